#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "proto/error.hpp"

/*
Envelope of one logical message, before chunking:

  [kind:1]['|':1][payload...]

  kind = 't' text, 'c' clipboard, 'f' file
  file payload = [name utf-8]["<NAME>"][content...]

The payload is never escaped. Content may contain "<NAME>"; only the first
occurrence separates the name.
*/

namespace framer
{

using Bytes = std::vector<std::uint8_t>;

enum class Kind : std::uint8_t
{
    Text      = 't',
    Clipboard = 'c',
    File      = 'f'
};

struct Message
{
    Kind  kind{Kind::Text};
    Bytes payload;
};

struct FilePayload
{
    std::string name;
    Bytes       content;
};

const char *kind_name(Kind k);

Bytes       encode(Kind kind, const Bytes &payload);
Bytes       encode(Kind kind, std::string_view payload);
proto::Error decode(const Bytes &framed, Message &out);

proto::Error encode_file(std::string_view name, const Bytes &content, Bytes &payload_out);
proto::Error split_file(const Bytes &payload, FilePayload &out);

}  // namespace framer
