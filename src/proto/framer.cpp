#include <algorithm>
#include <cstdint>

#include "proto/framer.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace framer
{

const char *kind_name(Kind k)
{
    switch (k)
    {
        case Kind::Text:
            return "text";
        case Kind::Clipboard:
            return "clipboard";
        case Kind::File:
            return "file";
    }
    return "?";
}

static bool kind_from_tag(std::uint8_t tag, Kind &out)
{
    switch (tag)
    {
        case static_cast<std::uint8_t>(Kind::Text):
            out = Kind::Text;
            return true;
        case static_cast<std::uint8_t>(Kind::Clipboard):
            out = Kind::Clipboard;
            return true;
        case static_cast<std::uint8_t>(Kind::File):
            out = Kind::File;
            return true;
        default:
            return false;
    }
}

Bytes encode(Kind kind, const Bytes &payload)
{
    Bytes out;
    out.reserve(2 + payload.size());
    out.push_back(static_cast<std::uint8_t>(kind));
    out.push_back(constants::HEADER_SEPARATOR);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

Bytes encode(Kind kind, std::string_view payload)
{
    return encode(kind, Bytes(payload.begin(), payload.end()));
}

proto::Error decode(const Bytes &framed, Message &out)
{
    // the kind field ends at the first separator, so it has to be exactly one byte long
    if (framed.size() < 2 || framed[1] != constants::HEADER_SEPARATOR)
    {
        LOG_WARN("decode: missing header separator (%zu bytes)", framed.size());
        return proto::Error::UnknownMessageKind;
    }
    Kind k{};
    if (!kind_from_tag(framed[0], k))
    {
        LOG_WARN("decode: unknown kind tag 0x%02x", (unsigned)framed[0]);
        return proto::Error::UnknownMessageKind;
    }
    out.kind = k;
    out.payload.assign(framed.begin() + 2, framed.end());
    return proto::Error::None;
}

proto::Error encode_file(std::string_view name, const Bytes &content, Bytes &payload_out)
{
    if (name.empty() || name.find(constants::NAME_SEPARATOR) != std::string_view::npos)
    {
        LOG_ERROR("encode_file: file name '%.*s' cannot be framed", (int)name.size(),
                  name.data());
        return proto::Error::InvalidFileName;
    }
    payload_out.clear();
    payload_out.reserve(name.size() + constants::NAME_SEPARATOR.size() + content.size());
    payload_out.insert(payload_out.end(), name.begin(), name.end());
    payload_out.insert(payload_out.end(), constants::NAME_SEPARATOR.begin(),
                       constants::NAME_SEPARATOR.end());
    payload_out.insert(payload_out.end(), content.begin(), content.end());
    return proto::Error::None;
}

proto::Error split_file(const Bytes &payload, FilePayload &out)
{
    const auto &sep = constants::NAME_SEPARATOR;
    auto        it  = std::search(payload.begin(), payload.end(), sep.begin(), sep.end());
    if (it == payload.end())
    {
        LOG_WARN("split_file: no name separator in %zu byte payload", payload.size());
        return proto::Error::MalformedFilePayload;
    }
    out.name.assign(payload.begin(), it);
    out.content.assign(it + static_cast<std::ptrdiff_t>(sep.size()), payload.end());
    return proto::Error::None;
}

}  // namespace framer
