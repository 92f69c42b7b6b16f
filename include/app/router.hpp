#pragma once
#include <cstdio>
#include <string>

#include "clip/clipboard.hpp"
#include "proto/error.hpp"
#include "proto/framer.hpp"

namespace app
{

// Hands a complete, decoded message to its kind-specific handler.
class Router
{
  public:
    Router(clip::IClipboard &clipboard, std::string out_dir, std::FILE *text_out = stdout);

    proto::Error dispatch(const framer::Message &m);

    // where the last received file was written
    const std::string &last_saved() const { return last_saved_; }

    // First free path for `name` in `dir`: name, 1_name, 2_name, ...
    static std::string free_path(const std::string &dir, const std::string &name);
    // Final path component of a transmitted name, never empty
    static std::string safe_name(const std::string &name);

  private:
    proto::Error on_text(const framer::Bytes &payload);
    proto::Error on_clipboard(const framer::Bytes &payload);
    proto::Error on_file(const framer::Bytes &payload);

    clip::IClipboard &clipboard_;
    std::string       out_dir_;
    std::FILE        *text_out_;
    std::string       last_saved_;
};

}  // namespace app
