#include <filesystem>
#include <fstream>
#include <utility>

#include "app/router.hpp"
#include "util/constants.hpp"
#include "util/digest.hpp"
#include "util/log.hpp"

namespace app
{
namespace fs = std::filesystem;

Router::Router(clip::IClipboard &clipboard, std::string out_dir, std::FILE *text_out)
    : clipboard_(clipboard), out_dir_(std::move(out_dir)), text_out_(text_out)
{
}

proto::Error Router::dispatch(const framer::Message &m)
{
    LOG_DEBUG("dispatch: %s message, %zu bytes", framer::kind_name(m.kind), m.payload.size());
    switch (m.kind)
    {
        case framer::Kind::Text:
            return on_text(m.payload);
        case framer::Kind::Clipboard:
            return on_clipboard(m.payload);
        case framer::Kind::File:
            return on_file(m.payload);
    }
    return proto::Error::UnknownMessageKind;
}

proto::Error Router::on_text(const framer::Bytes &payload)
{
    if (!text_out_)
        return proto::Error::IoError;
    std::fputs("Received text:\n", text_out_);
    if (!payload.empty())
        std::fwrite(payload.data(), 1, payload.size(), text_out_);
    std::fputc('\n', text_out_);
    if (std::fflush(text_out_) != 0)
        return proto::Error::IoError;
    return proto::Error::None;
}

proto::Error Router::on_clipboard(const framer::Bytes &payload)
{
    std::string text(payload.begin(), payload.end());
    if (!clipboard_.set(text))
    {
        LOG_ERROR("could not write %zu bytes to the %s clipboard", text.size(),
                  clipboard_.name().c_str());
        return proto::Error::IoError;
    }
    LOG_SYSTEM("Received clipboard contents (%zu bytes), copied to your clipboard", text.size());
    return proto::Error::None;
}

std::string Router::safe_name(const std::string &name)
{
    std::string leaf = fs::path(name).filename().string();
    if (leaf.empty() || leaf == "." || leaf == "..")
    {
        LOG_WARN("unusable file name '%s', saving as %s", name.c_str(),
                 std::string(constants::RECEIVED_FILE_FALLBACK).c_str());
        return std::string(constants::RECEIVED_FILE_FALLBACK);
    }
    return leaf;
}

std::string Router::free_path(const std::string &dir, const std::string &name)
{
    std::error_code ec;
    fs::path        p = fs::path(dir) / name;
    for (unsigned copy = 1; fs::exists(p, ec); copy++)
        p = fs::path(dir) / (std::to_string(copy) + "_" + name);
    return p.string();
}

proto::Error Router::on_file(const framer::Bytes &payload)
{
    framer::FilePayload fp;
    proto::Error        err = framer::split_file(payload, fp);
    if (err != proto::Error::None)
        return err;

    const std::string path = free_path(out_dir_, safe_name(fp.name));
    std::ofstream     f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        LOG_ERROR("cannot create %s", path.c_str());
        return proto::Error::IoError;
    }
    f.write(reinterpret_cast<const char *>(fp.content.data()),
            static_cast<std::streamsize>(fp.content.size()));
    f.close();
    if (!f)
    {
        LOG_ERROR("write to %s failed", path.c_str());
        return proto::Error::IoError;
    }

    last_saved_ = path;
    LOG_SYSTEM("Received a file, saved to %s (%zu bytes, blake2b %s)", path.c_str(),
               fp.content.size(), digest::fingerprint(fp.content).c_str());
    return proto::Error::None;
}

}  // namespace app
