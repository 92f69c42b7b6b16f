#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

#include "app/messenger.hpp"
#include "util/digest.hpp"
#include "util/log.hpp"

namespace app
{

Messenger::Messenger(transport::ITransport &t,
                     clip::IClipboard      &clipboard,
                     ChannelOptions         opts,
                     std::string            out_dir,
                     std::FILE             *text_out)
    : tx_(t), clipboard_(clipboard), chan_(t, opts), router_(clipboard, std::move(out_dir), text_out)
{
}

bool Messenger::start(const transport::Settings &s)
{
    if (started_)
        return true;
    if (!tx_.start(s))
    {
        LOG_ERROR("transport %s failed to start", tx_.name().c_str());
        return false;
    }
    started_ = true;
    LOG_DEBUG("messenger up on %s transport (%s mode)", tx_.name().c_str(),
              chan_.options().confirmed ? "confirmed" : "brave");
    return true;
}

void Messenger::stop()
{
    if (!started_)
        return;
    chan_.cancel();
    tx_.stop();
    started_ = false;
}

proto::Error Messenger::send_message(framer::Kind kind, const framer::Bytes &payload)
{
    // 1) Frame
    framer::Bytes framed = framer::encode(kind, payload);

    // 2) Chunk + send (+ ack rounds)
    proto::Error err = chan_.send(framed);
    if (err != proto::Error::None)
    {
        LOG_ERROR("send %s: %s", framer::kind_name(kind), proto::error_name(err));
        return err;
    }
    return proto::Error::None;
}

proto::Error Messenger::send_text(std::string_view text)
{
    return send_message(framer::Kind::Text, framer::Bytes(text.begin(), text.end()));
}

proto::Error Messenger::send_clipboard()
{
    std::string contents;
    if (!clipboard_.get(contents))
    {
        LOG_ERROR("could not read the %s clipboard", clipboard_.name().c_str());
        return proto::Error::IoError;
    }
    return send_message(framer::Kind::Clipboard, framer::Bytes(contents.begin(), contents.end()));
}

proto::Error Messenger::send_file(const std::string &path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        LOG_ERROR("cannot open %s", path.c_str());
        return proto::Error::IoError;
    }
    framer::Bytes content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad())
    {
        LOG_ERROR("read from %s failed", path.c_str());
        return proto::Error::IoError;
    }

    const std::string name = std::filesystem::path(path).filename().string();
    framer::Bytes     payload;
    proto::Error      err = framer::encode_file(name, content, payload);
    if (err != proto::Error::None)
        return err;

    LOG_INFO("sending file %s (%zu bytes, blake2b %s)", name.c_str(), content.size(),
             digest::fingerprint(content).c_str());
    return send_message(framer::Kind::File, payload);
}

proto::Error Messenger::receive_one()
{
    framer::Bytes framed;
    proto::Error  err = chan_.receive(framed);
    if (err != proto::Error::None)
        return err;

    framer::Message m;
    err = framer::decode(framed, m);
    if (err != proto::Error::None)
        return err;
    return router_.dispatch(m);
}

proto::Error Messenger::listen(bool forever)
{
    while (true)
    {
        proto::Error err = receive_one();
        if (!forever)
            return err;

        switch (err)
        {
            case proto::Error::None:
                break;
            case proto::Error::Cancelled:
            case proto::Error::Busy:
            case proto::Error::TransportFailure:
                return err;
            default:
                // a bad message does not end a --forever session
                LOG_ERROR("message dropped: %s", proto::error_text(err));
                break;
        }
    }
}

}  // namespace app
