#pragma once
#include <cstdio>
#include <string>
#include <string_view>

#include "app/reliable_channel.hpp"
#include "app/router.hpp"
#include "clip/clipboard.hpp"
#include "proto/framer.hpp"
#include "transport/itransport.hpp"

namespace app
{

// Sends and receives whole text / clipboard / file messages over one transport.
class Messenger
{
  public:
    Messenger(transport::ITransport &t,
              clip::IClipboard      &clipboard,
              ChannelOptions         opts,
              std::string            out_dir,
              std::FILE             *text_out = stdout);
    ~Messenger() { stop(); }

    bool start(const transport::Settings &s);
    void stop();

    proto::Error send_text(std::string_view text);
    proto::Error send_clipboard();
    proto::Error send_file(const std::string &path);
    proto::Error send_message(framer::Kind kind, const framer::Bytes &payload);

    // Receive, decode and dispatch one message.
    proto::Error receive_one();
    // One message, or every message until cancelled when `forever` is set.
    proto::Error listen(bool forever);

    void cancel() { chan_.cancel(); }

    ReliableChannel &channel() { return chan_; }
    Router          &router() { return router_; }

  private:
    transport::ITransport &tx_;
    clip::IClipboard      &clipboard_;
    ReliableChannel        chan_;
    Router                 router_;
    bool                   started_{false};
};

}  // namespace app
