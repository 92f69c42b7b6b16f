#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <netinet/in.h>

#include "transport/itransport.hpp"

namespace transport
{

// Stand-in for the acoustic modem: one UDP datagram carries one packet.
// Datagrams that are empty or larger than the packet bound are handed up as
// decode failures. Without a configured peer, replies go to whoever sent the
// last datagram.
class UdpTransport final : public ITransport
{
  public:
    UdpTransport() = default;
    ~UdpTransport() override;
    UdpTransport(const UdpTransport &)            = delete;
    UdpTransport &operator=(const UdpTransport &) = delete;

    bool        start(const Settings &s) override;
    bool        send(const Frame &one_packet) override;
    void        set_receiver(OnFrame on_rx) override;
    void        clear_receiver() override;
    void        stop() override;
    std::string name() const override { return "udp"; }
    bool        link_ready() const override;

    // bound local port, useful when binding to port 0
    unsigned short local_port() const;

  private:
    void rx_loop();

    int              fd_{-1};
    std::atomic_bool running_{false};
    std::thread      rx_thr_;
    std::size_t      mtu_{constants::PACKET_MAX};

    mutable std::mutex peer_mu_;
    sockaddr_in        peer_{};
    bool               have_peer_{false};
    bool               fixed_peer_{false};

    std::mutex rx_mu_;
    OnFrame    on_rx_{};
};

// "host:port" -> sockaddr_in; host may be empty or a dotted quad or a name
bool parse_host_port(const std::string &s, sockaddr_in &out);

}  // namespace transport
