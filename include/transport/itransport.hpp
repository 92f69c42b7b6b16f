#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Frame = std::vector<std::uint8_t>;

// One unit handed up by the physical layer: a packet it managed to decode, or
// a marker saying something arrived but could not be recovered.
struct RxEvent
{
    bool  ok{true};
    Frame frame;
};

using OnFrame = std::function<void(const RxEvent &)>;

struct Settings
{
    std::string role;       // "listen" or "send" (or "memory" for testing)
    std::string bind_addr;  // host:port, transport specific
    std::string peer_addr;  // host:port, transport specific
    std::size_t mtu_payload = constants::PACKET_MAX;
};

struct ITransport
{
    virtual bool        start(const Settings &s)     = 0;
    virtual bool        send(const Frame &one_packet) = 0;  // blocks until transmitted
    // Single receiver slot. After clear_receiver() returns the callback is
    // never invoked again.
    virtual void        set_receiver(OnFrame on_rx) = 0;
    virtual void        clear_receiver()            = 0;
    virtual void        stop()                      = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
