#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

// In-process packet link between two endpoints. Each endpoint delivers on its
// own thread, like a modem callback. A per-packet filter decides the fate of
// every sent packet, which makes it a deterministic lossy channel for tests.
class MemoryLink final : public ITransport
{
  public:
    enum class Fate
    {
        Deliver,
        Drop,     // nothing reaches the peer
        Corrupt   // peer gets a decode-failure marker
    };
    using Filter = std::function<Fate(const Frame &)>;

    MemoryLink() = default;
    ~MemoryLink() override;
    MemoryLink(const MemoryLink &)            = delete;
    MemoryLink &operator=(const MemoryLink &) = delete;

    // wire a <-> b; both must outlive the traffic between them
    static void connect(MemoryLink &a, MemoryLink &b);

    bool        start(const Settings &s) override;
    bool        send(const Frame &one_packet) override;
    void        set_receiver(OnFrame on_rx) override;
    void        clear_receiver() override;
    void        stop() override;
    std::string name() const override { return "memory"; }
    bool        link_ready() const override;

    void               set_filter(Filter f);
    std::vector<Frame> sent() const;
    std::size_t        dropped() const;
    bool               has_receiver() const;

  private:
    void deliver(RxEvent ev);
    void pump();

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<RxEvent>     queue_;
    bool                    running_{false};
    std::thread             thr_;

    mutable std::mutex rx_mu_;
    OnFrame            on_rx_{};

    MemoryLink        *peer_{nullptr};
    Filter             filter_{};
    std::vector<Frame> sent_;
    std::size_t        dropped_{0};
    std::size_t        mtu_{constants::PACKET_MAX};
};

}  // namespace transport
