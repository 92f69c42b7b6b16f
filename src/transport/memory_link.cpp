#include <utility>

#include "transport/memory_link.hpp"
#include "util/log.hpp"

namespace transport
{
// MemoryLink: a fake link to test the reliability layer without a modem.

MemoryLink::~MemoryLink()
{
    stop();
}

void MemoryLink::connect(MemoryLink &a, MemoryLink &b)
{
    a.peer_ = &b;
    b.peer_ = &a;
}

bool MemoryLink::start(const Settings &s)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (running_)
        return true;
    mtu_     = s.mtu_payload;
    running_ = true;
    thr_     = std::thread([this] { pump(); });
    return true;
}

bool MemoryLink::send(const Frame &one_packet)
{
    Filter filter;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return false;
        if (mtu_ != 0 && one_packet.size() > mtu_)
        {
            LOG_ERROR("MemoryLink::send: %zu bytes exceeds mtu %zu", one_packet.size(), mtu_);
            return false;
        }
        sent_.push_back(one_packet);
        filter = filter_;
    }

    const Fate fate = filter ? filter(one_packet) : Fate::Deliver;
    if (fate == Fate::Drop || !peer_)
    {
        std::lock_guard<std::mutex> lk(mu_);
        dropped_++;
        return true;  // a lost packet still left the sender
    }
    if (fate == Fate::Corrupt)
        peer_->deliver(RxEvent{false, {}});
    else
        peer_->deliver(RxEvent{true, one_packet});
    return true;
}

void MemoryLink::deliver(RxEvent ev)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return;
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void MemoryLink::pump()
{
    while (true)
    {
        RxEvent ev;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return !running_ || !queue_.empty(); });
            if (!running_)
                break;
            ev = std::move(queue_.front());
            queue_.pop_front();
        }
        // held while invoking so clear_receiver() waits for a callback in flight
        std::lock_guard<std::mutex> g(rx_mu_);
        if (on_rx_)
            on_rx_(ev);
    }
}

void MemoryLink::set_receiver(OnFrame on_rx)
{
    std::lock_guard<std::mutex> g(rx_mu_);
    on_rx_ = std::move(on_rx);
}

void MemoryLink::clear_receiver()
{
    std::lock_guard<std::mutex> g(rx_mu_);
    on_rx_ = nullptr;
}

void MemoryLink::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        running_ = false;
        queue_.clear();
    }
    cv_.notify_all();
    if (thr_.joinable())
        thr_.join();
    clear_receiver();
}

bool MemoryLink::link_ready() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return running_ && peer_ != nullptr;
}

void MemoryLink::set_filter(Filter f)
{
    std::lock_guard<std::mutex> lk(mu_);
    filter_ = std::move(f);
}

std::vector<Frame> MemoryLink::sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
}

std::size_t MemoryLink::dropped() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
}

bool MemoryLink::has_receiver() const
{
    std::lock_guard<std::mutex> g(rx_mu_);
    return static_cast<bool>(on_rx_);
}

}  // namespace transport
