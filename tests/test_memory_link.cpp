#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "transport/itransport.hpp"
#include "transport/memory_link.hpp"

using namespace transport;
using namespace std::chrono_literals;

namespace
{
// Collects events delivered on the link's thread
struct Collector
{
    std::mutex              mu;
    std::condition_variable cv;
    std::vector<RxEvent>    events;

    OnFrame callback()
    {
        return [this](const RxEvent &ev) {
            std::lock_guard<std::mutex> lk(mu);
            events.push_back(ev);
            cv.notify_all();
        };
    }
    bool wait_for_count(std::size_t n)
    {
        std::unique_lock<std::mutex> lk(mu);
        return cv.wait_for(lk, 2s, [&] { return events.size() >= n; });
    }
};
}  // namespace

TEST(MemoryLink, DeliversToPeer)
{
    Collector  got;
    MemoryLink a, b;
    MemoryLink::connect(a, b);
    Settings s{};
    s.role = "memory";
    ASSERT_TRUE(a.start(s));
    ASSERT_TRUE(b.start(s));

    b.set_receiver(got.callback());

    Frame f = {1, 0, 't', '|', 'h', 'i'};
    EXPECT_TRUE(a.send(f));
    ASSERT_TRUE(got.wait_for_count(1));
    EXPECT_TRUE(got.events[0].ok);
    EXPECT_EQ(got.events[0].frame, f);
    EXPECT_EQ(a.sent().size(), 1u);

    a.stop();
    b.stop();
}

TEST(MemoryLink, SendFailsWhenNotStarted)
{
    MemoryLink t;
    Frame      f = {0x42};
    EXPECT_FALSE(t.send(f));
}

TEST(MemoryLink, RejectsOversizePacket)
{
    MemoryLink a, b;
    MemoryLink::connect(a, b);
    ASSERT_TRUE(a.start(Settings{}));
    EXPECT_FALSE(a.send(Frame(constants::PACKET_MAX + 1, 0)));
    EXPECT_TRUE(a.send(Frame(constants::PACKET_MAX, 1)));
}

TEST(MemoryLink, FilterDropsAndCorrupts)
{
    Collector  got;
    MemoryLink a, b;
    MemoryLink::connect(a, b);
    ASSERT_TRUE(a.start(Settings{}));
    ASSERT_TRUE(b.start(Settings{}));

    a.set_filter([](const Frame &f) {
        if (f[0] == 1)
            return MemoryLink::Fate::Drop;
        if (f[0] == 2)
            return MemoryLink::Fate::Corrupt;
        return MemoryLink::Fate::Deliver;
    });

    b.set_receiver(got.callback());
    EXPECT_TRUE(a.send({1}));  // dropped packets still count as sent
    EXPECT_TRUE(a.send({2}));
    EXPECT_TRUE(a.send({3}));
    ASSERT_TRUE(got.wait_for_count(2));

    EXPECT_FALSE(got.events[0].ok);
    EXPECT_TRUE(got.events[1].ok);
    EXPECT_EQ(got.events[1].frame, Frame({3}));
    EXPECT_EQ(a.dropped(), 1u);
    EXPECT_EQ(a.sent().size(), 3u);
}

TEST(MemoryLink, NoCallbackAfterClear)
{
    Collector  got;
    MemoryLink a, b;
    MemoryLink::connect(a, b);
    ASSERT_TRUE(a.start(Settings{}));
    ASSERT_TRUE(b.start(Settings{}));

    b.set_receiver(got.callback());
    EXPECT_TRUE(b.has_receiver());
    b.clear_receiver();
    EXPECT_FALSE(b.has_receiver());

    EXPECT_TRUE(a.send({9}));
    std::this_thread::sleep_for(50ms);
    std::lock_guard<std::mutex> lk(got.mu);
    EXPECT_TRUE(got.events.empty());
}
