#include <arpa/inet.h>
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include "transport/udp_transport.hpp"

using namespace transport;
using namespace std::chrono_literals;

namespace
{
// Collects events delivered on the transport's rx thread
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

// Plain datagram socket, for sizes the transport refuses to send
struct RawSocket
{
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    ~RawSocket()
    {
        if (fd != -1)
            ::close(fd);
    }
    bool send_to(unsigned short port, const std::vector<std::uint8_t> &bytes) const
    {
        sockaddr_in to{};
        to.sin_family      = AF_INET;
        to.sin_port        = htons(port);
        to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return ::sendto(fd, bytes.data(), bytes.size(), 0, reinterpret_cast<sockaddr *>(&to),
                        sizeof(to)) == static_cast<ssize_t>(bytes.size());
    }
};

Settings listen_on_loopback()
{
    Settings s{};
    s.role      = "listen";
    s.bind_addr = "127.0.0.1:0";
    return s;
}

Settings send_to_port(unsigned short port)
{
    Settings s{};
    s.role      = "send";
    s.bind_addr = "127.0.0.1:0";
    s.peer_addr = "127.0.0.1:" + std::to_string(port);
    return s;
}
}  // namespace

TEST(Udp, RoundTripAndReplyToLastSource)
{
    Collector    at_listener, at_sender;
    UdpTransport listener, sender;
    ASSERT_TRUE(listener.start(listen_on_loopback()));
    ASSERT_NE(listener.local_port(), 0);
    ASSERT_TRUE(sender.start(send_to_port(listener.local_port())));
    EXPECT_TRUE(sender.link_ready());

    // nobody has talked to the listener yet
    EXPECT_FALSE(listener.link_ready());
    EXPECT_FALSE(listener.send({0x00}));

    listener.set_receiver(at_listener.callback());
    sender.set_receiver(at_sender.callback());

    Frame f = {1, 0, 't', '|', 'h', 'i'};
    ASSERT_TRUE(sender.send(f));
    ASSERT_TRUE(at_listener.wait_for_count(1));
    EXPECT_TRUE(at_listener.events[0].ok);
    EXPECT_EQ(at_listener.events[0].frame, f);

    // the listener now answers whoever sent last
    EXPECT_TRUE(listener.link_ready());
    ASSERT_TRUE(listener.send({0x00}));
    ASSERT_TRUE(at_sender.wait_for_count(1));
    EXPECT_EQ(at_sender.events[0].frame, Frame({0x00}));

    listener.stop();
    sender.stop();
}

TEST(Udp, EmptyAndOversizeDatagramsAreDecodeFailures)
{
    Collector    got;
    UdpTransport listener;
    ASSERT_TRUE(listener.start(listen_on_loopback()));
    listener.set_receiver(got.callback());

    RawSocket raw;
    ASSERT_NE(raw.fd, -1);
    ASSERT_TRUE(raw.send_to(listener.local_port(), {}));
    ASSERT_TRUE(raw.send_to(listener.local_port(),
                            std::vector<std::uint8_t>(constants::PACKET_MAX + 1, 7)));
    ASSERT_TRUE(raw.send_to(listener.local_port(),
                            std::vector<std::uint8_t>(constants::PACKET_MAX, 7)));
    ASSERT_TRUE(got.wait_for_count(3));

    std::lock_guard<std::mutex> lk(got.mu);
    EXPECT_FALSE(got.events[0].ok);
    EXPECT_FALSE(got.events[1].ok);
    EXPECT_TRUE(got.events[2].ok);
    EXPECT_EQ(got.events[2].frame.size(), constants::PACKET_MAX);
}

TEST(Udp, SendRefusesBadPackets)
{
    UdpTransport t;
    EXPECT_FALSE(t.send({1, 0}));  // not started

    ASSERT_TRUE(t.start(send_to_port(9)));
    EXPECT_FALSE(t.send(Frame{}));
    EXPECT_FALSE(t.send(Frame(constants::PACKET_MAX + 1, 1)));
    t.stop();
}

TEST(Udp, StartRejectsBadAddresses)
{
    UdpTransport t;
    Settings     s = listen_on_loopback();
    s.bind_addr    = "no-port-here";
    EXPECT_FALSE(t.start(s));

    s           = listen_on_loopback();
    s.peer_addr = "127.0.0.1:99999";
    EXPECT_FALSE(t.start(s));
}

TEST(Udp, ParseHostPort)
{
    sockaddr_in a{};
    ASSERT_TRUE(parse_host_port("127.0.0.1:47100", a));
    EXPECT_EQ(ntohs(a.sin_port), 47100);
    EXPECT_EQ(ntohl(a.sin_addr.s_addr), INADDR_LOOPBACK);

    ASSERT_TRUE(parse_host_port(":5000", a));
    EXPECT_EQ(ntohl(a.sin_addr.s_addr), INADDR_ANY);
    ASSERT_TRUE(parse_host_port("*:0", a));
    EXPECT_EQ(ntohs(a.sin_port), 0);

    EXPECT_FALSE(parse_host_port("127.0.0.1", a));
    EXPECT_FALSE(parse_host_port("127.0.0.1:", a));
    EXPECT_FALSE(parse_host_port("127.0.0.1:65536", a));
    EXPECT_FALSE(parse_host_port("127.0.0.1:80x", a));
    EXPECT_FALSE(parse_host_port("127.0.0.1:-1", a));
}
