#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

#include "transport/udp_transport.hpp"
#include "util/log.hpp"

namespace transport
{

bool parse_host_port(const std::string &s, sockaddr_in &out)
{
    auto colon = s.rfind(':');
    if (colon == std::string::npos)
        return false;
    std::string host = s.substr(0, colon);
    std::string port = s.substr(colon + 1);

    char         *end = nullptr;
    unsigned long p   = std::strtoul(port.c_str(), &end, 10);
    if (port.empty() || !end || *end != '\0' || p > 65535)
        return false;

    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port   = htons(static_cast<unsigned short>(p));
    if (host.empty() || host == "*")
    {
        out.sin_addr.s_addr = htonl(INADDR_ANY);
        return true;
    }
    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1)
        return true;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res     = nullptr;
    int       rc      = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res)
    {
        LOG_ERROR("getaddrinfo(%s) failed: %s", host.c_str(), gai_strerror(rc));
        return false;
    }
    out.sin_addr = reinterpret_cast<sockaddr_in *>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

UdpTransport::~UdpTransport()
{
    stop();
}

bool UdpTransport::start(const Settings &s)
{
    if (running_.load())
        return true;

    sockaddr_in local{};
    if (!parse_host_port(s.bind_addr, local))
    {
        LOG_ERROR("invalid bind address '%s' (expect host:port)", s.bind_addr.c_str());
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(peer_mu_);
        have_peer_  = false;
        fixed_peer_ = false;
        if (!s.peer_addr.empty())
        {
            if (!parse_host_port(s.peer_addr, peer_))
            {
                LOG_ERROR("invalid peer address '%s' (expect host:port)", s.peer_addr.c_str());
                return false;
            }
            have_peer_  = true;
            fixed_peer_ = true;
        }
    }
    mtu_ = s.mtu_payload;

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);

    int one = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == -1)
        LOG_WARN("setsockopt(SO_REUSEADDR) failed: %s", std::strerror(errno));

    if (::bind(fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) == -1)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        LOG_ERROR("bind(%s) failed: %s", s.bind_addr.c_str(), std::strerror(errno));
        return false;
    }

    fd_ = fd;
    running_.store(true);
    rx_thr_ = std::thread([this] { rx_loop(); });
    LOG_DEBUG("udp transport bound to %s (port %u)", s.bind_addr.c_str(),
              (unsigned)local_port());
    return true;
}

void UdpTransport::rx_loop()
{
    // one byte more than a packet so oversize datagrams are detectable
    std::uint8_t buf[constants::PACKET_MAX + 1];
    while (running_.load())
    {
        pollfd pfd{fd_, POLLIN, 0};
        int    pr = ::poll(&pfd, 1, 100);
        if (pr == 0)
            continue;
        if (pr < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
            break;
        }

        sockaddr_in from{};
        socklen_t   from_len = sizeof(from);
        ssize_t     n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr *>(&from),
                                   &from_len);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNREFUSED)
                continue;
            LOG_ERROR("recvfrom() failed: %s", std::strerror(errno));
            break;
        }

        {
            std::lock_guard<std::mutex> lk(peer_mu_);
            if (!fixed_peer_)
            {
                peer_      = from;
                have_peer_ = true;
            }
        }

        RxEvent ev;
        if (n == 0 || static_cast<std::size_t>(n) > mtu_)
        {
            LOG_DEBUG("udp: undecodable datagram (%zd bytes)", n);
            ev.ok = false;
        }
        else
        {
            ev.frame.assign(buf, buf + n);
        }

        std::lock_guard<std::mutex> g(rx_mu_);
        if (on_rx_)
            on_rx_(ev);
    }
}

bool UdpTransport::send(const Frame &one_packet)
{
    if (!running_.load())
        return false;
    if (one_packet.empty() || one_packet.size() > mtu_)
    {
        LOG_ERROR("udp send: packet of %zu bytes outside 1..%zu", one_packet.size(), mtu_);
        return false;
    }
    sockaddr_in to{};
    {
        std::lock_guard<std::mutex> lk(peer_mu_);
        if (!have_peer_)
        {
            LOG_ERROR("udp send: no peer address known yet");
            return false;
        }
        to = peer_;
    }

    while (true)
    {
        ssize_t n = ::sendto(fd_, one_packet.data(), one_packet.size(), 0,
                             reinterpret_cast<const sockaddr *>(&to), sizeof(to));
        if (n == static_cast<ssize_t>(one_packet.size()))
            return true;
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("sendto() failed: %s", n == -1 ? std::strerror(errno) : "short write");
        return false;
    }
}

void UdpTransport::set_receiver(OnFrame on_rx)
{
    std::lock_guard<std::mutex> g(rx_mu_);
    on_rx_ = std::move(on_rx);
}

void UdpTransport::clear_receiver()
{
    std::lock_guard<std::mutex> g(rx_mu_);
    on_rx_ = nullptr;
}

void UdpTransport::stop()
{
    running_.store(false);
    if (rx_thr_.joinable())
        rx_thr_.join();
    if (fd_ != -1)
    {
        ::close(fd_);
        fd_ = -1;
    }
    clear_receiver();
}

bool UdpTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(peer_mu_);
    return running_.load() && have_peer_;
}

unsigned short UdpTransport::local_port() const
{
    sockaddr_in a{};
    socklen_t   len = sizeof(a);
    if (fd_ == -1 || getsockname(fd_, reinterpret_cast<sockaddr *>(&a), &len) == -1)
        return 0;
    return ntohs(a.sin_port);
}

}  // namespace transport
