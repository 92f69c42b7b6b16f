#include <cerrno>
#include <cstdlib>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

bool parse_ms(const char *s, long lo, long hi, std::chrono::milliseconds &out)
{
    if (!s || !*s)
        return false;
    char *p = nullptr;
    errno   = 0;
    long v  = std::strtol(s, &p, 10);
    if (errno != 0 || !p || *p != '\0' || v < lo || v > hi)
        return false;
    out = std::chrono::milliseconds(v);
    return true;
}

static void env_ms(const char *key, long lo, long hi, std::chrono::milliseconds &field)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    if (parse_ms(e, lo, hi, field))
        LOG_DEBUG("Using %s=%lld ms", key, (long long)field.count());
    else
        LOG_WARN("Ignoring invalid %s='%s' (expect %ld..%ld)", key, e, lo, hi);
}

static void env_str(const char *key, std::string &field)
{
    if (const char *e = std::getenv(key); e && *e)
        field = e;
}

Config from_env(Role role)
{
    Config c;
    c.packet_time     = constants::PACKET_TIME_DEFAULT;
    c.receive_timeout = constants::RECEIVE_TIMEOUT_DEFAULT;
    c.send_timeout    = constants::SEND_TIMEOUT_DEFAULT;

    if (role == Role::Listen)
    {
        c.bind_addr = std::string(constants::UDP_LISTEN_BIND_DEFAULT);
        // listener answers whoever talks to it unless told otherwise
        c.peer_addr.clear();
    }
    else
    {
        c.bind_addr = std::string(constants::UDP_SEND_BIND_DEFAULT);
        c.peer_addr = std::string(constants::UDP_PEER_DEFAULT);
    }

    env_str("WHISTLE_TRANSPORT", c.transport);
    env_str("WHISTLE_UDP_BIND", c.bind_addr);
    env_str("WHISTLE_UDP_PEER", c.peer_addr);
    env_str("WHISTLE_OUT_DIR", c.out_dir);

    env_ms("WHISTLE_PACKET_MS", 1, 60000, c.packet_time);
    env_ms("WHISTLE_ACK_WAIT_MS", 1, 600000, c.ack_wait);
    env_ms("WHISTLE_ATTEMPT_MS", 1, 600000, c.attempt_timeout);
    env_ms("WHISTLE_RECV_TIMEOUT_MS", 1, 24L * 3600 * 1000, c.receive_timeout);
    env_ms("WHISTLE_SEND_TIMEOUT_MS", 1, 24L * 3600 * 1000, c.send_timeout);

    LOG_DEBUG("Config: transport=%s bind=%s peer=%s out=%s packet=%lldms",
              c.transport.c_str(), c.bind_addr.c_str(),
              c.peer_addr.empty() ? "(last sender)" : c.peer_addr.c_str(), c.out_dir.c_str(),
              (long long)c.packet_time.count());
    return c;
}

std::chrono::milliseconds effective_ack_wait(const Config &c)
{
    if (c.ack_wait.count() > 0)
        return c.ack_wait;
    return c.packet_time * 2;
}

std::chrono::milliseconds effective_attempt_timeout(const Config &c)
{
    if (c.attempt_timeout.count() > 0)
        return c.attempt_timeout;
    return c.packet_time * 3 / 2;
}

}  // namespace config
