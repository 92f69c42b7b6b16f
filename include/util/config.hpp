#pragma once
#include <chrono>
#include <string>

namespace config
{

enum class Role
{
    Listen,
    Send
};

struct Config
{
    std::string transport = "udp";
    std::string bind_addr;  // defaults depend on the role
    std::string peer_addr;
    std::string out_dir = ".";

    std::chrono::milliseconds packet_time{5000};
    std::chrono::milliseconds ack_wait{0};         // 0: derive from packet_time
    std::chrono::milliseconds attempt_timeout{0};  // 0: derive from packet_time
    std::chrono::milliseconds receive_timeout{300000};
    std::chrono::milliseconds send_timeout{300000};
};

// Read WHISTLE_* variables; invalid values are logged and ignored.
Config from_env(Role role);

// 2 x packet time unless configured
std::chrono::milliseconds effective_ack_wait(const Config &c);
// 1.5 x packet time unless configured
std::chrono::milliseconds effective_attempt_timeout(const Config &c);

// strict decimal milliseconds within [lo, hi]
bool parse_ms(const char *s, long lo, long hi, std::chrono::milliseconds &out);

}  // namespace config
