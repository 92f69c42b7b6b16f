#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <optional>
#include <string_view>

namespace whistle
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always shown unless output is silenced
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline std::optional<Level> level_from_name(std::string_view name)
{
    if (name == "debug" || name == "DEBUG")
        return Level::Debug;
    if (name == "info" || name == "INFO")
        return Level::Info;
    if (name == "warn" || name == "warning" || name == "WARN" || name == "WARNING")
        return Level::Warning;
    if (name == "error" || name == "err" || name == "ERROR" || name == "ERR")
        return Level::Error;
    return std::nullopt;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    auto lv = level_from_name(name ? std::string_view{name} : std::string_view{});
    set_log_level(lv ? *lv : Level::Info);
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // one fprintf per line keeps lines from different threads whole
    char    msg[512];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    size_t      m  = std::strlen(msg);
    const char *nl = (m == 0 || msg[m - 1] != '\n') ? "\n" : "";
    std::fprintf(stderr, "%s %s %s: %s%s", ts, level_name(lv), func ? func : "?", msg, nl);
}

#define LOG_DEBUG(...) ::whistle::logf(::whistle::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::whistle::logf(::whistle::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::whistle::logf(::whistle::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::whistle::logf(::whistle::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::whistle::logf(::whistle::Level::System, __func__, __VA_ARGS__)

}  // namespace whistle
