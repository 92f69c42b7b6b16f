#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "clip/clipboard.hpp"
#include "util/log.hpp"

#if WHISTLE_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace clip
{

bool is_dbus_string(const std::string &s)
{
    const auto       *p   = reinterpret_cast<const unsigned char *>(s.data());
    const std::size_t len = s.size();
    std::size_t       i   = 0;
    while (i < len)
    {
        const unsigned char c = p[i];
        std::size_t         n;
        std::uint32_t       cp;
        if (c == 0)
            return false;
        if (c < 0x80)
        {
            i++;
            continue;
        }
        if ((c & 0xE0) == 0xC0)
        {
            n  = 1;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            n  = 2;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            n  = 3;
            cp = c & 0x07;
        }
        else
            return false;
        if (i + n >= len)
            return false;
        for (std::size_t k = 1; k <= n; k++)
        {
            if ((p[i + k] & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }
        // overlong forms, surrogates, beyond U+10FFFF
        static const std::uint32_t min_cp[] = {0, 0x80, 0x800, 0x10000};
        if (cp < min_cp[n] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += n + 1;
    }
    return true;
}

#if WHISTLE_HAVE_SDBUS
namespace
{
constexpr const char *KLIPPER_DEST  = "org.kde.klipper";
constexpr const char *KLIPPER_PATH  = "/klipper";
constexpr const char *KLIPPER_IFACE = "org.kde.klipper.klipper";

// TU-local owner for the user bus connection
struct UserBus
{
    sd_bus *bus = nullptr;
    UserBus()
    {
        int r = sd_bus_open_user(&bus);
        if (r < 0)
        {
            LOG_ERROR("sd_bus_open_user failed: %s", std::strerror(-r));
            bus = nullptr;
        }
    }
    ~UserBus()
    {
        if (bus)
            sd_bus_flush_close_unref(bus);
    }
    UserBus(const UserBus &)            = delete;
    UserBus &operator=(const UserBus &) = delete;
};
}  // namespace

bool KlipperClipboard::get(std::string &out)
{
    UserBus ub;
    if (!ub.bus)
        return false;

    sd_bus_error    err   = SD_BUS_ERROR_NULL;
    sd_bus_message *reply = nullptr;
    int r = sd_bus_call_method(ub.bus, KLIPPER_DEST, KLIPPER_PATH, KLIPPER_IFACE,
                               "getClipboardContents", &err, &reply, "");
    if (r < 0)
    {
        LOG_ERROR("getClipboardContents failed: %s",
                  err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }

    const char *s = nullptr;
    r             = sd_bus_message_read(reply, "s", &s);
    if (r >= 0 && s)
        out = s;
    sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
    {
        LOG_ERROR("getClipboardContents: bad reply: %s", std::strerror(-r));
        return false;
    }
    return true;
}

bool KlipperClipboard::set(const std::string &in)
{
    if (!is_dbus_string(in))
    {
        LOG_ERROR("clipboard takes UTF-8 text only, refusing %zu bytes of binary data",
                  in.size());
        return false;
    }
    UserBus ub;
    if (!ub.bus)
        return false;

    sd_bus_error err = SD_BUS_ERROR_NULL;
    int r = sd_bus_call_method(ub.bus, KLIPPER_DEST, KLIPPER_PATH, KLIPPER_IFACE,
                               "setClipboardContents", &err, nullptr, "s", in.c_str());
    if (r < 0)
    {
        LOG_ERROR("setClipboardContents failed: %s",
                  err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    return true;
}

#else

bool KlipperClipboard::get(std::string & /*out*/)
{
    LOG_ERROR("clipboard unavailable: built without sd-bus");
    return false;
}

bool KlipperClipboard::set(const std::string & /*in*/)
{
    LOG_ERROR("clipboard unavailable: built without sd-bus");
    return false;
}

#endif

}  // namespace clip
