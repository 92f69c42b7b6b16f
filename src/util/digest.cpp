#include <array>
#include <sodium.h>

#include "util/digest.hpp"
#include "util/log.hpp"

namespace digest
{

static_assert(FINGERPRINT_SIZE == crypto_generichash_BYTES_MIN, "fingerprint size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::string fingerprint(const std::vector<std::uint8_t> &data)
{
    if (!ensure_sodium_init())
    {
        LOG_WARN("fingerprint: sodium_init failed");
        return {};
    }

    std::array<unsigned char, FINGERPRINT_SIZE> h{};
    if (crypto_generichash(h.data(), h.size(), data.empty() ? nullptr : data.data(), data.size(),
                           nullptr, 0) != 0)
    {
        LOG_WARN("fingerprint: crypto_generichash failed");
        return {};
    }

    char hex[FINGERPRINT_SIZE * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), h.data(), h.size());
    return std::string(hex);
}

}  // namespace digest
