#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "proto/error.hpp"
#include "util/constants.hpp"

namespace ack
{
// [0x00][missing index]... , at most DATA_LEN indices so an ack fits one packet
constexpr std::size_t MAX_MISSING = constants::DATA_LEN;

inline std::vector<std::uint8_t> encode_ack(const std::vector<std::uint8_t> &missing)
{
    const std::size_t    n = missing.size() > MAX_MISSING ? MAX_MISSING : missing.size();
    std::vector<std::uint8_t> out;
    out.reserve(1 + n);
    out.push_back(constants::ACK_MARKER);
    out.insert(out.end(), missing.begin(), missing.begin() + static_cast<std::ptrdiff_t>(n));
    return out;
}

// A marker other than 0 means the sender is looking at something that is not
// an ack (a data packet, a foreign transmission): peers are out of sync.
inline proto::Error parse_ack(const std::uint8_t        *buf,
                              std::size_t                len,
                              std::vector<std::uint8_t> &missing)
{
    missing.clear();
    if (len < 1 || len > 1 + MAX_MISSING || buf[0] != constants::ACK_MARKER)
        return proto::Error::AckCorrupted;
    missing.assign(buf + 1, buf + len);
    return proto::Error::None;
}

inline proto::Error parse_ack(const std::vector<std::uint8_t> &frame,
                              std::vector<std::uint8_t>       &missing)
{
    return parse_ack(frame.data(), frame.size(), missing);
}

}  // namespace ack
