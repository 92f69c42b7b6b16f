#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace digest
{

constexpr std::size_t FINGERPRINT_SIZE = 16;  // crypto_generichash_BYTES_MIN

// Short BLAKE2b fingerprint in hex, logged on both ends of a file transfer.
// Empty string if libsodium could not be initialised.
std::string fingerprint(const std::vector<std::uint8_t> &data);

}  // namespace digest
