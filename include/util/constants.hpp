#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Packet geometry: [total][index][<= 30 data bytes]
inline constexpr std::size_t  PACKET_MAX = 32;
inline constexpr std::size_t  HDR_SIZE   = 2;
inline constexpr std::size_t  DATA_LEN   = PACKET_MAX - HDR_SIZE;
inline constexpr std::size_t  MAX_CHUNKS = 255;
inline constexpr std::size_t  MAX_FRAMED = DATA_LEN * MAX_CHUNKS;  // 7650 bytes
inline constexpr std::uint8_t ACK_MARKER = 0x00;

// Message envelope
inline constexpr std::uint8_t     HEADER_SEPARATOR = '|';
inline constexpr std::string_view NAME_SEPARATOR   = "<NAME>";

// Timing defaults (ms). Ack wait and attempt timeout derive from packet airtime
// when not configured explicitly.
inline constexpr std::chrono::milliseconds PACKET_TIME_DEFAULT{5000};
inline constexpr std::chrono::milliseconds RECEIVE_TIMEOUT_DEFAULT{5 * 60 * 1000};
inline constexpr std::chrono::milliseconds SEND_TIMEOUT_DEFAULT{5 * 60 * 1000};

// UDP stand-in for the modem
inline constexpr std::string_view UDP_LISTEN_BIND_DEFAULT = "0.0.0.0:47100";
inline constexpr std::string_view UDP_SEND_BIND_DEFAULT   = "0.0.0.0:0";
inline constexpr std::string_view UDP_PEER_DEFAULT        = "127.0.0.1:47100";

// Fallback name for received files whose transmitted name is unusable
inline constexpr std::string_view RECEIVED_FILE_FALLBACK = "received.bin";

}  // namespace constants
