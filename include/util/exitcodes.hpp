#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int bad_args   = 2;
inline constexpr int io_error   = 3;
inline constexpr int too_large  = 4;
inline constexpr int timeout    = 5;
inline constexpr int protocol   = 6;
inline constexpr int cancelled  = 130;
}  // namespace exitc
