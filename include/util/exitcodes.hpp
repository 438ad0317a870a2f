#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int failure    = 1;  // decapsulation failed (decode/protocol error)
inline constexpr int bad_args   = 2;
inline constexpr int bad_config = 3;
inline constexpr int mismatch   = 4;  // round trip did not reproduce the message
}  // namespace exitc
