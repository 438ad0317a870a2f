#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace crypto
{

// sodium_init() once per process; false if libsodium could not initialise.
bool ensure_sodium_init();

// `len` characters drawn uniformly from `alphabet` with libsodium's CSPRNG.
std::string random_token(std::string_view alphabet, std::size_t len);

// Lowercase hex of SHA-256(data), truncated to `hex_chars` (<= 64).
std::string sha256_hex(const std::uint8_t *data, std::size_t len, std::size_t hex_chars);

}  // namespace crypto
