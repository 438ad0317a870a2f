#include <array>
#include <sodium.h>

#include "crypto/sodium_util.hpp"
#include "util/log.hpp"

namespace crypto
{

bool ensure_sodium_init()
{
    static const bool ok = [] {
        if (sodium_init() < 0)  // -1 means failed, 1 means already initialised
        {
            LOG_ERROR("sodium_init failed");
            return false;
        }
        return true;
    }();
    return ok;
}

std::string random_token(std::string_view alphabet, std::size_t len)
{
    std::string out;
    if (alphabet.empty() || !ensure_sodium_init())
        return out;
    out.reserve(len);
    const auto upper = static_cast<std::uint32_t>(alphabet.size());
    for (std::size_t i = 0; i < len; ++i)
        out.push_back(alphabet[randombytes_uniform(upper)]);  // unbiased in [0, upper)
    return out;
}

std::string sha256_hex(const std::uint8_t *data, std::size_t len, std::size_t hex_chars)
{
    if (!ensure_sodium_init())
        return {};
    std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256(digest.data(), data, static_cast<unsigned long long>(len));

    // bin2hex writes 2 chars per byte plus a NUL
    std::array<char, crypto_hash_sha256_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());

    if (hex_chars > crypto_hash_sha256_BYTES * 2)
        hex_chars = crypto_hash_sha256_BYTES * 2;
    return std::string(hex.data(), hex_chars);
}

}  // namespace crypto
