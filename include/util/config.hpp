#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "util/constants.hpp"

namespace config
{

// Immutable pipeline configuration. Layers copy what they need at construction.
struct Settings
{
    std::size_t   chunk_size{constants::CHUNK_SIZE};
    std::uint8_t  cipher_key{constants::CIPHER_KEY};
    std::uint16_t src_port{constants::SRC_PORT};
    std::uint16_t dst_port{constants::DST_PORT};
    std::string   src_ip{constants::SRC_IP};
    std::string   dst_ip{constants::DST_IP};
    std::uint8_t  ttl{constants::TTL};
    std::string   src_mac{constants::SRC_MAC};
    std::string   dst_mac{constants::DST_MAC};
    std::size_t   session_token_length{constants::SESSION_TOKEN_LENGTH};
    std::string   http_host{constants::HTTP_HOST};
    std::string   http_path{constants::HTTP_PATH};
};

bool is_valid_mac(const std::string &mac);
bool is_valid_ipv4(const std::string &ip);

// Returns false and fills *why (when given) on the first invalid field.
bool validate(const Settings &s, std::string *why = nullptr);

// Defaults overridden by OSISIM_* environment variables. nullopt when an override
// does not parse or the result does not validate.
std::optional<Settings> load_from_env();

}  // namespace config
