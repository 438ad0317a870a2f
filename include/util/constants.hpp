#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Layer 7: HTTP POST framing
inline constexpr std::string_view HTTP_HOST       = "example.com";
inline constexpr std::string_view HTTP_PATH       = "/api/message";
inline constexpr std::string_view HTTP_HEADER_END = "\r\n\r\n";

// Layer 6: presentation
inline constexpr std::uint8_t     CIPHER_KEY     = 42;
inline constexpr std::string_view ENCODING_UTF8  = "UTF-8";
inline constexpr std::string_view ENCRYPTION_XOR = "XOR";

// Layer 5: session token alphabet and length
inline constexpr std::string_view SESSION_ALPHABET     = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
inline constexpr std::size_t      SESSION_TOKEN_LENGTH = 16;

// Layer 4: segmentation
inline constexpr std::size_t   CHUNK_SIZE     = 10;
inline constexpr std::size_t   MAX_CHUNK_SIZE = 1500;
inline constexpr std::size_t   CHECKSUM_HEX   = 8;  // hex chars kept from the digest
inline constexpr std::uint16_t SRC_PORT       = 8080;
inline constexpr std::uint16_t DST_PORT       = 443;

// Layer 3: network
inline constexpr std::string_view SRC_IP       = "192.168.1.2";
inline constexpr std::string_view DST_IP       = "192.168.1.10";
inline constexpr std::uint8_t     TTL          = 64;
inline constexpr std::string_view PROTOCOL_TCP = "TCP";

// Layer 2: data link
inline constexpr std::string_view SRC_MAC        = "AA:BB:CC:DD:EE:01";
inline constexpr std::string_view DST_MAC        = "FF:EE:DD:CC:BB:02";
inline constexpr std::string_view ETHERTYPE_IPV4 = "0x0800";
inline constexpr std::string_view FCS_CRC32      = "CRC32";

// Environment overrides read by config::load_from_env()
inline constexpr const char *ENV_LOG_LEVEL     = "OSISIM_LOG_LEVEL";
inline constexpr const char *ENV_CHUNK_SIZE    = "OSISIM_CHUNK_SIZE";
inline constexpr const char *ENV_CIPHER_KEY    = "OSISIM_CIPHER_KEY";
inline constexpr const char *ENV_SRC_PORT      = "OSISIM_SRC_PORT";
inline constexpr const char *ENV_DST_PORT      = "OSISIM_DST_PORT";
inline constexpr const char *ENV_SRC_IP        = "OSISIM_SRC_IP";
inline constexpr const char *ENV_DST_IP        = "OSISIM_DST_IP";
inline constexpr const char *ENV_SRC_MAC       = "OSISIM_SRC_MAC";
inline constexpr const char *ENV_DST_MAC       = "OSISIM_DST_MAC";
inline constexpr const char *ENV_TOKEN_LENGTH  = "OSISIM_TOKEN_LENGTH";

}  // namespace constants
