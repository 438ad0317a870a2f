#include <arpa/inet.h>  // inet_pton
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

namespace
{

bool parse_uint(const char *s, unsigned long max, unsigned long &out)
{
    if (!s || !*s)
        return false;
    for (const char *p = s; *p; ++p)
    {
        if (!std::isdigit(static_cast<unsigned char>(*p)))
            return false;
    }
    errno           = 0;
    char         *end = nullptr;
    unsigned long v   = std::strtoul(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || v > max)
        return false;
    out = v;
    return true;
}

// Numeric override: absent is fine, present but malformed fails the load.
template <typename T>
bool env_uint(const char *key, unsigned long max, T &field)
{
    const char *v = std::getenv(key);
    if (!v)
        return true;
    unsigned long parsed = 0;
    if (!parse_uint(v, max, parsed))
    {
        LOG_ERROR("%s: invalid value '%s'", key, v);
        return false;
    }
    field = static_cast<T>(parsed);
    return true;
}

// Header fields go into the HTTP request line and Host header verbatim.
bool has_control_char(const std::string &v)
{
    for (char ch : v)
    {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F)
            return true;
    }
    return false;
}

void env_str(const char *key, std::string &field)
{
    if (const char *v = std::getenv(key); v && *v)
        field = v;
}

}  // namespace

bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

bool is_valid_ipv4(const std::string &ip)
{
    in_addr addr{};
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

bool validate(const Settings &s, std::string *why)
{
    auto fail = [why](const std::string &msg) {
        if (why)
            *why = msg;
        return false;
    };

    if (s.chunk_size < 1 || s.chunk_size > constants::MAX_CHUNK_SIZE)
        return fail("chunk_size must be in 1.." + std::to_string(constants::MAX_CHUNK_SIZE));
    if (s.session_token_length < 1)
        return fail("session_token_length must be positive");
    if (!is_valid_ipv4(s.src_ip))
        return fail("src_ip is not an IPv4 address: " + s.src_ip);
    if (!is_valid_ipv4(s.dst_ip))
        return fail("dst_ip is not an IPv4 address: " + s.dst_ip);
    if (!is_valid_mac(s.src_mac))
        return fail("src_mac is not a MAC address: " + s.src_mac);
    if (!is_valid_mac(s.dst_mac))
        return fail("dst_mac is not a MAC address: " + s.dst_mac);
    if (s.ttl == 0)
        return fail("ttl must be positive");
    if (s.http_path.empty() || s.http_path.front() != '/')
        return fail("http_path must start with '/'");
    if (s.http_host.empty())
        return fail("http_host must not be empty");
    if (has_control_char(s.http_host))
        return fail("http_host contains control characters");
    if (has_control_char(s.http_path) || s.http_path.find(' ') != std::string::npos)
        return fail("http_path contains control characters or spaces");
    return true;
}

std::optional<Settings> load_from_env()
{
    Settings s;

    if (!env_uint(constants::ENV_CHUNK_SIZE, constants::MAX_CHUNK_SIZE, s.chunk_size) ||
        !env_uint(constants::ENV_CIPHER_KEY, 0xFF, s.cipher_key) ||
        !env_uint(constants::ENV_SRC_PORT, 0xFFFF, s.src_port) ||
        !env_uint(constants::ENV_DST_PORT, 0xFFFF, s.dst_port) ||
        !env_uint(constants::ENV_TOKEN_LENGTH, 256, s.session_token_length))
    {
        return std::nullopt;
    }
    env_str(constants::ENV_SRC_IP, s.src_ip);
    env_str(constants::ENV_DST_IP, s.dst_ip);
    env_str(constants::ENV_SRC_MAC, s.src_mac);
    env_str(constants::ENV_DST_MAC, s.dst_mac);

    std::string why;
    if (!validate(s, &why))
    {
        LOG_ERROR("invalid configuration: %s", why.c_str());
        return std::nullopt;
    }
    return s;
}

}  // namespace config
