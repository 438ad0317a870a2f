#include <cstring>
#include <string>

#include "crypto/obfuscator.hpp"
#include "proto/app_framer.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace crypto
{

bool is_valid_utf8(const std::uint8_t *p, std::size_t n)
{
    std::size_t i = 0;
    while (i < n)
    {
        const std::uint8_t c = p[i];
        if (c < 0x80)
        {
            ++i;
            continue;
        }

        std::size_t   extra = 0;
        std::uint32_t cp    = 0;
        std::uint32_t min   = 0;
        if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp    = c & 0x1F;
            min   = 0x80;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp    = c & 0x0F;
            min   = 0x800;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp    = c & 0x07;
            min   = 0x10000;
        }
        else
        {
            return false;  // stray continuation byte or 0xF8..0xFF
        }

        if (n - i <= extra)
            return false;  // truncated sequence
        for (std::size_t k = 1; k <= extra; ++k)
        {
            const std::uint8_t cc = p[i + k];
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += extra + 1;
    }
    return true;
}

proto::ObfuscatedEnvelope Obfuscator::encapsulate(const proto::ApplicationEnvelope &in) const
{
    proto::ObfuscatedEnvelope out;
    out.cipher_bytes.resize(in.header.size() + in.payload.size());
    if (!in.header.empty())
        std::memcpy(out.cipher_bytes.data(), in.header.data(), in.header.size());
    if (!in.payload.empty())
        std::memcpy(out.cipher_bytes.data() + in.header.size(), in.payload.data(), in.payload.size());

    cipher_.apply(out.cipher_bytes);

    out.encoding        = std::string(constants::ENCODING_UTF8);
    out.encryption      = cipher_.tag();
    out.original_length = out.cipher_bytes.size();
    LOG_DEBUG("%s over %zu bytes", out.encryption.c_str(), out.original_length);
    return out;
}

proto::Error Obfuscator::decapsulate(const proto::ObfuscatedEnvelope &in,
                                     proto::ApplicationEnvelope      &out,
                                     proto::Diagnostics              &diag) const
{
    if (in.cipher_bytes.size() != in.original_length)
    {
        diag.detail = "cipher length " + std::to_string(in.cipher_bytes.size()) +
                      " != original length " + std::to_string(in.original_length);
        LOG_ERROR("%s", diag.detail.c_str());
        return proto::Error::Protocol;
    }
    if (in.encoding != constants::ENCODING_UTF8)
    {
        diag.detail = "unsupported encoding '" + in.encoding + "'";
        LOG_ERROR("%s", diag.detail.c_str());
        return proto::Error::Protocol;
    }
    if (in.encryption != cipher_.tag())
    {
        diag.detail = "encryption '" + in.encryption + "' does not match cipher '" + cipher_.tag() + "'";
        LOG_ERROR("%s", diag.detail.c_str());
        return proto::Error::Protocol;
    }

    proto::Bytes plain = in.cipher_bytes;
    cipher_.apply(plain);

    if (!is_valid_utf8(plain.data(), plain.size()))
    {
        diag.detail = "recovered bytes are not valid UTF-8";
        LOG_ERROR("%s", diag.detail.c_str());
        return proto::Error::Decode;
    }

    const std::string_view text(reinterpret_cast<const char *>(plain.data()), plain.size());
    std::string            why;
    if (!proto::split_request(text, out.header, out.payload, &why))
    {
        diag.detail = "cannot parse application request: " + why;
        LOG_ERROR("%s", diag.detail.c_str());
        return proto::Error::Decode;
    }
    return proto::Error::None;
}

}  // namespace crypto
