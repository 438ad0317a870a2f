#include <string>

#include "proto/bits.hpp"
#include "util/log.hpp"

namespace bits
{

std::string bytes_to_bits(const proto::Bytes &in)
{
    std::string out;
    out.reserve(in.size() * 8);
    for (std::uint8_t b : in)
    {
        for (int bit = 7; bit >= 0; --bit)
            out.push_back(((b >> bit) & 1) ? '1' : '0');
    }
    return out;
}

bool bits_to_bytes(std::string_view in, proto::Bytes &out)
{
    if (in.size() % 8 != 0)
        return false;
    out.clear();
    out.reserve(in.size() / 8);
    for (std::size_t i = 0; i < in.size(); i += 8)
    {
        std::uint8_t b = 0;
        for (std::size_t k = 0; k < 8; ++k)
        {
            const char c = in[i + k];
            if (c != '0' && c != '1')
                return false;
            b = static_cast<std::uint8_t>((b << 1) | (c == '1' ? 1 : 0));
        }
        out.push_back(b);
    }
    return true;
}

}  // namespace bits

namespace proto
{

BinaryFrameSet BinaryCodec::encapsulate(const FrameSet &in) const
{
    BinaryFrameSet out;
    out.frames.reserve(in.frames.size());
    for (const auto &f : in.frames)
    {
        BinaryFrame bf;
        bf.bits       = bits::bytes_to_bits(f.packet.segment.payload);
        bf.bit_length = bf.bits.size();
        bf.frame_info = f;
        bf.frame_info.packet.segment.payload.clear();  // the bit string is authoritative
        out.total_bits += bf.bit_length;
        out.frames.push_back(std::move(bf));
    }
    out.session_id = in.session_id;
    LOG_DEBUG("%zu frames, %zu bits", out.frames.size(), out.total_bits);
    return out;
}

Error BinaryCodec::decapsulate(const BinaryFrameSet &in, FrameSet &out, Diagnostics &diag) const
{
    out = FrameSet{};

    // total_bits is the only count the wire declares; everything below is rebuilt from it
    std::size_t sum = 0;
    for (const auto &bf : in.frames)
        sum += bf.bit_length;
    if (sum != in.total_bits)
    {
        diag.detail = "declared " + std::to_string(in.total_bits) + " bits, frames carry " + std::to_string(sum);
        LOG_ERROR("%s", diag.detail.c_str());
        return Error::Protocol;
    }

    out.frames.reserve(in.frames.size());
    for (std::size_t i = 0; i < in.frames.size(); ++i)
    {
        const BinaryFrame &bf = in.frames[i];
        if (bf.bit_length != bf.bits.size() || bf.bit_length % 8 != 0)
        {
            diag.detail = "frame " + std::to_string(i) + ": bit length " + std::to_string(bf.bit_length) +
                          " (string holds " + std::to_string(bf.bits.size()) + ")";
            LOG_ERROR("%s", diag.detail.c_str());
            out.frames.clear();
            return Error::Protocol;
        }
        Frame f = bf.frame_info;
        if (!bits::bits_to_bytes(bf.bits, f.packet.segment.payload))
        {
            diag.detail = "frame " + std::to_string(i) + ": invalid bit string";
            LOG_ERROR("%s", diag.detail.c_str());
            out.frames.clear();
            return Error::Protocol;
        }
        out.frames.push_back(std::move(f));
    }
    out.session_id   = in.session_id;
    out.total_frames = out.frames.size();
    return Error::None;
}

}  // namespace proto
