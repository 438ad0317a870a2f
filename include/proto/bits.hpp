#pragma once
#include <string>
#include <string_view>

#include "proto/envelopes.hpp"
#include "proto/layer.hpp"

namespace bits
{

// MSB first, exactly 8 chars per byte
std::string bytes_to_bits(const proto::Bytes &in);

// false on a length that is not a multiple of 8 or a char other than '0'/'1'
bool bits_to_bytes(std::string_view in, proto::Bytes &out);

}  // namespace bits

namespace proto
{

// Layer 1: turns each frame's segment payload into a bit string.
class BinaryCodec final : public Layer<FrameSet, BinaryFrameSet>
{
  public:
    int         number() const override { return 1; }
    const char *name() const override { return "Physical Layer"; }

    BinaryFrameSet encapsulate(const FrameSet &in) const override;
    Error          decapsulate(const BinaryFrameSet &in, FrameSet &out, Diagnostics &diag) const override;
};

}  // namespace proto
