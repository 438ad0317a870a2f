#pragma once
#include <cstdint>
#include <string>

#include "proto/envelopes.hpp"
#include "proto/layer.hpp"
#include "util/config.hpp"

namespace proto
{

// Layer 3: one packet per segment, constant IPv4 header fields. Payload untouched.
class NetworkAddresser final : public Layer<SegmentSet, PacketSet>
{
  public:
    explicit NetworkAddresser(const config::Settings &s);

    int         number() const override { return 3; }
    const char *name() const override { return "Network Layer"; }

    PacketSet encapsulate(const SegmentSet &in) const override;
    Error     decapsulate(const PacketSet &in, SegmentSet &out, Diagnostics &diag) const override;

  private:
    std::string  src_ip_;
    std::string  dst_ip_;
    std::uint8_t ttl_;
};

// Layer 2: one frame per packet, constant Ethernet header fields.
class LinkAddresser final : public Layer<PacketSet, FrameSet>
{
  public:
    explicit LinkAddresser(const config::Settings &s);

    int         number() const override { return 2; }
    const char *name() const override { return "Data Link Layer"; }

    FrameSet encapsulate(const PacketSet &in) const override;
    Error    decapsulate(const FrameSet &in, PacketSet &out, Diagnostics &diag) const override;

  private:
    std::string src_mac_;
    std::string dst_mac_;
};

}  // namespace proto
