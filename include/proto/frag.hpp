#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "proto/envelopes.hpp"
#include "proto/layer.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"

/*
TX:
session.inner.cipher_bytes
  -> make_segments(bytes, chunk_size, ports)
     -> Segment{seq, ports, checksum(chunk), chunk} ...

RX:
SegmentSet (any order)
  -> reassemble(set)  // validate shape, sort by seq, verify each checksum
     -> mismatch? IntegrityWarning, keep the bytes
     -> concatenated bytes in ascending seq
*/

namespace frag
{

// 8 hex chars of SHA-256 over the chunk
std::string checksum(const proto::Bytes &chunk);

// TX: ceil(len / chunk_size) segments, seq 0.., none for an empty buffer
std::vector<proto::Segment> make_segments(const proto::Bytes &payload,
                                          std::size_t         chunk_size,
                                          std::uint16_t       src_port,
                                          std::uint16_t       dst_port);

// RX: bytes in ascending sequence order. Checksum mismatches go to diag.warnings.
proto::Error reassemble(const proto::SegmentSet &set,
                        std::size_t              chunk_size,
                        proto::Bytes            &out,
                        proto::Diagnostics      &diag);

}  // namespace frag

namespace proto
{

// Layer 4
class Segmenter final : public Layer<SessionEnvelope, SegmentSet>
{
  public:
    // encryption is the tag written into the rebuilt envelope on the way up
    explicit Segmenter(const config::Settings &s,
                       std::string             encryption = std::string(constants::ENCRYPTION_XOR))
        : chunk_size_(s.chunk_size), src_port_(s.src_port), dst_port_(s.dst_port),
          encryption_(std::move(encryption))
    {
    }

    int         number() const override { return 4; }
    const char *name() const override { return "Transport Layer"; }

    SegmentSet encapsulate(const SessionEnvelope &in) const override;
    Error      decapsulate(const SegmentSet &in, SessionEnvelope &out, Diagnostics &diag) const override;

    std::size_t chunk_size() const { return chunk_size_; }

  private:
    std::size_t   chunk_size_;
    std::uint16_t src_port_;
    std::uint16_t dst_port_;
    std::string   encryption_;
};

}  // namespace proto
