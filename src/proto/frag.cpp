#include <algorithm>
#include <cstdint>
#include <string>

#include "crypto/sodium_util.hpp"
#include "proto/frag.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace frag
{

std::string checksum(const proto::Bytes &chunk)
{
    return crypto::sha256_hex(chunk.data(), chunk.size(), constants::CHECKSUM_HEX);
}

std::vector<proto::Segment> make_segments(const proto::Bytes &payload,
                                          std::size_t         chunk_size,
                                          std::uint16_t       src_port,
                                          std::uint16_t       dst_port)
{
    std::vector<proto::Segment> out;
    if (chunk_size < 1)
    {
        LOG_ERROR("make_segments: invalid chunk_size (%zu)", chunk_size);
        return out;
    }
    if (payload.empty())
        return out;

    const std::size_t num_segments = (payload.size() + chunk_size - 1) / chunk_size;
    out.reserve(num_segments);

    for (std::size_t i = 0; i < num_segments; i++)
    {
        std::size_t    start = i * chunk_size;
        std::size_t    take  = std::min(chunk_size, payload.size() - start);
        proto::Segment s;
        s.sequence = static_cast<std::uint32_t>(i);
        s.src_port = src_port;
        s.dst_port = dst_port;
        s.payload.assign(payload.begin() + start, payload.begin() + start + take);
        s.checksum = checksum(s.payload);
        out.push_back(std::move(s));
    }
    return out;
}

proto::Error reassemble(const proto::SegmentSet &set,
                        std::size_t              chunk_size,
                        proto::Bytes            &out,
                        proto::Diagnostics      &diag)
{
    const std::size_t total = set.total_segments;
    if (set.segments.size() != total)
    {
        diag.detail = "segment count " + std::to_string(set.segments.size()) +
                      " != declared total " + std::to_string(total);
        LOG_ERROR("%s", diag.detail.c_str());
        return proto::Error::Protocol;
    }

    // order by sequence without touching the caller's set
    std::vector<const proto::Segment *> ordered;
    ordered.reserve(total);
    std::size_t bytes = 0;
    for (const auto &s : set.segments)
    {
        if (s.sequence >= total)
        {
            diag.detail = "sequence " + std::to_string(s.sequence) + " out of range (total " +
                          std::to_string(total) + ")";
            LOG_ERROR("%s", diag.detail.c_str());
            return proto::Error::Protocol;
        }
        if (s.payload.size() > chunk_size)
        {
            diag.detail = "segment " + std::to_string(s.sequence) + " carries " +
                          std::to_string(s.payload.size()) + " bytes, chunk size is " +
                          std::to_string(chunk_size);
            LOG_ERROR("%s", diag.detail.c_str());
            return proto::Error::Protocol;
        }
        ordered.push_back(&s);
        bytes += s.payload.size();
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const proto::Segment *a, const proto::Segment *b) { return a->sequence < b->sequence; });

    // with count == total and every seq < total, a repeat is the only way to miss one
    for (std::size_t i = 0; i < ordered.size(); i++)
    {
        if (ordered[i]->sequence != i)
        {
            diag.detail = "duplicate sequence " + std::to_string(ordered[i]->sequence);
            LOG_ERROR("%s", diag.detail.c_str());
            return proto::Error::Protocol;
        }
    }

    out.clear();
    out.reserve(bytes);
    for (const proto::Segment *s : ordered)
    {
        std::string actual = checksum(s->payload);
        if (actual != s->checksum)
        {
            LOG_WARN("checksum mismatch in segment %u (expected %s, got %s)", s->sequence,
                     s->checksum.c_str(), actual.c_str());
            diag.warnings.push_back({s->sequence, s->checksum, std::move(actual)});
        }
        out.insert(out.end(), s->payload.begin(), s->payload.end());
    }
    return proto::Error::None;
}

}  // namespace frag

namespace proto
{

SegmentSet Segmenter::encapsulate(const SessionEnvelope &in) const
{
    SegmentSet out;
    out.segments       = frag::make_segments(in.inner.cipher_bytes, chunk_size_, src_port_, dst_port_);
    out.session_id     = in.session_id;
    out.total_segments = out.segments.size();
    LOG_DEBUG("%zu bytes -> %zu segments", in.inner.cipher_bytes.size(), out.total_segments);
    return out;
}

Error Segmenter::decapsulate(const SegmentSet &in, SessionEnvelope &out, Diagnostics &diag) const
{
    Bytes       bytes;
    const Error e = frag::reassemble(in, chunk_size_, bytes, diag);
    if (e != Error::None)
        return e;

    out.session_id             = in.session_id;
    out.inner.original_length  = bytes.size();
    out.inner.cipher_bytes     = std::move(bytes);
    out.inner.encoding         = std::string(constants::ENCODING_UTF8);
    out.inner.encryption       = encryption_;
    return Error::None;
}

}  // namespace proto
