#include <string>

#include "proto/addressing.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

namespace
{
// Declared unit count must agree with the units actually carried.
Error check_count(const char *what, std::size_t have, std::size_t declared, Diagnostics &diag)
{
    if (have == declared)
        return Error::None;
    diag.detail = std::string(what) + " count " + std::to_string(have) + " != declared total " +
                  std::to_string(declared);
    LOG_ERROR("%s", diag.detail.c_str());
    return Error::Protocol;
}
}  // namespace

NetworkAddresser::NetworkAddresser(const config::Settings &s)
    : src_ip_(s.src_ip), dst_ip_(s.dst_ip), ttl_(s.ttl)
{
}

PacketSet NetworkAddresser::encapsulate(const SegmentSet &in) const
{
    PacketSet out;
    out.packets.reserve(in.segments.size());
    for (const auto &seg : in.segments)
    {
        Packet p;
        p.src_ip   = src_ip_;
        p.dst_ip   = dst_ip_;
        p.ttl      = ttl_;
        p.protocol = std::string(constants::PROTOCOL_TCP);
        p.segment  = seg;
        out.packets.push_back(std::move(p));
    }
    out.session_id    = in.session_id;
    out.total_packets = out.packets.size();
    LOG_DEBUG("%zu packets %s -> %s", out.total_packets, src_ip_.c_str(), dst_ip_.c_str());
    return out;
}

Error NetworkAddresser::decapsulate(const PacketSet &in, SegmentSet &out, Diagnostics &diag) const
{
    if (Error e = check_count("packet", in.packets.size(), in.total_packets, diag); e != Error::None)
        return e;

    out.segments.clear();
    out.segments.reserve(in.packets.size());
    for (const auto &p : in.packets)
        out.segments.push_back(p.segment);
    out.session_id     = in.session_id;
    out.total_segments = out.segments.size();
    return Error::None;
}

LinkAddresser::LinkAddresser(const config::Settings &s) : src_mac_(s.src_mac), dst_mac_(s.dst_mac)
{
}

FrameSet LinkAddresser::encapsulate(const PacketSet &in) const
{
    FrameSet out;
    out.frames.reserve(in.packets.size());
    for (const auto &p : in.packets)
    {
        Frame f;
        f.src_mac   = src_mac_;
        f.dst_mac   = dst_mac_;
        f.ethertype = std::string(constants::ETHERTYPE_IPV4);
        f.packet    = p;
        f.fcs       = std::string(constants::FCS_CRC32);
        out.frames.push_back(std::move(f));
    }
    out.session_id   = in.session_id;
    out.total_frames = out.frames.size();
    LOG_DEBUG("%zu frames %s -> %s", out.total_frames, src_mac_.c_str(), dst_mac_.c_str());
    return out;
}

Error LinkAddresser::decapsulate(const FrameSet &in, PacketSet &out, Diagnostics &diag) const
{
    if (Error e = check_count("frame", in.frames.size(), in.total_frames, diag); e != Error::None)
        return e;

    out.packets.clear();
    out.packets.reserve(in.frames.size());
    for (const auto &f : in.frames)
        out.packets.push_back(f.packet);
    out.session_id    = in.session_id;
    out.total_packets = out.packets.size();
    return Error::None;
}

}  // namespace proto
