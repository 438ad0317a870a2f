#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/*
encapsulate:
  text
    -> ApplicationEnvelope   (L7: HTTP header + payload)
    -> ObfuscatedEnvelope    (L6: UTF-8 bytes ^ key)
    -> SessionEnvelope       (L5: + session token)
    -> SegmentSet            (L4: chunks + seq + checksum + ports)
    -> PacketSet             (L3: + IP addresses)
    -> FrameSet              (L2: + MAC addresses)
    -> BinaryFrameSet        (L1: payload as '0'/'1')

decapsulate walks the same chain backwards.
*/

namespace proto
{

using Bytes = std::vector<std::uint8_t>;

struct ApplicationEnvelope
{
    std::string header;
    std::string payload;
};

struct ObfuscatedEnvelope
{
    Bytes       cipher_bytes;
    std::string encoding;
    std::string encryption;
    std::size_t original_length{0};  // == cipher_bytes.size()
};

struct SessionEnvelope
{
    std::string        session_id;
    ObfuscatedEnvelope inner;
};

struct Segment
{
    std::uint32_t sequence{0};
    std::uint16_t src_port{0};
    std::uint16_t dst_port{0};
    std::string   checksum;  // 8 hex chars
    Bytes         payload;   // <= chunk size
};

struct SegmentSet
{
    std::vector<Segment> segments;
    std::string          session_id;
    std::size_t          total_segments{0};
};

struct Packet
{
    std::string   src_ip;
    std::string   dst_ip;
    std::uint8_t  ttl{0};
    std::string   protocol;
    Segment       segment;
};

struct PacketSet
{
    std::vector<Packet> packets;
    std::string         session_id;
    std::size_t         total_packets{0};
};

struct Frame
{
    std::string src_mac;
    std::string dst_mac;
    std::string ethertype;
    Packet      packet;
    std::string fcs;
};

struct FrameSet
{
    std::vector<Frame> frames;
    std::string        session_id;
    std::size_t        total_frames{0};
};

struct BinaryFrame
{
    Frame       frame_info;  // metadata only, frame_info.packet.segment.payload is empty
    std::string bits;
    std::size_t bit_length{0};
};

struct BinaryFrameSet
{
    std::vector<BinaryFrame> frames;
    std::string              session_id;
    std::size_t              total_bits{0};
};

using WireEnvelope = BinaryFrameSet;

}  // namespace proto
