#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace proto
{

// Outcome of a decapsulation step. Decode and Protocol abort the current call.
enum class Error
{
    None,
    Decode,    // recovered bytes are not UTF-8 or the serialized form does not parse
    Protocol,  // structurally malformed envelope at a layer boundary
    Config,    // settings rejected before any layer ran
};

inline const char *error_name(Error e)
{
    switch (e)
    {
        case Error::None:
            return "None";
        case Error::Decode:
            return "DecodeError";
        case Error::Protocol:
            return "ProtocolError";
        case Error::Config:
            return "ConfigError";
    }
    return "?";
}

// Checksum mismatch on reassembly. Reported, never fatal.
struct IntegrityWarning
{
    std::uint32_t sequence{0};
    std::string   expected;  // checksum carried by the segment
    std::string   actual;    // checksum recomputed over the received bytes
};

// Side channel filled by decapsulate(): warnings accumulate across layers, detail
// describes the error that stopped the call (if any).
struct Diagnostics
{
    std::vector<IntegrityWarning> warnings;
    std::string                   detail;
};

}  // namespace proto
