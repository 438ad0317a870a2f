#include "proto/session.hpp"
#include "crypto/sodium_util.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

SessionEnvelope SessionTagger::encapsulate(const ObfuscatedEnvelope &in) const
{
    SessionEnvelope out;
    out.session_id = crypto::random_token(constants::SESSION_ALPHABET, token_len_);
    out.inner      = in;
    LOG_DEBUG("session %s", out.session_id.c_str());
    return out;
}

Error SessionTagger::decapsulate(const SessionEnvelope &in, ObfuscatedEnvelope &out, Diagnostics & /*diag*/) const
{
    out = in.inner;
    return Error::None;
}

}  // namespace proto
