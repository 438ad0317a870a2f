#pragma once
#include <cstddef>

#include "proto/envelopes.hpp"
#include "proto/layer.hpp"
#include "util/config.hpp"

namespace proto
{

// Layer 5: tags each message with a fresh random token. There is no session store,
// so decapsulation just drops the token.
class SessionTagger final : public Layer<ObfuscatedEnvelope, SessionEnvelope>
{
  public:
    explicit SessionTagger(const config::Settings &s) : token_len_(s.session_token_length) {}

    int         number() const override { return 5; }
    const char *name() const override { return "Session Layer"; }

    SessionEnvelope encapsulate(const ObfuscatedEnvelope &in) const override;
    Error decapsulate(const SessionEnvelope &in, ObfuscatedEnvelope &out, Diagnostics &diag) const override;

  private:
    std::size_t token_len_;
};

}  // namespace proto
