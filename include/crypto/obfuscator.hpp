#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>

#include "proto/envelopes.hpp"
#include "proto/layer.hpp"

namespace crypto
{

// Length-preserving, self-inverse byte transform. Not a security primitive.
class ByteCipher
{
  public:
    virtual ~ByteCipher() = default;

    virtual void        apply(proto::Bytes &buf) const = 0;
    virtual const char *tag() const                    = 0;
};

class NoopCipher : public ByteCipher
{
  public:
    void        apply(proto::Bytes & /*buf*/) const override {}
    const char *tag() const override { return "NONE"; }
};

class XorCipher : public ByteCipher
{
  public:
    explicit XorCipher(std::uint8_t key) : key_(key) {}

    void apply(proto::Bytes &buf) const override
    {
        for (auto &b : buf)
            b ^= key_;
    }
    const char  *tag() const override { return "XOR"; }
    std::uint8_t key() const { return key_; }

  private:
    std::uint8_t key_;
};

// Layer 6: serializes header + payload as UTF-8 and runs it through the cipher.
// The cipher must outlive the layer.
class Obfuscator final : public proto::Layer<proto::ApplicationEnvelope, proto::ObfuscatedEnvelope>
{
  public:
    explicit Obfuscator(const ByteCipher &cipher) : cipher_(cipher) {}

    int         number() const override { return 6; }
    const char *name() const override { return "Presentation Layer"; }

    proto::ObfuscatedEnvelope encapsulate(const proto::ApplicationEnvelope &in) const override;
    proto::Error              decapsulate(const proto::ObfuscatedEnvelope &in,
                                          proto::ApplicationEnvelope      &out,
                                          proto::Diagnostics              &diag) const override;

  private:
    const ByteCipher &cipher_;
};

// Strict UTF-8 check: no overlong forms, no surrogates, nothing above U+10FFFF.
bool is_valid_utf8(const std::uint8_t *p, std::size_t n);

}  // namespace crypto
