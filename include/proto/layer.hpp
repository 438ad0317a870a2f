#pragma once
#include "proto/error.hpp"

namespace proto
{

// One protocol layer. Upper is what the layer receives from above when sending,
// Lower is what it hands down. decapsulate() only accepts the Lower its own
// encapsulate() produced, so a pipeline that wires layers in the wrong order does
// not compile.
template <typename Upper, typename Lower>
class Layer
{
  public:
    using upper_type = Upper;
    using lower_type = Lower;

    virtual ~Layer() = default;

    virtual int         number() const = 0;  // OSI layer number, 7..1
    virtual const char *name() const   = 0;

    virtual Lower encapsulate(const Upper &in) const = 0;

    // On failure `out` is unspecified and diag.detail describes the problem.
    virtual Error decapsulate(const Lower &in, Upper &out, Diagnostics &diag) const = 0;
};

}  // namespace proto
