#include <memory>
#include <string>
#include <utility>

#include "app/pipeline.hpp"
#include "crypto/sodium_util.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{

struct Size
{
    std::size_t units;
    std::size_t bytes;
};

Size measure(const std::string &s)
{
    return {1, s.size()};
}
Size measure(const proto::ApplicationEnvelope &e)
{
    return {1, e.header.size() + e.payload.size()};
}
Size measure(const proto::ObfuscatedEnvelope &e)
{
    return {1, e.cipher_bytes.size()};
}
Size measure(const proto::SessionEnvelope &e)
{
    return {1, e.inner.cipher_bytes.size()};
}
Size measure(const proto::SegmentSet &e)
{
    std::size_t n = 0;
    for (const auto &s : e.segments)
        n += s.payload.size();
    return {e.segments.size(), n};
}
Size measure(const proto::PacketSet &e)
{
    std::size_t n = 0;
    for (const auto &p : e.packets)
        n += p.segment.payload.size();
    return {e.packets.size(), n};
}
Size measure(const proto::FrameSet &e)
{
    std::size_t n = 0;
    for (const auto &f : e.frames)
        n += f.packet.segment.payload.size();
    return {e.frames.size(), n};
}
Size measure(const proto::BinaryFrameSet &e)
{
    return {e.frames.size(), e.total_bits};
}

}  // namespace

LayerPipeline::LayerPipeline(const config::Settings &s)
    : settings_(s),
      cipher_(s.cipher_key),
      application_(s),
      presentation_(cipher_),
      session_(s),
      transport_(s, cipher_.tag()),
      network_(s),
      link_(s),
      physical_()
{
}

std::unique_ptr<LayerPipeline> LayerPipeline::create(const config::Settings &s, std::string *why)
{
    std::string reason;
    if (!config::validate(s, &reason))
    {
        LOG_ERROR("invalid settings: %s", reason.c_str());
        if (why)
            *why = "invalid settings: " + reason;
        return nullptr;
    }
    // tokens and checksums both come from libsodium
    if (!crypto::ensure_sodium_init())
    {
        if (why)
            *why = "libsodium initialisation failed";
        return nullptr;
    }
    return std::unique_ptr<LayerPipeline>(new LayerPipeline(s));
}

template <typename Env>
void LayerPipeline::notify(Direction dir, int number, const char *name, const Env &env) const
{
    if (!on_layer_)
        return;
    const Size sz = measure(env);
    LayerEvent ev;
    ev.direction = dir;
    ev.number    = number;
    ev.name      = name;
    ev.units     = sz.units;
    ev.bytes     = sz.bytes;
    on_layer_(ev);
}

template <typename L>
typename L::lower_type LayerPipeline::down(const L &layer, const typename L::upper_type &in) const
{
    auto out = layer.encapsulate(in);
    notify(Direction::Encapsulate, layer.number(), layer.name(), out);
    return out;
}

template <typename L>
proto::Error LayerPipeline::up(const L                      &layer,
                               const typename L::lower_type &in,
                               typename L::upper_type       &out,
                               proto::Diagnostics           &diag) const
{
    const proto::Error e = layer.decapsulate(in, out, diag);
    if (e != proto::Error::None)
    {
        LOG_ERROR("L%d %s: %s: %s", layer.number(), layer.name(), proto::error_name(e),
                  diag.detail.c_str());
        out = typename L::upper_type{};  // no partial results from a failed layer
        return e;
    }
    notify(Direction::Decapsulate, layer.number(), layer.name(), out);
    return e;
}

proto::WireEnvelope LayerPipeline::encapsulate(std::string_view message, EncapTrace *trace) const
{
    auto l7 = down(application_, std::string(message));
    auto l6 = down(presentation_, l7);
    auto l5 = down(session_, l6);
    auto l4 = down(transport_, l5);
    auto l3 = down(network_, l4);
    auto l2 = down(link_, l3);
    auto l1 = down(physical_, l2);

    LOG_DEBUG("message of %zu bytes -> %zu frames, %zu bits (session %s)", message.size(),
              l1.frames.size(), l1.total_bits, l1.session_id.c_str());

    if (trace)
    {
        trace->application  = std::move(l7);
        trace->presentation = std::move(l6);
        trace->session      = std::move(l5);
        trace->transport    = std::move(l4);
        trace->network      = std::move(l3);
        trace->link         = std::move(l2);
        trace->physical     = l1;
    }
    return l1;
}

proto::Error LayerPipeline::decapsulate(const proto::WireEnvelope &wire,
                                        Decapsulated              &out,
                                        DecapTrace                *trace) const
{
    proto::Diagnostics         diag;
    proto::FrameSet            frames;
    proto::PacketSet           packets;
    proto::SegmentSet          segments;
    proto::SessionEnvelope     session;
    proto::ObfuscatedEnvelope  obfuscated;
    proto::ApplicationEnvelope request;
    std::string                message;

    proto::Error e = up(physical_, wire, frames, diag);
    if (e == proto::Error::None)
        e = up(link_, frames, packets, diag);
    if (e == proto::Error::None)
        e = up(network_, packets, segments, diag);
    if (e == proto::Error::None)
        e = up(transport_, segments, session, diag);
    if (e == proto::Error::None)
        e = up(session_, session, obfuscated, diag);
    if (e == proto::Error::None)
        e = up(presentation_, obfuscated, request, diag);
    if (e == proto::Error::None)
        e = up(application_, request, message, diag);

    if (!diag.warnings.empty())
        LOG_WARN("%zu segment(s) failed checksum verification", diag.warnings.size());

    out.warnings     = std::move(diag.warnings);
    out.error_detail = std::move(diag.detail);
    out.message.clear();
    if (e == proto::Error::None)
        out.message = message;

    if (trace)
    {
        trace->physical     = std::move(frames);
        trace->link         = std::move(packets);
        trace->network      = std::move(segments);
        trace->transport    = std::move(session);
        trace->session      = std::move(obfuscated);
        trace->presentation = std::move(request);
        trace->application  = std::move(message);
    }
    return e;
}

std::optional<proto::WireEnvelope> encapsulate(std::string_view message, const config::Settings &s)
{
    auto p = LayerPipeline::create(s);
    if (!p)
        return std::nullopt;
    return p->encapsulate(message);
}

proto::Error decapsulate(const proto::WireEnvelope &wire, const config::Settings &s, Decapsulated &out)
{
    out = Decapsulated{};
    auto p = LayerPipeline::create(s, &out.error_detail);
    if (!p)
        return proto::Error::Config;
    return p->decapsulate(wire, out);
}

}  // namespace app
