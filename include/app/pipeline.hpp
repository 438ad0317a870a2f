#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/obfuscator.hpp"
#include "proto/addressing.hpp"
#include "proto/app_framer.hpp"
#include "proto/bits.hpp"
#include "proto/envelopes.hpp"
#include "proto/error.hpp"
#include "proto/frag.hpp"
#include "proto/session.hpp"
#include "util/config.hpp"

namespace app
{

enum class Direction
{
    Encapsulate,
    Decapsulate
};

// Emitted after every layer transition.
struct LayerEvent
{
    Direction   direction{Direction::Encapsulate};
    int         number{0};
    const char *name{""};
    std::size_t units{0};  // segments/packets/frames, 1 for single envelopes
    std::size_t bytes{0};  // payload bytes (bits for the physical layer)
};

using OnLayer = std::function<void(const LayerEvent &)>;

// Every envelope produced by one encapsulate() call, named after the layer that built it.
struct EncapTrace
{
    proto::ApplicationEnvelope application;
    proto::ObfuscatedEnvelope  presentation;
    proto::SessionEnvelope     session;
    proto::SegmentSet          transport;
    proto::PacketSet           network;
    proto::FrameSet            link;
    proto::BinaryFrameSet      physical;
};

// Same for decapsulate(). The failing layer's slot and all later ones stay default constructed.
struct DecapTrace
{
    proto::FrameSet            physical;
    proto::PacketSet           link;
    proto::SegmentSet          network;
    proto::SessionEnvelope     transport;
    proto::ObfuscatedEnvelope  session;
    proto::ApplicationEnvelope presentation;
    std::string                application;
};

struct Decapsulated
{
    std::string                          message;
    std::vector<proto::IntegrityWarning> warnings;      // filled even when a later layer fails
    std::string                          error_detail;  // empty on success
};

// Fixed L7..L1 stack. Holds only read-only configuration, so one instance may serve
// concurrent callers as long as the observer tolerates that.
class LayerPipeline
{
  public:
    // nullptr when the settings fail config::validate or libsodium cannot be
    // initialised; why (if given) says which.
    static std::unique_ptr<LayerPipeline> create(const config::Settings &s, std::string *why = nullptr);

    // layers keep a reference to cipher_
    LayerPipeline(const LayerPipeline &)            = delete;
    LayerPipeline &operator=(const LayerPipeline &) = delete;

    // Set before use; not synchronised with running calls.
    void set_observer(OnLayer cb) { on_layer_ = std::move(cb); }

    proto::WireEnvelope encapsulate(std::string_view message, EncapTrace *trace = nullptr) const;

    // Returns Error::None and fills out.message on success. Integrity warnings do not
    // fail the call.
    proto::Error decapsulate(const proto::WireEnvelope &wire,
                             Decapsulated              &out,
                             DecapTrace                *trace = nullptr) const;

    const config::Settings &settings() const { return settings_; }

  private:
    explicit LayerPipeline(const config::Settings &s);

    template <typename L>
    typename L::lower_type down(const L &layer, const typename L::upper_type &in) const;

    template <typename L>
    proto::Error up(const L                      &layer,
                    const typename L::lower_type &in,
                    typename L::upper_type       &out,
                    proto::Diagnostics           &diag) const;

    template <typename Env>
    void notify(Direction dir, int number, const char *name, const Env &env) const;

    config::Settings         settings_;
    crypto::XorCipher        cipher_;
    proto::ApplicationFramer application_;
    crypto::Obfuscator       presentation_;
    proto::SessionTagger     session_;
    proto::Segmenter         transport_;
    proto::NetworkAddresser  network_;
    proto::LinkAddresser     link_;
    proto::BinaryCodec       physical_;
    OnLayer                  on_layer_;
};

// One-shot helpers for callers that do not keep a pipeline around. Invalid settings
// give std::nullopt and Error::Config respectively.
std::optional<proto::WireEnvelope> encapsulate(std::string_view message, const config::Settings &s);
proto::Error decapsulate(const proto::WireEnvelope &wire, const config::Settings &s, Decapsulated &out);

}  // namespace app
