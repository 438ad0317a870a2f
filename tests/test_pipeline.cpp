#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "app/pipeline.hpp"
#include "util/log.hpp"

using app::Decapsulated;
using app::LayerPipeline;
using proto::Error;

namespace
{
std::size_t ceil_div(std::size_t a, std::size_t b)
{
    return (a + b - 1) / b;
}

std::string roundtrip(const LayerPipeline &p, const std::string &msg)
{
    Decapsulated res;
    EXPECT_EQ(p.decapsulate(p.encapsulate(msg), res), Error::None) << res.error_detail;
    EXPECT_TRUE(res.warnings.empty());
    return res.message;
}
}  // namespace

TEST(Pipeline, Roundtrip_Messages)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);

    const std::vector<std::string> messages = {
        "",
        "Hello, OSI Model!",
        "Temperature: 23.5C",
        "{\"sensor\": \"DHT22\", \"temp\": 23.5, \"humidity\": 45}",
        "Alert",
        "Simulating a longer MQTT message that will be split into multiple segments during transport!",
        "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82 \xE4\xB8\x96\xE7\x95\x8C \xF0\x9F\x8C\x8D",
        "header-like\r\n\r\nContent-Length: 0\r\n\r\ntail",
    };
    for (const auto &m : messages)
        EXPECT_EQ(roundtrip(*p, m), m);
}

TEST(Pipeline, Roundtrip_ExactMultipleOfChunkSize)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);

    // grow the payload until header + payload lands on a chunk boundary
    std::string msg;
    for (int i = 0; i < 20; ++i)
    {
        app::EncapTrace t;
        p->encapsulate(msg, &t);
        if (t.presentation.cipher_bytes.size() % 10 == 0)
            break;
        msg.push_back('x');
    }
    app::EncapTrace t;
    auto            wire = p->encapsulate(msg, &t);
    ASSERT_EQ(t.presentation.cipher_bytes.size() % 10, 0u);
    EXPECT_EQ(t.transport.segments.back().payload.size(), 10u);
    EXPECT_EQ(wire.frames.size(), t.presentation.cipher_bytes.size() / 10);
    EXPECT_EQ(roundtrip(*p, msg), msg);
}

TEST(Pipeline, TemperatureScenario)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    const std::string msg = "Temperature: 23.5C";

    app::EncapTrace t;
    auto            wire = p->encapsulate(msg, &t);

    const std::size_t cipher_len = t.presentation.cipher_bytes.size();
    EXPECT_EQ(cipher_len, t.application.header.size() + msg.size());
    EXPECT_EQ(t.presentation.original_length, cipher_len);
    EXPECT_EQ(t.transport.segments.size(), ceil_div(cipher_len, 10));
    EXPECT_EQ(t.network.packets.size(), t.transport.segments.size());
    EXPECT_EQ(t.link.frames.size(), t.transport.segments.size());
    EXPECT_EQ(wire.total_bits, 8 * cipher_len);
    EXPECT_EQ(wire.session_id, t.session.session_id);
    EXPECT_EQ(wire.session_id.size(), 16u);

    Decapsulated res;
    ASSERT_EQ(p->decapsulate(wire, res), Error::None);
    EXPECT_EQ(res.message, msg);
    EXPECT_TRUE(res.warnings.empty());
}

TEST(Pipeline, SegmentCountFollowsChunkSize)
{
    for (std::size_t chunk : {1u, 3u, 10u, 64u, 1500u})
    {
        config::Settings cfg;
        cfg.chunk_size = chunk;
        auto p = LayerPipeline::create(cfg);
        ASSERT_TRUE(p);

        const std::string msg(77, 'm');
        app::EncapTrace   t;
        auto              wire = p->encapsulate(msg, &t);
        EXPECT_EQ(wire.frames.size(), ceil_div(t.presentation.cipher_bytes.size(), chunk));
        EXPECT_EQ(roundtrip(*p, msg), msg);
    }
}

TEST(Pipeline, ObserverSeesEveryLayerInOrder)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    std::vector<app::LayerEvent>   events;
    p->set_observer([&](const app::LayerEvent &ev) { events.push_back(ev); });

    auto wire = p->encapsulate("observe me");
    ASSERT_EQ(events.size(), 7u);
    for (int i = 0; i < 7; ++i)
    {
        EXPECT_EQ(events[i].direction, app::Direction::Encapsulate);
        EXPECT_EQ(events[i].number, 7 - i);
    }
    EXPECT_STREQ(events[0].name, "Application Layer");
    EXPECT_STREQ(events[6].name, "Physical Layer");
    EXPECT_EQ(events[6].bytes, wire.total_bits);
    EXPECT_EQ(events[6].units, wire.frames.size());

    events.clear();
    Decapsulated res;
    ASSERT_EQ(p->decapsulate(wire, res), Error::None);
    ASSERT_EQ(events.size(), 7u);
    for (int i = 0; i < 7; ++i)
    {
        EXPECT_EQ(events[i].direction, app::Direction::Decapsulate);
        EXPECT_EQ(events[i].number, i + 1);
    }
    EXPECT_EQ(events[6].bytes, std::string("observe me").size());
}

TEST(Pipeline, DecapTraceMirrorsEncapTrace)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    app::EncapTrace et;
    auto            wire = p->encapsulate("trace both ways", &et);

    app::DecapTrace dt;
    Decapsulated    res;
    ASSERT_EQ(p->decapsulate(wire, res, &dt), Error::None);

    EXPECT_EQ(dt.application, "trace both ways");
    EXPECT_EQ(dt.presentation.header, et.application.header);
    EXPECT_EQ(dt.session.cipher_bytes, et.presentation.cipher_bytes);
    EXPECT_EQ(dt.transport.session_id, et.session.session_id);
    ASSERT_EQ(dt.network.segments.size(), et.transport.segments.size());
    for (std::size_t i = 0; i < dt.network.segments.size(); ++i)
    {
        EXPECT_EQ(dt.network.segments[i].checksum, et.transport.segments[i].checksum);
        EXPECT_EQ(dt.network.segments[i].payload, et.transport.segments[i].payload);
    }
    EXPECT_EQ(dt.link.packets.size(), et.network.packets.size());
    EXPECT_EQ(dt.physical.frames.size(), et.link.frames.size());
}

TEST(Pipeline, ReorderedFramesStillRecover)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    const std::string msg  = "out of order delivery is fine";
    auto              wire = p->encapsulate(msg);
    std::reverse(wire.frames.begin(), wire.frames.end());

    Decapsulated res;
    ASSERT_EQ(p->decapsulate(wire, res), Error::None);
    EXPECT_EQ(res.message, msg);
}

TEST(Pipeline, TamperedBitYieldsWarningNotError)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    const std::string msg  = "The quick brown fox jumps over the lazy dog";
    auto              wire = p->encapsulate(msg);

    // the last frame holds payload bytes only; flip the lowest bit of its last byte
    auto &last = wire.frames.back();
    last.bits.back() = last.bits.back() == '0' ? '1' : '0';

    osisim::set_log_level(osisim::Level::Warning);
    testing::internal::CaptureStderr();
    Decapsulated res;
    const Error  e   = p->decapsulate(wire, res);
    std::string  err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(e, Error::None);
    ASSERT_EQ(res.warnings.size(), 1u);
    EXPECT_EQ(res.warnings[0].sequence, last.frame_info.packet.segment.sequence);
    EXPECT_NE(res.warnings[0].expected, res.warnings[0].actual);
    EXPECT_EQ(res.message, "The quick brown fox jumps over the lazy dof");
    EXPECT_NE(err.find("checksum mismatch"), std::string::npos);
}

TEST(Pipeline, MalformedWireIsProtocolError)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    auto wire = p->encapsulate("a message long enough for several frames");

    {
        auto bad = wire;
        bad.frames[0].bits[3] = '2';
        Decapsulated res;
        EXPECT_EQ(p->decapsulate(bad, res), Error::Protocol);
        EXPECT_TRUE(res.message.empty());
        EXPECT_FALSE(res.error_detail.empty());
    }
    {
        auto bad = wire;
        bad.frames[1].bits.resize(bad.frames[1].bits.size() - 3);
        bad.frames[1].bit_length = bad.frames[1].bits.size();
        Decapsulated res;
        EXPECT_EQ(p->decapsulate(bad, res), Error::Protocol);
    }
    {
        // a lost frame no longer adds up to the declared bit count
        auto bad = wire;
        bad.frames.erase(bad.frames.begin() + 1);
        Decapsulated res;
        EXPECT_EQ(p->decapsulate(bad, res), Error::Protocol);
    }
    {
        // with the total patched up, the gap in sequence numbers is still caught
        auto bad = wire;
        bad.total_bits -= bad.frames[1].bit_length;
        bad.frames.erase(bad.frames.begin() + 1);
        Decapsulated res;
        EXPECT_EQ(p->decapsulate(bad, res), Error::Protocol);
    }
}

TEST(Pipeline, DeclaredBitTotalIsChecked)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    auto wire = p->encapsulate("abc");

    wire.total_bits = 12345;
    Decapsulated    res;
    app::DecapTrace dt;
    EXPECT_EQ(p->decapsulate(wire, res, &dt), Error::Protocol);
    EXPECT_TRUE(res.message.empty());
    EXPECT_NE(res.error_detail.find("12345"), std::string::npos);
    EXPECT_TRUE(dt.physical.frames.empty());
}

TEST(Pipeline, FailedLayerLeavesTraceSlotEmpty)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    auto wire = p->encapsulate("a message long enough for several frames");
    ASSERT_GT(wire.frames.size(), 2u);
    wire.frames[2].bits[0] = 'x';  // earlier frames decode before this one fails

    Decapsulated    res;
    app::DecapTrace dt;
    ASSERT_EQ(p->decapsulate(wire, res, &dt), Error::Protocol);
    EXPECT_TRUE(dt.physical.frames.empty());
    EXPECT_TRUE(dt.link.packets.empty());
    EXPECT_TRUE(dt.application.empty());
}

TEST(Pipeline, InvalidSettingsAreRejected)
{
    std::string why;

    config::Settings zero_chunk;
    zero_chunk.chunk_size = 0;
    EXPECT_FALSE(LayerPipeline::create(zero_chunk, &why));
    EXPECT_NE(why.find("chunk_size"), std::string::npos);

    config::Settings crlf_host;
    crlf_host.http_host = "evil\r\n\r\nX";
    EXPECT_FALSE(LayerPipeline::create(crlf_host, &why));
    EXPECT_NE(why.find("http_host"), std::string::npos);

    config::Settings bad_mac;
    bad_mac.src_mac = "not-a-mac";
    EXPECT_FALSE(LayerPipeline::create(bad_mac));
}

TEST(Pipeline, Roundtrip_CustomHostAndPath)
{
    config::Settings cfg;
    cfg.http_host = "sensors.local:8080";
    cfg.http_path = "/v1/readings?id=7";
    auto p        = LayerPipeline::create(cfg);
    ASSERT_TRUE(p);

    app::EncapTrace t;
    auto            wire = p->encapsulate("humidity 45%", &t);
    EXPECT_EQ(t.application.header.rfind("POST /v1/readings?id=7 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(t.application.header.find("Host: sensors.local:8080\r\n"), std::string::npos);

    Decapsulated res;
    ASSERT_EQ(p->decapsulate(wire, res), Error::None) << res.error_detail;
    EXPECT_EQ(res.message, "humidity 45%");
}

TEST(Pipeline, UndecodableWireIsDecodeError)
{
    {
        auto p = LayerPipeline::create(config::Settings{});
        ASSERT_TRUE(p);
        Decapsulated  res;
        EXPECT_EQ(p->decapsulate(proto::WireEnvelope{}, res), Error::Decode);
    }
    {
        config::Settings other;
        other.cipher_key = 43;
        auto sender = LayerPipeline::create(config::Settings{});
        ASSERT_TRUE(sender);
        auto receiver = LayerPipeline::create(other);
        ASSERT_TRUE(receiver);

        Decapsulated res;
        EXPECT_EQ(receiver->decapsulate(sender->encapsulate("key mismatch"), res), Error::Decode);
    }
}

TEST(Pipeline, FreeFunctions)
{
    config::Settings cfg;
    cfg.cipher_key = 7;
    cfg.chunk_size = 4;

    auto wire = app::encapsulate("one shot", cfg);
    ASSERT_TRUE(wire);
    EXPECT_EQ(wire->frames.front().frame_info.packet.segment.payload.size(), 0u);

    Decapsulated res;
    ASSERT_EQ(app::decapsulate(*wire, cfg, res), Error::None);
    EXPECT_EQ(res.message, "one shot");
}

TEST(Pipeline, FreeFunctions_InvalidSettings)
{
    config::Settings bad;
    bad.chunk_size = 0;
    EXPECT_FALSE(app::encapsulate("payload data", bad));

    auto wire = app::encapsulate("payload data", config::Settings{});
    ASSERT_TRUE(wire);
    Decapsulated res;
    EXPECT_EQ(app::decapsulate(*wire, bad, res), Error::Config);
    EXPECT_TRUE(res.message.empty());
    EXPECT_NE(res.error_detail.find("chunk_size"), std::string::npos);
}

TEST(Pipeline, ConcurrentCallersAreIndependent)
{
    auto p = LayerPipeline::create(config::Settings{});
    ASSERT_TRUE(p);
    std::atomic<int> failures{0};

    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w)
    {
        workers.emplace_back([&, w] {
            for (int i = 0; i < 50; ++i)
            {
                const std::string msg = "worker " + std::to_string(w) + " message " + std::to_string(i);
                Decapsulated      res;
                if (p->decapsulate(p->encapsulate(msg), res) != Error::None || res.message != msg)
                    failures.fetch_add(1);
            }
        });
    }
    for (auto &t : workers)
        t.join();
    EXPECT_EQ(failures.load(), 0);
}
