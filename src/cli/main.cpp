#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/pipeline.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

constexpr const char *DEFAULT_MESSAGE = "Hello, OSI Model!";

static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  osisim [--log-level <lvl>] [--chunk-size <n>] [--key <0-255>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  run [text...]     encapsulate, decapsulate and verify\n"
                         "  wire [text...]    print the bit string of every frame\n"
                         "  examples          run the sample sensor messages\n"
                         "  config            print the effective configuration\n"
                         "\n"
                         "Environment: OSISIM_LOG_LEVEL, OSISIM_CHUNK_SIZE, OSISIM_CIPHER_KEY,\n"
                         "  OSISIM_SRC_PORT, OSISIM_DST_PORT, OSISIM_SRC_IP, OSISIM_DST_IP,\n"
                         "  OSISIM_SRC_MAC, OSISIM_DST_MAC, OSISIM_TOKEN_LENGTH\n");
}

static bool parse_num(const std::string &s, unsigned long max, unsigned long &out)
{
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 10)
        return false;
    unsigned long v = std::strtoul(s.c_str(), nullptr, 10);
    if (v > max)
        return false;
    out = v;
    return true;
}

static std::string join_text(const std::vector<std::string> &args)
{
    std::string text;
    for (size_t i = 1; i < args.size(); ++i)
    {
        if (i > 1)
            text.push_back(' ');
        text += args[i];
    }
    return text;
}

static std::string hex_prefix(const proto::Bytes &b, std::size_t n)
{
    static const char *digits = "0123456789abcdef";
    std::string        out;
    for (std::size_t i = 0; i < b.size() && i < n; ++i)
    {
        out.push_back(digits[b[i] >> 4]);
        out.push_back(digits[b[i] & 0x0F]);
    }
    return out;
}

static void print_rule(char c)
{
    std::printf("%s\n", std::string(80, c).c_str());
}

static void print_encapsulation(const app::EncapTrace &t, const config::Settings &s)
{
    print_rule('=');
    std::printf("ENCAPSULATION (Application -> Physical)\n");
    print_rule('=');

    std::string first_line = t.application.header.substr(0, t.application.header.find('\r'));
    std::printf("\nLayer 7: Application Layer\n");
    std::printf("  Request: %s\n", first_line.c_str());
    std::printf("  Message: %s\n", t.application.payload.c_str());

    std::printf("\nLayer 6: Presentation Layer\n");
    std::printf("  Encoding: %s, Encryption: %s (key=%u)\n", t.presentation.encoding.c_str(),
                t.presentation.encryption.c_str(), static_cast<unsigned>(s.cipher_key));
    std::printf("  Encrypted length: %zu bytes\n", t.presentation.cipher_bytes.size());
    std::printf("  First 20 bytes (hex): %s\n", hex_prefix(t.presentation.cipher_bytes, 20).c_str());

    std::printf("\nLayer 5: Session Layer\n");
    std::printf("  Session ID: %s\n", t.session.session_id.c_str());

    std::printf("\nLayer 4: Transport Layer\n");
    std::printf("  Segments: %zu (chunk size %zu bytes)\n", t.transport.total_segments, s.chunk_size);
    std::printf("  Ports: %u -> %u\n", static_cast<unsigned>(s.src_port), static_cast<unsigned>(s.dst_port));
    if (!t.transport.segments.empty())
        std::printf("  First checksum: %s\n", t.transport.segments.front().checksum.c_str());

    std::printf("\nLayer 3: Network Layer\n");
    std::printf("  Packets: %zu, %s -> %s, TTL %u, %s\n", t.network.total_packets, s.src_ip.c_str(),
                s.dst_ip.c_str(), static_cast<unsigned>(s.ttl), constants::PROTOCOL_TCP.data());

    std::printf("\nLayer 2: Data Link Layer\n");
    std::printf("  Frames: %zu, %s -> %s, EtherType %s\n", t.link.total_frames, s.src_mac.c_str(),
                s.dst_mac.c_str(), constants::ETHERTYPE_IPV4.data());

    std::printf("\nLayer 1: Physical Layer\n");
    std::printf("  Total bits: %zu in %zu frames\n", t.physical.total_bits, t.physical.frames.size());
    if (!t.physical.frames.empty())
        std::printf("  First frame (50 bits): %s\n", t.physical.frames.front().bits.substr(0, 50).c_str());
}

static int cmd_run(const app::LayerPipeline &pipe, const std::string &message)
{
    app::EncapTrace     trace;
    proto::WireEnvelope wire = pipe.encapsulate(message, &trace);
    print_encapsulation(trace, pipe.settings());

    std::printf("\n");
    print_rule('=');
    std::printf("DECAPSULATION (Physical -> Application)\n");
    print_rule('=');

    app::Decapsulated  res;
    const proto::Error e = pipe.decapsulate(wire, res);
    for (const auto &w : res.warnings)
        std::printf("  Warning: checksum mismatch in segment %u\n", w.sequence);
    if (e != proto::Error::None)
    {
        std::printf("  %s: %s\n", proto::error_name(e), res.error_detail.c_str());
        return exitc::failure;
    }

    const bool match = res.message == message;
    std::printf("\n");
    print_rule('=');
    std::printf("VERIFICATION\n");
    print_rule('=');
    std::printf("Original Message:     %s\n", message.c_str());
    std::printf("Decapsulated Message: %s\n", res.message.c_str());
    std::printf("Match: %s\n", match ? "true" : "false");
    return match ? exitc::ok : exitc::mismatch;
}

static int cmd_wire(const app::LayerPipeline &pipe, const std::string &message)
{
    proto::WireEnvelope wire = pipe.encapsulate(message);
    std::printf("session %s frames %zu bits %zu\n", wire.session_id.c_str(), wire.frames.size(),
                wire.total_bits);
    for (const auto &f : wire.frames)
        std::printf("%u %s\n", f.frame_info.packet.segment.sequence, f.bits.c_str());
    return exitc::ok;
}

static int cmd_examples(const app::LayerPipeline &pipe)
{
    const std::vector<std::string> messages = {
        "Temperature: 23.5C",
        "{\"sensor\": \"DHT22\", \"temp\": 23.5, \"humidity\": 45}",
        "Alert",
        "Simulating a longer MQTT message that will be split into multiple segments during transport!",
    };

    int rc = exitc::ok;
    for (std::size_t i = 0; i < messages.size(); ++i)
    {
        const std::string &m     = messages[i];
        std::string        shown = m.size() > 30 ? m.substr(0, 30) + "..." : m;

        proto::WireEnvelope wire = pipe.encapsulate(m);
        app::Decapsulated   res;
        const proto::Error  e  = pipe.decapsulate(wire, res);
        const bool          ok = e == proto::Error::None && res.message == m;
        if (!ok)
            rc = exitc::mismatch;

        std::printf("--- Message %zu: '%s' ---\n", i + 1, shown.c_str());
        std::printf("  Total bits transmitted: %zu\n", wire.total_bits);
        std::printf("  Number of frames: %zu\n", wire.frames.size());
        std::printf("  Successfully recovered: %s\n", ok ? "true" : "false");
    }
    return rc;
}

static int cmd_config(const config::Settings &s)
{
    std::printf("chunk_size=%zu\n", s.chunk_size);
    std::printf("cipher_key=%u\n", static_cast<unsigned>(s.cipher_key));
    std::printf("ports=%u->%u\n", static_cast<unsigned>(s.src_port), static_cast<unsigned>(s.dst_port));
    std::printf("ip=%s->%s ttl=%u\n", s.src_ip.c_str(), s.dst_ip.c_str(), static_cast<unsigned>(s.ttl));
    std::printf("mac=%s->%s\n", s.src_mac.c_str(), s.dst_mac.c_str());
    std::printf("session_token_length=%zu\n", s.session_token_length);
    std::printf("http=%s%s\n", s.http_host.c_str(), s.http_path.c_str());
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args, const config::Settings &s)
{
    std::string why;
    auto        pipe = app::LayerPipeline::create(s, &why);
    if (!pipe)
    {
        std::fprintf(stderr, "error: %s\n", why.c_str());
        return exitc::failure;
    }
    auto message = [&]() -> std::string {
        std::string text = join_text(args);
        return text.empty() ? std::string(DEFAULT_MESSAGE) : text;
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"run", [&]() -> int { return cmd_run(*pipe, message()); }},
        {"wire", [&]() -> int { return cmd_wire(*pipe, message()); }},
        {"examples",
         [&]() -> int {
             if (args.size() != 1)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_examples(*pipe);
         }},
        {"config", [&]() -> int { return cmd_config(s); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    if (const char *e = std::getenv(constants::ENV_LOG_LEVEL); e && *e)
    {
        if (!osisim::set_log_level_by_name(e))
            LOG_WARN("unknown %s '%s', using warn", constants::ENV_LOG_LEVEL, e);
    }

    auto loaded = config::load_from_env();
    if (!loaded)
    {
        std::fprintf(stderr, "error: invalid OSISIM_* configuration\n");
        return exitc::bad_config;
    }
    config::Settings s = *loaded;

    // CLI options override env
    std::vector<std::string> args;
    args.reserve(argc - 1);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (!args.empty())
        {
            args.push_back(std::move(a));  // everything after the command is message text
            continue;
        }
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        unsigned long v = 0;
        if (a == "--log-level" && i + 1 < argc)
        {
            if (!osisim::set_log_level_by_name(argv[++i]))
            {
                std::fprintf(stderr, "error: unknown log level: %s\n", argv[i]);
                return exitc::bad_args;
            }
        }
        else if (a == "--chunk-size" && i + 1 < argc)
        {
            if (!parse_num(argv[++i], constants::MAX_CHUNK_SIZE, v) || v == 0)
            {
                std::fprintf(stderr, "error: invalid chunk size: %s\n", argv[i]);
                return exitc::bad_args;
            }
            s.chunk_size = v;
        }
        else if (a == "--key" && i + 1 < argc)
        {
            if (!parse_num(argv[++i], 0xFF, v))
            {
                std::fprintf(stderr, "error: invalid key: %s\n", argv[i]);
                return exitc::bad_args;
            }
            s.cipher_key = static_cast<std::uint8_t>(v);
        }
        else if (a.rfind("--", 0) == 0)
        {
            std::fprintf(stderr, "error: unknown option: %s\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    std::string why;
    if (!config::validate(s, &why))
    {
        std::fprintf(stderr, "error: %s\n", why.c_str());
        return exitc::bad_config;
    }

    return run_cmd(args[0], args, s);
}
