#include <cctype>
#include <string>

#include "proto/app_framer.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

namespace
{
constexpr std::string_view CONTENT_LENGTH = "Content-Length:";
constexpr std::string_view CRLF           = "\r\n";
}  // namespace

ApplicationFramer::ApplicationFramer(const config::Settings &s) : host_(s.http_host), path_(s.http_path)
{
}

std::string ApplicationFramer::build_header(std::size_t payload_len) const
{
    std::string h;
    h.reserve(96 + host_.size() + path_.size());
    h += "POST ";
    h += path_;
    h += " HTTP/1.1\r\n";
    h += "Host: ";
    h += host_;
    h += "\r\n";
    h += "Content-Type: text/plain\r\n";
    h += "Content-Length: ";
    h += std::to_string(payload_len);
    h += "\r\n\r\n";
    return h;
}

ApplicationEnvelope ApplicationFramer::encapsulate(const std::string &message) const
{
    ApplicationEnvelope env;
    env.header  = build_header(message.size());
    env.payload = message;
    LOG_DEBUG("header %zu bytes, payload %zu bytes", env.header.size(), env.payload.size());
    return env;
}

Error ApplicationFramer::decapsulate(const ApplicationEnvelope &in,
                                     std::string               &out,
                                     Diagnostics & /*diag*/) const
{
    // header is informational on this path, the payload was already delimited below us
    out = in.payload;
    return Error::None;
}

bool parse_content_length(std::string_view header, std::size_t &out)
{
    std::size_t pos = 0;
    while (pos < header.size())
    {
        std::size_t eol = header.find(CRLF, pos);
        if (eol == std::string_view::npos)
            eol = header.size();
        std::string_view line = header.substr(pos, eol - pos);
        if (line.substr(0, CONTENT_LENGTH.size()) == CONTENT_LENGTH)
        {
            std::string_view v = line.substr(CONTENT_LENGTH.size());
            while (!v.empty() && v.front() == ' ')
                v.remove_prefix(1);
            if (v.empty() || v.size() > 19)
                return false;
            std::size_t n = 0;
            for (char c : v)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return false;
                n = n * 10 + static_cast<std::size_t>(c - '0');
            }
            out = n;
            return true;
        }
        pos = eol + CRLF.size();
    }
    return false;
}

bool split_request(std::string_view wire, std::string &header, std::string &payload, std::string *why)
{
    // The generated header never contains a blank line, so the first one ends it
    // even when the payload itself carries "\r\n\r\n".
    const std::size_t end = wire.find(constants::HTTP_HEADER_END);
    if (end == std::string_view::npos)
    {
        if (why)
            *why = "missing end of header";
        return false;
    }
    const std::size_t body = end + constants::HTTP_HEADER_END.size();
    std::string_view  h    = wire.substr(0, body);

    std::size_t declared = 0;
    if (!parse_content_length(h, declared))
    {
        if (why)
            *why = "missing or invalid Content-Length";
        return false;
    }
    if (declared != wire.size() - body)
    {
        if (why)
            *why = "Content-Length " + std::to_string(declared) + " does not match body of " +
                   std::to_string(wire.size() - body) + " bytes";
        return false;
    }
    header.assign(h.data(), h.size());
    payload.assign(wire.data() + body, wire.size() - body);
    return true;
}

}  // namespace proto
