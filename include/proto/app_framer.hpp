#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "proto/envelopes.hpp"
#include "proto/layer.hpp"
#include "util/config.hpp"

namespace proto
{

// Layer 7: wraps the message in an HTTP/1.1 POST request.
//
//   POST /api/message HTTP/1.1\r\n
//   Host: example.com\r\n
//   Content-Type: text/plain\r\n
//   Content-Length: <UTF-8 byte length of payload>\r\n
//   \r\n
class ApplicationFramer final : public Layer<std::string, ApplicationEnvelope>
{
  public:
    explicit ApplicationFramer(const config::Settings &s);

    int         number() const override { return 7; }
    const char *name() const override { return "Application Layer"; }

    ApplicationEnvelope encapsulate(const std::string &message) const override;
    Error decapsulate(const ApplicationEnvelope &in, std::string &out, Diagnostics &diag) const override;

    std::string build_header(std::size_t payload_len) const;

  private:
    std::string host_;
    std::string path_;
};

// Splits a serialized request at the end of its header and checks Content-Length
// against the remaining byte count. The header keeps its trailing blank line.
bool split_request(std::string_view wire, std::string &header, std::string &payload, std::string *why);

// Value of the Content-Length field, false when absent or not a decimal number.
bool parse_content_length(std::string_view header, std::size_t &out);

}  // namespace proto
