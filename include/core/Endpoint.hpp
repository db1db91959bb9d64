#pragma once
#include <cstdint>
#include <string>
#include "common/Result.hpp"

namespace core {

// Parsed ws:// or wss:// destination
struct Endpoint {
    bool secure = false;
    std::string host;
    uint16_t port = 0;
    std::string target = "/";   // path + query, sent in the request line

    // host[:port] as sent in the Host header (port omitted when default)
    std::string host_header() const;
    std::string to_string() const;
};

// Accepts ws, wss, http and https URLs. http(s) is rewritten to ws(s).
common::Result<Endpoint> parse_endpoint(const std::string& url);

// Returns a copy whose target carries `token=<percent-encoded token>`.
Endpoint with_token_query(const Endpoint& endpoint, const std::string& token);

std::string percent_encode(const std::string& value);

} // namespace core
