#include "core/Endpoint.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace core {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

std::string Endpoint::host_header() const {
    bool default_port = (secure && port == 443) || (!secure && port == 80);
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return default_port ? h : h + ":" + std::to_string(port);
}

std::string Endpoint::to_string() const {
    return std::string(secure ? "wss://" : "ws://") + host_header() + target;
}

common::Result<Endpoint> parse_endpoint(const std::string& raw) {
    using R = common::Result<Endpoint>;
    const std::string url = trim(raw);

    if (url.empty()) {
        return R::err(common::ErrorCode::InvalidArgument, "endpoint is empty");
    }

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return R::err(common::ErrorCode::InvalidArgument, "endpoint has no scheme: " + url);
    }

    Endpoint ep;
    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme == "ws" || scheme == "http") {
        ep.secure = false;
    } else if (scheme == "wss" || scheme == "https") {
        ep.secure = true;
    } else {
        return R::err(common::ErrorCode::InvalidArgument, "unsupported scheme: " + scheme);
    }

    std::string rest = url.substr(scheme_end + 3);
    size_t path_start = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_start);
    std::string target = path_start == std::string::npos ? "/" : rest.substr(path_start);

    // Fragments are never sent
    size_t hash = target.find('#');
    if (hash != std::string::npos) target.erase(hash);
    if (target.empty() || target[0] != '/') target.insert(0, "/");

    if (authority.find('@') != std::string::npos) {
        return R::err(common::ErrorCode::InvalidArgument, "credentials in endpoint URL are not supported");
    }

    std::string host;
    std::string port_str;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return R::err(common::ErrorCode::InvalidArgument, "malformed IPv6 host: " + authority);
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return R::err(common::ErrorCode::InvalidArgument, "malformed authority: " + authority);
            }
            port_str = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != std::string::npos) port_str = authority.substr(colon + 1);
    }

    if (host.empty()) {
        return R::err(common::ErrorCode::InvalidArgument, "endpoint has no host: " + url);
    }

    ep.port = ep.secure ? 443 : 80;
    if (!port_str.empty()) {
        if (port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return R::err(common::ErrorCode::InvalidArgument, "invalid port: " + port_str);
        }
        unsigned long port = std::stoul(port_str);
        if (port == 0 || port > 65535) {
            return R::err(common::ErrorCode::InvalidArgument, "port out of range: " + port_str);
        }
        ep.port = static_cast<uint16_t>(port);
    }

    ep.host = to_lower(host);
    ep.target = target;
    return R::ok(ep);
}

std::string percent_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

Endpoint with_token_query(const Endpoint& endpoint, const std::string& token) {
    Endpoint out = endpoint;
    if (token.empty()) return out;

    out.target += (out.target.find('?') == std::string::npos) ? "?" : "&";
    out.target += "token=" + percent_encode(token);
    return out;
}

} // namespace core
