#include "net/WebSocketChannel.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include "util/base64.h"
#include "util/sha1.h"

namespace net {

using common::ErrorCode;
using Clock = std::chrono::steady_clock;

namespace {

constexpr const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t kMaxHandshakeResponse = 16 * 1024;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r");
    return s.substr(a, b - a + 1);
}

std::chrono::milliseconds until(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool is_control(WsOpcode op) {
    return op == WsOpcode::CLOSE || op == WsOpcode::PING || op == WsOpcode::PONG;
}

} // namespace

// ============================================================================
// Framing
// ============================================================================

std::vector<uint8_t> encode_frame(WsOpcode opcode, const uint8_t* payload, size_t len,
                                  const uint8_t* mask_key) {
    std::vector<uint8_t> frame;
    frame.reserve(len + 14);

    // FIN + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    uint8_t mask_bit = mask_key ? 0x80 : 0x00;
    if (len <= 125) {
        frame.push_back(mask_bit | static_cast<uint8_t>(len));
    } else if (len <= 65535) {
        frame.push_back(mask_bit | 126);
        frame.push_back((len >> 8) & 0xFF);
        frame.push_back(len & 0xFF);
    } else {
        frame.push_back(mask_bit | 127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF);
        }
    }

    if (mask_key) {
        frame.insert(frame.end(), mask_key, mask_key + 4);
        for (size_t i = 0; i < len; ++i) {
            frame.push_back(payload[i] ^ mask_key[i % 4]);
        }
    } else {
        frame.insert(frame.end(), payload, payload + len);
    }
    return frame;
}

common::Result<size_t> decode_frame(const std::vector<uint8_t>& buffer, WsFrame& out,
                                    size_t max_payload) {
    using R = common::Result<size_t>;
    if (buffer.size() < 2) return R::ok(0);

    out.fin = (buffer[0] & 0x80) != 0;
    out.opcode = static_cast<WsOpcode>(buffer[0] & 0x0F);
    if (buffer[0] & 0x70) {
        return R::err(ErrorCode::ProtocolError, "reserved bits set without negotiated extension");
    }

    bool masked = (buffer[1] & 0x80) != 0;
    uint64_t payload_len = buffer[1] & 0x7F;
    size_t offset = 2;

    if (payload_len == 126) {
        if (buffer.size() < offset + 2) return R::ok(0);
        payload_len = (uint64_t(buffer[2]) << 8) | buffer[3];
        offset += 2;
    } else if (payload_len == 127) {
        if (buffer.size() < offset + 8) return R::ok(0);
        payload_len = 0;
        for (int i = 0; i < 8; ++i) {
            payload_len = (payload_len << 8) | buffer[offset + i];
        }
        offset += 8;
    }

    if (is_control(out.opcode) && (payload_len > 125 || !out.fin)) {
        return R::err(ErrorCode::ProtocolError, "invalid control frame");
    }
    if (payload_len > max_payload) {
        return R::err(ErrorCode::ProtocolError,
                      "frame too large: " + std::to_string(payload_len) + " bytes");
    }

    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buffer.size() < offset + 4) return R::ok(0);
        std::copy(buffer.begin() + offset, buffer.begin() + offset + 4, mask);
        offset += 4;
    }

    if (buffer.size() < offset + payload_len) return R::ok(0);

    out.payload.assign(buffer.begin() + offset, buffer.begin() + offset + payload_len);
    if (masked) {
        for (size_t i = 0; i < out.payload.size(); ++i) {
            out.payload[i] ^= mask[i % 4];
        }
    }
    return R::ok(offset + static_cast<size_t>(payload_len));
}

std::string compute_accept_key(const std::string& client_key) {
    auto digest = util::Sha1::of(client_key + kWebSocketGuid);
    return util::base64_encode(digest.data(), digest.size());
}

// ============================================================================
// WebSocketChannel
// ============================================================================

WebSocketChannel::WebSocketChannel(std::unique_ptr<StreamSocket> socket,
                                   std::vector<uint8_t> leftover)
    : socket_(std::move(socket))
    , rx_buffer_(std::move(leftover))
    , mask_rng_(std::random_device{}())
{
}

WebSocketChannel::~WebSocketChannel() {
    if (socket_) socket_->shutdown();
}

common::EmptyResult WebSocketChannel::send_frame(WsOpcode opcode, const uint8_t* data, size_t len) {
    if (!socket_) {
        return common::EmptyResult::err(ErrorCode::IoError, "channel closed");
    }

    uint32_t m = mask_rng_();
    uint8_t mask_key[4] = {
        static_cast<uint8_t>(m >> 24), static_cast<uint8_t>(m >> 16),
        static_cast<uint8_t>(m >> 8), static_cast<uint8_t>(m)
    };

    auto frame = encode_frame(opcode, data, len, mask_key);
    return socket_->write_all(frame.data(), frame.size(), SEND_TIMEOUT);
}

common::EmptyResult WebSocketChannel::send_text(const std::string& text) {
    return send_frame(WsOpcode::TEXT, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

common::EmptyResult WebSocketChannel::send_binary(const std::vector<uint8_t>& data) {
    return send_frame(WsOpcode::BINARY, data.data(), data.size());
}

common::EmptyResult WebSocketChannel::send_ping(const std::string& payload) {
    return send_frame(WsOpcode::PING, reinterpret_cast<const uint8_t*>(payload.data()),
                      std::min<size_t>(payload.size(), 125));
}

common::EmptyResult WebSocketChannel::handle_frame(WsFrame&& frame, std::optional<std::string>& text) {
    switch (frame.opcode) {
        case WsOpcode::PING:
            return send_frame(WsOpcode::PONG, frame.payload.data(), frame.payload.size());

        case WsOpcode::PONG:
            return common::EmptyResult::success();

        case WsOpcode::CLOSE: {
            close_received_ = true;
            uint16_t code = 1005;
            if (frame.payload.size() >= 2) {
                code = static_cast<uint16_t>((frame.payload[0] << 8) | frame.payload[1]);
            }
            if (!close_sent_) {
                close_sent_ = true;
                uint8_t echo[2] = {static_cast<uint8_t>(code >> 8), static_cast<uint8_t>(code & 0xFF)};
                auto res = send_frame(WsOpcode::CLOSE, echo, code == 1005 ? 0 : 2);
                if (res.is_err()) return res;
            }
            return common::EmptyResult::err(ErrorCode::Cancelled,
                                            "server closed connection (code " + std::to_string(code) + ")");
        }

        case WsOpcode::TEXT:
        case WsOpcode::BINARY:
            if (fragment_opcode_) {
                return common::EmptyResult::err(ErrorCode::ProtocolError,
                                                "new message while a fragmented one is pending");
            }
            if (!frame.fin) {
                fragment_opcode_ = frame.opcode;
                fragments_ = std::move(frame.payload);
                return common::EmptyResult::success();
            }
            if (frame.opcode == WsOpcode::TEXT) {
                text = std::string(frame.payload.begin(), frame.payload.end());
            }
            return common::EmptyResult::success();

        case WsOpcode::CONTINUATION:
            if (!fragment_opcode_) {
                return common::EmptyResult::err(ErrorCode::ProtocolError, "unexpected continuation frame");
            }
            if (fragments_.size() + frame.payload.size() > MAX_MESSAGE_SIZE) {
                return common::EmptyResult::err(ErrorCode::ProtocolError, "fragmented message too large");
            }
            fragments_.insert(fragments_.end(), frame.payload.begin(), frame.payload.end());
            if (frame.fin) {
                if (*fragment_opcode_ == WsOpcode::TEXT) {
                    text = std::string(fragments_.begin(), fragments_.end());
                }
                fragments_.clear();
                fragment_opcode_.reset();
            }
            return common::EmptyResult::success();
    }

    return common::EmptyResult::err(ErrorCode::ProtocolError,
                                    "unknown opcode " + std::to_string(static_cast<int>(frame.opcode)));
}

common::Result<std::optional<std::string>> WebSocketChannel::poll_text(std::chrono::milliseconds timeout) {
    using R = common::Result<std::optional<std::string>>;
    if (!socket_) return R::err(ErrorCode::IoError, "channel closed");

    auto deadline = Clock::now() + timeout;
    uint8_t buf[16 * 1024];

    while (true) {
        // Drain whatever is already buffered
        while (true) {
            WsFrame frame;
            auto decoded = decode_frame(rx_buffer_, frame, MAX_MESSAGE_SIZE);
            if (decoded.is_err()) return R::err(decoded.error());
            size_t consumed = decoded.unwrap();
            if (consumed == 0) break;
            rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + consumed);

            std::optional<std::string> text;
            auto handled = handle_frame(std::move(frame), text);
            if (handled.is_err()) return R::err(handled.error());
            if (text) return R::ok(std::move(text));
        }

        auto n = socket_->read_some(buf, sizeof(buf), until(deadline));
        if (n.is_err()) return R::err(n.error());
        if (n.unwrap() == 0) return R::ok(std::nullopt);
        rx_buffer_.insert(rx_buffer_.end(), buf, buf + n.unwrap());
    }
}

void WebSocketChannel::close(std::chrono::milliseconds timeout) {
    if (!socket_) return;

    auto deadline = Clock::now() + timeout;
    if (!close_sent_ && !close_received_) {
        close_sent_ = true;
        uint8_t normal[2] = {0x03, 0xE8}; // 1000
        if (send_frame(WsOpcode::CLOSE, normal, 2).is_ok()) {
            // Wait for the peer's close frame, bounded
            while (!close_received_ && Clock::now() < deadline) {
                auto r = poll_text(until(deadline));
                if (r.is_err()) break;
            }
        }
    }

    socket_->shutdown();
    socket_.reset();
}

// ============================================================================
// WebSocketConnector
// ============================================================================

WebSocketConnector::WebSocketConnector(std::string user_agent)
    : user_agent_(std::move(user_agent))
{
}

common::Result<std::unique_ptr<interfaces::IMessageChannel>> WebSocketConnector::connect(
    const core::Endpoint& endpoint,
    const std::string& auth_token,
    std::chrono::milliseconds timeout,
    const common::CancellationToken& cancel
) {
    using R = common::Result<std::unique_ptr<interfaces::IMessageChannel>>;
    auto deadline = Clock::now() + timeout;

    // Connect runs on the transport's IO thread, which later writes to the socket
    block_sigpipe_on_current_thread();

    auto sock_res = StreamSocket::connect(endpoint, deadline, cancel);
    if (sock_res.is_err()) return R::err(sock_res.error());
    std::unique_ptr<StreamSocket> sock = sock_res.take();

    // ---- Upgrade request ----
    std::random_device rd;
    uint8_t nonce[16];
    for (auto& b : nonce) b = static_cast<uint8_t>(rd());
    const std::string key = util::base64_encode(nonce, sizeof(nonce));

    const core::Endpoint target = core::with_token_query(endpoint, auth_token);

    std::ostringstream req;
    req << "GET " << target.target << " HTTP/1.1\r\n"
        << "Host: " << endpoint.host_header() << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << key << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n"
        << "User-Agent: " << user_agent_ << "\r\n";
    if (!auth_token.empty()) {
        req << "Authorization: Bearer " << auth_token << "\r\n";
    }
    req << "\r\n";
    const std::string request = req.str();

    auto wrote = sock->write_all(reinterpret_cast<const uint8_t*>(request.data()),
                                 request.size(), until(deadline));
    if (wrote.is_err()) return R::err(wrote.error());

    // ---- Response headers ----
    std::vector<uint8_t> response;
    size_t header_end = std::string::npos;
    uint8_t buf[4096];

    while (header_end == std::string::npos) {
        if (cancel.is_cancellation_requested()) {
            return R::err(ErrorCode::Cancelled, "handshake cancelled");
        }
        if (Clock::now() >= deadline) {
            return R::err(ErrorCode::Timeout, "handshake timed out");
        }

        auto n = sock->read_some(buf, sizeof(buf), std::min(until(deadline), std::chrono::milliseconds(100)));
        if (n.is_err()) {
            return R::err(ErrorCode::ConnectionFailed, "handshake read failed: " + n.error().message);
        }
        response.insert(response.end(), buf, buf + n.unwrap());

        std::string view(response.begin(), response.end());
        header_end = view.find("\r\n\r\n");
        if (header_end == std::string::npos && response.size() > kMaxHandshakeResponse) {
            return R::err(ErrorCode::ProtocolError, "handshake response too large");
        }
    }

    std::string head(response.begin(), response.begin() + header_end);
    std::vector<uint8_t> leftover(response.begin() + header_end + 4, response.end());

    std::istringstream lines(head);
    std::string status_line;
    std::getline(lines, status_line);
    int status = 0;
    {
        std::istringstream sl(status_line);
        std::string http_version;
        sl >> http_version >> status;
    }

    if (status == 401 || status == 403) {
        return R::err(ErrorCode::AuthRejected,
                      "endpoint rejected credentials (HTTP " + std::to_string(status) + ")");
    }
    if (status != 101) {
        return R::err(ErrorCode::ConnectionFailed,
                      "upgrade refused: " + trim(status_line));
    }

    std::string upgrade;
    std::string accept;
    std::string line;
    while (std::getline(lines, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "upgrade") upgrade = lower(value);
        else if (name == "sec-websocket-accept") accept = value;
    }

    if (upgrade != "websocket") {
        return R::err(ErrorCode::ProtocolError, "server did not upgrade to websocket");
    }
    if (accept != compute_accept_key(key)) {
        return R::err(ErrorCode::ProtocolError, "Sec-WebSocket-Accept mismatch");
    }

    return R::ok(std::make_unique<WebSocketChannel>(std::move(sock), std::move(leftover)));
}

} // namespace net
