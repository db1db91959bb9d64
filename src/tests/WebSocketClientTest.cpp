// ============================================================================
// WebSocket client tests against an in-process loopback server
// ============================================================================
// The server side is a minimal blocking RFC 6455 peer on 127.0.0.1 with an
// ephemeral port. Covers the upgrade handshake (token query + bearer header),
// client masking, ping/pong, server close and HTTP 401 mapping.
// ============================================================================

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/Cancellation.hpp"
#include "core/Endpoint.hpp"
#include "net/WebSocketChannel.hpp"
#include "testing/TestHarness.hpp"

using namespace testing;
using namespace std::chrono_literals;

namespace {

// ============================================================================
// Loopback server
// ============================================================================

class LoopbackServer {
public:
    enum class Mode { Accept, Unauthorized };

    explicit LoopbackServer(Mode mode) : mode_(mode) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 1);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { run(); });
    }

    ~LoopbackServer() {
        if (thread_.joinable()) thread_.join();
        if (listen_fd_ >= 0) ::close(listen_fd_);
    }

    uint16_t port() const { return port_; }

    // Filled by the server thread; read after join()
    void join() { if (thread_.joinable()) thread_.join(); }

    std::string request_head;
    std::string received_text;
    bool client_masked = false;
    bool got_pong = false;
    bool got_close_echo = false;

private:
    bool read_exact(int fd, std::vector<uint8_t>& buffer, net::WsFrame& frame) {
        uint8_t chunk[4096];
        while (true) {
            auto decoded = net::decode_frame(buffer, frame, 1 << 20);
            if (decoded.is_err()) return false;
            if (decoded.unwrap() > 0) {
                if (buffer.size() >= 2 && (buffer[1] & 0x80)) client_masked = true;
                buffer.erase(buffer.begin(), buffer.begin() + decoded.unwrap());
                return true;
            }
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) return false;
            buffer.insert(buffer.end(), chunk, chunk + n);
        }
    }

    void send_all(int fd, const std::string& data) {
        ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    }

    void send_frame(int fd, net::WsOpcode op, const std::string& payload) {
        auto frame = net::encode_frame(op, reinterpret_cast<const uint8_t*>(payload.data()),
                                       payload.size(), nullptr);
        ::send(fd, frame.data(), frame.size(), MSG_NOSIGNAL);
    }

    void run() {
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) return;

        std::string head;
        char c;
        while (head.find("\r\n\r\n") == std::string::npos && ::recv(fd, &c, 1, 0) == 1) {
            head += c;
        }
        request_head = head;

        if (mode_ == Mode::Unauthorized) {
            send_all(fd, "HTTP/1.1 401 Unauthorized\r\nContent-Length: 0\r\n\r\n");
            ::close(fd);
            return;
        }

        std::string key;
        const std::string marker = "Sec-WebSocket-Key: ";
        size_t pos = head.find(marker);
        if (pos != std::string::npos) {
            size_t end = head.find("\r\n", pos);
            key = head.substr(pos + marker.size(), end - pos - marker.size());
        }

        send_all(fd, "HTTP/1.1 101 Switching Protocols\r\n"
                     "Upgrade: websocket\r\n"
                     "Connection: Upgrade\r\n"
                     "Sec-WebSocket-Accept: " + net::compute_accept_key(key) + "\r\n\r\n");

        std::vector<uint8_t> buffer;
        net::WsFrame frame;

        // 1. client text
        if (read_exact(fd, buffer, frame) && frame.opcode == net::WsOpcode::TEXT) {
            received_text.assign(frame.payload.begin(), frame.payload.end());
        }

        // 2. reply, split into two fragments
        auto first = net::encode_frame(net::WsOpcode::TEXT,
                                       reinterpret_cast<const uint8_t*>("ack:"), 4, nullptr);
        first[0] &= 0x7F; // clear FIN
        ::send(fd, first.data(), first.size(), MSG_NOSIGNAL);
        send_frame(fd, net::WsOpcode::CONTINUATION, received_text);

        // 3. ping -> expect pong
        send_frame(fd, net::WsOpcode::PING, "hb");
        if (read_exact(fd, buffer, frame) && frame.opcode == net::WsOpcode::PONG) {
            got_pong = std::string(frame.payload.begin(), frame.payload.end()) == "hb";
        }

        // 4. close -> expect echo
        std::string normal("\x03\xE8", 2);
        send_frame(fd, net::WsOpcode::CLOSE, normal);
        if (read_exact(fd, buffer, frame) && frame.opcode == net::WsOpcode::CLOSE) {
            got_close_echo = true;
        }
        ::close(fd);
    }

    Mode mode_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
};

core::Endpoint endpoint_for(uint16_t port) {
    return core::parse_endpoint("ws://127.0.0.1:" + std::to_string(port) + "/report").unwrap();
}

// ============================================================================
// Tests
// ============================================================================

void test_frame_codec() {
    section("Framing");

    std::string big(70000, 'x');
    uint8_t mask[4] = {1, 2, 3, 4};
    auto encoded = net::encode_frame(net::WsOpcode::BINARY,
                                     reinterpret_cast<const uint8_t*>(big.data()), big.size(), mask);
    net::WsFrame frame;
    auto partial = std::vector<uint8_t>(encoded.begin(), encoded.begin() + 100);
    auto incomplete = net::decode_frame(partial, frame, 1 << 20);
    log_test("Incomplete frame consumes nothing", incomplete.is_ok() && incomplete.unwrap() == 0);

    auto decoded = net::decode_frame(encoded, frame, 1 << 20);
    bool ok = decoded.is_ok() && decoded.unwrap() == encoded.size() &&
              frame.opcode == net::WsOpcode::BINARY &&
              std::string(frame.payload.begin(), frame.payload.end()) == big;
    log_test("64-bit length frame with mask decodes", ok);

    auto too_big = net::decode_frame(encoded, frame, 1024);
    log_test("Oversized frame is a protocol error",
             too_big.is_err() && too_big.error().code == common::ErrorCode::ProtocolError);

    log_test("Accept key matches RFC 6455 example",
             net::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzhtOwxYzs+o=");
}

void test_handshake_and_session() {
    section("Session");

    LoopbackServer server(LoopbackServer::Mode::Accept);
    net::WebSocketConnector connector;
    common::CancellationSource cancel;

    auto connected = connector.connect(endpoint_for(server.port()), "tok en", 2s, cancel.get_token());
    log_test("Handshake succeeds", connected.is_ok(),
             connected.is_err() ? connected.error().message : "");
    if (connected.is_err()) {
        server.join();
        return;
    }

    auto channel = connected.take();
    bool sent = channel->send_text("hello").is_ok();

    auto reply = channel->poll_text(2s);
    log_test("Fragmented reply is reassembled",
             sent && reply.is_ok() && reply.unwrap() && *reply.unwrap() == "ack:hello");

    // Next poll answers the ping internally, then sees the close
    std::optional<common::AppError> end;
    for (int i = 0; i < 20 && !end; ++i) {
        auto r = channel->poll_text(100ms);
        if (r.is_err()) end = r.error();
    }
    log_test("Server close surfaces as Cancelled",
             end && end->code == common::ErrorCode::Cancelled);

    channel->close(100ms);
    server.join();

    log_test("Request carries token query",
             server.request_head.find("GET /report?token=tok%20en HTTP/1.1") != std::string::npos);
    log_test("Request carries bearer header",
             server.request_head.find("Authorization: Bearer tok en") != std::string::npos);
    log_test("Client frames are masked", server.client_masked);
    log_test("Server received the text", server.received_text == "hello");
    log_test("Ping answered with pong", server.got_pong);
    log_test("Close frame echoed", server.got_close_echo);
}

void test_unauthorized() {
    section("Unauthorized");

    LoopbackServer server(LoopbackServer::Mode::Unauthorized);
    net::WebSocketConnector connector;
    common::CancellationSource cancel;

    auto result = connector.connect(endpoint_for(server.port()), "bad", 2s, cancel.get_token());
    server.join();
    log_test("HTTP 401 maps to AuthRejected",
             result.is_err() && result.error().code == common::ErrorCode::AuthRejected);
}

void test_refused() {
    section("Refused");

    // Bind and immediately close to get a port with no listener
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);

    net::WebSocketConnector connector;
    common::CancellationSource cancel;
    auto t = std::chrono::steady_clock::now();
    auto result = connector.connect(endpoint_for(port), "", 1s, cancel.get_token());
    log_test("Refused connection is an error, not AuthRejected",
             result.is_err() && result.error().code != common::ErrorCode::AuthRejected,
             result.is_err() ? result.error().message : "", elapsed_ms(t));
}

} // namespace

int main() {
    std::cout << "WebSocket Client Test Suite" << std::endl;
    std::cout << "===========================" << std::endl;

    test_frame_codec();
    test_handshake_and_session();
    test_unauthorized();
    test_refused();

    return print_summary();
}
