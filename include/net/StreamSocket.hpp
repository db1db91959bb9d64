#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "core/Endpoint.hpp"
#include "core/NetworkDefs.hpp"

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace net {

// ============================================================================
// StreamSocket - connected TCP stream, optionally wrapped in TLS
// ============================================================================
// The descriptor is non-blocking; every operation takes its own timeout and
// waits with poll(). TLS uses OpenSSL with peer and host-name verification.
//
// Error codes:
//   - Cancelled: peer closed, or the cancellation token fired while connecting
//   - Timeout:   deadline passed
//   - ConnectionFailed / IoError: anything else
// ============================================================================

class StreamSocket {
public:
    static common::Result<std::unique_ptr<StreamSocket>> connect(
        const core::Endpoint& endpoint,
        std::chrono::steady_clock::time_point deadline,
        const common::CancellationToken& cancel
    );

    // Wraps an already connected plain descriptor (takes ownership)
    explicit StreamSocket(socket_t fd);
    ~StreamSocket();

    StreamSocket(const StreamSocket&) = delete;
    StreamSocket& operator=(const StreamSocket&) = delete;

    common::EmptyResult write_all(const uint8_t* data, size_t len, std::chrono::milliseconds timeout);

    // Returns the number of bytes read; 0 when nothing arrived within `timeout`
    common::Result<size_t> read_some(uint8_t* buf, size_t len, std::chrono::milliseconds timeout);

    void shutdown();

    bool is_tls() const { return ssl_ != nullptr; }
    socket_t fd() const { return fd_; }

private:
    StreamSocket(socket_t fd, SSL_CTX* ctx, SSL* ssl);

    common::EmptyResult start_tls(const std::string& host,
                                  std::chrono::steady_clock::time_point deadline,
                                  const common::CancellationToken& cancel);

    socket_t fd_ = INVALID_SOCKET;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

// A write to a peer-closed socket must surface as EPIPE, not kill the host.
// Blocks SIGPIPE on the calling thread (OpenSSL writes through write(2)).
void block_sigpipe_on_current_thread();

} // namespace net
