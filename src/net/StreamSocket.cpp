#include "net/StreamSocket.hpp"
#include <algorithm>
#include <cstring>
#include <signal.h>
#include <pthread.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace net {

namespace {

using Clock = std::chrono::steady_clock;
using common::ErrorCode;

// Poll slices keep connect/handshake responsive to cancellation
constexpr std::chrono::milliseconds kPollSlice{100};

std::string openssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) return 0;
    return static_cast<int>(std::min<long long>(left.count(), kPollSlice.count()));
}

// Waits for `events` on `fd` until the deadline, honoring cancellation.
// Returns 1 ready, 0 timed out, -1 cancelled, -2 poll error.
int wait_fd(socket_t fd, short events, Clock::time_point deadline,
            const common::CancellationToken* cancel) {
    while (true) {
        if (cancel && cancel->is_cancellation_requested()) return -1;
        int slice = remaining_ms(deadline);
        if (slice == 0) return 0;

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, slice);
        if (ready > 0) return 1;
        if (ready < 0 && errno != EINTR) return -2;
    }
}

common::EmptyResult connect_addr(socket_t fd, const struct addrinfo* ai,
                                 Clock::time_point deadline,
                                 const common::CancellationToken& cancel) {
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        return common::EmptyResult::success();
    }
    if (errno != EINPROGRESS) {
        return common::EmptyResult::err(ErrorCode::ConnectionFailed, std::strerror(errno));
    }

    int w = wait_fd(fd, POLLOUT, deadline, &cancel);
    if (w == -1) return common::EmptyResult::err(ErrorCode::Cancelled, "connect cancelled");
    if (w == 0) return common::EmptyResult::err(ErrorCode::Timeout, "connect timed out");
    if (w < 0) return common::EmptyResult::err(ErrorCode::ConnectionFailed, std::strerror(errno));

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
        return common::EmptyResult::err(ErrorCode::ConnectionFailed,
                                        std::strerror(so_error ? so_error : errno));
    }
    return common::EmptyResult::success();
}

} // namespace

void block_sigpipe_on_current_thread() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

// ============================================================================
// Construction / Destruction
// ============================================================================

StreamSocket::StreamSocket(socket_t fd) : fd_(fd) {
    set_nonblocking(fd_);
}

StreamSocket::StreamSocket(socket_t fd, SSL_CTX* ctx, SSL* ssl)
    : fd_(fd), ctx_(ctx), ssl_(ssl) {}

StreamSocket::~StreamSocket() {
    shutdown();
}

void StreamSocket::shutdown() {
    if (ssl_) {
        SSL_shutdown(ssl_);  // best effort close_notify, non-blocking
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
    if (IS_VALID_SOCKET(fd_)) {
        ::shutdown(fd_, SHUT_RDWR);
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET;
    }
}

// ============================================================================
// Connect
// ============================================================================

common::Result<std::unique_ptr<StreamSocket>> StreamSocket::connect(
    const core::Endpoint& endpoint,
    Clock::time_point deadline,
    const common::CancellationToken& cancel
) {
    using R = common::Result<std::unique_ptr<StreamSocket>>;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* results = nullptr;
    std::string port = std::to_string(endpoint.port);
    int gai = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &results);
    if (gai != 0) {
        return R::err(ErrorCode::ConnectionFailed,
                      "resolve " + endpoint.host + " failed: " + gai_strerror(gai));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> guard(results, &freeaddrinfo);

    common::AppError last_error{ErrorCode::ConnectionFailed, "no address for " + endpoint.host, ""};

    for (const struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        socket_t fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (!IS_VALID_SOCKET(fd)) {
            last_error = {ErrorCode::ConnectionFailed, std::strerror(errno), ""};
            continue;
        }

        set_nonblocking(fd);
        set_nodelay(fd);

        auto res = connect_addr(fd, ai, deadline, cancel);
        if (res.is_err()) {
            CLOSE_SOCKET(fd);
            last_error = res.error();
            if (last_error.code == ErrorCode::Cancelled || last_error.code == ErrorCode::Timeout) {
                break;
            }
            continue;
        }

        std::unique_ptr<StreamSocket> sock(new StreamSocket(fd, nullptr, nullptr));
        if (endpoint.secure) {
            auto tls = sock->start_tls(endpoint.host, deadline, cancel);
            if (tls.is_err()) return R::err(tls.error());
        }
        return R::ok(std::move(sock));
    }

    return R::err(last_error.code,
                  "connect " + endpoint.host + ":" + port + " failed: " + last_error.message);
}

common::EmptyResult StreamSocket::start_tls(const std::string& host,
                                            Clock::time_point deadline,
                                            const common::CancellationToken& cancel) {
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        return common::EmptyResult::err(ErrorCode::ConnectionFailed, openssl_error_string());
    }
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        return common::EmptyResult::err(ErrorCode::ConnectionFailed,
                                        "cannot load CA store: " + openssl_error_string());
    }

    ssl_ = SSL_new(ctx_);
    if (!ssl_) {
        return common::EmptyResult::err(ErrorCode::ConnectionFailed, openssl_error_string());
    }
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, host.c_str());
    SSL_set1_host(ssl_, host.c_str());

    while (true) {
        int rc = SSL_connect(ssl_);
        if (rc == 1) return common::EmptyResult::success();

        int err = SSL_get_error(ssl_, rc);
        short events = 0;
        if (err == SSL_ERROR_WANT_READ) events = POLLIN;
        else if (err == SSL_ERROR_WANT_WRITE) events = POLLOUT;
        else {
            long verify = SSL_get_verify_result(ssl_);
            std::string reason = verify != X509_V_OK
                ? std::string("certificate verification failed: ") + X509_verify_cert_error_string(verify)
                : openssl_error_string();
            return common::EmptyResult::err(ErrorCode::ConnectionFailed, "TLS handshake failed: " + reason);
        }

        int w = wait_fd(fd_, events, deadline, &cancel);
        if (w == -1) return common::EmptyResult::err(ErrorCode::Cancelled, "TLS handshake cancelled");
        if (w == 0) return common::EmptyResult::err(ErrorCode::Timeout, "TLS handshake timed out");
        if (w < 0) return common::EmptyResult::err(ErrorCode::ConnectionFailed, std::strerror(errno));
    }
}

// ============================================================================
// IO
// ============================================================================

common::EmptyResult StreamSocket::write_all(const uint8_t* data, size_t len,
                                            std::chrono::milliseconds timeout) {
    if (!IS_VALID_SOCKET(fd_)) {
        return common::EmptyResult::err(ErrorCode::IoError, "socket closed");
    }
    auto deadline = Clock::now() + timeout;
    size_t sent = 0;

    while (sent < len) {
        short wait_events = POLLOUT;

        if (ssl_) {
            int n = SSL_write(ssl_, data + sent, static_cast<int>(len - sent));
            if (n > 0) { sent += static_cast<size_t>(n); continue; }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_WANT_READ) wait_events = POLLIN;
            else if (err != SSL_ERROR_WANT_WRITE) {
                if (err == SSL_ERROR_ZERO_RETURN) {
                    return common::EmptyResult::err(ErrorCode::Cancelled, "peer closed");
                }
                return common::EmptyResult::err(ErrorCode::IoError, "TLS write failed: " + openssl_error_string());
            }
        } else {
            ssize_t n = ::send(fd_, data + sent, len - sent, SM_SEND_FLAGS);
            if (n > 0) { sent += static_cast<size_t>(n); continue; }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                if (errno == EPIPE || errno == ECONNRESET) {
                    return common::EmptyResult::err(ErrorCode::Cancelled, "peer closed");
                }
                return common::EmptyResult::err(ErrorCode::IoError, std::strerror(errno));
            }
        }

        int w = wait_fd(fd_, wait_events, deadline, nullptr);
        if (w == 0) return common::EmptyResult::err(ErrorCode::Timeout, "write timed out");
        if (w < 0) return common::EmptyResult::err(ErrorCode::IoError, std::strerror(errno));
    }

    return common::EmptyResult::success();
}

common::Result<size_t> StreamSocket::read_some(uint8_t* buf, size_t len,
                                               std::chrono::milliseconds timeout) {
    using R = common::Result<size_t>;
    if (!IS_VALID_SOCKET(fd_)) {
        return R::err(ErrorCode::IoError, "socket closed");
    }
    auto deadline = Clock::now() + timeout;

    while (true) {
        short wait_events = POLLIN;

        if (ssl_) {
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0) return R::ok(static_cast<size_t>(n));
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_ZERO_RETURN) return R::err(ErrorCode::Cancelled, "peer closed");
            if (err == SSL_ERROR_WANT_WRITE) wait_events = POLLOUT;
            else if (err != SSL_ERROR_WANT_READ) {
                if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
                    return R::err(ErrorCode::Cancelled, "peer closed");
                }
                return R::err(ErrorCode::IoError, "TLS read failed: " + openssl_error_string());
            }
        } else {
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n > 0) return R::ok(static_cast<size_t>(n));
            if (n == 0) return R::err(ErrorCode::Cancelled, "peer closed");
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                if (errno == ECONNRESET) return R::err(ErrorCode::Cancelled, "connection reset");
                return R::err(ErrorCode::IoError, std::strerror(errno));
            }
        }

        int w = wait_fd(fd_, wait_events, deadline, nullptr);
        if (w == 0) return R::ok(0);
        if (w < 0) return R::err(ErrorCode::IoError, std::strerror(errno));
    }
}

} // namespace net
