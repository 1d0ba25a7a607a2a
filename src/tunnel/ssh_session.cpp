#include "tunnel/ssh_session.hpp"
#include "core/utils.hpp"

#include <libssh2.h>
#include <fcntl.h>
#include <format>
#include <thread>

namespace dbgate {

namespace {

constexpr std::chrono::milliseconds kChannelOpenTimeout{10000};
constexpr std::chrono::milliseconds kRetryDelay{5};
constexpr int kCloseRetries = 200;
constexpr long kBlockingCloseTimeoutMs = 2000;

Result<void> ensure_libssh2() {
    static const int rc = libssh2_init(0);
    if (rc != 0) {
        return Result<void>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("libssh2_init failed ({})", rc));
    }
    return Result<void>::ok();
}

} // anonymous namespace

// ============================================================================
// SshChannel
// ============================================================================

class SshChannel : public IForwardChannel {
public:
    SshChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel)
        : session_(std::move(session)), channel_(channel) {}

    ~SshChannel() override { close(); }

    long read(char* buf, size_t n) override {
        std::lock_guard lock(session_->mutex_);
        if (!channel_) return -1;
        const auto rc = libssh2_channel_read(channel_, buf, n);
        if (rc > 0) return static_cast<long>(rc);
        if (rc == LIBSSH2_ERROR_EAGAIN) return 0;
        if (rc == 0) return libssh2_channel_eof(channel_) ? -1 : 0;
        return -1;
    }

    long write(const char* buf, size_t n) override {
        std::lock_guard lock(session_->mutex_);
        if (!channel_) return -1;
        const auto rc = libssh2_channel_write(channel_, buf, n);
        if (rc >= 0) return static_cast<long>(rc);
        if (rc == LIBSSH2_ERROR_EAGAIN) return 0;
        return -1;
    }

    int poll_fd() const override { return session_->socket_.fd(); }

    void close() override {
        for (int attempt = 0; attempt < kCloseRetries; ++attempt) {
            {
                std::lock_guard lock(session_->mutex_);
                if (!channel_) return;
                const int rc = libssh2_channel_free(channel_);
                if (rc != LIBSSH2_ERROR_EAGAIN) {
                    channel_ = nullptr;
                    return;
                }
            }
            std::this_thread::sleep_for(kRetryDelay);
        }

        // Peer is slow to acknowledge: finish in blocking mode with a bounded wait
        std::lock_guard lock(session_->mutex_);
        if (!channel_) return;
        LIBSSH2_SESSION* session = session_->session_;
        libssh2_session_set_blocking(session, 1);
        libssh2_session_set_timeout(session, kBlockingCloseTimeoutMs);
        if (libssh2_channel_free(channel_) != 0) {
            // The session still owns the channel and releases it on free
            utils::log::warn(std::format("SSH {}: channel did not close cleanly: {}",
                session_->endpoint(), session_->last_error()));
        }
        libssh2_session_set_timeout(session, 0);
        libssh2_session_set_blocking(session, 0);
        channel_ = nullptr;
    }

private:
    std::shared_ptr<SshSession> session_;
    LIBSSH2_CHANNEL* channel_;
};

// ============================================================================
// SshSession
// ============================================================================

SshSession::SshSession(PrivateTag, net::TcpSocket socket, LIBSSH2_SESSION* session,
                       std::string endpoint)
    : socket_(std::move(socket)),
      session_(session),
      endpoint_(std::move(endpoint)) {}

SshSession::~SshSession() {
    if (session_) {
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_set_timeout(session_, 1000);
        libssh2_session_disconnect(session_, "dbgate tunnel closed");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    utils::log::info(std::format("SSH {}: session closed", endpoint_));
}

std::string SshSession::last_error() {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return msg ? std::string(msg, static_cast<size_t>(len)) : std::string("unknown libssh2 error");
}

Result<std::shared_ptr<SshSession>> SshSession::connect(
    const SshTarget& target,
    std::chrono::milliseconds timeout) {
    using R = Result<std::shared_ptr<SshSession>>;

    if (!target.password || target.password->empty()) {
        return R::error(ErrorCategory::AUTH_UNSUPPORTED,
            "SSH authentication requires a password");
    }

    if (auto init = ensure_libssh2(); init.is_error()) {
        return R::error_from(init);
    }

    auto sock = net::TcpSocket::connect(target.host, target.port, timeout);
    if (sock.is_error()) {
        return R::error_from(sock);
    }

    LIBSSH2_SESSION* raw = libssh2_session_init();
    if (!raw) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "libssh2_session_init failed");
    }

    const std::string endpoint = std::format("{}@{}:{}", target.username, target.host, target.port);
    auto session = std::make_shared<SshSession>(PrivateTag{}, std::move(sock.value()), raw, endpoint);

    libssh2_session_set_blocking(raw, 1);
    libssh2_session_set_timeout(raw, static_cast<long>(timeout.count()));

    if (libssh2_session_handshake(raw, session->socket_.fd()) != 0) {
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("SSH handshake with {}:{} failed: {}",
                target.host, target.port, session->last_error()));
    }

    if (libssh2_userauth_password(raw, target.username.c_str(), target.password->c_str()) != 0) {
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("SSH authentication failed for {}: {}", endpoint, session->last_error()));
    }

    // Channel traffic runs non-blocking; a blocking fd would stall under the session mutex
    const int fd = session->socket_.fd();
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("SSH {}: failed to make socket non-blocking", endpoint));
    }
    libssh2_session_set_blocking(raw, 0);

    utils::log::info(std::format("SSH {}: authenticated", endpoint));
    return R::ok(std::move(session));
}

Result<std::unique_ptr<IForwardChannel>> SshSession::open_channel(
    const std::string& remote_host, uint16_t remote_port,
    const std::string& origin_host, uint16_t origin_port) {
    using R = Result<std::unique_ptr<IForwardChannel>>;

    const auto deadline = std::chrono::steady_clock::now() + kChannelOpenTimeout;
    while (true) {
        {
            std::lock_guard lock(mutex_);
            LIBSSH2_CHANNEL* channel = libssh2_channel_direct_tcpip_ex(
                session_, remote_host.c_str(), remote_port,
                origin_host.c_str(), origin_port);
            if (channel) {
                return R::ok(std::make_unique<SshChannel>(shared_from_this(), channel));
            }
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return R::error(ErrorCategory::CONNECT_ERROR,
                    std::format("direct-tcpip to {}:{} refused: {}",
                        remote_host, remote_port, last_error()));
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return R::error(ErrorCategory::TIMEOUT_ERROR,
                std::format("direct-tcpip to {}:{} timed out", remote_host, remote_port));
        }
        std::this_thread::sleep_for(kRetryDelay);
    }
}

} // namespace dbgate
