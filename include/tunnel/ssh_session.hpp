#pragma once

#include "core/error.hpp"
#include "db/connect_params.hpp"
#include "net/tcp_socket.hpp"
#include "tunnel/forward_channel.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

namespace dbgate {

/**
 * @brief Authenticated libssh2 session
 *
 * libssh2 sessions are not thread safe: every call on the session or one of
 * its channels holds mutex_ for that single call. After authentication the
 * session runs non-blocking. Channels keep the session alive.
 */
class SshSession : public IChannelOpener,
                   public std::enable_shared_from_this<SshSession> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief TCP connect, handshake and password authentication
     *
     * Errors: AUTH_UNSUPPORTED without a password, CONNECT_ERROR for
     * handshake or authentication failure, TIMEOUT_ERROR for a TCP timeout.
     */
    [[nodiscard]] static Result<std::shared_ptr<SshSession>> connect(
        const SshTarget& target,
        std::chrono::milliseconds timeout);

    // Use connect(); the tag keeps construction inside this class
    SshSession(PrivateTag, net::TcpSocket socket, LIBSSH2_SESSION* session, std::string endpoint);

    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    Result<std::unique_ptr<IForwardChannel>> open_channel(
        const std::string& remote_host, uint16_t remote_port,
        const std::string& origin_host, uint16_t origin_port) override;

    [[nodiscard]] const std::string& endpoint() const { return endpoint_; }

private:
    friend class SshChannel;

    std::string last_error();

    net::TcpSocket socket_;
    LIBSSH2_SESSION* session_;
    std::string endpoint_;
    std::mutex mutex_;
};

} // namespace dbgate
