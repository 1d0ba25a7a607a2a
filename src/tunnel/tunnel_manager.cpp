#include "tunnel/tunnel_manager.hpp"
#include "tunnel/ssh_session.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbgate {

TunnelSession::TunnelSession(std::shared_ptr<IChannelOpener> session,
                             std::unique_ptr<PortForwarder> forwarder)
    : session_(std::move(session)),
      forwarder_(std::move(forwarder)) {}

TunnelSession::~TunnelSession() {
    // Threads hold channels that reference the session; stop them first
    forwarder_->stop();
}

TunnelManager::TunnelManager(std::chrono::milliseconds handshake_timeout)
    : handshake_timeout_(handshake_timeout) {}

Result<std::shared_ptr<TunnelSession>> TunnelManager::forward(
    std::shared_ptr<IChannelOpener> opener,
    const std::string& remote_host,
    uint16_t remote_port) {
    using R = Result<std::shared_ptr<TunnelSession>>;

    auto forwarder = std::make_unique<PortForwarder>(opener, remote_host, remote_port);
    auto port = forwarder->start();
    if (port.is_error()) {
        return R::error_from(port);
    }
    return R::ok(std::make_shared<TunnelSession>(std::move(opener), std::move(forwarder)));
}

Result<std::shared_ptr<TunnelSession>> TunnelManager::open_tunnel(
    const SshTarget& target,
    const std::string& remote_host,
    uint16_t remote_port) {
    using R = Result<std::shared_ptr<TunnelSession>>;

    if (!target.password || target.password->empty()) {
        return R::error(ErrorCategory::AUTH_UNSUPPORTED,
            "SSH authentication requires a password");
    }

    utils::log::info(std::format("SSH: opening tunnel via {}:{} to {}:{}",
        target.host, target.port, remote_host, remote_port));

    auto session = SshSession::connect(target, handshake_timeout_);
    if (session.is_error()) {
        utils::log::warn(std::format("SSH: {}", session.error_message()));
        return R::error_from(session);
    }

    return forward(std::move(session.value()), remote_host, remote_port);
}

} // namespace dbgate
