#pragma once

#include "core/error.hpp"
#include "db/connect_params.hpp"
#include "tunnel/forward_channel.hpp"
#include "tunnel/port_forwarder.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace dbgate {

/**
 * @brief A running local forward: the shared session plus its listener
 *
 * Destroying the last reference stops the listener and joins its threads;
 * the session itself lives on until every open channel is gone.
 */
class TunnelSession {
public:
    TunnelSession(std::shared_ptr<IChannelOpener> session,
                  std::unique_ptr<PortForwarder> forwarder);

    ~TunnelSession();

    TunnelSession(const TunnelSession&) = delete;
    TunnelSession& operator=(const TunnelSession&) = delete;

    [[nodiscard]] uint16_t local_port() const { return forwarder_->local_port(); }

    [[nodiscard]] const std::shared_ptr<IChannelOpener>& session() const { return session_; }

private:
    std::shared_ptr<IChannelOpener> session_;
    std::unique_ptr<PortForwarder> forwarder_;
};

class ITunnelOpener {
public:
    virtual ~ITunnelOpener() = default;

    /**
     * @brief Authenticate against target and forward a local port to
     *        remote_host:remote_port on the far side
     */
    [[nodiscard]] virtual Result<std::shared_ptr<TunnelSession>> open_tunnel(
        const SshTarget& target,
        const std::string& remote_host,
        uint16_t remote_port) = 0;
};

class TunnelManager : public ITunnelOpener {
public:
    explicit TunnelManager(std::chrono::milliseconds handshake_timeout);

    Result<std::shared_ptr<TunnelSession>> open_tunnel(
        const SshTarget& target,
        const std::string& remote_host,
        uint16_t remote_port) override;

    /**
     * @brief Start forwarding through an already-open channel opener
     */
    [[nodiscard]] static Result<std::shared_ptr<TunnelSession>> forward(
        std::shared_ptr<IChannelOpener> opener,
        const std::string& remote_host,
        uint16_t remote_port);

private:
    std::chrono::milliseconds handshake_timeout_;
};

} // namespace dbgate
