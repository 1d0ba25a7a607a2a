#pragma once

#include "core/error.hpp"
#include "tunnel/forward_channel.hpp"

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_set>

namespace dbgate {

/**
 * @brief Local listener on 127.0.0.1 that splices each accepted client onto
 *        a channel opened through an IChannelOpener
 *
 * One accept thread plus one thread per client. The client thread opens
 * the channel and splices, so a target that is slow to answer only holds
 * up its own client. Finished client threads are joined by the accept loop
 * before it starts the next one. stop() closes the listener, shuts down
 * every active client socket and joins all threads.
 */
class PortForwarder {
public:
    static constexpr std::chrono::milliseconds kPollInterval{50};

    PortForwarder(std::shared_ptr<IChannelOpener> opener,
                  std::string remote_host,
                  uint16_t remote_port);

    ~PortForwarder();

    PortForwarder(const PortForwarder&) = delete;
    PortForwarder& operator=(const PortForwarder&) = delete;

    // Bind 127.0.0.1:0 and start accepting; returns the assigned port
    [[nodiscard]] Result<uint16_t> start();

    void stop();

    [[nodiscard]] uint16_t local_port() const { return local_port_; }

    [[nodiscard]] uint32_t active_connections() const {
        return active_connections_.load();
    }

    // Client threads not yet joined, finished or not
    [[nodiscard]] size_t worker_count() const;

private:
    struct Worker {
        std::jthread thread;
        std::atomic<bool> done{false};
    };

    void accept_loop(int listen_fd);
    void reap_finished();
    void serve_client(std::stop_token stop, int client_fd,
                      std::string origin_host, uint16_t origin_port);
    void splice(std::stop_token stop, int client_fd, std::unique_ptr<IForwardChannel> channel);
    void release_client(int client_fd);

    std::shared_ptr<IChannelOpener> opener_;
    std::string remote_host_;
    uint16_t remote_port_;

    std::atomic<int> listen_fd_{-1};
    uint16_t local_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint32_t> active_connections_{0};

    std::mutex clients_mutex_;
    std::unordered_set<int> client_fds_;

    std::jthread accept_thread_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace dbgate
