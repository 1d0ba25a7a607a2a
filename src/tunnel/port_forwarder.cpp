#include "tunnel/port_forwarder.hpp"
#include "core/utils.hpp"

#include <format>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace dbgate {

PortForwarder::PortForwarder(std::shared_ptr<IChannelOpener> opener,
                             std::string remote_host,
                             uint16_t remote_port)
    : opener_(std::move(opener)),
      remote_host_(std::move(remote_host)),
      remote_port_(remote_port) {}

PortForwarder::~PortForwarder() {
    stop();
}

Result<uint16_t> PortForwarder::start() {
    using R = Result<uint16_t>;
    if (running_.load()) {
        return R::ok(local_port_);
    }

    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("Tunnel: socket() failed: {}", strerror(errno)));
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(fd, 16) < 0) {
        const std::string reason = strerror(errno);
        ::close(fd);
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("Tunnel: failed to listen on 127.0.0.1: {}", reason));
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        const std::string reason = strerror(errno);
        ::close(fd);
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("Tunnel: getsockname() failed: {}", reason));
    }
    local_port_ = ntohs(addr.sin_port);
    listen_fd_.store(fd);

    running_.store(true);
    accept_thread_ = std::jthread([this, fd](std::stop_token) { accept_loop(fd); });

    utils::log::info(std::format("Tunnel: 127.0.0.1:{} -> {}:{}",
        local_port_, remote_host_, remote_port_));
    return R::ok(local_port_);
}

void PortForwarder::stop() {
    if (!running_.exchange(false)) return;

    // Wake accept() first; the descriptor is closed only once nothing uses it
    const int fd = listen_fd_.exchange(-1);
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
    }

    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    if (fd >= 0) {
        ::close(fd);
    }

    {
        std::lock_guard lock(clients_mutex_);
        for (const int client_fd : client_fds_) {
            shutdown(client_fd, SHUT_RDWR);
        }
    }

    std::lock_guard lock(workers_mutex_);
    for (auto& w : workers_) {
        w.thread.request_stop();
    }
    for (auto& w : workers_) {
        if (w.thread.joinable()) w.thread.join();
    }
    workers_.clear();

    utils::log::info(std::format("Tunnel: listener on port {} stopped", local_port_));
}

size_t PortForwarder::worker_count() const {
    std::lock_guard lock(workers_mutex_);
    return workers_.size();
}

void PortForwarder::reap_finished() {
    std::lock_guard lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done.load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void PortForwarder::accept_loop(int listen_fd) {
    while (running_.load()) {
        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        const int client_fd = accept(listen_fd,
            reinterpret_cast<struct sockaddr*>(&client_addr), &addr_len);

        if (client_fd < 0) {
            if (!running_.load()) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            utils::log::warn(std::format("Tunnel: accept() failed on port {}: {}",
                local_port_, strerror(errno)));
            break;
        }

        char origin[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, origin, sizeof(origin));
        const uint16_t origin_port = ntohs(client_addr.sin_port);

        reap_finished();

        {
            std::lock_guard lock(clients_mutex_);
            client_fds_.insert(client_fd);
        }
        active_connections_.fetch_add(1);

        std::lock_guard lock(workers_mutex_);
        auto& worker = workers_.emplace_back();
        worker.thread = std::jthread(
            [this, &worker, client_fd, host = std::string(origin), origin_port](std::stop_token st) mutable {
                serve_client(st, client_fd, std::move(host), origin_port);
                worker.done.store(true);
                active_connections_.fetch_sub(1);
            });
    }
}

void PortForwarder::serve_client(std::stop_token stop, int client_fd,
                                 std::string origin_host, uint16_t origin_port) {
    auto channel = opener_->open_channel(remote_host_, remote_port_, origin_host, origin_port);
    if (channel.is_error()) {
        utils::log::warn(std::format("Tunnel: failed to open channel to {}:{}: {}",
            remote_host_, remote_port_, channel.error_message()));
        release_client(client_fd);
        return;
    }
    splice(stop, client_fd, std::move(channel.value()));
}

void PortForwarder::splice(std::stop_token stop, int client_fd,
                           std::unique_ptr<IForwardChannel> channel) {
    char buf[16384];
    std::string pending;  // client bytes the channel has not accepted yet

    while (!stop.stop_requested()) {
        struct pollfd fds[2]{};
        fds[0].fd = client_fd;
        fds[0].events = pending.empty() ? POLLIN : 0;
        fds[1].fd = channel->poll_fd();
        fds[1].events = POLLIN;
        const nfds_t nfds = fds[1].fd >= 0 ? 2 : 1;

        const int timeout = pending.empty() ? static_cast<int>(kPollInterval.count()) : 1;
        if (poll(fds, nfds, timeout) < 0 && errno != EINTR) {
            break;
        }

        // Client -> channel
        if (pending.empty() && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            const ssize_t n = recv(client_fd, buf, sizeof(buf), MSG_DONTWAIT);
            if (n == 0) break;
            if (n < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) break;
            } else {
                pending.assign(buf, static_cast<size_t>(n));
            }
        }
        if (!pending.empty()) {
            const long written = channel->write(pending.data(), pending.size());
            if (written < 0) break;
            pending.erase(0, static_cast<size_t>(written));
        }

        // Channel -> client; drain whatever is buffered
        bool closed = false;
        while (true) {
            const long n = channel->read(buf, sizeof(buf));
            if (n < 0) { closed = true; break; }
            if (n == 0) break;
            size_t sent = 0;
            while (sent < static_cast<size_t>(n)) {
                const ssize_t s = send(client_fd, buf + sent, static_cast<size_t>(n) - sent, MSG_NOSIGNAL);
                if (s <= 0) {
                    if (s < 0 && errno == EINTR) continue;
                    closed = true;
                    break;
                }
                sent += static_cast<size_t>(s);
            }
            if (closed) break;
        }
        if (closed) break;
    }

    channel->close();
    release_client(client_fd);
}

void PortForwarder::release_client(int client_fd) {
    std::lock_guard lock(clients_mutex_);
    client_fds_.erase(client_fd);
    ::close(client_fd);
}

} // namespace dbgate
