#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>

namespace dbgate {

/**
 * @brief Bounded pool over any IConnectionFactory
 *
 * A counting semaphore caps checked-out plus idle connections at
 * max_connections. The pool opens min_connections up front and grows on
 * demand. On checkout an idle connection is replaced when it has outlived
 * max_lifetime, or checked with the health query when it sat idle past
 * idle_timeout. Connections that come back disconnected are closed.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    std::string last_error() const override;
    PoolStats get_stats() const override;
    void drain() override;

    const std::string& name() const override { return name_; }

private:
    using Clock = std::chrono::steady_clock;

    struct IdleConnection {
        std::unique_ptr<IDbConnection> conn;
        Clock::time_point created_at;
        Clock::time_point last_used;
    };

    // Idle connection past its lifetime or failing its health query
    bool is_stale(IdleConnection& idle, Clock::time_point now);

    std::unique_ptr<IDbConnection> open_connection();
    void close_connection(std::unique_ptr<IDbConnection> conn);
    void give_back(std::unique_ptr<IDbConnection> conn, Clock::time_point created_at);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<IdleConnection> idle_;
    std::string last_error_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> slots_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> drained_{false};
};

} // namespace dbgate
