#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>
#include <optional>

namespace dbgate {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      slots_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = open_connection();
        if (!conn) {
            utils::log::warn(std::format("Pool '{}': warm-up stopped at connection {}: {}",
                name_, i + 1, last_error()));
            break;
        }
        const auto now = Clock::now();
        std::lock_guard lock(mutex_);
        idle_.push_back(IdleConnection{std::move(conn), now, now});
    }

    utils::log::debug(std::format("Pool '{}' ready: {} open (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

bool GenericConnectionPool::is_stale(IdleConnection& idle, Clock::time_point now) {
    if (config_.max_lifetime.count() > 0 && now - idle.created_at > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    if (now - idle.last_used > config_.idle_timeout &&
        !idle.conn->is_healthy(config_.health_check_query)) {
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    return false;
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (drained_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!slots_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(mutex_);
        last_error_ = std::format("Timed out after {}ms waiting for a connection to '{}'",
            timeout.count(), name_);
        return nullptr;
    }

    // drain() may have run while we waited
    if (drained_.load(std::memory_order_acquire)) {
        slots_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::optional<IdleConnection> idle;
    {
        std::lock_guard lock(mutex_);
        if (!idle_.empty()) {
            idle = std::move(idle_.front());
            idle_.pop_front();
        }
    }

    // Lifetime and health checks may do I/O; run them unlocked
    if (idle && is_stale(*idle, Clock::now())) {
        close_connection(std::move(idle->conn));
        idle.reset();
    }

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point created_at;
    if (idle) {
        conn = std::move(idle->conn);
        created_at = idle->created_at;
    } else {
        conn = open_connection();
        if (!conn) {
            slots_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        created_at = Clock::now();
    }

    return std::make_unique<PooledConnection>(std::move(conn),
        [this, created_at](std::unique_ptr<IDbConnection> c) {
            give_back(std::move(c), created_at);
        });
}

std::string GenericConnectionPool::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    drained_.store(true, std::memory_order_release);

    std::deque<IdleConnection> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_);
    }

    for (auto& entry : idle) {
        close_connection(std::move(entry.conn));
    }

    if (!idle.empty()) {
        utils::log::debug(std::format("Pool '{}' drained, {} idle closed", name_, idle.size()));
    }
}

std::unique_ptr<IDbConnection> GenericConnectionPool::open_connection() {
    auto result = factory_->create(config_.connection_string);
    if (result.is_error()) {
        std::lock_guard lock(mutex_);
        last_error_ = result.error_message();
        return nullptr;
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return std::move(result.value());
}

void GenericConnectionPool::close_connection(std::unique_ptr<IDbConnection> conn) {
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::give_back(std::unique_ptr<IDbConnection> conn,
                                      Clock::time_point created_at) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (drained_.load(std::memory_order_acquire) || !conn->is_connected()) {
        close_connection(std::move(conn));
    } else {
        std::lock_guard lock(mutex_);
        idle_.push_back(IdleConnection{std::move(conn), created_at, Clock::now()});
    }

    slots_.release();
}

} // namespace dbgate
