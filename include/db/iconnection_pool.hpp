#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace dbgate {

class PooledConnection;

/**
 * @brief Sizing and recycling rules for one backend pool
 *
 * Filled from GatewayConfig when a connect command succeeds. The connect
 * timeout is already baked into connection_string by the backend.
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 5;
    // Idle longer than this and the connection is checked before reuse
    std::chrono::milliseconds idle_timeout{300000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Connection pool owned by a registry slot
 *
 * SQL adapters borrow one connection per operation; the gateway drains the
 * pool when the slot is replaced or cleared.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Check out a connection, opening one if the pool has room
     * @return Handle that returns itself on destruction, or nullptr when
     *         the wait expires or the driver refuses; see last_error()
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    // Driver or timeout message behind the latest nullptr from acquire()
    [[nodiscard]] virtual std::string last_error() const = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    // Close idle connections and refuse further acquires
    virtual void drain() = 0;

    // "<backend>/<database>", or the file path for SQLite
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace dbgate
