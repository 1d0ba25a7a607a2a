#pragma once

#include "core/database_type.hpp"
#include "db/connect_params.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/sql_adapter.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace dbgate {

/**
 * @brief Relational backend: connection strings, pools and dialect adapters
 *
 * Each database type (MySQL, PostgreSQL, SQLite) provides a concrete
 * implementation that builds its connection string, pool and adapter.
 *
 * Usage:
 *   auto backend = registry.create(DatabaseType::POSTGRESQL);
 *   auto pool = backend->create_pool("postgres", config);
 *   auto adapter = backend->create_adapter(pool, acquire_timeout);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Port used when the caller passes 0 */
    [[nodiscard]] virtual uint16_t default_port() const = 0;

    /** @brief Driver connection string for the given parameters */
    [[nodiscard]] virtual std::string connection_string(
        const SqlConnectParams& params,
        std::chrono::milliseconds connect_timeout) const = 0;

    /** @brief Factory wrapping the native connect call */
    [[nodiscard]] virtual std::shared_ptr<IConnectionFactory> create_factory() = 0;

    /** @brief Create a connection pool */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config);

    /** @brief Create the dialect adapter over a borrowed pool */
    [[nodiscard]] virtual std::unique_ptr<SqlAdapter> create_adapter(
        std::shared_ptr<IConnectionPool> pool,
        std::chrono::milliseconds acquire_timeout) = 0;
};

} // namespace dbgate
