#pragma once

#include "db/idb_backend.hpp"

namespace dbgate {

/**
 * @brief PostgreSQL backend over libpq
 *
 * Creates:
 * - PgConnectionFactory → GenericConnectionPool
 * - PgAdapter
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] uint16_t default_port() const override { return 5432; }

    /**
     * @brief libpq keyword/value conninfo; values are single-quoted
     *
     * An empty database falls back to the user name, as libpq does.
     */
    [[nodiscard]] std::string connection_string(
        const SqlConnectParams& params,
        std::chrono::milliseconds connect_timeout) const override;

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_factory() override;

    [[nodiscard]] std::unique_ptr<SqlAdapter> create_adapter(
        std::shared_ptr<IConnectionPool> pool,
        std::chrono::milliseconds acquire_timeout) override;
};

} // namespace dbgate
