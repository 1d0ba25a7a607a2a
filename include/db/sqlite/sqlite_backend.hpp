#pragma once

#include "db/idb_backend.hpp"

namespace dbgate {

/**
 * @brief SQLite backend
 *
 * Creates:
 * - SqliteConnectionFactory → GenericConnectionPool
 * - SqliteAdapter
 */
class SqliteBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::SQLITE;
    }

    [[nodiscard]] uint16_t default_port() const override { return 0; }

    // The file path
    [[nodiscard]] std::string connection_string(
        const SqlConnectParams& params,
        std::chrono::milliseconds connect_timeout) const override;

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_factory() override;

    [[nodiscard]] std::unique_ptr<SqlAdapter> create_adapter(
        std::shared_ptr<IConnectionPool> pool,
        std::chrono::milliseconds acquire_timeout) override;
};

} // namespace dbgate
