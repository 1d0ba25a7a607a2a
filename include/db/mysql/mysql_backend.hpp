#pragma once

#include "db/idb_backend.hpp"

namespace dbgate {

/**
 * @brief MySQL / MariaDB backend over libmysqlclient
 *
 * Creates:
 * - MysqlConnectionFactory → GenericConnectionPool
 * - MysqlAdapter
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
    }

    [[nodiscard]] uint16_t default_port() const override { return 3306; }

    [[nodiscard]] std::string connection_string(
        const SqlConnectParams& params,
        std::chrono::milliseconds connect_timeout) const override;

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_factory() override;

    [[nodiscard]] std::unique_ptr<SqlAdapter> create_adapter(
        std::shared_ptr<IConnectionPool> pool,
        std::chrono::milliseconds acquire_timeout) override;
};

} // namespace dbgate
