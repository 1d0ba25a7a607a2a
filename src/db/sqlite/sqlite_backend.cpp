#include "db/sqlite/sqlite_backend.hpp"
#include "db/sqlite/sqlite_adapter.hpp"
#include "db/sqlite/sqlite_connection.hpp"

namespace dbgate {

std::string SqliteBackend::connection_string(
    const SqlConnectParams& params,
    std::chrono::milliseconds /*connect_timeout*/) const {
    return params.path;
}

std::shared_ptr<IConnectionFactory> SqliteBackend::create_factory() {
    return std::make_shared<SqliteConnectionFactory>();
}

std::unique_ptr<SqlAdapter> SqliteBackend::create_adapter(
    std::shared_ptr<IConnectionPool> pool,
    std::chrono::milliseconds acquire_timeout) {

    return std::make_unique<SqliteAdapter>(std::move(pool), acquire_timeout);
}

} // namespace dbgate
