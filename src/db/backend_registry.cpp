#include "db/backend_registry.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/mysql/mysql_backend.hpp"
#include "db/postgresql/pg_backend.hpp"
#include "db/sqlite/sqlite_backend.hpp"

namespace dbgate {

std::shared_ptr<IConnectionPool> IDbBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    return std::make_shared<GenericConnectionPool>(db_name, config, create_factory());
}

std::shared_ptr<BackendRegistry> BackendRegistry::with_builtin_backends() {
    auto registry = std::make_shared<BackendRegistry>();
    registry->register_backend(DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    registry->register_backend(DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    registry->register_backend(DatabaseType::SQLITE,
        [] { return std::make_unique<SqliteBackend>(); });
    return registry;
}

} // namespace dbgate
