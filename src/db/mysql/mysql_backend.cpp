#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_adapter.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace dbgate {

std::string MysqlBackend::connection_string(
    const SqlConnectParams& params,
    std::chrono::milliseconds connect_timeout) const {

    const auto seconds = std::max<int64_t>(1, (connect_timeout.count() + 999) / 1000);
    return std::format("mysql://{}:{}@{}:{}/{}?connect_timeout={}",
        utils::percent_encode(params.user),
        utils::percent_encode(params.password),
        params.host,
        params.port != 0 ? params.port : default_port(),
        utils::percent_encode(params.database),
        seconds);
}

std::shared_ptr<IConnectionFactory> MysqlBackend::create_factory() {
    return std::make_shared<MysqlConnectionFactory>();
}

std::unique_ptr<SqlAdapter> MysqlBackend::create_adapter(
    std::shared_ptr<IConnectionPool> pool,
    std::chrono::milliseconds acquire_timeout) {

    return std::make_unique<MysqlAdapter>(std::move(pool), acquire_timeout);
}

} // namespace dbgate
