#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_adapter.hpp"
#include "db/postgresql/pg_connection.hpp"
#include <algorithm>
#include <format>

namespace dbgate {

namespace {

std::string conninfo_value(std::string_view value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // anonymous namespace

std::string PgBackend::connection_string(
    const SqlConnectParams& params,
    std::chrono::milliseconds connect_timeout) const {

    const auto seconds = std::max<int64_t>(2, (connect_timeout.count() + 999) / 1000);
    std::string conninfo = std::format("host={} port={} connect_timeout={}",
        conninfo_value(params.host),
        params.port != 0 ? params.port : default_port(),
        seconds);

    if (!params.user.empty()) {
        conninfo += " user=" + conninfo_value(params.user);
    }
    if (!params.password.empty()) {
        conninfo += " password=" + conninfo_value(params.password);
    }
    if (!params.database.empty()) {
        conninfo += " dbname=" + conninfo_value(params.database);
    }
    conninfo += " application_name='dbgate'";
    return conninfo;
}

std::shared_ptr<IConnectionFactory> PgBackend::create_factory() {
    return std::make_shared<PgConnectionFactory>();
}

std::unique_ptr<SqlAdapter> PgBackend::create_adapter(
    std::shared_ptr<IConnectionPool> pool,
    std::chrono::milliseconds acquire_timeout) {

    return std::make_unique<PgAdapter>(std::move(pool), acquire_timeout);
}

} // namespace dbgate
