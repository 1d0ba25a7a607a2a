#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>
#include <memory>

namespace dbgate {

namespace {

struct PGResultDeleter {
    void operator()(PGresult* r) const { if (r) PQclear(r); }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

std::string trimmed_error(PGconn* conn) {
    return utils::trim(PQerrorMessage(conn));
}

// bytea arrives hex-escaped in text mode; hand back the raw bytes
std::string unescape_bytea(const char* text) {
    size_t len = 0;
    unsigned char* raw = PQunescapeBytea(reinterpret_cast<const unsigned char*>(text), &len);
    if (!raw) {
        return text;
    }
    std::string bytes(reinterpret_cast<const char*>(raw), len);
    PQfreemem(raw);
    return bytes;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    PGresult* res = PQexec(conn_, sql.c_str());
    if (!res) {
        return DbResultSet::failure(trimmed_error(conn_));
    }
    return dispatch_result(res);
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<SqlValue>& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    // Null paramTypes: the server infers each type from context
    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    if (!res) {
        return DbResultSet::failure(trimmed_error(conn_));
    }
    return dispatch_result(res);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGResultPtr res(PQexec(conn_, health_check_query.c_str()));
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::dispatch_result(PGresult* raw) {
    PGResultPtr res(raw);
    const ExecStatusType status = PQresultStatus(res.get());

    if (status == PGRES_TUPLES_OK) {
        return read_rows(res.get());
    }
    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        return read_command_status(res.get());
    }

    const char* msg = PQresultErrorMessage(res.get());
    return DbResultSet::failure(
        msg && *msg ? utils::trim(msg) : trimmed_error(conn_));
}

DbResultSet PgConnection::read_rows(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    std::vector<bool> is_bytea(static_cast<size_t>(ncols), false);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));

        const Oid type_oid = PQftype(res, i);
        result.column_types.push_back(ColumnTypeInfo{
            PgTypeMap::oid_to_generic_type(type_oid), static_cast<uint32_t>(type_oid), {}});
        is_bytea[static_cast<size_t>(i)] = (type_oid == pg_oid::BYTEA);
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        std::vector<SqlValue> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
                continue;
            }
            const char* val = PQgetvalue(res, i, j);
            if (is_bytea[static_cast<size_t>(j)]) {
                row.emplace_back(unescape_bytea(val));
            } else {
                row.emplace_back(std::string(val, static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::read_command_status(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const std::string& connection_string) {
    using R = Result<std::unique_ptr<IDbConnection>>;

    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        return R::error(ErrorCategory::CONNECT_ERROR, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = trimmed_error(conn);
        PQfinish(conn);
        return R::error(ErrorCategory::CONNECT_ERROR, std::move(error));
    }

    return R::ok(std::make_unique<PgConnection>(conn));
}

} // namespace dbgate
