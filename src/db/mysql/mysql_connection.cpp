#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <mysql/errmsg.h>
#include <cstring>
#include <format>
#include <memory>
#include <type_traits>

namespace dbgate {

namespace {

// bool in libmysqlclient 8, my_bool in MariaDB Connector/C
using BindFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

constexpr size_t kInitialCellBuffer = 256;

struct StmtCloser {
    void operator()(MYSQL_STMT* stmt) const { if (stmt) mysql_stmt_close(stmt); }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtCloser>;

struct ResCloser {
    void operator()(MYSQL_RES* res) const { if (res) mysql_free_result(res); }
};
using ResPtr = std::unique_ptr<MYSQL_RES, ResCloser>;

// Output buffer for one column of a prepared statement's row
struct CellBuffer {
    std::vector<char> data = std::vector<char>(kInitialCellBuffer);
    unsigned long length = 0;
    BindFlag is_null = 0;
    BindFlag truncated = 0;
};

} // anonymous namespace

// ============================================================================
// MysqlParamBinds
// ============================================================================

MysqlParamBinds::MysqlParamBinds(const std::vector<SqlValue>& params)
    : binds(params.size()),
      lengths(params.size(), 0) {
    for (size_t i = 0; i < params.size(); ++i) {
        MYSQL_BIND& b = binds[i];
        std::memset(&b, 0, sizeof(b));
        if (!params[i]) {
            b.buffer_type = MYSQL_TYPE_NULL;
            continue;
        }
        lengths[i] = static_cast<unsigned long>(params[i]->size());
        b.buffer_type = MYSQL_TYPE_STRING;
        b.buffer = const_cast<char*>(params[i]->data());
        b.buffer_length = lengths[i];
        b.length = &lengths[i];
    }
}

// ============================================================================
// MysqlConnection
// ============================================================================

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::failure() {
    const unsigned int code = mysql_errno(conn_);
    if (code == CR_SERVER_GONE_ERROR || code == CR_SERVER_LOST ||
        code == CR_COMMANDS_OUT_OF_SYNC) {
        broken_ = true;
    }
    return DbResultSet::failure(mysql_error(conn_));
}

DbResultSet MysqlConnection::statement_failure(MYSQL_STMT* stmt) {
    const unsigned int code = mysql_stmt_errno(stmt);
    if (code == CR_SERVER_GONE_ERROR || code == CR_SERVER_LOST ||
        code == CR_COMMANDS_OUT_OF_SYNC) {
        broken_ = true;
    }
    return DbResultSet::failure(mysql_stmt_error(stmt));
}

DbResultSet MysqlConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return failure();
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        auto result = process_result_set(res);
        mysql_free_result(res);
        return drain_results(std::move(result));
    }

    // No result set: either DML/DDL or error
    if (mysql_field_count(conn_) == 0) {
        return drain_results(process_affected_rows());
    }
    return failure();
}

DbResultSet MysqlConnection::drain_results(DbResultSet first) {
    int status = 0;
    while ((status = mysql_next_result(conn_)) == 0) {
        if (MYSQL_RES* extra = mysql_store_result(conn_)) {
            mysql_free_result(extra);
        } else if (mysql_field_count(conn_) != 0) {
            return failure();
        }
    }
    if (status > 0) {
        return failure();
    }
    return first;
}

DbResultSet MysqlConnection::execute_params(const std::string& sql,
                                            const std::vector<SqlValue>& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    StmtPtr stmt(mysql_stmt_init(conn_));
    if (!stmt) {
        return failure();
    }
    if (mysql_stmt_prepare(stmt.get(), sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return statement_failure(stmt.get());
    }

    const unsigned long expected = mysql_stmt_param_count(stmt.get());
    if (expected != params.size()) {
        return DbResultSet::failure(std::format(
            "Statement has {} placeholder(s) but {} parameter(s) were bound", expected, params.size()));
    }

    MysqlParamBinds binds(params);
    if (!params.empty() && mysql_stmt_bind_param(stmt.get(), binds.binds.data()) != 0) {
        return statement_failure(stmt.get());
    }
    if (mysql_stmt_execute(stmt.get()) != 0) {
        return statement_failure(stmt.get());
    }

    ResPtr meta(mysql_stmt_result_metadata(stmt.get()));
    if (!meta) {
        if (mysql_stmt_field_count(stmt.get()) != 0) {
            return statement_failure(stmt.get());
        }
        DbResultSet result;
        result.success = true;
        result.affected_rows = static_cast<uint64_t>(mysql_stmt_affected_rows(stmt.get()));
        return result;
    }
    return fetch_statement_rows(stmt.get(), meta.get());
}

DbResultSet MysqlConnection::fetch_statement_rows(MYSQL_STMT* stmt, MYSQL_RES* meta) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(meta);
    MYSQL_FIELD* fields = mysql_fetch_fields(meta);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    if (mysql_stmt_store_result(stmt) != 0) {
        return statement_failure(stmt);
    }

    // Every column comes back as text, the same rendering mysql_fetch_row gives
    std::vector<CellBuffer> cells(num_fields);
    std::vector<MYSQL_BIND> out(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        std::memset(&out[i], 0, sizeof(MYSQL_BIND));
        out[i].buffer_type = MYSQL_TYPE_STRING;
        out[i].buffer = cells[i].data.data();
        out[i].buffer_length = static_cast<unsigned long>(cells[i].data.size());
        out[i].length = &cells[i].length;
        out[i].is_null = &cells[i].is_null;
        out[i].error = &cells[i].truncated;
    }
    if (num_fields > 0 && mysql_stmt_bind_result(stmt, out.data()) != 0) {
        return statement_failure(stmt);
    }

    while (true) {
        const int rc = mysql_stmt_fetch(stmt);
        if (rc == MYSQL_NO_DATA) break;
        if (rc == 1) {
            return statement_failure(stmt);
        }

        std::vector<SqlValue> row;
        row.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            CellBuffer& cell = cells[i];
            if (cell.is_null) {
                row.emplace_back(std::nullopt);
                continue;
            }
            if (cell.length <= cell.data.size()) {
                row.emplace_back(std::string(cell.data.data(), cell.length));
                continue;
            }
            // Longer than the bound buffer: fetch the whole cell separately
            std::string value(cell.length, '\0');
            MYSQL_BIND full;
            std::memset(&full, 0, sizeof(full));
            unsigned long full_length = 0;
            full.buffer_type = MYSQL_TYPE_STRING;
            full.buffer = value.data();
            full.buffer_length = cell.length;
            full.length = &full_length;
            if (mysql_stmt_fetch_column(stmt, &full, i, 0) != 0) {
                return statement_failure(stmt);
            }
            value.resize(full_length);
            row.emplace_back(std::move(value));
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);

    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<SqlValue> row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.emplace_back(std::string(row[i], lengths[i]));
            } else {
                row_data.emplace_back(std::nullopt);
            }
        }

        result.rows.push_back(std::move(row_data));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet MysqlConnection::process_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || broken_) {
        return false;
    }

    if (mysql_ping(conn_) != 0) {
        return false;
    }

    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        MYSQL_RES* res = mysql_store_result(conn_);
        if (res) {
            mysql_free_result(res);
        }
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr && !broken_;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> MysqlConnectionFactory::create(
    const std::string& connection_string) {
    using R = Result<std::unique_ptr<IDbConnection>>;

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        return R::error(ErrorCategory::CONNECT_ERROR, "mysql_init failed");
    }

    const unsigned int timeout = params.connect_timeout_s;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.empty() ? nullptr : params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        std::string error = mysql_error(conn);
        mysql_close(conn);
        return R::error(ErrorCategory::CONNECT_ERROR, std::move(error));
    }

    return R::ok(std::make_unique<MysqlConnection>(conn));
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // Query options
    if (const size_t q = sv.find('?'); q != std::string_view::npos) {
        std::string_view query = sv.substr(q + 1);
        sv = sv.substr(0, q);
        while (!query.empty()) {
            const size_t amp = query.find('&');
            const std::string_view pair = query.substr(0, amp);
            if (const size_t eq = pair.find('='); eq != std::string_view::npos) {
                if (pair.substr(0, eq) == "connect_timeout") {
                    params.connect_timeout_s = utils::parse_int<unsigned int>(
                        pair.substr(eq + 1), params.connect_timeout_s);
                }
            }
            if (amp == std::string_view::npos) break;
            query.remove_prefix(amp + 1);
        }
    }

    // Credentials end at the last '@' (an encoded password never contains one)
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = utils::percent_decode(creds.substr(0, colon_pos));
            params.password = utils::percent_decode(creds.substr(colon_pos + 1));
        } else {
            params.user = utils::percent_decode(creds);
        }
    }

    std::string_view host_port = sv;
    if (const size_t slash_pos = sv.find('/'); slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        params.database = utils::percent_decode(sv.substr(slash_pos + 1));
    }

    const size_t colon_pos = host_port.rfind(':');
    if (colon_pos != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon_pos));
        params.port = utils::parse_int<unsigned int>(host_port.substr(colon_pos + 1), 3306);
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace dbgate
