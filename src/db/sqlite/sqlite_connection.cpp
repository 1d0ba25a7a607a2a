#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include <format>
#include <memory>

namespace dbgate {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* s) const { if (s) sqlite3_finalize(s); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

GenericColumnType storage_class_to_generic(int storage_class) {
    switch (storage_class) {
        case SQLITE_INTEGER: return GenericColumnType::BIGINT;
        case SQLITE_FLOAT:   return GenericColumnType::DOUBLE_PRECISION;
        case SQLITE_BLOB:    return GenericColumnType::BLOB;
        case SQLITE_TEXT:    return GenericColumnType::TEXT;
        default:             return GenericColumnType::UNKNOWN;
    }
}

SqlValue read_cell(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return std::nullopt;
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, col);
            const int len = sqlite3_column_bytes(stmt, col);
            if (!data || len <= 0) return std::string{};
            return std::string(static_cast<const char*>(data), static_cast<size_t>(len));
        }
        default: {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            const int len = sqlite3_column_bytes(stmt, col);
            if (!text) return std::string{};
            return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
        }
    }
}

} // anonymous namespace

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

GenericColumnType SqliteConnection::declared_type_to_generic(const std::string& decltype_name) {
    const std::string upper = utils::to_upper(decltype_name);
    const auto has = [&upper](std::string_view needle) {
        return upper.find(needle) != std::string::npos;
    };

    if (upper.empty()) return GenericColumnType::UNKNOWN;
    if (has("BOOL")) return GenericColumnType::BOOLEAN;
    if (has("INT")) return GenericColumnType::BIGINT;
    if (has("CHAR") || has("CLOB") || has("TEXT")) return GenericColumnType::TEXT;
    if (has("BLOB")) return GenericColumnType::BLOB;
    if (has("REAL") || has("FLOA") || has("DOUB")) return GenericColumnType::DOUBLE_PRECISION;
    if (has("DATE") || has("TIME")) return GenericColumnType::TIMESTAMP;
    return GenericColumnType::NUMERIC;
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    return execute_params(sql, {});
}

DbResultSet SqliteConnection::execute_params(const std::string& sql,
                                             const std::vector<SqlValue>& params) {
    if (!db_) {
        return DbResultSet::failure("Connection is closed");
    }

    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, &tail) != SQLITE_OK) {
        return DbResultSet::failure(sqlite3_errmsg(db_));
    }
    StmtPtr stmt(raw);

    if (!stmt) {
        // Whitespace or comment only
        DbResultSet empty;
        empty.success = true;
        return empty;
    }

    if (tail && !utils::trim(tail).empty() && utils::trim(tail) != ";") {
        return DbResultSet::failure("Multiple statements are not supported");
    }

    const int expected = sqlite3_bind_parameter_count(stmt.get());
    if (expected != static_cast<int>(params.size())) {
        return DbResultSet::failure(std::format(
            "Statement expects {} parameter(s), {} bound", expected, params.size()));
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const int idx = static_cast<int>(i) + 1;
        const int rc = params[i]
            ? sqlite3_bind_text(stmt.get(), idx, params[i]->data(),
                                static_cast<int>(params[i]->size()), SQLITE_TRANSIENT)
            : sqlite3_bind_null(stmt.get(), idx);
        if (rc != SQLITE_OK) {
            return DbResultSet::failure(sqlite3_errmsg(db_));
        }
    }

    return run(stmt.get());
}

DbResultSet SqliteConnection::run(sqlite3_stmt* stmt) {
    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt);

    result.has_rows = ncols > 0;
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        result.column_names.emplace_back(name ? name : "");

        const char* decl = sqlite3_column_decltype(stmt, i);
        result.column_types.push_back(ColumnTypeInfo{
            declared_type_to_generic(decl ? decl : ""), 0, decl ? decl : ""});
    }

    bool first_row = true;
    while (true) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            return DbResultSet::failure(sqlite3_errmsg(db_));
        }

        std::vector<SqlValue> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int i = 0; i < ncols; ++i) {
            // Expression columns carry no declared type; take the first row's storage class
            auto& info = result.column_types[static_cast<size_t>(i)];
            if (first_row && info.generic_type == GenericColumnType::UNKNOWN) {
                const int storage = sqlite3_column_type(stmt, i);
                info.vendor_type_id = static_cast<uint32_t>(storage);
                info.generic_type = storage_class_to_generic(storage);
            }
            row.push_back(read_cell(stmt, i));
        }
        result.rows.push_back(std::move(row));
        first_row = false;
    }

    result.success = true;
    result.affected_rows = result.has_rows
        ? result.rows.size()
        : static_cast<uint64_t>(sqlite3_changes(db_));
    return result;
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }
    return execute(health_check_query).success;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> SqliteConnectionFactory::create(
    const std::string& connection_string) {
    using R = Result<std::unique_ptr<IDbConnection>>;

    if (connection_string.empty()) {
        return R::error(ErrorCategory::CONNECT_ERROR, "SQLite path is empty");
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(connection_string.c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "sqlite open failed";
        if (db) sqlite3_close_v2(db);
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("Failed to open '{}': {}", connection_string, msg));
    }

    // Wait for locks instead of failing immediately
    if (sqlite3_busy_timeout(db, 5000) != SQLITE_OK ||
        sqlite3_exec(db, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        utils::log::warn(std::format("SQLite '{}': failed to configure connection: {}",
            connection_string, sqlite3_errmsg(db)));
    }

    return R::ok(std::make_unique<SqliteConnection>(db));
}

} // namespace dbgate
