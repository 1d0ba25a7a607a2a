#include "db/sql_adapter.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"
#include "core/value_marshaller.hpp"

#include <algorithm>
#include <format>

namespace dbgate {

// ============================================================================
// RawExecution
// ============================================================================

std::string RawExecution::message() const {
    return std::format("Success: {} rows affected", affected_rows);
}

Json RawExecution::to_json() const {
    if (has_rows) {
        return rows;
    }
    return message();
}

// ============================================================================
// SqlAdapter - plumbing
// ============================================================================

SqlAdapter::SqlAdapter(std::shared_ptr<IConnectionPool> pool,
                       std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)),
      acquire_timeout_(acquire_timeout) {}

std::string SqlAdapter::placeholder(size_t /*n*/) const {
    return "?";
}

std::string SqlAdapter::table_name_param(const std::string& table) const {
    return table;
}

Result<DbResultSet> SqlAdapter::run(const std::string& sql,
                                    const std::vector<SqlValue>& params) {
    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        const std::string reason = pool_->last_error();
        return Result<DbResultSet>::error(ErrorCategory::CONNECT_ERROR,
            reason.empty() ? std::format("No connection available for '{}'", pool_->name()) : reason);
    }

    utils::log::debug(std::format("[{}] {}", dialect(), sql));

    auto rs = params.empty() ? conn->execute(sql) : conn->execute_params(sql, params);
    if (!rs.success) {
        return Result<DbResultSet>::error(ErrorCategory::QUERY_ERROR, std::move(rs.error_message));
    }
    return Result<DbResultSet>::ok(std::move(rs));
}

Result<std::vector<std::string>> SqlAdapter::run_names(const std::string& sql,
                                                       const std::vector<SqlValue>& params) {
    auto rs = run(sql, params);
    if (rs.is_error()) {
        return Result<std::vector<std::string>>::error_from(rs);
    }

    std::vector<std::string> names;
    names.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        if (!row.empty() && row[0]) {
            names.push_back(utils::lossy_utf8(*row[0]));
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Result<std::vector<SizedName>> SqlAdapter::run_sized(const std::string& sql,
                                                     const std::vector<SqlValue>& params) {
    auto rs = run(sql, params);
    if (rs.is_error()) {
        return Result<std::vector<SizedName>>::error_from(rs);
    }

    std::vector<SizedName> out;
    out.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        if (row.size() < 2 || !row[0]) continue;
        SizedName entry;
        entry.name = utils::lossy_utf8(*row[0]);
        // SUM() over DECIMAL comes back as "1234.0000" from MySQL
        if (row[1]) {
            if (const auto i = utils::try_parse_int<int64_t>(*row[1])) {
                entry.bytes = *i;
            } else if (const auto d = utils::try_parse_double(*row[1])) {
                entry.bytes = static_cast<int64_t>(*d);
            }
        }
        out.push_back(std::move(entry));
    }
    return Result<std::vector<SizedName>>::ok(std::move(out));
}

bool SqlAdapter::is_read_only(std::string_view sql) const {
    const std::string keyword = utils::leading_keyword(sql);
    const auto keywords = read_only_keywords();
    return std::find(keywords.begin(), keywords.end(), keyword) != keywords.end();
}

// ============================================================================
// SqlAdapter - catalog
// ============================================================================

Result<std::vector<std::string>> SqlAdapter::list_tables() {
    return run_names(tables_query());
}

Result<std::vector<std::string>> SqlAdapter::list_views() {
    const auto sql = views_query();
    if (!sql) return unsupported<std::vector<std::string>>("Listing views");
    return run_names(*sql);
}

Result<std::vector<std::string>> SqlAdapter::list_functions() {
    const auto sql = functions_query();
    if (!sql) return unsupported<std::vector<std::string>>("Listing functions");
    return run_names(*sql);
}

Result<std::vector<std::string>> SqlAdapter::list_procedures() {
    const auto sql = procedures_query();
    if (!sql) return unsupported<std::vector<std::string>>("Listing procedures");
    return run_names(*sql);
}

Result<std::vector<std::string>> SqlAdapter::get_columns(const std::string& table) {
    return run_names(columns_query(), {table_name_param(table)});
}

Result<std::optional<std::string>> SqlAdapter::get_primary_key(const std::string& table) {
    using R = Result<std::optional<std::string>>;

    auto names = run_names(primary_key_query(), {table_name_param(table)});
    if (names.is_error()) {
        return R::error_from(names);
    }
    if (names.value().size() != 1) {
        return R::ok(std::nullopt);
    }
    return R::ok(std::move(names.value().front()));
}

Result<std::vector<SizedName>> SqlAdapter::list_databases_with_size() {
    return unsupported<std::vector<SizedName>>("Listing databases");
}

Result<std::vector<SizedName>> SqlAdapter::list_tables_with_size(const std::string& /*database*/) {
    return unsupported<std::vector<SizedName>>("Listing table sizes");
}

Result<std::string> SqlAdapter::current_database() {
    return unsupported<std::string>("Reading the current database");
}

// ============================================================================
// SqlAdapter - data
// ============================================================================

Result<int64_t> SqlAdapter::get_row_count(const std::string& table) {
    auto rs = run(std::format("SELECT COUNT(*) FROM {}", quote_identifier(table)));
    if (rs.is_error()) {
        return Result<int64_t>::error_from(rs);
    }

    const auto& rows = rs.value().rows;
    if (rows.empty() || rows[0].empty() || !rows[0][0]) {
        return Result<int64_t>::ok(0);
    }
    const auto count = utils::try_parse_int<int64_t>(*rows[0][0]);
    if (!count) {
        return Result<int64_t>::error(ErrorCategory::QUERY_ERROR,
            std::format("Unexpected row count '{}'", *rows[0][0]));
    }
    return Result<int64_t>::ok(*count);
}

Result<Json> SqlAdapter::get_rows(const std::string& table, int64_t limit, int64_t offset) {
    if (limit < 0 || offset < 0) {
        return Result<Json>::error(ErrorCategory::INVALID_REQUEST,
            "limit and offset must not be negative");
    }

    auto pk = get_primary_key(table);
    if (pk.is_error()) {
        return Result<Json>::error_from(pk);
    }

    std::string sql = std::format("SELECT * FROM {}", quote_identifier(table));
    if (pk.value()) {
        sql += std::format(" ORDER BY {} ASC", quote_identifier(*pk.value()));
    }
    sql += std::format(" LIMIT {} OFFSET {}", limit, offset);

    auto rs = run(sql);
    if (rs.is_error()) {
        return Result<Json>::error_from(rs);
    }

    const auto& set = rs.value();
    Json rows = Json::array();
    for (const auto& cells : set.rows) {
        rows.push_back(marshal_row(set.column_names, set.column_types, cells));
    }
    return Result<Json>::ok(std::move(rows));
}

Result<std::string> SqlAdapter::build_update(const std::string& table,
                                             const std::string& pk_col,
                                             const std::string& col) {
    return Result<std::string>::ok(std::format("UPDATE {} SET {} = {} WHERE {} = {}",
        quote_identifier(table), quote_identifier(col), placeholder(1),
        quote_identifier(pk_col), placeholder(2)));
}

Result<uint64_t> SqlAdapter::update_cell(const std::string& table,
                                         const std::string& pk_col,
                                         const std::string& pk_val,
                                         const std::string& col,
                                         const std::string& new_val) {
    auto sql = build_update(table, pk_col, col);
    if (sql.is_error()) {
        return Result<uint64_t>::error_from(sql);
    }

    auto rs = run(sql.value(), {new_val, pk_val});
    if (rs.is_error()) {
        return Result<uint64_t>::error_from(rs);
    }
    return Result<uint64_t>::ok(rs.value().affected_rows);
}

std::string SqlAdapter::empty_insert(const std::string& table) const {
    return std::format("INSERT INTO {} DEFAULT VALUES", quote_identifier(table));
}

Result<std::string> SqlAdapter::build_insert(const std::string& table,
                                             const std::vector<std::string>& columns) {
    std::string cols;
    std::string values;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            cols += ", ";
            values += ", ";
        }
        cols += quote_identifier(columns[i]);
        values += placeholder(i + 1);
    }
    return Result<std::string>::ok(std::format("INSERT INTO {} ({}) VALUES ({})",
        quote_identifier(table), cols, values));
}

SqlValue SqlAdapter::bind_json(const Json& value) const {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

Result<uint64_t> SqlAdapter::insert_row(const std::string& table, const Json& data) {
    if (!data.is_object()) {
        return Result<uint64_t>::error(ErrorCategory::INVALID_REQUEST,
            "Row data must be a JSON object");
    }

    std::vector<std::string> columns;
    std::vector<SqlValue> params;
    columns.reserve(data.size());
    params.reserve(data.size());
    for (const auto& [column, value] : data.items()) {
        columns.push_back(column);
        params.push_back(bind_json(value));
    }

    std::string sql;
    if (columns.empty()) {
        sql = empty_insert(table);
    } else {
        auto built = build_insert(table, columns);
        if (built.is_error()) {
            return Result<uint64_t>::error_from(built);
        }
        sql = std::move(built.value());
    }

    auto rs = run(sql, params);
    if (rs.is_error()) {
        return Result<uint64_t>::error_from(rs);
    }
    return Result<uint64_t>::ok(rs.value().affected_rows);
}

std::string SqlAdapter::build_delete(const std::string& table, const std::string& pk_col) const {
    return std::format("DELETE FROM {} WHERE {} = {}",
        quote_identifier(table), quote_identifier(pk_col), placeholder(1));
}

Result<uint64_t> SqlAdapter::delete_row(const std::string& table,
                                        const std::string& pk_col,
                                        const std::string& pk_val) {
    auto rs = run(build_delete(table, pk_col), {pk_val});
    if (rs.is_error()) {
        return Result<uint64_t>::error_from(rs);
    }
    return Result<uint64_t>::ok(rs.value().affected_rows);
}

Result<void> SqlAdapter::drop_table(const std::string& table) {
    auto rs = run(std::format("DROP TABLE {}", quote_identifier(table)));
    if (rs.is_error()) {
        return Result<void>::error_from(rs);
    }
    return Result<void>::ok();
}

std::string SqlAdapter::build_rename(const std::string& old_name, const std::string& new_name) const {
    return std::format("ALTER TABLE {} RENAME TO {}",
        quote_identifier(old_name), quote_identifier(new_name));
}

Result<void> SqlAdapter::rename_table(const std::string& old_name, const std::string& new_name) {
    auto rs = run(build_rename(old_name, new_name));
    if (rs.is_error()) {
        return Result<void>::error_from(rs);
    }
    return Result<void>::ok();
}

Result<RawExecution> SqlAdapter::execute_raw(const std::string& sql) {
    if (utils::trim(sql).empty()) {
        return Result<RawExecution>::error(ErrorCategory::INVALID_REQUEST, "Statement is empty");
    }

    auto rs = run(sql);
    if (rs.is_error()) {
        return Result<RawExecution>::error_from(rs);
    }

    const auto& set = rs.value();
    RawExecution out;
    if (is_read_only(sql)) {
        out.has_rows = true;
        for (const auto& cells : set.rows) {
            out.rows.push_back(marshal_row(set.column_names, set.column_types, cells));
        }
        out.affected_rows = set.rows.size();
    } else {
        out.affected_rows = set.affected_rows;
    }
    return Result<RawExecution>::ok(std::move(out));
}

} // namespace dbgate
