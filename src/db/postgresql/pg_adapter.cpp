#include "db/postgresql/pg_adapter.hpp"
#include <format>

namespace dbgate {

std::string PgAdapter::quote_identifier(std::string_view ident) const {
    std::string out = "\"";
    for (const char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string PgAdapter::placeholder(size_t n) const {
    return std::format("${}", n);
}

std::vector<std::string_view> PgAdapter::read_only_keywords() const {
    return {"SELECT", "WITH", "SHOW", "EXPLAIN", "VALUES", "TABLE"};
}

std::string PgAdapter::tables_query() const {
    return "SELECT table_name FROM information_schema.tables "
           "WHERE table_schema = current_schema() AND table_type = 'BASE TABLE' "
           "ORDER BY table_name";
}

std::optional<std::string> PgAdapter::views_query() const {
    return "SELECT table_name FROM information_schema.views "
           "WHERE table_schema = current_schema() "
           "ORDER BY table_name";
}

std::optional<std::string> PgAdapter::functions_query() const {
    return "SELECT DISTINCT routine_name FROM information_schema.routines "
           "WHERE routine_schema = current_schema() AND routine_type = 'FUNCTION' "
           "ORDER BY routine_name";
}

std::optional<std::string> PgAdapter::procedures_query() const {
    return "SELECT DISTINCT routine_name FROM information_schema.routines "
           "WHERE routine_schema = current_schema() AND routine_type = 'PROCEDURE' "
           "ORDER BY routine_name";
}

// Relation lookups go through to_regclass() on the quoted name, so mixed-case
// tables resolve and a missing table yields no rows instead of an error
std::string PgAdapter::table_name_param(const std::string& table) const {
    return quote_identifier(table);
}

std::string PgAdapter::columns_query() const {
    return "SELECT attname FROM pg_attribute "
           "WHERE attrelid = to_regclass($1::text) AND attnum > 0 AND NOT attisdropped "
           "ORDER BY attnum";
}

std::string PgAdapter::primary_key_query() const {
    return "SELECT a.attname FROM pg_index i "
           "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = ANY(i.indkey) "
           "WHERE i.indrelid = to_regclass($1::text) AND i.indisprimary";
}

Result<std::unordered_map<std::string, std::string>> PgAdapter::declared_types(const std::string& table) {
    using R = Result<std::unordered_map<std::string, std::string>>;

    auto rs = run("SELECT attname, format_type(atttypid, atttypmod) FROM pg_attribute "
                  "WHERE attrelid = to_regclass($1::text) AND attnum > 0 AND NOT attisdropped",
                  {quote_identifier(table)});
    if (rs.is_error()) {
        return R::error_from(rs);
    }

    std::unordered_map<std::string, std::string> types;
    for (const auto& row : rs.value().rows) {
        if (row.size() >= 2 && row[0] && row[1]) {
            types.emplace(*row[0], *row[1]);
        }
    }
    return R::ok(std::move(types));
}

std::string PgAdapter::cast_placeholder(size_t n,
                                        const std::unordered_map<std::string, std::string>& types,
                                        const std::string& column) const {
    const auto it = types.find(column);
    if (it == types.end()) {
        return placeholder(n);
    }
    return std::format("{}::{}", placeholder(n), it->second);
}

Result<std::string> PgAdapter::build_update(const std::string& table,
                                            const std::string& pk_col,
                                            const std::string& col) {
    auto types = declared_types(table);
    if (types.is_error()) {
        return Result<std::string>::error_from(types);
    }

    return Result<std::string>::ok(std::format("UPDATE {} SET {} = {} WHERE {}::text = {}",
        quote_identifier(table), quote_identifier(col),
        cast_placeholder(1, types.value(), col),
        quote_identifier(pk_col), placeholder(2)));
}

Result<std::string> PgAdapter::build_insert(const std::string& table,
                                            const std::vector<std::string>& columns) {
    auto types = declared_types(table);
    if (types.is_error()) {
        return Result<std::string>::error_from(types);
    }

    std::string cols;
    std::string values;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            cols += ", ";
            values += ", ";
        }
        cols += quote_identifier(columns[i]);
        values += cast_placeholder(i + 1, types.value(), columns[i]);
    }
    return Result<std::string>::ok(std::format("INSERT INTO {} ({}) VALUES ({})",
        quote_identifier(table), cols, values));
}

std::string PgAdapter::build_delete(const std::string& table, const std::string& pk_col) const {
    return std::format("DELETE FROM {} WHERE {}::text = {}",
        quote_identifier(table), quote_identifier(pk_col), placeholder(1));
}

Result<std::vector<SizedName>> PgAdapter::list_databases_with_size() {
    return run_sized(
        "SELECT datname, "
        "CASE WHEN has_database_privilege(datname, 'CONNECT') "
        "THEN pg_database_size(datname) ELSE 0 END "
        "FROM pg_database WHERE NOT datistemplate ORDER BY datname");
}

Result<std::vector<SizedName>> PgAdapter::list_tables_with_size(const std::string& database) {
    auto current = current_database();
    if (current.is_error()) {
        return Result<std::vector<SizedName>>::error_from(current);
    }
    if (current.value() != database) {
        return Result<std::vector<SizedName>>::error(ErrorCategory::QUERY_ERROR,
            std::format("Cannot list tables of database '{}' while connected to '{}'; "
                        "switch databases first", database, current.value()));
    }

    return run_sized(
        "SELECT c.relname, pg_total_relation_size(c.oid) "
        "FROM pg_class c JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = current_schema() AND c.relkind IN ('r', 'p') "
        "ORDER BY c.relname");
}

Result<std::string> PgAdapter::current_database() {
    auto names = run_names("SELECT current_database()");
    if (names.is_error()) {
        return Result<std::string>::error_from(names);
    }
    return Result<std::string>::ok(names.value().empty() ? std::string{} : names.value().front());
}

} // namespace dbgate
