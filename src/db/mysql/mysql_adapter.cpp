#include "db/mysql/mysql_adapter.hpp"
#include <format>

namespace dbgate {

std::string MysqlAdapter::quote_identifier(std::string_view ident) const {
    std::string out = "`";
    for (const char c : ident) {
        if (c == '`') out += '`';
        out += c;
    }
    out += '`';
    return out;
}

std::vector<std::string_view> MysqlAdapter::read_only_keywords() const {
    return {"SELECT", "SHOW", "DESCRIBE", "DESC", "EXPLAIN", "WITH"};
}

std::string MysqlAdapter::tables_query() const {
    return "SELECT TABLE_NAME FROM information_schema.TABLES "
           "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = 'BASE TABLE' "
           "ORDER BY TABLE_NAME";
}

std::optional<std::string> MysqlAdapter::views_query() const {
    return "SELECT TABLE_NAME FROM information_schema.TABLES "
           "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = 'VIEW' "
           "ORDER BY TABLE_NAME";
}

std::optional<std::string> MysqlAdapter::functions_query() const {
    return "SELECT ROUTINE_NAME FROM information_schema.ROUTINES "
           "WHERE ROUTINE_SCHEMA = DATABASE() AND ROUTINE_TYPE = 'FUNCTION' "
           "ORDER BY ROUTINE_NAME";
}

std::optional<std::string> MysqlAdapter::procedures_query() const {
    return "SELECT ROUTINE_NAME FROM information_schema.ROUTINES "
           "WHERE ROUTINE_SCHEMA = DATABASE() AND ROUTINE_TYPE = 'PROCEDURE' "
           "ORDER BY ROUTINE_NAME";
}

std::string MysqlAdapter::columns_query() const {
    return "SELECT COLUMN_NAME FROM information_schema.COLUMNS "
           "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = ? "
           "ORDER BY ORDINAL_POSITION";
}

std::string MysqlAdapter::primary_key_query() const {
    return "SELECT COLUMN_NAME FROM information_schema.KEY_COLUMN_USAGE "
           "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = ? "
           "AND CONSTRAINT_NAME = 'PRIMARY' "
           "ORDER BY ORDINAL_POSITION";
}

std::string MysqlAdapter::build_rename(const std::string& old_name, const std::string& new_name) const {
    return std::format("RENAME TABLE {} TO {}",
        quote_identifier(old_name), quote_identifier(new_name));
}

std::string MysqlAdapter::empty_insert(const std::string& table) const {
    return std::format("INSERT INTO {} () VALUES ()", quote_identifier(table));
}

SqlValue MysqlAdapter::bind_json(const Json& value) const {
    // 'true' is not a valid TINYINT literal in strict mode
    if (value.is_boolean()) {
        return value.get<bool>() ? "1" : "0";
    }
    return SqlAdapter::bind_json(value);
}

Result<std::vector<SizedName>> MysqlAdapter::list_databases_with_size() {
    return run_sized(
        "SELECT s.SCHEMA_NAME, COALESCE(SUM(t.DATA_LENGTH + t.INDEX_LENGTH), 0) "
        "FROM information_schema.SCHEMATA s "
        "LEFT JOIN information_schema.TABLES t ON t.TABLE_SCHEMA = s.SCHEMA_NAME "
        "GROUP BY s.SCHEMA_NAME ORDER BY s.SCHEMA_NAME");
}

Result<std::vector<SizedName>> MysqlAdapter::list_tables_with_size(const std::string& database) {
    return run_sized(
        "SELECT TABLE_NAME, COALESCE(DATA_LENGTH + INDEX_LENGTH, 0) "
        "FROM information_schema.TABLES "
        "WHERE TABLE_SCHEMA = ? AND TABLE_TYPE = 'BASE TABLE' "
        "ORDER BY TABLE_NAME",
        {database});
}

Result<std::string> MysqlAdapter::current_database() {
    auto names = run_names("SELECT DATABASE()");
    if (names.is_error()) {
        return Result<std::string>::error_from(names);
    }
    return Result<std::string>::ok(names.value().empty() ? std::string{} : names.value().front());
}

} // namespace dbgate
