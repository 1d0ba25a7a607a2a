#include "db/sqlite/sqlite_adapter.hpp"

namespace dbgate {

std::string SqliteAdapter::quote_identifier(std::string_view ident) const {
    std::string out = "\"";
    for (const char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::vector<std::string_view> SqliteAdapter::read_only_keywords() const {
    return {"SELECT", "WITH", "PRAGMA", "EXPLAIN", "VALUES"};
}

std::string SqliteAdapter::tables_query() const {
    return "SELECT name FROM sqlite_master "
           "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
           "ORDER BY name";
}

std::optional<std::string> SqliteAdapter::views_query() const {
    return "SELECT name FROM sqlite_master WHERE type = 'view' ORDER BY name";
}

std::optional<std::string> SqliteAdapter::functions_query() const {
    return std::nullopt;
}

std::optional<std::string> SqliteAdapter::procedures_query() const {
    return std::nullopt;
}

std::string SqliteAdapter::columns_query() const {
    return "SELECT name FROM pragma_table_info(?) ORDER BY cid";
}

// pk holds the 1-based position within the key, 0 for non-key columns
std::string SqliteAdapter::primary_key_query() const {
    return "SELECT name FROM pragma_table_info(?) WHERE pk > 0 ORDER BY pk";
}

} // namespace dbgate
