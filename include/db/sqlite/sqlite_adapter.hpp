#pragma once

#include "db/sql_adapter.hpp"

namespace dbgate {

/**
 * @brief SQLite dialect
 *
 * Double-quoted identifiers, `?` placeholders, catalog from sqlite_master
 * and the pragma table-valued functions. Values rely on column affinity.
 * Database listing, sizes, routines and database switching do not apply.
 */
class SqliteAdapter : public SqlAdapter {
public:
    using SqlAdapter::SqlAdapter;

    [[nodiscard]] std::string_view dialect() const override { return "sqlite"; }
    [[nodiscard]] std::string quote_identifier(std::string_view ident) const override;

protected:
    std::vector<std::string_view> read_only_keywords() const override;
    std::string tables_query() const override;
    std::optional<std::string> views_query() const override;
    std::optional<std::string> functions_query() const override;
    std::optional<std::string> procedures_query() const override;
    std::string columns_query() const override;
    std::string primary_key_query() const override;
};

} // namespace dbgate
