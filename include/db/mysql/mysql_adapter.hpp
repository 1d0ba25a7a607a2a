#pragma once

#include "db/sql_adapter.hpp"

namespace dbgate {

/**
 * @brief MySQL / MariaDB dialect
 *
 * Backtick identifiers, `?` placeholders, catalog from information_schema
 * scoped to DATABASE().
 */
class MysqlAdapter : public SqlAdapter {
public:
    using SqlAdapter::SqlAdapter;

    [[nodiscard]] std::string_view dialect() const override { return "mysql"; }
    [[nodiscard]] std::string quote_identifier(std::string_view ident) const override;

    Result<std::vector<SizedName>> list_databases_with_size() override;
    Result<std::vector<SizedName>> list_tables_with_size(const std::string& database) override;
    Result<std::string> current_database() override;

protected:
    std::vector<std::string_view> read_only_keywords() const override;
    std::string tables_query() const override;
    std::optional<std::string> views_query() const override;
    std::optional<std::string> functions_query() const override;
    std::optional<std::string> procedures_query() const override;
    std::string columns_query() const override;
    std::string primary_key_query() const override;
    std::string build_rename(const std::string& old_name, const std::string& new_name) const override;
    std::string empty_insert(const std::string& table) const override;
    SqlValue bind_json(const Json& value) const override;
};

} // namespace dbgate
