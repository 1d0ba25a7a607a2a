#pragma once

#include "db/sql_adapter.hpp"
#include <unordered_map>

namespace dbgate {

/**
 * @brief PostgreSQL dialect
 *
 * Double-quoted identifiers and $n placeholders. Catalog queries are scoped
 * to current_schema(). Bound text values are cast to the declared column
 * type (format_type) and key comparisons are done on `pk::text`, so any
 * key type can be addressed with its text form.
 */
class PgAdapter : public SqlAdapter {
public:
    using SqlAdapter::SqlAdapter;

    [[nodiscard]] std::string_view dialect() const override { return "postgres"; }
    [[nodiscard]] std::string quote_identifier(std::string_view ident) const override;

    Result<std::vector<SizedName>> list_databases_with_size() override;

    /**
     * @brief Table sizes of the connected database
     *
     * A PostgreSQL session cannot see another database's catalog, so any
     * other name is a QUERY_ERROR.
     */
    Result<std::vector<SizedName>> list_tables_with_size(const std::string& database) override;
    Result<std::string> current_database() override;

protected:
    std::string placeholder(size_t n) const override;
    std::vector<std::string_view> read_only_keywords() const override;
    std::string tables_query() const override;
    std::optional<std::string> views_query() const override;
    std::optional<std::string> functions_query() const override;
    std::optional<std::string> procedures_query() const override;
    std::string columns_query() const override;
    std::string primary_key_query() const override;
    std::string table_name_param(const std::string& table) const override;

    Result<std::string> build_update(const std::string& table,
                                     const std::string& pk_col,
                                     const std::string& col) override;
    Result<std::string> build_insert(const std::string& table,
                                     const std::vector<std::string>& columns) override;
    std::string build_delete(const std::string& table, const std::string& pk_col) const override;

private:
    // column name -> format_type(atttypid, atttypmod)
    Result<std::unordered_map<std::string, std::string>> declared_types(const std::string& table);

    std::string cast_placeholder(size_t n,
                                 const std::unordered_map<std::string, std::string>& types,
                                 const std::string& column) const;
};

} // namespace dbgate
