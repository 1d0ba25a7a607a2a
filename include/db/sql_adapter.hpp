#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbgate {

/**
 * @brief Name plus on-disk size in bytes (databases, tables)
 */
struct SizedName {
    std::string name;
    int64_t bytes = 0;
};

/**
 * @brief Outcome of execute_raw: a row set or an affected-row message
 */
struct RawExecution {
    bool has_rows = false;
    Json rows = Json::array();
    uint64_t affected_rows = 0;

    [[nodiscard]] std::string message() const;
    [[nodiscard]] Json to_json() const;
};

/**
 * @brief Dialect-aware table operations over a connection pool
 *
 * One instance is built per operation around a borrowed pool. The generic
 * operations live here; subclasses supply identifier quoting, placeholder
 * syntax, catalog queries and the read-only keyword set. Every identifier
 * is quoted before interpolation and every value is bound as a parameter.
 */
class SqlAdapter {
public:
    SqlAdapter(std::shared_ptr<IConnectionPool> pool, std::chrono::milliseconds acquire_timeout);
    virtual ~SqlAdapter() = default;

    SqlAdapter(const SqlAdapter&) = delete;
    SqlAdapter& operator=(const SqlAdapter&) = delete;

    [[nodiscard]] virtual std::string_view dialect() const = 0;

    // ---- Catalog -----------------------------------------------------------

    [[nodiscard]] Result<std::vector<std::string>> list_tables();
    [[nodiscard]] Result<std::vector<std::string>> list_views();
    [[nodiscard]] Result<std::vector<std::string>> list_functions();
    [[nodiscard]] Result<std::vector<std::string>> list_procedures();
    [[nodiscard]] Result<std::vector<std::string>> get_columns(const std::string& table);

    /**
     * @brief The primary key column, only when the key has exactly one column
     */
    [[nodiscard]] Result<std::optional<std::string>> get_primary_key(const std::string& table);

    [[nodiscard]] virtual Result<std::vector<SizedName>> list_databases_with_size();
    [[nodiscard]] virtual Result<std::vector<SizedName>> list_tables_with_size(const std::string& database);
    [[nodiscard]] virtual Result<std::string> current_database();

    // ---- Data --------------------------------------------------------------

    [[nodiscard]] Result<int64_t> get_row_count(const std::string& table);

    /**
     * @brief Page of canonical rows, ordered by the primary key when one exists
     * @return JSON array of objects (column -> canonical value)
     */
    [[nodiscard]] Result<Json> get_rows(const std::string& table, int64_t limit, int64_t offset);

    [[nodiscard]] Result<uint64_t> update_cell(const std::string& table,
                                               const std::string& pk_col,
                                               const std::string& pk_val,
                                               const std::string& col,
                                               const std::string& new_val);

    /**
     * @brief Insert one row from a JSON object (column -> value)
     *
     * Strings are bound as-is, null as SQL NULL, other kinds as their JSON
     * text. An empty object inserts a row of defaults.
     */
    [[nodiscard]] Result<uint64_t> insert_row(const std::string& table, const Json& data);

    [[nodiscard]] Result<uint64_t> delete_row(const std::string& table,
                                              const std::string& pk_col,
                                              const std::string& pk_val);

    [[nodiscard]] Result<void> drop_table(const std::string& table);
    [[nodiscard]] Result<void> rename_table(const std::string& old_name, const std::string& new_name);

    /**
     * @brief Run a caller-supplied statement
     *
     * Statements whose first keyword is read-only for the dialect return
     * rows; everything else returns the affected-row count.
     */
    [[nodiscard]] Result<RawExecution> execute_raw(const std::string& sql);

    // ---- Dialect -----------------------------------------------------------

    [[nodiscard]] virtual std::string quote_identifier(std::string_view ident) const = 0;

    [[nodiscard]] bool is_read_only(std::string_view sql) const;

protected:
    // Positional placeholder, 1-based
    [[nodiscard]] virtual std::string placeholder(size_t n) const;

    [[nodiscard]] virtual std::vector<std::string_view> read_only_keywords() const = 0;

    // Catalog queries; nullopt means the dialect has no such object kind
    [[nodiscard]] virtual std::string tables_query() const = 0;
    [[nodiscard]] virtual std::optional<std::string> views_query() const = 0;
    [[nodiscard]] virtual std::optional<std::string> functions_query() const = 0;
    [[nodiscard]] virtual std::optional<std::string> procedures_query() const = 0;

    // Take the table name as the single parameter
    [[nodiscard]] virtual std::string columns_query() const = 0;
    [[nodiscard]] virtual std::string primary_key_query() const = 0;
    [[nodiscard]] virtual std::string table_name_param(const std::string& table) const;

    [[nodiscard]] virtual Result<std::string> build_update(const std::string& table,
                                                           const std::string& pk_col,
                                                           const std::string& col);
    [[nodiscard]] virtual Result<std::string> build_insert(const std::string& table,
                                                           const std::vector<std::string>& columns);
    [[nodiscard]] virtual std::string build_delete(const std::string& table,
                                                   const std::string& pk_col) const;
    [[nodiscard]] virtual std::string build_rename(const std::string& old_name,
                                                   const std::string& new_name) const;
    [[nodiscard]] virtual std::string empty_insert(const std::string& table) const;

    // How a JSON value from insert_row is bound
    [[nodiscard]] virtual SqlValue bind_json(const Json& value) const;

    [[nodiscard]] Result<DbResultSet> run(const std::string& sql,
                                          const std::vector<SqlValue>& params = {});
    [[nodiscard]] Result<std::vector<std::string>> run_names(const std::string& sql,
                                                             const std::vector<SqlValue>& params = {});
    [[nodiscard]] Result<std::vector<SizedName>> run_sized(const std::string& sql,
                                                           const std::vector<SqlValue>& params = {});

    template<typename T>
    [[nodiscard]] Result<T> unsupported(std::string_view operation) const {
        return Result<T>::error(ErrorCategory::INVALID_REQUEST,
            std::string(operation) + " is not supported for " + std::string(dialect()));
    }

private:
    std::shared_ptr<IConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
};

} // namespace dbgate
