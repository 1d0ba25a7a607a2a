#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dbgate {

// A bound parameter or result cell; nullopt is SQL NULL
using SqlValue = std::optional<std::string>;

/**
 * @brief Driver-independent copy of one statement's outcome
 *
 * Cells stay as the driver's text rendering; SqlAdapter hands them to the
 * value marshaller together with column_types.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<SqlValue>> rows;

    uint64_t affected_rows = 0;

    // The statement produced a row set, possibly empty
    bool has_rows = false;

    static DbResultSet failure(std::string message) {
        DbResultSet rs;
        rs.success = false;
        rs.error_message = std::move(message);
        return rs;
    }
};

/**
 * @brief One driver session (PGconn*, MYSQL*, sqlite3*)
 *
 * Not thread-safe. A connection is used by one pool borrower at a time.
 * Driver errors come back as DbResultSet::failure, never as exceptions.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a statement with bound text parameters
     * @param sql SQL text using the dialect's placeholder syntax
     * @param params Values bound in order; nullopt binds NULL
     */
    [[nodiscard]] virtual DbResultSet execute_params(const std::string& sql,
                                                     const std::vector<SqlValue>& params) = 0;

    // Round-trips health_check_query; run on connections that sat idle
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    // Local state only, no I/O
    [[nodiscard]] virtual bool is_connected() const = 0;

    // Idempotent
    virtual void close() = 0;
};

} // namespace dbgate
