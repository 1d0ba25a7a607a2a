#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <string>

namespace dbgate {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* opened in serialized (FULLMUTEX) mode. Statements are
 * prepared with sqlite3_prepare_v2; parameters use `?` and are bound as
 * text so the column affinity decides the stored type.
 */
class SqliteConnection : public IDbConnection {
public:
    explicit SqliteConnection(sqlite3* db);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql,
                               const std::vector<SqlValue>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

    /**
     * @brief Generic type of a declared column type, by SQLite affinity rules
     *
     * BOOL and date/time names are recognised before the affinity fallback.
     */
    [[nodiscard]] static GenericColumnType declared_type_to_generic(const std::string& decltype_name);

private:
    DbResultSet run(sqlite3_stmt* stmt);

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * The connection string is the database file path. The file is created
 * when it does not exist.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override;
};

} // namespace dbgate
