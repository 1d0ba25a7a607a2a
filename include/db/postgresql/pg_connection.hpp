#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace dbgate {

/**
 * @brief One libpq session
 *
 * Statements run in text format. Parameters are bound positionally to
 * $1..$n with server-inferred types; bytea cells are unescaped to raw
 * bytes before they reach the marshaller.
 */
class PgConnection : public IDbConnection {
public:
    // Takes ownership; the handle is PQfinish'ed on close()
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql,
                               const std::vector<SqlValue>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    // Takes ownership of res
    DbResultSet dispatch_result(PGresult* res);
    DbResultSet read_rows(PGresult* res);
    DbResultSet read_command_status(PGresult* res);

    PGconn* conn_;
};

// Opens sessions with PQconnectdb on a keyword/value conninfo string
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override;
};

} // namespace dbgate
