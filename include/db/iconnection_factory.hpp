#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace dbgate {

/**
 * @brief Opens driver sessions for a pool
 *
 * One per backend, wrapping PQconnectdb, mysql_real_connect or
 * sqlite3_open_v2. Tests substitute a scripted factory.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    // CONNECT_ERROR carries the driver's own message
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const std::string& connection_string) = 0;
};

} // namespace dbgate
