#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dbgate {

/**
 * @brief Parameters for the relational backends
 *
 * host/port/user/password/database apply to MySQL and PostgreSQL;
 * path applies to SQLite. port == 0 selects the backend default.
 */
struct SqlConnectParams {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    std::string user;
    std::string password;
    std::string database;
    std::string path;
};

struct RedisConnectParams {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::optional<std::string> password;
    int64_t database = 0;
};

struct MongoConnectParams {
    std::string host = "127.0.0.1";
    uint16_t port = 27017;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::string auth_database = "admin";
};

// One SSH hop, password authentication only
struct SshTarget {
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::optional<std::string> password;
};

} // namespace dbgate
