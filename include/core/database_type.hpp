#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>

namespace dbgate {

namespace keys {
    inline constexpr std::string_view REDIS = "redis";
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view MONGODB = "mongodb";
    inline constexpr std::string_view MONGO = "mongo";
}

enum class DatabaseType {
    REDIS,
    MYSQL,
    POSTGRESQL,
    SQLITE,
    MONGODB,
};

// Command-surface prefix of a backend kind ("postgres", not "postgresql")
[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::REDIS:      return keys::REDIS;
        case DatabaseType::MYSQL:      return keys::MYSQL;
        case DatabaseType::POSTGRESQL: return keys::POSTGRES;
        case DatabaseType::SQLITE:     return keys::SQLITE;
        case DatabaseType::MONGODB:    return keys::MONGODB;
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<DatabaseType> try_parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::REDIS,      DatabaseType::REDIS},
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::MONGODB,    DatabaseType::MONGODB},
        {keys::MONGO,      DatabaseType::MONGODB},
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }
    return std::nullopt;
}

struct DatabaseTypeHash {
    size_t operator()(DatabaseType t) const noexcept {
        return static_cast<size_t>(t);
    }
};

} // namespace dbgate
