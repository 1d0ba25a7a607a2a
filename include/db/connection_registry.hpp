#pragma once

#include "core/database_type.hpp"
#include "db/connect_params.hpp"
#include "db/iconnection_pool.hpp"
#include "db/mongodb/mongo_client.hpp"
#include "db/redis/redis_client.hpp"
#include "tunnel/tunnel_manager.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace dbgate {

/**
 * @brief One backend kind's live handle, guarded by its own mutex
 *
 * The mutex covers only the copy or swap of the entry. A replaced entry is
 * destroyed after the lock is released, so pool teardown and tunnel shutdown
 * never run under it.
 */
template<typename Handle, typename Params>
class RegistrySlot {
public:
    struct Entry {
        std::shared_ptr<Handle> handle;
        std::shared_ptr<TunnelSession> tunnel;
        Params params;
        std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    };

    // Last writer wins
    void set(Entry entry) {
        std::optional<Entry> previous;
        {
            std::lock_guard lock(mutex_);
            previous = std::exchange(entry_, std::move(entry));
        }
    }

    [[nodiscard]] std::optional<Entry> get() const {
        std::lock_guard lock(mutex_);
        return entry_;
    }

    // Returns false when the slot was already empty
    bool clear() {
        std::optional<Entry> previous;
        {
            std::lock_guard lock(mutex_);
            previous = std::exchange(entry_, std::nullopt);
        }
        return previous.has_value();
    }

    [[nodiscard]] bool occupied() const {
        std::lock_guard lock(mutex_);
        return entry_.has_value();
    }

private:
    mutable std::mutex mutex_;
    std::optional<Entry> entry_;
};

/**
 * @brief At most one live handle per backend kind plus the tunnel feeding it
 */
class ConnectionRegistry {
public:
    using SqlSlot = RegistrySlot<IConnectionPool, SqlConnectParams>;
    using RedisSlot = RegistrySlot<IRedisCommander, RedisConnectParams>;
    using MongoSlot = RegistrySlot<IDocumentClient, MongoConnectParams>;

    // nullptr for kinds that are not relational
    [[nodiscard]] SqlSlot* sql(DatabaseType type) {
        switch (type) {
            case DatabaseType::MYSQL:      return &mysql_;
            case DatabaseType::POSTGRESQL: return &postgres_;
            case DatabaseType::SQLITE:     return &sqlite_;
            case DatabaseType::REDIS:
            case DatabaseType::MONGODB:    return nullptr;
        }
        return nullptr;
    }

    [[nodiscard]] RedisSlot& redis() { return redis_; }
    [[nodiscard]] MongoSlot& mongo() { return mongo_; }

    bool clear(DatabaseType type) {
        switch (type) {
            case DatabaseType::REDIS:   return redis_.clear();
            case DatabaseType::MONGODB: return mongo_.clear();
            case DatabaseType::MYSQL:
            case DatabaseType::POSTGRESQL:
            case DatabaseType::SQLITE:  return sql(type)->clear();
        }
        return false;
    }

    [[nodiscard]] bool occupied(DatabaseType type) {
        switch (type) {
            case DatabaseType::REDIS:   return redis_.occupied();
            case DatabaseType::MONGODB: return mongo_.occupied();
            case DatabaseType::MYSQL:
            case DatabaseType::POSTGRESQL:
            case DatabaseType::SQLITE:  return sql(type)->occupied();
        }
        return false;
    }

    void clear_all() {
        mysql_.clear();
        postgres_.clear();
        sqlite_.clear();
        redis_.clear();
        mongo_.clear();
    }

private:
    SqlSlot mysql_;
    SqlSlot postgres_;
    SqlSlot sqlite_;
    RedisSlot redis_;
    MongoSlot mongo_;
};

} // namespace dbgate
