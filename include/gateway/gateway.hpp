#pragma once

#include "config/config_types.hpp"
#include "core/deadline.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "db/backend_registry.hpp"
#include "db/connect_params.hpp"
#include "db/connection_registry.hpp"
#include "db/sql_adapter.hpp"
#include "db/redis/redis_client.hpp"
#include "db/mongodb/mongo_client.hpp"
#include "tunnel/tunnel_manager.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dbgate {

using RedisConnector = std::function<Result<std::shared_ptr<IRedisCommander>>(
    const RedisConnectParams&, std::chrono::milliseconds)>;

using MongoConnector = std::function<Result<std::shared_ptr<IDocumentClient>>(
    const MongoConnectParams&, std::chrono::milliseconds)>;

/**
 * @brief Everything the Gateway talks to; tests swap in fakes
 */
struct GatewayDependencies {
    std::shared_ptr<BackendRegistry> backends;
    std::shared_ptr<ITunnelOpener> tunnels;
    RedisConnector redis_connector;
    MongoConnector mongo_connector;

    // Real drivers, libssh2 tunnels
    [[nodiscard]] static GatewayDependencies defaults(const GatewayConfig& gateway,
                                                      const TunnelConfig& tunnel);
};

/**
 * @brief Entry point for every database operation
 *
 * Owns the connection registry. Connect operations build a handle (through a
 * tunnel when SSH settings are given) on a worker bounded by the connect
 * timeout, then store it in the slot of that kind. Every other operation
 * borrows the stored handle for its duration. An empty slot yields
 * NOT_CONNECTED before any network call.
 */
class Gateway {
public:
    Gateway(GatewayConfig config,
            GatewayDependencies deps,
            std::shared_ptr<ConnectionRegistry> registry = std::make_shared<ConnectionRegistry>());

    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // ---- Redis -------------------------------------------------------------

    [[nodiscard]] Result<std::string> connect_redis(const RedisConnectParams& params,
                                                    const std::optional<SshTarget>& ssh);
    [[nodiscard]] Result<std::vector<std::string>> redis_get_keys(const std::string& pattern);
    [[nodiscard]] Result<std::string> redis_get_value(const std::string& key);
    [[nodiscard]] Result<void> redis_set_value(const std::string& key, const std::string& value);
    [[nodiscard]] Result<int64_t> redis_del_key(const std::string& key);
    [[nodiscard]] Result<void> redis_rename_key(const std::string& old_key, const std::string& new_key);
    [[nodiscard]] Result<int64_t> redis_get_ttl(const std::string& key);
    [[nodiscard]] Result<std::string> redis_execute_raw(const std::string& command_line);

    // ---- MongoDB -----------------------------------------------------------

    [[nodiscard]] Result<std::string> connect_mongodb(const MongoConnectParams& params,
                                                      const std::optional<SshTarget>& ssh);
    [[nodiscard]] Result<std::vector<std::string>> mongodb_list_databases();

    // ---- Relational (MySQL, PostgreSQL, SQLite) ----------------------------

    /**
     * @brief Build a pool for type, validate it with one connection and
     *        store it. SQLite ignores host/port and takes params.path.
     */
    [[nodiscard]] Result<std::string> connect_sql(DatabaseType type,
                                                  SqlConnectParams params,
                                                  const std::optional<SshTarget>& ssh);

    [[nodiscard]] Result<std::vector<std::string>> list_tables(DatabaseType type);
    [[nodiscard]] Result<std::vector<std::string>> list_views(DatabaseType type);
    [[nodiscard]] Result<std::vector<std::string>> list_functions(DatabaseType type);
    [[nodiscard]] Result<std::vector<std::string>> list_procedures(DatabaseType type);
    [[nodiscard]] Result<std::vector<std::string>> get_columns(DatabaseType type, const std::string& table);
    [[nodiscard]] Result<std::optional<std::string>> get_primary_key(DatabaseType type, const std::string& table);
    [[nodiscard]] Result<int64_t> get_row_count(DatabaseType type, const std::string& table);
    [[nodiscard]] Result<Json> get_rows(DatabaseType type, const std::string& table,
                                        int64_t limit, int64_t offset);
    [[nodiscard]] Result<uint64_t> update_cell(DatabaseType type, const std::string& table,
                                               const std::string& pk_col, const std::string& pk_val,
                                               const std::string& col, const std::string& new_val);
    [[nodiscard]] Result<uint64_t> insert_row(DatabaseType type, const std::string& table, const Json& data);
    [[nodiscard]] Result<uint64_t> delete_row(DatabaseType type, const std::string& table,
                                              const std::string& pk_col, const std::string& pk_val);
    [[nodiscard]] Result<void> drop_table(DatabaseType type, const std::string& table);
    [[nodiscard]] Result<void> rename_table(DatabaseType type, const std::string& old_name,
                                            const std::string& new_name);
    [[nodiscard]] Result<RawExecution> execute_raw(DatabaseType type, const std::string& sql);
    [[nodiscard]] Result<std::vector<SizedName>> list_databases_with_size(DatabaseType type);
    [[nodiscard]] Result<std::vector<SizedName>> list_tables_with_size(DatabaseType type,
                                                                       const std::string& database);

    /**
     * @brief Re-target the slot at another database on the same server,
     *        reusing the stored parameters and tunnel
     */
    [[nodiscard]] Result<std::string> use_database(DatabaseType type, const std::string& database);

    // ---- Lifecycle ---------------------------------------------------------

    // Empties the slot of type; disconnecting an empty slot is not an error
    [[nodiscard]] Result<void> disconnect(DatabaseType type);

    [[nodiscard]] bool is_connected(DatabaseType type) const;

    // Waits for outstanding connect workers, then empties every slot
    void shutdown();

    [[nodiscard]] const GatewayConfig& config() const { return config_; }

private:
    using SqlEntry = ConnectionRegistry::SqlSlot::Entry;

    Result<std::unique_ptr<SqlAdapter>> sql_adapter(DatabaseType type);

    template<typename T, typename Fn>
    Result<T> with_sql(DatabaseType type, Fn&& fn) {
        auto adapter = sql_adapter(type);
        if (adapter.is_error()) {
            return Result<T>::error_from(adapter);
        }
        return fn(*adapter.value());
    }

    template<typename T, typename Fn>
    Result<T> with_redis(Fn&& fn);

    template<typename T, typename Fn>
    Result<T> with_mongo(Fn&& fn);

    GatewayConfig config_;
    GatewayDependencies deps_;
    std::shared_ptr<ConnectionRegistry> registry_;
    DeadlineRunner connect_workers_;
};

} // namespace dbgate
