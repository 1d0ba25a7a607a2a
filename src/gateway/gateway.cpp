#include "gateway/gateway.hpp"
#include "core/utils.hpp"
#include "db/mongodb/mongo_adapter.hpp"
#include "db/pooled_connection.hpp"
#include "db/redis/redis_adapter.hpp"

#include <format>

namespace dbgate {

namespace {

std::string not_connected_message(DatabaseType type) {
    return std::format("Not connected to {}", database_type_to_string(type));
}

/**
 * @brief Build a pool for target and prove it by checking out one connection
 */
Result<std::shared_ptr<IConnectionPool>> build_pool(IDbBackend& backend,
                                                    const SqlConnectParams& target,
                                                    const GatewayConfig& config) {
    using R = Result<std::shared_ptr<IConnectionPool>>;

    PoolConfig pool_config;
    pool_config.connection_string = backend.connection_string(target, config.connect_timeout);
    pool_config.min_connections = config.pool_min_connections;
    pool_config.max_connections = config.pool_max_connections;
    pool_config.idle_timeout = config.pool_idle_timeout;
    pool_config.max_lifetime = config.pool_max_lifetime;

    const std::string name = backend.type() == DatabaseType::SQLITE
        ? target.path
        : std::format("{}/{}", database_type_to_string(backend.type()), target.database);

    auto pool = backend.create_pool(name, pool_config);
    {
        auto conn = pool->acquire(config.pool_acquire_timeout);
        if (!conn) {
            const std::string reason = pool->last_error();
            return R::error(ErrorCategory::CONNECT_ERROR,
                reason.empty() ? std::format("Failed to connect to {}", name) : reason);
        }
    }
    return R::ok(std::move(pool));
}

// Where the driver should connect: the target itself or the local tunnel end
template<typename Params>
Params via_tunnel(Params params, const std::shared_ptr<TunnelSession>& tunnel) {
    if (tunnel) {
        params.host = "127.0.0.1";
        params.port = tunnel->local_port();
    }
    return params;
}

Result<std::shared_ptr<TunnelSession>> maybe_open_tunnel(
    const std::shared_ptr<ITunnelOpener>& tunnels,
    const std::optional<SshTarget>& ssh,
    const std::string& remote_host,
    uint16_t remote_port) {
    using R = Result<std::shared_ptr<TunnelSession>>;
    if (!ssh) {
        return R::ok(nullptr);
    }
    if (!tunnels) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "No tunnel manager configured");
    }
    return tunnels->open_tunnel(*ssh, remote_host, remote_port);
}

} // anonymous namespace

// ============================================================================
// GatewayDependencies
// ============================================================================

GatewayDependencies GatewayDependencies::defaults(const GatewayConfig& gateway,
                                                  const TunnelConfig& tunnel) {
    GatewayDependencies deps;
    deps.backends = BackendRegistry::with_builtin_backends();
    deps.tunnels = std::make_shared<TunnelManager>(tunnel.handshake_timeout);
    deps.redis_connector = [reply_timeout = gateway.redis_reply_timeout](
        const RedisConnectParams& params, std::chrono::milliseconds timeout)
        -> Result<std::shared_ptr<IRedisCommander>> {
        auto client = RedisClient::connect(params, timeout, reply_timeout);
        if (client.is_error()) {
            return Result<std::shared_ptr<IRedisCommander>>::error_from(client);
        }
        return Result<std::shared_ptr<IRedisCommander>>::ok(std::move(client.value()));
    };
    deps.mongo_connector = [](const MongoConnectParams& params, std::chrono::milliseconds timeout)
        -> Result<std::shared_ptr<IDocumentClient>> {
        auto client = MongoClient::connect(params, timeout);
        if (client.is_error()) {
            return Result<std::shared_ptr<IDocumentClient>>::error_from(client);
        }
        return Result<std::shared_ptr<IDocumentClient>>::ok(std::move(client.value()));
    };
    return deps;
}

// ============================================================================
// Gateway
// ============================================================================

Gateway::Gateway(GatewayConfig config,
                 GatewayDependencies deps,
                 std::shared_ptr<ConnectionRegistry> registry)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      registry_(std::move(registry)) {}

Gateway::~Gateway() {
    shutdown();
}

void Gateway::shutdown() {
    // Connects still running past their deadline finish before teardown
    connect_workers_.join();
    registry_->clear_all();
}

bool Gateway::is_connected(DatabaseType type) const {
    return registry_->occupied(type);
}

Result<void> Gateway::disconnect(DatabaseType type) {
    if (registry_->clear(type)) {
        utils::log::info(std::format("Disconnected from {}", database_type_to_string(type)));
    }
    return Result<void>::ok();
}

// ---- Redis -----------------------------------------------------------------

template<typename T, typename Fn>
Result<T> Gateway::with_redis(Fn&& fn) {
    const auto entry = registry_->redis().get();
    if (!entry) {
        return Result<T>::error(ErrorCategory::NOT_CONNECTED, not_connected_message(DatabaseType::REDIS));
    }
    RedisAdapter adapter(entry->handle);
    return fn(adapter);
}

Result<std::string> Gateway::connect_redis(const RedisConnectParams& params,
                                           const std::optional<SshTarget>& ssh) {
    using Entry = ConnectionRegistry::RedisSlot::Entry;

    auto work = [tunnels = deps_.tunnels, connector = deps_.redis_connector,
                 timeout = config_.connect_timeout, params, ssh]() -> Result<Entry> {
        auto tunnel = maybe_open_tunnel(tunnels, ssh, params.host, params.port);
        if (tunnel.is_error()) {
            return Result<Entry>::error_from(tunnel);
        }
        auto client = connector(via_tunnel(params, tunnel.value()), timeout);
        if (client.is_error()) {
            return Result<Entry>::error_from(client);
        }
        Entry entry;
        entry.handle = std::move(client.value());
        entry.tunnel = std::move(tunnel.value());
        entry.params = params;
        return Result<Entry>::ok(std::move(entry));
    };

    auto entry = connect_workers_.run<Entry>(config_.connect_timeout, std::move(work),
        std::format("Connecting to Redis at {}:{}", params.host, params.port));
    if (entry.is_error()) {
        utils::log::warn(entry.error_message());
        return Result<std::string>::error_from(entry);
    }

    registry_->redis().set(std::move(entry.value()));
    utils::log::info(std::format("Connected to Redis at {}:{}{}", params.host, params.port,
        ssh ? " (via SSH)" : ""));
    return Result<std::string>::ok(std::format("Connected to {}:{}", params.host, params.port));
}

Result<std::vector<std::string>> Gateway::redis_get_keys(const std::string& pattern) {
    return with_redis<std::vector<std::string>>([&](RedisAdapter& a) { return a.list_keys(pattern); });
}

Result<std::string> Gateway::redis_get_value(const std::string& key) {
    return with_redis<std::string>([&](RedisAdapter& a) { return a.get_value(key); });
}

Result<void> Gateway::redis_set_value(const std::string& key, const std::string& value) {
    return with_redis<void>([&](RedisAdapter& a) { return a.set_string(key, value); });
}

Result<int64_t> Gateway::redis_del_key(const std::string& key) {
    return with_redis<int64_t>([&](RedisAdapter& a) { return a.delete_key(key); });
}

Result<void> Gateway::redis_rename_key(const std::string& old_key, const std::string& new_key) {
    return with_redis<void>([&](RedisAdapter& a) { return a.rename(old_key, new_key); });
}

Result<int64_t> Gateway::redis_get_ttl(const std::string& key) {
    return with_redis<int64_t>([&](RedisAdapter& a) { return a.get_ttl(key); });
}

Result<std::string> Gateway::redis_execute_raw(const std::string& command_line) {
    return with_redis<std::string>([&](RedisAdapter& a) { return a.execute_raw(command_line); });
}

// ---- MongoDB ---------------------------------------------------------------

template<typename T, typename Fn>
Result<T> Gateway::with_mongo(Fn&& fn) {
    const auto entry = registry_->mongo().get();
    if (!entry) {
        return Result<T>::error(ErrorCategory::NOT_CONNECTED, not_connected_message(DatabaseType::MONGODB));
    }
    MongoAdapter adapter(entry->handle);
    return fn(adapter);
}

Result<std::string> Gateway::connect_mongodb(const MongoConnectParams& params,
                                             const std::optional<SshTarget>& ssh) {
    using Entry = ConnectionRegistry::MongoSlot::Entry;

    auto work = [tunnels = deps_.tunnels, connector = deps_.mongo_connector,
                 timeout = config_.connect_timeout, params, ssh]() -> Result<Entry> {
        auto tunnel = maybe_open_tunnel(tunnels, ssh, params.host, params.port);
        if (tunnel.is_error()) {
            return Result<Entry>::error_from(tunnel);
        }
        auto client = connector(via_tunnel(params, tunnel.value()), timeout);
        if (client.is_error()) {
            return Result<Entry>::error_from(client);
        }

        // A server that accepts the handshake may still refuse commands
        MongoAdapter adapter(client.value());
        auto names = adapter.list_databases();
        if (names.is_error()) {
            return Result<Entry>::error(ErrorCategory::CONNECT_ERROR, names.error_message());
        }

        Entry entry;
        entry.handle = std::move(client.value());
        entry.tunnel = std::move(tunnel.value());
        entry.params = params;
        return Result<Entry>::ok(std::move(entry));
    };

    auto entry = connect_workers_.run<Entry>(config_.connect_timeout, std::move(work),
        std::format("Connecting to MongoDB at {}:{}", params.host, params.port));
    if (entry.is_error()) {
        utils::log::warn(entry.error_message());
        return Result<std::string>::error_from(entry);
    }

    registry_->mongo().set(std::move(entry.value()));
    utils::log::info(std::format("Connected to MongoDB at {}:{}{}", params.host, params.port,
        ssh ? " (via SSH)" : ""));
    return Result<std::string>::ok(std::format("Connected to {}:{}", params.host, params.port));
}

Result<std::vector<std::string>> Gateway::mongodb_list_databases() {
    return with_mongo<std::vector<std::string>>([](MongoAdapter& a) { return a.list_databases(); });
}

// ---- Relational ------------------------------------------------------------

Result<std::unique_ptr<SqlAdapter>> Gateway::sql_adapter(DatabaseType type) {
    using R = Result<std::unique_ptr<SqlAdapter>>;

    auto* slot = registry_->sql(type);
    if (!slot) {
        return R::error(ErrorCategory::INVALID_REQUEST,
            std::format("{} is not a relational backend", database_type_to_string(type)));
    }
    const auto entry = slot->get();
    if (!entry) {
        return R::error(ErrorCategory::NOT_CONNECTED, not_connected_message(type));
    }
    auto backend = deps_.backends->create(type);
    if (!backend) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("No backend registered for {}", database_type_to_string(type)));
    }
    return R::ok(backend->create_adapter(entry->handle, config_.pool_acquire_timeout));
}

Result<std::string> Gateway::connect_sql(DatabaseType type,
                                         SqlConnectParams params,
                                         const std::optional<SshTarget>& ssh) {
    auto* slot = registry_->sql(type);
    if (!slot) {
        return Result<std::string>::error(ErrorCategory::INVALID_REQUEST,
            std::format("{} is not a relational backend", database_type_to_string(type)));
    }

    std::shared_ptr<IDbBackend> backend = deps_.backends->create(type);
    if (!backend) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("No backend registered for {}", database_type_to_string(type)));
    }

    const bool is_file = (type == DatabaseType::SQLITE);
    if (is_file) {
        if (ssh) {
            return Result<std::string>::error(ErrorCategory::INVALID_REQUEST,
                "SSH tunnels do not apply to SQLite");
        }
        if (params.path.empty()) {
            return Result<std::string>::error(ErrorCategory::INVALID_REQUEST, "path is required");
        }
    } else if (params.port == 0) {
        params.port = backend->default_port();
    }

    auto work = [backend, tunnels = deps_.tunnels, config = config_, params, ssh]() -> Result<SqlEntry> {
        auto tunnel = maybe_open_tunnel(tunnels, ssh, params.host, params.port);
        if (tunnel.is_error()) {
            return Result<SqlEntry>::error_from(tunnel);
        }
        auto pool = build_pool(*backend, via_tunnel(params, tunnel.value()), config);
        if (pool.is_error()) {
            return Result<SqlEntry>::error_from(pool);
        }
        SqlEntry entry;
        entry.handle = std::move(pool.value());
        entry.tunnel = std::move(tunnel.value());
        entry.params = params;
        return Result<SqlEntry>::ok(std::move(entry));
    };

    const std::string target = is_file
        ? params.path
        : std::format("{}:{}", params.host, params.port);

    auto entry = connect_workers_.run<SqlEntry>(config_.connect_timeout, std::move(work),
        std::format("Connecting to {} at {}", database_type_to_string(type), target));
    if (entry.is_error()) {
        utils::log::warn(entry.error_message());
        return Result<std::string>::error_from(entry);
    }

    slot->set(std::move(entry.value()));
    utils::log::info(std::format("Connected to {} at {}{}", database_type_to_string(type), target,
        ssh ? " (via SSH)" : ""));
    return Result<std::string>::ok(is_file
        ? std::format("Opened {}", params.path)
        : std::format("Connected to {}", target));
}

Result<std::string> Gateway::use_database(DatabaseType type, const std::string& database) {
    using R = Result<std::string>;

    if (type == DatabaseType::SQLITE) {
        return R::error(ErrorCategory::INVALID_REQUEST, "Switching databases is not supported for sqlite");
    }
    auto* slot = registry_->sql(type);
    if (!slot) {
        return R::error(ErrorCategory::INVALID_REQUEST,
            std::format("{} is not a relational backend", database_type_to_string(type)));
    }
    if (database.empty()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "database is required");
    }

    const auto current = slot->get();
    if (!current) {
        return R::error(ErrorCategory::NOT_CONNECTED, not_connected_message(type));
    }

    std::shared_ptr<IDbBackend> backend = deps_.backends->create(type);
    if (!backend) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("No backend registered for {}", database_type_to_string(type)));
    }

    SqlConnectParams params = current->params;
    params.database = database;

    auto work = [backend, config = config_, params, tunnel = current->tunnel]() -> Result<SqlEntry> {
        auto pool = build_pool(*backend, via_tunnel(params, tunnel), config);
        if (pool.is_error()) {
            return Result<SqlEntry>::error_from(pool);
        }
        SqlEntry entry;
        entry.handle = std::move(pool.value());
        entry.tunnel = tunnel;
        entry.params = params;
        return Result<SqlEntry>::ok(std::move(entry));
    };

    auto entry = connect_workers_.run<SqlEntry>(config_.connect_timeout, std::move(work),
        std::format("Switching {} to '{}'", database_type_to_string(type), database));
    if (entry.is_error()) {
        utils::log::warn(entry.error_message());
        return R::error_from(entry);
    }

    slot->set(std::move(entry.value()));
    utils::log::info(std::format("{}: switched to database '{}'", database_type_to_string(type), database));
    return R::ok(std::format("Switched to {}", database));
}

Result<std::vector<std::string>> Gateway::list_tables(DatabaseType type) {
    return with_sql<std::vector<std::string>>(type, [](SqlAdapter& a) { return a.list_tables(); });
}

Result<std::vector<std::string>> Gateway::list_views(DatabaseType type) {
    return with_sql<std::vector<std::string>>(type, [](SqlAdapter& a) { return a.list_views(); });
}

Result<std::vector<std::string>> Gateway::list_functions(DatabaseType type) {
    return with_sql<std::vector<std::string>>(type, [](SqlAdapter& a) { return a.list_functions(); });
}

Result<std::vector<std::string>> Gateway::list_procedures(DatabaseType type) {
    return with_sql<std::vector<std::string>>(type, [](SqlAdapter& a) { return a.list_procedures(); });
}

Result<std::vector<std::string>> Gateway::get_columns(DatabaseType type, const std::string& table) {
    return with_sql<std::vector<std::string>>(type, [&](SqlAdapter& a) { return a.get_columns(table); });
}

Result<std::optional<std::string>> Gateway::get_primary_key(DatabaseType type, const std::string& table) {
    return with_sql<std::optional<std::string>>(type, [&](SqlAdapter& a) { return a.get_primary_key(table); });
}

Result<int64_t> Gateway::get_row_count(DatabaseType type, const std::string& table) {
    return with_sql<int64_t>(type, [&](SqlAdapter& a) { return a.get_row_count(table); });
}

Result<Json> Gateway::get_rows(DatabaseType type, const std::string& table,
                               int64_t limit, int64_t offset) {
    return with_sql<Json>(type, [&](SqlAdapter& a) { return a.get_rows(table, limit, offset); });
}

Result<uint64_t> Gateway::update_cell(DatabaseType type, const std::string& table,
                                      const std::string& pk_col, const std::string& pk_val,
                                      const std::string& col, const std::string& new_val) {
    return with_sql<uint64_t>(type, [&](SqlAdapter& a) {
        return a.update_cell(table, pk_col, pk_val, col, new_val);
    });
}

Result<uint64_t> Gateway::insert_row(DatabaseType type, const std::string& table, const Json& data) {
    return with_sql<uint64_t>(type, [&](SqlAdapter& a) { return a.insert_row(table, data); });
}

Result<uint64_t> Gateway::delete_row(DatabaseType type, const std::string& table,
                                     const std::string& pk_col, const std::string& pk_val) {
    return with_sql<uint64_t>(type, [&](SqlAdapter& a) { return a.delete_row(table, pk_col, pk_val); });
}

Result<void> Gateway::drop_table(DatabaseType type, const std::string& table) {
    return with_sql<void>(type, [&](SqlAdapter& a) { return a.drop_table(table); });
}

Result<void> Gateway::rename_table(DatabaseType type, const std::string& old_name,
                                   const std::string& new_name) {
    return with_sql<void>(type, [&](SqlAdapter& a) { return a.rename_table(old_name, new_name); });
}

Result<RawExecution> Gateway::execute_raw(DatabaseType type, const std::string& sql) {
    return with_sql<RawExecution>(type, [&](SqlAdapter& a) { return a.execute_raw(sql); });
}

Result<std::vector<SizedName>> Gateway::list_databases_with_size(DatabaseType type) {
    return with_sql<std::vector<SizedName>>(type, [](SqlAdapter& a) { return a.list_databases_with_size(); });
}

Result<std::vector<SizedName>> Gateway::list_tables_with_size(DatabaseType type,
                                                              const std::string& database) {
    return with_sql<std::vector<SizedName>>(type, [&](SqlAdapter& a) {
        return a.list_tables_with_size(database);
    });
}

} // namespace dbgate
