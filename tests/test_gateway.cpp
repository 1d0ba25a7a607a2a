#include <catch2/catch_test_macros.hpp>
#include "gateway/gateway.hpp"
#include "db/mysql/mysql_adapter.hpp"
#include "mocks/mock_backends.hpp"
#include "mocks/mock_db_connection.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <thread>

using namespace dbgate;
using namespace dbgate::testing;

namespace {

/**
 * @brief What FakeMysqlBackend saw, shared across the instances the
 *        registry creates
 */
struct BackendLog {
    std::mutex mutex;
    std::vector<std::string> connection_strings;
    std::shared_ptr<MockDbScript> script = std::make_shared<MockDbScript>();
    std::string refuse_reason;  // non-empty: every new pool is exhausted

    std::vector<std::string> targets() {
        std::lock_guard lock(mutex);
        return connection_strings;
    }
};

class FakeMysqlBackend : public IDbBackend {
public:
    explicit FakeMysqlBackend(std::shared_ptr<BackendLog> log) : log_(std::move(log)) {}

    DatabaseType type() const override { return DatabaseType::MYSQL; }
    uint16_t default_port() const override { return 3306; }

    std::string connection_string(const SqlConnectParams& params,
                                  std::chrono::milliseconds) const override {
        return std::format("{}:{}/{}", params.host, params.port, params.database);
    }

    std::shared_ptr<IConnectionFactory> create_factory() override {
        return std::make_shared<MockConnectionFactory>(log_->script);
    }

    std::shared_ptr<IConnectionPool> create_pool(const std::string&, const PoolConfig& config) override {
        auto pool = std::make_shared<MockPool>(log_->script);
        std::lock_guard lock(log_->mutex);
        log_->connection_strings.push_back(config.connection_string);
        if (!log_->refuse_reason.empty()) {
            pool->exhaust(log_->refuse_reason);
        }
        return pool;
    }

    std::unique_ptr<SqlAdapter> create_adapter(std::shared_ptr<IConnectionPool> pool,
                                               std::chrono::milliseconds acquire_timeout) override {
        return std::make_unique<MysqlAdapter>(std::move(pool), acquire_timeout);
    }

private:
    std::shared_ptr<BackendLog> log_;
};

// Channel opener that never gets used: nothing connects to the listener
class IdleOpener : public IChannelOpener {
public:
    Result<std::unique_ptr<IForwardChannel>> open_channel(
        const std::string&, uint16_t, const std::string&, uint16_t) override {
        return Result<std::unique_ptr<IForwardChannel>>::error(
            ErrorCategory::CONNECT_ERROR, "unused");
    }
};

class FakeTunnels : public ITunnelOpener {
public:
    Result<std::shared_ptr<TunnelSession>> open_tunnel(const SshTarget& target,
                                                       const std::string& remote_host,
                                                       uint16_t remote_port) override {
        opened.fetch_add(1);
        {
            std::lock_guard lock(mutex);
            last_remote = std::format("{}:{}", remote_host, remote_port);
            last_user = target.username;
        }
        if (!target.password) {
            return Result<std::shared_ptr<TunnelSession>>::error(
                ErrorCategory::AUTH_UNSUPPORTED, "password required");
        }
        auto tunnel = TunnelManager::forward(std::make_shared<IdleOpener>(), remote_host, remote_port);
        if (tunnel.is_ok()) {
            std::lock_guard lock(mutex);
            last_local_port = tunnel.value()->local_port();
        }
        return tunnel;
    }

    std::atomic<int> opened{0};
    std::mutex mutex;
    std::string last_remote;
    std::string last_user;
    uint16_t last_local_port = 0;
};

struct Harness {
    std::shared_ptr<BackendLog> log = std::make_shared<BackendLog>();
    std::shared_ptr<FakeTunnels> tunnels = std::make_shared<FakeTunnels>();
    std::shared_ptr<MockRedisCommander> redis = std::make_shared<MockRedisCommander>();
    std::shared_ptr<MockDocumentClient> mongo = std::make_shared<MockDocumentClient>();
    std::vector<RedisConnectParams> redis_targets;
    std::chrono::milliseconds redis_delay{0};
    std::shared_ptr<Gateway> gateway;

    explicit Harness(GatewayConfig config = {}) {
        GatewayDependencies deps;
        deps.backends = std::make_shared<BackendRegistry>();
        deps.backends->register_backend(DatabaseType::MYSQL,
            [log = log] { return std::make_unique<FakeMysqlBackend>(log); });
        deps.tunnels = tunnels;
        deps.redis_connector = [this](const RedisConnectParams& params, std::chrono::milliseconds)
            -> Result<std::shared_ptr<IRedisCommander>> {
            if (redis_delay.count() > 0) {
                std::this_thread::sleep_for(redis_delay);
            }
            redis_targets.push_back(params);
            return Result<std::shared_ptr<IRedisCommander>>::ok(redis);
        };
        deps.mongo_connector = [client = mongo](const MongoConnectParams&, std::chrono::milliseconds)
            -> Result<std::shared_ptr<IDocumentClient>> {
            return Result<std::shared_ptr<IDocumentClient>>::ok(client);
        };
        gateway = std::make_shared<Gateway>(config, std::move(deps));
    }
};

SshTarget bastion(std::optional<std::string> password = "secret") {
    SshTarget t;
    t.host = "bastion.example";
    t.username = "ops";
    t.password = std::move(password);
    return t;
}

} // anonymous namespace

TEST_CASE("Gateway: every operation on an empty slot is NOT_CONNECTED", "[gateway]") {
    Harness h;
    auto& gw = *h.gateway;

    CHECK(gw.redis_get_keys("*").error_category() == ErrorCategory::NOT_CONNECTED);
    CHECK(gw.redis_get_value("k").error_category() == ErrorCategory::NOT_CONNECTED);
    CHECK(gw.redis_set_value("k", "v").error_category() == ErrorCategory::NOT_CONNECTED);
    CHECK(gw.redis_execute_raw("PING").error_category() == ErrorCategory::NOT_CONNECTED);
    CHECK(gw.mongodb_list_databases().error_category() == ErrorCategory::NOT_CONNECTED);

    for (const auto type : {DatabaseType::MYSQL, DatabaseType::POSTGRESQL, DatabaseType::SQLITE}) {
        CHECK(gw.list_tables(type).error_category() == ErrorCategory::NOT_CONNECTED);
        CHECK(gw.get_rows(type, "t", 10, 0).error_category() == ErrorCategory::NOT_CONNECTED);
        CHECK(gw.execute_raw(type, "SELECT 1").error_category() == ErrorCategory::NOT_CONNECTED);
        CHECK(gw.drop_table(type, "t").error_category() == ErrorCategory::NOT_CONNECTED);
    }
    CHECK(gw.use_database(DatabaseType::MYSQL, "other").error_category() == ErrorCategory::NOT_CONNECTED);

    // Nothing reached a driver
    CHECK(h.log->targets().empty());
    CHECK(h.redis->commands().empty());
    CHECK(h.mongo->calls().empty());
}

TEST_CASE("Gateway: connect stores the handle and operations use it", "[gateway]") {
    Harness h;
    auto& gw = *h.gateway;

    SqlConnectParams params;
    params.host = "db.local";
    params.database = "shop";
    auto connected = gw.connect_sql(DatabaseType::MYSQL, params, std::nullopt);
    REQUIRE(connected.is_ok());
    CHECK(connected.value() == "Connected to db.local:3306");
    CHECK(gw.is_connected(DatabaseType::MYSQL));

    // port 0 picks the backend default
    REQUIRE(h.log->targets().size() == 1);
    CHECK(h.log->targets()[0] == "db.local:3306/shop");

    h.log->script->responder = [](const std::string&, const std::vector<SqlValue>&) {
        return names_result({"orders", "users"});
    };
    auto tables = gw.list_tables(DatabaseType::MYSQL);
    REQUIRE(tables.is_ok());
    CHECK(tables.value() == std::vector<std::string>{"orders", "users"});

    // Other kinds are unaffected
    CHECK_FALSE(gw.is_connected(DatabaseType::POSTGRESQL));
}

TEST_CASE("Gateway: failed validation leaves the slot untouched", "[gateway]") {
    Harness h;
    auto& gw = *h.gateway;

    SqlConnectParams params;
    params.database = "shop";
    REQUIRE(gw.connect_sql(DatabaseType::MYSQL, params, std::nullopt).is_ok());

    h.log->refuse_reason = "Access denied for user 'app'";
    params.database = "other";
    auto second = gw.connect_sql(DatabaseType::MYSQL, params, std::nullopt);
    REQUIRE(second.is_error());
    CHECK(second.error_category() == ErrorCategory::CONNECT_ERROR);
    CHECK(second.error_message() == "Access denied for user 'app'");

    // The first connection still serves requests
    CHECK(gw.is_connected(DatabaseType::MYSQL));
    CHECK(gw.get_row_count(DatabaseType::MYSQL, "t").is_ok());
}

TEST_CASE("Gateway: unregistered backend is an internal error", "[gateway]") {
    Harness h;
    SqlConnectParams params;
    params.database = "app";
    auto r = h.gateway->connect_sql(DatabaseType::POSTGRESQL, params, std::nullopt);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::INTERNAL_ERROR);
}

TEST_CASE("Gateway: SQLite rejects SSH and requires a path", "[gateway][sqlite]") {
    Harness h;
    h.gateway = std::make_shared<Gateway>(GatewayConfig{}, [&] {
        GatewayDependencies deps;
        deps.backends = BackendRegistry::with_builtin_backends();
        deps.tunnels = h.tunnels;
        return deps;
    }());

    SqlConnectParams params;
    auto no_path = h.gateway->connect_sql(DatabaseType::SQLITE, params, std::nullopt);
    REQUIRE(no_path.is_error());
    CHECK(no_path.error_category() == ErrorCategory::INVALID_REQUEST);

    params.path = "/tmp/whatever.db";
    auto tunneled = h.gateway->connect_sql(DatabaseType::SQLITE, params, bastion());
    REQUIRE(tunneled.is_error());
    CHECK(tunneled.error_category() == ErrorCategory::INVALID_REQUEST);
    CHECK(h.tunnels->opened.load() == 0);

    auto use = h.gateway->use_database(DatabaseType::SQLITE, "main");
    CHECK(use.error_category() == ErrorCategory::INVALID_REQUEST);
}

TEST_CASE("Gateway: use_database reuses the stored parameters", "[gateway]") {
    Harness h;
    auto& gw = *h.gateway;

    SqlConnectParams params;
    params.host = "db.local";
    params.port = 3307;
    params.user = "app";
    params.database = "shop";
    REQUIRE(gw.connect_sql(DatabaseType::MYSQL, params, std::nullopt).is_ok());

    auto switched = gw.use_database(DatabaseType::MYSQL, "analytics");
    REQUIRE(switched.is_ok());
    CHECK(switched.value() == "Switched to analytics");

    const auto targets = h.log->targets();
    REQUIRE(targets.size() == 2);
    CHECK(targets[1] == "db.local:3307/analytics");

    CHECK(gw.use_database(DatabaseType::MYSQL, "").error_category() == ErrorCategory::INVALID_REQUEST);
}

TEST_CASE("Gateway: disconnect is idempotent", "[gateway]") {
    Harness h;
    auto& gw = *h.gateway;

    CHECK(gw.disconnect(DatabaseType::REDIS).is_ok());

    REQUIRE(gw.connect_redis(RedisConnectParams{}, std::nullopt).is_ok());
    CHECK(gw.is_connected(DatabaseType::REDIS));
    CHECK(gw.disconnect(DatabaseType::REDIS).is_ok());
    CHECK_FALSE(gw.is_connected(DatabaseType::REDIS));
    CHECK(gw.disconnect(DatabaseType::REDIS).is_ok());

    CHECK(gw.redis_get_ttl("k").error_category() == ErrorCategory::NOT_CONNECTED);
}

TEST_CASE("Gateway: Redis operations go through the stored client", "[gateway][redis]") {
    Harness h;
    h.redis->reply("TTL session", RespValue::from_integer(30));

    RedisConnectParams params;
    params.host = "cache.local";
    auto connected = h.gateway->connect_redis(params, std::nullopt);
    REQUIRE(connected.is_ok());
    CHECK(connected.value() == "Connected to cache.local:6379");

    CHECK(h.gateway->redis_get_ttl("session").value() == 30);
    CHECK(h.redis->commands().size() == 1);
}

TEST_CASE("Gateway: slow connect hits the connect timeout", "[gateway][timeout]") {
    GatewayConfig config;
    config.connect_timeout = std::chrono::milliseconds(50);
    Harness h(config);
    h.redis_delay = std::chrono::milliseconds(400);

    auto r = h.gateway->connect_redis(RedisConnectParams{}, std::nullopt);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::TIMEOUT_ERROR);
    CHECK_FALSE(h.gateway->is_connected(DatabaseType::REDIS));

    // shutdown waits for the late worker; its result is dropped
    h.gateway->shutdown();
    CHECK(h.redis_targets.size() == 1);
    CHECK_FALSE(h.gateway->is_connected(DatabaseType::REDIS));

    auto after = h.gateway->connect_redis(RedisConnectParams{}, std::nullopt);
    REQUIRE(after.is_error());
    CHECK(after.error_category() == ErrorCategory::INTERNAL_ERROR);
}

TEST_CASE("Gateway: MongoDB listDatabases failure is a connect error", "[gateway][mongodb]") {
    Harness h;

    SECTION("listDatabases refused") {
        h.mongo->reply("listDatabases", Result<Json>::error(ErrorCategory::QUERY_ERROR,
            "command listDatabases requires authentication"));
        auto r = h.gateway->connect_mongodb(MongoConnectParams{}, std::nullopt);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::CONNECT_ERROR);
        CHECK(r.error_message() == "command listDatabases requires authentication");
        CHECK_FALSE(h.gateway->is_connected(DatabaseType::MONGODB));
    }

    SECTION("listDatabases accepted") {
        h.mongo->reply("listDatabases", Result<Json>::ok(Json{
            {"databases", Json::array({Json{{"name", "admin"}}})}, {"ok", 1.0}}));
        REQUIRE(h.gateway->connect_mongodb(MongoConnectParams{}, std::nullopt).is_ok());
        auto names = h.gateway->mongodb_list_databases();
        REQUIRE(names.is_ok());
        CHECK(names.value() == std::vector<std::string>{"admin"});
    }
}

TEST_CASE("Gateway: SSH connects through the local tunnel end", "[gateway][tunnel]") {
    Harness h;

    SECTION("driver is pointed at the forwarded port") {
        SqlConnectParams params;
        params.host = "10.0.0.5";
        params.database = "shop";
        REQUIRE(h.gateway->connect_sql(DatabaseType::MYSQL, params, bastion()).is_ok());

        uint16_t local_port = 0;
        {
            std::lock_guard lock(h.tunnels->mutex);
            CHECK(h.tunnels->last_remote == "10.0.0.5:3306");
            CHECK(h.tunnels->last_user == "ops");
            local_port = h.tunnels->last_local_port;
        }
        REQUIRE(local_port != 0);
        CHECK(h.log->targets().back() == std::format("127.0.0.1:{}/shop", local_port));

        // The switch reuses the tunnel instead of opening another
        REQUIRE(h.gateway->use_database(DatabaseType::MYSQL, "other").is_ok());
        CHECK(h.tunnels->opened.load() == 1);
        CHECK(h.log->targets().back() == std::format("127.0.0.1:{}/other", local_port));
    }

    SECTION("missing password") {
        RedisConnectParams params;
        params.host = "cache.internal";
        auto r = h.gateway->connect_redis(params, bastion(std::nullopt));
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::AUTH_UNSUPPORTED);
        CHECK(h.redis_targets.empty());
    }

    SECTION("redis target is rewritten") {
        RedisConnectParams params;
        params.host = "cache.internal";
        REQUIRE(h.gateway->connect_redis(params, bastion()).is_ok());
        REQUIRE(h.redis_targets.size() == 1);
        CHECK(h.redis_targets[0].host == "127.0.0.1");
        CHECK(h.redis_targets[0].port != 6379);
    }
}
