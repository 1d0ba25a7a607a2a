#include <catch2/catch_test_macros.hpp>
#include "gateway/gateway.hpp"
#include "server/command_dispatcher.hpp"
#include "mocks/mock_backends.hpp"

#include <algorithm>

using namespace dbgate;
using namespace dbgate::testing;

namespace {

struct DispatcherFixture {
    std::shared_ptr<MockRedisCommander> redis = std::make_shared<MockRedisCommander>();
    std::shared_ptr<std::vector<RedisConnectParams>> redis_targets =
        std::make_shared<std::vector<RedisConnectParams>>();
    std::shared_ptr<Gateway> gateway;
    std::unique_ptr<CommandDispatcher> dispatcher;

    DispatcherFixture() {
        GatewayDependencies deps;
        deps.backends = BackendRegistry::with_builtin_backends();
        deps.redis_connector = [client = redis, targets = redis_targets](
            const RedisConnectParams& params, std::chrono::milliseconds)
            -> Result<std::shared_ptr<IRedisCommander>> {
            targets->push_back(params);
            return Result<std::shared_ptr<IRedisCommander>>::ok(client);
        };
        gateway = std::make_shared<Gateway>(GatewayConfig{}, std::move(deps));
        dispatcher = std::make_unique<CommandDispatcher>(gateway);
    }
};

} // anonymous namespace

TEST_CASE("Dispatcher: envelope shapes", "[dispatcher]") {
    const auto ok = CommandDispatcher::envelope(Result<Json>::ok(Json::array({"a"})));
    CHECK(ok["ok"] == true);
    CHECK(ok["data"] == Json::array({"a"}));
    CHECK_FALSE(ok.contains("error"));

    const auto err = CommandDispatcher::envelope(
        Result<Json>::error(ErrorCategory::NOT_CONNECTED, "Not connected to redis"));
    CHECK(err["ok"] == false);
    CHECK(err["error"] == "Not connected to redis");
    CHECK(err["category"] == "NotConnected");
}

TEST_CASE("Dispatcher: command table", "[dispatcher]") {
    DispatcherFixture f;
    const auto names = f.dispatcher->command_names();
    CHECK(std::is_sorted(names.begin(), names.end()));

    for (const char* name : {"connect_redis", "redis_get_keys", "redis_execute_raw",
                             "connect_mongodb", "mongodb_list_databases",
                             "connect_mysql", "mysql_get_rows", "mysql_use_database",
                             "connect_postgres", "postgres_get_tables_with_size",
                             "connect_sqlite", "sqlite_execute_raw", "disconnect"}) {
        INFO(name);
        CHECK(f.dispatcher->has_command(name));
    }
    CHECK_FALSE(f.dispatcher->has_command("connect_postgresql"));
}

TEST_CASE("Dispatcher: request validation", "[dispatcher]") {
    DispatcherFixture f;

    SECTION("unknown command") {
        auto r = f.dispatcher->dispatch("redis_flushall", Json::object());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_REQUEST);
        CHECK(r.error_message() == "Unknown command: redis_flushall");
    }

    SECTION("arguments must be an object") {
        auto r = f.dispatcher->dispatch("redis_get_keys", Json::array());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_REQUEST);
    }

    SECTION("missing argument") {
        auto r = f.dispatcher->dispatch("mysql_get_columns", Json::object());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_REQUEST);
        CHECK(r.error_message() == "Missing or invalid argument 'tableName'");
    }

    SECTION("wrongly typed argument") {
        auto r = f.dispatcher->dispatch("redis_get_value", Json{{"key", 5}});
        REQUIRE(r.is_error());
        CHECK(r.error_message() == "Missing or invalid argument 'key'");
    }

    SECTION("insert data must be an object") {
        auto r = f.dispatcher->dispatch("sqlite_insert_row",
            Json{{"tableName", "t"}, {"data", Json::array()}});
        REQUIRE(r.is_error());
        CHECK(r.error_message() == "Missing or invalid argument 'data'");
    }

    SECTION("ssh without a host") {
        auto r = f.dispatcher->dispatch("connect_redis", Json{{"ssh", Json{{"username", "ops"}}}});
        REQUIRE(r.is_error());
        CHECK(r.error_message() == "Missing or invalid argument 'ssh.host'");
    }

    SECTION("unknown disconnect type") {
        auto r = f.dispatcher->dispatch("disconnect", Json{{"type", "oracle"}});
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_REQUEST);
    }
}

TEST_CASE("Dispatcher: operations before connect are NotConnected", "[dispatcher]") {
    DispatcherFixture f;

    auto rows = f.dispatcher->dispatch("postgres_get_rows", Json{{"tableName", "users"}});
    REQUIRE(rows.is_error());
    CHECK(rows.error_category() == ErrorCategory::NOT_CONNECTED);
    CHECK(CommandDispatcher::envelope(rows)["category"] == "NotConnected");

    auto keys = f.dispatcher->dispatch("redis_get_keys", Json::object());
    CHECK(keys.error_category() == ErrorCategory::NOT_CONNECTED);
}

TEST_CASE("Dispatcher: Redis round trip", "[dispatcher][redis]") {
    DispatcherFixture f;
    f.redis->reply("KEYS *", RespValue::array({RespValue::bulk("k1")}));
    f.redis->reply("SET k1 v1", RespValue::simple("OK"));

    auto connected = f.dispatcher->dispatch("connect_redis",
        Json{{"host", "cache.local"}, {"port", "6380"}, {"password", ""}, {"ssh", nullptr}});
    REQUIRE(connected.is_ok());
    CHECK(connected.value() == "Connected to cache.local:6380");

    REQUIRE(f.redis_targets->size() == 1);
    CHECK(f.redis_targets->at(0).port == 6380);
    // Empty password means none
    CHECK_FALSE(f.redis_targets->at(0).password.has_value());

    auto keys = f.dispatcher->dispatch("redis_get_keys", Json::object());
    REQUIRE(keys.is_ok());
    CHECK(keys.value() == Json::array({"k1"}));

    auto set = f.dispatcher->dispatch("redis_set_value", Json{{"key", "k1"}, {"value", "v1"}});
    REQUIRE(set.is_ok());
    CHECK(set.value().is_null());

    CHECK(f.dispatcher->dispatch("disconnect", Json{{"type", "redis"}}).is_ok());
    CHECK(f.dispatcher->dispatch("redis_get_keys", Json::object()).error_category()
          == ErrorCategory::NOT_CONNECTED);
}

TEST_CASE("Dispatcher: disabled ssh block means a direct connection", "[dispatcher]") {
    DispatcherFixture f;
    auto r = f.dispatcher->dispatch("connect_redis",
        Json{{"host", "cache"}, {"ssh", Json{{"enabled", false}, {"host", "bastion"}}}});
    REQUIRE(r.is_ok());
    REQUIRE(f.redis_targets->size() == 1);
    CHECK(f.redis_targets->at(0).host == "cache");
}
