#include <catch2/catch_test_macros.hpp>
#include "db/connection_registry.hpp"
#include "mocks/mock_backends.hpp"
#include "mocks/mock_db_connection.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace dbgate;
using namespace dbgate::testing;

namespace {

ConnectionRegistry::SqlSlot::Entry sql_entry(std::shared_ptr<MockPool> pool, std::string database) {
    ConnectionRegistry::SqlSlot::Entry entry;
    entry.handle = std::move(pool);
    entry.params.database = std::move(database);
    return entry;
}

} // anonymous namespace

TEST_CASE("Registry: slot starts empty", "[registry]") {
    ConnectionRegistry registry;
    for (const auto type : {DatabaseType::REDIS, DatabaseType::MYSQL, DatabaseType::POSTGRESQL,
                            DatabaseType::SQLITE, DatabaseType::MONGODB}) {
        CHECK_FALSE(registry.occupied(type));
        CHECK_FALSE(registry.clear(type));
    }
    CHECK_FALSE(registry.redis().get().has_value());
}

TEST_CASE("Registry: only relational kinds have SQL slots", "[registry]") {
    ConnectionRegistry registry;
    CHECK(registry.sql(DatabaseType::MYSQL) != nullptr);
    CHECK(registry.sql(DatabaseType::POSTGRESQL) != nullptr);
    CHECK(registry.sql(DatabaseType::SQLITE) != nullptr);
    CHECK(registry.sql(DatabaseType::REDIS) == nullptr);
    CHECK(registry.sql(DatabaseType::MONGODB) == nullptr);

    // Distinct slots per dialect
    CHECK(registry.sql(DatabaseType::MYSQL) != registry.sql(DatabaseType::SQLITE));
}

TEST_CASE("Registry: last writer wins and the old handle is released", "[registry]") {
    ConnectionRegistry registry;
    auto* slot = registry.sql(DatabaseType::POSTGRESQL);

    auto first = std::make_shared<MockPool>();
    auto second = std::make_shared<MockPool>();
    std::weak_ptr<MockPool> first_weak = first;

    slot->set(sql_entry(std::move(first), "one"));
    slot->set(sql_entry(second, "two"));

    const auto entry = slot->get();
    REQUIRE(entry.has_value());
    CHECK(entry->params.database == "two");
    CHECK(entry->handle == second);
    CHECK(first_weak.expired());
}

TEST_CASE("Registry: a borrowed entry outlives clear", "[registry]") {
    ConnectionRegistry registry;
    auto redis = std::make_shared<MockRedisCommander>();

    ConnectionRegistry::RedisSlot::Entry entry;
    entry.handle = redis;
    entry.params.host = "cache";
    registry.redis().set(std::move(entry));
    CHECK(registry.occupied(DatabaseType::REDIS));

    const auto borrowed = registry.redis().get();
    CHECK(registry.clear(DatabaseType::REDIS));
    CHECK_FALSE(registry.occupied(DatabaseType::REDIS));

    REQUIRE(borrowed.has_value());
    CHECK(borrowed->handle.get() == redis.get());
    CHECK(borrowed->params.host == "cache");
}

TEST_CASE("Registry: clear_all empties every slot", "[registry]") {
    ConnectionRegistry registry;
    registry.sql(DatabaseType::MYSQL)->set(sql_entry(std::make_shared<MockPool>(), "a"));
    registry.sql(DatabaseType::SQLITE)->set(sql_entry(std::make_shared<MockPool>(), ""));

    ConnectionRegistry::MongoSlot::Entry mongo;
    mongo.handle = std::make_shared<MockDocumentClient>();
    registry.mongo().set(std::move(mongo));

    registry.clear_all();
    CHECK_FALSE(registry.occupied(DatabaseType::MYSQL));
    CHECK_FALSE(registry.occupied(DatabaseType::SQLITE));
    CHECK_FALSE(registry.occupied(DatabaseType::MONGODB));
}

TEST_CASE("Registry: concurrent set and get", "[registry][concurrency]") {
    ConnectionRegistry registry;
    auto* slot = registry.sql(DatabaseType::MYSQL);

    std::atomic<int> torn{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([slot, t, &torn] {
            for (int i = 0; i < 200; ++i) {
                slot->set(sql_entry(std::make_shared<MockPool>(), std::to_string(t)));
                const auto entry = slot->get();
                if (!entry || !entry->handle) {
                    torn.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(torn.load() == 0);
    CHECK(registry.occupied(DatabaseType::MYSQL));
}
