#include <catch2/catch_test_macros.hpp>
#include "gateway/gateway.hpp"
#include "db/sqlite/sqlite_connection.hpp"

#include <filesystem>
#include <format>
#include <random>

using namespace dbgate;

namespace {

// Removes the database file (and any journal) when the test ends
class TempDbFile {
public:
    TempDbFile() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                std::format("dbgate_test_{:x}.db", rd());
    }
    ~TempDbFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + "-journal", ec);
    }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

GatewayDependencies sqlite_only() {
    GatewayDependencies deps;
    deps.backends = BackendRegistry::with_builtin_backends();
    return deps;
}

std::shared_ptr<Gateway> open_gateway(const TempDbFile& file) {
    auto gw = std::make_shared<Gateway>(GatewayConfig{}, sqlite_only());
    SqlConnectParams params;
    params.path = file.str();
    auto opened = gw->connect_sql(DatabaseType::SQLITE, params, std::nullopt);
    REQUIRE(opened.is_ok());
    return gw;
}

void exec(Gateway& gw, const std::string& sql) {
    auto r = gw.execute_raw(DatabaseType::SQLITE, sql);
    INFO(sql << " -> " << r.error_message());
    REQUIRE(r.is_ok());
}

} // anonymous namespace

TEST_CASE("SQLite: declared types follow affinity rules", "[sqlite]") {
    CHECK(SqliteConnection::declared_type_to_generic("INTEGER") == GenericColumnType::BIGINT);
    CHECK(SqliteConnection::declared_type_to_generic("varchar(20)") == GenericColumnType::TEXT);
    CHECK(SqliteConnection::declared_type_to_generic("BOOLEAN") == GenericColumnType::BOOLEAN);
    CHECK(SqliteConnection::declared_type_to_generic("BLOB") == GenericColumnType::BLOB);
    CHECK(SqliteConnection::declared_type_to_generic("DOUBLE") == GenericColumnType::DOUBLE_PRECISION);
    CHECK(SqliteConnection::declared_type_to_generic("DATETIME") == GenericColumnType::TIMESTAMP);
    CHECK(SqliteConnection::declared_type_to_generic("DECIMAL(10,2)") == GenericColumnType::NUMERIC);
    CHECK(SqliteConnection::declared_type_to_generic("") == GenericColumnType::UNKNOWN);
}

TEST_CASE("SQLite: open reports the path", "[sqlite][connect]") {
    TempDbFile file;
    Gateway gw(GatewayConfig{}, sqlite_only());

    SqlConnectParams params;
    params.path = file.str();
    auto opened = gw.connect_sql(DatabaseType::SQLITE, params, std::nullopt);
    REQUIRE(opened.is_ok());
    CHECK(opened.value() == "Opened " + file.str());
    CHECK(gw.is_connected(DatabaseType::SQLITE));
}

TEST_CASE("SQLite: empty path and SSH are rejected", "[sqlite][connect]") {
    Gateway gw(GatewayConfig{}, sqlite_only());

    auto no_path = gw.connect_sql(DatabaseType::SQLITE, SqlConnectParams{}, std::nullopt);
    REQUIRE(no_path.is_error());
    CHECK(no_path.error_category() == ErrorCategory::INVALID_REQUEST);

    SqlConnectParams params;
    params.path = "/tmp/whatever.db";
    SshTarget ssh;
    ssh.host = "bastion";
    ssh.username = "me";
    ssh.password = "pw";
    auto with_ssh = gw.connect_sql(DatabaseType::SQLITE, params, ssh);
    REQUIRE(with_ssh.is_error());
    CHECK(with_ssh.error_category() == ErrorCategory::INVALID_REQUEST);
    CHECK_FALSE(gw.is_connected(DatabaseType::SQLITE));
}

TEST_CASE("SQLite: unopenable path is a connect error", "[sqlite][connect]") {
    Gateway gw(GatewayConfig{}, sqlite_only());

    SqlConnectParams params;
    params.path = "/nonexistent-dir/sub/db.sqlite";
    auto opened = gw.connect_sql(DatabaseType::SQLITE, params, std::nullopt);
    REQUIRE(opened.is_error());
    CHECK(opened.error_category() == ErrorCategory::CONNECT_ERROR);
    CHECK_FALSE(gw.is_connected(DatabaseType::SQLITE));
}

TEST_CASE("SQLite: catalog of a fresh schema", "[sqlite][catalog]") {
    TempDbFile file;
    auto gw = open_gateway(file);

    exec(*gw, "CREATE TABLE users (id INTEGER PRIMARY KEY, email TEXT NOT NULL, age INTEGER)");
    exec(*gw, "CREATE TABLE pairs (a INTEGER, b INTEGER, PRIMARY KEY (a, b))");
    exec(*gw, "CREATE VIEW adults AS SELECT * FROM users WHERE age >= 18");

    auto tables = gw->list_tables(DatabaseType::SQLITE);
    REQUIRE(tables.is_ok());
    CHECK(tables.value() == std::vector<std::string>{"pairs", "users"});

    auto views = gw->list_views(DatabaseType::SQLITE);
    REQUIRE(views.is_ok());
    CHECK(views.value() == std::vector<std::string>{"adults"});

    auto columns = gw->get_columns(DatabaseType::SQLITE, "users");
    REQUIRE(columns.is_ok());
    CHECK(columns.value() == std::vector<std::string>{"id", "email", "age"});

    auto pk = gw->get_primary_key(DatabaseType::SQLITE, "users");
    REQUIRE(pk.is_ok());
    REQUIRE(pk.value().has_value());
    CHECK(*pk.value() == "id");

    auto composite = gw->get_primary_key(DatabaseType::SQLITE, "pairs");
    REQUIRE(composite.is_ok());
    CHECK_FALSE(composite.value().has_value());

    auto missing = gw->get_columns(DatabaseType::SQLITE, "ghost");
    REQUIRE(missing.is_ok());
    CHECK(missing.value().empty());
}

TEST_CASE("SQLite: insert, page and edit rows", "[sqlite][data]") {
    TempDbFile file;
    auto gw = open_gateway(file);
    exec(*gw, "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT, price REAL, note TEXT)");

    for (int i = 1; i <= 5; ++i) {
        Json row = Json::object();
        row["id"] = i;
        row["name"] = std::format("item{}", i);
        row["price"] = i * 1.5;
        row["note"] = nullptr;
        auto inserted = gw->insert_row(DatabaseType::SQLITE, "items", row);
        REQUIRE(inserted.is_ok());
        CHECK(inserted.value() == 1);
    }

    auto count = gw->get_row_count(DatabaseType::SQLITE, "items");
    REQUIRE(count.is_ok());
    CHECK(count.value() == 5);

    SECTION("page is ordered by key with canonical values") {
        auto page = gw->get_rows(DatabaseType::SQLITE, "items", 2, 1);
        REQUIRE(page.is_ok());
        REQUIRE(page.value().size() == 2);
        CHECK(page.value()[0]["id"] == 2);
        CHECK(page.value()[0]["name"] == "item2");
        CHECK(page.value()[0]["price"] == 3.0);
        CHECK(page.value()[0]["note"].is_null());
        CHECK(page.value()[1]["id"] == 3);
    }

    SECTION("offset past the end is an empty page") {
        auto page = gw->get_rows(DatabaseType::SQLITE, "items", 10, 50);
        REQUIRE(page.is_ok());
        CHECK(page.value().empty());
    }

    SECTION("update one cell") {
        auto updated = gw->update_cell(DatabaseType::SQLITE, "items", "id", "4", "name", "renamed");
        REQUIRE(updated.is_ok());
        CHECK(updated.value() == 1);

        auto rows = gw->execute_raw(DatabaseType::SQLITE, "SELECT name FROM items WHERE id = 4");
        REQUIRE(rows.is_ok());
        CHECK(rows.value().to_json()[0]["name"] == "renamed");
    }

    SECTION("missing key affects nothing") {
        auto updated = gw->update_cell(DatabaseType::SQLITE, "items", "id", "99", "name", "x");
        REQUIRE(updated.is_ok());
        CHECK(updated.value() == 0);

        auto deleted = gw->delete_row(DatabaseType::SQLITE, "items", "id", "99");
        REQUIRE(deleted.is_ok());
        CHECK(deleted.value() == 0);
    }

    SECTION("delete by key") {
        auto deleted = gw->delete_row(DatabaseType::SQLITE, "items", "id", "1");
        REQUIRE(deleted.is_ok());
        CHECK(deleted.value() == 1);
        CHECK(gw->get_row_count(DatabaseType::SQLITE, "items").value() == 4);
    }

    SECTION("unknown column is a query error") {
        auto updated = gw->update_cell(DatabaseType::SQLITE, "items", "id", "1", "nope", "x");
        REQUIRE(updated.is_error());
        CHECK(updated.error_category() == ErrorCategory::QUERY_ERROR);
    }
}

TEST_CASE("SQLite: hostile identifiers stay identifiers", "[sqlite][quoting]") {
    TempDbFile file;
    auto gw = open_gateway(file);
    exec(*gw, "CREATE TABLE \"we\"\"ird; name\" (id INTEGER PRIMARY KEY, v TEXT)");

    Json row = Json::object();
    row["v"] = "x'); DROP TABLE t; --";
    auto inserted = gw->insert_row(DatabaseType::SQLITE, "we\"ird; name", row);
    REQUIRE(inserted.is_ok());

    auto rows = gw->get_rows(DatabaseType::SQLITE, "we\"ird; name", 10, 0);
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 1);
    CHECK(rows.value()[0]["v"] == "x'); DROP TABLE t; --");
}

TEST_CASE("SQLite: rename and drop tables", "[sqlite][ddl]") {
    TempDbFile file;
    auto gw = open_gateway(file);
    exec(*gw, "CREATE TABLE old_name (id INTEGER PRIMARY KEY)");

    REQUIRE(gw->rename_table(DatabaseType::SQLITE, "old_name", "new_name").is_ok());
    CHECK(gw->list_tables(DatabaseType::SQLITE).value() == std::vector<std::string>{"new_name"});

    REQUIRE(gw->drop_table(DatabaseType::SQLITE, "new_name").is_ok());
    CHECK(gw->list_tables(DatabaseType::SQLITE).value().empty());

    auto again = gw->drop_table(DatabaseType::SQLITE, "new_name");
    REQUIRE(again.is_error());
    CHECK(again.error_category() == ErrorCategory::QUERY_ERROR);
}

TEST_CASE("SQLite: raw statements", "[sqlite][raw]") {
    TempDbFile file;
    auto gw = open_gateway(file);
    exec(*gw, "CREATE TABLE t (n INTEGER)");

    auto insert = gw->execute_raw(DatabaseType::SQLITE, "INSERT INTO t VALUES (1), (2), (3)");
    REQUIRE(insert.is_ok());
    CHECK(insert.value().to_json() == "Success: 3 rows affected");

    auto select = gw->execute_raw(DatabaseType::SQLITE, "select n * 2 AS d FROM t ORDER BY n");
    REQUIRE(select.is_ok());
    REQUIRE(select.value().has_rows);
    CHECK(select.value().to_json().size() == 3);
    CHECK(select.value().to_json()[2]["d"] == 6);

    auto pragma = gw->execute_raw(DatabaseType::SQLITE, "PRAGMA table_info(t)");
    REQUIRE(pragma.is_ok());
    CHECK(pragma.value().has_rows);

    auto broken = gw->execute_raw(DatabaseType::SQLITE, "SELEC oops");
    REQUIRE(broken.is_error());
    CHECK(broken.error_category() == ErrorCategory::QUERY_ERROR);

    auto two = gw->execute_raw(DatabaseType::SQLITE, "SELECT 1; SELECT 2");
    REQUIRE(two.is_error());
    CHECK(two.error_category() == ErrorCategory::QUERY_ERROR);
}

TEST_CASE("SQLite: operations without routines or databases", "[sqlite][catalog]") {
    TempDbFile file;
    auto gw = open_gateway(file);

    CHECK(gw->list_functions(DatabaseType::SQLITE).error_category() == ErrorCategory::INVALID_REQUEST);
    CHECK(gw->list_procedures(DatabaseType::SQLITE).error_category() == ErrorCategory::INVALID_REQUEST);
    CHECK(gw->list_databases_with_size(DatabaseType::SQLITE).error_category() == ErrorCategory::INVALID_REQUEST);
    CHECK(gw->use_database(DatabaseType::SQLITE, "other").error_category() == ErrorCategory::INVALID_REQUEST);
}

TEST_CASE("SQLite: disconnect empties the slot", "[sqlite][connect]") {
    TempDbFile file;
    auto gw = open_gateway(file);

    REQUIRE(gw->disconnect(DatabaseType::SQLITE).is_ok());
    CHECK_FALSE(gw->is_connected(DatabaseType::SQLITE));

    auto tables = gw->list_tables(DatabaseType::SQLITE);
    REQUIRE(tables.is_error());
    CHECK(tables.error_category() == ErrorCategory::NOT_CONNECTED);

    // Second disconnect is not an error
    CHECK(gw->disconnect(DatabaseType::SQLITE).is_ok());
}
