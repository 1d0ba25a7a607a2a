#include <catch2/catch_test_macros.hpp>
#include "core/value_marshaller.hpp"
#include "db/postgresql/pg_type_map.hpp"

using namespace dbgate;

TEST_CASE("Marshal: classify maps column families", "[marshal]") {
    CHECK(classify(GenericColumnType::SMALLINT) == ValueClass::INTEGER);
    CHECK(classify(GenericColumnType::BIGINT) == ValueClass::INTEGER);
    CHECK(classify(GenericColumnType::REAL) == ValueClass::FLOAT);
    CHECK(classify(GenericColumnType::NUMERIC) == ValueClass::FLOAT);
    CHECK(classify(GenericColumnType::BOOLEAN) == ValueClass::BOOLEAN);
    CHECK(classify(GenericColumnType::BLOB) == ValueClass::BINARY);
    CHECK(classify(GenericColumnType::TIMESTAMP) == ValueClass::TEXT);
    CHECK(classify(GenericColumnType::UUID) == ValueClass::TEXT);
    CHECK(classify(GenericColumnType::UNKNOWN) == ValueClass::TEXT);
}

TEST_CASE("Marshal: null input is JSON null for every class", "[marshal]") {
    for (auto vc : {ValueClass::INTEGER, ValueClass::FLOAT, ValueClass::BOOLEAN,
                    ValueClass::BINARY, ValueClass::TEXT}) {
        CHECK(marshal(vc, std::nullopt).is_null());
    }
}

TEST_CASE("Marshal: integers", "[marshal]") {
    CHECK(marshal(ValueClass::INTEGER, "42") == 42);
    CHECK(marshal(ValueClass::INTEGER, "-7") == -7);

    SECTION("BIGINT UNSIGNED above int64") {
        const auto v = marshal(ValueClass::INTEGER, "18446744073709551615");
        REQUIRE(v.is_number_unsigned());
        CHECK(v.get<uint64_t>() == 18446744073709551615ULL);
    }

    SECTION("Unparsable falls back to text") {
        const auto v = marshal(ValueClass::INTEGER, "12abc");
        REQUIRE(v.is_string());
        CHECK(v == "12abc");
    }
}

TEST_CASE("Marshal: floats", "[marshal]") {
    const auto v = marshal(ValueClass::FLOAT, "3.5");
    REQUIRE(v.is_number_float());
    CHECK(v.get<double>() == 3.5);

    // Non-finite values have no JSON number form
    CHECK(marshal(ValueClass::FLOAT, "NaN").is_string());
    CHECK(marshal(ValueClass::FLOAT, "").is_string());
}

TEST_CASE("Marshal: booleans accept driver spellings", "[marshal]") {
    CHECK(marshal(ValueClass::BOOLEAN, "t") == true);
    CHECK(marshal(ValueClass::BOOLEAN, "f") == false);
    CHECK(marshal(ValueClass::BOOLEAN, "1") == true);
    CHECK(marshal(ValueClass::BOOLEAN, "0") == false);
    CHECK(marshal(ValueClass::BOOLEAN, "TRUE") == true);
    CHECK(marshal(ValueClass::BOOLEAN, "maybe") == "maybe");
}

TEST_CASE("Marshal: binary is lossy UTF-8 text", "[marshal]") {
    const std::string raw("ab\xff" "c", 4);
    const auto v = marshal(ValueClass::BINARY, raw);
    REQUIRE(v.is_string());
    CHECK(v.get<std::string>() == "ab\xEF\xBF\xBD" "c");

    // Valid UTF-8 passes through unchanged
    CHECK(marshal(ValueClass::TEXT, "h\xC3\xA9llo") == "h\xC3\xA9llo");
}

TEST_CASE("Marshal: row keeps column order and types", "[marshal]") {
    const std::vector<std::string> names = {"id", "name", "score", "active", "note"};
    const std::vector<ColumnTypeInfo> types = {
        {GenericColumnType::INTEGER, 23, "int4"},
        {GenericColumnType::TEXT, 25, "text"},
        {GenericColumnType::DOUBLE_PRECISION, 701, "float8"},
        {GenericColumnType::BOOLEAN, 16, "bool"},
        {GenericColumnType::TEXT, 25, "text"},
    };
    const std::vector<std::optional<std::string>> cells = {"1", "alice", "9.25", "t", std::nullopt};

    const auto row = marshal_row(names, types, cells);
    REQUIRE(row.is_object());
    REQUIRE(row.size() == 5);

    auto it = row.begin();
    CHECK(it.key() == "id");
    ++it;
    CHECK(it.key() == "name");

    CHECK(row["id"] == 1);
    CHECK(row["name"] == "alice");
    CHECK(row["score"] == 9.25);
    CHECK(row["active"] == true);
    CHECK(row["note"].is_null());
}

TEST_CASE("Marshal: row with missing type info decodes as text", "[marshal]") {
    const auto row = marshal_row({"a", "b"}, {}, {"5", std::nullopt});
    CHECK(row["a"] == "5");
    CHECK(row["b"].is_null());
}

TEST_CASE("Marshal: PostgreSQL OIDs reach the right value class", "[marshal][pg]") {
    const auto via_oid = [](uint32_t oid) { return classify(PgTypeMap::oid_to_generic_type(oid)); };

    CHECK(via_oid(pg_oid::INT2) == ValueClass::INTEGER);
    CHECK(via_oid(pg_oid::INT8) == ValueClass::INTEGER);
    CHECK(via_oid(pg_oid::NUMERIC) == ValueClass::FLOAT);
    CHECK(via_oid(pg_oid::BOOL) == ValueClass::BOOLEAN);
    CHECK(via_oid(pg_oid::BYTEA) == ValueClass::BINARY);
    CHECK(via_oid(pg_oid::JSONB) == ValueClass::TEXT);

    // Domains and extension types
    CHECK(PgTypeMap::oid_to_generic_type(16385) == GenericColumnType::VENDOR_SPECIFIC);
    CHECK(via_oid(16385) == ValueClass::TEXT);
}
