#pragma once

#include <cstdint>
#include <string>

namespace dbgate {

/**
 * @brief Driver-neutral type of a result column
 *
 * Each backend's type map folds its native codes into this set (PostgreSQL
 * OIDs, MYSQL_FIELD types, SQLite declared types and storage classes).
 * The value marshaller only distinguishes numbers and booleans; every
 * other member is rendered as text and is kept apart so the type maps
 * stay lossless.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // -> JSON integer
    SMALLINT, INTEGER, BIGINT,

    // -> JSON number
    REAL, DOUBLE_PRECISION, NUMERIC,

    // -> JSON boolean
    BOOLEAN,

    // -> JSON string, invalid UTF-8 replaced
    BLOB,

    // -> JSON string
    TEXT, VARCHAR, CHAR,
    DATE, TIME, TIMESTAMP, TIMESTAMP_TZ, INTERVAL,
    JSON, JSONB, XML,
    UUID, INET, MACADDR, MONEY,
    ARRAY,
    VENDOR_SPECIFIC,
};

// Native code kept next to the folded type for diagnostics and tests
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;
    std::string vendor_type_name;
};

} // namespace dbgate
