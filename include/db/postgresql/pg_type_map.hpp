#pragma once

#include "core/column_type.hpp"
#include <cstdint>

namespace dbgate {

// Built-in type OIDs from pg_type.dat; stable across server versions
namespace pg_oid {
inline constexpr uint32_t BOOL = 16;
inline constexpr uint32_t BYTEA = 17;
inline constexpr uint32_t CHAR = 18;
inline constexpr uint32_t NAME = 19;
inline constexpr uint32_t INT8 = 20;
inline constexpr uint32_t INT2 = 21;
inline constexpr uint32_t INT4 = 23;
inline constexpr uint32_t TEXT = 25;
inline constexpr uint32_t OID = 26;
inline constexpr uint32_t XID = 28;
inline constexpr uint32_t JSON = 114;
inline constexpr uint32_t XML = 142;
inline constexpr uint32_t CIDR = 650;
inline constexpr uint32_t FLOAT4 = 700;
inline constexpr uint32_t FLOAT8 = 701;
inline constexpr uint32_t MONEY = 790;
inline constexpr uint32_t MACADDR = 829;
inline constexpr uint32_t INET = 869;
inline constexpr uint32_t INT4_ARRAY = 1007;
inline constexpr uint32_t TEXT_ARRAY = 1009;
inline constexpr uint32_t BPCHAR = 1042;
inline constexpr uint32_t VARCHAR = 1043;
inline constexpr uint32_t DATE = 1082;
inline constexpr uint32_t TIME = 1083;
inline constexpr uint32_t TIMESTAMP = 1114;
inline constexpr uint32_t TIMESTAMPTZ = 1184;
inline constexpr uint32_t INTERVAL = 1186;
inline constexpr uint32_t TIMETZ = 1266;
inline constexpr uint32_t NUMERIC = 1700;
inline constexpr uint32_t ANYARRAY = 2277;
inline constexpr uint32_t UUID = 2950;
inline constexpr uint32_t JSONB = 3802;
} // namespace pg_oid

class PgTypeMap {
public:
    // Unlisted OIDs (domains, enums, extension types) map to VENDOR_SPECIFIC
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);
};

} // namespace dbgate
