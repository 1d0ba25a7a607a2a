#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace dbgate {

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    using G = GenericColumnType;
    static const std::unordered_map<uint32_t, G> by_oid = {
        {pg_oid::INT2, G::SMALLINT},
        {pg_oid::INT4, G::INTEGER},
        {pg_oid::OID, G::INTEGER},
        {pg_oid::XID, G::INTEGER},
        {pg_oid::INT8, G::BIGINT},
        {pg_oid::FLOAT4, G::REAL},
        {pg_oid::FLOAT8, G::DOUBLE_PRECISION},
        {pg_oid::NUMERIC, G::NUMERIC},
        {pg_oid::BOOL, G::BOOLEAN},
        {pg_oid::BYTEA, G::BLOB},
        {pg_oid::TEXT, G::TEXT},
        {pg_oid::NAME, G::TEXT},
        {pg_oid::VARCHAR, G::VARCHAR},
        {pg_oid::BPCHAR, G::CHAR},
        {pg_oid::CHAR, G::CHAR},
        {pg_oid::DATE, G::DATE},
        {pg_oid::TIME, G::TIME},
        {pg_oid::TIMETZ, G::TIME},
        {pg_oid::TIMESTAMP, G::TIMESTAMP},
        {pg_oid::TIMESTAMPTZ, G::TIMESTAMP_TZ},
        {pg_oid::INTERVAL, G::INTERVAL},
        {pg_oid::JSON, G::JSON},
        {pg_oid::JSONB, G::JSONB},
        {pg_oid::XML, G::XML},
        {pg_oid::UUID, G::UUID},
        {pg_oid::INET, G::INET},
        {pg_oid::CIDR, G::INET},
        {pg_oid::MACADDR, G::MACADDR},
        {pg_oid::MONEY, G::MONEY},
        {pg_oid::ANYARRAY, G::ARRAY},
        {pg_oid::INT4_ARRAY, G::ARRAY},
        {pg_oid::TEXT_ARRAY, G::ARRAY},
    };

    const auto it = by_oid.find(oid);
    return it != by_oid.end() ? it->second : G::VENDOR_SPECIFIC;
}

} // namespace dbgate
