#pragma once

#include "core/error.hpp"
#include "core/json.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dbgate::bson {

/**
 * @brief Serialize a JSON object as a BSON document
 *
 * Binary JSON values become BSON binary (0x05). The argument must be an object.
 */
[[nodiscard]] Result<std::string> encode(const Json& document);

/**
 * @brief Decode one BSON document
 *
 * Types without a JSON counterpart map as:
 *   ObjectId  -> {"$oid": "<24 hex>"}
 *   datetime  -> {"$date": <ms since epoch>}
 *   timestamp -> {"$timestamp": <uint64>}
 *   binary    -> Json::binary with its subtype
 *   regex     -> {"$regex": pattern, "$options": flags}
 *   decimal128, min/max key -> their extended-JSON tag with the raw hex
 */
[[nodiscard]] Result<Json> decode(std::string_view bytes);

// Little-endian helpers shared with the wire codec
[[nodiscard]] int32_t read_int32(const char* p);
void append_int32(std::string& out, int32_t value);

} // namespace dbgate::bson
