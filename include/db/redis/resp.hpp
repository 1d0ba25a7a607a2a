#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dbgate {

/**
 * @brief One RESP2 reply
 *
 * A null bulk string and a null array both decode to NIL.
 */
struct RespValue {
    enum class Type { NIL, INTEGER, BULK, SIMPLE, ERROR, ARRAY };

    Type type = Type::NIL;
    int64_t integer = 0;
    std::string str;                  // BULK, SIMPLE, ERROR
    std::vector<RespValue> elements;  // ARRAY

    static RespValue nil() { return {}; }
    static RespValue from_integer(int64_t v) {
        RespValue r;
        r.type = Type::INTEGER;
        r.integer = v;
        return r;
    }
    static RespValue bulk(std::string s) {
        RespValue r;
        r.type = Type::BULK;
        r.str = std::move(s);
        return r;
    }
    static RespValue simple(std::string s) {
        RespValue r;
        r.type = Type::SIMPLE;
        r.str = std::move(s);
        return r;
    }
    static RespValue error(std::string s) {
        RespValue r;
        r.type = Type::ERROR;
        r.str = std::move(s);
        return r;
    }
    static RespValue array(std::vector<RespValue> items) {
        RespValue r;
        r.type = Type::ARRAY;
        r.elements = std::move(items);
        return r;
    }

    [[nodiscard]] bool is_nil() const { return type == Type::NIL; }
    [[nodiscard]] bool is_error() const { return type == Type::ERROR; }
    [[nodiscard]] bool is_array() const { return type == Type::ARRAY; }
    [[nodiscard]] bool is_string() const { return type == Type::BULK || type == Type::SIMPLE; }
};

namespace resp {

enum class parse_result { complete, incomplete, error };

// Append a command as an array of bulk strings
void encode_command_into(std::string& out, const std::vector<std::string>& args);

/**
 * @brief Decode one reply from the front of buf
 * @param consumed Bytes used when the result is complete
 */
[[nodiscard]] parse_result parse_reply(std::string_view buf, RespValue& out, size_t& consumed);

/**
 * @brief Human-readable rendering used by raw command execution
 *
 * nil -> (nil), integer -> decimal, bulk -> lossy UTF-8 text,
 * array -> [a, b] (recursive), simple -> the string,
 * error -> Error("<msg>").
 */
[[nodiscard]] std::string format_reply(const RespValue& value);

} // namespace resp

} // namespace dbgate
