#pragma once

#include "core/error.hpp"
#include "db/redis/redis_client.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dbgate {

/**
 * @brief Key-value operations over a borrowed Redis client
 *
 * A top-level error reply becomes a QUERY_ERROR carrying the server text.
 */
class RedisAdapter {
public:
    explicit RedisAdapter(std::shared_ptr<IRedisCommander> client);

    [[nodiscard]] Result<std::vector<std::string>> list_keys(const std::string& pattern);

    /**
     * @brief Value of a key, shaped by its type
     *
     * string -> raw value; list/set/zset -> JSON array text;
     * hash -> JSON object text; anything else -> "Unsupported type: <type>".
     */
    [[nodiscard]] Result<std::string> get_value(const std::string& key);

    [[nodiscard]] Result<void> set_string(const std::string& key, const std::string& value);
    [[nodiscard]] Result<int64_t> delete_key(const std::string& key);
    [[nodiscard]] Result<void> rename(const std::string& old_key, const std::string& new_key);

    // Seconds to live; -1 no expiry, -2 missing key
    [[nodiscard]] Result<int64_t> get_ttl(const std::string& key);

    /**
     * @brief Run a whitespace-split command line and render the reply
     */
    [[nodiscard]] Result<std::string> execute_raw(const std::string& command_line);

private:
    Result<RespValue> call(const std::vector<std::string>& args);
    Result<std::vector<std::string>> call_strings(const std::vector<std::string>& args);

    std::shared_ptr<IRedisCommander> client_;
};

} // namespace dbgate
