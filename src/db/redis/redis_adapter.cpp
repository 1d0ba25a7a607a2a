#include "db/redis/redis_adapter.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbgate {

RedisAdapter::RedisAdapter(std::shared_ptr<IRedisCommander> client)
    : client_(std::move(client)) {}

Result<RespValue> RedisAdapter::call(const std::vector<std::string>& args) {
    auto reply = client_->command(args);
    if (reply.is_error()) {
        return reply;
    }
    if (reply.value().is_error()) {
        return Result<RespValue>::error(ErrorCategory::QUERY_ERROR, reply.value().str);
    }
    return reply;
}

Result<std::vector<std::string>> RedisAdapter::call_strings(const std::vector<std::string>& args) {
    using R = Result<std::vector<std::string>>;

    auto reply = call(args);
    if (reply.is_error()) {
        return R::error_from(reply);
    }

    const auto& value = reply.value();
    std::vector<std::string> out;
    if (value.is_nil()) {
        return R::ok(std::move(out));
    }
    if (!value.is_array()) {
        return R::error(ErrorCategory::QUERY_ERROR,
            std::format("Unexpected reply to {}: {}", args.front(), resp::format_reply(value)));
    }

    out.reserve(value.elements.size());
    for (const auto& item : value.elements) {
        if (item.is_string()) {
            out.push_back(utils::lossy_utf8(item.str));
        } else {
            out.push_back(resp::format_reply(item));
        }
    }
    return R::ok(std::move(out));
}

Result<std::vector<std::string>> RedisAdapter::list_keys(const std::string& pattern) {
    return call_strings({"KEYS", pattern.empty() ? std::string("*") : pattern});
}

Result<std::string> RedisAdapter::get_value(const std::string& key) {
    using R = Result<std::string>;

    auto type_reply = call({"TYPE", key});
    if (type_reply.is_error()) {
        return R::error_from(type_reply);
    }
    const std::string type = type_reply.value().str;

    if (type == "string") {
        auto reply = call({"GET", key});
        if (reply.is_error()) {
            return R::error_from(reply);
        }
        // Deleted between TYPE and GET
        if (reply.value().is_nil()) {
            return R::ok("(nil)");
        }
        return R::ok(utils::lossy_utf8(reply.value().str));
    }

    if (type == "list" || type == "set" || type == "zset") {
        std::vector<std::string> args;
        if (type == "list") {
            args = {"LRANGE", key, "0", "-1"};
        } else if (type == "set") {
            args = {"SMEMBERS", key};
        } else {
            args = {"ZRANGE", key, "0", "-1"};
        }
        auto items = call_strings(args);
        if (items.is_error()) {
            return R::error_from(items);
        }
        return R::ok(Json(items.value()).dump());
    }

    if (type == "hash") {
        auto fields = call_strings({"HGETALL", key});
        if (fields.is_error()) {
            return R::error_from(fields);
        }
        Json obj = Json::object();
        const auto& flat = fields.value();
        for (size_t i = 0; i + 1 < flat.size(); i += 2) {
            obj[flat[i]] = flat[i + 1];
        }
        return R::ok(obj.dump());
    }

    return R::ok(std::format("Unsupported type: {}", type));
}

Result<void> RedisAdapter::set_string(const std::string& key, const std::string& value) {
    auto reply = call({"SET", key, value});
    if (reply.is_error()) {
        return Result<void>::error_from(reply);
    }
    return Result<void>::ok();
}

Result<int64_t> RedisAdapter::delete_key(const std::string& key) {
    auto reply = call({"DEL", key});
    if (reply.is_error()) {
        return Result<int64_t>::error_from(reply);
    }
    return Result<int64_t>::ok(reply.value().integer);
}

Result<void> RedisAdapter::rename(const std::string& old_key, const std::string& new_key) {
    auto reply = call({"RENAME", old_key, new_key});
    if (reply.is_error()) {
        return Result<void>::error_from(reply);
    }
    return Result<void>::ok();
}

Result<int64_t> RedisAdapter::get_ttl(const std::string& key) {
    auto reply = call({"TTL", key});
    if (reply.is_error()) {
        return Result<int64_t>::error_from(reply);
    }
    if (reply.value().type != RespValue::Type::INTEGER) {
        return Result<int64_t>::error(ErrorCategory::QUERY_ERROR,
            std::format("Unexpected reply to TTL: {}", resp::format_reply(reply.value())));
    }
    return Result<int64_t>::ok(reply.value().integer);
}

Result<std::string> RedisAdapter::execute_raw(const std::string& command_line) {
    auto args = utils::split_whitespace(command_line);
    if (args.empty()) {
        return Result<std::string>::error(ErrorCategory::INVALID_REQUEST, "Command is empty");
    }

    auto reply = call(args);
    if (reply.is_error()) {
        return Result<std::string>::error_from(reply);
    }
    return Result<std::string>::ok(resp::format_reply(reply.value()));
}

} // namespace dbgate
