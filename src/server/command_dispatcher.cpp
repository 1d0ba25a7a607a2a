#include "server/command_dispatcher.hpp"
#include "gateway/gateway.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace dbgate {

namespace {

// ---- Argument extraction ---------------------------------------------------

Result<Json> missing(std::string_view key) {
    return Result<Json>::error(ErrorCategory::INVALID_REQUEST,
        std::format("Missing or invalid argument '{}'", key));
}

std::optional<std::string> opt_string(const Json& args, const std::string& key) {
    const auto it = args.find(key);
    if (it == args.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<int64_t> opt_int(const Json& args, const std::string& key) {
    const auto it = args.find(key);
    if (it == args.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<int64_t>();
    // Form fields tend to arrive as strings
    if (it->is_string()) return utils::try_parse_int<int64_t>(utils::trim(it->get<std::string>()));
    return std::nullopt;
}

std::optional<uint16_t> opt_port(const Json& args, const std::string& key) {
    const auto v = opt_int(args, key);
    if (!v || !utils::in_range<0, 65535>(*v)) return std::nullopt;
    return static_cast<uint16_t>(*v);
}

// Non-empty strings only; an empty password means "no password"
std::optional<std::string> opt_nonempty(const Json& args, const std::string& key) {
    auto v = opt_string(args, key);
    if (v && v->empty()) return std::nullopt;
    return v;
}

/**
 * @brief "ssh": {host, port, username, password}; absent, null or
 *        {"enabled": false} means a direct connection
 */
Result<std::optional<SshTarget>> ssh_target(const Json& args) {
    using R = Result<std::optional<SshTarget>>;

    const auto it = args.find("ssh");
    if (it == args.end() || it->is_null()) {
        return R::ok(std::nullopt);
    }
    if (!it->is_object()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "Argument 'ssh' must be an object");
    }
    const Json& ssh = *it;
    if (const auto enabled = ssh.find("enabled"); enabled != ssh.end() && enabled->is_boolean() &&
        !enabled->get<bool>()) {
        return R::ok(std::nullopt);
    }

    SshTarget target;
    auto host = opt_string(ssh, "host");
    auto username = opt_string(ssh, "username");
    if (!host || host->empty()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "Missing or invalid argument 'ssh.host'");
    }
    if (!username || username->empty()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "Missing or invalid argument 'ssh.username'");
    }
    target.host = std::move(*host);
    target.username = std::move(*username);
    target.port = opt_port(ssh, "port").value_or(22);
    target.password = opt_nonempty(ssh, "password");
    return R::ok(std::move(target));
}

SqlConnectParams sql_params(const Json& args) {
    SqlConnectParams params;
    params.host = opt_string(args, "host").value_or("127.0.0.1");
    params.port = opt_port(args, "port").value_or(0);
    params.user = opt_string(args, "user").value_or("");
    params.password = opt_string(args, "password").value_or("");
    params.database = opt_string(args, "database").value_or("");
    params.path = opt_string(args, "path").value_or("");
    return params;
}

// ---- Result -> JSON --------------------------------------------------------

Json to_json(const std::string& v) { return v; }
Json to_json(int64_t v) { return v; }
Json to_json(uint64_t v) { return v; }
Json to_json(const Json& v) { return v; }
Json to_json(const std::vector<std::string>& v) { return Json(v); }
Json to_json(const std::optional<std::string>& v) { return v ? Json(*v) : Json(nullptr); }
Json to_json(const RawExecution& v) { return v.to_json(); }

Json to_json(const std::vector<SizedName>& v) {
    Json out = Json::array();
    for (const auto& entry : v) {
        out.push_back(Json{{"name", entry.name}, {"size", entry.bytes}});
    }
    return out;
}

template<typename T>
Result<Json> wrap(const Result<T>& result) {
    if (result.is_error()) {
        return Result<Json>::error_from(result);
    }
    return Result<Json>::ok(to_json(result.value()));
}

Result<Json> wrap(const Result<void>& result) {
    if (result.is_error()) {
        return Result<Json>::error_from(result);
    }
    return Result<Json>::ok(nullptr);
}

} // anonymous namespace

// ============================================================================
// CommandDispatcher
// ============================================================================

CommandDispatcher::CommandDispatcher(std::shared_ptr<Gateway> gateway)
    : gateway_(std::move(gateway)) {
    register_redis();
    register_mongodb();
    register_sql();

    handlers_["disconnect"] = [gw = gateway_](const Json& args) -> Result<Json> {
        const auto name = opt_string(args, "type");
        if (!name) return missing("type");
        const auto type = try_parse_database_type(*name);
        if (!type) {
            return Result<Json>::error(ErrorCategory::INVALID_REQUEST,
                std::format("Unknown database type: {}", *name));
        }
        return wrap(gw->disconnect(*type));
    };
}

void CommandDispatcher::register_redis() {
    auto gw = gateway_;

    handlers_["connect_redis"] = [gw](const Json& args) -> Result<Json> {
        auto ssh = ssh_target(args);
        if (ssh.is_error()) return Result<Json>::error_from(ssh);

        RedisConnectParams params;
        params.host = opt_string(args, "host").value_or("127.0.0.1");
        params.port = opt_port(args, "port").value_or(6379);
        params.password = opt_nonempty(args, "password");
        params.database = opt_int(args, "database").value_or(0);
        return wrap(gw->connect_redis(params, ssh.value()));
    };
    handlers_["redis_get_keys"] = [gw](const Json& args) -> Result<Json> {
        return wrap(gw->redis_get_keys(opt_string(args, "pattern").value_or("*")));
    };
    handlers_["redis_get_value"] = [gw](const Json& args) -> Result<Json> {
        const auto key = opt_string(args, "key");
        if (!key) return missing("key");
        return wrap(gw->redis_get_value(*key));
    };
    handlers_["redis_set_value"] = [gw](const Json& args) -> Result<Json> {
        const auto key = opt_string(args, "key");
        const auto value = opt_string(args, "value");
        if (!key) return missing("key");
        if (!value) return missing("value");
        return wrap(gw->redis_set_value(*key, *value));
    };
    handlers_["redis_del_key"] = [gw](const Json& args) -> Result<Json> {
        const auto key = opt_string(args, "key");
        if (!key) return missing("key");
        return wrap(gw->redis_del_key(*key));
    };
    handlers_["redis_rename_key"] = [gw](const Json& args) -> Result<Json> {
        const auto old_key = opt_string(args, "oldKey");
        const auto new_key = opt_string(args, "newKey");
        if (!old_key) return missing("oldKey");
        if (!new_key) return missing("newKey");
        return wrap(gw->redis_rename_key(*old_key, *new_key));
    };
    handlers_["redis_get_ttl"] = [gw](const Json& args) -> Result<Json> {
        const auto key = opt_string(args, "key");
        if (!key) return missing("key");
        return wrap(gw->redis_get_ttl(*key));
    };
    handlers_["redis_execute_raw"] = [gw](const Json& args) -> Result<Json> {
        const auto command = opt_string(args, "command");
        if (!command) return missing("command");
        return wrap(gw->redis_execute_raw(*command));
    };
}

void CommandDispatcher::register_mongodb() {
    auto gw = gateway_;

    handlers_["connect_mongodb"] = [gw](const Json& args) -> Result<Json> {
        auto ssh = ssh_target(args);
        if (ssh.is_error()) return Result<Json>::error_from(ssh);

        MongoConnectParams params;
        params.host = opt_string(args, "host").value_or("127.0.0.1");
        params.port = opt_port(args, "port").value_or(27017);
        params.username = opt_nonempty(args, "user");
        params.password = opt_nonempty(args, "password");
        params.auth_database = opt_nonempty(args, "database").value_or("admin");
        return wrap(gw->connect_mongodb(params, ssh.value()));
    };
    handlers_["mongodb_list_databases"] = [gw](const Json&) -> Result<Json> {
        return wrap(gw->mongodb_list_databases());
    };
}

void CommandDispatcher::register_sql() {
    static constexpr DatabaseType kDialects[] = {
        DatabaseType::MYSQL, DatabaseType::POSTGRESQL, DatabaseType::SQLITE};

    for (const auto type : kDialects) {
        const std::string prefix(database_type_to_string(type));
        auto gw = gateway_;

        handlers_["connect_" + prefix] = [gw, type](const Json& args) -> Result<Json> {
            auto ssh = ssh_target(args);
            if (ssh.is_error()) return Result<Json>::error_from(ssh);
            return wrap(gw->connect_sql(type, sql_params(args), ssh.value()));
        };
        handlers_[prefix + "_get_tables"] = [gw, type](const Json&) -> Result<Json> {
            return wrap(gw->list_tables(type));
        };
        handlers_[prefix + "_get_views"] = [gw, type](const Json&) -> Result<Json> {
            return wrap(gw->list_views(type));
        };
        handlers_[prefix + "_get_functions"] = [gw, type](const Json&) -> Result<Json> {
            return wrap(gw->list_functions(type));
        };
        handlers_[prefix + "_get_procedures"] = [gw, type](const Json&) -> Result<Json> {
            return wrap(gw->list_procedures(type));
        };
        handlers_[prefix + "_get_columns"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            if (!table) return missing("tableName");
            return wrap(gw->get_columns(type, *table));
        };
        handlers_[prefix + "_get_primary_key"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            if (!table) return missing("tableName");
            return wrap(gw->get_primary_key(type, *table));
        };
        handlers_[prefix + "_get_count"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            if (!table) return missing("tableName");
            return wrap(gw->get_row_count(type, *table));
        };
        handlers_[prefix + "_get_rows"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            if (!table) return missing("tableName");
            return wrap(gw->get_rows(type, *table,
                opt_int(args, "limit").value_or(100), opt_int(args, "offset").value_or(0)));
        };
        handlers_[prefix + "_update_cell"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            const auto pk_col = opt_string(args, "pkCol");
            const auto pk_val = opt_string(args, "pkVal");
            const auto col = opt_string(args, "colName");
            const auto new_val = opt_string(args, "newVal");
            if (!table) return missing("tableName");
            if (!pk_col) return missing("pkCol");
            if (!pk_val) return missing("pkVal");
            if (!col) return missing("colName");
            if (!new_val) return missing("newVal");
            return wrap(gw->update_cell(type, *table, *pk_col, *pk_val, *col, *new_val));
        };
        handlers_[prefix + "_insert_row"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            if (!table) return missing("tableName");
            const auto it = args.find("data");
            if (it == args.end() || !it->is_object()) return missing("data");
            return wrap(gw->insert_row(type, *table, *it));
        };
        handlers_[prefix + "_delete_row"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            const auto pk_col = opt_string(args, "pkCol");
            const auto pk_val = opt_string(args, "pkVal");
            if (!table) return missing("tableName");
            if (!pk_col) return missing("pkCol");
            if (!pk_val) return missing("pkVal");
            return wrap(gw->delete_row(type, *table, *pk_col, *pk_val));
        };
        handlers_[prefix + "_drop_table"] = [gw, type](const Json& args) -> Result<Json> {
            const auto table = opt_string(args, "tableName");
            if (!table) return missing("tableName");
            return wrap(gw->drop_table(type, *table));
        };
        handlers_[prefix + "_rename_table"] = [gw, type](const Json& args) -> Result<Json> {
            const auto old_name = opt_string(args, "oldName");
            const auto new_name = opt_string(args, "newName");
            if (!old_name) return missing("oldName");
            if (!new_name) return missing("newName");
            return wrap(gw->rename_table(type, *old_name, *new_name));
        };
        handlers_[prefix + "_execute_raw"] = [gw, type](const Json& args) -> Result<Json> {
            const auto sql = opt_string(args, "sql");
            if (!sql) return missing("sql");
            return wrap(gw->execute_raw(type, *sql));
        };
        handlers_[prefix + "_get_databases"] = [gw, type](const Json&) -> Result<Json> {
            return wrap(gw->list_databases_with_size(type));
        };
        handlers_[prefix + "_use_database"] = [gw, type](const Json& args) -> Result<Json> {
            const auto database = opt_string(args, "database");
            if (!database) return missing("database");
            return wrap(gw->use_database(type, *database));
        };
        handlers_[prefix + "_get_tables_with_size"] = [gw, type](const Json& args) -> Result<Json> {
            const auto database = opt_string(args, "database");
            if (!database) return missing("database");
            return wrap(gw->list_tables_with_size(type, *database));
        };
    }
}

Result<Json> CommandDispatcher::dispatch(const std::string& command, const Json& args) const {
    const auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return Result<Json>::error(ErrorCategory::INVALID_REQUEST,
            std::format("Unknown command: {}", command));
    }
    if (!args.is_object()) {
        return Result<Json>::error(ErrorCategory::INVALID_REQUEST,
            "Command arguments must be a JSON object");
    }

    try {
        return it->second(args);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Command '{}' failed: {}", command, e.what()));
        return Result<Json>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
}

std::vector<std::string> CommandDispatcher::command_names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, _] : handlers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

Json CommandDispatcher::envelope(const Result<Json>& result) {
    if (result.is_ok()) {
        return Json{{"ok", true}, {"data", result.value()}};
    }
    return Json{
        {"ok", false},
        {"error", result.error_message()},
        {"category", std::string(error_category_to_string(result.error_category()))}
    };
}

} // namespace dbgate
