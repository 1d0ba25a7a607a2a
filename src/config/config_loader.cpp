#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <vector>

using namespace std::string_literals;

namespace dbgate {

namespace {

constexpr int kMaxIncludeDepth = 8;

// "${NAME}" becomes the value of NAME; unset variables become empty
std::string substitute_env(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t open = text.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(std::format("Unterminated ${{...}} in '{}'", text));
        }
        const std::string name(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

void substitute_env_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = substitute_env(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) {
            substitute_env_in(child);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) {
            substitute_env_in(child);
        }
    }
}

// Tables merge key by key; anything else in `top` replaces `base`
void overlay(toml::table& base, const toml::table& top) {
    for (auto&& [key, value] : top) {
        auto* base_tbl = base[key].as_table();
        if (base_tbl && value.is_table()) {
            overlay(*base_tbl, *value.as_table());
        } else {
            base.insert_or_assign(key, value);
        }
    }
}

std::vector<std::string> include_paths(const toml::table& root) {
    std::vector<std::string> paths;
    const auto node = root["include"];
    if (const auto* one = node.as_string()) {
        paths.push_back(one->get());
    } else if (const auto* many = node.as_array()) {
        for (const auto& item : *many) {
            if (const auto* s = item.as_string()) {
                paths.push_back(s->get());
            }
        }
    }
    return paths;
}

/**
 * @brief Load path and fold its includes underneath it
 *
 * Included files are read first and the including file is laid over them,
 * so the including file wins on conflicts. `chain` holds the files being
 * loaded and detects cycles.
 */
toml::table load_with_includes(const std::filesystem::path& path,
                               std::vector<std::filesystem::path>& chain) {
    namespace fs = std::filesystem;

    if (chain.size() > kMaxIncludeDepth) {
        throw std::runtime_error(std::format("Config includes nested deeper than {}", kMaxIncludeDepth));
    }
    const fs::path canonical = fs::canonical(path);
    if (std::find(chain.begin(), chain.end(), canonical) != chain.end()) {
        throw std::runtime_error(std::format("Config include cycle at {}", canonical.string()));
    }

    toml::table own = toml::parse_file(canonical.string());
    const auto paths = include_paths(own);
    if (paths.empty()) {
        return own;
    }
    own.erase("include");

    chain.push_back(canonical);
    toml::table merged;
    for (const auto& rel : paths) {
        overlay(merged, load_with_includes(canonical.parent_path() / rel, chain));
    }
    chain.pop_back();

    overlay(merged, own);
    return merged;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("127.0.0.1"s);
    cfg.port = static_cast<uint16_t>(s["port"].value_or(7420));
    cfg.thread_pool_size = static_cast<size_t>(s["threads"].value_or(4));
    cfg.max_body_bytes = static_cast<size_t>(s["max_body_bytes"].value_or(16 * 1024 * 1024));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

GatewayConfig ConfigLoader::extract_gateway(const toml::table& root) {
    GatewayConfig cfg;
    const auto* gateway = root["gateway"].as_table();
    if (!gateway) return cfg;
    const auto& g = *gateway;

    cfg.connect_timeout = std::chrono::milliseconds(g["connect_timeout_ms"].value_or(5000));
    cfg.pool_min_connections = static_cast<size_t>(g["pool_min_connections"].value_or(1));
    cfg.pool_max_connections = static_cast<size_t>(g["pool_max_connections"].value_or(5));
    cfg.pool_acquire_timeout = std::chrono::milliseconds(g["pool_acquire_timeout_ms"].value_or(5000));
    cfg.pool_idle_timeout = std::chrono::milliseconds(g["pool_idle_timeout_ms"].value_or(300000));
    cfg.pool_max_lifetime = std::chrono::seconds(g["pool_max_lifetime_s"].value_or(3600));
    cfg.redis_reply_timeout = std::chrono::milliseconds(g["redis_reply_timeout_ms"].value_or(30000));
    return cfg;
}

TunnelConfig ConfigLoader::extract_tunnel(const toml::table& root) {
    TunnelConfig cfg;
    const auto* tunnel = root["tunnel"].as_table();
    if (!tunnel) return cfg;

    cfg.handshake_timeout = std::chrono::milliseconds((*tunnel)["handshake_timeout_ms"].value_or(5000));
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.gateway = extract_gateway(tbl);
    config.tunnel = extract_tunnel(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        std::vector<std::filesystem::path> chain;
        auto tbl = load_with_includes(config_path, chain);
        substitute_env_in(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        substitute_env_in(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.host.empty()) {
        errors.push_back("server.host must not be empty");
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    static constexpr std::string_view kLevels[] = {"debug", "info", "warn", "warning", "error"};
    const std::string level = utils::to_lower(config.logging.level);
    if (std::find(std::begin(kLevels), std::end(kLevels), level) == std::end(kLevels)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    const auto& gw = config.gateway;
    if (gw.connect_timeout.count() <= 0) {
        errors.push_back("gateway.connect_timeout_ms must be > 0");
    }
    if (gw.pool_max_connections == 0) {
        errors.push_back("gateway.pool_max_connections must be > 0");
    }
    if (gw.pool_min_connections > gw.pool_max_connections) {
        errors.push_back(std::format(
            "gateway.pool_min_connections ({}) > pool_max_connections ({})",
            gw.pool_min_connections, gw.pool_max_connections));
    }
    if (gw.pool_acquire_timeout.count() <= 0) {
        errors.push_back("gateway.pool_acquire_timeout_ms must be > 0");
    }
    if (gw.redis_reply_timeout.count() <= 0) {
        errors.push_back("gateway.redis_reply_timeout_ms must be > 0");
    }

    if (config.tunnel.handshake_timeout.count() <= 0) {
        errors.push_back("tunnel.handshake_timeout_ms must be > 0");
    }

    return errors;
}

} // namespace dbgate
