#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace dbgate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads dbgate.toml
 *
 * Supports ${ENV_VAR} expansion in string values and an `include` key
 * (string or array of paths, relative to the including file) whose tables
 * are merged underneath the including file. Every key has a default.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check value ranges and cross-field constraints
     * @return One message per problem; empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static GatewayConfig extract_gateway(const toml::table& root);
    static TunnelConfig extract_tunnel(const toml::table& root);

    static AppConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace dbgate
