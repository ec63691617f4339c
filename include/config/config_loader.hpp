#pragma once

#include "core/types.hpp"
#include "policy/policy_types.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace ztgate {

// ============================================================================
// Server / Logging / Watcher Config (mirrors TOML hierarchy)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_pool_size = 4;
    std::string admin_token;            // Bearer token for /admin/*; empty = no auth
};

struct LoggingConfig {
    std::string level = "info";
};

struct ConfigWatcherConfig {
    bool enabled = false;
    int poll_interval_seconds = 5;
};

// ============================================================================
// GatewayConfig - Complete parsed configuration
// ============================================================================

struct GatewayConfig {
    ServerConfig server;
    LoggingConfig logging;
    ContextConfig context;
    PolicySet policy_set;
    std::string policy_file;            // Resolved path; empty when policies are inline
    MonitoringConfig monitoring;
    RemediationConfig remediation;
    ConfigWatcherConfig config_watcher;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads ztgate.toml
 *
 * Sections: [server] [logging] [context] [policy] [[policies]] [monitoring]
 * [remediation] [config_watcher]. Strings may reference ${ENV_VAR}; a
 * top-level include = "other.toml" (or an array) is merged underneath the
 * including file, which wins on conflicts.
 *
 * Policies come from [policy] file = "..." (TOML or JSON, relative to the
 * config file) when set, otherwise from inline [[policies]]. A configuration
 * without any policy source is rejected: the gateway never serves requests
 * without a policy set.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
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

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to ztgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @param base_dir Directory used to resolve a relative [policy] file
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content,
                                                     const std::string& base_dir = ".");

    /// Validation errors for an already-extracted config (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ContextConfig extract_context(const toml::table& root);
    static MonitoringConfig extract_monitoring(const toml::table& root);
    static RemediationConfig extract_remediation(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);

    static LoadResult extract_all_sections(const toml::table& root, const std::string& base_dir);
    static LoadResult validate_and_return(GatewayConfig config);
};

} // namespace ztgate
