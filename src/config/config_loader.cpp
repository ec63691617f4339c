#include "config/config_loader.hpp"
#include "policy/policy_loader.hpp"
#include "security/network_trust.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace ztgate {

// ============================================================================
// TOML helpers: ${ENV} expansion, include = [...] merging
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/// Substitutes every ${NAME} with the environment value (unset -> empty)
std::string expand_env_vars(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    for (size_t open = input.find("${"); open != std::string_view::npos;
         open = input.find("${", pos)) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed ${{...}} in config value at offset {}", open));
        }
        out.append(input.substr(pos, open - pos));
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    out.append(input.substr(pos));
    return out;
}

void expand_env_in_node(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = expand_env_vars(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_env_in_node(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_in_node(child);
    }
}

/**
 * @brief Overlay `top` onto `base`
 *
 * Sub-tables merge key by key. Arrays of tables ([[policies]]) are appended
 * so an included file can contribute rules; any other value from `top`
 * replaces the base value.
 */
void overlay_table(toml::table& base, const toml::table& top) {
    for (auto&& [key, value] : top) {
        auto* base_node = base.get(key);
        if (base_node && base_node->is_table() && value.is_table()) {
            overlay_table(*base_node->as_table(), *value.as_table());
            continue;
        }
        if (base_node && base_node->is_array_of_tables() && value.is_array_of_tables()) {
            for (const auto& elem : *value.as_array()) {
                base_node->as_array()->push_back(elem);
            }
            continue;
        }
        base.insert_or_assign(key, value);
    }
}

std::vector<std::string> include_list(const toml::table& root) {
    std::vector<std::string> files;
    const auto node = root["include"];
    if (const auto* single = node.as_string()) {
        files.push_back(single->get());
    } else if (const auto* many = node.as_array()) {
        for (const auto& item : *many) {
            if (const auto* s = item.as_string()) files.push_back(s->get());
        }
    }
    return files;
}

/// Replaces root with (includes merged in order) overlaid by root itself
void apply_includes(toml::table& root, const std::filesystem::path& dir,
                    std::unordered_set<std::string>& seen, int depth) {
    const auto files = include_list(root);
    root.erase("include");
    if (files.empty()) return;
    if (depth >= kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config includes nested deeper than {}", kMaxIncludeDepth));
    }

    toml::table merged;
    for (const auto& file : files) {
        const auto path = std::filesystem::canonical(dir / file);
        if (!seen.insert(path.string()).second) {
            throw std::runtime_error(std::format("Config include cycle at {}", path.string()));
        }
        auto included = toml::parse_file(path.string());
        apply_includes(included, path.parent_path(), seen, depth + 1);
        overlay_table(merged, included);
    }
    overlay_table(merged, root);
    root = std::move(merged);
}

toml::table parse_toml_string(const std::string& content) {
    auto root = toml::parse(content);
    expand_env_in_node(root);
    return root;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto root = toml::parse_file(file_path);

    std::unordered_set<std::string> seen{fs::canonical(file_path).string()};
    fs::path dir = fs::path(file_path).parent_path();
    apply_includes(root, dir.empty() ? fs::path(".") : dir, seen, 0);

    expand_env_in_node(root);
    return root;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    const int64_t port = s["port"].value_or(int64_t{8080});
    cfg.port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;
    cfg.thread_pool_size = static_cast<size_t>(s["threads"].value_or(4));
    cfg.admin_token = s["admin_token"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ContextConfig ConfigLoader::extract_context(const toml::table& root) {
    ContextConfig cfg;
    const auto* context = root["context"].as_table();
    if (!context) return cfg;
    const auto& c = *context;

    if (c["trusted_networks"].is_array()) {
        cfg.trusted_networks = toml_string_array(c, "trusted_networks");
    }
    if (c["trusted_devices"].is_array()) {
        cfg.trusted_devices = toml_string_array(c, "trusted_devices");
    }
    cfg.business_start_hour = c["business_start_hour"].value_or(cfg.business_start_hour);
    cfg.business_end_hour = c["business_end_hour"].value_or(cfg.business_end_hour);
    return cfg;
}

MonitoringConfig ConfigLoader::extract_monitoring(const toml::table& root) {
    MonitoringConfig cfg;
    const auto* monitoring = root["monitoring"].as_table();
    if (!monitoring) return cfg;
    const auto& m = *monitoring;

    cfg.log_file = m["log_file"].value_or(cfg.log_file);
    cfg.metrics_file = m["metrics_file"].value_or(cfg.metrics_file);
    cfg.max_write_attempts = m["max_write_attempts"].value_or(cfg.max_write_attempts);
    cfg.retry_backoff = std::chrono::milliseconds(
        m["retry_backoff_ms"].value_or(static_cast<int64_t>(cfg.retry_backoff.count())));
    cfg.integrity_enabled = m["integrity"].value_or(cfg.integrity_enabled);
    cfg.recover_on_start = m["recover_on_start"].value_or(cfg.recover_on_start);
    return cfg;
}

RemediationConfig ConfigLoader::extract_remediation(const toml::table& root) {
    RemediationConfig cfg;
    const auto* remediation = root["remediation"].as_table();
    if (!remediation) return cfg;

    cfg.adapter_timeout = std::chrono::milliseconds(
        (*remediation)["adapter_timeout_ms"].value_or(
            static_cast<int64_t>(cfg.adapter_timeout.count())));
    // Negative counts clamp to 0 and are rejected by validate_config
    const int64_t workers = (*remediation)["worker_threads"].value_or(
        static_cast<int64_t>(cfg.worker_threads));
    cfg.worker_threads = static_cast<size_t>(std::max<int64_t>(workers, 0));
    const int64_t pending = (*remediation)["max_pending"].value_or(
        static_cast<int64_t>(cfg.max_pending));
    cfg.max_pending = static_cast<size_t>(std::max<int64_t>(pending, 0));
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* cw = root["config_watcher"].as_table();
    if (!cw) return cfg;

    cfg.enabled = (*cw)["enabled"].value_or(false);
    cfg.poll_interval_seconds = (*cw)["poll_interval_seconds"].value_or(5);
    return cfg;
}

ConfigLoader::LoadResult ConfigLoader::extract_all_sections(const toml::table& root,
                                                            const std::string& base_dir) {
    GatewayConfig config;
    config.server = extract_server(root);
    config.logging = extract_logging(root);
    config.context = extract_context(root);
    config.monitoring = extract_monitoring(root);
    config.remediation = extract_remediation(root);
    config.config_watcher = extract_config_watcher(root);

    // Policies: external document first, inline [[policies]] otherwise
    std::string policy_file;
    if (const auto* header = root["policy"].as_table()) {
        policy_file = (*header)["file"].value_or(""s);
    }

    if (!policy_file.empty()) {
        namespace fs = std::filesystem;
        fs::path path(policy_file);
        if (path.is_relative()) {
            path = fs::path(base_dir) / path;
        }
        config.policy_file = path.lexically_normal().string();

        auto policies = PolicyLoader::load_from_file(config.policy_file);
        if (!policies.success) {
            return LoadResult::error(std::format("Policy file {}: {}",
                                                 config.policy_file, policies.error_message));
        }
        config.policy_set = std::move(policies.policy_set);
    } else {
        auto policies = PolicyLoader::load_from_table(root);
        if (!policies.success) {
            return LoadResult::error(std::format("Policies: {}", policies.error_message));
        }
        config.policy_set = std::move(policies.policy_set);
    }

    return validate_and_return(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        const std::string base_dir = std::filesystem::path(config_path).parent_path().string();
        return extract_all_sections(tbl, base_dir.empty() ? "." : base_dir);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content,
                                                        const std::string& base_dir) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_all_sections(tbl, base_dir);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535");
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    const auto& ctx = config.context;
    if (ctx.business_start_hour < 0 || ctx.business_start_hour > 23) {
        errors.push_back(std::format("context.business_start_hour must be 0-23, got {}",
                                     ctx.business_start_hour));
    }
    if (ctx.business_end_hour < 0 || ctx.business_end_hour > 24) {
        errors.push_back(std::format("context.business_end_hour must be 0-24, got {}",
                                     ctx.business_end_hour));
    }
    for (const auto& network : ctx.trusted_networks) {
        if (network.empty()) {
            errors.push_back("context.trusted_networks must not contain empty entries");
        } else if (network.find('/') != std::string::npos) {
            NetworkTrust::CidrRange range;
            if (!NetworkTrust::parse_cidr(network, range)) {
                errors.push_back(std::format("context.trusted_networks: invalid CIDR '{}'", network));
            }
        }
    }

    if (config.monitoring.log_file.empty()) {
        errors.push_back("monitoring.log_file must not be empty");
    }
    if (config.monitoring.max_write_attempts <= 0) {
        errors.push_back("monitoring.max_write_attempts must be > 0");
    }
    if (config.monitoring.retry_backoff.count() < 0) {
        errors.push_back("monitoring.retry_backoff_ms must be >= 0");
    }

    if (config.remediation.adapter_timeout.count() <= 0) {
        errors.push_back("remediation.adapter_timeout_ms must be > 0");
    }
    if (config.remediation.worker_threads == 0) {
        errors.push_back("remediation.worker_threads must be > 0");
    }
    if (config.remediation.max_pending == 0) {
        errors.push_back("remediation.max_pending must be > 0");
    }

    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds <= 0) {
        errors.push_back("config_watcher.poll_interval_seconds must be > 0");
    }

    if (!utils::log::is_valid_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace ztgate
