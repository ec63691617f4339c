#include "core/gateway.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "monitoring/central_monitor.hpp"
#include "server/access_server.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ztgate;

// Global instances for signal handling
std::shared_ptr<AccessServer> g_server;
std::shared_ptr<ConfigWatcher> g_config_watcher;

namespace {

constexpr const char* kDefaultConfig = "config/ztgate.toml";

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_config_watcher) {
        g_config_watcher->stop();
    }
    if (g_server) {
        g_server->stop();
    }
}

void print_usage() {
    std::cerr <<
        "Usage: ztgate [--config <file>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  serve                                             Run the HTTP access server\n"
        "  enforce <user> <action> <resource> <ip> <device>  Evaluate and enforce one request\n"
        "  metrics                                           Print metrics rebuilt from the event log\n"
        "  replay [log_file]                                 Replay an event log from empty state\n"
        "  verify [log_file]                                 Verify the event log hash chain\n";
}

GatewayConfig load_config_or_exit(const std::string& config_file) {
    auto result = ConfigLoader::load_from_file(config_file);
    if (!result.success) {
        utils::log::error(std::format("{}: {}", error_category_to_string(ErrorCategory::CONFIG_ERROR),
                                      result.error_message));
        std::exit(1);
    }
    utils::log::set_level(result.config.logging.level);
    return std::move(result.config);
}

// ============================================================================
// Commands
// ============================================================================

int run_serve(const std::string& config_file) {
    const GatewayConfig config = load_config_or_exit(config_file);

    auto gateway = std::make_shared<Gateway>(config);
    gateway->monitor().set_alarm_handler([](const std::string& message) {
        utils::log::error(std::format("AUDIT ALARM: {}", message));
    });

    if (config.config_watcher.enabled) {
        g_config_watcher = std::make_shared<ConfigWatcher>(
            config_file, config.policy_file,
            std::chrono::seconds{config.config_watcher.poll_interval_seconds});

        g_config_watcher->set_callback([gateway](const GatewayConfig& new_cfg) {
            const std::string source = new_cfg.policy_file.empty() ? "config" : new_cfg.policy_file;
            gateway->reload_policies(new_cfg.policy_set, source);
        });
        g_config_watcher->set_failure_callback([gateway, config_file](const std::string& error) {
            gateway->reject_reload(config_file, error);
        });
        g_config_watcher->start();
    } else {
        utils::log::info("Config watcher: disabled");
    }

    g_server = std::make_shared<AccessServer>(
        gateway, config_file,
        config.server.host, config.server.port,
        config.server.thread_pool_size, config.server.admin_token);

    // Blocks until a signal stops the server
    g_server->start();

    if (g_config_watcher) {
        g_config_watcher->stop();
    }
    gateway->monitor().shutdown();
    return 0;
}

int run_enforce(const std::string& config_file, const std::vector<std::string>& args) {
    if (args.size() != 5) {
        print_usage();
        return 1;
    }
    const GatewayConfig config = load_config_or_exit(config_file);
    Gateway gateway(config);

    const AccessRequest request(args[0], args[1], args[2], args[3], args[4]);
    auto result = gateway.enforce(request);
    if (result.is_error()) {
        utils::log::error(std::format("{}: {}", error_category_to_string(result.error_category()),
                                      result.error_message()));
        return 1;
    }

    const auto& outcome = result.value();
    std::cout << AccessServer::outcome_to_json(outcome).dump(2) << std::endl;
    return 0;
}

int run_metrics(const std::string& config_file) {
    const GatewayConfig config = load_config_or_exit(config_file);
    size_t skipped = 0;
    const MetricsState state = CentralMonitor::replay_log(config.monitoring.log_file, &skipped);
    if (skipped > 0) {
        utils::log::warn(std::format("Skipped {} unreadable lines in {}",
                                     skipped, config.monitoring.log_file));
    }
    std::cout << state.to_json().dump(2) << std::endl;
    return 0;
}

int run_replay(const std::string& log_file) {
    size_t skipped = 0;
    const MetricsState state = CentralMonitor::replay_log(log_file, &skipped);
    nlohmann::json out = state.to_json();
    out["skipped_lines"] = skipped;
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int run_verify(const std::string& log_file) {
    std::string error;
    if (!CentralMonitor::verify_chain(log_file, &error)) {
        utils::log::error(std::format("Hash chain broken in {}: {}", log_file, error));
        return 2;
    }
    utils::log::info(std::format("Hash chain intact: {}", log_file));
    return 0;
}

std::string log_file_arg(const std::vector<std::string>& args, const std::string& config_file) {
    if (!args.empty()) {
        return args[0];
    }
    return load_config_or_exit(config_file).monitoring.log_file;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = kDefaultConfig;
        std::string command;
        std::vector<std::string> args;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                config_file = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (command.empty()) {
                command = arg;
            } else {
                args.push_back(arg);
            }
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (command.empty() || command == "serve") {
            return run_serve(config_file);
        }
        if (command == "enforce") {
            return run_enforce(config_file, args);
        }
        if (command == "metrics") {
            return run_metrics(config_file);
        }
        if (command == "replay") {
            return run_replay(log_file_arg(args, config_file));
        }
        if (command == "verify") {
            return run_verify(log_file_arg(args, config_file));
        }

        utils::log::error(std::format("Unknown command: {}", command));
        print_usage();
        return 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
