#pragma once

#include "config/config_loader.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace ztgate {

/**
 * @brief Background watcher for ztgate.toml and the policy document it names
 *
 * Polls the modification time of the config file and, when set, the external
 * policy file. On a change the whole configuration is re-parsed through
 * ConfigLoader; only a configuration that loads and validates is handed to
 * the reload callback. A failed reload is logged and the running policy set
 * stays active.
 *
 * The callback runs on the watcher thread; the PolicyStore swap it performs
 * is RCU, so request threads are never blocked.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const GatewayConfig& new_config)>;
    using FailureCallback = std::function<void(const std::string& error)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::string policy_path = "",
        std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);
    void set_failure_callback(FailureCallback callback);

    void start();
    void stop();

    /**
     * @brief Run a single poll on the calling thread
     * @return true if a change was detected and reloaded successfully
     */
    bool poll_once();

    [[nodiscard]] bool is_running() const { return running_.load(); }

private:
    void watch_loop(std::stop_token stop);
    bool changed(const std::string& path, std::filesystem::file_time_type& last) const;

    std::string config_path_;
    std::string policy_path_;
    std::chrono::seconds poll_interval_;
    ReloadCallback callback_;
    FailureCallback failure_callback_;

    std::filesystem::file_time_type config_mtime_{};
    std::filesystem::file_time_type policy_mtime_{};
    std::atomic<bool> running_{false};
    std::jthread watch_thread_;
};

} // namespace ztgate
