#include "config/config_watcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace ztgate {

namespace {

std::filesystem::file_time_type stat_mtime(const std::string& path) {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        utils::log::warn(std::format("Config watcher: cannot stat {}: {}", path, ec.message()));
        return {};
    }
    return mtime;
}

} // anonymous namespace

ConfigWatcher::ConfigWatcher(std::string config_path, std::string policy_path,
                             std::chrono::seconds poll_interval)
    : config_path_(std::move(config_path)),
      policy_path_(std::move(policy_path)),
      poll_interval_(poll_interval) {
    config_mtime_ = stat_mtime(config_path_);
    if (!policy_path_.empty()) {
        policy_mtime_ = stat_mtime(policy_path_);
    }
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::set_callback(ReloadCallback callback) {
    callback_ = std::move(callback);
}

void ConfigWatcher::set_failure_callback(FailureCallback callback) {
    failure_callback_ = std::move(callback);
}

void ConfigWatcher::start() {
    if (running_.load()) return;
    running_.store(true);
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
    utils::log::info(std::format("Config watcher started: polling {} every {}s",
                                 config_path_, poll_interval_.count()));
}

void ConfigWatcher::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    utils::log::info("Config watcher stopped");
}

bool ConfigWatcher::changed(const std::string& path, std::filesystem::file_time_type& last) const {
    if (path.empty()) return false;

    std::error_code ec;
    const auto current = std::filesystem::last_write_time(path, ec);
    if (ec || current == last) {
        return false;
    }
    last = current;
    utils::log::info(std::format("Config file changed: {}", path));
    return true;
}

bool ConfigWatcher::poll_once() {
    // Evaluate both so each mtime is refreshed
    const bool config_changed = changed(config_path_, config_mtime_);
    const bool policy_changed = changed(policy_path_, policy_mtime_);
    if (!config_changed && !policy_changed) {
        return false;
    }

    auto result = ConfigLoader::load_from_file(config_path_);
    if (!result.success) {
        utils::log::warn(std::format("Config reload failed (keeping last-known-good policies): {}",
                                     result.error_message));
        if (failure_callback_) {
            failure_callback_(result.error_message);
        }
        return false;
    }

    // The policy document may have been moved by the new config
    if (result.config.policy_file != policy_path_) {
        policy_path_ = result.config.policy_file;
        policy_mtime_ = policy_path_.empty() ? std::filesystem::file_time_type{}
                                             : stat_mtime(policy_path_);
    }

    if (callback_) {
        try {
            callback_(result.config);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Config reload callback error: {}", e.what()));
            return false;
        }
    }
    utils::log::info("Config reloaded successfully");
    return true;
}

void ConfigWatcher::watch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in 100ms increments for responsive shutdown
        for (int i = 0; i < poll_interval_.count() * 10 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stop.stop_requested()) break;

        poll_once();
    }
}

} // namespace ztgate
