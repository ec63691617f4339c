#include "monitoring/central_monitor.hpp"
#include "monitoring/event_codec.hpp"
#include "monitoring/file_sink.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace ztgate {

// ============================================================================
// Construction / Destruction
// ============================================================================

CentralMonitor::CentralMonitor(const MonitoringConfig& config)
    : config_(config) {
    // Appending to a log that was not replayed would restart the sequence and the hash chain
    if (config_.recover_on_start && !recover()) {
        throw std::runtime_error(std::format(
            "Event log {} exists but could not be replayed; refusing to append to it",
            config_.log_file));
    }
    sink_ = std::make_unique<FileSink>(config_.log_file);
    utils::log::info(std::format("Central monitoring writing to {}", sink_->name()));
}

CentralMonitor::CentralMonitor(const MonitoringConfig& config, std::unique_ptr<IEventSink> sink)
    : config_(config),
      sink_(std::move(sink)) {}

CentralMonitor::~CentralMonitor() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

Result<uint64_t> CentralMonitor::record_event(EventLogEntry entry) {
    // Hash, log line and metrics all see the same normalized strings
    EventCodec::sanitize(entry);

    AlarmHandler alarm;
    std::string alarm_message;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!sink_) {
            return Result<uint64_t>::error(ErrorCategory::AUDIT_WRITE_FAILURE,
                                           "Event sink is shut down");
        }

        entry.sequence_num = next_sequence_;
        if (config_.integrity_enabled) {
            entry.previous_hash = previous_hash_;
            entry.record_hash = EventCodec::compute_record_hash(entry, previous_hash_);
        }

        std::string line = EventCodec::to_json(entry);
        line += '\n';

        if (append_with_retry(line)) {
            ++next_sequence_;
            if (config_.integrity_enabled) {
                previous_hash_ = entry.record_hash;
            }
            metrics_.apply(entry);
            persist_metrics_locked();
            total_recorded_.fetch_add(1, std::memory_order_relaxed);
            return Result<uint64_t>::ok(entry.sequence_num);
        }

        write_failures_.fetch_add(1, std::memory_order_relaxed);
        alarm = alarm_handler_;
        alarm_message = std::format(
            "Audit write failed after {} attempts on {}: {} event for user '{}' not recorded",
            std::max(1, config_.max_write_attempts), sink_->name(),
            event_type_to_string(entry.event_type), entry.user);
    }

    // Escalate outside the lock so the handler may itself inspect the monitor
    utils::log::error(alarm_message);
    if (alarm) {
        alarm(alarm_message);
    }
    return Result<uint64_t>::error(ErrorCategory::AUDIT_WRITE_FAILURE, alarm_message);
}

MetricsState CentralMonitor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

void CentralMonitor::set_alarm_handler(AlarmHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    alarm_handler_ = std::move(handler);
}

bool CentralMonitor::recover() {
    std::error_code ec;
    if (!std::filesystem::exists(config_.log_file, ec)) {
        return true;  // Fresh deployment, nothing to replay
    }

    if (!std::filesystem::is_regular_file(config_.log_file, ec)) {
        utils::log::error(std::format("{} is not a regular file, cannot recover", config_.log_file));
        return false;
    }

    std::ifstream in(config_.log_file);
    if (!in.is_open()) {
        utils::log::error(std::format("Cannot open {} for recovery", config_.log_file));
        return false;
    }

    MetricsState rebuilt;
    uint64_t next_sequence = 0;
    std::string last_hash;
    size_t skipped = 0;

    std::string line;
    while (std::getline(in, line)) {
        auto entry = EventCodec::from_json(line);
        if (!entry) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) ++skipped;
            continue;
        }
        rebuilt.apply(*entry);
        next_sequence = std::max(next_sequence, entry->sequence_num + 1);
        last_hash = entry->record_hash;
    }
    if (in.bad()) {
        utils::log::error(std::format("Read error while recovering {}", config_.log_file));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_ = std::move(rebuilt);
        next_sequence_ = next_sequence;
        previous_hash_ = std::move(last_hash);
        persist_metrics_locked();
    }

    if (skipped > 0) {
        utils::log::warn(std::format("Recovery skipped {} corrupt lines in {}",
                                     skipped, config_.log_file));
    }
    utils::log::info(std::format("Recovered metrics from {} ({} events)",
                                 config_.log_file, next_sequence));
    return true;
}

MetricsState CentralMonitor::replay_log(const std::string& path, size_t* skipped_lines) {
    MetricsState state;
    size_t skipped = 0;

    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (auto entry = EventCodec::from_json(line)) {
            state.apply(*entry);
        } else if (line.find_first_not_of(" \t\r") != std::string::npos) {
            ++skipped;
        }
    }

    if (skipped_lines) *skipped_lines = skipped;
    return state;
}

bool CentralMonitor::verify_chain(const std::string& path, std::string* error_out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error_out) *error_out = std::format("Cannot open {}", path);
        return false;
    }

    std::string expected_prev;
    size_t line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        auto entry = EventCodec::from_json(line);
        if (!entry) {
            if (error_out) *error_out = std::format("Line {}: unparsable entry", line_no);
            return false;
        }
        if (entry->previous_hash != expected_prev) {
            if (error_out) *error_out = std::format("Line {}: previous_hash does not link", line_no);
            return false;
        }
        const std::string recomputed = EventCodec::compute_record_hash(*entry, expected_prev);
        if (recomputed != entry->record_hash) {
            if (error_out) *error_out = std::format("Line {}: record_hash mismatch", line_no);
            return false;
        }
        expected_prev = entry->record_hash;
    }
    return true;
}

void CentralMonitor::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) sink_->flush();
}

void CentralMonitor::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_->flush();
        sink_->shutdown();
        sink_.reset();
    }
}

CentralMonitor::Stats CentralMonitor::get_stats() const {
    return Stats{
        .total_recorded = total_recorded_.load(std::memory_order_relaxed),
        .write_retries = write_retries_.load(std::memory_order_relaxed),
        .write_failures = write_failures_.load(std::memory_order_relaxed),
        .metrics_persist_failures = metrics_persist_failures_.load(std::memory_order_relaxed)
    };
}

// ============================================================================
// Private Helpers (called with mutex_ held)
// ============================================================================

bool CentralMonitor::append_with_retry(const std::string& line) {
    const int attempts = std::max(1, config_.max_write_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (sink_->write(line)) {
            return true;
        }
        if (attempt < attempts) {
            write_retries_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Event append to {} failed (attempt {}/{}), retrying",
                                         sink_->name(), attempt, attempts));
            std::this_thread::sleep_for(config_.retry_backoff * attempt);
        }
    }
    return false;
}

void CentralMonitor::persist_metrics_locked() {
    if (config_.metrics_file.empty()) return;

    const std::string tmp_path = config_.metrics_file + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            metrics_persist_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Cannot write metrics file {}", tmp_path));
            return;
        }
        out << metrics_.to_json().dump(2) << '\n';
        if (!out.good()) {
            metrics_persist_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Short write to metrics file {}", tmp_path));
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, config_.metrics_file, ec);
    if (ec) {
        metrics_persist_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Cannot publish metrics file {}: {}",
                                     config_.metrics_file, ec.message()));
    }
}

} // namespace ztgate
