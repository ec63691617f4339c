#pragma once

#include "monitoring/event_log_entry.hpp"
#include "monitoring/event_sink.hpp"
#include "monitoring/metrics_state.hpp"
#include "core/error.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ztgate {

/**
 * @brief Central Monitoring - durable event log + aggregate metrics
 *
 * record_event() is the single serialization point of the gateway. Inside one
 * critical section it:
 *   1. assigns the sequence number and hash-chain link,
 *   2. appends the JSON line to the sink (bounded retries with backoff),
 *   3. folds the entry into MetricsState,
 *   4. persists the metrics side file (write temp + rename).
 * A snapshot taken under the same mutex therefore always equals the replay of
 * some prefix of the log. The log is the source of truth; if the process dies
 * between steps 2 and 4, recover() rebuilds the metrics by replaying it.
 *
 * When every append attempt fails the alarm handler fires (process-level
 * escalation) and AUDIT_WRITE_FAILURE is returned; metrics are left untouched
 * for the unwritten entry.
 */
class CentralMonitor {
public:
    using AlarmHandler = std::function<void(const std::string& message)>;

    /// Opens a FileSink on config.log_file; replays it first when recover_on_start is set.
    /// Throws std::runtime_error if an existing log cannot be replayed.
    explicit CentralMonitor(const MonitoringConfig& config);

    /// Custom sink (tests, alternative stores). No automatic recovery.
    CentralMonitor(const MonitoringConfig& config, std::unique_ptr<IEventSink> sink);

    ~CentralMonitor();

    // Non-copyable, non-movable (owns the sink and the lock)
    CentralMonitor(const CentralMonitor&) = delete;
    CentralMonitor& operator=(const CentralMonitor&) = delete;
    CentralMonitor(CentralMonitor&&) = delete;
    CentralMonitor& operator=(CentralMonitor&&) = delete;

    /**
     * @brief Append an event and update metrics
     * @return Assigned sequence number, or AUDIT_WRITE_FAILURE
     */
    [[nodiscard]] Result<uint64_t> record_event(EventLogEntry entry);

    /// Deep copy of the current metrics
    [[nodiscard]] MetricsState snapshot() const;

    void set_alarm_handler(AlarmHandler handler);

    /**
     * @brief Rebuild metrics, sequence and hash chain from config.log_file
     * @return false if the log could not be read (state unchanged)
     */
    bool recover();

    /**
     * @brief Replay an event log from empty state
     * @param skipped_lines Receives the number of corrupt lines ignored
     */
    [[nodiscard]] static MetricsState replay_log(const std::string& path,
                                                 size_t* skipped_lines = nullptr);

    /**
     * @brief Verify the hash chain of an event log
     * @param error_out Receives a description of the first broken link
     */
    [[nodiscard]] static bool verify_chain(const std::string& path,
                                           std::string* error_out = nullptr);

    void flush();
    void shutdown();

    struct Stats {
        uint64_t total_recorded;            ///< Entries durably appended
        uint64_t write_retries;             ///< Append attempts beyond the first
        uint64_t write_failures;            ///< Entries lost after all retries
        uint64_t metrics_persist_failures;  ///< Metrics side-file writes that failed
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const MonitoringConfig& config() const { return config_; }

private:
    bool append_with_retry(const std::string& line);
    void persist_metrics_locked();

    MonitoringConfig config_;
    std::unique_ptr<IEventSink> sink_;

    // -- Guarded by mutex_ --
    mutable std::mutex mutex_;
    MetricsState metrics_;
    uint64_t next_sequence_ = 0;
    std::string previous_hash_;
    AlarmHandler alarm_handler_;

    // -- Stats --
    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> write_retries_{0};
    std::atomic<uint64_t> write_failures_{0};
    std::atomic<uint64_t> metrics_persist_failures_{0};
};

} // namespace ztgate
