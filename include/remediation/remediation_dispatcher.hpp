#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "monitoring/event_log_entry.hpp"
#include "remediation/icloud_adapter.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ztgate {

class CentralMonitor;

/**
 * @brief Auto-Remediation dispatcher
 *
 * DENY   → revoke_access(user) on the adapter registered for the cloud
 * REVIEW → no adapter; a single "Admin review needed ..." action
 * ALLOW  → not expected (caller contract); nothing is done
 *
 * The cloud string is mapped to a CloudProvider by parse_cloud(); a cloud
 * without a registered adapter produces no action. Adapter calls run on a
 * fixed pool of worker_threads owned by the dispatcher and are awaited for at
 * most adapter_timeout, with no lock held. Exceptions, timeouts and a full
 * queue become "... remediation failed ..." descriptions and never propagate.
 * Each call appends one REMEDIATION event to Central Monitoring; a call that
 * finishes after its caller timed out appends a second one with outcome
 * late_success or late_failure. A queued call whose caller already gave up is
 * never started.
 *
 * The destructor stops the pool and joins the workers, waiting for any
 * adapter call already in progress.
 */
class RemediationDispatcher {
public:
    RemediationDispatcher(CentralMonitor& monitor, const RemediationConfig& config = RemediationConfig{});
    ~RemediationDispatcher();

    RemediationDispatcher(const RemediationDispatcher&) = delete;
    RemediationDispatcher& operator=(const RemediationDispatcher&) = delete;

    /// Register (or replace) the adapter for adapter->provider()
    void register_adapter(std::shared_ptr<ICloudAdapter> adapter);

    /**
     * @brief Dispatch remediation for a non-ALLOW decision
     * @return Action descriptions, in the order they were produced
     */
    std::vector<std::string> remediate(const std::string& user,
                                       const std::string& resource,
                                       Decision decision,
                                       const std::string& reason,
                                       const std::string& cloud);

    [[nodiscard]] size_t adapter_count() const;

    [[nodiscard]] std::chrono::milliseconds adapter_timeout() const { return adapter_timeout_; }

    [[nodiscard]] size_t worker_count() const { return workers_.size(); }

private:
    struct PendingCall;

    [[nodiscard]] std::shared_ptr<ICloudAdapter> find_adapter(CloudProvider provider) const;

    /// Runs revoke_access on the pool; ADAPTER_FAILURE on exception, timeout or full queue
    [[nodiscard]] Result<std::string> invoke_with_timeout(const std::shared_ptr<ICloudAdapter>& adapter,
                                                          const EventLogEntry& entry);

    void worker_loop(std::stop_token stop);
    void run_call(PendingCall& call);
    void record_late_result(const PendingCall& call);

    CentralMonitor& monitor_;
    std::chrono::milliseconds adapter_timeout_;
    size_t max_pending_;

    mutable std::shared_mutex adapters_mutex_;
    std::unordered_map<CloudProvider, std::shared_ptr<ICloudAdapter>> adapters_;

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<std::shared_ptr<PendingCall>> queue_;

    // Last member: stopped and joined before the queue is destroyed
    std::vector<std::jthread> workers_;
};

} // namespace ztgate
