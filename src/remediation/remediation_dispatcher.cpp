#include "remediation/remediation_dispatcher.hpp"
#include "monitoring/central_monitor.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <optional>

namespace ztgate {

namespace {

std::string failure_description(CloudProvider provider, const std::string& user, const std::string& message) {
    return std::format("{} remediation failed for {}: {}", cloud_to_string(provider), user, message);
}

} // anonymous namespace

// One adapter call handed to the pool. Guarded by its own mutex; the caller
// and the worker both hold a shared_ptr so either side may finish first.
struct RemediationDispatcher::PendingCall {
    std::shared_ptr<ICloudAdapter> adapter;
    EventLogEntry origin;               // Fields copied into a late REMEDIATION event

    std::mutex mutex;
    std::condition_variable done_cv;
    bool started = false;
    bool finished = false;
    bool abandoned = false;             // Caller timed out
    std::optional<std::string> value;
    std::string error;
};

RemediationDispatcher::RemediationDispatcher(CentralMonitor& monitor, const RemediationConfig& config)
    : monitor_(monitor),
      adapter_timeout_(config.adapter_timeout),
      max_pending_(config.max_pending) {
    const size_t count = config.worker_threads > 0 ? config.worker_threads : 1;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

RemediationDispatcher::~RemediationDispatcher() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();   // joins
}

void RemediationDispatcher::register_adapter(std::shared_ptr<ICloudAdapter> adapter) {
    if (!adapter) return;
    const CloudProvider provider = adapter->provider();
    const std::string adapter_name = adapter->name();
    {
        std::unique_lock lock(adapters_mutex_);
        adapters_[provider] = std::move(adapter);
    }
    utils::log::info(std::format("Remediation adapter registered: {} ({})",
                                 adapter_name, cloud_to_string(provider)));
}

size_t RemediationDispatcher::adapter_count() const {
    std::shared_lock lock(adapters_mutex_);
    return adapters_.size();
}

std::shared_ptr<ICloudAdapter> RemediationDispatcher::find_adapter(CloudProvider provider) const {
    std::shared_lock lock(adapters_mutex_);
    const auto it = adapters_.find(provider);
    return it != adapters_.end() ? it->second : nullptr;
}

std::vector<std::string> RemediationDispatcher::remediate(const std::string& user,
                                                          const std::string& resource,
                                                          Decision decision,
                                                          const std::string& reason,
                                                          const std::string& cloud) {
    std::vector<std::string> actions;
    EventLogEntry entry("ARM", EventType::REMEDIATION);
    entry.user = user;
    entry.resource = resource;
    entry.cloud = cloud;
    entry.decision = decision;
    entry.reason = reason;

    switch (decision) {
        case Decision::DENY: {
            const CloudProvider provider = parse_cloud(cloud);
            // Shared pointer copy: the adapter stays alive with no lock held during the call
            auto adapter = find_adapter(provider);
            if (!adapter) {
                entry.details["outcome"] = "no_adapter";
                utils::log::warn(std::format("[ARM] No remediation adapter for cloud '{}'", cloud));
                break;
            }
            entry.details["adapter"] = adapter->name();
            auto revoked = invoke_with_timeout(adapter, entry);
            if (revoked.is_ok()) {
                actions.push_back(std::move(revoked.value()));
                entry.details["outcome"] = "success";
            } else {
                actions.push_back(failure_description(provider, user, revoked.error_message()));
                entry.details["outcome"] = "failed";
                utils::log::warn(std::format("[ARM] {}", actions.back()));
            }
            break;
        }
        case Decision::REVIEW:
            actions.push_back(std::format("Admin review needed for {} on {}: {}",
                                          user, resource, reason));
            entry.details["outcome"] = "review_requested";
            break;
        case Decision::ALLOW:
            utils::log::warn(std::format("[ARM] remediate() called for ALLOW decision ({} on {}), ignoring",
                                         user, resource));
            return actions;
    }

    entry.actions_taken = actions;
    auto recorded = monitor_.record_event(std::move(entry));
    if (recorded.is_error()) {
        utils::log::error(std::format("[ARM] Remediation for {} not recorded: {}",
                                      user, recorded.error_message()));
    }

    utils::log::info(std::format("[ARM] {} remediation for {} on {} ({}): {} action(s)",
                                 decision_to_string(decision), user, resource, cloud, actions.size()));
    return actions;
}

// ============================================================================
// Worker pool
// ============================================================================

Result<std::string> RemediationDispatcher::invoke_with_timeout(
    const std::shared_ptr<ICloudAdapter>& adapter, const EventLogEntry& entry) {
    auto call = std::make_shared<PendingCall>();
    call->adapter = adapter;
    call->origin = entry;

    {
        std::lock_guard lock(queue_mutex_);
        if (queue_.size() >= max_pending_) {
            return Result<std::string>::error(
                ErrorCategory::ADAPTER_FAILURE,
                std::format("remediation queue full ({} pending)", queue_.size()));
        }
        queue_.push_back(call);
    }
    queue_cv_.notify_one();

    std::unique_lock lock(call->mutex);
    if (!call->done_cv.wait_for(lock, adapter_timeout_, [&call] { return call->finished; })) {
        call->abandoned = true;
        return Result<std::string>::error(
            ErrorCategory::ADAPTER_FAILURE,
            call->started
                ? std::format("timed out after {}ms", adapter_timeout_.count())
                : std::format("timed out after {}ms waiting for a worker", adapter_timeout_.count()));
    }
    if (call->value) {
        return Result<std::string>::ok(std::move(*call->value));
    }
    return Result<std::string>::error(ErrorCategory::ADAPTER_FAILURE, call->error);
}

void RemediationDispatcher::worker_loop(std::stop_token stop) {
    while (true) {
        std::shared_ptr<PendingCall> call;
        {
            std::unique_lock lock(queue_mutex_);
            if (!queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                return;
            }
            call = std::move(queue_.front());
            queue_.pop_front();
        }
        run_call(*call);
    }
}

void RemediationDispatcher::run_call(PendingCall& call) {
    {
        std::lock_guard lock(call.mutex);
        if (call.abandoned) return;
        call.started = true;
    }

    std::optional<std::string> value;
    std::string error;
    try {
        value = call.adapter->revoke_access(call.origin.user);
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "unknown adapter error";
    }

    bool late = false;
    {
        std::lock_guard lock(call.mutex);
        call.value = std::move(value);
        call.error = std::move(error);
        call.finished = true;
        late = call.abandoned;
    }
    call.done_cv.notify_all();

    if (late) {
        record_late_result(call);
    }
}

void RemediationDispatcher::record_late_result(const PendingCall& call) {
    const auto& origin = call.origin;
    EventLogEntry entry("ARM", EventType::REMEDIATION);
    entry.user = origin.user;
    entry.resource = origin.resource;
    entry.cloud = origin.cloud;
    entry.decision = origin.decision;
    entry.reason = origin.reason;
    entry.details["adapter"] = call.adapter->name();

    if (call.value) {
        entry.details["outcome"] = "late_success";
        entry.actions_taken.push_back(*call.value);
    } else {
        entry.details["outcome"] = "late_failure";
        entry.actions_taken.push_back(
            failure_description(call.adapter->provider(), origin.user, call.error));
    }

    utils::log::warn(std::format("[ARM] Adapter call for {} finished after timeout: {}",
                                 origin.user, entry.details["outcome"]));
    auto recorded = monitor_.record_event(std::move(entry));
    if (recorded.is_error()) {
        utils::log::error(std::format("[ARM] Late remediation for {} not recorded: {}",
                                      origin.user, recorded.error_message()));
    }
}

} // namespace ztgate
