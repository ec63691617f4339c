#include "core/gateway.hpp"
#include "core/utils.hpp"
#include "enforcement/policy_enforcement_point.hpp"
#include "monitoring/central_monitor.hpp"
#include "policy/context_evaluator.hpp"
#include "policy/policy_decision_point.hpp"
#include "policy/policy_store.hpp"
#include "remediation/remediation_dispatcher.hpp"
#include "remediation/stub_cloud_adapters.hpp"

#include <format>

namespace ztgate {

Gateway::Gateway(const GatewayConfig& config, std::unique_ptr<IEventSink> sink)
    : store_(std::make_unique<PolicyStore>(config.policy_set)),
      pdp_(std::make_unique<PolicyDecisionPoint>(*store_, ContextEvaluator(config.context))),
      monitor_(sink ? std::make_unique<CentralMonitor>(config.monitoring, std::move(sink))
                    : std::make_unique<CentralMonitor>(config.monitoring)),
      arm_(std::make_unique<RemediationDispatcher>(*monitor_, config.remediation)),
      pep_(std::make_unique<PolicyEnforcementPoint>(*pdp_, *arm_, *monitor_)) {
    for (auto& adapter : make_stub_adapters()) {
        arm_->register_adapter(std::move(adapter));
    }
    utils::log::info(std::format("Gateway ready: policy set v{} ({} policies, default {})",
                                 config.policy_set.version, config.policy_set.policies.size(),
                                 decision_to_string(config.policy_set.default_decision)));
}

Gateway::~Gateway() = default;

Result<EnforcementOutcome> Gateway::enforce(const AccessRequest& request) {
    return pep_->enforce(request);
}

void Gateway::register_adapter(std::shared_ptr<ICloudAdapter> adapter) {
    arm_->register_adapter(std::move(adapter));
}

void Gateway::reload_policies(PolicySet set, const std::string& source) {
    const std::string detail = std::format("v{} ({} policies)", set.version, set.policies.size());
    store_->publish(std::move(set));
    utils::log::info(std::format("Policies reloaded from {}: {}", source, detail));
    record_reload(source, true, detail);
}

void Gateway::reject_reload(const std::string& source, const std::string& error) {
    record_reload(source, false, error);
}

bool Gateway::reload_from_config(const std::string& config_path, std::string* error_out) {
    auto result = ConfigLoader::load_from_file(config_path);
    if (!result.success) {
        utils::log::warn(std::format("Policy reload rejected (keeping v{}): {}",
                                     store_->version(), result.error_message));
        record_reload(config_path, false, result.error_message);
        if (error_out) *error_out = result.error_message;
        return false;
    }
    const std::string source = result.config.policy_file.empty() ? config_path
                                                                 : result.config.policy_file;
    reload_policies(std::move(result.config.policy_set), source);
    return true;
}

void Gateway::record_reload(const std::string& source, bool accepted, const std::string& detail) {
    EventLogEntry entry("PolicyStore", EventType::POLICY_RELOAD);
    entry.resource = source;
    entry.reason = detail;
    entry.details = {
        {"outcome", accepted ? "accepted" : "rejected"},
        {"active_version", store_->version()},
        {"generation", std::to_string(store_->generation())},
    };

    auto recorded = monitor_->record_event(std::move(entry));
    if (recorded.is_error()) {
        utils::log::error(std::format("Policy reload not audited: {}", recorded.error_message()));
    }
}

} // namespace ztgate
