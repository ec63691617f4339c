#include "enforcement/policy_enforcement_point.hpp"
#include "enforcement/cloud_classifier.hpp"
#include "monitoring/central_monitor.hpp"
#include "monitoring/event_codec.hpp"
#include "policy/policy_decision_point.hpp"
#include "remediation/remediation_dispatcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace ztgate {

PolicyEnforcementPoint::PolicyEnforcementPoint(const PolicyDecisionPoint& pdp,
                                               RemediationDispatcher& arm,
                                               CentralMonitor& monitor)
    : pdp_(pdp), arm_(arm), monitor_(monitor) {}

std::string PolicyEnforcementPoint::validate(const AccessRequest& request) {
    if (utils::trim(request.user).empty())      return "user";
    if (utils::trim(request.action).empty())    return "action";
    if (utils::trim(request.resource).empty())  return "resource";
    if (utils::trim(request.source_ip).empty()) return "source_ip";
    if (utils::trim(request.device_id).empty()) return "device_id";
    return "";
}

std::string PolicyEnforcementPoint::validate_encoding(const AccessRequest& request) {
    if (!EventCodec::is_valid_utf8(request.user))      return "user";
    if (!EventCodec::is_valid_utf8(request.action))    return "action";
    if (!EventCodec::is_valid_utf8(request.resource))  return "resource";
    if (!EventCodec::is_valid_utf8(request.source_ip)) return "source_ip";
    if (!EventCodec::is_valid_utf8(request.device_id)) return "device_id";
    return "";
}

const char* PolicyEnforcementPoint::enforcement_label(Decision decision) {
    switch (decision) {
        case Decision::ALLOW: return "permitted";
        case Decision::REVIEW: return "pending_review";
        case Decision::DENY: return "blocked";
        default: return "blocked";
    }
}

Result<EnforcementOutcome> PolicyEnforcementPoint::enforce(const AccessRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    // 1. Reject malformed requests before they reach the PDP
    if (const std::string missing = validate(request); !missing.empty()) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("[PEP] Rejected malformed request: missing '{}'", missing));
        return Result<EnforcementOutcome>::error(
            ErrorCategory::MALFORMED_REQUEST,
            std::format("Missing required field: {}", missing));
    }
    if (const std::string invalid = validate_encoding(request); !invalid.empty()) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("[PEP] Rejected malformed request: '{}' is not valid UTF-8", invalid));
        return Result<EnforcementOutcome>::error(
            ErrorCategory::MALFORMED_REQUEST,
            std::format("Field is not valid UTF-8: {}", invalid));
    }

    // 2. Decide
    const PdpDecision pdp = pdp_.decide(request);

    EnforcementOutcome outcome;
    outcome.request = request;
    outcome.decision = pdp.decision;
    outcome.reason = pdp.reason;
    outcome.cloud = CloudClassifier::classify_name(request.resource);

    // 3. Enforce
    switch (outcome.decision) {
        case Decision::ALLOW:
            permitted_.fetch_add(1, std::memory_order_relaxed);
            utils::log::info(std::format("[PEP] Access granted: {} {} on {}",
                                         request.user, request.action, request.resource));
            break;
        case Decision::REVIEW:
            pending_review_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("[PEP] Pending review: {} {} on {} ({})",
                                         request.user, request.action, request.resource,
                                         outcome.reason));
            break;
        case Decision::DENY:
            blocked_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("[PEP] Access blocked: {} {} on {} ({})",
                                         request.user, request.action, request.resource,
                                         outcome.reason));
            break;
    }

    // 4. Remediate (the decision above is already final)
    if (outcome.decision != Decision::ALLOW) {
        outcome.remediation_actions = arm_.remediate(
            request.user, request.resource, outcome.decision, outcome.reason, outcome.cloud);
    }

    // 5. Audit
    EventLogEntry entry("PEP", EventType::ACCESS_REQUEST);
    entry.timestamp = request.request_time;
    entry.user = request.user;
    entry.resource = request.resource;
    entry.cloud = outcome.cloud;
    entry.decision = outcome.decision;
    entry.reason = outcome.reason;
    entry.actions_taken = outcome.remediation_actions;
    entry.details = {
        {"action", request.action},
        {"source_ip", request.source_ip},
        {"device_id", request.device_id},
        {"context_decision", decision_to_string(pdp.context.decision)},
        {"context_reason", pdp.context.reason},
        {"action_decision", decision_to_string(pdp.action.decision)},
        {"action_reason", pdp.action.reason},
        {"matched_policy", pdp.action.matched_policy},
        {"enforcement", enforcement_label(outcome.decision)},
    };

    auto recorded = monitor_.record_event(std::move(entry));
    if (recorded.is_error()) {
        // Decision stands; the alarm has already been raised by the monitor
        audit_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("[PEP] Access decision for {} not audited: {}",
                                      request.user, recorded.error_message()));
    }

    return Result<EnforcementOutcome>::ok(std::move(outcome));
}

PolicyEnforcementPoint::Stats PolicyEnforcementPoint::get_stats() const {
    return Stats{
        .total_requests = total_requests_.load(std::memory_order_relaxed),
        .permitted = permitted_.load(std::memory_order_relaxed),
        .blocked = blocked_.load(std::memory_order_relaxed),
        .pending_review = pending_review_.load(std::memory_order_relaxed),
        .malformed = malformed_.load(std::memory_order_relaxed),
        .audit_failures = audit_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace ztgate
