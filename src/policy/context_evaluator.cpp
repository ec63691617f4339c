#include "policy/context_evaluator.hpp"
#include "policy/policy_constants.hpp"
#include "core/utils.hpp"

namespace ztgate {

ContextEvaluator::ContextEvaluator(const ContextConfig& config)
    : networks_(config.trusted_networks),
      trusted_devices_(config.trusted_devices.begin(), config.trusted_devices.end()),
      start_hour_(config.business_start_hour),
      end_hour_(config.business_end_hour) {}

ContextVerdict ContextEvaluator::evaluate(const AccessRequest& request) const {
    if (!networks_.is_trusted(request.source_ip)) {
        return {Decision::DENY, std::string(policy::kUntrustedNetwork)};
    }
    if (!within_business_hours(utils::local_hour(request.request_time))) {
        return {Decision::DENY, std::string(policy::kOutsideBusinessHours)};
    }
    if (!is_trusted_device(request.device_id)) {
        return {Decision::REVIEW, std::string(policy::kUnrecognizedDevice)};
    }
    return {Decision::ALLOW, std::string(policy::kContextValidated)};
}

bool ContextEvaluator::within_business_hours(int hour) const {
    if (start_hour_ <= end_hour_) {
        return hour >= start_hour_ && hour < end_hour_;
    }
    return hour >= start_hour_ || hour < end_hour_;
}

} // namespace ztgate
