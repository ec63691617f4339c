#pragma once

#include "core/types.hpp"
#include "security/network_trust.hpp"
#include <string>
#include <unordered_set>

namespace ztgate {

/**
 * @brief Context Evaluator - network / time / device trust signals
 *
 * Check order (first failure short-circuits):
 * 1. Source IP not in a trusted network  → DENY   "untrusted network source"
 * 2. Hour outside [start_hour, end_hour)  → DENY   "outside business hours"
 * 3. Device not in the trusted list       → REVIEW "unrecognized device"
 * 4. Otherwise                            → ALLOW  "context validated"
 *
 * The hour is taken from request.request_time in local time. Stateless after
 * construction; safe for concurrent use.
 */
class ContextEvaluator {
public:
    explicit ContextEvaluator(const ContextConfig& config = ContextConfig{});

    [[nodiscard]] ContextVerdict evaluate(const AccessRequest& request) const;

    /// Half-open window [start_hour, end_hour); a window with start > end wraps midnight
    [[nodiscard]] bool within_business_hours(int hour) const;

    [[nodiscard]] bool is_trusted_device(const std::string& device_id) const {
        return trusted_devices_.contains(device_id);
    }

    [[nodiscard]] bool is_trusted_network(std::string_view ip) const {
        return networks_.is_trusted(ip);
    }

private:
    NetworkTrust networks_;
    std::unordered_set<std::string> trusted_devices_;
    int start_hour_;
    int end_hour_;
};

} // namespace ztgate
