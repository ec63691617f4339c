#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace ztgate {

class PolicyDecisionPoint;
class RemediationDispatcher;
class CentralMonitor;

/**
 * @brief Policy Enforcement Point - the request orchestrator
 *
 * enforce():
 *   validate → PDP.decide → classify → derive cloud →
 *   ARM.remediate (DENY / REVIEW only) → one ACCESS_REQUEST event
 *
 * ALLOW permits the request. DENY blocks it. REVIEW blocks it pending manual
 * inspection; it is recorded as "pending_review" rather than "blocked".
 *
 * A malformed request (any required field empty) is rejected with
 * MALFORMED_REQUEST before reaching the PDP and is not logged as an access
 * decision. Remediation and monitoring failures are logged and never change
 * the returned outcome.
 */
class PolicyEnforcementPoint {
public:
    PolicyEnforcementPoint(const PolicyDecisionPoint& pdp,
                           RemediationDispatcher& arm,
                           CentralMonitor& monitor);

    [[nodiscard]] Result<EnforcementOutcome> enforce(const AccessRequest& request);

    /// Empty string if the request is well-formed, otherwise the first missing field
    [[nodiscard]] static std::string validate(const AccessRequest& request);

    /// Empty string if every field is valid UTF-8, otherwise the first field that is not
    [[nodiscard]] static std::string validate_encoding(const AccessRequest& request);

    /// "permitted", "blocked" or "pending_review"
    [[nodiscard]] static const char* enforcement_label(Decision decision);

    struct Stats {
        uint64_t total_requests;
        uint64_t permitted;
        uint64_t blocked;
        uint64_t pending_review;
        uint64_t malformed;
        uint64_t audit_failures;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    const PolicyDecisionPoint& pdp_;
    RemediationDispatcher& arm_;
    CentralMonitor& monitor_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> permitted_{0};
    std::atomic<uint64_t> blocked_{0};
    std::atomic<uint64_t> pending_review_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> audit_failures_{0};
};

} // namespace ztgate
