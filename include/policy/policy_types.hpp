#pragma once

#include "core/types.hpp"

namespace ztgate {

// ============================================================================
// Policy Types
// ============================================================================

struct Policy {
    std::string name;
    std::vector<std::string> match_actions;  // "s3:GetObject", "*", or prefix wildcard "s3:*"
    Decision decision;
    std::string description;                 // Reported as the reason when this policy matches

    Policy() : decision(Decision::DENY) {}
    Policy(std::string n, std::vector<std::string> actions, Decision d, std::string desc = "")
        : name(std::move(n)), match_actions(std::move(actions)),
          decision(d), description(std::move(desc)) {}
};

/**
 * Ordered action policies plus the fallback decision. First match wins.
 * Instances are immutable once published to the PolicyStore.
 */
struct PolicySet {
    std::string version;
    std::vector<Policy> policies;
    Decision default_decision;

    PolicySet() : version("0"), default_decision(Decision::DENY) {}
};

} // namespace ztgate
