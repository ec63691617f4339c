#pragma once

#include "core/types.hpp"
#include "policy/context_evaluator.hpp"
#include "policy/policy_store.hpp"
#include <string_view>

namespace ztgate {

/**
 * @brief Policy Decision Point - combines context and action verdicts
 *
 * Action evaluation: the request action is compared case-insensitively with
 * each policy's match_actions in order; first matching policy wins. An entry
 * matches when it equals the action, is "*", or is a prefix wildcard
 * ("s3:*") whose prefix starts the action. No match → the set's default.
 *
 * Combination (deny-overrides, fail-closed):
 *   context \ action | ALLOW  | REVIEW | DENY
 *   -----------------+--------+--------+-----
 *   ALLOW            | ALLOW  | DENY   | DENY
 *   REVIEW           | REVIEW | DENY   | DENY
 *   DENY             | DENY   | DENY   | DENY
 *
 * The reported reason is the context reason when the final decision equals
 * the context decision, otherwise the action reason.
 *
 * Thread-safety: decide() reads only an immutable PolicySet snapshot.
 */
class PolicyDecisionPoint {
public:
    PolicyDecisionPoint(const PolicyStore& store, ContextEvaluator context);

    /// Evaluate against the store's current snapshot
    [[nodiscard]] PdpDecision decide(const AccessRequest& request) const;

    /// Evaluate against an explicit policy set
    [[nodiscard]] PdpDecision decide(const AccessRequest& request,
                                     const PolicySet& policy_set) const;

    [[nodiscard]] static ActionVerdict evaluate_action(const AccessRequest& request,
                                                       const PolicySet& policy_set);

    [[nodiscard]] static Decision combine(Decision context, Decision action);

    [[nodiscard]] static PdpDecision resolve(const ContextVerdict& context,
                                             const ActionVerdict& action);

    /// pattern is matched case-insensitively; action_lower must already be lower-case
    [[nodiscard]] static bool action_matches(std::string_view pattern,
                                             std::string_view action_lower);

    [[nodiscard]] const ContextEvaluator& context_evaluator() const { return context_; }

private:
    const PolicyStore& store_;
    ContextEvaluator context_;
};

} // namespace ztgate
