#include "policy/policy_decision_point.hpp"
#include "policy/policy_constants.hpp"
#include "core/utils.hpp"

namespace ztgate {

PolicyDecisionPoint::PolicyDecisionPoint(const PolicyStore& store, ContextEvaluator context)
    : store_(store), context_(std::move(context)) {}

PdpDecision PolicyDecisionPoint::decide(const AccessRequest& request) const {
    // RCU read: the snapshot stays alive for the whole evaluation
    const auto snapshot = store_.current();
    return decide(request, *snapshot);
}

PdpDecision PolicyDecisionPoint::decide(const AccessRequest& request,
                                        const PolicySet& policy_set) const {
    const ContextVerdict context = context_.evaluate(request);
    const ActionVerdict action = evaluate_action(request, policy_set);
    return resolve(context, action);
}

ActionVerdict PolicyDecisionPoint::evaluate_action(const AccessRequest& request,
                                                   const PolicySet& policy_set) {
    const std::string action = utils::to_lower(request.action);

    for (const auto& policy : policy_set.policies) {
        for (const auto& pattern : policy.match_actions) {
            if (action_matches(pattern, action)) {
                return ActionVerdict(
                    policy.decision,
                    policy.name,
                    policy.description.empty() ? policy.name : policy.description);
            }
        }
    }

    return ActionVerdict(policy_set.default_decision, "",
                         std::string(policy::kNoMatchingPolicy));
}

bool PolicyDecisionPoint::action_matches(std::string_view pattern, std::string_view action_lower) {
    if (pattern == policy::kWildcard) {
        return true;
    }
    const std::string lowered = utils::to_lower(pattern);
    if (lowered.size() > 1 && lowered.back() == '*') {
        return action_lower.starts_with(std::string_view(lowered).substr(0, lowered.size() - 1));
    }
    return lowered == action_lower;
}

Decision PolicyDecisionPoint::combine(Decision context, Decision action) {
    if (context == Decision::DENY || action == Decision::DENY) {
        return Decision::DENY;
    }
    if (context == Decision::REVIEW && action == Decision::ALLOW) {
        return Decision::REVIEW;
    }
    if (context == Decision::ALLOW && action == Decision::ALLOW) {
        return Decision::ALLOW;
    }
    // Fail closed (e.g. context ALLOW + action REVIEW)
    return Decision::DENY;
}

PdpDecision PolicyDecisionPoint::resolve(const ContextVerdict& context,
                                         const ActionVerdict& action) {
    PdpDecision result;
    result.decision = combine(context.decision, action.decision);
    result.reason = (result.decision == context.decision) ? context.reason : action.reason;
    result.context = context;
    result.action = action;
    return result;
}

} // namespace ztgate
