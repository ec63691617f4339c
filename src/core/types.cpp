#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace ztgate {

std::optional<Decision> parse_decision(std::string_view text) {
    const std::string lower = utils::to_lower(text);

    static const std::unordered_map<std::string, Decision> lookup = {
        {"allow",  Decision::ALLOW},
        {"review", Decision::REVIEW},
        {"deny",   Decision::DENY},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<EventType> parse_event_type(std::string_view text) {
    static const std::unordered_map<std::string_view, EventType> lookup = {
        {"ACCESS_REQUEST", EventType::ACCESS_REQUEST},
        {"REMEDIATION",    EventType::REMEDIATION},
        {"POLICY_RELOAD",  EventType::POLICY_RELOAD},
    };

    const auto it = lookup.find(text);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

CloudProvider parse_cloud(std::string_view text) {
    const std::string lower = utils::to_lower(text);
    if (lower.find("aws") != std::string::npos)   return CloudProvider::AWS;
    if (lower.find("azure") != std::string::npos) return CloudProvider::AZURE;
    if (lower.find("gcp") != std::string::npos)   return CloudProvider::GCP;
    return CloudProvider::UNKNOWN;
}

} // namespace ztgate
