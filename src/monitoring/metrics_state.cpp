#include "monitoring/metrics_state.hpp"

#include <nlohmann/json.hpp>

namespace ztgate {

namespace {

void read_counter_map(const nlohmann::json& j, const char* key,
                      std::map<std::string, uint64_t>& out) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return;
    for (const auto& [name, value] : it->items()) {
        if (value.is_number_unsigned()) {
            out[name] = value.get<uint64_t>();
        }
    }
}

uint64_t read_counter(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    return (it != j.end() && it->is_number_unsigned()) ? it->get<uint64_t>() : 0;
}

} // anonymous namespace

MetricsState::MetricsState()
    : decision_counts{{"ALLOW", 0}, {"DENY", 0}, {"REVIEW", 0}},
      per_cloud{{"AWS", 0}, {"Azure", 0}, {"GCP", 0}} {}

void MetricsState::apply(const EventLogEntry& entry) {
    switch (entry.event_type) {
        case EventType::ACCESS_REQUEST:
            ++total_access_requests;
            if (entry.decision) {
                ++decision_counts[decision_to_string(*entry.decision)];
            }
            break;
        case EventType::REMEDIATION:
            ++total_remediations;
            break;
        default:
            break;
    }

    if (!entry.cloud.empty()) {
        ++per_cloud[entry.cloud];
    }
    ++events_by_type[event_type_to_string(entry.event_type)];
}

uint64_t MetricsState::decision_total() const {
    uint64_t total = 0;
    for (const auto& [name, count] : decision_counts) {
        total += count;
    }
    return total;
}

nlohmann::json MetricsState::to_json() const {
    return nlohmann::json{
        {"total_access_requests", total_access_requests},
        {"total_remediations", total_remediations},
        {"decision_counts", decision_counts},
        {"per_cloud", per_cloud},
        {"events_by_type", events_by_type},
    };
}

MetricsState MetricsState::from_json(const nlohmann::json& j) {
    MetricsState state;
    if (!j.is_object()) return state;
    state.total_access_requests = read_counter(j, "total_access_requests");
    state.total_remediations = read_counter(j, "total_remediations");
    read_counter_map(j, "decision_counts", state.decision_counts);
    read_counter_map(j, "per_cloud", state.per_cloud);
    read_counter_map(j, "events_by_type", state.events_by_type);
    return state;
}

} // namespace ztgate
