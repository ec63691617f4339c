#pragma once

#include "monitoring/event_log_entry.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace ztgate {

/**
 * @brief Aggregate counters derived from the event log
 *
 * decision_counts only counts ACCESS_REQUEST events, so the sum of
 * decision_counts always equals total_access_requests. A value type:
 * copies are fully independent.
 */
struct MetricsState {
    uint64_t total_access_requests = 0;
    uint64_t total_remediations = 0;
    std::map<std::string, uint64_t> decision_counts;   // "ALLOW" / "DENY" / "REVIEW"
    std::map<std::string, uint64_t> per_cloud;         // "AWS" / "Azure" / "GCP" / ...
    std::map<std::string, uint64_t> events_by_type;

    MetricsState();

    /// Fold one event into the counters
    void apply(const EventLogEntry& entry);

    [[nodiscard]] uint64_t decision_total() const;

    [[nodiscard]] uint64_t decision_count(Decision d) const {
        const auto it = decision_counts.find(decision_to_string(d));
        return it != decision_counts.end() ? it->second : 0;
    }

    [[nodiscard]] nlohmann::json to_json() const;
    [[nodiscard]] static MetricsState from_json(const nlohmann::json& j);

    bool operator==(const MetricsState&) const = default;
};

} // namespace ztgate
