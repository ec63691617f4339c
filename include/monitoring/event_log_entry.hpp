#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include <map>

namespace ztgate {

// ============================================================================
// Event Log Entry
// ============================================================================

struct EventLogEntry {
    std::string event_id;               // UUID
    uint64_t sequence_num;              // Monotonic counter for gap detection
    std::chrono::system_clock::time_point timestamp;

    std::string module;                 // "PEP", "ARM", "PolicyStore"
    EventType event_type;

    std::string user;
    std::string resource;
    std::string cloud;

    std::optional<Decision> decision;
    std::optional<std::string> reason;
    std::vector<std::string> actions_taken;
    std::map<std::string, std::string> details;   // Ordered for stable serialization

    // Integrity (hash chain)
    std::string record_hash;            // SHA-256 of this record's content
    std::string previous_hash;          // Hash of previous record (chain link)

    EventLogEntry()
        : event_id(utils::generate_uuid()),
          sequence_num(0),
          timestamp(std::chrono::system_clock::now()),
          event_type(EventType::ACCESS_REQUEST) {}

    EventLogEntry(std::string mod, EventType type)
        : EventLogEntry() {
        module = std::move(mod);
        event_type = type;
    }
};

} // namespace ztgate
