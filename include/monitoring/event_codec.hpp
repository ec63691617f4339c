#pragma once

#include "monitoring/event_log_entry.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace ztgate {

/**
 * @brief JSON Lines encoding of EventLogEntry
 *
 * One object per line:
 *   {"event_id":..,"sequence_num":..,"timestamp":"<ISO-8601>","timestamp_ms":..,
 *    "module":..,"event_type":..,"user":..,"resource":..,"cloud":..,
 *    "decision":..|null,"reason":..|null,"actions_taken":[..],"details":{..},
 *    "record_hash":..,"previous_hash":..}
 *
 * Encoding is hand-formatted; decoding (log replay) uses nlohmann::json.
 * Strings must be valid UTF-8 for a line to parse back, so entries pass
 * through sanitize() before they are hashed and written.
 */
class EventCodec {
public:
    /// Serialize without trailing newline
    [[nodiscard]] static std::string to_json(const EventLogEntry& entry);

    /// Parse one log line; std::nullopt for blank or corrupt lines
    [[nodiscard]] static std::optional<EventLogEntry> from_json(std::string_view line);

    /// Invalid UTF-8 sequences replaced with U+FFFD; valid input is returned unchanged
    [[nodiscard]] static std::string to_valid_utf8(std::string_view text);

    [[nodiscard]] static bool is_valid_utf8(std::string_view text);

    /// Applies to_valid_utf8 to every string field of the entry
    static void sanitize(EventLogEntry& entry);

    /// SHA-256 over the entry's content fields chained with prev_hash (hex, 64 chars)
    [[nodiscard]] static std::string compute_record_hash(const EventLogEntry& entry,
                                                         const std::string& prev_hash);
};

} // namespace ztgate
