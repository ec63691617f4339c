#include "monitoring/event_codec.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <format>

namespace ztgate {

// ============================================================================
// JSON Serialization: section builders
// ============================================================================

namespace {

int64_t to_epoch_ms(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

void append_string_field(std::string& out, std::string_view key, std::string_view value) {
    out += std::format("\"{}\":\"{}\",", key, utils::escape_json(value));
}

void append_event_tracking(std::string& out, const EventLogEntry& e) {
    out += std::format("\"event_id\":\"{}\",\"sequence_num\":{},", e.event_id, e.sequence_num);
    out += std::format("\"timestamp\":\"{}\",\"timestamp_ms\":{},",
                       utils::format_timestamp(e.timestamp), to_epoch_ms(e.timestamp));
    append_string_field(out, "module", e.module);
    out += std::format("\"event_type\":\"{}\",", event_type_to_string(e.event_type));
}

void append_subject(std::string& out, const EventLogEntry& e) {
    append_string_field(out, "user", e.user);
    append_string_field(out, "resource", e.resource);
    append_string_field(out, "cloud", e.cloud);
}

void append_decision(std::string& out, const EventLogEntry& e) {
    if (e.decision) {
        out += std::format("\"decision\":\"{}\",", decision_to_string(*e.decision));
    } else {
        out += "\"decision\":null,";
    }
    if (e.reason) {
        append_string_field(out, "reason", *e.reason);
    } else {
        out += "\"reason\":null,";
    }
}

void append_actions(std::string& out, const EventLogEntry& e) {
    out += "\"actions_taken\":[";
    for (size_t i = 0; i < e.actions_taken.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(e.actions_taken[i]));
    }
    out += "],";
}

void append_details(std::string& out, const EventLogEntry& e) {
    out += "\"details\":{";
    bool first = true;
    for (const auto& [key, value] : e.details) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":\"{}\"", utils::escape_json(key), utils::escape_json(value));
    }
    out += "},";
}

void append_integrity(std::string& out, const EventLogEntry& e) {
    out += std::format("\"record_hash\":\"{}\",\"previous_hash\":\"{}\"",
                       e.record_hash, e.previous_hash);
}

std::string string_or_empty(const nlohmann::json& obj, const char* key) {
    const auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string{};
}

} // anonymous namespace

std::string EventCodec::to_json(const EventLogEntry& entry) {
    std::string result;
    result.reserve(512);
    result += '{';
    append_event_tracking(result, entry);
    append_subject(result, entry);
    append_decision(result, entry);
    append_actions(result, entry);
    append_details(result, entry);
    append_integrity(result, entry);
    result += '}';
    return result;
}

// ============================================================================
// Parsing (log replay)
// ============================================================================

std::optional<EventLogEntry> EventCodec::from_json(std::string_view line) {
    using json = nlohmann::json;

    if (line.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return std::nullopt;
    }

    const json obj = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (obj.is_discarded() || !obj.is_object()) {
        return std::nullopt;
    }

    const auto type = parse_event_type(string_or_empty(obj, "event_type"));
    if (!type) {
        return std::nullopt;
    }

    EventLogEntry entry;
    entry.event_type = *type;
    entry.event_id = string_or_empty(obj, "event_id");
    entry.module = string_or_empty(obj, "module");
    entry.user = string_or_empty(obj, "user");
    entry.resource = string_or_empty(obj, "resource");
    entry.cloud = string_or_empty(obj, "cloud");
    entry.record_hash = string_or_empty(obj, "record_hash");
    entry.previous_hash = string_or_empty(obj, "previous_hash");

    if (const auto it = obj.find("sequence_num"); it != obj.end() && it->is_number_unsigned()) {
        entry.sequence_num = it->get<uint64_t>();
    }
    if (const auto it = obj.find("timestamp_ms"); it != obj.end() && it->is_number_integer()) {
        entry.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(it->get<int64_t>()));
    }
    if (const auto it = obj.find("decision"); it != obj.end() && it->is_string()) {
        entry.decision = parse_decision(it->get<std::string>());
    }
    if (const auto it = obj.find("reason"); it != obj.end() && it->is_string()) {
        entry.reason = it->get<std::string>();
    }
    if (const auto it = obj.find("actions_taken"); it != obj.end() && it->is_array()) {
        for (const auto& a : *it) {
            if (a.is_string()) entry.actions_taken.push_back(a.get<std::string>());
        }
    }
    if (const auto it = obj.find("details"); it != obj.end() && it->is_object()) {
        for (const auto& [key, value] : it->items()) {
            entry.details[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return entry;
}

// ============================================================================
// UTF-8 normalization
// ============================================================================

std::string EventCodec::to_valid_utf8(std::string_view text) {
    using json = nlohmann::json;
    // dump() with the replace handler substitutes U+FFFD for invalid bytes
    const std::string quoted = json(std::string(text)).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(quoted).get<std::string>();
}

bool EventCodec::is_valid_utf8(std::string_view text) {
    return to_valid_utf8(text) == text;
}

void EventCodec::sanitize(EventLogEntry& entry) {
    entry.module = to_valid_utf8(entry.module);
    entry.user = to_valid_utf8(entry.user);
    entry.resource = to_valid_utf8(entry.resource);
    entry.cloud = to_valid_utf8(entry.cloud);
    if (entry.reason) {
        entry.reason = to_valid_utf8(*entry.reason);
    }
    for (auto& action : entry.actions_taken) {
        action = to_valid_utf8(action);
    }
    std::map<std::string, std::string> details;
    for (const auto& [key, value] : entry.details) {
        details[to_valid_utf8(key)] = to_valid_utf8(value);
    }
    entry.details = std::move(details);
}

// ============================================================================
// Hash Chain
// ============================================================================

std::string EventCodec::compute_record_hash(const EventLogEntry& entry,
                                            const std::string& prev_hash) {
    // Hash: event_id|sequence_num|timestamp_ms|module|event_type|user|resource|cloud|decision|reason|actions|details|previous_hash
    std::string input;
    input.reserve(256);
    input += std::format("{}|{}|{}|", entry.event_id, entry.sequence_num, to_epoch_ms(entry.timestamp));
    input += entry.module;
    input += '|';
    input += event_type_to_string(entry.event_type);
    input += '|';
    input += entry.user;
    input += '|';
    input += entry.resource;
    input += '|';
    input += entry.cloud;
    input += '|';
    input += entry.decision ? decision_to_string(*entry.decision) : "";
    input += '|';
    input += entry.reason.value_or("");
    input += '|';
    for (const auto& action : entry.actions_taken) {
        input += action;
        input += '\x1f';
    }
    input += '|';
    for (const auto& [key, value] : entry.details) {
        input += key;
        input += '=';
        input += value;
        input += '\x1f';
    }
    input += '|';
    input += prev_hash;

    // SHA-256 via OpenSSL EVP
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace ztgate
