#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace ztgate {

// ============================================================================
// Basic Enums
// ============================================================================

// Strictness order for combination: DENY > REVIEW > ALLOW
enum class Decision {
    ALLOW,
    REVIEW,
    DENY
};

enum class CloudProvider {
    AWS,
    AZURE,
    GCP,
    UNKNOWN
};

enum class EventType {
    ACCESS_REQUEST,
    REMEDIATION,
    POLICY_RELOAD
};

// ============================================================================
// Access Request
// ============================================================================

struct AccessRequest {
    std::string user;
    std::string action;             // e.g. "s3:GetObject"
    std::string resource;           // URI-like identifier, e.g. "arn:aws:s3:::bucket"
    std::string source_ip;
    std::string device_id;
    std::chrono::system_clock::time_point request_time;

    AccessRequest() : request_time(std::chrono::system_clock::now()) {}
    AccessRequest(std::string u, std::string a, std::string r,
                  std::string ip, std::string dev,
                  std::chrono::system_clock::time_point t = std::chrono::system_clock::now())
        : user(std::move(u)), action(std::move(a)), resource(std::move(r)),
          source_ip(std::move(ip)), device_id(std::move(dev)), request_time(t) {}
};

// ============================================================================
// Verdicts
// ============================================================================

struct ContextVerdict {
    Decision decision;
    std::string reason;

    ContextVerdict() : decision(Decision::DENY) {}
    ContextVerdict(Decision d, std::string r) : decision(d), reason(std::move(r)) {}
};

struct ActionVerdict {
    Decision decision;
    std::string matched_policy;     // Empty when the default decision applied
    std::string reason;

    ActionVerdict() : decision(Decision::DENY) {}
    ActionVerdict(Decision d, std::string p, std::string r)
        : decision(d), matched_policy(std::move(p)), reason(std::move(r)) {}
};

struct PdpDecision {
    Decision decision = Decision::DENY;
    std::string reason;
    ContextVerdict context;
    ActionVerdict action;
};

struct EnforcementOutcome {
    AccessRequest request;
    Decision decision = Decision::DENY;
    std::string reason;
    std::string cloud;
    std::vector<std::string> remediation_actions;

    bool permitted() const { return decision == Decision::ALLOW; }
};

// ============================================================================
// Runtime Configuration
// ============================================================================

struct ContextConfig {
    std::vector<std::string> trusted_networks;  // "192.168." prefixes or "10.0.0.0/16" CIDRs
    std::vector<std::string> trusted_devices;
    int business_start_hour;                    // inclusive
    int business_end_hour;                      // exclusive

    ContextConfig()
        : trusted_networks{"192.168.", "10.0."},
          trusted_devices{"device-laptop-001", "device-admin-001"},
          business_start_hour(8),
          business_end_hour(20) {}
};

struct MonitoringConfig {
    std::string log_file;
    std::string metrics_file;
    int max_write_attempts;
    std::chrono::milliseconds retry_backoff;
    bool integrity_enabled;
    bool recover_on_start;

    MonitoringConfig()
        : log_file("ztgate_events.jsonl"),
          metrics_file("ztgate_metrics.json"),
          max_write_attempts(3),
          retry_backoff(50),
          integrity_enabled(true),
          recover_on_start(true) {}
};

struct RemediationConfig {
    std::chrono::milliseconds adapter_timeout;
    size_t worker_threads;      // Adapter calls in flight at once
    size_t max_pending;         // Queued calls beyond that are refused

    RemediationConfig()
        : adapter_timeout(2000),
          worker_threads(4),
          max_pending(64) {}
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* decision_to_string(Decision decision) {
    switch (decision) {
        case Decision::ALLOW: return "ALLOW";
        case Decision::REVIEW: return "REVIEW";
        case Decision::DENY: return "DENY";
        default: return "UNKNOWN";
    }
}

inline const char* cloud_to_string(CloudProvider cloud) {
    switch (cloud) {
        case CloudProvider::AWS: return "AWS";
        case CloudProvider::AZURE: return "Azure";
        case CloudProvider::GCP: return "GCP";
        default: return "UNKNOWN";
    }
}

inline const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::ACCESS_REQUEST: return "ACCESS_REQUEST";
        case EventType::REMEDIATION: return "REMEDIATION";
        case EventType::POLICY_RELOAD: return "POLICY_RELOAD";
        default: return "UNKNOWN";
    }
}

std::optional<Decision> parse_decision(std::string_view text);
std::optional<EventType> parse_event_type(std::string_view text);

/// Case-insensitive substring match on "aws" / "azure" / "gcp".
CloudProvider parse_cloud(std::string_view text);

} // namespace ztgate
