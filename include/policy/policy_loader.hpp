#pragma once

#include "policy/policy_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace ztgate {

/**
 * @brief Policy loader for TOML configuration and JSON policy documents
 *
 * TOML layout:
 *   [policy]
 *   version = "2024.1"
 *   default_decision = "deny"
 *
 *   [[policies]]
 *   name = "object-read"
 *   actions = ["s3:GetObject", "s3:ListBucket"]
 *   decision = "allow"
 *   description = "Read access to object storage"
 *
 * JSON layout:
 *   {"version": "...", "default_action": "deny",
 *    "policies": [{"name": "...", "conditions": {"action": [...]},
 *                  "decision": "allow", "description": "..."}]}
 *
 * Validates:
 * - Decision values (ALLOW/DENY/REVIEW, case-insensitive)
 * - Every policy matches at least one action
 * - Unique policy names
 */
class PolicyLoader {
public:
    /**
     * @brief Load result
     */
    struct LoadResult {
        bool success;
        std::string error_message;
        PolicySet policy_set;

        static LoadResult ok(PolicySet set) {
            LoadResult result;
            result.success = true;
            result.policy_set = std::move(set);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load a policy document from disk
     * @param path ".json" files are parsed as JSON documents, anything else as TOML
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& path);

    /// Parse TOML content containing [policy] and [[policies]]
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Parse a JSON policy document
    [[nodiscard]] static LoadResult load_from_json_string(const std::string& json_content);

    /// Extract policies from an already-parsed TOML root table
    [[nodiscard]] static LoadResult load_from_table(const toml::table& root);

private:
    static bool validate_policy_set(const PolicySet& set, std::string& error_msg);
};

} // namespace ztgate
