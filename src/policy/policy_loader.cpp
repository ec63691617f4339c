#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <unordered_set>

using namespace std::string_literals;

namespace ztgate {

// Constexpr config keys
static constexpr std::string_view kPolicy       = "policy";
static constexpr std::string_view kPolicies     = "policies";
static constexpr std::string_view kActions      = "actions";
static constexpr std::string_view kDecision     = "decision";
static constexpr std::string_view kDescription  = "description";

namespace {

std::string auto_policy_name(size_t index) {
    return std::format("policy-{}", index + 1);
}

std::string read_file(const std::string& path, bool& ok) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ok = false;
        return {};
    }
    ok = true;
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

} // anonymous namespace

// ============================================================================
// Public API - Load from file
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_file(const std::string& path) {
    bool ok = false;
    const std::string buffer = read_file(path, ok);
    if (!ok) {
        return LoadResult::error(std::format("Cannot open policy file: {}", path));
    }

    const std::string ext = utils::to_lower(std::filesystem::path(path).extension().string());
    if (ext == ".json") {
        return load_from_json_string(buffer);
    }
    return load_from_string(buffer);
}

// ============================================================================
// Public API - TOML
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto root = toml::parse(toml_content);
        return load_from_table(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    }
}

PolicyLoader::LoadResult PolicyLoader::load_from_table(const toml::table& root) {
    PolicySet set;

    if (const auto* header = root[kPolicy].as_table()) {
        if (auto v = (*header)["version"].value<std::string>()) {
            set.version = *v;
        } else if (auto n = (*header)["version"].value<int64_t>()) {
            set.version = std::to_string(*n);
        }

        const std::string default_str = (*header)["default_decision"].value_or("deny"s);
        const auto parsed = parse_decision(default_str);
        if (!parsed) {
            return LoadResult::error(
                std::format("Invalid default_decision '{}'", default_str));
        }
        set.default_decision = *parsed;
    }

    const auto* policies_array = root[kPolicies].as_array();
    if (!policies_array) {
        return LoadResult::error("No [[policies]] array found in configuration");
    }

    for (const auto& elem : *policies_array) {
        const auto* node = elem.as_table();
        if (!node) continue;
        const auto& tbl = *node;

        Policy policy;
        policy.name = tbl["name"].value_or(""s);
        if (policy.name.empty()) {
            policy.name = auto_policy_name(set.policies.size());
        }

        const std::string decision_str = tbl[kDecision].value_or(""s);
        const auto decision = parse_decision(decision_str);
        if (!decision) {
            return LoadResult::error(
                std::format("Policy '{}': Invalid decision '{}'", policy.name, decision_str));
        }
        policy.decision = *decision;

        if (const auto* arr = tbl[kActions].as_array()) {
            for (const auto& a : *arr) {
                if (const auto* s = a.as_string(); s && !s->get().empty()) {
                    policy.match_actions.emplace_back(s->get());
                }
            }
        }

        policy.description = tbl[kDescription].value_or(""s);
        set.policies.emplace_back(std::move(policy));
    }

    std::string error_msg;
    if (!validate_policy_set(set, error_msg)) {
        return LoadResult::error(std::move(error_msg));
    }
    return LoadResult::ok(std::move(set));
}

// ============================================================================
// Public API - JSON
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_json_string(const std::string& json_content) {
    using json = nlohmann::json;

    const json doc = json::parse(json_content, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return LoadResult::error("JSON parse error: policy document must be an object");
    }

    PolicySet set;
    try {
        if (const auto it = doc.find("version"); it != doc.end()) {
            set.version = it->is_string() ? it->get<std::string>() : it->dump();
        }

        const std::string default_str = doc.value("default_action", "deny"s);
        const auto parsed = parse_decision(default_str);
        if (!parsed) {
            return LoadResult::error(
                std::format("Invalid default_action '{}'", default_str));
        }
        set.default_decision = *parsed;

        const auto policies_it = doc.find("policies");
        if (policies_it == doc.end() || !policies_it->is_array()) {
            return LoadResult::error("No \"policies\" array found in policy document");
        }

        for (const auto& p : *policies_it) {
            if (!p.is_object()) continue;

            Policy policy;
            policy.name = p.value("name", ""s);
            if (policy.name.empty()) {
                policy.name = auto_policy_name(set.policies.size());
            }

            const std::string decision_str = p.value("decision", ""s);
            const auto decision = parse_decision(decision_str);
            if (!decision) {
                return LoadResult::error(
                    std::format("Policy '{}': Invalid decision '{}'", policy.name, decision_str));
            }
            policy.decision = *decision;

            if (const auto cond = p.find("conditions"); cond != p.end() && cond->is_object()) {
                if (const auto acts = cond->find("action"); acts != cond->end()) {
                    if (acts->is_string()) {
                        policy.match_actions.push_back(acts->get<std::string>());
                    } else if (acts->is_array()) {
                        for (const auto& a : *acts) {
                            if (a.is_string() && !a.get<std::string>().empty()) {
                                policy.match_actions.push_back(a.get<std::string>());
                            }
                        }
                    }
                }
            }

            policy.description = p.value("description", ""s);
            set.policies.emplace_back(std::move(policy));
        }
    } catch (const json::exception& e) {
        return LoadResult::error(std::format("Error parsing policy document: {}", e.what()));
    }

    std::string error_msg;
    if (!validate_policy_set(set, error_msg)) {
        return LoadResult::error(std::move(error_msg));
    }
    return LoadResult::ok(std::move(set));
}

// ============================================================================
// Private Helpers
// ============================================================================

bool PolicyLoader::validate_policy_set(const PolicySet& set, std::string& error_msg) {
    std::unordered_set<std::string> names;
    for (const auto& policy : set.policies) {
        if (policy.match_actions.empty()) {
            error_msg = std::format("Policy '{}': must match at least one action", policy.name);
            return false;
        }
        if (!names.insert(policy.name).second) {
            error_msg = std::format("Duplicate policy name '{}'", policy.name);
            return false;
        }
    }
    return true;
}

} // namespace ztgate
