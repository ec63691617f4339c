#include <catch2/catch_test_macros.hpp>
#include "policy/policy_loader.hpp"
#include "test_helpers.hpp"

using namespace ztgate;

TEST_CASE("PolicyLoader: TOML policies", "[policy][loader]") {
    SECTION("full policy set") {
        auto result = PolicyLoader::load_from_string(R"(
            [policy]
            version = "2024.1"
            default_decision = "review"

            [[policies]]
            name = "object-read"
            actions = ["s3:GetObject", "s3:ListBucket"]
            decision = "allow"
            description = "Read access to object storage"

            [[policies]]
            name = "iam"
            actions = ["iam:*"]
            decision = "REVIEW"
        )");

        REQUIRE(result.success);
        const auto& set = result.policy_set;
        CHECK(set.version == "2024.1");
        CHECK(set.default_decision == Decision::REVIEW);
        REQUIRE(set.policies.size() == 2);
        CHECK(set.policies[0].name == "object-read");
        CHECK(set.policies[0].match_actions.size() == 2);
        CHECK(set.policies[0].decision == Decision::ALLOW);
        CHECK(set.policies[0].description == "Read access to object storage");
        CHECK(set.policies[1].decision == Decision::REVIEW);
        CHECK(set.policies[1].description.empty());
    }

    SECTION("default decision is DENY when [policy] is absent") {
        auto result = PolicyLoader::load_from_string(R"(
            [[policies]]
            actions = ["*"]
            decision = "allow"
        )");
        REQUIRE(result.success);
        CHECK(result.policy_set.default_decision == Decision::DENY);
        CHECK(result.policy_set.policies[0].name == "policy-1");
    }

    SECTION("invalid decision is rejected") {
        auto result = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "bad"
            actions = ["s3:GetObject"]
            decision = "maybe"
        )");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("bad") != std::string::npos);
    }

    SECTION("policy without actions is rejected") {
        auto result = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "empty"
            decision = "allow"
        )");
        CHECK_FALSE(result.success);
    }

    SECTION("duplicate names are rejected") {
        auto result = PolicyLoader::load_from_string(R"(
            [[policies]]
            name = "dup"
            actions = ["a"]
            decision = "allow"

            [[policies]]
            name = "dup"
            actions = ["b"]
            decision = "deny"
        )");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Duplicate") != std::string::npos);
    }

    SECTION("missing [[policies]] is a config error") {
        auto result = PolicyLoader::load_from_string(R"(
            [policy]
            default_decision = "deny"
        )");
        CHECK_FALSE(result.success);
    }

    SECTION("syntax error is reported") {
        auto result = PolicyLoader::load_from_string("[[policies]\nname = ");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("TOML parse error") != std::string::npos);
    }
}

TEST_CASE("PolicyLoader: JSON policy document", "[policy][loader]") {
    SECTION("document with conditions") {
        auto result = PolicyLoader::load_from_json_string(R"({
            "version": "7",
            "default_action": "deny",
            "policies": [
                {"name": "read", "conditions": {"action": ["s3:GetObject"]},
                 "decision": "allow", "description": "Read objects"},
                {"name": "single", "conditions": {"action": "ec2:*"}, "decision": "review"}
            ]
        })");
        REQUIRE(result.success);
        CHECK(result.policy_set.version == "7");
        REQUIRE(result.policy_set.policies.size() == 2);
        CHECK(result.policy_set.policies[0].match_actions == std::vector<std::string>{"s3:GetObject"});
        CHECK(result.policy_set.policies[1].match_actions == std::vector<std::string>{"ec2:*"});
        CHECK(result.policy_set.policies[1].decision == Decision::REVIEW);
    }

    SECTION("numeric version is kept as text") {
        auto result = PolicyLoader::load_from_json_string(R"({
            "version": 3,
            "policies": [{"name": "p", "conditions": {"action": ["*"]}, "decision": "allow"}]
        })");
        REQUIRE(result.success);
        CHECK(result.policy_set.version == "3");
    }

    SECTION("malformed JSON") {
        auto result = PolicyLoader::load_from_json_string("{\"policies\": [");
        CHECK_FALSE(result.success);
    }

    SECTION("invalid default_action") {
        auto result = PolicyLoader::load_from_json_string(R"({
            "default_action": "sometimes",
            "policies": []
        })");
        CHECK_FALSE(result.success);
    }
}

TEST_CASE("PolicyLoader: TOML and JSON documents load the same set", "[policy][loader]") {
    ztgate::testing::TmpDir tmp;
    const auto toml_path = tmp.file("policies.toml", R"(
        [policy]
        version = "1"
        default_decision = "deny"

        [[policies]]
        name = "read"
        actions = ["s3:GetObject"]
        decision = "allow"
        description = "Read objects"
    )");
    const auto json_path = tmp.file("policies.json", R"({
        "version": "1",
        "default_action": "deny",
        "policies": [{"name": "read", "conditions": {"action": ["s3:GetObject"]},
                      "decision": "allow", "description": "Read objects"}]
    })");

    auto from_toml = PolicyLoader::load_from_file(toml_path);
    auto from_json = PolicyLoader::load_from_file(json_path);
    REQUIRE(from_toml.success);
    REQUIRE(from_json.success);

    const auto& a = from_toml.policy_set;
    const auto& b = from_json.policy_set;
    CHECK(a.version == b.version);
    CHECK(a.default_decision == b.default_decision);
    REQUIRE(a.policies.size() == b.policies.size());
    CHECK(a.policies[0].name == b.policies[0].name);
    CHECK(a.policies[0].match_actions == b.policies[0].match_actions);
    CHECK(a.policies[0].decision == b.policies[0].decision);
    CHECK(a.policies[0].description == b.policies[0].description);

    SECTION("missing file") {
        auto missing = PolicyLoader::load_from_file(tmp.join("nope.json"));
        CHECK_FALSE(missing.success);
        CHECK(missing.error_message.find("Cannot open") != std::string::npos);
    }
}
