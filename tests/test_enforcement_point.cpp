#include <catch2/catch_test_macros.hpp>
#include "core/gateway.hpp"
#include "enforcement/policy_enforcement_point.hpp"
#include "monitoring/central_monitor.hpp"
#include "monitoring/event_codec.hpp"
#include "mocks/mock_cloud_adapter.hpp"
#include "mocks/mock_event_sink.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

using namespace ztgate;
using ztgate::testing::make_request;
using ztgate::testing::MockCloudAdapter;
using ztgate::testing::MockEventSink;
using ztgate::testing::TmpDir;

namespace {

GatewayConfig make_config() {
    GatewayConfig config;
    config.monitoring.metrics_file.clear();
    config.monitoring.retry_backoff = std::chrono::milliseconds(1);
    config.monitoring.recover_on_start = false;

    config.policy_set.version = "test";
    config.policy_set.default_decision = Decision::DENY;
    config.policy_set.policies.emplace_back(
        "object-read", std::vector<std::string>{"s3:GetObject", "s3:ListBucket"},
        Decision::ALLOW, "Read access to object storage");
    config.policy_set.policies.emplace_back(
        "iam-changes", std::vector<std::string>{"iam:*"},
        Decision::REVIEW, "Identity changes require admin review");
    return config;
}

struct Fixture {
    std::shared_ptr<MockEventSink::State> sink_state = std::make_shared<MockEventSink::State>();
    Gateway gateway{make_config(), std::make_unique<MockEventSink>(sink_state)};
    std::shared_ptr<MockCloudAdapter> aws = std::make_shared<MockCloudAdapter>(CloudProvider::AWS);

    Fixture() { gateway.register_adapter(aws); }

    std::vector<EventLogEntry> events(EventType type) {
        std::vector<EventLogEntry> out;
        for (const auto& line : sink_state->snapshot()) {
            auto e = EventCodec::from_json(line);
            if (e && e->event_type == type) out.push_back(std::move(*e));
        }
        return out;
    }
};

} // namespace

TEST_CASE("PEP: trusted context with an allowed action is permitted", "[pep][scenario]") {
    Fixture fx;
    auto result = fx.gateway.enforce(make_request(
        "alice", "s3:GetObject", "arn:aws:s3:::finance-data", "192.168.1.12", "device-laptop-001", 10));

    REQUIRE(result.is_ok());
    const auto& outcome = result.value();
    CHECK(outcome.decision == Decision::ALLOW);
    CHECK(outcome.permitted());
    CHECK(outcome.cloud == "AWS");
    CHECK(outcome.remediation_actions.empty());
    CHECK(fx.aws->calls() == 0);

    CHECK(fx.events(EventType::REMEDIATION).empty());
    const auto access = fx.events(EventType::ACCESS_REQUEST);
    REQUIRE(access.size() == 1);
    CHECK(access[0].module == "PEP");
    CHECK(access[0].user == "alice");
    CHECK(access[0].decision == Decision::ALLOW);
    CHECK(access[0].details.at("enforcement") == "permitted");
    CHECK(access[0].details.at("matched_policy") == "object-read");
}

TEST_CASE("PEP: untrusted network is denied and remediated", "[pep][scenario]") {
    Fixture fx;
    auto result = fx.gateway.enforce(make_request(
        "eve", "s3:ListBucket", "arn:aws:s3:::finance-data", "8.8.8.8", "device-laptop-001", 10));

    REQUIRE(result.is_ok());
    const auto& outcome = result.value();
    CHECK(outcome.decision == Decision::DENY);
    CHECK(outcome.reason == "untrusted network source");
    CHECK_FALSE(outcome.permitted());
    REQUIRE(outcome.remediation_actions.size() == 1);
    CHECK(outcome.remediation_actions[0] == "mock revoke eve on AWS");
    CHECK(fx.aws->calls() == 1);

    const auto remediation = fx.events(EventType::REMEDIATION);
    REQUIRE(remediation.size() == 1);
    CHECK(remediation[0].decision == Decision::DENY);

    const auto access = fx.events(EventType::ACCESS_REQUEST);
    REQUIRE(access.size() == 1);
    CHECK(access[0].details.at("enforcement") == "blocked");
    CHECK(access[0].details.at("context_decision") == "DENY");
    CHECK(access[0].details.at("action_decision") == "ALLOW");
    CHECK(access[0].actions_taken == outcome.remediation_actions);
}

TEST_CASE("PEP: unrecognized device goes to review", "[pep][scenario]") {
    Fixture fx;
    auto result = fx.gateway.enforce(make_request(
        "bob", "s3:GetObject", "arn:aws:s3:::finance-data", "192.168.1.12", "unknown-device-999", 10));

    REQUIRE(result.is_ok());
    const auto& outcome = result.value();
    CHECK(outcome.decision == Decision::REVIEW);
    CHECK(outcome.reason == "unrecognized device");
    REQUIRE(outcome.remediation_actions.size() == 1);
    CHECK(outcome.remediation_actions[0].find("Admin review needed for bob") == 0);
    CHECK(fx.aws->calls() == 0);

    const auto access = fx.events(EventType::ACCESS_REQUEST);
    REQUIRE(access.size() == 1);
    CHECK(access[0].details.at("enforcement") == "pending_review");
    CHECK(fx.gateway.pep().get_stats().pending_review == 1);
}

TEST_CASE("PEP: unmatched action falls back to the default decision", "[pep][scenario]") {
    Fixture fx;
    auto result = fx.gateway.enforce(make_request(
        "alice", "ec2:RunInstances", "arn:aws:ec2:us-east-1::instance/i-1",
        "192.168.1.12", "device-laptop-001", 10));

    REQUIRE(result.is_ok());
    CHECK(result.value().decision == Decision::DENY);
    CHECK(result.value().reason == "no matching policy (default)");

    const auto access = fx.events(EventType::ACCESS_REQUEST);
    REQUIRE(access.size() == 1);
    CHECK(access[0].details.at("matched_policy").empty());
}

TEST_CASE("PEP: request details are carried into the event", "[pep]") {
    Fixture fx;
    const auto request = make_request("alice", "s3:GetObject", "arn:aws:s3:::finance-data",
                                      "10.0.4.2", "device-admin-001", 9);
    REQUIRE(fx.gateway.enforce(request).is_ok());

    const auto access = fx.events(EventType::ACCESS_REQUEST);
    REQUIRE(access.size() == 1);
    const auto& e = access[0];
    CHECK(e.timestamp == std::chrono::time_point_cast<std::chrono::milliseconds>(request.request_time));
    CHECK(e.resource == "arn:aws:s3:::finance-data");
    CHECK(e.details.at("action") == "s3:GetObject");
    CHECK(e.details.at("source_ip") == "10.0.4.2");
    CHECK(e.details.at("device_id") == "device-admin-001");
    CHECK(e.details.at("context_reason") == "context validated");
    CHECK(e.details.at("action_reason") == "Read access to object storage");
}

TEST_CASE("PEP: malformed requests are rejected without an event", "[pep]") {
    Fixture fx;

    auto missing_user = make_request("", "s3:GetObject", "r", "192.168.1.12", "device-laptop-001");
    auto result = fx.gateway.enforce(missing_user);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::MALFORMED_REQUEST);
    CHECK(result.error_message() == "Missing required field: user");

    auto blank_device = make_request("alice", "s3:GetObject", "r", "192.168.1.12", "   ");
    CHECK(PolicyEnforcementPoint::validate(blank_device) == "device_id");
    CHECK(fx.gateway.enforce(blank_device).is_error());

    auto bad_encoding = make_request("mall\xffory", "s3:GetObject", "r", "192.168.1.12", "device-laptop-001");
    CHECK(PolicyEnforcementPoint::validate(bad_encoding).empty());
    CHECK(PolicyEnforcementPoint::validate_encoding(bad_encoding) == "user");
    auto rejected = fx.gateway.enforce(bad_encoding);
    REQUIRE(rejected.is_error());
    CHECK(rejected.error_category() == ErrorCategory::MALFORMED_REQUEST);
    CHECK(rejected.error_message() == "Field is not valid UTF-8: user");

    CHECK(fx.sink_state->snapshot().empty());
    CHECK(fx.gateway.pep().get_stats().malformed == 3);
    CHECK(fx.gateway.monitor().snapshot().total_access_requests == 0);
}

TEST_CASE("PEP: every enforce call logs exactly one access event", "[pep][audit]") {
    Fixture fx;
    const std::vector<AccessRequest> requests = {
        make_request("alice", "s3:GetObject", "arn:aws:s3:::a", "192.168.1.12", "device-laptop-001", 10),
        make_request("eve", "s3:GetObject", "projects/p/buckets/b", "8.8.8.8", "device-laptop-001", 10),
        make_request("bob", "s3:GetObject", "/subscriptions/1/rg", "192.168.1.12", "unknown", 10),
        make_request("carl", "iam:CreateUser", "arn:aws:iam::1:user/x", "10.0.0.5", "device-admin-001", 10),
        make_request("dana", "s3:GetObject", "arn:aws:s3:::a", "192.168.1.12", "device-laptop-001", 3),
        make_request("", "s3:GetObject", "arn:aws:s3:::a", "192.168.1.12", "device-laptop-001", 10),
    };

    size_t ok = 0;
    for (const auto& request : requests) {
        if (fx.gateway.enforce(request).is_ok()) ++ok;
    }
    CHECK(ok == 5);

    const auto access = fx.events(EventType::ACCESS_REQUEST);
    const auto metrics = fx.gateway.monitor().snapshot();
    CHECK(access.size() == ok);
    CHECK(metrics.total_access_requests == ok);
    CHECK(metrics.decision_total() == access.size());

    // Context ALLOW with an action needing review is denied
    CHECK(metrics.decision_count(Decision::ALLOW) == 1);
    CHECK(metrics.decision_count(Decision::REVIEW) == 1);
    CHECK(metrics.decision_count(Decision::DENY) == 3);
    CHECK(metrics.per_cloud.at("Azure") >= 1);
}

TEST_CASE("PEP: concurrent enforcement keeps the log and metrics in step", "[pep][audit][concurrency]") {
    TmpDir dir("ztgate_pep_concurrent");
    auto config = make_config();
    config.monitoring.log_file = dir.join("events.jsonl");
    config.monitoring.metrics_file = dir.join("metrics.json");

    Gateway gateway(config);

    const std::vector<AccessRequest> mix = {
        make_request("alice", "s3:GetObject", "arn:aws:s3:::a", "192.168.1.12", "device-laptop-001", 10),
        make_request("eve", "s3:GetObject", "projects/p/buckets/b", "8.8.8.8", "device-laptop-001", 10),
        make_request("bob", "s3:GetObject", "/subscriptions/1/rg", "192.168.1.12", "unknown", 10),
        make_request("carl", "iam:CreateUser", "arn:aws:iam::1:user/x", "10.0.0.5", "device-admin-001", 10),
        make_request("", "s3:GetObject", "arn:aws:s3:::a", "192.168.1.12", "device-laptop-001", 10),
    };

    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    std::atomic<int> ok{0};
    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    if (gateway.enforce(mix[static_cast<size_t>(t + i) % mix.size()]).is_ok()) {
                        ok.fetch_add(1);
                    }
                }
            });
        }
    }

    size_t access_lines = 0;
    {
        std::ifstream in(config.monitoring.log_file);
        std::string line;
        while (std::getline(in, line)) {
            auto e = EventCodec::from_json(line);
            REQUIRE(e.has_value());
            if (e->event_type == EventType::ACCESS_REQUEST) ++access_lines;
        }
    }

    const auto metrics = gateway.monitor().snapshot();
    CHECK(ok.load() == kThreads * kPerThread * 4 / 5);
    CHECK(access_lines == static_cast<size_t>(ok.load()));
    CHECK(metrics.decision_total() == access_lines);
    CHECK(metrics.total_access_requests == access_lines);
    CHECK(CentralMonitor::replay_log(config.monitoring.log_file) == metrics);
    CHECK(CentralMonitor::verify_chain(config.monitoring.log_file));
}

TEST_CASE("PEP: monitoring failure does not change the decision", "[pep][audit]") {
    Fixture fx;
    std::vector<std::string> alarms;
    fx.gateway.monitor().set_alarm_handler([&alarms](const std::string& m) { alarms.push_back(m); });
    fx.sink_state->always_fail = true;

    auto result = fx.gateway.enforce(make_request(
        "alice", "s3:GetObject", "arn:aws:s3:::finance-data", "192.168.1.12", "device-laptop-001", 10));

    REQUIRE(result.is_ok());
    CHECK(result.value().decision == Decision::ALLOW);
    CHECK(alarms.size() == 1);
    CHECK(fx.gateway.pep().get_stats().audit_failures == 1);
    CHECK(fx.gateway.monitor().snapshot().total_access_requests == 0);
}

TEST_CASE("PEP: enforcement labels", "[pep]") {
    CHECK(std::string(PolicyEnforcementPoint::enforcement_label(Decision::ALLOW)) == "permitted");
    CHECK(std::string(PolicyEnforcementPoint::enforcement_label(Decision::DENY)) == "blocked");
    CHECK(std::string(PolicyEnforcementPoint::enforcement_label(Decision::REVIEW)) == "pending_review");
}
