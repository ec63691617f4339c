#include <catch2/catch_test_macros.hpp>
#include "monitoring/file_sink.hpp"
#include "monitoring/central_monitor.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <sstream>

using namespace ztgate;
using ztgate::testing::TmpDir;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

} // namespace

TEST_CASE("FileSink: appends complete lines", "[monitoring][sink]") {
    TmpDir dir("ztgate_sink");
    const auto path = dir.join("logs/events.jsonl");

    FileSink sink(path);
    CHECK(sink.name() == "file:" + path);
    CHECK(sink.committed_size() == 0);

    REQUIRE(sink.write("{\"a\":1}\n"));
    REQUIRE(sink.write("{\"b\":2}\n"));
    CHECK(sink.committed_size() == 16);
    sink.shutdown();

    CHECK(read_file(path) == "{\"a\":1}\n{\"b\":2}\n");
}

TEST_CASE("FileSink: torn final line is cut before appending", "[monitoring][sink]") {
    TmpDir dir("ztgate_sink_torn");
    const auto path = dir.file("events.jsonl", "{\"a\":1}\n{\"event_id\":\"4f1");

    SECTION("partial line after a complete one") {
        FileSink sink(path);
        CHECK(sink.committed_size() == 8);
        REQUIRE(sink.write("{\"b\":2}\n"));
        sink.shutdown();
        CHECK(read_file(path) == "{\"a\":1}\n{\"b\":2}\n");
    }

    SECTION("file holding only a fragment") {
        const auto fragment_only = dir.file("fragment.jsonl", "{\"event_id\"");
        FileSink sink(fragment_only);
        CHECK(sink.committed_size() == 0);
        REQUIRE(sink.write("{\"b\":2}\n"));
        sink.shutdown();
        CHECK(read_file(fragment_only) == "{\"b\":2}\n");
    }

    SECTION("complete file is left alone") {
        const auto complete = dir.file("complete.jsonl", "{\"a\":1}\n");
        FileSink sink(complete);
        CHECK(sink.committed_size() == 8);
        sink.shutdown();
        CHECK(read_file(complete) == "{\"a\":1}\n");
    }
}

TEST_CASE("FileSink: restart after an interrupted append keeps replay exact", "[monitoring][sink][replay]") {
    TmpDir dir("ztgate_sink_restart");
    MonitoringConfig config;
    config.log_file = dir.join("events.jsonl");
    config.metrics_file = dir.join("metrics.json");
    config.retry_backoff = std::chrono::milliseconds(1);

    auto access = [](const std::string& user) {
        EventLogEntry entry("PEP", EventType::ACCESS_REQUEST);
        entry.user = user;
        entry.resource = "arn:aws:s3:::b";
        entry.cloud = "AWS";
        entry.decision = Decision::DENY;
        entry.reason = "untrusted network source";
        return entry;
    };

    {
        CentralMonitor monitor(config);
        REQUIRE(monitor.record_event(access("alice")).is_ok());
    }
    {
        // Bytes of a record that never completed
        std::ofstream out(config.log_file, std::ios::app | std::ios::binary);
        out << "{\"event_id\":\"9c2e\",\"sequence_num\":1,\"timest";
    }

    MetricsState live;
    {
        CentralMonitor monitor(config);
        auto result = monitor.record_event(access("bob"));
        REQUIRE(result.is_ok());
        CHECK(result.value() == 1);
        live = monitor.snapshot();
    }

    CHECK(live.total_access_requests == 2);
    size_t skipped = 0;
    CHECK(CentralMonitor::replay_log(config.log_file, &skipped) == live);
    CHECK(skipped == 0);

    std::string error;
    CHECK(CentralMonitor::verify_chain(config.log_file, &error));
}
