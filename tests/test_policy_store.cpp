#include <catch2/catch_test_macros.hpp>
#include "policy/policy_store.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace ztgate;

namespace {

PolicySet make_set(const std::string& version, size_t count) {
    PolicySet set;
    set.version = version;
    for (size_t i = 0; i < count; ++i) {
        set.policies.emplace_back("p" + std::to_string(i),
                                  std::vector<std::string>{"svc:action" + std::to_string(i)},
                                  Decision::ALLOW);
    }
    return set;
}

} // namespace

TEST_CASE("PolicyStore: default store is empty and denies", "[policy][store]") {
    PolicyStore store;
    REQUIRE(store.current() != nullptr);
    CHECK(store.policy_count() == 0);
    CHECK(store.current()->default_decision == Decision::DENY);
    CHECK(store.generation() == 0);
}

TEST_CASE("PolicyStore: publish swaps the snapshot", "[policy][store]") {
    PolicyStore store(make_set("1", 1));
    const auto before = store.current();

    store.publish(make_set("2", 3));

    CHECK(store.version() == "2");
    CHECK(store.policy_count() == 3);
    CHECK(store.generation() == 1);

    // Old snapshot held by a reader stays intact
    CHECK(before->version == "1");
    CHECK(before->policies.size() == 1);
}

TEST_CASE("PolicyStore: failed reload keeps last-known-good", "[policy][store]") {
    ztgate::testing::TmpDir tmp;
    PolicyStore store(make_set("good", 2));

    const auto bad = tmp.file("bad.json", R"({"policies": [{"decision": "allow"}]})");
    std::string error;
    CHECK_FALSE(store.reload_from_file(bad, &error));
    CHECK_FALSE(error.empty());
    CHECK(store.version() == "good");
    CHECK(store.policy_count() == 2);
    CHECK(store.generation() == 0);

    const auto good = tmp.file("good.json", R"({
        "version": "next",
        "policies": [{"name": "all", "conditions": {"action": ["*"]}, "decision": "deny"}]
    })");
    CHECK(store.reload_from_file(good));
    CHECK(store.version() == "next");
    CHECK(store.generation() == 1);
}

TEST_CASE("PolicyStore: readers never see a partial set", "[policy][store][concurrency]") {
    PolicyStore store(make_set("4", 4));
    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                const auto snap = store.current();
                // Every published set has version == policy count
                if (snap->version != std::to_string(snap->policies.size())) {
                    inconsistent.fetch_add(1);
                }
            }
        });
    }

    for (size_t i = 1; i <= 200; ++i) {
        store.publish(make_set(std::to_string(i % 8), i % 8));
    }
    stop.store(true);
    for (auto& r : readers) r.join();

    CHECK(inconsistent.load() == 0);
    CHECK(store.generation() == 200);
}
