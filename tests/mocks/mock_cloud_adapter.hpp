#pragma once

#include "remediation/icloud_adapter.hpp"
#include <atomic>
#include <chrono>
#include <format>
#include <stdexcept>
#include <string>
#include <thread>

namespace ztgate::testing {

/**
 * @brief Scriptable cloud adapter: succeed, throw, throw a non-std type, or stall
 */
class MockCloudAdapter : public ICloudAdapter {
public:
    enum class Behavior { SUCCEED, THROW, THROW_UNKNOWN, STALL };

    struct UnknownError {};

    explicit MockCloudAdapter(CloudProvider provider,
                              Behavior behavior = Behavior::SUCCEED,
                              std::chrono::milliseconds stall = std::chrono::milliseconds{500})
        : provider_(provider), behavior_(behavior), stall_(stall) {}

    [[nodiscard]] std::string revoke_access(const std::string& user) override {
        calls_.fetch_add(1, std::memory_order_relaxed);
        switch (behavior_) {
            case Behavior::THROW:
                throw std::runtime_error("control plane unavailable");
            case Behavior::THROW_UNKNOWN:
                throw UnknownError{};
            case Behavior::STALL:
                std::this_thread::sleep_for(stall_);
                break;
            case Behavior::SUCCEED:
                break;
        }
        return std::format("mock revoke {} on {}", user, cloud_to_string(provider_));
    }

    [[nodiscard]] CloudProvider provider() const override { return provider_; }
    [[nodiscard]] std::string name() const override { return "mock"; }

    [[nodiscard]] int calls() const { return calls_.load(std::memory_order_relaxed); }

private:
    CloudProvider provider_;
    Behavior behavior_;
    std::chrono::milliseconds stall_;
    std::atomic<int> calls_{0};
};

} // namespace ztgate::testing
