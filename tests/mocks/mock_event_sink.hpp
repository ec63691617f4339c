#pragma once

#include "monitoring/event_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ztgate::testing {

/**
 * @brief In-memory event sink with scripted failures
 *
 * State lives behind a shared_ptr so the test can keep inspecting it after
 * the sink itself has been moved into CentralMonitor.
 */
class MockEventSink : public IEventSink {
public:
    struct State {
        std::mutex mutex;
        std::vector<std::string> lines;
        int fail_next = 0;          // Fail this many upcoming writes
        bool always_fail = false;
        int write_calls = 0;
        bool shut_down = false;

        std::vector<std::string> snapshot() {
            std::lock_guard<std::mutex> lock(mutex);
            return lines;
        }
    };

    explicit MockEventSink(std::shared_ptr<State> state = std::make_shared<State>())
        : state_(std::move(state)) {}

    [[nodiscard]] bool write(std::string_view json_line) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->write_calls;
        if (state_->always_fail) return false;
        if (state_->fail_next > 0) {
            --state_->fail_next;
            return false;
        }
        // Stored without the trailing newline
        std::string line(json_line);
        if (!line.empty() && line.back() == '\n') line.pop_back();
        state_->lines.push_back(std::move(line));
        return true;
    }

    void flush() override {}

    void shutdown() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->shut_down = true;
    }

    [[nodiscard]] std::string name() const override { return "mock"; }

    [[nodiscard]] const std::shared_ptr<State>& state() const { return state_; }

private:
    std::shared_ptr<State> state_;
};

} // namespace ztgate::testing
