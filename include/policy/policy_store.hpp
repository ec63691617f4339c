#pragma once

#include "policy/policy_types.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ztgate {

/**
 * @brief Holder of the active PolicySet
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). Readers take an
 * immutable snapshot with current(); writers parse the new set completely
 * offline and swap the pointer, so a reader never observes a partially
 * updated set. A failed reload leaves the last-known-good set in place.
 */
class PolicyStore {
public:
    /// Starts with an empty set (default DENY)
    PolicyStore();

    explicit PolicyStore(PolicySet initial);

    /// Current immutable snapshot (never null)
    [[nodiscard]] std::shared_ptr<const PolicySet> current() const;

    /// Replace the active set
    void publish(PolicySet set);

    /**
     * @brief Re-read a policy document and publish it on success
     * @return true if the new set is active; false keeps the previous one
     */
    bool reload_from_file(const std::string& path, std::string* error_out = nullptr);

    [[nodiscard]] std::string version() const;
    [[nodiscard]] size_t policy_count() const;

    /// Number of successful publishes since construction
    [[nodiscard]] uint64_t generation() const {
        return generation_.load(std::memory_order_acquire);
    }

private:
    std::atomic<std::shared_ptr<const PolicySet>> set_;
    std::atomic<uint64_t> generation_{0};

    // Single writer for reload
    mutable std::mutex reload_mutex_;
};

} // namespace ztgate
