#include "policy/policy_store.hpp"
#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <format>

namespace ztgate {

PolicyStore::PolicyStore()
    : set_(std::make_shared<const PolicySet>()) {}

PolicyStore::PolicyStore(PolicySet initial)
    : set_(std::make_shared<const PolicySet>(std::move(initial))) {}

std::shared_ptr<const PolicySet> PolicyStore::current() const {
    return set_.load(std::memory_order_acquire);
}

void PolicyStore::publish(PolicySet set) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto next = std::make_shared<const PolicySet>(std::move(set));
    set_.store(std::move(next), std::memory_order_release);
    generation_.fetch_add(1, std::memory_order_acq_rel);
}

bool PolicyStore::reload_from_file(const std::string& path, std::string* error_out) {
    auto result = PolicyLoader::load_from_file(path);
    if (!result.success) {
        utils::log::warn(std::format(
            "Policy reload from {} failed, keeping version {}: {}",
            path, version(), result.error_message));
        if (error_out) *error_out = result.error_message;
        return false;
    }

    const size_t count = result.policy_set.policies.size();
    const std::string new_version = result.policy_set.version;
    publish(std::move(result.policy_set));
    utils::log::info(std::format("Policies reloaded: version {} ({} policies)",
                                 new_version, count));
    return true;
}

std::string PolicyStore::version() const {
    return current()->version;
}

size_t PolicyStore::policy_count() const {
    return current()->policies.size();
}

} // namespace ztgate
