#pragma once

#include "core/types.hpp"
#include <string>

namespace ztgate {

/**
 * @brief Interface for per-cloud remediation adapters
 *
 * RemediationDispatcher selects one adapter per CloudProvider. Implementations
 * report failure by throwing; the dispatcher turns exceptions and timeouts
 * into failure descriptions. revoke_access() must be idempotent: the same
 * revocation may be requested again for a later denied request.
 */
class ICloudAdapter {
public:
    virtual ~ICloudAdapter() = default;

    /**
     * @brief Revoke the user's elevated access on this cloud
     * @return Human-readable description of what was done
     */
    [[nodiscard]] virtual std::string revoke_access(const std::string& user) = 0;

    [[nodiscard]] virtual CloudProvider provider() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace ztgate
