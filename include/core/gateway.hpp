#pragma once

#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>

namespace ztgate {

class PolicyStore;
class PolicyDecisionPoint;
class CentralMonitor;
class RemediationDispatcher;
class PolicyEnforcementPoint;
class IEventSink;
class ICloudAdapter;

/**
 * @brief Composition root for the decision pipeline
 *
 * Owns every component and wires them leaf-first:
 *   PolicyStore → PolicyDecisionPoint → CentralMonitor →
 *   RemediationDispatcher (stub AWS/Azure/GCP adapters) → PolicyEnforcementPoint
 *
 * Policy reloads go through reload_policies() so that each accepted or
 * rejected reload leaves a POLICY_RELOAD record in the event log.
 */
class Gateway {
public:
    /**
     * @param config Fully validated configuration
     * @param sink   Custom event sink; nullptr opens a FileSink on monitoring.log_file
     */
    explicit Gateway(const GatewayConfig& config, std::unique_ptr<IEventSink> sink = nullptr);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    [[nodiscard]] Result<EnforcementOutcome> enforce(const AccessRequest& request);

    /// Publish a new policy set and audit the swap
    void reload_policies(PolicySet set, const std::string& source);

    /**
     * @brief Re-read the configuration file and publish its policies
     * @return false on load failure; the active policy set is kept
     */
    bool reload_from_config(const std::string& config_path, std::string* error_out = nullptr);

    /// Audit a reload that failed before reaching the store (watcher path)
    void reject_reload(const std::string& source, const std::string& error);

    /// Replace the stub adapter for adapter->provider()
    void register_adapter(std::shared_ptr<ICloudAdapter> adapter);

    [[nodiscard]] PolicyStore& policy_store() { return *store_; }
    [[nodiscard]] const PolicyDecisionPoint& pdp() const { return *pdp_; }
    [[nodiscard]] CentralMonitor& monitor() { return *monitor_; }
    [[nodiscard]] RemediationDispatcher& remediation() { return *arm_; }
    [[nodiscard]] PolicyEnforcementPoint& pep() { return *pep_; }

private:
    void record_reload(const std::string& source, bool accepted, const std::string& detail);

    std::unique_ptr<PolicyStore> store_;
    std::unique_ptr<PolicyDecisionPoint> pdp_;
    std::unique_ptr<CentralMonitor> monitor_;
    std::unique_ptr<RemediationDispatcher> arm_;
    std::unique_ptr<PolicyEnforcementPoint> pep_;
};

} // namespace ztgate
