#pragma once

#include "remediation/icloud_adapter.hpp"
#include <memory>
#include <vector>

namespace ztgate {

/**
 * Capability stubs for the three supported clouds. They perform no provider
 * API calls and return deterministic descriptions, which keeps them trivially
 * idempotent.
 */

class AwsAdapter : public ICloudAdapter {
public:
    [[nodiscard]] std::string revoke_access(const std::string& user) override;
    [[nodiscard]] CloudProvider provider() const override { return CloudProvider::AWS; }
    [[nodiscard]] std::string name() const override { return "aws-stub"; }
};

class AzureAdapter : public ICloudAdapter {
public:
    [[nodiscard]] std::string revoke_access(const std::string& user) override;
    [[nodiscard]] CloudProvider provider() const override { return CloudProvider::AZURE; }
    [[nodiscard]] std::string name() const override { return "azure-stub"; }
};

class GcpAdapter : public ICloudAdapter {
public:
    [[nodiscard]] std::string revoke_access(const std::string& user) override;
    [[nodiscard]] CloudProvider provider() const override { return CloudProvider::GCP; }
    [[nodiscard]] std::string name() const override { return "gcp-stub"; }
};

/// One stub adapter per supported cloud
std::vector<std::shared_ptr<ICloudAdapter>> make_stub_adapters();

} // namespace ztgate
