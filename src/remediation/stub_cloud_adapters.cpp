#include "remediation/stub_cloud_adapters.hpp"

#include <format>

namespace ztgate {

std::string AwsAdapter::revoke_access(const std::string& user) {
    return std::format("Removed {} from SensitiveAccess group in AWS (mock)", user);
}

std::string AzureAdapter::revoke_access(const std::string& user) {
    return std::format("Azure remediation triggered for {}", user);
}

std::string GcpAdapter::revoke_access(const std::string& user) {
    return std::format("GCP remediation triggered for {}", user);
}

std::vector<std::shared_ptr<ICloudAdapter>> make_stub_adapters() {
    return {
        std::make_shared<AwsAdapter>(),
        std::make_shared<AzureAdapter>(),
        std::make_shared<GcpAdapter>(),
    };
}

} // namespace ztgate
