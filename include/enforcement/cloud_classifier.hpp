#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ztgate {

/**
 * @brief Best-effort cloud detection from a resource identifier
 *
 * The identifier is split into lower-cased alphanumeric tokens and matched
 * whole-token, so "awsome-bucket" is not AWS:
 *   token "aws"                                        → AWS   (arn:aws:s3:::x)
 *   token "azure", "/subscriptions/" or "windows.net"  → AZURE
 *   anything else                                      → GCP
 */
class CloudClassifier {
public:
    [[nodiscard]] static CloudProvider classify(std::string_view resource);

    /// Display name used in events and adapter selection ("AWS", "Azure", "GCP")
    [[nodiscard]] static std::string classify_name(std::string_view resource) {
        return cloud_to_string(classify(resource));
    }

    [[nodiscard]] static std::vector<std::string> tokenize(std::string_view resource);
};

} // namespace ztgate
