#include "enforcement/cloud_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace ztgate {

std::vector<std::string> CloudClassifier::tokenize(std::string_view resource) {
    std::vector<std::string> tokens;
    std::string current;
    for (const char c : resource) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            current += static_cast<char>(std::tolower(uc));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

CloudProvider CloudClassifier::classify(std::string_view resource) {
    const auto tokens = tokenize(resource);
    const auto has_token = [&tokens](std::string_view t) {
        return std::find(tokens.begin(), tokens.end(), t) != tokens.end();
    };

    if (has_token("aws")) {
        return CloudProvider::AWS;
    }

    const std::string lower = utils::to_lower(resource);
    if (has_token("azure")
        || lower.find("/subscriptions/") != std::string::npos
        || lower.find("windows.net") != std::string::npos) {
        return CloudProvider::AZURE;
    }

    // Unmatched identifiers fall through to GCP
    return CloudProvider::GCP;
}

} // namespace ztgate
