#pragma once

#include <string>
#include <string_view>

namespace ztgate::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";

// Routes
inline const std::string kAccessRoute = "/api/v1/access";
inline const std::string kMetricsRoute = "/api/v1/metrics";
inline const std::string kHealthRoute = "/health";
inline const std::string kPolicyReloadRoute = "/admin/policies/reload";

} // namespace ztgate::http
