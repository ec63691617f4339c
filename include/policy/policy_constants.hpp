#pragma once

#include <string>
#include <string_view>

namespace ztgate::policy {

// kWildcard is std::string (not string_view) because it's compared against owned entries
inline const std::string kWildcard = "*";

// Context evaluator reasons
inline constexpr std::string_view kUntrustedNetwork = "untrusted network source";
inline constexpr std::string_view kOutsideBusinessHours = "outside business hours";
inline constexpr std::string_view kUnrecognizedDevice = "unrecognized device";
inline constexpr std::string_view kContextValidated = "context validated";

// Action evaluation fallback
inline constexpr std::string_view kNoMatchingPolicy = "no matching policy (default)";

} // namespace ztgate::policy
