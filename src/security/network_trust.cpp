#include "security/network_trust.hpp"
#include "core/utils.hpp"

#include <format>

namespace ztgate {

NetworkTrust::NetworkTrust(const std::vector<std::string>& entries) {
    for (const auto& entry : entries) {
        if (entry.empty()) continue;
        if (entry.find('/') == std::string::npos) {
            prefixes_.push_back(entry);
            continue;
        }
        CidrRange range;
        if (parse_cidr(entry, range)) {
            ranges_.push_back(range);
        } else {
            utils::log::warn(std::format("Ignoring invalid trusted network CIDR '{}'", entry));
        }
    }
}

bool NetworkTrust::is_trusted(std::string_view ip) const {
    for (const auto& prefix : prefixes_) {
        if (ip.starts_with(prefix)) return true;
    }
    if (ranges_.empty()) return false;

    uint32_t addr = 0;
    if (!parse_ip(ip, addr)) return false;
    for (const auto& range : ranges_) {
        if (ip_matches_cidr(addr, range)) return true;
    }
    return false;
}

bool NetworkTrust::parse_ip(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    bool has_digit = false;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (!has_digit || val > 255 || octet_idx > 3) return false;
            octets[octet_idx++] = val;
            val = 0;
            has_digit = false;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
            if (val > 255) return false;
            has_digit = true;
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

bool NetworkTrust::parse_cidr(std::string_view cidr, CidrRange& out) {
    const auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        if (!parse_ip(cidr, out.network)) return false;
        out.mask = 0xFFFFFFFFu;
        return true;
    }

    if (!parse_ip(cidr.substr(0, slash), out.network)) return false;

    const auto prefix_sv = cidr.substr(slash + 1);
    if (prefix_sv.empty()) return false;
    uint32_t prefix = 0;
    for (const char c : prefix_sv) {
        if (c < '0' || c > '9') return false;
        prefix = prefix * 10 + static_cast<uint32_t>(c - '0');
        if (prefix > 32) return false;
    }
    out.mask = (prefix == 0) ? 0u : ~((1u << (32 - prefix)) - 1);
    out.network &= out.mask;
    return true;
}

bool NetworkTrust::ip_matches_cidr(uint32_t ip, const CidrRange& range) {
    return (ip & range.mask) == range.network;
}

} // namespace ztgate
