#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ztgate {

/**
 * @brief Trusted network list for context evaluation
 *
 * Entries containing '/' are IPv4 CIDR ranges ("10.0.0.0/16"); any other
 * entry is a literal string prefix of the source address ("192.168.").
 * CIDR entries are parsed once at construction; unparsable CIDRs never match.
 */
class NetworkTrust {
public:
    struct CidrRange {
        uint32_t network = 0;
        uint32_t mask = 0;
    };

    NetworkTrust() = default;
    explicit NetworkTrust(const std::vector<std::string>& entries);

    /// True if ip starts with a prefix entry or falls inside a CIDR entry.
    /// An empty list trusts nothing.
    [[nodiscard]] bool is_trusted(std::string_view ip) const;

    [[nodiscard]] size_t size() const { return prefixes_.size() + ranges_.size(); }

    static bool parse_ip(std::string_view ip, uint32_t& out);
    static bool parse_cidr(std::string_view cidr, CidrRange& out);
    static bool ip_matches_cidr(uint32_t ip, const CidrRange& range);

private:
    std::vector<std::string> prefixes_;
    std::vector<CidrRange> ranges_;
};

} // namespace ztgate
