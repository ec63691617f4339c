#include <catch2/catch_test_macros.hpp>
#include "security/network_trust.hpp"

using namespace ztgate;

TEST_CASE("NetworkTrust: empty list trusts nothing", "[network_trust]") {
    NetworkTrust trust;
    CHECK_FALSE(trust.is_trusted("10.0.0.1"));
    CHECK_FALSE(trust.is_trusted("192.168.1.100"));
    CHECK(trust.size() == 0);
}

TEST_CASE("NetworkTrust: string prefixes match the start of the address", "[network_trust]") {
    NetworkTrust trust({"192.168.", "10.0."});
    CHECK(trust.is_trusted("192.168.1.12"));
    CHECK(trust.is_trusted("10.0.44.2"));
    CHECK_FALSE(trust.is_trusted("10.1.0.1"));
    CHECK_FALSE(trust.is_trusted("8.8.8.8"));
    CHECK_FALSE(trust.is_trusted("1.192.168.1"));
}

TEST_CASE("NetworkTrust: CIDR /8 range matches", "[network_trust]") {
    NetworkTrust trust({"10.0.0.0/8"});
    CHECK(trust.is_trusted("10.0.0.1"));
    CHECK(trust.is_trusted("10.255.255.255"));
    CHECK_FALSE(trust.is_trusted("11.0.0.1"));
}

TEST_CASE("NetworkTrust: CIDR /24 range rejects out-of-range IP", "[network_trust]") {
    NetworkTrust trust({"192.168.1.0/24"});
    CHECK(trust.is_trusted("192.168.1.254"));
    CHECK_FALSE(trust.is_trusted("192.168.2.1"));
}

TEST_CASE("NetworkTrust: mixed prefix and CIDR entries", "[network_trust]") {
    NetworkTrust trust({"172.16.0.0/12", "192.168."});
    CHECK(trust.is_trusted("172.31.255.255"));
    CHECK(trust.is_trusted("192.168.77.1"));
    CHECK_FALSE(trust.is_trusted("172.32.0.1"));
    CHECK(trust.size() == 2);
}

TEST_CASE("NetworkTrust: invalid entries and addresses", "[network_trust]") {
    SECTION("invalid CIDR is dropped") {
        NetworkTrust trust({"10.0.0.0/40", "300.0.0.0/8"});
        CHECK(trust.size() == 0);
        CHECK_FALSE(trust.is_trusted("10.0.0.1"));
    }

    SECTION("non-IP source never matches a CIDR") {
        NetworkTrust trust({"10.0.0.0/8"});
        CHECK_FALSE(trust.is_trusted("not-an-ip"));
        CHECK_FALSE(trust.is_trusted(""));
    }

    SECTION("parse_cidr normalizes the network address") {
        NetworkTrust::CidrRange range;
        REQUIRE(NetworkTrust::parse_cidr("10.1.2.3/16", range));
        uint32_t expected = 0;
        REQUIRE(NetworkTrust::parse_ip("10.1.0.0", expected));
        CHECK(range.network == expected);
    }
}
