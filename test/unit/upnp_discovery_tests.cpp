// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "nat/upnp_discovery.hpp"
#include <set>

using namespace natforward::nat;
using boost::asio::ip::make_address;

TEST_CASE("UPnPDiscovery::ParseUrlEndpoint - valid URLs", "[unit][nat][upnp]") {
    SECTION("IPv4 with port") {
        auto ep = UPnPDiscovery::ParseUrlEndpoint("http://192.168.1.1:5000/rootDesc.xml");
        REQUIRE(ep.has_value());
        CHECK(ep->address == make_address("192.168.1.1"));
        CHECK(ep->port == 5000);
    }

    SECTION("IPv4 without port defaults to 80") {
        auto ep = UPnPDiscovery::ParseUrlEndpoint("http://10.0.0.1/desc.xml");
        REQUIRE(ep.has_value());
        CHECK(ep->port == 80);
    }

    SECTION("no path") {
        auto ep = UPnPDiscovery::ParseUrlEndpoint("http://10.0.0.1:1900");
        REQUIRE(ep.has_value());
        CHECK(ep->port == 1900);
    }

    SECTION("bracketed IPv6") {
        auto ep = UPnPDiscovery::ParseUrlEndpoint("http://[fe80::1]:49152/igd.xml");
        REQUIRE(ep.has_value());
        CHECK(ep->address.is_v6());
        CHECK(ep->port == 49152);
    }
}

TEST_CASE("UPnPDiscovery::ParseUrlEndpoint - rejected URLs", "[unit][nat][upnp]") {
    CHECK_FALSE(UPnPDiscovery::ParseUrlEndpoint("").has_value());
    CHECK_FALSE(UPnPDiscovery::ParseUrlEndpoint("http:///rootDesc.xml").has_value());
    CHECK_FALSE(UPnPDiscovery::ParseUrlEndpoint("http://router.local:5000/").has_value());
    CHECK_FALSE(UPnPDiscovery::ParseUrlEndpoint("http://192.168.1.1:99999/").has_value());
    CHECK_FALSE(UPnPDiscovery::ParseUrlEndpoint("http://192.168.1.1:50a0/").has_value());
    CHECK_FALSE(UPnPDiscovery::ParseUrlEndpoint("http://[fe80::1/").has_value());
}

TEST_CASE("GatewayEndpoint - formatting and ordering", "[unit][nat]") {
    GatewayEndpoint v4{make_address("192.0.2.1"), 0};
    GatewayEndpoint v4_port{make_address("192.0.2.1"), 5000};
    GatewayEndpoint v6{make_address("2001:db8::1"), 80};

    CHECK(v4.ToString() == "192.0.2.1:0");
    CHECK(v6.ToString() == "[2001:db8::1]:80");

    CHECK(v4 != v4_port);
    CHECK(v4 == GatewayEndpoint{make_address("192.0.2.1"), 0});

    std::set<GatewayEndpoint> endpoints{v4, v4_port, v6, v4};
    CHECK(endpoints.size() == 3);
}

TEST_CASE("UPnPDiscovery - stop without start", "[unit][nat][upnp]") {
    UPnPDiscovery discovery;
    REQUIRE_NOTHROW(discovery.StopDiscovery());
    CHECK_FALSE(discovery.IsRunning());
}
