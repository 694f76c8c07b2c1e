// Copyright (c) 2024 NatForward
// Distributed under the MIT software license
// Lifecycle and end-to-end tests for PortForwardingService

#include <catch2/catch_test_macros.hpp>
#include "forwarding/errors.hpp"
#include "forwarding/port_forwarding_service.hpp"
#include "util/forwarding_fakes.hpp"
#include <algorithm>

using namespace natforward;
using namespace natforward::forwarding;
using natforward::test::FakeConfigurationProvider;
using natforward::test::FakeNatDevice;
using natforward::test::FakeNatDiscovery;
using natforward::test::FakeServerHost;
using natforward::test::WaitFor;

TEST_CASE("PortForwardingService - lifecycle", "[unit][service]") {
    FakeConfigurationProvider provider;
    FakeServerHost host;
    FakeNatDiscovery discovery;
    PortForwardingService service(provider, host, discovery);

    SECTION("start begins discovery") {
        REQUIRE(service.Start());
        CHECK(service.IsRunning());
        CHECK(discovery.start_calls == 1);
        CHECK(service.controller().IsDiscovering());
    }

    SECTION("second start is rejected") {
        REQUIRE(service.Start());
        CHECK_FALSE(service.Start());
        CHECK(discovery.start_calls == 1);
    }

    SECTION("stop ends discovery") {
        service.Start();
        service.Stop();
        CHECK_FALSE(service.IsRunning());
        CHECK(discovery.stop_calls == 1);
        CHECK_FALSE(service.controller().HasCleanupTimer());
    }

    SECTION("service can be started again after stop") {
        service.Start();
        service.Stop();
        REQUIRE(service.Start());
        CHECK(discovery.start_calls == 2);
    }

    SECTION("dispose is idempotent and final") {
        service.Start();
        service.Dispose();
        REQUIRE_NOTHROW(service.Dispose());
        CHECK(service.IsDisposed());
        CHECK_FALSE(service.IsRunning());
        CHECK(discovery.stop_calls == 1);
        CHECK_THROWS_AS(service.Start(), ObjectDisposedError);
    }

    SECTION("configuration read failure surfaces from start") {
        provider.SetFailReads(true);
        CHECK_THROWS_AS(service.Start(), config::ConfigError);
        CHECK_FALSE(service.IsRunning());
    }
}

TEST_CASE("PortForwardingService - configuration updates", "[unit][service]") {
    FakeConfigurationProvider provider;
    FakeServerHost host;
    FakeNatDiscovery discovery;
    PortForwardingService service(provider, host, discovery);
    REQUIRE(service.Start());

    SECTION("changed forwarding settings restart discovery") {
        config::NetworkConfiguration cfg;
        cfg.public_http_port = 9096;
        provider.Set(cfg);

        CHECK(discovery.stop_calls == 1);
        CHECK(discovery.start_calls == 2);
    }

    SECTION("updates that leave forwarding alone are ignored") {
        provider.RaiseUpdated();
        CHECK(discovery.stop_calls == 0);
        CHECK(discovery.start_calls == 1);
    }

    SECTION("update handling errors are logged, not thrown") {
        provider.SetFailReads(true);
        REQUIRE_NOTHROW(provider.RaiseUpdated());
        CHECK(service.IsRunning());
    }

    SECTION("no restarts after stop") {
        service.Stop();
        config::NetworkConfiguration cfg;
        cfg.public_https_port = 9920;
        provider.Set(cfg);
        CHECK(discovery.start_calls == 1);
    }
}

TEST_CASE("PortForwardingService - gateway discovered end to end", "[unit][service]") {
    FakeConfigurationProvider provider;
    FakeServerHost host;
    host.http_port = 8096;
    host.https_port = 8920;
    host.listen_with_https = true;
    FakeNatDiscovery discovery;
    PortForwardingService service(provider, host, discovery);
    REQUIRE(service.Start());

    auto gateway = std::make_shared<FakeNatDevice>("192.0.2.1", 0);
    discovery.EmitDeviceFound(gateway);
    REQUIRE(WaitFor([&]() { return gateway->request_count() == 2; }));

    auto requests = gateway->requests();
    std::sort(requests.begin(), requests.end(),
              [](const nat::Mapping &a, const nat::Mapping &b) {
                  return a.private_port < b.private_port;
              });
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].private_port == 8096);
    CHECK(requests[0].public_port == 8096);
    CHECK(requests[1].private_port == 8920);
    CHECK(requests[1].public_port == 8920);
    for (const auto &m : requests) {
        CHECK(m.protocol == nat::Protocol::Tcp);
        CHECK(m.lifetime_seconds == 0);
    }

    // Reported again inside the same window
    discovery.EmitDeviceFound(gateway);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK(gateway->request_count() == 2);

    service.Stop();
}
