#include <catch2/catch_test_macros.hpp>
#include "c11n/configuration/transport_config.hpp"
#include "c11n/configuration/supervisor_config.hpp"

using namespace std::chrono_literals;
using namespace c11n::configuration;

TEST_CASE("TransportConfig - Defaults", "[config][transport]") {
    SECTION("Default uses fixed node timeouts") {
        constexpr auto config = TransportConfig::Default();
        STATIC_REQUIRE(config.ConnectTimeout() == 1000ms);
        STATIC_REQUIRE(config.RequestTimeout() == 5000ms);
        STATIC_REQUIRE(config.ResponseHeaderTimeout() == 5000ms);
        STATIC_REQUIRE(config.MaxHeaderBytes() == 64 * 1024);
    }

    SECTION("Custom timeouts differ from the default") {
        constexpr TransportConfig custom(100ms, 300ms, 200ms);
        REQUIRE(custom.ConnectTimeout() == 100ms);
        REQUIRE(custom.MaxHeaderBytes() == TransportConfig::Default().MaxHeaderBytes());
        REQUIRE_FALSE(custom == TransportConfig::Default());
        REQUIRE(TransportConfig::Default() == TransportConfig::Default());
    }
}

TEST_CASE("SupervisorConfig - Defaults and modifiers", "[config][supervisor]") {
    SECTION("Default launches constellation-node with a settle delay") {
        const auto config = SupervisorConfig::Default();
        REQUIRE(config.Executable() == "constellation-node");
        REQUIRE(config.SettleDelay() == 100ms);
        REQUIRE_FALSE(config.IsReadinessPollingEnabled());
    }

    SECTION("WithReadinessPolling enables polling on a copy") {
        const auto base = SupervisorConfig::Default();
        const auto polling = base.WithReadinessPolling("/tmp/node.ipc", 2000ms, 25ms);
        REQUIRE(polling.IsReadinessPollingEnabled());
        REQUIRE(polling.ReadinessSocketPath() == "/tmp/node.ipc");
        REQUIRE(polling.ReadinessTimeout() == 2000ms);
        REQUIRE(polling.ReadinessInterval() == 25ms);
        REQUIRE_FALSE(base.IsReadinessPollingEnabled());
    }

    SECTION("WithExecutable and WithSettleDelay override the defaults") {
        const auto config = SupervisorConfig::WithExecutable("/opt/node/bin/c11n").WithSettleDelay(0ms);
        REQUIRE(config.Executable() == "/opt/node/bin/c11n");
        REQUIRE(config.SettleDelay() == 0ms);
    }
}
