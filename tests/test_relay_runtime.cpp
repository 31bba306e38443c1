#include <catch2/catch.hpp>

#include <chrono>
#include <functional>
#include <thread>

#include "drone_relay/relay_runtime.hpp"
#include "logging_test_fixture.hpp"

using namespace drone_relay;

namespace {
Configuration make_configuration() {
    Configuration configuration{};
    configuration.simulator.tick_period = Duration{0.02};
    configuration.simulator.seed = 11;
    configuration.hub.telemetry.period = Duration{0.01};
    configuration.hardware.poll_period = Duration{0.01};
    configuration.hardware.seed = 11;
    return configuration;
}

bool wait_for(const std::function<bool()>& predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}
}  // namespace

TEST_CASE("RelayRuntime streams telemetry and alerts to connected clients") {
    test::ensure_logger_initialized();
    RelayRuntime runtime{make_configuration()};
    REQUIRE(runtime.hardware().simulated());
    REQUIRE_FALSE(runtime.hardware().degraded());

    auto sink = std::make_shared<test::RecordingSink>();
    runtime.hub().connect("ui", sink);
    runtime.start();
    REQUIRE(runtime.running());

    REQUIRE(runtime.router().execute("arm", CommandParams{}).success);
    REQUIRE(wait_for([&sink]() { return sink->count(Channel::Telemetry) >= 5; }));
    REQUIRE(wait_for([&sink]() { return sink->count(Channel::Alerts) >= 1; }));

    runtime.stop();
    REQUIRE_FALSE(runtime.running());
    const std::size_t delivered = sink->count(Channel::Telemetry);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(sink->count(Channel::Telemetry) == delivered);

    const CommandResult result = runtime.router().execute("disarm", CommandParams{});
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == CommandErrorKind::Unavailable);
}

TEST_CASE("RelayRuntime stop is idempotent and safe before start") {
    test::ensure_logger_initialized();
    RelayRuntime runtime{make_configuration()};
    REQUIRE_NOTHROW(runtime.stop());
    REQUIRE_NOTHROW(runtime.stop());
    REQUIRE_FALSE(runtime.router().accepting());
}
