#include <catch2/catch.hpp>

#include "drone_relay/command_router.hpp"
#include "drone_relay/errors.hpp"
#include "drone_relay/hardware_adapter.hpp"
#include "logging_test_fixture.hpp"

using namespace drone_relay;

namespace {

struct RouterHarness {
    RouterHarness()
        : hub((test::ensure_logger_initialized(), test::make_manual_hub_config()), shutdown_signal),
          hardware(HardwareConfig{}),
          simulator(SimulatorConfig{}, hardware, hub, shutdown_signal),
          router(simulator) {}

    ShutdownSignal shutdown_signal;
    BroadcastHub hub;
    MockHardwareAdapter hardware;
    StateSimulator simulator;
    CommandRouter router;
};

CommandParams altitude_params(double altitude) {
    CommandParams params{};
    params.altitude = altitude;
    return params;
}

}  // namespace

TEST_CASE("parse_command builds typed commands from raw parameters") {
    CommandParams params{};
    params.latitude = 33.69;
    params.longitude = 73.05;
    params.altitude = 15.0;

    const Command command = parse_command("goto", params);
    REQUIRE(std::holds_alternative<GotoCommand>(command));
    REQUIRE(std::get<GotoCommand>(command).target.latitude_deg == Approx(33.69));
    REQUIRE(command_name(command) == "goto");

    const Command takeoff = parse_command("takeoff", CommandParams{});
    REQUIRE(std::get<TakeoffCommand>(takeoff).altitude_m == Approx(k_default_takeoff_altitude_m));
}

TEST_CASE("parse_command rejects unknown names and bad parameters") {
    REQUIRE_THROWS_AS(parse_command("barrel_roll", CommandParams{}), ValidationError);

    CommandParams missing_longitude{};
    missing_longitude.latitude = 33.69;
    missing_longitude.altitude = 15.0;
    REQUIRE_THROWS_AS(parse_command("goto", missing_longitude), ValidationError);

    CommandParams out_of_range{};
    out_of_range.latitude = 91.0;
    out_of_range.longitude = 73.05;
    out_of_range.altitude = 15.0;
    REQUIRE_THROWS_AS(parse_command("goto", out_of_range), ValidationError);

    REQUIRE_THROWS_AS(parse_command("start_mission", CommandParams{}), ValidationError);
}

TEST_CASE("CommandRouter rejects takeoff altitudes outside one to one hundred metres") {
    RouterHarness harness{};
    REQUIRE(harness.router.execute("arm", CommandParams{}).success);

    for (const double altitude : {0.0, 0.99, 100.5, -10.0}) {
        const CommandResult result = harness.router.execute("takeoff", altitude_params(altitude));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == CommandErrorKind::Validation);
    }
    REQUIRE_FALSE(harness.simulator.snapshot().flying);

    const CommandResult result = harness.router.execute("takeoff", altitude_params(100.0));
    REQUIRE(result.success);
    REQUIRE(result.command == "takeoff");
    REQUIRE_FALSE(result.error.has_value());
}

TEST_CASE("CommandRouter reports precondition failures without throwing") {
    RouterHarness harness{};

    CommandResult result{};
    REQUIRE_NOTHROW(result = harness.router.execute("takeoff", altitude_params(10.0)));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == CommandErrorKind::Precondition);
    REQUIRE(result.message == "Drone must be armed first");

    result = harness.router.execute("land", CommandParams{});
    REQUIRE(result.error == CommandErrorKind::Precondition);
}

TEST_CASE("CommandRouter validates every waypoint of a mission") {
    RouterHarness harness{};
    harness.router.execute("arm", CommandParams{});
    harness.router.execute("takeoff", altitude_params(10.0));

    CommandParams params{};
    params.waypoints = std::vector<GeodeticCoordinate>{
        GeodeticCoordinate{33.685, 73.048, 20.0},
        GeodeticCoordinate{33.686, 73.049, 150.0},
    };
    CommandResult result = harness.router.execute("start_mission", params);
    REQUIRE(result.error == CommandErrorKind::Validation);
    REQUIRE_FALSE(harness.simulator.snapshot().mission.has_value());

    params.waypoints = std::vector<GeodeticCoordinate>{};
    result = harness.router.execute("start_mission", params);
    REQUIRE(result.error == CommandErrorKind::Validation);

    result = harness.router.execute(StartMissionCommand{{GeodeticCoordinate{33.685, 73.048, 20.0}}});
    REQUIRE(result.success);
    REQUIRE(result.message == "Mission started with 1 waypoints");
}

TEST_CASE("CommandRouter publishes a snapshot after every successful command") {
    RouterHarness harness{};
    REQUIRE(harness.hub.queue_size(Channel::Telemetry) == 0);

    REQUIRE(harness.router.execute(ArmCommand{}).success);
    REQUIRE(harness.hub.queue_size(Channel::Telemetry) == 1);

    REQUIRE_FALSE(harness.router.execute(LandCommand{}).success);
    REQUIRE(harness.hub.queue_size(Channel::Telemetry) == 1);
}

TEST_CASE("CommandRouter refuses commands after stop_accepting") {
    RouterHarness harness{};
    harness.router.stop_accepting();
    REQUIRE_FALSE(harness.router.accepting());

    const CommandResult result = harness.router.execute("arm", CommandParams{});
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == CommandErrorKind::Unavailable);
    REQUIRE_FALSE(harness.simulator.snapshot().armed);
}
