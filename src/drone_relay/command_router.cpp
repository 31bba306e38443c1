#include "drone_relay/command_router.hpp"

#include <cmath>

#include <fmt/format.h>

#include "drone_relay/errors.hpp"
#include "drone_relay/logging.hpp"

namespace drone_relay {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void check_range(std::string_view field, double value, double minimum, double maximum) {
    if (!std::isfinite(value) || value < minimum || value > maximum) {
        throw ValidationError(fmt::format("{} must lie within [{}, {}], got {}", field, minimum, maximum, value));
    }
}

void check_coordinate(const GeodeticCoordinate& coordinate) {
    check_range("latitude", coordinate.latitude_deg, k_min_latitude_deg, k_max_latitude_deg);
    check_range("longitude", coordinate.longitude_deg, k_min_longitude_deg, k_max_longitude_deg);
    check_range("altitude", coordinate.altitude_m, k_min_command_altitude_m, k_max_command_altitude_m);
}

double require(const std::optional<double>& value, std::string_view field, std::string_view command) {
    if (!value.has_value()) {
        throw ValidationError(fmt::format("{} requires parameter {}", command, field));
    }
    return value.value();
}

}  // namespace

std::string_view to_string(CommandErrorKind kind) noexcept {
    switch (kind) {
        case CommandErrorKind::Validation:
            return "validation";
        case CommandErrorKind::Precondition:
            return "precondition";
        case CommandErrorKind::Unavailable:
            return "unavailable";
        case CommandErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

std::string_view command_name(const Command& command) noexcept {
    return std::visit(
        overloaded{
            [](const ArmCommand&) { return std::string_view{"arm"}; },
            [](const DisarmCommand&) { return std::string_view{"disarm"}; },
            [](const TakeoffCommand&) { return std::string_view{"takeoff"}; },
            [](const LandCommand&) { return std::string_view{"land"}; },
            [](const GotoCommand&) { return std::string_view{"goto"}; },
            [](const StartMissionCommand&) { return std::string_view{"start_mission"}; },
            [](const ReturnHomeCommand&) { return std::string_view{"return_home"}; },
            [](const EmergencyStopCommand&) { return std::string_view{"emergency_stop"}; },
        },
        command
    );
}

Command parse_command(std::string_view name, const CommandParams& params) {
    Command command;
    if (name == "arm") {
        command = ArmCommand{};
    } else if (name == "disarm") {
        command = DisarmCommand{};
    } else if (name == "takeoff") {
        command = TakeoffCommand{params.altitude.value_or(k_default_takeoff_altitude_m)};
    } else if (name == "land") {
        command = LandCommand{};
    } else if (name == "goto") {
        command = GotoCommand{GeodeticCoordinate{
            require(params.latitude, "latitude", name),
            require(params.longitude, "longitude", name),
            require(params.altitude, "altitude", name)
        }};
    } else if (name == "start_mission") {
        if (!params.waypoints.has_value()) {
            throw ValidationError("start_mission requires parameter waypoints");
        }
        command = StartMissionCommand{params.waypoints.value()};
    } else if (name == "return_home") {
        command = ReturnHomeCommand{};
    } else if (name == "emergency_stop") {
        command = EmergencyStopCommand{};
    } else {
        throw ValidationError(fmt::format("Unknown command: {}", name));
    }
    validate_command(command);
    return command;
}

void validate_command(const Command& command) {
    std::visit(
        overloaded{
            [](const TakeoffCommand& takeoff) {
                check_range("altitude", takeoff.altitude_m, k_min_command_altitude_m, k_max_command_altitude_m);
            },
            [](const GotoCommand& go) { check_coordinate(go.target); },
            [](const StartMissionCommand& mission) {
                if (mission.waypoints.empty()) {
                    throw ValidationError("start_mission requires at least one waypoint");
                }
                for (const GeodeticCoordinate& waypoint : mission.waypoints) {
                    check_coordinate(waypoint);
                }
            },
            [](const auto&) {},
        },
        command
    );
}

CommandRouter::CommandRouter(StateSimulator& simulator)
    : simulator_(simulator),
      logger_(get_logger()) {}

CommandResult CommandRouter::execute(std::string_view command, const CommandParams& params) {
    if (!flag_accepting_.load()) {
        return make_result(command, false, "Command router is shutting down", CommandErrorKind::Unavailable);
    }
    try {
        return execute(parse_command(command, params));
    } catch (const ValidationError& exc) {
        return make_result(command, false, exc.what(), CommandErrorKind::Validation);
    }
}

CommandResult CommandRouter::execute(const Command& command) {
    const std::string_view name = command_name(command);
    if (!flag_accepting_.load()) {
        return make_result(name, false, "Command router is shutting down", CommandErrorKind::Unavailable);
    }
    try {
        validate_command(command);
        std::string message = dispatch(command);
        simulator_.publish_snapshot();
        return make_result(name, true, std::move(message), std::nullopt);
    } catch (const ValidationError& exc) {
        return make_result(name, false, exc.what(), CommandErrorKind::Validation);
    } catch (const PreconditionError& exc) {
        return make_result(name, false, exc.what(), CommandErrorKind::Precondition);
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"router","command":"{}","error":"{}"}})", name, exc.what());
        return make_result(name, false, fmt::format("Command failed: {}", exc.what()), CommandErrorKind::Internal);
    }
}

void CommandRouter::stop_accepting() noexcept {
    flag_accepting_.store(false);
}

bool CommandRouter::accepting() const noexcept {
    return flag_accepting_.load();
}

std::string CommandRouter::dispatch(const Command& command) {
    return std::visit(
        overloaded{
            [this](const ArmCommand&) { return simulator_.arm(); },
            [this](const DisarmCommand&) { return simulator_.disarm(); },
            [this](const TakeoffCommand& takeoff) { return simulator_.takeoff(takeoff.altitude_m); },
            [this](const LandCommand&) { return simulator_.land(); },
            [this](const GotoCommand& go) { return simulator_.goto_position(go.target); },
            [this](const StartMissionCommand& mission) { return simulator_.start_mission(mission.waypoints); },
            [this](const ReturnHomeCommand&) { return simulator_.return_home(); },
            [this](const EmergencyStopCommand&) { return simulator_.emergency_stop(); },
        },
        command
    );
}

CommandResult CommandRouter::make_result(std::string_view command, bool success, std::string message, std::optional<CommandErrorKind> error) const {
    CommandResult result{};
    result.command = std::string{command};
    result.success = success;
    result.message = std::move(message);
    result.error = error;
    result.timestamp = WallClock::now();

    if (success) {
        logger_->info(R"({{"component":"router","command":"{}","success":true,"message":"{}"}})", command, result.message);
    } else {
        logger_->warn(
            R"({{"component":"router","command":"{}","success":false,"error":"{}","message":"{}"}})",
            command,
            to_string(error.value_or(CommandErrorKind::Internal)),
            result.message
        );
    }
    return result;
}

}  // namespace drone_relay
