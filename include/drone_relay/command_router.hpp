// === Command Router ==========================================================
//
// Entry point for operator commands. Raw {command, params} requests are parsed
// into typed commands and range-checked before the simulator is touched; the
// simulator's verdict comes back as a CommandResult. Nothing thrown below this
// layer escapes execute().

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/logger.h>

#include "drone_relay/state_simulator.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

inline constexpr double k_min_latitude_deg{-90.0};
inline constexpr double k_max_latitude_deg{90.0};
inline constexpr double k_min_longitude_deg{-180.0};
inline constexpr double k_max_longitude_deg{180.0};
inline constexpr double k_min_command_altitude_m{1.0};
inline constexpr double k_max_command_altitude_m{100.0};
inline constexpr double k_default_takeoff_altitude_m{10.0};

struct ArmCommand final {};
struct DisarmCommand final {};
struct TakeoffCommand final {
    double altitude_m{k_default_takeoff_altitude_m};
};
struct LandCommand final {};
struct GotoCommand final {
    GeodeticCoordinate target{};
};
struct StartMissionCommand final {
    std::vector<GeodeticCoordinate> waypoints{};
};
struct ReturnHomeCommand final {};
struct EmergencyStopCommand final {};

using Command = std::variant<
    ArmCommand,
    DisarmCommand,
    TakeoffCommand,
    LandCommand,
    GotoCommand,
    StartMissionCommand,
    ReturnHomeCommand,
    EmergencyStopCommand>;

/** @brief Untyped parameters as received from the transport layer. */
struct CommandParams final {
    std::optional<double> altitude{};
    std::optional<double> latitude{};
    std::optional<double> longitude{};
    std::optional<std::vector<GeodeticCoordinate>> waypoints{};
};

/** @brief Failure classes reported in a CommandResult. */
enum class CommandErrorKind {
    Validation,   /**< Malformed or out-of-range parameters. */
    Precondition, /**< Illegal for the current vehicle state. */
    Unavailable,  /**< Router is shutting down. */
    Internal      /**< Unexpected failure inside the simulator. */
};

[[nodiscard]] std::string_view to_string(CommandErrorKind kind) noexcept;

/** @brief Structured response returned for every command. */
struct CommandResult final {
    std::string command{};
    bool success{};
    std::string message{};
    std::optional<CommandErrorKind> error{};
    WallTime timestamp{};
};

/** @brief Wire name of a typed command. */
[[nodiscard]] std::string_view command_name(const Command& command) noexcept;

/**
 * @brief Build and range-check a typed command.
 * @throws ValidationError for unknown names, missing or out-of-range parameters.
 */
[[nodiscard]] Command parse_command(std::string_view name, const CommandParams& params);

/** @brief Range-check an already typed command. @throws ValidationError */
void validate_command(const Command& command);

class CommandRouter final {
  public:
    explicit CommandRouter(StateSimulator& simulator);

    /** @brief Parse, validate and apply a raw command. */
    CommandResult execute(std::string_view command, const CommandParams& params);
    /** @brief Validate and apply a typed command. */
    CommandResult execute(const Command& command);

    /** @brief Refuse every further command; used during shutdown. */
    void stop_accepting() noexcept;
    [[nodiscard]] bool accepting() const noexcept;

  private:
    std::string dispatch(const Command& command);
    CommandResult make_result(std::string_view command, bool success, std::string message, std::optional<CommandErrorKind> error) const;

    StateSimulator& simulator_;
    std::atomic<bool> flag_accepting_{true};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
