// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the relay (time primitives, geodetic coordinates, flight modes, alert
// severities).

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace drone_relay {

/**
 * @brief Alias for the steady clock used for scheduling and staleness checks.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for wall-clock timestamps carried in published messages.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for wall-clock timestamps.
 */
using WallTime = std::chrono::time_point<WallClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude/altitude triplet in degrees/metres.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
    double altitude_m{};     /**< Altitude in metres above the take-off point. */
};

/**
 * @brief Flight modes of the vehicle state machine.
 */
enum class FlightMode {
    Disarmed,   /**< Motors disarmed, on the ground. */
    Armed,      /**< Motors armed, awaiting take-off. */
    Guided,     /**< Airborne under command control. */
    Rtl,        /**< Airborne, returning to the home position. */
    Land,       /**< Landed, motors still armed. */
    Emergency   /**< Emergency stop latched until an explicit disarm. */
};

/**
 * @brief Severity attached to operator alerts.
 */
enum class AlertSeverity {
    Info,
    Warning,
    Critical
};

[[nodiscard]] std::string_view to_string(FlightMode mode) noexcept;
[[nodiscard]] std::string_view to_string(AlertSeverity severity) noexcept;

}  // namespace drone_relay
