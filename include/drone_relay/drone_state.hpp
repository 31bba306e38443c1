#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "drone_relay/alert_log.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/**
 * @brief Ordered waypoint list plus the index of the next unreached waypoint.
 */
struct Mission final {
    std::vector<GeodeticCoordinate> waypoints{}; /**< Targets in visiting order. */
    std::size_t cursor{};                        /**< Index of the next unreached waypoint. */
    bool active{};                               /**< False once every waypoint has been reached. */
    bool return_to_home{};                       /**< Mission was installed by a return-home command. */
};

/**
 * @brief Mutable record of truth for the vehicle. Owned by StateSimulator only.
 */
struct DroneState final {
    bool armed{};                                  /**< Motors armed. */
    bool flying{};                                 /**< Airborne. */
    FlightMode mode{FlightMode::Disarmed};         /**< Current state-machine mode. */
    GeodeticCoordinate position{};                 /**< Current position. */
    double heading_deg{};                          /**< Heading in [0, 360). */
    double speed_mps{};                            /**< Ground speed, never negative. */
    double battery_percent{100.0};                 /**< Remaining battery in [0, 100]. */
    std::optional<Mission> mission{};              /**< Installed mission, if any. */
    AlertLog alerts{};                             /**< Most recent alerts, newest last. */
    double flight_time_s{};                        /**< Seconds spent airborne this session. */
    unsigned satellites{};                         /**< Satellites reported by the last hardware sample. */
    bool hardware_simulated{true};                 /**< Hardware runs on synthetic data. */
};

/** @brief Mission progress as published to subscribers. */
struct MissionProgress final {
    std::size_t cursor{};
    std::size_t total{};
    bool active{};
};

/**
 * @brief Immutable copy of DroneState published on the telemetry channel.
 *
 * Holds values only; it never references storage owned by the simulator.
 */
struct TelemetrySnapshot final {
    WallTime timestamp{};
    std::uint64_t sequence{};                    /**< Monotonic per-simulator snapshot counter. */
    bool armed{};
    bool flying{};
    FlightMode mode{FlightMode::Disarmed};
    GeodeticCoordinate position{};
    double heading_deg{};
    double speed_mps{};
    double battery_percent{};
    std::optional<MissionProgress> mission{};    /**< Empty when no mission is installed. */
    std::vector<Alert> alerts{};                 /**< Up to the ten newest alerts. */
    double flight_time_s{};
    unsigned satellites{};
    bool hardware_simulated{};
};

}  // namespace drone_relay
