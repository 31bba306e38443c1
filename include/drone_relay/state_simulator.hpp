// === State Simulator =========================================================
//
// Sole owner of the DroneState. A fixed-period tick advances missions, applies
// hover jitter and battery drain, raises alerts and publishes a snapshot. The
// mutation entry points implement the flight-mode state machine:
//
//   DISARMED <-> ARMED -> GUIDED (flying) -> {RTL | LAND} -> DISARMED
//   EMERGENCY is reachable from any mode and left only through disarm().
//
// Illegal transitions throw PreconditionError. Every access to the state goes
// through one timed mutex; other components only ever see snapshot copies.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "drone_relay/broadcast_hub.hpp"
#include "drone_relay/drone_state.hpp"
#include "drone_relay/hardware_adapter.hpp"
#include "drone_relay/periodic_task.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/**
 * @brief Tunable parameters of the simulation.
 *
 * Step sizes and arrival tolerances are plain per-tick constants in degrees
 * and metres; they carry no physical derivation and are meant to be tuned.
 */
struct SimulatorConfig final {
    Duration tick_period{Duration{1.0}};                       /**< Interval between ticks. */
    double drain_rate_percent_per_minute{0.1};                 /**< Battery drain while flying. */
    double initial_battery_percent{100.0};                     /**< Battery at process start. */
    double step_deg{0.00005};                                  /**< Per-tick latitude/longitude step toward a waypoint. */
    double altitude_step_m{1.0};                               /**< Per-tick altitude step toward a waypoint. */
    double arrival_tolerance_deg{0.0001};                      /**< Horizontal arrival tolerance per axis. */
    double arrival_tolerance_alt_m{2.0};                       /**< Vertical arrival tolerance. */
    double hover_drift_deg{0.00001};                           /**< Hover jitter bound per horizontal axis. */
    double hover_altitude_drift_m{0.5};                        /**< Hover jitter bound in altitude. */
    double heading_jitter_deg{2.0};                            /**< Heading change bound per tick. */
    double low_battery_percent{20.0};                          /**< Threshold of the low-battery warning. */
    double min_arm_battery_percent{15.0};                      /**< Arming is refused below this level. */
    GeodeticCoordinate home{33.6844, 73.0479, 0.0};            /**< Start and return-home position. */
    std::size_t snapshot_alert_count{10};                      /**< Alerts carried by each snapshot. */
    Duration lock_timeout{Duration{5.0}};                      /**< Longest wait for the state lock before aborting. */
    std::optional<std::uint32_t> seed{};                       /**< Fixed seed for reproducible jitter. */
};

class StateSimulator final {
  public:
    StateSimulator(SimulatorConfig config, HardwareAdapter& hardware, BroadcastHub& hub, ShutdownSignal& shutdown_signal);
    ~StateSimulator();

    StateSimulator(const StateSimulator&) = delete;
    StateSimulator& operator=(const StateSimulator&) = delete;

    /** @brief Launch the periodic tick task. */
    void start();
    /** @brief Stop the tick task after its current iteration. */
    void stop();

    /** @brief Advance the simulation by one tick and publish the result. */
    void tick();

    /** @brief Arm the motors. Fails below the minimum arming battery. */
    std::string arm();
    /** @brief Disarm. Fails while flying; clears an emergency latch. */
    std::string disarm();
    /** @brief Climb to @p altitude_m. Requires armed and on the ground. */
    std::string takeoff(double altitude_m);
    /** @brief Land in place and clear any mission. Requires flying. */
    std::string land();
    /** @brief Fly to a single waypoint. Requires flying. */
    std::string goto_position(const GeodeticCoordinate& target);
    /** @brief Fly a multi-waypoint mission from its first waypoint. Requires flying. */
    std::string start_mission(const std::vector<GeodeticCoordinate>& waypoints);
    /** @brief Fly back to the home position and land there. Requires flying. */
    std::string return_home();
    /** @brief Kill the flight unconditionally and latch EMERGENCY. Never fails. */
    std::string emergency_stop();

    /** @brief Copy of the current state. */
    [[nodiscard]] TelemetrySnapshot snapshot() const;
    /** @brief Copy of every retained alert, oldest first. */
    [[nodiscard]] std::vector<Alert> alerts() const;
    /** @brief Publish the current snapshot on the telemetry channel outside the tick cadence. */
    void publish_snapshot();

    [[nodiscard]] const SimulatorConfig& config() const noexcept;

  private:
    std::unique_lock<std::timed_mutex> lock_state() const;
    TelemetrySnapshot make_snapshot_locked() const;
    void raise_alert_locked(std::string message, AlertSeverity severity, std::string type = "general");
    void advance_mission_locked();
    void apply_hover_locked(const TelemetrySample& hardware_sample);
    void apply_battery_locked();
    void clear_mission_locked();
    void touch_down_locked();
    void publish_pending_alerts();

    SimulatorConfig config_;
    HardwareAdapter& hardware_;
    BroadcastHub& hub_;
    PeriodicTask tick_task_;
    mutable std::timed_mutex state_mutex_;
    DroneState state_;
    mutable std::uint64_t snapshot_sequence_{0};
    bool flag_low_battery_warned_{false};
    bool flag_battery_depleted_{false};
    std::mt19937 random_engine_;
    std::vector<Alert> list_pending_alerts_;
    std::mutex alert_publish_mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
