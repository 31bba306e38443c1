#include "drone_relay/state_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <numbers>
#include <stdexcept>

#include <fmt/format.h>

#include "drone_relay/errors.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/messages.hpp"

namespace drone_relay {

namespace {

constexpr double k_earth_radius_m{6'371'000.0};   /**< Mean Earth radius used for geodesic calculations. */
constexpr double k_max_battery_percent{100.0};
constexpr double k_seconds_per_minute{60.0};
constexpr char k_alert_type_low_battery[] = "low_battery";
constexpr char k_alert_type_battery_depleted[] = "battery_depleted";
constexpr char k_alert_type_mission[] = "mission";
constexpr char k_alert_type_emergency[] = "emergency";

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

/**
 * @brief Determine the great-circle distance separating two coordinates.
 */
double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

/**
 * @brief Move @p current by at most @p step toward @p target, landing on it when close enough.
 */
double step_towards(double current, double target, double step) {
    const double delta = target - current;
    if (std::abs(delta) <= step) {
        return target;
    }
    return current + (delta > 0.0 ? step : -step);
}

double wrap_heading(double heading_deg) {
    const double wrapped = std::fmod(heading_deg, 360.0);
    if (wrapped >= 0.0) {
        return wrapped;
    }
    // A tiny negative remainder rounds up to exactly 360 when shifted.
    const double shifted = wrapped + 360.0;
    return shifted < 360.0 ? shifted : 0.0;
}

std::mt19937 make_engine(const std::optional<std::uint32_t>& seed) {
    if (seed.has_value()) {
        return std::mt19937{seed.value()};
    }
    std::random_device device;
    return std::mt19937{device()};
}

void validate_config(const SimulatorConfig& config) {
    if (config.tick_period.count() <= 0.0) {
        throw std::invalid_argument("Simulator tick period must be positive");
    }
    if (config.drain_rate_percent_per_minute < 0.0) {
        throw std::invalid_argument("Battery drain rate cannot be negative");
    }
    if (config.initial_battery_percent < 0.0 || config.initial_battery_percent > k_max_battery_percent) {
        throw std::invalid_argument("Initial battery must lie within [0, 100]");
    }
    if (config.step_deg <= 0.0 || config.altitude_step_m <= 0.0) {
        throw std::invalid_argument("Mission step sizes must be positive");
    }
    if (config.arrival_tolerance_deg <= 0.0 || config.arrival_tolerance_alt_m <= 0.0) {
        throw std::invalid_argument("Arrival tolerances must be positive");
    }
    if (config.hover_drift_deg < 0.0 || config.hover_altitude_drift_m < 0.0 || config.heading_jitter_deg < 0.0) {
        throw std::invalid_argument("Jitter bounds cannot be negative");
    }
    if (config.lock_timeout.count() <= 0.0) {
        throw std::invalid_argument("State lock timeout must be positive");
    }
}

}  // namespace

StateSimulator::StateSimulator(SimulatorConfig config, HardwareAdapter& hardware, BroadcastHub& hub, ShutdownSignal& shutdown_signal)
    : config_(std::move(config)),
      hardware_(hardware),
      hub_(hub),
      tick_task_("simulator-tick", config_.tick_period, [this]() { tick(); }, shutdown_signal),
      random_engine_(make_engine(config_.seed)),
      logger_(get_logger()) {
    validate_config(config_);
    state_.position = config_.home;
    state_.battery_percent = config_.initial_battery_percent;
    state_.mode = FlightMode::Disarmed;
    logger_->info(
        "State simulator ready at {:.6f},{:.6f} with battery {:.1f}%",
        state_.position.latitude_deg,
        state_.position.longitude_deg,
        state_.battery_percent
    );
}

StateSimulator::~StateSimulator() {
    stop();
}

void StateSimulator::start() {
    tick_task_.start();
}

void StateSimulator::stop() {
    tick_task_.stop();
}

/**
 * @brief One simulation step: motion, heading, battery, then publication.
 */
void StateSimulator::tick() {
    const TelemetrySample hardware_sample = hardware_.sample();
    TelemetrySnapshot snapshot;
    {
        auto lock = lock_state();
        state_.satellites = hardware_sample.satellites;
        state_.hardware_simulated = hardware_sample.simulated;

        const GeodeticCoordinate previous_position = state_.position;
        if (state_.flying && state_.mission.has_value() && state_.mission->active) {
            advance_mission_locked();
        } else if (state_.flying) {
            apply_hover_locked(hardware_sample);
        }

        std::uniform_real_distribution<double> heading_delta(-config_.heading_jitter_deg, config_.heading_jitter_deg);
        state_.heading_deg = wrap_heading(state_.heading_deg + heading_delta(random_engine_));

        if (state_.flying) {
            state_.speed_mps = haversine_distance_m(previous_position, state_.position) / config_.tick_period.count();
            state_.flight_time_s += config_.tick_period.count();
            apply_battery_locked();
        } else {
            state_.speed_mps = 0.0;
        }
        snapshot = make_snapshot_locked();
    }
    logger_->debug(
        "Tick {}: mode={} pos={:.6f},{:.6f},{:.1f} battery={:.2f}",
        snapshot.sequence,
        to_string(snapshot.mode),
        snapshot.position.latitude_deg,
        snapshot.position.longitude_deg,
        snapshot.position.altitude_m,
        snapshot.battery_percent
    );
    publish_pending_alerts();
    hub_.publish(Channel::Telemetry, std::move(snapshot));
}

std::string StateSimulator::arm() {
    std::string message;
    {
        auto lock = lock_state();
        if (state_.mode == FlightMode::Emergency) {
            throw PreconditionError("Emergency stop is latched; disarm before arming");
        }
        if (state_.armed) {
            throw PreconditionError("Drone is already armed");
        }
        if (state_.battery_percent < config_.min_arm_battery_percent) {
            throw PreconditionError(fmt::format("Battery too low to arm ({:.1f}%)", state_.battery_percent));
        }
        state_.armed = true;
        state_.mode = FlightMode::Armed;
        message = "Drone armed successfully";
        raise_alert_locked(message, AlertSeverity::Info);
    }
    publish_pending_alerts();
    return message;
}

std::string StateSimulator::disarm() {
    std::string message;
    {
        auto lock = lock_state();
        if (state_.flying) {
            throw PreconditionError("Cannot disarm while flying");
        }
        state_.armed = false;
        state_.mode = FlightMode::Disarmed;
        message = "Drone disarmed successfully";
        raise_alert_locked("Drone disarmed", AlertSeverity::Info);
    }
    publish_pending_alerts();
    return message;
}

std::string StateSimulator::takeoff(double altitude_m) {
    std::string message;
    {
        auto lock = lock_state();
        if (!state_.armed) {
            throw PreconditionError("Drone must be armed first");
        }
        if (state_.flying) {
            throw PreconditionError("Drone is already flying");
        }
        if (state_.mode != FlightMode::Armed) {
            throw PreconditionError("Disarm and re-arm after landing before taking off again");
        }
        state_.flying = true;
        state_.position.altitude_m = altitude_m;
        state_.mode = FlightMode::Guided;
        message = fmt::format("Taking off to {}m", altitude_m);
        raise_alert_locked(fmt::format("Takeoff to {}m initiated", altitude_m), AlertSeverity::Info);
    }
    publish_pending_alerts();
    return message;
}

std::string StateSimulator::land() {
    std::string message;
    {
        auto lock = lock_state();
        if (!state_.flying) {
            throw PreconditionError("Drone is not flying");
        }
        touch_down_locked();
        message = "Landing initiated";
        raise_alert_locked(message, AlertSeverity::Info);
    }
    publish_pending_alerts();
    return message;
}

std::string StateSimulator::goto_position(const GeodeticCoordinate& target) {
    std::string message;
    {
        auto lock = lock_state();
        if (!state_.flying) {
            throw PreconditionError("Drone must be flying");
        }
        const double distance_m = haversine_distance_m(state_.position, target);
        Mission mission{};
        mission.waypoints.push_back(target);
        mission.active = true;
        state_.mission = std::move(mission);
        state_.mode = FlightMode::Guided;
        message = fmt::format("Navigating to position (distance: {:.1f}m)", distance_m);
    }
    logger_->info("{}", message);
    return message;
}

std::string StateSimulator::start_mission(const std::vector<GeodeticCoordinate>& waypoints) {
    if (waypoints.empty()) {
        throw ValidationError("Mission requires at least one waypoint");
    }
    std::string message;
    {
        auto lock = lock_state();
        if (!state_.flying) {
            throw PreconditionError("Drone must be flying to start mission");
        }
        Mission mission{};
        mission.waypoints = waypoints;
        mission.active = true;
        state_.mission = std::move(mission);
        state_.mode = FlightMode::Guided;
        message = fmt::format("Mission started with {} waypoints", waypoints.size());
        raise_alert_locked(message, AlertSeverity::Info, k_alert_type_mission);
    }
    publish_pending_alerts();
    return message;
}

std::string StateSimulator::return_home() {
    std::string message;
    {
        auto lock = lock_state();
        if (!state_.flying) {
            throw PreconditionError("Drone must be flying to return home");
        }
        const GeodeticCoordinate home_target{
            config_.home.latitude_deg,
            config_.home.longitude_deg,
            state_.position.altitude_m
        };
        Mission mission{};
        mission.waypoints.push_back(home_target);
        mission.active = true;
        mission.return_to_home = true;
        state_.mission = std::move(mission);
        state_.mode = FlightMode::Rtl;
        message = "Returning to home";
        raise_alert_locked(message, AlertSeverity::Info, k_alert_type_mission);
    }
    publish_pending_alerts();
    return message;
}

std::string StateSimulator::emergency_stop() {
    std::string message;
    {
        auto lock = lock_state();
        state_.flying = false;
        state_.armed = false;
        state_.speed_mps = 0.0;
        state_.mode = FlightMode::Emergency;
        clear_mission_locked();
        message = "Emergency stop activated";
        raise_alert_locked(message, AlertSeverity::Critical, k_alert_type_emergency);
    }
    logger_->warn(R"({{"component":"simulator","event":"emergency_stop"}})");
    publish_pending_alerts();
    return message;
}

TelemetrySnapshot StateSimulator::snapshot() const {
    auto lock = lock_state();
    return make_snapshot_locked();
}

std::vector<Alert> StateSimulator::alerts() const {
    auto lock = lock_state();
    return std::vector<Alert>(state_.alerts.entries().begin(), state_.alerts.entries().end());
}

void StateSimulator::publish_snapshot() {
    TelemetrySnapshot current = snapshot();
    hub_.publish(Channel::Telemetry, std::move(current));
}

const SimulatorConfig& StateSimulator::config() const noexcept {
    return config_;
}

/**
 * @brief Take the state lock; failing to get it within the bound means a deadlock.
 */
std::unique_lock<std::timed_mutex> StateSimulator::lock_state() const {
    std::unique_lock<std::timed_mutex> lock(state_mutex_, std::defer_lock);
    const auto timeout = std::chrono::duration_cast<SteadyClock::duration>(config_.lock_timeout);
    if (!lock.try_lock_for(timeout)) {
        logger_->critical(
            R"({{"component":"simulator","event":"state_lock_timeout","timeout_s":{}}})",
            config_.lock_timeout.count()
        );
        logger_->flush();
        std::terminate();
    }
    return lock;
}

TelemetrySnapshot StateSimulator::make_snapshot_locked() const {
    TelemetrySnapshot snapshot{};
    snapshot.timestamp = WallClock::now();
    snapshot.sequence = ++snapshot_sequence_;
    snapshot.armed = state_.armed;
    snapshot.flying = state_.flying;
    snapshot.mode = state_.mode;
    snapshot.position = state_.position;
    snapshot.heading_deg = state_.heading_deg;
    snapshot.speed_mps = state_.speed_mps;
    snapshot.battery_percent = state_.battery_percent;
    if (state_.mission.has_value()) {
        snapshot.mission = MissionProgress{
            state_.mission->cursor,
            state_.mission->waypoints.size(),
            state_.mission->active
        };
    }
    snapshot.alerts = state_.alerts.recent(config_.snapshot_alert_count);
    snapshot.flight_time_s = state_.flight_time_s;
    snapshot.satellites = state_.satellites;
    snapshot.hardware_simulated = state_.hardware_simulated;
    return snapshot;
}

void StateSimulator::raise_alert_locked(std::string message, AlertSeverity severity, std::string type) {
    const Alert& alert = state_.alerts.push(std::move(message), severity, std::move(type));
    list_pending_alerts_.push_back(alert);
}

/**
 * @brief Step toward the current waypoint and advance the cursor on arrival.
 */
void StateSimulator::advance_mission_locked() {
    Mission& mission = state_.mission.value();
    if (mission.cursor >= mission.waypoints.size()) {
        mission.active = false;
        return;
    }
    const GeodeticCoordinate& target = mission.waypoints[mission.cursor];
    GeodeticCoordinate& position = state_.position;
    position.latitude_deg = step_towards(position.latitude_deg, target.latitude_deg, config_.step_deg);
    position.longitude_deg = step_towards(position.longitude_deg, target.longitude_deg, config_.step_deg);
    position.altitude_m = step_towards(position.altitude_m, target.altitude_m, config_.altitude_step_m);

    const bool arrived = std::abs(target.latitude_deg - position.latitude_deg) < config_.arrival_tolerance_deg
        && std::abs(target.longitude_deg - position.longitude_deg) < config_.arrival_tolerance_deg
        && std::abs(target.altitude_m - position.altitude_m) < config_.arrival_tolerance_alt_m;
    if (!arrived) {
        return;
    }

    ++mission.cursor;
    logger_->info("Reached waypoint {}/{}", mission.cursor, mission.waypoints.size());
    if (mission.cursor < mission.waypoints.size()) {
        return;
    }

    mission.active = false;
    if (mission.return_to_home) {
        touch_down_locked();
        raise_alert_locked("Returned to home and landed", AlertSeverity::Info, k_alert_type_mission);
        return;
    }
    raise_alert_locked("Mission completed successfully", AlertSeverity::Info, k_alert_type_mission);
}

/**
 * @brief Hold position: follow a live GPS fix when one exists, otherwise jitter.
 */
void StateSimulator::apply_hover_locked(const TelemetrySample& hardware_sample) {
    if (hardware_sample.valid && !hardware_sample.simulated) {
        state_.position.latitude_deg = hardware_sample.position.latitude_deg;
        state_.position.longitude_deg = hardware_sample.position.longitude_deg;
        return;
    }
    std::uniform_real_distribution<double> horizontal(-config_.hover_drift_deg, config_.hover_drift_deg);
    std::uniform_real_distribution<double> vertical(-config_.hover_altitude_drift_m, config_.hover_altitude_drift_m);
    state_.position.latitude_deg += horizontal(random_engine_);
    state_.position.longitude_deg += horizontal(random_engine_);
    state_.position.altitude_m = std::max(0.0, state_.position.altitude_m + vertical(random_engine_));
}

void StateSimulator::apply_battery_locked() {
    const double drain = config_.drain_rate_percent_per_minute / k_seconds_per_minute * config_.tick_period.count();
    state_.battery_percent = std::clamp(state_.battery_percent - drain, 0.0, k_max_battery_percent);

    if (!flag_low_battery_warned_ && state_.battery_percent < config_.low_battery_percent) {
        flag_low_battery_warned_ = true;
        raise_alert_locked("Low battery warning", AlertSeverity::Warning, k_alert_type_low_battery);
        logger_->warn(R"({{"component":"simulator","event":"low_battery","battery":{:.2f}}})", state_.battery_percent);
    }
    if (!flag_battery_depleted_ && state_.battery_percent <= 0.0) {
        flag_battery_depleted_ = true;
        raise_alert_locked("Battery depleted", AlertSeverity::Critical, k_alert_type_battery_depleted);
    }
}

void StateSimulator::clear_mission_locked() {
    state_.mission.reset();
}

void StateSimulator::touch_down_locked() {
    state_.flying = false;
    state_.position.altitude_m = 0.0;
    state_.speed_mps = 0.0;
    state_.mode = FlightMode::Land;
    clear_mission_locked();
}

/**
 * @brief Relay alerts raised under the state lock to the alerts channel, in id order.
 */
void StateSimulator::publish_pending_alerts() {
    std::scoped_lock publish_lock(alert_publish_mutex_);
    std::vector<Alert> list_alerts;
    {
        auto lock = lock_state();
        list_alerts.swap(list_pending_alerts_);
    }
    for (Alert& alert : list_alerts) {
        hub_.publish(Channel::Alerts, AlertEvent{std::move(alert)});
    }
}

}  // namespace drone_relay
