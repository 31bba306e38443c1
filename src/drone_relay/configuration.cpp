// === Configuration Loader ====================================================
//
// Translates environment variables into the Configuration consumed by the
// relay runtime. Unparseable or out-of-range values fall back to their
// defaults and are reported through the logger.
//
// The loader never reads from disk; callers populate the process environment
// ahead of time (a shell-sourced `.env` or a service unit).

#include "drone_relay/configuration.hpp"

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>

#include "drone_relay/logging.hpp"

namespace drone_relay {

namespace {
constexpr double k_default_tick_hz{1.0};
constexpr double k_default_gps_timeout_s{5.0};
constexpr std::string_view k_default_log_directory{"logs"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* variable, double fallback, bool allow_negative = false) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return allow_negative ? parsed_value : clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from {}; using fallback {}", variable, fallback);
        return fallback;
    }
}

std::optional<std::uint32_t> parse_seed() {
    const char* raw_value = std::getenv("DRONE_RELAY_SEED");
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint32_t>(std::stoul(raw_value));
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse DRONE_RELAY_SEED; using a random seed");
        return std::nullopt;
    }
}

std::string parse_string(const char* variable, std::string_view fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    LoggingOptions& logging = config.logging;
    logging.directory = parse_string("DRONE_RELAY_LOG_DIR", k_default_log_directory);
    const std::string str_console_level = parse_string("DRONE_RELAY_LOG_LEVEL", "");
    const std::string str_file_level = parse_string("DRONE_RELAY_LOG_FILE_LEVEL", "");
    const std::optional<spdlog::level::level_enum> file_level = parse_log_level(str_file_level);
    if (file_level.has_value()) {
        logging.file_level = file_level.value();
    }

    auto logger = initialize_logger(logging);
    if (!str_file_level.empty() && !file_level.has_value()) {
        logger->warn("Unknown DRONE_RELAY_LOG_FILE_LEVEL {}; keeping {}", str_file_level, spdlog::level::to_string_view(logging.file_level));
    }
    if (!str_console_level.empty() && set_log_level(str_console_level)) {
        logging.console_level = console_log_level();
    }
    logger->info("Loading configuration from environment");

    const double tick_hz = parse_double("DRONE_RELAY_TICK_HZ", k_default_tick_hz);
    SimulatorConfig& simulator = config.simulator;
    simulator.tick_period = Duration{1.0 / tick_hz};
    simulator.drain_rate_percent_per_minute = parse_double("DRONE_RELAY_DRAIN_RATE", simulator.drain_rate_percent_per_minute);
    simulator.step_deg = parse_double("DRONE_RELAY_STEP_DEG", simulator.step_deg);
    simulator.altitude_step_m = parse_double("DRONE_RELAY_ALT_STEP_M", simulator.altitude_step_m);
    simulator.arrival_tolerance_deg = parse_double("DRONE_RELAY_ARRIVAL_TOL_DEG", simulator.arrival_tolerance_deg);
    simulator.arrival_tolerance_alt_m = parse_double("DRONE_RELAY_ARRIVAL_TOL_ALT_M", simulator.arrival_tolerance_alt_m);
    simulator.home.latitude_deg = parse_double("DRONE_RELAY_HOME_LAT", simulator.home.latitude_deg, true);
    simulator.home.longitude_deg = parse_double("DRONE_RELAY_HOME_LNG", simulator.home.longitude_deg, true);
    if (simulator.home.latitude_deg < -90.0 || simulator.home.latitude_deg > 90.0
        || simulator.home.longitude_deg < -180.0 || simulator.home.longitude_deg > 180.0) {
        logger->warn("Home position out of range; using default");
        simulator.home = SimulatorConfig{}.home;
    }
    simulator.seed = parse_seed();

    HardwareConfig& hardware = config.hardware;
    hardware.gps_device = parse_string("DRONE_RELAY_GPS_DEVICE", "");
    const double gps_timeout_s = parse_double("DRONE_RELAY_GPS_TIMEOUT_S", k_default_gps_timeout_s);
    hardware.connect_timeout = Duration{gps_timeout_s};
    hardware.fix_timeout = Duration{gps_timeout_s};
    hardware.mock_base = GeodeticCoordinate{simulator.home.latitude_deg, simulator.home.longitude_deg, hardware.mock_base.altitude_m};
    hardware.seed = simulator.seed;

    logger->info(
        R"({{"event":"configuration_loaded","tick_hz":{},"drain_rate":{},"gps_device":"{}","home_lat":{},"home_lng":{}}})",
        tick_hz,
        simulator.drain_rate_percent_per_minute,
        hardware.gps_device.empty() ? "mock" : hardware.gps_device,
        simulator.home.latitude_deg,
        simulator.home.longitude_deg
    );

    return config;
}

}  // namespace drone_relay
