#include "drone_relay/hardware_adapter.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "drone_relay/errors.hpp"
#include "drone_relay/logging.hpp"

namespace drone_relay {

namespace {
constexpr unsigned k_mock_min_satellites{6};
constexpr unsigned k_mock_max_satellites{12};

std::mt19937 make_engine(const std::optional<std::uint32_t>& seed) {
    if (seed.has_value()) {
        return std::mt19937{seed.value()};
    }
    std::random_device device;
    return std::mt19937{device()};
}
}  // namespace

MockHardwareAdapter::MockHardwareAdapter(const HardwareConfig& config)
    : base_(config.mock_base),
      jitter_deg_(config.mock_jitter_deg),
      altitude_jitter_m_(config.mock_altitude_jitter_m),
      random_engine_(make_engine(config.seed)) {
    if (jitter_deg_ < 0.0 || altitude_jitter_m_ < 0.0) {
        throw std::invalid_argument("MockHardwareAdapter jitter cannot be negative");
    }
    latest_sample_.position = base_;
    latest_sample_.satellites = k_mock_min_satellites;
    latest_sample_.timestamp = WallClock::now();
    latest_sample_.valid = true;
    latest_sample_.simulated = true;
}

void MockHardwareAdapter::poll() {
    std::scoped_lock lock(mutex_);
    std::uniform_real_distribution<double> horizontal(-jitter_deg_, jitter_deg_);
    std::uniform_real_distribution<double> vertical(-altitude_jitter_m_, altitude_jitter_m_);
    std::uniform_int_distribution<unsigned> satellites(k_mock_min_satellites, k_mock_max_satellites);

    latest_sample_.position = GeodeticCoordinate{
        base_.latitude_deg + horizontal(random_engine_),
        base_.longitude_deg + horizontal(random_engine_),
        base_.altitude_m + vertical(random_engine_)
    };
    latest_sample_.satellites = satellites(random_engine_);
    latest_sample_.timestamp = WallClock::now();
}

TelemetrySample MockHardwareAdapter::sample() const {
    std::scoped_lock lock(mutex_);
    return latest_sample_;
}

bool MockHardwareAdapter::health() const {
    return true;
}

std::string_view MockHardwareAdapter::name() const noexcept {
    return "mock";
}

DeviceHardwareAdapter::DeviceHardwareAdapter(GpsSourcePtr source, Duration fix_timeout)
    : source_(std::move(source)),
      fix_timeout_(fix_timeout),
      last_fix_time_(SteadyClock::now()) {
    if (source_ == nullptr) {
        throw std::invalid_argument("DeviceHardwareAdapter requires a GPS source");
    }
    if (fix_timeout_.count() <= 0.0) {
        throw std::invalid_argument("DeviceHardwareAdapter fix timeout must be positive");
    }
}

void DeviceHardwareAdapter::poll() {
    const std::optional<GpsFix> optional_fix = source_->poll();
    const TimePoint now = SteadyClock::now();

    std::scoped_lock lock(mutex_);
    if (optional_fix.has_value()) {
        const GpsFix& fix = optional_fix.value();
        latest_sample_.position = GeodeticCoordinate{fix.latitude_deg, fix.longitude_deg, fix.altitude_m};
        latest_sample_.satellites = fix.satellites;
        latest_sample_.timestamp = fix.timestamp;
        latest_sample_.valid = true;
        latest_sample_.simulated = false;
        last_fix_time_ = now;
        return;
    }
    const Duration silence = now - last_fix_time_;
    if (silence > fix_timeout_) {
        throw HardwareDegradedError(fmt::format("No GPS fix from {} for {:.1f}s", source_->describe(), silence.count()));
    }
}

TelemetrySample DeviceHardwareAdapter::sample() const {
    std::scoped_lock lock(mutex_);
    return latest_sample_;
}

bool DeviceHardwareAdapter::health() const {
    std::scoped_lock lock(mutex_);
    const Duration silence = SteadyClock::now() - last_fix_time_;
    return latest_sample_.valid && silence <= fix_timeout_;
}

std::string_view DeviceHardwareAdapter::name() const noexcept {
    return "device";
}

HardwareLink::HardwareLink(HardwareAdapterPtr primary, std::unique_ptr<MockHardwareAdapter> fallback, bool degraded_at_start)
    : primary_(std::move(primary)),
      fallback_(std::move(fallback)),
      flag_use_fallback_(primary_ == nullptr || degraded_at_start),
      flag_degraded_(degraded_at_start),
      logger_(get_logger()) {
    if (fallback_ == nullptr) {
        throw std::invalid_argument("HardwareLink requires a fallback adapter");
    }
}

void HardwareLink::poll() {
    if (!flag_use_fallback_.load()) {
        try {
            primary_->poll();
            return;
        } catch (const HardwareDegradedError& exc) {
            degrade(exc.what());
        }
    }
    fallback_->poll();
}

TelemetrySample HardwareLink::sample() const {
    if (flag_use_fallback_.load()) {
        return fallback_->sample();
    }
    return primary_->sample();
}

bool HardwareLink::health() const {
    if (flag_use_fallback_.load()) {
        return fallback_->health();
    }
    return primary_->health();
}

std::string_view HardwareLink::name() const noexcept {
    if (flag_use_fallback_.load()) {
        return fallback_->name();
    }
    return primary_->name();
}

bool HardwareLink::degraded() const noexcept {
    return flag_degraded_.load();
}

bool HardwareLink::simulated() const noexcept {
    return flag_use_fallback_.load();
}

void HardwareLink::degrade(const std::string& reason) {
    if (flag_use_fallback_.exchange(true)) {
        return;
    }
    flag_degraded_.store(true);
    logger_->warn(R"({{"component":"hardware","event":"degraded","reason":"{}"}})", reason);
}

std::unique_ptr<HardwareLink> probe_hardware(const HardwareConfig& config, GpsSourcePtr source) {
    auto logger = get_logger();
    auto fallback = std::make_unique<MockHardwareAdapter>(config);
    if (source == nullptr) {
        logger->info("No GPS device configured; using mock hardware adapter");
        return std::make_unique<HardwareLink>(nullptr, std::move(fallback));
    }

    const std::string str_description = source->describe();
    try {
        source->open(config.connect_timeout);
    } catch (const std::exception& exc) {
        logger->warn(
            R"({{"component":"hardware","event":"degraded","device":"{}","reason":"{}"}})",
            str_description,
            exc.what()
        );
        return std::make_unique<HardwareLink>(nullptr, std::move(fallback), true);
    }

    logger->info("Using GPS device {}", str_description);
    auto device = std::make_unique<DeviceHardwareAdapter>(std::move(source), config.fix_timeout);
    return std::make_unique<HardwareLink>(std::move(device), std::move(fallback));
}

GpsSourcePtr make_gps_source(const HardwareConfig& config) {
    if (config.gps_device.empty()) {
        return nullptr;
    }
    return std::make_unique<NmeaSerialSource>(config.gps_device, config.baud_rate);
}

}  // namespace drone_relay
