#include <catch2/catch.hpp>

#include <chrono>
#include <cmath>
#include <deque>
#include <mutex>
#include <thread>

#include "drone_relay/errors.hpp"
#include "drone_relay/gps_source.hpp"
#include "drone_relay/hardware_adapter.hpp"
#include "logging_test_fixture.hpp"

using namespace drone_relay;

namespace {

/** @brief Shared script driving a ScriptedGpsSource after ownership moved away. */
struct GpsScript {
    bool fail_open{false};
    bool always_fix{false};
    std::deque<GpsFix> deque_fixes{};
    std::mutex mutex{};
};

class ScriptedGpsSource final : public GpsSource {
  public:
    explicit ScriptedGpsSource(std::shared_ptr<GpsScript> script) : script_(std::move(script)) {}

    void open(Duration) override {
        if (script_->fail_open) {
            throw HardwareDegradedError("scripted open failure");
        }
    }

    std::optional<GpsFix> poll() override {
        std::scoped_lock lock(script_->mutex);
        if (script_->always_fix) {
            return make_fix(10);
        }
        if (script_->deque_fixes.empty()) {
            return std::nullopt;
        }
        GpsFix fix = script_->deque_fixes.front();
        script_->deque_fixes.pop_front();
        return fix;
    }

    std::string describe() const override {
        return "scripted";
    }

    static GpsFix make_fix(unsigned satellites) {
        GpsFix fix{};
        fix.latitude_deg = 33.7;
        fix.longitude_deg = 73.1;
        fix.altitude_m = 540.0;
        fix.satellites = satellites;
        fix.timestamp = WallClock::now();
        return fix;
    }

  private:
    std::shared_ptr<GpsScript> script_;
};

HardwareConfig make_config() {
    HardwareConfig config{};
    config.seed = 7;
    config.fix_timeout = Duration{0.02};
    return config;
}

}  // namespace

TEST_CASE("parse_gga_sentence decodes position, satellites and altitude") {
    const auto fix = parse_gga_sentence("$GPGGA,123519,3341.064,N,07302.874,E,1,08,0.9,545.4,M,46.9,M,,*4F\r\n");
    REQUIRE(fix.has_value());
    REQUIRE(fix->latitude_deg == Approx(33.6844));
    REQUIRE(fix->longitude_deg == Approx(73.0479));
    REQUIRE(fix->satellites == 8);
    REQUIRE(fix->altitude_m == Approx(545.4));
}

TEST_CASE("parse_gga_sentence applies hemispheres") {
    const auto fix = parse_gga_sentence("$GNGGA,123519,3341.064,S,07302.874,W,1,10,0.9,12.0,M,46.9,M,,*64");
    REQUIRE(fix.has_value());
    REQUIRE(fix->latitude_deg == Approx(-33.6844));
    REQUIRE(fix->longitude_deg == Approx(-73.0479));
    REQUIRE(fix->satellites == 10);
}

TEST_CASE("parse_gga_sentence clamps out-of-range satellite counts") {
    const auto negative = parse_gga_sentence("$GPGGA,123519,3341.064,N,07302.874,E,1,-1,0.9,545.4,M,46.9,M,,");
    REQUIRE(negative.has_value());
    REQUIRE(negative->satellites == 0);

    const auto not_a_number = parse_gga_sentence("$GPGGA,123519,3341.064,N,07302.874,E,1,nan,0.9,545.4,M,46.9,M,,");
    REQUIRE(not_a_number.has_value());
    REQUIRE(not_a_number->satellites == 0);

    const auto huge = parse_gga_sentence("$GPGGA,123519,3341.064,N,07302.874,E,1,1e12,0.9,545.4,M,46.9,M,,");
    REQUIRE(huge.has_value());
    REQUIRE(huge->satellites == 99);

    const auto blank = parse_gga_sentence("$GPGGA,123519,3341.064,N,07302.874,E,1,,0.9,545.4,M,46.9,M,,");
    REQUIRE(blank.has_value());
    REQUIRE(blank->satellites == 0);
}

TEST_CASE("parse_gga_sentence rejects bad checksums, missing fixes and other sentences") {
    REQUIRE_FALSE(parse_gga_sentence("$GPGGA,123519,3341.064,N,07302.874,E,1,08,0.9,545.4,M,46.9,M,,*00").has_value());
    REQUIRE_FALSE(parse_gga_sentence("$GPGGA,123519,3341.064,N,07302.874,E,0,00,,,M,,M,,*5A").has_value());
    REQUIRE_FALSE(parse_gga_sentence("$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A").has_value());
    REQUIRE_FALSE(parse_gga_sentence("garbage").has_value());
    REQUIRE_FALSE(parse_gga_sentence("").has_value());
}

TEST_CASE("MockHardwareAdapter jitters around its base position") {
    test::ensure_logger_initialized();
    const HardwareConfig config = make_config();
    MockHardwareAdapter adapter{config};

    for (int iteration = 0; iteration < 20; ++iteration) {
        adapter.poll();
        const TelemetrySample sample = adapter.sample();
        REQUIRE(sample.valid);
        REQUIRE(sample.simulated);
        REQUIRE(std::abs(sample.position.latitude_deg - config.mock_base.latitude_deg) <= config.mock_jitter_deg);
        REQUIRE(std::abs(sample.position.longitude_deg - config.mock_base.longitude_deg) <= config.mock_jitter_deg);
        REQUIRE(std::abs(sample.position.altitude_m - config.mock_base.altitude_m) <= config.mock_altitude_jitter_m);
        REQUIRE(sample.satellites >= 6);
        REQUIRE(sample.satellites <= 12);
    }
    REQUIRE(adapter.health());
    REQUIRE(adapter.name() == "mock");
}

TEST_CASE("probe_hardware uses the mock when no device is configured") {
    test::ensure_logger_initialized();
    const HardwareConfig config = make_config();
    REQUIRE(make_gps_source(config) == nullptr);

    const auto link = probe_hardware(config, nullptr);
    REQUIRE(link->simulated());
    REQUIRE_FALSE(link->degraded());
    REQUIRE(link->name() == "mock");
}

TEST_CASE("probe_hardware degrades when the device cannot be opened") {
    test::ensure_logger_initialized();
    auto script = std::make_shared<GpsScript>();
    script->fail_open = true;

    const auto link = probe_hardware(make_config(), std::make_unique<ScriptedGpsSource>(script));
    REQUIRE(link->simulated());
    REQUIRE(link->degraded());
    REQUIRE_NOTHROW(link->poll());
    REQUIRE(link->sample().simulated);
}

TEST_CASE("HardwareLink falls back to the mock permanently after a stale fix") {
    test::ensure_logger_initialized();
    auto script = std::make_shared<GpsScript>();
    script->deque_fixes.push_back(ScriptedGpsSource::make_fix(9));

    const auto link = probe_hardware(make_config(), std::make_unique<ScriptedGpsSource>(script));
    REQUIRE_FALSE(link->simulated());
    REQUIRE(link->name() == "device");

    link->poll();
    TelemetrySample sample = link->sample();
    REQUIRE(sample.valid);
    REQUIRE_FALSE(sample.simulated);
    REQUIRE(sample.satellites == 9);
    REQUIRE(sample.position.latitude_deg == Approx(33.7));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_NOTHROW(link->poll());
    REQUIRE(link->degraded());
    REQUIRE(link->simulated());
    REQUIRE(link->name() == "mock");
    REQUIRE(link->sample().simulated);

    {
        std::scoped_lock lock(script->mutex);
        script->always_fix = true;
    }
    link->poll();
    REQUIRE(link->simulated());
    REQUIRE(link->sample().simulated);
}

TEST_CASE("NmeaSerialSource reports a missing device as degraded hardware") {
    test::ensure_logger_initialized();
    NmeaSerialSource source{"/dev/drone-relay-missing-gps", 9600};
    REQUIRE(source.describe() == "nmea:/dev/drone-relay-missing-gps@9600");
    REQUIRE_THROWS_AS(source.open(Duration{0.1}), HardwareDegradedError);
}
