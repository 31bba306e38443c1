// === Hardware Adapter ========================================================
//
// Telemetry sources feeding the state simulator. A device adapter reads a real
// GPS receiver; a mock adapter perturbs a base position. HardwareLink selects
// one at startup and degrades permanently to the mock when the device fails.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "drone_relay/gps_source.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief Normalized reading produced by a hardware adapter. */
struct TelemetrySample final {
    GeodeticCoordinate position{};
    unsigned satellites{};
    WallTime timestamp{};
    bool valid{};     /**< False until the adapter produced its first reading. */
    bool simulated{}; /**< True when the reading is synthetic. */
};

/** @brief Knobs for adapter selection and the synthetic generator. */
struct HardwareConfig final {
    std::string gps_device{};                                /**< Serial device; empty selects the mock adapter. */
    int baud_rate{9600};                                     /**< Serial baud rate. */
    Duration connect_timeout{Duration{5.0}};                 /**< Wait for a first fix when opening the device. */
    Duration fix_timeout{Duration{5.0}};                     /**< Oldest acceptable fix before degrading. */
    Duration poll_period{Duration{0.1}};                     /**< Cadence of the polling task. */
    GeodeticCoordinate mock_base{33.6844, 73.0479, 500.0};   /**< Centre of the synthetic position cloud. */
    double mock_jitter_deg{0.0001};                          /**< Horizontal jitter bound in degrees. */
    double mock_altitude_jitter_m{1.0};                      /**< Vertical jitter bound in metres. */
    std::optional<std::uint32_t> seed{};                     /**< Fixed seed for reproducible mock output. */
};

/** @brief Common interface of every telemetry source. */
class HardwareAdapter {
  public:
    virtual ~HardwareAdapter() = default;

    /** @brief Advance the adapter by one polling step. May block only briefly. */
    virtual void poll() = 0;
    /** @brief Latest known reading; never blocks on I/O. */
    [[nodiscard]] virtual TelemetrySample sample() const = 0;
    /** @brief True when the adapter is producing fresh data. */
    [[nodiscard]] virtual bool health() const = 0;
    /** @brief Short identifier used in logs. */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

using HardwareAdapterPtr = std::unique_ptr<HardwareAdapter>;

/** @brief Synthetic source that perturbs a base position on each poll. */
class MockHardwareAdapter final : public HardwareAdapter {
  public:
    explicit MockHardwareAdapter(const HardwareConfig& config);

    void poll() override;
    [[nodiscard]] TelemetrySample sample() const override;
    [[nodiscard]] bool health() const override;
    [[nodiscard]] std::string_view name() const noexcept override;

  private:
    GeodeticCoordinate base_;
    double jitter_deg_;
    double altitude_jitter_m_;
    mutable std::mutex mutex_;
    std::mt19937 random_engine_;
    TelemetrySample latest_sample_;
};

/** @brief Source backed by a physical GPS receiver. */
class DeviceHardwareAdapter final : public HardwareAdapter {
  public:
    /** @param source Already opened GPS source. */
    DeviceHardwareAdapter(GpsSourcePtr source, Duration fix_timeout);

    /** @throws HardwareDegradedError when no fix arrived within the fix timeout. */
    void poll() override;
    [[nodiscard]] TelemetrySample sample() const override;
    [[nodiscard]] bool health() const override;
    [[nodiscard]] std::string_view name() const noexcept override;

  private:
    GpsSourcePtr source_;
    Duration fix_timeout_;
    mutable std::mutex mutex_;
    TelemetrySample latest_sample_;
    TimePoint last_fix_time_;
};

/**
 * @brief Adapter selected at startup, with a one-way fallback to the mock.
 *
 * Once degraded the link never returns to the device; a process restart is
 * required to try the hardware again.
 */
class HardwareLink final : public HardwareAdapter {
  public:
    /** @param primary Device adapter, or null to run on the mock from the start. */
    HardwareLink(HardwareAdapterPtr primary, std::unique_ptr<MockHardwareAdapter> fallback, bool degraded_at_start = false);

    void poll() override;
    [[nodiscard]] TelemetrySample sample() const override;
    [[nodiscard]] bool health() const override;
    [[nodiscard]] std::string_view name() const noexcept override;

    /** @brief True once the link fell back to synthetic data after a device failure. */
    [[nodiscard]] bool degraded() const noexcept;
    /** @brief True while readings come from the mock adapter. */
    [[nodiscard]] bool simulated() const noexcept;

  private:
    void degrade(const std::string& reason);

    HardwareAdapterPtr primary_;
    std::unique_ptr<MockHardwareAdapter> fallback_;
    std::atomic<bool> flag_use_fallback_;
    std::atomic<bool> flag_degraded_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Pick the hardware adapter for this process.
 *
 * With no @p source the mock is used outright. Otherwise the source is opened
 * within the configured timeout; failure yields a degraded link on the mock.
 */
[[nodiscard]] std::unique_ptr<HardwareLink> probe_hardware(const HardwareConfig& config, GpsSourcePtr source);

/** @brief Build the production GPS source for @p config; null when no device is configured. */
[[nodiscard]] GpsSourcePtr make_gps_source(const HardwareConfig& config);

}  // namespace drone_relay
