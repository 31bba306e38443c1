// === GPS Source ==============================================================
//
// Boundary to the GPS hardware: something that yields normalized fixes
// {lat, lng, altitude, satellites, timestamp}. The serial NMEA reader is the
// production implementation; tests substitute scripted sources.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief Normalized GPS fix handed to the device hardware adapter. */
struct GpsFix final {
    double latitude_deg{};
    double longitude_deg{};
    double altitude_m{};
    unsigned satellites{};
    WallTime timestamp{};
};

/** @brief Source of GPS fixes from a physical receiver. */
class GpsSource {
  public:
    virtual ~GpsSource() = default;

    /**
     * @brief Open the device and wait up to @p timeout for a first fix.
     * @throws HardwareDegradedError when the device cannot be opened or stays silent.
     */
    virtual void open(Duration timeout) = 0;
    /** @brief Newest fix parsed since the previous call, without blocking. */
    virtual std::optional<GpsFix> poll() = 0;
    /** @brief Human-readable device description for logs. */
    [[nodiscard]] virtual std::string describe() const = 0;
};

using GpsSourcePtr = std::unique_ptr<GpsSource>;

/**
 * @brief Parse a `$xxGGA` sentence, validating its checksum when present.
 *
 * Returns nothing for other sentence types, malformed input, or fix quality 0.
 */
[[nodiscard]] std::optional<GpsFix> parse_gga_sentence(std::string_view sentence);

/** @brief Reads NMEA sentences from a serial receiver through termios. */
class NmeaSerialSource final : public GpsSource {
  public:
    NmeaSerialSource(std::string device_path, int baud_rate);
    ~NmeaSerialSource() override;

    NmeaSerialSource(const NmeaSerialSource&) = delete;
    NmeaSerialSource& operator=(const NmeaSerialSource&) = delete;

    void open(Duration timeout) override;
    std::optional<GpsFix> poll() override;
    [[nodiscard]] std::string describe() const override;

  private:
    void configure_port();
    void close_port() noexcept;

    std::string str_device_path_;
    int baud_rate_;
    int file_descriptor_{-1};
    std::string str_line_buffer_;
};

}  // namespace drone_relay
