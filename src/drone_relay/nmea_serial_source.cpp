#include "drone_relay/gps_source.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <fmt/format.h>

#include "drone_relay/errors.hpp"
#include "drone_relay/logging.hpp"

namespace drone_relay {

namespace {

constexpr std::size_t k_max_sentence_length{120};                  /**< Longer lines are discarded as noise. */
constexpr std::chrono::milliseconds k_open_poll_interval{50};      /**< Sleep between reads while waiting for a first fix. */
constexpr std::size_t k_gga_min_fields{10};                        /**< GGA fields up to and including altitude. */
constexpr double k_max_satellites{99.0};                           /**< Two-digit GGA satellite field. */

std::vector<std::string_view> split_fields(std::string_view body) {
    std::vector<std::string_view> list_fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = body.find(',', start);
        if (comma == std::string_view::npos) {
            list_fields.push_back(body.substr(start));
            break;
        }
        list_fields.push_back(body.substr(start, comma - start));
        start = comma + 1;
    }
    return list_fields;
}

std::optional<double> parse_number(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    // std::from_chars for double is not available on every supported toolchain.
    const std::string copy{text};
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Convert NMEA ddmm.mmmm / dddmm.mmmm plus hemisphere into signed degrees.
 */
std::optional<double> parse_coordinate(std::string_view value, std::string_view hemisphere) {
    const std::optional<double> raw = parse_number(value);
    if (!raw.has_value() || hemisphere.size() != 1) {
        return std::nullopt;
    }
    const double degrees = std::floor(raw.value() / 100.0);
    const double minutes = raw.value() - degrees * 100.0;
    double decimal = degrees + minutes / 60.0;
    switch (hemisphere.front()) {
        case 'N':
        case 'E':
            break;
        case 'S':
        case 'W':
            decimal = -decimal;
            break;
        default:
            return std::nullopt;
    }
    return decimal;
}

bool checksum_matches(std::string_view body, std::string_view checksum_text) {
    unsigned expected = 0;
    const auto [ptr, error] = std::from_chars(checksum_text.data(), checksum_text.data() + checksum_text.size(), expected, 16);
    if (error != std::errc{} || ptr != checksum_text.data() + checksum_text.size()) {
        return false;
    }
    unsigned parity = 0;
    for (const char character : body) {
        parity ^= static_cast<unsigned char>(character);
    }
    return parity == expected;
}

speed_t to_speed(int baud_rate) {
    switch (baud_rate) {
        case 4800:
            return B4800;
        case 9600:
            return B9600;
        case 19200:
            return B19200;
        case 38400:
            return B38400;
        case 57600:
            return B57600;
        case 115200:
            return B115200;
        default:
            throw std::invalid_argument(fmt::format("Unsupported GPS baud rate {}", baud_rate));
    }
}

}  // namespace

std::optional<GpsFix> parse_gga_sentence(std::string_view sentence) {
    while (!sentence.empty() && (sentence.back() == '\r' || sentence.back() == '\n')) {
        sentence.remove_suffix(1);
    }
    if (sentence.size() < 7 || sentence.front() != '$') {
        return std::nullopt;
    }
    std::string_view body = sentence.substr(1);
    const std::size_t star = body.find('*');
    if (star != std::string_view::npos) {
        if (!checksum_matches(body.substr(0, star), body.substr(star + 1))) {
            return std::nullopt;
        }
        body = body.substr(0, star);
    }

    const std::vector<std::string_view> list_fields = split_fields(body);
    if (list_fields.size() < k_gga_min_fields || list_fields[0].size() != 5 || list_fields[0].substr(2) != "GGA") {
        return std::nullopt;
    }

    const std::optional<double> latitude = parse_coordinate(list_fields[2], list_fields[3]);
    const std::optional<double> longitude = parse_coordinate(list_fields[4], list_fields[5]);
    const std::optional<double> fix_quality = parse_number(list_fields[6]);
    if (!latitude.has_value() || !longitude.has_value() || !fix_quality.has_value() || fix_quality.value() <= 0.0) {
        return std::nullopt;
    }

    GpsFix fix{};
    fix.latitude_deg = latitude.value();
    fix.longitude_deg = longitude.value();
    const double satellites = parse_number(list_fields[7]).value_or(0.0);
    fix.satellites = std::isfinite(satellites) && satellites > 0.0
        ? static_cast<unsigned>(std::min(satellites, k_max_satellites))
        : 0U;
    fix.altitude_m = parse_number(list_fields[9]).value_or(0.0);
    fix.timestamp = WallClock::now();
    return fix;
}

NmeaSerialSource::NmeaSerialSource(std::string device_path, int baud_rate)
    : str_device_path_(std::move(device_path)),
      baud_rate_(baud_rate) {
    if (str_device_path_.empty()) {
        throw std::invalid_argument("NmeaSerialSource requires a device path");
    }
}

NmeaSerialSource::~NmeaSerialSource() {
    close_port();
}

void NmeaSerialSource::open(Duration timeout) {
    close_port();
    file_descriptor_ = ::open(str_device_path_.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
    if (file_descriptor_ < 0) {
        throw HardwareDegradedError(fmt::format("Unable to open GPS device {}: {}", str_device_path_, std::strerror(errno)));
    }
    try {
        configure_port();
    } catch (const std::exception&) {
        close_port();
        throw;
    }

    const TimePoint deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(timeout);
    while (SteadyClock::now() < deadline) {
        if (poll().has_value()) {
            get_logger()->info("GPS device {} delivered a first fix", str_device_path_);
            return;
        }
        std::this_thread::sleep_for(k_open_poll_interval);
    }
    close_port();
    throw HardwareDegradedError(fmt::format("GPS device {} produced no fix within {}s", str_device_path_, timeout.count()));
}

std::optional<GpsFix> NmeaSerialSource::poll() {
    if (file_descriptor_ < 0) {
        return std::nullopt;
    }
    std::optional<GpsFix> optional_latest;
    std::array<char, 256> buffer{};
    while (true) {
        const ssize_t count = ::read(file_descriptor_, buffer.data(), buffer.size());
        if (count <= 0) {
            if (count < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                throw HardwareDegradedError(fmt::format("GPS device {} read failed: {}", str_device_path_, std::strerror(errno)));
            }
            break;
        }
        for (ssize_t index = 0; index < count; ++index) {
            const char character = buffer[static_cast<std::size_t>(index)];
            if (character == '\n') {
                if (std::optional<GpsFix> fix = parse_gga_sentence(str_line_buffer_); fix.has_value()) {
                    optional_latest = fix;
                }
                str_line_buffer_.clear();
            } else if (character != '\r') {
                str_line_buffer_.push_back(character);
                if (str_line_buffer_.size() > k_max_sentence_length) {
                    str_line_buffer_.clear();
                }
            }
        }
    }
    return optional_latest;
}

std::string NmeaSerialSource::describe() const {
    return fmt::format("nmea:{}@{}", str_device_path_, baud_rate_);
}

void NmeaSerialSource::configure_port() {
    termios tty{};
    if (tcgetattr(file_descriptor_, &tty) != 0) {
        throw HardwareDegradedError(fmt::format("GPS device {} is not a serial port: {}", str_device_path_, std::strerror(errno)));
    }
    const speed_t speed = to_speed(baud_rate_);
    cfsetospeed(&tty, speed);
    cfsetispeed(&tty, speed);

    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
    tty.c_iflag &= ~(IGNBRK | IXON | IXOFF | IXANY);
    tty.c_lflag = 0;
    tty.c_oflag = 0;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~(PARENB | PARODD | CSTOPB | CRTSCTS);

    if (tcsetattr(file_descriptor_, TCSANOW, &tty) != 0) {
        throw HardwareDegradedError(fmt::format("Unable to configure GPS device {}: {}", str_device_path_, std::strerror(errno)));
    }
}

void NmeaSerialSource::close_port() noexcept {
    if (file_descriptor_ >= 0) {
        ::close(file_descriptor_);
        file_descriptor_ = -1;
    }
    str_line_buffer_.clear();
}

}  // namespace drone_relay
