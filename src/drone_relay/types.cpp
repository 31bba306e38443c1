#include "drone_relay/types.hpp"

namespace drone_relay {

std::string_view to_string(FlightMode mode) noexcept {
    switch (mode) {
        case FlightMode::Disarmed:
            return "DISARMED";
        case FlightMode::Armed:
            return "ARMED";
        case FlightMode::Guided:
            return "GUIDED";
        case FlightMode::Rtl:
            return "RTL";
        case FlightMode::Land:
            return "LAND";
        case FlightMode::Emergency:
            return "EMERGENCY";
    }
    return "UNKNOWN";
}

std::string_view to_string(AlertSeverity severity) noexcept {
    switch (severity) {
        case AlertSeverity::Info:
            return "info";
        case AlertSeverity::Warning:
            return "warning";
        case AlertSeverity::Critical:
            return "critical";
    }
    return "unknown";
}

}  // namespace drone_relay
