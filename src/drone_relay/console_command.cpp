#include "drone_relay/console_command.hpp"

#include <cerrno>
#include <cstdlib>

#include <fmt/format.h>

#include "drone_relay/errors.hpp"

namespace drone_relay {

namespace {

constexpr std::string_view k_whitespace{" \t\r\n"};

std::string_view trim(std::string_view text) {
    const std::size_t first = text.find_first_not_of(k_whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const std::size_t last = text.find_last_not_of(k_whitespace);
    return text.substr(first, last - first + 1);
}

double parse_number(std::string_view key, std::string_view text) {
    const std::string buffer{text};
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(buffer.c_str(), &end);
    if (buffer.empty() || end != buffer.c_str() + buffer.size() || errno == ERANGE) {
        throw ValidationError(fmt::format("Invalid number for {}: '{}'", key, text));
    }
    return value;
}

GeodeticCoordinate parse_waypoint(std::string_view text) {
    const std::size_t first_colon = text.find(':');
    const std::size_t second_colon = first_colon == std::string_view::npos ? std::string_view::npos : text.find(':', first_colon + 1);
    if (second_colon == std::string_view::npos || text.find(':', second_colon + 1) != std::string_view::npos) {
        throw ValidationError(fmt::format("Waypoint must be lat:lng:alt, got '{}'", text));
    }
    return GeodeticCoordinate{
        parse_number("lat", text.substr(0, first_colon)),
        parse_number("lng", text.substr(first_colon + 1, second_colon - first_colon - 1)),
        parse_number("alt", text.substr(second_colon + 1)),
    };
}

std::vector<GeodeticCoordinate> parse_waypoints(std::string_view text) {
    std::vector<GeodeticCoordinate> list_waypoints;
    while (!text.empty()) {
        const std::size_t separator = text.find(';');
        const std::string_view item = trim(text.substr(0, separator));
        if (!item.empty()) {
            list_waypoints.push_back(parse_waypoint(item));
        }
        if (separator == std::string_view::npos) {
            break;
        }
        text.remove_prefix(separator + 1);
    }
    return list_waypoints;
}

void apply_parameter(CommandParams& params, std::string_view key, std::string_view value) {
    if (key == "altitude" || key == "alt") {
        params.altitude = parse_number(key, value);
    } else if (key == "latitude" || key == "lat") {
        params.latitude = parse_number(key, value);
    } else if (key == "longitude" || key == "lng") {
        params.longitude = parse_number(key, value);
    } else if (key == "waypoints") {
        params.waypoints = parse_waypoints(value);
    } else {
        throw ValidationError(fmt::format("Unknown parameter '{}'", key));
    }
}

}  // namespace

ConsoleCommand parse_console_line(std::string_view line) {
    std::string_view rest = trim(line);
    if (rest.empty()) {
        throw ValidationError("Empty command");
    }

    ConsoleCommand console_command{};
    const std::size_t name_end = rest.find_first_of(k_whitespace);
    console_command.name = std::string{rest.substr(0, name_end)};
    rest = name_end == std::string_view::npos ? std::string_view{} : trim(rest.substr(name_end));

    while (!rest.empty()) {
        const std::size_t token_end = rest.find_first_of(k_whitespace);
        const std::string_view token = rest.substr(0, token_end);
        const std::size_t equals = token.find('=');
        if (equals == std::string_view::npos || equals == 0) {
            throw ValidationError(fmt::format("Expected key=value, got '{}'", token));
        }
        apply_parameter(console_command.params, token.substr(0, equals), token.substr(equals + 1));
        rest = token_end == std::string_view::npos ? std::string_view{} : trim(rest.substr(token_end));
    }
    return console_command;
}

}  // namespace drone_relay
