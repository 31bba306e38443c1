// === Console Command =========================================================
//
// Line-oriented command syntax of the relay console:
//
//   takeoff altitude=10
//   goto lat=33.69 lng=73.05 alt=15
//   start_mission waypoints=33.685:73.048:20;33.686:73.049:25

#pragma once

#include <string>
#include <string_view>

#include "drone_relay/command_router.hpp"

namespace drone_relay {

/** @brief A console line split into a command name and its parameters. */
struct ConsoleCommand final {
    std::string name{};
    CommandParams params{};
};

/**
 * @brief Parse one console line.
 * @throws ValidationError for empty lines, unknown keys and malformed numbers.
 */
[[nodiscard]] ConsoleCommand parse_console_line(std::string_view line);

}  // namespace drone_relay
