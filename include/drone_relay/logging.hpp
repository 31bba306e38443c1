// === Logging =================================================================
//
// Process-wide spdlog logger shared by every relay component. Operators read
// the console sink; the rotating file sink keeps one JSON object per line for
// later inspection and may run at a more verbose level than the console.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace drone_relay {

/** @brief Sink layout and verbosity for the relay logger. */
struct LoggingOptions final {
    std::string directory{"logs"};                                   /**< Created on demand. */
    std::string file_name{"drone_relay.log"};                        /**< Active file inside @ref directory. */
    std::size_t max_file_bytes{10 * 1024 * 1024};                    /**< Rotation threshold. */
    std::size_t max_files{5};                                        /**< Rotated files kept besides the active one. */
    spdlog::level::level_enum console_level{spdlog::level::info};    /**< Operator-facing verbosity. */
    spdlog::level::level_enum file_level{spdlog::level::debug};      /**< Verbosity of the JSON file. */
};

/**
 * @brief Map a level name to an spdlog level.
 *
 * Accepts spdlog's names plus "warning" and "error", case-insensitively.
 * @return std::nullopt for an unknown name.
 */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view level_name);

/**
 * @brief Create the shared logger. Later calls return the first logger unchanged.
 * @throws std::runtime_error when the log directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const LoggingOptions& options);

/** @throws std::runtime_error when initialize_logger has not run. */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Change the console verbosity at runtime.
 * @return false, with a warning logged, when @p level_name is unknown; the
 *         current level is kept in that case.
 */
bool set_log_level(std::string_view level_name);

/** @brief Current console verbosity. */
[[nodiscard]] spdlog::level::level_enum console_log_level();

/** @brief Flush both sinks; a no-op before initialization. */
void flush_logger();

}  // namespace drone_relay
