#include "drone_relay/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace drone_relay {

namespace {

constexpr std::string_view k_logger_name{"drone_relay"};
constexpr std::string_view k_console_pattern{"[%l] %v"};
constexpr std::string_view k_file_pattern{R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%v})"};

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 10> k_level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

/** @brief Logger plus the sinks whose levels change at runtime. */
struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
    spdlog::sink_ptr console_sink;
    spdlog::sink_ptr file_sink;
};

LoggerState& logger_state() {
    static LoggerState state;
    return state;
}

/** @brief The logger must pass records down to its most verbose sink. */
void update_logger_threshold(LoggerState& state) {
    state.logger->set_level(std::min(state.console_sink->level(), state.file_sink->level()));
}

}  // namespace

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view level_name) {
    std::string lowered{level_name};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    for (const auto& [name, level] : k_level_names) {
        if (lowered == name) {
            return level;
        }
    }
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> initialize_logger(const LoggingOptions& options) {
    LoggerState& state = logger_state();
    std::scoped_lock lock(state.mutex);
    if (state.logger) {
        return state.logger;
    }

    const std::filesystem::path path_log_dir{options.directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error(
            "Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message()
        );
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(std::string{k_console_pattern});
    console_sink->set_level(options.console_level);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (path_log_dir / options.file_name).string(),
        options.max_file_bytes,
        options.max_files
    );
    file_sink->set_pattern(std::string{k_file_pattern});
    file_sink->set_level(options.file_level);

    auto logger = std::make_shared<spdlog::logger>(std::string{k_logger_name}, spdlog::sinks_init_list{console_sink, file_sink});
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);

    state.console_sink = std::move(console_sink);
    state.file_sink = std::move(file_sink);
    state.logger = std::move(logger);
    update_logger_threshold(state);
    return state.logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    LoggerState& state = logger_state();
    std::scoped_lock lock(state.mutex);
    if (!state.logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return state.logger;
}

bool set_log_level(std::string_view level_name) {
    LoggerState& state = logger_state();
    std::scoped_lock lock(state.mutex);
    if (!state.logger) {
        return false;
    }
    const std::optional<spdlog::level::level_enum> level = parse_log_level(level_name);
    if (!level.has_value()) {
        state.logger->warn(
            R"({{"component":"logging","event":"unknown_level","requested":"{}","kept":"{}"}})",
            level_name,
            spdlog::level::to_string_view(state.console_sink->level())
        );
        return false;
    }
    state.console_sink->set_level(level.value());
    update_logger_threshold(state);
    return true;
}

spdlog::level::level_enum console_log_level() {
    LoggerState& state = logger_state();
    std::scoped_lock lock(state.mutex);
    return state.console_sink ? state.console_sink->level() : LoggingOptions{}.console_level;
}

void flush_logger() {
    LoggerState& state = logger_state();
    std::scoped_lock lock(state.mutex);
    if (state.logger) {
        state.logger->flush();
    }
}

}  // namespace drone_relay
