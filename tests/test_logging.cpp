#include <catch2/catch.hpp>

#include <filesystem>
#include <string_view>

#include "drone_relay/logging.hpp"
#include "logging_test_fixture.hpp"

using namespace drone_relay;

namespace {
/** @brief Restores the console level a test changed. */
class ConsoleLevelGuard final {
  public:
    ConsoleLevelGuard() : saved_level_(console_log_level()) {}
    ~ConsoleLevelGuard() {
        const auto name = spdlog::level::to_string_view(saved_level_);
        set_log_level(std::string_view{name.data(), name.size()});
    }

  private:
    spdlog::level::level_enum saved_level_;
};
}  // namespace

TEST_CASE("parse_log_level accepts spdlog names and common aliases") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("INFO") == spdlog::level::info);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("set_log_level applies known levels and keeps the current one otherwise") {
    test::ensure_logger_initialized();
    ConsoleLevelGuard guard;

    REQUIRE(set_log_level("error"));
    REQUIRE(console_log_level() == spdlog::level::err);

    REQUIRE_FALSE(set_log_level("loud"));
    REQUIRE(console_log_level() == spdlog::level::err);

    REQUIRE(set_log_level("Debug"));
    REQUIRE(console_log_level() == spdlog::level::debug);
    REQUIRE(get_logger()->should_log(spdlog::level::debug));
}

TEST_CASE("file sink keeps debug records while the console is quieter") {
    test::ensure_logger_initialized();
    ConsoleLevelGuard guard;

    REQUIRE(set_log_level("critical"));
    REQUIRE(get_logger()->should_log(spdlog::level::debug));
    get_logger()->debug(R"({{"component":"logging","event":"file_only"}})");
    REQUIRE_NOTHROW(flush_logger());

    const auto log_file = std::filesystem::temp_directory_path() / "drone_relay_tests_logs" / LoggingOptions{}.file_name;
    REQUIRE(std::filesystem::exists(log_file));
}

TEST_CASE("initialize_logger returns the existing logger on later calls") {
    const auto first = [] {
        test::ensure_logger_initialized();
        return get_logger();
    }();
    LoggingOptions other{};
    other.directory = (std::filesystem::temp_directory_path() / "drone_relay_other_logs").string();
    REQUIRE(initialize_logger(other) == first);
    REQUIRE(get_logger() == first);
}
