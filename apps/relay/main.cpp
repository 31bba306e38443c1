#include <poll.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drone_relay/configuration.hpp"
#include "drone_relay/console_command.hpp"
#include "drone_relay/errors.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/relay_runtime.hpp"
#include "drone_relay/wire_format.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr int k_console_poll_ms{250};
constexpr std::size_t k_console_read_size{256};

void handle_signal(int) {
    should_terminate.store(true);
}

/** @brief Client attached to the local console: telemetry to the log, alerts to stdout. */
class ConsoleSink final : public drone_relay::ClientSink {
  public:
    ConsoleSink() : logger_(drone_relay::get_logger()) {}

    void deliver(drone_relay::Channel channel, const drone_relay::ChannelMessage& message) override {
        const nlohmann::json envelope{
            {"channel", std::string(drone_relay::to_string(channel))},
            {"data", drone_relay::to_json_document(message)},
        };
        if (channel == drone_relay::Channel::Alerts) {
            std::cout << envelope.dump() << std::endl;
            return;
        }
        logger_->debug(envelope.dump());
    }

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Handle `subscribe <channel>` / `unsubscribe <channel>` for the console client. */
bool handle_subscription_line(drone_relay::RelayRuntime& runtime, std::string_view line) {
    const std::size_t separator = line.find(' ');
    const std::string_view verb = line.substr(0, separator);
    if (verb != "subscribe" && verb != "unsubscribe") {
        return false;
    }
    const std::string_view name = separator == std::string_view::npos ? std::string_view{} : line.substr(separator + 1);
    const std::optional<drone_relay::Channel> channel = drone_relay::parse_channel(name);
    if (!channel.has_value()) {
        std::cout << nlohmann::json{{"error", "unknown channel"}}.dump() << std::endl;
        return true;
    }
    const bool updated = verb == "subscribe"
        ? runtime.hub().subscribe("console", channel.value())
        : runtime.hub().unsubscribe("console", channel.value());
    const nlohmann::json reply{{"channel", std::string(drone_relay::to_string(channel.value()))}, {"updated", updated}};
    std::cout << reply.dump() << std::endl;
    return true;
}

void handle_console_line(drone_relay::RelayRuntime& runtime, std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.remove_suffix(1);
    }
    if (line.find_first_not_of(" \t") == std::string_view::npos) {
        return;
    }
    if (handle_subscription_line(runtime, line)) {
        return;
    }
    drone_relay::CommandResult result{};
    try {
        const drone_relay::ConsoleCommand console_command = drone_relay::parse_console_line(line);
        result = runtime.router().execute(console_command.name, console_command.params);
    } catch (const drone_relay::ValidationError& exc) {
        result.command = std::string{line};
        result.success = false;
        result.message = exc.what();
        result.error = drone_relay::CommandErrorKind::Validation;
        result.timestamp = drone_relay::WallClock::now();
    }
    std::cout << drone_relay::to_json(result) << std::endl;
}

/** @brief Poll stdin without blocking shutdown; returns false once stdin is closed. */
bool pump_console(drone_relay::RelayRuntime& runtime, std::string& line_buffer) {
    pollfd descriptor{STDIN_FILENO, POLLIN, 0};
    const int ready = ::poll(&descriptor, 1, k_console_poll_ms);
    if (ready <= 0) {
        return true;
    }
    std::array<char, k_console_read_size> chunk{};
    const ssize_t count = ::read(STDIN_FILENO, chunk.data(), chunk.size());
    if (count <= 0) {
        return false;
    }
    line_buffer.append(chunk.data(), static_cast<std::size_t>(count));
    std::size_t newline = line_buffer.find('\n');
    while (newline != std::string::npos) {
        handle_console_line(runtime, std::string_view{line_buffer}.substr(0, newline));
        line_buffer.erase(0, newline + 1);
        newline = line_buffer.find('\n');
    }
    return true;
}
}  // namespace

int main() {
    using namespace drone_relay;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        RelayRuntime runtime{std::move(configuration)};
        runtime.hub().connect("console", std::make_shared<ConsoleSink>());
        runtime.start();

        bool flag_console_open = true;
        std::string line_buffer;
        while (!should_terminate.load()) {
            if (flag_console_open) {
                flag_console_open = pump_console(runtime, line_buffer);
            } else {
                ::poll(nullptr, 0, k_console_poll_ms);
            }
        }

        runtime.stop();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
