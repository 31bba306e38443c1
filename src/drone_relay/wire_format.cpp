#include "drone_relay/wire_format.hpp"

#include <chrono>
#include <ctime>
#include <variant>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace drone_relay {

using json = nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string format_timestamp(WallTime timestamp) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
    const auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - seconds).count();
    const std::time_t time_value = WallClock::to_time_t(seconds);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(time_value), milliseconds);
}

void to_json(json& json_out, const Alert& alert) {
    json_out = json{
        {"id", alert.id},
        {"message", alert.message},
        {"severity", std::string(to_string(alert.severity))},
        {"type", alert.type},
        {"timestamp", format_timestamp(alert.timestamp)},
    };
}

void to_json(json& json_out, const MissionProgress& progress) {
    json_out = json{{"cursor", progress.cursor}, {"total", progress.total}, {"active", progress.active}};
}

void to_json(json& json_out, const TelemetrySnapshot& snapshot) {
    json_out = json{
        {"timestamp", format_timestamp(snapshot.timestamp)},
        {"sequence", snapshot.sequence},
        {"armed", snapshot.armed},
        {"flying", snapshot.flying},
        {"mode", std::string(to_string(snapshot.mode))},
        {"position",
         {{"lat", snapshot.position.latitude_deg},
          {"lng", snapshot.position.longitude_deg},
          {"alt", snapshot.position.altitude_m}}},
        {"heading", snapshot.heading_deg},
        {"speed", snapshot.speed_mps},
        {"battery_pct", snapshot.battery_percent},
        {"flight_time", snapshot.flight_time_s},
        {"gps", {{"satellites", snapshot.satellites}, {"simulated", snapshot.hardware_simulated}}},
        {"alerts", snapshot.alerts},
    };
    json_out["mission"] = snapshot.mission.has_value() ? json(snapshot.mission.value()) : json(nullptr);
}

void to_json(json& json_out, const CommandResult& result) {
    json_out = json{
        {"command", result.command},
        {"success", result.success},
        {"message", result.message},
        {"timestamp", format_timestamp(result.timestamp)},
    };
    json_out["error"] = result.error.has_value() ? json(std::string(to_string(result.error.value()))) : json(nullptr);
}

void to_json(json& json_out, const Detection& detection) {
    json_out = json{{"label", detection.label}, {"confidence", detection.confidence}, {"bbox", detection.bbox}};
}

void to_json(json& json_out, const DetectionBatch& batch) {
    json_out = json{
        {"timestamp", format_timestamp(batch.timestamp)},
        {"count", batch.detections.size()},
        {"detections", batch.detections},
    };
}

void to_json(json& json_out, const VideoFrame& frame) {
    json_out = json{
        {"timestamp", format_timestamp(frame.timestamp)},
        {"format", frame.format},
        {"bytes", frame.payload.size()},
    };
}

json to_json_document(const ChannelMessage& message) {
    return std::visit(
        overloaded{
            [](const TelemetrySnapshot& snapshot) { return json(snapshot); },
            [](const VideoFrame& frame) { return json(frame); },
            [](const DetectionBatch& batch) { return json(batch); },
            [](const AlertEvent& event) { return json(event.alert); },
        },
        message
    );
}

std::string to_json(const Alert& alert) {
    return json(alert).dump();
}

std::string to_json(const TelemetrySnapshot& snapshot) {
    return json(snapshot).dump();
}

std::string to_json(const CommandResult& result) {
    return json(result).dump();
}

std::string to_json(const ChannelMessage& message) {
    return to_json_document(message).dump();
}

}  // namespace drone_relay
