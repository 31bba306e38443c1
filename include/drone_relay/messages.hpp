// === Channel Messages ========================================================
//
// Tagged payloads carried by the broadcast hub. Each channel carries exactly
// one payload type; ChannelMessage is the variant placed on channel queues.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "drone_relay/alert_log.hpp"
#include "drone_relay/drone_state.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief Named broadcast topics. */
enum class Channel {
    Telemetry,
    Video,
    Detections,
    Alerts
};

inline constexpr std::array<Channel, 4> k_all_channels{
    Channel::Telemetry,
    Channel::Video,
    Channel::Detections,
    Channel::Alerts,
};

[[nodiscard]] std::string_view to_string(Channel channel) noexcept;
/** @brief Parse a wire channel name; empty for unknown names. */
[[nodiscard]] std::optional<Channel> parse_channel(std::string_view name) noexcept;

/** @brief Encoded video frame produced by the capture pipeline. */
struct VideoFrame final {
    WallTime timestamp{};
    std::string format{"jpeg"};
    std::vector<std::byte> payload{};
};

/** @brief Single object detection reported by the vision pipeline. */
struct Detection final {
    std::string label{};
    double confidence{};
    std::array<double, 4> bbox{}; /**< x, y, width, height in frame pixels. */
};

/** @brief Detection results for one processed frame. */
struct DetectionBatch final {
    WallTime timestamp{};
    std::vector<Detection> detections{};
};

/** @brief Alert as relayed on the alerts channel. */
struct AlertEvent final {
    Alert alert{};
};

using ChannelMessage = std::variant<TelemetrySnapshot, VideoFrame, DetectionBatch, AlertEvent>;

/** @brief Channel a payload belongs on. */
[[nodiscard]] Channel channel_of(const ChannelMessage& message) noexcept;

}  // namespace drone_relay
