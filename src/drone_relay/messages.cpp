#include "drone_relay/messages.hpp"

namespace drone_relay {

std::string_view to_string(Channel channel) noexcept {
    switch (channel) {
        case Channel::Telemetry:
            return "telemetry";
        case Channel::Video:
            return "video";
        case Channel::Detections:
            return "detections";
        case Channel::Alerts:
            return "alerts";
    }
    return "unknown";
}

std::optional<Channel> parse_channel(std::string_view name) noexcept {
    for (const Channel channel : k_all_channels) {
        if (to_string(channel) == name) {
            return channel;
        }
    }
    return std::nullopt;
}

Channel channel_of(const ChannelMessage& message) noexcept {
    switch (message.index()) {
        case 0:
            return Channel::Telemetry;
        case 1:
            return Channel::Video;
        case 2:
            return Channel::Detections;
        default:
            return Channel::Alerts;
    }
}

}  // namespace drone_relay
