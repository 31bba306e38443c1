// === Wire Format =============================================================
//
// JSON renderings of the messages exchanged with the presentation layer:
// telemetry snapshots, alerts, detections, video frame metadata and command
// results. Each payload type has an nlohmann::json conversion hook so it can be
// embedded in larger documents; the string overloads dump a single message.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "drone_relay/command_router.hpp"
#include "drone_relay/messages.hpp"

namespace drone_relay {

[[nodiscard]] std::string format_timestamp(WallTime timestamp);

void to_json(nlohmann::json& json_out, const Alert& alert);
void to_json(nlohmann::json& json_out, const MissionProgress& progress);
void to_json(nlohmann::json& json_out, const TelemetrySnapshot& snapshot);
void to_json(nlohmann::json& json_out, const CommandResult& result);
void to_json(nlohmann::json& json_out, const Detection& detection);
void to_json(nlohmann::json& json_out, const DetectionBatch& batch);
/** @brief Video frames carry metadata only; the payload bytes travel separately. */
void to_json(nlohmann::json& json_out, const VideoFrame& frame);

/** @brief Build the document for any channel payload. */
[[nodiscard]] nlohmann::json to_json_document(const ChannelMessage& message);

[[nodiscard]] std::string to_json(const Alert& alert);
[[nodiscard]] std::string to_json(const TelemetrySnapshot& snapshot);
[[nodiscard]] std::string to_json(const CommandResult& result);
/** @brief Render any channel payload as one compact JSON document. */
[[nodiscard]] std::string to_json(const ChannelMessage& message);

}  // namespace drone_relay
