#include <catch2/catch.hpp>

#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

#include "drone_relay/broadcast_hub.hpp"
#include "logging_test_fixture.hpp"

using namespace drone_relay;

namespace {
TelemetrySnapshot make_snapshot(std::uint64_t sequence) {
    TelemetrySnapshot snapshot{};
    snapshot.sequence = sequence;
    return snapshot;
}

AlertEvent make_alert_event(std::uint64_t id) {
    AlertEvent event{};
    event.alert.id = id;
    event.alert.message = "alert";
    return event;
}

bool wait_for(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}
}  // namespace

TEST_CASE("Channel names round-trip and payloads map to their channel") {
    for (const Channel channel : k_all_channels) {
        REQUIRE(parse_channel(to_string(channel)) == channel);
    }
    REQUIRE_FALSE(parse_channel("audio").has_value());

    REQUIRE(channel_of(make_snapshot(1)) == Channel::Telemetry);
    REQUIRE(channel_of(VideoFrame{}) == Channel::Video);
    REQUIRE(channel_of(DetectionBatch{}) == Channel::Detections);
    REQUIRE(channel_of(make_alert_event(1)) == Channel::Alerts);
}

TEST_CASE("BroadcastHub joins a new client to every channel") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    BroadcastHub hub{test::make_manual_hub_config(), shutdown_signal};

    hub.connect("ui", std::make_shared<test::RecordingSink>());
    REQUIRE(hub.client_count() == 1);
    const auto subscription = hub.subscription("ui");
    REQUIRE(subscription.has_value());
    REQUIRE(subscription->joined_channels.size() == k_all_channels.size());

    REQUIRE(hub.unsubscribe("ui", Channel::Video));
    REQUIRE(hub.subscription("ui")->joined_channels.count(Channel::Video) == 0);
    REQUIRE(hub.subscribe("ui", Channel::Video));
    REQUIRE(hub.subscription("ui")->joined_channels.count(Channel::Video) == 1);

    REQUIRE_FALSE(hub.subscribe("ghost", Channel::Telemetry));
    REQUIRE_THROWS_AS(hub.connect("ui", std::make_shared<test::RecordingSink>()), std::invalid_argument);
    REQUIRE_THROWS_AS(hub.connect("", std::make_shared<test::RecordingSink>()), std::invalid_argument);
    REQUIRE_THROWS_AS(hub.connect("null", nullptr), std::invalid_argument);

    hub.disconnect("ui");
    REQUIRE(hub.client_count() == 0);
    REQUIRE_FALSE(hub.subscription("ui").has_value());
}

TEST_CASE("BroadcastHub keeps at most capacity telemetry messages without a consumer") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    BroadcastHub hub{test::make_manual_hub_config(), shutdown_signal};

    for (std::uint64_t sequence = 1; sequence <= 150; ++sequence) {
        (void)hub.publish(make_snapshot(sequence));
        REQUIRE(hub.queue_size(Channel::Telemetry) <= 100);
    }

    REQUIRE(hub.queue_size(Channel::Telemetry) == 100);
    const ChannelStats stats = hub.stats(Channel::Telemetry);
    REQUIRE(stats.published == 100);
    REQUIRE(stats.dropped == 50);
}

TEST_CASE("BroadcastHub flush delivers in order to subscribed clients only") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    BroadcastHub hub{test::make_manual_hub_config(), shutdown_signal};

    auto subscribed = std::make_shared<test::RecordingSink>();
    auto video_only = std::make_shared<test::RecordingSink>();
    hub.connect("subscribed", subscribed);
    hub.connect("video-only", video_only);
    REQUIRE(hub.unsubscribe("video-only", Channel::Telemetry));

    for (std::uint64_t sequence = 1; sequence <= 3; ++sequence) {
        REQUIRE(hub.publish(Channel::Telemetry, make_snapshot(sequence)) == PushResult::Enqueued);
    }
    REQUIRE(hub.flush(Channel::Telemetry) == 3);

    const auto list_received = subscribed->received();
    REQUIRE(list_received.size() == 3);
    for (std::size_t index = 0; index < list_received.size(); ++index) {
        REQUIRE(list_received[index].first == Channel::Telemetry);
        REQUIRE(std::get<TelemetrySnapshot>(list_received[index].second).sequence == index + 1);
    }
    REQUIRE(video_only->received().empty());
    REQUIRE(hub.stats(Channel::Telemetry).delivered == 3);
}

TEST_CASE("BroadcastHub rejects payloads published on the wrong channel") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    BroadcastHub hub{test::make_manual_hub_config(), shutdown_signal};

    REQUIRE_THROWS_AS(hub.publish(Channel::Video, make_snapshot(1)), std::invalid_argument);
    REQUIRE(hub.publish(make_alert_event(1)) == PushResult::Enqueued);
    REQUIRE(hub.queue_size(Channel::Alerts) == 1);
}

TEST_CASE("BroadcastHub isolates a failing client to the failing channel") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    BroadcastHub hub{test::make_manual_hub_config(), shutdown_signal};

    auto healthy = std::make_shared<test::RecordingSink>();
    auto broken = std::make_shared<test::RecordingSink>(1);
    hub.connect("healthy", healthy);
    hub.connect("broken", broken);

    for (std::uint64_t sequence = 1; sequence <= 5; ++sequence) {
        (void)hub.publish(make_snapshot(sequence));
    }
    REQUIRE_NOTHROW(hub.flush(Channel::Telemetry));

    REQUIRE(healthy->count(Channel::Telemetry) == 5);
    REQUIRE(broken->received().empty());
    REQUIRE(hub.stats(Channel::Telemetry).delivery_failures == 1);

    const auto subscription = hub.subscription("broken");
    REQUIRE(subscription.has_value());
    REQUIRE(subscription->joined_channels.count(Channel::Telemetry) == 0);
    REQUIRE(subscription->joined_channels.count(Channel::Alerts) == 1);
}

TEST_CASE("BroadcastHub keeps serving remaining clients when one disconnects mid-broadcast") {
    test::ensure_logger_initialized();
    HubConfig config = test::make_manual_hub_config();
    config.telemetry.capacity = 1000;
    config.telemetry.period = Duration{0.005};
    ShutdownSignal shutdown_signal;
    BroadcastHub hub{config, shutdown_signal};

    auto staying = std::make_shared<test::RecordingSink>();
    auto leaving = std::make_shared<test::RecordingSink>();
    hub.connect("staying", staying);
    hub.connect("leaving", leaving);
    hub.start();

    constexpr std::uint64_t k_message_count{200};
    for (std::uint64_t sequence = 1; sequence <= k_message_count; ++sequence) {
        REQUIRE(hub.publish(make_snapshot(sequence)) == PushResult::Enqueued);
        if (sequence == k_message_count / 2) {
            REQUIRE_NOTHROW(hub.disconnect("leaving"));
        }
        if (sequence % 20 == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }

    REQUIRE(wait_for([&staying]() { return staying->count(Channel::Telemetry) == k_message_count; }));
    const std::size_t leaving_count = leaving->count(Channel::Telemetry);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    REQUIRE(leaving->count(Channel::Telemetry) == leaving_count);
    REQUIRE(leaving_count <= k_message_count / 2);

    const auto list_received = staying->received();
    for (std::size_t index = 0; index < list_received.size(); ++index) {
        REQUIRE(std::get<TelemetrySnapshot>(list_received[index].second).sequence == index + 1);
    }
    REQUIRE(hub.stats(Channel::Telemetry).delivery_failures == 0);
    hub.stop();
}

TEST_CASE("BroadcastHub delivers alerts as soon as they are published") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    BroadcastHub hub{test::make_manual_hub_config(), shutdown_signal};

    auto sink = std::make_shared<test::RecordingSink>();
    hub.connect("ui", sink);
    hub.start();

    REQUIRE(hub.publish(make_alert_event(7)) == PushResult::Enqueued);
    REQUIRE(wait_for([&sink]() { return sink->count(Channel::Alerts) == 1; }, std::chrono::milliseconds(1000)));
    REQUIRE(std::get<AlertEvent>(sink->received().front().second).alert.id == 7);

    hub.stop();
    REQUIRE(hub.publish(make_alert_event(8)) == PushResult::Closed);
}
