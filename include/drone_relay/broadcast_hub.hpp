// === Broadcast Hub ===========================================================
//
// Publish/subscribe fan-out for the relay. Each channel owns a bounded queue
// and a delivery loop running at the channel's cadence; every queued message
// is handed to every subscribed client before the next message is taken.
// Delivery failures are isolated per client and per channel.

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "drone_relay/channel_queue.hpp"
#include "drone_relay/messages.hpp"
#include "drone_relay/periodic_task.hpp"

namespace drone_relay {

/**
 * @brief Connection endpoint of one client.
 *
 * deliver() runs on the channel's delivery thread and signals a broken
 * connection by throwing DeliveryError. It must not call back into the hub.
 */
class ClientSink {
  public:
    virtual ~ClientSink() = default;
    virtual void deliver(Channel channel, const ChannelMessage& message) = 0;
};

using ClientSinkPtr = std::shared_ptr<ClientSink>;

/** @brief Queue and cadence settings of one channel. */
struct ChannelSettings final {
    std::size_t capacity{};                              /**< Queue capacity in messages. */
    OverflowPolicy overflow{OverflowPolicy::DropNewest}; /**< Policy applied on a full queue. */
    Duration period{};                                   /**< Delivery cadence; zero means event driven. */
};

/** @brief Settings for every channel of the hub. */
struct HubConfig final {
    ChannelSettings telemetry{100, OverflowPolicy::DropNewest, Duration{0.1}};
    ChannelSettings video{10, OverflowPolicy::DropNewest, Duration{1.0 / 30.0}};
    ChannelSettings detections{50, OverflowPolicy::DropNewest, Duration{0.1}};
    ChannelSettings alerts{20, OverflowPolicy::Block, Duration{0.0}};
    Duration alert_block_timeout{Duration{1.0}}; /**< Longest a producer waits on a full blocking queue. */
    Duration event_wait{Duration{0.1}};          /**< Longest an event-driven loop waits before re-checking shutdown. */

    [[nodiscard]] const ChannelSettings& settings_for(Channel channel) const noexcept;
};

/** @brief Channels joined by one connected client. */
struct ClientSubscription final {
    std::string client_id{};
    std::set<Channel> joined_channels{};
};

/** @brief Counters kept per channel. */
struct ChannelStats final {
    std::uint64_t published{};          /**< Messages accepted onto the queue. */
    std::uint64_t dropped{};            /**< Messages rejected by the overflow policy. */
    std::uint64_t delivered{};          /**< Successful client deliveries. */
    std::uint64_t delivery_failures{};  /**< Client deliveries that raised. */
};

class BroadcastHub final {
  public:
    BroadcastHub(HubConfig config, ShutdownSignal& shutdown_signal);
    ~BroadcastHub();

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    /** @brief Launch one delivery loop per channel. */
    void start();
    /** @brief Raise shutdown, release blocked producers and join the loops. */
    void stop();

    /** @brief Register a client; it joins every channel until it unsubscribes. */
    void connect(const std::string& client_id, ClientSinkPtr sink);
    /** @brief Remove a client from every channel. Returns once no delivery to it is in flight. */
    void disconnect(const std::string& client_id);
    /** @brief Join @p channel. Returns false for unknown clients. */
    bool subscribe(const std::string& client_id, Channel channel);
    /** @brief Leave @p channel. Returns false for unknown clients. */
    bool unsubscribe(const std::string& client_id, Channel channel);

    /**
     * @brief Queue @p message on @p channel.
     * @throws std::invalid_argument when the payload does not belong to the channel.
     */
    PushResult publish(Channel channel, ChannelMessage message);
    /** @brief Queue @p message on the channel its payload type belongs to. */
    PushResult publish(ChannelMessage message);

    /** @brief Deliver every message currently queued on @p channel. Returns the count delivered. */
    std::size_t flush(Channel channel);

    [[nodiscard]] std::optional<ClientSubscription> subscription(const std::string& client_id) const;
    [[nodiscard]] std::size_t client_count() const;
    [[nodiscard]] std::size_t queue_size(Channel channel) const;
    [[nodiscard]] ChannelStats stats(Channel channel) const;
    [[nodiscard]] const HubConfig& config() const noexcept;

  private:
    struct ClientRecord final {
        ClientSinkPtr sink{};
        ClientSubscription subscription{};
    };

    struct ChannelState final {
        ChannelState(Channel channel_id, const ChannelSettings& settings, Duration block_timeout);

        Channel channel;
        ChannelSettings settings;
        ChannelQueue queue;
        std::mutex delivery_mutex;
        std::atomic<std::uint64_t> published{0};
        std::atomic<std::uint64_t> dropped{0};
        std::atomic<std::uint64_t> delivered{0};
        std::atomic<std::uint64_t> delivery_failures{0};
        std::unique_ptr<PeriodicTask> task;
    };

    ChannelState& state_for(Channel channel) const;
    void fan_out(ChannelState& state, const ChannelMessage& message);
    void run_event_iteration(ChannelState& state);
    void drop_subscriber(ChannelState& state, const std::string& client_id, const std::string& reason);

    HubConfig config_;
    ShutdownSignal& shutdown_signal_;
    std::array<std::unique_ptr<ChannelState>, k_all_channels.size()> array_channels_;
    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, ClientRecord> map_clients_;
    std::atomic<bool> flag_started_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
