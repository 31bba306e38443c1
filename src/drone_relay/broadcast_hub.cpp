#include "drone_relay/broadcast_hub.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "drone_relay/errors.hpp"
#include "drone_relay/logging.hpp"

namespace drone_relay {

namespace {
std::size_t channel_index(Channel channel) {
    return static_cast<std::size_t>(channel);
}
}  // namespace

const ChannelSettings& HubConfig::settings_for(Channel channel) const noexcept {
    switch (channel) {
        case Channel::Telemetry:
            return telemetry;
        case Channel::Video:
            return video;
        case Channel::Detections:
            return detections;
        case Channel::Alerts:
            break;
    }
    return alerts;
}

BroadcastHub::ChannelState::ChannelState(Channel channel_id, const ChannelSettings& channel_settings, Duration block_timeout)
    : channel(channel_id),
      settings(channel_settings),
      queue(channel_settings.capacity, channel_settings.overflow, block_timeout) {}

BroadcastHub::BroadcastHub(HubConfig config, ShutdownSignal& shutdown_signal)
    : config_(std::move(config)),
      shutdown_signal_(shutdown_signal),
      logger_(get_logger()) {
    if (config_.event_wait.count() <= 0.0) {
        throw std::invalid_argument("BroadcastHub event wait must be positive");
    }
    for (const Channel channel : k_all_channels) {
        const ChannelSettings& settings = config_.settings_for(channel);
        if (settings.period.count() < 0.0) {
            throw std::invalid_argument(fmt::format("Channel {} period cannot be negative", to_string(channel)));
        }
        array_channels_[channel_index(channel)] = std::make_unique<ChannelState>(channel, settings, config_.alert_block_timeout);
    }
}

BroadcastHub::~BroadcastHub() {
    stop();
}

void BroadcastHub::start() {
    if (flag_started_.exchange(true)) {
        return;
    }
    for (const auto& state : array_channels_) {
        ChannelState* const raw_state = state.get();
        std::function<void()> body;
        if (raw_state->settings.period.count() > 0.0) {
            body = [this, raw_state]() { flush(raw_state->channel); };
        } else {
            body = [this, raw_state]() { run_event_iteration(*raw_state); };
        }
        raw_state->task = std::make_unique<PeriodicTask>(
            fmt::format("hub-{}", to_string(raw_state->channel)),
            raw_state->settings.period,
            std::move(body),
            shutdown_signal_
        );
        raw_state->task->start();
    }
    logger_->info("Broadcast hub started with {} channels", array_channels_.size());
}

void BroadcastHub::stop() {
    if (!flag_started_.exchange(false)) {
        return;
    }
    shutdown_signal_.request();
    for (const auto& state : array_channels_) {
        state->queue.close();
    }
    for (const auto& state : array_channels_) {
        if (state->task) {
            state->task->stop();
        }
    }
    logger_->info("Broadcast hub stopped");
}

void BroadcastHub::connect(const std::string& client_id, ClientSinkPtr sink) {
    if (client_id.empty()) {
        throw std::invalid_argument("Client identifier cannot be empty");
    }
    if (sink == nullptr) {
        throw std::invalid_argument("Client sink cannot be null");
    }
    std::size_t connected_count = 0;
    {
        std::scoped_lock lock(registry_mutex_);
        if (map_clients_.count(client_id) != 0) {
            throw std::invalid_argument(fmt::format("Client {} is already connected", client_id));
        }
        ClientRecord record{};
        record.sink = std::move(sink);
        record.subscription.client_id = client_id;
        record.subscription.joined_channels.insert(k_all_channels.begin(), k_all_channels.end());
        map_clients_.emplace(client_id, std::move(record));
        connected_count = map_clients_.size();
    }
    logger_->info(R"({{"component":"hub","event":"connect","client":"{}","clients":{}}})", client_id, connected_count);
}

void BroadcastHub::disconnect(const std::string& client_id) {
    std::size_t erased = 0;
    {
        std::scoped_lock lock(registry_mutex_);
        erased = map_clients_.erase(client_id);
    }
    if (erased == 0) {
        return;
    }
    // Wait out any fan-out that collected this client before it was erased.
    for (const auto& state : array_channels_) {
        std::scoped_lock barrier(state->delivery_mutex);
    }
    logger_->info(R"({{"component":"hub","event":"disconnect","client":"{}"}})", client_id);
}

bool BroadcastHub::subscribe(const std::string& client_id, Channel channel) {
    std::scoped_lock lock(registry_mutex_);
    const auto iterator_client = map_clients_.find(client_id);
    if (iterator_client == map_clients_.end()) {
        return false;
    }
    iterator_client->second.subscription.joined_channels.insert(channel);
    logger_->debug("Client {} joined {}", client_id, to_string(channel));
    return true;
}

bool BroadcastHub::unsubscribe(const std::string& client_id, Channel channel) {
    std::scoped_lock lock(registry_mutex_);
    const auto iterator_client = map_clients_.find(client_id);
    if (iterator_client == map_clients_.end()) {
        return false;
    }
    iterator_client->second.subscription.joined_channels.erase(channel);
    logger_->debug("Client {} left {}", client_id, to_string(channel));
    return true;
}

PushResult BroadcastHub::publish(Channel channel, ChannelMessage message) {
    if (channel_of(message) != channel) {
        throw std::invalid_argument(fmt::format("Payload does not belong on channel {}", to_string(channel)));
    }
    ChannelState& state = state_for(channel);
    const PushResult result = state.queue.publish(std::move(message));
    switch (result) {
        case PushResult::Enqueued:
            ++state.published;
            break;
        case PushResult::Dropped:
            ++state.dropped;
            logger_->debug("Channel {} full; dropped newest message", to_string(channel));
            break;
        case PushResult::TimedOut:
            ++state.dropped;
            logger_->error(
                R"({{"component":"hub","channel":"{}","event":"publish_timeout","timeout_s":{}}})",
                to_string(channel),
                config_.alert_block_timeout.count()
            );
            break;
        case PushResult::Closed:
            logger_->debug("Channel {} closed; message discarded", to_string(channel));
            break;
    }
    return result;
}

PushResult BroadcastHub::publish(ChannelMessage message) {
    const Channel channel = channel_of(message);
    return publish(channel, std::move(message));
}

std::size_t BroadcastHub::flush(Channel channel) {
    ChannelState& state = state_for(channel);
    std::vector<ChannelMessage> list_messages = state.queue.drain();
    for (const ChannelMessage& message : list_messages) {
        fan_out(state, message);
    }
    return list_messages.size();
}

std::optional<ClientSubscription> BroadcastHub::subscription(const std::string& client_id) const {
    std::scoped_lock lock(registry_mutex_);
    const auto iterator_client = map_clients_.find(client_id);
    if (iterator_client == map_clients_.end()) {
        return std::nullopt;
    }
    return iterator_client->second.subscription;
}

std::size_t BroadcastHub::client_count() const {
    std::scoped_lock lock(registry_mutex_);
    return map_clients_.size();
}

std::size_t BroadcastHub::queue_size(Channel channel) const {
    return state_for(channel).queue.size();
}

ChannelStats BroadcastHub::stats(Channel channel) const {
    const ChannelState& state = state_for(channel);
    ChannelStats stats{};
    stats.published = state.published.load();
    stats.dropped = state.dropped.load();
    stats.delivered = state.delivered.load();
    stats.delivery_failures = state.delivery_failures.load();
    return stats;
}

const HubConfig& BroadcastHub::config() const noexcept {
    return config_;
}

BroadcastHub::ChannelState& BroadcastHub::state_for(Channel channel) const {
    return *array_channels_.at(channel_index(channel));
}

/**
 * @brief Hand one message to every current subscriber of the channel.
 *
 * The channel's delivery mutex is held for the whole fan-out so that messages
 * never overtake each other and disconnect() can wait for in-flight deliveries.
 */
void BroadcastHub::fan_out(ChannelState& state, const ChannelMessage& message) {
    std::scoped_lock delivery_lock(state.delivery_mutex);

    std::vector<std::pair<std::string, ClientSinkPtr>> list_recipients;
    {
        std::scoped_lock lock(registry_mutex_);
        list_recipients.reserve(map_clients_.size());
        for (const auto& [client_id, record] : map_clients_) {
            if (record.subscription.joined_channels.count(state.channel) != 0) {
                list_recipients.emplace_back(client_id, record.sink);
            }
        }
    }

    for (const auto& [client_id, sink] : list_recipients) {
        {
            std::scoped_lock lock(registry_mutex_);
            const auto iterator_client = map_clients_.find(client_id);
            if (iterator_client == map_clients_.end()
                || iterator_client->second.subscription.joined_channels.count(state.channel) == 0) {
                continue;
            }
        }
        try {
            sink->deliver(state.channel, message);
            ++state.delivered;
        } catch (const DeliveryError& exc) {
            drop_subscriber(state, client_id, exc.what());
        } catch (const std::exception& exc) {
            drop_subscriber(state, client_id, fmt::format("unexpected delivery error: {}", exc.what()));
        }
    }
}

void BroadcastHub::run_event_iteration(ChannelState& state) {
    std::optional<ChannelMessage> optional_message = state.queue.consume_for(config_.event_wait);
    if (!optional_message.has_value()) {
        return;
    }
    fan_out(state, optional_message.value());
}

void BroadcastHub::drop_subscriber(ChannelState& state, const std::string& client_id, const std::string& reason) {
    ++state.delivery_failures;
    {
        std::scoped_lock lock(registry_mutex_);
        const auto iterator_client = map_clients_.find(client_id);
        if (iterator_client != map_clients_.end()) {
            iterator_client->second.subscription.joined_channels.erase(state.channel);
        }
    }
    logger_->warn(
        R"({{"component":"hub","channel":"{}","event":"delivery_failed","client":"{}","error":"{}"}})",
        to_string(state.channel),
        client_id,
        reason
    );
}

}  // namespace drone_relay
