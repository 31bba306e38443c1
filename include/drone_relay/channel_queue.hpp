// === Channel Queue ===========================================================
//
// Bounded thread-safe FIFO feeding one broadcast channel. What happens when a
// producer publishes into a full queue is decided by the channel's overflow
// policy: drop the new item, or block the producer for a bounded time.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "drone_relay/messages.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief Behaviour of publish() on a full queue. */
enum class OverflowPolicy {
    DropNewest, /**< Discard the item being published; the producer never waits. */
    Block       /**< Wait for space up to the queue's block timeout. */
};

/** @brief Outcome of a single publish. */
enum class PushResult {
    Enqueued,
    Dropped,
    TimedOut,
    Closed
};

/** @brief Thread-safe bounded FIFO of channel messages. */
class ChannelQueue final {
  public:
    ChannelQueue(std::size_t capacity, OverflowPolicy policy, Duration block_timeout = Duration{1.0});

    /** @brief Publish a message according to the overflow policy. */
    PushResult publish(ChannelMessage message);
    /** @brief Attempt to consume a pending message without blocking. */
    [[nodiscard]] std::optional<ChannelMessage> try_consume();
    /** @brief Wait up to @p timeout for a message. */
    [[nodiscard]] std::optional<ChannelMessage> consume_for(Duration timeout);
    /** @brief Remove and return every queued message in FIFO order. */
    [[nodiscard]] std::vector<ChannelMessage> drain();
    /** @brief Wake all waiters and reject further publishes. */
    void close();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] OverflowPolicy policy() const noexcept;

  private:
    const std::size_t capacity_;
    const OverflowPolicy policy_;
    const Duration block_timeout_;
    mutable std::mutex mutex_;
    std::condition_variable cv_not_full_;
    std::condition_variable cv_not_empty_;
    std::deque<ChannelMessage> deque_messages_;
    bool closed_{false};
};

}  // namespace drone_relay
