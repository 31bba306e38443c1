#include "drone_relay/channel_queue.hpp"

#include <stdexcept>

namespace drone_relay {

namespace {
SteadyClock::duration to_steady(Duration duration) {
    return std::chrono::duration_cast<SteadyClock::duration>(duration);
}
}  // namespace

ChannelQueue::ChannelQueue(std::size_t capacity, OverflowPolicy policy, Duration block_timeout)
    : capacity_(capacity),
      policy_(policy),
      block_timeout_(block_timeout) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ChannelQueue capacity must be positive");
    }
    if (block_timeout_.count() <= 0.0) {
        throw std::invalid_argument("ChannelQueue block timeout must be positive");
    }
}

PushResult ChannelQueue::publish(ChannelMessage message) {
    std::unique_lock lock(mutex_);
    if (closed_) {
        return PushResult::Closed;
    }
    if (deque_messages_.size() >= capacity_) {
        if (policy_ == OverflowPolicy::DropNewest) {
            return PushResult::Dropped;
        }
        const bool has_space = cv_not_full_.wait_for(lock, to_steady(block_timeout_), [this]() {
            return closed_ || deque_messages_.size() < capacity_;
        });
        if (closed_) {
            return PushResult::Closed;
        }
        if (!has_space) {
            return PushResult::TimedOut;
        }
    }
    deque_messages_.push_back(std::move(message));
    lock.unlock();
    cv_not_empty_.notify_one();
    return PushResult::Enqueued;
}

std::optional<ChannelMessage> ChannelQueue::try_consume() {
    std::unique_lock lock(mutex_);
    if (deque_messages_.empty()) {
        return std::nullopt;
    }
    ChannelMessage message = std::move(deque_messages_.front());
    deque_messages_.pop_front();
    lock.unlock();
    cv_not_full_.notify_one();
    return message;
}

std::optional<ChannelMessage> ChannelQueue::consume_for(Duration timeout) {
    std::unique_lock lock(mutex_);
    const bool ready = cv_not_empty_.wait_for(lock, to_steady(timeout), [this]() {
        return closed_ || !deque_messages_.empty();
    });
    if (!ready || deque_messages_.empty()) {
        return std::nullopt;
    }
    ChannelMessage message = std::move(deque_messages_.front());
    deque_messages_.pop_front();
    lock.unlock();
    cv_not_full_.notify_one();
    return message;
}

std::vector<ChannelMessage> ChannelQueue::drain() {
    std::vector<ChannelMessage> list_messages;
    {
        std::scoped_lock lock(mutex_);
        list_messages.reserve(deque_messages_.size());
        for (ChannelMessage& message : deque_messages_) {
            list_messages.push_back(std::move(message));
        }
        deque_messages_.clear();
    }
    cv_not_full_.notify_all();
    return list_messages;
}

void ChannelQueue::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
    }
    cv_not_full_.notify_all();
    cv_not_empty_.notify_all();
}

std::size_t ChannelQueue::size() const {
    std::scoped_lock lock(mutex_);
    return deque_messages_.size();
}

std::size_t ChannelQueue::capacity() const noexcept {
    return capacity_;
}

OverflowPolicy ChannelQueue::policy() const noexcept {
    return policy_;
}

}  // namespace drone_relay
