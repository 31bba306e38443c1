#include "drone_relay/alert_log.hpp"

#include <algorithm>
#include <stdexcept>

namespace drone_relay {

AlertLog::AlertLog(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("AlertLog capacity must be positive");
    }
}

const Alert& AlertLog::push(std::string message, AlertSeverity severity, std::string type) {
    Alert alert{};
    alert.id = next_id_++;
    alert.message = std::move(message);
    alert.severity = severity;
    alert.type = type.empty() ? std::string{"general"} : std::move(type);
    alert.timestamp = WallClock::now();

    deque_alerts_.push_back(std::move(alert));
    while (deque_alerts_.size() > capacity_) {
        deque_alerts_.pop_front();
    }
    return deque_alerts_.back();
}

std::size_t AlertLog::size() const noexcept {
    return deque_alerts_.size();
}

std::size_t AlertLog::capacity() const noexcept {
    return capacity_;
}

bool AlertLog::empty() const noexcept {
    return deque_alerts_.empty();
}

std::vector<Alert> AlertLog::recent(std::size_t count) const {
    const std::size_t taken = std::min(count, deque_alerts_.size());
    return std::vector<Alert>(deque_alerts_.end() - static_cast<std::ptrdiff_t>(taken), deque_alerts_.end());
}

const std::deque<Alert>& AlertLog::entries() const noexcept {
    return deque_alerts_;
}

}  // namespace drone_relay
