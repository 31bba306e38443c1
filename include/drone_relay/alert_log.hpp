// === Alert Log ===============================================================
//
// Bounded, append-only record of operator alerts. The oldest alert is evicted
// once capacity is exceeded; identifiers keep increasing across evictions.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief Single operator alert raised by the simulator. */
struct Alert final {
    std::uint64_t id{};                          /**< Monotonic identifier, starting at 1. */
    std::string message{};                       /**< Human-readable text. */
    AlertSeverity severity{AlertSeverity::Info}; /**< Severity class. */
    std::string type{};                          /**< Machine-readable category, "general" by default. */
    WallTime timestamp{};                        /**< Wall-clock time the alert was raised. */
};

/** @brief Ring buffer of alerts, newest last. */
class AlertLog final {
  public:
    static constexpr std::size_t k_default_capacity{50};

    explicit AlertLog(std::size_t capacity = k_default_capacity);

    /** @brief Append an alert, evicting the oldest entry when full. */
    const Alert& push(std::string message, AlertSeverity severity, std::string type = "general");

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    /** @brief Copy of the newest @p count alerts, oldest first. */
    [[nodiscard]] std::vector<Alert> recent(std::size_t count) const;
    [[nodiscard]] const std::deque<Alert>& entries() const noexcept;

  private:
    std::size_t capacity_;
    std::uint64_t next_id_{1};
    std::deque<Alert> deque_alerts_;
};

}  // namespace drone_relay
