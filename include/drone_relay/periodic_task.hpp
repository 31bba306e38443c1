// === Periodic Task ===========================================================
//
// Cooperative scheduling primitives shared by every background loop: a
// shutdown signal that all loops of one runtime observe, and a fixed-cadence
// task that runs a body on its own thread until that signal is raised or the
// task itself is stopped.

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/logger.h>

#include "drone_relay/types.hpp"

namespace drone_relay {

/** @brief One-shot cancellation flag with interruptible waits. */
class ShutdownSignal final {
  public:
    /** @brief Raise the signal and wake every waiter. Idempotent. */
    void request();
    [[nodiscard]] bool requested() const noexcept;
    /**
     * @brief Sleep until @p deadline or until the signal is raised.
     * @return true when the signal was raised.
     */
    bool wait_until(TimePoint deadline);
    /**
     * @brief Sleep until @p deadline, the signal, or @p local_stop is set.
     * @return true when either the signal or @p local_stop was raised.
     */
    bool wait_until(TimePoint deadline, const std::atomic<bool>& local_stop);
    /** @brief Relative-time variant of wait_until. */
    bool wait_for(Duration timeout);
    /** @brief Wake every waiter without raising the signal. */
    void wake();

  private:
    std::atomic<bool> flag_requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * @brief Runs @p body every @p period on a dedicated thread.
 *
 * A zero period runs the body back to back; such bodies are expected to block
 * for a bounded time on their own. Exceptions escaping the body are logged and
 * the loop continues with the next iteration.
 */
class PeriodicTask final {
  public:
    PeriodicTask(std::string name, Duration period, std::function<void()> body, ShutdownSignal& shutdown_signal);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /** @brief Launch the worker thread. Calling start twice is a no-op. */
    void start();
    /**
     * @brief Stop this task after its current iteration and join the worker.
     *
     * The shared shutdown signal is left untouched; other tasks on the same
     * signal keep running.
     */
    void stop();

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] bool running() const noexcept;

  private:
    void run_loop();

    std::string str_name_;
    Duration period_;
    std::function<void()> body_;
    ShutdownSignal& shutdown_signal_;
    std::atomic<bool> flag_running_{false};
    std::atomic<bool> flag_stop_requested_{false};
    std::thread worker_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
