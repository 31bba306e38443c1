#include "drone_relay/periodic_task.hpp"

#include <algorithm>
#include <stdexcept>

#include "drone_relay/logging.hpp"

namespace drone_relay {

void ShutdownSignal::request() {
    {
        std::scoped_lock lock(mutex_);
        flag_requested_.store(true);
    }
    cv_.notify_all();
}

bool ShutdownSignal::requested() const noexcept {
    return flag_requested_.load();
}

bool ShutdownSignal::wait_until(TimePoint deadline) {
    std::unique_lock lock(mutex_);
    return cv_.wait_until(lock, deadline, [this]() { return flag_requested_.load(); });
}

bool ShutdownSignal::wait_until(TimePoint deadline, const std::atomic<bool>& local_stop) {
    std::unique_lock lock(mutex_);
    return cv_.wait_until(lock, deadline, [this, &local_stop]() {
        return flag_requested_.load() || local_stop.load();
    });
}

void ShutdownSignal::wake() {
    // Taking the mutex orders the wake after any waiter's predicate check.
    { std::scoped_lock lock(mutex_); }
    cv_.notify_all();
}

bool ShutdownSignal::wait_for(Duration timeout) {
    return wait_until(SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(timeout));
}

PeriodicTask::PeriodicTask(std::string name, Duration period, std::function<void()> body, ShutdownSignal& shutdown_signal)
    : str_name_(std::move(name)),
      period_(period),
      body_(std::move(body)),
      shutdown_signal_(shutdown_signal),
      logger_(get_logger()) {
    if (str_name_.empty()) {
        throw std::invalid_argument("PeriodicTask requires a name");
    }
    if (period_.count() < 0.0) {
        throw std::invalid_argument("PeriodicTask period cannot be negative");
    }
    if (!body_) {
        throw std::invalid_argument("PeriodicTask requires a body");
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    flag_stop_requested_.store(false);
    logger_->debug("Starting task {} with period {}s", str_name_, period_.count());
    worker_thread_ = std::thread(&PeriodicTask::run_loop, this);
}

void PeriodicTask::stop() {
    flag_stop_requested_.store(true);
    shutdown_signal_.wake();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        logger_->debug("Task {} stopped", str_name_);
    }
    flag_running_.store(false);
}

const std::string& PeriodicTask::name() const noexcept {
    return str_name_;
}

bool PeriodicTask::running() const noexcept {
    return flag_running_.load();
}

/**
 * @brief Fixed-cadence loop; a late iteration reschedules from "now" instead of bursting.
 */
void PeriodicTask::run_loop() {
    const SteadyClock::duration steady_period = std::chrono::duration_cast<SteadyClock::duration>(period_);
    auto next_tick = SteadyClock::now();
    while (!shutdown_signal_.requested() && !flag_stop_requested_.load()) {
        if (steady_period.count() > 0 && shutdown_signal_.wait_until(next_tick, flag_stop_requested_)) {
            break;
        }
        const TimePoint now = SteadyClock::now();
        try {
            body_();
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"task","task":"{}","error":"{}"}})", str_name_, exc.what());
        }
        next_tick = std::max(next_tick + steady_period, now);
    }
}

}  // namespace drone_relay
