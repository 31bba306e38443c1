#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

#include "drone_relay/periodic_task.hpp"
#include "logging_test_fixture.hpp"

using namespace drone_relay;

namespace {
bool wait_for_count(const std::atomic<int>& counter, int target) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(2000);
    while (std::chrono::steady_clock::now() < deadline) {
        if (counter.load() >= target) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return counter.load() >= target;
}
}  // namespace

TEST_CASE("PeriodicTask stop ends only its own loop") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    std::atomic<int> first_runs{0};
    std::atomic<int> second_runs{0};
    PeriodicTask first{"first", Duration{0.005}, [&first_runs]() { ++first_runs; }, shutdown_signal};
    PeriodicTask second{"second", Duration{0.005}, [&second_runs]() { ++second_runs; }, shutdown_signal};
    first.start();
    second.start();
    REQUIRE(wait_for_count(first_runs, 2));

    first.stop();
    REQUIRE_FALSE(first.running());
    REQUIRE_FALSE(shutdown_signal.requested());

    const int first_after_stop = first_runs.load();
    const int second_before = second_runs.load();
    REQUIRE(wait_for_count(second_runs, second_before + 3));
    REQUIRE(first_runs.load() == first_after_stop);
    REQUIRE(second.running());

    shutdown_signal.request();
    second.stop();
    REQUIRE_FALSE(second.running());
}

TEST_CASE("PeriodicTask stop interrupts a long period without waiting it out") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    std::atomic<int> runs{0};
    PeriodicTask task{"slow", Duration{30.0}, [&runs]() { ++runs; }, shutdown_signal};
    task.start();
    REQUIRE(wait_for_count(runs, 1));

    const auto before = std::chrono::steady_clock::now();
    task.stop();
    REQUIRE(std::chrono::steady_clock::now() - before < std::chrono::seconds(5));
    REQUIRE_FALSE(shutdown_signal.requested());
}

TEST_CASE("PeriodicTask can be restarted after a local stop") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    std::atomic<int> runs{0};
    PeriodicTask task{"restartable", Duration{0.005}, [&runs]() { ++runs; }, shutdown_signal};
    task.start();
    REQUIRE(wait_for_count(runs, 1));
    task.stop();

    const int after_first_stop = runs.load();
    task.start();
    REQUIRE(task.running());
    REQUIRE(wait_for_count(runs, after_first_stop + 2));
    task.stop();
}

TEST_CASE("PeriodicTask keeps running after its body throws") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    std::atomic<int> runs{0};
    PeriodicTask task{
        "flaky",
        Duration{0.005},
        [&runs]() {
            if (++runs == 1) {
                throw std::runtime_error("first iteration fails");
            }
        },
        shutdown_signal};
    task.start();
    REQUIRE(wait_for_count(runs, 3));
    task.stop();
}

TEST_CASE("PeriodicTask rejects invalid construction arguments") {
    test::ensure_logger_initialized();
    ShutdownSignal shutdown_signal;
    REQUIRE_THROWS_AS(PeriodicTask("", Duration{0.1}, []() {}, shutdown_signal), std::invalid_argument);
    REQUIRE_THROWS_AS(PeriodicTask("negative", Duration{-1.0}, []() {}, shutdown_signal), std::invalid_argument);
    REQUIRE_THROWS_AS(PeriodicTask("empty", Duration{0.1}, std::function<void()>{}, shutdown_signal), std::invalid_argument);
}
