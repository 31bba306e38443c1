#include <catch2/catch.hpp>

#include <stdexcept>

#include "drone_relay/alert_log.hpp"

using namespace drone_relay;

TEST_CASE("AlertLog never exceeds its capacity and evicts the oldest alert") {
    AlertLog alert_log{};
    REQUIRE(alert_log.capacity() == 50);

    for (int index = 1; index <= 50; ++index) {
        alert_log.push("alert " + std::to_string(index), AlertSeverity::Info);
    }
    REQUIRE(alert_log.size() == 50);
    REQUIRE(alert_log.entries().front().id == 1);

    const Alert& newest = alert_log.push("alert 51", AlertSeverity::Warning, "low_battery");
    REQUIRE(alert_log.size() == 50);
    REQUIRE(newest.id == 51);
    REQUIRE(newest.type == "low_battery");
    REQUIRE(alert_log.entries().front().id == 2);
    REQUIRE(alert_log.entries().back().message == "alert 51");
}

TEST_CASE("AlertLog recent returns the newest alerts oldest first") {
    AlertLog alert_log{5};
    for (int index = 1; index <= 7; ++index) {
        alert_log.push("alert " + std::to_string(index), AlertSeverity::Info);
    }

    const std::vector<Alert> list_recent = alert_log.recent(3);
    REQUIRE(list_recent.size() == 3);
    REQUIRE(list_recent[0].id == 5);
    REQUIRE(list_recent[2].id == 7);

    REQUIRE(alert_log.recent(10).size() == 5);
    REQUIRE(alert_log.recent(0).empty());
}

TEST_CASE("AlertLog defaults the alert type and rejects zero capacity") {
    AlertLog alert_log{};
    REQUIRE(alert_log.empty());
    REQUIRE(alert_log.push("hello", AlertSeverity::Critical).type == "general");
    REQUIRE_THROWS_AS(AlertLog{0}, std::invalid_argument);
}
