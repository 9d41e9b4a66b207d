#include <catch2/catch_test_macros.hpp>
#include "sigkeep/state/key_health_monitor.hpp"
#include <chrono>
#include <vector>
using namespace sigkeep;
using namespace sigkeep::state;
using models::KeyHealthStatus;

TEST_CASE("KeyHealthMonitor - State Transitions", "[health]") {
    KeyHealthMonitor monitor("prekeys");
    const KeyHealthMonitor::TimePoint at{std::chrono::seconds(1'700'000'000)};

    SECTION("Starts unknown") {
        const auto state = monitor.Snapshot();
        REQUIRE(monitor.Name() == "prekeys");
        REQUIRE(state.status == KeyHealthStatus::Unknown);
        REQUIRE(state.key_count == 0);
        REQUIRE_FALSE(state.in_progress);
        REQUIRE_FALSE(state.last_check.has_value());
    }
    SECTION("Generation clears progress and records the time") {
        monitor.MarkInProgress();
        REQUIRE(monitor.Snapshot().in_progress);
        REQUIRE(monitor.Snapshot().status == KeyHealthStatus::Generating);
        monitor.MarkGenerated(110, at);
        const auto state = monitor.Snapshot();
        REQUIRE_FALSE(state.in_progress);
        REQUIRE(state.status == KeyHealthStatus::Healthy);
        REQUIRE(state.key_count == 110);
        REQUIRE(state.last_generation == at);
    }
    SECTION("Errors are cleared by a healthy check") {
        monitor.MarkInProgress();
        monitor.MarkError("upload failed");
        auto state = monitor.Snapshot();
        REQUIRE(state.status == KeyHealthStatus::Error);
        REQUIRE_FALSE(state.in_progress);
        REQUIRE(state.last_error == "upload failed");

        monitor.MarkChecked(25, KeyHealthStatus::Healthy, at);
        state = monitor.Snapshot();
        REQUIRE_FALSE(state.last_error.has_value());
        REQUIRE(state.last_check == at);
    }
    SECTION("Count updates keep the status") {
        monitor.MarkChecked(19, KeyHealthStatus::Low, at);
        monitor.UpdateCount(18);
        REQUIRE(monitor.Snapshot().key_count == 18);
        REQUIRE(monitor.Snapshot().status == KeyHealthStatus::Low);
    }
}

TEST_CASE("KeyHealthMonitor - Observers", "[health]") {
    KeyHealthMonitor monitor("identity");
    std::vector<KeyHealthStatus> seen;
    const auto id = monitor.Subscribe([&seen](const models::KeyHealthState& state) {
        seen.push_back(state.status);
    });

    monitor.MarkInProgress();
    monitor.MarkError("boom");
    REQUIRE(seen == std::vector<KeyHealthStatus>{KeyHealthStatus::Generating, KeyHealthStatus::Error});

    SECTION("Unsubscribed observers stop receiving snapshots") {
        monitor.Unsubscribe(id);
        monitor.UpdateCount(1);
        REQUIRE(seen.size() == 2);
    }
    SECTION("Observers may read the monitor re-entrantly") {
        size_t observed_count = 0;
        monitor.Subscribe([&](const models::KeyHealthState&) {
            observed_count = monitor.Snapshot().key_count;
        });
        monitor.UpdateCount(7);
        REQUIRE(observed_count == 7);
    }
}
