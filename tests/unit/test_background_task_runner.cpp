#include <catch2/catch_test_macros.hpp>
#include "sigkeep/concurrency/background_task_runner.hpp"
#include "helpers/capturing_log_sink.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
using namespace sigkeep;
using namespace sigkeep::concurrency;

TEST_CASE("BackgroundTaskRunner - Completion", "[concurrency][runner]") {
    BackgroundTaskRunner runner;
    std::atomic<int> completed{0};

    for (int i = 0; i < 4; ++i) {
        runner.Spawn("increment", [&completed]() {
            ++completed;
            return Result<Unit, KeyStoreFailure>::Ok(unit);
        });
    }
    runner.WaitForIdle();

    REQUIRE(completed == 4);
    REQUIRE(runner.PendingCount() == 0);
}

TEST_CASE("BackgroundTaskRunner - Error Channel", "[concurrency][runner]") {
    test_helpers::ScopedLogCapture capture(logging::LogLevel::Warn);
    BackgroundTaskRunner runner;
    std::mutex mutex;
    std::string reported_task;
    std::optional<KeyStoreFailure> reported;

    auto handler = [&](const std::string_view task_name, const KeyStoreFailure& failure) {
        std::lock_guard lock(mutex);
        reported_task = std::string(task_name);
        reported = failure;
    };

    SECTION("Err results reach the handler and the log") {
        runner.Spawn("prekey-refill", []() {
            return Result<Unit, KeyStoreFailure>::Err(KeyStoreFailure::Network("offline"));
        }, handler);
        runner.WaitForIdle();

        REQUIRE(reported_task == "prekey-refill");
        REQUIRE(reported.has_value());
        REQUIRE(reported->type == KeyStoreFailureType::Network);
        REQUIRE(capture.Sink().Contains("prekey-refill"));
    }
    SECTION("Exceptions are reported as InvalidState") {
        runner.Spawn("throws", []() -> Result<Unit, KeyStoreFailure> {
            throw std::runtime_error("disk vanished");
        }, handler);
        runner.WaitForIdle();

        REQUIRE(reported.has_value());
        REQUIRE(reported->type == KeyStoreFailureType::InvalidState);
        REQUIRE(reported->message.find("disk vanished") != std::string::npos);
    }
    SECTION("Failures without a handler are only logged") {
        runner.Spawn("unhandled", []() {
            return Result<Unit, KeyStoreFailure>::Err(KeyStoreFailure::Storage("full"));
        });
        runner.WaitForIdle();
        REQUIRE(capture.Sink().CountAtLevel(logging::LogLevel::Error) == 1);
    }
}

TEST_CASE("BackgroundTaskRunner - Nested Spawns", "[concurrency][runner]") {
    BackgroundTaskRunner runner;
    std::atomic<bool> inner_ran{false};

    runner.Spawn("outer", [&]() {
        runner.Spawn("inner", [&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            inner_ran = true;
            return Result<Unit, KeyStoreFailure>::Ok(unit);
        });
        return Result<Unit, KeyStoreFailure>::Ok(unit);
    });
    runner.WaitForIdle();

    REQUIRE(inner_ran);
}
