#include <catch2/catch_test_macros.hpp>
#include "sigkeep/concurrency/regeneration_lock.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
using namespace sigkeep;
using namespace sigkeep::concurrency;
using namespace std::chrono_literals;

namespace {

void WaitForWaiters(const RegenerationLock& lock, const size_t count) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (lock.WaiterCount() < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
}

}

TEST_CASE("RegenerationLock - Ownership", "[concurrency][lock]") {
    RegenerationLock lock;

    SECTION("Guard releases on destruction") {
        {
            auto guard = lock.Acquire(100ms);
            REQUIRE(guard.IsOk());
            REQUIRE(lock.IsHeld());
        }
        REQUIRE_FALSE(lock.IsHeld());
        REQUIRE(lock.Acquire(100ms).IsOk());
    }
    SECTION("Moved guard keeps the lock until the new owner is gone") {
        auto acquired = lock.Acquire(100ms);
        REQUIRE(acquired.IsOk());
        {
            RegenerationLock::Guard moved = std::move(acquired).Unwrap();
            REQUIRE(lock.IsHeld());
        }
        REQUIRE_FALSE(lock.IsHeld());
    }
    SECTION("Waiting past the timeout reports LockTimeout") {
        auto held = lock.Acquire(100ms);
        REQUIRE(held.IsOk());
        auto second = lock.Acquire(20ms);
        REQUIRE(second.IsErr());
        REQUIRE(second.UnwrapErr().type == KeyStoreFailureType::LockTimeout);
        REQUIRE(lock.WaiterCount() == 0);
    }
}

TEST_CASE("RegenerationLock - FIFO Admission", "[concurrency][lock]") {
    RegenerationLock lock;
    std::mutex order_mutex;
    std::vector<int> order;

    auto first = lock.Acquire(1s);
    REQUIRE(first.IsOk());

    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&, i] {
            auto guard = lock.Acquire(5s);
            if (guard.IsOk()) {
                std::lock_guard record(order_mutex);
                order.push_back(i);
            }
        });
        WaitForWaiters(lock, static_cast<size_t>(i) + 1);
    }

    { auto release = std::move(first).Unwrap(); }
    for (auto& waiter : waiters) {
        waiter.join();
    }

    REQUIRE(order == std::vector<int>{0, 1, 2});
    REQUIRE_FALSE(lock.IsHeld());
}

TEST_CASE("RegenerationLock - Timed Out Waiter Does Not Block The Queue", "[concurrency][lock]") {
    RegenerationLock lock;
    auto held = lock.Acquire(1s);
    REQUIRE(held.IsOk());

    std::atomic<bool> impatient_timed_out{false};
    std::atomic<bool> patient_acquired{false};

    std::thread impatient([&] {
        impatient_timed_out = lock.Acquire(20ms).IsErr();
    });
    WaitForWaiters(lock, 1);
    std::thread patient([&] {
        patient_acquired = lock.Acquire(5s).IsOk();
    });
    impatient.join();

    { auto release = std::move(held).Unwrap(); }
    patient.join();

    REQUIRE(impatient_timed_out);
    REQUIRE(patient_acquired);
}
