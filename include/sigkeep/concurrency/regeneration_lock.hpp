#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace sigkeep::concurrency {

/**
 * @brief Serializes identity generation with FIFO hand-off and bounded waits.
 *
 * Waiters are admitted strictly in arrival order. A waiter that exceeds its
 * timeout leaves the queue and receives KeyStoreFailure::LockTimeout.
 */
class RegenerationLock {
public:
    /**
     * @brief RAII ownership of the lock. Releasing wakes the next waiter.
     */
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class RegenerationLock;
        explicit Guard(RegenerationLock* owner) noexcept : owner_(owner) {}
        RegenerationLock* owner_;
    };

    RegenerationLock() = default;
    RegenerationLock(const RegenerationLock&) = delete;
    RegenerationLock& operator=(const RegenerationLock&) = delete;

    [[nodiscard]] Result<Guard, KeyStoreFailure> Acquire(std::chrono::milliseconds timeout);

    [[nodiscard]] bool IsHeld() const;
    [[nodiscard]] size_t WaiterCount() const;

private:
    void Release() noexcept;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::deque<uint64_t> waiters_;
    uint64_t next_ticket_ = 0;
    bool held_ = false;
};

} // namespace sigkeep::concurrency
