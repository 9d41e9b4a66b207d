#include "sigkeep/concurrency/regeneration_lock.hpp"
#include "sigkeep/logging/logger.hpp"

#include <algorithm>
#include <string>

namespace sigkeep::concurrency {

RegenerationLock::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_) {
    other.owner_ = nullptr;
}

RegenerationLock::Guard& RegenerationLock::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        if (owner_ != nullptr) {
            owner_->Release();
        }
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

RegenerationLock::Guard::~Guard() {
    if (owner_ != nullptr) {
        owner_->Release();
    }
}

Result<RegenerationLock::Guard, KeyStoreFailure> RegenerationLock::Acquire(
    const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    waiters_.push_back(ticket);
    if (held_) {
        SIGKEEP_LOG_DEBUG("regeneration-lock", "Waiting behind {} queued caller(s)", waiters_.size() - 1);
    }
    const bool admitted = released_.wait_for(lock, timeout, [&] {
        return !held_ && waiters_.front() == ticket;
    });
    if (!admitted) {
        waiters_.erase(std::find(waiters_.begin(), waiters_.end(), ticket));
        // The head of the queue may have changed.
        released_.notify_all();
        SIGKEEP_LOG_WARN("regeneration-lock", "Timed out after {} ms waiting for identity regeneration",
                         timeout.count());
        return Result<Guard, KeyStoreFailure>::Err(KeyStoreFailure::LockTimeout(
            "Timed out after " + std::to_string(timeout.count()) +
            " ms waiting for identity regeneration lock"));
    }
    waiters_.pop_front();
    held_ = true;
    return Result<Guard, KeyStoreFailure>::Ok(Guard(this));
}

bool RegenerationLock::IsHeld() const {
    std::lock_guard lock(mutex_);
    return held_;
}

size_t RegenerationLock::WaiterCount() const {
    std::lock_guard lock(mutex_);
    return waiters_.size();
}

void RegenerationLock::Release() noexcept {
    {
        std::lock_guard lock(mutex_);
        held_ = false;
    }
    released_.notify_all();
}

} // namespace sigkeep::concurrency
