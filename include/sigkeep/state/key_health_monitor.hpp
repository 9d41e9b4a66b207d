#pragma once

#include "sigkeep/models/key_health_state.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace sigkeep::state {

using HealthObserver = std::function<void(const models::KeyHealthState&)>;

/**
 * @brief Observable health of one store.
 *
 * Every mutation publishes the new snapshot to subscribers. Observers run on
 * the mutating thread after the internal lock is released, so they may read
 * the monitor again but should return quickly.
 */
class KeyHealthMonitor {
public:
    using TimePoint = models::KeyHealthState::TimePoint;

    explicit KeyHealthMonitor(std::string name);

    KeyHealthMonitor(const KeyHealthMonitor&) = delete;
    KeyHealthMonitor& operator=(const KeyHealthMonitor&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept {
        return name_;
    }

    [[nodiscard]] models::KeyHealthState Snapshot() const;

    uint64_t Subscribe(HealthObserver observer);
    void Unsubscribe(uint64_t subscription_id);

    void MarkChecked(size_t key_count, models::KeyHealthStatus status, TimePoint at);
    void MarkInProgress();
    void MarkGenerated(size_t key_count, TimePoint at);
    void MarkError(std::string_view error);
    void UpdateCount(size_t key_count);

private:
    void Mutate(const std::function<void(models::KeyHealthState&)>& mutation);

    std::string name_;
    mutable std::mutex mutex_;
    models::KeyHealthState state_;
    std::map<uint64_t, HealthObserver> observers_;
    uint64_t next_subscription_id_ = 1;
};

} // namespace sigkeep::state
