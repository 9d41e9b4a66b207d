#include "sigkeep/state/key_health_monitor.hpp"

#include <vector>

namespace sigkeep::state {

KeyHealthMonitor::KeyHealthMonitor(std::string name)
    : name_(std::move(name)) {
}

models::KeyHealthState KeyHealthMonitor::Snapshot() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint64_t KeyHealthMonitor::Subscribe(HealthObserver observer) {
    std::lock_guard lock(mutex_);
    const uint64_t id = next_subscription_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void KeyHealthMonitor::Unsubscribe(const uint64_t subscription_id) {
    std::lock_guard lock(mutex_);
    observers_.erase(subscription_id);
}

void KeyHealthMonitor::MarkChecked(const size_t key_count, const models::KeyHealthStatus status,
                                   const TimePoint at) {
    Mutate([&](models::KeyHealthState& state) {
        state.key_count = key_count;
        state.status = status;
        state.last_check = at;
        if (status != models::KeyHealthStatus::Error) {
            state.last_error.reset();
        }
    });
}

void KeyHealthMonitor::MarkInProgress() {
    Mutate([](models::KeyHealthState& state) {
        state.in_progress = true;
        state.status = models::KeyHealthStatus::Generating;
    });
}

void KeyHealthMonitor::MarkGenerated(const size_t key_count, const TimePoint at) {
    Mutate([&](models::KeyHealthState& state) {
        state.in_progress = false;
        state.key_count = key_count;
        state.status = models::KeyHealthStatus::Healthy;
        state.last_generation = at;
        state.last_check = at;
        state.last_error.reset();
    });
}

void KeyHealthMonitor::MarkError(const std::string_view error) {
    Mutate([&](models::KeyHealthState& state) {
        state.in_progress = false;
        state.status = models::KeyHealthStatus::Error;
        state.last_error = std::string(error);
    });
}

void KeyHealthMonitor::UpdateCount(const size_t key_count) {
    Mutate([&](models::KeyHealthState& state) {
        state.key_count = key_count;
    });
}

void KeyHealthMonitor::Mutate(const std::function<void(models::KeyHealthState&)>& mutation) {
    models::KeyHealthState snapshot;
    std::vector<HealthObserver> observers;
    {
        std::lock_guard lock(mutex_);
        mutation(state_);
        snapshot = state_;
        observers.reserve(observers_.size());
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        observer(snapshot);
    }
}

} // namespace sigkeep::state
