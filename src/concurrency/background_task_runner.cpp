#include "sigkeep/concurrency/background_task_runner.hpp"
#include "sigkeep/logging/logger.hpp"

#include <chrono>
#include <exception>

namespace sigkeep::concurrency {

namespace {

constexpr std::string_view kComponent = "background";

void RunTask(const std::string& name, const BackgroundTask& task, const TaskErrorHandler& on_error) {
    auto report = [&](const KeyStoreFailure& failure) {
        SIGKEEP_LOG_ERROR(kComponent, "Task '{}' failed ({}): {}", name, ToString(failure.type),
                          failure.message);
        if (on_error) {
            on_error(name, failure);
        }
    };
    try {
        auto result = task();
        if (result.IsErr()) {
            report(result.UnwrapErr());
        } else {
            SIGKEEP_LOG_TRACE(kComponent, "Task '{}' completed", name);
        }
    } catch (const std::exception& ex) {
        report(KeyStoreFailure::InvalidState("Unhandled exception: " + std::string(ex.what())));
    }
}

} // namespace

BackgroundTaskRunner::~BackgroundTaskRunner() {
    WaitForIdle();
}

void BackgroundTaskRunner::Spawn(std::string name, BackgroundTask task, TaskErrorHandler on_error) {
    std::lock_guard lock(mutex_);
    ReapFinishedLocked();
    SIGKEEP_LOG_DEBUG(kComponent, "Spawning task '{}'", name);
    tasks_.push_back(std::async(std::launch::async,
        [name = std::move(name), task = std::move(task), on_error = std::move(on_error)] {
            RunTask(name, task, on_error);
        }));
}

void BackgroundTaskRunner::WaitForIdle() {
    for (;;) {
        std::list<std::future<void>> batch;
        {
            std::lock_guard lock(mutex_);
            if (tasks_.empty()) {
                return;
            }
            batch.swap(tasks_);
        }
        for (auto& future : batch) {
            future.wait();
        }
    }
}

size_t BackgroundTaskRunner::PendingCount() const {
    std::lock_guard lock(mutex_);
    size_t pending = 0;
    for (const auto& future : tasks_) {
        if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++pending;
        }
    }
    return pending;
}

void BackgroundTaskRunner::ReapFinishedLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace sigkeep::concurrency
