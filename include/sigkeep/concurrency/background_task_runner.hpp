#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"

#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <string>
#include <string_view>

namespace sigkeep::concurrency {

using BackgroundTask = std::function<Result<Unit, KeyStoreFailure>()>;
using TaskErrorHandler = std::function<void(std::string_view task_name, const KeyStoreFailure& failure)>;

/**
 * @brief Runs follow-up work off the caller's path with an explicit error channel.
 *
 * Each spawned task runs on its own std::async thread. A failed task is
 * logged and reported to its error handler. The destructor waits for every
 * outstanding task.
 */
class BackgroundTaskRunner {
public:
    BackgroundTaskRunner() = default;
    ~BackgroundTaskRunner();

    BackgroundTaskRunner(const BackgroundTaskRunner&) = delete;
    BackgroundTaskRunner& operator=(const BackgroundTaskRunner&) = delete;

    void Spawn(std::string name, BackgroundTask task, TaskErrorHandler on_error = {});

    /**
     * @brief Block until every task spawned so far, and any they spawned, has finished.
     *
     * Must not be called from inside a background task.
     */
    void WaitForIdle();

    [[nodiscard]] size_t PendingCount() const;

private:
    void ReapFinishedLocked();

    mutable std::mutex mutex_;
    std::list<std::future<void>> tasks_;
};

} // namespace sigkeep::concurrency
