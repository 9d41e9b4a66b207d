#pragma once
#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/models/cleanup_report.hpp"
#include <functional>
namespace sigkeep::interfaces {
using PublishIdentityFn = std::function<Result<Unit, KeyStoreFailure>()>;
/**
 * @brief Purges everything derived from the previous identity, then publishes the new one.
 *
 * publish is invoked exactly once, after every cleanup step was attempted.
 */
class IDependentKeyCleanup {
public:
    virtual ~IDependentKeyCleanup() = default;
    virtual models::CleanupReport CleanupAndPublish(const PublishIdentityFn& publish) = 0;
};
}
