#include "sigkeep/manager/cleanup_cascade.hpp"
#include "sigkeep/logging/logger.hpp"

namespace sigkeep::manager {

namespace {

constexpr std::string_view kComponent = "cleanup-cascade";

template<typename Action>
models::CleanupStepOutcome RunStep(const models::CleanupStep step, Action&& action) {
    models::CleanupStepOutcome outcome{step};
    auto result = std::forward<Action>(action)();
    if (result.IsErr()) {
        outcome.error = result.UnwrapErr().message;
        SIGKEEP_LOG_ERROR(kComponent, "Step '{}' failed, continuing: {}", models::ToString(step), outcome.error);
        return outcome;
    }
    outcome.succeeded = true;
    outcome.removed = result.Unwrap();
    SIGKEEP_LOG_INFO(kComponent, "Step '{}' removed {} items", models::ToString(step), outcome.removed);
    return outcome;
}

} // namespace

CleanupCascade::CleanupCascade(
    stores::PreKeyStore& pre_keys,
    stores::SignedPreKeyStore& signed_pre_keys,
    stores::SessionStore& sessions,
    stores::SenderKeyStore* sender_keys,
    api::KeyServerApi& server)
    : pre_keys_(pre_keys)
    , signed_pre_keys_(signed_pre_keys)
    , sessions_(sessions)
    , sender_keys_(sender_keys)
    , server_(server) {
}

void CleanupCascade::SetPhaseObserver(PhaseObserver observer) {
    std::lock_guard lock(observer_mutex_);
    observer_ = std::move(observer);
}

void CleanupCascade::EnterPhase(const models::CascadePhase phase) {
    phase_.store(phase);
    SIGKEEP_LOG_DEBUG(kComponent, "Phase -> {}", models::ToString(phase));
    PhaseObserver observer;
    {
        std::lock_guard lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(phase);
    }
}

models::CleanupReport CleanupCascade::Run(const interfaces::PublishIdentityFn& publish) {
    using models::CleanupStep;
    models::CleanupReport report;
    SIGKEEP_LOG_WARN(kComponent, "Purging key material of the previous identity");
    // Held until the new identity is published.
    const auto refills_paused = pre_keys_.PauseRefills();

    EnterPhase(models::CascadePhase::CleaningLocal);
    report.steps.push_back(RunStep(CleanupStep::LocalPreKeys, [this] {
        return pre_keys_.DeleteAllLocal();
    }));
    report.steps.push_back(RunStep(CleanupStep::LocalSignedPreKeys, [this] {
        return signed_pre_keys_.DeleteAllLocal();
    }));
    report.steps.push_back(RunStep(CleanupStep::LocalSessions, [this] {
        return sessions_.DeleteAllSessions();
    }));
    if (sender_keys_ != nullptr) {
        report.steps.push_back(RunStep(CleanupStep::LocalSenderKeys, [this] {
            return sender_keys_->DeleteAllLocal();
        }));
    } else {
        models::CleanupStepOutcome skipped{CleanupStep::LocalSenderKeys};
        skipped.skipped = true;
        report.steps.push_back(std::move(skipped));
    }

    EnterPhase(models::CascadePhase::CleaningRemote);
    report.steps.push_back(RunStep(CleanupStep::ServerKeyMaterial, [this] {
        return server_.DeleteAllKeys().Map([](Unit) { return size_t{0}; });
    }));

    EnterPhase(models::CascadePhase::Uploading);
    models::CleanupStepOutcome published{CleanupStep::PublishIdentity};
    if (auto result = publish(); result.IsErr()) {
        published.error = result.UnwrapErr().message;
        SIGKEEP_LOG_ERROR(kComponent, "New identity was not published: {}", published.error);
        report.publication_error = std::move(result).UnwrapErr();
    } else {
        published.succeeded = true;
        SIGKEEP_LOG_INFO(kComponent, "New identity published");
    }
    report.steps.push_back(std::move(published));

    EnterPhase(models::CascadePhase::Idle);
    return report;
}

} // namespace sigkeep::manager
