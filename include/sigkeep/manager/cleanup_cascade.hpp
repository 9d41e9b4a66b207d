#pragma once

#include "sigkeep/api/key_server_api.hpp"
#include "sigkeep/interfaces/i_dependent_key_cleanup.hpp"
#include "sigkeep/models/cleanup_report.hpp"
#include "sigkeep/stores/pre_key_store.hpp"
#include "sigkeep/stores/sender_key_store.hpp"
#include "sigkeep/stores/session_store.hpp"
#include "sigkeep/stores/signed_pre_key_store.hpp"

#include <atomic>
#include <functional>
#include <mutex>

namespace sigkeep::manager {

using PhaseObserver = std::function<void(models::CascadePhase)>;

/**
 * @brief Ordered purge of every key derived from the previous identity.
 *
 * Idle -> CleaningLocal -> CleaningRemote -> Uploading -> Idle.
 *
 * Local pre-keys, signed pre-keys, sessions and sender keys are deleted,
 * then the server is asked to drop all published material, and only then
 * is the new identity published. Each step is attempted regardless of
 * earlier failures; failures are logged and recorded in the report.
 */
class CleanupCascade final : public interfaces::IDependentKeyCleanup {
public:
    /**
     * @param sender_keys nullptr when group messaging is disabled; the step is reported as skipped
     */
    CleanupCascade(
        stores::PreKeyStore& pre_keys,
        stores::SignedPreKeyStore& signed_pre_keys,
        stores::SessionStore& sessions,
        stores::SenderKeyStore* sender_keys,
        api::KeyServerApi& server);

    CleanupCascade(const CleanupCascade&) = delete;
    CleanupCascade& operator=(const CleanupCascade&) = delete;

    models::CleanupReport Run(const interfaces::PublishIdentityFn& publish);

    models::CleanupReport CleanupAndPublish(const interfaces::PublishIdentityFn& publish) override {
        return Run(publish);
    }

    [[nodiscard]] models::CascadePhase Phase() const noexcept {
        return phase_.load();
    }

    void SetPhaseObserver(PhaseObserver observer);

private:
    void EnterPhase(models::CascadePhase phase);

    stores::PreKeyStore& pre_keys_;
    stores::SignedPreKeyStore& signed_pre_keys_;
    stores::SessionStore& sessions_;
    stores::SenderKeyStore* sender_keys_;
    api::KeyServerApi& server_;

    std::atomic<models::CascadePhase> phase_{models::CascadePhase::Idle};
    std::mutex observer_mutex_;
    PhaseObserver observer_;
};

} // namespace sigkeep::manager
