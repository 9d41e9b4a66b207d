#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/api/key_server_api.hpp"
#include "sigkeep/concurrency/background_task_runner.hpp"
#include "sigkeep/configuration/key_lifecycle_config.hpp"
#include "sigkeep/interfaces/i_clock.hpp"
#include "sigkeep/interfaces/i_encrypted_storage.hpp"
#include "sigkeep/interfaces/i_key_server_transport.hpp"
#include "sigkeep/interfaces/i_realtime_channel.hpp"
#include "sigkeep/manager/cleanup_cascade.hpp"
#include "sigkeep/models/cleanup_report.hpp"
#include "sigkeep/state/key_health_monitor.hpp"
#include "sigkeep/stores/identity_key_store.hpp"
#include "sigkeep/stores/pre_key_store.hpp"
#include "sigkeep/stores/sender_key_store.hpp"
#include "sigkeep/stores/session_store.hpp"
#include "sigkeep/stores/signed_pre_key_store.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sigkeep::manager {

/**
 * @brief Collaborators supplied by the embedding application.
 *
 * realtime and clock are optional; a missing clock means the system clock.
 * Every referenced object must outlive the KeyManager.
 */
struct KeyManagerDependencies {
    interfaces::IEncryptedStorage& storage;
    interfaces::IKeyServerTransport& transport;
    interfaces::IRealtimeChannel* realtime = nullptr;
    const interfaces::IClock* clock = nullptr;
};

using InitializeProgress = std::function<void(size_t completed, size_t total, std::string_view stage)>;

enum class VerificationOutcome {
    // Server state matched the local keys.
    Valid,
    Repaired,
    // Server state is wrong and was left as is; see reason.
    NeedsHealing,
    // Rate limited; nothing was checked.
    Skipped
};

/**
 * @brief Result of comparing this device's published keys with the local ones.
 *
 * reason names the first problem found: identity-missing, identity-mismatch,
 * signed-prekey-invalid or prekeys-unsynced. Empty when Valid.
 */
struct VerificationReport {
    VerificationOutcome outcome = VerificationOutcome::Valid;
    std::string reason;
    bool identity_republished = false;
    bool signed_pre_key_regenerated = false;
    stores::ReconcileReport pre_keys;
};

/**
 * @brief Owns and wires every key store of one device.
 *
 * **Ownership**:
 * - One health monitor per store, exposed for subscription
 * - One background runner shared by the stores for follow-up work
 * - The cleanup cascade, registered with the identity store
 *
 * **Usage Example**:
 * ```cpp
 * auto manager = KeyManager::Create({storage, transport, &realtime}, KeyLifecycleConfig::Default());
 * if (manager.IsOk()) {
 *     auto ready = manager.Unwrap()->Initialize();
 * }
 * ```
 */
class KeyManager {
public:
    static Result<std::unique_ptr<KeyManager>, KeyStoreFailure> Create(
        KeyManagerDependencies dependencies,
        configuration::KeyLifecycleConfig config);

    ~KeyManager();

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    KeyManager(KeyManager&&) = delete;
    KeyManager& operator=(KeyManager&&) = delete;

    /**
     * @brief Bring every store to a usable state: identity, signed pre-key, pre-key pool, sessions.
     *
     * progress receives (completed, total, stage) with total = target_count + 3.
     * Stops at the first failing stage.
     */
    Result<Unit, KeyStoreFailure> Initialize(const InitializeProgress& progress = {});

    Result<models::CleanupReport, KeyStoreFailure> RegenerateIdentityKeyPair();

    Result<stores::ReconcileReport, KeyStoreFailure> ReconcilePreKeys(
        std::span<const uint32_t> server_ids,
        const std::map<uint32_t, std::string>& server_fingerprints = {});

    Result<bool, KeyStoreFailure> ValidateSignedPreKeyWithServer(const stores::RemoteSignedPreKeyStatus& remote);

    /**
     * @brief Check what the server advertises for this device and repair it from local state.
     *
     * - Missing identity: re-published
     * - Identity differing from the local one: re-published, at most once per healing.repair_backoff
     * - Signed pre-key missing or not verifying: regenerated
     * - Pre-keys missing or with a differing fingerprint: uploaded again
     *
     * Runs at most once per healing.min_verification_interval unless force is set.
     * Serialized with RegenerateIdentityKeyPair().
     *
     * @return Err only when the server status or the local identity cannot be read
     */
    Result<VerificationReport, KeyStoreFailure> VerifyOwnKeysOnServer(bool force = false);

    void WaitForBackgroundTasks();

    [[nodiscard]] stores::IdentityKeyStore& Identity() noexcept { return identity_store_; }
    [[nodiscard]] stores::PreKeyStore& PreKeys() noexcept { return pre_key_store_; }
    [[nodiscard]] stores::SignedPreKeyStore& SignedPreKeys() noexcept { return signed_pre_key_store_; }
    [[nodiscard]] stores::SessionStore& Sessions() noexcept { return session_store_; }
    // nullptr when sender keys are disabled.
    [[nodiscard]] stores::SenderKeyStore* SenderKeys() noexcept {
        return sender_key_store_.get();
    }
    [[nodiscard]] CleanupCascade& Cascade() noexcept { return cascade_; }

    [[nodiscard]] state::KeyHealthMonitor& IdentityHealth() noexcept { return identity_health_; }
    [[nodiscard]] state::KeyHealthMonitor& PreKeyHealth() noexcept { return pre_key_health_; }
    [[nodiscard]] state::KeyHealthMonitor& SignedPreKeyHealth() noexcept { return signed_pre_key_health_; }
    [[nodiscard]] state::KeyHealthMonitor& SessionHealth() noexcept { return session_health_; }

    [[nodiscard]] const configuration::KeyLifecycleConfig& Config() const noexcept { return config_; }

private:
    KeyManager(KeyManagerDependencies dependencies, configuration::KeyLifecycleConfig config);

    void OnSignedPreKeysResponse(std::string_view payload);

    // Records the attempt; false while the same repair is still backing off.
    bool ShouldRepairNow(const std::string& reason);

    configuration::KeyLifecycleConfig config_;
    interfaces::SystemClock system_clock_;
    const interfaces::IClock& clock_;
    interfaces::IRealtimeChannel* realtime_;
    std::optional<uint64_t> realtime_subscription_;

    state::KeyHealthMonitor identity_health_{"identity"};
    state::KeyHealthMonitor pre_key_health_{"prekeys"};
    state::KeyHealthMonitor signed_pre_key_health_{"signed-prekeys"};
    state::KeyHealthMonitor session_health_{"sessions"};

    concurrency::BackgroundTaskRunner runner_;
    api::KeyServerApi server_api_;
    stores::IdentityKeyStore identity_store_;
    stores::PreKeyStore pre_key_store_;
    stores::SignedPreKeyStore signed_pre_key_store_;
    stores::SessionStore session_store_;
    std::unique_ptr<stores::SenderKeyStore> sender_key_store_;
    CleanupCascade cascade_;

    std::mutex maintenance_mutex_;
    std::optional<std::chrono::system_clock::time_point> last_verification_;
    std::map<std::string, std::chrono::system_clock::time_point> last_repair_;
};

} // namespace sigkeep::manager
