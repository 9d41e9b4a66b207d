#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/api/key_server_api.hpp"
#include "sigkeep/concurrency/regeneration_lock.hpp"
#include "sigkeep/configuration/key_lifecycle_config.hpp"
#include "sigkeep/interfaces/i_clock.hpp"
#include "sigkeep/interfaces/i_dependent_key_cleanup.hpp"
#include "sigkeep/interfaces/i_encrypted_storage.hpp"
#include "sigkeep/models/cleanup_report.hpp"
#include "sigkeep/models/keys/identity_key_pair.hpp"
#include "sigkeep/state/key_health_monitor.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigkeep::stores {

using IdentityChangeHandler = std::function<void(std::string_view peer, uint32_t device_id)>;

/**
 * @brief Owns the device identity key pair and the trust-on-first-use records of peers.
 *
 * **Own identity**:
 * - Created lazily on first access, persisted, then published.
 * - Creation and regeneration are serialized by a FIFO RegenerationLock;
 *   concurrent first callers observe exactly one generation and one upload.
 * - Every freshly generated identity runs the dependent-key cleanup before
 *   its public key is uploaded.
 * - A stored pair that cannot be read is reported as StorageCorruption and
 *   left in place. Recovering means losing every session, so it is never
 *   done implicitly.
 *
 * **Remote identities**:
 * - No stored key: trusted, caller records it with SaveIdentity.
 * - Stored key: trusted only on exact byte equality.
 * - An unreadable remote record is purged and treated as absent.
 */
class IdentityKeyStore {
public:
    using IdentityPtr = std::shared_ptr<const models::IdentityKeyPair>;

    IdentityKeyStore(
        interfaces::IEncryptedStorage& storage,
        api::KeyServerApi& server,
        state::KeyHealthMonitor& health,
        const interfaces::IClock& clock,
        configuration::RegenerationPolicy policy);

    IdentityKeyStore(const IdentityKeyStore&) = delete;
    IdentityKeyStore& operator=(const IdentityKeyStore&) = delete;

    void SetDependentKeyCleanup(interfaces::IDependentKeyCleanup* cleanup) noexcept;
    void SetIdentityChangeHandler(IdentityChangeHandler handler);

    /**
     * @brief Cached pair, else the stored pair, else a newly generated and published pair.
     *
     * A failed upload of a new pair does not fail this call: the pair is
     * usable locally, the failure is recorded in the health monitor and the
     * upload is retried on the next load or by PublishIdentity().
     */
    Result<IdentityPtr, KeyStoreFailure> GetIdentityKeyPair();

    Result<uint32_t, KeyStoreFailure> GetLocalRegistrationId();

    /**
     * @brief Destroy the current identity and everything derived from it.
     *
     * @return The cleanup report, or Err(Publication) when the new identity
     *         could not be uploaded, Err(LockTimeout) when another
     *         regeneration held the lock for too long
     */
    Result<models::CleanupReport, KeyStoreFailure> RegenerateIdentityKeyPair();

    /**
     * @brief Upload the current identity if the server never acknowledged it.
     */
    Result<Unit, KeyStoreFailure> PublishIdentity();

    [[nodiscard]] bool IsPublished() const;

    Result<bool, KeyStoreFailure> IsTrusted(
        std::string_view peer, uint32_t device_id, std::span<const uint8_t> identity_key);

    /**
     * @brief Record a peer identity.
     *
     * @return true for a new contact or a replaced key, false when unchanged.
     *         A replacement is logged and reported to the change handler.
     */
    Result<bool, KeyStoreFailure> SaveIdentity(
        std::string_view peer, uint32_t device_id, std::span<const uint8_t> identity_key);

    Result<Unit, KeyStoreFailure> RemoveIdentity(std::string_view peer, uint32_t device_id);

    Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure> GetIdentity(
        std::string_view peer, uint32_t device_id);

private:
    struct Generated {
        IdentityPtr identity;
        models::CleanupReport report;
    };

    Result<IdentityPtr, KeyStoreFailure> LoadStoredLocked();
    Result<Generated, KeyStoreFailure> GenerateAndPublishLocked();
    Result<Unit, KeyStoreFailure> PublishLocked(const IdentityPtr& identity);
    Result<Unit, KeyStoreFailure> Persist(const models::IdentityKeyPair& identity, bool published);
    Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure> LoadRemoteIdentity(
        std::string_view peer, uint32_t device_id);

    interfaces::IEncryptedStorage& storage_;
    api::KeyServerApi& server_;
    state::KeyHealthMonitor& health_;
    const interfaces::IClock& clock_;
    configuration::RegenerationPolicy policy_;
    interfaces::IDependentKeyCleanup* cleanup_ = nullptr;

    concurrency::RegenerationLock regeneration_lock_;
    mutable std::mutex cache_mutex_;
    IdentityPtr cached_;
    bool published_ = false;

    std::mutex remote_mutex_;
    IdentityChangeHandler change_handler_;
};

} // namespace sigkeep::stores
