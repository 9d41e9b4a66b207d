#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/api/key_server_api.hpp"
#include "sigkeep/configuration/key_lifecycle_config.hpp"
#include "sigkeep/interfaces/i_clock.hpp"
#include "sigkeep/interfaces/i_encrypted_storage.hpp"
#include "sigkeep/models/keys/signed_pre_key_record.hpp"
#include "sigkeep/state/key_health_monitor.hpp"
#include "sigkeep/stores/identity_key_store.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace sigkeep::stores {

/**
 * @brief What the server advertises as this device's signed pre-key.
 */
struct RemoteSignedPreKeyStatus {
    uint32_t key_id = 0;
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> signature;
};

/**
 * @brief Current signed pre-key with periodic rotation and two-tier retention.
 *
 * Keys are ordered newest first by creation time; a key without a
 * creation time sorts as oldest and is always due for rotation. A new key
 * is stored locally only after the server accepted it.
 *
 * Never call into this store while holding the identity regeneration
 * lock: the identity is fetched before the store's own mutex is taken.
 */
class SignedPreKeyStore {
public:
    SignedPreKeyStore(
        interfaces::IEncryptedStorage& storage,
        api::KeyServerApi& server,
        state::KeyHealthMonitor& health,
        IdentityKeyStore& identity_store,
        const interfaces::IClock& clock,
        configuration::SignedPreKeyPolicy policy);

    SignedPreKeyStore(const SignedPreKeyStore&) = delete;
    SignedPreKeyStore& operator=(const SignedPreKeyStore&) = delete;

    /**
     * @brief Newest key, rotating first when it is due. Generates id 0 for an empty store.
     */
    Result<models::SignedPreKeyRecord, KeyStoreFailure> GetCurrentSignedPreKey();

    /**
     * @brief Generate, publish and store the next id, then prune locally and remotely.
     */
    Result<models::SignedPreKeyRecord, KeyStoreFailure> RotateSignedPreKey();

    /**
     * @brief Replace id 0 with a fresh key and publish it.
     */
    Result<models::SignedPreKeyRecord, KeyStoreFailure> RegenerateInitial();

    /**
     * @brief Check the server's copy against the local identity and local record.
     *
     * @return true when consistent; false after a mismatch was repaired by RegenerateInitial()
     */
    Result<bool, KeyStoreFailure> ValidateAgainstServer(const RemoteSignedPreKeyStatus& remote);

    Result<bool, KeyStoreFailure> NeedsRotation();

    Result<models::SignedPreKeyRecord, KeyStoreFailure> LoadSignedPreKey(uint32_t signed_pre_key_id);

    /**
     * @brief Ascending ids of every stored key.
     */
    Result<std::vector<uint32_t>, KeyStoreFailure> ListSignedPreKeyIds();

    Result<size_t, KeyStoreFailure> DeleteAllLocal();

private:
    using Records = std::vector<models::SignedPreKeyRecord>;

    Result<Records, KeyStoreFailure> LoadAllNewestFirstLocked();
    Result<models::SignedPreKeyRecord, KeyStoreFailure> LoadLocked(uint32_t signed_pre_key_id);
    Result<std::vector<uint32_t>, KeyStoreFailure> ListIdsLocked();
    Result<models::SignedPreKeyRecord, KeyStoreFailure> PublishNewLocked(
        uint32_t new_id, const models::IdentityKeyPair& identity, const Records& existing);
    Result<Unit, KeyStoreFailure> Persist(const models::SignedPreKeyRecord& record);
    size_t PruneLocalLocked(const std::vector<uint32_t>& newest_first);
    void PruneRemote(const std::vector<uint32_t>& newest_first);
    [[nodiscard]] bool IsDue(const models::SignedPreKeyRecord& record) const;

    interfaces::IEncryptedStorage& storage_;
    api::KeyServerApi& server_;
    state::KeyHealthMonitor& health_;
    IdentityKeyStore& identity_store_;
    const interfaces::IClock& clock_;
    configuration::SignedPreKeyPolicy policy_;

    std::mutex mutex_;
};

} // namespace sigkeep::stores
