#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/api/key_server_api.hpp"
#include "sigkeep/concurrency/background_task_runner.hpp"
#include "sigkeep/configuration/key_lifecycle_config.hpp"
#include "sigkeep/interfaces/i_clock.hpp"
#include "sigkeep/interfaces/i_encrypted_storage.hpp"
#include "sigkeep/models/keys/pre_key_record.hpp"
#include "sigkeep/state/key_health_monitor.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigkeep::stores {

/**
 * @brief Called after each generated key with (generated so far, total to generate).
 */
using PreKeyProgress = std::function<void(size_t generated, size_t total)>;

struct ReconcileReport {
    // Local keys the server did not list, uploaded in one batch.
    size_t uploaded = 0;
    // Keys re-uploaded because the server fingerprint differed.
    size_t republished = 0;
    // Unreadable local keys removed.
    size_t purged = 0;
    // Keys generated by the closing refill.
    size_t regenerated = 0;
    bool pool_rebuilt = false;
};

/**
 * @brief Pool of one-time X25519 pre-keys kept between min_count and target_count.
 *
 * **Id assignment**: see AllocatePreKeyIds(). Ids never collide with a live key.
 *
 * **Publication**: every refill is uploaded as one batch. When the server
 * never acknowledges it, the keys stay local and are re-sent on the next
 * EnsureSufficientPreKeys().
 *
 * **Corruption**: a single unreadable key is purged and treated as absent.
 * When every stored key is unreadable the pool is rebuilt from scratch.
 */
class PreKeyStore {
public:
    PreKeyStore(
        interfaces::IEncryptedStorage& storage,
        api::KeyServerApi& server,
        state::KeyHealthMonitor& health,
        concurrency::BackgroundTaskRunner& runner,
        const interfaces::IClock& clock,
        configuration::PreKeyPolicy policy);

    PreKeyStore(const PreKeyStore&) = delete;
    PreKeyStore& operator=(const PreKeyStore&) = delete;

    /**
     * @brief Refill the pool to target_count when it fell below min_count.
     *
     * Single-flight: a call made while another refill runs returns Ok(0)
     * immediately. Excess keys above target_count are trimmed from the top.
     *
     * @return Number of keys generated, or Err(Publication) when the batch
     *         was not acknowledged (the keys are kept locally)
     */
    Result<size_t, KeyStoreFailure> EnsureSufficientPreKeys(const PreKeyProgress& progress = {});

    /**
     * @brief Delete a used pre-key locally.
     *
     * The server DELETE and the refill check run on the background runner,
     * so no network round-trip happens on the caller's thread.
     *
     * @param notify_server false during bulk local cleanup
     */
    Result<Unit, KeyStoreFailure> ConsumePreKey(uint32_t pre_key_id, bool notify_server = true);

    /**
     * @brief Bring the server's view in line with the local pool.
     *
     * @param server_ids Ids the server currently holds
     * @param server_fingerprints Optional id -> hex fingerprint advertised by the server
     */
    Result<ReconcileReport, KeyStoreFailure> ReconcileWithServer(
        std::span<const uint32_t> server_ids,
        const std::map<uint32_t, std::string>& server_fingerprints = {});

    /**
     * @brief Stored key, or NotFound. An unreadable key is purged and reported as NotFound.
     */
    Result<models::PreKeyRecord, KeyStoreFailure> LoadPreKey(uint32_t pre_key_id);

    Result<bool, KeyStoreFailure> ContainsPreKey(uint32_t pre_key_id);

    /**
     * @brief Ascending ids of every stored key.
     */
    Result<std::vector<uint32_t>, KeyStoreFailure> ListPreKeyIds();

    Result<size_t, KeyStoreFailure> Count();

    /**
     * @brief Every readable key, ascending by id. Unreadable keys are purged.
     *
     * @return Err(StorageCorruption) when keys exist but none is readable
     */
    Result<std::vector<models::PreKeyRecord>, KeyStoreFailure> LoadAllPreKeys();

    /**
     * @brief id -> lowercase hex BLAKE2b-256 of each readable public key.
     */
    Result<std::map<uint32_t, std::string>, KeyStoreFailure> GetPreKeyFingerprints();

    /**
     * @brief Remove every local pre-key without touching the server.
     *
     * @return Number of keys removed
     */
    Result<size_t, KeyStoreFailure> DeleteAllLocal();

    /**
     * @brief Hold off refills until the returned lock is released.
     *
     * A refill already running finishes first; later ones wait. Held by the
     * cleanup cascade so no key is generated between the local wipe and the
     * server wipe.
     */
    [[nodiscard]] std::unique_lock<std::mutex> PauseRefills();

    [[nodiscard]] bool IsGenerating() const noexcept {
        return generating_.load();
    }

private:
    struct LoadOutcome {
        std::vector<models::PreKeyRecord> records;
        std::vector<uint32_t> purged_ids;
        size_t stored = 0;
    };

    Result<size_t, KeyStoreFailure> EnsureLocked(const PreKeyProgress& progress);
    Result<LoadOutcome, KeyStoreFailure> LoadAllLocked();
    Result<std::vector<models::PreKeyRecord>, KeyStoreFailure> GenerateRun(
        uint32_t first, uint32_t last, size_t& generated, size_t total, const PreKeyProgress& progress);
    Result<Unit, KeyStoreFailure> Persist(const models::PreKeyRecord& record);
    Result<Unit, KeyStoreFailure> RetryPendingPublication();
    Result<size_t, KeyStoreFailure> TrimExcess(std::vector<uint32_t>& ids);
    void Purge(uint32_t pre_key_id, std::string_view reason);
    // Queues a server DELETE and flushes it on the background runner.
    void RemoveFromServer(uint32_t pre_key_id);
    Result<Unit, KeyStoreFailure> FlushServerRemovals();

    interfaces::IEncryptedStorage& storage_;
    api::KeyServerApi& server_;
    state::KeyHealthMonitor& health_;
    concurrency::BackgroundTaskRunner& runner_;
    const interfaces::IClock& clock_;
    configuration::PreKeyPolicy policy_;

    std::atomic<bool> generating_{false};
    std::mutex refill_mutex_;
    std::mutex pending_mutex_;
    std::vector<uint32_t> pending_publication_;
    std::vector<uint32_t> pending_removal_;
    std::mutex removal_mutex_;
};

} // namespace sigkeep::stores
