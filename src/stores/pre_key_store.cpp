#include "sigkeep/stores/pre_key_store.hpp"
#include "sigkeep/stores/pre_key_id_allocator.hpp"
#include "sigkeep/core/constants.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/logging/logger.hpp"
#include "record_codec.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string>

namespace sigkeep::stores {

namespace {

constexpr std::string_view kComponent = "prekey-store";

std::string PreKeyStorageKey(const uint32_t pre_key_id) {
    return std::string(storage_keys::kPreKeyPrefix) + std::to_string(pre_key_id);
}

std::string FingerprintHex(const models::PreKeyRecord& record) {
    return logging::ToHex(crypto::SodiumInterop::Fingerprint(record.GetPublicKey()));
}

class GeneratingFlagReset {
public:
    explicit GeneratingFlagReset(std::atomic<bool>& flag) noexcept : flag_(flag) {}
    ~GeneratingFlagReset() { flag_.store(false); }
    GeneratingFlagReset(const GeneratingFlagReset&) = delete;
    GeneratingFlagReset& operator=(const GeneratingFlagReset&) = delete;
private:
    std::atomic<bool>& flag_;
};

} // namespace

PreKeyStore::PreKeyStore(
    interfaces::IEncryptedStorage& storage,
    api::KeyServerApi& server,
    state::KeyHealthMonitor& health,
    concurrency::BackgroundTaskRunner& runner,
    const interfaces::IClock& clock,
    const configuration::PreKeyPolicy policy)
    : storage_(storage)
    , server_(server)
    , health_(health)
    , runner_(runner)
    , clock_(clock)
    , policy_(policy) {
}

Result<size_t, KeyStoreFailure> PreKeyStore::EnsureSufficientPreKeys(const PreKeyProgress& progress) {
    bool expected = false;
    if (!generating_.compare_exchange_strong(expected, true)) {
        SIGKEEP_LOG_DEBUG(kComponent, "Refill already running, skipping");
        return Result<size_t, KeyStoreFailure>::Ok(0);
    }
    GeneratingFlagReset reset(generating_);
    std::lock_guard refill_lock(refill_mutex_);
    return EnsureLocked(progress);
}

std::unique_lock<std::mutex> PreKeyStore::PauseRefills() {
    std::unique_lock lock(refill_mutex_);
    SIGKEEP_LOG_DEBUG(kComponent, "Refills paused");
    return lock;
}

Result<size_t, KeyStoreFailure> PreKeyStore::EnsureLocked(const PreKeyProgress& progress) {
    if (auto pending = RetryPendingPublication(); pending.IsErr()) {
        health_.MarkError(pending.UnwrapErr().message);
        return Result<size_t, KeyStoreFailure>::Err(std::move(pending).UnwrapErr());
    }
    if (auto removed = FlushServerRemovals(); removed.IsErr()) {
        health_.MarkError(removed.UnwrapErr().message);
    }

    auto ids_result = ListPreKeyIds();
    if (ids_result.IsErr()) {
        health_.MarkError(ids_result.UnwrapErr().message);
        return Result<size_t, KeyStoreFailure>::Err(std::move(ids_result).UnwrapErr());
    }
    auto ids = std::move(ids_result).Unwrap();
    const size_t current = ids.size();

    if (current > policy_.target_count) {
        health_.MarkChecked(current, models::KeyHealthStatus::Excess, clock_.Now());
        auto trimmed = TrimExcess(ids);
        SIGKEEP_TRY(trimmed);
        SIGKEEP_LOG_INFO(kComponent, "Trimmed {} excess pre-keys", trimmed.Unwrap());
        health_.MarkChecked(ids.size(), models::KeyHealthStatus::Healthy, clock_.Now());
        return Result<size_t, KeyStoreFailure>::Ok(0);
    }
    if (current >= policy_.min_count) {
        SIGKEEP_LOG_DEBUG(kComponent, "Pool healthy with {} pre-keys", current);
        health_.MarkChecked(current, models::KeyHealthStatus::Healthy, clock_.Now());
        return Result<size_t, KeyStoreFailure>::Ok(0);
    }

    health_.MarkChecked(current, models::KeyHealthStatus::Low, clock_.Now());
    health_.MarkInProgress();

    const size_t needed = policy_.target_count - current;
    const auto new_ids = AllocatePreKeyIds(ids, needed, policy_);
    if (new_ids.empty()) {
        auto failure = KeyStoreFailure::KeyGeneration("No free pre-key ids left");
        health_.MarkError(failure.message);
        return Result<size_t, KeyStoreFailure>::Err(std::move(failure));
    }
    if (new_ids.size() < needed) {
        SIGKEEP_LOG_WARN(kComponent, "Only {} of {} pre-key ids available", new_ids.size(), needed);
    }
    SIGKEEP_LOG_INFO(kComponent, "Pool low ({} < {}), generating {} pre-keys{}", current, policy_.min_count,
                     new_ids.size(), IsWrapMode(ids, policy_) ? " in wrap mode" : "");

    std::vector<models::PreKeyRecord> batch;
    batch.reserve(new_ids.size());
    size_t generated = 0;
    for (const auto& run : GroupContiguousRuns(new_ids)) {
        auto records = GenerateRun(run.first, run.last, generated, new_ids.size(), progress);
        if (records.IsErr()) {
            // Keys already stored stay local; publish them with the next refill.
            {
                std::lock_guard lock(pending_mutex_);
                for (const auto& record : batch) {
                    pending_publication_.push_back(record.GetId());
                }
            }
            health_.MarkError(records.UnwrapErr().message);
            return Result<size_t, KeyStoreFailure>::Err(std::move(records).UnwrapErr());
        }
        for (auto& record : records.Unwrap()) {
            batch.push_back(std::move(record));
        }
    }

    auto uploaded = server_.UploadPreKeyBatch(batch);
    if (uploaded.IsErr()) {
        {
            std::lock_guard lock(pending_mutex_);
            for (const auto& record : batch) {
                pending_publication_.push_back(record.GetId());
            }
        }
        SIGKEEP_LOG_ERROR(kComponent, "Generated {} pre-keys but publication failed: {}",
                          batch.size(), uploaded.UnwrapErr().message);
        health_.MarkError(uploaded.UnwrapErr().message);
        return Result<size_t, KeyStoreFailure>::Err(std::move(uploaded).UnwrapErr());
    }

    health_.MarkGenerated(current + batch.size(), clock_.Now());
    return Result<size_t, KeyStoreFailure>::Ok(batch.size());
}

Result<std::vector<models::PreKeyRecord>, KeyStoreFailure> PreKeyStore::GenerateRun(
    const uint32_t first, const uint32_t last, size_t& generated, const size_t total,
    const PreKeyProgress& progress) {
    std::vector<models::PreKeyRecord> records;
    records.reserve(static_cast<size_t>(last - first) + 1);
    for (uint64_t id = first; id <= last; ++id) {
        auto record = models::PreKeyRecord::Generate(static_cast<uint32_t>(id));
        SIGKEEP_TRY(record);
        SIGKEEP_TRY(Persist(record.Unwrap()));
        records.push_back(std::move(record).Unwrap());
        ++generated;
        if (progress) {
            progress(generated, total);
        }
    }
    SIGKEEP_LOG_TRACE(kComponent, "Generated pre-key run {}-{}", first, last);
    return Result<std::vector<models::PreKeyRecord>, KeyStoreFailure>::Ok(std::move(records));
}

Result<Unit, KeyStoreFailure> PreKeyStore::Persist(const models::PreKeyRecord& record) {
    auto stored = record.ToProto();
    SIGKEEP_TRY(stored);
    auto bytes = detail::SerializeRecord(stored.Unwrap(), "pre-key");
    SIGKEEP_TRY(bytes);
    auto result = storage_.Put(collections::kPreKeys, PreKeyStorageKey(record.GetId()), bytes.Unwrap());
    crypto::SodiumInterop::SecureWipe(bytes.Unwrap());
    return result;
}

Result<Unit, KeyStoreFailure> PreKeyStore::RetryPendingPublication() {
    std::vector<uint32_t> pending;
    {
        std::lock_guard lock(pending_mutex_);
        pending.swap(pending_publication_);
    }
    if (pending.empty()) {
        return Result<Unit, KeyStoreFailure>::Ok(unit);
    }

    std::vector<models::PreKeyRecord> records;
    records.reserve(pending.size());
    for (const auto id : pending) {
        auto record = LoadPreKey(id);
        if (record.IsOk()) {
            records.push_back(std::move(record).Unwrap());
        } else if (record.UnwrapErr().type != KeyStoreFailureType::NotFound) {
            SIGKEEP_LOG_WARN(kComponent, "Unpublished pre-key {} unavailable: {}", id, record.UnwrapErr().message);
        }
    }

    SIGKEEP_LOG_INFO(kComponent, "Retrying publication of {} pre-keys", records.size());
    auto uploaded = server_.UploadPreKeyBatch(records);
    if (uploaded.IsErr()) {
        std::lock_guard lock(pending_mutex_);
        for (const auto& record : records) {
            pending_publication_.push_back(record.GetId());
        }
        return uploaded;
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<size_t, KeyStoreFailure> PreKeyStore::TrimExcess(std::vector<uint32_t>& ids) {
    size_t removed = 0;
    while (ids.size() > policy_.target_count) {
        const uint32_t id = ids.back();
        SIGKEEP_TRY(storage_.Delete(collections::kPreKeys, PreKeyStorageKey(id)));
        if (auto deleted = server_.DeletePreKey(id); deleted.IsErr()) {
            SIGKEEP_LOG_WARN(kComponent, "Server kept trimmed pre-key {}: {}", id, deleted.UnwrapErr().message);
        }
        ids.pop_back();
        ++removed;
    }
    return Result<size_t, KeyStoreFailure>::Ok(removed);
}

Result<Unit, KeyStoreFailure> PreKeyStore::ConsumePreKey(const uint32_t pre_key_id, const bool notify_server) {
    SIGKEEP_TRY(storage_.Delete(collections::kPreKeys, PreKeyStorageKey(pre_key_id)));
    SIGKEEP_LOG_DEBUG(kComponent, "Consumed pre-key {}", pre_key_id);

    if (notify_server) {
        RemoveFromServer(pre_key_id);
    }
    if (auto count = Count(); count.IsOk()) {
        health_.UpdateCount(count.Unwrap());
    }

    runner_.Spawn("prekey-refill",
        [this]() {
            return EnsureSufficientPreKeys().Map([](size_t) { return unit; });
        },
        [this](std::string_view, const KeyStoreFailure& failure) {
            health_.MarkError(failure.message);
        });
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<ReconcileReport, KeyStoreFailure> PreKeyStore::ReconcileWithServer(
    const std::span<const uint32_t> server_ids,
    const std::map<uint32_t, std::string>& server_fingerprints) {
    ReconcileReport report;

    auto loaded = LoadAllLocked();
    SIGKEEP_TRY(loaded);
    auto outcome = std::move(loaded).Unwrap();
    report.purged = outcome.purged_ids.size();

    if (outcome.stored > 0 && outcome.records.empty()) {
        SIGKEEP_LOG_ERROR(kComponent, "All {} local pre-keys are unreadable, rebuilding the pool", outcome.stored);
        SIGKEEP_TRY(DeleteAllLocal());
        report.pool_rebuilt = true;
        auto refilled = EnsureSufficientPreKeys();
        SIGKEEP_TRY(refilled);
        report.regenerated = refilled.Unwrap();
        return Result<ReconcileReport, KeyStoreFailure>::Ok(report);
    }

    const std::set<uint32_t> on_server(server_ids.begin(), server_ids.end());
    std::vector<models::PreKeyRecord> missing;
    for (auto& record : outcome.records) {
        if (!on_server.contains(record.GetId())) {
            missing.push_back(std::move(record));
            continue;
        }
        const auto advertised = server_fingerprints.find(record.GetId());
        if (advertised != server_fingerprints.end() && advertised->second != FingerprintHex(record)) {
            SIGKEEP_LOG_WARN(kComponent, "Server copy of pre-key {} differs, re-publishing", record.GetId());
            SIGKEEP_TRY(server_.UploadPreKey(record));
            ++report.republished;
        }
    }
    if (!missing.empty()) {
        SIGKEEP_LOG_INFO(kComponent, "Server is missing {} local pre-keys, uploading", missing.size());
        SIGKEEP_TRY(server_.UploadPreKeyBatch(missing));
        report.uploaded = missing.size();
    }

    auto refilled = EnsureSufficientPreKeys();
    SIGKEEP_TRY(refilled);
    report.regenerated = refilled.Unwrap();
    return Result<ReconcileReport, KeyStoreFailure>::Ok(report);
}

Result<models::PreKeyRecord, KeyStoreFailure> PreKeyStore::LoadPreKey(const uint32_t pre_key_id) {
    using RecordResult = Result<models::PreKeyRecord, KeyStoreFailure>;
    auto not_found = [pre_key_id]() {
        return RecordResult::Err(KeyStoreFailure::NotFound("Pre-key " + std::to_string(pre_key_id) + " not found"));
    };

    auto raw = storage_.Get(collections::kPreKeys, PreKeyStorageKey(pre_key_id));
    if (raw.IsErr()) {
        if (raw.UnwrapErr().IsCorruption()) {
            Purge(pre_key_id, raw.UnwrapErr().message);
            return not_found();
        }
        return RecordResult::Err(std::move(raw).UnwrapErr());
    }
    auto bytes = std::move(raw).Unwrap();
    if (!bytes.has_value()) {
        return not_found();
    }
    auto record = detail::ParseRecord<proto::keys::StoredPreKey>(*bytes, "pre-key")
        .Bind([](const proto::keys::StoredPreKey& stored) {
            return models::PreKeyRecord::FromProto(stored);
        });
    crypto::SodiumInterop::SecureWipe(*bytes);
    if (record.IsErr()) {
        Purge(pre_key_id, record.UnwrapErr().message);
        return not_found();
    }
    if (record.Unwrap().GetId() != pre_key_id) {
        Purge(pre_key_id, "record id does not match its storage key");
        return not_found();
    }
    return record;
}

Result<bool, KeyStoreFailure> PreKeyStore::ContainsPreKey(const uint32_t pre_key_id) {
    auto raw = storage_.Get(collections::kPreKeys, PreKeyStorageKey(pre_key_id));
    if (raw.IsErr()) {
        if (raw.UnwrapErr().IsCorruption()) {
            return Result<bool, KeyStoreFailure>::Ok(false);
        }
        return Result<bool, KeyStoreFailure>::Err(std::move(raw).UnwrapErr());
    }
    return Result<bool, KeyStoreFailure>::Ok(raw.Unwrap().has_value());
}

Result<std::vector<uint32_t>, KeyStoreFailure> PreKeyStore::ListPreKeyIds() {
    auto keys = storage_.ListKeys(collections::kPreKeys);
    SIGKEEP_TRY(keys);
    std::vector<uint32_t> ids;
    ids.reserve(keys.Unwrap().size());
    for (const auto& key : keys.Unwrap()) {
        if (const auto id = detail::ParseIdSuffix(key, storage_keys::kPreKeyPrefix)) {
            ids.push_back(*id);
        } else {
            SIGKEEP_LOG_DEBUG(kComponent, "Ignoring foreign key '{}' in pre-key collection", key);
        }
    }
    std::sort(ids.begin(), ids.end());
    return Result<std::vector<uint32_t>, KeyStoreFailure>::Ok(std::move(ids));
}

Result<size_t, KeyStoreFailure> PreKeyStore::Count() {
    return ListPreKeyIds().Map([](const std::vector<uint32_t>& ids) {
        return ids.size();
    });
}

Result<PreKeyStore::LoadOutcome, KeyStoreFailure> PreKeyStore::LoadAllLocked() {
    auto ids = ListPreKeyIds();
    SIGKEEP_TRY(ids);
    LoadOutcome outcome;
    outcome.stored = ids.Unwrap().size();
    outcome.records.reserve(outcome.stored);
    for (const auto id : ids.Unwrap()) {
        auto record = LoadPreKey(id);
        if (record.IsOk()) {
            outcome.records.push_back(std::move(record).Unwrap());
            continue;
        }
        if (record.UnwrapErr().type != KeyStoreFailureType::NotFound) {
            return Result<LoadOutcome, KeyStoreFailure>::Err(std::move(record).UnwrapErr());
        }
        // Listed a moment ago: NotFound here means LoadPreKey purged it.
        outcome.purged_ids.push_back(id);
    }
    return Result<LoadOutcome, KeyStoreFailure>::Ok(std::move(outcome));
}

Result<std::vector<models::PreKeyRecord>, KeyStoreFailure> PreKeyStore::LoadAllPreKeys() {
    auto loaded = LoadAllLocked();
    SIGKEEP_TRY(loaded);
    auto outcome = std::move(loaded).Unwrap();
    if (outcome.stored > 0 && outcome.records.empty()) {
        health_.MarkError("All stored pre-keys are unreadable");
        return Result<std::vector<models::PreKeyRecord>, KeyStoreFailure>::Err(KeyStoreFailure::StorageCorruption(
            "All " + std::to_string(outcome.stored) + " stored pre-keys are unreadable"));
    }
    return Result<std::vector<models::PreKeyRecord>, KeyStoreFailure>::Ok(std::move(outcome.records));
}

Result<std::map<uint32_t, std::string>, KeyStoreFailure> PreKeyStore::GetPreKeyFingerprints() {
    auto records = LoadAllPreKeys();
    SIGKEEP_TRY(records);
    std::map<uint32_t, std::string> fingerprints;
    for (const auto& record : records.Unwrap()) {
        fingerprints.emplace(record.GetId(), FingerprintHex(record));
    }
    return Result<std::map<uint32_t, std::string>, KeyStoreFailure>::Ok(std::move(fingerprints));
}

Result<size_t, KeyStoreFailure> PreKeyStore::DeleteAllLocal() {
    auto ids = ListPreKeyIds();
    SIGKEEP_TRY(ids);
    size_t removed = 0;
    std::optional<KeyStoreFailure> first_error;
    for (const auto id : ids.Unwrap()) {
        auto deleted = storage_.Delete(collections::kPreKeys, PreKeyStorageKey(id));
        if (deleted.IsErr()) {
            SIGKEEP_LOG_ERROR(kComponent, "Failed to delete pre-key {}: {}", id, deleted.UnwrapErr().message);
            if (!first_error) {
                first_error = std::move(deleted).UnwrapErr();
            }
            continue;
        }
        ++removed;
    }
    {
        std::lock_guard lock(pending_mutex_);
        pending_publication_.clear();
    }
    health_.UpdateCount(ids.Unwrap().size() - removed);
    SIGKEEP_LOG_INFO(kComponent, "Deleted {} local pre-keys", removed);
    if (first_error) {
        return Result<size_t, KeyStoreFailure>::Err(std::move(*first_error));
    }
    return Result<size_t, KeyStoreFailure>::Ok(removed);
}

void PreKeyStore::Purge(const uint32_t pre_key_id, const std::string_view reason) {
    SIGKEEP_LOG_WARN(kComponent, "Purging unreadable pre-key {} ({})", pre_key_id, reason);
    if (auto deleted = storage_.Delete(collections::kPreKeys, PreKeyStorageKey(pre_key_id)); deleted.IsErr()) {
        SIGKEEP_LOG_ERROR(kComponent, "Failed to purge pre-key {}: {}", pre_key_id, deleted.UnwrapErr().message);
    }
    RemoveFromServer(pre_key_id);
}

void PreKeyStore::RemoveFromServer(const uint32_t pre_key_id) {
    {
        std::lock_guard lock(pending_mutex_);
        pending_removal_.push_back(pre_key_id);
    }
    runner_.Spawn("prekey-server-delete",
        [this]() {
            return FlushServerRemovals();
        },
        [this](std::string_view, const KeyStoreFailure& failure) {
            health_.MarkError(failure.message);
        });
}

Result<Unit, KeyStoreFailure> PreKeyStore::FlushServerRemovals() {
    // Held across the DELETEs so a refill cannot upload a reused id before they land.
    std::lock_guard removal_lock(removal_mutex_);
    std::vector<uint32_t> ids;
    {
        std::lock_guard lock(pending_mutex_);
        ids.swap(pending_removal_);
    }
    std::optional<KeyStoreFailure> last_error;
    for (const auto id : ids) {
        if (auto deleted = server_.DeletePreKey(id); deleted.IsErr()) {
            SIGKEEP_LOG_WARN(kComponent, "Server still advertises pre-key {}: {}", id, deleted.UnwrapErr().message);
            last_error = KeyStoreFailure::Network(
                "Pre-key " + std::to_string(id) + " not removed from server: " + deleted.UnwrapErr().message);
        }
    }
    if (last_error) {
        return Result<Unit, KeyStoreFailure>::Err(std::move(*last_error));
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

} // namespace sigkeep::stores
