#include "sigkeep/stores/signed_pre_key_store.hpp"
#include "sigkeep/core/constants.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/logging/logger.hpp"
#include "record_codec.hpp"

#include <algorithm>
#include <limits>
#include <set>

namespace sigkeep::stores {

namespace {

constexpr std::string_view kComponent = "signed-prekey-store";

std::string SignedPreKeyStorageKey(const uint32_t signed_pre_key_id) {
    return std::string(storage_keys::kSignedPreKeyPrefix) + std::to_string(signed_pre_key_id);
}

// Newest first; a key without a creation time is treated as the oldest.
bool NewerFirst(const models::SignedPreKeyRecord& lhs, const models::SignedPreKeyRecord& rhs) {
    const auto& a = lhs.GetCreatedAt();
    const auto& b = rhs.GetCreatedAt();
    if (a.has_value() != b.has_value()) {
        return a.has_value();
    }
    if (a.has_value() && *a != *b) {
        return *a > *b;
    }
    return lhs.GetId() > rhs.GetId();
}

} // namespace

SignedPreKeyStore::SignedPreKeyStore(
    interfaces::IEncryptedStorage& storage,
    api::KeyServerApi& server,
    state::KeyHealthMonitor& health,
    IdentityKeyStore& identity_store,
    const interfaces::IClock& clock,
    const configuration::SignedPreKeyPolicy policy)
    : storage_(storage)
    , server_(server)
    , health_(health)
    , identity_store_(identity_store)
    , clock_(clock)
    , policy_(policy) {
}

Result<models::SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyStore::GetCurrentSignedPreKey() {
    auto identity = identity_store_.GetIdentityKeyPair();
    SIGKEEP_TRY(identity);

    std::lock_guard lock(mutex_);
    auto loaded = LoadAllNewestFirstLocked();
    SIGKEEP_TRY(loaded);
    auto records = std::move(loaded).Unwrap();

    if (records.empty()) {
        SIGKEEP_LOG_INFO(kComponent, "No signed pre-key stored, generating id 0");
        return PublishNewLocked(0, *identity.Unwrap(), records);
    }
    if (IsDue(records.front())) {
        const auto max_id = std::max_element(records.begin(), records.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.GetId() < rhs.GetId(); })->GetId();
        SIGKEEP_LOG_INFO(kComponent, "Signed pre-key {} is due for rotation", records.front().GetId());
        auto rotated = max_id == std::numeric_limits<uint32_t>::max()
            ? Result<models::SignedPreKeyRecord, KeyStoreFailure>::Err(
                  KeyStoreFailure::KeyGeneration("Signed pre-key id space exhausted"))
            : PublishNewLocked(max_id + 1, *identity.Unwrap(), records);
        if (rotated.IsOk()) {
            return rotated;
        }
        // The current key stays valid until a rotation succeeds.
        SIGKEEP_LOG_WARN(kComponent, "Rotation failed, keeping signed pre-key {}: {}", records.front().GetId(),
                         rotated.UnwrapErr().message);
        health_.MarkError("Signed pre-key rotation failed: " + rotated.UnwrapErr().message);
        return Result<models::SignedPreKeyRecord, KeyStoreFailure>::Ok(std::move(records.front()));
    }

    std::vector<uint32_t> newest_first;
    newest_first.reserve(records.size());
    for (const auto& record : records) {
        newest_first.push_back(record.GetId());
    }
    const size_t kept = PruneLocalLocked(newest_first);
    health_.MarkChecked(kept, models::KeyHealthStatus::Healthy, clock_.Now());
    return Result<models::SignedPreKeyRecord, KeyStoreFailure>::Ok(std::move(records.front()));
}

Result<models::SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyStore::RotateSignedPreKey() {
    auto identity = identity_store_.GetIdentityKeyPair();
    SIGKEEP_TRY(identity);

    std::lock_guard lock(mutex_);
    auto loaded = LoadAllNewestFirstLocked();
    SIGKEEP_TRY(loaded);
    const auto& records = loaded.Unwrap();
    uint32_t next_id = 0;
    for (const auto& record : records) {
        if (record.GetId() == std::numeric_limits<uint32_t>::max()) {
            return Result<models::SignedPreKeyRecord, KeyStoreFailure>::Err(
                KeyStoreFailure::KeyGeneration("Signed pre-key id space exhausted"));
        }
        next_id = std::max(next_id, record.GetId() + 1);
    }
    return PublishNewLocked(next_id, *identity.Unwrap(), records);
}

Result<models::SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyStore::RegenerateInitial() {
    auto identity = identity_store_.GetIdentityKeyPair();
    SIGKEEP_TRY(identity);

    std::lock_guard lock(mutex_);
    auto loaded = LoadAllNewestFirstLocked();
    SIGKEEP_TRY(loaded);
    SIGKEEP_LOG_WARN(kComponent, "Regenerating signed pre-key 0");
    return PublishNewLocked(0, *identity.Unwrap(), loaded.Unwrap());
}

Result<bool, KeyStoreFailure> SignedPreKeyStore::ValidateAgainstServer(const RemoteSignedPreKeyStatus& remote) {
    auto identity = identity_store_.GetIdentityKeyPair();
    SIGKEEP_TRY(identity);
    const auto& identity_public = identity.Unwrap()->GetPublicKey();

    std::string problem;
    if (remote.public_key.empty() || remote.signature.empty()) {
        problem = "server returned no key material";
    } else if (remote.signature.size() != kEd25519SignatureBytes) {
        problem = "signature has length " + std::to_string(remote.signature.size());
    } else if (!crypto::SodiumInterop::VerifyDetached(remote.signature, remote.public_key, identity_public)) {
        problem = "signature does not verify against the identity key";
    } else {
        std::lock_guard lock(mutex_);
        auto local = LoadLocked(remote.key_id);
        if (local.IsErr()) {
            if (local.UnwrapErr().type != KeyStoreFailureType::NotFound) {
                return Result<bool, KeyStoreFailure>::Err(std::move(local).UnwrapErr());
            }
            problem = "key " + std::to_string(remote.key_id) + " is unknown locally";
        } else if (!crypto::SodiumInterop::ConstantTimeEquals(local.Unwrap().GetPublicKey(), remote.public_key)) {
            problem = "public key differs from local key " + std::to_string(remote.key_id);
        }
    }

    if (problem.empty()) {
        SIGKEEP_LOG_DEBUG(kComponent, "Server signed pre-key {} is valid", remote.key_id);
        return Result<bool, KeyStoreFailure>::Ok(true);
    }
    SIGKEEP_LOG_WARN(kComponent, "Server signed pre-key is invalid ({}), regenerating", problem);
    auto regenerated = RegenerateInitial();
    SIGKEEP_TRY(regenerated);
    return Result<bool, KeyStoreFailure>::Ok(false);
}

Result<bool, KeyStoreFailure> SignedPreKeyStore::NeedsRotation() {
    std::lock_guard lock(mutex_);
    auto loaded = LoadAllNewestFirstLocked();
    SIGKEEP_TRY(loaded);
    const auto& records = loaded.Unwrap();
    return Result<bool, KeyStoreFailure>::Ok(records.empty() || IsDue(records.front()));
}

Result<models::SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyStore::LoadSignedPreKey(
    const uint32_t signed_pre_key_id) {
    std::lock_guard lock(mutex_);
    return LoadLocked(signed_pre_key_id);
}

Result<std::vector<uint32_t>, KeyStoreFailure> SignedPreKeyStore::ListSignedPreKeyIds() {
    std::lock_guard lock(mutex_);
    return ListIdsLocked();
}

Result<size_t, KeyStoreFailure> SignedPreKeyStore::DeleteAllLocal() {
    std::lock_guard lock(mutex_);
    auto ids = ListIdsLocked();
    SIGKEEP_TRY(ids);
    size_t removed = 0;
    for (const auto id : ids.Unwrap()) {
        SIGKEEP_TRY(storage_.Delete(collections::kSignedPreKeys, SignedPreKeyStorageKey(id)));
        ++removed;
    }
    health_.UpdateCount(0);
    SIGKEEP_LOG_INFO(kComponent, "Deleted {} local signed pre-keys", removed);
    return Result<size_t, KeyStoreFailure>::Ok(removed);
}

Result<models::SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyStore::PublishNewLocked(
    const uint32_t new_id, const models::IdentityKeyPair& identity, const Records& existing) {
    using RecordResult = Result<models::SignedPreKeyRecord, KeyStoreFailure>;
    health_.MarkInProgress();

    auto generated = models::SignedPreKeyRecord::Generate(new_id, identity, clock_.Now());
    if (generated.IsErr()) {
        health_.MarkError(generated.UnwrapErr().message);
        return generated;
    }
    auto record = std::move(generated).Unwrap();

    if (auto uploaded = server_.UploadSignedPreKey(record); uploaded.IsErr()) {
        SIGKEEP_LOG_ERROR(kComponent, "Signed pre-key {} was not published: {}", new_id, uploaded.UnwrapErr().message);
        health_.MarkError(uploaded.UnwrapErr().message);
        return RecordResult::Err(std::move(uploaded).UnwrapErr());
    }
    if (auto persisted = Persist(record); persisted.IsErr()) {
        health_.MarkError(persisted.UnwrapErr().message);
        return RecordResult::Err(std::move(persisted).UnwrapErr());
    }
    SIGKEEP_LOG_INFO(kComponent, "Published signed pre-key {}", new_id);
    SIGKEEP_LOG_KEY(kComponent, "signed_prekey_public", std::span<const uint8_t>(record.GetPublicKey()));

    std::vector<uint32_t> newest_first{new_id};
    for (const auto& older : existing) {
        if (older.GetId() != new_id) {
            newest_first.push_back(older.GetId());
        }
    }
    const size_t kept = PruneLocalLocked(newest_first);
    PruneRemote(newest_first);
    health_.MarkGenerated(kept, clock_.Now());
    return RecordResult::Ok(std::move(record));
}

size_t SignedPreKeyStore::PruneLocalLocked(const std::vector<uint32_t>& newest_first) {
    size_t kept = 0;
    for (size_t i = 0; i < newest_first.size(); ++i) {
        if (i < policy_.local_retention) {
            ++kept;
            continue;
        }
        const uint32_t id = newest_first[i];
        if (auto deleted = storage_.Delete(collections::kSignedPreKeys, SignedPreKeyStorageKey(id));
            deleted.IsErr()) {
            SIGKEEP_LOG_ERROR(kComponent, "Failed to prune local signed pre-key {}: {}",
                              id, deleted.UnwrapErr().message);
            ++kept;
            continue;
        }
        SIGKEEP_LOG_DEBUG(kComponent, "Pruned local signed pre-key {}", id);
    }
    return kept;
}

void SignedPreKeyStore::PruneRemote(const std::vector<uint32_t>& newest_first) {
    const size_t keep_count = std::min(policy_.remote_retention, newest_first.size());
    const std::set<uint32_t> keep(newest_first.begin(), newest_first.begin() + static_cast<std::ptrdiff_t>(keep_count));

    std::vector<uint32_t> advertised;
    if (auto listed = server_.ListSignedPreKeyIds(); listed.IsOk()) {
        advertised = std::move(listed).Unwrap();
    } else {
        SIGKEEP_LOG_WARN(kComponent, "Server signed pre-key list unavailable ({}), pruning by local ids",
                         listed.UnwrapErr().message);
        advertised = newest_first;
    }

    for (const auto id : advertised) {
        if (keep.contains(id)) {
            continue;
        }
        if (auto deleted = server_.DeleteSignedPreKey(id); deleted.IsErr()) {
            SIGKEEP_LOG_WARN(kComponent, "Server kept signed pre-key {}: {}", id, deleted.UnwrapErr().message);
        } else {
            SIGKEEP_LOG_DEBUG(kComponent, "Removed signed pre-key {} from server", id);
        }
    }
}

bool SignedPreKeyStore::IsDue(const models::SignedPreKeyRecord& record) const {
    const auto& created_at = record.GetCreatedAt();
    if (!created_at.has_value()) {
        return true;
    }
    return clock_.Now() - *created_at >= policy_.rotation_interval;
}

Result<SignedPreKeyStore::Records, KeyStoreFailure> SignedPreKeyStore::LoadAllNewestFirstLocked() {
    auto ids = ListIdsLocked();
    SIGKEEP_TRY(ids);
    Records records;
    records.reserve(ids.Unwrap().size());
    for (const auto id : ids.Unwrap()) {
        auto record = LoadLocked(id);
        if (record.IsOk()) {
            records.push_back(std::move(record).Unwrap());
        } else if (record.UnwrapErr().type != KeyStoreFailureType::NotFound) {
            return Result<Records, KeyStoreFailure>::Err(std::move(record).UnwrapErr());
        }
    }
    std::sort(records.begin(), records.end(), NewerFirst);
    return Result<Records, KeyStoreFailure>::Ok(std::move(records));
}

Result<models::SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyStore::LoadLocked(const uint32_t signed_pre_key_id) {
    using RecordResult = Result<models::SignedPreKeyRecord, KeyStoreFailure>;
    const auto key = SignedPreKeyStorageKey(signed_pre_key_id);
    auto purge = [&](const std::string& reason) {
        SIGKEEP_LOG_WARN(kComponent, "Purging unreadable signed pre-key {} ({})", signed_pre_key_id, reason);
        if (auto deleted = storage_.Delete(collections::kSignedPreKeys, key); deleted.IsErr()) {
            SIGKEEP_LOG_ERROR(kComponent, "Failed to purge signed pre-key {}: {}",
                              signed_pre_key_id, deleted.UnwrapErr().message);
        }
        return RecordResult::Err(KeyStoreFailure::NotFound(
            "Signed pre-key " + std::to_string(signed_pre_key_id) + " not found"));
    };

    auto raw = storage_.Get(collections::kSignedPreKeys, key);
    if (raw.IsErr()) {
        if (raw.UnwrapErr().IsCorruption()) {
            return purge(raw.UnwrapErr().message);
        }
        return RecordResult::Err(std::move(raw).UnwrapErr());
    }
    auto bytes = std::move(raw).Unwrap();
    if (!bytes.has_value()) {
        return RecordResult::Err(KeyStoreFailure::NotFound(
            "Signed pre-key " + std::to_string(signed_pre_key_id) + " not found"));
    }
    auto record = detail::ParseRecord<proto::keys::StoredSignedPreKey>(*bytes, "signed pre-key")
        .Bind([](const proto::keys::StoredSignedPreKey& stored) {
            return models::SignedPreKeyRecord::FromProto(stored);
        });
    crypto::SodiumInterop::SecureWipe(*bytes);
    if (record.IsErr()) {
        return purge(record.UnwrapErr().message);
    }
    if (record.Unwrap().GetId() != signed_pre_key_id) {
        return purge("record id does not match its storage key");
    }
    return record;
}

Result<std::vector<uint32_t>, KeyStoreFailure> SignedPreKeyStore::ListIdsLocked() {
    auto keys = storage_.ListKeys(collections::kSignedPreKeys);
    SIGKEEP_TRY(keys);
    std::vector<uint32_t> ids;
    for (const auto& key : keys.Unwrap()) {
        if (const auto id = detail::ParseIdSuffix(key, storage_keys::kSignedPreKeyPrefix)) {
            ids.push_back(*id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return Result<std::vector<uint32_t>, KeyStoreFailure>::Ok(std::move(ids));
}

Result<Unit, KeyStoreFailure> SignedPreKeyStore::Persist(const models::SignedPreKeyRecord& record) {
    auto stored = record.ToProto();
    SIGKEEP_TRY(stored);
    auto bytes = detail::SerializeRecord(stored.Unwrap(), "signed pre-key");
    SIGKEEP_TRY(bytes);
    auto result = storage_.Put(collections::kSignedPreKeys, SignedPreKeyStorageKey(record.GetId()), bytes.Unwrap());
    crypto::SodiumInterop::SecureWipe(bytes.Unwrap());
    return result;
}

} // namespace sigkeep::stores
