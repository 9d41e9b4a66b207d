#include "sigkeep/stores/identity_key_store.hpp"
#include "sigkeep/core/constants.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/logging/logger.hpp"
#include "record_codec.hpp"

namespace sigkeep::stores {

namespace {

constexpr std::string_view kComponent = "identity-store";

using IdentityResult = Result<IdentityKeyStore::IdentityPtr, KeyStoreFailure>;

Result<Unit, KeyStoreFailure> ValidatePeer(std::string_view peer) {
    if (peer.empty()) {
        return Result<Unit, KeyStoreFailure>::Err(KeyStoreFailure::InvalidInput("Peer name is empty"));
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

uint64_t NowMillis(const interfaces::IClock& clock) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        clock.Now().time_since_epoch()).count());
}

} // namespace

IdentityKeyStore::IdentityKeyStore(
    interfaces::IEncryptedStorage& storage,
    api::KeyServerApi& server,
    state::KeyHealthMonitor& health,
    const interfaces::IClock& clock,
    const configuration::RegenerationPolicy policy)
    : storage_(storage)
    , server_(server)
    , health_(health)
    , clock_(clock)
    , policy_(policy) {
}

void IdentityKeyStore::SetDependentKeyCleanup(interfaces::IDependentKeyCleanup* cleanup) noexcept {
    cleanup_ = cleanup;
}

void IdentityKeyStore::SetIdentityChangeHandler(IdentityChangeHandler handler) {
    std::lock_guard lock(remote_mutex_);
    change_handler_ = std::move(handler);
}

IdentityResult IdentityKeyStore::GetIdentityKeyPair() {
    {
        std::lock_guard lock(cache_mutex_);
        if (cached_) {
            return IdentityResult::Ok(cached_);
        }
    }

    auto guard = regeneration_lock_.Acquire(policy_.lock_timeout);
    SIGKEEP_TRY(guard);

    {
        std::lock_guard lock(cache_mutex_);
        if (cached_) {
            return IdentityResult::Ok(cached_);
        }
    }

    auto stored = LoadStoredLocked();
    if (stored.IsErr()) {
        if (stored.UnwrapErr().type != KeyStoreFailureType::NotFound) {
            return stored;
        }
    } else {
        return stored;
    }

    SIGKEEP_LOG_INFO(kComponent, "No identity key pair stored, generating one");
    auto generated = GenerateAndPublishLocked();
    SIGKEEP_TRY(generated);
    auto outcome = std::move(generated).Unwrap();
    if (!outcome.report.Published()) {
        SIGKEEP_LOG_WARN(kComponent, "New identity is usable locally but unpublished: {}",
                         outcome.report.publication_error->message);
    }
    return IdentityResult::Ok(std::move(outcome.identity));
}

Result<uint32_t, KeyStoreFailure> IdentityKeyStore::GetLocalRegistrationId() {
    return GetIdentityKeyPair().Map([](const IdentityPtr& identity) {
        return identity->GetRegistrationId();
    });
}

Result<models::CleanupReport, KeyStoreFailure> IdentityKeyStore::RegenerateIdentityKeyPair() {
    auto guard = regeneration_lock_.Acquire(policy_.lock_timeout);
    SIGKEEP_TRY(guard);

    SIGKEEP_LOG_WARN(kComponent, "Regenerating identity key pair; all dependent key material will be destroyed");
    {
        std::lock_guard lock(cache_mutex_);
        cached_.reset();
        published_ = false;
    }
    SIGKEEP_TRY(storage_.Delete(collections::kIdentity, storage_keys::kIdentityKeyPair));

    auto generated = GenerateAndPublishLocked();
    SIGKEEP_TRY(generated);
    auto outcome = std::move(generated).Unwrap();
    if (!outcome.report.Published()) {
        return Result<models::CleanupReport, KeyStoreFailure>::Err(KeyStoreFailure::Publication(
            "Regenerated identity was not published: " + outcome.report.publication_error->message));
    }
    return Result<models::CleanupReport, KeyStoreFailure>::Ok(std::move(outcome.report));
}

Result<Unit, KeyStoreFailure> IdentityKeyStore::PublishIdentity() {
    auto identity = GetIdentityKeyPair();
    SIGKEEP_TRY(identity);
    auto guard = regeneration_lock_.Acquire(policy_.lock_timeout);
    SIGKEEP_TRY(guard);
    {
        std::lock_guard lock(cache_mutex_);
        if (published_) {
            return Result<Unit, KeyStoreFailure>::Ok(unit);
        }
        // A regeneration may have replaced the pair meanwhile.
        if (cached_) {
            identity = IdentityResult::Ok(cached_);
        }
    }
    auto published = PublishLocked(identity.Unwrap());
    if (published.IsErr()) {
        health_.MarkError(published.UnwrapErr().message);
    }
    return published;
}

bool IdentityKeyStore::IsPublished() const {
    std::lock_guard lock(cache_mutex_);
    return published_;
}

IdentityResult IdentityKeyStore::LoadStoredLocked() {
    auto raw = storage_.Get(collections::kIdentity, storage_keys::kIdentityKeyPair);
    if (raw.IsErr()) {
        const auto& failure = raw.UnwrapErr();
        if (failure.IsCorruption()) {
            SIGKEEP_LOG_ERROR(kComponent, "Stored identity key pair is unreadable: {}", failure.message);
            health_.MarkError("Identity key pair is corrupted: " + failure.message);
            return IdentityResult::Err(KeyStoreFailure::StorageCorruption(
                "Identity key pair is unreadable; explicit regeneration required: " + failure.message));
        }
        return IdentityResult::Err(failure);
    }
    auto bytes = std::move(raw).Unwrap();
    if (!bytes.has_value()) {
        return IdentityResult::Err(KeyStoreFailure::NotFound("No identity key pair stored"));
    }

    auto decoded = detail::ParseRecord<proto::keys::StoredIdentityKeyPair>(*bytes, "identity key pair")
        .Bind([](proto::keys::StoredIdentityKeyPair stored) {
            return models::IdentityKeyPair::FromProto(stored).Map([&stored](models::IdentityKeyPair pair) {
                return std::make_pair(std::make_shared<const models::IdentityKeyPair>(std::move(pair)),
                                      stored.published());
            });
        });
    crypto::SodiumInterop::SecureWipe(*bytes);
    if (decoded.IsErr()) {
        const auto& failure = decoded.UnwrapErr();
        SIGKEEP_LOG_ERROR(kComponent, "Stored identity key pair is invalid: {}", failure.message);
        health_.MarkError("Identity key pair is corrupted: " + failure.message);
        return IdentityResult::Err(KeyStoreFailure::StorageCorruption(
            "Identity key pair is invalid; explicit regeneration required: " + failure.message));
    }

    auto [identity, published] = std::move(decoded).Unwrap();
    {
        std::lock_guard lock(cache_mutex_);
        cached_ = identity;
        published_ = published;
    }
    SIGKEEP_LOG_DEBUG(kComponent, "Loaded identity key pair (registration id {})", identity->GetRegistrationId());
    SIGKEEP_LOG_KEY(kComponent, "identity_public", std::span<const uint8_t>(identity->GetPublicKey()));
    health_.MarkChecked(1, models::KeyHealthStatus::Healthy, clock_.Now());

    if (!published) {
        SIGKEEP_LOG_INFO(kComponent, "Stored identity was never acknowledged by the server, publishing");
        auto publish = PublishLocked(identity);
        if (publish.IsErr()) {
            health_.MarkError(publish.UnwrapErr().message);
        }
    }
    return IdentityResult::Ok(std::move(identity));
}

Result<IdentityKeyStore::Generated, KeyStoreFailure> IdentityKeyStore::GenerateAndPublishLocked() {
    health_.MarkInProgress();
    auto pair_result = models::IdentityKeyPair::Generate();
    if (pair_result.IsErr()) {
        health_.MarkError(pair_result.UnwrapErr().message);
        return Result<Generated, KeyStoreFailure>::Err(std::move(pair_result).UnwrapErr());
    }
    auto identity = std::make_shared<const models::IdentityKeyPair>(std::move(pair_result).Unwrap());

    auto persisted = Persist(*identity, false);
    if (persisted.IsErr()) {
        health_.MarkError(persisted.UnwrapErr().message);
        return Result<Generated, KeyStoreFailure>::Err(std::move(persisted).UnwrapErr());
    }
    SIGKEEP_LOG_INFO(kComponent, "Generated identity key pair (registration id {})", identity->GetRegistrationId());
    SIGKEEP_LOG_KEY(kComponent, "identity_public", std::span<const uint8_t>(identity->GetPublicKey()));

    const interfaces::PublishIdentityFn publish = [this, &identity]() {
        return PublishLocked(identity);
    };

    models::CleanupReport report;
    if (cleanup_ != nullptr) {
        report = cleanup_->CleanupAndPublish(publish);
    } else {
        auto published = publish();
        if (published.IsErr()) {
            report.publication_error = std::move(published).UnwrapErr();
        }
    }

    // Other callers block on the regeneration lock until the pair is visible here.
    {
        std::lock_guard lock(cache_mutex_);
        cached_ = identity;
        published_ = report.Published();
    }
    if (report.Published()) {
        health_.MarkGenerated(1, clock_.Now());
    } else {
        health_.MarkError(report.publication_error->message);
    }
    return Result<Generated, KeyStoreFailure>::Ok(Generated{std::move(identity), std::move(report)});
}

Result<Unit, KeyStoreFailure> IdentityKeyStore::PublishLocked(const IdentityPtr& identity) {
    SIGKEEP_TRY(server_.UploadIdentity(*identity));
    auto persisted = Persist(*identity, true);
    if (persisted.IsErr()) {
        // Server has the key; the flag only causes one redundant upload later.
        SIGKEEP_LOG_WARN(kComponent, "Could not record identity publication: {}", persisted.UnwrapErr().message);
    }
    std::lock_guard lock(cache_mutex_);
    if (cached_ == identity) {
        published_ = true;
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<Unit, KeyStoreFailure> IdentityKeyStore::Persist(const models::IdentityKeyPair& identity,
                                                        const bool published) {
    auto stored = identity.ToProto(published);
    SIGKEEP_TRY(stored);
    auto bytes = detail::SerializeRecord(stored.Unwrap(), "identity key pair");
    SIGKEEP_TRY(bytes);
    auto result = storage_.Put(collections::kIdentity, storage_keys::kIdentityKeyPair, bytes.Unwrap());
    crypto::SodiumInterop::SecureWipe(bytes.Unwrap());
    return result;
}

Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure> IdentityKeyStore::LoadRemoteIdentity(
    const std::string_view peer, const uint32_t device_id) {
    using RemoteResult = Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure>;
    const auto key = detail::PeerDeviceKey(storage_keys::kRemoteIdentityPrefix, peer, device_id);

    auto purge = [&](const std::string& reason) -> RemoteResult {
        SIGKEEP_LOG_WARN(kComponent, "Purging unreadable identity record for {}:{} ({})", peer, device_id, reason);
        auto deleted = storage_.Delete(collections::kRemoteIdentities, key);
        if (deleted.IsErr()) {
            SIGKEEP_LOG_ERROR(kComponent, "Failed to purge identity record {}: {}", key, deleted.UnwrapErr().message);
        }
        return RemoteResult::Ok(std::nullopt);
    };

    auto raw = storage_.Get(collections::kRemoteIdentities, key);
    if (raw.IsErr()) {
        if (raw.UnwrapErr().IsCorruption()) {
            return purge(raw.UnwrapErr().message);
        }
        return RemoteResult::Err(std::move(raw).UnwrapErr());
    }
    auto bytes = std::move(raw).Unwrap();
    if (!bytes.has_value()) {
        return RemoteResult::Ok(std::nullopt);
    }
    auto parsed = detail::ParseRecord<proto::keys::StoredRemoteIdentity>(*bytes, "remote identity");
    if (parsed.IsErr()) {
        return purge(parsed.UnwrapErr().message);
    }
    const auto& identity_key = parsed.Unwrap().identity_key();
    if (identity_key.empty()) {
        return purge("empty identity key");
    }
    return RemoteResult::Ok(std::vector<uint8_t>(identity_key.begin(), identity_key.end()));
}

Result<bool, KeyStoreFailure> IdentityKeyStore::IsTrusted(
    const std::string_view peer, const uint32_t device_id, const std::span<const uint8_t> identity_key) {
    SIGKEEP_TRY(ValidatePeer(peer));
    std::lock_guard lock(remote_mutex_);
    auto stored = LoadRemoteIdentity(peer, device_id);
    SIGKEEP_TRY(stored);
    const auto& known = stored.Unwrap();
    if (!known.has_value()) {
        SIGKEEP_LOG_DEBUG(kComponent, "No identity on record for {}:{}, trusting on first use", peer, device_id);
        return Result<bool, KeyStoreFailure>::Ok(true);
    }
    const bool trusted = crypto::SodiumInterop::ConstantTimeEquals(*known, identity_key);
    if (!trusted) {
        SIGKEEP_LOG_WARN(kComponent, "Identity key for {}:{} does not match the recorded key", peer, device_id);
    }
    return Result<bool, KeyStoreFailure>::Ok(trusted);
}

Result<bool, KeyStoreFailure> IdentityKeyStore::SaveIdentity(
    const std::string_view peer, const uint32_t device_id, const std::span<const uint8_t> identity_key) {
    SIGKEEP_TRY(ValidatePeer(peer));
    if (identity_key.empty()) {
        return Result<bool, KeyStoreFailure>::Err(KeyStoreFailure::InvalidInput("Identity key is empty"));
    }

    IdentityChangeHandler notify;
    {
        std::lock_guard lock(remote_mutex_);
        auto stored = LoadRemoteIdentity(peer, device_id);
        SIGKEEP_TRY(stored);
        const auto& known = stored.Unwrap();
        if (known.has_value() && crypto::SodiumInterop::ConstantTimeEquals(*known, identity_key)) {
            return Result<bool, KeyStoreFailure>::Ok(false);
        }

        proto::keys::StoredRemoteIdentity record;
        record.set_identity_key(identity_key.data(), identity_key.size());
        record.set_first_seen_ms(NowMillis(clock_));
        auto bytes = detail::SerializeRecord(record, "remote identity");
        SIGKEEP_TRY(bytes);
        SIGKEEP_TRY(storage_.Put(collections::kRemoteIdentities,
                                 detail::PeerDeviceKey(storage_keys::kRemoteIdentityPrefix, peer, device_id),
                                 bytes.Unwrap()));

        if (known.has_value()) {
            SIGKEEP_LOG_WARN(kComponent,
                             "Identity key of {}:{} changed; the peer reinstalled or the key is compromised",
                             peer, device_id);
            notify = change_handler_;
        } else {
            SIGKEEP_LOG_INFO(kComponent, "Recorded identity key for new contact {}:{}", peer, device_id);
        }
    }
    if (notify) {
        notify(peer, device_id);
    }
    return Result<bool, KeyStoreFailure>::Ok(true);
}

Result<Unit, KeyStoreFailure> IdentityKeyStore::RemoveIdentity(const std::string_view peer,
                                                               const uint32_t device_id) {
    SIGKEEP_TRY(ValidatePeer(peer));
    std::lock_guard lock(remote_mutex_);
    SIGKEEP_TRY(storage_.Delete(collections::kRemoteIdentities,
                                detail::PeerDeviceKey(storage_keys::kRemoteIdentityPrefix, peer, device_id)));
    SIGKEEP_LOG_INFO(kComponent, "Removed identity record for {}:{}", peer, device_id);
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure> IdentityKeyStore::GetIdentity(
    const std::string_view peer, const uint32_t device_id) {
    SIGKEEP_TRY(ValidatePeer(peer));
    std::lock_guard lock(remote_mutex_);
    return LoadRemoteIdentity(peer, device_id);
}

} // namespace sigkeep::stores
