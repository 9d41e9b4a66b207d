#include "sigkeep/manager/key_manager.hpp"
#include "sigkeep/core/constants.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/logging/logger.hpp"
#include "server/key_distribution.pb.h"

#include <vector>

namespace sigkeep::manager {

namespace {

constexpr std::string_view kComponent = "key-manager";

} // namespace

Result<std::unique_ptr<KeyManager>, KeyStoreFailure> KeyManager::Create(
    KeyManagerDependencies dependencies,
    configuration::KeyLifecycleConfig config) {
    SIGKEEP_TRY(config.Validate());
    if (auto initialized = crypto::SodiumInterop::Initialize(); initialized.IsErr()) {
        return Result<std::unique_ptr<KeyManager>, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(initialized.UnwrapErr()));
    }
    logging::Logger::SetLevel(config.log_level);
    return Result<std::unique_ptr<KeyManager>, KeyStoreFailure>::Ok(
        std::unique_ptr<KeyManager>(new KeyManager(dependencies, std::move(config))));
}

KeyManager::KeyManager(KeyManagerDependencies dependencies, configuration::KeyLifecycleConfig config)
    : config_(std::move(config))
    , clock_(dependencies.clock != nullptr ? *dependencies.clock : system_clock_)
    , realtime_(dependencies.realtime)
    , server_api_(dependencies.transport, config_.publication)
    , identity_store_(dependencies.storage, server_api_, identity_health_, clock_, config_.regeneration)
    , pre_key_store_(dependencies.storage, server_api_, pre_key_health_, runner_, clock_, config_.pre_keys)
    , signed_pre_key_store_(dependencies.storage, server_api_, signed_pre_key_health_, identity_store_, clock_,
                            config_.signed_pre_keys)
    , session_store_(dependencies.storage, session_health_)
    , sender_key_store_(config_.enable_sender_keys
                            ? std::make_unique<stores::SenderKeyStore>(dependencies.storage)
                            : nullptr)
    , cascade_(pre_key_store_, signed_pre_key_store_, session_store_, sender_key_store_.get(), server_api_) {
    identity_store_.SetDependentKeyCleanup(&cascade_);
    if (realtime_ != nullptr) {
        realtime_subscription_ = realtime_->Subscribe(
            std::string(kSignedPreKeysResponseEvent),
            [this](const std::string_view payload) { OnSignedPreKeysResponse(payload); });
    }
    SIGKEEP_LOG_DEBUG(kComponent, "Key manager ready (sender keys {})",
                      config_.enable_sender_keys ? "enabled" : "disabled");
}

KeyManager::~KeyManager() {
    if (realtime_ != nullptr && realtime_subscription_.has_value()) {
        realtime_->Unsubscribe(*realtime_subscription_);
    }
    runner_.WaitForIdle();
    identity_store_.SetDependentKeyCleanup(nullptr);
}

Result<Unit, KeyStoreFailure> KeyManager::Initialize(const InitializeProgress& progress) {
    const size_t total = 2 + config_.pre_keys.target_count + 1;
    auto report = [&](const size_t completed, const std::string_view stage) {
        if (progress) {
            progress(completed, total, stage);
        }
    };

    report(0, "identity");
    auto identity = identity_store_.GetIdentityKeyPair();
    SIGKEEP_TRY(identity);
    report(1, "identity");

    auto signed_pre_key = signed_pre_key_store_.GetCurrentSignedPreKey();
    SIGKEEP_TRY(signed_pre_key);
    report(2, "signed-prekey");

    auto pre_keys = pre_key_store_.EnsureSufficientPreKeys([&](const size_t generated, size_t) {
        report(2 + generated, "prekeys");
    });
    SIGKEEP_TRY(pre_keys);
    report(2 + config_.pre_keys.target_count, "prekeys");

    auto sessions = session_store_.SessionCount();
    SIGKEEP_TRY(sessions);
    session_health_.MarkChecked(sessions.Unwrap(), models::KeyHealthStatus::Healthy, clock_.Now());
    report(total, "sessions");

    SIGKEEP_LOG_INFO(kComponent, "Initialized: registration id {}, signed pre-key {}, {} pre-keys generated, {} sessions",
                     identity.Unwrap()->GetRegistrationId(), signed_pre_key.Unwrap().GetId(),
                     pre_keys.Unwrap(), sessions.Unwrap());
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<models::CleanupReport, KeyStoreFailure> KeyManager::RegenerateIdentityKeyPair() {
    std::lock_guard maintenance(maintenance_mutex_);
    // Follow-up work of the old identity must not race the cascade.
    runner_.WaitForIdle();
    return identity_store_.RegenerateIdentityKeyPair();
}

Result<stores::ReconcileReport, KeyStoreFailure> KeyManager::ReconcilePreKeys(
    const std::span<const uint32_t> server_ids,
    const std::map<uint32_t, std::string>& server_fingerprints) {
    return pre_key_store_.ReconcileWithServer(server_ids, server_fingerprints);
}

Result<bool, KeyStoreFailure> KeyManager::ValidateSignedPreKeyWithServer(
    const stores::RemoteSignedPreKeyStatus& remote) {
    return signed_pre_key_store_.ValidateAgainstServer(remote);
}

Result<VerificationReport, KeyStoreFailure> KeyManager::VerifyOwnKeysOnServer(const bool force) {
    using ReportResult = Result<VerificationReport, KeyStoreFailure>;
    std::lock_guard maintenance(maintenance_mutex_);

    const auto now = clock_.Now();
    if (!force && last_verification_.has_value() &&
        now - *last_verification_ < config_.healing.min_verification_interval) {
        SIGKEEP_LOG_DEBUG(kComponent, "Skipping server verification, last run {} ms ago",
                          std::chrono::duration_cast<std::chrono::milliseconds>(now - *last_verification_).count());
        VerificationReport skipped;
        skipped.outcome = VerificationOutcome::Skipped;
        return ReportResult::Ok(std::move(skipped));
    }
    last_verification_ = now;

    auto status_result = server_api_.FetchKeyStatus();
    SIGKEEP_TRY(status_result);
    const auto& status = status_result.Unwrap();
    auto identity = identity_store_.GetIdentityKeyPair();
    SIGKEEP_TRY(identity);
    const auto& local = *identity.Unwrap();

    VerificationReport report;
    auto needs_healing = [&](std::string reason, state::KeyHealthMonitor& health, const std::string& detail) {
        SIGKEEP_LOG_ERROR(kComponent, "Server verification failed ({}): {}", reason, detail);
        health.MarkError("Server verification failed (" + reason + "): " + detail);
        report.outcome = VerificationOutcome::NeedsHealing;
        report.reason = std::move(reason);
        return ReportResult::Ok(std::move(report));
    };
    auto note_repair = [&report](const std::string_view reason) {
        report.outcome = VerificationOutcome::Repaired;
        if (report.reason.empty()) {
            report.reason = std::string(reason);
        }
    };

    if (status.identity_key.empty() ||
        !crypto::SodiumInterop::ConstantTimeEquals(status.identity_key, local.GetPublicKey())) {
        const std::string reason = status.identity_key.empty() ? "identity-missing" : "identity-mismatch";
        if (reason == "identity-mismatch" && !ShouldRepairNow(reason)) {
            return needs_healing(reason, identity_health_, "repair attempted less than the backoff ago");
        }
        SIGKEEP_LOG_WARN(kComponent, "Server identity key is {}, re-publishing the local one",
                         status.identity_key.empty() ? "missing" : "not ours");
        if (auto uploaded = server_api_.UploadIdentity(local); uploaded.IsErr()) {
            return needs_healing(reason, identity_health_, uploaded.UnwrapErr().message);
        }
        report.identity_republished = true;
        note_repair(reason);
    } else {
        SIGKEEP_LOG_DEBUG(kComponent, "Server identity key matches");
    }

    const stores::RemoteSignedPreKeyStatus remote_signed{
        status.signed_pre_key_id, status.signed_pre_key, status.signed_pre_key_signature};
    auto signed_valid = signed_pre_key_store_.ValidateAgainstServer(remote_signed);
    if (signed_valid.IsErr()) {
        return needs_healing("signed-prekey-invalid", signed_pre_key_health_, signed_valid.UnwrapErr().message);
    }
    if (!signed_valid.Unwrap()) {
        report.signed_pre_key_regenerated = true;
        note_repair("signed-prekey-invalid");
    }

    std::vector<uint32_t> server_ids;
    server_ids.reserve(status.pre_key_fingerprints.size());
    for (const auto& [id, fingerprint] : status.pre_key_fingerprints) {
        server_ids.push_back(id);
    }
    auto reconciled = pre_key_store_.ReconcileWithServer(server_ids, status.pre_key_fingerprints);
    if (reconciled.IsErr()) {
        return needs_healing("prekeys-unsynced", pre_key_health_, reconciled.UnwrapErr().message);
    }
    report.pre_keys = reconciled.Unwrap();
    if (report.pre_keys.uploaded > 0 || report.pre_keys.republished > 0 || report.pre_keys.pool_rebuilt) {
        note_repair("prekeys-unsynced");
    }

    if (report.outcome == VerificationOutcome::Valid) {
        SIGKEEP_LOG_INFO(kComponent, "Server holds the local keys");
    } else {
        SIGKEEP_LOG_INFO(kComponent, "Server keys repaired ({})", report.reason);
    }
    return ReportResult::Ok(std::move(report));
}

bool KeyManager::ShouldRepairNow(const std::string& reason) {
    const auto now = clock_.Now();
    const auto last = last_repair_.find(reason);
    if (last != last_repair_.end() && now - last->second < config_.healing.repair_backoff) {
        return false;
    }
    last_repair_[reason] = now;
    return true;
}

void KeyManager::WaitForBackgroundTasks() {
    runner_.WaitForIdle();
}

void KeyManager::OnSignedPreKeysResponse(const std::string_view payload) {
    proto::server::SignedPreKeyList list;
    if (!list.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        SIGKEEP_LOG_WARN(kComponent, "Ignoring malformed {} event ({} bytes)",
                         kSignedPreKeysResponseEvent, payload.size());
        return;
    }
    if (list.key_ids_size() > 0) {
        SIGKEEP_LOG_DEBUG(kComponent, "Server holds {} signed pre-keys", list.key_ids_size());
        return;
    }
    SIGKEEP_LOG_WARN(kComponent, "Server holds no signed pre-key for this device, regenerating");
    runner_.Spawn("signed-prekey-regeneration",
        [this]() {
            return signed_pre_key_store_.RegenerateInitial().Map([](models::SignedPreKeyRecord) {
                return unit;
            });
        },
        [this](std::string_view, const KeyStoreFailure& failure) {
            signed_pre_key_health_.MarkError(failure.message);
        });
}

} // namespace sigkeep::manager
