#include "sigkeep/api/key_server_api.hpp"
#include "sigkeep/core/constants.hpp"
#include "sigkeep/logging/logger.hpp"
#include "server/key_distribution.pb.h"

#include <thread>

namespace sigkeep::api {

using interfaces::HttpMethod;
using interfaces::TransportRequest;
using interfaces::TransportResponse;

namespace {

constexpr std::string_view kComponent = "key-server";

template<typename Message>
Result<std::string, KeyStoreFailure> Encode(const Message& message, std::string_view what) {
    std::string body;
    if (!message.SerializeToString(&body)) {
        return Result<std::string, KeyStoreFailure>::Err(
            KeyStoreFailure::Encode("Failed to serialize " + std::string(what)));
    }
    return Result<std::string, KeyStoreFailure>::Ok(std::move(body));
}

Result<Unit, KeyStoreFailure> Discard(Result<TransportResponse, KeyStoreFailure> response) {
    if (response.IsErr()) {
        return Result<Unit, KeyStoreFailure>::Err(std::move(response).UnwrapErr());
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

} // namespace

KeyServerApi::KeyServerApi(interfaces::IKeyServerTransport& transport,
                           const configuration::PublicationPolicy policy)
    : transport_(transport)
    , policy_(policy) {
}

Result<TransportResponse, KeyStoreFailure> KeyServerApi::Execute(
    const HttpMethod method, std::string path, std::string body) {
    TransportRequest request{method, std::move(path), std::move(body)};
    auto response_result = transport_.Send(request);
    if (response_result.IsErr()) {
        const auto& failure = response_result.UnwrapErr();
        return Result<TransportResponse, KeyStoreFailure>::Err(KeyStoreFailure::Network(
            std::string(interfaces::ToString(method)) + " " + request.path + " failed: " + failure.message));
    }
    auto response = std::move(response_result).Unwrap();
    if (response.status_code == http_status::kAccepted) {
        SIGKEEP_LOG_DEBUG(kComponent, "{} {} accepted (202), settling for {} ms",
                          interfaces::ToString(method), request.path, policy_.accepted_settle_delay.count());
        if (policy_.accepted_settle_delay.count() > 0) {
            std::this_thread::sleep_for(policy_.accepted_settle_delay);
        }
        return Result<TransportResponse, KeyStoreFailure>::Ok(std::move(response));
    }
    if (response.status_code != http_status::kOk) {
        return Result<TransportResponse, KeyStoreFailure>::Err(KeyStoreFailure::Network(
            std::string(interfaces::ToString(method)) + " " + request.path + " returned HTTP " +
            std::to_string(response.status_code)));
    }
    return Result<TransportResponse, KeyStoreFailure>::Ok(std::move(response));
}

Result<Unit, KeyStoreFailure> KeyServerApi::UploadIdentity(const models::IdentityKeyPair& identity) {
    proto::server::IdentityUpload upload;
    upload.set_identity_key(identity.GetPublicKey().data(), identity.GetPublicKey().size());
    upload.set_registration_id(identity.GetRegistrationId());
    auto body = Encode(upload, "identity upload");
    SIGKEEP_TRY(body);
    SIGKEEP_LOG_INFO(kComponent, "Publishing identity key (registration id {})", identity.GetRegistrationId());
    return Discard(Execute(HttpMethod::Post, std::string(endpoints::kIdentity), std::move(body).Unwrap()));
}

Result<Unit, KeyStoreFailure> KeyServerApi::UploadPreKey(const models::PreKeyRecord& pre_key) {
    proto::server::PreKeyUpload upload;
    upload.set_key_id(pre_key.GetId());
    upload.set_public_key(pre_key.GetPublicKey().data(), pre_key.GetPublicKey().size());
    auto body = Encode(upload, "pre-key upload");
    SIGKEEP_TRY(body);
    return Discard(Execute(HttpMethod::Post, std::string(endpoints::kPreKey), std::move(body).Unwrap()));
}

Result<Unit, KeyStoreFailure> KeyServerApi::UploadPreKeyBatch(
    const std::span<const models::PreKeyRecord> pre_keys) {
    if (pre_keys.empty()) {
        return Result<Unit, KeyStoreFailure>::Ok(unit);
    }
    proto::server::PreKeyBatchUpload batch;
    for (const auto& pre_key : pre_keys) {
        auto* entry = batch.add_pre_keys();
        entry->set_key_id(pre_key.GetId());
        entry->set_public_key(pre_key.GetPublicKey().data(), pre_key.GetPublicKey().size());
    }
    auto body_result = Encode(batch, "pre-key batch");
    SIGKEEP_TRY(body_result);
    const std::string body = std::move(body_result).Unwrap();

    std::string last_error;
    for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        auto response = Execute(HttpMethod::Post, std::string(endpoints::kPreKeyBatch), body);
        if (response.IsOk()) {
            SIGKEEP_LOG_INFO(kComponent, "Published {} pre-keys (attempt {}/{})",
                             pre_keys.size(), attempt, policy_.max_attempts);
            return Result<Unit, KeyStoreFailure>::Ok(unit);
        }
        last_error = response.UnwrapErr().message;
        SIGKEEP_LOG_WARN(kComponent, "Pre-key batch attempt {}/{} failed: {}",
                         attempt, policy_.max_attempts, last_error);
        if (attempt < policy_.max_attempts && policy_.retry_delay.count() > 0) {
            std::this_thread::sleep_for(policy_.retry_delay);
        }
    }
    return Result<Unit, KeyStoreFailure>::Err(KeyStoreFailure::Publication(
        "Pre-key batch of " + std::to_string(pre_keys.size()) + " keys not acknowledged after " +
        std::to_string(policy_.max_attempts) + " attempts: " + last_error));
}

Result<Unit, KeyStoreFailure> KeyServerApi::DeletePreKey(const uint32_t pre_key_id) {
    return Discard(Execute(HttpMethod::Delete,
                           std::string(endpoints::kPreKey) + "/" + std::to_string(pre_key_id), {}));
}

Result<Unit, KeyStoreFailure> KeyServerApi::UploadSignedPreKey(
    const models::SignedPreKeyRecord& signed_pre_key) {
    proto::server::SignedPreKeyUpload upload;
    upload.set_key_id(signed_pre_key.GetId());
    upload.set_public_key(signed_pre_key.GetPublicKey().data(), signed_pre_key.GetPublicKey().size());
    upload.set_signature(signed_pre_key.GetSignature().data(), signed_pre_key.GetSignature().size());
    auto body = Encode(upload, "signed pre-key upload");
    SIGKEEP_TRY(body);
    SIGKEEP_LOG_INFO(kComponent, "Publishing signed pre-key {}", signed_pre_key.GetId());
    return Discard(Execute(HttpMethod::Post, std::string(endpoints::kSignedPreKey), std::move(body).Unwrap()));
}

Result<Unit, KeyStoreFailure> KeyServerApi::DeleteSignedPreKey(const uint32_t signed_pre_key_id) {
    return Discard(Execute(HttpMethod::Delete,
                           std::string(endpoints::kSignedPreKey) + "/" + std::to_string(signed_pre_key_id), {}));
}

Result<std::vector<uint32_t>, KeyStoreFailure> KeyServerApi::ListSignedPreKeyIds() {
    auto response = Execute(HttpMethod::Get, std::string(endpoints::kSignedPreKeys), {});
    SIGKEEP_TRY(response);
    proto::server::SignedPreKeyList list;
    const auto& body = response.Unwrap().body;
    if (!list.ParseFromString(body)) {
        return Result<std::vector<uint32_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::Decode("Malformed signed pre-key list from server"));
    }
    return Result<std::vector<uint32_t>, KeyStoreFailure>::Ok(
        std::vector<uint32_t>(list.key_ids().begin(), list.key_ids().end()));
}

Result<ServerKeyStatus, KeyStoreFailure> KeyServerApi::FetchKeyStatus() {
    auto response = Execute(HttpMethod::Get, std::string(endpoints::kKeyStatus), {});
    SIGKEEP_TRY(response);
    proto::server::KeyStatus message;
    if (!message.ParseFromString(response.Unwrap().body)) {
        return Result<ServerKeyStatus, KeyStoreFailure>::Err(
            KeyStoreFailure::Decode("Malformed key status from server"));
    }
    ServerKeyStatus status;
    status.identity_key.assign(message.identity_key().begin(), message.identity_key().end());
    status.signed_pre_key_id = message.signed_pre_key_id();
    status.signed_pre_key.assign(message.signed_pre_key().begin(), message.signed_pre_key().end());
    status.signed_pre_key_signature.assign(message.signed_pre_key_signature().begin(),
                                           message.signed_pre_key_signature().end());
    for (const auto& [id, fingerprint] : message.pre_key_fingerprints()) {
        status.pre_key_fingerprints.emplace(id, fingerprint);
    }
    SIGKEEP_LOG_DEBUG(kComponent, "Server advertises {} pre-keys, signed pre-key {}",
                      status.pre_key_fingerprints.size(), status.signed_pre_key_id);
    return Result<ServerKeyStatus, KeyStoreFailure>::Ok(std::move(status));
}

Result<Unit, KeyStoreFailure> KeyServerApi::DeleteAllKeys() {
    SIGKEEP_LOG_INFO(kComponent, "Requesting deletion of all server-side key material");
    return Discard(Execute(HttpMethod::Delete, std::string(endpoints::kWipeAllKeys), {}));
}

} // namespace sigkeep::api
