#include "sigkeep/models/keys/signed_pre_key_record.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/core/constants.hpp"

#include <string>

namespace sigkeep::models {

namespace {

uint64_t ToMillis(const SignedPreKeyRecord::TimePoint time_point) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count());
}

} // namespace

SignedPreKeyRecord::SignedPreKeyRecord(
    const uint32_t id,
    crypto::SecureMemoryHandle private_key_handle,
    std::vector<uint8_t> public_key,
    std::vector<uint8_t> signature,
    std::optional<TimePoint> created_at)
    : id_(id)
    , private_key_handle_(std::move(private_key_handle))
    , public_key_(std::move(public_key))
    , signature_(std::move(signature))
    , created_at_(created_at) {
}

Result<SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyRecord::Generate(
    const uint32_t id,
    const IdentityKeyPair& identity,
    const TimePoint created_at) {
    auto pair_result = crypto::SodiumInterop::GenerateX25519KeyPair("signed pre-key");
    if (pair_result.IsErr()) {
        return Result<SignedPreKeyRecord, KeyStoreFailure>::Err(std::move(pair_result).UnwrapErr());
    }
    auto [secret, public_key] = std::move(pair_result).Unwrap();
    auto signature_result = identity.Sign(public_key);
    if (signature_result.IsErr()) {
        return Result<SignedPreKeyRecord, KeyStoreFailure>::Err(std::move(signature_result).UnwrapErr());
    }
    return Result<SignedPreKeyRecord, KeyStoreFailure>::Ok(SignedPreKeyRecord(
        id,
        std::move(secret),
        std::move(public_key),
        std::move(signature_result).Unwrap(),
        created_at));
}

Result<SignedPreKeyRecord, KeyStoreFailure> SignedPreKeyRecord::FromProto(
    const proto::keys::StoredSignedPreKey& stored) {
    if (stored.public_key().size() != kX25519PublicKeyBytes ||
        stored.private_key().size() != kX25519PrivateKeyBytes ||
        stored.signature().size() != kEd25519SignatureBytes) {
        return Result<SignedPreKeyRecord, KeyStoreFailure>::Err(
            KeyStoreFailure::StorageCorruption(
                "Signed pre-key " + std::to_string(stored.key_id()) + " has invalid field sizes"));
    }
    const auto* private_bytes = reinterpret_cast<const uint8_t*>(stored.private_key().data());
    auto handle_result = crypto::SecureMemoryHandle::FromBytes(
        std::span<const uint8_t>(private_bytes, kX25519PrivateKeyBytes));
    if (handle_result.IsErr()) {
        return Result<SignedPreKeyRecord, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    std::optional<TimePoint> created_at;
    if (stored.created_at_ms() != 0) {
        created_at = TimePoint(std::chrono::milliseconds(stored.created_at_ms()));
    }
    return Result<SignedPreKeyRecord, KeyStoreFailure>::Ok(SignedPreKeyRecord(
        stored.key_id(),
        std::move(handle_result).Unwrap(),
        std::vector<uint8_t>(stored.public_key().begin(), stored.public_key().end()),
        std::vector<uint8_t>(stored.signature().begin(), stored.signature().end()),
        created_at));
}

Result<proto::keys::StoredSignedPreKey, KeyStoreFailure> SignedPreKeyRecord::ToProto() const {
    auto private_result = private_key_handle_.ReadBytes();
    if (private_result.IsErr()) {
        return Result<proto::keys::StoredSignedPreKey, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(private_result.UnwrapErr()));
    }
    auto private_key = std::move(private_result).Unwrap();
    proto::keys::StoredSignedPreKey stored;
    stored.set_key_id(id_);
    stored.set_public_key(public_key_.data(), public_key_.size());
    stored.set_private_key(private_key.data(), private_key.size());
    stored.set_signature(signature_.data(), signature_.size());
    stored.set_created_at_ms(created_at_.has_value() ? ToMillis(*created_at_) : 0);
    crypto::SodiumInterop::SecureWipe(private_key);
    return Result<proto::keys::StoredSignedPreKey, KeyStoreFailure>::Ok(std::move(stored));
}

bool SignedPreKeyRecord::VerifySignature(const std::span<const uint8_t> identity_public_key) const noexcept {
    return crypto::SodiumInterop::VerifyDetached(signature_, public_key_, identity_public_key);
}

} // namespace sigkeep::models
