#include "sigkeep/models/keys/identity_key_pair.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/core/constants.hpp"

#include <string>

namespace sigkeep::models {

IdentityKeyPair::IdentityKeyPair(
    crypto::SecureMemoryHandle secret_key_handle,
    std::vector<uint8_t> public_key,
    const uint32_t registration_id)
    : secret_key_handle_(std::move(secret_key_handle))
    , public_key_(std::move(public_key))
    , registration_id_(registration_id) {
}

Result<IdentityKeyPair, KeyStoreFailure> IdentityKeyPair::Generate() {
    auto pair_result = crypto::SodiumInterop::GenerateEd25519KeyPair();
    if (pair_result.IsErr()) {
        return Result<IdentityKeyPair, KeyStoreFailure>::Err(std::move(pair_result).UnwrapErr());
    }
    auto [secret, public_key] = std::move(pair_result).Unwrap();
    const uint32_t registration_id = crypto::SodiumInterop::GenerateRandomInRange(
        kMinRegistrationId, kMaxRegistrationId);
    return Result<IdentityKeyPair, KeyStoreFailure>::Ok(
        IdentityKeyPair(std::move(secret), std::move(public_key), registration_id));
}

Result<IdentityKeyPair, KeyStoreFailure> IdentityKeyPair::FromProto(
    const proto::keys::StoredIdentityKeyPair& stored) {
    if (stored.public_key().size() != kEd25519PublicKeyBytes ||
        stored.secret_key().size() != kEd25519SecretKeyBytes) {
        return Result<IdentityKeyPair, KeyStoreFailure>::Err(
            KeyStoreFailure::StorageCorruption("Stored identity key pair has invalid key sizes"));
    }
    if (stored.registration_id() < kMinRegistrationId ||
        stored.registration_id() > kMaxRegistrationId) {
        return Result<IdentityKeyPair, KeyStoreFailure>::Err(
            KeyStoreFailure::StorageCorruption(
                "Stored registration id " + std::to_string(stored.registration_id()) + " is out of range"));
    }
    const auto* secret_bytes = reinterpret_cast<const uint8_t*>(stored.secret_key().data());
    const auto* public_bytes = reinterpret_cast<const uint8_t*>(stored.public_key().data());
    // libsodium secret keys end with their public key.
    if (!crypto::SodiumInterop::ConstantTimeEquals(
            std::span<const uint8_t>(secret_bytes + kEd25519PublicKeyBytes, kEd25519PublicKeyBytes),
            std::span<const uint8_t>(public_bytes, kEd25519PublicKeyBytes))) {
        return Result<IdentityKeyPair, KeyStoreFailure>::Err(
            KeyStoreFailure::StorageCorruption("Stored identity secret does not match its public key"));
    }
    auto handle_result = crypto::SecureMemoryHandle::FromBytes(
        std::span<const uint8_t>(secret_bytes, kEd25519SecretKeyBytes));
    if (handle_result.IsErr()) {
        return Result<IdentityKeyPair, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<IdentityKeyPair, KeyStoreFailure>::Ok(IdentityKeyPair(
        std::move(handle_result).Unwrap(),
        std::vector<uint8_t>(public_bytes, public_bytes + kEd25519PublicKeyBytes),
        stored.registration_id()));
}

Result<proto::keys::StoredIdentityKeyPair, KeyStoreFailure> IdentityKeyPair::ToProto(
    const bool published) const {
    auto secret_result = secret_key_handle_.ReadBytes();
    if (secret_result.IsErr()) {
        return Result<proto::keys::StoredIdentityKeyPair, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(secret_result.UnwrapErr()));
    }
    auto secret = std::move(secret_result).Unwrap();
    proto::keys::StoredIdentityKeyPair stored;
    stored.set_public_key(public_key_.data(), public_key_.size());
    stored.set_secret_key(secret.data(), secret.size());
    stored.set_registration_id(registration_id_);
    stored.set_published(published);
    crypto::SodiumInterop::SecureWipe(secret);
    return Result<proto::keys::StoredIdentityKeyPair, KeyStoreFailure>::Ok(std::move(stored));
}

Result<std::vector<uint8_t>, KeyStoreFailure> IdentityKeyPair::Sign(
    const std::span<const uint8_t> message) const {
    return crypto::SodiumInterop::SignDetached(message, secret_key_handle_);
}

} // namespace sigkeep::models
