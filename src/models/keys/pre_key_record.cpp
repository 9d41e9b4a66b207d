#include "sigkeep/models/keys/pre_key_record.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/core/constants.hpp"

#include <string>

namespace sigkeep::models {

PreKeyRecord::PreKeyRecord(
    const uint32_t id,
    crypto::SecureMemoryHandle private_key_handle,
    std::vector<uint8_t> public_key)
    : id_(id)
    , private_key_handle_(std::move(private_key_handle))
    , public_key_(std::move(public_key)) {
}

Result<PreKeyRecord, KeyStoreFailure> PreKeyRecord::Generate(const uint32_t id) {
    auto pair_result = crypto::SodiumInterop::GenerateX25519KeyPair("pre-key");
    if (pair_result.IsErr()) {
        return Result<PreKeyRecord, KeyStoreFailure>::Err(std::move(pair_result).UnwrapErr());
    }
    auto [secret, public_key] = std::move(pair_result).Unwrap();
    return Result<PreKeyRecord, KeyStoreFailure>::Ok(
        PreKeyRecord(id, std::move(secret), std::move(public_key)));
}

Result<PreKeyRecord, KeyStoreFailure> PreKeyRecord::FromProto(const proto::keys::StoredPreKey& stored) {
    if (stored.public_key().size() != kX25519PublicKeyBytes ||
        stored.private_key().size() != kX25519PrivateKeyBytes) {
        return Result<PreKeyRecord, KeyStoreFailure>::Err(
            KeyStoreFailure::StorageCorruption(
                "Pre-key " + std::to_string(stored.key_id()) + " has invalid key sizes"));
    }
    const auto* private_bytes = reinterpret_cast<const uint8_t*>(stored.private_key().data());
    auto handle_result = crypto::SecureMemoryHandle::FromBytes(
        std::span<const uint8_t>(private_bytes, kX25519PrivateKeyBytes));
    if (handle_result.IsErr()) {
        return Result<PreKeyRecord, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();
    std::vector<uint8_t> public_key(stored.public_key().begin(), stored.public_key().end());
    auto derived = crypto::SodiumInterop::DeriveX25519PublicKey(handle);
    if (derived.IsErr()) {
        return Result<PreKeyRecord, KeyStoreFailure>::Err(std::move(derived).UnwrapErr());
    }
    if (!crypto::SodiumInterop::ConstantTimeEquals(derived.Unwrap(), public_key)) {
        return Result<PreKeyRecord, KeyStoreFailure>::Err(
            KeyStoreFailure::StorageCorruption(
                "Pre-key " + std::to_string(stored.key_id()) + " public key does not match its secret"));
    }
    return Result<PreKeyRecord, KeyStoreFailure>::Ok(PreKeyRecord(
        stored.key_id(), std::move(handle), std::move(public_key)));
}

Result<proto::keys::StoredPreKey, KeyStoreFailure> PreKeyRecord::ToProto() const {
    auto private_result = private_key_handle_.ReadBytes();
    if (private_result.IsErr()) {
        return Result<proto::keys::StoredPreKey, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(private_result.UnwrapErr()));
    }
    auto private_key = std::move(private_result).Unwrap();
    proto::keys::StoredPreKey stored;
    stored.set_key_id(id_);
    stored.set_public_key(public_key_.data(), public_key_.size());
    stored.set_private_key(private_key.data(), private_key.size());
    crypto::SodiumInterop::SecureWipe(private_key);
    return Result<proto::keys::StoredPreKey, KeyStoreFailure>::Ok(std::move(stored));
}

} // namespace sigkeep::models
