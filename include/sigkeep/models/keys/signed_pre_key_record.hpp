#pragma once
#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/crypto/secure_memory_handle.hpp"
#include "sigkeep/models/keys/identity_key_pair.hpp"
#include "keys/key_records.pb.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace sigkeep::models {
/**
 * @brief Medium-term X25519 key whose public half is signed by the identity key.
 *
 * created_at is stored inside the record. Records written without it load
 * with an empty created_at and are treated as due for rotation.
 */
class SignedPreKeyRecord {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    SignedPreKeyRecord(
        uint32_t id,
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key,
        std::vector<uint8_t> signature,
        std::optional<TimePoint> created_at);
    SignedPreKeyRecord(SignedPreKeyRecord&&) noexcept = default;
    SignedPreKeyRecord& operator=(SignedPreKeyRecord&&) noexcept = default;
    SignedPreKeyRecord(const SignedPreKeyRecord&) = delete;
    SignedPreKeyRecord& operator=(const SignedPreKeyRecord&) = delete;

    static Result<SignedPreKeyRecord, KeyStoreFailure> Generate(
        uint32_t id,
        const IdentityKeyPair& identity,
        TimePoint created_at);

    static Result<SignedPreKeyRecord, KeyStoreFailure> FromProto(
        const proto::keys::StoredSignedPreKey& stored);

    [[nodiscard]] Result<proto::keys::StoredSignedPreKey, KeyStoreFailure> ToProto() const;

    /**
     * @brief Check the signature over the public key against an identity public key.
     */
    [[nodiscard]] bool VerifySignature(std::span<const uint8_t> identity_public_key) const noexcept;

    [[nodiscard]] uint32_t GetId() const noexcept {
        return id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept {
        return signature_;
    }
    [[nodiscard]] const std::optional<TimePoint>& GetCreatedAt() const noexcept {
        return created_at_;
    }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetPrivateKeyHandle() const noexcept {
        return private_key_handle_;
    }
private:
    uint32_t id_;
    crypto::SecureMemoryHandle private_key_handle_;
    std::vector<uint8_t> public_key_;
    std::vector<uint8_t> signature_;
    std::optional<TimePoint> created_at_;
};
}
