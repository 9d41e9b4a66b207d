#pragma once
#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/crypto/secure_memory_handle.hpp"
#include "keys/key_records.pb.h"
#include <cstdint>
#include <span>
#include <vector>
namespace sigkeep::models {
/**
 * @brief The device's long-term Ed25519 identity and its registration id.
 *
 * Move-only. The secret half never leaves secure memory except while it is
 * being serialized for encrypted storage.
 */
class IdentityKeyPair {
public:
    IdentityKeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key,
        uint32_t registration_id);
    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;

    /**
     * @brief Fresh Ed25519 pair with a registration id in [1, 16380].
     */
    static Result<IdentityKeyPair, KeyStoreFailure> Generate();

    static Result<IdentityKeyPair, KeyStoreFailure> FromProto(
        const proto::keys::StoredIdentityKeyPair& stored);

    [[nodiscard]] Result<proto::keys::StoredIdentityKeyPair, KeyStoreFailure> ToProto(bool published) const;

    [[nodiscard]] Result<std::vector<uint8_t>, KeyStoreFailure> Sign(std::span<const uint8_t> message) const;

    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::vector<uint8_t> GetPublicKeyCopy() const {
        return public_key_;
    }
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept {
        return registration_id_;
    }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
    uint32_t registration_id_;
};
}
