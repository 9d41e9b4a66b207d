#pragma once
#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/crypto/secure_memory_handle.hpp"
#include "keys/key_records.pb.h"
#include <cstdint>
#include <vector>
namespace sigkeep::models {
class PreKeyRecord {
public:
    PreKeyRecord(
        uint32_t id,
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key);
    PreKeyRecord(PreKeyRecord&&) noexcept = default;
    PreKeyRecord& operator=(PreKeyRecord&&) noexcept = default;
    PreKeyRecord(const PreKeyRecord&) = delete;
    PreKeyRecord& operator=(const PreKeyRecord&) = delete;

    static Result<PreKeyRecord, KeyStoreFailure> Generate(uint32_t id);

    static Result<PreKeyRecord, KeyStoreFailure> FromProto(const proto::keys::StoredPreKey& stored);

    [[nodiscard]] Result<proto::keys::StoredPreKey, KeyStoreFailure> ToProto() const;

    [[nodiscard]] uint32_t GetId() const noexcept {
        return id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetPrivateKeyHandle() const noexcept {
        return private_key_handle_;
    }
private:
    uint32_t id_;
    crypto::SecureMemoryHandle private_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
