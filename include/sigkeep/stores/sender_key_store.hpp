#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/interfaces/i_encrypted_storage.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigkeep::stores {

/**
 * @brief Group sender-key state per (group, sender, device).
 *
 * Storage keys length-prefix the group, so no two addresses share a key.
 * Records also carry their own address; a load whose record names another
 * address reports the key as absent.
 */
class SenderKeyStore {
public:
    explicit SenderKeyStore(interfaces::IEncryptedStorage& storage);

    SenderKeyStore(const SenderKeyStore&) = delete;
    SenderKeyStore& operator=(const SenderKeyStore&) = delete;

    Result<Unit, KeyStoreFailure> StoreSenderKey(
        std::string_view group_id, std::string_view sender, uint32_t device_id,
        std::span<const uint8_t> record);

    /**
     * @return The stored record, or nullopt when absent or unreadable
     */
    Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure> LoadSenderKey(
        std::string_view group_id, std::string_view sender, uint32_t device_id);

    Result<bool, KeyStoreFailure> ContainsSenderKey(
        std::string_view group_id, std::string_view sender, uint32_t device_id);

    Result<Unit, KeyStoreFailure> RemoveSenderKey(
        std::string_view group_id, std::string_view sender, uint32_t device_id);

    /**
     * @return Number of records removed
     */
    Result<size_t, KeyStoreFailure> ClearGroup(std::string_view group_id);

    Result<std::vector<std::string>, KeyStoreFailure> ListGroups();

    Result<size_t, KeyStoreFailure> DeleteAllLocal();

private:
    interfaces::IEncryptedStorage& storage_;
};

} // namespace sigkeep::stores
