#include "sigkeep/stores/sender_key_store.hpp"
#include "sigkeep/core/constants.hpp"
#include "sigkeep/logging/logger.hpp"
#include "keys/key_records.pb.h"
#include "record_codec.hpp"

#include <algorithm>

namespace sigkeep::stores {

namespace {

constexpr std::string_view kComponent = "sender-key-store";

using StoredResult = Result<std::optional<proto::keys::StoredSenderKey>, KeyStoreFailure>;

// The group is length-prefixed; the device id follows the last separator.
std::string GroupKeyPrefix(std::string_view group_id) {
    std::string prefix(storage_keys::kSenderKeyPrefix);
    prefix.append(std::to_string(group_id.size())).append(":").append(group_id).append("_");
    return prefix;
}

std::string SenderKeyStorageKey(std::string_view group_id, std::string_view sender, const uint32_t device_id) {
    return detail::PeerDeviceKey(GroupKeyPrefix(group_id), sender, device_id);
}

bool AddressedTo(const proto::keys::StoredSenderKey& stored, std::string_view group_id, std::string_view sender,
                 const uint32_t device_id) {
    return stored.group_id() == group_id && stored.sender() == sender && stored.device_id() == device_id;
}

Result<Unit, KeyStoreFailure> ValidateAddress(std::string_view group_id, std::string_view sender) {
    if (group_id.empty() || sender.empty()) {
        return Result<Unit, KeyStoreFailure>::Err(
            KeyStoreFailure::InvalidInput("Sender key address needs a group and a sender"));
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

StoredResult LoadStored(interfaces::IEncryptedStorage& storage, const std::string& key) {
    auto purge = [&](const std::string& reason) {
        SIGKEEP_LOG_WARN(kComponent, "Purging unreadable sender key {} ({})", key, reason);
        if (auto deleted = storage.Delete(collections::kSenderKeys, key); deleted.IsErr()) {
            SIGKEEP_LOG_ERROR(kComponent, "Failed to purge sender key {}: {}", key, deleted.UnwrapErr().message);
        }
        return StoredResult::Ok(std::nullopt);
    };

    auto raw = storage.Get(collections::kSenderKeys, key);
    if (raw.IsErr()) {
        if (raw.UnwrapErr().IsCorruption()) {
            return purge(raw.UnwrapErr().message);
        }
        return StoredResult::Err(std::move(raw).UnwrapErr());
    }
    const auto& bytes = raw.Unwrap();
    if (!bytes.has_value()) {
        return StoredResult::Ok(std::nullopt);
    }
    auto parsed = detail::ParseRecord<proto::keys::StoredSenderKey>(*bytes, "sender key");
    if (parsed.IsErr()) {
        return purge(parsed.UnwrapErr().message);
    }
    return StoredResult::Ok(std::move(parsed).Unwrap());
}

} // namespace

SenderKeyStore::SenderKeyStore(interfaces::IEncryptedStorage& storage)
    : storage_(storage) {
}

Result<Unit, KeyStoreFailure> SenderKeyStore::StoreSenderKey(
    const std::string_view group_id, const std::string_view sender, const uint32_t device_id,
    const std::span<const uint8_t> record) {
    SIGKEEP_TRY(ValidateAddress(group_id, sender));
    proto::keys::StoredSenderKey stored;
    stored.set_group_id(std::string(group_id));
    stored.set_sender(std::string(sender));
    stored.set_device_id(device_id);
    stored.set_record(record.data(), record.size());
    auto bytes = detail::SerializeRecord(stored, "sender key");
    SIGKEEP_TRY(bytes);
    SIGKEEP_TRY(storage_.Put(collections::kSenderKeys, SenderKeyStorageKey(group_id, sender, device_id),
                             bytes.Unwrap()));
    SIGKEEP_LOG_TRACE(kComponent, "Stored sender key {}/{}:{}", group_id, sender, device_id);
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure> SenderKeyStore::LoadSenderKey(
    const std::string_view group_id, const std::string_view sender, const uint32_t device_id) {
    using RecordResult = Result<std::optional<std::vector<uint8_t>>, KeyStoreFailure>;
    SIGKEEP_TRY(ValidateAddress(group_id, sender));
    auto stored = LoadStored(storage_, SenderKeyStorageKey(group_id, sender, device_id));
    SIGKEEP_TRY(stored);
    const auto& message = stored.Unwrap();
    if (!message.has_value() || message->record().empty()) {
        return RecordResult::Ok(std::nullopt);
    }
    if (!AddressedTo(*message, group_id, sender, device_id)) {
        SIGKEEP_LOG_WARN(kComponent, "Sender key stored for {}/{}:{} answers a lookup for {}/{}:{}",
                         message->group_id(), message->sender(), message->device_id(), group_id, sender, device_id);
        return RecordResult::Ok(std::nullopt);
    }
    const auto& record = message->record();
    return RecordResult::Ok(std::vector<uint8_t>(record.begin(), record.end()));
}

Result<bool, KeyStoreFailure> SenderKeyStore::ContainsSenderKey(
    const std::string_view group_id, const std::string_view sender, const uint32_t device_id) {
    return LoadSenderKey(group_id, sender, device_id).Map(
        [](const std::optional<std::vector<uint8_t>>& record) {
            return record.has_value();
        });
}

Result<Unit, KeyStoreFailure> SenderKeyStore::RemoveSenderKey(
    const std::string_view group_id, const std::string_view sender, const uint32_t device_id) {
    SIGKEEP_TRY(ValidateAddress(group_id, sender));
    return storage_.Delete(collections::kSenderKeys, SenderKeyStorageKey(group_id, sender, device_id));
}

Result<size_t, KeyStoreFailure> SenderKeyStore::ClearGroup(const std::string_view group_id) {
    if (group_id.empty()) {
        return Result<size_t, KeyStoreFailure>::Err(KeyStoreFailure::InvalidInput("Group id is empty"));
    }
    auto keys = storage_.ListKeys(collections::kSenderKeys);
    SIGKEEP_TRY(keys);

    const auto prefix = GroupKeyPrefix(group_id);
    size_t removed = 0;
    for (const auto& key : keys.Unwrap()) {
        if (!key.starts_with(prefix)) {
            continue;
        }
        SIGKEEP_TRY(storage_.Delete(collections::kSenderKeys, key));
        ++removed;
    }
    SIGKEEP_LOG_INFO(kComponent, "Cleared {} sender keys of group {}", removed, group_id);
    return Result<size_t, KeyStoreFailure>::Ok(removed);
}

Result<std::vector<std::string>, KeyStoreFailure> SenderKeyStore::ListGroups() {
    auto keys = storage_.ListKeys(collections::kSenderKeys);
    SIGKEEP_TRY(keys);
    std::vector<std::string> groups;
    for (const auto& key : keys.Unwrap()) {
        auto stored = LoadStored(storage_, key);
        SIGKEEP_TRY(stored);
        if (stored.Unwrap().has_value()) {
            groups.push_back(stored.Unwrap()->group_id());
        }
    }
    std::sort(groups.begin(), groups.end());
    groups.erase(std::unique(groups.begin(), groups.end()), groups.end());
    return Result<std::vector<std::string>, KeyStoreFailure>::Ok(std::move(groups));
}

Result<size_t, KeyStoreFailure> SenderKeyStore::DeleteAllLocal() {
    auto keys = storage_.ListKeys(collections::kSenderKeys);
    SIGKEEP_TRY(keys);
    size_t removed = 0;
    for (const auto& key : keys.Unwrap()) {
        SIGKEEP_TRY(storage_.Delete(collections::kSenderKeys, key));
        ++removed;
    }
    SIGKEEP_LOG_INFO(kComponent, "Deleted {} local sender keys", removed);
    return Result<size_t, KeyStoreFailure>::Ok(removed);
}

} // namespace sigkeep::stores
