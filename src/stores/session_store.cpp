#include "sigkeep/stores/session_store.hpp"
#include "sigkeep/core/constants.hpp"
#include "sigkeep/logging/logger.hpp"
#include "record_codec.hpp"

#include <algorithm>

namespace sigkeep::stores {

namespace {

constexpr std::string_view kComponent = "session-store";

Result<Unit, KeyStoreFailure> ValidatePeer(std::string_view peer) {
    if (peer.empty()) {
        return Result<Unit, KeyStoreFailure>::Err(KeyStoreFailure::InvalidInput("Peer name is empty"));
    }
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

std::string SessionKey(std::string_view peer, const uint32_t device_id) {
    return detail::PeerDeviceKey(storage_keys::kSessionPrefix, peer, device_id);
}

// "session_{peer}_{device}" -> (peer, device). Peer names may contain '_'.
std::optional<std::pair<std::string, uint32_t>> SplitSessionKey(std::string_view key) {
    if (!key.starts_with(storage_keys::kSessionPrefix)) {
        return std::nullopt;
    }
    key.remove_prefix(storage_keys::kSessionPrefix.size());
    const auto separator = key.rfind('_');
    if (separator == std::string_view::npos || separator == 0) {
        return std::nullopt;
    }
    const auto device = detail::ParseDecimal(key.substr(separator + 1));
    if (!device) {
        return std::nullopt;
    }
    return std::make_pair(std::string(key.substr(0, separator)), *device);
}

} // namespace

SessionStore::SessionStore(interfaces::IEncryptedStorage& storage, state::KeyHealthMonitor& health)
    : storage_(storage)
    , health_(health) {
}

Result<models::SessionRecord, KeyStoreFailure> SessionStore::LoadSession(
    const std::string_view peer, const uint32_t device_id) {
    SIGKEEP_TRY(ValidatePeer(peer));
    const auto key = SessionKey(peer, device_id);
    auto raw = storage_.Get(collections::kSessions, key);
    if (raw.IsErr()) {
        if (!raw.UnwrapErr().IsCorruption()) {
            return Result<models::SessionRecord, KeyStoreFailure>::Err(std::move(raw).UnwrapErr());
        }
        SIGKEEP_LOG_WARN(kComponent, "Session {}:{} is unreadable, discarding: {}",
                         peer, device_id, raw.UnwrapErr().message);
        if (auto deleted = storage_.Delete(collections::kSessions, key); deleted.IsErr()) {
            SIGKEEP_LOG_ERROR(kComponent, "Failed to discard session {}: {}", key, deleted.UnwrapErr().message);
        }
        RefreshCount();
        return Result<models::SessionRecord, KeyStoreFailure>::Ok(models::SessionRecord{});
    }
    auto bytes = std::move(raw).Unwrap();
    if (!bytes.has_value() || bytes->empty()) {
        return Result<models::SessionRecord, KeyStoreFailure>::Ok(models::SessionRecord{});
    }
    return Result<models::SessionRecord, KeyStoreFailure>::Ok(models::SessionRecord(std::move(*bytes)));
}

Result<Unit, KeyStoreFailure> SessionStore::StoreSession(
    const std::string_view peer, const uint32_t device_id, const models::SessionRecord& record) {
    SIGKEEP_TRY(ValidatePeer(peer));
    SIGKEEP_TRY(storage_.Put(collections::kSessions, SessionKey(peer, device_id), record.Serialized()));
    SIGKEEP_LOG_TRACE(kComponent, "Stored session {}:{} ({} bytes)", peer, device_id, record.Serialized().size());
    RefreshCount();
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<bool, KeyStoreFailure> SessionStore::ContainsSession(const std::string_view peer, const uint32_t device_id) {
    return LoadSession(peer, device_id).Map([](const models::SessionRecord& record) {
        return !record.IsEmpty();
    });
}

Result<Unit, KeyStoreFailure> SessionStore::DeleteSession(const std::string_view peer, const uint32_t device_id) {
    SIGKEEP_TRY(ValidatePeer(peer));
    SIGKEEP_TRY(storage_.Delete(collections::kSessions, SessionKey(peer, device_id)));
    SIGKEEP_LOG_DEBUG(kComponent, "Deleted session {}:{}", peer, device_id);
    RefreshCount();
    return Result<Unit, KeyStoreFailure>::Ok(unit);
}

Result<size_t, KeyStoreFailure> SessionStore::DeleteAllSessionsForPeer(const std::string_view peer) {
    auto devices = ListDevices(peer, true);
    SIGKEEP_TRY(devices);
    size_t removed = 0;
    for (const auto device_id : devices.Unwrap()) {
        SIGKEEP_TRY(storage_.Delete(collections::kSessions, SessionKey(peer, device_id)));
        ++removed;
    }
    SIGKEEP_LOG_INFO(kComponent, "Deleted {} sessions of {}", removed, peer);
    RefreshCount();
    return Result<size_t, KeyStoreFailure>::Ok(removed);
}

Result<size_t, KeyStoreFailure> SessionStore::DeleteAllSessions() {
    auto keys = storage_.ListKeys(collections::kSessions);
    SIGKEEP_TRY(keys);
    size_t removed = 0;
    for (const auto& key : keys.Unwrap()) {
        SIGKEEP_TRY(storage_.Delete(collections::kSessions, key));
        ++removed;
    }
    SIGKEEP_LOG_INFO(kComponent, "Deleted all {} sessions", removed);
    health_.UpdateCount(0);
    return Result<size_t, KeyStoreFailure>::Ok(removed);
}

Result<std::vector<uint32_t>, KeyStoreFailure> SessionStore::ListDevices(
    const std::string_view peer, const bool include_primary) {
    SIGKEEP_TRY(ValidatePeer(peer));
    auto keys = storage_.ListKeys(collections::kSessions);
    SIGKEEP_TRY(keys);

    std::string prefix(storage_keys::kSessionPrefix);
    prefix.append(peer).append("_");
    std::vector<uint32_t> devices;
    for (const auto& key : keys.Unwrap()) {
        // ParseIdSuffix rejects "session_alice_bob_2" when listing "alice".
        const auto device_id = detail::ParseIdSuffix(key, prefix);
        if (!device_id) {
            continue;
        }
        if (!include_primary && *device_id == kPrimaryDeviceId) {
            continue;
        }
        devices.push_back(*device_id);
    }
    std::sort(devices.begin(), devices.end());
    return Result<std::vector<uint32_t>, KeyStoreFailure>::Ok(std::move(devices));
}

Result<std::vector<std::string>, KeyStoreFailure> SessionStore::ListPeers() {
    auto keys = storage_.ListKeys(collections::kSessions);
    SIGKEEP_TRY(keys);
    std::vector<std::string> peers;
    for (const auto& key : keys.Unwrap()) {
        if (auto split = SplitSessionKey(key)) {
            peers.push_back(std::move(split->first));
        }
    }
    std::sort(peers.begin(), peers.end());
    peers.erase(std::unique(peers.begin(), peers.end()), peers.end());
    return Result<std::vector<std::string>, KeyStoreFailure>::Ok(std::move(peers));
}

Result<size_t, KeyStoreFailure> SessionStore::SessionCount() {
    return storage_.ListKeys(collections::kSessions).Map([](const std::vector<std::string>& keys) {
        return static_cast<size_t>(std::count_if(keys.begin(), keys.end(), [](const std::string& key) {
            return SplitSessionKey(key).has_value();
        }));
    });
}

void SessionStore::RefreshCount() {
    if (auto count = SessionCount(); count.IsOk()) {
        health_.UpdateCount(count.Unwrap());
    }
}

} // namespace sigkeep::stores
