#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/interfaces/i_encrypted_storage.hpp"
#include "sigkeep/models/session_record.hpp"
#include "sigkeep/state/key_health_monitor.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigkeep::stores {

/**
 * @brief Ratchet state per (peer, device), stored as opaque bytes.
 *
 * Loading never fails for a missing, empty or unreadable record: the
 * caller gets an empty SessionRecord and performs a fresh key exchange.
 * Unreadable records are purged on load.
 */
class SessionStore {
public:
    SessionStore(interfaces::IEncryptedStorage& storage, state::KeyHealthMonitor& health);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    Result<models::SessionRecord, KeyStoreFailure> LoadSession(std::string_view peer, uint32_t device_id);

    Result<Unit, KeyStoreFailure> StoreSession(
        std::string_view peer, uint32_t device_id, const models::SessionRecord& record);

    Result<bool, KeyStoreFailure> ContainsSession(std::string_view peer, uint32_t device_id);

    Result<Unit, KeyStoreFailure> DeleteSession(std::string_view peer, uint32_t device_id);

    /**
     * @return Number of sessions removed
     */
    Result<size_t, KeyStoreFailure> DeleteAllSessionsForPeer(std::string_view peer);

    /**
     * @return Number of sessions removed
     */
    Result<size_t, KeyStoreFailure> DeleteAllSessions();

    /**
     * @brief Ascending device ids with a stored session for the peer.
     *
     * @param include_primary false drops device 1 from the result
     */
    Result<std::vector<uint32_t>, KeyStoreFailure> ListDevices(std::string_view peer, bool include_primary);

    /**
     * @brief Distinct peers with at least one stored session, sorted.
     */
    Result<std::vector<std::string>, KeyStoreFailure> ListPeers();

    Result<size_t, KeyStoreFailure> SessionCount();

private:
    void RefreshCount();

    interfaces::IEncryptedStorage& storage_;
    state::KeyHealthMonitor& health_;
};

} // namespace sigkeep::stores
