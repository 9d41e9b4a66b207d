#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/configuration/key_lifecycle_config.hpp"
#include "sigkeep/interfaces/i_key_server_transport.hpp"
#include "sigkeep/models/keys/identity_key_pair.hpp"
#include "sigkeep/models/keys/pre_key_record.hpp"
#include "sigkeep/models/keys/signed_pre_key_record.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace sigkeep::api {

/**
 * @brief Key material the server advertises for this device.
 *
 * Empty byte fields mean the server holds nothing for that slot.
 */
struct ServerKeyStatus {
    std::vector<uint8_t> identity_key;
    uint32_t signed_pre_key_id = 0;
    std::vector<uint8_t> signed_pre_key;
    std::vector<uint8_t> signed_pre_key_signature;
    std::map<uint32_t, std::string> pre_key_fingerprints;
};

/**
 * @brief Typed client for the key distribution endpoints.
 *
 * Payloads are protobuf messages serialized into the request body.
 * HTTP 200 and 202 are success; 202 additionally waits for the configured
 * settle delay. Any other status, or a transport error, is a Network failure.
 * Only UploadPreKeyBatch retries; when every attempt fails it returns a
 * Publication failure.
 */
class KeyServerApi {
public:
    KeyServerApi(interfaces::IKeyServerTransport& transport, configuration::PublicationPolicy policy);

    KeyServerApi(const KeyServerApi&) = delete;
    KeyServerApi& operator=(const KeyServerApi&) = delete;

    Result<Unit, KeyStoreFailure> UploadIdentity(const models::IdentityKeyPair& identity);

    Result<Unit, KeyStoreFailure> UploadPreKey(const models::PreKeyRecord& pre_key);

    Result<Unit, KeyStoreFailure> UploadPreKeyBatch(std::span<const models::PreKeyRecord> pre_keys);

    Result<Unit, KeyStoreFailure> DeletePreKey(uint32_t pre_key_id);

    Result<Unit, KeyStoreFailure> UploadSignedPreKey(const models::SignedPreKeyRecord& signed_pre_key);

    Result<Unit, KeyStoreFailure> DeleteSignedPreKey(uint32_t signed_pre_key_id);

    Result<std::vector<uint32_t>, KeyStoreFailure> ListSignedPreKeyIds();

    Result<ServerKeyStatus, KeyStoreFailure> FetchKeyStatus();

    /**
     * @brief Ask the server to drop every key published for this device.
     */
    Result<Unit, KeyStoreFailure> DeleteAllKeys();

private:
    Result<interfaces::TransportResponse, KeyStoreFailure> Execute(
        interfaces::HttpMethod method, std::string path, std::string body);

    interfaces::IKeyServerTransport& transport_;
    configuration::PublicationPolicy policy_;
};

} // namespace sigkeep::api
