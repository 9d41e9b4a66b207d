#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sigkeep {

inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;
inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kFingerprintBytes = 32;

// Registration ids share the 14-bit space used by the session protocol.
inline constexpr uint32_t kMinRegistrationId = 1;
inline constexpr uint32_t kMaxRegistrationId = 16380;

inline constexpr uint32_t kPrimaryDeviceId = 1;

namespace collections {
inline constexpr std::string_view kIdentity = "identity";
inline constexpr std::string_view kRemoteIdentities = "remote_identities";
inline constexpr std::string_view kPreKeys = "prekeys";
inline constexpr std::string_view kSignedPreKeys = "signed_prekeys";
inline constexpr std::string_view kSessions = "sessions";
inline constexpr std::string_view kSenderKeys = "sender_keys";
}

namespace storage_keys {
inline constexpr std::string_view kIdentityKeyPair = "identity_keypair";
inline constexpr std::string_view kRemoteIdentityPrefix = "identity_";
inline constexpr std::string_view kPreKeyPrefix = "prekey_";
inline constexpr std::string_view kSignedPreKeyPrefix = "signedprekey_";
inline constexpr std::string_view kSessionPrefix = "session_";
inline constexpr std::string_view kSenderKeyPrefix = "sender_key_";
}

namespace endpoints {
inline constexpr std::string_view kIdentity = "/signal/identity";
inline constexpr std::string_view kPreKey = "/signal/prekey";
inline constexpr std::string_view kPreKeyBatch = "/signal/prekeys/batch";
inline constexpr std::string_view kSignedPreKey = "/signal/signedprekey";
inline constexpr std::string_view kSignedPreKeys = "/signal/signedprekeys";
inline constexpr std::string_view kKeyStatus = "/signal/status/minimal";
inline constexpr std::string_view kWipeAllKeys = "/api/signal/keys";
}

namespace http_status {
inline constexpr int kOk = 200;
inline constexpr int kAccepted = 202;
}

inline constexpr std::string_view kSignedPreKeysResponseEvent = "signed_prekeys_response";

}
