#pragma once
#include <string>
#include <string_view>
namespace sigkeep {
enum class SodiumFailureType {
    InitializationFailed,
    AllocationFailed,
    BufferTooSmall,
    InvalidOperation,
    SignatureFailed
};
enum class KeyStoreFailureType {
    StorageCorruption,
    Storage,
    Publication,
    Network,
    IdentityMismatch,
    LockTimeout,
    KeyGeneration,
    InvalidInput,
    InvalidState,
    Decode,
    Encode,
    NotFound
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
    static SodiumFailure SignatureFailed(std::string msg) {
        return {SodiumFailureType::SignatureFailed, std::move(msg)};
    }
};
class KeyStoreFailure {
public:
    KeyStoreFailureType type;
    std::string message;
    KeyStoreFailure(const KeyStoreFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static KeyStoreFailure StorageCorruption(std::string msg) {
        return {KeyStoreFailureType::StorageCorruption, std::move(msg)};
    }
    static KeyStoreFailure Storage(std::string msg) {
        return {KeyStoreFailureType::Storage, std::move(msg)};
    }
    static KeyStoreFailure Publication(std::string msg) {
        return {KeyStoreFailureType::Publication, std::move(msg)};
    }
    static KeyStoreFailure Network(std::string msg) {
        return {KeyStoreFailureType::Network, std::move(msg)};
    }
    static KeyStoreFailure IdentityMismatch(std::string msg) {
        return {KeyStoreFailureType::IdentityMismatch, std::move(msg)};
    }
    static KeyStoreFailure LockTimeout(std::string msg) {
        return {KeyStoreFailureType::LockTimeout, std::move(msg)};
    }
    static KeyStoreFailure KeyGeneration(std::string msg) {
        return {KeyStoreFailureType::KeyGeneration, std::move(msg)};
    }
    static KeyStoreFailure InvalidInput(std::string msg) {
        return {KeyStoreFailureType::InvalidInput, std::move(msg)};
    }
    static KeyStoreFailure InvalidState(std::string msg) {
        return {KeyStoreFailureType::InvalidState, std::move(msg)};
    }
    static KeyStoreFailure Decode(std::string msg) {
        return {KeyStoreFailureType::Decode, std::move(msg)};
    }
    static KeyStoreFailure Encode(std::string msg) {
        return {KeyStoreFailureType::Encode, std::move(msg)};
    }
    static KeyStoreFailure NotFound(std::string msg) {
        return {KeyStoreFailureType::NotFound, std::move(msg)};
    }
    static KeyStoreFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::SignatureFailed) {
            return KeyGeneration(sf.message);
        }
        return InvalidState(sf.message);
    }
    [[nodiscard]] bool IsCorruption() const noexcept {
        return type == KeyStoreFailureType::StorageCorruption;
    }
};
inline std::string_view ToString(const KeyStoreFailureType type) noexcept {
    switch (type) {
        case KeyStoreFailureType::StorageCorruption: return "storage-corruption";
        case KeyStoreFailureType::Storage: return "storage";
        case KeyStoreFailureType::Publication: return "publication";
        case KeyStoreFailureType::Network: return "network";
        case KeyStoreFailureType::IdentityMismatch: return "identity-mismatch";
        case KeyStoreFailureType::LockTimeout: return "lock-timeout";
        case KeyStoreFailureType::KeyGeneration: return "key-generation";
        case KeyStoreFailureType::InvalidInput: return "invalid-input";
        case KeyStoreFailureType::InvalidState: return "invalid-state";
        case KeyStoreFailureType::Decode: return "decode";
        case KeyStoreFailureType::Encode: return "encode";
        case KeyStoreFailureType::NotFound: return "not-found";
    }
    return "unknown";
}
}
