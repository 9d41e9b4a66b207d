#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/crypto/secure_memory_handle.hpp"

#include <string>

namespace sigkeep::crypto {

namespace {

using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeyStoreFailure>;

} // namespace

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("sodium_init() failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

void SodiumInterop::SecureWipe(const std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

bool SodiumInterop::ConstantTimeEquals(
    const std::span<const uint8_t> a,
    const std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

KeyPairResult SodiumInterop::GenerateX25519KeyPair(const std::string_view key_purpose) {
    std::vector<uint8_t> secret(kX25519PrivateKeyBytes);
    std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
    if (crypto_box_keypair(public_key.data(), secret.data()) != 0) {
        SecureWipe(secret);
        return KeyPairResult::Err(KeyStoreFailure::KeyGeneration(
            "Failed to generate " + std::string(key_purpose) + " X25519 key pair"));
    }
    auto handle_result = SecureMemoryHandle::FromBytes(secret);
    SecureWipe(secret);
    if (handle_result.IsErr()) {
        return KeyPairResult::Err(KeyStoreFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(handle_result).Unwrap(), std::move(public_key)));
}

Result<std::vector<uint8_t>, KeyStoreFailure> SodiumInterop::DeriveX25519PublicKey(
    const SecureMemoryHandle& x25519_secret_key) {
    if (x25519_secret_key.Size() != kX25519PrivateKeyBytes) {
        return Result<std::vector<uint8_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::InvalidInput("X25519 secret key must be 32 bytes"));
    }
    std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
    auto derive_result = x25519_secret_key.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_scalarmult_base(public_key.data(), secret.data());
    });
    if (derive_result.IsErr()) {
        return Result<std::vector<uint8_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != 0) {
        return Result<std::vector<uint8_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::KeyGeneration("crypto_scalarmult_base failed"));
    }
    return Result<std::vector<uint8_t>, KeyStoreFailure>::Ok(std::move(public_key));
}

KeyPairResult SodiumInterop::GenerateEd25519KeyPair() {
    std::vector<uint8_t> secret(kEd25519SecretKeyBytes);
    std::vector<uint8_t> public_key(kEd25519PublicKeyBytes);
    if (crypto_sign_keypair(public_key.data(), secret.data()) != 0) {
        SecureWipe(secret);
        return KeyPairResult::Err(KeyStoreFailure::KeyGeneration(
            "Failed to generate Ed25519 identity key pair"));
    }
    auto handle_result = SecureMemoryHandle::FromBytes(secret);
    SecureWipe(secret);
    if (handle_result.IsErr()) {
        return KeyPairResult::Err(KeyStoreFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(handle_result).Unwrap(), std::move(public_key)));
}

Result<std::vector<uint8_t>, KeyStoreFailure> SodiumInterop::SignDetached(
    const std::span<const uint8_t> message,
    const SecureMemoryHandle& ed25519_secret_key) {
    if (ed25519_secret_key.Size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::InvalidInput("Ed25519 secret key must be 64 bytes"));
    }
    std::vector<uint8_t> signature(kEd25519SignatureBytes);
    auto sign_result = ed25519_secret_key.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_sign_detached(signature.data(), nullptr,
                                    message.data(), message.size(), secret.data());
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (sign_result.Unwrap() != 0) {
        return Result<std::vector<uint8_t>, KeyStoreFailure>::Err(
            KeyStoreFailure::KeyGeneration("crypto_sign_detached failed"));
    }
    return Result<std::vector<uint8_t>, KeyStoreFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    const std::span<const uint8_t> signature,
    const std::span<const uint8_t> message,
    const std::span<const uint8_t> ed25519_public_key) noexcept {
    if (signature.size() != kEd25519SignatureBytes ||
        ed25519_public_key.size() != kEd25519PublicKeyBytes) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       ed25519_public_key.data()) == 0;
}

std::vector<uint8_t> SodiumInterop::Fingerprint(const std::span<const uint8_t> public_key) {
    std::vector<uint8_t> digest(kFingerprintBytes);
    crypto_generichash(digest.data(), digest.size(), public_key.data(), public_key.size(),
                       nullptr, 0);
    return digest;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomInRange(const uint32_t min_value, const uint32_t max_value) {
    if (max_value <= min_value) {
        return min_value;
    }
    return min_value + randombytes_uniform(max_value - min_value + 1);
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace sigkeep::crypto
