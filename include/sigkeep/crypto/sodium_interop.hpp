#pragma once

#include "sigkeep/core/result.hpp"
#include "sigkeep/core/failures.hpp"
#include "sigkeep/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace sigkeep::crypto {

class SecureMemoryHandle;

/**
 * @brief Thin libsodium layer used by the key models.
 *
 * Covers exactly what the lifecycle stores need: key pair generation,
 * detached Ed25519 signatures, fingerprints, randomness and guarded memory.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison. Buffers of different length are unequal.
     */
    static bool ConstantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept;

    /**
     * @brief Generate an X25519 key pair for pre-keys and signed pre-keys.
     *
     * @return Ok((secret handle, public key)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeyStoreFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Recompute the X25519 public key of a secret held in secure memory.
     */
    static Result<std::vector<uint8_t>, KeyStoreFailure> DeriveX25519PublicKey(
        const SecureMemoryHandle& x25519_secret_key);

    /**
     * @brief Generate an Ed25519 key pair for the device identity.
     *
     * The 64-byte libsodium secret key (seed || public) goes into the handle.
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeyStoreFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Produce a detached Ed25519 signature with a secret held in secure memory.
     */
    static Result<std::vector<uint8_t>, KeyStoreFailure> SignDetached(
        std::span<const uint8_t> message,
        const SecureMemoryHandle& ed25519_secret_key);

    /**
     * @brief Verify a detached Ed25519 signature.
     *
     * Wrong-length signatures or public keys verify as false.
     */
    static bool VerifyDetached(
        std::span<const uint8_t> signature,
        std::span<const uint8_t> message,
        std::span<const uint8_t> ed25519_public_key) noexcept;

    /**
     * @brief BLAKE2b-256 digest of a public key.
     */
    static std::vector<uint8_t> Fingerprint(std::span<const uint8_t> public_key);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform value in [min_value, max_value].
     */
    static uint32_t GenerateRandomInRange(uint32_t min_value, uint32_t max_value);

    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::once_flag init_flag_;
    static inline std::atomic<bool> initialized_{false};
};

} // namespace sigkeep::crypto
