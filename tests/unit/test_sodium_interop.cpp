#include <catch2/catch_test_macros.hpp>
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/crypto/secure_memory_handle.hpp"
#include "sigkeep/core/constants.hpp"
#include <algorithm>
using namespace sigkeep;
using namespace sigkeep::crypto;

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe and Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe zeroes the buffer") {
        std::vector<uint8_t> buffer(100, 0xFF);
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe of an empty buffer is a no-op") {
        std::vector<uint8_t> buffer;
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(buffer.empty());
    }
    SECTION("Equal buffers compare equal") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different contents or sizes compare unequal") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        std::vector<uint8_t> c = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, c));
    }
    SECTION("Empty buffers are equal") {
        std::vector<uint8_t> a;
        std::vector<uint8_t> b;
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
}

TEST_CASE("SodiumInterop - Key Generation", "[sodium][crypto][keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("X25519 key pair has the expected sizes") {
        auto result = SodiumInterop::GenerateX25519KeyPair("test");
        REQUIRE(result.IsOk());
        auto [secret, public_key] = std::move(result).Unwrap();
        REQUIRE(secret.Size() == kX25519PrivateKeyBytes);
        REQUIRE(public_key.size() == kX25519PublicKeyBytes);
    }
    SECTION("X25519 key pairs are distinct") {
        auto first = SodiumInterop::GenerateX25519KeyPair("a");
        auto second = SodiumInterop::GenerateX25519KeyPair("b");
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap().second != second.Unwrap().second);
    }
    SECTION("Ed25519 secret embeds the public key") {
        auto result = SodiumInterop::GenerateEd25519KeyPair();
        REQUIRE(result.IsOk());
        auto [secret, public_key] = std::move(result).Unwrap();
        REQUIRE(secret.Size() == kEd25519SecretKeyBytes);
        auto secret_bytes = secret.ReadBytes();
        REQUIRE(secret_bytes.IsOk());
        const auto& bytes = secret_bytes.Unwrap();
        REQUIRE(std::vector<uint8_t>(bytes.begin() + 32, bytes.end()) == public_key);
    }
}

TEST_CASE("SodiumInterop - Detached Signatures", "[sodium][crypto][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = SodiumInterop::GenerateEd25519KeyPair();
    REQUIRE(pair.IsOk());
    auto [secret, public_key] = std::move(pair).Unwrap();
    const std::vector<uint8_t> message = {0x05, 0x10, 0x20, 0x30};

    SECTION("Signature verifies against the signing key") {
        auto signature = SodiumInterop::SignDetached(message, secret);
        REQUIRE(signature.IsOk());
        REQUIRE(signature.Unwrap().size() == kEd25519SignatureBytes);
        REQUIRE(SodiumInterop::VerifyDetached(signature.Unwrap(), message, public_key));
    }
    SECTION("Tampered message does not verify") {
        auto signature = SodiumInterop::SignDetached(message, secret);
        REQUIRE(signature.IsOk());
        auto tampered = message;
        tampered[0] ^= 0x01;
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(signature.Unwrap(), tampered, public_key));
    }
    SECTION("Wrong-length signature does not verify") {
        std::vector<uint8_t> short_signature(32, 0x00);
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(short_signature, message, public_key));
    }
    SECTION("Signing with a wrong-size key is rejected") {
        auto x25519 = SodiumInterop::GenerateX25519KeyPair("not a signing key");
        REQUIRE(x25519.IsOk());
        auto signature = SodiumInterop::SignDetached(message, x25519.Unwrap().first);
        REQUIRE(signature.IsErr());
        REQUIRE(signature.UnwrapErr().type == KeyStoreFailureType::InvalidInput);
    }
}

TEST_CASE("SodiumInterop - Fingerprints and Randomness", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Fingerprint is deterministic and 32 bytes") {
        const std::vector<uint8_t> key(32, 0x42);
        const auto first = SodiumInterop::Fingerprint(key);
        REQUIRE(first.size() == kFingerprintBytes);
        REQUIRE(first == SodiumInterop::Fingerprint(key));
    }
    SECTION("Different keys have different fingerprints") {
        REQUIRE(SodiumInterop::Fingerprint(std::vector<uint8_t>(32, 1)) !=
                SodiumInterop::Fingerprint(std::vector<uint8_t>(32, 2)));
    }
    SECTION("Random values stay in range") {
        for (int i = 0; i < 1000; ++i) {
            const auto value = SodiumInterop::GenerateRandomInRange(kMinRegistrationId, kMaxRegistrationId);
            REQUIRE(value >= kMinRegistrationId);
            REQUIRE(value <= kMaxRegistrationId);
        }
    }
    SECTION("Degenerate range returns the minimum") {
        REQUIRE(SodiumInterop::GenerateRandomInRange(7, 7) == 7);
        REQUIRE(SodiumInterop::GenerateRandomInRange(9, 3) == 9);
    }
}

TEST_CASE("SecureMemoryHandle - Ownership", "[sodium][crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("FromBytes round-trips its contents") {
        const std::vector<uint8_t> bytes = {9, 8, 7, 6};
        auto handle = SecureMemoryHandle::FromBytes(bytes);
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap().ReadBytes().Unwrap() == bytes);
    }
    SECTION("Moved-from handle is invalid") {
        auto handle = SecureMemoryHandle::Allocate(16);
        REQUIRE(handle.IsOk());
        auto owner = std::move(handle).Unwrap();
        SecureMemoryHandle target = std::move(owner);
        REQUIRE(owner.IsInvalid());
        REQUIRE_FALSE(target.IsInvalid());
        REQUIRE(target.Size() == 16);
    }
    SECTION("Default handle refuses read access") {
        SecureMemoryHandle empty;
        auto access = empty.WithReadAccess([](std::span<const uint8_t> data) { return data.size(); });
        REQUIRE(access.IsErr());
    }
}
