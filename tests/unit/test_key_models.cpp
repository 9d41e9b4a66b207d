#include <catch2/catch_test_macros.hpp>
#include "sigkeep/models/keys/identity_key_pair.hpp"
#include "sigkeep/models/keys/pre_key_record.hpp"
#include "sigkeep/models/keys/signed_pre_key_record.hpp"
#include "sigkeep/models/cleanup_report.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "sigkeep/core/constants.hpp"
#include <chrono>
using namespace sigkeep;
using namespace sigkeep::models;
using crypto::SodiumInterop;

TEST_CASE("IdentityKeyPair - Generation and Persistence", "[models][identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto generated = IdentityKeyPair::Generate();
    REQUIRE(generated.IsOk());
    auto identity = std::move(generated).Unwrap();

    SECTION("Registration id is in range") {
        REQUIRE(identity.GetRegistrationId() >= kMinRegistrationId);
        REQUIRE(identity.GetRegistrationId() <= kMaxRegistrationId);
        REQUIRE(identity.GetPublicKey().size() == kEd25519PublicKeyBytes);
    }
    SECTION("Stored form restores the same key and flag") {
        auto stored = identity.ToProto(true);
        REQUIRE(stored.IsOk());
        REQUIRE(stored.Unwrap().published());
        auto restored = IdentityKeyPair::FromProto(stored.Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetPublicKey() == identity.GetPublicKey());
        REQUIRE(restored.Unwrap().GetRegistrationId() == identity.GetRegistrationId());
    }
    SECTION("Signatures verify against the public key") {
        const std::vector<uint8_t> message = {1, 2, 3};
        auto signature = identity.Sign(message);
        REQUIRE(signature.IsOk());
        REQUIRE(SodiumInterop::VerifyDetached(signature.Unwrap(), message, identity.GetPublicKey()));
    }
    SECTION("Swapped public key is corruption") {
        auto stored = identity.ToProto(false).Unwrap();
        auto other = IdentityKeyPair::Generate().Unwrap();
        stored.set_public_key(other.GetPublicKey().data(), other.GetPublicKey().size());
        auto restored = IdentityKeyPair::FromProto(stored);
        REQUIRE(restored.IsErr());
        REQUIRE(restored.UnwrapErr().IsCorruption());
    }
    SECTION("Registration id out of range is corruption") {
        auto stored = identity.ToProto(false).Unwrap();
        stored.set_registration_id(kMaxRegistrationId + 1);
        REQUIRE(IdentityKeyPair::FromProto(stored).UnwrapErr().IsCorruption());
        stored.set_registration_id(0);
        REQUIRE(IdentityKeyPair::FromProto(stored).UnwrapErr().IsCorruption());
    }
    SECTION("Truncated secret is corruption") {
        auto stored = identity.ToProto(false).Unwrap();
        stored.set_secret_key(std::string(10, 'x'));
        REQUIRE(IdentityKeyPair::FromProto(stored).UnwrapErr().IsCorruption());
    }
}

TEST_CASE("PreKeyRecord - Generation and Persistence", "[models][prekey]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto generated = PreKeyRecord::Generate(42);
    REQUIRE(generated.IsOk());
    const auto& record = generated.Unwrap();

    SECTION("Carries its id and an X25519 public key") {
        REQUIRE(record.GetId() == 42);
        REQUIRE(record.GetPublicKey().size() == kX25519PublicKeyBytes);
        REQUIRE(record.GetPrivateKeyHandle().Size() == kX25519PrivateKeyBytes);
    }
    SECTION("Stored form restores the same key") {
        auto stored = record.ToProto();
        REQUIRE(stored.IsOk());
        auto restored = PreKeyRecord::FromProto(stored.Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetId() == 42);
        REQUIRE(restored.Unwrap().GetPublicKey() == record.GetPublicKey());
    }
    SECTION("Wrong key size is corruption") {
        auto stored = record.ToProto().Unwrap();
        stored.set_public_key(std::string(5, 'x'));
        REQUIRE(PreKeyRecord::FromProto(stored).UnwrapErr().IsCorruption());
    }
    SECTION("Public key from another pair is corruption") {
        auto stored = record.ToProto().Unwrap();
        auto other = PreKeyRecord::Generate(43).Unwrap();
        stored.set_public_key(other.GetPublicKey().data(), other.GetPublicKey().size());
        auto restored = PreKeyRecord::FromProto(stored);
        REQUIRE(restored.IsErr());
        REQUIRE(restored.UnwrapErr().type == KeyStoreFailureType::StorageCorruption);
    }
    SECTION("Derived public key matches the generated one") {
        auto derived = SodiumInterop::DeriveX25519PublicKey(record.GetPrivateKeyHandle());
        REQUIRE(derived.IsOk());
        REQUIRE(derived.Unwrap() == record.GetPublicKey());
    }
}

TEST_CASE("SignedPreKeyRecord - Signing and Timestamps", "[models][signed-prekey]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    const SignedPreKeyRecord::TimePoint created_at{std::chrono::seconds(1'700'000'000)};
    auto generated = SignedPreKeyRecord::Generate(3, identity, created_at);
    REQUIRE(generated.IsOk());
    const auto& record = generated.Unwrap();

    SECTION("Signature covers the public key") {
        REQUIRE(record.GetSignature().size() == kEd25519SignatureBytes);
        REQUIRE(record.VerifySignature(identity.GetPublicKey()));
    }
    SECTION("Signature fails against another identity") {
        auto other = IdentityKeyPair::Generate().Unwrap();
        REQUIRE_FALSE(record.VerifySignature(other.GetPublicKey()));
    }
    SECTION("Creation time survives persistence") {
        auto restored = SignedPreKeyRecord::FromProto(record.ToProto().Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetCreatedAt() == created_at);
        REQUIRE(restored.Unwrap().GetId() == 3);
    }
    SECTION("Missing creation time loads as unknown") {
        auto stored = record.ToProto().Unwrap();
        stored.set_created_at_ms(0);
        auto restored = SignedPreKeyRecord::FromProto(stored);
        REQUIRE(restored.IsOk());
        REQUIRE_FALSE(restored.Unwrap().GetCreatedAt().has_value());
    }
    SECTION("Short signature is corruption") {
        auto stored = record.ToProto().Unwrap();
        stored.set_signature(std::string(63, 'x'));
        REQUIRE(SignedPreKeyRecord::FromProto(stored).UnwrapErr().IsCorruption());
    }
}

TEST_CASE("CleanupReport - Summary", "[models][cascade]") {
    CleanupReport report;
    report.steps.push_back(CleanupStepOutcome{CleanupStep::LocalPreKeys, true, false, 4, {}});
    report.steps.push_back(CleanupStepOutcome{CleanupStep::LocalSenderKeys, false, true, 0, {}});

    SECTION("Skipped steps do not count as failures") {
        REQUIRE(report.FullyCleaned());
        REQUIRE(report.Published());
        REQUIRE(report.Find(CleanupStep::LocalPreKeys)->removed == 4);
        REQUIRE(report.Find(CleanupStep::LocalSessions) == nullptr);
    }
    SECTION("A failed step is reported") {
        report.steps.push_back(CleanupStepOutcome{CleanupStep::ServerKeyMaterial, false, false, 0, "HTTP 500"});
        REQUIRE_FALSE(report.FullyCleaned());
    }
    SECTION("Publication failure is reported") {
        report.publication_error = KeyStoreFailure::Network("offline");
        REQUIRE_FALSE(report.Published());
    }
}
