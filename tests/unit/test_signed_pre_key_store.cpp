#include <catch2/catch_test_macros.hpp>
#include "helpers/store_harness.hpp"
#include "sigkeep/core/constants.hpp"
#include <chrono>
#include <string>
#include <vector>
using namespace sigkeep;
using interfaces::HttpMethod;
using test_helpers::StoreHarness;
using namespace std::chrono_literals;

namespace {

constexpr auto kWeek = std::chrono::hours(24 * 7);
const std::string kUploadPath(endpoints::kSignedPreKey);

}

TEST_CASE("SignedPreKeyStore - Initial Key", "[signed-prekeys]") {
    StoreHarness h;

    auto current = h.signed_pre_keys.GetCurrentSignedPreKey();
    REQUIRE(current.IsOk());

    SECTION("Starts at id 0, signed by the identity") {
        REQUIRE(current.Unwrap().GetId() == 0);
        const auto identity = h.identity.GetIdentityKeyPair().Unwrap();
        REQUIRE(current.Unwrap().VerifySignature(identity->GetPublicKey()));
        REQUIRE(current.Unwrap().GetCreatedAt() == h.clock.Now());
    }
    SECTION("Published and stored") {
        REQUIRE(h.server.SignedPreKeyIds() == std::vector<uint32_t>{0});
        REQUIRE(h.signed_pre_keys.ListSignedPreKeyIds().Unwrap() == std::vector<uint32_t>{0});
        REQUIRE(h.server.SignedPreKey(0)->public_key == current.Unwrap().GetPublicKey());
        REQUIRE(h.signed_pre_key_health.Snapshot().status == models::KeyHealthStatus::Healthy);
    }
    SECTION("Repeated calls return the same key") {
        auto again = h.signed_pre_keys.GetCurrentSignedPreKey();
        REQUIRE(again.Unwrap().GetId() == 0);
        REQUIRE(again.Unwrap().GetPublicKey() == current.Unwrap().GetPublicKey());
        REQUIRE(h.server.CountRequests(HttpMethod::Post, kUploadPath) == 1);
    }
}

TEST_CASE("SignedPreKeyStore - Rotation Schedule", "[signed-prekeys]") {
    StoreHarness h;
    REQUIRE(h.signed_pre_keys.GetCurrentSignedPreKey().IsOk());

    SECTION("Not due before the interval") {
        h.clock.Advance(kWeek - 1h);
        REQUIRE_FALSE(h.signed_pre_keys.NeedsRotation().Unwrap());
        REQUIRE(h.signed_pre_keys.GetCurrentSignedPreKey().Unwrap().GetId() == 0);
        REQUIRE(h.server.CountRequests(HttpMethod::Post, kUploadPath) == 1);
    }
    SECTION("Rotates once the interval has passed") {
        h.clock.Advance(kWeek + 1h);
        REQUIRE(h.signed_pre_keys.NeedsRotation().Unwrap());
        auto rotated = h.signed_pre_keys.GetCurrentSignedPreKey();
        REQUIRE(rotated.Unwrap().GetId() == 1);
        REQUIRE(h.server.SignedPreKeyIds() == std::vector<uint32_t>{0, 1});
        REQUIRE_FALSE(h.signed_pre_keys.NeedsRotation().Unwrap());
    }
    SECTION("Explicit rotation ignores the schedule") {
        auto rotated = h.signed_pre_keys.RotateSignedPreKey();
        REQUIRE(rotated.Unwrap().GetId() == 1);
    }
    SECTION("Failed rotation keeps serving the current key") {
        const auto original = h.server.SignedPreKey(0)->public_key;
        h.clock.Advance(kWeek + 1h);
        h.server.FailNext(HttpMethod::Post, kUploadPath, 1);
        auto current = h.signed_pre_keys.GetCurrentSignedPreKey();
        REQUIRE(current.IsOk());
        REQUIRE(current.Unwrap().GetId() == 0);
        REQUIRE(current.Unwrap().GetPublicKey() == original);
        REQUIRE(h.signed_pre_keys.ListSignedPreKeyIds().Unwrap() == std::vector<uint32_t>{0});

        const auto health = h.signed_pre_key_health.Snapshot();
        REQUIRE(health.status == models::KeyHealthStatus::Error);
        REQUIRE(health.last_error.has_value());
        REQUIRE(health.last_error->find("rotation failed") != std::string::npos);

        REQUIRE(h.signed_pre_keys.NeedsRotation().Unwrap());
        REQUIRE(h.signed_pre_keys.GetCurrentSignedPreKey().Unwrap().GetId() == 1);
    }
    SECTION("Explicit rotation still reports upload failures") {
        h.server.FailNext(HttpMethod::Post, kUploadPath, 1);
        REQUIRE(h.signed_pre_keys.RotateSignedPreKey().IsErr());
        REQUIRE(h.signed_pre_keys.ListSignedPreKeyIds().Unwrap() == std::vector<uint32_t>{0});
    }
}

TEST_CASE("SignedPreKeyStore - Retention", "[signed-prekeys]") {
    StoreHarness h;
    REQUIRE(h.signed_pre_keys.GetCurrentSignedPreKey().IsOk());
    for (int rotation = 0; rotation < 4; ++rotation) {
        h.clock.Advance(kWeek + 1h);
        REQUIRE(h.signed_pre_keys.GetCurrentSignedPreKey().IsOk());
    }

    SECTION("Three newest keys stay local") {
        REQUIRE(h.signed_pre_keys.ListSignedPreKeyIds().Unwrap() == std::vector<uint32_t>{2, 3, 4});
        REQUIRE(h.signed_pre_keys.LoadSignedPreKey(0).UnwrapErr().type == KeyStoreFailureType::NotFound);
        REQUIRE(h.signed_pre_key_health.Snapshot().key_count == 3);
    }
    SECTION("Two newest keys stay on the server") {
        REQUIRE(h.server.SignedPreKeyIds() == std::vector<uint32_t>{3, 4});
    }
    SECTION("Server list failure falls back to local ids") {
        h.server.FailNext(HttpMethod::Get, std::string(endpoints::kSignedPreKeys), 1);
        h.clock.Advance(kWeek + 1h);
        REQUIRE(h.signed_pre_keys.GetCurrentSignedPreKey().Unwrap().GetId() == 5);
        REQUIRE(h.server.SignedPreKeyIds() == std::vector<uint32_t>{4, 5});
    }
}

TEST_CASE("SignedPreKeyStore - Records Without Creation Time", "[signed-prekeys]") {
    StoreHarness h;
    auto identity = h.identity.GetIdentityKeyPair().Unwrap();
    auto legacy = models::SignedPreKeyRecord::Generate(5, *identity, h.clock.Now()).Unwrap();
    auto stored = legacy.ToProto().Unwrap();
    stored.set_created_at_ms(0);
    std::string bytes;
    REQUIRE(stored.SerializeToString(&bytes));
    h.storage.SetRaw(collections::kSignedPreKeys, "signedprekey_5", std::vector<uint8_t>(bytes.begin(), bytes.end()));

    SECTION("Is due immediately and rotates past its id") {
        REQUIRE(h.signed_pre_keys.NeedsRotation().Unwrap());
        auto current = h.signed_pre_keys.GetCurrentSignedPreKey();
        REQUIRE(current.Unwrap().GetId() == 6);
    }
}

TEST_CASE("SignedPreKeyStore - Server Validation", "[signed-prekeys]") {
    StoreHarness h;
    const auto original = h.signed_pre_keys.GetCurrentSignedPreKey().Unwrap().GetPublicKey();
    const auto advertised = *h.server.SignedPreKey(0);

    stores::RemoteSignedPreKeyStatus remote;
    remote.key_id = 0;
    remote.public_key = advertised.public_key;
    remote.signature = advertised.signature;

    SECTION("Matching key is accepted") {
        REQUIRE(h.signed_pre_keys.ValidateAgainstServer(remote).Unwrap());
        REQUIRE(h.server.CountRequests(HttpMethod::Post, kUploadPath) == 1);
    }
    SECTION("Tampered public key triggers regeneration") {
        remote.public_key[0] ^= 0xFF;
        h.clock.Advance(1s);
        REQUIRE_FALSE(h.signed_pre_keys.ValidateAgainstServer(remote).Unwrap());
        REQUIRE(h.server.CountRequests(HttpMethod::Post, kUploadPath) == 2);
        REQUIRE(h.server.SignedPreKey(0)->public_key != original);
    }
    SECTION("Truncated signature triggers regeneration") {
        remote.signature.resize(32);
        REQUIRE_FALSE(h.signed_pre_keys.ValidateAgainstServer(remote).Unwrap());
    }
    SECTION("Empty response triggers regeneration") {
        REQUIRE_FALSE(h.signed_pre_keys.ValidateAgainstServer(stores::RemoteSignedPreKeyStatus{}).Unwrap());
        REQUIRE(h.signed_pre_keys.LoadSignedPreKey(0).IsOk());
    }
    SECTION("Unknown key id triggers regeneration") {
        REQUIRE(h.signed_pre_keys.DeleteAllLocal().Unwrap() == 1);
        REQUIRE_FALSE(h.signed_pre_keys.ValidateAgainstServer(remote).Unwrap());
        REQUIRE(h.signed_pre_keys.ListSignedPreKeyIds().Unwrap() == std::vector<uint32_t>{0});
    }
}

TEST_CASE("SignedPreKeyStore - Corruption", "[signed-prekeys]") {
    StoreHarness h;
    REQUIRE(h.signed_pre_keys.GetCurrentSignedPreKey().IsOk());
    h.storage.MarkCorrupted(collections::kSignedPreKeys, "signedprekey_0");

    SECTION("Unreadable key is purged") {
        REQUIRE(h.signed_pre_keys.LoadSignedPreKey(0).UnwrapErr().type == KeyStoreFailureType::NotFound);
        REQUIRE_FALSE(h.storage.Contains(collections::kSignedPreKeys, "signedprekey_0"));
    }
    SECTION("Losing the only key regenerates id 0") {
        auto current = h.signed_pre_keys.GetCurrentSignedPreKey();
        REQUIRE(current.Unwrap().GetId() == 0);
        REQUIRE(h.server.CountRequests(HttpMethod::Post, kUploadPath) == 2);
    }
}
