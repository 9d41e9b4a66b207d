#include <catch2/catch_test_macros.hpp>
#include "sigkeep/api/key_server_api.hpp"
#include "sigkeep/crypto/sodium_interop.hpp"
#include "helpers/fake_key_server.hpp"
#include <chrono>
#include <string>
#include <vector>
using namespace sigkeep;
using namespace sigkeep::api;
using interfaces::HttpMethod;
using test_helpers::FakeKeyServer;
using namespace std::chrono_literals;

namespace {

configuration::PublicationPolicy ImmediatePolicy() {
    configuration::PublicationPolicy policy;
    policy.retry_delay = 0ms;
    policy.accepted_settle_delay = 0ms;
    return policy;
}

std::vector<models::PreKeyRecord> GeneratePreKeys(const uint32_t first, const uint32_t count) {
    std::vector<models::PreKeyRecord> keys;
    for (uint32_t id = first; id < first + count; ++id) {
        keys.push_back(models::PreKeyRecord::Generate(id).Unwrap());
    }
    return keys;
}

}

TEST_CASE("KeyServerApi - Uploads", "[api]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeKeyServer server;
    KeyServerApi api(server, ImmediatePolicy());

    SECTION("Identity upload carries key and registration id") {
        auto identity = models::IdentityKeyPair::Generate().Unwrap();
        REQUIRE(api.UploadIdentity(identity).IsOk());
        REQUIRE(server.IdentityKey() == identity.GetPublicKey());
        REQUIRE(server.RegistrationId() == identity.GetRegistrationId());
    }
    SECTION("Batch upload is a single request") {
        const auto keys = GeneratePreKeys(0, 10);
        REQUIRE(api.UploadPreKeyBatch(keys).IsOk());
        REQUIRE(server.CountRequests(HttpMethod::Post, "/signal/prekeys/batch") == 1);
        REQUIRE(server.PreKeyIds().size() == 10);
        REQUIRE(server.PreKey(7) == keys[7].GetPublicKey());
    }
    SECTION("Empty batch sends nothing") {
        REQUIRE(api.UploadPreKeyBatch({}).IsOk());
        REQUIRE(server.Requests().empty());
    }
    SECTION("Signed pre-key upload carries the signature") {
        auto identity = models::IdentityKeyPair::Generate().Unwrap();
        auto signed_pre_key = models::SignedPreKeyRecord::Generate(
            4, identity, std::chrono::system_clock::now()).Unwrap();
        REQUIRE(api.UploadSignedPreKey(signed_pre_key).IsOk());
        const auto stored = server.SignedPreKey(4);
        REQUIRE(stored.has_value());
        REQUIRE(stored->signature == signed_pre_key.GetSignature());
    }
}

TEST_CASE("KeyServerApi - Deletions and Listing", "[api]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeKeyServer server;
    KeyServerApi api(server, ImmediatePolicy());
    REQUIRE(api.UploadPreKeyBatch(GeneratePreKeys(0, 3)).IsOk());
    server.SeedSignedPreKey(1);
    server.SeedSignedPreKey(2);

    SECTION("Single pre-key deletion addresses the id") {
        REQUIRE(api.DeletePreKey(1).IsOk());
        REQUIRE(server.CountRequests(HttpMethod::Delete, "/signal/prekey/1") == 1);
        REQUIRE(server.PreKeyIds() == std::vector<uint32_t>{0, 2});
    }
    SECTION("Signed pre-key ids are listed") {
        auto ids = api.ListSignedPreKeyIds();
        REQUIRE(ids.IsOk());
        REQUIRE(ids.Unwrap() == std::vector<uint32_t>{1, 2});
        REQUIRE(api.DeleteSignedPreKey(1).IsOk());
        REQUIRE(api.ListSignedPreKeyIds().Unwrap() == std::vector<uint32_t>{2});
    }
    SECTION("Wipe removes everything") {
        REQUIRE(api.DeleteAllKeys().IsOk());
        REQUIRE(server.PreKeyIds().empty());
        REQUIRE(server.SignedPreKeyIds().empty());
    }
}

TEST_CASE("KeyServerApi - Key Status", "[api]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeKeyServer server;
    KeyServerApi api(server, ImmediatePolicy());

    SECTION("Empty server reports empty slots") {
        auto status = api.FetchKeyStatus();
        REQUIRE(status.IsOk());
        REQUIRE(status.Unwrap().identity_key.empty());
        REQUIRE(status.Unwrap().signed_pre_key.empty());
        REQUIRE(status.Unwrap().pre_key_fingerprints.empty());
        REQUIRE(server.CountRequests(HttpMethod::Get, "/signal/status/minimal") == 1);
    }
    SECTION("Published material is reported") {
        auto identity = models::IdentityKeyPair::Generate().Unwrap();
        const auto created_at = models::SignedPreKeyRecord::TimePoint{std::chrono::seconds(1'700'000'000)};
        auto signed_pre_key = models::SignedPreKeyRecord::Generate(4, identity, created_at).Unwrap();
        const auto pre_keys = GeneratePreKeys(10, 2);
        REQUIRE(api.UploadIdentity(identity).IsOk());
        REQUIRE(api.UploadSignedPreKey(signed_pre_key).IsOk());
        REQUIRE(api.UploadPreKeyBatch(pre_keys).IsOk());

        const auto status = api.FetchKeyStatus().Unwrap();
        REQUIRE(status.identity_key == identity.GetPublicKey());
        REQUIRE(status.signed_pre_key_id == 4);
        REQUIRE(status.signed_pre_key == signed_pre_key.GetPublicKey());
        REQUIRE(status.signed_pre_key_signature == signed_pre_key.GetSignature());
        REQUIRE(status.pre_key_fingerprints.size() == 2);
        REQUIRE(status.pre_key_fingerprints.at(11) ==
                logging::ToHex(crypto::SodiumInterop::Fingerprint(pre_keys[1].GetPublicKey())));
    }
    SECTION("Failures propagate as network errors") {
        server.FailNext(HttpMethod::Get, "/signal/status/minimal", 1, 503);
        auto status = api.FetchKeyStatus();
        REQUIRE(status.IsErr());
        REQUIRE(status.UnwrapErr().type == KeyStoreFailureType::Network);
    }
}

TEST_CASE("KeyServerApi - Status Handling", "[api]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeKeyServer server;

    SECTION("202 counts as success after the settle delay") {
        auto policy = ImmediatePolicy();
        policy.accepted_settle_delay = 20ms;
        KeyServerApi api(server, policy);
        server.SetSuccessStatus(202);

        const auto started = std::chrono::steady_clock::now();
        REQUIRE(api.DeletePreKey(5).IsOk());
        REQUIRE(std::chrono::steady_clock::now() - started >= 20ms);
    }
    SECTION("Other statuses are network failures") {
        KeyServerApi api(server, ImmediatePolicy());
        server.FailNext(HttpMethod::Delete, "/signal/prekey/5", 1, 404);
        auto result = api.DeletePreKey(5);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeyStoreFailureType::Network);
        REQUIRE(result.UnwrapErr().message.find("404") != std::string::npos);
    }
    SECTION("Transport errors are network failures") {
        KeyServerApi api(server, ImmediatePolicy());
        server.SetOffline(true);
        auto result = api.DeleteAllKeys();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeyStoreFailureType::Network);
    }
    SECTION("Single uploads do not retry") {
        KeyServerApi api(server, ImmediatePolicy());
        server.FailNext(HttpMethod::Post, "/signal/prekey", 1);
        const auto key = models::PreKeyRecord::Generate(9).Unwrap();
        REQUIRE(api.UploadPreKey(key).IsErr());
        REQUIRE(server.CountRequests(HttpMethod::Post, "/signal/prekey") == 1);
    }
    SECTION("Malformed list body is a decode failure") {
        // A 200 with a truncated varint cannot be parsed.
        class TruncatedBody : public interfaces::IKeyServerTransport {
        public:
            Result<interfaces::TransportResponse, KeyStoreFailure> Send(
                const interfaces::TransportRequest&) override {
                return Result<interfaces::TransportResponse, KeyStoreFailure>::Ok(
                    interfaces::TransportResponse{200, std::string("\x08\xff", 2)});
            }
        } transport;
        KeyServerApi decoding_api(transport, ImmediatePolicy());
        auto ids = decoding_api.ListSignedPreKeyIds();
        REQUIRE(ids.IsErr());
        REQUIRE(ids.UnwrapErr().type == KeyStoreFailureType::Decode);
    }
}

TEST_CASE("KeyServerApi - Batch Retries", "[api]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeKeyServer server;
    KeyServerApi api(server, ImmediatePolicy());
    const auto keys = GeneratePreKeys(0, 5);

    SECTION("Recovers within the attempt budget") {
        server.FailNext(HttpMethod::Post, "/signal/prekeys/batch", 2);
        REQUIRE(api.UploadPreKeyBatch(keys).IsOk());
        REQUIRE(server.CountRequests(HttpMethod::Post, "/signal/prekeys/batch") == 3);
        REQUIRE(server.PreKeyIds().size() == 5);
    }
    SECTION("Gives up after three attempts with a publication failure") {
        server.FailAlways(HttpMethod::Post, "/signal/prekeys/batch", 0);
        auto result = api.UploadPreKeyBatch(keys);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeyStoreFailureType::Publication);
        REQUIRE(server.CountRequests(HttpMethod::Post, "/signal/prekeys/batch") == 3);
        REQUIRE(server.PreKeyIds().empty());
    }
}
