#include <catch2/catch_test_macros.hpp>
#include "swarmauth/requests/request_builder.hpp"
#include "swarmauth/canonical/canonical_message_builder.hpp"
#include "swarmauth/crypto/ed25519_signer.hpp"
#include "swarmauth/identity/key_material.hpp"
#include "swarmauth/utilities/descriptor_codec.hpp"
#include "helpers/test_vectors.hpp"
#include <vector>

using namespace swarmauth::protocol;
using namespace swarmauth::protocol::canonical;
using namespace swarmauth::protocol::configuration;
using namespace swarmauth::protocol::crypto;
using namespace swarmauth::protocol::requests;
using namespace swarmauth::protocol::utilities;
namespace vectors = swarmauth::test;

namespace {
    bool OwnerSignatureValid(
        const OperationDescriptor& descriptor,
        const OperationKind kind,
        const OperationFields& fields,
        std::span<const uint8_t> owner_public_key) {
        if (!descriptor.signature.has_value()) {
            return false;
        }
        auto message = CanonicalMessageBuilder::Build(kind, fields);
        if (message.IsErr()) {
            return false;
        }
        auto valid = Ed25519Signer::VerifyBase64(owner_public_key, message.Unwrap(), *descriptor.signature);
        return valid.IsOk() && valid.Unwrap();
    }
}

TEST_CASE("Owner workflow - Message lifecycle", "[integration][owner]") {
    auto keys_result = identity::KeyMaterial::Generate();
    REQUIRE(keys_result.IsOk());
    const auto owner = std::move(keys_result).Unwrap();
    const RequestBuilder builder(ClientConfig::Testnet());
    const auto signer = RequestSigner::Owner(owner);
    const int64_t now = vectors::kTimestamp;
    const std::vector<std::string> hashes{"hash1", "hash2"};

    SECTION("Store then retrieve in a custom namespace") {
        auto store = builder.Store(signer, vectors::Bytes("payload"), 3'600'000, Namespace::Number(11), now);
        REQUIRE(store.IsOk());
        OperationFields fields;
        fields.ns = Namespace::Number(11);
        fields.timestamp = now;
        REQUIRE(OwnerSignatureValid(store.Unwrap(), OperationKind::Store, fields, owner.GetPublicKeySpan()));

        RetrieveOptions options;
        options.last_hash = "hash1";
        auto retrieve = builder.Retrieve(signer, Namespace::Number(11), now + 10, options);
        REQUIRE(retrieve.IsOk());
        fields.timestamp = now + 10;
        REQUIRE(OwnerSignatureValid(retrieve.Unwrap(), OperationKind::Retrieve, fields, owner.GetPublicKeySpan()));
    }

    SECTION("Expire, inspect and delete") {
        auto expire = builder.Expire(signer, hashes, now + 60'000, false, true);
        REQUIRE(expire.IsOk());
        OperationFields expire_fields;
        expire_fields.message_hashes = hashes;
        expire_fields.expiry = now + 60'000;
        expire_fields.extend = true;
        REQUIRE(OwnerSignatureValid(expire.Unwrap(), OperationKind::ExpireMsgs, expire_fields, owner.GetPublicKeySpan()));
        REQUIRE(expire.Unwrap().GetField<bool>("extend") == true);

        auto expiries = builder.GetExpiries(signer, hashes, now);
        REQUIRE(expiries.IsOk());
        OperationFields expiry_fields;
        expiry_fields.message_hashes = hashes;
        expiry_fields.timestamp = now;
        REQUIRE(OwnerSignatureValid(expiries.Unwrap(), OperationKind::GetExpiries, expiry_fields, owner.GetPublicKeySpan()));

        auto deleted = builder.Delete(signer, hashes);
        REQUIRE(deleted.IsOk());
        OperationFields delete_fields;
        delete_fields.message_hashes = hashes;
        REQUIRE(OwnerSignatureValid(deleted.Unwrap(), OperationKind::Delete, delete_fields, owner.GetPublicKeySpan()));
    }

    SECTION("Update, fetch and expire everything") {
        auto update = builder.Update(signer, {"hash1"}, vectors::Bytes("Hi"), now);
        REQUIRE(update.IsOk());
        REQUIRE(update.Unwrap().GetField<std::string>("data") == std::string("SGk="));
        OperationFields update_fields;
        update_fields.message_hashes = {"hash1"};
        update_fields.timestamp = now;
        update_fields.data = "SGk=";
        REQUIRE(OwnerSignatureValid(update.Unwrap(), OperationKind::Update, update_fields, owner.GetPublicKeySpan()));

        auto messages = builder.GetMessages(signer, now);
        REQUIRE(messages.IsOk());
        REQUIRE(messages.Unwrap().FindField("messages") == nullptr);
        REQUIRE(messages.Unwrap().fields.size() == 1);
        OperationFields message_fields;
        message_fields.timestamp = now;
        REQUIRE(OwnerSignatureValid(messages.Unwrap(), OperationKind::GetMessages, message_fields, owner.GetPublicKeySpan()));

        auto expire_all = builder.ExpireAll(signer, Namespace::All(), now);
        REQUIRE(expire_all.IsOk());
        REQUIRE(expire_all.Unwrap().GetField<std::string>("namespace") == std::string("all"));
        OperationFields expire_all_fields;
        expire_all_fields.ns = Namespace::All();
        expire_all_fields.expiry = now;
        REQUIRE(OwnerSignatureValid(expire_all.Unwrap(), OperationKind::ExpireAll, expire_all_fields, owner.GetPublicKeySpan()));
    }

    SECTION("Clean up by age") {
        auto before = builder.DeleteBefore(signer, Namespace::Number(4), now);
        REQUIRE(before.IsOk());
        OperationFields fields;
        fields.ns = Namespace::Number(4);
        fields.before = now;
        REQUIRE(OwnerSignatureValid(before.Unwrap(), OperationKind::DeleteBefore, fields, owner.GetPublicKeySpan()));

        auto all = builder.DeleteAll(signer, Namespace::Default(), now);
        REQUIRE(all.IsOk());
        OperationFields all_fields;
        all_fields.timestamp = now;
        REQUIRE(OwnerSignatureValid(all.Unwrap(), OperationKind::DeleteAll, all_fields, owner.GetPublicKeySpan()));
    }

    SECTION("Monitor subscription signs the account id") {
        auto monitor = builder.Monitor(signer, {0, 3}, true, now);
        REQUIRE(monitor.IsOk());
        auto identity = builder.ResolveIdentity(owner.GetPublicKeySpan());
        OperationFields fields;
        fields.timestamp = now;
        fields.account = identity.Unwrap().account_bytes;
        fields.namespaces = {0, 3};
        fields.want_data = true;
        REQUIRE(OwnerSignatureValid(monitor.Unwrap(), OperationKind::MonitorSubscribe, fields, owner.GetPublicKeySpan()));
    }

    SECTION("Revoked subaccount listing") {
        auto listing = builder.RevokedSubaccounts(owner, now);
        REQUIRE(listing.IsOk());
        REQUIRE(listing.Unwrap().method == "revoked_subaccounts");
        OperationFields fields;
        fields.timestamp = now;
        REQUIRE(OwnerSignatureValid(listing.Unwrap(), OperationKind::RevokedSubaccounts, fields, owner.GetPublicKeySpan()));
    }
}

TEST_CASE("Owner workflow - Requests survive the wire", "[integration][owner]") {
    const auto owner = vectors::OwnerKeys();
    const RequestBuilder builder(ClientConfig::SessionId());
    const auto signer = RequestSigner::Owner(owner);

    std::vector<OperationDescriptor> outgoing;
    outgoing.push_back(builder.Store(signer, vectors::Bytes("a"), 1000, Namespace::Default(), vectors::kTimestamp).Unwrap());
    outgoing.push_back(builder.Retrieve(signer, Namespace::Number(-10), vectors::kTimestamp).Unwrap());
    outgoing.push_back(builder.Delete(signer, {"h"}, true).Unwrap());
    outgoing.push_back(builder.Expire(signer, {"h"}, vectors::kTimestamp, true).Unwrap());
    outgoing.push_back(builder.GetSwarm(owner.GetPublicKeySpan()).Unwrap());

    for (const auto& descriptor : outgoing) {
        auto encoded = DescriptorCodec::EncodeDescriptor(descriptor);
        REQUIRE(encoded.IsOk());
        auto decoded = DescriptorCodec::DecodeDescriptor(encoded.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == descriptor);
    }

    REQUIRE(outgoing[0].signature == std::string(vectors::kStoreSignatureBase64));
    REQUIRE_FALSE(outgoing[1].IsSigned());
    REQUIRE(std::holds_alternative<SessionAuth>(outgoing[2].auth));
    REQUIRE(std::holds_alternative<PlainAuth>(outgoing[4].auth));
}
