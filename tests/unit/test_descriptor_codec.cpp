#include <catch2/catch_test_macros.hpp>
#include "swarmauth/utilities/descriptor_codec.hpp"
#include "swarmauth/requests/request_builder.hpp"
#include "helpers/test_vectors.hpp"

using namespace swarmauth::protocol;
using namespace swarmauth::protocol::requests;
using swarmauth::protocol::canonical::Namespace;
using swarmauth::protocol::configuration::ClientConfig;
using swarmauth::protocol::delegation::DelegationAuthority;
using swarmauth::protocol::delegation::DelegationCertificate;
using swarmauth::protocol::delegation::Permission;
using swarmauth::protocol::utilities::DescriptorCodec;
namespace vectors = swarmauth::test;

namespace {
    DelegationCertificate BlindedCertificate() {
        return DelegationCertificate{
            vectors::FromHex(vectors::kBlindedTokenHex),
            vectors::FromHex(vectors::kBlindedOwnerSignatureHex)
        };
    }

    void AppendBytesField(std::vector<uint8_t>& out, const uint8_t tag, const std::vector<uint8_t>& bytes) {
        out.push_back(tag);
        out.push_back(static_cast<uint8_t>(bytes.size()));
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
}

TEST_CASE("DescriptorCodec - Delegation grants", "[utilities][codec]") {
    const auto owner_pk = vectors::FromHex(vectors::kOwnerPublicKeyHex);
    const auto certificate = BlindedCertificate();

    SECTION("Grant survives encoding") {
        auto encoded = DescriptorCodec::EncodeGrant(certificate, owner_pk);
        REQUIRE(encoded.IsOk());
        auto decoded = DescriptorCodec::DecodeGrant(encoded.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().certificate.token == certificate.token);
        REQUIRE(decoded.Unwrap().certificate.owner_signature == certificate.owner_signature);
        REQUIRE(decoded.Unwrap().owner_public_key == owner_pk);
        REQUIRE(DelegationAuthority::VerifyCertificate(
            decoded.Unwrap().certificate, decoded.Unwrap().owner_public_key).Unwrap());
    }
    SECTION("Encoding refuses a short token") {
        auto short_certificate = certificate;
        short_certificate.token.pop_back();
        auto encoded = DescriptorCodec::EncodeGrant(short_certificate, owner_pk);
        REQUIRE(encoded.IsErr());
        REQUIRE(encoded.UnwrapErr().type == AuthFailureType::MalformedToken);
    }
    SECTION("Decoding a 35-byte token is MalformedToken") {
        std::vector<uint8_t> truncated_token(certificate.token.begin(), certificate.token.end() - 1);
        std::vector<uint8_t> wire{0x08, 0x01};
        AppendBytesField(wire, 0x12, truncated_token);
        AppendBytesField(wire, 0x1a, certificate.owner_signature);
        AppendBytesField(wire, 0x22, owner_pk);

        auto decoded = DescriptorCodec::DecodeGrant(wire);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == AuthFailureType::MalformedToken);
    }
    SECTION("Hand-encoded grant decodes") {
        std::vector<uint8_t> wire{0x08, 0x01};
        AppendBytesField(wire, 0x12, certificate.token);
        AppendBytesField(wire, 0x1a, certificate.owner_signature);
        AppendBytesField(wire, 0x22, owner_pk);
        REQUIRE(DescriptorCodec::EncodeGrant(certificate, owner_pk).Unwrap() == wire);
        REQUIRE(DescriptorCodec::DecodeGrant(wire).IsOk());
    }
    SECTION("Unknown grant version is rejected") {
        auto encoded = DescriptorCodec::EncodeGrant(certificate, owner_pk).Unwrap();
        REQUIRE(encoded[0] == 0x08);
        encoded[1] = 0x02;
        REQUIRE(DescriptorCodec::DecodeGrant(encoded).UnwrapErr().type == AuthFailureType::MalformedToken);
    }
    SECTION("Short owner key is rejected") {
        std::vector<uint8_t> wire{0x08, 0x01};
        AppendBytesField(wire, 0x12, certificate.token);
        AppendBytesField(wire, 0x1a, certificate.owner_signature);
        AppendBytesField(wire, 0x22, std::vector<uint8_t>(16, 0x01));
        REQUIRE(DescriptorCodec::DecodeGrant(wire).UnwrapErr().type == AuthFailureType::InvalidKeyLength);
    }
    SECTION("Garbage does not parse") {
        const std::vector<uint8_t> garbage{0xFF, 0xFF, 0xFF};
        REQUIRE(DescriptorCodec::DecodeGrant(garbage).UnwrapErr().type == AuthFailureType::Decode);
    }
}

TEST_CASE("DescriptorCodec - Signed requests", "[utilities][codec]") {
    const auto owner = vectors::OwnerKeys();
    const auto delegate = vectors::DelegateKeys();

    SECTION("Delegated request survives encoding") {
        const DelegationAuthority authority(ClientConfig::Testnet());
        const auto certificate = authority.CreateDelegation(
            owner, vectors::kDelegatePublicKeyHex, Permission::Read | Permission::Write, kTestnetPrefix).Unwrap();
        const RequestBuilder builder(ClientConfig::Testnet());
        auto request = builder.Store(
            RequestSigner::Delegate(delegate, certificate, owner.GetPublicKeySpan()),
            vectors::Bytes("payload"), 1000, Namespace::Number(7), vectors::kTimestamp);
        REQUIRE(request.IsOk());

        auto encoded = DescriptorCodec::EncodeDescriptor(request.Unwrap());
        REQUIRE(encoded.IsOk());
        auto decoded = DescriptorCodec::DecodeDescriptor(encoded.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == request.Unwrap());
    }
    SECTION("Session request keeps pubkey_ed25519 and list fields") {
        const RequestBuilder builder(ClientConfig::SessionId());
        auto request = builder.Monitor(RequestSigner::Owner(owner), {0, -10}, false, vectors::kTimestamp);
        REQUIRE(request.IsOk());
        auto decoded = DescriptorCodec::DecodeDescriptor(DescriptorCodec::EncodeDescriptor(request.Unwrap()).Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(std::get<SessionAuth>(decoded.Unwrap().auth).pubkey_ed25519 == vectors::kOwnerPublicKeyHex);
        REQUIRE(decoded.Unwrap() == request.Unwrap());
    }
    SECTION("Unsigned request stays unsigned") {
        const RequestBuilder builder(ClientConfig::Testnet());
        auto request = builder.GetSwarm(owner.GetPublicKeySpan()).Unwrap();
        auto decoded = DescriptorCodec::DecodeDescriptor(DescriptorCodec::EncodeDescriptor(request).Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE_FALSE(decoded.Unwrap().IsSigned());
        REQUIRE(decoded.Unwrap() == request);
    }
    SECTION("Request without a method is refused") {
        OperationDescriptor descriptor;
        descriptor.pubkey = "00";
        REQUIRE(DescriptorCodec::EncodeDescriptor(descriptor).UnwrapErr().type ==
                AuthFailureType::MissingRequiredField);
    }
    SECTION("Unknown canonical version is rejected") {
        const RequestBuilder builder(ClientConfig::Testnet());
        auto encoded = DescriptorCodec::EncodeDescriptor(builder.GetSwarm(owner.GetPublicKeySpan()).Unwrap()).Unwrap();
        REQUIRE(encoded[0] == 0x08);
        encoded[1] = 0x02;
        REQUIRE(DescriptorCodec::DecodeDescriptor(encoded).UnwrapErr().type ==
                AuthFailureType::UnsupportedOperation);
    }
    SECTION("Delegated auth with a short subaccount is malformed") {
        OperationDescriptor descriptor;
        descriptor.method = "store";
        descriptor.pubkey = "00";
        descriptor.signature = "c2ln";
        descriptor.auth = DelegatedAuth{"abcd", "c2ln", std::nullopt};
        auto encoded = DescriptorCodec::EncodeDescriptor(descriptor);
        REQUIRE(encoded.IsOk());
        REQUIRE(DescriptorCodec::DecodeDescriptor(encoded.Unwrap()).UnwrapErr().type ==
                AuthFailureType::MalformedToken);
    }
}
