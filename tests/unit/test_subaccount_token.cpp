#include <catch2/catch_test_macros.hpp>
#include "swarmauth/delegation/subaccount_token.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "helpers/test_vectors.hpp"
#include <algorithm>
#include <type_traits>
#include <vector>

using namespace swarmauth::protocol;
using namespace swarmauth::protocol::delegation;
using swarmauth::protocol::configuration::ReservedPolicy;
namespace vectors = swarmauth::test;

TEST_CASE("SubaccountTokenCodec - Layout", "[delegation][token]") {
    const auto key = vectors::FromHex(vectors::kDelegatePublicKeyHex);

    SECTION("Encodes prefix, permissions, zero reserved bytes and key") {
        auto token = SubaccountTokenCodec::Encode(kTestnetPrefix, Permission::Read | Permission::Write, key);
        REQUIRE(token.IsOk());
        const auto& bytes = token.Unwrap();
        REQUIRE(bytes.size() == kSubaccountTokenBytes);
        REQUIRE(bytes[0] == 0x00);
        REQUIRE(bytes[1] == 0x03);
        REQUIRE(bytes[2] == 0x00);
        REQUIRE(bytes[3] == 0x00);
        REQUIRE(std::vector<uint8_t>(bytes.begin() + 4, bytes.end()) == key);
    }
    SECTION("Matches the pinned unblinded token") {
        auto token = SubaccountTokenCodec::Encode(0x00, 0x07, key);
        REQUIRE(crypto::SodiumInterop::ToHex(token.Unwrap()) == vectors::kUnblindedTokenHex);
    }
    SECTION("Every permission byte encodes to 36 bytes") {
        for (int permissions = 0x00; permissions <= 0xFF; ++permissions) {
            auto token = SubaccountTokenCodec::Encode(
                kMainnetPrefix, static_cast<uint8_t>(permissions), key);
            REQUIRE(token.IsOk());
            REQUIRE(token.Unwrap().size() == kSubaccountTokenBytes);
            REQUIRE(token.Unwrap()[1] == permissions);
        }
    }
    SECTION("Key of the wrong size is rejected") {
        for (const size_t size : {size_t{31}, size_t{33}}) {
            auto token = SubaccountTokenCodec::Encode(0x00, 0x01, std::vector<uint8_t>(size, 0x01));
            REQUIRE(token.IsErr());
            REQUIRE(token.UnwrapErr().type == AuthFailureType::InvalidKeyLength);
        }
    }
    SECTION("Caller-built token has a fixed-width key") {
        using KeyField = decltype(SubaccountToken::public_key);
        STATIC_REQUIRE(std::tuple_size_v<KeyField> == kEd25519PublicKeyBytes);
        STATIC_REQUIRE_FALSE(std::is_assignable_v<KeyField&, std::vector<uint8_t>>);

        SubaccountToken token;
        token.prefix = kMainnetPrefix;
        token.permissions = 0x01;
        std::copy(key.begin(), key.end(), token.public_key.begin());
        const auto bytes = token.ToBytes();
        REQUIRE(bytes.size() == kSubaccountTokenBytes);
        REQUIRE(bytes == SubaccountTokenCodec::Encode(kMainnetPrefix, 0x01, key).Unwrap());
    }
}

TEST_CASE("SubaccountTokenCodec - Decoding", "[delegation][token]") {
    const auto key = vectors::FromHex(vectors::kDelegatePublicKeyHex);

    SECTION("Decode inverts encode") {
        const uint8_t prefixes[] = {kTestnetPrefix, kMainnetPrefix};
        const uint8_t masks[] = {0x00, 0x01, 0x07, 0x0F, 0xFF};
        for (const uint8_t prefix : prefixes) {
            for (const uint8_t mask : masks) {
                auto encoded = SubaccountTokenCodec::Encode(prefix, mask, key).Unwrap();
                auto decoded = SubaccountTokenCodec::Decode(encoded);
                REQUIRE(decoded.IsOk());
                REQUIRE(decoded.Unwrap().prefix == prefix);
                REQUIRE(decoded.Unwrap().permissions == mask);
                REQUIRE(std::equal(key.begin(), key.end(), decoded.Unwrap().public_key.begin()));
                REQUIRE(decoded.Unwrap().ToBytes() == encoded);
            }
        }
    }
    SECTION("Hex decoding accepts the pinned token") {
        auto decoded = SubaccountTokenCodec::DecodeHex(vectors::kBlindedTokenHex);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().permissions == 0x03);
        REQUIRE(decoded.Unwrap().ToHex() == vectors::kBlindedTokenHex);
    }
    SECTION("35 and 37 bytes are malformed") {
        auto encoded = SubaccountTokenCodec::Encode(0x00, 0x01, key).Unwrap();
        auto truncated = std::vector<uint8_t>(encoded.begin(), encoded.end() - 1);
        REQUIRE(SubaccountTokenCodec::Decode(truncated).UnwrapErr().type == AuthFailureType::MalformedToken);
        encoded.push_back(0x00);
        REQUIRE(SubaccountTokenCodec::Decode(encoded).UnwrapErr().type == AuthFailureType::MalformedToken);
    }
    SECTION("Bad hex is malformed") {
        REQUIRE(SubaccountTokenCodec::DecodeHex("00").UnwrapErr().type == AuthFailureType::MalformedToken);
        REQUIRE(SubaccountTokenCodec::DecodeHex(std::string(72, 'x')).UnwrapErr().type ==
                AuthFailureType::MalformedToken);
    }
}

TEST_CASE("SubaccountTokenCodec - Reserved bytes", "[delegation][token]") {
    auto encoded = SubaccountTokenCodec::Encode(
        0x00, 0x01, vectors::FromHex(vectors::kDelegatePublicKeyHex)).Unwrap();
    encoded[kTokenReservedOffset + 1] = 0x01;

    SECTION("Strict decoding rejects non-zero reserved bytes") {
        auto decoded = SubaccountTokenCodec::Decode(encoded);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == AuthFailureType::ReservedBytesNonZero);
    }
    SECTION("Lenient decoding keeps them") {
        auto decoded = SubaccountTokenCodec::Decode(encoded, ReservedPolicy::Ignore);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().reserved[1] == 0x01);
        REQUIRE(decoded.Unwrap().ToBytes() == encoded);
    }
}

TEST_CASE("SubaccountTokenCodec - Permissions", "[delegation][token]") {
    SECTION("Bitmask membership") {
        STATIC_REQUIRE(SubaccountTokenCodec::HasPermission(0x07, Permission::Delete));
        STATIC_REQUIRE_FALSE(SubaccountTokenCodec::HasPermission(0x03, Permission::Delete));
        STATIC_REQUIRE(SubaccountTokenCodec::HasPermission(0x0F, Permission::AnyPrefix));
        STATIC_REQUIRE(SubaccountTokenCodec::HasPermission(0x03, Permission::Read | Permission::Write));
        STATIC_REQUIRE_FALSE(SubaccountTokenCodec::HasPermission(0x01, Permission::Read | Permission::Write));
    }
    SECTION("Authorize checks prefix before permissions") {
        SubaccountToken token;
        token.prefix = kTestnetPrefix;
        token.permissions = Permission::Read | Permission::Write;
        token.public_key.fill(0x01);

        REQUIRE(token.Authorize(kTestnetPrefix, static_cast<uint8_t>(Permission::Write)).IsOk());
        REQUIRE(token.Authorize(kTestnetPrefix, static_cast<uint8_t>(Permission::Delete)).UnwrapErr().type ==
                AuthFailureType::PermissionDenied);
        REQUIRE(token.Authorize(kMainnetPrefix, static_cast<uint8_t>(Permission::Delete)).UnwrapErr().type ==
                AuthFailureType::PrefixMismatch);

        token.permissions = token.permissions | Permission::AnyPrefix;
        REQUIRE(token.PrefixAllowed(kMainnetPrefix));
        REQUIRE(token.Authorize(kMainnetPrefix, static_cast<uint8_t>(Permission::Read)).IsOk());
    }
}
