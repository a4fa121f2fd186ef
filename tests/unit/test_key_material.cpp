#include <catch2/catch_test_macros.hpp>
#include "swarmauth/identity/key_material.hpp"
#include "swarmauth/models/public_key_handle.hpp"
#include "swarmauth/models/key_materials/ed25519_key_pair.hpp"
#include "swarmauth/crypto/sodium_secure_memory_handle.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "helpers/test_vectors.hpp"
using namespace swarmauth::protocol;
using namespace swarmauth::protocol::identity;
using namespace swarmauth::protocol::models;
using swarmauth::protocol::crypto::SodiumInterop;
namespace vectors = swarmauth::test;

TEST_CASE("KeyMaterial - Seeded generation", "[identity][keys]") {
    const auto seed = vectors::FromHex(vectors::kOwnerSeedHex);

    SECTION("Known seed gives the known public key") {
        auto keys = KeyMaterial::Generate(seed);
        REQUIRE(keys.IsOk());
        REQUIRE(SodiumInterop::ToHex(keys.Unwrap().GetPublicKey()) == vectors::kOwnerPublicKeyHex);
    }
    SECTION("Same seed twice gives identical pairs") {
        auto first = KeyMaterial::Generate(seed).Unwrap();
        auto second = KeyMaterial::Generate(seed).Unwrap();
        REQUIRE(first.GetPublicKey() == second.GetPublicKey());
        REQUIRE(KeyMaterial::GetSeedCopy(first).Unwrap() == KeyMaterial::GetSeedCopy(second).Unwrap());
    }
    SECTION("Hex seed matches byte seed") {
        auto from_hex = KeyMaterial::GenerateFromSeedHex(vectors::kOwnerSeedHex).Unwrap();
        auto from_bytes = KeyMaterial::Generate(seed).Unwrap();
        REQUIRE(from_hex.GetPublicKey() == from_bytes.GetPublicKey());
    }
    SECTION("Seed is recoverable from the secret key") {
        auto keys = KeyMaterial::Generate(seed).Unwrap();
        REQUIRE(KeyMaterial::GetSeedCopy(keys).Unwrap() == seed);
    }
}

TEST_CASE("KeyMaterial - Seed validation", "[identity][keys]") {
    SECTION("31-byte seed is rejected") {
        const std::vector<uint8_t> seed(31, 0x11);
        auto result = KeyMaterial::Generate(seed);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == AuthFailureType::InvalidSeedLength);
    }
    SECTION("33-byte seed is rejected") {
        const std::vector<uint8_t> seed(33, 0x11);
        REQUIRE(KeyMaterial::Generate(seed).UnwrapErr().type == AuthFailureType::InvalidSeedLength);
    }
    SECTION("Non-hex seed string is a decode error") {
        auto result = KeyMaterial::GenerateFromSeedHex(std::string(64, 'g'));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == AuthFailureType::Decode);
    }
}

TEST_CASE("KeyMaterial - Random generation", "[identity][keys]") {
    auto first = KeyMaterial::Generate();
    auto second = KeyMaterial::Generate();
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap().GetPublicKey().size() == kEd25519PublicKeyBytes);
    REQUIRE(first.Unwrap().GetPublicKey() != second.Unwrap().GetPublicKey());
}

TEST_CASE("KeyMaterial - Secret key import", "[identity][keys]") {
    auto seed = vectors::FromHex(vectors::kOwnerSeedHex);
    auto public_key = vectors::FromHex(vectors::kOwnerPublicKeyHex);
    std::vector<uint8_t> secret_key = seed;
    secret_key.insert(secret_key.end(), public_key.begin(), public_key.end());

    SECTION("Seed || public key rebuilds the pair") {
        auto keys = KeyMaterial::FromSecretKey(secret_key);
        REQUIRE(keys.IsOk());
        REQUIRE(keys.Unwrap().GetPublicKey() == public_key);
    }
    SECTION("Mismatched public half is rejected") {
        secret_key.back() ^= 0x01;
        auto keys = KeyMaterial::FromSecretKey(secret_key);
        REQUIRE(keys.IsErr());
        REQUIRE(keys.UnwrapErr().type == AuthFailureType::KeyDerivation);
    }
    SECTION("Wrong length is rejected") {
        secret_key.pop_back();
        REQUIRE(KeyMaterial::FromSecretKey(secret_key).UnwrapErr().type ==
                AuthFailureType::InvalidKeyLength);
    }
}

TEST_CASE("Ed25519KeyPair - Secret handle ownership", "[identity][models]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto secret_key = vectors::FromHex(vectors::kOwnerSeedHex);
    const auto public_key = vectors::FromHex(vectors::kOwnerPublicKeyHex);
    secret_key.insert(secret_key.end(), public_key.begin(), public_key.end());

    auto handle = crypto::SecureMemoryHandle::Allocate(kEd25519SecretKeyBytes);
    REQUIRE(handle.IsOk());
    REQUIRE(handle.Unwrap().Write(secret_key).IsOk());

    Ed25519KeyPair pair(std::move(handle).Unwrap(), public_key);
    REQUIRE(pair.GetPublicKey() == public_key);

    Ed25519KeyPair moved(std::move(pair));
    auto copy = moved.WithSecretKey([](std::span<const uint8_t> sk) {
        return std::vector<uint8_t>(sk.begin(), sk.end());
    });
    REQUIRE(copy.IsOk());
    REQUIRE(copy.Unwrap() == secret_key);

    auto released = pair.WithSecretKey([](std::span<const uint8_t> sk) { return sk.size(); });
    REQUIRE(released.IsErr());
}

TEST_CASE("KeyMaterial - X25519 derivation", "[identity][keys][session]") {
    SECTION("Known Ed25519 key maps to the known X25519 key") {
        auto x25519 = KeyMaterial::DerivePublicKeyX25519(vectors::FromHex(vectors::kOwnerPublicKeyHex));
        REQUIRE(x25519.IsOk());
        REQUIRE(SodiumInterop::ToHex(x25519.Unwrap()) == vectors::kOwnerX25519Hex);
    }
    SECTION("Wrong length is rejected") {
        auto result = KeyMaterial::DerivePublicKeyX25519(std::vector<uint8_t>(31, 0x01));
        REQUIRE(result.UnwrapErr().type == AuthFailureType::InvalidKeyLength);
    }
    SECTION("Small-order point is rejected") {
        auto result = KeyMaterial::DerivePublicKeyX25519(std::vector<uint8_t>(32, 0x00));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == AuthFailureType::KeyDerivation);
    }
}

TEST_CASE("PublicKeyHandle - Account identifiers", "[identity][models]") {
    const auto public_key = vectors::FromHex(vectors::kOwnerPublicKeyHex);

    SECTION("Testnet identifier is 00 || key") {
        auto handle = PublicKeyHandle::Create(kTestnetPrefix, public_key, KeyType::Ed25519);
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap().ToHex() == "00" + std::string(vectors::kOwnerPublicKeyHex));
        REQUIRE(handle.Unwrap().ToBytes().size() == kAccountIdBytes);
    }
    SECTION("Identifier parses back") {
        const std::string id = "05" + std::string(vectors::kOwnerX25519Hex);
        auto handle = PublicKeyHandle::FromHex(id, KeyType::X25519);
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap().GetPrefix() == kMainnetPrefix);
        REQUIRE(handle.Unwrap().GetKeyType() == KeyType::X25519);
        REQUIRE(handle.Unwrap().ToHex() == id);
    }
    SECTION("Short key is rejected") {
        auto handle = PublicKeyHandle::Create(kTestnetPrefix, std::vector<uint8_t>(16, 1), KeyType::Ed25519);
        REQUIRE(handle.UnwrapErr().type == AuthFailureType::InvalidKeyLength);
    }
    SECTION("Identifier of the wrong length is rejected") {
        REQUIRE(PublicKeyHandle::FromHex("0011", KeyType::Ed25519).IsErr());
    }
}
