#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/models/key_materials/ed25519_key_pair.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace swarmauth::protocol::identity {
using protocol::Result;
using protocol::AuthFailure;
using models::Ed25519KeyPair;
class KeyMaterial {
public:
    /**
     * Fresh random Ed25519 key pair.
     */
    [[nodiscard]] static Result<Ed25519KeyPair, AuthFailure> Generate();
    /**
     * Deterministic key pair from a 32-byte seed. The same seed always
     * yields the same pair. Any other length is InvalidSeedLength.
     */
    [[nodiscard]] static Result<Ed25519KeyPair, AuthFailure> Generate(
        std::span<const uint8_t> seed);
    [[nodiscard]] static Result<Ed25519KeyPair, AuthFailure> GenerateFromSeedHex(
        std::string_view seed_hex);
    /**
     * Rebuilds a pair from a libsodium secret key (seed || public key).
     * The embedded public half must match the one derived from the seed.
     */
    [[nodiscard]] static Result<Ed25519KeyPair, AuthFailure> FromSecretKey(
        std::span<const uint8_t> secret_key);
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> DerivePublicKeyX25519(
        std::span<const uint8_t> ed25519_public_key);
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> GetSeedCopy(
        const Ed25519KeyPair& key_pair);
private:
    [[nodiscard]] static Result<Ed25519KeyPair, AuthFailure> WrapSecretKey(
        std::vector<uint8_t>& secret_key,
        std::vector<uint8_t> public_key);
};
}
