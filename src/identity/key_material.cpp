#include "swarmauth/identity/key_material.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "swarmauth/core/constants.hpp"
#include "swarmauth/core/format.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/debug/signing_logger.hpp"
#include <sodium.h>

namespace swarmauth::protocol::identity {
    using crypto::SodiumInterop;
    using crypto::SecureMemoryHandle;

    namespace {
        Result<Unit, AuthFailure> EnsureSodium() {
            auto init = SodiumInterop::Initialize();
            if (init.IsErr()) {
                return Result<Unit, AuthFailure>::Err(
                    AuthFailure::FromSodiumFailure(init.UnwrapErr()));
            }
            return Result<Unit, AuthFailure>::Ok(unit);
        }
    }

    Result<Ed25519KeyPair, AuthFailure> KeyMaterial::WrapSecretKey(
        std::vector<uint8_t>& secret_key,
        std::vector<uint8_t> public_key) {
        auto handle_result = SecureMemoryHandle::Allocate(kEd25519SecretKeyBytes);
        if (handle_result.IsErr()) {
            SodiumInterop::SecureWipe(std::span(secret_key));
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        auto handle = std::move(handle_result).Unwrap();
        auto write_result = handle.Write(std::span<const uint8_t>(secret_key));
        SodiumInterop::SecureWipe(std::span(secret_key));
        if (write_result.IsErr()) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return Result<Ed25519KeyPair, AuthFailure>::Ok(
            Ed25519KeyPair(std::move(handle), std::move(public_key)));
    }

    Result<Ed25519KeyPair, AuthFailure> KeyMaterial::Generate() {
        if (auto init = EnsureSodium(); init.IsErr()) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(init.UnwrapErr());
        }
        std::vector<uint8_t> public_key(crypto_sign_PUBLICKEYBYTES);
        std::vector<uint8_t> secret_key(crypto_sign_SECRETKEYBYTES);
        if (crypto_sign_keypair(public_key.data(), secret_key.data()) != SodiumConstants::SUCCESS) {
            SodiumInterop::SecureWipe(std::span(secret_key));
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::KeyGeneration("Failed to generate Ed25519 keypair"));
        }
        SWARMAUTH_LOG_KEY(debug::Role::Any, "KEYGEN", "ed25519_public", public_key);
        return WrapSecretKey(secret_key, std::move(public_key));
    }

    Result<Ed25519KeyPair, AuthFailure> KeyMaterial::Generate(
        const std::span<const uint8_t> seed) {
        if (seed.size() != kEd25519SeedBytes) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::InvalidSeedLength(compat::format(
                    "Seed must be {} bytes, got {}", kEd25519SeedBytes, seed.size())));
        }
        if (auto init = EnsureSodium(); init.IsErr()) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(init.UnwrapErr());
        }
        std::vector<uint8_t> public_key(crypto_sign_PUBLICKEYBYTES);
        std::vector<uint8_t> secret_key(crypto_sign_SECRETKEYBYTES);
        if (crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data()) !=
            SodiumConstants::SUCCESS) {
            SodiumInterop::SecureWipe(std::span(secret_key));
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::KeyGeneration("Failed to generate Ed25519 keypair from seed"));
        }
        SWARMAUTH_LOG_KEY(debug::Role::Any, "KEYGEN", "ed25519_public (seeded)", public_key);
        return WrapSecretKey(secret_key, std::move(public_key));
    }

    Result<Ed25519KeyPair, AuthFailure> KeyMaterial::GenerateFromSeedHex(
        const std::string_view seed_hex) {
        auto decoded = SodiumInterop::FromHex(seed_hex);
        if (decoded.IsErr()) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(decoded.UnwrapErr(), AuthFailureType::Decode));
        }
        auto seed = std::move(decoded).Unwrap();
        auto result = Generate(std::span<const uint8_t>(seed));
        SodiumInterop::SecureWipe(std::span(seed));
        return result;
    }

    Result<Ed25519KeyPair, AuthFailure> KeyMaterial::FromSecretKey(
        const std::span<const uint8_t> secret_key) {
        if (secret_key.size() != kEd25519SecretKeyBytes) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Secret key must be {} bytes, got {}",
                    kEd25519SecretKeyBytes, secret_key.size())));
        }
        auto rebuilt = Generate(secret_key.first(kEd25519SeedBytes));
        if (rebuilt.IsErr()) {
            return rebuilt;
        }
        auto embedded_public = secret_key.subspan(kEd25519SeedBytes);
        auto matches = SodiumInterop::ConstantTimeEquals(
            embedded_public, rebuilt.Unwrap().GetPublicKeySpan());
        if (matches.IsErr()) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(matches.UnwrapErr(), AuthFailureType::KeyDerivation));
        }
        if (!matches.Unwrap()) {
            return Result<Ed25519KeyPair, AuthFailure>::Err(
                AuthFailure::KeyDerivation("Secret key public half does not match its seed"));
        }
        return rebuilt;
    }

    Result<std::vector<uint8_t>, AuthFailure> KeyMaterial::DerivePublicKeyX25519(
        const std::span<const uint8_t> ed25519_public_key) {
        if (ed25519_public_key.size() != kEd25519PublicKeyBytes) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Ed25519 public key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, ed25519_public_key.size())));
        }
        if (auto init = EnsureSodium(); init.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(init.UnwrapErr());
        }
        std::vector<uint8_t> x25519_public(kX25519PublicKeyBytes);
        if (crypto_sign_ed25519_pk_to_curve25519(
                x25519_public.data(), ed25519_public_key.data()) != SodiumConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::KeyDerivation("Ed25519 public key is not a valid curve point"));
        }
        return Result<std::vector<uint8_t>, AuthFailure>::Ok(std::move(x25519_public));
    }

    Result<std::vector<uint8_t>, AuthFailure> KeyMaterial::GetSeedCopy(
        const Ed25519KeyPair& key_pair) {
        return key_pair.WithSecretKey([](std::span<const uint8_t> secret_key) {
            std::vector<uint8_t> seed(kEd25519SeedBytes);
            crypto_sign_ed25519_sk_to_seed(seed.data(), secret_key.data());
            return seed;
        }, AuthFailureType::KeyDerivation);
    }
}
