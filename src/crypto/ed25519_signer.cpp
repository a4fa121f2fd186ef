#include "swarmauth/crypto/ed25519_signer.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "swarmauth/core/format.hpp"
#include <sodium.h>

namespace swarmauth::protocol::crypto {
    Result<std::vector<uint8_t>, AuthFailure> Ed25519Signer::Sign(
        const std::span<const uint8_t> secret_key,
        const std::span<const uint8_t> message) {
        if (secret_key.size() != kEd25519SecretKeyBytes) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Secret key must be {} bytes, got {}",
                    kEd25519SecretKeyBytes, secret_key.size())));
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        std::vector<uint8_t> signature(crypto_sign_BYTES);
        unsigned long long sig_len = 0;
        const int result = crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            secret_key.data());
        if (result != SodiumConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::Signing(std::string(ErrorMessages::SIGNING_FAILED)));
        }
        if (sig_len != kEd25519SignatureBytes) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::Signing("Generated signature has incorrect size"));
        }
        return Result<std::vector<uint8_t>, AuthFailure>::Ok(std::move(signature));
    }

    Result<std::vector<uint8_t>, AuthFailure> Ed25519Signer::Sign(
        const models::Ed25519KeyPair& key_pair,
        const std::span<const uint8_t> message) {
        auto signed_result = key_pair.WithSecretKey([message](std::span<const uint8_t> secret_key) {
            return Sign(secret_key, message);
        });
        if (signed_result.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(signed_result.UnwrapErr());
        }
        return std::move(signed_result).Unwrap();
    }

    Result<std::string, AuthFailure> Ed25519Signer::SignBase64(
        const models::Ed25519KeyPair& key_pair,
        const std::span<const uint8_t> message) {
        return Sign(key_pair, message).Map([](std::vector<uint8_t> signature) {
            return SodiumInterop::ToBase64(signature);
        });
    }

    Result<bool, AuthFailure> Ed25519Signer::Verify(
        const std::span<const uint8_t> public_key,
        const std::span<const uint8_t> message,
        const std::span<const uint8_t> signature) {
        if (public_key.size() != kEd25519PublicKeyBytes) {
            return Result<bool, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Public key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, public_key.size())));
        }
        if (signature.size() != kEd25519SignatureBytes) {
            return Result<bool, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Signature must be {} bytes, got {}",
                    kEd25519SignatureBytes, signature.size())));
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<bool, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        const int result = crypto_sign_verify_detached(
            signature.data(),
            message.data(),
            message.size(),
            public_key.data());
        return Result<bool, AuthFailure>::Ok(result == SodiumConstants::SUCCESS);
    }

    Result<bool, AuthFailure> Ed25519Signer::VerifyBase64(
        const std::span<const uint8_t> public_key,
        const std::span<const uint8_t> message,
        const std::string_view signature_base64) {
        auto decoded = SodiumInterop::FromBase64(signature_base64);
        if (decoded.IsErr()) {
            return Result<bool, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(decoded.UnwrapErr(), AuthFailureType::Decode));
        }
        return Verify(public_key, message, decoded.Unwrap());
    }
}
