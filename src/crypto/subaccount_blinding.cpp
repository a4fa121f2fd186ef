#include "swarmauth/crypto/subaccount_blinding.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "swarmauth/core/constants.hpp"
#include "swarmauth/core/format.hpp"
#include <sodium.h>
#include <array>

namespace swarmauth::protocol::crypto {
    namespace {
        const unsigned char* AsBytes(const std::string_view text) {
            return reinterpret_cast<const unsigned char*>(text.data());
        }

        Result<Unit, AuthFailure> CheckKey(
            const std::span<const uint8_t> key,
            const std::string_view name) {
            if (key.size() != kEd25519PublicKeyBytes) {
                return Result<Unit, AuthFailure>::Err(
                    AuthFailure::InvalidKeyLength(compat::format(
                        "{} must be {} bytes, got {}", name, kEd25519PublicKeyBytes, key.size())));
            }
            return Result<Unit, AuthFailure>::Ok(unit);
        }

        using Scalar = std::array<uint8_t, Constants::ED_25519_SCALAR_SIZE>;
        using WideScalar = std::array<uint8_t, Constants::ED_25519_NONREDUCED_SCALAR_SIZE>;
    }

    Result<std::vector<uint8_t>, AuthFailure> SubaccountBlinding::BlindFactor(
        const std::span<const uint8_t> owner_public_key,
        const std::span<const uint8_t> target_public_key) {
        if (auto check = CheckKey(owner_public_key, "Owner public key"); check.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(check.UnwrapErr());
        }
        if (auto check = CheckKey(target_public_key, "Target public key"); check.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(check.UnwrapErr());
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        WideScalar hash{};
        crypto_generichash_blake2b_state state;
        crypto_generichash_blake2b_init(&state, nullptr, 0, hash.size());
        crypto_generichash_blake2b_update(&state, owner_public_key.data(), owner_public_key.size());
        crypto_generichash_blake2b_update(&state, target_public_key.data(), target_public_key.size());
        crypto_generichash_blake2b_final(&state, hash.data(), hash.size());

        std::vector<uint8_t> factor(Constants::ED_25519_SCALAR_SIZE);
        crypto_core_ed25519_scalar_reduce(factor.data(), hash.data());
        return Result<std::vector<uint8_t>, AuthFailure>::Ok(std::move(factor));
    }

    Result<std::vector<uint8_t>, AuthFailure> SubaccountBlinding::BlindPublicKey(
        const std::span<const uint8_t> blind_factor,
        const std::span<const uint8_t> target_public_key) {
        if (blind_factor.size() != Constants::ED_25519_SCALAR_SIZE) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Blind factor must be {} bytes, got {}",
                    Constants::ED_25519_SCALAR_SIZE, blind_factor.size())));
        }
        if (auto check = CheckKey(target_public_key, "Target public key"); check.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(check.UnwrapErr());
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        std::vector<uint8_t> blinded(kEd25519PublicKeyBytes);
        if (crypto_scalarmult_ed25519_noclamp(
                blinded.data(), blind_factor.data(), target_public_key.data()) != SodiumConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::KeyDerivation(compat::format(
                    "{}: target key is not a valid prime-order point",
                    ErrorMessages::SCALARMULT_FAILED)));
        }
        return Result<std::vector<uint8_t>, AuthFailure>::Ok(std::move(blinded));
    }

    Result<std::vector<uint8_t>, AuthFailure> SubaccountBlinding::DeriveBlindedPublicKey(
        const std::span<const uint8_t> owner_public_key,
        const std::span<const uint8_t> target_public_key) {
        return BlindFactor(owner_public_key, target_public_key).Bind(
            [target_public_key](std::vector<uint8_t> factor) {
                return BlindPublicKey(factor, target_public_key);
            });
    }

    Result<std::vector<uint8_t>, AuthFailure> SubaccountBlinding::Sign(
        const models::Ed25519KeyPair& delegate,
        const std::span<const uint8_t> owner_public_key,
        const std::span<const uint8_t> message) {
        auto factor_result = BlindFactor(owner_public_key, delegate.GetPublicKeySpan());
        if (factor_result.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(factor_result.UnwrapErr());
        }
        const auto k = std::move(factor_result).Unwrap();
        auto blinded_result = BlindPublicKey(k, delegate.GetPublicKeySpan());
        if (blinded_result.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(blinded_result.UnwrapErr());
        }
        const auto kT = std::move(blinded_result).Unwrap();

        auto signed_result = delegate.WithSecretKey([&](std::span<const uint8_t> secret_key) {
            Scalar t{};
            Scalar kt{};
            Scalar hseed{};
            Scalar r{};
            WideScalar wide{};
            std::vector<uint8_t> signature(kEd25519SignatureBytes);
            uint8_t* R = signature.data();
            uint8_t* S = signature.data() + Constants::ED_25519_SCALAR_SIZE;

            // t is the clamped expanded scalar, so T = tB
            crypto_sign_ed25519_sk_to_curve25519(t.data(), secret_key.data());
            crypto_core_ed25519_scalar_mul(kt.data(), k.data(), t.data());

            crypto_generichash_blake2b(
                hseed.data(), hseed.size(),
                secret_key.data(), kEd25519SeedBytes,
                AsBytes(kBlindSeedHashKey), kBlindSeedHashKey.size());

            crypto_generichash_blake2b_state state;
            crypto_generichash_blake2b_init(
                &state, AsBytes(kBlindNonceHashKey), kBlindNonceHashKey.size(), wide.size());
            crypto_generichash_blake2b_update(&state, hseed.data(), hseed.size());
            crypto_generichash_blake2b_update(&state, kT.data(), kT.size());
            crypto_generichash_blake2b_update(&state, message.data(), message.size());
            crypto_generichash_blake2b_final(&state, wide.data(), wide.size());
            crypto_core_ed25519_scalar_reduce(r.data(), wide.data());

            if (crypto_scalarmult_ed25519_base_noclamp(R, r.data()) != SodiumConstants::SUCCESS) {
                sodium_memzero(t.data(), t.size());
                sodium_memzero(kt.data(), kt.size());
                sodium_memzero(hseed.data(), hseed.size());
                sodium_memzero(r.data(), r.size());
                return std::vector<uint8_t>{};
            }

            crypto_hash_sha512_state sha;
            crypto_hash_sha512_init(&sha);
            crypto_hash_sha512_update(&sha, R, Constants::ED_25519_SCALAR_SIZE);
            crypto_hash_sha512_update(&sha, kT.data(), kT.size());
            crypto_hash_sha512_update(&sha, message.data(), message.size());
            crypto_hash_sha512_final(&sha, wide.data());
            crypto_core_ed25519_scalar_reduce(S, wide.data());
            crypto_core_ed25519_scalar_mul(S, S, kt.data());
            crypto_core_ed25519_scalar_add(S, S, r.data());

            sodium_memzero(t.data(), t.size());
            sodium_memzero(kt.data(), kt.size());
            sodium_memzero(hseed.data(), hseed.size());
            sodium_memzero(r.data(), r.size());
            return signature;
        });
        if (signed_result.IsErr()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(signed_result.UnwrapErr());
        }
        auto signature = std::move(signed_result).Unwrap();
        if (signature.empty()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::Signing(std::string(ErrorMessages::SIGNING_FAILED)));
        }
        return Result<std::vector<uint8_t>, AuthFailure>::Ok(std::move(signature));
    }
}
