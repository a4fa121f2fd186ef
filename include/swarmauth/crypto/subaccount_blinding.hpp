#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/models/key_materials/ed25519_key_pair.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace swarmauth::protocol::crypto {

/**
 * Scalar blinding of delegate keys.
 *
 * Notation: owner public key O, delegate key pair (t, T = tB).
 *
 *   k  = BLAKE2b-512(O || T) mod L        blind factor
 *   Z  = kT                               key placed in the token
 *
 * The delegate signs with the scalar kt so that an ordinary Ed25519
 * verifier accepts the signature under Z:
 *
 *   r = H64(H32(seed, key="SubaccountSeed") || Z || M, key="SubaccountSig") mod L
 *   R = rB
 *   S = r + SHA512(R || Z || M) kt        (mod L)
 *
 * H64/H32 are keyed BLAKE2b. O is public in every request, so Z only hides
 * T from parties without a candidate T; anyone holding one can recompute Z.
 */
class SubaccountBlinding {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> BlindFactor(
        std::span<const uint8_t> owner_public_key,
        std::span<const uint8_t> target_public_key);

    /// Z = kT
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> BlindPublicKey(
        std::span<const uint8_t> blind_factor,
        std::span<const uint8_t> target_public_key);

    /// BlindPublicKey(BlindFactor(O, T), T)
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> DeriveBlindedPublicKey(
        std::span<const uint8_t> owner_public_key,
        std::span<const uint8_t> target_public_key);

    /// 64-byte signature by the delegate that verifies against Z
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> Sign(
        const models::Ed25519KeyPair& delegate,
        std::span<const uint8_t> owner_public_key,
        std::span<const uint8_t> message);

private:
    SubaccountBlinding() = delete;
};

}
