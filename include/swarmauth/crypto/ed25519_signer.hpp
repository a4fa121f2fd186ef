#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/models/key_materials/ed25519_key_pair.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace swarmauth::protocol::crypto {

/**
 * Detached Ed25519 signatures (RFC 8032, deterministic).
 *
 * The same key pair and message always produce the same 64 bytes, whether
 * the key belongs to the account owner or to a delegate.
 */
class Ed25519Signer {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> Sign(
        const models::Ed25519KeyPair& key_pair,
        std::span<const uint8_t> message);

    /// Signs with a raw 64-byte libsodium secret key
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> Sign(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> message);

    /// Standard padded base64 of Sign(), the `signature` field encoding
    [[nodiscard]] static Result<std::string, AuthFailure> SignBase64(
        const models::Ed25519KeyPair& key_pair,
        std::span<const uint8_t> message);

    /**
     * @return Ok(true) when the signature is valid, Ok(false) when it is not,
     *         InvalidKeyLength when key or signature has the wrong size
     */
    [[nodiscard]] static Result<bool, AuthFailure> Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    [[nodiscard]] static Result<bool, AuthFailure> VerifyBase64(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::string_view signature_base64);

private:
    Ed25519Signer() = delete;
};

}
