#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
namespace swarmauth::protocol::models {
/**
 * Ed25519 signing key of one principal (account owner or delegate).
 *
 * The 64-byte secret key uses libsodium's layout, seed(32) || public(32),
 * and never leaves the guarded handle except through WithSecretKey.
 */
class Ed25519KeyPair {
public:
    Ed25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key) noexcept
        : secret_key_handle_(std::move(secret_key_handle)),
          public_key_(std::move(public_key)) {}
    Ed25519KeyPair(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::vector<uint8_t> GetPublicKeyCopy() const {
        return public_key_;
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKeySpan() const noexcept {
        return public_key_;
    }
    /// Runs func over the 64-byte secret key; sodium failures map to context
    template<typename F>
    auto WithSecretKey(F&& func, const AuthFailureType context = AuthFailureType::Signing) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, AuthFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto access = secret_key_handle_.WithReadAccess(std::forward<F>(func));
        if (access.IsErr()) {
            return Result<T, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(access.UnwrapErr(), context));
        }
        return Result<T, AuthFailure>::Ok(std::move(access).Unwrap());
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
