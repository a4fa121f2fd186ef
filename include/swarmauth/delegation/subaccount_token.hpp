#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/configuration/client_config.hpp"
#include "swarmauth/protocol/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace swarmauth::protocol::delegation {

enum class Permission : uint8_t {
    Read = kPermissionRead,
    Write = kPermissionWrite,
    Delete = kPermissionDelete,
    AnyPrefix = kPermissionAnyPrefix
};

[[nodiscard]] constexpr uint8_t operator|(const Permission a, const Permission b) noexcept {
    return static_cast<uint8_t>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr uint8_t operator|(const uint8_t mask, const Permission flag) noexcept {
    return static_cast<uint8_t>(mask | static_cast<uint8_t>(flag));
}

/**
 * Decoded delegation token.
 *
 * Wire layout, 36 bytes:
 *   [0]      network prefix
 *   [1]      permission bits (read, write, delete, any-prefix)
 *   [2..3]   reserved, zero
 *   [4..35]  token public key (blinded delegate key, or the raw key when unblinded)
 */
struct SubaccountToken {
    uint8_t prefix = 0;
    uint8_t permissions = 0;
    std::array<uint8_t, kTokenReservedBytes> reserved{};
    std::array<uint8_t, kEd25519PublicKeyBytes> public_key{};

    [[nodiscard]] std::vector<uint8_t> ToBytes() const;
    [[nodiscard]] std::string ToHex() const;

    [[nodiscard]] bool HasPermission(Permission flag) const noexcept;

    /// Token prefix matches the account's, or the token carries AnyPrefix
    [[nodiscard]] bool PrefixAllowed(uint8_t network_prefix) const noexcept;

    /// Prefix check first, then every bit of required must be granted
    [[nodiscard]] Result<Unit, AuthFailure> Authorize(
        uint8_t network_prefix,
        uint8_t required) const;

    bool operator==(const SubaccountToken& other) const = default;
};

class SubaccountTokenCodec {
public:
    /// InvalidKeyLength unless target_public_key is 32 bytes; output is always 36 bytes
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> Encode(
        uint8_t prefix,
        uint8_t permissions,
        std::span<const uint8_t> target_public_key);

    [[nodiscard]] static Result<SubaccountToken, AuthFailure> Decode(
        std::span<const uint8_t> token,
        configuration::ReservedPolicy policy = configuration::ReservedPolicy::Strict);

    [[nodiscard]] static Result<SubaccountToken, AuthFailure> DecodeHex(
        std::string_view token_hex,
        configuration::ReservedPolicy policy = configuration::ReservedPolicy::Strict);

    [[nodiscard]] static constexpr bool HasPermission(
        const uint8_t permissions,
        const uint8_t flag) noexcept {
        return (permissions & flag) == flag;
    }

    [[nodiscard]] static constexpr bool HasPermission(
        const uint8_t permissions,
        const Permission flag) noexcept {
        return HasPermission(permissions, static_cast<uint8_t>(flag));
    }

private:
    SubaccountTokenCodec() = delete;
};

}
