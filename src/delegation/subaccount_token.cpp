#include "swarmauth/delegation/subaccount_token.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/core/format.hpp"
#include "swarmauth/debug/signing_logger.hpp"
#include <algorithm>

namespace swarmauth::protocol::delegation {
    using crypto::SodiumInterop;
    using configuration::ReservedPolicy;

    std::vector<uint8_t> SubaccountToken::ToBytes() const {
        std::vector<uint8_t> bytes(kSubaccountTokenBytes, 0);
        bytes[kTokenPrefixOffset] = prefix;
        bytes[kTokenPermissionsOffset] = permissions;
        std::copy(reserved.begin(), reserved.end(), bytes.begin() + kTokenReservedOffset);
        std::copy(public_key.begin(), public_key.end(), bytes.begin() + kTokenPublicKeyOffset);
        return bytes;
    }

    std::string SubaccountToken::ToHex() const {
        return SodiumInterop::ToHex(ToBytes());
    }

    bool SubaccountToken::HasPermission(const Permission flag) const noexcept {
        return SubaccountTokenCodec::HasPermission(permissions, flag);
    }

    bool SubaccountToken::PrefixAllowed(const uint8_t network_prefix) const noexcept {
        return prefix == network_prefix || HasPermission(Permission::AnyPrefix);
    }

    Result<Unit, AuthFailure> SubaccountToken::Authorize(
        const uint8_t network_prefix,
        const uint8_t required) const {
        if (!PrefixAllowed(network_prefix)) {
            return Result<Unit, AuthFailure>::Err(
                AuthFailure::PrefixMismatch(compat::format(
                    "Token prefix {:02x} is not valid for account prefix {:02x}",
                    prefix, network_prefix)));
        }
        if (!SubaccountTokenCodec::HasPermission(permissions, required)) {
            return Result<Unit, AuthFailure>::Err(
                AuthFailure::PermissionDenied(compat::format(
                    "Token grants {:#04x}, operation needs {:#04x}", permissions, required)));
        }
        return Result<Unit, AuthFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, AuthFailure> SubaccountTokenCodec::Encode(
        const uint8_t prefix,
        const uint8_t permissions,
        const std::span<const uint8_t> target_public_key) {
        if (target_public_key.size() != kEd25519PublicKeyBytes) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Token key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, target_public_key.size())));
        }
        SubaccountToken token;
        token.prefix = prefix;
        token.permissions = permissions;
        std::copy(target_public_key.begin(), target_public_key.end(), token.public_key.begin());
        debug::LogTokenLayout(prefix, permissions, token.reserved, token.public_key);
        return Result<std::vector<uint8_t>, AuthFailure>::Ok(token.ToBytes());
    }

    Result<SubaccountToken, AuthFailure> SubaccountTokenCodec::Decode(
        const std::span<const uint8_t> token,
        const ReservedPolicy policy) {
        if (token.size() != kSubaccountTokenBytes) {
            return Result<SubaccountToken, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Token must be {} bytes, got {}", kSubaccountTokenBytes, token.size())));
        }
        SubaccountToken decoded;
        decoded.prefix = token[kTokenPrefixOffset];
        decoded.permissions = token[kTokenPermissionsOffset];
        decoded.reserved = {token[kTokenReservedOffset], token[kTokenReservedOffset + 1]};
        if (policy == ReservedPolicy::Strict &&
            (decoded.reserved[0] != 0 || decoded.reserved[1] != 0)) {
            return Result<SubaccountToken, AuthFailure>::Err(
                AuthFailure::ReservedBytesNonZero(compat::format(
                    "Reserved token bytes are {:02x}{:02x}",
                    decoded.reserved[0], decoded.reserved[1])));
        }
        auto key = token.subspan(kTokenPublicKeyOffset, kEd25519PublicKeyBytes);
        std::copy(key.begin(), key.end(), decoded.public_key.begin());
        return Result<SubaccountToken, AuthFailure>::Ok(std::move(decoded));
    }

    Result<SubaccountToken, AuthFailure> SubaccountTokenCodec::DecodeHex(
        const std::string_view token_hex,
        const ReservedPolicy policy) {
        if (token_hex.size() != kSubaccountTokenHexChars) {
            return Result<SubaccountToken, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Token must be {} hex characters, got {}",
                    kSubaccountTokenHexChars, token_hex.size())));
        }
        auto bytes = SodiumInterop::FromHex(token_hex);
        if (bytes.IsErr()) {
            return Result<SubaccountToken, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(bytes.UnwrapErr(), AuthFailureType::MalformedToken));
        }
        return Decode(bytes.Unwrap(), policy);
    }
}
