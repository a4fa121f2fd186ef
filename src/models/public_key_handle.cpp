#include "swarmauth/models/public_key_handle.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/core/format.hpp"

namespace swarmauth::protocol::models {
    using crypto::SodiumInterop;

    PublicKeyHandle::PublicKeyHandle(
        const uint8_t prefix,
        std::vector<uint8_t> public_key,
        const KeyType key_type)
        : prefix_(prefix)
          , public_key_(std::move(public_key))
          , key_type_(key_type) {
    }

    Result<PublicKeyHandle, AuthFailure> PublicKeyHandle::Create(
        const uint8_t prefix,
        std::span<const uint8_t> public_key,
        const KeyType key_type) {
        if (public_key.size() != kEd25519PublicKeyBytes) {
            return Result<PublicKeyHandle, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Identifier key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, public_key.size())));
        }
        return Result<PublicKeyHandle, AuthFailure>::Ok(PublicKeyHandle(
            prefix,
            std::vector<uint8_t>(public_key.begin(), public_key.end()),
            key_type));
    }

    Result<PublicKeyHandle, AuthFailure> PublicKeyHandle::FromHex(
        const std::string_view identifier_hex,
        const KeyType key_type) {
        if (identifier_hex.size() != kAccountIdHexChars) {
            return Result<PublicKeyHandle, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Identifier must be {} hex characters, got {}",
                    kAccountIdHexChars, identifier_hex.size())));
        }
        auto decoded = SodiumInterop::FromHex(identifier_hex);
        if (decoded.IsErr()) {
            return Result<PublicKeyHandle, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(decoded.UnwrapErr(), AuthFailureType::Decode));
        }
        const auto& bytes = decoded.Unwrap();
        return Create(
            bytes[0],
            std::span<const uint8_t>(bytes).subspan(kNetworkPrefixBytes),
            key_type);
    }

    std::vector<uint8_t> PublicKeyHandle::ToBytes() const {
        std::vector<uint8_t> bytes;
        bytes.reserve(kAccountIdBytes);
        bytes.push_back(prefix_);
        bytes.insert(bytes.end(), public_key_.begin(), public_key_.end());
        return bytes;
    }

    std::string PublicKeyHandle::ToHex() const {
        return SodiumInterop::ToHex(ToBytes());
    }
}
