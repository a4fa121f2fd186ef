#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace swarmauth::protocol::models {
enum class KeyType : uint8_t {
    Ed25519,
    X25519
};
/**
 * Account identifier: network prefix followed by a 32-byte public key.
 * Rendered as 66 lowercase hex characters.
 */
class PublicKeyHandle {
public:
    [[nodiscard]] static Result<PublicKeyHandle, AuthFailure> Create(
        uint8_t prefix,
        std::span<const uint8_t> public_key,
        KeyType key_type);
    [[nodiscard]] static Result<PublicKeyHandle, AuthFailure> FromHex(
        std::string_view identifier_hex,
        KeyType key_type);
    [[nodiscard]] uint8_t GetPrefix() const noexcept { return prefix_; }
    [[nodiscard]] KeyType GetKeyType() const noexcept { return key_type_; }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] std::vector<uint8_t> ToBytes() const;
    [[nodiscard]] std::string ToHex() const;
    bool operator==(const PublicKeyHandle& other) const = default;
private:
    PublicKeyHandle(uint8_t prefix, std::vector<uint8_t> public_key, KeyType key_type);
    uint8_t prefix_;
    std::vector<uint8_t> public_key_;
    KeyType key_type_;
};
}
