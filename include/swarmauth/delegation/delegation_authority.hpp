#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/configuration/client_config.hpp"
#include "swarmauth/delegation/subaccount_token.hpp"
#include "swarmauth/models/key_materials/ed25519_key_pair.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace swarmauth::protocol::delegation {

/**
 * Owner-signed grant: the raw token and the owner's Ed25519 signature
 * over exactly those 36 bytes. Attached unchanged to every request the
 * delegate makes.
 */
struct DelegationCertificate {
    std::vector<uint8_t> token;
    std::vector<uint8_t> owner_signature;

    [[nodiscard]] std::string TokenHex() const;
    [[nodiscard]] std::string OwnerSignatureBase64() const;
    [[nodiscard]] Result<SubaccountToken, AuthFailure> DecodeToken(
        configuration::ReservedPolicy policy = configuration::ReservedPolicy::Strict) const;
};

/// Fields a delegated request adds on top of the operation fields
struct DelegatedSignature {
    /// delegate's signature over the operation message, base64
    std::string signature;
    /// 72 hex characters
    std::string subaccount;
    /// owner's grant signature, base64
    std::string subaccount_sig;
};

/// Canonical message signed by the account owner
struct OwnerSignedMessage {
    std::vector<uint8_t> message;
    std::string signature;
};

class DelegationAuthority {
public:
    explicit DelegationAuthority(
        configuration::ClientConfig config = configuration::ClientConfig::Default()) noexcept;

    [[nodiscard]] const configuration::ClientConfig& GetConfig() const noexcept {
        return config_;
    }

    /**
     * Owner grants permissions to the holder of target_public_key_hex
     * (64 hex characters, raw Ed25519 key).
     *
     * In Blinded mode the token carries kT rather than T; see
     * SubaccountBlinding. Unblinded tokens expose the delegate's key.
     */
    [[nodiscard]] Result<DelegationCertificate, AuthFailure> CreateDelegation(
        const models::Ed25519KeyPair& owner,
        std::string_view target_public_key_hex,
        uint8_t permissions,
        uint8_t network_prefix) const;

    /**
     * Delegate signs the operation's own canonical message. The owner's
     * grant signature is passed through untouched and never covers the
     * operation.
     *
     * Fails with MalformedToken when the token key does not belong to
     * delegate under this authority's blinding mode.
     */
    [[nodiscard]] Result<DelegatedSignature, AuthFailure> AssembleDelegatedRequest(
        std::span<const uint8_t> operation_message,
        const models::Ed25519KeyPair& delegate,
        const DelegationCertificate& certificate,
        std::span<const uint8_t> owner_public_key) const;

    [[nodiscard]] static Result<bool, AuthFailure> VerifyCertificate(
        const DelegationCertificate& certificate,
        std::span<const uint8_t> owner_public_key);

    /// "revoke_subaccount" || token_hex, signed by the owner
    [[nodiscard]] static Result<OwnerSignedMessage, AuthFailure> BuildRevocation(
        const models::Ed25519KeyPair& owner,
        std::string_view token_hex);

    /// "unrevoke_subaccount" || timestamp || token hexes, signed by the owner
    [[nodiscard]] static Result<OwnerSignedMessage, AuthFailure> BuildUnrevocation(
        const models::Ed25519KeyPair& owner,
        int64_t timestamp,
        const std::vector<std::string>& token_hexes);

private:
    [[nodiscard]] Result<std::vector<uint8_t>, AuthFailure> TokenKeyFor(
        std::span<const uint8_t> owner_public_key,
        std::span<const uint8_t> target_public_key) const;

    configuration::ClientConfig config_;
};

}
