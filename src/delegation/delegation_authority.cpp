#include "swarmauth/delegation/delegation_authority.hpp"
#include "swarmauth/canonical/canonical_message_builder.hpp"
#include "swarmauth/crypto/ed25519_signer.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/crypto/subaccount_blinding.hpp"
#include "swarmauth/core/format.hpp"
#include "swarmauth/debug/signing_logger.hpp"

namespace swarmauth::protocol::delegation {
    using crypto::Ed25519Signer;
    using crypto::SodiumInterop;
    using crypto::SubaccountBlinding;
    using canonical::CanonicalMessageBuilder;
    using canonical::OperationFields;
    using canonical::OperationKind;
    using configuration::BlindingMode;
    using configuration::ClientConfig;
    using configuration::ReservedPolicy;

    std::string DelegationCertificate::TokenHex() const {
        return SodiumInterop::ToHex(token);
    }

    std::string DelegationCertificate::OwnerSignatureBase64() const {
        return SodiumInterop::ToBase64(owner_signature);
    }

    Result<SubaccountToken, AuthFailure> DelegationCertificate::DecodeToken(
        const ReservedPolicy policy) const {
        return SubaccountTokenCodec::Decode(token, policy);
    }

    DelegationAuthority::DelegationAuthority(const ClientConfig config) noexcept
        : config_(config) {
    }

    Result<std::vector<uint8_t>, AuthFailure> DelegationAuthority::TokenKeyFor(
        const std::span<const uint8_t> owner_public_key,
        const std::span<const uint8_t> target_public_key) const {
        if (config_.GetBlindingMode() == BlindingMode::Unblinded) {
            return Result<std::vector<uint8_t>, AuthFailure>::Ok(
                std::vector<uint8_t>(target_public_key.begin(), target_public_key.end()));
        }
        return SubaccountBlinding::DeriveBlindedPublicKey(owner_public_key, target_public_key);
    }

    Result<DelegationCertificate, AuthFailure> DelegationAuthority::CreateDelegation(
        const models::Ed25519KeyPair& owner,
        const std::string_view target_public_key_hex,
        const uint8_t permissions,
        const uint8_t network_prefix) const {
        if (target_public_key_hex.size() != kEd25519PublicKeyBytes * 2) {
            return Result<DelegationCertificate, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Target public key must be {} hex characters, got {}",
                    kEd25519PublicKeyBytes * 2, target_public_key_hex.size())));
        }
        auto target_result = SodiumInterop::FromHex(target_public_key_hex);
        if (target_result.IsErr()) {
            return Result<DelegationCertificate, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(target_result.UnwrapErr(), AuthFailureType::Decode));
        }
        const auto target_public_key = std::move(target_result).Unwrap();

        auto key_result = TokenKeyFor(owner.GetPublicKeySpan(), target_public_key);
        if (key_result.IsErr()) {
            return Result<DelegationCertificate, AuthFailure>::Err(key_result.UnwrapErr());
        }
        auto token_result = SubaccountTokenCodec::Encode(
            network_prefix, permissions, key_result.Unwrap());
        if (token_result.IsErr()) {
            return Result<DelegationCertificate, AuthFailure>::Err(token_result.UnwrapErr());
        }
        auto token = std::move(token_result).Unwrap();

        auto signature_result = Ed25519Signer::Sign(owner, token);
        if (signature_result.IsErr()) {
            return Result<DelegationCertificate, AuthFailure>::Err(signature_result.UnwrapErr());
        }
        DelegationCertificate certificate{
            std::move(token),
            std::move(signature_result).Unwrap()
        };
        debug::LogDelegationCreated(
            config_.IsBlinded(), target_public_key, certificate.token, certificate.owner_signature);
        return Result<DelegationCertificate, AuthFailure>::Ok(std::move(certificate));
    }

    Result<DelegatedSignature, AuthFailure> DelegationAuthority::AssembleDelegatedRequest(
        const std::span<const uint8_t> operation_message,
        const models::Ed25519KeyPair& delegate,
        const DelegationCertificate& certificate,
        const std::span<const uint8_t> owner_public_key) const {
        auto decoded = certificate.DecodeToken(config_.GetReservedPolicy());
        if (decoded.IsErr()) {
            return Result<DelegatedSignature, AuthFailure>::Err(decoded.UnwrapErr());
        }
        if (certificate.owner_signature.size() != kEd25519SignatureBytes) {
            return Result<DelegatedSignature, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Grant signature must be {} bytes, got {}",
                    kEd25519SignatureBytes, certificate.owner_signature.size())));
        }

        auto expected_key = TokenKeyFor(owner_public_key, delegate.GetPublicKeySpan());
        if (expected_key.IsErr()) {
            return Result<DelegatedSignature, AuthFailure>::Err(expected_key.UnwrapErr());
        }
        auto same_key = SodiumInterop::ConstantTimeEquals(
            expected_key.Unwrap(), decoded.Unwrap().public_key);
        if (same_key.IsErr()) {
            return Result<DelegatedSignature, AuthFailure>::Err(
                AuthFailure::FromSodiumFailure(same_key.UnwrapErr(), AuthFailureType::MalformedToken));
        }
        if (!same_key.Unwrap()) {
            return Result<DelegatedSignature, AuthFailure>::Err(
                AuthFailure::MalformedToken(config_.IsBlinded()
                    ? "Token key is not the blinded key of this delegate"
                    : "Token key is not this delegate's public key"));
        }

        auto signature_result = config_.IsBlinded()
            ? SubaccountBlinding::Sign(delegate, owner_public_key, operation_message)
            : Ed25519Signer::Sign(delegate, operation_message);
        if (signature_result.IsErr()) {
            return Result<DelegatedSignature, AuthFailure>::Err(signature_result.UnwrapErr());
        }
        const auto& signature = signature_result.Unwrap();
        debug::LogDelegatedSignature(config_.IsBlinded(), expected_key.Unwrap(), signature);

        return Result<DelegatedSignature, AuthFailure>::Ok(DelegatedSignature{
            SodiumInterop::ToBase64(signature),
            certificate.TokenHex(),
            certificate.OwnerSignatureBase64()
        });
    }

    Result<bool, AuthFailure> DelegationAuthority::VerifyCertificate(
        const DelegationCertificate& certificate,
        const std::span<const uint8_t> owner_public_key) {
        if (certificate.token.size() != kSubaccountTokenBytes) {
            return Result<bool, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Token must be {} bytes, got {}",
                    kSubaccountTokenBytes, certificate.token.size())));
        }
        return Ed25519Signer::Verify(owner_public_key, certificate.token, certificate.owner_signature);
    }

    Result<OwnerSignedMessage, AuthFailure> DelegationAuthority::BuildRevocation(
        const models::Ed25519KeyPair& owner,
        const std::string_view token_hex) {
        auto token = SubaccountTokenCodec::DecodeHex(token_hex, ReservedPolicy::Ignore);
        if (token.IsErr()) {
            return Result<OwnerSignedMessage, AuthFailure>::Err(token.UnwrapErr());
        }
        OperationFields fields;
        fields.token_hex = std::string(token_hex);
        auto message = CanonicalMessageBuilder::Build(OperationKind::RevokeSubaccount, fields);
        if (message.IsErr()) {
            return Result<OwnerSignedMessage, AuthFailure>::Err(message.UnwrapErr());
        }
        auto signature = Ed25519Signer::SignBase64(owner, message.Unwrap());
        if (signature.IsErr()) {
            return Result<OwnerSignedMessage, AuthFailure>::Err(signature.UnwrapErr());
        }
        return Result<OwnerSignedMessage, AuthFailure>::Ok(OwnerSignedMessage{
            std::move(message).Unwrap(),
            std::move(signature).Unwrap()
        });
    }

    Result<OwnerSignedMessage, AuthFailure> DelegationAuthority::BuildUnrevocation(
        const models::Ed25519KeyPair& owner,
        const int64_t timestamp,
        const std::vector<std::string>& token_hexes) {
        for (const auto& token_hex : token_hexes) {
            auto token = SubaccountTokenCodec::DecodeHex(token_hex, ReservedPolicy::Ignore);
            if (token.IsErr()) {
                return Result<OwnerSignedMessage, AuthFailure>::Err(token.UnwrapErr());
            }
        }
        OperationFields fields;
        fields.timestamp = timestamp;
        fields.token_hexes = token_hexes;
        auto message = CanonicalMessageBuilder::Build(OperationKind::UnrevokeSubaccount, fields);
        if (message.IsErr()) {
            return Result<OwnerSignedMessage, AuthFailure>::Err(message.UnwrapErr());
        }
        auto signature = Ed25519Signer::SignBase64(owner, message.Unwrap());
        if (signature.IsErr()) {
            return Result<OwnerSignedMessage, AuthFailure>::Err(signature.UnwrapErr());
        }
        return Result<OwnerSignedMessage, AuthFailure>::Ok(OwnerSignedMessage{
            std::move(message).Unwrap(),
            std::move(signature).Unwrap()
        });
    }
}
