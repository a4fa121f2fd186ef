#include "swarmauth/requests/request_builder.hpp"
#include "swarmauth/crypto/ed25519_signer.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/identity/key_material.hpp"
#include "swarmauth/models/public_key_handle.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "swarmauth/core/format.hpp"

namespace swarmauth::protocol::requests {
    using canonical::CanonicalMessageBuilder;
    using canonical::Namespace;
    using canonical::OperationFields;
    using canonical::OperationKind;
    using configuration::ClientConfig;
    using crypto::Ed25519Signer;
    using crypto::SodiumInterop;
    using delegation::DelegationAuthority;
    using delegation::DelegationCertificate;
    using delegation::Permission;
    using identity::KeyMaterial;
    using models::Ed25519KeyPair;
    using models::KeyType;
    using models::PublicKeyHandle;

    namespace {
        using DescriptorResult = Result<OperationDescriptor, AuthFailure>;

        bool IsPublicNamespace(const Namespace& ns) {
            const auto number = ns.GetNumber();
            return !ns.IsAll() && number.has_value() && *number == kPublicNamespace;
        }

        void AddNamespace(std::vector<RequestField>& body, const Namespace& ns, const bool include_default) {
            if (ns.IsAll()) {
                body.push_back({"namespace", std::string(kAllNamespacesLiteral)});
                return;
            }
            if (ns.GetKind() == Namespace::Kind::Default && !include_default) {
                return;
            }
            body.push_back({"namespace", static_cast<int64_t>(*ns.GetNumber())});
        }

        Result<Unit, AuthFailure> RejectAllNamespace(const OperationKind kind, const Namespace& ns) {
            if (ns.IsAll()) {
                return Result<Unit, AuthFailure>::Err(AuthFailure::UnsupportedOperation(
                    compat::format("{} does not accept namespace 'all'", canonical::MethodName(kind))));
            }
            return Result<Unit, AuthFailure>::Ok(unit);
        }
    }

    RequestSigner::RequestSigner(
        const Ed25519KeyPair* key_pair,
        const DelegationCertificate* certificate,
        std::vector<uint8_t> account_public_key) noexcept
        : key_pair_(key_pair)
        , certificate_(certificate)
        , account_public_key_(std::move(account_public_key)) {
    }

    RequestSigner RequestSigner::Owner(const Ed25519KeyPair& owner) {
        return RequestSigner(&owner, nullptr, owner.GetPublicKeyCopy());
    }

    RequestSigner RequestSigner::Delegate(
        const Ed25519KeyPair& delegate,
        const DelegationCertificate& certificate,
        const std::span<const uint8_t> owner_public_key) {
        return RequestSigner(
            &delegate,
            &certificate,
            std::vector<uint8_t>(owner_public_key.begin(), owner_public_key.end()));
    }

    RequestBuilder::RequestBuilder(const ClientConfig config) noexcept
        : config_(config) {
    }

    Result<AccountIdentity, AuthFailure> RequestBuilder::ResolveIdentity(
        const std::span<const uint8_t> ed25519_public_key) const {
        if (!config_.IsSessionIdentity()) {
            auto handle = PublicKeyHandle::Create(config_.GetPrefixByte(), ed25519_public_key, KeyType::Ed25519);
            if (handle.IsErr()) {
                return Result<AccountIdentity, AuthFailure>::Err(handle.UnwrapErr());
            }
            return Result<AccountIdentity, AuthFailure>::Ok(AccountIdentity{
                handle.Unwrap().ToHex(), handle.Unwrap().ToBytes(), std::nullopt});
        }

        auto x25519 = KeyMaterial::DerivePublicKeyX25519(ed25519_public_key);
        if (x25519.IsErr()) {
            return Result<AccountIdentity, AuthFailure>::Err(x25519.UnwrapErr());
        }
        auto handle = PublicKeyHandle::Create(kMainnetPrefix, x25519.Unwrap(), KeyType::X25519);
        if (handle.IsErr()) {
            return Result<AccountIdentity, AuthFailure>::Err(handle.UnwrapErr());
        }
        return Result<AccountIdentity, AuthFailure>::Ok(AccountIdentity{
            handle.Unwrap().ToHex(),
            handle.Unwrap().ToBytes(),
            SodiumInterop::ToHex(ed25519_public_key)});
    }

    uint8_t RequestBuilder::RequiredPermissions(const OperationKind kind) noexcept {
        switch (kind) {
            case OperationKind::Retrieve:
            case OperationKind::GetExpiries:
            case OperationKind::GetMessages:
            case OperationKind::MonitorSubscribe:
            case OperationKind::RevokedSubaccounts:
                return static_cast<uint8_t>(Permission::Read);
            case OperationKind::Store:
            case OperationKind::Update:
            case OperationKind::ExpireMsgs:
            case OperationKind::ExpireAll:
                return static_cast<uint8_t>(Permission::Write);
            case OperationKind::Delete:
            case OperationKind::DeleteAll:
            case OperationKind::DeleteBefore:
                return static_cast<uint8_t>(Permission::Delete);
            case OperationKind::RevokeSubaccount:
            case OperationKind::UnrevokeSubaccount:
                break;
        }
        // Grant management is owner-only; those builders never take a delegate
        return 0xFF;
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::Assemble(
        const OperationKind kind,
        const OperationFields& fields,
        const RequestSigner& signer,
        std::vector<RequestField> body,
        const bool sign) const {
        auto identity_result = ResolveIdentity(signer.GetAccountPublicKey());
        if (identity_result.IsErr()) {
            return DescriptorResult::Err(identity_result.UnwrapErr());
        }
        auto identity = std::move(identity_result).Unwrap();

        OperationDescriptor descriptor;
        descriptor.method = std::string(canonical::MethodName(kind));
        descriptor.pubkey = identity.pubkey;
        descriptor.fields = std::move(body);
        if (identity.pubkey_ed25519.has_value()) {
            descriptor.auth = SessionAuth{*identity.pubkey_ed25519};
        } else {
            descriptor.auth = PlainAuth{};
        }
        if (!sign) {
            return DescriptorResult::Ok(std::move(descriptor));
        }

        auto message = CanonicalMessageBuilder::Build(kind, fields);
        if (message.IsErr()) {
            return DescriptorResult::Err(message.UnwrapErr());
        }

        if (!signer.IsDelegated()) {
            auto signature = Ed25519Signer::SignBase64(signer.GetKeyPair(), message.Unwrap());
            if (signature.IsErr()) {
                return DescriptorResult::Err(signature.UnwrapErr());
            }
            descriptor.signature = std::move(signature).Unwrap();
            return DescriptorResult::Ok(std::move(descriptor));
        }

        const DelegationCertificate& certificate = *signer.GetCertificate();
        auto token = certificate.DecodeToken(config_.GetReservedPolicy());
        if (token.IsErr()) {
            return DescriptorResult::Err(token.UnwrapErr());
        }
        auto authorized = token.Unwrap().Authorize(identity.account_bytes.front(), RequiredPermissions(kind));
        if (authorized.IsErr()) {
            return DescriptorResult::Err(authorized.UnwrapErr());
        }

        const DelegationAuthority authority(config_);
        auto delegated = authority.AssembleDelegatedRequest(
            message.Unwrap(), signer.GetKeyPair(), certificate, signer.GetAccountPublicKey());
        if (delegated.IsErr()) {
            return DescriptorResult::Err(delegated.UnwrapErr());
        }
        auto parts = std::move(delegated).Unwrap();
        descriptor.signature = std::move(parts.signature);
        descriptor.auth = DelegatedAuth{
            std::move(parts.subaccount),
            std::move(parts.subaccount_sig),
            identity.pubkey_ed25519
        };
        return DescriptorResult::Ok(std::move(descriptor));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::Store(
        const RequestSigner& signer,
        const std::span<const uint8_t> data,
        const int64_t ttl,
        const Namespace ns,
        const int64_t timestamp) const {
        auto allowed = RejectAllNamespace(OperationKind::Store, ns);
        if (allowed.IsErr()) {
            return DescriptorResult::Err(allowed.UnwrapErr());
        }
        OperationFields fields;
        fields.ns = ns;
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        body.push_back({"timestamp", timestamp});
        body.push_back({"ttl", ttl});
        body.push_back({"data", SodiumInterop::ToBase64(data)});
        AddNamespace(body, ns, true);
        return Assemble(OperationKind::Store, fields, signer, std::move(body), !IsPublicNamespace(ns));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::Retrieve(
        const RequestSigner& signer,
        const Namespace ns,
        const int64_t timestamp,
        const RetrieveOptions& options) const {
        auto allowed = RejectAllNamespace(OperationKind::Retrieve, ns);
        if (allowed.IsErr()) {
            return DescriptorResult::Err(allowed.UnwrapErr());
        }
        OperationFields fields;
        fields.ns = ns;
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        AddNamespace(body, ns, true);
        if (options.last_hash.has_value()) {
            body.push_back({"last_hash", *options.last_hash});
        }
        body.push_back({"max_count", options.max_count});
        body.push_back({"max_size", options.max_size});
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::Retrieve, fields, signer, std::move(body), !IsPublicNamespace(ns));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::Delete(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        const bool required) const {
        OperationFields fields;
        fields.message_hashes = message_hashes;

        std::vector<RequestField> body;
        body.push_back({"messages", message_hashes});
        if (required) {
            body.push_back({"required", true});
        }
        return Assemble(OperationKind::Delete, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::DeleteAll(
        const RequestSigner& signer,
        const Namespace ns,
        const int64_t timestamp) const {
        OperationFields fields;
        fields.ns = ns;
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        AddNamespace(body, ns, true);
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::DeleteAll, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::DeleteBefore(
        const RequestSigner& signer,
        const Namespace ns,
        const int64_t before) const {
        OperationFields fields;
        fields.ns = ns;
        fields.before = before;

        std::vector<RequestField> body;
        AddNamespace(body, ns, false);
        body.push_back({"before", before});
        return Assemble(OperationKind::DeleteBefore, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::Expire(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        const int64_t expiry,
        const bool shorten,
        const bool extend) const {
        OperationFields fields;
        fields.message_hashes = message_hashes;
        fields.expiry = expiry;
        fields.shorten = shorten;
        fields.extend = extend && !shorten;

        std::vector<RequestField> body;
        body.push_back({"messages", message_hashes});
        body.push_back({"expiry", expiry});
        if (fields.shorten) {
            body.push_back({"shorten", true});
        } else if (fields.extend) {
            body.push_back({"extend", true});
        }
        return Assemble(OperationKind::ExpireMsgs, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::ExpireAll(
        const RequestSigner& signer,
        const Namespace ns,
        const int64_t expiry) const {
        OperationFields fields;
        fields.ns = ns;
        fields.expiry = expiry;

        std::vector<RequestField> body;
        body.push_back({"expiry", expiry});
        AddNamespace(body, ns, false);
        return Assemble(OperationKind::ExpireAll, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::GetExpiries(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        const int64_t timestamp) const {
        OperationFields fields;
        fields.message_hashes = message_hashes;
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        body.push_back({"messages", message_hashes});
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::GetExpiries, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::GetMessages(
        const RequestSigner& signer,
        const int64_t timestamp) const {
        OperationFields fields;
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::GetMessages, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::Update(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        const std::span<const uint8_t> data,
        const int64_t timestamp) const {
        OperationFields fields;
        fields.message_hashes = message_hashes;
        fields.timestamp = timestamp;
        fields.data = SodiumInterop::ToBase64(data);

        std::vector<RequestField> body;
        body.push_back({"messages", message_hashes});
        body.push_back({"data", fields.data});
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::Update, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::Monitor(
        const RequestSigner& signer,
        const std::vector<int32_t>& namespaces,
        const bool want_data,
        const int64_t timestamp) const {
        auto identity = ResolveIdentity(signer.GetAccountPublicKey());
        if (identity.IsErr()) {
            return DescriptorResult::Err(identity.UnwrapErr());
        }
        OperationFields fields;
        fields.timestamp = timestamp;
        fields.account = identity.Unwrap().account_bytes;
        fields.namespaces = namespaces;
        fields.want_data = want_data;

        std::vector<RequestField> body;
        body.push_back({"namespaces", std::vector<int64_t>(namespaces.begin(), namespaces.end())});
        body.push_back({"data", want_data});
        body.push_back({"sig_ts", timestamp});
        return Assemble(OperationKind::MonitorSubscribe, fields, signer, std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::RevokeSubaccount(
        const Ed25519KeyPair& owner,
        const std::string_view token_hex,
        const int64_t timestamp) const {
        auto token = delegation::SubaccountTokenCodec::DecodeHex(
            token_hex, configuration::ReservedPolicy::Ignore);
        if (token.IsErr()) {
            return DescriptorResult::Err(token.UnwrapErr());
        }
        OperationFields fields;
        fields.token_hex = std::string(token_hex);
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        body.push_back({"revoke", std::string(token_hex)});
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::RevokeSubaccount, fields, RequestSigner::Owner(owner), std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::UnrevokeSubaccount(
        const Ed25519KeyPair& owner,
        const std::vector<std::string>& token_hexes,
        const int64_t timestamp) const {
        for (const auto& token_hex : token_hexes) {
            auto token = delegation::SubaccountTokenCodec::DecodeHex(
                token_hex, configuration::ReservedPolicy::Ignore);
            if (token.IsErr()) {
                return DescriptorResult::Err(token.UnwrapErr());
            }
        }
        OperationFields fields;
        fields.token_hexes = token_hexes;
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        body.push_back({"unrevoke", token_hexes});
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::UnrevokeSubaccount, fields, RequestSigner::Owner(owner), std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::RevokedSubaccounts(
        const Ed25519KeyPair& owner,
        const int64_t timestamp) const {
        OperationFields fields;
        fields.timestamp = timestamp;

        std::vector<RequestField> body;
        body.push_back({"timestamp", timestamp});
        return Assemble(OperationKind::RevokedSubaccounts, fields, RequestSigner::Owner(owner), std::move(body));
    }

    Result<OperationDescriptor, AuthFailure> RequestBuilder::GetSwarm(
        const std::span<const uint8_t> ed25519_public_key) const {
        auto identity = ResolveIdentity(ed25519_public_key);
        if (identity.IsErr()) {
            return DescriptorResult::Err(identity.UnwrapErr());
        }
        OperationDescriptor descriptor;
        descriptor.method = std::string(kGetSwarmMethod);
        descriptor.pubkey = identity.Unwrap().pubkey;
        descriptor.auth = PlainAuth{};
        return DescriptorResult::Ok(std::move(descriptor));
    }
}
