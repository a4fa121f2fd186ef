#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/canonical/canonical_message_builder.hpp"
#include "swarmauth/configuration/client_config.hpp"
#include "swarmauth/delegation/delegation_authority.hpp"
#include "swarmauth/models/key_materials/ed25519_key_pair.hpp"
#include "swarmauth/requests/operation_descriptor.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace swarmauth::protocol::requests {

/**
 * Who signs a request: the account owner, or a delegate holding a grant
 * for the owner's account. Non-owning; the key pair and certificate must
 * outlive the builder call, so temporaries are refused.
 */
class RequestSigner {
public:
    [[nodiscard]] static RequestSigner Owner(const models::Ed25519KeyPair& owner);
    static RequestSigner Owner(models::Ed25519KeyPair&&) = delete;

    [[nodiscard]] static RequestSigner Delegate(
        const models::Ed25519KeyPair& delegate,
        const delegation::DelegationCertificate& certificate,
        std::span<const uint8_t> owner_public_key);
    static RequestSigner Delegate(
        models::Ed25519KeyPair&&,
        const delegation::DelegationCertificate&,
        std::span<const uint8_t>) = delete;
    static RequestSigner Delegate(
        const models::Ed25519KeyPair&,
        delegation::DelegationCertificate&&,
        std::span<const uint8_t>) = delete;

    [[nodiscard]] bool IsDelegated() const noexcept { return certificate_ != nullptr; }

    [[nodiscard]] const models::Ed25519KeyPair& GetKeyPair() const noexcept { return *key_pair_; }

    /// nullptr for owner signers
    [[nodiscard]] const delegation::DelegationCertificate* GetCertificate() const noexcept {
        return certificate_;
    }

    /// Ed25519 key of the account the request acts on
    [[nodiscard]] std::span<const uint8_t> GetAccountPublicKey() const noexcept {
        return account_public_key_;
    }

private:
    RequestSigner(
        const models::Ed25519KeyPair* key_pair,
        const delegation::DelegationCertificate* certificate,
        std::vector<uint8_t> account_public_key) noexcept;

    const models::Ed25519KeyPair* key_pair_;
    const delegation::DelegationCertificate* certificate_;
    std::vector<uint8_t> account_public_key_;
};

struct RetrieveOptions {
    std::optional<std::string> last_hash;
    int64_t max_count = 100;
    /// Negative values request 1/n of the node's maximum response size
    int64_t max_size = -5;
};

/// Account identifier fields for the configured identity mode
struct AccountIdentity {
    /// 66 hex characters
    std::string pubkey;
    std::vector<uint8_t> account_bytes;
    /// Session accounts only
    std::optional<std::string> pubkey_ed25519;
};

/**
 * Assembles complete storage RPC requests. Timestamps are always passed
 * in (milliseconds since the epoch); nothing here reads a clock.
 *
 * @code
 * RequestBuilder builder(ClientConfig::Testnet());
 * auto owner = RequestSigner::Owner(keys);
 * auto request = builder.Store(owner, payload, 86'400'000,
 *                              Namespace::Default(), now_ms);
 * @endcode
 */
class RequestBuilder {
public:
    explicit RequestBuilder(
        configuration::ClientConfig config = configuration::ClientConfig::Default()) noexcept;

    [[nodiscard]] const configuration::ClientConfig& GetConfig() const noexcept { return config_; }

    [[nodiscard]] Result<AccountIdentity, AuthFailure> ResolveIdentity(
        std::span<const uint8_t> ed25519_public_key) const;

    /// Unsigned on the public namespace
    [[nodiscard]] Result<OperationDescriptor, AuthFailure> Store(
        const RequestSigner& signer,
        std::span<const uint8_t> data,
        int64_t ttl,
        canonical::Namespace ns,
        int64_t timestamp) const;

    /// Unsigned on the public namespace
    [[nodiscard]] Result<OperationDescriptor, AuthFailure> Retrieve(
        const RequestSigner& signer,
        canonical::Namespace ns,
        int64_t timestamp,
        const RetrieveOptions& options = {}) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> Delete(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        bool required = false) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> DeleteAll(
        const RequestSigner& signer,
        canonical::Namespace ns,
        int64_t timestamp) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> DeleteBefore(
        const RequestSigner& signer,
        canonical::Namespace ns,
        int64_t before) const;

    /// shorten takes precedence when both flags are set
    [[nodiscard]] Result<OperationDescriptor, AuthFailure> Expire(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        int64_t expiry,
        bool shorten = false,
        bool extend = false) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> ExpireAll(
        const RequestSigner& signer,
        canonical::Namespace ns,
        int64_t expiry) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> GetExpiries(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        int64_t timestamp) const;

    /// Body carries only the signed timestamp
    [[nodiscard]] Result<OperationDescriptor, AuthFailure> GetMessages(
        const RequestSigner& signer,
        int64_t timestamp) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> Update(
        const RequestSigner& signer,
        const std::vector<std::string>& message_hashes,
        std::span<const uint8_t> data,
        int64_t timestamp) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> Monitor(
        const RequestSigner& signer,
        const std::vector<int32_t>& namespaces,
        bool want_data,
        int64_t timestamp) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> RevokeSubaccount(
        const models::Ed25519KeyPair& owner,
        std::string_view token_hex,
        int64_t timestamp) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> UnrevokeSubaccount(
        const models::Ed25519KeyPair& owner,
        const std::vector<std::string>& token_hexes,
        int64_t timestamp) const;

    [[nodiscard]] Result<OperationDescriptor, AuthFailure> RevokedSubaccounts(
        const models::Ed25519KeyPair& owner,
        int64_t timestamp) const;

    /// Unsigned; only identifies the account
    [[nodiscard]] Result<OperationDescriptor, AuthFailure> GetSwarm(
        std::span<const uint8_t> ed25519_public_key) const;

    /// Permission bits a delegate needs for kind
    [[nodiscard]] static uint8_t RequiredPermissions(canonical::OperationKind kind) noexcept;

private:
    [[nodiscard]] Result<OperationDescriptor, AuthFailure> Assemble(
        canonical::OperationKind kind,
        const canonical::OperationFields& fields,
        const RequestSigner& signer,
        std::vector<RequestField> body,
        bool sign = true) const;

    configuration::ClientConfig config_;
};

}
