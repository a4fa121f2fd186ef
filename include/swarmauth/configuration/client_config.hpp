#pragma once

#include <cstdint>

namespace swarmauth::protocol::configuration {

/// Which key identifies the account in the `pubkey` field
enum class IdentityMode : uint8_t {
    /// `prefix || Ed25519 public key`
    Ed25519 = 0,

    /// `05 || X25519 public key` derived from the Ed25519 key. Requests also
    /// carry `pubkey_ed25519` so the node can check the Ed25519 signature.
    SessionX25519 = 1
};

/// One-byte network prefix of account identifiers and subaccount tokens
enum class NetworkPrefix : uint8_t {
    Testnet = 0x00,
    Mainnet = 0x05
};

/// How a delegation grant embeds the delegate key
enum class BlindingMode : uint8_t {
    /// Token carries `k·T` with `k = H(owner || target) mod L`. The delegate
    /// signs with the scalar `k·t`. The owner key is public, so this keeps T
    /// out of the token but does not stop a holder of a candidate T matching it.
    Blinded = 0,

    /// Token carries the delegate key verbatim. Test vectors only: anyone
    /// reading the token learns which key acts for the account.
    Unblinded = 1
};

/// What token decoding does with non-zero reserved bytes
enum class ReservedPolicy : uint8_t {
    Strict = 0,
    Ignore = 1
};

/// Construction configuration for request and grant builders
///
/// Immutable value: every builder call takes it explicitly, so two requests
/// built with the same config and inputs are identical.
///
/// @example
/// ```cpp
/// // Local storage node, owner identified by Ed25519 key
/// auto config = ClientConfig::Testnet();
///
/// // Session account: 05-prefixed X25519 id
/// auto config = ClientConfig::SessionId();
///
/// // Byte-pinned test vectors with the delegate key visible in the token
/// auto config = ClientConfig::Testnet().WithBlinding(BlindingMode::Unblinded);
/// ```
class ClientConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Testnet / local development node (prefix 00, Ed25519 identity)
    [[nodiscard]] static constexpr ClientConfig Testnet() noexcept {
        return ClientConfig(
            IdentityMode::Ed25519,
            NetworkPrefix::Testnet,
            BlindingMode::Blinded,
            ReservedPolicy::Strict);
    }

    /// Mainnet account identified by its Ed25519 key (prefix 05)
    [[nodiscard]] static constexpr ClientConfig Mainnet() noexcept {
        return ClientConfig(
            IdentityMode::Ed25519,
            NetworkPrefix::Mainnet,
            BlindingMode::Blinded,
            ReservedPolicy::Strict);
    }

    /// Session ID: `05 || X25519` with `pubkey_ed25519` attached
    [[nodiscard]] static constexpr ClientConfig SessionId() noexcept {
        return ClientConfig(
            IdentityMode::SessionX25519,
            NetworkPrefix::Mainnet,
            BlindingMode::Blinded,
            ReservedPolicy::Strict);
    }

    [[nodiscard]] static constexpr ClientConfig Default() noexcept {
        return Testnet();
    }

    // =========================================================================
    // Modifiers (return a new value)
    // =========================================================================

    [[nodiscard]] constexpr ClientConfig WithIdentity(const IdentityMode identity) const noexcept {
        return ClientConfig(identity, prefix_, blinding_, reserved_policy_);
    }

    [[nodiscard]] constexpr ClientConfig WithPrefix(const NetworkPrefix prefix) const noexcept {
        return ClientConfig(identity_, prefix, blinding_, reserved_policy_);
    }

    [[nodiscard]] constexpr ClientConfig WithBlinding(const BlindingMode blinding) const noexcept {
        return ClientConfig(identity_, prefix_, blinding, reserved_policy_);
    }

    [[nodiscard]] constexpr ClientConfig WithReservedPolicy(const ReservedPolicy policy) const noexcept {
        return ClientConfig(identity_, prefix_, blinding_, policy);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr IdentityMode GetIdentityMode() const noexcept {
        return identity_;
    }

    [[nodiscard]] constexpr NetworkPrefix GetNetworkPrefix() const noexcept {
        return prefix_;
    }

    [[nodiscard]] constexpr uint8_t GetPrefixByte() const noexcept {
        return static_cast<uint8_t>(prefix_);
    }

    [[nodiscard]] constexpr BlindingMode GetBlindingMode() const noexcept {
        return blinding_;
    }

    [[nodiscard]] constexpr ReservedPolicy GetReservedPolicy() const noexcept {
        return reserved_policy_;
    }

    [[nodiscard]] constexpr bool IsSessionIdentity() const noexcept {
        return identity_ == IdentityMode::SessionX25519;
    }

    [[nodiscard]] constexpr bool IsBlinded() const noexcept {
        return blinding_ == BlindingMode::Blinded;
    }

    [[nodiscard]] constexpr bool operator==(const ClientConfig& other) const noexcept {
        return identity_ == other.identity_ &&
               prefix_ == other.prefix_ &&
               blinding_ == other.blinding_ &&
               reserved_policy_ == other.reserved_policy_;
    }

    [[nodiscard]] constexpr bool operator!=(const ClientConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    explicit constexpr ClientConfig(
        const IdentityMode identity,
        const NetworkPrefix prefix,
        const BlindingMode blinding,
        const ReservedPolicy reserved_policy) noexcept
        : identity_(identity)
        , prefix_(prefix)
        , blinding_(blinding)
        , reserved_policy_(reserved_policy) {}

    IdentityMode identity_;
    NetworkPrefix prefix_;
    BlindingMode blinding_;
    ReservedPolicy reserved_policy_;
};

} // namespace swarmauth::protocol::configuration
