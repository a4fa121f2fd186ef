#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace swarmauth::protocol {

inline constexpr uint32_t kCanonicalEncodingVersion = 1;
inline constexpr uint32_t kGrantFormatVersion = 1;

inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SeedBytes = 32;
inline constexpr size_t kEd25519SignatureBytes = 64;
inline constexpr size_t kX25519PublicKeyBytes = 32;

// Account identifiers: prefix(1) || key(32)
inline constexpr size_t kNetworkPrefixBytes = 1;
inline constexpr size_t kAccountIdBytes = kNetworkPrefixBytes + kEd25519PublicKeyBytes;
inline constexpr size_t kAccountIdHexChars = kAccountIdBytes * 2;

inline constexpr uint8_t kTestnetPrefix = 0x00;
inline constexpr uint8_t kMainnetPrefix = 0x05;

// Subaccount token: prefix(1) || permissions(1) || reserved(2) || pubkey(32)
inline constexpr size_t kSubaccountTokenBytes = 36;
inline constexpr size_t kSubaccountTokenHexChars = kSubaccountTokenBytes * 2;
inline constexpr size_t kTokenPrefixOffset = 0;
inline constexpr size_t kTokenPermissionsOffset = 1;
inline constexpr size_t kTokenReservedOffset = 2;
inline constexpr size_t kTokenReservedBytes = 2;
inline constexpr size_t kTokenPublicKeyOffset = 4;

inline constexpr uint8_t kPermissionRead = 0b0001;
inline constexpr uint8_t kPermissionWrite = 0b0010;
inline constexpr uint8_t kPermissionDelete = 0b0100;
inline constexpr uint8_t kPermissionAnyPrefix = 0b1000;

// Storing into this namespace needs no signature
inline constexpr int32_t kPublicNamespace = -10;

// Blinded subaccount signing hash keys
inline constexpr std::string_view kBlindSeedHashKey = "SubaccountSeed";
inline constexpr std::string_view kBlindNonceHashKey = "SubaccountSig";

// Canonical message literals
inline constexpr std::string_view kStoreLiteral = "store";
inline constexpr std::string_view kRetrieveLiteral = "retrieve";
inline constexpr std::string_view kDeleteLiteral = "delete";
inline constexpr std::string_view kDeleteAllLiteral = "delete_all";
inline constexpr std::string_view kDeleteBeforeLiteral = "delete_before";
inline constexpr std::string_view kExpireLiteral = "expire";
inline constexpr std::string_view kExpireAllLiteral = "expire_all";
inline constexpr std::string_view kGetExpiriesLiteral = "get_expiries";
inline constexpr std::string_view kRevokeSubaccountLiteral = "revoke_subaccount";
inline constexpr std::string_view kUnrevokeSubaccountLiteral = "unrevoke_subaccount";
inline constexpr std::string_view kUpdateLiteral = "update";
inline constexpr std::string_view kRevokedSubaccountsLiteral = "revoked_subaccounts";
inline constexpr std::string_view kGetMessagesLiteral = "get_messages";
inline constexpr std::string_view kMonitorLiteral = "MONITOR";
inline constexpr std::string_view kShortenLiteral = "shorten";
inline constexpr std::string_view kExtendLiteral = "extend";
inline constexpr std::string_view kAllNamespacesLiteral = "all";

// Wire method names that differ from the canonical literal
inline constexpr std::string_view kExpireMethod = "expire";
inline constexpr std::string_view kMonitorMethod = "monitor";
inline constexpr std::string_view kGetSwarmMethod = "get_swarm";

}
