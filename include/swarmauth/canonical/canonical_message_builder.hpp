#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/canonical/namespace.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace swarmauth::protocol::canonical {

enum class OperationKind : uint8_t {
    Store,
    Retrieve,
    Delete,
    DeleteAll,
    DeleteBefore,
    ExpireMsgs,
    ExpireAll,
    GetExpiries,
    RevokeSubaccount,
    UnrevokeSubaccount,
    Update,
    RevokedSubaccounts,
    GetMessages,
    MonitorSubscribe
};

/// Wire method name for an operation ("expire" for ExpireMsgs, "monitor" for MonitorSubscribe)
[[nodiscard]] std::string_view MethodName(OperationKind kind) noexcept;

/// Accepts wire method names; "expire_msgs" is an alias of "expire"
[[nodiscard]] Result<OperationKind, AuthFailure> ParseOperationKind(std::string_view method);

/**
 * Inputs of a canonical message. Which fields an operation reads, and
 * which of those it requires, is fixed per OperationKind.
 */
struct OperationFields {
    Namespace ns = Namespace::Default();
    /// `timestamp`, or `sig_timestamp` for store and monitor
    std::optional<int64_t> timestamp;
    std::optional<int64_t> before;
    std::optional<int64_t> expiry;
    std::vector<std::string> message_hashes;
    bool shorten = false;
    bool extend = false;
    std::optional<std::string> token_hex;
    std::vector<std::string> token_hexes;
    /// base64 payload signed by update
    std::string data;
    /// 33-byte account id signed by monitor
    std::vector<uint8_t> account;
    std::vector<int32_t> namespaces;
    bool want_data = false;
};

/**
 * Version 1 of the canonical encoding. Each function renders exactly the
 * ASCII string a storage node rebuilds to verify the signature; changing
 * any byte here breaks every deployed client.
 */
namespace v1 {
    /// Default namespace renders empty; All renders "all" only where allowed
    [[nodiscard]] std::string RenderNamespace(const Namespace& ns, bool all_allowed);
    [[nodiscard]] std::string Store(const Namespace& ns, int64_t sig_timestamp);
    [[nodiscard]] std::string Retrieve(const Namespace& ns, int64_t timestamp);
    [[nodiscard]] std::string Delete(const std::vector<std::string>& message_hashes);
    [[nodiscard]] std::string DeleteAll(const Namespace& ns, int64_t timestamp);
    [[nodiscard]] std::string DeleteBefore(const Namespace& ns, int64_t before);
    [[nodiscard]] std::string ExpireMsgs(
        bool shorten, bool extend, int64_t expiry,
        const std::vector<std::string>& message_hashes);
    [[nodiscard]] std::string ExpireAll(const Namespace& ns, int64_t expiry);
    [[nodiscard]] std::string GetExpiries(
        int64_t timestamp, const std::vector<std::string>& message_hashes);
    [[nodiscard]] std::string RevokeSubaccount(std::string_view token_hex);
    [[nodiscard]] std::string UnrevokeSubaccount(
        int64_t timestamp, const std::vector<std::string>& token_hexes);
    [[nodiscard]] std::string Update(
        int64_t timestamp, const std::vector<std::string>& message_hashes, std::string_view data);
    [[nodiscard]] std::string RevokedSubaccounts(int64_t timestamp);
    [[nodiscard]] std::string GetMessages(int64_t timestamp);
    [[nodiscard]] std::string MonitorSubscribe(
        std::span<const uint8_t> account, int64_t sig_timestamp,
        bool want_data, const std::vector<int32_t>& namespaces);
}

class CanonicalMessageBuilder {
public:
    static constexpr uint32_t kVersion = 1;

    /// Validates the fields required by kind and returns the bytes to sign
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> Build(
        OperationKind kind,
        const OperationFields& fields);

    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> Build(
        std::string_view method,
        const OperationFields& fields);

    [[nodiscard]] static Result<std::string, AuthFailure> BuildString(
        OperationKind kind,
        const OperationFields& fields);

private:
    CanonicalMessageBuilder() = delete;
};

}
