#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace swarmauth::protocol::requests {

/// Identified directly by `prefix || Ed25519 public key`
struct PlainAuth {
    bool operator==(const PlainAuth&) const = default;
};

/// Identified by `05 || X25519 public key`; the node verifies against pubkey_ed25519
struct SessionAuth {
    std::string pubkey_ed25519;

    bool operator==(const SessionAuth&) const = default;
};

/**
 * Request signed by a delegate on behalf of the account in `pubkey`.
 * pubkey_ed25519 is set only for Session accounts.
 */
struct DelegatedAuth {
    std::string subaccount;
    std::string subaccount_sig;
    std::optional<std::string> pubkey_ed25519;

    bool operator==(const DelegatedAuth&) const = default;
};

using RequestAuth = std::variant<PlainAuth, SessionAuth, DelegatedAuth>;

using FieldValue = std::variant<
    int64_t,
    bool,
    std::string,
    std::vector<std::string>,
    std::vector<int64_t>>;

struct RequestField {
    std::string name;
    FieldValue value;

    bool operator==(const RequestField&) const = default;
};

/**
 * One storage RPC call: `{"method": ..., "params": {pubkey, signature,
 * auth fields, fields...}}`. Fields keep insertion order.
 */
struct OperationDescriptor {
    std::string method;
    std::string pubkey;
    /// Absent for unsigned calls (get_swarm, public namespace)
    std::optional<std::string> signature;
    RequestAuth auth;
    std::vector<RequestField> fields;

    [[nodiscard]] bool IsSigned() const noexcept {
        return signature.has_value();
    }

    [[nodiscard]] bool IsDelegated() const noexcept {
        return std::holds_alternative<DelegatedAuth>(auth);
    }

    [[nodiscard]] const FieldValue* FindField(std::string_view name) const noexcept {
        for (const auto& field : fields) {
            if (field.name == name) {
                return &field.value;
            }
        }
        return nullptr;
    }

    template<typename T>
    [[nodiscard]] std::optional<T> GetField(std::string_view name) const {
        const FieldValue* value = FindField(name);
        if (value == nullptr || !std::holds_alternative<T>(*value)) {
            return std::nullopt;
        }
        return std::get<T>(*value);
    }

    void AddField(std::string name, FieldValue value) {
        fields.push_back(RequestField{std::move(name), std::move(value)});
    }

    bool operator==(const OperationDescriptor&) const = default;
};

}
