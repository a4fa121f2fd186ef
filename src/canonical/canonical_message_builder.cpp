#include "swarmauth/canonical/canonical_message_builder.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "swarmauth/core/format.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/debug/signing_logger.hpp"

namespace swarmauth::protocol::canonical {
    namespace {
        struct MethodEntry {
            std::string_view method;
            OperationKind kind;
        };

        constexpr MethodEntry kMethods[] = {
            {kStoreLiteral, OperationKind::Store},
            {kRetrieveLiteral, OperationKind::Retrieve},
            {kDeleteLiteral, OperationKind::Delete},
            {kDeleteAllLiteral, OperationKind::DeleteAll},
            {kDeleteBeforeLiteral, OperationKind::DeleteBefore},
            {kExpireMethod, OperationKind::ExpireMsgs},
            {kExpireAllLiteral, OperationKind::ExpireAll},
            {kGetExpiriesLiteral, OperationKind::GetExpiries},
            {kRevokeSubaccountLiteral, OperationKind::RevokeSubaccount},
            {kUnrevokeSubaccountLiteral, OperationKind::UnrevokeSubaccount},
            {kUpdateLiteral, OperationKind::Update},
            {kRevokedSubaccountsLiteral, OperationKind::RevokedSubaccounts},
            {kGetMessagesLiteral, OperationKind::GetMessages},
            {kMonitorMethod, OperationKind::MonitorSubscribe},
        };

        void AppendAll(std::string& out, const std::vector<std::string>& parts) {
            for (const auto& part : parts) {
                out.append(part);
            }
        }

        AuthFailure Missing(const OperationKind kind, const std::string_view field) {
            return AuthFailure::MissingRequiredField(compat::format(
                "{} requires {}", MethodName(kind), field));
        }
    }

    std::string_view MethodName(const OperationKind kind) noexcept {
        for (const auto& entry : kMethods) {
            if (entry.kind == kind) {
                return entry.method;
            }
        }
        return {};
    }

    Result<OperationKind, AuthFailure> ParseOperationKind(const std::string_view method) {
        for (const auto& entry : kMethods) {
            if (entry.method == method) {
                return Result<OperationKind, AuthFailure>::Ok(entry.kind);
            }
        }
        if (method == "expire_msgs") {
            return Result<OperationKind, AuthFailure>::Ok(OperationKind::ExpireMsgs);
        }
        return Result<OperationKind, AuthFailure>::Err(
            AuthFailure::UnsupportedOperation(compat::format(
                "No canonical message for method '{}'", method)));
    }

    namespace v1 {
        std::string RenderNamespace(const Namespace& ns, const bool all_allowed) {
            if (ns.IsAll()) {
                return all_allowed ? std::string(kAllNamespacesLiteral) : std::string();
            }
            if (ns.IsDefault()) {
                return {};
            }
            return std::to_string(*ns.GetNumber());
        }

        std::string Store(const Namespace& ns, const int64_t sig_timestamp) {
            return compat::format("{}{}{}", kStoreLiteral, RenderNamespace(ns, false), sig_timestamp);
        }

        std::string Retrieve(const Namespace& ns, const int64_t timestamp) {
            return compat::format("{}{}{}", kRetrieveLiteral, RenderNamespace(ns, false), timestamp);
        }

        std::string Delete(const std::vector<std::string>& message_hashes) {
            std::string message(kDeleteLiteral);
            AppendAll(message, message_hashes);
            return message;
        }

        std::string DeleteAll(const Namespace& ns, const int64_t timestamp) {
            return compat::format("{}{}{}", kDeleteAllLiteral, RenderNamespace(ns, true), timestamp);
        }

        std::string DeleteBefore(const Namespace& ns, const int64_t before) {
            return compat::format("{}{}{}", kDeleteBeforeLiteral, RenderNamespace(ns, false), before);
        }

        std::string ExpireMsgs(
            const bool shorten,
            const bool extend,
            const int64_t expiry,
            const std::vector<std::string>& message_hashes) {
            std::string_view modifier;
            if (shorten) {
                modifier = kShortenLiteral;
            } else if (extend) {
                modifier = kExtendLiteral;
            }
            std::string message = compat::format("{}{}{}", kExpireLiteral, modifier, expiry);
            AppendAll(message, message_hashes);
            return message;
        }

        std::string ExpireAll(const Namespace& ns, const int64_t expiry) {
            return compat::format("{}{}{}", kExpireAllLiteral, RenderNamespace(ns, true), expiry);
        }

        std::string GetExpiries(
            const int64_t timestamp,
            const std::vector<std::string>& message_hashes) {
            std::string message = compat::format("{}{}", kGetExpiriesLiteral, timestamp);
            AppendAll(message, message_hashes);
            return message;
        }

        std::string RevokeSubaccount(const std::string_view token_hex) {
            return compat::format("{}{}", kRevokeSubaccountLiteral, token_hex);
        }

        std::string UnrevokeSubaccount(
            const int64_t timestamp,
            const std::vector<std::string>& token_hexes) {
            std::string message = compat::format("{}{}", kUnrevokeSubaccountLiteral, timestamp);
            AppendAll(message, token_hexes);
            return message;
        }

        std::string Update(
            const int64_t timestamp,
            const std::vector<std::string>& message_hashes,
            const std::string_view data) {
            std::string message = compat::format("{}{}", kUpdateLiteral, timestamp);
            AppendAll(message, message_hashes);
            message.append(data);
            return message;
        }

        std::string RevokedSubaccounts(const int64_t timestamp) {
            return compat::format("{}{}", kRevokedSubaccountsLiteral, timestamp);
        }

        std::string GetMessages(const int64_t timestamp) {
            return compat::format("{}{}", kGetMessagesLiteral, timestamp);
        }

        std::string MonitorSubscribe(
            const std::span<const uint8_t> account,
            const int64_t sig_timestamp,
            const bool want_data,
            const std::vector<int32_t>& namespaces) {
            std::string message = compat::format(
                "{}{}{}{}",
                kMonitorLiteral,
                crypto::SodiumInterop::ToHex(account),
                sig_timestamp,
                want_data ? '1' : '0');
            for (size_t i = 0; i < namespaces.size(); ++i) {
                if (i > 0) {
                    message.push_back(',');
                }
                message.append(std::to_string(namespaces[i]));
            }
            return message;
        }
    }

    Result<std::string, AuthFailure> CanonicalMessageBuilder::BuildString(
        const OperationKind kind,
        const OperationFields& fields) {
        using StringResult = Result<std::string, AuthFailure>;
        const bool needs_timestamp =
            kind == OperationKind::Store || kind == OperationKind::Retrieve ||
            kind == OperationKind::DeleteAll || kind == OperationKind::GetExpiries ||
            kind == OperationKind::UnrevokeSubaccount || kind == OperationKind::Update ||
            kind == OperationKind::RevokedSubaccounts || kind == OperationKind::GetMessages ||
            kind == OperationKind::MonitorSubscribe;
        const bool needs_hashes =
            kind == OperationKind::Delete || kind == OperationKind::ExpireMsgs ||
            kind == OperationKind::GetExpiries || kind == OperationKind::Update;
        const bool needs_expiry =
            kind == OperationKind::ExpireMsgs || kind == OperationKind::ExpireAll;

        if (needs_timestamp && !fields.timestamp.has_value()) {
            return StringResult::Err(Missing(kind,
                kind == OperationKind::Store || kind == OperationKind::MonitorSubscribe
                    ? "sig_timestamp" : "timestamp"));
        }
        if (needs_hashes && fields.message_hashes.empty()) {
            return StringResult::Err(Missing(kind, "messages"));
        }
        if (needs_expiry && !fields.expiry.has_value()) {
            return StringResult::Err(Missing(kind, "expiry"));
        }
        if ((kind == OperationKind::Store || kind == OperationKind::Retrieve) && fields.ns.IsAll()) {
            return StringResult::Err(AuthFailure::UnsupportedOperation(compat::format(
                "{} does not accept namespace 'all'", MethodName(kind))));
        }

        switch (kind) {
            case OperationKind::Store:
                return StringResult::Ok(v1::Store(fields.ns, *fields.timestamp));
            case OperationKind::Retrieve:
                return StringResult::Ok(v1::Retrieve(fields.ns, *fields.timestamp));
            case OperationKind::Delete:
                return StringResult::Ok(v1::Delete(fields.message_hashes));
            case OperationKind::DeleteAll:
                return StringResult::Ok(v1::DeleteAll(fields.ns, *fields.timestamp));
            case OperationKind::DeleteBefore:
                if (!fields.before.has_value()) {
                    return StringResult::Err(Missing(kind, "before"));
                }
                return StringResult::Ok(v1::DeleteBefore(fields.ns, *fields.before));
            case OperationKind::ExpireMsgs:
                return StringResult::Ok(v1::ExpireMsgs(
                    fields.shorten, fields.extend, *fields.expiry, fields.message_hashes));
            case OperationKind::ExpireAll:
                return StringResult::Ok(v1::ExpireAll(fields.ns, *fields.expiry));
            case OperationKind::GetExpiries:
                return StringResult::Ok(v1::GetExpiries(*fields.timestamp, fields.message_hashes));
            case OperationKind::RevokeSubaccount:
                if (!fields.token_hex.has_value() || fields.token_hex->empty()) {
                    return StringResult::Err(Missing(kind, "revoke"));
                }
                return StringResult::Ok(v1::RevokeSubaccount(*fields.token_hex));
            case OperationKind::UnrevokeSubaccount:
                if (fields.token_hexes.empty()) {
                    return StringResult::Err(Missing(kind, "unrevoke"));
                }
                return StringResult::Ok(v1::UnrevokeSubaccount(*fields.timestamp, fields.token_hexes));
            case OperationKind::Update:
                return StringResult::Ok(v1::Update(*fields.timestamp, fields.message_hashes, fields.data));
            case OperationKind::RevokedSubaccounts:
                return StringResult::Ok(v1::RevokedSubaccounts(*fields.timestamp));
            case OperationKind::GetMessages:
                return StringResult::Ok(v1::GetMessages(*fields.timestamp));
            case OperationKind::MonitorSubscribe:
                if (fields.account.empty()) {
                    return StringResult::Err(Missing(kind, "account"));
                }
                if (fields.account.size() != kAccountIdBytes) {
                    return StringResult::Err(AuthFailure::InvalidKeyLength(compat::format(
                        "monitor account must be {} bytes, got {}",
                        kAccountIdBytes, fields.account.size())));
                }
                return StringResult::Ok(v1::MonitorSubscribe(
                    fields.account, *fields.timestamp, fields.want_data, fields.namespaces));
        }
        return StringResult::Err(AuthFailure::UnsupportedOperation(compat::format(
            "Unknown operation kind {}", static_cast<int>(kind))));
    }

    Result<std::vector<uint8_t>, AuthFailure> CanonicalMessageBuilder::Build(
        const OperationKind kind,
        const OperationFields& fields) {
        return BuildString(kind, fields).Map([kind](std::string message) {
            std::vector<uint8_t> bytes(message.begin(), message.end());
            debug::LogCanonicalMessage(MethodName(kind), bytes);
            return bytes;
        });
    }

    Result<std::vector<uint8_t>, AuthFailure> CanonicalMessageBuilder::Build(
        const std::string_view method,
        const OperationFields& fields) {
        return ParseOperationKind(method).Bind([&fields](const OperationKind kind) {
            return Build(kind, fields);
        });
    }
}
