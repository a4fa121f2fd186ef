#include "swarmauth/utilities/descriptor_codec.hpp"
#include "swarmauth/protocol/constants.hpp"
#include "swarmauth/core/format.hpp"
#include "swarmauth/storage_request.pb.h"
#include <limits>
#include <type_traits>

namespace swarmauth::protocol::utilities {
    using delegation::DelegationCertificate;
    using requests::DelegatedAuth;
    using requests::FieldValue;
    using requests::OperationDescriptor;
    using requests::PlainAuth;
    using requests::RequestField;
    using requests::SessionAuth;

    namespace {
        template<typename Message>
        Result<std::vector<uint8_t>, AuthFailure> Serialize(const Message& message, const std::string_view what) {
            const size_t size = message.ByteSizeLong();
            if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
                return Result<std::vector<uint8_t>, AuthFailure>::Err(
                    AuthFailure::Encoding(compat::format("{} too large to serialize ({} bytes)", what, size)));
            }
            std::vector<uint8_t> bytes(size);
            if (!message.SerializeToArray(bytes.data(), static_cast<int>(size))) {
                return Result<std::vector<uint8_t>, AuthFailure>::Err(
                    AuthFailure::Encoding(compat::format("Failed to serialize {} to protobuf", what)));
            }
            return Result<std::vector<uint8_t>, AuthFailure>::Ok(std::move(bytes));
        }

        std::vector<uint8_t> ToBytes(const std::string& field) {
            return std::vector<uint8_t>(field.begin(), field.end());
        }

        void WriteValue(const FieldValue& value, proto::storage::FieldValue& out) {
            std::visit([&out](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, int64_t>) {
                    out.set_integer_value(v);
                } else if constexpr (std::is_same_v<T, bool>) {
                    out.set_bool_value(v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    out.set_string_value(v);
                } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    auto* list = out.mutable_string_list();
                    for (const auto& item : v) {
                        list->add_values(item);
                    }
                } else {
                    auto* list = out.mutable_integer_list();
                    for (const int64_t item : v) {
                        list->add_values(item);
                    }
                }
            }, value);
        }

        Result<FieldValue, AuthFailure> ReadValue(const proto::storage::RequestField& field) {
            const auto& value = field.value();
            switch (value.value_case()) {
                case proto::storage::FieldValue::kIntegerValue:
                    return Result<FieldValue, AuthFailure>::Ok(FieldValue(value.integer_value()));
                case proto::storage::FieldValue::kBoolValue:
                    return Result<FieldValue, AuthFailure>::Ok(FieldValue(value.bool_value()));
                case proto::storage::FieldValue::kStringValue:
                    return Result<FieldValue, AuthFailure>::Ok(FieldValue(value.string_value()));
                case proto::storage::FieldValue::kStringList:
                    return Result<FieldValue, AuthFailure>::Ok(FieldValue(std::vector<std::string>(
                        value.string_list().values().begin(), value.string_list().values().end())));
                case proto::storage::FieldValue::kIntegerList:
                    return Result<FieldValue, AuthFailure>::Ok(FieldValue(std::vector<int64_t>(
                        value.integer_list().values().begin(), value.integer_list().values().end())));
                case proto::storage::FieldValue::VALUE_NOT_SET:
                    break;
            }
            return Result<FieldValue, AuthFailure>::Err(
                AuthFailure::Decode(compat::format("Field '{}' has no value", field.name())));
        }
    }

    proto::storage::DelegationGrant DescriptorCodec::CreateGrant(
        const DelegationCertificate& certificate,
        const std::span<const uint8_t> owner_public_key) {
        proto::storage::DelegationGrant grant;
        grant.set_version(kGrantFormatVersion);
        grant.set_token(certificate.token.data(), certificate.token.size());
        grant.set_owner_signature(certificate.owner_signature.data(), certificate.owner_signature.size());
        grant.set_owner_pubkey(owner_public_key.data(), owner_public_key.size());
        return grant;
    }

    Result<std::vector<uint8_t>, AuthFailure> DescriptorCodec::EncodeGrant(
        const DelegationCertificate& certificate,
        const std::span<const uint8_t> owner_public_key) {
        if (certificate.token.size() != kSubaccountTokenBytes) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Token must be {} bytes, got {}", kSubaccountTokenBytes, certificate.token.size())));
        }
        if (owner_public_key.size() != kEd25519PublicKeyBytes) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Owner public key must be {} bytes, got {}", kEd25519PublicKeyBytes, owner_public_key.size())));
        }
        return Serialize(CreateGrant(certificate, owner_public_key), "DelegationGrant");
    }

    Result<DecodedGrant, AuthFailure> DescriptorCodec::DecodeGrant(const std::span<const uint8_t> encoded) {
        proto::storage::DelegationGrant grant;
        if (encoded.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
            !grant.ParseFromArray(encoded.data(), static_cast<int>(encoded.size()))) {
            return Result<DecodedGrant, AuthFailure>::Err(
                AuthFailure::Decode("Failed to parse DelegationGrant from protobuf"));
        }
        if (grant.version() != kGrantFormatVersion) {
            return Result<DecodedGrant, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Unsupported grant version {} (expected {})", grant.version(), kGrantFormatVersion)));
        }
        if (grant.token().size() != kSubaccountTokenBytes) {
            return Result<DecodedGrant, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Grant token must be {} bytes, got {}", kSubaccountTokenBytes, grant.token().size())));
        }
        if (grant.owner_signature().size() != kEd25519SignatureBytes) {
            return Result<DecodedGrant, AuthFailure>::Err(
                AuthFailure::MalformedToken(compat::format(
                    "Grant signature must be {} bytes, got {}",
                    kEd25519SignatureBytes, grant.owner_signature().size())));
        }
        if (grant.owner_pubkey().size() != kEd25519PublicKeyBytes) {
            return Result<DecodedGrant, AuthFailure>::Err(
                AuthFailure::InvalidKeyLength(compat::format(
                    "Grant owner key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, grant.owner_pubkey().size())));
        }
        return Result<DecodedGrant, AuthFailure>::Ok(DecodedGrant{
            DelegationCertificate{ToBytes(grant.token()), ToBytes(grant.owner_signature())},
            ToBytes(grant.owner_pubkey())
        });
    }

    proto::storage::SignedRequest DescriptorCodec::CreateSignedRequest(const OperationDescriptor& descriptor) {
        proto::storage::SignedRequest request;
        request.set_canonical_version(kCanonicalEncodingVersion);
        request.set_method(descriptor.method);
        request.set_pubkey(descriptor.pubkey);
        if (descriptor.signature.has_value()) {
            request.set_signature(*descriptor.signature);
        }
        if (const auto* session = std::get_if<SessionAuth>(&descriptor.auth)) {
            request.mutable_session()->set_pubkey_ed25519(session->pubkey_ed25519);
        } else if (const auto* delegated = std::get_if<DelegatedAuth>(&descriptor.auth)) {
            auto* out = request.mutable_delegated();
            out->set_subaccount(delegated->subaccount);
            out->set_subaccount_sig(delegated->subaccount_sig);
            if (delegated->pubkey_ed25519.has_value()) {
                out->set_pubkey_ed25519(*delegated->pubkey_ed25519);
            }
        } else {
            request.mutable_plain();
        }
        for (const RequestField& field : descriptor.fields) {
            auto* out = request.add_fields();
            out->set_name(field.name);
            WriteValue(field.value, *out->mutable_value());
        }
        return request;
    }

    Result<std::vector<uint8_t>, AuthFailure> DescriptorCodec::EncodeDescriptor(const OperationDescriptor& descriptor) {
        if (descriptor.method.empty()) {
            return Result<std::vector<uint8_t>, AuthFailure>::Err(
                AuthFailure::MissingRequiredField("Request has no method"));
        }
        return Serialize(CreateSignedRequest(descriptor), "SignedRequest");
    }

    Result<OperationDescriptor, AuthFailure> DescriptorCodec::DecodeDescriptor(const std::span<const uint8_t> encoded) {
        proto::storage::SignedRequest request;
        if (encoded.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
            !request.ParseFromArray(encoded.data(), static_cast<int>(encoded.size()))) {
            return Result<OperationDescriptor, AuthFailure>::Err(
                AuthFailure::Decode("Failed to parse SignedRequest from protobuf"));
        }
        if (request.canonical_version() != kCanonicalEncodingVersion) {
            return Result<OperationDescriptor, AuthFailure>::Err(
                AuthFailure::UnsupportedOperation(compat::format(
                    "Unsupported canonical encoding version {}", request.canonical_version())));
        }

        OperationDescriptor descriptor;
        descriptor.method = request.method();
        descriptor.pubkey = request.pubkey();
        if (request.has_signature()) {
            descriptor.signature = request.signature();
        }
        switch (request.auth_case()) {
            case proto::storage::SignedRequest::kSession:
                descriptor.auth = SessionAuth{request.session().pubkey_ed25519()};
                break;
            case proto::storage::SignedRequest::kDelegated: {
                const auto& delegated = request.delegated();
                if (delegated.subaccount().size() != kSubaccountTokenHexChars) {
                    return Result<OperationDescriptor, AuthFailure>::Err(
                        AuthFailure::MalformedToken(compat::format(
                            "subaccount must be {} hex characters, got {}",
                            kSubaccountTokenHexChars, delegated.subaccount().size())));
                }
                DelegatedAuth auth{delegated.subaccount(), delegated.subaccount_sig(), std::nullopt};
                if (delegated.has_pubkey_ed25519()) {
                    auth.pubkey_ed25519 = delegated.pubkey_ed25519();
                }
                descriptor.auth = std::move(auth);
                break;
            }
            case proto::storage::SignedRequest::kPlain:
            case proto::storage::SignedRequest::AUTH_NOT_SET:
                descriptor.auth = PlainAuth{};
                break;
        }
        for (const auto& field : request.fields()) {
            auto value = ReadValue(field);
            if (value.IsErr()) {
                return Result<OperationDescriptor, AuthFailure>::Err(value.UnwrapErr());
            }
            descriptor.fields.push_back(RequestField{field.name(), std::move(value).Unwrap()});
        }
        return Result<OperationDescriptor, AuthFailure>::Ok(std::move(descriptor));
    }
}
