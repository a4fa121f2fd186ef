#pragma once
#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/delegation/delegation_authority.hpp"
#include "swarmauth/requests/operation_descriptor.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace swarmauth::proto::storage {
    class DelegationGrant;
    class SignedRequest;
}

namespace swarmauth::protocol::utilities {
using protocol::Result;
using protocol::AuthFailure;

struct DecodedGrant {
    delegation::DelegationCertificate certificate;
    std::vector<uint8_t> owner_public_key;
};

/**
 * Protobuf wire form of delegation grants and signed requests.
 *
 * Decoding checks every length it can: token 36 bytes, signatures 64,
 * keys 32. A short or padded token is MalformedToken.
 */
class DescriptorCodec {
public:
    [[nodiscard]] static proto::storage::DelegationGrant CreateGrant(
        const delegation::DelegationCertificate& certificate,
        std::span<const uint8_t> owner_public_key);

    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> EncodeGrant(
        const delegation::DelegationCertificate& certificate,
        std::span<const uint8_t> owner_public_key);

    [[nodiscard]] static Result<DecodedGrant, AuthFailure> DecodeGrant(
        std::span<const uint8_t> encoded);

    [[nodiscard]] static proto::storage::SignedRequest CreateSignedRequest(
        const requests::OperationDescriptor& descriptor);

    [[nodiscard]] static Result<std::vector<uint8_t>, AuthFailure> EncodeDescriptor(
        const requests::OperationDescriptor& descriptor);

    [[nodiscard]] static Result<requests::OperationDescriptor, AuthFailure> DecodeDescriptor(
        std::span<const uint8_t> encoded);

private:
    DescriptorCodec() = delete;
};
}
