/**
 * @file subaccount_example.cpp
 * @brief Owner grants a delegate write access, the delegate stores a message
 */

#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/delegation/delegation_authority.hpp"
#include "swarmauth/identity/key_material.hpp"
#include "swarmauth/requests/request_builder.hpp"
#include "swarmauth/utilities/descriptor_codec.hpp"

#include <chrono>
#include <iostream>
#include <string>

using namespace swarmauth::protocol;
using namespace swarmauth::protocol::crypto;
using namespace swarmauth::protocol::delegation;
using namespace swarmauth::protocol::requests;
using swarmauth::protocol::canonical::Namespace;
using swarmauth::protocol::configuration::ClientConfig;
using swarmauth::protocol::utilities::DescriptorCodec;

namespace {
    void PrintRequest(const OperationDescriptor& descriptor) {
        std::cout << "   method:    " << descriptor.method << std::endl;
        std::cout << "   pubkey:    " << descriptor.pubkey << std::endl;
        std::cout << "   signature: " << descriptor.signature.value_or("(unsigned)") << std::endl;
        if (const auto* delegated = std::get_if<DelegatedAuth>(&descriptor.auth)) {
            std::cout << "   subaccount:     " << delegated->subaccount << std::endl;
            std::cout << "   subaccount_sig: " << delegated->subaccount_sig << std::endl;
        }
    }
}

int main() {
    std::cout << "=== swarmauth - Subaccount Delegation Example ===" << std::endl;
    std::cout << std::endl;

    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }

    // 1. Both parties hold Ed25519 keys
    std::cout << "1. Generating owner and delegate keys..." << std::endl;
    auto owner_result = identity::KeyMaterial::Generate();
    auto delegate_result = identity::KeyMaterial::Generate();
    if (owner_result.IsErr() || delegate_result.IsErr()) {
        std::cerr << "Failed to generate keys" << std::endl;
        return 1;
    }
    const auto owner = std::move(owner_result).Unwrap();
    const auto delegate = std::move(delegate_result).Unwrap();
    std::cout << "   owner:    " << SodiumInterop::ToHex(owner.GetPublicKey()) << std::endl;
    std::cout << "   delegate: " << SodiumInterop::ToHex(delegate.GetPublicKey()) << std::endl;
    std::cout << std::endl;

    // 2. Owner issues a blinded read/write grant
    std::cout << "2. Owner grants read and write..." << std::endl;
    const auto config = ClientConfig::Testnet();
    const DelegationAuthority authority(config);
    auto grant_result = authority.CreateDelegation(
        owner,
        SodiumInterop::ToHex(delegate.GetPublicKey()),
        Permission::Read | Permission::Write,
        config.GetPrefixByte());
    if (grant_result.IsErr()) {
        std::cerr << "Grant failed: " << grant_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto certificate = std::move(grant_result).Unwrap();
    std::cout << "   token: " << certificate.TokenHex() << std::endl;

    auto wire = DescriptorCodec::EncodeGrant(certificate, owner.GetPublicKey());
    if (wire.IsErr()) {
        std::cerr << "Grant encoding failed: " << wire.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   grant is " << wire.Unwrap().size() << " bytes on the wire" << std::endl;
    std::cout << std::endl;

    // 3. Delegate stores into the owner's account
    std::cout << "3. Delegate stores a message..." << std::endl;
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string payload = "hello from a subaccount";
    const std::vector<uint8_t> data(payload.begin(), payload.end());

    const RequestBuilder builder(config);
    auto request = builder.Store(
        RequestSigner::Delegate(delegate, certificate, owner.GetPublicKey()),
        data, 86'400'000, Namespace::Default(), now_ms);
    if (request.IsErr()) {
        std::cerr << "Store failed: " << request.UnwrapErr().message << std::endl;
        return 1;
    }
    PrintRequest(request.Unwrap());
    std::cout << std::endl;

    // 4. A delete needs a bit the grant lacks
    std::cout << "4. Delegate attempts a delete..." << std::endl;
    auto denied = builder.Delete(
        RequestSigner::Delegate(delegate, certificate, owner.GetPublicKey()), {"somehash"});
    if (denied.IsErr()) {
        std::cout << "   refused: " << denied.UnwrapErr().message << std::endl;
    }
    std::cout << std::endl;

    // 5. Owner revokes
    std::cout << "5. Owner revokes the grant..." << std::endl;
    auto revoke = builder.RevokeSubaccount(owner, certificate.TokenHex(), now_ms);
    if (revoke.IsErr()) {
        std::cerr << "Revocation failed: " << revoke.UnwrapErr().message << std::endl;
        return 1;
    }
    PrintRequest(revoke.Unwrap());

    return 0;
}
