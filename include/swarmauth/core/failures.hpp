#pragma once
#include <string>
#include <string_view>
#include <utility>
namespace swarmauth::protocol {
/// Failures raised by the libsodium wrapper layer
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    AllocationFailed,
    ComparisonFailed,
    InvalidOperation
};
/// Failures of key handling, encoding, signing and delegation
enum class AuthFailureType {
    InvalidSeedLength,
    InvalidKeyLength,
    MalformedToken,
    ReservedBytesNonZero,
    UnsupportedOperation,
    MissingRequiredField,
    KeyGeneration,
    KeyDerivation,
    Signing,
    Encoding,
    Decode,
    PermissionDenied,
    PrefixMismatch,
    Initialization
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class AuthFailure {
public:
    AuthFailureType type;
    std::string message;
    AuthFailure(const AuthFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static AuthFailure InvalidSeedLength(std::string msg) {
        return {AuthFailureType::InvalidSeedLength, std::move(msg)};
    }
    static AuthFailure InvalidKeyLength(std::string msg) {
        return {AuthFailureType::InvalidKeyLength, std::move(msg)};
    }
    static AuthFailure MalformedToken(std::string msg) {
        return {AuthFailureType::MalformedToken, std::move(msg)};
    }
    static AuthFailure ReservedBytesNonZero(std::string msg) {
        return {AuthFailureType::ReservedBytesNonZero, std::move(msg)};
    }
    static AuthFailure UnsupportedOperation(std::string msg) {
        return {AuthFailureType::UnsupportedOperation, std::move(msg)};
    }
    static AuthFailure MissingRequiredField(std::string msg) {
        return {AuthFailureType::MissingRequiredField, std::move(msg)};
    }
    static AuthFailure KeyGeneration(std::string msg) {
        return {AuthFailureType::KeyGeneration, std::move(msg)};
    }
    static AuthFailure KeyDerivation(std::string msg) {
        return {AuthFailureType::KeyDerivation, std::move(msg)};
    }
    static AuthFailure Signing(std::string msg) {
        return {AuthFailureType::Signing, std::move(msg)};
    }
    static AuthFailure Encoding(std::string msg) {
        return {AuthFailureType::Encoding, std::move(msg)};
    }
    static AuthFailure Decode(std::string msg) {
        return {AuthFailureType::Decode, std::move(msg)};
    }
    static AuthFailure PermissionDenied(std::string msg) {
        return {AuthFailureType::PermissionDenied, std::move(msg)};
    }
    static AuthFailure PrefixMismatch(std::string msg) {
        return {AuthFailureType::PrefixMismatch, std::move(msg)};
    }
    static AuthFailure Initialization(std::string msg) {
        return {AuthFailureType::Initialization, std::move(msg)};
    }
    static AuthFailure FromSodiumFailure(
        const SodiumFailure& sf,
        const AuthFailureType context = AuthFailureType::KeyGeneration) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return Initialization(sf.message);
        }
        return {context, sf.message};
    }
};
}
