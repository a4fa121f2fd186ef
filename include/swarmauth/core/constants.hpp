#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace swarmauth::protocol {

// libsodium buffer sizes not covered by protocol/constants.hpp
struct Constants {
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SCALAR_SIZE = 32;
    static constexpr size_t ED_25519_NONREDUCED_SCALAR_SIZE = 64;
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle already released";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "sodium_malloc failed for ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data does not fit the secure buffer";
    static constexpr std::string_view INVALID_HEX = "Input is not valid hexadecimal";
    static constexpr std::string_view INVALID_BASE64 = "Input is not valid base64";
    static constexpr std::string_view SIGNING_FAILED = "Ed25519 signing failed";
    static constexpr std::string_view SCALARMULT_FAILED = "Ed25519 scalar multiplication failed";
};

}
