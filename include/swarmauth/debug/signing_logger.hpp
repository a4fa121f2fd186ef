#pragma once

/**
 * @file signing_logger.hpp
 * @brief Debug trace of canonical messages, tokens and signatures.
 *
 * SECURITY WARNING: with SWARMAUTH_DEBUG_SIGNING defined this prints key
 * material and signatures to stdout. It exists to diff canonical bytes
 * against a storage node when a signature is rejected. Never enable it in
 * a release build.
 *
 * Enable via CMake: -DSWARMAUTH_DEBUG_SIGNING=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace swarmauth::debug {

enum class Role {
    Owner,
    Delegate,
    Any
};

#ifdef SWARMAUTH_DEBUG_SIGNING

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline const char* RoleToString(Role role) {
    switch (role) {
        case Role::Owner: return "OWNER";
        case Role::Delegate: return "DELEGATE";
        default: return "ANY";
    }
}

#define SWARMAUTH_LOG_KEY(role, operation, key_name, data) \
    do { \
        fprintf(stdout, "[SWARMAUTH-DEBUG] %s %s %s: %s\n", \
            ::swarmauth::debug::RoleToString(role), \
            operation, \
            key_name, \
            ::swarmauth::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SWARMAUTH_LOG_VALUE(role, operation, name, value) \
    do { \
        fprintf(stdout, "[SWARMAUTH-DEBUG] %s %s %s: %s\n", \
            ::swarmauth::debug::RoleToString(role), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SWARMAUTH_LOG_MSG(role, operation, message) \
    do { \
        fprintf(stdout, "[SWARMAUTH-DEBUG] %s %s %s\n", \
            ::swarmauth::debug::RoleToString(role), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

inline void LogCanonicalMessage(
    std::string_view method,
    std::span<const uint8_t> message) {

    fprintf(stdout, "[SWARMAUTH-DEBUG] ANY CANONICAL %.*s: \"%.*s\"\n",
        static_cast<int>(method.size()), method.data(),
        static_cast<int>(message.size()), reinterpret_cast<const char*>(message.data()));
    fflush(stdout);
}

inline void LogTokenLayout(
    uint8_t prefix,
    uint8_t permissions,
    std::span<const uint8_t> reserved,
    std::span<const uint8_t> token_public_key) {

    SWARMAUTH_LOG_VALUE(Role::Owner, "TOKEN", "prefix", prefix);
    SWARMAUTH_LOG_VALUE(Role::Owner, "TOKEN", "permissions", permissions);
    SWARMAUTH_LOG_KEY(Role::Owner, "TOKEN", "reserved", reserved);
    SWARMAUTH_LOG_KEY(Role::Owner, "TOKEN", "token_public_key", token_public_key);
}

inline void LogDelegationCreated(
    bool blinded,
    std::span<const uint8_t> target_public_key,
    std::span<const uint8_t> token,
    std::span<const uint8_t> owner_signature) {

    SWARMAUTH_LOG_MSG(Role::Owner, "GRANT", blinded
        ? "blinding: ON"
        : "blinding: OFF (token exposes the delegate key, no unlinkability)");
    SWARMAUTH_LOG_KEY(Role::Owner, "GRANT", "target_public_key", target_public_key);
    SWARMAUTH_LOG_KEY(Role::Owner, "GRANT", "token", token);
    SWARMAUTH_LOG_KEY(Role::Owner, "GRANT", "owner_signature", owner_signature);
}

inline void LogDelegatedSignature(
    bool blinded,
    std::span<const uint8_t> verifying_key,
    std::span<const uint8_t> signature) {

    SWARMAUTH_LOG_MSG(Role::Delegate, "SIGN", blinded ? "scalar: k*t" : "scalar: t");
    SWARMAUTH_LOG_KEY(Role::Delegate, "SIGN", "verifying_key", verifying_key);
    SWARMAUTH_LOG_KEY(Role::Delegate, "SIGN", "signature", signature);
}

#else // !SWARMAUTH_DEBUG_SIGNING

#define SWARMAUTH_LOG_KEY(role, operation, key_name, data) ((void)0)
#define SWARMAUTH_LOG_VALUE(role, operation, name, value) ((void)0)
#define SWARMAUTH_LOG_MSG(role, operation, message) ((void)0)

inline void LogCanonicalMessage(std::string_view, std::span<const uint8_t>) {}
inline void LogTokenLayout(uint8_t, uint8_t, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogDelegationCreated(bool, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>) {}
inline void LogDelegatedSignature(bool, std::span<const uint8_t>, std::span<const uint8_t>) {}

#endif // SWARMAUTH_DEBUG_SIGNING

} // namespace swarmauth::debug
