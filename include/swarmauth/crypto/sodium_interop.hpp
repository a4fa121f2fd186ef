#pragma once

#include "swarmauth/core/result.hpp"
#include "swarmauth/core/failures.hpp"
#include "swarmauth/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace swarmauth::protocol::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Initialisation, wiping, constant-time comparison and the text codecs
 * (lowercase hex, standard padded base64) used by every request field.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every public entry point of the library
     * calls this before touching key material.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer with sodium_memzero (not elided by the optimiser)
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different or of different size
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Text Codecs
    // ========================================================================

    /**
     * @brief Lowercase hex encoding
     */
    static std::string ToHex(std::span<const uint8_t> data);

    /**
     * @brief Strict hex decoding
     *
     * Accepts upper and lower case. Rejects odd lengths and any character
     * that is not a hex digit.
     */
    static Result<std::vector<uint8_t>, SodiumFailure> FromHex(std::string_view hex);

    /**
     * @brief Standard (RFC 4648) padded base64 encoding
     */
    static std::string ToBase64(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view encoded);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged memory with sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace swarmauth::protocol::crypto
