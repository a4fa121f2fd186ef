#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/core/format.hpp"

#include <cstring>

namespace swarmauth::protocol::crypto {

namespace {
    Result<Unit, SodiumFailure> NotInitialized() {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, [] {
        // sodium_init returns 1 when already initialised elsewhere
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (IsInitialized()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    return Result<Unit, SodiumFailure>::Err(
        SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(const std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return NotInitialized();
    }
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    const std::span<const uint8_t> a,
    const std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(SodiumFailure::ComparisonFailed(compat::format(
            "{}: {}", ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED, ErrorMessages::NOT_INITIALIZED)));
    }
    // Lengths are public; only the contents are compared in constant time
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> bytes(size);
    if (size > 0) {
        randombytes_buf(bytes.data(), size);
    }
    return bytes;
}

// ============================================================================
// Text Codecs
// ============================================================================

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                std::string(ErrorMessages::INVALID_HEX) + " (odd length " +
                std::to_string(hex.size()) + ")"));
    }

    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t bin_len = 0;
    const char* hex_end = nullptr;
    const int rc = sodium_hex2bin(
        bytes.data(), bytes.size(),
        hex.data(), hex.size(),
        nullptr, &bin_len, &hex_end);
    if (rc != SodiumConstants::SUCCESS ||
        hex_end != hex.data() + hex.size() ||
        bin_len != bytes.size()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::INVALID_HEX)));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bytes));
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(std::strlen(encoded.c_str()));
    return encoded;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(std::string_view encoded) {
    std::vector<uint8_t> bytes(encoded.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* b64_end = nullptr;
    const int rc = sodium_base642bin(
        bytes.data(), bytes.size(),
        encoded.data(), encoded.size(),
        nullptr, &bin_len, &b64_end,
        sodium_base64_VARIANT_ORIGINAL);
    if (rc != SodiumConstants::SUCCESS || b64_end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::INVALID_BASE64)));
    }
    bytes.resize(bin_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bytes));
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace swarmauth::protocol::crypto
