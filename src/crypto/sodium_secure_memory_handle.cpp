#include "swarmauth/crypto/sodium_secure_memory_handle.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/core/constants.hpp"
#include "swarmauth/core/format.hpp"

#include <cstring>
#include <string>
#include <utility>

namespace swarmauth::protocol::crypto {

namespace {
    SodiumFailure Disposed() {
        return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
    }
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    using AllocateResult = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return AllocateResult::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return AllocateResult::Err(
            SodiumFailure::AllocationFailed("Secure allocation of zero bytes"));
    }

    void* memory = SodiumInterop::AllocateSecure(size);
    if (memory == nullptr) {
        return AllocateResult::Err(SodiumFailure::AllocationFailed(compat::format(
            "{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return AllocateResult::Ok(SecureMemoryHandle(memory, size));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , size_(std::exchange(other.size_, 0)) {
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = std::exchange(other.ptr_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ == nullptr) {
        return;
    }
    // sodium_free wipes before unmapping
    SodiumInterop::FreeSecure(ptr_);
    ptr_ = nullptr;
    size_ = 0;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(const std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(compat::format(
            "{} ({} > {})", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }

    auto* bytes = static_cast<uint8_t*>(ptr_);
    if (!data.empty()) {
        std::memcpy(bytes, data.data(), data.size());
    }
    sodium_memzero(bytes + data.size(), size_ - data.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(const std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(compat::format(
            "Output holds {} bytes, handle holds {}", output.size(), size_)));
    }
    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(Disposed());
    }
    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(compat::format(
            "Requested {} bytes from a {}-byte handle", size, size_)));
    }
    const auto* bytes = static_cast<const uint8_t*>(ptr_);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::vector<uint8_t>(bytes, bytes + size));
}

}
