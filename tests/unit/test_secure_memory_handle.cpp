#include <catch2/catch_test_macros.hpp>
#include "swarmauth/crypto/sodium_secure_memory_handle.hpp"
#include "swarmauth/crypto/sodium_interop.hpp"
#include "swarmauth/core/constants.hpp"
using namespace swarmauth::protocol;
using namespace swarmauth::protocol::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate secret key size") {
        auto result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == Constants::ED_25519_SECRET_KEY_SIZE);
    }
    SECTION("Cannot allocate zero bytes") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
    SECTION("Move assignment transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(64).Unwrap();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
}
TEST_CASE("SecureMemoryHandle - Read and Write", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
    SECTION("Written bytes read back") {
        const std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6, 7, 8};
        REQUIRE(handle.Write(data).IsOk());
        auto bytes = handle.ReadBytes(8);
        REQUIRE(bytes.IsOk());
        REQUIRE(bytes.Unwrap() == data);
    }
    SECTION("Short write zeroes the tail") {
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xFF)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{9, 9}).IsOk());
        REQUIRE(handle.ReadBytes(8).Unwrap() == std::vector<uint8_t>{9, 9, 0, 0, 0, 0, 0, 0});
    }
    SECTION("Oversized write fails") {
        auto result = handle.Write(std::vector<uint8_t>(9, 1));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Read into a short buffer fails") {
        std::vector<uint8_t> out(4);
        REQUIRE(handle.Read(out).IsErr());
    }
    SECTION("WithReadAccess sees the contents without copying out") {
        REQUIRE(handle.Write(std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8}).IsOk());
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            int total = 0;
            for (const uint8_t b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.IsOk());
        REQUIRE(sum.Unwrap() == 36);
    }
    SECTION("Disposed handle rejects access") {
        SecureMemoryHandle moved(std::move(handle));
        REQUIRE(handle.ReadBytes(1).IsErr());
        REQUIRE(handle.WithReadAccess([](std::span<const uint8_t>) { return 0; }).IsErr());
    }
}
