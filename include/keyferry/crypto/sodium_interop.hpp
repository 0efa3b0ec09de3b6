#pragma once

#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include "keyferry/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace keyferry::onboarding::crypto {

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Every primitive in the onboarding protocol goes through libsodium or
 * OpenSSL; this class owns library initialization and the small helpers
 * (wipe, compare, randomness) the higher layers share.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses sodium_memzero, which the compiler may not elide. Safe to call
     * before Initialize() and on empty spans.
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate Ed25519 (EdDSA) key pair
     *
     * @return Ok((secret_key, public_key)) or Err
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, OnboardingFailure>
    GenerateEd25519KeyPair();

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Random RFC 4122 version 4 UUID in canonical lowercase form
     */
    static std::string GenerateUuidV4();

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace keyferry::onboarding::crypto
