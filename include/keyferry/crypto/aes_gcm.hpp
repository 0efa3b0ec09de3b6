#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace keyferry::onboarding::crypto {

/**
 * AES-256-GCM Authenticated Encryption with Associated Data (AEAD)
 *
 * Output of Encrypt() is ciphertext || 16-byte tag. Decrypt() fails on any
 * tag mismatch without releasing plaintext.
 *
 * NONCE UNIQUENESS: the caller MUST NOT reuse a (key, nonce) pair.
 * Both users in this library satisfy that structurally:
 *
 * - Invites derive a fresh key per invite from a fresh random salt, and
 *   encrypt exactly once under it.
 * - The keyring seals each generation key under a random 96-bit nonce;
 *   a keyring seals at most a few thousand values over its lifetime,
 *   far below the random-nonce collision bound.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, OnboardingFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, OnboardingFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
