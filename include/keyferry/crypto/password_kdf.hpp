#pragma once

#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace keyferry::onboarding::crypto {

/**
 * @brief Password-hardened key derivation
 *
 * Two derivations, one per low-entropy secret in the system:
 *
 * - Invite codes go through Argon2id (libsodium crypto_pwhash) with fixed
 *   interactive limits. The limits are part of envelope version 1, so the
 *   acceptor can re-derive without any parameters on the wire.
 * - Keyring passphrases go through PBKDF2-HMAC-SHA256 (OpenSSL) with an
 *   iteration count chosen at keyring creation and persisted next to the
 *   salt.
 *
 * Both return 32-byte keys suitable for AesGcm. Callers own the returned
 * buffer and must wipe it.
 */
class PasswordKdf {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, OnboardingFailure> DeriveInviteKey(
        std::string_view code,
        std::span<const uint8_t> salt);

    [[nodiscard]] static Result<std::vector<uint8_t>, OnboardingFailure> DeriveWrappingKey(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        uint32_t iterations);

    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t INVITE_SALT_SIZE = 16;
    static constexpr uint32_t MIN_WRAPPING_ITERATIONS = 1;

private:
    PasswordKdf() = delete;
};

}
