#include "keyferry/crypto/password_kdf.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
#include "keyferry/core/constants.hpp"

#include <openssl/evp.h>
#include <format>
#include <limits>

namespace keyferry::onboarding::crypto {

namespace {
    using KeyResult = Result<std::vector<uint8_t>, OnboardingFailure>;

    static_assert(PasswordKdf::INVITE_SALT_SIZE == crypto_pwhash_SALTBYTES,
                  "Invite salt size must match Argon2id salt size");
    static_assert(PasswordKdf::INVITE_SALT_SIZE == kInviteSaltBytes);
}

Result<std::vector<uint8_t>, OnboardingFailure> PasswordKdf::DeriveInviteKey(
    const std::string_view code,
    const std::span<const uint8_t> salt) {
    if (code.empty()) {
        return KeyResult::Err(
            OnboardingFailure::Validation("Invite code cannot be empty"));
    }
    if (salt.size() != INVITE_SALT_SIZE) {
        return KeyResult::Err(
            OnboardingFailure::Validation(
                std::format("Invite salt must be {} bytes, got {}", INVITE_SALT_SIZE, salt.size())));
    }
    if (!SodiumInterop::IsInitialized()) {
        return KeyResult::Err(
            OnboardingFailure::DeriveKey(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    std::vector<uint8_t> key(KEY_SIZE);
    const int result = crypto_pwhash(
        key.data(),
        key.size(),
        code.data(),
        code.size(),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_ARGON2ID13);
    if (result != SodiumConstants::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return KeyResult::Err(
            OnboardingFailure::DeriveKey("Argon2id derivation failed (out of memory?)"));
    }
    return KeyResult::Ok(std::move(key));
}

Result<std::vector<uint8_t>, OnboardingFailure> PasswordKdf::DeriveWrappingKey(
    const std::string_view passphrase,
    const std::span<const uint8_t> salt,
    const uint32_t iterations) {
    if (passphrase.empty()) {
        return KeyResult::Err(
            OnboardingFailure::Validation("Passphrase cannot be empty"));
    }
    if (salt.empty()) {
        return KeyResult::Err(
            OnboardingFailure::Validation("Wrapping key salt cannot be empty"));
    }
    if (iterations < MIN_WRAPPING_ITERATIONS ||
        iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        return KeyResult::Err(
            OnboardingFailure::Validation(
                std::format("PBKDF2 iteration count out of range: {}", iterations)));
    }
    if (passphrase.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        salt.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return KeyResult::Err(
            OnboardingFailure::Validation("PBKDF2 input exceeds maximum length"));
    }

    std::vector<uint8_t> key(KEY_SIZE);
    const int result = PKCS5_PBKDF2_HMAC(
        passphrase.data(),
        static_cast<int>(passphrase.size()),
        salt.data(),
        static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha256(),
        static_cast<int>(key.size()),
        key.data());
    if (result != OpenSSLConstants::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return KeyResult::Err(
            OnboardingFailure::DeriveKey("PBKDF2-HMAC-SHA256 derivation failed"));
    }
    return KeyResult::Ok(std::move(key));
}

}
