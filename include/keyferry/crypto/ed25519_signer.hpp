#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include "keyferry/crypto/sodium_secure_memory_handle.hpp"
#include "keyferry/interfaces/invite_capabilities.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace keyferry::onboarding::crypto {

/**
 * @brief Ed25519 identity key used to sign invite envelopes
 *
 * The secret key lives in a SecureMemoryHandle for the lifetime of the
 * signer and is copied out only for the duration of a single
 * crypto_sign_detached call. Move-only.
 *
 * The protocol core never sees this class: it receives the SignFunction /
 * VerifyFunction built by SignCapability() and VerifyCapability().
 */
class Ed25519Signer {
public:
    [[nodiscard]] static Result<Ed25519Signer, OnboardingFailure> Generate();

    /// @param secret_key 64-byte libsodium secret key (seed || public key)
    [[nodiscard]] static Result<Ed25519Signer, OnboardingFailure> FromSecretKey(
        std::span<const uint8_t> secret_key);

    Ed25519Signer(Ed25519Signer&&) noexcept = default;
    Ed25519Signer& operator=(Ed25519Signer&&) noexcept = default;
    Ed25519Signer(const Ed25519Signer&) = delete;
    Ed25519Signer& operator=(const Ed25519Signer&) = delete;
    ~Ed25519Signer() = default;

    [[nodiscard]] Result<std::vector<uint8_t>, OnboardingFailure> Sign(
        std::span<const uint8_t> data) const;

    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const noexcept { return public_key_; }

    [[nodiscard]] std::string PublicKeyB64u() const;

    /**
     * @brief Verify a detached signature
     *
     * Ok(false) for a wrong signature, a signature or key of the wrong
     * length, or an undecodable public key. Err only when the library is
     * not initialized.
     */
    [[nodiscard]] static Result<bool, OnboardingFailure> Verify(
        std::span<const uint8_t> data,
        std::span<const uint8_t> signature,
        std::string_view signer_pub_b64u);

    [[nodiscard]] static interfaces::SignFunction SignCapability(
        std::shared_ptr<const Ed25519Signer> signer);

    [[nodiscard]] static interfaces::VerifyFunction VerifyCapability();

private:
    Ed25519Signer(SecureMemoryHandle secret_key, std::vector<uint8_t> public_key) noexcept
        : secret_key_(std::move(secret_key)), public_key_(std::move(public_key)) {}

    SecureMemoryHandle secret_key_;
    std::vector<uint8_t> public_key_;
};
}
