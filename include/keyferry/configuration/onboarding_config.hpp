#pragma once

#include "keyferry/core/constants.hpp"

#include <chrono>
#include <cstdint>

namespace keyferry::onboarding::configuration {

/// Tunables for keyring creation and invite issue/accept
///
/// Profiles:
/// - Default: 200k PBKDF2 rounds, 5 minute skew, 7 day max ttl
/// - HighSecurity: 600k rounds, 1 minute skew, 1 day max ttl, role required
/// - ForTesting: 1k rounds so unit tests stay fast; otherwise Default
///
/// @example
/// ```cpp
/// constexpr auto config = OnboardingConfig::HighSecurity();
/// auto init = keyring.InitNew(passphrase, config.KeyringKdfIterations());
/// ```
class OnboardingConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr OnboardingConfig Default() noexcept {
        return OnboardingConfig(
            kDefaultKeyringKdfIterations,
            kDefaultClockSkew,
            kDefaultMaxInviteTtl,
            false);
    }

    /// Shorter windows and a mandatory role on every accepted invite
    [[nodiscard]] static constexpr OnboardingConfig HighSecurity() noexcept {
        return OnboardingConfig(
            kHighSecurityKeyringKdfIterations,
            kHighSecurityClockSkew,
            kHighSecurityMaxInviteTtl,
            true);
    }

    /// Never use outside tests: the keyring KDF is deliberately cheap
    [[nodiscard]] static constexpr OnboardingConfig ForTesting() noexcept {
        return OnboardingConfig(
            kTestingKeyringKdfIterations,
            kDefaultClockSkew,
            kDefaultMaxInviteTtl,
            false);
    }

    [[nodiscard]] static constexpr OnboardingConfig Custom(
        const uint32_t keyring_kdf_iterations,
        const std::chrono::milliseconds clock_skew,
        const std::chrono::milliseconds max_invite_ttl,
        const bool require_role) noexcept {
        return OnboardingConfig(keyring_kdf_iterations, clock_skew, max_invite_ttl, require_role);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr uint32_t KeyringKdfIterations() const noexcept {
        return keyring_kdf_iterations_;
    }

    [[nodiscard]] constexpr std::chrono::milliseconds ClockSkew() const noexcept {
        return clock_skew_;
    }

    [[nodiscard]] constexpr std::chrono::milliseconds MaxInviteTtl() const noexcept {
        return max_invite_ttl_;
    }

    [[nodiscard]] constexpr bool RequireRole() const noexcept {
        return require_role_;
    }

    /// Rejects values the issuer or keyring would refuse anyway
    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return keyring_kdf_iterations_ > 0 &&
               clock_skew_.count() >= 0 &&
               max_invite_ttl_.count() > 0 &&
               max_invite_ttl_ <= kAbsoluteMaxInviteTtl;
    }

    [[nodiscard]] constexpr bool operator==(const OnboardingConfig& other) const noexcept {
        return keyring_kdf_iterations_ == other.keyring_kdf_iterations_ &&
               clock_skew_ == other.clock_skew_ &&
               max_invite_ttl_ == other.max_invite_ttl_ &&
               require_role_ == other.require_role_;
    }

    [[nodiscard]] constexpr bool operator!=(const OnboardingConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr OnboardingConfig(
        const uint32_t keyring_kdf_iterations,
        const std::chrono::milliseconds clock_skew,
        const std::chrono::milliseconds max_invite_ttl,
        const bool require_role) noexcept
        : keyring_kdf_iterations_(keyring_kdf_iterations)
        , clock_skew_(clock_skew)
        , max_invite_ttl_(max_invite_ttl)
        , require_role_(require_role) {}

    uint32_t keyring_kdf_iterations_;
    std::chrono::milliseconds clock_skew_;
    std::chrono::milliseconds max_invite_ttl_;
    bool require_role_;
};

} // namespace keyferry::onboarding::configuration
