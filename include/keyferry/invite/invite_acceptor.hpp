#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include "keyferry/core/constants.hpp"
#include "keyferry/configuration/onboarding_config.hpp"
#include "keyferry/interfaces/invite_capabilities.hpp"
#include "keyferry/invite/invite_envelope.hpp"
#include "keyferry/keyring/keyring.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace keyferry::onboarding::invite {

struct AcceptOptions {
    interfaces::Clock now = interfaces::SystemClock();
    /// Tolerance added to expires_at
    std::chrono::milliseconds skew = kDefaultClockSkew;
    /// Reject invites that carry no role instead of defaulting to MEMBER
    bool require_role = false;
    /// When set, the signer must still be allowed to grant the invite's role
    interfaces::AuthorizeRoleFunction verify_issuer_still_authorized;
    /// When set, called once after the invite is committed as used
    interfaces::ApplyRoleFunction apply_role;

    [[nodiscard]] static AcceptOptions FromConfig(const configuration::OnboardingConfig& config) {
        AcceptOptions options;
        options.skew = config.ClockSkew();
        options.require_role = config.RequireRole();
        return options;
    }
};

struct AcceptResult {
    size_t imported_count = 0;
    bool rewrapped = false;
    std::string applied_role;
};

/**
 * @brief Verify, decrypt and import an invite into the local keyring
 *
 * Stages run strictly in order and the first failure ends the call:
 *
 *  1. version                  UnsupportedVersion
 *  2. signature                Authentication "Invalid signature"
 *  3. shape and role policy    Validation
 *  4. expiry (now <= exp+skew) Temporal "Invite expired"
 *  5. replay (is_used)         Replay "Invite already used"
 *  6. issuer still authorized  Authorization (only when configured)
 *  7. decrypt with code        Decryption "Invite decryption failed"
 *  8. import into keyring      keyring failures, KeyConflict
 *  9. commit (mark_used)       Storage, or Replay when another acceptor won
 * 10. apply role               apply_role failure (only when configured)
 *
 * Every signed field is covered by stage 2, so a tampered envelope fails
 * there whatever field was touched. Stages 1-7 have no side effects.
 * When stage 9 does not commit, the import from stage 8 is rolled back, so
 * the keyring never keeps generations from an invite that is not recorded
 * as used. Stage 10 runs only for the acceptance that committed; when it
 * fails the invite stays consumed and the keys stay imported.
 *
 * Stages 8-9 hold Keyring::LockForImport(): mark_used must not accept
 * another invite into the same keyring.
 */
class InviteAcceptor {
public:
    [[nodiscard]] static Result<AcceptResult, OnboardingFailure> AcceptInvite(
        const InviteEnvelope& envelope,
        std::string_view code,
        keyring::Keyring& keyring,
        const interfaces::VerifyFunction& verify,
        const interfaces::IsUsedFunction& is_used,
        const interfaces::MarkUsedFunction& mark_used,
        const AcceptOptions& options = {});

private:
    InviteAcceptor() = delete;
};
}
