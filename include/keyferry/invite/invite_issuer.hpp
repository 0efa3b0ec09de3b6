#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include "keyferry/configuration/onboarding_config.hpp"
#include "keyferry/interfaces/invite_capabilities.hpp"
#include "keyferry/invite/invite_envelope.hpp"
#include "keyferry/keyring/keyring.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace keyferry::onboarding::invite {

struct IssueOptions {
    interfaces::Clock now = interfaces::SystemClock();
    /// Signed into the envelope; the acceptor reports it back
    std::optional<std::string> role;
    /// ttl above this is rejected; kAbsoluteMaxInviteTtl applies regardless
    std::optional<std::chrono::milliseconds> max_ttl;
    /// When set, asked whether the signer may grant the role (MEMBER when unset)
    interfaces::AuthorizeRoleFunction authorize;

    [[nodiscard]] static IssueOptions FromConfig(const configuration::OnboardingConfig& config) {
        IssueOptions options;
        options.max_ttl = config.MaxInviteTtl();
        return options;
    }
};

struct IssuedInvite {
    InviteEnvelope envelope;
    InviteMeta meta;
};

class InviteIssuer {
public:
    /**
     * @brief Package every keyring generation into a signed invite
     *
     * The payload is encrypted with AES-256-GCM under a key derived from
     * @p code (Argon2id, fresh salt) and bound to "<ns>:<invite_id>" as
     * associated data. The envelope is then signed through @p sign.
     *
     * All-or-nothing: any failure returns Err and no envelope. Entropy of
     * @p code is the caller's concern.
     */
    [[nodiscard]] static Result<IssuedInvite, OnboardingFailure> CreateInvite(
        const keyring::Keyring& keyring,
        std::string_view code,
        std::chrono::milliseconds ttl,
        std::string_view ns,
        const interfaces::SignFunction& sign,
        std::string_view signer_pub_b64u,
        const IssueOptions& options = {});

private:
    InviteIssuer() = delete;
};
}
