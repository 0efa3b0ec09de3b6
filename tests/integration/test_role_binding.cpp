#include <catch2/catch_test_macros.hpp>
#include "helpers/onboarding_fixture.hpp"
#include "helpers/membership_directory.hpp"
#include "keyferry/configuration/onboarding_config.hpp"
#include <stdexcept>

using namespace keyferry::onboarding;
using namespace keyferry::onboarding::invite;
using namespace keyferry::onboarding::test_helpers;
using keyferry::onboarding::configuration::OnboardingConfig;

TEST_CASE("Role Binding - Role travels with the invite", "[integration][role]") {
    OnboardingScenario scenario;

    SECTION("Signed role is applied") {
        auto options = scenario.IssueOptionsAt();
        options.role = "ADMIN";
        const auto issued = scenario.Issue(options);
        REQUIRE(issued.envelope.role == std::optional<std::string>("ADMIN"));

        auto result = scenario.Accept(issued.envelope);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().applied_role == "ADMIN");
    }

    SECTION("Role survives JSON transport") {
        auto options = scenario.IssueOptionsAt();
        options.role = "VIEWER";
        const auto issued = scenario.Issue(options);
        auto json = InviteEnvelopeCodec::ToJson(issued.envelope).Unwrap();
        REQUIRE(json.find("\"role\"") != std::string::npos);

        auto result = scenario.Accept(InviteEnvelopeCodec::FromJson(json).Unwrap());
        REQUIRE(result.Unwrap().applied_role == "VIEWER");
    }

    SECTION("Invite without a role defaults to MEMBER") {
        auto result = scenario.Accept(scenario.Issue().envelope);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().applied_role == kDefaultRole);
    }
}

TEST_CASE("Role Binding - Strict mode", "[integration][role]") {
    OnboardingScenario scenario;
    auto strict = scenario.AcceptOptionsAt();
    strict.require_role = true;

    SECTION("Invite without a role is rejected") {
        const auto issued = scenario.Issue();
        auto result = scenario.Accept(issued.envelope, strict);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Validation);
        REQUIRE(result.UnwrapErr().message == "Invite carries no role");
        REQUIRE_FALSE(scenario.registry->IsUsed(issued.meta.invite_id).Unwrap());
    }

    SECTION("Invite with a role is accepted") {
        auto options = scenario.IssueOptionsAt();
        options.role = "MEMBER";
        auto result = scenario.Accept(scenario.Issue(options).envelope, strict);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().applied_role == "MEMBER");
    }

    SECTION("High security profile turns strict mode on") {
        auto from_config = AcceptOptions::FromConfig(OnboardingConfig::HighSecurity());
        from_config.now = scenario.clock.AsClock();
        auto result = scenario.Accept(scenario.Issue().envelope, from_config);
        REQUIRE(result.UnwrapErr().message == "Invite carries no role");
    }

    SECTION("Stripping the role does not get past strict mode") {
        auto options = scenario.IssueOptionsAt();
        options.role = "ADMIN";
        auto envelope = scenario.Issue(options).envelope;
        envelope.role.reset();
        auto result = scenario.Accept(envelope, strict);
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Authentication);
        REQUIRE(result.UnwrapErr().message == "Invalid signature");
    }
}

TEST_CASE("Role Binding - Issue-time authorization", "[integration][role][authorization]") {
    OnboardingScenario scenario;
    MembershipDirectory membership;
    const std::string issuer = scenario.signer->PublicKeyB64u();

    auto issue_as = [&](std::string_view role) {
        auto options = scenario.IssueOptionsAt();
        options.role = std::string(role);
        options.authorize = membership.AuthorizeCapability();
        return InviteIssuer::CreateInvite(
            *scenario.sender, kTestCode, 60'000ms, kTestNamespace,
            crypto::Ed25519Signer::SignCapability(scenario.signer), issuer, options);
    };
    auto require_denied = [](const Result<IssuedInvite, OnboardingFailure>& result, std::string_view message) {
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Authorization);
        REQUIRE(result.UnwrapErr().message == message);
    };

    SECTION("OWNER can issue OWNER invites") {
        membership.SetRole(issuer, "OWNER");
        auto issued = issue_as("OWNER");
        REQUIRE(issued.IsOk());
        REQUIRE(issued.Unwrap().envelope.role == std::optional<std::string>("OWNER"));
        REQUIRE(issued.Unwrap().meta.ns == kTestNamespace);
    }

    SECTION("ADMIN can issue MEMBER invites") {
        membership.SetRole(issuer, "ADMIN");
        auto issued = issue_as("MEMBER");
        REQUIRE(issued.IsOk());
        REQUIRE(issued.Unwrap().envelope.role == std::optional<std::string>("MEMBER"));
    }

    SECTION("ADMIN cannot issue OWNER invites") {
        membership.SetRole(issuer, "ADMIN");
        require_denied(issue_as("OWNER"), "Access denied: ADMIN cannot issue OWNER invites");
    }

    SECTION("MEMBER cannot issue any invites") {
        membership.SetRole(issuer, "MEMBER");
        require_denied(issue_as("MEMBER"), "Access denied: INVITE_CREATE requires ADMIN, user has MEMBER");
    }

    SECTION("Unknown issuer cannot issue invites") {
        require_denied(issue_as("VIEWER"), "Access denied: INVITE_CREATE requires ADMIN, user has none");
    }

    SECTION("Invite without a role is authorized as MEMBER") {
        membership.SetRole(issuer, "ADMIN");
        auto options = scenario.IssueOptionsAt();
        std::string asked;
        options.authorize = [&asked](std::string_view, std::string_view role) {
            asked = std::string(role);
            return Result<Unit, OnboardingFailure>::Ok(unit);
        };
        auto issued = scenario.Issue(options);
        REQUIRE(asked == kDefaultRole);
        REQUIRE_FALSE(issued.envelope.role.has_value());
    }

    SECTION("Policy hook that throws is a denial") {
        auto options = scenario.IssueOptionsAt();
        options.role = "ADMIN";
        options.authorize = [](std::string_view, std::string_view) -> Result<Unit, OnboardingFailure> {
            throw std::runtime_error("directory offline");
        };
        auto issued = InviteIssuer::CreateInvite(
            *scenario.sender, kTestCode, 60'000ms, kTestNamespace,
            crypto::Ed25519Signer::SignCapability(scenario.signer), issuer, options);
        require_denied(issued, "directory offline");
    }
}

TEST_CASE("Role Binding - Accept-time enforcement", "[integration][role][authorization]") {
    OnboardingScenario scenario;
    MembershipDirectory membership;
    const std::string issuer = scenario.signer->PublicKeyB64u();

    auto issue_as = [&](std::string_view role) {
        auto options = scenario.IssueOptionsAt();
        options.role = std::string(role);
        options.authorize = membership.AuthorizeCapability();
        return scenario.Issue(options);
    };

    SECTION("Accept applies the bound OWNER role to membership") {
        membership.SetRole(issuer, "OWNER");
        const auto issued = issue_as("OWNER");
        auto options = scenario.AcceptOptionsAt();
        options.apply_role = membership.ApplyRoleCapability("new-user-123");

        auto result = scenario.Accept(issued.envelope, options);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().applied_role == "OWNER");
        REQUIRE(membership.RoleOf("new-user-123") == std::optional<std::string>("OWNER"));
    }

    SECTION("Accept applies the bound MEMBER role") {
        membership.SetRole(issuer, "ADMIN");
        const auto issued = issue_as("MEMBER");
        auto options = scenario.AcceptOptionsAt();
        options.apply_role = membership.ApplyRoleCapability("new-member-456");

        auto result = scenario.Accept(issued.envelope, options);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().applied_role == "MEMBER");
        REQUIRE(result.Unwrap().imported_count > 0);
        REQUIRE(membership.RoleOf("new-member-456") == std::optional<std::string>("MEMBER"));
    }

    SECTION("Invite without a role applies MEMBER") {
        auto options = scenario.AcceptOptionsAt();
        options.apply_role = membership.ApplyRoleCapability("legacy-user");
        REQUIRE(scenario.Accept(scenario.Issue().envelope, options).IsOk());
        REQUIRE(membership.RoleOf("legacy-user") == std::optional<std::string>(kDefaultRole));
    }

    SECTION("Issuer downgraded before accept") {
        membership.SetRole(issuer, "OWNER");
        const auto issued = issue_as("OWNER");
        membership.SetRole(issuer, "MEMBER");

        auto options = scenario.AcceptOptionsAt();
        options.verify_issuer_still_authorized = membership.AuthorizeCapability();
        options.apply_role = membership.ApplyRoleCapability("reauth-user");
        auto result = scenario.Accept(issued.envelope, options);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Authorization);
        REQUIRE(result.UnwrapErr().message == "Issuer no longer authorized to issue OWNER invites");
        REQUIRE_FALSE(scenario.registry->IsUsed(issued.meta.invite_id).Unwrap());
        REQUIRE(scenario.receiver->GenerationCount() == 0);
        REQUIRE_FALSE(membership.RoleOf("reauth-user").has_value());

        membership.SetRole(issuer, "OWNER");
        REQUIRE(scenario.Accept(issued.envelope, options).IsOk());
        REQUIRE(membership.RoleOf("reauth-user") == std::optional<std::string>("OWNER"));
    }

    SECTION("Issuer still authorized") {
        membership.SetRole(issuer, "ADMIN");
        const auto issued = issue_as("VIEWER");
        auto options = scenario.AcceptOptionsAt();
        options.verify_issuer_still_authorized = membership.AuthorizeCapability();
        auto result = scenario.Accept(issued.envelope, options);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().applied_role == "VIEWER");
    }

    SECTION("Replayed invite does not apply the role again") {
        membership.SetRole(issuer, "ADMIN");
        const auto issued = issue_as("ADMIN");
        auto options = scenario.AcceptOptionsAt();
        options.apply_role = membership.ApplyRoleCapability("new-admin");

        REQUIRE(scenario.Accept(issued.envelope, options).IsOk());
        auto replay = scenario.Accept(issued.envelope, options);
        REQUIRE(replay.UnwrapErr().type == OnboardingFailureType::Replay);
        REQUIRE(membership.ApplyCount() == 1);
    }

    SECTION("Role application failure is reported after the commit") {
        membership.SetRole(issuer, "ADMIN");
        const auto issued = issue_as("MEMBER");
        auto options = scenario.AcceptOptionsAt();
        options.apply_role = [](std::string_view, std::string_view) -> Result<Unit, OnboardingFailure> {
            throw std::runtime_error("membership store unavailable");
        };

        auto result = scenario.Accept(issued.envelope, options);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Generic);
        REQUIRE(result.UnwrapErr().message == "Role application failed: membership store unavailable");
        REQUIRE(scenario.registry->IsUsed(issued.meta.invite_id).Unwrap());
        REQUIRE(scenario.receiver->GenerationCount() == 2);
    }

    SECTION("Tampered role fails at the signature, before any policy hook") {
        membership.SetRole(issuer, "ADMIN");
        auto envelope = issue_as("MEMBER").envelope;
        envelope.role = "OWNER";
        auto options = scenario.AcceptOptionsAt();
        options.verify_issuer_still_authorized = membership.AuthorizeCapability();
        options.apply_role = membership.ApplyRoleCapability("tamper-user");

        auto result = scenario.Accept(envelope, options);
        REQUIRE(result.UnwrapErr().message == "Invalid signature");
        REQUIRE(membership.ApplyCount() == 0);
    }
}
