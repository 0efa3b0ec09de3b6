#include <catch2/catch_test_macros.hpp>
#include "helpers/onboarding_fixture.hpp"
#include "keyferry/encoding/base64_url.hpp"
#include <string>

using namespace keyferry::onboarding;
using namespace keyferry::onboarding::invite;
using namespace keyferry::onboarding::test_helpers;
using keyferry::onboarding::encoding::Base64Url;

namespace {
    std::string FlipFirstByte(const std::string& b64u) {
        auto bytes = Base64Url::Decode(b64u).Unwrap();
        REQUIRE_FALSE(bytes.empty());
        bytes[0] ^= 0x01;
        return Base64Url::Encode(bytes);
    }

    void RequireInvalidSignature(const Result<AcceptResult, OnboardingFailure>& result) {
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Authentication);
        REQUIRE(result.UnwrapErr().message == "Invalid signature");
    }

    void RequireMalformed(const Result<AcceptResult, OnboardingFailure>& result) {
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Validation);
        REQUIRE(result.UnwrapErr().message.starts_with("Malformed invite"));
    }
}

TEST_CASE("Envelope Tampering - Signed fields", "[attacks][tampering][critical]") {
    OnboardingScenario scenario;
    auto envelope = scenario.Issue().envelope;

    SECTION("Modified signature must fail") {
        envelope.sig_b64u = FlipFirstByte(envelope.sig_b64u);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Signature that is not base64url must fail") {
        envelope.sig_b64u = "!!" + envelope.sig_b64u;
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Modified ciphertext must fail at the signature") {
        envelope.ciphertext = FlipFirstByte(envelope.ciphertext);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Modified salt must fail") {
        envelope.salt = FlipFirstByte(envelope.salt);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Modified nonce must fail") {
        envelope.nonce = FlipFirstByte(envelope.nonce);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Extended expiry must fail") {
        envelope.meta.expires_at += std::chrono::hours(24 * 365);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Back-dated creation must fail") {
        envelope.meta.created_at -= std::chrono::milliseconds(1);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Injected role must fail") {
        envelope.role = "ADMIN";
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Stripped role must fail") {
        auto options = scenario.IssueOptionsAt();
        options.role = "VIEWER";
        auto with_role = scenario.Issue(options).envelope;
        with_role.role.reset();
        RequireInvalidSignature(scenario.Accept(with_role));
    }

    SECTION("Swapped signer key must fail") {
        auto attacker = MakeSigner();
        envelope.signer_pub_b64u = attacker->PublicKeyB64u();
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Tampering leaves no trace in the registry or keyring") {
        envelope.meta.expires_at += std::chrono::minutes(1);
        REQUIRE(scenario.Accept(envelope).IsErr());
        REQUIRE_FALSE(scenario.registry->IsUsed(envelope.meta.invite_id).Unwrap());
        REQUIRE(scenario.receiver->GenerationCount() == 0);
    }
}

TEST_CASE("Envelope Tampering - Re-signed envelopes", "[attacks][tampering]") {
    OnboardingScenario scenario;
    auto envelope = scenario.Issue().envelope;

    SECTION("Namespace swap is caught by the associated data") {
        envelope.meta.ns = "workspace-2";
        envelope.aad = BuildInviteAad(envelope.meta.ns, envelope.meta.invite_id);
        scenario.Resign(envelope);
        auto result = scenario.Accept(envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Decryption);
    }

    SECTION("Invite id swap is caught by the associated data") {
        envelope.meta.invite_id = "11111111-2222-4333-8444-555555555555";
        envelope.aad = BuildInviteAad(envelope.meta.ns, envelope.meta.invite_id);
        scenario.Resign(envelope);
        auto result = scenario.Accept(envelope);
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Decryption);
        REQUIRE_FALSE(scenario.registry->IsUsed(envelope.meta.invite_id).Unwrap());
    }

    SECTION("Pinned verifier rejects an envelope re-signed by another key") {
        auto attacker = MakeSigner();
        envelope.signer_pub_b64u = attacker->PublicKeyB64u();
        auto canonical = InviteEnvelopeCodec::CanonicalBytes(envelope).Unwrap();
        envelope.sig_b64u = Base64Url::Encode(attacker->Sign(canonical).Unwrap());

        const std::string trusted = scenario.signer->PublicKeyB64u();
        const interfaces::VerifyFunction pinned =
            [trusted](std::span<const uint8_t> data, std::span<const uint8_t> signature,
                      std::string_view signer_pub_b64u) -> Result<bool, OnboardingFailure> {
                if (signer_pub_b64u != trusted) {
                    return Result<bool, OnboardingFailure>::Ok(false);
                }
                return crypto::Ed25519Signer::Verify(data, signature, signer_pub_b64u);
            };
        auto result = InviteAcceptor::AcceptInvite(
            envelope, kTestCode, *scenario.receiver, pinned,
            scenario.registry->IsUsedCapability(),
            scenario.registry->MarkUsedCapability(),
            scenario.AcceptOptionsAt());
        RequireInvalidSignature(result);
    }
}

TEST_CASE("Envelope Tampering - Shape changes in transit", "[attacks][tampering][critical]") {
    OnboardingScenario scenario;
    auto envelope = scenario.Issue().envelope;

    SECTION("Future version is rejected before the signature") {
        envelope.v = 2;
        auto result = scenario.Accept(envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::UnsupportedVersion);
        REQUIRE(result.UnwrapErr().message == "Unsupported invite version: 2");
    }

    SECTION("Version zero is rejected") {
        envelope.v = 0;
        REQUIRE(scenario.Accept(envelope).UnwrapErr().type == OnboardingFailureType::UnsupportedVersion);
    }

    SECTION("Associated data that disagrees with metadata") {
        envelope.aad = "workspace-2:" + envelope.meta.invite_id;
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Namespace changed alone") {
        envelope.meta.ns = "workspace-2";
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Invite id changed alone") {
        envelope.meta.invite_id = "11111111-2222-4333-8444-555555555555";
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Separator inside the invite id") {
        envelope.meta.invite_id = "a:b";
        envelope.aad = BuildInviteAad(envelope.meta.ns, envelope.meta.invite_id);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Missing ciphertext") {
        envelope.ciphertext.clear();
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Missing signature") {
        envelope.sig_b64u.clear();
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Missing signer key") {
        envelope.signer_pub_b64u.clear();
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Expiry before creation") {
        envelope.meta.expires_at = envelope.meta.created_at - std::chrono::milliseconds(1);
        RequireInvalidSignature(scenario.Accept(envelope));
    }

    SECTION("Empty role") {
        envelope.role = "";
        RequireInvalidSignature(scenario.Accept(envelope));
    }
}

TEST_CASE("Envelope Tampering - Malformed envelopes from a valid signer", "[attacks][tampering]") {
    OnboardingScenario scenario;
    auto envelope = scenario.Issue().envelope;

    SECTION("Associated data that disagrees with metadata") {
        envelope.aad = "workspace-2:" + envelope.meta.invite_id;
        scenario.Resign(envelope);
        RequireMalformed(scenario.Accept(envelope));
    }

    SECTION("Separator inside the invite id") {
        envelope.meta.invite_id = "a:b";
        envelope.aad = BuildInviteAad(envelope.meta.ns, envelope.meta.invite_id);
        scenario.Resign(envelope);
        RequireMalformed(scenario.Accept(envelope));
    }

    SECTION("Missing ciphertext") {
        envelope.ciphertext.clear();
        scenario.Resign(envelope);
        RequireMalformed(scenario.Accept(envelope));
    }

    SECTION("Expiry before creation") {
        envelope.meta.expires_at = envelope.meta.created_at - std::chrono::milliseconds(1);
        scenario.Resign(envelope);
        RequireMalformed(scenario.Accept(envelope));
    }

    SECTION("Empty role") {
        envelope.role = "";
        scenario.Resign(envelope);
        RequireMalformed(scenario.Accept(envelope));
    }

    SECTION("Nothing is consumed") {
        envelope.ciphertext.clear();
        scenario.Resign(envelope);
        REQUIRE(scenario.Accept(envelope).IsErr());
        REQUIRE_FALSE(scenario.registry->IsUsed(envelope.meta.invite_id).Unwrap());
        REQUIRE(scenario.receiver->GenerationCount() == 0);
    }
}
