#include <catch2/catch_test_macros.hpp>
#include "helpers/onboarding_fixture.hpp"
#include "helpers/failing_storage_driver.hpp"
#include <stdexcept>

using namespace keyferry::onboarding;
using namespace keyferry::onboarding::invite;
using namespace keyferry::onboarding::test_helpers;

TEST_CASE("Fail Closed - Wrong invite code", "[security][fail_closed][critical]") {
    OnboardingScenario scenario;
    const auto issued = scenario.Issue();

    SECTION("Wrong code is a decryption failure with no side effects") {
        auto result = scenario.Accept(issued.envelope, "SECRET124");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Decryption);
        REQUIRE(result.UnwrapErr().message == "Invite decryption failed");
        REQUIRE(result.UnwrapErr().IsRetryableWithDifferentCode());

        REQUIRE_FALSE(scenario.registry->IsUsed(issued.meta.invite_id).Unwrap());
        REQUIRE(scenario.receiver->GenerationCount() == 0);
        REQUIRE_FALSE(scenario.receiver->CurrentGenerationId().has_value());
    }

    SECTION("Correct code still works after a wrong attempt") {
        REQUIRE(scenario.Accept(issued.envelope, "wrong").IsErr());
        auto result = scenario.Accept(issued.envelope);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().imported_count == 2);
    }

    SECTION("Empty code is rejected before any crypto") {
        auto result = scenario.Accept(issued.envelope, "");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Validation);
    }
}

TEST_CASE("Fail Closed - Misbehaving capabilities", "[security][fail_closed]") {
    OnboardingScenario scenario;
    const auto issued = scenario.Issue();
    const auto options = scenario.AcceptOptionsAt();
    const auto verify = crypto::Ed25519Signer::VerifyCapability();
    const auto is_used = scenario.registry->IsUsedCapability();
    const auto mark_used = scenario.registry->MarkUsedCapability();

    SECTION("Missing capability") {
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *scenario.receiver, verify, is_used, nullptr, options);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Validation);
    }

    SECTION("Negative clock skew") {
        auto skewed = options;
        skewed.skew = std::chrono::milliseconds(-1);
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *scenario.receiver, verify, is_used, mark_used, skewed);
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Validation);
    }

    SECTION("Verifier that throws is an invalid signature") {
        const interfaces::VerifyFunction throwing = [](auto, auto, auto) -> Result<bool, OnboardingFailure> {
            throw std::runtime_error("verifier crashed");
        };
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *scenario.receiver, throwing, is_used, mark_used, options);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Authentication);
        REQUIRE(result.UnwrapErr().message == "Invalid signature");
    }

    SECTION("Verifier that errors is an invalid signature") {
        const interfaces::VerifyFunction failing = [](auto, auto, auto) {
            return Result<bool, OnboardingFailure>::Err(OnboardingFailure::Generic("key service down"));
        };
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *scenario.receiver, failing, is_used, mark_used, options);
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Authentication);
    }

    SECTION("Replay check error is propagated") {
        const interfaces::IsUsedFunction failing = [](std::string_view) {
            return Result<bool, OnboardingFailure>::Err(OnboardingFailure::Storage("registry offline"));
        };
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *scenario.receiver, verify, failing, mark_used, options);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Storage);
        REQUIRE(result.UnwrapErr().message == "registry offline");
        REQUIRE(scenario.receiver->GenerationCount() == 0);
    }

    SECTION("Replay check that throws is a storage failure") {
        const interfaces::IsUsedFunction throwing = [](std::string_view) -> Result<bool, OnboardingFailure> {
            throw std::runtime_error("disk unplugged");
        };
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *scenario.receiver, verify, throwing, mark_used, options);
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Storage);
        REQUIRE(scenario.receiver->GenerationCount() == 0);
    }

    SECTION("Commit that throws rolls the import back") {
        const interfaces::MarkUsedFunction throwing = [](std::string_view) -> Result<bool, OnboardingFailure> {
            throw std::runtime_error("disk full");
        };
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *scenario.receiver, verify, is_used, throwing, options);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Storage);
        REQUIRE(scenario.receiver->GenerationCount() == 0);
        REQUIRE_FALSE(scenario.registry->IsUsed(issued.meta.invite_id).Unwrap());
    }
}

TEST_CASE("Fail Closed - Import and commit failures", "[security][fail_closed][critical]") {
    OnboardingScenario scenario;
    const auto issued = scenario.Issue();

    SECTION("Locked receiver keyring") {
        scenario.receiver->Lock();
        auto result = scenario.Accept(issued.envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Locked);
        REQUIRE_FALSE(scenario.registry->IsUsed(issued.meta.invite_id).Unwrap());
    }

    SECTION("Registry write failure rolls back and leaves the invite usable") {
        auto registry_storage = std::make_shared<FailingStorageDriver>(scenario.receiver_storage);
        auto registry = MakeRegistry(registry_storage);
        const auto accept = [&] {
            return InviteAcceptor::AcceptInvite(
                issued.envelope, kTestCode, *scenario.receiver,
                crypto::Ed25519Signer::VerifyCapability(),
                registry->IsUsedCapability(),
                registry->MarkUsedCapability(),
                scenario.AcceptOptionsAt());
        };

        registry_storage->FailWrites(true);
        auto failed = accept();
        REQUIRE(failed.IsErr());
        REQUIRE(failed.UnwrapErr().type == OnboardingFailureType::Storage);
        REQUIRE(scenario.receiver->GenerationCount() == 0);
        REQUIRE_FALSE(registry->IsUsed(issued.meta.invite_id).Unwrap());

        registry_storage->FailWrites(false);
        auto retried = accept();
        REQUIRE(retried.IsOk());
        REQUIRE(retried.Unwrap().imported_count == 2);
        REQUIRE(registry->IsUsed(issued.meta.invite_id).Unwrap());
    }

    SECTION("Rollback failure is reported alongside the commit failure") {
        auto keyring_storage = std::make_shared<FailingStorageDriver>();
        auto receiver = MakeReceiverKeyring(keyring_storage);
        const interfaces::MarkUsedFunction failing_commit = [&](std::string_view) {
            keyring_storage->FailWrites(true);
            return Result<bool, OnboardingFailure>::Err(OnboardingFailure::Storage("commit failed"));
        };
        auto result = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *receiver,
            crypto::Ed25519Signer::VerifyCapability(),
            scenario.registry->IsUsedCapability(),
            failing_commit,
            scenario.AcceptOptionsAt());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Storage);
        REQUIRE(result.UnwrapErr().message ==
                "commit failed; rollback failed: simulated write failure");
    }
}
