#include <catch2/catch_test_macros.hpp>
#include "helpers/onboarding_fixture.hpp"

using namespace keyferry::onboarding;
using namespace keyferry::onboarding::invite;
using namespace keyferry::onboarding::test_helpers;

TEST_CASE("Replay Attacks - Invite is consumed exactly once", "[attacks][replay][critical]") {
    OnboardingScenario scenario;
    const auto issued = scenario.Issue();

    REQUIRE(scenario.Accept(issued.envelope).IsOk());

    SECTION("Second accept of the same envelope must fail") {
        auto replay = scenario.Accept(issued.envelope);
        REQUIRE(replay.IsErr());
        REQUIRE(replay.UnwrapErr().type == OnboardingFailureType::Replay);
        REQUIRE(replay.UnwrapErr().message == "Invite already used");
        REQUIRE(scenario.receiver->GenerationCount() == 2);
    }

    SECTION("Replay is detected before the code is tried") {
        auto replay = scenario.Accept(issued.envelope, "guess-0001");
        REQUIRE(replay.UnwrapErr().type == OnboardingFailureType::Replay);
    }

    SECTION("Expiry is reported ahead of replay") {
        scenario.clock.Advance(std::chrono::hours(1));
        auto replay = scenario.Accept(issued.envelope);
        REQUIRE(replay.UnwrapErr().type == OnboardingFailureType::Temporal);
    }

    SECTION("Replay after a restart must fail") {
        auto receiver = MakeKeyring(scenario.receiver_storage);
        REQUIRE(receiver->Unlock(kTestPassphrase).IsOk());
        auto registry = MakeRegistry(scenario.receiver_storage);
        auto replay = InviteAcceptor::AcceptInvite(
            issued.envelope, kTestCode, *receiver,
            crypto::Ed25519Signer::VerifyCapability(),
            registry->IsUsedCapability(),
            registry->MarkUsedCapability(),
            scenario.AcceptOptionsAt());
        REQUIRE(replay.UnwrapErr().type == OnboardingFailureType::Replay);
    }

    SECTION("Replay through a JSON copy must fail") {
        auto json = InviteEnvelopeCodec::ToJson(issued.envelope).Unwrap();
        auto copy = InviteEnvelopeCodec::FromJson(json).Unwrap();
        REQUIRE(scenario.Accept(copy).UnwrapErr().type == OnboardingFailureType::Replay);
    }
}

TEST_CASE("Replay Attacks - Independent invites", "[attacks][replay]") {
    OnboardingScenario scenario;
    const auto first = scenario.Issue();
    const auto second = scenario.Issue();

    REQUIRE(first.meta.invite_id != second.meta.invite_id);

    SECTION("Each invite is accepted once") {
        auto accepted_first = scenario.Accept(first.envelope);
        REQUIRE(accepted_first.IsOk());
        REQUIRE(accepted_first.Unwrap().imported_count == 2);

        auto accepted_second = scenario.Accept(second.envelope);
        REQUIRE(accepted_second.IsOk());
        REQUIRE(accepted_second.Unwrap().imported_count == 0);
        REQUIRE_FALSE(accepted_second.Unwrap().rewrapped);

        REQUIRE(scenario.registry->ListUsed().Unwrap().size() == 2);
    }

    SECTION("Consuming one invite does not consume the other") {
        REQUIRE(scenario.Accept(first.envelope).IsOk());
        REQUIRE_FALSE(scenario.registry->IsUsed(second.meta.invite_id).Unwrap());
    }
}

TEST_CASE("Replay Attacks - Lost commit race", "[attacks][replay][critical]") {
    OnboardingScenario scenario;
    const auto issued = scenario.Issue();

    // Another acceptor commits between this acceptor's replay check and its commit
    const interfaces::IsUsedFunction stale_check = [](std::string_view) {
        return Result<bool, OnboardingFailure>::Ok(false);
    };
    REQUIRE(scenario.registry->MarkUsed(issued.meta.invite_id).Unwrap());

    auto result = InviteAcceptor::AcceptInvite(
        issued.envelope, kTestCode, *scenario.receiver,
        crypto::Ed25519Signer::VerifyCapability(),
        stale_check,
        scenario.registry->MarkUsedCapability(),
        scenario.AcceptOptionsAt());

    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == OnboardingFailureType::Replay);
    REQUIRE(scenario.receiver->GenerationCount() == 0);
    REQUIRE_FALSE(scenario.receiver->CurrentGenerationId().has_value());
}
