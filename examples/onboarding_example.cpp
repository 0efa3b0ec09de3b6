/**
 * @file onboarding_example.cpp
 * @brief Walks a second device through joining a workspace with an invite
 */

#include "keyferry/configuration/onboarding_config.hpp"
#include "keyferry/crypto/ed25519_signer.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
#include "keyferry/invite/invite_acceptor.hpp"
#include "keyferry/invite/invite_issuer.hpp"
#include "keyferry/keyring/keyring.hpp"
#include "keyferry/security/invite_registry.hpp"
#include "keyferry/storage/in_memory_storage_driver.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace keyferry::onboarding;

namespace {
    int Fail(const std::string& step, const OnboardingFailure& failure) {
        std::cerr << "Failed to " << step << ": " << failure.message << std::endl;
        return 1;
    }
}

int main() {
    std::cout << "=== keyferry - Device Onboarding Example ===" << std::endl;
    std::cout << std::endl;

    constexpr auto config = configuration::OnboardingConfig::ForTesting();
    const std::string ns = "workspace-1";
    const std::string code = "SECRET123";

    std::cout << "1. Initializing libsodium..." << std::endl;
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize: " << init.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    // Device A owns the workspace keys
    std::cout << "2. Creating the sender keyring..." << std::endl;
    auto sender_storage = std::make_shared<storage::InMemoryStorageDriver>();
    auto sender_result = keyring::Keyring::Create(sender_storage, ns);
    if (sender_result.IsErr()) {
        return Fail("create sender keyring", sender_result.UnwrapErr());
    }
    auto sender = std::move(sender_result).Unwrap();
    if (auto init = sender->InitNew("device-a passphrase", config.KeyringKdfIterations()); init.IsErr()) {
        return Fail("initialize sender keyring", init.UnwrapErr());
    }
    if (auto rotated = sender->Rotate(); rotated.IsErr()) {
        return Fail("rotate", rotated.UnwrapErr());
    }
    std::cout << "   ✓ Sender holds " << sender->GenerationCount() << " generations, current "
              << sender->CurrentGenerationId().value_or(0) << std::endl;
    std::cout << std::endl;

    std::cout << "3. Issuing a signed invite (ttl 60s)..." << std::endl;
    auto signer_result = crypto::Ed25519Signer::Generate();
    if (signer_result.IsErr()) {
        return Fail("generate signer", signer_result.UnwrapErr());
    }
    auto signer = std::make_shared<crypto::Ed25519Signer>(std::move(signer_result).Unwrap());

    auto issue_options = invite::IssueOptions::FromConfig(config);
    issue_options.role = "MEMBER";
    auto issued = invite::InviteIssuer::CreateInvite(
        *sender, code, std::chrono::milliseconds(60'000), ns,
        crypto::Ed25519Signer::SignCapability(signer),
        signer->PublicKeyB64u(),
        issue_options);
    if (issued.IsErr()) {
        return Fail("issue invite", issued.UnwrapErr());
    }
    auto json = invite::InviteEnvelopeCodec::ToJson(issued.Unwrap().envelope);
    if (json.IsErr()) {
        return Fail("encode invite", json.UnwrapErr());
    }
    std::cout << "   ✓ Invite " << issued.Unwrap().meta.invite_id << std::endl;
    std::cout << "   Envelope JSON: " << json.Unwrap().size() << " bytes" << std::endl;
    std::cout << std::endl;

    // Device B receives the JSON out of band and the code from the user
    std::cout << "4. Accepting the invite on the new device..." << std::endl;
    auto receiver_storage = std::make_shared<storage::InMemoryStorageDriver>();
    auto receiver_result = keyring::Keyring::Create(receiver_storage, ns);
    if (receiver_result.IsErr()) {
        return Fail("create receiver keyring", receiver_result.UnwrapErr());
    }
    auto receiver = std::move(receiver_result).Unwrap();
    if (auto init = receiver->InitForImport("device-b passphrase", config.KeyringKdfIterations());
        init.IsErr()) {
        return Fail("initialize receiver keyring", init.UnwrapErr());
    }
    auto registry_result = security::InviteRegistry::Create(receiver_storage, ns);
    if (registry_result.IsErr()) {
        return Fail("create invite registry", registry_result.UnwrapErr());
    }
    auto registry = std::move(registry_result).Unwrap();

    auto envelope = invite::InviteEnvelopeCodec::FromJson(json.Unwrap());
    if (envelope.IsErr()) {
        return Fail("decode invite", envelope.UnwrapErr());
    }
    auto accepted = invite::InviteAcceptor::AcceptInvite(
        envelope.Unwrap(), code, *receiver,
        crypto::Ed25519Signer::VerifyCapability(),
        registry->IsUsedCapability(),
        registry->MarkUsedCapability(),
        invite::AcceptOptions::FromConfig(config));
    if (accepted.IsErr()) {
        return Fail("accept invite", accepted.UnwrapErr());
    }
    std::cout << "   ✓ Imported " << accepted.Unwrap().imported_count << " generations as "
              << accepted.Unwrap().applied_role << std::endl;
    std::cout << std::endl;

    std::cout << "5. Replaying the same invite..." << std::endl;
    auto replayed = invite::InviteAcceptor::AcceptInvite(
        envelope.Unwrap(), code, *receiver,
        crypto::Ed25519Signer::VerifyCapability(),
        registry->IsUsedCapability(),
        registry->MarkUsedCapability(),
        invite::AcceptOptions::FromConfig(config));
    if (replayed.IsOk()) {
        std::cerr << "Replay was accepted" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Rejected: " << replayed.UnwrapErr().message << std::endl;
    std::cout << std::endl;

    std::cout << "=== Onboarding complete ===" << std::endl;
    return 0;
}
