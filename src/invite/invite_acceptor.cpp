#include "keyferry/invite/invite_acceptor.hpp"
#include "keyferry/crypto/aes_gcm.hpp"
#include "keyferry/crypto/password_kdf.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
#include "keyferry/encoding/base64_url.hpp"
#include "keyferry/encoding/byte_view.hpp"
#include "keyferry/encoding/proto_support.hpp"
#include "keyferry/debug/onboarding_logger.hpp"
#include "onboarding/invite.pb.h"
#include <exception>
#include <format>
#include <limits>
#include <mutex>

namespace keyferry::onboarding::invite {
using crypto::AesGcm;
using crypto::PasswordKdf;
using crypto::SodiumInterop;
using encoding::Base64Url;
using keyring::KeyGeneration;
using debug::Component;

namespace {
    using AcceptOutcome = Result<AcceptResult, OnboardingFailure>;
    using UnitResult = Result<Unit, OnboardingFailure>;

    OnboardingFailure InvalidSignature() {
        return OnboardingFailure::Authentication(std::string(ErrorMessages::INVALID_SIGNATURE));
    }

    OnboardingFailure DecryptionFailed() {
        return OnboardingFailure::Decryption(std::string(ErrorMessages::INVITE_DECRYPTION_FAILED));
    }

    OnboardingFailure AlreadyUsed() {
        return OnboardingFailure::Replay(std::string(ErrorMessages::INVITE_ALREADY_USED));
    }

    bool IsValidIdentifier(const std::string_view value) {
        return !value.empty() && value.find(kAadSeparator) == std::string_view::npos;
    }

    UnitResult CheckVersion(const InviteEnvelope& envelope) {
        if (envelope.v != kInviteEnvelopeVersion) {
            return UnitResult::Err(OnboardingFailure::UnsupportedVersion(
                std::format("{}: {}", ErrorMessages::UNSUPPORTED_INVITE_VERSION, envelope.v)));
        }
        return UnitResult::Ok(unit);
    }

    /// Runs on an authenticated envelope: a failure here means the signer
    /// produced it this way, not that it was modified in transit
    UnitResult CheckShape(const InviteEnvelope& envelope, const AcceptOptions& options) {
        auto malformed = [](std::string_view detail) {
            return UnitResult::Err(OnboardingFailure::Validation(
                std::format("Malformed invite: {}", detail)));
        };
        if (!IsValidIdentifier(envelope.meta.ns) || !IsValidIdentifier(envelope.meta.invite_id)) {
            return malformed("namespace and invite id must be non-empty and must not contain ':'");
        }
        if (envelope.aad != BuildInviteAad(envelope.meta.ns, envelope.meta.invite_id)) {
            return malformed("associated data does not match metadata");
        }
        if (envelope.salt.empty() || envelope.nonce.empty() || envelope.ciphertext.empty()) {
            return malformed("missing field");
        }
        if (envelope.meta.expires_at < envelope.meta.created_at) {
            return malformed("expiry precedes creation");
        }
        if (envelope.role.has_value() && envelope.role->empty()) {
            return malformed("empty role");
        }
        if (options.require_role && !envelope.role.has_value()) {
            return UnitResult::Err(OnboardingFailure::Validation("Invite carries no role"));
        }
        return UnitResult::Ok(unit);
    }

    UnitResult CheckSignature(const InviteEnvelope& envelope, const interfaces::VerifyFunction& verify) {
        auto canonical = InviteEnvelopeCodec::CanonicalBytes(envelope);
        if (canonical.IsErr()) {
            return UnitResult::Err(InvalidSignature());
        }
        auto signature = Base64Url::Decode(envelope.sig_b64u);
        if (signature.IsErr()) {
            return UnitResult::Err(InvalidSignature());
        }
        try {
            auto verified = verify(canonical.Unwrap(), signature.Unwrap(), envelope.signer_pub_b64u);
            if (verified.IsErr() || !verified.Unwrap()) {
                return UnitResult::Err(InvalidSignature());
            }
        } catch (const std::exception& e) {
            KF_LOG_MSG(Component::Acceptor, "VERIFY", e.what());
            return UnitResult::Err(InvalidSignature());
        }
        return UnitResult::Ok(unit);
    }

    UnitResult CheckExpiry(const InviteEnvelope& envelope, const AcceptOptions& options) {
        // expires_at comes off the wire; keep the arithmetic on the local clock
        if (options.now() - options.skew > envelope.meta.expires_at) {
            return UnitResult::Err(
                OnboardingFailure::Temporal(std::string(ErrorMessages::INVITE_EXPIRED)));
        }
        return UnitResult::Ok(unit);
    }

    UnitResult CheckReplay(const InviteEnvelope& envelope, const interfaces::IsUsedFunction& is_used) {
        try {
            auto used = is_used(envelope.meta.invite_id);
            if (used.IsErr()) {
                return UnitResult::Err(std::move(used).UnwrapErr());
            }
            if (used.Unwrap()) {
                return UnitResult::Err(AlreadyUsed());
            }
        } catch (const std::exception& e) {
            return UnitResult::Err(OnboardingFailure::Storage(
                std::format("Replay check failed: {}", e.what())));
        }
        return UnitResult::Ok(unit);
    }

    /// Every failure in here collapses to the same message so a wrong code,
    /// a corrupted field and a foreign AAD are indistinguishable
    Result<std::vector<KeyGeneration>, OnboardingFailure> DecryptPayload(
        const InviteEnvelope& envelope,
        const std::string_view code) {
        using PayloadResult = Result<std::vector<KeyGeneration>, OnboardingFailure>;
        auto salt = Base64Url::Decode(envelope.salt);
        auto nonce = Base64Url::Decode(envelope.nonce);
        auto ciphertext = Base64Url::Decode(envelope.ciphertext);
        if (salt.IsErr() || nonce.IsErr() || ciphertext.IsErr()) {
            return PayloadResult::Err(DecryptionFailed());
        }
        auto key_result = PasswordKdf::DeriveInviteKey(code, salt.Unwrap());
        if (key_result.IsErr()) {
            return PayloadResult::Err(DecryptionFailed());
        }
        auto key = std::move(key_result).Unwrap();
        auto plaintext_result = AesGcm::Decrypt(
            key, nonce.Unwrap(), ciphertext.Unwrap(), encoding::AsBytes(envelope.aad));
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        if (plaintext_result.IsErr()) {
            return PayloadResult::Err(DecryptionFailed());
        }
        auto plaintext = std::move(plaintext_result).Unwrap();

        proto::onboarding::InvitePayload payload;
        const bool parsed =
            plaintext.size() <= static_cast<size_t>(std::numeric_limits<int>::max()) &&
            payload.ParseFromArray(plaintext.data(), static_cast<int>(plaintext.size()));
        SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
        if (!parsed || payload.version() != kInvitePayloadVersion) {
            return PayloadResult::Err(DecryptionFailed());
        }

        std::vector<KeyGeneration> generations;
        generations.reserve(static_cast<size_t>(payload.generations_size()));
        for (auto& material : *payload.mutable_generations()) {
            KeyGeneration generation;
            generation.generation_id = material.generation_id();
            std::string* key_bytes = material.mutable_symmetric_key();
            generation.symmetric_key.assign(key_bytes->begin(), key_bytes->end());
            SodiumInterop::SecureWipe(
                std::span<uint8_t>(reinterpret_cast<uint8_t*>(key_bytes->data()), key_bytes->size()));
            auto created_at = encoding::FromProtoTimestamp(material.created_at());
            if (created_at.IsErr()) {
                keyring::WipeKeyMaterial(generations);
                SodiumInterop::SecureWipe(std::span<uint8_t>(generation.symmetric_key));
                return PayloadResult::Err(DecryptionFailed());
            }
            generation.created_at = created_at.Unwrap();
            generations.push_back(std::move(generation));
        }
        return PayloadResult::Ok(std::move(generations));
    }

    UnitResult CheckIssuerStillAuthorized(
        const InviteEnvelope& envelope,
        const std::string_view role,
        const interfaces::AuthorizeRoleFunction& authorized) {
        auto revoked = [role] {
            return UnitResult::Err(OnboardingFailure::Authorization(
                std::format("Issuer no longer authorized to issue {} invites", role)));
        };
        try {
            auto result = authorized(envelope.signer_pub_b64u, role);
            if (result.IsErr()) {
                auto failure = std::move(result).UnwrapErr();
                if (failure.type == OnboardingFailureType::Storage) {
                    return UnitResult::Err(std::move(failure));
                }
                KF_LOG_MSG(Component::Acceptor, "REAUTHORIZE", failure.message);
                return revoked();
            }
        } catch (const std::exception& e) {
            KF_LOG_MSG(Component::Acceptor, "REAUTHORIZE", e.what());
            return revoked();
        }
        return UnitResult::Ok(unit);
    }

    UnitResult InvokeApplyRole(
        const interfaces::ApplyRoleFunction& apply_role,
        const InviteEnvelope& envelope,
        const std::string_view role) {
        try {
            return apply_role(envelope.signer_pub_b64u, role);
        } catch (const std::exception& e) {
            return UnitResult::Err(OnboardingFailure::Generic(
                std::format("Role application failed: {}", e.what())));
        }
    }

    Result<bool, OnboardingFailure> InvokeMarkUsed(
        const interfaces::MarkUsedFunction& mark_used,
        const std::string_view invite_id) {
        try {
            return mark_used(invite_id);
        } catch (const std::exception& e) {
            return Result<bool, OnboardingFailure>::Err(OnboardingFailure::Storage(
                std::format("Commit failed: {}", e.what())));
        }
    }

    OnboardingFailure RollBack(
        keyring::Keyring& keyring,
        const keyring::ImportOutcome& outcome,
        OnboardingFailure failure) {
        auto rolled_back = keyring.RollbackImport(outcome);
        if (rolled_back.IsErr()) {
            KF_LOG_STAGE(Component::Acceptor, "rollback", "failed");
            return OnboardingFailure(failure.type, std::format("{}; rollback failed: {}",
                failure.message, rolled_back.UnwrapErr().message));
        }
        KF_LOG_STAGE(Component::Acceptor, "rollback", "ok");
        return failure;
    }
}

Result<AcceptResult, OnboardingFailure> InviteAcceptor::AcceptInvite(
    const InviteEnvelope& envelope,
    const std::string_view code,
    keyring::Keyring& keyring,
    const interfaces::VerifyFunction& verify,
    const interfaces::IsUsedFunction& is_used,
    const interfaces::MarkUsedFunction& mark_used,
    const AcceptOptions& options) {
    if (!verify || !is_used || !mark_used || !options.now) {
        return AcceptOutcome::Err(OnboardingFailure::Validation(
            "verify, is_used, mark_used and clock capabilities are required"));
    }
    if (code.empty()) {
        return AcceptOutcome::Err(OnboardingFailure::Validation("Invite code cannot be empty"));
    }
    if (options.skew.count() < 0) {
        return AcceptOutcome::Err(OnboardingFailure::Validation("Clock skew cannot be negative"));
    }

    KF_LOG_SECTION(Component::Acceptor, "ACCEPT INVITE");

    if (auto version = CheckVersion(envelope); version.IsErr()) {
        KF_LOG_STAGE(Component::Acceptor, "version", "rejected");
        return AcceptOutcome::Err(std::move(version).UnwrapErr());
    }
    if (auto signature = CheckSignature(envelope, verify); signature.IsErr()) {
        KF_LOG_STAGE(Component::Acceptor, "signature", "rejected");
        return AcceptOutcome::Err(std::move(signature).UnwrapErr());
    }
    if (auto shape = CheckShape(envelope, options); shape.IsErr()) {
        KF_LOG_STAGE(Component::Acceptor, "shape", "rejected");
        return AcceptOutcome::Err(std::move(shape).UnwrapErr());
    }
    if (auto expiry = CheckExpiry(envelope, options); expiry.IsErr()) {
        KF_LOG_STAGE(Component::Acceptor, "expiry", "rejected");
        return AcceptOutcome::Err(std::move(expiry).UnwrapErr());
    }
    if (auto replay = CheckReplay(envelope, is_used); replay.IsErr()) {
        KF_LOG_STAGE(Component::Acceptor, "replay", "rejected");
        return AcceptOutcome::Err(std::move(replay).UnwrapErr());
    }

    const std::string role = envelope.role.value_or(std::string(kDefaultRole));
    if (options.verify_issuer_still_authorized) {
        auto authorized = CheckIssuerStillAuthorized(envelope, role, options.verify_issuer_still_authorized);
        if (authorized.IsErr()) {
            KF_LOG_STAGE(Component::Acceptor, "reauthorize", "rejected");
            return AcceptOutcome::Err(std::move(authorized).UnwrapErr());
        }
    }

    auto payload = DecryptPayload(envelope, code);
    if (payload.IsErr()) {
        KF_LOG_STAGE(Component::Acceptor, "decrypt", "rejected");
        return AcceptOutcome::Err(std::move(payload).UnwrapErr());
    }
    auto generations = std::move(payload).Unwrap();
    KF_LOG_VALUE(Component::Acceptor, "DECRYPT", "generations", generations.size());

    keyring::ImportOutcome outcome;
    {
        // A loser whose import was a no-op must not commit between the
        // winner's import and the winner's rollback
        auto import_guard = keyring.LockForImport();
        auto import_result = keyring.ImportGenerations(generations);
        keyring::WipeKeyMaterial(generations);
        if (import_result.IsErr()) {
            KF_LOG_STAGE(Component::Acceptor, "import", "rejected");
            return AcceptOutcome::Err(std::move(import_result).UnwrapErr());
        }
        outcome = std::move(import_result).Unwrap();

        auto committed = InvokeMarkUsed(mark_used, envelope.meta.invite_id);
        if (committed.IsErr()) {
            KF_LOG_STAGE(Component::Acceptor, "commit", "failed");
            return AcceptOutcome::Err(RollBack(keyring, outcome, std::move(committed).UnwrapErr()));
        }
        if (!committed.Unwrap()) {
            KF_LOG_STAGE(Component::Acceptor, "commit", "lost race");
            return AcceptOutcome::Err(RollBack(keyring, outcome, AlreadyUsed()));
        }
    }
    KF_LOG_STAGE(Component::Acceptor, "commit", "ok");

    if (options.apply_role) {
        if (auto applied = InvokeApplyRole(options.apply_role, envelope, role); applied.IsErr()) {
            KF_LOG_STAGE(Component::Acceptor, "apply role", "failed");
            return AcceptOutcome::Err(std::move(applied).UnwrapErr());
        }
    }

    AcceptResult result;
    result.imported_count = outcome.imported_count;
    result.rewrapped = outcome.rewrapped;
    result.applied_role = role;
    return AcceptOutcome::Ok(std::move(result));
}

}
