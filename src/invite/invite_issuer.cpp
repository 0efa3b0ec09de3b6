#include "keyferry/invite/invite_issuer.hpp"
#include "keyferry/crypto/aes_gcm.hpp"
#include "keyferry/crypto/password_kdf.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
#include "keyferry/encoding/base64_url.hpp"
#include "keyferry/encoding/byte_view.hpp"
#include "keyferry/encoding/proto_support.hpp"
#include "keyferry/core/constants.hpp"
#include "keyferry/debug/onboarding_logger.hpp"
#include "onboarding/invite.pb.h"
#include <exception>
#include <format>

namespace keyferry::onboarding::invite {
using crypto::AesGcm;
using crypto::PasswordKdf;
using crypto::SodiumInterop;
using encoding::Base64Url;
using debug::Component;

namespace {
    using IssueResult = Result<IssuedInvite, OnboardingFailure>;

    Result<Unit, OnboardingFailure> ValidateIssueInputs(
        const std::chrono::milliseconds ttl,
        const std::string_view code,
        const std::string_view ns,
        const interfaces::SignFunction& sign,
        const std::string_view signer_pub_b64u,
        const IssueOptions& options) {
        auto invalid = [](std::string message) {
            return Result<Unit, OnboardingFailure>::Err(
                OnboardingFailure::Validation(std::move(message)));
        };
        if (ttl.count() <= 0) {
            return invalid("Invite TTL must be positive");
        }
        if (ttl > kAbsoluteMaxInviteTtl) {
            return invalid(std::format("Invite TTL {}ms exceeds maximum {}ms",
                ttl.count(), kAbsoluteMaxInviteTtl.count()));
        }
        if (options.max_ttl.has_value() && ttl > *options.max_ttl) {
            return invalid(std::format("Invite TTL {}ms exceeds maximum {}ms",
                ttl.count(), options.max_ttl->count()));
        }
        if (code.empty()) {
            return invalid("Invite code cannot be empty");
        }
        if (ns.empty() || ns.find(kAadSeparator) != std::string_view::npos) {
            return invalid("Namespace must be non-empty and must not contain ':'");
        }
        if (!sign) {
            return invalid("Sign capability is required");
        }
        if (signer_pub_b64u.empty()) {
            return invalid("Signer public key is required");
        }
        if (options.role.has_value() && options.role->empty()) {
            return invalid("Role cannot be empty when present");
        }
        if (!options.now) {
            return invalid("Clock is required");
        }
        return Result<Unit, OnboardingFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, OnboardingFailure> BuildPayload(
        const std::vector<keyring::KeyGeneration>& generations) {
        proto::onboarding::InvitePayload payload;
        payload.set_version(kInvitePayloadVersion);
        for (const auto& generation : generations) {
            auto* material = payload.add_generations();
            material->set_generation_id(generation.generation_id);
            material->set_symmetric_key(
                generation.symmetric_key.data(), generation.symmetric_key.size());
            encoding::ToProtoTimestamp(generation.created_at, material->mutable_created_at());
        }
        auto bytes = encoding::SerializeDeterministic(payload);
        for (auto& material : *payload.mutable_generations()) {
            std::string* key = material.mutable_symmetric_key();
            SodiumInterop::SecureWipe(
                std::span<uint8_t>(reinterpret_cast<uint8_t*>(key->data()), key->size()));
        }
        return bytes;
    }

    Result<Unit, OnboardingFailure> InvokeAuthorize(
        const interfaces::AuthorizeRoleFunction& authorize,
        const std::string_view signer_pub_b64u,
        const std::string_view role) {
        try {
            return authorize(signer_pub_b64u, role);
        } catch (const std::exception& e) {
            return Result<Unit, OnboardingFailure>::Err(
                OnboardingFailure::Authorization(e.what()));
        }
    }

    Result<std::vector<uint8_t>, OnboardingFailure> InvokeSign(
        const interfaces::SignFunction& sign,
        std::span<const uint8_t> data) {
        try {
            return sign(data);
        } catch (const std::exception& e) {
            return Result<std::vector<uint8_t>, OnboardingFailure>::Err(
                OnboardingFailure::Generic(std::format("Sign capability threw: {}", e.what())));
        }
    }
}

Result<IssuedInvite, OnboardingFailure> InviteIssuer::CreateInvite(
    const keyring::Keyring& keyring,
    const std::string_view code,
    const std::chrono::milliseconds ttl,
    const std::string_view ns,
    const interfaces::SignFunction& sign,
    const std::string_view signer_pub_b64u,
    const IssueOptions& options) {
    if (auto valid = ValidateIssueInputs(ttl, code, ns, sign, signer_pub_b64u, options);
        valid.IsErr()) {
        return IssueResult::Err(std::move(valid).UnwrapErr());
    }

    KF_LOG_SECTION(Component::Issuer, "CREATE INVITE");

    if (options.authorize) {
        const std::string_view role = options.role.has_value()
            ? std::string_view(*options.role)
            : kDefaultRole;
        if (auto allowed = InvokeAuthorize(options.authorize, signer_pub_b64u, role); allowed.IsErr()) {
            KF_LOG_STAGE(Component::Issuer, "authorize", "denied");
            return IssueResult::Err(std::move(allowed).UnwrapErr());
        }
    }

    InviteMeta meta;
    meta.ns = std::string(ns);
    meta.invite_id = SodiumInterop::GenerateUuidV4();
    meta.created_at = std::chrono::time_point_cast<std::chrono::milliseconds>(options.now());
    if (meta.created_at > std::chrono::system_clock::time_point::max() - ttl) {
        return IssueResult::Err(
            OnboardingFailure::Validation("Invite expiry is not representable"));
    }
    meta.expires_at = meta.created_at + ttl;
    const std::string aad = BuildInviteAad(meta.ns, meta.invite_id);
    KF_LOG_MSG(Component::Issuer, "META", meta.invite_id);

    auto snapshot_result = keyring.ExportAll();
    if (snapshot_result.IsErr()) {
        return IssueResult::Err(std::move(snapshot_result).UnwrapErr());
    }
    auto snapshot = std::move(snapshot_result).Unwrap();
    if (snapshot.empty()) {
        return IssueResult::Err(
            OnboardingFailure::Validation("Keyring holds no generations to share"));
    }
    auto payload_result = BuildPayload(snapshot);
    keyring::WipeKeyMaterial(snapshot);
    if (payload_result.IsErr()) {
        return IssueResult::Err(std::move(payload_result).UnwrapErr());
    }
    auto payload = std::move(payload_result).Unwrap();
    KF_LOG_VALUE(Component::Issuer, "PAYLOAD", "generations", snapshot.size());

    const auto salt = SodiumInterop::GetRandomBytes(kInviteSaltBytes);
    auto key_result = PasswordKdf::DeriveInviteKey(code, salt);
    if (key_result.IsErr()) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(payload));
        return IssueResult::Err(std::move(key_result).UnwrapErr());
    }
    auto key = std::move(key_result).Unwrap();
    KF_LOG_KEY(Component::Issuer, "KDF", "invite_key", key);

    const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    auto ciphertext_result = AesGcm::Encrypt(key, nonce, payload, encoding::AsBytes(aad));
    SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    SodiumInterop::SecureWipe(std::span<uint8_t>(payload));
    if (ciphertext_result.IsErr()) {
        return IssueResult::Err(std::move(ciphertext_result).UnwrapErr());
    }

    InviteEnvelope envelope;
    envelope.v = kInviteEnvelopeVersion;
    envelope.aad = aad;
    envelope.salt = Base64Url::Encode(salt);
    envelope.nonce = Base64Url::Encode(nonce);
    envelope.ciphertext = Base64Url::Encode(ciphertext_result.Unwrap());
    envelope.signer_pub_b64u = std::string(signer_pub_b64u);
    envelope.meta = meta;
    envelope.role = options.role;

    auto canonical = InviteEnvelopeCodec::CanonicalBytes(envelope);
    if (canonical.IsErr()) {
        return IssueResult::Err(std::move(canonical).UnwrapErr());
    }
    auto signature_result = InvokeSign(sign, canonical.Unwrap());
    if (signature_result.IsErr()) {
        return IssueResult::Err(std::move(signature_result).UnwrapErr());
    }
    const auto signature = std::move(signature_result).Unwrap();
    if (signature.empty()) {
        return IssueResult::Err(OnboardingFailure::Generic("Sign capability returned no signature"));
    }
    envelope.sig_b64u = Base64Url::Encode(signature);
    KF_LOG_STAGE(Component::Issuer, "sign", "ok");

    return IssueResult::Ok(IssuedInvite{std::move(envelope), std::move(meta)});
}

}
