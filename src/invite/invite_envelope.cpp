#include "keyferry/invite/invite_envelope.hpp"
#include "keyferry/core/constants.hpp"
#include "keyferry/encoding/proto_support.hpp"
#include "onboarding/invite.pb.h"
#include <google/protobuf/util/json_util.h>
#include <format>

namespace keyferry::onboarding::invite {
namespace {
    using ProtoEnvelope = proto::onboarding::InviteEnvelope;
}

std::string BuildInviteAad(const std::string_view ns, const std::string_view invite_id) {
    std::string aad;
    aad.reserve(ns.size() + 1 + invite_id.size());
    aad.append(ns);
    aad.push_back(kAadSeparator);
    aad.append(invite_id);
    return aad;
}

void InviteEnvelopeCodec::ToProto(const InviteEnvelope& envelope, ProtoEnvelope* out) {
    out->set_v(envelope.v);
    out->set_aad(envelope.aad);
    out->set_salt(envelope.salt);
    out->set_nonce(envelope.nonce);
    out->set_ciphertext(envelope.ciphertext);
    out->set_sig_b64u(envelope.sig_b64u);
    out->set_signer_pub_b64u(envelope.signer_pub_b64u);
    auto* meta = out->mutable_meta();
    meta->set_ns(envelope.meta.ns);
    meta->set_invite_id(envelope.meta.invite_id);
    encoding::ToProtoTimestamp(envelope.meta.created_at, meta->mutable_created_at());
    encoding::ToProtoTimestamp(envelope.meta.expires_at, meta->mutable_expires_at());
    if (envelope.role.has_value()) {
        out->set_role(*envelope.role);
    } else {
        out->clear_role();
    }
}

Result<InviteEnvelope, OnboardingFailure> InviteEnvelopeCodec::FromProto(const ProtoEnvelope& message) {
    using EnvelopeResult = Result<InviteEnvelope, OnboardingFailure>;
    auto created_at = encoding::FromProtoTimestamp(message.meta().created_at());
    if (created_at.IsErr()) {
        return EnvelopeResult::Err(std::move(created_at).UnwrapErr());
    }
    auto expires_at = encoding::FromProtoTimestamp(message.meta().expires_at());
    if (expires_at.IsErr()) {
        return EnvelopeResult::Err(std::move(expires_at).UnwrapErr());
    }

    InviteEnvelope envelope;
    envelope.v = message.v();
    envelope.aad = message.aad();
    envelope.salt = message.salt();
    envelope.nonce = message.nonce();
    envelope.ciphertext = message.ciphertext();
    envelope.sig_b64u = message.sig_b64u();
    envelope.signer_pub_b64u = message.signer_pub_b64u();
    envelope.meta.ns = message.meta().ns();
    envelope.meta.invite_id = message.meta().invite_id();
    envelope.meta.created_at = created_at.Unwrap();
    envelope.meta.expires_at = expires_at.Unwrap();
    if (message.has_role()) {
        envelope.role = message.role();
    }
    return EnvelopeResult::Ok(std::move(envelope));
}

Result<std::vector<uint8_t>, OnboardingFailure> InviteEnvelopeCodec::CanonicalBytes(
    const InviteEnvelope& envelope) {
    ProtoEnvelope message;
    ToProto(envelope, &message);
    message.clear_sig_b64u();
    return encoding::SerializeDeterministic(message);
}

Result<std::string, OnboardingFailure> InviteEnvelopeCodec::ToJson(const InviteEnvelope& envelope) {
    ProtoEnvelope message;
    ToProto(envelope, &message);
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = false;
    const auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        return Result<std::string, OnboardingFailure>::Err(
            OnboardingFailure::Encode(
                std::format("Failed to encode invite as JSON: {}", status.ToString())));
    }
    return Result<std::string, OnboardingFailure>::Ok(std::move(json));
}

Result<InviteEnvelope, OnboardingFailure> InviteEnvelopeCodec::FromJson(const std::string_view json) {
    ProtoEnvelope message;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), &message, options);
    if (!status.ok()) {
        return Result<InviteEnvelope, OnboardingFailure>::Err(
            OnboardingFailure::Decode(
                std::format("Malformed invite JSON: {}", status.ToString())));
    }
    return FromProto(message);
}

}
