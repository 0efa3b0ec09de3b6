#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyferry::proto::onboarding {
class InviteEnvelope;
}

namespace keyferry::onboarding::invite {

struct InviteMeta {
    std::string ns;
    std::string invite_id;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point expires_at;

    bool operator==(const InviteMeta&) const = default;
};

/**
 * @brief Signed, encrypted invite as it travels between devices
 *
 * salt, nonce, ciphertext, sig_b64u and signer_pub_b64u hold unpadded
 * base64url text. aad is "<ns>:<invite_id>" in the clear. The signature
 * covers every field except itself, including meta and role.
 */
struct InviteEnvelope {
    uint32_t v = 0;
    std::string aad;
    std::string salt;
    std::string nonce;
    std::string ciphertext;
    std::string sig_b64u;
    std::string signer_pub_b64u;
    InviteMeta meta;
    std::optional<std::string> role;

    bool operator==(const InviteEnvelope&) const = default;
};

/// "<ns>:<invite_id>"
[[nodiscard]] std::string BuildInviteAad(std::string_view ns, std::string_view invite_id);

class InviteEnvelopeCodec {
public:
    /// Deterministic protobuf encoding of @p envelope with sig_b64u cleared
    [[nodiscard]] static Result<std::vector<uint8_t>, OnboardingFailure> CanonicalBytes(
        const InviteEnvelope& envelope);

    [[nodiscard]] static Result<std::string, OnboardingFailure> ToJson(
        const InviteEnvelope& envelope);

    /// Unknown fields, malformed JSON and unrepresentable timestamps are Decode failures
    [[nodiscard]] static Result<InviteEnvelope, OnboardingFailure> FromJson(
        std::string_view json);

    static void ToProto(const InviteEnvelope& envelope, proto::onboarding::InviteEnvelope* out);

    [[nodiscard]] static Result<InviteEnvelope, OnboardingFailure> FromProto(
        const proto::onboarding::InviteEnvelope& message);

private:
    InviteEnvelopeCodec() = delete;
};
}
