#include "keyferry/crypto/ed25519_signer.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
#include "keyferry/encoding/base64_url.hpp"
#include "keyferry/core/constants.hpp"
#include <sodium.h>
#include <format>

namespace keyferry::onboarding::crypto {
using encoding::Base64Url;

namespace {
    using SignerResult = Result<Ed25519Signer, OnboardingFailure>;

    static_assert(kEd25519PublicKeyBytes == crypto_sign_PUBLICKEYBYTES);
    static_assert(kEd25519SecretKeyBytes == crypto_sign_SECRETKEYBYTES);
    static_assert(kEd25519SignatureBytes == crypto_sign_BYTES);
}

Result<Ed25519Signer, OnboardingFailure> Ed25519Signer::Generate() {
    auto keypair_result = SodiumInterop::GenerateEd25519KeyPair();
    if (keypair_result.IsErr()) {
        return SignerResult::Err(std::move(keypair_result).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(keypair_result).Unwrap();
    auto handle_result = SecureMemoryHandle::FromBytes(secret_key);
    SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
    if (handle_result.IsErr()) {
        return SignerResult::Err(
            OnboardingFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return SignerResult::Ok(
        Ed25519Signer(std::move(handle_result).Unwrap(), std::move(public_key)));
}

Result<Ed25519Signer, OnboardingFailure> Ed25519Signer::FromSecretKey(
    const std::span<const uint8_t> secret_key) {
    if (secret_key.size() != kEd25519SecretKeyBytes) {
        return SignerResult::Err(
            OnboardingFailure::Validation(
                std::format("Ed25519 secret key must be {} bytes, got {}",
                    kEd25519SecretKeyBytes, secret_key.size())));
    }
    if (!SodiumInterop::IsInitialized()) {
        return SignerResult::Err(
            OnboardingFailure::KeyGeneration(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    std::vector<uint8_t> public_key(kEd25519PublicKeyBytes);
    if (crypto_sign_ed25519_sk_to_pk(public_key.data(), secret_key.data()) != SodiumConstants::SUCCESS) {
        return SignerResult::Err(
            OnboardingFailure::KeyGeneration("Failed to derive Ed25519 public key"));
    }
    auto handle_result = SecureMemoryHandle::FromBytes(secret_key);
    if (handle_result.IsErr()) {
        return SignerResult::Err(
            OnboardingFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return SignerResult::Ok(
        Ed25519Signer(std::move(handle_result).Unwrap(), std::move(public_key)));
}

Result<std::vector<uint8_t>, OnboardingFailure> Ed25519Signer::Sign(
    const std::span<const uint8_t> data) const {
    using SignResult = Result<std::vector<uint8_t>, OnboardingFailure>;
    auto read_result = secret_key_.ReadBytes(kEd25519SecretKeyBytes);
    if (read_result.IsErr()) {
        return SignResult::Err(
            OnboardingFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    auto secret_key = std::move(read_result).Unwrap();
    std::vector<uint8_t> signature(crypto_sign_BYTES);
    unsigned long long sig_len = 0;
    const int result = crypto_sign_detached(
        signature.data(),
        &sig_len,
        data.data(),
        data.size(),
        secret_key.data());
    SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
    if (result != SodiumConstants::SUCCESS) {
        return SignResult::Err(
            OnboardingFailure::Generic("Failed to sign invite envelope"));
    }
    if (sig_len != kEd25519SignatureBytes) {
        return SignResult::Err(
            OnboardingFailure::Generic("Generated signature has incorrect size"));
    }
    return SignResult::Ok(std::move(signature));
}

std::string Ed25519Signer::PublicKeyB64u() const {
    return Base64Url::Encode(public_key_);
}

Result<bool, OnboardingFailure> Ed25519Signer::Verify(
    const std::span<const uint8_t> data,
    const std::span<const uint8_t> signature,
    const std::string_view signer_pub_b64u) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<bool, OnboardingFailure>::Err(
            OnboardingFailure::Generic(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    auto pub_result = Base64Url::Decode(signer_pub_b64u);
    if (pub_result.IsErr()) {
        return Result<bool, OnboardingFailure>::Ok(false);
    }
    const auto public_key = std::move(pub_result).Unwrap();
    if (public_key.size() != kEd25519PublicKeyBytes ||
        signature.size() != kEd25519SignatureBytes) {
        return Result<bool, OnboardingFailure>::Ok(false);
    }
    const int result = crypto_sign_verify_detached(
        signature.data(),
        data.data(),
        data.size(),
        public_key.data());
    return Result<bool, OnboardingFailure>::Ok(result == SodiumConstants::SUCCESS);
}

interfaces::SignFunction Ed25519Signer::SignCapability(
    std::shared_ptr<const Ed25519Signer> signer) {
    return [signer = std::move(signer)](std::span<const uint8_t> data)
        -> Result<std::vector<uint8_t>, OnboardingFailure> {
        if (!signer) {
            return Result<std::vector<uint8_t>, OnboardingFailure>::Err(
                OnboardingFailure::Generic("Signer not available"));
        }
        return signer->Sign(data);
    };
}

interfaces::VerifyFunction Ed25519Signer::VerifyCapability() {
    return [](std::span<const uint8_t> data,
              std::span<const uint8_t> signature,
              std::string_view signer_pub_b64u) {
        return Verify(data, signature, signer_pub_b64u);
    };
}

}
