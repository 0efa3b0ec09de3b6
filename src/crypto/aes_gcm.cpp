#include "keyferry/crypto/aes_gcm.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
#include "keyferry/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <format>
#include <limits>
#include <memory>
#include <string>
namespace keyferry::onboarding::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    using BytesResult = Result<std::vector<uint8_t>, OnboardingFailure>;

    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[kOpenSslErrorBufferSize];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    Result<Unit, OnboardingFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, OnboardingFailure>::Err(
                OnboardingFailure::Validation(
                    std::format("AES-256-GCM key must be {} bytes, got {}",
                        kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, OnboardingFailure>::Err(
                OnboardingFailure::Validation(
                    std::format("AES-GCM nonce must be {} bytes, got {}",
                        kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, OnboardingFailure>::Ok(unit);
    }

    bool FitsInt(size_t size) {
        return size <= static_cast<size_t>(std::numeric_limits<int>::max());
    }
}
Result<std::vector<uint8_t>, OnboardingFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return BytesResult::Err(std::move(check).UnwrapErr());
    }
    if (!FitsInt(plaintext.size()) || !FitsInt(associated_data.size())) {
        return BytesResult::Err(
            OnboardingFailure::Validation("AES-GCM input exceeds maximum length"));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return BytesResult::Err(
                OnboardingFailure::Generic(
                    std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return BytesResult::Ok(std::move(output));
}
Result<std::vector<uint8_t>, OnboardingFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return BytesResult::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return BytesResult::Err(
            OnboardingFailure::Validation(
                std::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    if (!FitsInt(ciphertext_with_tag.size()) || !FitsInt(associated_data.size())) {
        return BytesResult::Err(
            OnboardingFailure::Validation("AES-GCM input exceeds maximum length"));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return BytesResult::Err(
                OnboardingFailure::Generic(
                    std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return BytesResult::Err(
            OnboardingFailure::Decryption(
                std::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return BytesResult::Err(
            OnboardingFailure::Generic(
                std::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    const int ret = EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len);
    if (ret != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return BytesResult::Err(
            OnboardingFailure::Decryption(
                "Authentication tag verification failed - data may have been tampered with"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return BytesResult::Ok(std::move(output));
}
}
