#include "keyferry/encoding/base64_url.hpp"
#include <sodium.h>
#include <format>
namespace keyferry::onboarding::encoding {
namespace {
    constexpr int kVariant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
}

std::string Base64Url::Encode(const std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), kVariant);
    std::string output(encoded_len, '\0');
    sodium_bin2base64(output.data(), output.size(), data.data(), data.size(), kVariant);
    // encoded_len counts the terminating NUL
    output.resize(encoded_len - 1);
    return output;
}

Result<std::vector<uint8_t>, OnboardingFailure> Base64Url::Decode(const std::string_view text) {
    using DecodeResult = Result<std::vector<uint8_t>, OnboardingFailure>;
    if (text.empty()) {
        return DecodeResult::Ok({});
    }
    std::vector<uint8_t> output(text.size() * 3 / 4 + 1);
    size_t decoded_len = 0;
    const char* end = nullptr;
    const int result = sodium_base642bin(
        output.data(), output.size(),
        text.data(), text.size(),
        nullptr,
        &decoded_len,
        &end,
        kVariant);
    if (result != 0 || end != text.data() + text.size()) {
        return DecodeResult::Err(
            OnboardingFailure::Decode(
                std::format("Invalid base64url input ({} chars)", text.size())));
    }
    output.resize(decoded_len);
    return DecodeResult::Ok(std::move(output));
}
}
