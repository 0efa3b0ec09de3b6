#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace keyferry::onboarding::encoding {

/**
 * @brief Unpadded URL-safe base64 (RFC 4648 section 5) over libsodium
 *
 * Every binary field of the invite wire format and the persisted keyring
 * record travels in this alphabet. Decode rejects padding, whitespace,
 * the standard alphabet and trailing garbage.
 */
class Base64Url {
public:
    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, OnboardingFailure> Decode(std::string_view text);

private:
    Base64Url() = delete;
};
}
