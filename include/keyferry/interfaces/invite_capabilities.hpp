#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>
namespace keyferry::onboarding::interfaces {

/// Produces a detached signature over the given bytes
using SignFunction = std::function<
    Result<std::vector<uint8_t>, OnboardingFailure>(std::span<const uint8_t> data)>;

/// Ok(true) only for a valid signature by the holder of signer_pub_b64u
using VerifyFunction = std::function<
    Result<bool, OnboardingFailure>(
        std::span<const uint8_t> data,
        std::span<const uint8_t> signature,
        std::string_view signer_pub_b64u)>;

using IsUsedFunction = std::function<
    Result<bool, OnboardingFailure>(std::string_view invite_id)>;

/// Test-and-set: Ok(true) when newly marked, Ok(false) when already consumed
using MarkUsedFunction = std::function<
    Result<bool, OnboardingFailure>(std::string_view invite_id)>;

/**
 * Membership policy hook: Ok when the holder of signer_pub_b64u may grant
 * role. An Err carries the refusal and is reported to the caller.
 */
using AuthorizeRoleFunction = std::function<
    Result<Unit, OnboardingFailure>(std::string_view signer_pub_b64u, std::string_view role)>;

/// Records the granted role for the accepting device in the caller's membership store
using ApplyRoleFunction = std::function<
    Result<Unit, OnboardingFailure>(std::string_view signer_pub_b64u, std::string_view role)>;

using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}
}
