#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace keyferry::onboarding::interfaces {

/**
 * @brief Backend-agnostic string key/value store
 *
 * The keyring record and the consumed-invite registry both persist
 * through this interface. Implementations report every I/O problem as an
 * OnboardingFailureType::Storage failure; callers propagate it unchanged.
 * Implementations must be safe to call from several threads.
 */
class IStorageDriver {
public:
    virtual ~IStorageDriver() = default;

    /// Ok(nullopt) when the key is absent
    [[nodiscard]] virtual Result<std::optional<std::string>, OnboardingFailure> GetItem(
        std::string_view key) = 0;

    [[nodiscard]] virtual Result<Unit, OnboardingFailure> SetItem(
        std::string_view key,
        std::string_view value) = 0;

    /// Removing an absent key is not an error
    [[nodiscard]] virtual Result<Unit, OnboardingFailure> RemoveItem(
        std::string_view key) = 0;

    /// Keys starting with @p prefix, in lexicographic order
    [[nodiscard]] virtual Result<std::vector<std::string>, OnboardingFailure> ListKeys(
        std::string_view prefix) = 0;
};
}
