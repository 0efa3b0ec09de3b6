#pragma once
#include "keyferry/interfaces/i_storage_driver.hpp"
#include <map>
#include <mutex>
#include <string>
namespace keyferry::onboarding::storage {

/**
 * @brief Reference IStorageDriver kept entirely in process memory
 *
 * Used by tests and by the example program. Several Keyring /
 * InviteRegistry instances sharing one driver behave like several
 * processes sharing one disk, which is how persistence across restarts
 * is exercised.
 */
class InMemoryStorageDriver final : public interfaces::IStorageDriver {
public:
    InMemoryStorageDriver() = default;

    [[nodiscard]] Result<std::optional<std::string>, OnboardingFailure> GetItem(
        std::string_view key) override;

    [[nodiscard]] Result<Unit, OnboardingFailure> SetItem(
        std::string_view key,
        std::string_view value) override;

    [[nodiscard]] Result<Unit, OnboardingFailure> RemoveItem(
        std::string_view key) override;

    [[nodiscard]] Result<std::vector<std::string>, OnboardingFailure> ListKeys(
        std::string_view prefix) override;

    [[nodiscard]] size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> items_;
};
}
