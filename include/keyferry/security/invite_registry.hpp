#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include "keyferry/interfaces/i_storage_driver.hpp"
#include "keyferry/interfaces/invite_capabilities.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
namespace keyferry::onboarding::security {

/**
 * @brief Append-only set of consumed invite ids for one namespace
 *
 * Entries live in the storage driver under "__invite_used__:<ns>:<id>"
 * with the RFC 3339 time of consumption as value, so they survive a
 * restart. Entries are never removed.
 *
 * MarkUsed() is a test-and-set serialized by an internal mutex: share
 * one registry per namespace within a process. Two registries on the
 * same storage in one process do not coordinate.
 *
 * Capabilities share the registry's state and stay valid after the
 * registry itself is destroyed.
 */
class InviteRegistry {
public:
    [[nodiscard]] static Result<std::unique_ptr<InviteRegistry>, OnboardingFailure> Create(
        std::shared_ptr<interfaces::IStorageDriver> storage,
        std::string ns,
        interfaces::Clock clock = interfaces::SystemClock());

    InviteRegistry(const InviteRegistry&) = delete;
    InviteRegistry& operator=(const InviteRegistry&) = delete;
    InviteRegistry(InviteRegistry&&) = delete;
    InviteRegistry& operator=(InviteRegistry&&) = delete;
    ~InviteRegistry() = default;

    [[nodiscard]] Result<bool, OnboardingFailure> IsUsed(std::string_view invite_id) const;

    /// Ok(true) when newly recorded, Ok(false) when it was already present
    [[nodiscard]] Result<bool, OnboardingFailure> MarkUsed(std::string_view invite_id);

    /// Consumed invite ids in this namespace, sorted
    [[nodiscard]] Result<std::vector<std::string>, OnboardingFailure> ListUsed() const;

    [[nodiscard]] interfaces::IsUsedFunction IsUsedCapability() const;

    [[nodiscard]] interfaces::MarkUsedFunction MarkUsedCapability();

    [[nodiscard]] const std::string& Namespace() const noexcept { return state_->ns; }

private:
    struct State {
        std::shared_ptr<interfaces::IStorageDriver> storage;
        std::string ns;
        interfaces::Clock clock;
        std::mutex lock;
    };

    explicit InviteRegistry(std::shared_ptr<State> state);

    [[nodiscard]] static std::string Prefix(const State& state);

    [[nodiscard]] static Result<std::string, OnboardingFailure> EntryKey(
        const State& state, std::string_view invite_id);

    [[nodiscard]] static Result<bool, OnboardingFailure> IsUsed(State& state, std::string_view invite_id);

    [[nodiscard]] static Result<bool, OnboardingFailure> MarkUsed(State& state, std::string_view invite_id);

    std::shared_ptr<State> state_;
};
}
