#include "keyferry/security/invite_registry.hpp"
#include "keyferry/core/constants.hpp"
#include "keyferry/encoding/proto_support.hpp"
#include "keyferry/debug/onboarding_logger.hpp"

namespace keyferry::onboarding::security {
using debug::Component;

Result<std::unique_ptr<InviteRegistry>, OnboardingFailure> InviteRegistry::Create(
    std::shared_ptr<interfaces::IStorageDriver> storage,
    std::string ns,
    interfaces::Clock clock) {
    using CreateResult = Result<std::unique_ptr<InviteRegistry>, OnboardingFailure>;
    if (!storage) {
        return CreateResult::Err(OnboardingFailure::Validation("Storage driver is required"));
    }
    if (ns.empty() || ns.find(kAadSeparator) != std::string::npos) {
        return CreateResult::Err(
            OnboardingFailure::Validation("Namespace must be non-empty and must not contain ':'"));
    }
    if (!clock) {
        return CreateResult::Err(OnboardingFailure::Validation("Clock is required"));
    }
    auto state = std::make_shared<State>();
    state->storage = std::move(storage);
    state->ns = std::move(ns);
    state->clock = std::move(clock);
    return CreateResult::Ok(std::unique_ptr<InviteRegistry>(new InviteRegistry(std::move(state))));
}

InviteRegistry::InviteRegistry(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

std::string InviteRegistry::Prefix(const State& state) {
    std::string prefix(kInviteUsedStoragePrefix);
    prefix += state.ns;
    prefix += kAadSeparator;
    return prefix;
}

Result<std::string, OnboardingFailure> InviteRegistry::EntryKey(
    const State& state, const std::string_view invite_id) {
    if (invite_id.empty() || invite_id.find(kAadSeparator) != std::string_view::npos) {
        return Result<std::string, OnboardingFailure>::Err(
            OnboardingFailure::Validation("Invite id must be non-empty and must not contain ':'"));
    }
    return Result<std::string, OnboardingFailure>::Ok(Prefix(state) + std::string(invite_id));
}

Result<bool, OnboardingFailure> InviteRegistry::IsUsed(State& state, const std::string_view invite_id) {
    auto key = EntryKey(state, invite_id);
    if (key.IsErr()) {
        return Result<bool, OnboardingFailure>::Err(std::move(key).UnwrapErr());
    }
    std::lock_guard guard(state.lock);
    auto item = state.storage->GetItem(key.Unwrap());
    if (item.IsErr()) {
        return Result<bool, OnboardingFailure>::Err(std::move(item).UnwrapErr());
    }
    return Result<bool, OnboardingFailure>::Ok(item.Unwrap().has_value());
}

Result<bool, OnboardingFailure> InviteRegistry::MarkUsed(State& state, const std::string_view invite_id) {
    auto key = EntryKey(state, invite_id);
    if (key.IsErr()) {
        return Result<bool, OnboardingFailure>::Err(std::move(key).UnwrapErr());
    }
    std::lock_guard guard(state.lock);
    auto item = state.storage->GetItem(key.Unwrap());
    if (item.IsErr()) {
        return Result<bool, OnboardingFailure>::Err(std::move(item).UnwrapErr());
    }
    if (item.Unwrap().has_value()) {
        KF_LOG_MSG(Component::Registry, "MARK", "already consumed");
        return Result<bool, OnboardingFailure>::Ok(false);
    }
    if (auto stored = state.storage->SetItem(key.Unwrap(), encoding::FormatRfc3339(state.clock()));
        stored.IsErr()) {
        return Result<bool, OnboardingFailure>::Err(std::move(stored).UnwrapErr());
    }
    KF_LOG_MSG(Component::Registry, "MARK", std::string(invite_id));
    return Result<bool, OnboardingFailure>::Ok(true);
}

Result<bool, OnboardingFailure> InviteRegistry::IsUsed(const std::string_view invite_id) const {
    return IsUsed(*state_, invite_id);
}

Result<bool, OnboardingFailure> InviteRegistry::MarkUsed(const std::string_view invite_id) {
    return MarkUsed(*state_, invite_id);
}

Result<std::vector<std::string>, OnboardingFailure> InviteRegistry::ListUsed() const {
    using ListResult = Result<std::vector<std::string>, OnboardingFailure>;
    const std::string prefix = Prefix(*state_);
    std::lock_guard guard(state_->lock);
    auto keys = state_->storage->ListKeys(prefix);
    if (keys.IsErr()) {
        return ListResult::Err(std::move(keys).UnwrapErr());
    }
    std::vector<std::string> ids;
    for (const auto& key : keys.Unwrap()) {
        ids.push_back(key.substr(prefix.size()));
    }
    return ListResult::Ok(std::move(ids));
}

interfaces::IsUsedFunction InviteRegistry::IsUsedCapability() const {
    return [state = state_](std::string_view invite_id) { return IsUsed(*state, invite_id); };
}

interfaces::MarkUsedFunction InviteRegistry::MarkUsedCapability() {
    return [state = state_](std::string_view invite_id) { return MarkUsed(*state, invite_id); };
}

}
