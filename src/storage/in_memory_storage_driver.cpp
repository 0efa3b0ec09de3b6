#include "keyferry/storage/in_memory_storage_driver.hpp"

namespace keyferry::onboarding::storage {

Result<std::optional<std::string>, OnboardingFailure> InMemoryStorageDriver::GetItem(
    const std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = items_.find(key);
    if (it == items_.end()) {
        return Result<std::optional<std::string>, OnboardingFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::string>, OnboardingFailure>::Ok(it->second);
}

Result<Unit, OnboardingFailure> InMemoryStorageDriver::SetItem(
    const std::string_view key,
    const std::string_view value) {
    if (key.empty()) {
        return Result<Unit, OnboardingFailure>::Err(
            OnboardingFailure::Storage("Storage key cannot be empty"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    items_.insert_or_assign(std::string(key), std::string(value));
    return Result<Unit, OnboardingFailure>::Ok(unit);
}

Result<Unit, OnboardingFailure> InMemoryStorageDriver::RemoveItem(const std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = items_.find(key); it != items_.end()) {
        items_.erase(it);
    }
    return Result<Unit, OnboardingFailure>::Ok(unit);
}

Result<std::vector<std::string>, OnboardingFailure> InMemoryStorageDriver::ListKeys(
    const std::string_view prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = items_.lower_bound(prefix); it != items_.end(); ++it) {
        if (!it->first.starts_with(prefix)) {
            break;
        }
        keys.push_back(it->first);
    }
    return Result<std::vector<std::string>, OnboardingFailure>::Ok(std::move(keys));
}

size_t InMemoryStorageDriver::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

}
