#pragma once
#include "keyferry/interfaces/i_storage_driver.hpp"
#include "keyferry/storage/in_memory_storage_driver.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace keyferry::onboarding::test_helpers {

/// In-memory driver whose reads and writes can be made to fail on demand
class FailingStorageDriver final : public interfaces::IStorageDriver {
public:
    FailingStorageDriver()
        : inner_(std::make_shared<storage::InMemoryStorageDriver>()) {}

    explicit FailingStorageDriver(std::shared_ptr<storage::InMemoryStorageDriver> inner)
        : inner_(std::move(inner)) {}

    void FailWrites(const bool fail) noexcept { fail_writes_.store(fail); }
    void FailReads(const bool fail) noexcept { fail_reads_.store(fail); }

    [[nodiscard]] int WriteAttempts() const noexcept { return write_attempts_.load(); }

    [[nodiscard]] Result<std::optional<std::string>, OnboardingFailure> GetItem(
        const std::string_view key) override {
        if (fail_reads_.load()) {
            return Result<std::optional<std::string>, OnboardingFailure>::Err(
                OnboardingFailure::Storage("simulated read failure"));
        }
        return inner_->GetItem(key);
    }

    [[nodiscard]] Result<Unit, OnboardingFailure> SetItem(
        const std::string_view key,
        const std::string_view value) override {
        write_attempts_.fetch_add(1);
        if (fail_writes_.load()) {
            return Result<Unit, OnboardingFailure>::Err(
                OnboardingFailure::Storage("simulated write failure"));
        }
        return inner_->SetItem(key, value);
    }

    [[nodiscard]] Result<Unit, OnboardingFailure> RemoveItem(const std::string_view key) override {
        if (fail_writes_.load()) {
            return Result<Unit, OnboardingFailure>::Err(
                OnboardingFailure::Storage("simulated write failure"));
        }
        return inner_->RemoveItem(key);
    }

    [[nodiscard]] Result<std::vector<std::string>, OnboardingFailure> ListKeys(
        const std::string_view prefix) override {
        if (fail_reads_.load()) {
            return Result<std::vector<std::string>, OnboardingFailure>::Err(
                OnboardingFailure::Storage("simulated read failure"));
        }
        return inner_->ListKeys(prefix);
    }

    [[nodiscard]] const std::shared_ptr<storage::InMemoryStorageDriver>& Inner() const noexcept {
        return inner_;
    }

private:
    std::shared_ptr<storage::InMemoryStorageDriver> inner_;
    std::atomic<bool> fail_writes_{false};
    std::atomic<bool> fail_reads_{false};
    std::atomic<int> write_attempts_{0};
};

}
