#pragma once
#include <string>
#include <string_view>
namespace keyferry::onboarding {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class OnboardingFailureType {
    Generic,
    Validation,
    UnsupportedVersion,
    Authentication,
    Temporal,
    Replay,
    Decryption,
    Storage,
    Initialization,
    Corruption,
    InvalidPassphrase,
    Locked,
    KeyConflict,
    Authorization,
    KeyGeneration,
    DeriveKey,
    Encode,
    Decode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure value carried by every fallible onboarding operation
 *
 * The type groups failures by how a caller should react:
 * Validation / UnsupportedVersion / Authentication / Temporal / Replay are
 * terminal for the invite, Decryption may be retried with another code,
 * Storage may be retried as a whole because nothing was mutated.
 * KeyConflict and Authorization leave the invite unconsumed; they need an
 * operator decision before the same invite can succeed.
 */
class OnboardingFailure {
public:
    OnboardingFailureType type;
    std::string message;
    OnboardingFailure(const OnboardingFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static OnboardingFailure Generic(std::string msg) {
        return {OnboardingFailureType::Generic, std::move(msg)};
    }
    static OnboardingFailure Validation(std::string msg) {
        return {OnboardingFailureType::Validation, std::move(msg)};
    }
    static OnboardingFailure UnsupportedVersion(std::string msg) {
        return {OnboardingFailureType::UnsupportedVersion, std::move(msg)};
    }
    static OnboardingFailure Authentication(std::string msg) {
        return {OnboardingFailureType::Authentication, std::move(msg)};
    }
    static OnboardingFailure Temporal(std::string msg) {
        return {OnboardingFailureType::Temporal, std::move(msg)};
    }
    static OnboardingFailure Replay(std::string msg) {
        return {OnboardingFailureType::Replay, std::move(msg)};
    }
    static OnboardingFailure Decryption(std::string msg) {
        return {OnboardingFailureType::Decryption, std::move(msg)};
    }
    static OnboardingFailure Storage(std::string msg) {
        return {OnboardingFailureType::Storage, std::move(msg)};
    }
    static OnboardingFailure Initialization(std::string msg) {
        return {OnboardingFailureType::Initialization, std::move(msg)};
    }
    static OnboardingFailure Corruption(std::string msg) {
        return {OnboardingFailureType::Corruption, std::move(msg)};
    }
    static OnboardingFailure InvalidPassphrase(std::string msg) {
        return {OnboardingFailureType::InvalidPassphrase, std::move(msg)};
    }
    static OnboardingFailure Locked(std::string msg) {
        return {OnboardingFailureType::Locked, std::move(msg)};
    }
    static OnboardingFailure KeyConflict(std::string msg) {
        return {OnboardingFailureType::KeyConflict, std::move(msg)};
    }
    static OnboardingFailure Authorization(std::string msg) {
        return {OnboardingFailureType::Authorization, std::move(msg)};
    }
    static OnboardingFailure KeyGeneration(std::string msg) {
        return {OnboardingFailureType::KeyGeneration, std::move(msg)};
    }
    static OnboardingFailure DeriveKey(std::string msg) {
        return {OnboardingFailureType::DeriveKey, std::move(msg)};
    }
    static OnboardingFailure Encode(std::string msg) {
        return {OnboardingFailureType::Encode, std::move(msg)};
    }
    static OnboardingFailure Decode(std::string msg) {
        return {OnboardingFailureType::Decode, std::move(msg)};
    }
    static OnboardingFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsValidationError() const noexcept {
        return type == OnboardingFailureType::Validation ||
               type == OnboardingFailureType::UnsupportedVersion;
    }
    [[nodiscard]] bool IsRetryableWithDifferentCode() const noexcept {
        return type == OnboardingFailureType::Decryption;
    }
};
}
