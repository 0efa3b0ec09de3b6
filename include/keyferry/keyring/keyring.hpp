#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include "keyferry/crypto/sodium_secure_memory_handle.hpp"
#include "keyferry/interfaces/i_storage_driver.hpp"
#include "keyferry/interfaces/invite_capabilities.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyferry::proto::onboarding {
class KeyringRecord;
}

namespace keyferry::onboarding::keyring {

/// One version of the symmetric data key, in the clear
struct KeyGeneration {
    uint32_t generation_id = 0;
    std::vector<uint8_t> symmetric_key;
    std::chrono::system_clock::time_point created_at;
};

/// What ImportGenerations() changed; enough to undo it with RollbackImport()
struct ImportOutcome {
    size_t imported_count = 0;
    bool rewrapped = false;
    std::vector<uint32_t> merged_generation_ids;
    std::optional<uint32_t> previous_current;
};

/// Zeroes every symmetric_key in @p generations
void WipeKeyMaterial(std::vector<KeyGeneration>& generations) noexcept;

/**
 * @brief Versioned store of symmetric data keys, encrypted at rest
 *
 * A keyring belongs to one namespace and persists as a single record in
 * the storage driver under "__keyring__:<ns>". Generation keys are sealed
 * with AES-256-GCM under a wrapping key derived from the device
 * passphrase (PBKDF2-HMAC-SHA256). While unlocked, the wrapping key and
 * the unsealed generation keys live in SecureMemoryHandle allocations.
 *
 * Invariants:
 * - Generations are append-only; rotation never removes one.
 * - CurrentGenerationId() is the largest id present, nullopt when empty.
 * - Every mutation is persisted before it becomes visible in memory, so a
 *   storage failure leaves the keyring exactly as it was.
 *
 * All public methods are thread-safe.
 */
class Keyring {
public:
    [[nodiscard]] static Result<std::unique_ptr<Keyring>, OnboardingFailure> Create(
        std::shared_ptr<interfaces::IStorageDriver> storage,
        std::string ns,
        interfaces::Clock clock = interfaces::SystemClock());

    ~Keyring();

    Keyring(const Keyring&) = delete;
    Keyring& operator=(const Keyring&) = delete;
    Keyring(Keyring&&) = delete;
    Keyring& operator=(Keyring&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Create the keyring with generation 0 and persist it
     *
     * Fails with Initialization "Keyring already initialized" when a
     * keyring for this namespace exists in memory or in storage.
     */
    [[nodiscard]] Result<Unit, OnboardingFailure> InitNew(
        std::string_view passphrase,
        uint32_t kdf_iterations);

    /**
     * @brief Create an empty keyring that will be filled by an invite
     *
     * Same guard as InitNew(). CurrentGenerationId() stays nullopt until
     * the first import.
     */
    [[nodiscard]] Result<Unit, OnboardingFailure> InitForImport(
        std::string_view passphrase,
        uint32_t kdf_iterations);

    /**
     * @brief Load the persisted record and unseal every generation
     *
     * - Initialization "Keyring not found" when nothing is stored
     * - Corruption when the stored record is malformed
     * - InvalidPassphrase when the passphrase check does not open
     */
    [[nodiscard]] Result<Unit, OnboardingFailure> Unlock(std::string_view passphrase);

    /// Drops the wrapping key and all unsealed key material
    void Lock();

    // ========================================================================
    // Generations
    // ========================================================================

    /// @return id of the new current generation
    [[nodiscard]] Result<uint32_t, OnboardingFailure> Rotate();

    /// Snapshot ordered by generation id. Caller wipes with WipeKeyMaterial().
    [[nodiscard]] Result<std::vector<KeyGeneration>, OnboardingFailure> ExportAll() const;

    /**
     * @brief Merge generations by id
     *
     * An id already present (or repeated in @p incoming) with the same key
     * is skipped. The same id with a different key is a KeyConflict and
     * nothing is imported. Every incoming key must be 32 bytes or nothing
     * is imported. The current generation advances only when the largest
     * merged id exceeds it.
     */
    [[nodiscard]] Result<ImportOutcome, OnboardingFailure> ImportGenerations(
        std::span<const KeyGeneration> incoming);

    /// Remove exactly what @p outcome merged
    [[nodiscard]] Result<Unit, OnboardingFailure> RollbackImport(const ImportOutcome& outcome);

    /**
     * @brief Hold across an import and whatever decides whether it stays
     *
     * Separate from the state mutex, so keyring methods stay callable while
     * it is held. Acceptances into different keyrings never contend.
     */
    [[nodiscard]] std::unique_lock<std::mutex> LockForImport() const {
        return std::unique_lock<std::mutex>(import_mutex_);
    }

    [[nodiscard]] Result<KeyGeneration, OnboardingFailure> GetActiveKey() const;

    [[nodiscard]] Result<KeyGeneration, OnboardingFailure> GetGeneration(uint32_t generation_id) const;

    // ========================================================================
    // State
    // ========================================================================

    [[nodiscard]] std::optional<uint32_t> CurrentGenerationId() const;

    [[nodiscard]] size_t GenerationCount() const;

    [[nodiscard]] bool IsUnlocked() const;

    [[nodiscard]] const std::string& Namespace() const noexcept { return ns_; }

    [[nodiscard]] std::string StorageKey() const;

private:
    Keyring(std::shared_ptr<interfaces::IStorageDriver> storage,
            std::string ns,
            interfaces::Clock clock);

    struct UnsealedGeneration {
        crypto::SecureMemoryHandle key;
        std::chrono::system_clock::time_point created_at;
    };

    [[nodiscard]] Result<Unit, OnboardingFailure> Initialize(
        std::string_view passphrase,
        uint32_t kdf_iterations,
        bool with_first_generation);

    [[nodiscard]] Result<Unit, OnboardingFailure> RequireUnlockedLocked() const;

    [[nodiscard]] Result<Unit, OnboardingFailure> PersistLocked(
        const proto::onboarding::KeyringRecord& record);

    [[nodiscard]] Result<KeyGeneration, OnboardingFailure> ReadGenerationLocked(
        uint32_t generation_id) const;

    std::shared_ptr<interfaces::IStorageDriver> storage_;
    std::string ns_;
    interfaces::Clock clock_;

    mutable std::mutex mutex_;
    mutable std::mutex import_mutex_;
    std::unique_ptr<proto::onboarding::KeyringRecord> record_;
    crypto::SecureMemoryHandle wrapping_key_;
    std::map<uint32_t, UnsealedGeneration> generations_;
    bool unlocked_ = false;
};

}
