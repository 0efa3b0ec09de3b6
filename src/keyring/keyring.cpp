#include "keyferry/keyring/keyring.hpp"
#include "keyferry/keyring/generation_merge.hpp"
#include "keyferry/crypto/aes_gcm.hpp"
#include "keyferry/crypto/password_kdf.hpp"
#include "keyferry/crypto/sodium_interop.hpp"
#include "keyferry/encoding/base64_url.hpp"
#include "keyferry/encoding/byte_view.hpp"
#include "keyferry/encoding/proto_support.hpp"
#include "keyferry/core/constants.hpp"
#include "keyferry/debug/onboarding_logger.hpp"
#include "onboarding/keyring.pb.h"
#include <algorithm>
#include <format>
#include <limits>
#include <set>

namespace keyferry::onboarding::keyring {
using crypto::AesGcm;
using crypto::PasswordKdf;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using encoding::AsBytes;
using encoding::Base64Url;
using proto::onboarding::KeyringRecord;
using proto::onboarding::SealedGeneration;
using debug::Component;

namespace {
    using BytesResult = Result<std::vector<uint8_t>, OnboardingFailure>;
    using UnitResult = Result<Unit, OnboardingFailure>;

    std::string GenerationAad(const std::string_view ns, const uint32_t generation_id) {
        return std::format("{}:{}:{}", kKeyringSealContext, ns, generation_id);
    }

    std::string CheckAad(const std::string_view ns) {
        return std::format("{}:{}", kKeyringCheckContext, ns);
    }

    BytesResult SealWithKey(
        const SecureMemoryHandle& wrapping_key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        const std::string_view aad) {
        auto access = wrapping_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesGcm::Encrypt(key, nonce, plaintext, AsBytes(aad));
        });
        if (access.IsErr()) {
            return BytesResult::Err(OnboardingFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return std::move(access).Unwrap();
    }

    BytesResult OpenWithKey(
        const SecureMemoryHandle& wrapping_key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> sealed,
        const std::string_view aad) {
        auto access = wrapping_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesGcm::Decrypt(key, nonce, sealed, AsBytes(aad));
        });
        if (access.IsErr()) {
            return BytesResult::Err(OnboardingFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return std::move(access).Unwrap();
    }

    UnitResult AppendSealedGeneration(
        KeyringRecord& record,
        const SecureMemoryHandle& wrapping_key,
        const std::string_view ns,
        const uint32_t generation_id,
        std::span<const uint8_t> key,
        const std::chrono::system_clock::time_point created_at) {
        const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
        auto sealed_result = SealWithKey(wrapping_key, nonce, key, GenerationAad(ns, generation_id));
        if (sealed_result.IsErr()) {
            return UnitResult::Err(std::move(sealed_result).UnwrapErr());
        }
        const auto sealed = std::move(sealed_result).Unwrap();
        SealedGeneration* generation = record.add_generations();
        generation->set_generation_id(generation_id);
        encoding::ToProtoTimestamp(created_at, generation->mutable_created_at());
        generation->set_nonce(nonce.data(), nonce.size());
        generation->set_sealed_key(sealed.data(), sealed.size());
        return UnitResult::Ok(unit);
    }

    void SortGenerations(KeyringRecord& record) {
        std::vector<SealedGeneration> sorted(
            record.generations().begin(), record.generations().end());
        std::sort(sorted.begin(), sorted.end(),
            [](const SealedGeneration& a, const SealedGeneration& b) {
                return a.generation_id() < b.generation_id();
            });
        record.clear_generations();
        for (auto& generation : sorted) {
            *record.add_generations() = std::move(generation);
        }
    }

    std::optional<uint32_t> MaxGenerationId(const KeyringRecord& record) {
        std::optional<uint32_t> max_id;
        for (const auto& generation : record.generations()) {
            if (!max_id.has_value() || generation.generation_id() > *max_id) {
                max_id = generation.generation_id();
            }
        }
        return max_id;
    }

    std::optional<uint32_t> CurrentOf(const KeyringRecord& record) {
        if (!record.has_current_generation_id()) {
            return std::nullopt;
        }
        return record.current_generation_id();
    }

    Result<std::unique_ptr<KeyringRecord>, OnboardingFailure> ParseRecord(
        const std::string& stored,
        const std::string_view expected_ns) {
        using ParseResult = Result<std::unique_ptr<KeyringRecord>, OnboardingFailure>;
        auto corrupted = [](std::string_view detail) {
            return ParseResult::Err(OnboardingFailure::Corruption(
                std::format("{}: {}", ErrorMessages::KEYRING_CORRUPTED, detail)));
        };

        auto bytes_result = Base64Url::Decode(stored);
        if (bytes_result.IsErr()) {
            return corrupted("not base64url");
        }
        const auto bytes = std::move(bytes_result).Unwrap();
        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return corrupted("record too large");
        }
        auto record = std::make_unique<KeyringRecord>();
        if (!record->ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return corrupted("not a keyring record");
        }
        if (record->version() != kKeyringRecordVersion) {
            return corrupted(std::format("unsupported version {}", record->version()));
        }
        if (record->ns() != expected_ns) {
            return corrupted("namespace mismatch");
        }
        if (record->kdf_salt().empty() || record->kdf_iterations() == 0) {
            return corrupted("missing KDF parameters");
        }
        if (record->check_nonce().size() != kAesGcmNonceBytes ||
            record->check_tag().size() != kAesGcmTagBytes) {
            return corrupted("malformed passphrase check");
        }
        std::set<uint32_t> ids;
        for (const auto& generation : record->generations()) {
            if (!ids.insert(generation.generation_id()).second) {
                return corrupted(std::format("duplicate generation {}", generation.generation_id()));
            }
            if (generation.nonce().size() != kAesGcmNonceBytes ||
                generation.sealed_key().size() != kGenerationKeyBytes + kAesGcmTagBytes) {
                return corrupted(std::format("malformed generation {}", generation.generation_id()));
            }
        }
        if (MaxGenerationId(*record) != CurrentOf(*record)) {
            return corrupted("current generation does not match generations");
        }
        return ParseResult::Ok(std::move(record));
    }

    OnboardingFailure GenerationConflict(const uint32_t generation_id) {
        return OnboardingFailure::KeyConflict(
            std::format("Generation {} {}", generation_id, ErrorMessages::GENERATION_CONFLICT));
    }

    Result<bool, OnboardingFailure> SameKey(std::span<const uint8_t> a, std::span<const uint8_t> b) {
        auto equal = SodiumInterop::ConstantTimeEquals(a, b);
        if (equal.IsErr()) {
            return Result<bool, OnboardingFailure>::Err(
                OnboardingFailure::FromSodiumFailure(equal.UnwrapErr()));
        }
        return Result<bool, OnboardingFailure>::Ok(equal.Unwrap());
    }

    Result<SecureMemoryHandle, OnboardingFailure> DeriveWrappingHandle(
        const std::string_view passphrase,
        std::span<const uint8_t> salt,
        const uint32_t iterations) {
        using HandleResult = Result<SecureMemoryHandle, OnboardingFailure>;
        auto derived = PasswordKdf::DeriveWrappingKey(passphrase, salt, iterations);
        if (derived.IsErr()) {
            return HandleResult::Err(std::move(derived).UnwrapErr());
        }
        auto key = std::move(derived).Unwrap();
        auto handle = SecureMemoryHandle::FromBytes(key);
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        if (handle.IsErr()) {
            return HandleResult::Err(OnboardingFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return HandleResult::Ok(std::move(handle).Unwrap());
    }
}

void WipeKeyMaterial(std::vector<KeyGeneration>& generations) noexcept {
    for (auto& generation : generations) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(generation.symmetric_key));
    }
}

Result<std::unique_ptr<Keyring>, OnboardingFailure> Keyring::Create(
    std::shared_ptr<interfaces::IStorageDriver> storage,
    std::string ns,
    interfaces::Clock clock) {
    using CreateResult = Result<std::unique_ptr<Keyring>, OnboardingFailure>;
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
    return CreateResult::Ok(std::unique_ptr<Keyring>(
        new Keyring(std::move(storage), std::move(ns), std::move(clock))));
}

Keyring::Keyring(
    std::shared_ptr<interfaces::IStorageDriver> storage,
    std::string ns,
    interfaces::Clock clock)
    : storage_(std::move(storage))
    , ns_(std::move(ns))
    , clock_(std::move(clock)) {}

Keyring::~Keyring() = default;

std::string Keyring::StorageKey() const {
    return std::string(kKeyringStoragePrefix) + ns_;
}

Result<Unit, OnboardingFailure> Keyring::InitNew(
    const std::string_view passphrase,
    const uint32_t kdf_iterations) {
    return Initialize(passphrase, kdf_iterations, true);
}

Result<Unit, OnboardingFailure> Keyring::InitForImport(
    const std::string_view passphrase,
    const uint32_t kdf_iterations) {
    return Initialize(passphrase, kdf_iterations, false);
}

Result<Unit, OnboardingFailure> Keyring::Initialize(
    const std::string_view passphrase,
    const uint32_t kdf_iterations,
    const bool with_first_generation) {
    if (passphrase.empty()) {
        return UnitResult::Err(OnboardingFailure::Validation("Passphrase cannot be empty"));
    }
    if (kdf_iterations == 0) {
        return UnitResult::Err(OnboardingFailure::Validation("KDF iterations must be positive"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (record_) {
        return UnitResult::Err(OnboardingFailure::Initialization(
            std::string(ErrorMessages::KEYRING_ALREADY_INITIALIZED)));
    }
    auto existing = storage_->GetItem(StorageKey());
    if (existing.IsErr()) {
        return UnitResult::Err(std::move(existing).UnwrapErr());
    }
    if (existing.Unwrap().has_value()) {
        return UnitResult::Err(OnboardingFailure::Initialization(
            std::string(ErrorMessages::KEYRING_ALREADY_INITIALIZED)));
    }

    KF_LOG_SECTION(Component::Keyring, with_first_generation ? "INIT NEW" : "INIT FOR IMPORT");

    const auto salt = SodiumInterop::GetRandomBytes(kKeyringSaltBytes);
    auto wrapping_result = DeriveWrappingHandle(passphrase, salt, kdf_iterations);
    if (wrapping_result.IsErr()) {
        return UnitResult::Err(std::move(wrapping_result).UnwrapErr());
    }
    auto wrapping_key = std::move(wrapping_result).Unwrap();

    const auto check_nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    auto check_result = SealWithKey(wrapping_key, check_nonce, {}, CheckAad(ns_));
    if (check_result.IsErr()) {
        return UnitResult::Err(std::move(check_result).UnwrapErr());
    }
    const auto check_tag = std::move(check_result).Unwrap();

    auto record = std::make_unique<KeyringRecord>();
    record->set_version(kKeyringRecordVersion);
    record->set_ns(ns_);
    record->set_kdf_salt(salt.data(), salt.size());
    record->set_kdf_iterations(kdf_iterations);
    record->set_check_nonce(check_nonce.data(), check_nonce.size());
    record->set_check_tag(check_tag.data(), check_tag.size());

    std::map<uint32_t, UnsealedGeneration> generations;
    if (with_first_generation) {
        constexpr uint32_t first_id = 0;
        auto key = SodiumInterop::GetRandomBytes(kGenerationKeyBytes);
        const auto created_at = clock_();
        auto append = AppendSealedGeneration(*record, wrapping_key, ns_, first_id, key, created_at);
        auto handle = SecureMemoryHandle::FromBytes(key);
        KF_LOG_KEY(Component::Keyring, "INIT", "generation_0", key);
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        if (append.IsErr()) {
            return UnitResult::Err(std::move(append).UnwrapErr());
        }
        if (handle.IsErr()) {
            return UnitResult::Err(OnboardingFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        record->set_current_generation_id(first_id);
        generations.emplace(first_id, UnsealedGeneration{std::move(handle).Unwrap(), created_at});
    }

    if (auto persisted = PersistLocked(*record); persisted.IsErr()) {
        return persisted;
    }

    record_ = std::move(record);
    wrapping_key_ = std::move(wrapping_key);
    generations_ = std::move(generations);
    unlocked_ = true;
    KF_LOG_VALUE(Component::Keyring, "INIT", "generation_count", generations_.size());
    return UnitResult::Ok(unit);
}

Result<Unit, OnboardingFailure> Keyring::Unlock(const std::string_view passphrase) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stored = storage_->GetItem(StorageKey());
    if (stored.IsErr()) {
        return UnitResult::Err(std::move(stored).UnwrapErr());
    }
    const auto& stored_value = stored.Unwrap();
    if (!stored_value.has_value()) {
        return UnitResult::Err(OnboardingFailure::Initialization(
            std::string(ErrorMessages::KEYRING_NOT_FOUND)));
    }
    auto parsed = ParseRecord(*stored_value, ns_);
    if (parsed.IsErr()) {
        return UnitResult::Err(std::move(parsed).UnwrapErr());
    }
    auto record = std::move(parsed).Unwrap();

    auto wrapping_result = DeriveWrappingHandle(
        passphrase, AsBytes(record->kdf_salt()), record->kdf_iterations());
    if (wrapping_result.IsErr()) {
        return UnitResult::Err(std::move(wrapping_result).UnwrapErr());
    }
    auto wrapping_key = std::move(wrapping_result).Unwrap();

    auto check = OpenWithKey(
        wrapping_key, AsBytes(record->check_nonce()), AsBytes(record->check_tag()), CheckAad(ns_));
    if (check.IsErr()) {
        auto failure = std::move(check).UnwrapErr();
        if (failure.type == OnboardingFailureType::Decryption) {
            KF_LOG_MSG(Component::Keyring, "UNLOCK", "passphrase check failed");
            return UnitResult::Err(OnboardingFailure::InvalidPassphrase(
                std::string(ErrorMessages::INVALID_PASSPHRASE)));
        }
        return UnitResult::Err(std::move(failure));
    }

    std::map<uint32_t, UnsealedGeneration> generations;
    for (const auto& sealed : record->generations()) {
        const uint32_t id = sealed.generation_id();
        auto created_at = encoding::FromProtoTimestamp(sealed.created_at());
        if (created_at.IsErr()) {
            return UnitResult::Err(OnboardingFailure::Corruption(std::format("{}: generation {}: {}",
                ErrorMessages::KEYRING_CORRUPTED, id, created_at.UnwrapErr().message)));
        }
        auto opened = OpenWithKey(
            wrapping_key, AsBytes(sealed.nonce()), AsBytes(sealed.sealed_key()), GenerationAad(ns_, id));
        if (opened.IsErr()) {
            return UnitResult::Err(OnboardingFailure::Corruption(
                std::format("{}: generation {} does not unseal", ErrorMessages::KEYRING_CORRUPTED, id)));
        }
        auto key = std::move(opened).Unwrap();
        auto handle = SecureMemoryHandle::FromBytes(key);
        SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        if (handle.IsErr()) {
            return UnitResult::Err(OnboardingFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        generations.emplace(id, UnsealedGeneration{std::move(handle).Unwrap(), created_at.Unwrap()});
    }

    record_ = std::move(record);
    wrapping_key_ = std::move(wrapping_key);
    generations_ = std::move(generations);
    unlocked_ = true;
    KF_LOG_VALUE(Component::Keyring, "UNLOCK", "generation_count", generations_.size());
    return UnitResult::Ok(unit);
}

void Keyring::Lock() {
    std::lock_guard<std::mutex> lock(mutex_);
    generations_.clear();
    wrapping_key_ = SecureMemoryHandle();
    unlocked_ = false;
    KF_LOG_MSG(Component::Keyring, "LOCK", "key material dropped");
}

Result<uint32_t, OnboardingFailure> Keyring::Rotate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = RequireUnlockedLocked(); ready.IsErr()) {
        return Result<uint32_t, OnboardingFailure>::Err(std::move(ready).UnwrapErr());
    }
    const auto current = CurrentOf(*record_);
    if (current.has_value() && *current == std::numeric_limits<uint32_t>::max()) {
        return Result<uint32_t, OnboardingFailure>::Err(
            OnboardingFailure::Generic("Generation id space exhausted"));
    }
    const uint32_t new_id = current.has_value() ? *current + 1 : 0;

    auto key = SodiumInterop::GetRandomBytes(kGenerationKeyBytes);
    const auto created_at = clock_();
    KeyringRecord next = *record_;
    auto append = AppendSealedGeneration(next, wrapping_key_, ns_, new_id, key, created_at);
    auto handle = SecureMemoryHandle::FromBytes(key);
    SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (append.IsErr()) {
        return Result<uint32_t, OnboardingFailure>::Err(std::move(append).UnwrapErr());
    }
    if (handle.IsErr()) {
        return Result<uint32_t, OnboardingFailure>::Err(
            OnboardingFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    next.set_current_generation_id(new_id);

    if (auto persisted = PersistLocked(next); persisted.IsErr()) {
        KF_LOG_MSG(Component::Keyring, "ROTATE", "persist failed, state unchanged");
        return Result<uint32_t, OnboardingFailure>::Err(std::move(persisted).UnwrapErr());
    }
    *record_ = std::move(next);
    generations_.emplace(new_id, UnsealedGeneration{std::move(handle).Unwrap(), created_at});
    KF_LOG_VALUE(Component::Keyring, "ROTATE", "current_generation_id", new_id);
    return Result<uint32_t, OnboardingFailure>::Ok(new_id);
}

Result<std::vector<KeyGeneration>, OnboardingFailure> Keyring::ExportAll() const {
    using ExportResult = Result<std::vector<KeyGeneration>, OnboardingFailure>;
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = RequireUnlockedLocked(); ready.IsErr()) {
        return ExportResult::Err(std::move(ready).UnwrapErr());
    }
    std::vector<KeyGeneration> snapshot;
    snapshot.reserve(generations_.size());
    for (const auto& [id, generation] : generations_) {
        auto read = ReadGenerationLocked(id);
        if (read.IsErr()) {
            WipeKeyMaterial(snapshot);
            return ExportResult::Err(std::move(read).UnwrapErr());
        }
        snapshot.push_back(std::move(read).Unwrap());
    }
    return ExportResult::Ok(std::move(snapshot));
}

Result<ImportOutcome, OnboardingFailure> Keyring::ImportGenerations(
    const std::span<const KeyGeneration> incoming) {
    using ImportResult = Result<ImportOutcome, OnboardingFailure>;
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = RequireUnlockedLocked(); ready.IsErr()) {
        return ImportResult::Err(std::move(ready).UnwrapErr());
    }
    for (const auto& generation : incoming) {
        if (generation.symmetric_key.size() != kGenerationKeyBytes) {
            return ImportResult::Err(OnboardingFailure::Validation(
                std::format("Generation {} key must be {} bytes, got {}",
                    generation.generation_id, kGenerationKeyBytes, generation.symmetric_key.size())));
        }
    }

    std::set<uint32_t> local_ids;
    for (const auto& [id, generation] : generations_) {
        local_ids.insert(id);
    }
    std::vector<uint32_t> incoming_ids;
    std::map<uint32_t, const KeyGeneration*> first_occurrence;
    incoming_ids.reserve(incoming.size());
    for (const auto& generation : incoming) {
        incoming_ids.push_back(generation.generation_id);
        const auto [it, inserted] = first_occurrence.try_emplace(generation.generation_id, &generation);
        if (inserted) {
            continue;
        }
        auto same = SameKey(it->second->symmetric_key, generation.symmetric_key);
        if (same.IsErr()) {
            return ImportResult::Err(std::move(same).UnwrapErr());
        }
        if (!same.Unwrap()) {
            return ImportResult::Err(GenerationConflict(generation.generation_id));
        }
    }

    // A local id may only come back with the identical key
    for (const auto& entry : first_occurrence) {
        const uint32_t id = entry.first;
        const KeyGeneration* generation = entry.second;
        const auto local = generations_.find(id);
        if (local == generations_.end()) {
            continue;
        }
        auto compared = local->second.key.WithReadAccess([generation](std::span<const uint8_t> local_key) {
            return SameKey(local_key, generation->symmetric_key);
        });
        if (compared.IsErr()) {
            return ImportResult::Err(OnboardingFailure::FromSodiumFailure(compared.UnwrapErr()));
        }
        auto same = std::move(compared).Unwrap();
        if (same.IsErr()) {
            return ImportResult::Err(std::move(same).UnwrapErr());
        }
        if (!same.Unwrap()) {
            KF_LOG_VALUE(Component::Keyring, "IMPORT", "conflicting_generation", id);
            return ImportResult::Err(GenerationConflict(id));
        }
    }

    const auto previous_current = CurrentOf(*record_);
    auto plan = PlanGenerationMerge(local_ids, previous_current, incoming_ids);

    ImportOutcome outcome;
    outcome.imported_count = plan.new_ids.size();
    outcome.rewrapped = !plan.new_ids.empty();
    outcome.merged_generation_ids = plan.new_ids;
    outcome.previous_current = previous_current;

    KF_LOG_VALUE(Component::Keyring, "IMPORT", "incoming", incoming.size());
    KF_LOG_VALUE(Component::Keyring, "IMPORT", "skipped_duplicates", incoming.size() - plan.new_ids.size());
    if (plan.new_ids.empty()) {
        return ImportResult::Ok(std::move(outcome));
    }

    KeyringRecord next = *record_;
    std::map<uint32_t, UnsealedGeneration> staged;
    for (const uint32_t id : plan.new_ids) {
        const KeyGeneration& generation = *first_occurrence.at(id);
        auto append = AppendSealedGeneration(
            next, wrapping_key_, ns_, id, generation.symmetric_key, generation.created_at);
        if (append.IsErr()) {
            return ImportResult::Err(std::move(append).UnwrapErr());
        }
        auto handle = SecureMemoryHandle::FromBytes(generation.symmetric_key);
        if (handle.IsErr()) {
            return ImportResult::Err(OnboardingFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        staged.emplace(id, UnsealedGeneration{std::move(handle).Unwrap(), generation.created_at});
    }
    SortGenerations(next);
    next.set_current_generation_id(*plan.next_current);

    if (auto persisted = PersistLocked(next); persisted.IsErr()) {
        KF_LOG_MSG(Component::Keyring, "IMPORT", "persist failed, state unchanged");
        return ImportResult::Err(std::move(persisted).UnwrapErr());
    }
    *record_ = std::move(next);
    generations_.merge(staged);
    KF_LOG_VALUE(Component::Keyring, "IMPORT", "current_generation_id", *plan.next_current);
    return ImportResult::Ok(std::move(outcome));
}

Result<Unit, OnboardingFailure> Keyring::RollbackImport(const ImportOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = RequireUnlockedLocked(); ready.IsErr()) {
        return ready;
    }
    if (outcome.merged_generation_ids.empty()) {
        return UnitResult::Ok(unit);
    }
    const std::set<uint32_t> to_remove(
        outcome.merged_generation_ids.begin(), outcome.merged_generation_ids.end());

    KeyringRecord next = *record_;
    next.clear_generations();
    for (const auto& generation : record_->generations()) {
        if (!to_remove.contains(generation.generation_id())) {
            *next.add_generations() = generation;
        }
    }
    // Rotation may have happened since the import; keep current at the max id
    if (const auto max_id = MaxGenerationId(next); max_id.has_value()) {
        next.set_current_generation_id(*max_id);
    } else {
        next.clear_current_generation_id();
    }

    if (auto persisted = PersistLocked(next); persisted.IsErr()) {
        return persisted;
    }
    *record_ = std::move(next);
    for (const uint32_t id : to_remove) {
        generations_.erase(id);
    }
    KF_LOG_VALUE(Component::Keyring, "ROLLBACK", "removed", to_remove.size());
    return UnitResult::Ok(unit);
}

Result<KeyGeneration, OnboardingFailure> Keyring::GetActiveKey() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = RequireUnlockedLocked(); ready.IsErr()) {
        return Result<KeyGeneration, OnboardingFailure>::Err(std::move(ready).UnwrapErr());
    }
    const auto current = CurrentOf(*record_);
    if (!current.has_value()) {
        return Result<KeyGeneration, OnboardingFailure>::Err(
            OnboardingFailure::Initialization("Keyring holds no generations"));
    }
    return ReadGenerationLocked(*current);
}

Result<KeyGeneration, OnboardingFailure> Keyring::GetGeneration(const uint32_t generation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = RequireUnlockedLocked(); ready.IsErr()) {
        return Result<KeyGeneration, OnboardingFailure>::Err(std::move(ready).UnwrapErr());
    }
    return ReadGenerationLocked(generation_id);
}

std::optional<uint32_t> Keyring::CurrentGenerationId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!record_) {
        return std::nullopt;
    }
    return CurrentOf(*record_);
}

size_t Keyring::GenerationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!record_) {
        return 0;
    }
    return static_cast<size_t>(record_->generations_size());
}

bool Keyring::IsUnlocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unlocked_;
}

Result<Unit, OnboardingFailure> Keyring::RequireUnlockedLocked() const {
    if (!record_) {
        return UnitResult::Err(OnboardingFailure::Initialization(
            std::string(ErrorMessages::KEYRING_NOT_INITIALIZED)));
    }
    if (!unlocked_) {
        return UnitResult::Err(OnboardingFailure::Locked(
            std::string(ErrorMessages::KEYRING_LOCKED)));
    }
    return UnitResult::Ok(unit);
}

Result<Unit, OnboardingFailure> Keyring::PersistLocked(const KeyringRecord& record) {
    auto bytes = encoding::SerializeDeterministic(record);
    if (bytes.IsErr()) {
        return UnitResult::Err(std::move(bytes).UnwrapErr());
    }
    return storage_->SetItem(StorageKey(), Base64Url::Encode(bytes.Unwrap()));
}

Result<KeyGeneration, OnboardingFailure> Keyring::ReadGenerationLocked(
    const uint32_t generation_id) const {
    using ReadResult = Result<KeyGeneration, OnboardingFailure>;
    const auto it = generations_.find(generation_id);
    if (it == generations_.end()) {
        return ReadResult::Err(OnboardingFailure::Validation(
            std::format("Generation {} not found", generation_id)));
    }
    auto bytes = it->second.key.ReadBytes(it->second.key.Size());
    if (bytes.IsErr()) {
        return ReadResult::Err(OnboardingFailure::FromSodiumFailure(bytes.UnwrapErr()));
    }
    KeyGeneration generation;
    generation.generation_id = generation_id;
    generation.symmetric_key = std::move(bytes).Unwrap();
    generation.created_at = it->second.created_at;
    return ReadResult::Ok(std::move(generation));
}

}
