#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace keyferry::onboarding {

inline constexpr uint32_t kInviteEnvelopeVersion = 1;
inline constexpr uint32_t kInvitePayloadVersion = 1;
inline constexpr uint32_t kKeyringRecordVersion = 1;

inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SeedBytes = 32;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kGenerationKeyBytes = 32;
inline constexpr size_t kInviteSaltBytes = 16;
inline constexpr size_t kKeyringSaltBytes = 16;
inline constexpr size_t kUuidBytes = 16;

inline constexpr size_t kOpenSslErrorBufferSize = 256;
inline constexpr size_t kMaxPayloadBytes = 10 * 1024 * 1024;

inline constexpr uint32_t kDefaultKeyringKdfIterations = 200'000;
inline constexpr uint32_t kHighSecurityKeyringKdfIterations = 600'000;
inline constexpr uint32_t kTestingKeyringKdfIterations = 1'000;

inline constexpr std::chrono::milliseconds kDefaultClockSkew{5 * 60 * 1000};
inline constexpr std::chrono::milliseconds kHighSecurityClockSkew{60 * 1000};
inline constexpr std::chrono::milliseconds kDefaultMaxInviteTtl{7LL * 24 * 60 * 60 * 1000};
inline constexpr std::chrono::milliseconds kHighSecurityMaxInviteTtl{24LL * 60 * 60 * 1000};
// Hard ceiling applied even when no configured maximum is supplied
inline constexpr std::chrono::milliseconds kAbsoluteMaxInviteTtl{366LL * 24 * 60 * 60 * 1000};

inline constexpr char kAadSeparator = ':';
inline constexpr std::string_view kDefaultRole = "MEMBER";

inline constexpr std::string_view kKeyringStoragePrefix = "__keyring__:";
inline constexpr std::string_view kInviteUsedStoragePrefix = "__invite_used__:";
inline constexpr std::string_view kKeyringSealContext = "keyferry-keyring";
inline constexpr std::string_view kKeyringCheckContext = "keyferry-keyring-check";

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view INVALID_SIGNATURE = "Invalid signature";
    static constexpr std::string_view INVITE_EXPIRED = "Invite expired";
    static constexpr std::string_view INVITE_ALREADY_USED = "Invite already used";
    static constexpr std::string_view INVITE_DECRYPTION_FAILED = "Invite decryption failed";
    static constexpr std::string_view UNSUPPORTED_INVITE_VERSION = "Unsupported invite version";
    static constexpr std::string_view KEYRING_ALREADY_INITIALIZED = "Keyring already initialized";
    static constexpr std::string_view KEYRING_NOT_FOUND = "Keyring not found";
    static constexpr std::string_view KEYRING_NOT_INITIALIZED = "Keyring not initialized";
    static constexpr std::string_view KEYRING_LOCKED = "Keyring locked";
    static constexpr std::string_view KEYRING_CORRUPTED = "Keyring record corrupted";
    static constexpr std::string_view INVALID_PASSPHRASE = "Invalid passphrase";
    static constexpr std::string_view GENERATION_CONFLICT = "conflicts with the local key";
    static constexpr std::string_view TIMESTAMP_OUT_OF_RANGE = "Timestamp out of range";
};

}
