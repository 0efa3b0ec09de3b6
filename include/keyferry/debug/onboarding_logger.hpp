#pragma once

/**
 * @file onboarding_logger.hpp
 * @brief Debug tracing for the onboarding flow.
 *
 * Traces keyring mutations, issuer steps and acceptor stage transitions
 * to stdout. Key material is only ever printed as a short fingerprint
 * (first bytes in hex), never in full.
 *
 * Enable via CMake: -DKEYFERRY_DEBUG_LOG=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace keyferry::onboarding::debug {

enum class Component {
    Keyring,
    Issuer,
    Acceptor,
    Registry
};

#ifdef KEYFERRY_DEBUG_LOG

inline std::string Fingerprint(std::span<const uint8_t> data, size_t max_bytes = 4) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    result.reserve(shown * 2 + 16);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    result += "..(" + std::to_string(data.size()) + " bytes)";
    return result;
}

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::Keyring: return "KEYRING";
        case Component::Issuer: return "ISSUER";
        case Component::Acceptor: return "ACCEPTOR";
        case Component::Registry: return "REGISTRY";
    }
    return "UNKNOWN";
}

#define KF_LOG_KEY(component, operation, key_name, data) \
    do { \
        fprintf(stdout, "[KF-DEBUG] %s %s %s: %s\n", \
            ::keyferry::onboarding::debug::ComponentToString(component), \
            operation, \
            key_name, \
            ::keyferry::onboarding::debug::Fingerprint(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define KF_LOG_VALUE(component, operation, name, value) \
    do { \
        fprintf(stdout, "[KF-DEBUG] %s %s %s: %s\n", \
            ::keyferry::onboarding::debug::ComponentToString(component), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define KF_LOG_MSG(component, operation, message) \
    do { \
        fprintf(stdout, "[KF-DEBUG] %s %s %s\n", \
            ::keyferry::onboarding::debug::ComponentToString(component), \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define KF_LOG_STAGE(component, stage, outcome) \
    do { \
        fprintf(stdout, "[KF-DEBUG] %s stage %s -> %s\n", \
            ::keyferry::onboarding::debug::ComponentToString(component), \
            stage, \
            outcome); \
        fflush(stdout); \
    } while(0)

#define KF_LOG_SECTION(component, section_name) \
    do { \
        fprintf(stdout, "[KF-DEBUG] %s ========== %s ==========\n", \
            ::keyferry::onboarding::debug::ComponentToString(component), \
            section_name); \
        fflush(stdout); \
    } while(0)

#else // !KEYFERRY_DEBUG_LOG

#define KF_LOG_KEY(component, operation, key_name, data) ((void)0)
#define KF_LOG_VALUE(component, operation, name, value) ((void)0)
#define KF_LOG_MSG(component, operation, message) ((void)0)
#define KF_LOG_STAGE(component, stage, outcome) ((void)0)
#define KF_LOG_SECTION(component, section_name) ((void)0)

#endif // KEYFERRY_DEBUG_LOG

} // namespace keyferry::onboarding::debug
