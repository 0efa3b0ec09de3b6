#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace keyferry::onboarding::encoding {

inline std::span<const uint8_t> AsBytes(const std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

inline std::vector<uint8_t> ToBytes(const std::string_view text) {
    return {text.begin(), text.end()};
}
}
