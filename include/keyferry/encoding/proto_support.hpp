#pragma once
#include "keyferry/core/result.hpp"
#include "keyferry/core/failures.hpp"
#include <google/protobuf/message.h>
#include <google/protobuf/timestamp.pb.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
namespace keyferry::onboarding::encoding {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Serialize with deterministic map/field ordering
 *
 * Signed and sealed bytes must not depend on the protobuf runtime's
 * default (non-deterministic) output.
 */
[[nodiscard]] Result<std::vector<uint8_t>, OnboardingFailure> SerializeDeterministic(
    const google::protobuf::Message& message);

void ToProtoTimestamp(TimePoint time, google::protobuf::Timestamp* timestamp);

/**
 * @brief Convert a wire timestamp into a system_clock time point
 *
 * Protobuf admits years 0001-9999; system_clock usually spans a much
 * narrower window. Values it cannot represent, and nanos outside
 * [0, 999999999], are Decode failures.
 */
[[nodiscard]] Result<TimePoint, OnboardingFailure> FromProtoTimestamp(
    const google::protobuf::Timestamp& timestamp);

/// RFC 3339 in UTC, e.g. "2026-01-05T10:00:00.250Z"
[[nodiscard]] std::string FormatRfc3339(TimePoint time);
}
