#include "keyferry/encoding/proto_support.hpp"
#include "keyferry/core/constants.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/time_util.h>
#include <format>

namespace keyferry::onboarding::encoding {

Result<std::vector<uint8_t>, OnboardingFailure> SerializeDeterministic(
    const google::protobuf::Message& message) {
    std::string output;
    {
        google::protobuf::io::StringOutputStream stream(&output);
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::vector<uint8_t>, OnboardingFailure>::Err(
                OnboardingFailure::Encode("Failed to serialize protobuf deterministically"));
        }
    }
    return Result<std::vector<uint8_t>, OnboardingFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

void ToProtoTimestamp(const TimePoint time, google::protobuf::Timestamp* timestamp) {
    const auto epoch = time.time_since_epoch();
    const auto seconds = std::chrono::floor<std::chrono::seconds>(epoch);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(epoch - seconds);
    timestamp->set_seconds(seconds.count());
    timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
}

Result<TimePoint, OnboardingFailure> FromProtoTimestamp(const google::protobuf::Timestamp& timestamp) {
    using Duration = TimePoint::duration;
    // One second of headroom on each side leaves room for the nanos part
    constexpr int64_t kMaxSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(Duration::max()).count() - 1;
    constexpr int64_t kMinSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(Duration::min()).count() + 1;
    constexpr int32_t kMaxNanos = 999'999'999;

    const int64_t seconds = timestamp.seconds();
    const int32_t nanos = timestamp.nanos();
    if (seconds > kMaxSeconds || seconds < kMinSeconds || nanos < 0 || nanos > kMaxNanos) {
        return Result<TimePoint, OnboardingFailure>::Err(OnboardingFailure::Decode(
            std::format("{}: {}s {}ns", ErrorMessages::TIMESTAMP_OUT_OF_RANGE, seconds, nanos)));
    }
    const Duration since_epoch =
        std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds)) +
        std::chrono::duration_cast<Duration>(std::chrono::nanoseconds(nanos));
    return Result<TimePoint, OnboardingFailure>::Ok(TimePoint(since_epoch));
}

std::string FormatRfc3339(const TimePoint time) {
    google::protobuf::Timestamp timestamp;
    ToProtoTimestamp(time, &timestamp);
    return google::protobuf::util::TimeUtil::ToString(timestamp);
}

}
