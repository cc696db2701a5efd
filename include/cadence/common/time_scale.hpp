#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "cadence/common/time_scale_error.hpp"
#include "cadence/common/time_unit.hpp"

namespace cadence::common {

/// A time unit paired with a positive integer multiplier, such as
/// "2 weeks" or "6 months".
///
/// Values are immutable once built and may be shared across threads without
/// synchronization. Two scales are equal when both the unit and the length
/// match; `3 months` and `1 quarter` span the same duration but are distinct
/// values.
class TimeScale {
 public:
  /// Throws TimeScaleError (kInvalidUnitLength) if `unit_length` < 1.
  TimeScale(TimeUnit time_unit, int32_t unit_length);

  /// Same as the constructor, reporting an invalid length as an error value.
  static auto Create(TimeUnit time_unit, int32_t unit_length)
      -> Result<TimeScale>;

  static auto OneCentury() -> TimeScale;
  static auto OneDecade() -> TimeScale;
  static auto OneYear() -> TimeScale;
  static auto OneQuarter() -> TimeScale;
  static auto OneMonth() -> TimeScale;
  static auto OneWeek() -> TimeScale;
  static auto OneDay() -> TimeScale;
  static auto OneHour() -> TimeScale;
  static auto HalfHour() -> TimeScale;
  static auto OneMinute() -> TimeScale;
  static auto OneSecond() -> TimeScale;
  static auto OneMillisecond() -> TimeScale;
  static auto OneMicrosecond() -> TimeScale;
  static auto OneNanosecond() -> TimeScale;

  [[nodiscard]] auto GetTimeUnit() const -> TimeUnit {
    return time_unit_;
  }

  [[nodiscard]] auto GetUnitLength() const -> int32_t {
    return unit_length_;
  }

  /// Total span of this scale in seconds. No rounding is applied.
  [[nodiscard]] auto TotalDuration() const -> double;

  /// Number of times this scale occurs within `other`.
  ///
  /// Example: one month per one year is 12. The result is not rounded;
  /// callers that need a count truncate or round it themselves.
  ///
  /// Guarded against a zero divisor (kDegenerateTimeScale); validated
  /// scales never hit it.
  [[nodiscard]] auto FrequencyPer(const TimeScale& other) const -> double;

  auto operator==(const TimeScale& other) const -> bool = default;

 private:
  TimeUnit time_unit_;
  int32_t unit_length_;
};

}  // namespace cadence::common

template <>
struct std::hash<cadence::common::TimeScale> {
  auto operator()(const cadence::common::TimeScale& scale) const noexcept
      -> size_t {
    auto unit = static_cast<uint64_t>(scale.GetTimeUnit());
    auto length = static_cast<uint64_t>(
        static_cast<uint32_t>(scale.GetUnitLength()));
    return std::hash<uint64_t>{}((unit << 32) | length);
  }
};
