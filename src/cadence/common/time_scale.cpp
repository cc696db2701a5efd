#include "cadence/common/time_scale.hpp"

#include <cmath>
#include <cstdint>
#include <expected>

#include <fmt/core.h>

#include "cadence/common/time_scale_error.hpp"
#include "cadence/common/time_unit.hpp"

namespace cadence::common {

namespace {

auto InvalidLength(TimeUnit time_unit, int32_t unit_length) -> TimeScaleError {
  return TimeScaleError(
      TimeScaleErrorKind::kInvalidUnitLength,
      fmt::format(
          "{} {} (length must be at least 1)", unit_length, time_unit));
}

}  // namespace

TimeScale::TimeScale(TimeUnit time_unit, int32_t unit_length)
    : time_unit_(time_unit), unit_length_(unit_length) {
  if (unit_length < 1) {
    throw InvalidLength(time_unit, unit_length);
  }
}

auto TimeScale::Create(TimeUnit time_unit, int32_t unit_length)
    -> Result<TimeScale> {
  if (unit_length < 1) {
    return std::unexpected(InvalidLength(time_unit, unit_length));
  }
  return TimeScale(time_unit, unit_length);
}

auto TimeScale::OneCentury() -> TimeScale {
  return {TimeUnit::kCentury, 1};
}

auto TimeScale::OneDecade() -> TimeScale {
  return {TimeUnit::kDecade, 1};
}

auto TimeScale::OneYear() -> TimeScale {
  return {TimeUnit::kYear, 1};
}

auto TimeScale::OneQuarter() -> TimeScale {
  return {TimeUnit::kQuarter, 1};
}

auto TimeScale::OneMonth() -> TimeScale {
  return {TimeUnit::kMonth, 1};
}

auto TimeScale::OneWeek() -> TimeScale {
  return {TimeUnit::kWeek, 1};
}

auto TimeScale::OneDay() -> TimeScale {
  return {TimeUnit::kDay, 1};
}

auto TimeScale::OneHour() -> TimeScale {
  return {TimeUnit::kHour, 1};
}

auto TimeScale::HalfHour() -> TimeScale {
  return {TimeUnit::kMinute, 30};
}

auto TimeScale::OneMinute() -> TimeScale {
  return {TimeUnit::kMinute, 1};
}

auto TimeScale::OneSecond() -> TimeScale {
  return {TimeUnit::kSecond, 1};
}

auto TimeScale::OneMillisecond() -> TimeScale {
  return {TimeUnit::kMillisecond, 1};
}

auto TimeScale::OneMicrosecond() -> TimeScale {
  return {TimeUnit::kMicrosecond, 1};
}

auto TimeScale::OneNanosecond() -> TimeScale {
  return {TimeUnit::kNanosecond, 1};
}

auto TimeScale::TotalDuration() const -> double {
  return BaseSeconds(time_unit_) * static_cast<double>(unit_length_);
}

auto TimeScale::FrequencyPer(const TimeScale& other) const -> double {
  double duration = TotalDuration();
  if (!std::isfinite(duration) || duration == 0.0) {
    throw TimeScaleError(
        TimeScaleErrorKind::kDegenerateTimeScale,
        fmt::format(
            "{} {} spans {} seconds and cannot divide another scale",
            unit_length_, time_unit_, duration));
  }
  return other.TotalDuration() / duration;
}

}  // namespace cadence::common
