#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <fmt/core.h>

namespace cadence::common {

/// Named granularity of time with a fixed nominal duration.
///
/// Calendar units use the nominal lengths of the proleptic Gregorian
/// calendar: a year is 365.2425 days and a month is exactly 1/12 of a year,
/// so twelve months always fill one year.
enum class TimeUnit : uint8_t {
  kNanosecond,
  kMicrosecond,
  kMillisecond,
  kSecond,
  kMinute,
  kHour,
  kDay,
  kWeek,
  kMonth,
  kQuarter,
  kYear,
  kDecade,
  kCentury,
};

inline constexpr size_t kTimeUnitCount = 13;

// Ordered from the smallest unit to the largest.
inline constexpr std::array<TimeUnit, kTimeUnitCount> kAllTimeUnits = {
    TimeUnit::kNanosecond, TimeUnit::kMicrosecond, TimeUnit::kMillisecond,
    TimeUnit::kSecond,     TimeUnit::kMinute,      TimeUnit::kHour,
    TimeUnit::kDay,        TimeUnit::kWeek,        TimeUnit::kMonth,
    TimeUnit::kQuarter,    TimeUnit::kYear,        TimeUnit::kDecade,
    TimeUnit::kCentury,
};

namespace detail {

inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kSecondsPerYear = 31556952.0;  // 365.2425 days
inline constexpr double kSecondsPerMonth = 2629746.0;  // 1/12 year

// Indexed by the underlying value of TimeUnit. Sub-second units are stored
// as fractional seconds.
inline constexpr std::array<double, kTimeUnitCount> kBaseSeconds = {
    1e-9,                     // nanosecond
    1e-6,                     // microsecond
    1e-3,                     // millisecond
    1.0,                      // second
    60.0,                     // minute
    3600.0,                   // hour
    kSecondsPerDay,           // day
    7.0 * kSecondsPerDay,     // week
    kSecondsPerMonth,         // month
    3.0 * kSecondsPerMonth,   // quarter
    kSecondsPerYear,          // year
    10.0 * kSecondsPerYear,   // decade
    100.0 * kSecondsPerYear,  // century
};

}  // namespace detail

/// Nominal duration of one `unit`, in seconds.
constexpr auto BaseSeconds(TimeUnit unit) -> double {
  return detail::kBaseSeconds.at(static_cast<size_t>(unit));
}

// Lowercase singular name ("millisecond", "week", ...).
auto ToString(TimeUnit unit) -> const char*;

}  // namespace cadence::common

template <>
struct fmt::formatter<cadence::common::TimeUnit> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(cadence::common::TimeUnit unit, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", cadence::common::ToString(unit));
  }
};
