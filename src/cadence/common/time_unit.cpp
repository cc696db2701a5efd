#include "cadence/common/time_unit.hpp"

namespace cadence::common {

auto ToString(TimeUnit unit) -> const char* {
  switch (unit) {
    case TimeUnit::kNanosecond:
      return "nanosecond";
    case TimeUnit::kMicrosecond:
      return "microsecond";
    case TimeUnit::kMillisecond:
      return "millisecond";
    case TimeUnit::kSecond:
      return "second";
    case TimeUnit::kMinute:
      return "minute";
    case TimeUnit::kHour:
      return "hour";
    case TimeUnit::kDay:
      return "day";
    case TimeUnit::kWeek:
      return "week";
    case TimeUnit::kMonth:
      return "month";
    case TimeUnit::kQuarter:
      return "quarter";
    case TimeUnit::kYear:
      return "year";
    case TimeUnit::kDecade:
      return "decade";
    case TimeUnit::kCentury:
      return "century";
  }
  return "unknown";
}

}  // namespace cadence::common
