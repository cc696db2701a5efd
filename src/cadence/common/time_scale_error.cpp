#include "cadence/common/time_scale_error.hpp"

#include <string>

#include <fmt/core.h>

namespace cadence::common {

TimeScaleError::TimeScaleError(
    TimeScaleErrorKind kind, const std::string& detail)
    : std::runtime_error(fmt::format("{}: {}", ToString(kind), detail)),
      kind_(kind) {
}

auto ToString(TimeScaleErrorKind kind) -> const char* {
  switch (kind) {
    case TimeScaleErrorKind::kInvalidUnitLength:
      return "invalid unit length";
    case TimeScaleErrorKind::kDegenerateTimeScale:
      return "degenerate time scale";
  }
  return "unknown time scale error";
}

}  // namespace cadence::common
