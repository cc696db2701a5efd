#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>

namespace cadence::common {

enum class TimeScaleErrorKind : uint8_t {
  kInvalidUnitLength,    // Unit length below 1
  kDegenerateTimeScale,  // Zero or non-finite total duration used as divisor
};

// Error raised when a time scale cannot be built or used.
// Thrown by the TimeScale constructor and FrequencyPer; carried by Result
// from the non-throwing factories.
class TimeScaleError final : public std::runtime_error {
 public:
  TimeScaleError(TimeScaleErrorKind kind, const std::string& detail);

  [[nodiscard]] auto Kind() const -> TimeScaleErrorKind {
    return kind_;
  }

 private:
  TimeScaleErrorKind kind_;
};

template <typename T>
using Result = std::expected<T, TimeScaleError>;

auto ToString(TimeScaleErrorKind kind) -> const char*;

}  // namespace cadence::common
