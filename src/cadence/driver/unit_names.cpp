#include "unit_names.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "cadence/common/time_unit.hpp"

namespace cadence::driver {

auto ParseTimeUnit(std::string_view name) -> std::optional<common::TimeUnit> {
  for (auto unit : common::kAllTimeUnits) {
    if (name == common::ToString(unit)) {
      return unit;
    }
  }
  return std::nullopt;
}

auto KnownTimeUnitNames() -> std::string {
  std::string names;
  for (auto unit : common::kAllTimeUnits) {
    if (!names.empty()) {
      names += ", ";
    }
    names += common::ToString(unit);
  }
  return names;
}

}  // namespace cadence::driver
