#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "cadence/common/time_unit.hpp"

namespace cadence::driver {

// Look up a unit by its lowercase name ("day", "month", ...).
auto ParseTimeUnit(std::string_view name) -> std::optional<common::TimeUnit>;

// Comma-separated list of all unit names, for error messages.
auto KnownTimeUnitNames() -> std::string;

}  // namespace cadence::driver
