#include "commands.hpp"

#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cadence/common/time_scale.hpp"
#include "cadence/common/time_scale_error.hpp"
#include "cadence/common/time_unit.hpp"
#include "config.hpp"
#include "print.hpp"
#include "unit_names.hpp"

namespace cadence::driver {
namespace {

// Build a time scale from either --<prefix>scale or --<prefix>unit and
// --<prefix>length. A named scale takes precedence.
auto ResolveScale(
    const argparse::ArgumentParser& cmd, const std::string& prefix,
    const std::optional<CadenceConfig>& config)
    -> ConfigResult<common::TimeScale> {
  std::string scale_flag = "--" + prefix + "scale";
  std::string unit_flag = "--" + prefix + "unit";
  std::string length_flag = "--" + prefix + "length";

  auto length = cmd.present<int64_t>(length_flag);

  if (auto name = cmd.present<std::string>(scale_flag)) {
    std::vector<std::string> ignored;
    if (cmd.present<std::string>(unit_flag)) {
      ignored.push_back(unit_flag);
    }
    if (length) {
      ignored.push_back(length_flag);
    }
    if (!ignored.empty()) {
      PrintWarning(
          fmt::format(
              "{} {} ignored when {} is given", fmt::join(ignored, " and "),
              ignored.size() == 1 ? "is" : "are", scale_flag));
    }
    if (!config) {
      return std::unexpected(
          fmt::format(
              "{} '{}' requires a {} with a [scales] table", scale_flag, *name,
              kConfigFileName));
    }
    auto it = config->scales.find(*name);
    if (it == config->scales.end()) {
      return std::unexpected(
          fmt::format("no scale named '{}' in {}", *name, kConfigFileName));
    }
    return it->second;
  }

  auto unit_name = cmd.present<std::string>(unit_flag);
  if (!unit_name) {
    return std::unexpected(
        fmt::format("either {} or {} is required", unit_flag, scale_flag));
  }
  auto unit = ParseTimeUnit(*unit_name);
  if (!unit) {
    return std::unexpected(
        fmt::format(
            "unknown unit '{}' (expected one of: {})", *unit_name,
            KnownTimeUnitNames()));
  }

  int64_t unit_length = length.value_or(1);
  if (unit_length < std::numeric_limits<int32_t>::min() ||
      unit_length > std::numeric_limits<int32_t>::max()) {
    return std::unexpected(
        fmt::format("{} is out of range, got {}", length_flag, unit_length));
  }

  auto scale =
      common::TimeScale::Create(*unit, static_cast<int32_t>(unit_length));
  if (!scale) {
    return std::unexpected(std::string(scale.error().what()));
  }
  return *scale;
}

// CLI flag wins over the config, which wins over the default.
auto ResolvePrecision(
    const argparse::ArgumentParser& cmd,
    const std::optional<CadenceConfig>& config) -> std::optional<int> {
  if (auto precision = cmd.present<int>("--precision")) {
    if (*precision < 0 || *precision > kMaxPrecision) {
      PrintError(
          fmt::format(
              "--precision must be between 0 and {}, got {}", kMaxPrecision,
              *precision));
      return std::nullopt;
    }
    return *precision;
  }
  return config ? config->precision : kDefaultPrecision;
}

}  // namespace

void AddScaleFlags(argparse::ArgumentParser& cmd, const std::string& prefix) {
  cmd.add_argument("--" + prefix + "unit")
      .help("Time unit (" + KnownTimeUnitNames() + ")");
  cmd.add_argument("--" + prefix + "length")
      .scan<'i', int64_t>()
      .help("Number of units (default: 1)");
  cmd.add_argument("--" + prefix + "scale")
      .help("Named scale from the [scales] table of cadence.toml");
}

void AddPrecisionFlag(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--precision")
      .scan<'i', int>()
      .help("Digits after the decimal point (overrides cadence.toml)");
}

auto UnitsCommand(const argparse::ArgumentParser& /*cmd*/) -> int {
  for (auto unit : common::kAllTimeUnits) {
    fmt::print(
        "{:<12} {}\n", common::ToString(unit), common::BaseSeconds(unit));
  }
  return 0;
}

auto DurationCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<CadenceConfig>& config) -> int {
  auto precision = ResolvePrecision(cmd, config);
  if (!precision) {
    return 1;
  }

  auto scale = ResolveScale(cmd, "", config);
  if (!scale) {
    PrintError(scale.error());
    return 1;
  }

  double seconds = scale->TotalDuration();
  spdlog::debug(
      "duration of {} x {}: {} s", scale->GetUnitLength(),
      scale->GetTimeUnit(), seconds);
  fmt::print("{:.{}f}\n", seconds, *precision);
  return 0;
}

auto FrequencyCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<CadenceConfig>& config) -> int {
  auto precision = ResolvePrecision(cmd, config);
  if (!precision) {
    return 1;
  }

  auto scale = ResolveScale(cmd, "", config);
  if (!scale) {
    PrintError(scale.error());
    return 1;
  }
  auto per_scale = ResolveScale(cmd, "per-", config);
  if (!per_scale) {
    PrintError(per_scale.error());
    return 1;
  }

  try {
    double frequency = scale->FrequencyPer(*per_scale);
    spdlog::debug(
        "{} x {} occurs {} times per {} x {}", scale->GetUnitLength(),
        scale->GetTimeUnit(), frequency, per_scale->GetUnitLength(),
        per_scale->GetTimeUnit());
    fmt::print("{:.{}f}\n", frequency, *precision);
  } catch (const common::TimeScaleError& e) {
    PrintError(e.what());
    return 1;
  }
  return 0;
}

}  // namespace cadence::driver
