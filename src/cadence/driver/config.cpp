#include "config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/common.h>
#include <toml++/toml.hpp>

#include "cadence/common/time_scale.hpp"
#include "unit_names.hpp"

namespace cadence::driver {

namespace fs = std::filesystem;

namespace {

auto ParseScaleEntry(
    const fs::path& config_path, const std::string& name,
    const toml::node& node) -> ConfigResult<common::TimeScale> {
  const auto* entry = node.as_table();
  if (entry == nullptr) {
    return std::unexpected(
        fmt::format(
            "{}: 'scales.{}' must be a table with 'unit' and 'length'",
            config_path.string(), name));
  }

  auto unit_node = (*entry)["unit"];
  if (!unit_node) {
    return std::unexpected(
        fmt::format(
            "{}: missing required field 'scales.{}.unit'",
            config_path.string(), name));
  }
  if (!unit_node.is_string()) {
    return std::unexpected(
        fmt::format(
            "{}: 'scales.{}.unit' must be a string", config_path.string(),
            name));
  }
  auto unit_name = unit_node.value<std::string>();
  auto unit = ParseTimeUnit(*unit_name);
  if (!unit) {
    return std::unexpected(
        fmt::format(
            "{}: unknown unit '{}' in 'scales.{}.unit' (expected one of: {})",
            config_path.string(), *unit_name, name, KnownTimeUnitNames()));
  }

  // Length defaults to 1, matching the command line.
  int64_t length = 1;
  if (auto length_node = (*entry)["length"]) {
    if (!length_node.is_integer()) {
      return std::unexpected(
          fmt::format(
              "{}: 'scales.{}.length' must be an integer",
              config_path.string(), name));
    }
    length = *length_node.value<int64_t>();
  }
  if (length < std::numeric_limits<int32_t>::min() ||
      length > std::numeric_limits<int32_t>::max()) {
    return std::unexpected(
        fmt::format(
            "{}: 'scales.{}.length' is out of range, got {}",
            config_path.string(), name, length));
  }

  auto scale =
      common::TimeScale::Create(*unit, static_cast<int32_t>(length));
  if (!scale) {
    return std::unexpected(
        fmt::format(
            "{}: 'scales.{}': {}", config_path.string(), name,
            scale.error().what()));
  }
  return *scale;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> ConfigResult<CadenceConfig> {
  CadenceConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        fmt::format(
            "failed to parse {}: {}", config_path.string(), e.description()));
  }

  // [log] section (optional)
  if (auto log = tbl["log"]) {
    if (auto level_node = log["level"]) {
      if (!level_node.is_string()) {
        return std::unexpected(
            fmt::format(
                "{}: 'log.level' must be a string", config_path.string()));
      }
      auto level = level_node.value<std::string>();
      auto parsed = spdlog::level::from_str(*level);
      // from_str falls back to 'off' for names it does not know
      if (parsed == spdlog::level::off && *level != "off") {
        return std::unexpected(
            fmt::format(
                "{}: unknown log level '{}' in 'log.level'",
                config_path.string(), *level));
      }
      config.log_level = parsed;
    }
  }

  // [output] section (optional)
  if (auto output = tbl["output"]) {
    if (auto precision_node = output["precision"]) {
      if (!precision_node.is_integer()) {
        return std::unexpected(
            fmt::format(
                "{}: 'output.precision' must be an integer",
                config_path.string()));
      }
      auto precision = precision_node.value<int64_t>();
      if (*precision < 0 || *precision > kMaxPrecision) {
        return std::unexpected(
            fmt::format(
                "{}: 'output.precision' must be between 0 and {}, got {}",
                config_path.string(), kMaxPrecision, *precision));
      }
      config.precision = static_cast<int>(*precision);
    }
  }

  // [scales] section (optional)
  if (auto scales = tbl["scales"]) {
    const auto* scales_table = scales.as_table();
    if (scales_table == nullptr) {
      return std::unexpected(
          fmt::format("{}: 'scales' must be a table", config_path.string()));
    }
    for (auto&& [key, node] : *scales_table) {
      std::string name(key.str());
      auto scale = ParseScaleEntry(config_path, name, node);
      if (!scale) {
        return std::unexpected(scale.error());
      }
      config.scales.insert_or_assign(name, *scale);
    }
  }

  return config;
}

auto LoadOptionalConfig() -> ConfigResult<std::optional<CadenceConfig>> {
  auto config_path = FindConfig();
  if (!config_path) {
    return std::optional<CadenceConfig>{};
  }
  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(config.error());
  }
  return std::optional<CadenceConfig>(std::move(*config));
}

}  // namespace cadence::driver
