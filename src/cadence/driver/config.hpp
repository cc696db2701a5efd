#pragma once

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "cadence/common/time_scale.hpp"

namespace cadence::driver {

inline constexpr const char* kConfigFileName = "cadence.toml";
inline constexpr int kDefaultPrecision = 6;
inline constexpr int kMaxPrecision = 17;

struct CadenceConfig {
  spdlog::level::level_enum log_level = spdlog::level::warn;
  int precision = kDefaultPrecision;  // Digits after the decimal point

  // [scales] table, keyed by name
  std::map<std::string, common::TimeScale> scales;

  // Directory where cadence.toml was found
  std::filesystem::path root_dir;
};

template <typename T>
using ConfigResult = std::expected<T, std::string>;

// Search for cadence.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse cadence.toml. Every section is optional.
// Returns an error message on parse errors or invalid values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> ConfigResult<CadenceConfig>;

// Load cadence.toml if one is found above the working directory.
auto LoadOptionalConfig() -> ConfigResult<std::optional<CadenceConfig>>;

}  // namespace cadence::driver
