#pragma once

#include <optional>
#include <string>

#include <argparse/argparse.hpp>

#include "config.hpp"

namespace cadence::driver {

auto UnitsCommand(const argparse::ArgumentParser& cmd) -> int;
auto DurationCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<CadenceConfig>& config) -> int;
auto FrequencyCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<CadenceConfig>& config) -> int;

// Register --unit/--length/--scale (with the given prefix, e.g. "per-")
// on a subcommand.
void AddScaleFlags(argparse::ArgumentParser& cmd, const std::string& prefix);

// Register --precision on a subcommand.
void AddPrecisionFlag(argparse::ArgumentParser& cmd);

}  // namespace cadence::driver
