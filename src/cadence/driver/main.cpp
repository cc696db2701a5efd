#include <argparse/argparse.hpp>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "config.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

// Results go to stdout; logs and diagnostics go to stderr.
void InitLogging() {
  auto logger = spdlog::stderr_color_mt("cadence");
  logger->set_pattern("[%n] [%^%l%$] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::warn);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  InitLogging();

  std::span<char*> raw_args(argv, static_cast<size_t>(argc));
  std::vector<std::string> args(raw_args.begin(), raw_args.end());

  argparse::ArgumentParser program("cadence", "0.1.0");
  program.add_description("Time scale durations and frequencies");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  // Subcommand: units
  argparse::ArgumentParser units_cmd("units");
  units_cmd.add_description("List time units and their length in seconds");

  // Subcommand: duration
  argparse::ArgumentParser duration_cmd("duration");
  duration_cmd.add_description(
      "Print the total duration of a scale in seconds");
  cadence::driver::AddScaleFlags(duration_cmd, "");
  cadence::driver::AddPrecisionFlag(duration_cmd);

  // Subcommand: frequency
  argparse::ArgumentParser frequency_cmd("frequency");
  frequency_cmd.add_description(
      "Print how many times a scale occurs within another scale");
  cadence::driver::AddScaleFlags(frequency_cmd, "");
  cadence::driver::AddScaleFlags(frequency_cmd, "per-");
  cadence::driver::AddPrecisionFlag(frequency_cmd);

  program.add_subparser(units_cmd);
  program.add_subparser(duration_cmd);
  program.add_subparser(frequency_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    cadence::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before looking for cadence.toml
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      cadence::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto config = cadence::driver::LoadOptionalConfig();
  if (!config) {
    cadence::driver::PrintError(config.error());
    return 1;
  }
  if (*config) {
    spdlog::set_level((*config)->log_level);
  }
  if (program.get<bool>("--verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }
  if (*config) {
    spdlog::debug(
        "loaded {} from {}", cadence::driver::kConfigFileName,
        (*config)->root_dir.string());
  }

  if (program.is_subcommand_used("units")) {
    return cadence::driver::UnitsCommand(units_cmd);
  }

  if (program.is_subcommand_used("duration")) {
    return cadence::driver::DurationCommand(duration_cmd, *config);
  }

  if (program.is_subcommand_used("frequency")) {
    return cadence::driver::FrequencyCommand(frequency_cmd, *config);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
