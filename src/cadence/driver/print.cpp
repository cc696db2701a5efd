#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace cadence::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("cadence", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("cadence", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

}  // namespace cadence::driver
