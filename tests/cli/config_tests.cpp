#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace cadence::test {
namespace {

class ConfigTest : public CliTestFixture {};

// Test: named scales from cadence.toml
TEST_F(ConfigTest, NamedScale) {
  WriteCadenceToml(
      "[scales]\n"
      "fortnight = { unit = \"week\", length = 2 }\n");

  auto result = Run({"duration", "--scale", "fortnight", "--precision", "0"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "1209600\n");
}

// Test: named scales on both sides of a frequency
TEST_F(ConfigTest, NamedScalesInFrequency) {
  WriteCadenceToml(
      "[scales]\n"
      "quarter = { unit = \"month\", length = 3 }\n"
      "[scales.half]\n"
      "unit = \"month\"\n"
      "length = 6\n");

  auto result = Run(
      {"frequency", "--scale", "quarter", "--per-scale", "half",
       "--precision", "1"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "2.0\n");
}

// Test: length defaults to one in the config
TEST_F(ConfigTest, NamedScaleDefaultLength) {
  WriteCadenceToml(
      "[scales]\n"
      "daily = { unit = \"day\" }\n");

  auto result = Run({"duration", "--scale", "daily", "--precision", "0"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "86400\n");
}

// Test: output precision comes from the config
TEST_F(ConfigTest, PrecisionFromConfig) {
  WriteCadenceToml(
      "[output]\n"
      "precision = 1\n");

  auto result = Run({"duration", "--unit", "minute"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "60.0\n");
}

// Test: CLI precision overrides the config
TEST_F(ConfigTest, CliPrecisionOverridesConfig) {
  WriteCadenceToml(
      "[output]\n"
      "precision = 1\n");

  auto result = Run({"duration", "--unit", "minute", "--precision", "3"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "60.000\n");
}

// Test: config is found in a parent directory
TEST_F(ConfigTest, ConfigFoundInParentDirectory) {
  WriteCadenceToml(
      "[output]\n"
      "precision = 0\n");
  WriteFile("nested/deeper/.keep", "");

  auto result =
      RunIn(TestDir() / "nested" / "deeper", {"duration", "--unit", "hour"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "3600\n");
}

// Test: debug log level from the config
TEST_F(ConfigTest, LogLevelFromConfig) {
  WriteCadenceToml(
      "[log]\n"
      "level = \"debug\"\n");

  auto result = Run({"duration", "--unit", "day"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("loaded cadence.toml")) << result.output;
}

// Test: unknown scale name
TEST_F(ConfigTest, UnknownScaleName) {
  WriteCadenceToml(
      "[scales]\n"
      "fortnight = { unit = \"week\", length = 2 }\n");

  auto result = Run({"duration", "--scale", "sprint"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("no scale named 'sprint'")) << result.output;
}

// Test: --scale without any config
TEST_F(ConfigTest, ScaleWithoutConfig) {
  auto result = Run({"duration", "--scale", "fortnight"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("requires a cadence.toml")) << result.output;
}

// Test: --unit next to --scale is ignored with a warning
TEST_F(ConfigTest, ScaleOverridesUnitWithWarning) {
  WriteCadenceToml(
      "[scales]\n"
      "fortnight = { unit = \"week\", length = 2 }\n");

  auto result = Run(
      {"duration", "--scale", "fortnight", "--unit", "day", "--precision",
       "0"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("ignored when --scale is given"));
  EXPECT_TRUE(result.Contains("1209600\n"));
}

// Test: only the flags actually given are named in the warning
TEST_F(ConfigTest, ScaleWarningNamesOnlyGivenFlags) {
  WriteCadenceToml(
      "[scales]\n"
      "fortnight = { unit = \"week\", length = 2 }\n");

  auto result = Run(
      {"duration", "--scale", "fortnight", "--length", "3", "--precision",
       "0"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("--length is ignored when --scale is given"))
      << result.output;
  EXPECT_FALSE(result.Contains("--unit"));
  EXPECT_TRUE(result.Contains("1209600\n"));
}

// Test: malformed TOML
TEST_F(ConfigTest, MalformedToml) {
  WriteCadenceToml("[scales\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("failed to parse")) << result.output;
}

// Test: unknown unit in a scale entry
TEST_F(ConfigTest, UnknownUnitInScale) {
  WriteCadenceToml(
      "[scales]\n"
      "sprint = { unit = \"fortnight\", length = 1 }\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("unknown unit 'fortnight' in 'scales.sprint.unit'"))
      << result.output;
}

// Test: missing unit in a scale entry
TEST_F(ConfigTest, MissingUnitInScale) {
  WriteCadenceToml(
      "[scales]\n"
      "sprint = { length = 2 }\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("missing required field 'scales.sprint.unit'"))
      << result.output;
}

// Test: zero length in a scale entry
TEST_F(ConfigTest, ZeroLengthInScale) {
  WriteCadenceToml(
      "[scales]\n"
      "never = { unit = \"day\", length = 0 }\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'scales.never': invalid unit length"))
      << result.output;
}

// Test: scale entry that is not a table
TEST_F(ConfigTest, ScaleEntryNotTable) {
  WriteCadenceToml(
      "[scales]\n"
      "weekly = \"week\"\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'scales.weekly' must be a table"))
      << result.output;
}

// Test: a quoted length is not silently replaced by the default
TEST_F(ConfigTest, StringLengthInScale) {
  WriteCadenceToml(
      "[scales]\n"
      "fortnight = { unit = \"week\", length = \"2\" }\n");

  auto result = Run({"duration", "--scale", "fortnight"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'scales.fortnight.length' must be an integer"))
      << result.output;
  EXPECT_FALSE(result.Contains("604800"));
}

// Test: a fractional length is rejected
TEST_F(ConfigTest, FractionalLengthInScale) {
  WriteCadenceToml(
      "[scales]\n"
      "fortnight = { unit = \"week\", length = 2.5 }\n");

  auto result = Run({"duration", "--scale", "fortnight"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'scales.fortnight.length' must be an integer"))
      << result.output;
}

// Test: a non-string unit is reported
TEST_F(ConfigTest, NonStringUnitInScale) {
  WriteCadenceToml(
      "[scales]\n"
      "sprint = { unit = 7, length = 2 }\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'scales.sprint.unit' must be a string"))
      << result.output;
}

// Test: a quoted precision is rejected
TEST_F(ConfigTest, StringPrecisionInConfig) {
  WriteCadenceToml(
      "[output]\n"
      "precision = \"3\"\n");

  auto result = Run({"duration", "--unit", "minute"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'output.precision' must be an integer"))
      << result.output;
}

// Test: a numeric log level is rejected
TEST_F(ConfigTest, NumericLogLevel) {
  WriteCadenceToml(
      "[log]\n"
      "level = 3\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'log.level' must be a string")) << result.output;
}

// Test: unknown log level
TEST_F(ConfigTest, UnknownLogLevel) {
  WriteCadenceToml(
      "[log]\n"
      "level = \"chatty\"\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("unknown log level 'chatty'")) << result.output;
}

// Test: precision out of range in the config
TEST_F(ConfigTest, PrecisionOutOfRangeInConfig) {
  WriteCadenceToml(
      "[output]\n"
      "precision = -1\n");

  auto result = Run({"units"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("'output.precision' must be between 0 and 17"))
      << result.output;
}

}  // namespace
}  // namespace cadence::test
