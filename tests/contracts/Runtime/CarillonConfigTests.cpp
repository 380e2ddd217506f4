// Repository: Carillon
// Component: Configuration Tests
// Purpose: Verify command-line parsing over environment-derived defaults.
// Copyright (c) 2025 Carillon

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "carillon/runtime/CarillonConfig.hpp"

namespace carillon::runtime::testing {
namespace {

TEST(CarillonConfigTest, Defaults) {
  const CliArgs args = ParseArgs({});
  ASSERT_TRUE(args.valid) << args.error;
  EXPECT_FALSE(args.help);
  EXPECT_EQ(args.config.sound_dir, CarillonConfig::kDefaultSoundDir);
  EXPECT_EQ(args.config.sound_extension, ".mp3");
  EXPECT_EQ(args.config.strike_prefix, "Strike");
  EXPECT_EQ(args.config.poll_interval_ms, 200);
  EXPECT_EQ(args.config.wake_lead_ms, 1000);
  EXPECT_TRUE(args.config.install_default_schedule);
  EXPECT_FALSE(args.config.headless);
}

TEST(CarillonConfigTest, OptionsOverrideBase) {
  CarillonConfig base;
  base.sound_dir = "/from/environment";

  CliArgs args = ParseArgs({}, base);
  ASSERT_TRUE(args.valid);
  EXPECT_EQ(args.config.sound_dir, "/from/environment");

  args = ParseArgs({"--sound-dir", "/srv/chimes", "--poll-ms", "50", "--wake-lead-ms", "500",
                    "--no-default-schedule", "--headless"},
                   base);
  ASSERT_TRUE(args.valid) << args.error;
  EXPECT_EQ(args.config.sound_dir, "/srv/chimes");
  EXPECT_EQ(args.config.poll_interval_ms, 50);
  EXPECT_EQ(args.config.wake_lead_ms, 500);
  EXPECT_FALSE(args.config.install_default_schedule);
  EXPECT_TRUE(args.config.headless);
}

TEST(CarillonConfigTest, HelpStopsParsing) {
  const CliArgs args = ParseArgs({"--help", "--bogus"});
  EXPECT_TRUE(args.help);
  EXPECT_TRUE(args.valid);
}

TEST(CarillonConfigTest, Errors) {
  EXPECT_FALSE(ParseArgs({"--bogus"}).valid);
  EXPECT_EQ(ParseArgs({"--bogus"}).error, "Unknown argument: --bogus");
  EXPECT_FALSE(ParseArgs({"--poll-ms", "fast"}).valid);
  EXPECT_FALSE(ParseArgs({"--poll-ms", "20ms"}).valid);
  EXPECT_FALSE(ParseArgs({"--poll-ms", "-5"}).valid);
  EXPECT_FALSE(ParseArgs({"--wake-lead-ms", "60000"}).valid);
  EXPECT_FALSE(ParseArgs({"--sound-dir", ""}).valid);
  // Missing value.
  EXPECT_FALSE(ParseArgs({"--sound-dir"}).valid);
}

TEST(CarillonConfigTest, UsageListsOptions) {
  std::ostringstream out;
  PrintUsage(out, "carillon");
  const std::string text = out.str();
  EXPECT_NE(text.find("Usage: carillon"), std::string::npos);
  EXPECT_NE(text.find("--sound-dir"), std::string::npos);
  EXPECT_NE(text.find("--headless"), std::string::npos);
  EXPECT_NE(text.find(CarillonConfig::kSoundDirEnv), std::string::npos);
}

}  // namespace
}  // namespace carillon::runtime::testing
