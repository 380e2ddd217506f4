// Repository: Carillon
// Component: Configuration
// Purpose: Process configuration from compiled defaults, environment and
//          command line.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_RUNTIME_CARILLON_CONFIG_HPP_
#define CARILLON_RUNTIME_CARILLON_CONFIG_HPP_

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace carillon::runtime {

struct CarillonConfig {
  static constexpr const char* kDefaultSoundDir = "/usr/local/share/carillon/sounds";
  static constexpr const char* kSoundDirEnv = "CARILLON_SOUND_DIR";

  std::string sound_dir = kDefaultSoundDir;
  std::string sound_extension = ".mp3";
  std::string strike_prefix = "Strike";
  int64_t poll_interval_ms = 200;  // Clamped by ClockSync to 10..500
  int64_t wake_lead_ms = 1000;
  bool install_default_schedule = true;
  bool headless = false;
};

// Compiled defaults overlaid with the environment.
CarillonConfig ConfigFromEnvironment();

struct CliArgs {
  CarillonConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// args excludes the program name. Options override `base`.
CliArgs ParseArgs(const std::vector<std::string>& args,
                  const CarillonConfig& base = CarillonConfig());

void PrintUsage(std::ostream& out, const char* program_name);

}  // namespace carillon::runtime

#endif  // CARILLON_RUNTIME_CARILLON_CONFIG_HPP_
