// Repository: Carillon
// Component: Configuration
// Purpose: Process configuration from compiled defaults, environment and
//          command line.
// Copyright (c) 2025 Carillon

#include "carillon/runtime/CarillonConfig.hpp"

#include <cstdlib>
#include <ostream>
#include <stdexcept>

namespace carillon::runtime {

namespace {

bool ParseMillis(const std::string& text, int64_t* out) {
  try {
    size_t consumed = 0;
    const long long value = std::stoll(text, &consumed);
    if (consumed != text.size() || value < 0) {
      return false;
    }
    *out = static_cast<int64_t>(value);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

}  // namespace

CarillonConfig ConfigFromEnvironment() {
  CarillonConfig config;
  const char* sound_dir = std::getenv(CarillonConfig::kSoundDirEnv);
  if (sound_dir != nullptr && sound_dir[0] != '\0') {
    config.sound_dir = sound_dir;
  }
  return config;
}

void PrintUsage(std::ostream& out, const char* program_name) {
  out << "Usage: " << program_name << " [OPTIONS]\n"
      << "\n"
      << "Carillon chime scheduler. Plays sound files at scheduled minutes and\n"
      << "reads schedule edits from standard input.\n"
      << "\n"
      << "OPTIONS:\n"
      << "  --sound-dir PATH       Directory holding the sound files\n"
      << "                         (default: $" << CarillonConfig::kSoundDirEnv << " or "
      << CarillonConfig::kDefaultSoundDir << ")\n"
      << "  --poll-ms N            Clock poll interval, 10-500 (default: 200)\n"
      << "  --wake-lead-ms N       Wake this long before each minute (default: 1000)\n"
      << "  --no-default-schedule  Start with an empty schedule\n"
      << "  --headless             Decode sounds without opening an audio device\n"
      << "  --help                 Show this help message\n"
      << "\n"
      << "ENVIRONMENT:\n"
      << "  " << CarillonConfig::kSoundDirEnv << "     Sound directory\n"
      << "  CARILLON_DEBUG         Enable debug logging\n"
      << "\n";
}

CliArgs ParseArgs(const std::vector<std::string>& argv, const CarillonConfig& base) {
  CliArgs args;
  args.config = base;

  for (size_t i = 0; i < argv.size(); ++i) {
    const std::string& arg = argv[i];
    const bool has_value = i + 1 < argv.size();

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--sound-dir" && has_value) {
      args.config.sound_dir = argv[++i];
    } else if (arg == "--poll-ms" && has_value) {
      if (!ParseMillis(argv[++i], &args.config.poll_interval_ms)) {
        args.error = "--poll-ms requires a non-negative integer, got " + argv[i];
        return args;
      }
    } else if (arg == "--wake-lead-ms" && has_value) {
      if (!ParseMillis(argv[++i], &args.config.wake_lead_ms)) {
        args.error = "--wake-lead-ms requires a non-negative integer, got " + argv[i];
        return args;
      }
    } else if (arg == "--no-default-schedule") {
      args.config.install_default_schedule = false;
    } else if (arg == "--headless") {
      args.config.headless = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.config.sound_dir.empty()) {
    args.error = "--sound-dir must not be empty";
    return args;
  }
  if (args.config.wake_lead_ms >= 60000) {
    args.error = "--wake-lead-ms must be less than one minute";
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace carillon::runtime
