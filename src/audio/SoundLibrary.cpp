// Repository: Carillon
// Component: SoundLibrary
// Copyright (c) 2025 Carillon

#include "carillon/audio/SoundLibrary.hpp"

#include <algorithm>
#include <cctype>
#include <sys/stat.h>
#include <unistd.h>

#include "carillon/schedule/RuleMatcher.hpp"

namespace carillon::audio {

namespace {

bool EndsWithIgnoreCase(const std::string& value, const std::string& suffix) {
  if (suffix.empty() || value.size() < suffix.size()) {
    return false;
  }
  return std::equal(suffix.rbegin(), suffix.rend(), value.rbegin(),
                    [](char a, char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

}  // namespace

SoundLibrary::SoundLibrary(std::string base_dir,
                           std::string extension,
                           std::string strike_prefix)
    : base_dir_(std::move(base_dir)),
      extension_(std::move(extension)),
      strike_prefix_(std::move(strike_prefix)) {}

std::string SoundLibrary::Join(const std::string& file_name) const {
  if (base_dir_.empty()) {
    return file_name;
  }
  if (base_dir_.back() == '/') {
    return base_dir_ + file_name;
  }
  return base_dir_ + "/" + file_name;
}

std::string SoundLibrary::PathForName(const std::string& name) const {
  if (EndsWithIgnoreCase(name, extension_)) {
    return Join(name);
  }
  return Join(name + extension_);
}

std::string SoundLibrary::StrikePath(int strike_count) const {
  return Join(strike_prefix_ + std::to_string(strike_count) + extension_);
}

std::string SoundLibrary::ResolvePath(const schedule::SoundRef& sound, int hour) const {
  if (sound.IsStrike()) {
    return StrikePath(schedule::StrikeCountForHour(hour));
  }
  return PathForName(sound.name);
}

bool SoundLibrary::IsReadableFile(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return false;
  }
  return access(path.c_str(), R_OK) == 0;
}

PlaybackResult SoundLibrary::CheckAvailable(const schedule::SoundRef& sound) const {
  if (sound.IsStrike()) {
    for (int count = 1; count <= kStrikeSoundCount; ++count) {
      const std::string path = StrikePath(count);
      if (!IsReadableFile(path)) {
        return PlaybackResult::Failure(PlaybackError::kSoundMissing, path);
      }
    }
    return PlaybackResult::Success();
  }

  const std::string path = PathForName(sound.name);
  if (sound.name.empty() || !IsReadableFile(path)) {
    return PlaybackResult::Failure(PlaybackError::kSoundMissing, path);
  }
  return PlaybackResult::Success(path);
}

PlaybackResult SoundLibrary::CheckPlayable(const schedule::SoundRef& sound, int hour) const {
  if (!sound.IsStrike() && sound.name.empty()) {
    return PlaybackResult::Failure(PlaybackError::kSoundMissing, PathForName(sound.name));
  }
  const std::string path = ResolvePath(sound, hour);
  if (!IsReadableFile(path)) {
    return PlaybackResult::Failure(PlaybackError::kSoundMissing, path);
  }
  return PlaybackResult::Success(path);
}

}  // namespace carillon::audio
