// Repository: Carillon
// Component: SoundLibrary
// Purpose: Resolve sound references to files under the sound directory and
//          check that they can be read.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_AUDIO_SOUND_LIBRARY_HPP_
#define CARILLON_AUDIO_SOUND_LIBRARY_HPP_

#include <string>

#include "carillon/audio/IAudioPlayer.hpp"
#include "carillon/schedule/RuleTypes.hpp"

namespace carillon::audio {

// Naming convention:
//   Strike     → <dir>/<strike_prefix><1..12><extension>
//   named "X"  → <dir>/X<extension>, or <dir>/X when X already ends with
//                the extension (compared case-insensitively)
//
// Read-only after construction; safe to share between threads.
class SoundLibrary {
 public:
  static constexpr const char* kDefaultExtension = ".mp3";
  static constexpr const char* kDefaultStrikePrefix = "Strike";
  static constexpr int kStrikeSoundCount = 12;

  explicit SoundLibrary(std::string base_dir,
                        std::string extension = kDefaultExtension,
                        std::string strike_prefix = kDefaultStrikePrefix);

  // Path to play for this reference at the given 24-hour clock hour.
  std::string ResolvePath(const schedule::SoundRef& sound, int hour) const;

  std::string PathForName(const std::string& name) const;

  // strike_count in 1..12.
  std::string StrikePath(int strike_count) const;

  // kSoundMissing naming the first unreadable file; Strike requires all
  // twelve strike files.
  PlaybackResult CheckAvailable(const schedule::SoundRef& sound) const;

  // Play-time check: only the file ResolvePath() gives for this hour.
  PlaybackResult CheckPlayable(const schedule::SoundRef& sound, int hour) const;

  const std::string& BaseDir() const { return base_dir_; }

 private:
  std::string Join(const std::string& file_name) const;
  static bool IsReadableFile(const std::string& path);

  std::string base_dir_;
  std::string extension_;
  std::string strike_prefix_;
};

}  // namespace carillon::audio

#endif  // CARILLON_AUDIO_SOUND_LIBRARY_HPP_
