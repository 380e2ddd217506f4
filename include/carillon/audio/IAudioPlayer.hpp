// Repository: Carillon
// Component: Audio Player Interface
// Purpose: Blocking "play this sound to completion" boundary used by the
//          playout loop.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_AUDIO_IAUDIO_PLAYER_HPP_
#define CARILLON_AUDIO_IAUDIO_PLAYER_HPP_

#include <string>

namespace carillon::audio {

// =============================================================================
// Error Codes
// =============================================================================

enum class PlaybackError {
  kNone = 0,

  // Sound file absent or unreadable at resolve time
  kSoundMissing,

  // Container could not be opened or probed
  kOpenFailed,

  // File opened but carries no audio stream
  kNoAudioStream,

  // Codec setup or decode produced no usable audio
  kDecodeError,

  // Output device refused the audio
  kDeviceError,
};

const char* PlaybackErrorToString(PlaybackError error);

// True when the failure lies with the sound the rule names (missing file,
// unreadable or undecodable content) rather than with the output device.
bool IsSoundFault(PlaybackError error);

struct PlaybackResult {
  bool success;
  PlaybackError error;
  std::string detail;

  static PlaybackResult Success(std::string d = "") {
    return {true, PlaybackError::kNone, std::move(d)};
  }
  static PlaybackResult Failure(PlaybackError e, std::string d = "") {
    return {false, e, std::move(d)};
  }
};

// IAudioPlayer plays one resolved sound file and returns only when playback
// has finished (or failed). Called from the playout thread only.
class IAudioPlayer {
 public:
  virtual ~IAudioPlayer() = default;

  virtual PlaybackResult Play(const std::string& path) = 0;
};

}  // namespace carillon::audio

#endif  // CARILLON_AUDIO_IAUDIO_PLAYER_HPP_
