// Repository: Carillon
// Component: Audio Player Interface
// Copyright (c) 2025 Carillon

#include "carillon/audio/IAudioPlayer.hpp"

namespace carillon::audio {

const char* PlaybackErrorToString(PlaybackError error) {
  switch (error) {
    case PlaybackError::kNone: return "NONE";
    case PlaybackError::kSoundMissing: return "SOUND_MISSING";
    case PlaybackError::kOpenFailed: return "OPEN_FAILED";
    case PlaybackError::kNoAudioStream: return "NO_AUDIO_STREAM";
    case PlaybackError::kDecodeError: return "DECODE_ERROR";
    case PlaybackError::kDeviceError: return "DEVICE_ERROR";
  }
  return "UNKNOWN";
}

bool IsSoundFault(PlaybackError error) {
  switch (error) {
    case PlaybackError::kSoundMissing:
    case PlaybackError::kOpenFailed:
    case PlaybackError::kNoAudioStream:
    case PlaybackError::kDecodeError:
      return true;
    case PlaybackError::kNone:
    case PlaybackError::kDeviceError:
      return false;
  }
  return false;
}

}  // namespace carillon::audio
