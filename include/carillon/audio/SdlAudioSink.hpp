// Repository: Carillon
// Component: SDL Audio Sink
// Purpose: Plays PCM on the default sound device through SDL2 queued audio.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_AUDIO_SDL_AUDIO_SINK_HPP_
#define CARILLON_AUDIO_SDL_AUDIO_SINK_HPP_

#include <cstdint>
#include <string>

#include "carillon/audio/IAudioSink.hpp"

namespace carillon::audio {

// SdlAudioSink opens the default output device once, at Initialize(), in the
// house format (48 kHz stereo S16) and keeps it open for the process
// lifetime. Write() queues PCM; Drain() waits until SDL's queue is empty and
// the device buffer has played out.
//
// Built without SDL2 (CARILLON_SDL2_AVAILABLE undefined), Initialize()
// reports failure and the caller falls back to HeadlessAudioSink.
//
// Thread Safety: not thread-safe; used from the playout thread only.
class SdlAudioSink : public IAudioSink {
 public:
  // device_name: nullptr/empty selects the system default device.
  explicit SdlAudioSink(std::string device_name = "");
  ~SdlAudioSink() override;

  SdlAudioSink(const SdlAudioSink&) = delete;
  SdlAudioSink& operator=(const SdlAudioSink&) = delete;

  bool Initialize() override;
  bool Write(const AudioFrame& frame) override;
  bool Drain() override;
  void Cleanup() override;
  std::string LastError() const override { return last_error_; }

 private:
  std::string device_name_;
  uint32_t device_id_ = 0;       // SDL_AudioDeviceID
  int device_buffer_samples_ = 0;
  bool initialized_ = false;
  std::string last_error_;
};

}  // namespace carillon::audio

#endif  // CARILLON_AUDIO_SDL_AUDIO_SINK_HPP_
