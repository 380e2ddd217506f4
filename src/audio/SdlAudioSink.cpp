// Repository: Carillon
// Component: SDL Audio Sink
// Purpose: Plays PCM on the default sound device through SDL2 queued audio.
// Copyright (c) 2025 Carillon

#include "carillon/audio/SdlAudioSink.hpp"

#include <chrono>
#include <thread>

#ifdef CARILLON_SDL2_AVAILABLE
extern "C" {
#include <SDL2/SDL.h>
}
#endif

#include "carillon/util/Logger.hpp"

namespace carillon::audio {

SdlAudioSink::SdlAudioSink(std::string device_name)
    : device_name_(std::move(device_name)) {}

SdlAudioSink::~SdlAudioSink() {
  Cleanup();
}

#ifdef CARILLON_SDL2_AVAILABLE

namespace {
constexpr int kDeviceBufferSamples = 4096;
constexpr int kDrainPollMs = 20;
}  // namespace

bool SdlAudioSink::Initialize() {
  util::Logger::Info("[SdlAudioSink] Initializing SDL2 audio...");

  if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
    last_error_ = std::string("SDL_InitSubSystem failed: ") + SDL_GetError();
    util::Logger::Error("[SdlAudioSink] " + last_error_);
    return false;
  }

  SDL_AudioSpec want;
  SDL_zero(want);
  want.freq = kOutputSampleRate;
  want.format = AUDIO_S16SYS;
  want.channels = static_cast<Uint8>(kOutputChannels);
  want.samples = kDeviceBufferSamples;
  want.callback = nullptr;  // Queued audio

  SDL_AudioSpec have;
  SDL_zero(have);
  const char* device = device_name_.empty() ? nullptr : device_name_.c_str();
  // No allowed changes: SDL converts if the hardware format differs.
  device_id_ = SDL_OpenAudioDevice(device, 0, &want, &have, 0);
  if (device_id_ == 0) {
    last_error_ = std::string("SDL_OpenAudioDevice failed: ") + SDL_GetError();
    util::Logger::Error("[SdlAudioSink] " + last_error_);
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
    return false;
  }

  device_buffer_samples_ = have.samples;
  SDL_PauseAudioDevice(device_id_, 0);
  initialized_ = true;

  util::Logger::Info("[SdlAudioSink] Opened device " +
                     (device_name_.empty() ? std::string("(default)") : device_name_) +
                     " " + std::to_string(have.freq) + "Hz buffer=" +
                     std::to_string(have.samples));
  return true;
}

bool SdlAudioSink::Write(const AudioFrame& frame) {
  if (!initialized_) {
    last_error_ = "device not initialized";
    return false;
  }
  if (frame.data.empty()) {
    return true;
  }
  if (SDL_QueueAudio(device_id_, frame.data.data(),
                     static_cast<Uint32>(frame.data.size())) != 0) {
    last_error_ = std::string("SDL_QueueAudio failed: ") + SDL_GetError();
    return false;
  }
  return true;
}

bool SdlAudioSink::Drain() {
  if (!initialized_) {
    last_error_ = "device not initialized";
    return false;
  }
  while (SDL_GetQueuedAudioSize(device_id_) > 0) {
    if (SDL_GetAudioDeviceStatus(device_id_) == SDL_AUDIO_STOPPED) {
      last_error_ = "audio device stopped while draining";
      SDL_ClearQueuedAudio(device_id_);
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kDrainPollMs));
  }
  // Queue empty means handed to the device; let its buffer play out.
  const int64_t tail_ms =
      static_cast<int64_t>(device_buffer_samples_) * 1000 / kOutputSampleRate;
  std::this_thread::sleep_for(std::chrono::milliseconds(tail_ms));
  return true;
}

void SdlAudioSink::Cleanup() {
  if (!initialized_) {
    return;
  }
  SDL_CloseAudioDevice(device_id_);
  device_id_ = 0;
  SDL_QuitSubSystem(SDL_INIT_AUDIO);
  initialized_ = false;
  util::Logger::Info("[SdlAudioSink] Cleanup complete");
}

#else

bool SdlAudioSink::Initialize() {
  last_error_ = "SDL2 not available. Rebuild with SDL2 for sound device output.";
  util::Logger::Error("[SdlAudioSink] ERROR: " + last_error_);
  return false;
}

bool SdlAudioSink::Write(const AudioFrame& frame) {
  (void)frame;
  return false;
}

bool SdlAudioSink::Drain() {
  return false;
}

void SdlAudioSink::Cleanup() {}

#endif  // CARILLON_SDL2_AVAILABLE

}  // namespace carillon::audio
