// Repository: Carillon
// Component: Headless Audio Sink
// Copyright (c) 2025 Carillon

#include "carillon/audio/IAudioSink.hpp"

#include <chrono>
#include <thread>

#include "carillon/util/Logger.hpp"

namespace carillon::audio {

HeadlessAudioSink::HeadlessAudioSink(bool pace_realtime)
    : pace_realtime_(pace_realtime) {}

bool HeadlessAudioSink::Initialize() {
  util::Logger::Info("[HeadlessAudioSink] Initialized (no sound device output)");
  return true;
}

bool HeadlessAudioSink::Write(const AudioFrame& frame) {
  pending_samples_ += frame.nb_samples;
  total_samples_ += frame.nb_samples;
  return true;
}

bool HeadlessAudioSink::Drain() {
  const int64_t duration_ms = pending_samples_ * 1000 / kOutputSampleRate;
  pending_samples_ = 0;
  util::Logger::Debug("[HeadlessAudioSink] Drained " + std::to_string(duration_ms) + "ms");
  if (pace_realtime_ && duration_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
  }
  return true;
}

void HeadlessAudioSink::Cleanup() {
  util::Logger::Info("[HeadlessAudioSink] Cleanup complete");
}

}  // namespace carillon::audio
