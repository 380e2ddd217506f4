// Repository: Carillon
// Component: Audio Sink Interface
// Purpose: PCM destination for decoded sounds (sound device or headless).
// Copyright (c) 2025 Carillon

#ifndef CARILLON_AUDIO_IAUDIO_SINK_HPP_
#define CARILLON_AUDIO_IAUDIO_SINK_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace carillon::audio {

// Output format every sound is resampled to before reaching a sink.
inline constexpr int kOutputSampleRate = 48000;
inline constexpr int kOutputChannels = 2;
inline constexpr int kOutputBytesPerSample = 2;  // S16 interleaved

// One block of decoded PCM in the output format.
struct AudioFrame {
  std::vector<uint8_t> data;  // S16 interleaved
  int sample_rate = kOutputSampleRate;
  int channels = kOutputChannels;
  int nb_samples = 0;         // Samples per channel
};

// IAudioSink receives PCM for one sound at a time.
//
// Lifecycle:
// 1. Initialize() once at startup
// 2. Write() any number of frames for a sound, then Drain()
// 3. Cleanup() at shutdown
//
// Drain() blocks until everything written has been heard (or discarded, for
// a headless sink); that is what makes Play() blocking.
class IAudioSink {
 public:
  virtual ~IAudioSink() = default;

  virtual bool Initialize() = 0;
  virtual bool Write(const AudioFrame& frame) = 0;
  virtual bool Drain() = 0;
  virtual void Cleanup() = 0;

  // Human-readable reason for the last failed call.
  virtual std::string LastError() const = 0;
};

// HeadlessAudioSink discards PCM. Used when no sound device is wanted or
// available; the schedule still runs and every play is logged.
class HeadlessAudioSink : public IAudioSink {
 public:
  // pace_realtime: Drain() sleeps for the duration written, so the playout
  // loop sees the same timing it would with a device.
  explicit HeadlessAudioSink(bool pace_realtime = false);

  bool Initialize() override;
  bool Write(const AudioFrame& frame) override;
  bool Drain() override;
  void Cleanup() override;
  std::string LastError() const override { return ""; }

  int64_t TotalSamplesWritten() const { return total_samples_; }

 private:
  bool pace_realtime_;
  int64_t pending_samples_ = 0;
  int64_t total_samples_ = 0;
};

}  // namespace carillon::audio

#endif  // CARILLON_AUDIO_IAUDIO_SINK_HPP_
