// Repository: Carillon
// Component: FFmpeg Audio Player
// Purpose: Decode a sound file with libavformat/libavcodec, resample to the
//          house format and play it to completion on an IAudioSink.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_AUDIO_FFMPEG_AUDIO_PLAYER_HPP_
#define CARILLON_AUDIO_FFMPEG_AUDIO_PLAYER_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "carillon/audio/IAudioPlayer.hpp"
#include "carillon/audio/IAudioSink.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace carillon::audio {

// PlayerStats tracks playback outcomes for diagnostics.
struct PlayerStats {
  uint64_t plays_completed;
  uint64_t plays_failed;
  uint64_t decode_errors;
  int64_t last_duration_ms;

  PlayerStats()
      : plays_completed(0),
        plays_failed(0),
        decode_errors(0),
        last_duration_ms(0) {}
};

// FFmpegAudioPlayer plays any container/codec FFmpeg can demux and decode
// (.mp3 in practice). Only the best audio stream is decoded; every frame is
// converted to 48 kHz stereo S16 with libswresample and written to the sink,
// then the sink is drained so Play() returns after the last sample is heard.
//
// Thread Safety:
// - Not thread-safe: one Play() at a time, from the playout thread
//
// Error Handling:
// - Open/probe failure        → kOpenFailed
// - No audio stream           → kNoAudioStream
// - Codec/resampler failure,
//   or nothing decodable      → kDecodeError
// - Sink refused or stalled   → kDeviceError
// Isolated corrupt packets are counted and skipped.
class FFmpegAudioPlayer : public IAudioPlayer {
 public:
  explicit FFmpegAudioPlayer(std::shared_ptr<IAudioSink> sink);
  ~FFmpegAudioPlayer() override;

  // Disable copy and move
  FFmpegAudioPlayer(const FFmpegAudioPlayer&) = delete;
  FFmpegAudioPlayer& operator=(const FFmpegAudioPlayer&) = delete;

  PlaybackResult Play(const std::string& path) override;

  const PlayerStats& GetStats() const { return stats_; }

 private:
  PlaybackResult Open(const std::string& path);
  bool InitializeResampler();
  PlaybackResult DecodeToSink();

  // Pulls every frame the decoder has ready. False only on sink failure.
  bool ReceiveFrames();

  // Resamples one decoded frame and writes it. False only on sink failure.
  bool ConvertAndWrite(AVFrame* av_frame);

  // Emits samples still buffered inside the resampler.
  bool FlushResampler();

  void Close();

  std::shared_ptr<IAudioSink> sink_;

  AVFormatContext* format_ctx_;
  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVPacket* packet_;
  SwrContext* swr_ctx_;
  int audio_stream_index_;

  // Per-play counters
  int64_t samples_written_;
  uint64_t play_decode_errors_;
  std::string sink_error_;

  PlayerStats stats_;
};

}  // namespace carillon::audio

#endif  // CARILLON_AUDIO_FFMPEG_AUDIO_PLAYER_HPP_
