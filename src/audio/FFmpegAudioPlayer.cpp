// Repository: Carillon
// Component: FFmpeg Audio Player
// Purpose: Decode a sound file with libavformat/libavcodec, resample to the
//          house format and play it to completion on an IAudioSink.
// Copyright (c) 2025 Carillon

#include "carillon/audio/FFmpegAudioPlayer.hpp"

#include <chrono>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "carillon/util/Logger.hpp"

namespace carillon::audio {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return std::string(errbuf) + " (" + std::to_string(ret) + ")";
}

}  // namespace

FFmpegAudioPlayer::FFmpegAudioPlayer(std::shared_ptr<IAudioSink> sink)
    : sink_(std::move(sink)),
      format_ctx_(nullptr),
      codec_ctx_(nullptr),
      frame_(nullptr),
      packet_(nullptr),
      swr_ctx_(nullptr),
      audio_stream_index_(-1),
      samples_written_(0),
      play_decode_errors_(0) {
  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);
}

FFmpegAudioPlayer::~FFmpegAudioPlayer() {
  Close();
}

PlaybackResult FFmpegAudioPlayer::Play(const std::string& path) {
  util::Logger::Debug("[FFmpegAudioPlayer] Playing: " + path);
  const auto start = std::chrono::steady_clock::now();

  samples_written_ = 0;
  play_decode_errors_ = 0;
  sink_error_.clear();

  PlaybackResult result = Open(path);
  if (result.success) {
    result = DecodeToSink();
  }
  Close();

  if (result.success && !sink_->Drain()) {
    result = PlaybackResult::Failure(PlaybackError::kDeviceError,
                                     "drain failed: " + sink_->LastError());
  }

  stats_.decode_errors += play_decode_errors_;
  stats_.last_duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
  if (result.success) {
    ++stats_.plays_completed;
    util::Logger::Debug("[FFmpegAudioPlayer] Finished: " + path + " samples=" +
                        std::to_string(samples_written_) + " wall_ms=" +
                        std::to_string(stats_.last_duration_ms));
  } else {
    ++stats_.plays_failed;
    util::Logger::Error("[FFmpegAudioPlayer] FAILED " + std::string(PlaybackErrorToString(result.error)) +
                        " path=" + path + " " + result.detail);
  }
  return result;
}

PlaybackResult FFmpegAudioPlayer::Open(const std::string& path) {
  // Open input file; avformat frees the context itself on failure.
  int ret = avformat_open_input(&format_ctx_, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    format_ctx_ = nullptr;
    return PlaybackResult::Failure(PlaybackError::kOpenFailed,
                                   "open_input " + AvErrorString(ret));
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    return PlaybackResult::Failure(PlaybackError::kOpenFailed,
                                   "find_stream_info " + AvErrorString(ret));
  }

  const AVCodec* codec = nullptr;
  ret = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (ret < 0 || codec == nullptr) {
    return PlaybackResult::Failure(PlaybackError::kNoAudioStream,
                                   "no decodable audio stream");
  }
  audio_stream_index_ = ret;

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    return PlaybackResult::Failure(PlaybackError::kDecodeError,
                                   "failed to allocate codec context");
  }

  AVCodecParameters* codecpar = format_ctx_->streams[audio_stream_index_]->codecpar;
  ret = avcodec_parameters_to_context(codec_ctx_, codecpar);
  if (ret < 0) {
    return PlaybackResult::Failure(PlaybackError::kDecodeError,
                                   "parameters_to_context " + AvErrorString(ret));
  }

  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    return PlaybackResult::Failure(PlaybackError::kDecodeError,
                                   "avcodec_open2 " + AvErrorString(ret));
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    return PlaybackResult::Failure(PlaybackError::kDecodeError,
                                   "failed to allocate frame/packet");
  }

  if (!InitializeResampler()) {
    return PlaybackResult::Failure(PlaybackError::kDecodeError,
                                   "failed to initialize resampler");
  }

  util::Logger::Debug("[FFmpegAudioPlayer] Opened " + path + " codec=" + codec->name +
                      " rate=" + std::to_string(codec_ctx_->sample_rate) +
                      " channels=" + std::to_string(codec_ctx_->ch_layout.nb_channels));
  return PlaybackResult::Success();
}

bool FFmpegAudioPlayer::InitializeResampler() {
  // Source format (from decoder)
  AVChannelLayout src_ch_layout;
  av_channel_layout_uninit(&src_ch_layout);  // Initialize to empty state
  if (codec_ctx_->ch_layout.nb_channels > 0) {
    if (av_channel_layout_copy(&src_ch_layout, &codec_ctx_->ch_layout) < 0) {
      util::Logger::Error("[FFmpegAudioPlayer] Failed to copy source channel layout");
      return false;
    }
  } else {
    // Some mp3 streams leave the layout unset until the first frame; assume mono.
    av_channel_layout_default(&src_ch_layout, 1);
  }
  const AVSampleFormat src_sample_fmt = codec_ctx_->sample_fmt;
  const int src_sample_rate = codec_ctx_->sample_rate;
  if (src_sample_rate <= 0) {
    util::Logger::Error("[FFmpegAudioPlayer] Invalid source sample rate");
    av_channel_layout_uninit(&src_ch_layout);
    return false;
  }

  // Target format: S16 interleaved, stereo, 48kHz
  AVChannelLayout dst_ch_layout;
  av_channel_layout_uninit(&dst_ch_layout);
  if (av_channel_layout_from_mask(&dst_ch_layout, AV_CH_LAYOUT_STEREO) < 0) {
    util::Logger::Error("[FFmpegAudioPlayer] Failed to create destination channel layout");
    av_channel_layout_uninit(&src_ch_layout);
    return false;
  }

  swr_ctx_ = swr_alloc();
  if (!swr_ctx_) {
    av_channel_layout_uninit(&src_ch_layout);
    av_channel_layout_uninit(&dst_ch_layout);
    return false;
  }

  const int opts_ret = swr_alloc_set_opts2(&swr_ctx_,
                                           &dst_ch_layout, AV_SAMPLE_FMT_S16, kOutputSampleRate,
                                           &src_ch_layout, src_sample_fmt, src_sample_rate,
                                           0, nullptr);

  // swr_alloc_set_opts2 copies the layouts
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);

  if (opts_ret != 0) {
    util::Logger::Error("[FFmpegAudioPlayer] Failed to set resampler options");
    swr_free(&swr_ctx_);
    return false;
  }

  if (swr_init(swr_ctx_) < 0) {
    util::Logger::Error("[FFmpegAudioPlayer] Failed to initialize resampler");
    swr_free(&swr_ctx_);
    return false;
  }
  return true;
}

PlaybackResult FFmpegAudioPlayer::DecodeToSink() {
  bool read_error = false;
  while (true) {
    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      break;
    }
    if (ret < 0) {
      // Truncated file: play what was decoded so far.
      read_error = true;
      ++play_decode_errors_;
      util::Logger::Warn("[FFmpegAudioPlayer] read_frame " + AvErrorString(ret));
      break;
    }

    if (packet_->stream_index == audio_stream_index_) {
      ret = avcodec_send_packet(codec_ctx_, packet_);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        ++play_decode_errors_;
      }
      if (!ReceiveFrames()) {
        av_packet_unref(packet_);
        return PlaybackResult::Failure(PlaybackError::kDeviceError, sink_error_);
      }
    }
    av_packet_unref(packet_);
  }

  // Drain the decoder
  avcodec_send_packet(codec_ctx_, nullptr);
  if (!ReceiveFrames() || !FlushResampler()) {
    return PlaybackResult::Failure(PlaybackError::kDeviceError, sink_error_);
  }

  if (samples_written_ == 0) {
    return PlaybackResult::Failure(
        PlaybackError::kDecodeError,
        "no audio decoded (decode_errors=" + std::to_string(play_decode_errors_) +
            (read_error ? ", read error" : "") + ")");
  }
  return PlaybackResult::Success();
}

bool FFmpegAudioPlayer::ReceiveFrames() {
  while (true) {
    const int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      ++play_decode_errors_;
      return true;
    }
    const bool ok = ConvertAndWrite(frame_);
    av_frame_unref(frame_);
    if (!ok) {
      return false;
    }
  }
}

bool FFmpegAudioPlayer::ConvertAndWrite(AVFrame* av_frame) {
  // Calculate number of output samples
  const int64_t delay = swr_get_delay(swr_ctx_, av_frame->sample_rate);
  const int64_t out_samples = av_rescale_rnd(delay + av_frame->nb_samples,
                                             kOutputSampleRate, av_frame->sample_rate,
                                             AV_ROUND_UP);
  if (out_samples <= 0) {
    return true;
  }

  AudioFrame output_frame;
  output_frame.data.resize(static_cast<size_t>(out_samples) * kOutputChannels *
                           kOutputBytesPerSample);
  uint8_t* out_data[1] = {output_frame.data.data()};

  const int samples_converted =
      swr_convert(swr_ctx_, out_data, static_cast<int>(out_samples),
                  const_cast<const uint8_t**>(av_frame->extended_data), av_frame->nb_samples);
  if (samples_converted < 0) {
    ++play_decode_errors_;
    return true;
  }

  output_frame.nb_samples = samples_converted;
  output_frame.data.resize(static_cast<size_t>(samples_converted) * kOutputChannels *
                           kOutputBytesPerSample);
  if (samples_converted == 0) {
    return true;
  }

  if (!sink_->Write(output_frame)) {
    sink_error_ = "write failed: " + sink_->LastError();
    return false;
  }
  samples_written_ += samples_converted;
  return true;
}

bool FFmpegAudioPlayer::FlushResampler() {
  if (!swr_ctx_) {
    return true;
  }
  const int pending = swr_get_out_samples(swr_ctx_, 0);
  if (pending <= 0) {
    return true;
  }

  AudioFrame output_frame;
  output_frame.data.resize(static_cast<size_t>(pending) * kOutputChannels * kOutputBytesPerSample);
  uint8_t* out_data[1] = {output_frame.data.data()};
  const int samples_converted = swr_convert(swr_ctx_, out_data, pending, nullptr, 0);
  if (samples_converted <= 0) {
    return true;
  }
  output_frame.nb_samples = samples_converted;
  output_frame.data.resize(static_cast<size_t>(samples_converted) * kOutputChannels *
                           kOutputBytesPerSample);
  if (!sink_->Write(output_frame)) {
    sink_error_ = "write failed: " + sink_->LastError();
    return false;
  }
  samples_written_ += samples_converted;
  return true;
}

void FFmpegAudioPlayer::Close() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  audio_stream_index_ = -1;
}

}  // namespace carillon::audio
