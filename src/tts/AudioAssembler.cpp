// Repository: MediaHub
// Component: Audio Assembler Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/tts/AudioAssembler.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "mediahub/util/Logger.hpp"

namespace mediahub::tts {

using mediahub::util::Logger;

namespace {

std::string AvError(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

struct FormatCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecFreer {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct PacketFreer {
  void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
struct FrameFreer {
  void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct SwrFreer {
  void operator()(::SwrContext* ctx) const { swr_free(&ctx); }
};

// Converts decoded frames of any layout/rate/sample format to interleaved S16
// in the assembly format. The resampler is rebuilt when the source changes.
class FrameConverter {
 public:
  FrameConverter(int dst_rate, int dst_channels)
      : dst_rate_(dst_rate), dst_channels_(dst_channels) {}

  bool Convert(const AVFrame* frame, std::vector<int16_t>& out) {
    const auto src_fmt = static_cast<AVSampleFormat>(frame->format);
    const int src_channels = frame->ch_layout.nb_channels;
    const int src_rate = frame->sample_rate;
    if (frame->nb_samples <= 0 || src_channels <= 0 || src_rate <= 0) return false;

    if (!swr_ || src_rate != src_rate_ || src_channels != src_channels_ ||
        static_cast<int>(src_fmt) != src_fmt_) {
      if (swr_) Flush(out);
      if (!Reset(src_fmt, src_channels, src_rate)) return false;
    }

    const int64_t delay = swr_get_delay(swr_.get(), src_rate_);
    const int max_out = static_cast<int>(
        av_rescale_rnd(delay + frame->nb_samples, dst_rate_, src_rate_, AV_ROUND_UP));
    return Run(const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples, max_out,
               out);
  }

  // Drains samples buffered inside the resampler.
  void Flush(std::vector<int16_t>& out) {
    if (!swr_) return;
    const int max_out = static_cast<int>(
        av_rescale_rnd(swr_get_delay(swr_.get(), src_rate_), dst_rate_, src_rate_, AV_ROUND_UP));
    if (max_out > 0) Run(nullptr, 0, max_out, out);
  }

 private:
  bool Reset(AVSampleFormat src_fmt, int src_channels, int src_rate) {
    AVChannelLayout src_layout;
    av_channel_layout_default(&src_layout, src_channels);
    AVChannelLayout dst_layout;
    av_channel_layout_default(&dst_layout, dst_channels_);

    ::SwrContext* ctx = nullptr;
    int ret = swr_alloc_set_opts2(&ctx, &dst_layout, AV_SAMPLE_FMT_S16, dst_rate_,
                                  &src_layout, src_fmt, src_rate, 0, nullptr);
    av_channel_layout_uninit(&src_layout);
    av_channel_layout_uninit(&dst_layout);
    if (ret < 0 || !ctx) {
      Logger::Error("[AudioAssembler] Failed to allocate SwrContext: " +
                    (ret < 0 ? AvError(ret) : std::string("null context")));
      return false;
    }
    std::unique_ptr<::SwrContext, SwrFreer> owned(ctx);
    ret = swr_init(owned.get());
    if (ret < 0) {
      Logger::Error("[AudioAssembler] Failed to init SwrContext: " + AvError(ret));
      return false;
    }
    swr_ = std::move(owned);
    src_fmt_ = static_cast<int>(src_fmt);
    src_channels_ = src_channels;
    src_rate_ = src_rate;
    return true;
  }

  bool Run(const uint8_t** in, int in_samples, int max_out, std::vector<int16_t>& out) {
    if (max_out <= 0) return true;
    const size_t offset = out.size();
    out.resize(offset + static_cast<size_t>(max_out) * static_cast<size_t>(dst_channels_));
    auto* out_ptr = reinterpret_cast<uint8_t*>(out.data() + offset);
    const int converted = swr_convert(swr_.get(), &out_ptr, max_out, in, in_samples);
    if (converted < 0) {
      out.resize(offset);
      Logger::Error("[AudioAssembler] swr_convert failed: " + AvError(converted));
      return false;
    }
    out.resize(offset + static_cast<size_t>(converted) * static_cast<size_t>(dst_channels_));
    return true;
  }

  int dst_rate_;
  int dst_channels_;
  std::unique_ptr<::SwrContext, SwrFreer> swr_;
  int src_fmt_ = -1;
  int src_channels_ = 0;
  int src_rate_ = 0;
};

void WriteLe16(std::ofstream& out, uint16_t v) {
  const char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
  out.write(b, 2);
}

void WriteLe32(std::ofstream& out, uint32_t v) {
  const char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                     static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
  out.write(b, 4);
}

}  // namespace

AudioAssembler::AudioAssembler(int sample_rate, int channels)
    : sample_rate_(sample_rate > 0 ? sample_rate : kDefaultSampleRate),
      channels_(channels > 0 ? channels : kDefaultChannels) {}

bool AudioAssembler::AppendFile(const std::string& path) {
  AVFormatContext* raw_fmt = nullptr;
  int ret = avformat_open_input(&raw_fmt, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Logger::Error("[AudioAssembler] Cannot open " + path + ": " + AvError(ret));
    return false;
  }
  std::unique_ptr<AVFormatContext, FormatCloser> fmt(raw_fmt);

  ret = avformat_find_stream_info(fmt.get(), nullptr);
  if (ret < 0) {
    Logger::Error("[AudioAssembler] No stream info in " + path + ": " + AvError(ret));
    return false;
  }
  const int stream_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    Logger::Error("[AudioAssembler] No audio stream in " + path);
    return false;
  }
  const AVCodecParameters* params = fmt->streams[stream_index]->codecpar;
  const AVCodec* codec = avcodec_find_decoder(params->codec_id);
  if (!codec) {
    Logger::Error("[AudioAssembler] No decoder for " + path);
    return false;
  }
  std::unique_ptr<AVCodecContext, CodecFreer> dec(avcodec_alloc_context3(codec));
  if (!dec || avcodec_parameters_to_context(dec.get(), params) < 0 ||
      avcodec_open2(dec.get(), codec, nullptr) < 0) {
    Logger::Error("[AudioAssembler] Cannot open decoder for " + path);
    return false;
  }

  std::unique_ptr<AVPacket, PacketFreer> pkt(av_packet_alloc());
  std::unique_ptr<AVFrame, FrameFreer> frame(av_frame_alloc());
  if (!pkt || !frame) {
    Logger::Error("[AudioAssembler] Out of memory decoding " + path);
    return false;
  }

  FrameConverter converter(sample_rate_, channels_);
  std::vector<int16_t> decoded;

  auto drain = [&]() -> bool {
    while (true) {
      const int r = avcodec_receive_frame(dec.get(), frame.get());
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return true;
      if (r < 0) {
        Logger::Error("[AudioAssembler] Decode error in " + path + ": " + AvError(r));
        return false;
      }
      const bool ok = converter.Convert(frame.get(), decoded);
      av_frame_unref(frame.get());
      if (!ok) return false;
    }
  };

  while ((ret = av_read_frame(fmt.get(), pkt.get())) >= 0) {
    if (pkt->stream_index == stream_index) {
      const int sent = avcodec_send_packet(dec.get(), pkt.get());
      if (sent < 0 && sent != AVERROR(EAGAIN)) {
        Logger::Warn("[AudioAssembler] Dropping corrupt packet in " + path + ": " + AvError(sent));
      }
      if (!drain()) {
        av_packet_unref(pkt.get());
        return false;
      }
    }
    av_packet_unref(pkt.get());
  }
  if (ret != AVERROR_EOF) {
    Logger::Warn("[AudioAssembler] Read stopped early in " + path + ": " + AvError(ret));
  }
  ret = avcodec_send_packet(dec.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    Logger::Warn("[AudioAssembler] Decoder flush failed for " + path + ": " + AvError(ret));
  }
  if (!drain()) return false;
  converter.Flush(decoded);

  if (decoded.empty()) {
    Logger::Error("[AudioAssembler] " + path + " decoded to no audio");
    return false;
  }
  samples_.insert(samples_.end(), decoded.begin(), decoded.end());
  return true;
}

void AudioAssembler::AppendSilence(int duration_ms) {
  if (duration_ms <= 0) return;
  const size_t frames = static_cast<size_t>(
      static_cast<int64_t>(sample_rate_) * duration_ms / 1000);
  samples_.insert(samples_.end(), frames * static_cast<size_t>(channels_), 0);
}

int64_t AudioAssembler::duration_ms() const {
  return static_cast<int64_t>(frame_count()) * 1000 / sample_rate_;
}

bool AudioAssembler::WriteWav(const std::string& path) const {
  constexpr uint16_t kBitsPerSample = 16;
  const uint64_t total_bytes = static_cast<uint64_t>(samples_.size()) * sizeof(int16_t);
  if (total_bytes > std::numeric_limits<uint32_t>::max() - 36u) {
    Logger::Error("[AudioAssembler] " + std::to_string(total_bytes) +
                  " bytes of audio do not fit a WAV file");
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Logger::Error("[AudioAssembler] Cannot open " + path + " for writing");
    return false;
  }
  const uint32_t data_bytes = static_cast<uint32_t>(total_bytes);
  const uint16_t block_align = static_cast<uint16_t>(channels_ * kBitsPerSample / 8);

  out.write("RIFF", 4);
  WriteLe32(out, 36 + data_bytes);
  out.write("WAVE", 4);
  out.write("fmt ", 4);
  WriteLe32(out, 16);
  WriteLe16(out, 1);  // PCM
  WriteLe16(out, static_cast<uint16_t>(channels_));
  WriteLe32(out, static_cast<uint32_t>(sample_rate_));
  WriteLe32(out, static_cast<uint32_t>(sample_rate_) * block_align);
  WriteLe16(out, block_align);
  WriteLe16(out, kBitsPerSample);
  out.write("data", 4);
  WriteLe32(out, data_bytes);
  for (int16_t s : samples_) {
    WriteLe16(out, static_cast<uint16_t>(s));
  }
  if (!out) {
    Logger::Error("[AudioAssembler] Short write to " + path);
    return false;
  }
  return true;
}

}  // namespace mediahub::tts
