// Repository: MediaHub
// Component: Audio Assembler
// Purpose: Joins rendered speech chunks and literal silence into one WAV
//          artifact (FFmpeg decode + resample to a fixed PCM format).
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_TTS_AUDIO_ASSEMBLER_H_
#define MEDIAHUB_TTS_AUDIO_ASSEMBLER_H_

#include <cstdint>
#include <string>
#include <vector>

namespace mediahub::tts {

// AudioAssembler accumulates interleaved S16 PCM at a fixed sample rate and
// channel count ("assembly format"). Every appended file is decoded with
// libavformat/libavcodec and converted with libswresample, so chunks rendered
// by different backends (different rates, float or integer samples) can be
// joined.
class AudioAssembler {
 public:
  static constexpr int kDefaultSampleRate = 22050;
  static constexpr int kDefaultChannels = 1;

  explicit AudioAssembler(int sample_rate = kDefaultSampleRate,
                          int channels = kDefaultChannels);

  // Decodes the first audio stream of `path` and appends it. Returns false
  // (leaving the buffer unchanged) if the file cannot be decoded.
  bool AppendFile(const std::string& path);

  // Appends `duration_ms` of digital silence.
  void AppendSilence(int duration_ms);

  // Writes a canonical 44-byte-header PCM WAV file.
  bool WriteWav(const std::string& path) const;

  int sample_rate() const { return sample_rate_; }
  int channels() const { return channels_; }
  // Sample frames (one sample per channel) accumulated so far.
  size_t frame_count() const { return samples_.size() / static_cast<size_t>(channels_); }
  int64_t duration_ms() const;

 private:
  int sample_rate_;
  int channels_;
  std::vector<int16_t> samples_;
};

}  // namespace mediahub::tts

#endif  // MEDIAHUB_TTS_AUDIO_ASSEMBLER_H_
