// Repository: MediaHub
// Component: Synthesis Chain
// Purpose: Ordered fallback across synthesis backends, with pause markers and
//          sentence chunking assembled into a single artifact.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_TTS_TTS_SYNTHESIS_CHAIN_H_
#define MEDIAHUB_TTS_TTS_SYNTHESIS_CHAIN_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mediahub/tts/AudioAssembler.h"
#include "mediahub/tts/SpeechText.h"
#include "mediahub/tts/SynthesisBackend.h"

namespace mediahub::tts {

struct ChainOptions {
  int max_sentences_per_chunk = 3;
  int sample_rate = AudioAssembler::kDefaultSampleRate;
  // Longest single "<pause N>"; longer markers are clamped.
  int max_pause_ms = kDefaultMaxPauseMs;
  // Longest assembled artifact; a render that would exceed it fails.
  int64_t max_duration_ms = 600000;
};

struct ChainResult {
  SynthesisStatus status = SynthesisStatus::kUnavailable;
  // Backend that rendered the last text chunk ("" when nothing rendered).
  std::string backend;
  int chunks = 0;
  int pauses = 0;
};

// TtsSynthesisChain renders text to one WAV artifact.
//
// The text is tokenized on "<pause N>" markers; every text segment is split
// into chunks of at most max_sentences_per_chunk sentences. Each chunk is
// rendered independently by the first backend that succeeds; pauses become
// literal silence. Plain text that fits in one chunk is rendered straight to
// the output path without re-encoding. An assembled artifact longer than
// max_duration_ms is not written and the render is kFailed.
//
// Fallthrough: an unavailable backend and a failed backend both move on to
// the next one; the two are logged differently. When every backend is
// exhausted the result is kFailed if any backend failed, else kUnavailable.
class TtsSynthesisChain {
 public:
  TtsSynthesisChain(std::vector<std::shared_ptr<ISynthesisBackend>> backends,
                    ChainOptions options);

  ChainResult Render(const std::string& text,
                     const std::string& voice,
                     double speed,
                     const std::string& output_path);

  // (name, usable) for every backend, in order.
  std::vector<std::pair<std::string, bool>> ProbeAll();

  size_t backend_count() const { return backends_.size(); }

 private:
  SynthesisStatus RenderChunk(const SynthesisRequest& request, std::string* backend_used);

  std::vector<std::shared_ptr<ISynthesisBackend>> backends_;
  ChainOptions options_;
};

}  // namespace mediahub::tts

#endif  // MEDIAHUB_TTS_TTS_SYNTHESIS_CHAIN_H_
