// Repository: MediaHub
// Component: Synthesis Chain Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/tts/TtsSynthesisChain.h"

#include <filesystem>
#include <system_error>

#include "mediahub/tts/SpeechText.h"
#include "mediahub/util/Logger.hpp"

namespace mediahub::tts {

namespace fs = std::filesystem;
using mediahub::util::Logger;

namespace {

struct Piece {
  bool is_pause = false;
  std::string text;
  int pause_ms = 0;
};

std::vector<Piece> PlanPieces(const std::string& text, int max_sentences, int max_pause_ms) {
  std::vector<Piece> pieces;
  for (const auto& token : TokenizeSpeech(text, max_pause_ms)) {
    if (token.kind == SpeechToken::Kind::kPause) {
      pieces.push_back(Piece{true, "", token.pause_ms});
      continue;
    }
    for (auto& chunk : SplitSentences(token.text, max_sentences)) {
      pieces.push_back(Piece{false, std::move(chunk), 0});
    }
  }
  return pieces;
}

void LogTooLong(int64_t duration_ms) {
  Logger::Error("[TtsSynthesisChain] Speech would last " + std::to_string(duration_ms) +
                "ms, over the configured limit");
}

}  // namespace

TtsSynthesisChain::TtsSynthesisChain(std::vector<std::shared_ptr<ISynthesisBackend>> backends,
                                     ChainOptions options)
    : backends_(std::move(backends)), options_(options) {}

std::vector<std::pair<std::string, bool>> TtsSynthesisChain::ProbeAll() {
  std::vector<std::pair<std::string, bool>> out;
  out.reserve(backends_.size());
  for (const auto& backend : backends_) {
    out.emplace_back(backend->name(), backend->Probe());
  }
  return out;
}

SynthesisStatus TtsSynthesisChain::RenderChunk(const SynthesisRequest& request,
                                               std::string* backend_used) {
  bool any_failed = false;
  for (const auto& backend : backends_) {
    if (!backend->Probe()) {
      Logger::Info("[TtsSynthesisChain] " + backend->name() + " unavailable, trying next");
      continue;
    }
    const SynthesisStatus status = backend->Synthesize(request);
    switch (status) {
      case SynthesisStatus::kSuccess:
        *backend_used = backend->name();
        return status;
      case SynthesisStatus::kUnavailable:
        Logger::Info("[TtsSynthesisChain] " + backend->name() + " unavailable, trying next");
        break;
      case SynthesisStatus::kFailed:
        any_failed = true;
        Logger::Warn("[TtsSynthesisChain] " + backend->name() + " failed, trying next");
        break;
    }
  }
  return any_failed ? SynthesisStatus::kFailed : SynthesisStatus::kUnavailable;
}

ChainResult TtsSynthesisChain::Render(const std::string& text,
                                      const std::string& voice,
                                      double speed,
                                      const std::string& output_path) {
  ChainResult result;
  const std::vector<Piece> pieces =
      PlanPieces(text, options_.max_sentences_per_chunk, options_.max_pause_ms);
  if (pieces.empty()) {
    Logger::Warn("[TtsSynthesisChain] Nothing to render");
    result.status = SynthesisStatus::kFailed;
    return result;
  }

  if (pieces.size() == 1 && !pieces.front().is_pause) {
    result.chunks = 1;
    result.status = RenderChunk(SynthesisRequest{pieces.front().text, voice, speed, output_path},
                                &result.backend);
    if (result.status != SynthesisStatus::kSuccess) {
      Logger::Error("[TtsSynthesisChain] All backends exhausted (" +
                    std::string(SynthesisStatusToString(result.status)) + ")");
    }
    return result;
  }

  AudioAssembler assembler(options_.sample_rate);
  std::error_code ec;
  for (size_t i = 0; i < pieces.size(); ++i) {
    const Piece& piece = pieces[i];
    if (piece.is_pause) {
      if (assembler.duration_ms() + piece.pause_ms > options_.max_duration_ms) {
        LogTooLong(assembler.duration_ms() + piece.pause_ms);
        result.status = SynthesisStatus::kFailed;
        return result;
      }
      assembler.AppendSilence(piece.pause_ms);
      result.pauses++;
      continue;
    }
    const std::string part_path = output_path + ".part" + std::to_string(i) + ".wav";
    const SynthesisStatus status =
        RenderChunk(SynthesisRequest{piece.text, voice, speed, part_path}, &result.backend);
    if (status != SynthesisStatus::kSuccess) {
      fs::remove(part_path, ec);
      Logger::Error("[TtsSynthesisChain] Chunk " + std::to_string(result.chunks + 1) +
                    ": all backends exhausted (" + SynthesisStatusToString(status) + ")");
      result.status = status;
      return result;
    }
    const bool appended = assembler.AppendFile(part_path);
    fs::remove(part_path, ec);
    if (!appended) {
      result.status = SynthesisStatus::kFailed;
      return result;
    }
    if (assembler.duration_ms() > options_.max_duration_ms) {
      LogTooLong(assembler.duration_ms());
      result.status = SynthesisStatus::kFailed;
      return result;
    }
    result.chunks++;
  }

  if (!assembler.WriteWav(output_path)) {
    result.status = SynthesisStatus::kFailed;
    return result;
  }
  Logger::Debug("[TtsSynthesisChain] Assembled " + std::to_string(result.chunks) + " chunks, " +
                std::to_string(result.pauses) + " pauses, " +
                std::to_string(assembler.duration_ms()) + "ms");
  result.status = SynthesisStatus::kSuccess;
  return result;
}

}  // namespace mediahub::tts
