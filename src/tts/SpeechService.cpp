// Repository: MediaHub
// Component: Speech Service Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/tts/SpeechService.h"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <system_error>

#include "mediahub/process/CommandTemplate.h"
#include "mediahub/tts/SpeechText.h"
#include "mediahub/util/Logger.hpp"

namespace mediahub::tts {

namespace fs = std::filesystem;
using mediahub::util::Logger;

namespace {

constexpr size_t kLogPreviewChars = 50;

std::string Preview(const std::string& text) {
  if (text.size() <= kLogPreviewChars) return text;
  return text.substr(0, kLogPreviewChars) + "...";
}

}  // namespace

SpeechService::SpeechService(std::shared_ptr<TtsCache> cache,
                             std::shared_ptr<TtsSynthesisChain> chain,
                             SpeechOptions options)
    : cache_(std::move(cache)), chain_(std::move(chain)), options_(std::move(options)) {}

SpeechService::~SpeechService() { Shutdown(); }

std::optional<SpeechService::Resolved> SpeechService::Validate(const SpeechRequest& request,
                                                               SpeechResult& result) const {
  Resolved resolved;
  resolved.text = NormalizeText(request.text);
  if (resolved.text.empty()) {
    result.error = SpeechError::kInvalidArgument;
    result.message = "Text is required";
    Logger::Warn("[SpeechService] Empty text provided");
    return std::nullopt;
  }
  resolved.voice =
      request.voice && !request.voice->empty() ? *request.voice : options_.default_voice;
  resolved.speed = request.speed.value_or(options_.default_speed);
  if (!std::isfinite(resolved.speed) || resolved.speed <= 0.0) {
    result.error = SpeechError::kInvalidArgument;
    result.message = "Speed must be a positive number";
    Logger::Warn("[SpeechService] Rejected speed " + std::to_string(resolved.speed));
    return std::nullopt;
  }
  const double volume = request.volume.value_or(options_.default_volume);
  resolved.volume = std::isfinite(volume) ? std::clamp(volume, 0.0, 1.0) : options_.default_volume;
  return resolved;
}

SpeechResult SpeechService::RenderResolved(const Resolved& resolved) {
  SpeechResult result;
  ChainResult chain_result;
  auto render = [&](const std::string& output_path) {
    chain_result = chain_->Render(resolved.text, resolved.voice, resolved.speed, output_path);
    return chain_result.status == SynthesisStatus::kSuccess;
  };

  Logger::Info("[SpeechService] Speech for: " + Preview(resolved.text));
  std::optional<CacheLookup> lookup;
  if (options_.cache_enabled) {
    lookup = cache_->GetOrRender(resolved.text, resolved.voice, resolved.speed, render);
  } else {
    const std::string scratch =
        (fs::path(cache_->dir()) / ("uncached_" + std::to_string(getpid()) + "_" +
                                    std::to_string(scratch_counter_.fetch_add(1)) + ".wav"))
            .string();
    if (render(scratch)) lookup = CacheLookup{scratch, false};
  }

  if (!lookup) {
    result.error = SpeechError::kSynthesis;
    result.message = chain_result.status == SynthesisStatus::kUnavailable
                         ? "No speech synthesis backend available"
                         : "Speech synthesis failed";
    Logger::Error("[SpeechService] " + result.message);
    return result;
  }
  result.success = true;
  result.cache_hit = lookup->hit;
  result.artifact_path = lookup->path;
  result.backend = lookup->hit ? "" : chain_result.backend;
  result.message = lookup->hit ? "Using cached speech" : "Speech rendered";
  return result;
}

SpeechResult SpeechService::Render(const SpeechRequest& request) {
  SpeechResult result;
  const auto resolved = Validate(request, result);
  if (!resolved) return result;
  return RenderResolved(*resolved);
}

SpeechResult SpeechService::Speak(const SpeechRequest& request) {
  SpeechResult result;
  const auto resolved = Validate(request, result);
  if (!resolved) return result;

  std::lock_guard<std::mutex> speak_lock(speak_mutex_);
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (shut_down_) {
      result.error = SpeechError::kStopped;
      result.message = "Speech service is shutting down";
      Logger::Info("[SpeechService] " + result.message);
      return result;
    }
    stop_requested_ = false;
  }
  speaking_.store(true, std::memory_order_release);

  result = RenderResolved(*resolved);
  if (result.success) {
    switch (PlayArtifact(result.artifact_path, resolved->volume, &result.player)) {
      case PlayOutcome::kPlayed:
        result.message = "Spoke with " + result.player;
        Logger::Info("[SpeechService] Speech played with " + result.player);
        break;
      case PlayOutcome::kStopped:
        result.success = false;
        result.error = SpeechError::kStopped;
        result.message = "Announcement stopped";
        break;
      case PlayOutcome::kNoPlayer:
        result.success = false;
        result.error = SpeechError::kPlayback;
        result.message = "No audio player could play the speech";
        Logger::Error("[SpeechService] " + result.message);
        break;
    }
    if (!options_.cache_enabled) {
      std::error_code ec;
      fs::remove(result.artifact_path, ec);
    }
  }

  speaking_.store(false, std::memory_order_release);
  return result;
}

SpeechService::PlayOutcome SpeechService::PlayArtifact(const std::string& path, double volume,
                                                       std::string* player_used) {
  process::TemplateVars vars = {{"path", path}};
  process::AddVolumeVars(static_cast<int>(std::lround(volume * 100.0)), vars);

  for (const auto& player : options_.players) {
    process::ProcessSpec spec;
    spec.argv = process::ExpandCommand(player.command, vars);
    spec.label = player.name;
    if (spec.argv.empty()) continue;

    auto session = std::make_shared<process::ProcessSession>(spec);
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      if (stop_requested_) {
        Logger::Info("[SpeechService] Announcement stopped before playing");
        return PlayOutcome::kStopped;
      }
      current_ = session;
    }
    if (!session->Start(nullptr)) {
      Logger::Info("[SpeechService] Player " + player.name + " unavailable: " +
                   std::strerror(session->spawn_errno()));
      std::lock_guard<std::mutex> lock(session_mutex_);
      current_.reset();
      continue;
    }
    const process::ExitInfo exit = session->Wait();
    {
      std::lock_guard<std::mutex> lock(session_mutex_);
      current_.reset();
    }
    if (exit.reason == process::ExitReason::kRequested) {
      Logger::Info("[SpeechService] Announcement stopped");
      return PlayOutcome::kStopped;
    }
    if (exit.Succeeded()) {
      *player_used = player.name;
      return PlayOutcome::kPlayed;
    }
    Logger::Warn("[SpeechService] Player " + player.name + " failed: " +
                 process::DescribeExit(exit));
  }
  return PlayOutcome::kNoPlayer;
}

void SpeechService::Stop() {
  std::shared_ptr<process::ProcessSession> session;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    stop_requested_ = true;
    session = current_;
  }
  if (session) session->Stop(options_.stop_grace);
}

void SpeechService::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    shut_down_ = true;
  }
  Stop();
}

util::DirectoryUsage SpeechService::CacheInfo() const { return cache_->Usage(); }

int SpeechService::ClearCache() { return cache_->Clear(); }

std::vector<std::pair<std::string, bool>> SpeechService::ProbeBackends() {
  return chain_->ProbeAll();
}

std::vector<std::pair<std::string, bool>> SpeechService::ProbePlayers() const {
  std::vector<std::pair<std::string, bool>> out;
  for (const auto& player : options_.players) {
    out.emplace_back(player.name,
                     process::IsExecutableAvailable(process::CommandBinary(player.command)));
  }
  return out;
}

}  // namespace mediahub::tts
