// Repository: MediaHub
// Component: Speech Service
// Purpose: Speech announcements: validate, look up or render through the
//          cache and synthesis chain, then play through the player fallback list.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_TTS_SPEECH_SERVICE_H_
#define MEDIAHUB_TTS_SPEECH_SERVICE_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mediahub/process/ProcessSession.h"
#include "mediahub/tts/TtsCache.h"
#include "mediahub/tts/TtsSynthesisChain.h"

namespace mediahub::tts {

struct SpeechRequest {
  std::string text;
  std::optional<std::string> voice;
  std::optional<double> speed;
  std::optional<double> volume;  // 0.0-1.0, clamped
};

enum class SpeechError {
  kNone,
  kInvalidArgument,  // empty text, non-positive speed
  kSynthesis,        // every backend unavailable or failed
  kPlayback,         // every player unavailable or failed
  kStopped,          // Stop() or Shutdown() ended the announcement
};

struct SpeechResult {
  bool success = false;
  std::string message;
  SpeechError error = SpeechError::kNone;
  bool cache_hit = false;
  std::string artifact_path;
  std::string backend;  // Synthesis backend ("" on a cache hit)
  std::string player;   // Player that played the artifact
};

struct PlayerCommand {
  std::string name;
  std::string command;  // {path}, {volume}, {scale}, {gain}
};

struct SpeechOptions {
  std::string default_voice = "default";
  double default_speed = 1.0;
  double default_volume = 0.8;
  bool cache_enabled = true;
  std::vector<PlayerCommand> players;
  std::chrono::milliseconds stop_grace{500};
};

// SpeechService owns the announcement slot. Announcements are serialized:
// a second Speak() waits until the first one has finished playing. The slot is
// independent of music playback.
class SpeechService {
 public:
  SpeechService(std::shared_ptr<TtsCache> cache,
                std::shared_ptr<TtsSynthesisChain> chain,
                SpeechOptions options);
  ~SpeechService();

  SpeechService(const SpeechService&) = delete;
  SpeechService& operator=(const SpeechService&) = delete;

  // Blocks until the announcement has been rendered and played.
  SpeechResult Speak(const SpeechRequest& request);

  // Renders (or finds) the artifact without playing it.
  SpeechResult Render(const SpeechRequest& request);

  // Stops the announcement in progress, if any. One that is still rendering
  // is not played.
  void Stop();

  // Stops the announcement in progress and refuses every later Speak().
  void Shutdown();

  // Cache maintenance; also used by the RPC layer.
  util::DirectoryUsage CacheInfo() const;
  int ClearCache();

  std::vector<std::pair<std::string, bool>> ProbeBackends();
  std::vector<std::pair<std::string, bool>> ProbePlayers() const;

  bool speaking() const { return speaking_.load(std::memory_order_acquire); }
  const SpeechOptions& options() const { return options_; }

 private:
  struct Resolved {
    std::string text;
    std::string voice;
    double speed = 1.0;
    double volume = 0.8;
  };
  std::optional<Resolved> Validate(const SpeechRequest& request, SpeechResult& result) const;
  SpeechResult RenderResolved(const Resolved& resolved);
  enum class PlayOutcome { kPlayed, kStopped, kNoPlayer };
  PlayOutcome PlayArtifact(const std::string& path, double volume, std::string* player_used);

  std::shared_ptr<TtsCache> cache_;
  std::shared_ptr<TtsSynthesisChain> chain_;
  SpeechOptions options_;

  // Held for the whole render + play of one announcement.
  std::mutex speak_mutex_;

  std::mutex session_mutex_;
  std::shared_ptr<process::ProcessSession> current_;
  bool stop_requested_ = false;
  bool shut_down_ = false;

  std::atomic<bool> speaking_{false};
  std::atomic<uint64_t> scratch_counter_{0};
};

}  // namespace mediahub::tts

#endif  // MEDIAHUB_TTS_SPEECH_SERVICE_H_
