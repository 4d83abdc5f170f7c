// Repository: MediaHub
// Component: Playback Controller Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/playback/PlaybackController.h"

#include <algorithm>
#include <exception>
#include <type_traits>
#include <utility>

#include "mediahub/util/Logger.hpp"

namespace mediahub::playback {

using mediahub::util::Logger;

bool PlaybackStatus::operator==(const PlaybackStatus& other) const {
  return playing == other.playing && paused == other.paused &&
         current_track == other.current_track && current_title == other.current_title &&
         volume == other.volume && shuffle == other.shuffle && repeat == other.repeat &&
         queue_length == other.queue_length && current_index == other.current_index &&
         source_kind == other.source_kind && queue_state == other.queue_state &&
         session_status == other.session_status &&
         session_generation == other.session_generation;
}

PlaybackController::PlaybackController(std::shared_ptr<library::LocalTrackResolver> resolver,
                                       std::shared_ptr<remote::IRemoteCatalog> catalog,
                                       std::shared_ptr<ISessionLauncher> launcher,
                                       ControllerOptions options)
    : resolver_(std::move(resolver)),
      catalog_(std::move(catalog)),
      launcher_(std::move(launcher)),
      options_(options),
      queue_(options.shuffle_seed ? PlaybackQueue(*options.shuffle_seed) : PlaybackQueue()),
      volume_(std::clamp(options.default_volume, 0, 100)),
      executor_("playback") {
  Logger::Info("[PlaybackController] Initialized (volume " + std::to_string(volume_) + ")");
}

PlaybackController::~PlaybackController() { Shutdown(); }

template <typename Fn>
auto PlaybackController::RunSerialized(Fn fn) -> std::invoke_result_t<Fn> {
  using R = std::invoke_result_t<Fn>;
  if (executor_.IsWorkerThread()) {
    return fn();
  }
  try {
    return executor_.Submit(std::move(fn)).get();
  } catch (const std::exception& e) {
    Logger::Error(std::string("[PlaybackController] Command failed: ") + e.what());
    if constexpr (std::is_same_v<R, ControllerResult>) {
      return ControllerResult(false, e.what());
    } else if constexpr (!std::is_void_v<R>) {
      return R{};
    }
  }
}

// ======================================================================
// Commands
// ======================================================================

ControllerResult PlaybackController::PlayTrack(const std::string& name) {
  if (name.empty()) {
    return ControllerResult(false, "Track name is required");
  }
  if (!resolver_->Find(name)) {
    Logger::Error("[PlaybackController] Song not found: " + name);
    return ControllerResult(false, "Song not found: " + name);
  }
  return RunSerialized([this, name] {
    return LoadAndStart({Track::Local(name)}, "song " + name);
  });
}

ControllerResult PlaybackController::PlayPlaylist(const std::string& name) {
  std::vector<std::string> songs = resolver_->LoadPlaylist(name);
  if (songs.empty()) {
    Logger::Error("[PlaybackController] Playlist not found: " + name);
    return ControllerResult(false, "Playlist not found: " + name);
  }
  std::vector<Track> tracks;
  tracks.reserve(songs.size());
  for (auto& song : songs) {
    tracks.push_back(Track::Local(std::move(song)));
  }
  return RunSerialized([this, name, tracks = std::move(tracks)]() mutable {
    return LoadAndStart(std::move(tracks), "playlist " + name);
  });
}

ControllerResult PlaybackController::PlayRemote(const std::string& locator, RemoteMode mode) {
  if (!remote::IsVideoLocator(locator)) {
    Logger::Error("[PlaybackController] Invalid remote locator: " + locator);
    return ControllerResult(false, "Invalid remote locator: " + locator);
  }
  return RunSerialized([this, locator, mode] {
    return LoadAndStart({Track::Remote(locator, "", mode)}, "remote " + locator);
  });
}

ControllerResult PlaybackController::PlayRemoteSearch(const std::string& query, RemoteMode mode) {
  if (query.empty()) {
    return ControllerResult(false, "Search query is required");
  }
  std::optional<remote::RemoteItem> hit = catalog_->Search(query);
  if (!hit) {
    return ControllerResult(false, "Search results not found for: " + query);
  }
  return RunSerialized([this, query, mode, hit = std::move(*hit)] {
    return LoadAndStart({Track::Remote(hit.locator, hit.title, mode)}, "search " + query);
  });
}

ControllerResult PlaybackController::PlayRemotePlaylist(const std::string& locator,
                                                        RemoteMode mode,
                                                        bool shuffle) {
  if (!remote::IsPlaylistLocator(locator)) {
    Logger::Error("[PlaybackController] Invalid remote playlist locator: " + locator);
    return ControllerResult(false, "Invalid remote playlist locator: " + locator);
  }
  std::vector<remote::RemoteItem> items = catalog_->ListPlaylist(locator, shuffle);
  if (items.empty()) {
    return ControllerResult(false, "Remote playlist not found or empty: " + locator);
  }
  std::vector<Track> tracks;
  tracks.reserve(items.size());
  for (auto& item : items) {
    tracks.push_back(Track::Remote(std::move(item.locator), std::move(item.title), mode));
  }
  return RunSerialized([this, locator, tracks = std::move(tracks)]() mutable {
    return LoadAndStart(std::move(tracks), "remote playlist " + locator);
  });
}

ControllerResult PlaybackController::Stop() {
  return RunSerialized([this] {
    if (!session_) {
      return ControllerResult(true, "Nothing playing");
    }
    StopSession();
    Logger::Info("[PlaybackController] Music stopped");
    return ControllerResult(true, "Stopped");
  });
}

ControllerResult PlaybackController::Pause() {
  return RunSerialized([this] {
    if (!session_ || active_generation_ == 0) {
      return ControllerResult(false, "Nothing is playing");
    }
    if (paused_) {
      return ControllerResult(true, "Already paused");
    }
    if (!session_->Pause()) {
      return ControllerResult(false, "Session cannot be paused");
    }
    paused_ = true;
    Logger::Info("[PlaybackController] Music paused");
    return ControllerResult(true, "Paused");
  });
}

ControllerResult PlaybackController::Resume() {
  return RunSerialized([this] {
    if (!session_ || active_generation_ == 0) {
      return ControllerResult(false, "Nothing is playing");
    }
    if (!paused_) {
      return ControllerResult(true, "Not paused");
    }
    if (!session_->Resume()) {
      return ControllerResult(false, "Session cannot be resumed");
    }
    paused_ = false;
    Logger::Info("[PlaybackController] Music resumed");
    return ControllerResult(true, "Resumed");
  });
}

ControllerResult PlaybackController::Next() {
  return RunSerialized([this] {
    if (queue_.empty()) {
      return ControllerResult(false, "Queue is empty");
    }
    StopSession();
    queue_.Next();
    return StartCurrent();
  });
}

ControllerResult PlaybackController::Previous() {
  return RunSerialized([this] {
    if (queue_.empty()) {
      return ControllerResult(false, "Queue is empty");
    }
    StopSession();
    queue_.Previous();
    return StartCurrent();
  });
}

ControllerResult PlaybackController::SetVolume(int volume) {
  const int clamped = std::clamp(volume, 0, 100);
  return RunSerialized([this, clamped] {
    volume_ = clamped;
    Logger::Info("[PlaybackController] Volume set to: " + std::to_string(volume_));
    return ControllerResult(true, "Volume set to " + std::to_string(volume_));
  });
}

bool PlaybackController::ToggleShuffle() {
  return RunSerialized([this] {
    const bool on = queue_.ToggleShuffle();
    Logger::Info(std::string("[PlaybackController] Shuffle mode: ") + (on ? "ON" : "OFF"));
    return on;
  });
}

bool PlaybackController::ToggleRepeat() {
  return RunSerialized([this] {
    const bool on = queue_.ToggleRepeat();
    Logger::Info(std::string("[PlaybackController] Repeat mode: ") + (on ? "ON" : "OFF"));
    return on;
  });
}

PlaybackStatus PlaybackController::GetStatus() {
  return RunSerialized([this] {
    PlaybackStatus status;
    status.playing = session_ != nullptr && active_generation_ != 0;
    status.paused = paused_;
    status.volume = volume_;
    status.shuffle = queue_.shuffle();
    status.repeat = queue_.repeat();
    status.queue_length = queue_.size();
    status.current_index = queue_.index();
    status.queue_state = queue_.state();
    if (const Track* track = queue_.Current()) {
      status.current_track = track->identifier;
      status.current_title = track->DisplayName();
      status.source_kind = track->kind;
    }
    status.session_status = session_ ? session_->status() : process::SessionStatus::kStopped;
    status.session_generation = active_generation_;
    return status;
  });
}

void PlaybackController::Drain() {
  RunSerialized([] {});
}

void PlaybackController::Shutdown() {
  if (shut_down_.exchange(true)) return;
  RunSerialized([this] { StopSession(); });
  executor_.Shutdown();
}

// ======================================================================
// Executor-thread internals
// ======================================================================

std::chrono::milliseconds PlaybackController::GraceFor(SourceKind kind) const {
  return kind == SourceKind::kRemote ? options_.remote_stop_grace : options_.stop_grace;
}

void PlaybackController::StopSession() {
  // Any exit delivered from here on belongs to a superseded generation.
  active_generation_ = 0;
  paused_ = false;
  candidates_.clear();
  if (!session_) return;
  const std::string description = session_->Describe();
  session_->Stop(GraceFor(session_kind_));
  session_.reset();
  Logger::Debug("[PlaybackController] Session stopped: " + description);
}

ControllerResult PlaybackController::LoadAndStart(std::vector<Track> tracks,
                                                  const std::string& what) {
  StopSession();
  queue_.Load(std::move(tracks));
  ControllerResult result = StartCurrent();
  if (result.success) {
    Logger::Info("[PlaybackController] Playing " + what);
  }
  return result;
}

std::optional<std::string> PlaybackController::ResolvePlayable(const Track& track) const {
  if (track.kind == SourceKind::kRemote) {
    return track.identifier;
  }
  return resolver_->Find(track.identifier);
}

ControllerResult PlaybackController::StartCurrent() {
  std::string last_error = "Queue is empty";
  while (queue_.state() == PlaybackQueue::State::kPlaying) {
    const Track* track = queue_.Current();
    if (track == nullptr) break;

    const std::optional<std::string> playable = ResolvePlayable(*track);
    if (!playable) {
      last_error = "Song not found: " + track->identifier;
      Logger::Error("[PlaybackController] Song not found in queue: " + track->identifier);
    } else {
      session_kind_ = track->kind;
      candidates_ = launcher_->Candidates(*track, *playable, volume_);
      if (candidates_.empty()) {
        last_error = "No decoder available for " + track->DisplayName();
        Logger::Error("[PlaybackController] " + last_error);
      } else if (StartCandidates(0)) {
        return ControllerResult(true, "Playing " + track->DisplayName());
      } else {
        last_error = "No decoder could start " + track->DisplayName();
        Logger::Error("[PlaybackController] " + last_error);
      }
    }

    if (!queue_.SkipUnplayable()) {
      if (queue_.size() > 1) {
        Logger::Error("[PlaybackController] Every queue entry failed in a row; queue finished");
        last_error = "No playable track in queue (" + last_error + ")";
      }
      candidates_.clear();
      return ControllerResult(false, last_error);
    }
  }
  return ControllerResult(false, last_error);
}

bool PlaybackController::StartCandidates(size_t first) {
  const Track* track = queue_.Current();
  const std::string name = track ? track->DisplayName() : std::string("?");
  for (size_t i = first; i < candidates_.size(); ++i) {
    std::unique_ptr<process::ISession> session = candidates_[i].create();
    if (!session) continue;

    const uint64_t generation = ++generation_counter_;
    const bool started = session->Start([this, generation](const process::ExitInfo& info) {
      // Reaper thread: hand the event to the executor, never block here.
      if (!executor_.Post([this, generation, info] { OnSessionExit(generation, info); })) {
        Logger::Debug("[PlaybackController] Exit of generation " + std::to_string(generation) +
                      " after shutdown");
      }
    });
    if (!started) {
      Logger::Warn("[PlaybackController] " + candidates_[i].name + " could not start for '" +
                   name + "', trying next decoder");
      continue;
    }
    session_ = std::move(session);
    active_generation_ = generation;
    candidate_index_ = i;
    paused_ = false;
    Logger::Info("[PlaybackController] Playing '" + name + "' with " + candidates_[i].name +
                 " (generation " + std::to_string(generation) + ")");
    return true;
  }
  return false;
}

void PlaybackController::OnSessionExit(uint64_t generation, const process::ExitInfo& info) {
  if (generation != active_generation_) {
    Logger::Debug("[PlaybackController] Ignoring exit of superseded generation " +
                  std::to_string(generation));
    return;
  }
  if (info.reason == process::ExitReason::kRequested) {
    return;
  }

  const Track* track = queue_.Current();
  const std::string name = track ? track->DisplayName() : std::string("?");
  const std::string decoder =
      candidate_index_ < candidates_.size() ? candidates_[candidate_index_].name : "decoder";

  active_generation_ = 0;
  paused_ = false;
  session_.reset();

  if (info.Succeeded()) {
    queue_.ResetSkipRun();
    Logger::Info("[PlaybackController] Finished '" + name + "'");
    if (!queue_.AdvanceOnNaturalEnd()) {
      candidates_.clear();
      Logger::Info("[PlaybackController] Playlist finished");
      return;
    }
    const ControllerResult result = StartCurrent();
    if (!result.success) {
      Logger::Error("[PlaybackController] Auto-advance stopped: " + result.message);
    }
    return;
  }

  Logger::Warn("[PlaybackController] " + decoder + " ended abnormally on '" + name + "' (" +
               process::DescribeExit(info) + ")");
  if (candidate_index_ + 1 < candidates_.size() && StartCandidates(candidate_index_ + 1)) {
    return;
  }
  if (!queue_.SkipUnplayable()) {
    candidates_.clear();
    Logger::Error("[PlaybackController] Giving up: no queue entry could be played");
    return;
  }
  const ControllerResult result = StartCurrent();
  if (!result.success) {
    Logger::Error("[PlaybackController] Auto-advance stopped: " + result.message);
  }
}

}  // namespace mediahub::playback
