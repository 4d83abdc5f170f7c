// Repository: MediaHub
// Component: Playback Controller
// Purpose: Top-level arbiter that owns the single playback session and the
//          queue, serializes every playback command, and advances the queue
//          on natural session exits.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PLAYBACK_PLAYBACK_CONTROLLER_H_
#define MEDIAHUB_PLAYBACK_PLAYBACK_CONTROLLER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mediahub/library/LocalTrackResolver.h"
#include "mediahub/playback/PlaybackQueue.h"
#include "mediahub/playback/SessionLauncher.h"
#include "mediahub/playback/Track.h"
#include "mediahub/process/ISession.h"
#include "mediahub/remote/RemoteCatalog.h"
#include "mediahub/util/SerialExecutor.hpp"

namespace mediahub::playback {

// Result structure for controller operations
struct ControllerResult {
  bool success;
  std::string message;

  ControllerResult(bool s, const std::string& msg) : success(s), message(msg) {}
};

struct PlaybackStatus {
  bool playing = false;
  bool paused = false;
  std::optional<std::string> current_track;  // Identifier of the queue's current entry
  std::string current_title;
  int volume = 50;
  bool shuffle = false;
  bool repeat = false;
  size_t queue_length = 0;
  std::optional<size_t> current_index;
  std::optional<SourceKind> source_kind;
  PlaybackQueue::State queue_state = PlaybackQueue::State::kEmpty;
  process::SessionStatus session_status = process::SessionStatus::kStopped;
  uint64_t session_generation = 0;

  bool operator==(const PlaybackStatus& other) const;
};

struct ControllerOptions {
  std::chrono::milliseconds stop_grace{500};         // Local decoders
  std::chrono::milliseconds remote_stop_grace{1000};  // Fetcher/decoder pipelines
  int default_volume = 50;
  // Seed for queue shuffles; unset uses a random seed.
  std::optional<uint32_t> shuffle_seed;
};

// PlaybackController
//
// Every public method runs as one task on a private SerialExecutor and returns
// when that task has finished, so commands never interleave: a play* call
// stops the previous session (grace, then kill) and starts the next one before
// the following command begins.
//
// Sessions carry a generation number. Exit callbacks arrive on process reaper
// threads and are posted to the executor tagged with their generation; an
// exit from any session other than the current one is ignored.
//
// Natural-exit handling for the current session:
//   exit 0            → queue.AdvanceOnNaturalEnd(), start the next entry
//   non-zero/signal   → retry the same entry with the next decoder candidate;
//                       when none is left, skip the entry (bounded)
//
// Lookups that only read (track resolution, remote search and listing) run on
// the calling thread before the command is queued, so a missing track or an
// empty search leaves playback untouched.
class PlaybackController {
 public:
  PlaybackController(std::shared_ptr<library::LocalTrackResolver> resolver,
                     std::shared_ptr<remote::IRemoteCatalog> catalog,
                     std::shared_ptr<ISessionLauncher> launcher,
                     ControllerOptions options);
  ~PlaybackController();

  PlaybackController(const PlaybackController&) = delete;
  PlaybackController& operator=(const PlaybackController&) = delete;

  ControllerResult PlayTrack(const std::string& name);
  ControllerResult PlayPlaylist(const std::string& name);
  ControllerResult PlayRemote(const std::string& locator, RemoteMode mode);
  ControllerResult PlayRemoteSearch(const std::string& query, RemoteMode mode);
  ControllerResult PlayRemotePlaylist(const std::string& locator, RemoteMode mode, bool shuffle);

  // Idempotent; succeeds when nothing is playing.
  ControllerResult Stop();
  ControllerResult Pause();
  ControllerResult Resume();
  ControllerResult Next();
  ControllerResult Previous();

  // Clamped to [0, 100]; applies to sessions started afterwards.
  ControllerResult SetVolume(int volume);
  // Return the new flag value.
  bool ToggleShuffle();
  bool ToggleRepeat();

  PlaybackStatus GetStatus();

  // Waits until every task queued so far (including exit events) has run.
  void Drain();

  // Stops the session and the executor. Further commands fail.
  void Shutdown();

 private:
  template <typename Fn>
  auto RunSerialized(Fn fn) -> std::invoke_result_t<Fn>;

  // Executor-thread only.
  ControllerResult LoadAndStart(std::vector<Track> tracks, const std::string& what);
  ControllerResult StartCurrent();
  bool StartCandidates(size_t first);
  void StopSession();
  void OnSessionExit(uint64_t generation, const process::ExitInfo& info);
  std::optional<std::string> ResolvePlayable(const Track& track) const;
  std::chrono::milliseconds GraceFor(SourceKind kind) const;

  std::shared_ptr<library::LocalTrackResolver> resolver_;
  std::shared_ptr<remote::IRemoteCatalog> catalog_;
  std::shared_ptr<ISessionLauncher> launcher_;
  ControllerOptions options_;

  // State below is touched only on the executor thread.
  PlaybackQueue queue_;
  std::unique_ptr<process::ISession> session_;
  SourceKind session_kind_ = SourceKind::kLocal;
  std::vector<LaunchCandidate> candidates_;
  size_t candidate_index_ = 0;
  uint64_t generation_counter_ = 0;
  uint64_t active_generation_ = 0;  // 0: no live session
  bool paused_ = false;
  int volume_;

  std::atomic<bool> shut_down_{false};
  util::SerialExecutor executor_;
};

}  // namespace mediahub::playback

#endif  // MEDIAHUB_PLAYBACK_PLAYBACK_CONTROLLER_H_
