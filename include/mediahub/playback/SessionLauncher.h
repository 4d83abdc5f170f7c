// Repository: MediaHub
// Component: Session Launcher
// Purpose: Builds the ordered decoder candidates (single processes for local
//          files, fetcher→decoder pipelines for remote locators) for a track.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PLAYBACK_SESSION_LAUNCHER_H_
#define MEDIAHUB_PLAYBACK_SESSION_LAUNCHER_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "mediahub/playback/Track.h"
#include "mediahub/process/ISession.h"

namespace mediahub::playback {

// One way to play a track. `create` returns an unstarted session.
struct LaunchCandidate {
  std::string name;
  std::function<std::unique_ptr<process::ISession>()> create;
};

// ISessionLauncher is the controller's seam to the process layer. Tests
// substitute sessions that end on demand.
class ISessionLauncher {
 public:
  virtual ~ISessionLauncher() = default;

  // Candidates for `track`, best first. `playable_ref` is the resolved file
  // path (local) or the locator (remote). `volume` is 0-100.
  virtual std::vector<LaunchCandidate> Candidates(const Track& track,
                                                  const std::string& playable_ref,
                                                  int volume) = 0;
};

struct DecoderCommand {
  std::string name;
  std::string command;
  // Lower-case extensions including the dot; empty accepts everything.
  std::vector<std::string> extensions;
};

struct LauncherOptions {
  std::vector<DecoderCommand> local_decoders;
  std::string audio_fetch_command;
  std::string video_fetch_command;
  std::vector<DecoderCommand> audio_decoders;
  std::vector<DecoderCommand> video_decoders;
  std::chrono::milliseconds stall_timeout{20000};
  std::chrono::milliseconds fetcher_grace{1000};
};

// ProcessLauncher expands configured command templates into ProcessSession
// (local) and StreamPipeline (remote) candidates. Decoders whose binary is
// not on PATH are left out.
class ProcessLauncher : public ISessionLauncher {
 public:
  explicit ProcessLauncher(LauncherOptions options);

  std::vector<LaunchCandidate> Candidates(const Track& track,
                                          const std::string& playable_ref,
                                          int volume) override;

  // (name, available) for every configured decoder and fetcher.
  std::vector<std::pair<std::string, bool>> ProbeDecoders() const;

 private:
  std::vector<LaunchCandidate> LocalCandidates(const std::string& path, int volume) const;
  std::vector<LaunchCandidate> RemoteCandidates(const std::string& locator,
                                                RemoteMode mode,
                                                int volume) const;

  LauncherOptions options_;
};

}  // namespace mediahub::playback

#endif  // MEDIAHUB_PLAYBACK_SESSION_LAUNCHER_H_
