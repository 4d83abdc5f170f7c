// Repository: MediaHub
// Component: Track
// Purpose: Queue entry for local files and remote locators.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PLAYBACK_TRACK_H_
#define MEDIAHUB_PLAYBACK_TRACK_H_

#include <string>

namespace mediahub::playback {

enum class SourceKind {
  kLocal,
  kRemote,
};

enum class RemoteMode {
  kAudio,
  kVideo,
};

inline const char* SourceKindToString(SourceKind kind) {
  return kind == SourceKind::kLocal ? "local" : "remote";
}

// Track is a queue entry. `identifier` is the track name (local) or the
// locator (remote); it is resolved to a playable reference only when the
// entry is about to play.
struct Track {
  std::string identifier;
  SourceKind kind = SourceKind::kLocal;
  std::string title;  // Display title; defaults to identifier
  RemoteMode mode = RemoteMode::kAudio;

  static Track Local(std::string name) {
    Track t;
    t.identifier = std::move(name);
    t.kind = SourceKind::kLocal;
    return t;
  }

  static Track Remote(std::string locator, std::string title, RemoteMode mode) {
    Track t;
    t.identifier = std::move(locator);
    t.kind = SourceKind::kRemote;
    t.title = std::move(title);
    t.mode = mode;
    return t;
  }

  const std::string& DisplayName() const { return title.empty() ? identifier : title; }
};

}  // namespace mediahub::playback

#endif  // MEDIAHUB_PLAYBACK_TRACK_H_
