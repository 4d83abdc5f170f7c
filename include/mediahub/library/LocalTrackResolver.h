// Repository: MediaHub
// Component: Local Track Resolver
// Purpose: Resolves track names to files in the local music library and reads
//          and writes named playlist definitions.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_LIBRARY_LOCAL_TRACK_RESOLVER_H_
#define MEDIAHUB_LIBRARY_LOCAL_TRACK_RESOLVER_H_

#include <optional>
#include <string>
#include <vector>

namespace mediahub::library {

// LocalTrackResolver maps a track name to a playable file.
//
// Find() first tries "<music_dir>/<name><ext>" for each supported extension,
// in the configured order. On a miss it walks the whole library tree and
// returns the first supported file whose stem contains the name,
// case-insensitively. The walk follows directory-enumeration order, so which
// of several matching files wins is filesystem-dependent.
//
// Playlists live in "<playlists_dir>/<name>.json" as {"songs": [...]}.
class LocalTrackResolver {
 public:
  LocalTrackResolver(std::string music_dir,
                     std::string playlists_dir,
                     std::vector<std::string> supported_extensions);

  std::optional<std::string> Find(const std::string& track_name) const;

  // Ordered track names. Missing or malformed definitions yield an empty list
  // (logged, never thrown).
  std::vector<std::string> LoadPlaylist(const std::string& name) const;

  // Writes the definition, replacing any previous one.
  bool SavePlaylist(const std::string& name, const std::vector<std::string>& songs) const;

  // Names of all stored playlists, sorted.
  std::vector<std::string> ListPlaylists() const;

  // True if the extension (".mp3", case-insensitive) is supported.
  bool IsSupported(const std::string& extension) const;

  const std::string& music_dir() const { return music_dir_; }
  const std::string& playlists_dir() const { return playlists_dir_; }

 private:
  std::string PlaylistPath(const std::string& name) const;

  std::string music_dir_;
  std::string playlists_dir_;
  std::vector<std::string> extensions_;
};

}  // namespace mediahub::library

#endif  // MEDIAHUB_LIBRARY_LOCAL_TRACK_RESOLVER_H_
