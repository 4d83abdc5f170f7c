// Repository: MediaHub
// Component: Speech Cache
// Purpose: Content-addressed store of rendered speech artifacts keyed by
//          (normalized text, voice, speed).
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_TTS_TTS_CACHE_H_
#define MEDIAHUB_TTS_TTS_CACHE_H_

#include <atomic>
#include <functional>
#include <optional>
#include <string>

#include "mediahub/util/FileUtils.hpp"

namespace mediahub::tts {

struct CacheLookup {
  std::string path;
  bool hit = false;
};

// TtsCache: one "<key>.wav" file per entry under the cache directory.
//
// The existence of the file is the hit test; there is no in-memory index and
// no lock. Two concurrent identical misses both render (each into its own
// temporary file) and the later rename wins; both callers get a valid path.
//
// Bound: after every insert the oldest entries by modification time are
// removed until at most max_entries remain (0 = unbounded). The entry just
// inserted is never evicted.
class TtsCache {
 public:
  // Renders into `output_path`; returns true on success.
  using RenderFn = std::function<bool(const std::string& output_path)>;

  static constexpr const char* kArtifactExtension = ".wav";

  // Throws std::runtime_error if `dir` cannot be created.
  TtsCache(std::string dir, int max_entries);

  // Hex SHA-256 over "normalized_text \x1f voice \x1f speed(2 decimals)".
  static std::string MakeKey(const std::string& text, const std::string& voice, double speed);

  // Hit: returns the cached path without calling render_fn.
  // Miss: calls render_fn on a temporary path, then renames it into place.
  // nullopt when render_fn fails or leaves no output.
  std::optional<CacheLookup> GetOrRender(const std::string& text,
                                         const std::string& voice,
                                         double speed,
                                         const RenderFn& render_fn);

  // Path of an existing entry, without rendering.
  std::optional<std::string> Lookup(const std::string& text,
                                    const std::string& voice,
                                    double speed) const;

  // Removes every entry. Returns the number removed.
  int Clear();

  int Size() const;
  util::DirectoryUsage Usage() const;

  const std::string& dir() const { return dir_; }
  int max_entries() const { return max_entries_; }

 private:
  std::string PathForKey(const std::string& key) const;
  void EnforceBound(const std::string& keep_path);

  std::string dir_;
  int max_entries_;
  std::atomic<uint64_t> temp_counter_{0};
};

}  // namespace mediahub::tts

#endif  // MEDIAHUB_TTS_TTS_CACHE_H_
