// Repository: MediaHub
// Component: Remote Catalog
// Purpose: Fetcher-backed lookups for remote media: search, playlist listing,
//          and an on-disk download cache.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_REMOTE_REMOTE_CATALOG_H_
#define MEDIAHUB_REMOTE_REMOTE_CATALOG_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "mediahub/util/CancellationToken.hpp"
#include "mediahub/util/FileUtils.hpp"

namespace mediahub::remote {

struct RemoteItem {
  std::string title;
  std::string locator;
};

// Locator validation. A video locator is a watch/short/embed link; a playlist
// locator carries a list= parameter.
bool IsVideoLocator(const std::string& locator);
bool IsPlaylistLocator(const std::string& locator);

// Parses fetcher output of alternating title / locator lines. A trailing
// unpaired line is dropped.
std::vector<RemoteItem> ParseTitleLocatorPairs(const std::string& text);

// Reduces a title to a file-name-safe stem: drops punctuation, joins words
// with '-'. Returns "track" for a title with nothing usable.
std::string SanitizeTitle(const std::string& title);

// IRemoteCatalog is the controller's view of the fetcher's catalog side.
// Every call blocks until the fetcher answers or the catalog timeout expires.
class IRemoteCatalog {
 public:
  virtual ~IRemoteCatalog() = default;

  // First search hit, or nullopt when nothing matched.
  virtual std::optional<RemoteItem> Search(const std::string& query) = 0;

  // Playlist entries, at most the configured limit. `shuffle` asks the
  // fetcher for a random selection.
  virtual std::vector<RemoteItem> ListPlaylist(const std::string& locator, bool shuffle) = 0;

  // Path to "<cache>/<name>.mp3", downloading it first if absent. The name is
  // sanitized like a title; an empty name is derived from the remote title.
  virtual std::optional<std::string> DownloadAndCache(const std::string& locator,
                                                      const std::string& name) = 0;

  virtual util::DirectoryUsage CacheInfo() const = 0;
  virtual int ClearCache() = 0;
};

struct RemoteCatalogOptions {
  std::string fetcher = "yt-dlp";
  std::string cache_dir = "./audio/youtube_cache";
  int playlist_max_items = 20;
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds stop_grace{1000};
};

class RemoteCatalog : public IRemoteCatalog {
 public:
  explicit RemoteCatalog(RemoteCatalogOptions options);

  std::optional<RemoteItem> Search(const std::string& query) override;
  std::vector<RemoteItem> ListPlaylist(const std::string& locator, bool shuffle) override;
  std::optional<std::string> DownloadAndCache(const std::string& locator,
                                              const std::string& name) override;
  util::DirectoryUsage CacheInfo() const override;
  int ClearCache() override;

  // Cancels in-flight and future fetcher invocations (service shutdown).
  void Shutdown();

 private:
  struct FetchOutput {
    bool ok = false;
    std::string text;
  };
  FetchOutput RunFetcher(const std::vector<std::string>& args, const std::string& what);

  RemoteCatalogOptions options_;
  util::CancellationToken shutdown_;
};

}  // namespace mediahub::remote

#endif  // MEDIAHUB_REMOTE_REMOTE_CATALOG_H_
