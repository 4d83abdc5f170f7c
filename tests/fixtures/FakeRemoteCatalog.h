// Scripted remote catalog: search hits and playlist listings are set up by the
// test; nothing is spawned.

#ifndef MEDIAHUB_TESTS_FIXTURES_FAKE_REMOTE_CATALOG_H_
#define MEDIAHUB_TESTS_FIXTURES_FAKE_REMOTE_CATALOG_H_

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "mediahub/remote/RemoteCatalog.h"

namespace mediahub::tests::fixtures {

class FakeRemoteCatalog : public remote::IRemoteCatalog {
 public:
  void SetSearchResult(const std::string& query, remote::RemoteItem item) {
    std::lock_guard<std::mutex> lock(mutex_);
    search_[query] = std::move(item);
  }

  void SetPlaylist(const std::string& locator, std::vector<remote::RemoteItem> items) {
    std::lock_guard<std::mutex> lock(mutex_);
    playlists_[locator] = std::move(items);
  }

  std::optional<remote::RemoteItem> Search(const std::string& query) override {
    search_calls_++;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = search_.find(query);
    if (it == search_.end()) return std::nullopt;
    return it->second;
  }

  std::vector<remote::RemoteItem> ListPlaylist(const std::string& locator, bool shuffle) override {
    last_shuffle_ = shuffle;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = playlists_.find(locator);
    if (it == playlists_.end()) return {};
    return it->second;
  }

  std::optional<std::string> DownloadAndCache(const std::string& /*locator*/,
                                              const std::string& /*name*/) override {
    return std::nullopt;
  }

  util::DirectoryUsage CacheInfo() const override {
    util::DirectoryUsage usage;
    usage.directory = "/fake/remote_cache";
    return usage;
  }

  int ClearCache() override { return 0; }

  int search_calls() const { return search_calls_.load(); }
  bool last_shuffle() const { return last_shuffle_.load(); }

 private:
  std::mutex mutex_;
  std::map<std::string, remote::RemoteItem> search_;
  std::map<std::string, std::vector<remote::RemoteItem>> playlists_;
  std::atomic<int> search_calls_{0};
  std::atomic<bool> last_shuffle_{false};
};

}  // namespace mediahub::tests::fixtures

#endif  // MEDIAHUB_TESTS_FIXTURES_FAKE_REMOTE_CATALOG_H_
