// Repository: MediaHub
// Component: Remote Catalog Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/remote/RemoteCatalog.h"

#include <cctype>
#include <cstring>
#include <filesystem>
#include <regex>
#include <sstream>
#include <system_error>

#include "mediahub/process/CommandTemplate.h"
#include "mediahub/process/ProcessRunner.h"
#include "mediahub/util/Logger.hpp"

namespace mediahub::remote {

namespace fs = std::filesystem;
using mediahub::util::Logger;

namespace {

constexpr const char* kCacheExtension = ".mp3";

bool MatchesAny(const std::string& locator, const std::vector<std::regex>& patterns) {
  for (const auto& pattern : patterns) {
    if (std::regex_search(locator, pattern)) return true;
  }
  return false;
}

std::string TrimLine(const std::string& line) {
  size_t begin = 0;
  size_t end = line.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) --end;
  return line.substr(begin, end - begin);
}

}  // namespace

// Locators must be absolute http(s) URLs on a YouTube host; anything else
// could reach the fetcher as an option.
bool IsVideoLocator(const std::string& locator) {
  static const std::vector<std::regex> kPatterns = {
      std::regex(R"(^https?://(www\.|m\.)?youtube\.com/watch\?v=)"),
      std::regex(R"(^https?://youtu\.be/)"),
      std::regex(R"(^https?://(www\.)?youtube\.com/embed/)"),
      std::regex(R"(^https?://music\.youtube\.com/watch\?v=)"),
  };
  return MatchesAny(locator, kPatterns);
}

bool IsPlaylistLocator(const std::string& locator) {
  static const std::vector<std::regex> kPatterns = {
      std::regex(R"(^https?://(www\.|m\.)?youtube\.com/playlist\?list=)"),
      std::regex(R"(^https?://(www\.|m\.|music\.)?youtube\.com/watch\?[^\s]*list=)"),
      std::regex(R"(^https?://music\.youtube\.com/playlist\?list=)"),
  };
  return MatchesAny(locator, kPatterns);
}

std::vector<RemoteItem> ParseTitleLocatorPairs(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = TrimLine(line);
    if (!line.empty()) lines.push_back(line);
  }
  std::vector<RemoteItem> items;
  for (size_t i = 0; i + 1 < lines.size(); i += 2) {
    items.push_back(RemoteItem{lines[i], lines[i + 1]});
  }
  return items;
}

std::string SanitizeTitle(const std::string& title) {
  // Word characters (including any non-ASCII byte), whitespace and '-' survive.
  std::string kept;
  for (unsigned char c : title) {
    if (std::isalnum(c) || c == '_' || c == '-' || std::isspace(c) || c >= 0x80) {
      kept.push_back(static_cast<char>(c));
    }
  }
  kept = TrimLine(kept);

  std::string out;
  bool in_separator = false;
  for (char c : kept) {
    if (c == '-' || std::isspace(static_cast<unsigned char>(c))) {
      in_separator = true;
      continue;
    }
    if (in_separator && !out.empty()) out.push_back('-');
    in_separator = false;
    out.push_back(c);
  }
  return out.empty() ? "track" : out;
}

RemoteCatalog::RemoteCatalog(RemoteCatalogOptions options) : options_(std::move(options)) {
  std::error_code ec;
  fs::create_directories(options_.cache_dir, ec);
  if (ec) {
    Logger::Warn("[RemoteCatalog] Cannot create cache dir " + options_.cache_dir + ": " +
                 ec.message());
  }
}

void RemoteCatalog::Shutdown() { shutdown_.Cancel(); }

RemoteCatalog::FetchOutput RemoteCatalog::RunFetcher(const std::vector<std::string>& args,
                                                     const std::string& what) {
  FetchOutput output;
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(options_.fetcher);
  argv.insert(argv.end(), args.begin(), args.end());

  process::RunOptions run_options;
  run_options.timeout = options_.timeout;
  run_options.stop_grace = options_.stop_grace;
  const process::RunResult result = process::RunProcess(argv, run_options, shutdown_);

  if (!result.spawned) {
    Logger::Error("[RemoteCatalog] " + what + ": fetcher '" + options_.fetcher +
                  "' unavailable (" + std::strerror(result.spawn_errno) + ")");
    return output;
  }
  if (result.timed_out) {
    Logger::Error("[RemoteCatalog] " + what + ": timed out after " +
                  std::to_string(options_.timeout.count()) + "ms");
    return output;
  }
  if (result.cancelled) {
    Logger::Info("[RemoteCatalog] " + what + ": cancelled");
    return output;
  }
  if (!result.exit.Succeeded()) {
    Logger::Error("[RemoteCatalog] " + what + ": fetcher failed (" +
                  process::DescribeExit(result.exit) + ")");
    return output;
  }
  output.ok = true;
  output.text = result.stdout_text;
  return output;
}

std::optional<RemoteItem> RemoteCatalog::Search(const std::string& query) {
  const FetchOutput out = RunFetcher({"--quiet", "--get-title", "--get-url", "ytsearch1:" + query},
                                     "search '" + query + "'");
  if (!out.ok) return std::nullopt;
  auto items = ParseTitleLocatorPairs(out.text);
  if (items.empty()) {
    Logger::Info("[RemoteCatalog] No results found for: " + query);
    return std::nullopt;
  }
  Logger::Info("[RemoteCatalog] Found: " + items.front().title);
  return items.front();
}

std::vector<RemoteItem> RemoteCatalog::ListPlaylist(const std::string& locator, bool shuffle) {
  std::vector<std::string> args = {"--quiet", "--get-title", "--get-url", "--playlist-items",
                                   "1-" + std::to_string(options_.playlist_max_items)};
  if (shuffle) args.push_back("--playlist-random");
  args.push_back("--");
  args.push_back(locator);

  const FetchOutput out = RunFetcher(args, "list " + locator);
  if (!out.ok) return {};
  auto items = ParseTitleLocatorPairs(out.text);
  if (items.size() > static_cast<size_t>(options_.playlist_max_items)) {
    items.resize(static_cast<size_t>(options_.playlist_max_items));
  }
  Logger::Info("[RemoteCatalog] Found " + std::to_string(items.size()) + " videos in playlist");
  return items;
}

std::optional<std::string> RemoteCatalog::DownloadAndCache(const std::string& locator,
                                                           const std::string& name) {
  std::string stem = name.empty() ? std::string() : SanitizeTitle(name);
  if (stem.empty()) {
    const FetchOutput title = RunFetcher({"--quiet", "--get-title", "--", locator},
                                          "title " + locator);
    if (!title.ok) return std::nullopt;
    stem = SanitizeTitle(title.text);
  }

  const fs::path cache_file = fs::path(options_.cache_dir) / (stem + kCacheExtension);
  std::error_code ec;
  if (fs::is_regular_file(cache_file, ec)) {
    Logger::Info("[RemoteCatalog] Using cached file: " + cache_file.string());
    return cache_file.string();
  }

  const std::string output_template =
      (fs::path(options_.cache_dir) / (stem + ".%(ext)s")).string();
  const FetchOutput out = RunFetcher({"--quiet", "--extract-audio", "--audio-format", "mp3",
                                      "--output", output_template, "--", locator},
                                     "download " + locator);
  if (!out.ok || !fs::is_regular_file(cache_file, ec)) {
    Logger::Error("[RemoteCatalog] Failed to download: " + locator);
    return std::nullopt;
  }
  Logger::Info("[RemoteCatalog] Downloaded and cached: " + cache_file.string());
  return cache_file.string();
}

util::DirectoryUsage RemoteCatalog::CacheInfo() const {
  return util::MeasureDirectory(options_.cache_dir, kCacheExtension);
}

int RemoteCatalog::ClearCache() {
  const int removed = util::RemoveFiles(options_.cache_dir, kCacheExtension);
  Logger::Info("[RemoteCatalog] Cache cleared (" + std::to_string(removed) + " files)");
  return removed;
}

}  // namespace mediahub::remote
