// Repository: MediaHub
// Component: Speech Cache Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/tts/TtsCache.h"

#include <unistd.h>

#include <openssl/evp.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include "mediahub/tts/SpeechText.h"
#include "mediahub/util/Logger.hpp"

namespace mediahub::tts {

namespace fs = std::filesystem;
using mediahub::util::Logger;

namespace {

constexpr char kKeySeparator = '\x1f';

std::string Sha256Hex(const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  static const char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0f]);
  }
  return hex;
}

}  // namespace

TtsCache::TtsCache(std::string dir, int max_entries)
    : dir_(std::move(dir)), max_entries_(std::max(0, max_entries)) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    throw std::runtime_error("Cannot create speech cache directory " + dir_ + ": " +
                             ec.message());
  }
}

std::string TtsCache::MakeKey(const std::string& text, const std::string& voice, double speed) {
  char speed_buf[32];
  std::snprintf(speed_buf, sizeof(speed_buf), "%.2f", speed);
  std::string material = NormalizeText(text);
  material.push_back(kKeySeparator);
  material += voice;
  material.push_back(kKeySeparator);
  material += speed_buf;
  return Sha256Hex(material);
}

std::string TtsCache::PathForKey(const std::string& key) const {
  return (fs::path(dir_) / (key + kArtifactExtension)).string();
}

std::optional<std::string> TtsCache::Lookup(const std::string& text,
                                            const std::string& voice,
                                            double speed) const {
  const std::string path = PathForKey(MakeKey(text, voice, speed));
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) return path;
  return std::nullopt;
}

std::optional<CacheLookup> TtsCache::GetOrRender(const std::string& text,
                                                 const std::string& voice,
                                                 double speed,
                                                 const RenderFn& render_fn) {
  const std::string key = MakeKey(text, voice, speed);
  const std::string path = PathForKey(key);

  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    Logger::Info("[TtsCache] Using cached speech " + key.substr(0, 12));
    return CacheLookup{path, true};
  }

  // The temporary name keeps the artifact extension so renderers that pick a
  // format from the file name still produce WAV.
  const std::string tmp = (fs::path(dir_) / (key + ".tmp" + std::to_string(getpid()) + "_" +
                                             std::to_string(temp_counter_.fetch_add(1)) +
                                             kArtifactExtension))
                              .string();
  const bool rendered = render_fn && render_fn(tmp);
  if (!rendered || !fs::is_regular_file(tmp, ec) || fs::file_size(tmp, ec) == 0) {
    fs::remove(tmp, ec);
    Logger::Warn("[TtsCache] Render produced no artifact for key " + key.substr(0, 12));
    return std::nullopt;
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    Logger::Error("[TtsCache] Cannot move artifact into place: " + ec.message());
    fs::remove(tmp, ec);
    return std::nullopt;
  }
  Logger::Debug("[TtsCache] Stored " + path);
  EnforceBound(path);
  return CacheLookup{path, false};
}

void TtsCache::EnforceBound(const std::string& keep_path) {
  if (max_entries_ == 0) return;

  std::vector<std::pair<fs::file_time_type, fs::path>> entries;
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) return;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    const fs::path& p = it->path();
    if (p.extension() != kArtifactExtension || !it->is_regular_file(ec)) continue;
    // In-flight renders from concurrent requests are not entries yet.
    if (p.stem().string().find(".tmp") != std::string::npos) continue;
    const auto mtime = fs::last_write_time(p, ec);
    if (ec) continue;
    entries.emplace_back(mtime, p);
  }
  if (entries.size() <= static_cast<size_t>(max_entries_)) return;

  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  size_t excess = entries.size() - static_cast<size_t>(max_entries_);
  for (const auto& entry : entries) {
    if (excess == 0) break;
    if (entry.second == fs::path(keep_path)) continue;
    if (fs::remove(entry.second, ec)) {
      --excess;
      Logger::Debug("[TtsCache] Evicted " + entry.second.filename().string());
    }
  }
}

int TtsCache::Clear() {
  const int removed = util::RemoveFiles(dir_, kArtifactExtension);
  Logger::Info("[TtsCache] Cache cleared (" + std::to_string(removed) + " files)");
  return removed;
}

int TtsCache::Size() const { return Usage().entry_count; }

util::DirectoryUsage TtsCache::Usage() const {
  return util::MeasureDirectory(dir_, kArtifactExtension);
}

}  // namespace mediahub::tts
