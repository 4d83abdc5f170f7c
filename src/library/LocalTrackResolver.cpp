// Repository: MediaHub
// Component: Local Track Resolver Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/library/LocalTrackResolver.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <google/protobuf/util/json_util.h>

#include "mediahub_config.pb.h"
#include "mediahub/util/FileUtils.hpp"
#include "mediahub/util/Logger.hpp"

namespace mediahub::library {

namespace fs = std::filesystem;
using mediahub::util::Logger;

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

LocalTrackResolver::LocalTrackResolver(std::string music_dir,
                                       std::string playlists_dir,
                                       std::vector<std::string> supported_extensions)
    : music_dir_(std::move(music_dir)),
      playlists_dir_(std::move(playlists_dir)),
      extensions_(std::move(supported_extensions)) {}

bool LocalTrackResolver::IsSupported(const std::string& extension) const {
  const std::string lowered = ToLower(extension);
  for (const auto& ext : extensions_) {
    if (ToLower(ext) == lowered) return true;
  }
  return false;
}

std::optional<std::string> LocalTrackResolver::Find(const std::string& track_name) const {
  if (track_name.empty()) return std::nullopt;

  std::error_code ec;
  for (const auto& ext : extensions_) {
    const fs::path candidate = fs::path(music_dir_) / (track_name + ext);
    if (fs::is_regular_file(candidate, ec)) {
      return candidate.string();
    }
  }

  if (!fs::is_directory(music_dir_, ec)) {
    Logger::Warn("[LocalTrackResolver] Music directory missing: " + music_dir_);
    return std::nullopt;
  }

  const std::string needle = ToLower(track_name);
  fs::recursive_directory_iterator it(
      music_dir_, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    Logger::Warn("[LocalTrackResolver] Cannot scan " + music_dir_ + ": " + ec.message());
    return std::nullopt;
  }
  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      Logger::Warn("[LocalTrackResolver] Scan error under " + music_dir_ + ": " + ec.message());
      break;
    }
    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec)) continue;
    const fs::path& path = entry.path();
    if (!IsSupported(path.extension().string())) continue;
    if (ToLower(path.stem().string()).find(needle) != std::string::npos) {
      Logger::Debug("[LocalTrackResolver] '" + track_name + "' matched " + path.string());
      return path.string();
    }
  }
  return std::nullopt;
}

std::string LocalTrackResolver::PlaylistPath(const std::string& name) const {
  return (fs::path(playlists_dir_) / (name + ".json")).string();
}

std::vector<std::string> LocalTrackResolver::LoadPlaylist(const std::string& name) const {
  const std::string path = PlaylistPath(name);
  std::ifstream in(path);
  if (!in) {
    Logger::Info("[LocalTrackResolver] Playlist not found: " + path);
    return {};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  config::PlaylistDefinition definition;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status =
      google::protobuf::util::JsonStringToMessage(buffer.str(), &definition, options);
  if (!status.ok()) {
    Logger::Error("[LocalTrackResolver] Malformed playlist " + path + ": " + status.ToString());
    return {};
  }
  return std::vector<std::string>(definition.songs().begin(), definition.songs().end());
}

bool LocalTrackResolver::SavePlaylist(const std::string& name,
                                      const std::vector<std::string>& songs) const {
  config::PlaylistDefinition definition;
  definition.set_name(name);
  for (const auto& song : songs) {
    definition.add_songs(song);
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  std::string json;
  const auto status = google::protobuf::util::MessageToJsonString(definition, &json, options);
  if (!status.ok()) {
    Logger::Error("[LocalTrackResolver] Cannot encode playlist " + name + ": " + status.ToString());
    return false;
  }

  if (!util::EnsureDirectory(playlists_dir_)) {
    return false;
  }
  return util::WriteFileAtomically(PlaylistPath(name), json);
}

std::vector<std::string> LocalTrackResolver::ListPlaylists() const {
  std::vector<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(playlists_dir_, ec);
  if (ec) return names;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    const fs::path& path = it->path();
    if (path.extension() == ".json") {
      names.push_back(path.stem().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace mediahub::library
