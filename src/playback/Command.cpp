// Repository: MediaHub
// Component: Playback Commands
// Copyright (c) 2026 MediaHub

#include "mediahub/playback/Command.h"

#include <type_traits>

#include "mediahub/util/Logger.hpp"

namespace mediahub::playback {

using mediahub::util::Logger;

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

RemoteMode ModeFor(bool audio_only) {
  return audio_only ? RemoteMode::kAudio : RemoteMode::kVideo;
}

std::optional<std::string> Required(const RawCommand& raw,
                                    const std::optional<std::string>& field,
                                    const char* field_name) {
  if (!field || field->empty()) {
    Logger::Warn("[Command] '" + raw.type + "' without " + field_name + ", ignored");
    return std::nullopt;
  }
  return field;
}

}  // namespace

const char* CommandTypeName(const Command& command) {
  return std::visit(
      [](const auto& c) -> const char* {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, PlayMusic>) {
          return "play_music";
        } else if constexpr (std::is_same_v<T, StopMusic>) {
          return "stop_music";
        } else if constexpr (std::is_same_v<T, PlayPlaylist>) {
          return "play_playlist";
        } else if constexpr (std::is_same_v<T, PlayRemoteSearch>) {
          return "play_youtube_search";
        } else if constexpr (std::is_same_v<T, PlayRemoteUrl>) {
          return "play_youtube_url";
        } else if constexpr (std::is_same_v<T, PlayRemotePlaylist>) {
          return "play_youtube_playlist";
        } else if constexpr (std::is_same_v<T, SetVolumeCommand>) {
          return "volume";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled command");
        }
      },
      command);
}

std::optional<Command> ParseCommand(const RawCommand& raw) {
  const bool audio_only = raw.audio_only.value_or(true);

  if (raw.type == "play_music") {
    auto name = Required(raw, raw.song_name, "song_name");
    if (!name) return std::nullopt;
    return PlayMusic{*name};
  }
  if (raw.type == "stop_music") {
    return StopMusic{};
  }
  if (raw.type == "play_playlist") {
    auto name = Required(raw, raw.playlist_name, "playlist_name");
    if (!name) return std::nullopt;
    return PlayPlaylist{*name};
  }
  if (raw.type == "play_youtube_search") {
    auto query = Required(raw, raw.query, "query");
    if (!query) return std::nullopt;
    return PlayRemoteSearch{*query, audio_only};
  }
  if (raw.type == "play_youtube_url") {
    auto url = Required(raw, raw.url, "url");
    if (!url) return std::nullopt;
    return PlayRemoteUrl{*url, audio_only};
  }
  if (raw.type == "play_youtube_playlist") {
    auto url = Required(raw, raw.playlist_url, "playlist_url");
    if (!url) return std::nullopt;
    return PlayRemotePlaylist{*url, audio_only, raw.shuffle.value_or(false)};
  }
  if (raw.type == "volume") {
    return SetVolumeCommand{raw.volume.value_or(50)};
  }
  Logger::Warn("[Command] Unknown command type: '" + raw.type + "'");
  return std::nullopt;
}

ControllerResult Dispatch(PlaybackController& controller, const Command& command) {
  Logger::Info(std::string("[Command] Dispatching ") + CommandTypeName(command));
  return std::visit(
      [&controller](const auto& c) -> ControllerResult {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, PlayMusic>) {
          return controller.PlayTrack(c.song_name);
        } else if constexpr (std::is_same_v<T, StopMusic>) {
          return controller.Stop();
        } else if constexpr (std::is_same_v<T, PlayPlaylist>) {
          return controller.PlayPlaylist(c.playlist_name);
        } else if constexpr (std::is_same_v<T, PlayRemoteSearch>) {
          return controller.PlayRemoteSearch(c.query, ModeFor(c.audio_only));
        } else if constexpr (std::is_same_v<T, PlayRemoteUrl>) {
          return controller.PlayRemote(c.url, ModeFor(c.audio_only));
        } else if constexpr (std::is_same_v<T, PlayRemotePlaylist>) {
          return controller.PlayRemotePlaylist(c.playlist_url, ModeFor(c.audio_only), c.shuffle);
        } else if constexpr (std::is_same_v<T, SetVolumeCommand>) {
          return controller.SetVolume(c.volume);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled command");
        }
      },
      command);
}

}  // namespace mediahub::playback
