// Repository: MediaHub
// Component: Playback Commands
// Purpose: Typed home-automation commands and their dispatch onto the
//          playback controller.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PLAYBACK_COMMAND_H_
#define MEDIAHUB_PLAYBACK_COMMAND_H_

#include <optional>
#include <string>
#include <variant>

#include "mediahub/playback/PlaybackController.h"

namespace mediahub::playback {

struct PlayMusic {
  std::string song_name;
};

struct StopMusic {};

struct PlayPlaylist {
  std::string playlist_name;
};

struct PlayRemoteSearch {
  std::string query;
  bool audio_only = true;
};

struct PlayRemoteUrl {
  std::string url;
  bool audio_only = true;
};

struct PlayRemotePlaylist {
  std::string playlist_url;
  bool audio_only = true;
  bool shuffle = false;
};

struct SetVolumeCommand {
  int volume = 50;
};

using Command = std::variant<PlayMusic,
                             StopMusic,
                             PlayPlaylist,
                             PlayRemoteSearch,
                             PlayRemoteUrl,
                             PlayRemotePlaylist,
                             SetVolumeCommand>;

// Untyped command as received on the wire: `type` plus optional fields.
struct RawCommand {
  std::string type;
  std::optional<std::string> song_name;
  std::optional<std::string> playlist_name;
  std::optional<std::string> query;
  std::optional<std::string> url;
  std::optional<std::string> playlist_url;
  std::optional<bool> audio_only;
  std::optional<bool> shuffle;
  std::optional<int> volume;
};

// Wire name of the command ("play_music", ...).
const char* CommandTypeName(const Command& command);

// Converts a raw command. Unknown types and missing required fields are
// logged and yield nullopt; nothing is thrown.
std::optional<Command> ParseCommand(const RawCommand& raw);

// Runs the command on the controller.
ControllerResult Dispatch(PlaybackController& controller, const Command& command);

}  // namespace mediahub::playback

#endif  // MEDIAHUB_PLAYBACK_COMMAND_H_
