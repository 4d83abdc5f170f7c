// Repository: MediaHub
// Component: Configuration
// Purpose: Defaults, JSON load/save and directory setup for MediaHubConfig,
//          plus the mapping from configuration to component options.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_CONFIG_CONFIG_LOADER_H_
#define MEDIAHUB_CONFIG_CONFIG_LOADER_H_

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include "mediahub_config.pb.h"
#include "mediahub/playback/PlaybackController.h"
#include "mediahub/playback/SessionLauncher.h"
#include "mediahub/remote/RemoteCatalog.h"
#include "mediahub/tts/SpeechService.h"
#include "mediahub/tts/SynthesisBackend.h"
#include "mediahub/tts/TtsSynthesisChain.h"

namespace mediahub::config {

// Every field populated with its built-in default.
MediaHubConfig DefaultConfig();

// Loads `path` over the defaults.
// - missing file: defaults are written to `path` and returned
// - malformed file: logged, defaults returned
// - otherwise: fields present in the file replace the defaults; a non-empty
//   list in the file replaces the default list wholesale
// Never throws.
MediaHubConfig LoadConfig(const std::string& path);

// Parses JSON text over the defaults. Returns false (leaving *out untouched)
// when the text is not valid JSON for the schema.
bool ParseConfigJson(const std::string& json, MediaHubConfig* out, std::string* error);

bool SaveConfig(const MediaHubConfig& config, const std::string& path);

// Creates the music, playlist, speech cache, remote cache and log directories.
bool CreateDirectories(const MediaHubConfig& config);

// Merges `overlay` into `base`: set scalars and messages override, non-empty
// repeated fields replace.
void OverlayMessage(const google::protobuf::Message& overlay, google::protobuf::Message* base);

// Component options derived from the configuration.
playback::LauncherOptions ToLauncherOptions(const MediaHubConfig& config);
playback::ControllerOptions ToControllerOptions(const MediaHubConfig& config);
remote::RemoteCatalogOptions ToCatalogOptions(const MediaHubConfig& config);
tts::SpeechOptions ToSpeechOptions(const MediaHubConfig& config);
tts::ChainOptions ToChainOptions(const MediaHubConfig& config);
std::vector<std::shared_ptr<tts::ISynthesisBackend>> MakeSynthesisBackends(
    const MediaHubConfig& config);

}  // namespace mediahub::config

#endif  // MEDIAHUB_CONFIG_CONFIG_LOADER_H_
