// Repository: MediaHub
// Component: Configuration
// Copyright (c) 2026 MediaHub

#include "mediahub/config/ConfigLoader.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>

#include "mediahub/util/FileUtils.hpp"
#include "mediahub/util/Logger.hpp"

namespace mediahub::config {

namespace fs = std::filesystem;
namespace pb = google::protobuf;
using mediahub::util::Logger;

namespace {

void AddDecoder(pb::RepeatedPtrField<DecoderConfig>* list,
                const std::string& name,
                const std::string& command,
                std::initializer_list<const char*> extensions) {
  DecoderConfig* decoder = list->Add();
  decoder->set_name(name);
  decoder->set_command(command);
  for (const char* ext : extensions) {
    decoder->add_extensions(ext);
  }
}

// Clears every repeated field of `base` that `overlay` sets non-empty, so the
// following MergeFrom replaces lists instead of appending to them.
void ClearReplacedLists(const pb::Message& overlay, pb::Message* base) {
  const pb::Descriptor* descriptor = base->GetDescriptor();
  const pb::Reflection* overlay_refl = overlay.GetReflection();
  const pb::Reflection* base_refl = base->GetReflection();
  for (int i = 0; i < descriptor->field_count(); ++i) {
    const pb::FieldDescriptor* field = descriptor->field(i);
    if (field->is_repeated()) {
      if (overlay_refl->FieldSize(overlay, field) > 0) {
        base_refl->ClearField(base, field);
      }
    } else if (field->cpp_type() == pb::FieldDescriptor::CPPTYPE_MESSAGE &&
               overlay_refl->HasField(overlay, field)) {
      ClearReplacedLists(overlay_refl->GetMessage(overlay, field),
                         base_refl->MutableMessage(base, field));
    }
  }
}

std::vector<playback::DecoderCommand> ToDecoderCommands(
    const pb::RepeatedPtrField<DecoderConfig>& decoders) {
  std::vector<playback::DecoderCommand> out;
  for (const auto& decoder : decoders) {
    out.push_back(playback::DecoderCommand{
        decoder.name(), decoder.command(),
        std::vector<std::string>(decoder.extensions().begin(), decoder.extensions().end())});
  }
  return out;
}

}  // namespace

MediaHubConfig DefaultConfig() {
  MediaHubConfig config;

  AudioConfig* audio = config.mutable_audio();
  audio->set_music_dir("./audio/music");
  audio->set_playlists_dir("./audio/playlists");
  audio->set_tts_cache_dir("./audio/tts_cache");
  audio->set_remote_cache_dir("./audio/youtube_cache");
  audio->set_default_volume(50);
  for (const char* ext : {".mp3", ".wav", ".flac", ".ogg", ".m4a"}) {
    audio->add_supported_formats(ext);
  }

  PlaybackConfig* playback = config.mutable_playback();
  playback->set_stop_grace_ms(500);
  AddDecoder(playback->mutable_decoders(), "mpg123", "mpg123 -q -f {scale} {path}", {".mp3"});
  AddDecoder(playback->mutable_decoders(), "ffplay",
             "ffplay -nodisp -autoexit -loglevel quiet -volume {volume} {path}", {});
  AddDecoder(playback->mutable_decoders(), "aplay", "aplay -q {path}", {".wav"});

  RemoteConfig* remote = config.mutable_remote();
  remote->set_fetcher("yt-dlp");
  remote->set_audio_fetch_command(
      "yt-dlp --quiet --extract-audio --audio-format mp3 --output - -- {locator}");
  remote->set_video_fetch_command(
      "yt-dlp --quiet --format best[height<=480] --output - -- {locator}");
  AddDecoder(remote->mutable_audio_decoders(), "mpg123", "mpg123 -q -f {scale} -", {});
  AddDecoder(remote->mutable_video_decoders(), "mpv",
             "mpv --vo=gpu --hwdec=auto --volume={volume} -", {});
  remote->set_playlist_max_items(20);
  remote->set_catalog_timeout_ms(30000);
  remote->set_stall_timeout_ms(20000);
  remote->set_stop_grace_ms(1000);

  TtsConfig* tts = config.mutable_tts();
  tts->set_default_voice("default");
  tts->set_default_speed(1.0);
  tts->set_default_volume(0.8);
  tts->set_cache_enabled(true);
  tts->set_max_cache_entries(1000);
  tts->set_max_sentences_per_chunk(3);
  tts->set_synthesis_timeout_ms(60000);
  tts->set_max_pause_ms(10000);
  tts->set_max_audio_duration_ms(600000);
  SynthesisBackendConfig* espeak = tts->add_backends();
  espeak->set_name("espeak");
  espeak->set_command("espeak -s {wpm} -a 100 -v {voice} -w {output} {text}");
  SynthesisBackendConfig* festival = tts->add_backends();
  festival->set_name("festival");
  festival->set_command("text2wave {text_file} -o {output}");
  const std::pair<const char*, const char*> players[] = {
      {"aplay", "aplay -q {path}"},
      {"mpg123", "mpg123 -q -f {scale} {path}"},
      {"sox", "sox -q {path} -d vol {gain}"},
      {"paplay", "paplay {path}"},
  };
  for (const auto& [name, command] : players) {
    PlayerConfig* player = tts->add_players();
    player->set_name(name);
    player->set_command(command);
  }

  config.mutable_server()->set_listen_address("0.0.0.0:8000");
  config.mutable_logging()->set_level("INFO");
  config.mutable_logging()->set_file("./logs/mediahub.log");
  return config;
}

void OverlayMessage(const pb::Message& overlay, pb::Message* base) {
  ClearReplacedLists(overlay, base);
  base->MergeFrom(overlay);
}

bool ParseConfigJson(const std::string& json, MediaHubConfig* out, std::string* error) {
  MediaHubConfig from_file;
  pb::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status = pb::util::JsonStringToMessage(json, &from_file, options);
  if (!status.ok()) {
    if (error) *error = status.ToString();
    return false;
  }
  MediaHubConfig merged = DefaultConfig();
  OverlayMessage(from_file, &merged);
  *out = std::move(merged);
  return true;
}

MediaHubConfig LoadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    Logger::Info("[Config] " + path + " not found, writing defaults");
    MediaHubConfig defaults = DefaultConfig();
    if (!SaveConfig(defaults, path)) {
      Logger::Warn("[Config] Could not write default configuration to " + path);
    }
    return defaults;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  MediaHubConfig config;
  std::string error;
  if (!ParseConfigJson(buffer.str(), &config, &error)) {
    Logger::Error("[Config] Malformed " + path + " (" + error + "), using defaults");
    return DefaultConfig();
  }
  Logger::Info("[Config] Loaded " + path);
  return config;
}

bool SaveConfig(const MediaHubConfig& config, const std::string& path) {
  pb::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  const auto status = pb::util::MessageToJsonString(config, &json, options);
  if (!status.ok()) {
    Logger::Error("[Config] Cannot encode configuration: " + status.ToString());
    return false;
  }
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty() && !util::EnsureDirectory(parent.string())) {
    return false;
  }
  return util::WriteFileAtomically(path, json);
}

bool CreateDirectories(const MediaHubConfig& config) {
  bool ok = true;
  for (const std::string& dir :
       {config.audio().music_dir(), config.audio().playlists_dir(),
        config.audio().tts_cache_dir(), config.audio().remote_cache_dir()}) {
    ok = util::EnsureDirectory(dir) && ok;
  }
  if (!config.logging().file().empty()) {
    const fs::path log_parent = fs::path(config.logging().file()).parent_path();
    if (!log_parent.empty()) ok = util::EnsureDirectory(log_parent.string()) && ok;
  }
  return ok;
}

playback::LauncherOptions ToLauncherOptions(const MediaHubConfig& config) {
  playback::LauncherOptions options;
  options.local_decoders = ToDecoderCommands(config.playback().decoders());
  options.audio_fetch_command = config.remote().audio_fetch_command();
  options.video_fetch_command = config.remote().video_fetch_command();
  options.audio_decoders = ToDecoderCommands(config.remote().audio_decoders());
  options.video_decoders = ToDecoderCommands(config.remote().video_decoders());
  options.stall_timeout = std::chrono::milliseconds(config.remote().stall_timeout_ms());
  options.fetcher_grace = std::chrono::milliseconds(config.remote().stop_grace_ms());
  return options;
}

playback::ControllerOptions ToControllerOptions(const MediaHubConfig& config) {
  playback::ControllerOptions options;
  options.stop_grace = std::chrono::milliseconds(config.playback().stop_grace_ms());
  options.remote_stop_grace = std::chrono::milliseconds(config.remote().stop_grace_ms());
  options.default_volume = config.audio().default_volume();
  return options;
}

remote::RemoteCatalogOptions ToCatalogOptions(const MediaHubConfig& config) {
  remote::RemoteCatalogOptions options;
  options.fetcher = config.remote().fetcher();
  options.cache_dir = config.audio().remote_cache_dir();
  options.playlist_max_items = config.remote().playlist_max_items();
  options.timeout = std::chrono::milliseconds(config.remote().catalog_timeout_ms());
  options.stop_grace = std::chrono::milliseconds(config.remote().stop_grace_ms());
  return options;
}

tts::SpeechOptions ToSpeechOptions(const MediaHubConfig& config) {
  tts::SpeechOptions options;
  options.default_voice = config.tts().default_voice();
  options.default_speed = config.tts().default_speed();
  options.default_volume = config.tts().default_volume();
  options.cache_enabled = config.tts().cache_enabled();
  options.stop_grace = std::chrono::milliseconds(config.playback().stop_grace_ms());
  for (const auto& player : config.tts().players()) {
    options.players.push_back(tts::PlayerCommand{player.name(), player.command()});
  }
  return options;
}

tts::ChainOptions ToChainOptions(const MediaHubConfig& config) {
  tts::ChainOptions options;
  options.max_sentences_per_chunk = config.tts().max_sentences_per_chunk();
  options.max_pause_ms = config.tts().max_pause_ms();
  options.max_duration_ms = config.tts().max_audio_duration_ms();
  return options;
}

std::vector<std::shared_ptr<tts::ISynthesisBackend>> MakeSynthesisBackends(
    const MediaHubConfig& config) {
  std::vector<std::shared_ptr<tts::ISynthesisBackend>> backends;
  const std::chrono::milliseconds timeout(config.tts().synthesis_timeout_ms());
  for (const auto& backend : config.tts().backends()) {
    backends.push_back(std::make_shared<tts::CommandSynthesisBackend>(
        backend.name(), backend.command(), timeout));
  }
  return backends;
}

}  // namespace mediahub::config
