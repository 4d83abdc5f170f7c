// Repository: MediaHub
// Component: Configuration loader tests

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "mediahub/config/ConfigLoader.h"
#include "test_utils/TempDir.hpp"

namespace mediahub::config {
namespace {

namespace fs = std::filesystem;
using mediahub::tests::TempDir;

TEST(ConfigLoaderTest, DefaultsArePopulated) {
  const MediaHubConfig config = DefaultConfig();
  EXPECT_EQ(config.audio().music_dir(), "./audio/music");
  EXPECT_EQ(config.audio().default_volume(), 50);
  EXPECT_EQ(config.audio().supported_formats_size(), 5);
  ASSERT_EQ(config.playback().decoders_size(), 3);
  EXPECT_EQ(config.playback().decoders(0).name(), "mpg123");
  EXPECT_EQ(config.remote().playlist_max_items(), 20);
  EXPECT_EQ(config.remote().stall_timeout_ms(), 20000);
  EXPECT_EQ(config.tts().backends_size(), 2);
  EXPECT_EQ(config.tts().players_size(), 4);
  EXPECT_DOUBLE_EQ(config.tts().default_volume(), 0.8);
  EXPECT_EQ(config.server().listen_address(), "0.0.0.0:8000");
  EXPECT_EQ(config.logging().level(), "INFO");
}

TEST(ConfigLoaderTest, PartialFileOverridesOnlyWhatItSets) {
  MediaHubConfig config;
  std::string error;
  ASSERT_TRUE(ParseConfigJson(R"({
    "audio": {"music_dir": "/srv/music", "default_volume": 30},
    "server": {"listen_address": "127.0.0.1:9000"},
    "some_future_section": {"x": 1}
  })",
                              &config, &error))
      << error;
  EXPECT_EQ(config.audio().music_dir(), "/srv/music");
  EXPECT_EQ(config.audio().default_volume(), 30);
  EXPECT_EQ(config.audio().playlists_dir(), "./audio/playlists");
  EXPECT_EQ(config.audio().supported_formats_size(), 5);
  EXPECT_EQ(config.server().listen_address(), "127.0.0.1:9000");
  EXPECT_EQ(config.tts().players_size(), 4);
}

TEST(ConfigLoaderTest, ListsInFileReplaceDefaults) {
  MediaHubConfig config;
  std::string error;
  ASSERT_TRUE(ParseConfigJson(R"({
    "audio": {"supported_formats": [".flac"]},
    "playback": {"decoders": [{"name": "mine", "command": "mine {path}"}]}
  })",
                              &config, &error))
      << error;
  ASSERT_EQ(config.audio().supported_formats_size(), 1);
  EXPECT_EQ(config.audio().supported_formats(0), ".flac");
  ASSERT_EQ(config.playback().decoders_size(), 1);
  EXPECT_EQ(config.playback().decoders(0).name(), "mine");
  // Untouched lists keep their defaults.
  EXPECT_EQ(config.tts().backends_size(), 2);
}

TEST(ConfigLoaderTest, ExplicitZeroOverridesDefault) {
  MediaHubConfig config;
  std::string error;
  ASSERT_TRUE(ParseConfigJson(R"({"tts": {"max_cache_entries": 0, "cache_enabled": false}})",
                              &config, &error));
  EXPECT_EQ(config.tts().max_cache_entries(), 0);
  EXPECT_FALSE(config.tts().cache_enabled());
}

TEST(ConfigLoaderTest, MalformedJsonIsRejected) {
  MediaHubConfig config = DefaultConfig();
  config.mutable_audio()->set_music_dir("unchanged");
  std::string error;
  EXPECT_FALSE(ParseConfigJson("{ not json", &config, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(config.audio().music_dir(), "unchanged");
}

TEST(ConfigLoaderTest, MissingFileWritesDefaults) {
  TempDir dir("mediahub_config");
  const std::string path = dir.Join("conf/config.json");
  const MediaHubConfig loaded = LoadConfig(path);
  EXPECT_EQ(loaded.audio().music_dir(), "./audio/music");
  ASSERT_TRUE(fs::is_regular_file(path));

  // The written file loads back to the same configuration.
  const MediaHubConfig reloaded = LoadConfig(path);
  EXPECT_EQ(reloaded.SerializeAsString(), loaded.SerializeAsString());
}

TEST(ConfigLoaderTest, MalformedFileFallsBackToDefaults) {
  TempDir dir("mediahub_config");
  const std::string path = dir.WriteFile("config.json", "{\"audio\": [1, 2");
  const MediaHubConfig loaded = LoadConfig(path);
  EXPECT_EQ(loaded.audio().music_dir(), "./audio/music");
}

TEST(ConfigLoaderTest, CreateDirectoriesMakesEveryDirectory) {
  TempDir dir("mediahub_config");
  MediaHubConfig config = DefaultConfig();
  config.mutable_audio()->set_music_dir(dir.Join("a/music"));
  config.mutable_audio()->set_playlists_dir(dir.Join("a/playlists"));
  config.mutable_audio()->set_tts_cache_dir(dir.Join("a/tts"));
  config.mutable_audio()->set_remote_cache_dir(dir.Join("a/remote"));
  config.mutable_logging()->set_file(dir.Join("logs/hub.log"));
  ASSERT_TRUE(CreateDirectories(config));
  for (const char* sub : {"a/music", "a/playlists", "a/tts", "a/remote", "logs"}) {
    EXPECT_TRUE(fs::is_directory(dir.Join(sub))) << sub;
  }
}

TEST(ConfigLoaderTest, OptionsFollowConfiguration) {
  MediaHubConfig config = DefaultConfig();
  config.mutable_audio()->set_default_volume(70);
  config.mutable_remote()->set_stall_timeout_ms(1500);

  const playback::ControllerOptions controller = ToControllerOptions(config);
  EXPECT_EQ(controller.default_volume, 70);
  EXPECT_EQ(controller.stop_grace.count(), 500);
  EXPECT_EQ(controller.remote_stop_grace.count(), 1000);

  const playback::LauncherOptions launcher = ToLauncherOptions(config);
  ASSERT_EQ(launcher.local_decoders.size(), 3u);
  EXPECT_EQ(launcher.local_decoders[0].extensions, std::vector<std::string>{".mp3"});
  EXPECT_TRUE(launcher.local_decoders[1].extensions.empty());
  EXPECT_EQ(launcher.stall_timeout.count(), 1500);
  // Locators always follow "--" so the fetcher never parses one as an option.
  EXPECT_NE(launcher.audio_fetch_command.find(" -- {locator}"), std::string::npos);
  EXPECT_NE(launcher.video_fetch_command.find(" -- {locator}"), std::string::npos);

  const remote::RemoteCatalogOptions catalog = ToCatalogOptions(config);
  EXPECT_EQ(catalog.fetcher, "yt-dlp");
  EXPECT_EQ(catalog.playlist_max_items, 20);

  const tts::SpeechOptions speech = ToSpeechOptions(config);
  ASSERT_EQ(speech.players.size(), 4u);
  EXPECT_EQ(speech.players[0].name, "aplay");
  EXPECT_DOUBLE_EQ(speech.default_volume, 0.8);

  const tts::ChainOptions chain = ToChainOptions(config);
  EXPECT_EQ(chain.max_sentences_per_chunk, 3);
  EXPECT_EQ(chain.max_pause_ms, 10000);
  EXPECT_EQ(chain.max_duration_ms, 600000);
  const auto backends = MakeSynthesisBackends(config);
  ASSERT_EQ(backends.size(), 2u);
  EXPECT_EQ(backends[0]->name(), "espeak");
  EXPECT_EQ(backends[1]->name(), "festival");
}

}  // namespace
}  // namespace mediahub::config
