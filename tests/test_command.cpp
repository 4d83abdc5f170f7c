// Repository: MediaHub
// Component: Command parsing and dispatch tests

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "fixtures/FakeRemoteCatalog.h"
#include "fixtures/FakeSessionLauncher.h"
#include "mediahub/playback/Command.h"
#include "mediahub/util/Logger.hpp"
#include "test_utils/TempDir.hpp"

namespace mediahub::playback {
namespace {

using mediahub::tests::TempDir;
using mediahub::tests::fixtures::FakeRemoteCatalog;
using mediahub::tests::fixtures::FakeSessionLauncher;

RawCommand Raw(const std::string& type) {
  RawCommand raw;
  raw.type = type;
  return raw;
}

TEST(CommandParseTest, PlayMusicNeedsSongName) {
  EXPECT_FALSE(ParseCommand(Raw("play_music")).has_value());

  RawCommand raw = Raw("play_music");
  raw.song_name = "";
  EXPECT_FALSE(ParseCommand(raw).has_value());

  raw.song_name = "alpha";
  auto command = ParseCommand(raw);
  ASSERT_TRUE(command.has_value());
  ASSERT_TRUE(std::holds_alternative<PlayMusic>(*command));
  EXPECT_EQ(std::get<PlayMusic>(*command).song_name, "alpha");
  EXPECT_STREQ(CommandTypeName(*command), "play_music");
}

TEST(CommandParseTest, RemoteCommandsDefaultToAudioOnly) {
  RawCommand search = Raw("play_youtube_search");
  search.query = "jazz";
  auto parsed = ParseCommand(search);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(std::get<PlayRemoteSearch>(*parsed).audio_only);

  RawCommand url = Raw("play_youtube_url");
  url.url = "https://youtu.be/x";
  url.audio_only = false;
  parsed = ParseCommand(url);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(std::get<PlayRemoteUrl>(*parsed).audio_only);

  RawCommand playlist = Raw("play_youtube_playlist");
  playlist.playlist_url = "https://www.youtube.com/playlist?list=PL1";
  parsed = ParseCommand(playlist);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(std::get<PlayRemotePlaylist>(*parsed).audio_only);
  EXPECT_FALSE(std::get<PlayRemotePlaylist>(*parsed).shuffle);
}

TEST(CommandParseTest, VolumeDefaultsToFifty) {
  auto parsed = ParseCommand(Raw("volume"));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(std::get<SetVolumeCommand>(*parsed).volume, 50);

  RawCommand raw = Raw("volume");
  raw.volume = 80;
  EXPECT_EQ(std::get<SetVolumeCommand>(*ParseCommand(raw)).volume, 80);
}

TEST(CommandParseTest, StopNeedsNoFields) {
  auto parsed = ParseCommand(Raw("stop_music"));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(std::holds_alternative<StopMusic>(*parsed));
}

TEST(CommandParseTest, UnknownTypeYieldsNothing) {
  EXPECT_FALSE(ParseCommand(Raw("dance")).has_value());
  EXPECT_FALSE(ParseCommand(Raw("")).has_value());
}

TEST(CommandParseTest, RejectedCommandsAreLogged) {
  std::vector<std::string> warnings;
  util::Logger::SetWarnSink([&warnings](const std::string& line) { warnings.push_back(line); });
  ParseCommand(Raw("dance"));
  ParseCommand(Raw("play_playlist"));
  util::Logger::SetWarnSink(nullptr);

  ASSERT_EQ(warnings.size(), 2u);
  EXPECT_NE(warnings[0].find("Unknown command type: 'dance'"), std::string::npos);
  EXPECT_NE(warnings[1].find("without playlist_name"), std::string::npos);
}

class CommandDispatchTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_.WriteFile("music/alpha.mp3", "x");
    auto resolver = std::make_shared<library::LocalTrackResolver>(
        dir_.Join("music"), dir_.Join("playlists"), std::vector<std::string>{".mp3"});
    launcher_ = std::make_shared<FakeSessionLauncher>();
    controller_ = std::make_unique<PlaybackController>(
        resolver, std::make_shared<FakeRemoteCatalog>(), launcher_, ControllerOptions{});
  }

  void TearDown() override { controller_->Shutdown(); }

  TempDir dir_{"mediahub_command"};
  std::shared_ptr<FakeSessionLauncher> launcher_;
  std::unique_ptr<PlaybackController> controller_;
};

TEST_F(CommandDispatchTest, DispatchReachesController) {
  ControllerResult played = Dispatch(*controller_, PlayMusic{"alpha"});
  EXPECT_TRUE(played.success) << played.message;
  EXPECT_EQ(launcher_->started_count(), 1u);

  EXPECT_TRUE(Dispatch(*controller_, SetVolumeCommand{120}).success);
  EXPECT_EQ(controller_->GetStatus().volume, 100);

  EXPECT_EQ(Dispatch(*controller_, StopMusic{}).message, "Stopped");
  EXPECT_FALSE(controller_->GetStatus().playing);
}

TEST_F(CommandDispatchTest, UnknownCommandLeavesStatusUnchanged) {
  ASSERT_TRUE(controller_->PlayTrack("alpha").success);
  const PlaybackStatus before = controller_->GetStatus();

  RawCommand raw = Raw("self_destruct");
  raw.volume = 0;
  auto parsed = ParseCommand(raw);
  EXPECT_FALSE(parsed.has_value());

  EXPECT_TRUE(controller_->GetStatus() == before);
  EXPECT_EQ(launcher_->started_count(), 1u);
}

}  // namespace
}  // namespace mediahub::playback
