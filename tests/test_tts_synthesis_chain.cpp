// Repository: MediaHub
// Component: Synthesis chain and backend tests

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "fixtures/FakeSynthesisBackend.h"
#include "mediahub/tts/AudioAssembler.h"
#include "mediahub/tts/SynthesisBackend.h"
#include "mediahub/tts/TtsSynthesisChain.h"
#include "test_utils/TempDir.hpp"

namespace mediahub::tts {
namespace {

namespace fs = std::filesystem;
using mediahub::tests::TempDir;
using mediahub::tests::fixtures::FakeSynthesisBackend;

std::string WriteScript(const TempDir& dir, const std::string& name, const std::string& body) {
  const std::string path = dir.WriteFile(name, "#!/bin/sh\n" + body + "\n");
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path;
}

class TtsSynthesisChainTest : public ::testing::Test {
 protected:
  TempDir dir_{"mediahub_chain"};
  std::shared_ptr<FakeSynthesisBackend> primary_ =
      std::make_shared<FakeSynthesisBackend>("primary", SynthesisStatus::kSuccess);
  std::shared_ptr<FakeSynthesisBackend> secondary_ =
      std::make_shared<FakeSynthesisBackend>("secondary", SynthesisStatus::kSuccess);

  TtsSynthesisChain Chain(ChainOptions options = ChainOptions{}) {
    return TtsSynthesisChain({primary_, secondary_}, options);
  }
};

TEST_F(TtsSynthesisChainTest, FirstBackendWins) {
  auto chain = Chain();
  ChainResult result = chain.Render("Hello there.", "en", 1.0, dir_.Join("out.wav"));
  EXPECT_EQ(result.status, SynthesisStatus::kSuccess);
  EXPECT_EQ(result.backend, "primary");
  EXPECT_EQ(result.chunks, 1);
  EXPECT_EQ(primary_->calls(), 1);
  EXPECT_EQ(secondary_->calls(), 0);
  ASSERT_EQ(primary_->requests().size(), 1u);
  EXPECT_EQ(primary_->requests()[0].output_path, dir_.Join("out.wav"));
  EXPECT_TRUE(fs::is_regular_file(dir_.Join("out.wav")));
}

TEST_F(TtsSynthesisChainTest, UnavailableBackendIsSkippedWithoutCalling) {
  primary_->set_probe_result(false);
  auto chain = Chain();
  ChainResult result = chain.Render("Hi.", "en", 1.0, dir_.Join("out.wav"));
  EXPECT_EQ(result.status, SynthesisStatus::kSuccess);
  EXPECT_EQ(result.backend, "secondary");
  EXPECT_EQ(primary_->calls(), 0);
}

TEST_F(TtsSynthesisChainTest, FailedBackendFallsThrough) {
  primary_->set_outcome(SynthesisStatus::kFailed);
  auto chain = Chain();
  ChainResult result = chain.Render("Hi.", "en", 1.0, dir_.Join("out.wav"));
  EXPECT_EQ(result.status, SynthesisStatus::kSuccess);
  EXPECT_EQ(result.backend, "secondary");
  EXPECT_EQ(primary_->calls(), 1);
}

TEST_F(TtsSynthesisChainTest, ExhaustedChainReportsFailedOverUnavailable) {
  primary_->set_outcome(SynthesisStatus::kFailed);
  secondary_->set_probe_result(false);
  auto chain = Chain();
  EXPECT_EQ(chain.Render("Hi.", "en", 1.0, dir_.Join("a.wav")).status, SynthesisStatus::kFailed);

  primary_->set_probe_result(false);
  ChainResult result = chain.Render("Hi.", "en", 1.0, dir_.Join("b.wav"));
  EXPECT_EQ(result.status, SynthesisStatus::kUnavailable);
  EXPECT_TRUE(result.backend.empty());
}

TEST_F(TtsSynthesisChainTest, EmptyBackendListIsUnavailable) {
  TtsSynthesisChain chain({}, ChainOptions{});
  EXPECT_EQ(chain.Render("Hi.", "en", 1.0, dir_.Join("out.wav")).status,
            SynthesisStatus::kUnavailable);
}

TEST_F(TtsSynthesisChainTest, PausesAndChunksAreAssembled) {
  ChainOptions options;
  options.max_sentences_per_chunk = 1;
  auto chain = Chain(options);
  primary_->set_rendered_ms(200);

  const std::string out = dir_.Join("joined.wav");
  ChainResult result = chain.Render("One. Two. <pause 300> Three.", "en", 1.0, out);
  ASSERT_EQ(result.status, SynthesisStatus::kSuccess);
  EXPECT_EQ(result.chunks, 3);
  EXPECT_EQ(result.pauses, 1);
  EXPECT_EQ(primary_->calls(), 3);

  AudioAssembler check;
  ASSERT_TRUE(check.AppendFile(out));
  EXPECT_NEAR(static_cast<double>(check.duration_ms()), 900.0, 30.0);

  // Part files are cleaned up.
  int leftovers = 0;
  for (const auto& entry : fs::directory_iterator(dir_.path())) {
    if (entry.path().filename().string().find(".part") != std::string::npos) ++leftovers;
  }
  EXPECT_EQ(leftovers, 0);
}

TEST_F(TtsSynthesisChainTest, FailingChunkFailsWholeRender) {
  primary_->set_outcome(SynthesisStatus::kFailed);
  secondary_->set_outcome(SynthesisStatus::kFailed);
  auto chain = Chain();
  const std::string out = dir_.Join("never.wav");
  ChainResult result = chain.Render("Hello. <pause 100> Bye.", "en", 1.0, out);
  EXPECT_EQ(result.status, SynthesisStatus::kFailed);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(TtsSynthesisChainTest, HugePauseRendersClampedSilence) {
  ChainOptions options;
  options.max_pause_ms = 1000;
  auto chain = Chain(options);
  primary_->set_rendered_ms(100);

  const std::string out = dir_.Join("doorbell.wav");
  ChainResult result = chain.Render("Doorbell. <pause 999999999> Done.", "en", 1.0, out);
  ASSERT_EQ(result.status, SynthesisStatus::kSuccess);
  EXPECT_EQ(result.pauses, 1);

  AudioAssembler check;
  ASSERT_TRUE(check.AppendFile(out));
  EXPECT_NEAR(static_cast<double>(check.duration_ms()), 1200.0, 30.0);
}

TEST_F(TtsSynthesisChainTest, SilenceOverDurationLimitFailsBeforeRendering) {
  ChainOptions options;
  options.max_duration_ms = 300;
  auto chain = Chain(options);
  const std::string out = dir_.Join("long.wav");
  ChainResult result = chain.Render("<pause 400> Hi.", "en", 1.0, out);
  EXPECT_EQ(result.status, SynthesisStatus::kFailed);
  EXPECT_EQ(primary_->calls(), 0);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(TtsSynthesisChainTest, SpeechOverDurationLimitIsFailed) {
  ChainOptions options;
  options.max_duration_ms = 500;
  auto chain = Chain(options);
  primary_->set_rendered_ms(300);
  const std::string out = dir_.Join("long.wav");
  ChainResult result = chain.Render("One. <pause 100> Two.", "en", 1.0, out);
  EXPECT_EQ(result.status, SynthesisStatus::kFailed);
  EXPECT_EQ(primary_->calls(), 2);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(TtsSynthesisChainTest, BlankTextIsFailed) {
  auto chain = Chain();
  EXPECT_EQ(chain.Render("   ", "en", 1.0, dir_.Join("out.wav")).status,
            SynthesisStatus::kFailed);
  EXPECT_EQ(primary_->calls(), 0);
}

TEST_F(TtsSynthesisChainTest, ProbeAllListsBackendsInOrder) {
  secondary_->set_probe_result(false);
  auto chain = Chain();
  const auto probes = chain.ProbeAll();
  ASSERT_EQ(probes.size(), 2u);
  EXPECT_EQ(probes[0], std::make_pair(std::string("primary"), true));
  EXPECT_EQ(probes[1], std::make_pair(std::string("secondary"), false));
}

TEST(CommandSynthesisBackendTest, WordsPerMinuteScalesWithSpeed) {
  EXPECT_EQ(SpeedToWordsPerMinute(1.0), 175);
  EXPECT_EQ(SpeedToWordsPerMinute(2.0), 350);
}

TEST(CommandSynthesisBackendTest, MissingBinaryIsUnavailable) {
  CommandSynthesisBackend backend("ghost", "/nonexistent/mediahub-tts {output} {text}",
                                  std::chrono::milliseconds(2000));
  EXPECT_FALSE(backend.Probe());
  TempDir dir("mediahub_backend");
  EXPECT_EQ(backend.Synthesize(SynthesisRequest{"hi", "en", 1.0, dir.Join("out.wav")}),
            SynthesisStatus::kUnavailable);
}

TEST(CommandSynthesisBackendTest, ScriptWritesOutput) {
  TempDir dir("mediahub_backend");
  const std::string script =
      WriteScript(dir, "say.sh", "printf '%s|%s|%s' \"$2\" \"$3\" \"$4\" > \"$1\"");
  CommandSynthesisBackend backend("script", script + " {output} {text} {voice} {wpm}",
                                  std::chrono::milliseconds(5000));
  EXPECT_TRUE(backend.Probe());
  const std::string out = dir.Join("out.wav");
  EXPECT_EQ(backend.Synthesize(SynthesisRequest{"good morning", "en-us", 1.0, out}),
            SynthesisStatus::kSuccess);
  EXPECT_EQ(fs::file_size(out), std::string("good morning|en-us|175").size());
}

TEST(CommandSynthesisBackendTest, TextFilePlaceholderIsRemovedAfterwards) {
  TempDir dir("mediahub_backend");
  const std::string script = WriteScript(dir, "from_file.sh", "cat \"$1\" > \"$2\"");
  CommandSynthesisBackend backend("file", script + " {text_file} {output}",
                                  std::chrono::milliseconds(5000));
  const std::string out = dir.Join("out.wav");
  EXPECT_EQ(backend.Synthesize(SynthesisRequest{"from a file", "en", 1.0, out}),
            SynthesisStatus::kSuccess);
  EXPECT_EQ(fs::file_size(out), std::string("from a file").size());
  EXPECT_FALSE(fs::exists(out + ".txt"));
}

TEST(CommandSynthesisBackendTest, NonZeroExitOrNoOutputIsFailed) {
  TempDir dir("mediahub_backend");
  const std::string failing = WriteScript(dir, "fail.sh", "exit 3");
  CommandSynthesisBackend broken("broken", failing + " {output}", std::chrono::milliseconds(5000));
  EXPECT_EQ(broken.Synthesize(SynthesisRequest{"x", "en", 1.0, dir.Join("a.wav")}),
            SynthesisStatus::kFailed);

  const std::string silent = WriteScript(dir, "silent.sh", "exit 0");
  CommandSynthesisBackend lazy("lazy", silent + " {output}", std::chrono::milliseconds(5000));
  EXPECT_EQ(lazy.Synthesize(SynthesisRequest{"x", "en", 1.0, dir.Join("b.wav")}),
            SynthesisStatus::kFailed);
}

TEST(CommandSynthesisBackendTest, TimeoutIsFailed) {
  TempDir dir("mediahub_backend");
  const std::string slow = WriteScript(dir, "slow.sh", "sleep 10");
  CommandSynthesisBackend backend("slow", slow + " {output}", std::chrono::milliseconds(300));
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(backend.Synthesize(SynthesisRequest{"x", "en", 1.0, dir.Join("c.wav")}),
            SynthesisStatus::kFailed);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

}  // namespace
}  // namespace mediahub::tts
