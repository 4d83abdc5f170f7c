// Repository: MediaHub
// Component: StreamPipeline tests
// Purpose: Fetcher → relay → decoder wiring, teardown order and the stall
//          watchdog, using POSIX tools as stand-in fetchers and decoders.

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mediahub/process/StreamPipeline.h"
#include "test_utils/TempDir.hpp"

namespace mediahub::process {
namespace {

using mediahub::tests::TempDir;
using mediahub::tests::WaitUntil;

ProcessSpec Cmd(std::vector<std::string> argv) {
  ProcessSpec spec;
  spec.argv = std::move(argv);
  return spec;
}

std::string ReadAll(const std::string& path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class StreamPipelineTest : public ::testing::Test {
 protected:
  ExitCallback Record() {
    return [this](const ExitInfo& info) {
      std::lock_guard<std::mutex> lock(mutex_);
      exits_.push_back(info);
    };
  }
  size_t exit_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return exits_.size();
  }
  ExitInfo first_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return exits_.front();
  }

  TempDir dir_{"mediahub_pipeline"};
  std::mutex mutex_;
  std::vector<ExitInfo> exits_;
};

TEST_F(StreamPipelineTest, RelaysFetcherOutputToDecoder) {
  const std::string out = dir_.Join("decoded.bin");
  StreamPipeline pipeline(Cmd({"printf", "stream-bytes"}),
                          Cmd({"/bin/sh", "-c", "cat > " + out}), PipelineOptions{});
  ASSERT_TRUE(pipeline.Start(Record()));
  const ExitInfo info = pipeline.Wait();
  EXPECT_EQ(info.reason, ExitReason::kNatural);
  EXPECT_TRUE(info.Succeeded());
  EXPECT_EQ(ReadAll(out), "stream-bytes");
  ASSERT_TRUE(WaitUntil([&] { return exit_count() == 1; }, 5000));
  EXPECT_TRUE(first_exit().Succeeded());
  EXPECT_EQ(pipeline.bytes_relayed(), 12u);
  EXPECT_FALSE(pipeline.stalled());
}

TEST_F(StreamPipelineTest, StopReportsRequestedExitOnce) {
  StreamPipeline pipeline(Cmd({"yes"}), Cmd({"/bin/sh", "-c", "cat > /dev/null"}),
                          PipelineOptions{});
  ASSERT_TRUE(pipeline.Start(Record()));
  EXPECT_EQ(pipeline.status(), SessionStatus::kActive);

  pipeline.Stop(std::chrono::milliseconds(1000));
  EXPECT_EQ(pipeline.Wait().reason, ExitReason::kRequested);
  ASSERT_TRUE(WaitUntil([&] { return exit_count() == 1; }, 5000));
  EXPECT_EQ(first_exit().reason, ExitReason::kRequested);

  pipeline.Stop(std::chrono::milliseconds(10));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(exit_count(), 1u);
}

TEST_F(StreamPipelineTest, StopTearsDownDecoderBeforeFetcher) {
  const std::string order = dir_.Join("teardown.log");
  auto logs_on_term = [&order](const std::string& name) {
    return Cmd({"/bin/sh", "-c",
                "trap 'echo " + name + " >> " + order + "; exit 0' TERM; "
                "while :; do sleep 0.05; done"});
  };
  StreamPipeline pipeline(logs_on_term("fetcher"), logs_on_term("decoder"), PipelineOptions{});
  ASSERT_TRUE(pipeline.Start(Record()));
  // Both shells need to reach their trap before the stop.
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  pipeline.Stop(std::chrono::milliseconds(2000));
  EXPECT_EQ(pipeline.Wait().reason, ExitReason::kRequested);
  EXPECT_EQ(ReadAll(order), "decoder\nfetcher\n");
}

TEST_F(StreamPipelineTest, DestroyWhileDecoderIsExiting) {
  for (int i = 0; i < 20; ++i) {
    std::atomic<int> exits{0};
    {
      StreamPipeline pipeline(Cmd({"printf", "x"}), Cmd({"true"}), PipelineOptions{});
      ASSERT_TRUE(pipeline.Start([&exits](const ExitInfo&) { exits++; }));
    }
    EXPECT_LE(exits.load(), 1);
  }
}

TEST_F(StreamPipelineTest, SilentFetcherIsTreatedAsStall) {
  PipelineOptions options;
  options.stall_timeout = std::chrono::milliseconds(300);
  options.fetcher_grace = std::chrono::milliseconds(500);
  StreamPipeline pipeline(Cmd({"sleep", "30"}), Cmd({"/bin/sh", "-c", "cat > /dev/null"}),
                          options);
  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(pipeline.Start(Record()));
  // The decoder sees end of input and ends on its own.
  const ExitInfo info = pipeline.Wait();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  EXPECT_EQ(info.reason, ExitReason::kNatural);
  EXPECT_TRUE(pipeline.stalled());
}

TEST_F(StreamPipelineTest, PausedPipelineDoesNotStall) {
  PipelineOptions options;
  options.stall_timeout = std::chrono::milliseconds(200);
  StreamPipeline pipeline(Cmd({"sleep", "30"}), Cmd({"/bin/sh", "-c", "cat > /dev/null"}),
                          options);
  ASSERT_TRUE(pipeline.Start(Record()));
  ASSERT_TRUE(pipeline.Pause());
  EXPECT_EQ(pipeline.status(), SessionStatus::kPaused);
  std::this_thread::sleep_for(std::chrono::milliseconds(600));
  EXPECT_FALSE(pipeline.stalled());
  EXPECT_EQ(exit_count(), 0u);
  ASSERT_TRUE(pipeline.Resume());
  EXPECT_EQ(pipeline.status(), SessionStatus::kActive);
  pipeline.Stop(std::chrono::milliseconds(500));
}

TEST_F(StreamPipelineTest, DecoderFailureIsThePipelineExit) {
  StreamPipeline pipeline(Cmd({"yes"}), Cmd({"/bin/sh", "-c", "exit 4"}), PipelineOptions{});
  ASSERT_TRUE(pipeline.Start(Record()));
  const ExitInfo info = pipeline.Wait();
  EXPECT_EQ(info.reason, ExitReason::kNatural);
  EXPECT_EQ(info.exit_code, 4);
  ASSERT_TRUE(WaitUntil([&] { return exit_count() == 1; }, 5000));
  EXPECT_EQ(first_exit().exit_code, 4);
}

TEST_F(StreamPipelineTest, MissingDecoderFailsStart) {
  StreamPipeline pipeline(Cmd({"yes"}), Cmd({"mediahub-no-such-decoder"}), PipelineOptions{});
  EXPECT_FALSE(pipeline.Start(Record()));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(exit_count(), 0u);
}

TEST_F(StreamPipelineTest, MissingFetcherFailsStartAndStopsDecoder) {
  StreamPipeline pipeline(Cmd({"mediahub-no-such-fetcher"}),
                          Cmd({"/bin/sh", "-c", "cat > /dev/null"}), PipelineOptions{});
  EXPECT_FALSE(pipeline.Start(Record()));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(exit_count(), 0u);
  EXPECT_EQ(pipeline.status(), SessionStatus::kStopped);
}

}  // namespace
}  // namespace mediahub::process
