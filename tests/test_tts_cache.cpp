// Repository: MediaHub
// Component: Speech cache tests

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include "mediahub/tts/TtsCache.h"
#include "test_utils/TempDir.hpp"

namespace mediahub::tts {
namespace {

using mediahub::tests::TempDir;

// Render function that writes a small artifact and counts its invocations.
struct CountingRenderer {
  int calls = 0;
  bool succeed = true;

  TtsCache::RenderFn Fn() {
    return [this](const std::string& path) {
      ++calls;
      if (!succeed) return false;
      std::ofstream out(path, std::ios::binary);
      out << "RIFF-ish";
      return static_cast<bool>(out);
    };
  }
};

TEST(TtsCacheTest, KeyDependsOnNormalizedTextVoiceAndSpeed) {
  const std::string base = TtsCache::MakeKey("Hello world", "en", 1.0);
  EXPECT_EQ(base.size(), 64u);
  EXPECT_EQ(base, TtsCache::MakeKey("  Hello   world ", "en", 1.0));
  EXPECT_EQ(base, TtsCache::MakeKey("Hello world", "en", 1.001));
  EXPECT_NE(base, TtsCache::MakeKey("Hello world", "de", 1.0));
  EXPECT_NE(base, TtsCache::MakeKey("Hello world", "en", 1.5));
  EXPECT_NE(base, TtsCache::MakeKey("hello world", "en", 1.0));
}

TEST(TtsCacheTest, SecondRequestIsAHitWithoutRendering) {
  TempDir dir("mediahub_tts_cache");
  TtsCache cache(dir.Join("cache"), 0);
  CountingRenderer renderer;

  auto first = cache.GetOrRender("Dinner is ready", "en", 1.0, renderer.Fn());
  ASSERT_TRUE(first.has_value());
  EXPECT_FALSE(first->hit);
  EXPECT_EQ(renderer.calls, 1);

  auto second = cache.GetOrRender("Dinner   is ready", "en", 1.0, renderer.Fn());
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->hit);
  EXPECT_EQ(second->path, first->path);
  EXPECT_EQ(renderer.calls, 1);
  EXPECT_EQ(cache.Size(), 1);
  EXPECT_EQ(cache.Lookup("Dinner is ready", "en", 1.0), first->path);
}

TEST(TtsCacheTest, FailedRenderLeavesNothingBehind) {
  TempDir dir("mediahub_tts_cache");
  TtsCache cache(dir.Join("cache"), 0);
  CountingRenderer renderer;
  renderer.succeed = false;

  EXPECT_FALSE(cache.GetOrRender("nope", "en", 1.0, renderer.Fn()).has_value());
  EXPECT_EQ(cache.Size(), 0);
  EXPECT_TRUE(std::filesystem::is_empty(dir.Join("cache")));
  EXPECT_FALSE(cache.Lookup("nope", "en", 1.0).has_value());
}

TEST(TtsCacheTest, EmptyArtifactIsAMiss) {
  TempDir dir("mediahub_tts_cache");
  TtsCache cache(dir.Join("cache"), 0);
  auto touch_only = [](const std::string& path) {
    std::ofstream out(path);
    return true;
  };
  EXPECT_FALSE(cache.GetOrRender("silent", "en", 1.0, touch_only).has_value());
  EXPECT_EQ(cache.Size(), 0);
}

TEST(TtsCacheTest, BoundEvictsOldestEntries) {
  TempDir dir("mediahub_tts_cache");
  TtsCache cache(dir.Join("cache"), 2);
  CountingRenderer renderer;

  auto a = cache.GetOrRender("a", "en", 1.0, renderer.Fn());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  auto b = cache.GetOrRender("b", "en", 1.0, renderer.Fn());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  auto c = cache.GetOrRender("c", "en", 1.0, renderer.Fn());
  ASSERT_TRUE(a && b && c);

  EXPECT_EQ(cache.Size(), 2);
  EXPECT_FALSE(cache.Lookup("a", "en", 1.0).has_value());
  EXPECT_TRUE(cache.Lookup("b", "en", 1.0).has_value());
  EXPECT_TRUE(cache.Lookup("c", "en", 1.0).has_value());
}

TEST(TtsCacheTest, ClearRemovesEntries) {
  TempDir dir("mediahub_tts_cache");
  TtsCache cache(dir.Join("cache"), 0);
  CountingRenderer renderer;
  cache.GetOrRender("one", "en", 1.0, renderer.Fn());
  cache.GetOrRender("two", "en", 1.0, renderer.Fn());

  util::DirectoryUsage usage = cache.Usage();
  EXPECT_EQ(usage.entry_count, 2);
  EXPECT_GT(usage.total_bytes, 0u);

  EXPECT_EQ(cache.Clear(), 2);
  EXPECT_EQ(cache.Size(), 0);
  auto again = cache.GetOrRender("one", "en", 1.0, renderer.Fn());
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(again->hit);
}

}  // namespace
}  // namespace mediahub::tts
