// Repository: MediaHub
// Component: Speech Text
// Purpose: Text preparation for synthesis: normalization, pause markers,
//          sentence chunking.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_TTS_SPEECH_TEXT_H_
#define MEDIAHUB_TTS_SPEECH_TEXT_H_

#include <string>
#include <vector>

namespace mediahub::tts {

struct SpeechToken {
  enum class Kind { kText, kPause };

  Kind kind = Kind::kText;
  std::string text;     // kText only, trimmed, never empty
  int pause_ms = 0;     // kPause only

  static SpeechToken Text(std::string text);
  static SpeechToken Pause(int pause_ms);

  bool operator==(const SpeechToken& other) const;
};

// Trims and collapses every whitespace run to a single space.
std::string NormalizeText(const std::string& text);

// Longest pause a single marker may request.
constexpr int kDefaultMaxPauseMs = 10000;

// Splits on "<pause N>" markers (N in milliseconds). Text between markers is
// normalized; segments that normalize to nothing are dropped. Adjacent pauses
// are kept as separate tokens, in order. N is clamped to max_pause_ms.
//
// "Hello. <pause 500> World." → [Text("Hello."), Pause(500), Text("World.")]
std::vector<SpeechToken> TokenizeSpeech(const std::string& text,
                                        int max_pause_ms = kDefaultMaxPauseMs);

// Groups sentences (ending in '.', '!' or '?' followed by whitespace or end of
// text) into chunks of at most `max_sentences` sentences. max_sentences <= 0
// returns the whole text as one chunk.
std::vector<std::string> SplitSentences(const std::string& text, int max_sentences);

}  // namespace mediahub::tts

#endif  // MEDIAHUB_TTS_SPEECH_TEXT_H_
