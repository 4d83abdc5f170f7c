// Repository: MediaHub
// Component: Speech Text
// Copyright (c) 2026 MediaHub

#include "mediahub/tts/SpeechText.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <regex>

#include "mediahub/util/Logger.hpp"

namespace mediahub::tts {

using mediahub::util::Logger;

SpeechToken SpeechToken::Text(std::string text) {
  SpeechToken token;
  token.kind = Kind::kText;
  token.text = std::move(text);
  return token;
}

SpeechToken SpeechToken::Pause(int pause_ms) {
  SpeechToken token;
  token.kind = Kind::kPause;
  token.pause_ms = pause_ms;
  return token;
}

bool SpeechToken::operator==(const SpeechToken& other) const {
  return kind == other.kind && text == other.text && pause_ms == other.pause_ms;
}

std::string NormalizeText(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(c));
  }
  return out;
}

std::vector<SpeechToken> TokenizeSpeech(const std::string& text, int max_pause_ms) {
  static const std::regex kPauseMarker(R"(<pause\s+(\d+)\s*>)", std::regex::icase);

  std::vector<SpeechToken> tokens;
  auto emit_text = [&tokens](const std::string& raw) {
    std::string segment = NormalizeText(raw);
    if (!segment.empty()) tokens.push_back(SpeechToken::Text(std::move(segment)));
  };

  auto begin = std::sregex_iterator(text.begin(), text.end(), kPauseMarker);
  const auto end = std::sregex_iterator();
  size_t consumed = 0;
  for (auto it = begin; it != end; ++it) {
    const std::smatch& match = *it;
    emit_text(text.substr(consumed, static_cast<size_t>(match.position(0)) - consumed));
    const std::string digits = match[1].str();
    const long long requested = digits.size() > 9 ? INT_MAX : std::stoll(digits);
    const long long limit = std::max(max_pause_ms, 0);
    if (requested > limit) {
      Logger::Warn("[SpeechText] Pause of " + digits + "ms clamped to " +
                   std::to_string(limit) + "ms");
    }
    tokens.push_back(SpeechToken::Pause(static_cast<int>(std::min(requested, limit))));
    consumed = static_cast<size_t>(match.position(0) + match.length(0));
  }
  emit_text(text.substr(consumed));
  return tokens;
}

std::vector<std::string> SplitSentences(const std::string& text, int max_sentences) {
  const std::string normalized = NormalizeText(text);
  if (normalized.empty()) return {};
  if (max_sentences <= 0) return {normalized};

  std::vector<std::string> sentences;
  size_t start = 0;
  for (size_t i = 0; i < normalized.size(); ++i) {
    const char c = normalized[i];
    if (c != '.' && c != '!' && c != '?') continue;
    // Swallow runs like "?!" or "...".
    while (i + 1 < normalized.size() &&
           (normalized[i + 1] == '.' || normalized[i + 1] == '!' || normalized[i + 1] == '?')) {
      ++i;
    }
    if (i + 1 == normalized.size() || normalized[i + 1] == ' ') {
      sentences.push_back(normalized.substr(start, i + 1 - start));
      start = i + 2;
    }
  }
  if (start < normalized.size()) {
    sentences.push_back(normalized.substr(start));
  }

  std::vector<std::string> chunks;
  std::string current;
  int count = 0;
  for (const auto& sentence : sentences) {
    if (count == max_sentences) {
      chunks.push_back(std::move(current));
      current.clear();
      count = 0;
    }
    if (!current.empty()) current.push_back(' ');
    current += sentence;
    ++count;
  }
  if (!current.empty()) chunks.push_back(std::move(current));
  return chunks;
}

}  // namespace mediahub::tts
