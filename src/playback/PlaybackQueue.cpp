// Repository: MediaHub
// Component: Playback Queue Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/playback/PlaybackQueue.h"

#include <algorithm>

namespace mediahub::playback {

const char* QueueStateToString(PlaybackQueue::State state) {
  switch (state) {
    case PlaybackQueue::State::kEmpty:
      return "empty";
    case PlaybackQueue::State::kPlaying:
      return "playing";
    case PlaybackQueue::State::kFinished:
      return "finished";
  }
  return "unknown";
}

PlaybackQueue::PlaybackQueue() : rng_(std::random_device{}()) {}

PlaybackQueue::PlaybackQueue(uint32_t shuffle_seed) : rng_(shuffle_seed) {}

void PlaybackQueue::Load(std::vector<Track> tracks) {
  tracks_ = std::move(tracks);
  index_ = 0;
  consecutive_skips_ = 0;
  if (tracks_.empty()) {
    state_ = State::kEmpty;
    return;
  }
  if (shuffle_) {
    std::shuffle(tracks_.begin(), tracks_.end(), rng_);
  }
  state_ = State::kPlaying;
}

void PlaybackQueue::Clear() {
  tracks_.clear();
  index_ = 0;
  consecutive_skips_ = 0;
  state_ = State::kEmpty;
}

bool PlaybackQueue::AdvanceOnNaturalEnd() {
  if (tracks_.empty() || state_ != State::kPlaying) return false;
  const size_t length = tracks_.size();
  if (repeat_ && length == 1) {
    return true;
  }
  if (index_ + 1 < length) {
    ++index_;
    return true;
  }
  if (repeat_) {
    index_ = 0;
    return true;
  }
  state_ = State::kFinished;
  return false;
}

bool PlaybackQueue::Next() {
  if (tracks_.empty()) return false;
  index_ = (index_ + 1) % tracks_.size();
  consecutive_skips_ = 0;
  state_ = State::kPlaying;
  return true;
}

bool PlaybackQueue::Previous() {
  if (tracks_.empty()) return false;
  index_ = (index_ + tracks_.size() - 1) % tracks_.size();
  consecutive_skips_ = 0;
  state_ = State::kPlaying;
  return true;
}

bool PlaybackQueue::SkipUnplayable() {
  if (tracks_.empty() || state_ != State::kPlaying) return false;
  ++consecutive_skips_;
  if (consecutive_skips_ >= tracks_.size()) {
    state_ = State::kFinished;
    return false;
  }
  index_ = (index_ + 1) % tracks_.size();
  return true;
}

std::optional<size_t> PlaybackQueue::index() const {
  if (tracks_.empty()) return std::nullopt;
  return index_;
}

const Track* PlaybackQueue::Current() const {
  if (tracks_.empty()) return nullptr;
  return &tracks_[index_];
}

}  // namespace mediahub::playback
