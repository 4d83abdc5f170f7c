// Repository: MediaHub
// Component: Playback Queue
// Purpose: Playlist traversal state machine (index, shuffle, repeat, bounded
//          skipping of unplayable entries).
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PLAYBACK_PLAYBACK_QUEUE_H_
#define MEDIAHUB_PLAYBACK_PLAYBACK_QUEUE_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "mediahub/playback/Track.h"

namespace mediahub::playback {

// PlaybackQueue: states Empty, Playing(index), Finished.
//
//   Load(non-empty)      any → Playing(0)   (shuffled once if shuffle is on)
//   Load(empty)/Clear()  any → Empty
//   AdvanceOnNaturalEnd  repeat && size 1      → Playing(index)
//                        index < size - 1      → Playing(index + 1)
//                        repeat                → Playing(0)
//                        otherwise             → Finished
//   Next()/Previous()    Playing|Finished → Playing((index ± 1) mod size);
//                        no-op on Empty. Independent of repeat.
//   SkipUnplayable()     Playing(index) → Playing((index + 1) mod size), until
//                        every entry has been skipped once in a row; then
//                        Finished.
//
// Invariant: index() is set iff the queue is non-empty, and then < size().
// Not thread-safe; the controller's executor owns it.
class PlaybackQueue {
 public:
  enum class State {
    kEmpty,
    kPlaying,
    kFinished,
  };

  PlaybackQueue();
  // Fixed seed for reproducible shuffles.
  explicit PlaybackQueue(uint32_t shuffle_seed);

  void Load(std::vector<Track> tracks);
  void Clear();

  // Returns true if the queue is Playing afterwards.
  bool AdvanceOnNaturalEnd();
  bool Next();
  bool Previous();

  // The current entry could not be played. Returns false once the skip run
  // has covered the whole queue (the queue is then Finished).
  bool SkipUnplayable();
  // A track played through to a clean end; ends the current skip run.
  void ResetSkipRun() { consecutive_skips_ = 0; }

  bool ToggleShuffle() { return shuffle_ = !shuffle_; }
  bool ToggleRepeat() { return repeat_ = !repeat_; }
  void set_shuffle(bool shuffle) { shuffle_ = shuffle; }
  void set_repeat(bool repeat) { repeat_ = repeat; }
  [[nodiscard]] bool shuffle() const { return shuffle_; }
  [[nodiscard]] bool repeat() const { return repeat_; }

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] size_t size() const { return tracks_.size(); }
  [[nodiscard]] bool empty() const { return tracks_.empty(); }
  [[nodiscard]] std::optional<size_t> index() const;
  // nullptr when Empty.
  [[nodiscard]] const Track* Current() const;
  [[nodiscard]] const std::vector<Track>& tracks() const { return tracks_; }
  [[nodiscard]] size_t consecutive_skips() const { return consecutive_skips_; }

 private:
  std::vector<Track> tracks_;
  size_t index_ = 0;
  State state_ = State::kEmpty;
  bool shuffle_ = false;
  bool repeat_ = false;
  size_t consecutive_skips_ = 0;
  std::mt19937 rng_;
};

const char* QueueStateToString(PlaybackQueue::State state);

}  // namespace mediahub::playback

#endif  // MEDIAHUB_PLAYBACK_PLAYBACK_QUEUE_H_
