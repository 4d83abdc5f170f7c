// Repository: MediaHub
// Component: Stream Pipeline
// Purpose: Fetcher process → relay → decoder process, with joint teardown
//          ordering and a stall watchdog on the fetcher side.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PROCESS_STREAM_PIPELINE_H_
#define MEDIAHUB_PROCESS_STREAM_PIPELINE_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "mediahub/process/ISession.h"
#include "mediahub/process/ProcessSession.h"
#include "mediahub/util/CancellationToken.hpp"

namespace mediahub::process {

struct PipelineOptions {
  // Fetcher silence (no bytes read while not paused) that counts as a stall.
  std::chrono::milliseconds stall_timeout{20000};
  // Grace used when the relay tears down a stalled fetcher.
  std::chrono::milliseconds fetcher_grace{1000};
};

// StreamPipeline composes a fetcher and a decoder ProcessSession.
//
// Data path: fetcher stdout → relay thread → decoder stdin. Relaying in-process
// (rather than handing the fetcher's pipe straight to the decoder) lets the
// pipeline notice a fetcher that stops producing bytes.
//
// Lifecycle:
// - Wait() / the exit callback track the decoder only. The fetcher's exit is
//   logged; when it ends, the relay closes the decoder's input so the decoder
//   drains what it has and ends naturally.
// - Stop() stops the decoder first, then the fetcher, each with its own
//   grace-then-kill escalation.
// - Pause()/Resume() suspend the decoder only. The fetcher keeps running until
//   the pipe fills; the stall watchdog is frozen while paused.
class StreamPipeline : public ISession {
 public:
  StreamPipeline(ProcessSpec fetcher, ProcessSpec decoder, PipelineOptions options);
  ~StreamPipeline() override;

  StreamPipeline(const StreamPipeline&) = delete;
  StreamPipeline& operator=(const StreamPipeline&) = delete;

  bool Start(ExitCallback on_exit) override;
  ExitInfo Wait() override;
  void Stop(std::chrono::milliseconds grace) override;
  bool Pause() override;
  bool Resume() override;
  SessionStatus status() const override;
  std::string Describe() const override;

  // True once the relay gave up on a silent fetcher.
  bool stalled() const { return stalled_.load(std::memory_order_acquire); }

  // Total bytes relayed from fetcher to decoder.
  uint64_t bytes_relayed() const { return bytes_relayed_.load(std::memory_order_acquire); }

 private:
  void RelayLoop(int read_fd, int write_fd);
  void CloseFds();

  ProcessSpec fetcher_spec_;
  ProcessSpec decoder_spec_;
  PipelineOptions options_;

  std::unique_ptr<ProcessSession> fetcher_;
  std::unique_ptr<ProcessSession> decoder_;

  std::mutex mutex_;
  bool started_ = false;
  bool stop_requested_ = false;
  int fetch_read_fd_ = -1;
  int decode_write_fd_ = -1;

  util::CancellationToken relay_cancel_;
  std::thread relay_thread_;
  std::atomic<bool> paused_{false};
  std::atomic<bool> stalled_{false};
  std::atomic<uint64_t> bytes_relayed_{0};
};

}  // namespace mediahub::process

#endif  // MEDIAHUB_PROCESS_STREAM_PIPELINE_H_
