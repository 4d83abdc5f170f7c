// Repository: MediaHub
// Component: Stream Pipeline Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/process/StreamPipeline.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mediahub/util/Logger.hpp"

namespace mediahub::process {

using mediahub::util::Logger;

namespace {

constexpr int kRelayPollMs = 100;
constexpr size_t kRelayBufferBytes = 64 * 1024;

std::once_flag g_ignore_sigpipe_once;

// A decoder that exits early must surface as EPIPE on the relay's write, not
// as a SIGPIPE that terminates the hub.
void IgnoreSigpipe() {
  std::call_once(g_ignore_sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

struct StreamPipelineExitRelay {
  std::mutex mutex;
  bool start_complete = false;
  std::optional<ExitInfo> pending;
  ExitCallback callback;
};

StreamPipeline::StreamPipeline(ProcessSpec fetcher, ProcessSpec decoder,
                               PipelineOptions options)
    : fetcher_spec_(std::move(fetcher)),
      decoder_spec_(std::move(decoder)),
      options_(options) {}

StreamPipeline::~StreamPipeline() {
  Stop(ProcessSession::kDefaultGrace);
  if (relay_thread_.joinable()) {
    relay_thread_.join();
  }
  CloseFds();
  // The decoder's exit callback locks mutex_; its reaper must be joined while
  // mutex_ is still alive.
  decoder_.reset();
  fetcher_.reset();
}

bool StreamPipeline::Start(ExitCallback on_exit) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
      Logger::Warn("[StreamPipeline] Start called twice");
      return false;
    }
    started_ = true;
  }
  IgnoreSigpipe();

  int fetch_pipe[2];
  int decode_pipe[2];
  if (pipe2(fetch_pipe, O_CLOEXEC) != 0) {
    Logger::Error("[StreamPipeline] pipe2 failed: " + std::string(std::strerror(errno)));
    return false;
  }
  if (pipe2(decode_pipe, O_CLOEXEC) != 0) {
    Logger::Error("[StreamPipeline] pipe2 failed: " + std::string(std::strerror(errno)));
    close(fetch_pipe[0]);
    close(fetch_pipe[1]);
    return false;
  }

  // The decoder's exit is the pipeline's exit, but it must not be reported
  // until the whole pipeline has started (a failed Start never calls back).
  auto exit_relay = std::make_shared<StreamPipelineExitRelay>();
  exit_relay->callback = std::move(on_exit);

  decoder_spec_.stdin_fd = decode_pipe[0];
  decoder_ = std::make_unique<ProcessSession>(decoder_spec_);
  const bool decoder_started = decoder_->Start([this, exit_relay](const ExitInfo& info) {
    ExitInfo forwarded = info;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_requested_) forwarded.reason = ExitReason::kRequested;
    }
    ExitCallback cb;
    {
      std::lock_guard<std::mutex> lock(exit_relay->mutex);
      if (!exit_relay->start_complete) {
        exit_relay->pending = forwarded;
        return;
      }
      cb = std::move(exit_relay->callback);
      exit_relay->callback = nullptr;
    }
    if (cb) cb(forwarded);
  });
  close(decode_pipe[0]);
  if (!decoder_started) {
    close(decode_pipe[1]);
    close(fetch_pipe[0]);
    close(fetch_pipe[1]);
    return false;
  }

  fetcher_spec_.stdout_fd = fetch_pipe[1];
  fetcher_ = std::make_unique<ProcessSession>(fetcher_spec_);
  const std::string fetcher_label = fetcher_spec_.label;
  const bool fetcher_started = fetcher_->Start([fetcher_label](const ExitInfo& info) {
    if (info.reason == ExitReason::kNatural && !info.Succeeded()) {
      Logger::Warn("[StreamPipeline] fetcher " + fetcher_label + " ended: " +
                   DescribeExit(info));
    } else {
      Logger::Debug("[StreamPipeline] fetcher " + fetcher_label + " ended: " +
                    DescribeExit(info));
    }
  });
  close(fetch_pipe[1]);
  if (!fetcher_started) {
    close(fetch_pipe[0]);
    close(decode_pipe[1]);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = true;
    }
    decoder_->Stop(ProcessSession::kDefaultGrace);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    fetch_read_fd_ = fetch_pipe[0];
    decode_write_fd_ = decode_pipe[1];
  }
  relay_thread_ = std::thread(&StreamPipeline::RelayLoop, this, fetch_pipe[0], decode_pipe[1]);

  ExitCallback early_cb;
  ExitInfo early_info;
  {
    std::lock_guard<std::mutex> lock(exit_relay->mutex);
    exit_relay->start_complete = true;
    if (exit_relay->pending) {
      early_info = *exit_relay->pending;
      early_cb = std::move(exit_relay->callback);
      exit_relay->callback = nullptr;
    }
  }
  if (early_cb) early_cb(early_info);

  Logger::Info("[StreamPipeline] started " + fetcher_->Describe() + " -> " +
               decoder_->Describe());
  return true;
}

void StreamPipeline::RelayLoop(int read_fd, int write_fd) {
  std::vector<char> buf(kRelayBufferBytes);
  auto last_activity = std::chrono::steady_clock::now();
  bool decoder_gone = false;

  while (!relay_cancel_.IsCancelled()) {
    if (paused_.load(std::memory_order_acquire)) {
      last_activity = std::chrono::steady_clock::now();
    }

    pollfd pfd{read_fd, POLLIN, 0};
    const int rc = poll(&pfd, 1, kRelayPollMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      Logger::Warn("[StreamPipeline] relay poll failed: " + std::string(std::strerror(errno)));
      break;
    }
    if (rc == 0) {
      const auto silent_for = std::chrono::steady_clock::now() - last_activity;
      if (!paused_.load(std::memory_order_acquire) && silent_for >= options_.stall_timeout) {
        stalled_.store(true, std::memory_order_release);
        Logger::Warn("[StreamPipeline] fetcher produced no data for " +
                     std::to_string(options_.stall_timeout.count()) +
                     "ms, closing stream");
        fetcher_->Stop(options_.fetcher_grace);
        break;
      }
      continue;
    }

    const ssize_t n = read(read_fd, buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      Logger::Warn("[StreamPipeline] relay read failed: " + std::string(std::strerror(errno)));
      break;
    }
    if (n == 0) {
      Logger::Debug("[StreamPipeline] fetcher closed its output");
      break;
    }

    size_t written = 0;
    while (written < static_cast<size_t>(n)) {
      const ssize_t w = write(write_fd, buf.data() + written, static_cast<size_t>(n) - written);
      if (w < 0) {
        if (errno == EINTR) continue;
        if (errno != EPIPE) {
          Logger::Warn("[StreamPipeline] relay write failed: " +
                       std::string(std::strerror(errno)));
        }
        decoder_gone = true;
        break;
      }
      written += static_cast<size_t>(w);
    }
    bytes_relayed_.fetch_add(written, std::memory_order_acq_rel);
    last_activity = std::chrono::steady_clock::now();
    if (decoder_gone) break;
  }

  // Closing the decoder's input lets it drain and end naturally; closing the
  // fetcher's output makes a still-running fetcher fail its next write.
  std::lock_guard<std::mutex> lock(mutex_);
  if (decode_write_fd_ >= 0) {
    close(decode_write_fd_);
    decode_write_fd_ = -1;
  }
  if (fetch_read_fd_ >= 0) {
    close(fetch_read_fd_);
    fetch_read_fd_ = -1;
  }
}

void StreamPipeline::CloseFds() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (decode_write_fd_ >= 0) {
    close(decode_write_fd_);
    decode_write_fd_ = -1;
  }
  if (fetch_read_fd_ >= 0) {
    close(fetch_read_fd_);
    fetch_read_fd_ = -1;
  }
}

ExitInfo StreamPipeline::Wait() {
  if (!decoder_) return ExitInfo{};
  ExitInfo info = decoder_->Wait();
  std::lock_guard<std::mutex> lock(mutex_);
  if (stop_requested_) info.reason = ExitReason::kRequested;
  return info;
}

void StreamPipeline::Stop(std::chrono::milliseconds grace) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) return;
    stop_requested_ = true;
  }
  // Decoder first: a fetcher that outlives its consumer only produces
  // broken-pipe noise.
  if (decoder_) decoder_->Stop(grace);
  if (fetcher_) fetcher_->Stop(grace);
  relay_cancel_.Cancel();
  if (relay_thread_.joinable() && std::this_thread::get_id() != relay_thread_.get_id()) {
    relay_thread_.join();
  }
  paused_.store(false, std::memory_order_release);
}

bool StreamPipeline::Pause() {
  if (!decoder_ || !decoder_->Pause()) return false;
  paused_.store(true, std::memory_order_release);
  return true;
}

bool StreamPipeline::Resume() {
  if (!decoder_ || !decoder_->Resume()) return false;
  paused_.store(false, std::memory_order_release);
  return true;
}

SessionStatus StreamPipeline::status() const {
  if (!decoder_) return SessionStatus::kStopped;
  return decoder_->status();
}

std::string StreamPipeline::Describe() const {
  std::string out = fetcher_ ? fetcher_->Describe() : fetcher_spec_.label;
  out += " | ";
  out += decoder_ ? decoder_->Describe() : decoder_spec_.label;
  return out;
}

}  // namespace mediahub::process
