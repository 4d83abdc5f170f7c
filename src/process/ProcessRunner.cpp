// Repository: MediaHub
// Component: Process Runner
// Copyright (c) 2026 MediaHub

#include "mediahub/process/ProcessRunner.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "mediahub/process/CommandTemplate.h"
#include "mediahub/process/ProcessSession.h"
#include "mediahub/util/Logger.hpp"

namespace mediahub::process {

using mediahub::util::Logger;

namespace {

constexpr int kPollIntervalMs = 100;

}  // namespace

RunResult RunProcess(const std::vector<std::string>& argv,
                     const RunOptions& options,
                     const util::CancellationToken& token) {
  RunResult result;

  int out_pipe[2] = {-1, -1};
  if (options.capture_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) {
    Logger::Error("[ProcessRunner] pipe2 failed: " + std::string(std::strerror(errno)));
    return result;
  }

  ProcessSpec spec;
  spec.argv = argv;
  spec.stdout_fd = out_pipe[1];
  ProcessSession session(spec);

  result.spawned = session.Start(nullptr);
  if (out_pipe[1] >= 0) {
    close(out_pipe[1]);  // The child holds its own copy.
  }
  if (!result.spawned) {
    result.spawn_errno = session.spawn_errno();
    if (out_pipe[0] >= 0) close(out_pipe[0]);
    return result;
  }

  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  bool stop_now = false;

  if (out_pipe[0] >= 0) {
    char buf[4096];
    while (true) {
      if (token.IsCancelled()) {
        result.cancelled = true;
        stop_now = true;
        break;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        result.timed_out = true;
        stop_now = true;
        break;
      }
      pollfd pfd{out_pipe[0], POLLIN, 0};
      const int rc = poll(&pfd, 1, kPollIntervalMs);
      if (rc < 0) {
        if (errno == EINTR) continue;
        Logger::Warn("[ProcessRunner] poll failed: " + std::string(std::strerror(errno)));
        break;
      }
      if (rc == 0) continue;
      const ssize_t n = read(out_pipe[0], buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        break;
      }
      if (n == 0) break;  // EOF: child closed stdout
      if (result.stdout_text.size() < options.max_capture_bytes) {
        result.stdout_text.append(buf, static_cast<size_t>(n));
      }
    }
    close(out_pipe[0]);
  }

  // stdout closed; the process may still be finishing.
  while (!stop_now && !session.WaitFor(std::chrono::milliseconds(kPollIntervalMs))) {
    if (token.IsCancelled()) {
      result.cancelled = true;
      stop_now = true;
    } else if (std::chrono::steady_clock::now() >= deadline) {
      result.timed_out = true;
      stop_now = true;
    }
  }

  if (stop_now) {
    Logger::Warn("[ProcessRunner] " + JoinArgv(argv) +
                 (result.timed_out ? " timed out after " +
                                         std::to_string(options.timeout.count()) + "ms"
                                   : std::string(" cancelled")));
    session.Stop(options.stop_grace);
  }
  result.exit = session.Wait();
  return result;
}

}  // namespace mediahub::process
