// Repository: MediaHub
// Component: Process Runner
// Purpose: Run-to-completion helper for short-lived commands (remote catalog
//          lookups, speech synthesis) with a bounded timeout and cooperative
//          cancellation.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PROCESS_PROCESS_RUNNER_H_
#define MEDIAHUB_PROCESS_PROCESS_RUNNER_H_

#include <chrono>
#include <string>
#include <vector>

#include "mediahub/process/ISession.h"
#include "mediahub/util/CancellationToken.hpp"

namespace mediahub::process {

struct RunOptions {
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds stop_grace{500};
  bool capture_stdout = true;
  // Output beyond this many bytes is read and discarded.
  size_t max_capture_bytes = 1 << 20;
};

struct RunResult {
  bool spawned = false;   // false: binary absent / not executable
  int spawn_errno = 0;
  bool timed_out = false;
  bool cancelled = false;
  ExitInfo exit;
  std::string stdout_text;

  // Spawned, ran to completion, exit code 0.
  bool Succeeded() const {
    return spawned && !timed_out && !cancelled && exit.Succeeded();
  }
};

// Runs argv to completion. On timeout or cancellation the process is stopped
// with the grace-then-kill protocol and the partial output is returned.
RunResult RunProcess(const std::vector<std::string>& argv,
                     const RunOptions& options,
                     const util::CancellationToken& token = util::CancellationToken());

}  // namespace mediahub::process

#endif  // MEDIAHUB_PROCESS_PROCESS_RUNNER_H_
