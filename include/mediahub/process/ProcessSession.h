// Repository: MediaHub
// Component: Process Session
// Purpose: Owns one spawned external process: start, graceful stop with
//          forced-kill escalation, suspend/continue, natural-exit detection.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PROCESS_PROCESS_SESSION_H_
#define MEDIAHUB_PROCESS_PROCESS_SESSION_H_

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mediahub/process/ISession.h"

namespace mediahub::process {

// ProcessSpec describes how to launch one process. argv[0] is looked up on
// PATH. File descriptors are borrowed: the session dup2()s them into the child
// and never closes them in the parent.
struct ProcessSpec {
  std::vector<std::string> argv;
  int stdin_fd = -1;   // -1: /dev/null
  int stdout_fd = -1;  // -1: /dev/null
  bool inherit_stderr = false;  // false: /dev/null
  std::string label;   // For logs; defaults to argv[0]
};

// ProcessSession wraps a single child process.
//
// Exit detection: a dedicated reaper thread blocks in waitid(WNOWAIT) so the
// child stays a zombie (its pid cannot be reused) until the reaper has
// recorded the exit under the session mutex. Signals are only ever sent while
// the child is known not to be reaped.
//
// Thread Safety: all public methods are thread-safe.
class ProcessSession : public ISession {
 public:
  // Default grace used by the destructor when the session is still live.
  static constexpr std::chrono::milliseconds kDefaultGrace{500};
  // How long to wait for the kernel to deliver SIGKILL before giving up.
  static constexpr std::chrono::milliseconds kKillWait{2000};

  explicit ProcessSession(ProcessSpec spec);
  ~ProcessSession() override;

  ProcessSession(const ProcessSession&) = delete;
  ProcessSession& operator=(const ProcessSession&) = delete;

  bool Start(ExitCallback on_exit) override;
  ExitInfo Wait() override;
  void Stop(std::chrono::milliseconds grace) override;
  bool Pause() override;
  bool Resume() override;
  SessionStatus status() const override;
  std::string Describe() const override;

  // Waits up to `timeout` for the process to end. Returns true if it ended.
  bool WaitFor(std::chrono::milliseconds timeout);

  // pid of the child, or -1 before Start() / after a failed Start().
  pid_t pid() const;

  // errno reported by the child when execvp failed (0 otherwise).
  int spawn_errno() const;

 private:
  void ReaperLoop();
  // Requires mutex_ held; returns false if the child is already reaped.
  bool SignalLocked(int sig);

  ProcessSpec spec_;

  mutable std::mutex mutex_;
  std::condition_variable exit_cv_;
  SessionStatus status_ = SessionStatus::kStopped;
  pid_t pid_ = -1;
  bool started_ = false;
  bool exited_ = false;
  bool stop_requested_ = false;
  int spawn_errno_ = 0;
  ExitInfo exit_info_;
  ExitCallback on_exit_;
  std::thread reaper_thread_;
};

}  // namespace mediahub::process

#endif  // MEDIAHUB_PROCESS_PROCESS_SESSION_H_
