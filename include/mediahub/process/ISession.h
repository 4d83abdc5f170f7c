// Repository: MediaHub
// Component: Session Interface
// Purpose: Minimal lifecycle contract shared by single-process sessions and
//          fetcher→decoder stream pipelines.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PROCESS_ISESSION_H_
#define MEDIAHUB_PROCESS_ISESSION_H_

#include <chrono>
#include <functional>
#include <string>

namespace mediahub::process {

enum class SessionStatus {
  kStarting,
  kActive,
  kPaused,
  kStopping,
  kStopped,
};

// Natural: the process ended on its own (end of track, decode error).
// Requested: the process ended after Stop() was called.
enum class ExitReason {
  kNatural,
  kRequested,
};

struct ExitInfo {
  ExitReason reason = ExitReason::kNatural;
  int exit_code = 0;    // Valid when term_signal == 0
  int term_signal = 0;  // Non-zero when the process was killed by a signal

  bool Succeeded() const { return term_signal == 0 && exit_code == 0; }
};

// Invoked exactly once, from a background thread, when the session ends.
using ExitCallback = std::function<void(const ExitInfo&)>;

const char* SessionStatusToString(SessionStatus status);
const char* ExitReasonToString(ExitReason reason);
std::string DescribeExit(const ExitInfo& info);

// ISession is the lifecycle contract the controller relies on.
//
// Lifecycle: Start() once; Stop() any number of times (idempotent, including
// on a session that never started or already ended). The exit callback fires
// once whether the end was natural or requested.
class ISession {
 public:
  virtual ~ISession() = default;

  // Launches the underlying process(es). Returns false if a required process
  // could not be executed; in that case the callback never fires and the
  // session is kStopped.
  virtual bool Start(ExitCallback on_exit) = 0;

  // Blocks until the session has ended. Must only be called after a
  // successful Start().
  virtual ExitInfo Wait() = 0;

  // Graceful-terminate, wait up to `grace`, then force-kill.
  virtual void Stop(std::chrono::milliseconds grace) = 0;

  // Suspend/continue output. Returns false if the session is not in a state
  // that allows it (only kActive → kPaused and kPaused → kActive).
  virtual bool Pause() = 0;
  virtual bool Resume() = 0;

  virtual SessionStatus status() const = 0;

  // Short human-readable description for logs ("mpg123 (pid 123)").
  virtual std::string Describe() const = 0;
};

}  // namespace mediahub::process

#endif  // MEDIAHUB_PROCESS_ISESSION_H_
