// Repository: MediaHub
// Component: Process Session Implementation
// Purpose: fork/exec child management with grace-then-kill stop protocol.
// Copyright (c) 2026 MediaHub

#include "mediahub/process/ProcessSession.h"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>

#include "mediahub/util/Logger.hpp"

namespace mediahub::process {

using mediahub::util::Logger;

const char* SessionStatusToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kStarting: return "Starting";
    case SessionStatus::kActive:   return "Active";
    case SessionStatus::kPaused:   return "Paused";
    case SessionStatus::kStopping: return "Stopping";
    case SessionStatus::kStopped:  return "Stopped";
  }
  return "Unknown";
}

const char* ExitReasonToString(ExitReason reason) {
  switch (reason) {
    case ExitReason::kNatural:   return "natural";
    case ExitReason::kRequested: return "requested";
  }
  return "unknown";
}

std::string DescribeExit(const ExitInfo& info) {
  std::string out = ExitReasonToString(info.reason);
  if (info.term_signal != 0) {
    out += " signal=" + std::to_string(info.term_signal);
  } else {
    out += " code=" + std::to_string(info.exit_code);
  }
  return out;
}

ProcessSession::ProcessSession(ProcessSpec spec) : spec_(std::move(spec)) {
  if (spec_.label.empty() && !spec_.argv.empty()) {
    spec_.label = spec_.argv.front();
  }
}

ProcessSession::~ProcessSession() {
  Stop(kDefaultGrace);
  if (reaper_thread_.joinable()) {
    if (std::this_thread::get_id() == reaper_thread_.get_id()) {
      reaper_thread_.detach();
    } else {
      reaper_thread_.join();
    }
  }
}

bool ProcessSession::Start(ExitCallback on_exit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    Logger::Warn("[ProcessSession] Start called twice for " + spec_.label);
    return false;
  }
  started_ = true;
  if (spec_.argv.empty()) {
    Logger::Error("[ProcessSession] empty argv");
    status_ = SessionStatus::kStopped;
    return false;
  }
  status_ = SessionStatus::kStarting;

  // Everything the child needs is prepared before fork(): between fork and
  // exec only async-signal-safe calls are allowed.
  std::vector<char*> c_args;
  c_args.reserve(spec_.argv.size() + 1);
  for (auto& arg : spec_.argv) {
    c_args.push_back(const_cast<char*>(arg.c_str()));
  }
  c_args.push_back(nullptr);

  const int dev_null = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (dev_null < 0) {
    Logger::Error("[ProcessSession] cannot open /dev/null: " +
                  std::string(std::strerror(errno)));
    status_ = SessionStatus::kStopped;
    return false;
  }
  const int child_stdin = spec_.stdin_fd >= 0 ? spec_.stdin_fd : dev_null;
  const int child_stdout = spec_.stdout_fd >= 0 ? spec_.stdout_fd : dev_null;
  const int child_stderr = spec_.inherit_stderr ? STDERR_FILENO : dev_null;

  // exec-status pipe: closed by a successful exec (O_CLOEXEC), or carries the
  // child's errno when execvp fails.
  int status_pipe[2];
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    Logger::Error("[ProcessSession] pipe2 failed: " + std::string(std::strerror(errno)));
    close(dev_null);
    status_ = SessionStatus::kStopped;
    return false;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    Logger::Error("[ProcessSession] fork failed: " + std::string(std::strerror(errno)));
    close(status_pipe[0]);
    close(status_pipe[1]);
    close(dev_null);
    status_ = SessionStatus::kStopped;
    return false;
  }

  if (pid == 0) {
    // Child
    signal(SIGPIPE, SIG_DFL);
    if (dup2(child_stdin, STDIN_FILENO) < 0 ||
        dup2(child_stdout, STDOUT_FILENO) < 0 ||
        dup2(child_stderr, STDERR_FILENO) < 0) {
      int err = errno;
      ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
      (void)ignored;
      _exit(127);
    }
    execvp(c_args[0], c_args.data());
    int err = errno;
    ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // Parent
  close(status_pipe[1]);
  close(dev_null);
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    // exec failed; reap the child synchronously.
    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {
    }
    spawn_errno_ = child_errno;
    status_ = SessionStatus::kStopped;
    Logger::Warn("[ProcessSession] cannot execute " + spec_.label + ": " +
                 std::strerror(child_errno));
    return false;
  }

  pid_ = pid;
  on_exit_ = std::move(on_exit);
  status_ = SessionStatus::kActive;
  reaper_thread_ = std::thread(&ProcessSession::ReaperLoop, this);
  Logger::Debug("[ProcessSession] started " + spec_.label + " (pid " +
                std::to_string(pid) + ")");
  return true;
}

void ProcessSession::ReaperLoop() {
  pid_t pid;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pid = pid_;
  }

  // Wait without reaping: the zombie keeps the pid reserved until the exit is
  // recorded below, so concurrent kill() calls can never hit a reused pid.
  siginfo_t info{};
  int rc;
  do {
    rc = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
  } while (rc < 0 && errno == EINTR);

  ExitCallback callback;
  ExitInfo exit_info;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    int wstatus = 0;
    pid_t reaped;
    do {
      reaped = waitpid(pid, &wstatus, 0);
    } while (reaped < 0 && errno == EINTR);

    if (reaped == pid && WIFSIGNALED(wstatus)) {
      exit_info_.term_signal = WTERMSIG(wstatus);
    } else if (reaped == pid && WIFEXITED(wstatus)) {
      exit_info_.exit_code = WEXITSTATUS(wstatus);
    } else {
      exit_info_.exit_code = -1;
    }
    exit_info_.reason = stop_requested_ ? ExitReason::kRequested : ExitReason::kNatural;
    exited_ = true;
    status_ = SessionStatus::kStopped;
    exit_info = exit_info_;
    callback = std::move(on_exit_);
    on_exit_ = nullptr;
  }
  exit_cv_.notify_all();

  Logger::Debug("[ProcessSession] " + spec_.label + " (pid " + std::to_string(pid) +
                ") exited: " + DescribeExit(exit_info));
  if (callback) {
    callback(exit_info);
  }
}

ExitInfo ProcessSession::Wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  exit_cv_.wait(lock, [this] { return exited_ || pid_ < 0; });
  return exit_info_;
}

bool ProcessSession::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return exit_cv_.wait_for(lock, timeout, [this] { return exited_ || pid_ < 0; });
}

bool ProcessSession::SignalLocked(int sig) {
  if (pid_ < 0 || exited_) return false;
  if (kill(pid_, sig) != 0) {
    Logger::Warn("[ProcessSession] kill(" + std::to_string(pid_) + ", " +
                 std::to_string(sig) + ") failed: " + std::strerror(errno));
    return false;
  }
  return true;
}

void ProcessSession::Stop(std::chrono::milliseconds grace) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (pid_ < 0 || exited_) {
    return;  // Never started, failed to start, or already ended.
  }
  const bool was_paused = status_ == SessionStatus::kPaused;
  if (!stop_requested_) {
    stop_requested_ = true;
    status_ = SessionStatus::kStopping;
    SignalLocked(SIGTERM);
    // A stopped process keeps SIGTERM pending until it is continued.
    if (was_paused) {
      SignalLocked(SIGCONT);
    }
  }

  if (exit_cv_.wait_for(lock, grace, [this] { return exited_; })) {
    return;
  }

  Logger::Warn("[ProcessSession] " + spec_.label + " (pid " + std::to_string(pid_) +
               ") ignored SIGTERM for " + std::to_string(grace.count()) +
               "ms, sending SIGKILL");
  SignalLocked(SIGKILL);
  if (!exit_cv_.wait_for(lock, kKillWait, [this] { return exited_; })) {
    Logger::Error("[ProcessSession] " + spec_.label + " (pid " + std::to_string(pid_) +
                  ") still alive after SIGKILL");
  }
}

bool ProcessSession::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_ != SessionStatus::kActive) return false;
  if (!SignalLocked(SIGSTOP)) return false;
  status_ = SessionStatus::kPaused;
  return true;
}

bool ProcessSession::Resume() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_ != SessionStatus::kPaused) return false;
  if (!SignalLocked(SIGCONT)) return false;
  status_ = SessionStatus::kActive;
  return true;
}

SessionStatus ProcessSession::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

std::string ProcessSession::Describe() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ < 0) return spec_.label;
  return spec_.label + " (pid " + std::to_string(pid_) + ")";
}

pid_t ProcessSession::pid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pid_;
}

int ProcessSession::spawn_errno() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spawn_errno_;
}

}  // namespace mediahub::process
