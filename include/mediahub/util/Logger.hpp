// Repository: MediaHub
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; prevents multi-thread interleave.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_UTIL_LOGGER_HPP_
#define MEDIAHUB_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace mediahub::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, guaranteeing no interleave between concurrent threads
// (command executor, process reapers, stream relay, gRPC handlers).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when MEDIAHUB_DEBUG env is set or level is kDebug
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failed operations, exhausted fallbacks)
//
// Every emitted line is also appended to the mirror file when one is set.
//
// Test-only: Set*Sink installs a callback invoked for every line of that
// level (in addition to the console). Used by tests to assert that a failure
// was logged instead of raised.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Lines below `level` are dropped (sinks included).
  static void SetLevel(LogLevel level);
  static LogLevel GetLevel();

  // Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (case-insensitive).
  // Unrecognized names map to kInfo.
  static LogLevel ParseLevel(const std::string& name);

  // Opens `path` for append and mirrors every emitted line into it.
  // Returns false (and keeps console-only logging) if the file cannot be opened.
  // Empty path closes the mirror.
  static bool SetMirrorFile(const std::string& path);

  // Test-only: call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static bool DebugEnabledLocked();
  static void MirrorLocked(const char* tag, const std::string& line);

  static std::mutex mutex_;
  static LogLevel level_;
  static std::ofstream mirror_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace mediahub::util

#endif  // MEDIAHUB_UTIL_LOGGER_HPP_
