// Repository: MediaHub
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; prevents multi-thread interleave.
// Copyright (c) 2026 MediaHub

#include "mediahub/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mediahub::util {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::kInfo;
std::ofstream Logger::mirror_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::GetLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

LogLevel Logger::ParseLevel(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "DEBUG") return LogLevel::kDebug;
  if (upper == "WARNING" || upper == "WARN") return LogLevel::kWarn;
  if (upper == "ERROR") return LogLevel::kError;
  return LogLevel::kInfo;
}

bool Logger::SetMirrorFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mirror_.is_open()) {
    mirror_.close();
  }
  if (path.empty()) return true;
  mirror_.open(path, std::ios::out | std::ios::app);
  return mirror_.is_open();
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

bool Logger::DebugEnabledLocked() {
  return level_ == LogLevel::kDebug || std::getenv("MEDIAHUB_DEBUG") != nullptr;
}

void Logger::MirrorLocked(const char* tag, const std::string& line) {
  if (!mirror_.is_open()) return;
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  mirror_ << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " " << tag << " "
          << line << '\n';
  mirror_.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level_ > LogLevel::kInfo) return;
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
  MirrorLocked("INFO", line);
}

void Logger::Debug(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!DebugEnabledLocked()) return;
  std::cout << line << '\n';
  std::cout.flush();
  MirrorLocked("DEBUG", line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level_ > LogLevel::kWarn) return;
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
  MirrorLocked("WARNING", line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
  MirrorLocked("ERROR", line);
}

}  // namespace mediahub::util
