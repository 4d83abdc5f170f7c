// Repository: MediaHub
// Component: Serial Executor Implementation
// Copyright (c) 2026 MediaHub

#include "mediahub/util/SerialExecutor.hpp"

#include <exception>

#include "mediahub/util/Logger.hpp"

namespace mediahub::util {

SerialExecutor::SerialExecutor(std::string name) : name_(std::move(name)) {
  worker_thread_ = std::thread(&SerialExecutor::WorkerLoop, this);
}

SerialExecutor::~SerialExecutor() { Shutdown(); }

bool SerialExecutor::Post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return false;
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
  return true;
}

bool SerialExecutor::IsWorkerThread() const {
  return std::this_thread::get_id() == worker_thread_.get_id();
}

void SerialExecutor::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  work_cv_.notify_all();
  if (worker_thread_.joinable() && !IsWorkerThread()) {
    worker_thread_.join();
  }
}

void SerialExecutor::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;  // shutdown_ with nothing left to drain
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      task();
    } catch (const std::exception& e) {
      Logger::Error("[SerialExecutor:" + name_ + "] task threw: " + e.what());
    }
  }
}

}  // namespace mediahub::util
