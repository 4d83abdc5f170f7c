// Repository: MediaHub
// Component: Serial Executor
// Purpose: Single worker thread that runs submitted tasks one at a time, in
//          submission order. Owns all mutation of playback state.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_UTIL_SERIAL_EXECUTOR_HPP_
#define MEDIAHUB_UTIL_SERIAL_EXECUTOR_HPP_

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace mediahub::util {

// SerialExecutor: persistent worker thread draining a FIFO task queue.
//
// Submit() returns a future for the task's result; Post() is fire-and-forget
// and never blocks, so it is safe to call from process reaper threads while
// the worker is itself blocked inside a task (e.g. joining that reaper).
//
// Tasks run strictly one at a time: a task observes every side effect of the
// tasks queued before it.
class SerialExecutor {
 public:
  explicit SerialExecutor(std::string name);
  ~SerialExecutor();

  SerialExecutor(const SerialExecutor&) = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;

  // Enqueue a task; returns false if the executor is shutting down.
  bool Post(std::function<void()> task);

  // Enqueue a task and return a future for its result. If the executor is
  // shutting down the future holds a std::runtime_error.
  template <typename Fn>
  auto Submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using R = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> result = task->get_future();
    if (!Post([task] { (*task)(); })) {
      std::promise<R> rejected;
      rejected.set_exception(std::make_exception_ptr(
          std::runtime_error("SerialExecutor '" + name_ + "' is shut down")));
      return rejected.get_future();
    }
    return result;
  }

  // True when called from the worker thread.
  bool IsWorkerThread() const;

  // Stops accepting tasks, drains what is queued, joins the worker.
  void Shutdown();

 private:
  void WorkerLoop();

  std::string name_;
  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::deque<std::function<void()>> queue_;
  bool shutdown_ = false;
  std::thread worker_thread_;
};

}  // namespace mediahub::util

#endif  // MEDIAHUB_UTIL_SERIAL_EXECUTOR_HPP_
