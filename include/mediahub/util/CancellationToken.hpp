// Repository: MediaHub
// Component: Cancellation Token
// Purpose: Cooperative cancellation for blocking waits (grace periods,
//          catalog timeouts, stream relay).
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_UTIL_CANCELLATION_TOKEN_HPP_
#define MEDIAHUB_UTIL_CANCELLATION_TOKEN_HPP_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace mediahub::util {

// CancellationToken is a shared, one-shot flag. Copies share state, so the
// owner keeps one copy and hands others to the code that waits.
//
// WaitFor() sleeps until the timeout elapses or Cancel() is called, whichever
// comes first. Waiters never miss a Cancel() issued before they started.
class CancellationToken {
 public:
  CancellationToken();

  void Cancel();
  bool IsCancelled() const;

  // Returns true if cancelled (possibly before the timeout elapsed).
  bool WaitFor(std::chrono::milliseconds timeout) const;

 private:
  struct State {
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    bool cancelled = false;
  };
  std::shared_ptr<State> state_;
};

}  // namespace mediahub::util

#endif  // MEDIAHUB_UTIL_CANCELLATION_TOKEN_HPP_
