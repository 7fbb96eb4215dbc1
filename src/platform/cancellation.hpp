#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace platform {

class DeadlineTimer;
class CancelHook;

// Cancellation state for one outbound call. Only the DeadlineTimer that owns
// the call may trigger it; transports observe it and register an abort hook.
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  bool IsCancelled() const;

  // Blocks until the token is cancelled or `timeout` elapses. Returns true
  // when the token was cancelled.
  bool WaitForCancellation(std::chrono::milliseconds timeout) const;

 private:
  friend class DeadlineTimer;
  friend class CancelHook;

  void Cancel();
  void SetHook(std::function<void()> hook);
  void ClearHook();

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
  std::function<void()> hook_;
};

// Scoped abort hook registration. The hook runs at most once, on the timer
// thread, and never after the registration has been destroyed.
class CancelHook {
 public:
  CancelHook(CancellationToken& token, std::function<void()> hook);
  ~CancelHook();

  CancelHook(const CancelHook&) = delete;
  CancelHook& operator=(const CancelHook&) = delete;

 private:
  CancellationToken& token_;
};

// Arms a deadline on construction and disarms it on destruction. When the
// budget elapses first, the associated token is cancelled.
class DeadlineTimer {
 public:
  DeadlineTimer(std::chrono::milliseconds budget, CancellationToken& token);
  ~DeadlineTimer();

  DeadlineTimer(const DeadlineTimer&) = delete;
  DeadlineTimer& operator=(const DeadlineTimer&) = delete;

  // Stops the timer and joins its thread. Safe to call more than once.
  void Disarm();

  bool Expired() const { return expired_.load(); }
  std::chrono::milliseconds Budget() const { return budget_; }

  // Number of timers in the process whose thread has not been joined yet.
  static std::size_t PendingCount();

 private:
  void Run();

  std::chrono::milliseconds budget_;
  CancellationToken& token_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool disarmed_ = false;
  std::atomic<bool> expired_{false};
  std::thread worker_;
};

}  // namespace platform
