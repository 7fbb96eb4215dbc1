#include "platform/cancellation.hpp"

#include <utility>

namespace {

std::atomic<std::size_t> g_pending_timers{0};

}  // namespace

namespace platform {

bool CancellationToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationToken::WaitForCancellation(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    // The hook runs under the lock so ClearHook() cannot return while the
    // hook is still touching the transport it was registered for.
    if (hook_) {
      hook_();
    }
  }
  cv_.notify_all();
}

void CancellationToken::SetHook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  hook_ = std::move(hook);
  if (cancelled_ && hook_) {
    hook_();
  }
}

void CancellationToken::ClearHook() {
  std::lock_guard<std::mutex> lock(mutex_);
  hook_ = nullptr;
}

CancelHook::CancelHook(CancellationToken& token, std::function<void()> hook) : token_(token) {
  token_.SetHook(std::move(hook));
}

CancelHook::~CancelHook() { token_.ClearHook(); }

DeadlineTimer::DeadlineTimer(std::chrono::milliseconds budget, CancellationToken& token)
    : budget_(budget), token_(token) {
  g_pending_timers.fetch_add(1);
  worker_ = std::thread([this] { Run(); });
}

DeadlineTimer::~DeadlineTimer() { Disarm(); }

void DeadlineTimer::Disarm() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    disarmed_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
    g_pending_timers.fetch_sub(1);
  }
}

std::size_t DeadlineTimer::PendingCount() { return g_pending_timers.load(); }

void DeadlineTimer::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (cv_.wait_for(lock, budget_, [this] { return disarmed_; })) {
    return;
  }
  expired_.store(true);
  lock.unlock();
  token_.Cancel();
}

}  // namespace platform
