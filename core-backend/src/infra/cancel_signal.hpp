#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// ============================================================================
// CancelSignal - 可被 stop 打断的等待
// ============================================================================
class CancelSignal {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // 返回 false 表示等待期间被取消
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (d <= d.zero())
      return !cancelled_;
    return !cv_.wait_for(lock, d, [this] { return cancelled_; });
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};
