#pragma once

// ============================================================================
// 限流 + backoff 状态
// 所有请求必须先经过 RateLimiter::acquire(), 状态只在这里修改
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "../infra/cancel_signal.hpp"

// ============================================================================
// RateLimiter - 1 秒滑动窗口 + 最小请求间隔
// ============================================================================
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(int max_per_second, std::chrono::milliseconds min_spacing)
      : max_per_second_(std::max(1, max_per_second)), min_spacing_(min_spacing) {}

  // 阻塞直到允许发出下一次请求; 被取消返回 false
  bool acquire(CancelSignal &cancel) {
    while (true) {
      Clock::duration wait;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        wait = wait_needed_locked(now);
        if (wait <= Clock::duration::zero()) {
          window_.push_back(now);
          last_request_ = now;
          return true;
        }
      }
      if (!cancel.wait_for(wait))
        return false;
    }
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.clear();
    last_request_.reset();
  }

  size_t window_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked(Clock::now());
    return window_.size();
  }

private:
  // max(窗口剩余时间, 间隔剩余时间)
  Clock::duration wait_needed_locked(Clock::time_point now) {
    prune_locked(now);

    Clock::duration window_wait = Clock::duration::zero();
    if (static_cast<int>(window_.size()) >= max_per_second_)
      window_wait = window_.front() + std::chrono::seconds(1) - now;

    Clock::duration spacing_wait = Clock::duration::zero();
    if (last_request_)
      spacing_wait = *last_request_ + min_spacing_ - now;

    return std::max(window_wait, spacing_wait);
  }

  void prune_locked(Clock::time_point now) {
    while (!window_.empty() && now - window_.front() >= std::chrono::seconds(1))
      window_.pop_front();
  }

  int max_per_second_;
  std::chrono::milliseconds min_spacing_;

  std::mutex mutex_;
  std::deque<Clock::time_point> window_;
  std::optional<Clock::time_point> last_request_;
};

// ============================================================================
// BackoffState - 限流响应的指数退避
// ============================================================================
struct BackoffState {
  int64_t base_delay_ms = 0;
  int64_t current_delay_ms = 0;
  int consecutive_throttles = 0;
  int attempt = 0;

  BackoffState() = default;
  explicit BackoffState(int64_t base) : base_delay_ms(base), current_delay_ms(base) {}

  // 记录一次限流, 返回本次应等待的毫秒数
  int64_t on_throttled(double multiplier, int64_t max_delay_ms) {
    ++consecutive_throttles;
    auto grown = static_cast<int64_t>(static_cast<double>(std::max<int64_t>(current_delay_ms, 1)) * multiplier);
    current_delay_ms = std::min(grown, max_delay_ms);

    // current × 2^attempt × 2^(consecutive-1), 封顶
    int shift = std::min(attempt + consecutive_throttles - 1, 30);
    int64_t wait = current_delay_ms;
    for (int i = 0; i < shift && wait < max_delay_ms; ++i)
      wait *= 2;
    ++attempt;
    return std::min(wait, max_delay_ms);
  }

  void reset() {
    current_delay_ms = base_delay_ms;
    consecutive_throttles = 0;
    attempt = 0;
  }
};
