#pragma once

// ============================================================================
// EndpointPool - 等价 RPC endpoint 列表 + 当前轮换位置
// 可被多个 session 共享; 轮换以观察到的 index 为条件, 并发限流只会前进一格
// ============================================================================

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class EndpointPool {
public:
  struct Endpoint {
    size_t index = 0;
    std::string url;
  };

  explicit EndpointPool(std::vector<std::string> urls) : urls_(std::move(urls)) {
    if (urls_.empty())
      throw std::invalid_argument("endpoint pool must not be empty");
  }

  Endpoint current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {index_, urls_[index_]};
  }

  // 只有当前 index 仍是 observed 时才前进; 返回轮换后的 endpoint
  Endpoint rotate_from(size_t observed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (observed == index_) {
      index_ = (index_ + 1) % urls_.size();
      ++rotations_;
    }
    return {index_, urls_[index_]};
  }

  size_t size() const { return urls_.size(); }

  uint64_t rotations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotations_;
  }

private:
  const std::vector<std::string> urls_;
  mutable std::mutex mutex_;
  size_t index_ = 0;
  uint64_t rotations_ = 0;
};
