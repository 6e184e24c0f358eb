#pragma once

// ============================================================================
// 错误分类
// ============================================================================

#include <cstdint>
#include <stdexcept>
#include <string>

class TrackerError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// 节点限流(可恢复: backoff / 轮换 endpoint)
class ThrottledError : public TrackerError {
public:
  using TrackerError::TrackerError;
};

// endpoint 全部耗尽或重试预算用尽, 对 session 致命
class UpstreamUnavailableError : public TrackerError {
public:
  using TrackerError::TrackerError;
};

// 该高度被裁剪/跳过, 跳过继续
class BlockUnavailableError : public TrackerError {
public:
  BlockUnavailableError(uint64_t height, const std::string &reason)
      : TrackerError("block " + std::to_string(height) + " unavailable: " + reason), height_(height) {}

  uint64_t height() const { return height_; }

private:
  uint64_t height_;
};

// 单条指令解码失败, 丢弃该指令
class DecodeFailure : public TrackerError {
public:
  using TrackerError::TrackerError;
};

// startTracking 之前的地址格式校验
class InvalidTokenIdentifier : public TrackerError {
public:
  explicit InvalidTokenIdentifier(const std::string &token)
      : TrackerError("invalid token identifier: " + token) {}
};

// session 被 stop 时用于展开调用栈
class CancelledError : public TrackerError {
public:
  CancelledError() : TrackerError("cancelled") {}
};

// 未知 session 句柄
class SessionNotFound : public TrackerError {
public:
  explicit SessionNotFound(const std::string &id) : TrackerError("session not found: " + id) {}
};
