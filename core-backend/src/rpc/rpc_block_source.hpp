#pragma once

// ============================================================================
// RpcBlockSource - Solana JSON-RPC 区块来源
// 限流 -> 发送 -> 分类响应 -> (backoff | 轮换 endpoint | 重试)
// ============================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/config.hpp"
#include "../core/errors.hpp"
#include "../core/events.hpp"
#include "block_parser.hpp"
#include "block_source.hpp"
#include "endpoint_pool.hpp"
#include "rate_limiter.hpp"
#include "rpc_transport.hpp"

using json = nlohmann::json;

class RpcBlockSource : public BlockSource {
public:
  RpcBlockSource(const RpcConfig &rpc, const PollConfig &poll, std::shared_ptr<EndpointPool> endpoints,
                 RpcTransport &transport, EventSink sink = log_event)
      : BlockSource(poll), rpc_(rpc), endpoints_(std::move(endpoints)), transport_(transport),
        sink_(std::move(sink)),
        limiter_(rpc.max_requests_per_second, std::chrono::milliseconds(rpc.request_delay_ms)),
        backoff_(rpc.request_delay_ms) {}

  BlockHeight current_height() override {
    json params = json::array({{{"commitment", rpc_.commitment}}});
    json result = call("getSlot", params, std::nullopt);
    if (!result.is_number_unsigned())
      throw UpstreamUnavailableError("getSlot returned non-integer result");
    return result.get<BlockHeight>();
  }

  Block block_at(BlockHeight height) override {
    json params = json::array({height,
                               {{"encoding", "json"},
                                {"maxSupportedTransactionVersion", 0},
                                {"transactionDetails", "full"},
                                {"rewards", false},
                                {"commitment", rpc_.commitment}}});
    json result = call("getBlock", params, height);
    if (result.is_null())
      throw BlockUnavailableError(height, "node returned null block");
    return block_parser::parse_block(height, result);
  }

  const BackoffState &backoff_state() const { return backoff_; }
  const EndpointPool &endpoints() const { return *endpoints_; }

protected:
  void reset_rate_state() override {
    limiter_.reset();
    backoff_.reset();
  }

private:
  static bool contains_ci(std::string haystack, const char *needle) {
    std::transform(haystack.begin(), haystack.end(), haystack.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return haystack.find(needle) != std::string::npos;
  }

  // 成功返回 result, 可重试失败返回 nullopt(detail 说明原因)
  // 限流抛 ThrottledError, 高度不可用抛 BlockUnavailableError
  static std::optional<json> read_response(const HttpResponse &res, std::optional<BlockHeight> height,
                                           std::string &detail) {
    if (res.status == 0) {
      detail = "network failure";
      return std::nullopt;
    }
    if (res.status == 429)
      throw ThrottledError("HTTP 429");

    json j;
    try {
      j = json::parse(res.body);
    } catch (const json::parse_error &) {
      detail = "HTTP " + std::to_string(res.status) + ", JSON parse fail";
      return std::nullopt;
    }

    if (j.contains("error") && !j["error"].is_null()) {
      const auto &err = j["error"];
      int code = err.is_object() ? err.value("code", 0) : 0;
      std::string message = err.is_object() ? err.value("message", std::string()) : err.dump();
      detail = "RPC error " + std::to_string(code) + ": " + message;

      if (code == -32429 || code == 429 || contains_ci(message, "too many requests") ||
          contains_ci(message, "rate limit"))
        throw ThrottledError(detail);

      // 被裁剪 / 跳过 / 长期存储缺失 / 尚不可用
      switch (code) {
      case -32001:
      case -32004:
      case -32007:
      case -32009:
      case -32014:
        throw BlockUnavailableError(height.value_or(0), detail);
      default:
        return std::nullopt;
      }
    }

    if (res.status != 200) {
      detail = "HTTP " + std::to_string(res.status);
      return std::nullopt;
    }
    if (!j.contains("result")) {
      detail = "response has no result";
      return std::nullopt;
    }
    return std::move(j["result"]);
  }

  json call(const std::string &method, const json &params, std::optional<BlockHeight> height) {
    json request = {{"jsonrpc", "2.0"}, {"id", ++request_id_}, {"method", method}, {"params", params}};
    const std::string body = request.dump();

    int retries = 0;
    size_t rotations = 0;
    // 整个 pool 轮换 max_retries 圈仍被限流视为耗尽
    const size_t max_rotations = endpoints_->size() * static_cast<size_t>(std::max(1, rpc_.max_retries));

    while (true) {
      if (!limiter_.acquire(cancel_))
        throw CancelledError();

      auto endpoint = endpoints_->current();
      HttpResponse res = transport_.post(endpoint.url, body, cancel_);

      std::string detail;
      std::optional<json> result;
      try {
        result = read_response(res, height, detail);
      } catch (const ThrottledError &) {
        if (back_off(endpoint)) {
          if (++rotations >= max_rotations)
            throw UpstreamUnavailableError(method + ": all " + std::to_string(endpoints_->size()) +
                                           " endpoints throttled");
          wait_or_cancel(rpc_.rotation_pause_ms);
        }
        continue;
      } catch (const BlockUnavailableError &) {
        backoff_.reset();
        throw;
      }

      if (result) {
        backoff_.reset();
        return std::move(*result);
      }

      backoff_.consecutive_throttles = 0;
      ++retries;
      if (retries > rpc_.max_retries)
        throw UpstreamUnavailableError(method + " failed after " + std::to_string(rpc_.max_retries) +
                                       " retries: " + detail);
      int64_t delay = static_cast<int64_t>(rpc_.retry_delay_ms) << std::min(retries - 1, 20);
      std::cerr << "[RPC] " << method << " " << detail << ", retry " << retries << "/" << rpc_.max_retries
                << " in " << delay << "ms" << std::endl;
      wait_or_cancel(delay);
    }
  }

  // 连续限流未到阈值: 按 backoff 等待, 返回 false; 到阈值: 轮换 endpoint, 返回 true
  bool back_off(const EndpointPool::Endpoint &endpoint) {
    int64_t wait_ms = backoff_.on_throttled(rpc_.rate_limit_backoff_multiplier, rpc_.max_rate_limit_delay_ms);
    int consecutive = backoff_.consecutive_throttles;

    if (consecutive < rpc_.throttles_before_rotation) {
      emit(ThrottleBackoff{endpoint.url, consecutive, wait_ms, false, ""});
      wait_or_cancel(wait_ms);
      return false;
    }

    auto next = endpoints_->rotate_from(endpoint.index);
    backoff_.reset();
    emit(ThrottleBackoff{endpoint.url, consecutive, rpc_.rotation_pause_ms, true, next.url});
    return true;
  }

  void wait_or_cancel(int64_t ms) {
    if (!cancel_.wait_for(std::chrono::milliseconds(ms)))
      throw CancelledError();
  }

  void emit(TrackerEvent event) {
    if (sink_)
      sink_(event);
  }

  RpcConfig rpc_;
  std::shared_ptr<EndpointPool> endpoints_;
  RpcTransport &transport_;
  EventSink sink_;

  RateLimiter limiter_;
  BackoffState backoff_;
  int64_t request_id_ = 0;
};
