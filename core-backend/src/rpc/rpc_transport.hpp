#pragma once

// ============================================================================
// RpcTransport - JSON-RPC 请求的传输层
// ============================================================================

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "../core/errors.hpp"
#include "../infra/cancel_signal.hpp"
#include "../infra/https_pool.hpp"

class RpcTransport {
public:
  virtual ~RpcTransport() = default;

  // 阻塞发送; 网络失败返回 status=0, 被取消抛 CancelledError
  virtual HttpResponse post(const std::string &endpoint, const std::string &body, CancelSignal &cancel) = 0;
};

// ============================================================================
// HttpsRpcTransport - 把异步 HttpsPool 包装成可取消的同步调用
// ============================================================================
class HttpsRpcTransport : public RpcTransport {
public:
  explicit HttpsRpcTransport(HttpsPool &pool) : pool_(pool) {}

  HttpResponse post(const std::string &endpoint, const std::string &body, CancelSignal &cancel) override {
    // 回调可能晚于调用方返回, 状态放在共享块里
    struct Pending {
      std::mutex mtx;
      std::condition_variable cv;
      HttpResponse response;
      bool done = false;
    };
    auto pending = std::make_shared<Pending>();

    pool_.async_post(endpoint, body, [pending](HttpResponse response) {
      std::lock_guard<std::mutex> lock(pending->mtx);
      pending->response = std::move(response);
      pending->done = true;
      pending->cv.notify_one();
    });

    std::unique_lock<std::mutex> lock(pending->mtx);
    while (!pending->done) {
      pending->cv.wait_for(lock, std::chrono::milliseconds(50));
      if (!pending->done && cancel.cancelled())
        throw CancelledError();
    }
    return std::move(pending->response);
  }

private:
  HttpsPool &pool_;
};
