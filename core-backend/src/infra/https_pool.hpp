#pragma once

// ============================================================================
// 宏配置
// ============================================================================
#define HTTPS_POOL_SIZE 16 // 全局并发连接上限

#include "https_session.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <queue>
#include <string>
#include <unordered_map>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace asio = boost::asio;
namespace ssl = asio::ssl;

// ============================================================================
// HttpsPool - 多 host HTTPS 连接池(按 host:port 复用连接)
// 所有状态只在 ioc 线程上修改; async_post 可从任意线程调用
// ============================================================================
class HttpsPool {
public:
  using Callback = std::function<void(HttpResponse)>;

  explicit HttpsPool(asio::io_context &ioc)
      : ioc_(ioc), ssl_ctx_(ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
  }

  // url: 完整 endpoint, 失败时回调 status=0
  void async_post(const std::string &url, const std::string &body, Callback cb) {
    HttpsUrl parsed;
    try {
      parsed = HttpsUrl::parse(url);
    } catch (const std::invalid_argument &e) {
      std::cerr << "[HTTPS] " << e.what() << std::endl;
      cb(HttpResponse{});
      return;
    }
    asio::post(ioc_, [this, parsed = std::move(parsed), body, cb = std::move(cb)]() mutable {
      do_request(std::move(parsed), std::move(body), std::move(cb));
    });
  }

  void return_session(std::shared_ptr<HttpsSession> session) {
    --active_count_;
    if (session && session->is_connected()) {
      idle_sessions_[session->authority_key()].push(session);
    }
    process_pending();
  }

  void on_request_failed(Callback cb) {
    --active_count_;
    cb(HttpResponse{});
    process_pending();
  }

  int active_count() const { return active_count_; }

private:
  struct PendingRequest {
    HttpsUrl url;
    std::string body;
    Callback cb;
  };

  void do_request(HttpsUrl url, std::string body, Callback cb) {
    if (active_count_ < HTTPS_POOL_SIZE) {
      start_request(url, body, std::move(cb));
    } else {
      pending_.push({std::move(url), std::move(body), std::move(cb)});
    }
  }

  void start_request(const HttpsUrl &url, const std::string &body, Callback cb) {
    ++active_count_;

    std::shared_ptr<HttpsSession> session;
    auto &idle = idle_sessions_[url.authority()];
    if (!idle.empty()) {
      session = idle.front();
      idle.pop();
    } else {
      session = std::make_shared<HttpsSession>(ioc_, ssl_ctx_, url, this);
      session->set_authority_key(url.authority());
    }

    session->run(url.target, body,
                 [this, cb = std::move(cb)](HttpResponse response, bool success) mutable {
                   if (success) {
                     cb(std::move(response));
                   } else {
                     on_request_failed(std::move(cb));
                   }
                 });
  }

  void process_pending() {
    while (!pending_.empty() && active_count_ < HTTPS_POOL_SIZE) {
      auto req = std::move(pending_.front());
      pending_.pop();
      start_request(req.url, req.body, std::move(req.cb));
    }
  }

  // 配置
  asio::io_context &ioc_;
  ssl::context ssl_ctx_;

  // 状态
  int active_count_ = 0;
  std::queue<PendingRequest> pending_;
  std::unordered_map<std::string, std::queue<std::shared_ptr<HttpsSession>>> idle_sessions_;
};

// ============================================================================
// HttpsSession 成员函数实现(需要 HttpsPool 完整定义)
// ============================================================================

inline void HttpsSession::fail(const char *what) {
  std::cerr << "[HTTPS] " << host_ << " " << what << " failed" << std::endl;
  connected_ = false;
  auto cb = std::move(cb_);
  cb(HttpResponse{}, false);
}

inline void HttpsSession::return_to_pool() {
  pool_->return_session(shared_from_this());
}
