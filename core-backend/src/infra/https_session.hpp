#pragma once

// ============================================================================
// 宏配置
// ============================================================================
#define HTTPS_TIMEOUT_SEC 30 // 请求超时
#define HTTPS_DEFAULT_PORT "443"
#define HTTPS_MAX_BODY_BYTES (256ull * 1024 * 1024) // 完整区块的 JSON 应答上限

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

class HttpsPool;

// status = 0 表示网络层失败(连接/握手/读写)
struct HttpResponse {
  int status = 0;
  std::string body;
};

// ============================================================================
// HttpsUrl - "https://host[:port][/path]"
// ============================================================================
struct HttpsUrl {
  std::string host;
  std::string port = HTTPS_DEFAULT_PORT;
  std::string target = "/";

  std::string authority() const { return host + ":" + port; }

  static HttpsUrl parse(const std::string &url) {
    const std::string scheme = "https://";
    if (url.compare(0, scheme.size(), scheme) != 0)
      throw std::invalid_argument("only https:// endpoints are supported: " + url);

    HttpsUrl u;
    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (slash != std::string::npos)
      u.target = rest.substr(slash);

    auto colon = authority.find(':');
    if (colon != std::string::npos) {
      u.host = authority.substr(0, colon);
      u.port = authority.substr(colon + 1);
    } else {
      u.host = authority;
    }
    if (u.host.empty())
      throw std::invalid_argument("endpoint has no host: " + url);
    return u;
  }
};

// ============================================================================
// HttpsSession - 可复用的 HTTPS 连接会话(绑定单个 host)
// 流程: resolve -> connect -> handshake -> (write -> read)*
// ============================================================================
class HttpsSession : public std::enable_shared_from_this<HttpsSession> {
public:
  using Callback = std::function<void(HttpResponse, bool)>; // (response, success)

  HttpsSession(asio::io_context &ioc, ssl::context &ssl_ctx, const HttpsUrl &url, HttpsPool *pool)
      : resolver_(ioc), stream_(ioc, ssl_ctx), host_(url.host), port_(url.port), pool_(pool) {}

  void run(const std::string &target, const std::string &body, Callback cb) {
    cb_ = std::move(cb);
    build_request(target, body);

    if (connected_)
      return send();

    if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str()))
      return fail("SNI");
    resolver_.async_resolve(host_, port_,
                            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                              if (ec)
                                return self->fail("DNS resolve");
                              self->connect(results);
                            });
  }

  bool is_connected() const { return connected_; }
  const std::string &authority_key() const { return authority_; }
  void set_authority_key(std::string key) { authority_ = std::move(key); }

private:
  void fail(const char *what);
  void return_to_pool();

  void arm_timer() { beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(HTTPS_TIMEOUT_SEC)); }

  void connect(const tcp::resolver::results_type &results) {
    arm_timer();
    beast::get_lowest_layer(stream_).async_connect(
        results, [self = shared_from_this()](beast::error_code ec, tcp::endpoint) {
          if (ec)
            return self->fail("TCP connect");
          self->arm_timer();
          self->stream_.async_handshake(ssl::stream_base::client, [self](beast::error_code hs_ec) {
            if (hs_ec)
              return self->fail("SSL handshake");
            self->connected_ = true;
            self->send();
          });
        });
  }

  void build_request(const std::string &target, const std::string &body) {
    req_ = {};
    req_.method(http::verb::post);
    req_.target(target);
    req_.version(11);
    req_.set(http::field::host, host_);
    req_.set(http::field::content_type, "application/json");
    req_.set(http::field::accept, "application/json");
    req_.set(http::field::connection, "keep-alive");
    req_.body() = body;
    req_.prepare_payload();
  }

  // JSON-RPC 请求 + 应答; getBlock 应答可能远超 beast 默认的 8MB 上限
  void send() {
    buffer_.clear();
    parser_.emplace();
    parser_->body_limit(HTTPS_MAX_BODY_BYTES);

    arm_timer();
    http::async_write(stream_, req_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
      if (ec) {
        self->connected_ = false;
        return self->fail("HTTP write");
      }
      self->arm_timer();
      http::async_read(self->stream_, self->buffer_, *self->parser_,
                       [self](beast::error_code read_ec, std::size_t) {
                         if (read_ec) {
                           self->connected_ = false;
                           return self->fail("HTTP read");
                         }
                         self->deliver();
                       });
    });
  }

  void deliver() {
    auto res = parser_->release();
    parser_.reset();
    // 服务端要求关闭时不再复用
    if (!res.keep_alive())
      connected_ = false;
    cb_(HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())}, true);
    return_to_pool();
  }

  tcp::resolver resolver_;
  beast::ssl_stream<beast::tcp_stream> stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::optional<http::response_parser<http::string_body>> parser_;

  std::string host_;
  std::string port_;
  std::string authority_;
  HttpsPool *pool_;

  Callback cb_;
  bool connected_ = false;
};
