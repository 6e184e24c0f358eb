#pragma once

// ============================================================================
// API Session - HTTP 会话处理
// ============================================================================

#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/record_json.hpp"
#include "../tracking/session_registry.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

// 请求参数错误 -> 400
class BadRequest : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// ApiSession - HTTP 会话
// ============================================================================
class ApiSession : public std::enable_shared_from_this<ApiSession> {
public:
  ApiSession(tcp::socket socket, SessionRegistry &registry, Database *db)
      : socket_(std::move(socket)), registry_(registry), db_(db) {}

  void run() { do_read(); }

private:
  void do_read() {
    req_ = {};
    http::async_read(socket_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t) {
                       if (ec)
                         return;
                       self->handle_request();
                     });
  }

  void handle_request() {
    res_ = {};
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());

    res_.set(http::field::access_control_allow_origin, "*");
    res_.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
    res_.set(http::field::access_control_allow_headers, "Content-Type");

    if (req_.method() == http::verb::options) {
      res_.result(http::status::ok);
      return do_write();
    }

    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));
    res_.set(http::field::content_type, "application/json");

    try {
      if (path == "/api/health") {
        handle_health();
      } else if (path == "/api/track" && req_.method() == http::verb::post) {
        handle_start();
      } else if (path.starts_with("/api/track/")) {
        route_session(path.substr(std::string("/api/track/").size()));
      } else if (path == "/api/sessions") {
        handle_sessions();
      } else if (path == "/api/history") {
        handle_history();
      } else if (path == "/api/repeat-acquirers") {
        handle_repeat_acquirers();
      } else if (path == "/api/import" && req_.method() == http::verb::post) {
        handle_import();
      } else {
        error(http::status::not_found, "Not found");
      }
    } catch (const BadRequest &e) {
      error(http::status::bad_request, e.what());
    } catch (const InvalidTokenIdentifier &e) {
      error(http::status::bad_request, e.what());
    } catch (const SessionNotFound &e) {
      error(http::status::not_found, e.what());
    } catch (const std::exception &e) {
      std::cerr << "[HTTP] " << target << " failed: " << e.what() << std::endl;
      error(http::status::internal_server_error, e.what());
    }

    res_.prepare_payload();
    do_write();
  }

  // /api/track/<id>[/export|/complete]
  void route_session(const std::string &rest) {
    auto slash = rest.find('/');
    std::string id = rest.substr(0, slash);
    std::string action = slash == std::string::npos ? "" : rest.substr(slash + 1);
    if (id.empty())
      throw BadRequest("Missing session id");

    if (action.empty() && req_.method() == http::verb::get) {
      handle_progress(id);
    } else if (action.empty() && req_.method() == http::verb::delete_) {
      registry_.stop_tracking(id);
      ok({{"sessionId", id}, {"status", "stopped"}});
    } else if (action == "export" && req_.method() == http::verb::get) {
      res_.result(http::status::ok);
      res_.body() = registry_.export_records(id);
    } else if (action == "complete" && req_.method() == http::verb::post) {
      registry_.mark_complete(id);
      ok({{"sessionId", id}, {"status", registry_.session_status(id).status}});
    } else {
      error(http::status::not_found, "Not found");
    }
  }

  void handle_health() { ok({{"status", "ok"}, {"sessions", registry_.size()}}); }

  void handle_start() {
    json body = json::parse(req_.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object())
      throw BadRequest("Invalid JSON body");
    if (!body.contains("tokenAddress") || !body["tokenAddress"].is_string())
      throw BadRequest("Token address is required");

    std::optional<BlockHeight> start_height;
    if (body.contains("blockNumber") && !body["blockNumber"].is_null()) {
      const auto &b = body["blockNumber"];
      if (b.is_number_unsigned())
        start_height = b.get<BlockHeight>();
      else if (b.is_string() && !b.get<std::string>().empty())
        start_height = parse_height(b.get<std::string>());
      else
        throw BadRequest("blockNumber must be a non-negative integer");
    }

    std::string id = registry_.start_tracking(body["tokenAddress"].get<std::string>(), start_height);
    res_.result(http::status::ok);
    res_.body() = json{{"sessionId", id}, {"status", "starting"}, {"message", "Token tracking started"}}.dump();
  }

  void handle_progress(const std::string &id) {
    auto status = registry_.session_status(id);
    if (status.status == "error") {
      ok({{"sessionId", id}, {"status", "error"}, {"error", status.error.empty() ? "Unknown error" : status.error}});
      return;
    }

    auto progress = registry_.get_progress(id);
    record_json::ordered_json records = record_json::ordered_json::array();
    for (const auto &r : registry_.get_records(id))
      records.push_back(record_json::to_json(r));

    record_json::ordered_json result = {
        {"sessionId", id},
        {"status", status.status},
        {"progress",
         {{"current", progress.current},
          {"target", progress.target},
          {"percentage", progress.percentage},
          {"isComplete", progress.is_complete}}},
        {"records", records},
        {"isComplete", progress.is_complete},
    };
    res_.result(http::status::ok);
    res_.body() = result.dump();
  }

  void handle_sessions() {
    json sessions = json::array();
    int64_t now = unix_now();
    for (const auto &s : registry_.list_sessions()) {
      sessions.push_back({
          {"sessionId", s.id},
          {"tokenAddress", s.token},
          {"blockNumber", s.start_height ? json(*s.start_height) : json(nullptr)},
          {"status", session_status_name(s.state)},
          {"state", session_state_name(s.state)},
          {"records", s.progress.current},
          {"startTime", s.created_at},
          {"runtime", now - s.created_at},
      });
    }
    ok({{"sessions", sessions}});
  }

  void handle_history() {
    std::string token = get_param("token");
    if (token.empty())
      throw BadRequest("Missing query parameter 'token'");
    res_.result(http::status::ok);
    res_.body() = record_json::export_records(require_db().load_records(token));
  }

  void handle_repeat_acquirers() {
    std::string min = get_param("min");
    int min_sessions = min.empty() ? 2 : static_cast<int>(parse_height(min));
    ok(require_db().repeat_acquirers(min_sessions));
  }

  void handle_import() {
    size_t imported = registry_.import_records(req_.body());
    ok({{"imported", imported}});
  }

  Database &require_db() {
    if (!db_)
      throw std::runtime_error("archive database not configured");
    return *db_;
  }

  static BlockHeight parse_height(const std::string &s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
      throw BadRequest("Invalid number: " + s);
    try {
      return std::stoull(s);
    } catch (const std::out_of_range &) {
      throw BadRequest("Number out of range: " + s);
    }
  }

  void ok(const json &body) {
    res_.result(http::status::ok);
    res_.body() = body.dump();
  }

  void error(http::status status, const std::string &message) {
    res_.result(status);
    res_.body() = json{{"error", message}}.dump();
  }

  std::string get_param(const char *name) {
    std::string target(req_.target());
    auto q = target.find('?');
    if (q == std::string::npos)
      return "";
    std::string key = std::string(name) + "=";
    auto pos = target.find(key, q);
    if (pos == std::string::npos)
      return "";
    std::string value = url_decode(target.substr(pos + key.size()));
    auto amp = value.find('&');
    return (amp != std::string::npos) ? value.substr(0, amp) : value;
  }

  void do_write() {
    http::async_write(socket_, res_,
                      [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        beast::error_code shutdown_ec;
                        [[maybe_unused]] auto ret = self->socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
                      });
  }

  static std::string url_decode(const std::string &str) {
    std::string result;
    for (size_t i = 0; i < str.size(); ++i) {
      if (str[i] == '%' && i + 2 < str.size()) {
        int hex = std::stoi(str.substr(i + 1, 2), nullptr, 16);
        result += static_cast<char>(hex);
        i += 2;
      } else if (str[i] == '+') {
        result += ' ';
      } else {
        result += str[i];
      }
    }
    return result;
  }

  tcp::socket socket_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
  SessionRegistry &registry_;
  Database *db_;
};
