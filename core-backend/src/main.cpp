#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "api/api_server.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "infra/https_pool.hpp"
#include "rpc/endpoint_pool.hpp"
#include "rpc/rpc_block_source.hpp"
#include "rpc/rpc_transport.hpp"
#include "tracking/session_registry.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " [--config <config.json>] [--port <port>] [--token <mint> [--from <slot>]]"
            << std::endl;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";
  std::optional<unsigned short> port_override;
  std::string boot_token;
  std::optional<BlockHeight> boot_from;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
      port_override = static_cast<unsigned short>(std::stoi(argv[++i]));
    } else if (std::strcmp(argv[i], "--token") == 0 && i + 1 < argc) {
      boot_token = argv[++i];
    } else if (std::strcmp(argv[i], "--from") == 0 && i + 1 < argc) {
      boot_from = std::stoull(argv[++i]);
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else {
      print_usage(argv[0]);
      return 1;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Token Acquisition Tracker" << std::endl;
  std::cout << "========================================" << std::endl;

  Config config;
  if (std::filesystem::exists(config_path)) {
    config = Config::load(config_path);
  } else {
    std::cout << "[Main] " << config_path << " 不存在, 使用默认配置" << std::endl;
  }
  if (port_override)
    config.api_port = *port_override;
  config.validate();

  std::cout << "[Main] DB Path: " << config.db_path << std::endl;
  std::cout << "[Main] Commitment: " << config.rpc.commitment << std::endl;
  std::cout << "[Main] Endpoints: " << config.rpc.endpoints.size() << std::endl;
  for (const auto &url : config.rpc.endpoints)
    std::cout << "[Main]   - " << url << std::endl;
  std::cout << "[Main] Target: " << config.tracking.target_count << " acquisitions / session" << std::endl;

  Database db(config.db_path);
  db.init_schema();

  asio::io_context ioc_api; // API 专用
  asio::io_context ioc_rpc; // HTTPS 专用
  auto rpc_work = asio::make_work_guard(ioc_rpc);

  // HTTPS 连接池 + 所有会话共享的 endpoint 轮换
  HttpsPool pool(ioc_rpc);
  HttpsRpcTransport transport(pool);
  auto endpoints = std::make_shared<EndpointPool>(config.rpc.endpoints);

  SessionRegistry registry(
      config.tracking,
      [&config, &transport, endpoints]() {
        return std::make_unique<RpcBlockSource>(config.rpc, config.poll, endpoints, transport);
      },
      &db);

  // HTTP 服务器, 独立线程, 不被 RPC 阻塞
  ApiServer api_server(ioc_api, registry, &db, static_cast<unsigned short>(config.api_port));

  // 过期会话清理, 每分钟一次
  asio::steady_timer cleanup_timer(ioc_api);
  std::function<void()> schedule_cleanup = [&]() {
    cleanup_timer.expires_after(std::chrono::minutes(1));
    cleanup_timer.async_wait([&](const boost::system::error_code &ec) {
      if (ec)
        return;
      size_t n = registry.cleanup_expired();
      if (n > 0)
        std::cout << "[Main] cleaned up " << n << " sessions" << std::endl;
      schedule_cleanup();
    });
  };
  schedule_cleanup();

  // Ctrl-C / SIGTERM: 停止全部会话并归档
  asio::signal_set signals(ioc_api, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int sig) {
    if (ec)
      return;
    std::cout << "[Main] signal " << sig << ", shutting down" << std::endl;
    cleanup_timer.cancel();
    registry.stop_all();
    rpc_work.reset();
    ioc_rpc.stop();
    ioc_api.stop();
  });

  std::thread rpc_thread([&ioc_rpc]() { ioc_rpc.run(); });

  if (!boot_token.empty()) {
    try {
      std::string id = registry.start_tracking(boot_token, boot_from);
      std::cout << "[Main] session " << id << " started for " << boot_token << std::endl;
    } catch (const InvalidTokenIdentifier &e) {
      std::cerr << "[Main] " << e.what() << std::endl;
    }
  }

  ioc_api.run();
  rpc_thread.join();

  return 0;
}
