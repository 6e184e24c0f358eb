#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ============================================================================
// 配置结构
// 所有字段可选; 默认值偏保守(公共节点限流很激进)
// ============================================================================

struct RpcConfig {
  std::vector<std::string> endpoints{"https://api.mainnet-beta.solana.com"};
  std::string commitment = "confirmed";
  int max_requests_per_second = 3;
  int request_delay_ms = 500; // 任意两次请求的最小间隔
  double rate_limit_backoff_multiplier = 3.0;
  int max_rate_limit_delay_ms = 60000;
  int throttles_before_rotation = 3;
  int rotation_pause_ms = 1000;
  int max_retries = 5;
  int retry_delay_ms = 1000;
};

struct PollConfig {
  int slot_poll_interval_ms = 5000;
  int max_slots_per_cycle = 2;
  int slot_processing_delay_ms = 1000;
  int historical_batch_size = 10;
  int historical_batch_delay_ms = 2000;
};

struct TrackingConfig {
  int target_count = 100;
  size_t record_capacity = 10000; // 内存 ring 容量, 溢出写 DuckDB
  bool dedupe_by_transaction = false;
  int session_max_age_minutes = 30;
};

struct Config {
  RpcConfig rpc;
  PollConfig poll;
  TrackingConfig tracking;
  std::string db_path = "buytrack.duckdb";
  unsigned short api_port = 8001;

  static Config from_json(const json &j) {
    Config config;

    if (j.contains("rpc")) {
      const auto &r = j["rpc"];
      auto &rpc = config.rpc;
      if (r.contains("endpoints"))
        rpc.endpoints = r["endpoints"].get<std::vector<std::string>>();
      rpc.commitment = r.value("commitment", rpc.commitment);
      rpc.max_requests_per_second = r.value("max_requests_per_second", rpc.max_requests_per_second);
      rpc.request_delay_ms = r.value("request_delay_ms", rpc.request_delay_ms);
      rpc.rate_limit_backoff_multiplier = r.value("rate_limit_backoff_multiplier", rpc.rate_limit_backoff_multiplier);
      rpc.max_rate_limit_delay_ms = r.value("max_rate_limit_delay_ms", rpc.max_rate_limit_delay_ms);
      rpc.throttles_before_rotation = r.value("throttles_before_rotation", rpc.throttles_before_rotation);
      rpc.rotation_pause_ms = r.value("rotation_pause_ms", rpc.rotation_pause_ms);
      rpc.max_retries = r.value("max_retries", rpc.max_retries);
      rpc.retry_delay_ms = r.value("retry_delay_ms", rpc.retry_delay_ms);
    }

    if (j.contains("poll")) {
      const auto &p = j["poll"];
      auto &poll = config.poll;
      poll.slot_poll_interval_ms = p.value("slot_poll_interval_ms", poll.slot_poll_interval_ms);
      poll.max_slots_per_cycle = p.value("max_slots_per_cycle", poll.max_slots_per_cycle);
      poll.slot_processing_delay_ms = p.value("slot_processing_delay_ms", poll.slot_processing_delay_ms);
      poll.historical_batch_size = p.value("historical_batch_size", poll.historical_batch_size);
      poll.historical_batch_delay_ms = p.value("historical_batch_delay_ms", poll.historical_batch_delay_ms);
    }

    if (j.contains("tracking")) {
      const auto &t = j["tracking"];
      auto &tracking = config.tracking;
      tracking.target_count = t.value("target_count", tracking.target_count);
      tracking.record_capacity = t.value("record_capacity", tracking.record_capacity);
      tracking.dedupe_by_transaction = t.value("dedupe_by_transaction", tracking.dedupe_by_transaction);
      tracking.session_max_age_minutes = t.value("session_max_age_minutes", tracking.session_max_age_minutes);
    }

    config.db_path = j.value("db_path", config.db_path);
    config.api_port = j.value("api_port", config.api_port);

    config.validate();
    return config;
  }

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("无法打开配置文件: " + path);

    json j;
    f >> j;
    return from_json(j);
  }

  void validate() const {
    if (rpc.endpoints.empty())
      throw std::invalid_argument("rpc.endpoints must not be empty");
    if (rpc.max_requests_per_second <= 0)
      throw std::invalid_argument("rpc.max_requests_per_second must be positive");
    if (rpc.throttles_before_rotation <= 0)
      throw std::invalid_argument("rpc.throttles_before_rotation must be positive");
    if (poll.historical_batch_size <= 0 || poll.max_slots_per_cycle <= 0)
      throw std::invalid_argument("poll batch sizes must be positive");
    if (tracking.target_count <= 0 || tracking.record_capacity == 0)
      throw std::invalid_argument("tracking.target_count and record_capacity must be positive");
  }
};
