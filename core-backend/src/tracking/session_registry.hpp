#pragma once

// ============================================================================
// SessionRegistry - 多个追踪会话的句柄表
// 共享 EndpointPool(由 source factory 注入), 每个会话独立的 BlockSource 与限流
// 会话结束 / 过期时把内存记录归档到 DuckDB
// ============================================================================

#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../core/base58.hpp"
#include "../core/config.hpp"
#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/events.hpp"
#include "../core/record_json.hpp"
#include "../rpc/block_source.hpp"
#include "tracking_session.hpp"

struct SessionSummary {
  std::string id;
  std::string token;
  SessionState state = SessionState::IDLE;
  Progress progress;
  std::optional<BlockHeight> start_height;
  int64_t created_at = 0;
};

struct SessionStatusReport {
  std::string status;
  std::string error;
};

class SessionRegistry {
public:
  using SourceFactory = std::function<std::unique_ptr<BlockSource>()>;

  SessionRegistry(const TrackingConfig &config, SourceFactory factory, Database *archive = nullptr,
                  EventSink sink = log_event)
      : config_(config), factory_(std::move(factory)), archive_(archive), sink_(std::move(sink)) {}

  ~SessionRegistry() { stop_all(); }

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  // 地址校验在任何网络调用之前
  std::string start_tracking(const std::string &token, std::optional<BlockHeight> start_height) {
    if (!base58::is_valid_address(token))
      throw InvalidTokenIdentifier(token);

    std::string id = next_id();
    auto session = std::make_shared<TrackingSession>(factory_(), config_, overflow_sink(id), sink_);
    session->set_target(token, start_height);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Entry entry;
      entry.session = session;
      entry.token = token;
      entry.created = std::chrono::steady_clock::now();
      entry.created_at = unix_now();
      sessions_.emplace(id, std::move(entry));
    }
    session->start();
    std::cout << "[Registry] " << id << " tracking " << token << std::endl;
    return id;
  }

  Progress get_progress(const std::string &id) { return find(id)->progress(); }

  std::vector<AcquisitionRecord> get_records(const std::string &id) { return find(id)->records(); }

  // 停止并归档, 句柄保留到过期清理
  void stop_tracking(const std::string &id) {
    auto session = find(id);
    session->stop();
    archive_session(id, *session);
  }

  void mark_complete(const std::string &id) { find(id)->mark_complete(); }

  SessionStatusReport session_status(const std::string &id) {
    auto session = find(id);
    return {session_status_name(session->state()), session->error()};
  }

  std::vector<SessionSummary> list_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionSummary> out;
    out.reserve(sessions_.size());
    for (const auto &[id, entry] : sessions_) {
      SessionSummary s;
      s.id = id;
      s.token = entry.token;
      s.state = entry.session->state();
      s.progress = entry.session->progress();
      s.start_height = entry.session->start_height();
      s.created_at = entry.created_at;
      out.push_back(std::move(s));
    }
    return out;
  }

  std::string export_records(const std::string &id) { return record_json::export_records(get_records(id)); }

  // 导入外部导出的记录到归档(按 session "import-*" 存放), 返回条数
  size_t import_records(const std::string &text) {
    auto records = record_json::import_records(text);
    if (!archive_)
      throw TrackerError("import requires an archive database");
    std::string id = "import-" + next_id();
    archive_->archive_records(id, records);
    std::cout << "[Registry] imported " << records.size() << " records as " << id << std::endl;
    return records.size();
  }

  size_t cleanup_expired() { return cleanup_expired(std::chrono::minutes(config_.session_max_age_minutes)); }

  // 超过 max_age 的会话: stop + 归档 + 删除
  size_t cleanup_expired(std::chrono::steady_clock::duration max_age) {
    std::vector<std::pair<std::string, std::shared_ptr<TrackingSession>>> expired;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto now = std::chrono::steady_clock::now();
      for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.created >= max_age) {
          expired.emplace_back(it->first, it->second.session);
          it = sessions_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto &[id, session] : expired) {
      session->stop();
      archive_session(id, *session);
      std::cout << "[Registry] cleaned up expired session " << id << std::endl;
    }
    return expired.size();
  }

  void stop_all() {
    std::vector<std::pair<std::string, std::shared_ptr<TrackingSession>>> all;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto &[id, entry] : sessions_)
        all.emplace_back(id, entry.session);
    }
    for (auto &[id, session] : all) {
      session->stop();
      archive_session(id, *session);
    }
  }

  size_t size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
  }

private:
  struct Entry {
    std::shared_ptr<TrackingSession> session;
    std::string token;
    std::chrono::steady_clock::time_point created;
    int64_t created_at = 0;
  };

  std::shared_ptr<TrackingSession> find(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end())
      throw SessionNotFound(id);
    return it->second.session;
  }

  std::string next_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    std::lock_guard<std::mutex> lock(mutex_);
    return "trk-" + std::to_string(ms) + "-" + std::to_string(++counter_);
  }

  RecordStore::OverflowSink overflow_sink(const std::string &id) {
    if (!archive_)
      return nullptr;
    Database *db = archive_;
    return [db, id](const AcquisitionRecord &record) {
      try {
        db->archive_records(id, {record});
      } catch (const std::exception &e) {
        std::cerr << "[Registry] archive overflow #" << record.sequence_number << " failed: " << e.what()
                  << std::endl;
      }
    };
  }

  void archive_session(const std::string &id, const TrackingSession &session) {
    if (!archive_)
      return;
    auto records = session.records();
    try {
      archive_->archive_records(id, records);
      std::cout << "[Registry] archived " << records.size() << " records of " << id << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "[Registry] archive " << id << " failed: " << e.what() << std::endl;
    }
  }

  TrackingConfig config_;
  SourceFactory factory_;
  Database *archive_;
  EventSink sink_;

  std::mutex mutex_;
  std::map<std::string, Entry> sessions_;
  uint64_t counter_ = 0;
};
