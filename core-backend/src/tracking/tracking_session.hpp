#pragma once

// ============================================================================
// TrackingSession - 单个目标 token 的追踪会话
// 状态: IDLE -> INITIALIZING -> (BACKFILLING) -> LIVE_TAILING -> COMPLETED / ERRORED
// worker 线程跑 BlockSource 轮询, 每块: delta -> decode -> classify -> append
// backfill 阶段记录全部入库, live-tail 阶段达到 target 即完成
// ============================================================================

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../core/config.hpp"
#include "../core/errors.hpp"
#include "../core/events.hpp"
#include "../core/types.hpp"
#include "../detect/acquisition_classifier.hpp"
#include "../detect/balance_delta.hpp"
#include "../detect/instruction_decoder.hpp"
#include "../rpc/block_source.hpp"
#include "record_store.hpp"

enum class SessionState {
  IDLE,
  INITIALIZING,
  BACKFILLING,
  LIVE_TAILING,
  COMPLETED,
  ERRORED,
};

inline const char *session_state_name(SessionState s) {
  switch (s) {
  case SessionState::IDLE:
    return "idle";
  case SessionState::INITIALIZING:
    return "initializing";
  case SessionState::BACKFILLING:
    return "backfilling";
  case SessionState::LIVE_TAILING:
    return "live_tailing";
  case SessionState::COMPLETED:
    return "completed";
  case SessionState::ERRORED:
    return "errored";
  }
  return "unknown";
}

// 对外状态(API)
inline const char *session_status_name(SessionState s) {
  switch (s) {
  case SessionState::IDLE:
  case SessionState::INITIALIZING:
    return "starting";
  case SessionState::BACKFILLING:
  case SessionState::LIVE_TAILING:
    return "running";
  case SessionState::COMPLETED:
    return "completed";
  case SessionState::ERRORED:
    return "error";
  }
  return "unknown";
}

struct Progress {
  uint64_t current = 0;
  uint64_t target = 0;
  double percentage = 0.0;
  bool is_complete = false;
};

struct SessionStats {
  uint64_t blocks = 0;
  uint64_t transactions = 0;
  uint64_t relevant = 0;
  std::optional<BlockHeight> last_height;
};

inline int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

class TrackingSession {
public:
  TrackingSession(std::unique_ptr<BlockSource> source, const TrackingConfig &config,
                  RecordStore::OverflowSink overflow = nullptr, EventSink sink = log_event)
      : source_(std::move(source)), config_(config), store_(config.record_capacity, std::move(overflow)),
        sink_(std::move(sink)) {
    if (!source_)
      throw std::invalid_argument("TrackingSession requires a block source");
  }

  ~TrackingSession() { stop(); }

  TrackingSession(const TrackingSession &) = delete;
  TrackingSession &operator=(const TrackingSession &) = delete;

  // 设定目标, 清空上一轮的记录与计数
  void set_target(const std::string &token, std::optional<BlockHeight> start_height) {
    if (worker_.joinable()) {
      SessionState s = state();
      if (s != SessionState::COMPLETED && s != SessionState::ERRORED)
        throw std::logic_error("set_target while session is running");
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    target_ = token;
    start_height_ = start_height;
    store_.clear();
    stats_ = {};
    error_.clear();
    completed_ = false;
    completion_reason_.clear();
    state_ = SessionState::INITIALIZING;
  }

  void start() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ != SessionState::INITIALIZING)
        throw std::logic_error(std::string("start in state ") + session_state_name(state_));
    }
    if (worker_.joinable())
      worker_.join();
    source_->prepare();
    std::cout << "[Session] start " << target_ << " target=" << config_.target_count
              << (start_height_ ? " from=" + std::to_string(*start_height_) : std::string(" live")) << std::endl;
    worker_ = std::thread([this]() { run(); });
  }

  // 任意状态可调用: 打断所有等待, 等 worker 退出, 非 ERRORED 则视为 COMPLETED
  void stop() {
    source_->cancel();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
      worker_.join();
    std::optional<SessionCompleted> done;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ != SessionState::COMPLETED && state_ != SessionState::ERRORED)
        done = complete_locked("stopped");
    }
    if (done)
      emit(*done);
  }

  // 外部标记完成, live-tail 下一次回调即停止
  void mark_complete() {
    std::optional<SessionCompleted> done;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == SessionState::ERRORED || state_ == SessionState::COMPLETED)
        return;
      done = complete_locked("marked complete");
    }
    source_->cancel();
    emit(*done);
  }

  // 等 worker 自然结束(测试 / CLI 用)
  void wait() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
      worker_.join();
  }

  Progress progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Progress p;
    p.current = store_.total();
    p.target = static_cast<uint64_t>(config_.target_count);
    p.percentage = p.target == 0 ? 100.0 : static_cast<double>(p.current) * 100.0 / static_cast<double>(p.target);
    p.is_complete = completed_;
    return p;
  }

  std::vector<AcquisitionRecord> records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.snapshot();
  }

  SessionState state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  std::string error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
  }

  SessionStats stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

  std::string target_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_;
  }

  std::optional<BlockHeight> start_height() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_height_;
  }

private:
  void run() {
    PollHandlers handlers;
    handlers.on_phase = [this](PollPhase phase, BlockHeight height) { on_phase(phase, height); };
    handlers.on_block = [this](const Block &block, PollPhase phase) { return on_block(block, phase); };

    std::optional<SessionCompleted> done;
    try {
      source_->poll_new_heights(handlers, start_height_);
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ != SessionState::COMPLETED && state_ != SessionState::ERRORED)
        done = complete_locked("stopped");
    } catch (const std::exception &e) {
      std::lock_guard<std::mutex> lock(mutex_);
      state_ = SessionState::ERRORED;
      error_ = e.what();
      std::cerr << "[Session] " << target_ << " errored: " << error_ << std::endl;
    }
    if (done)
      emit(*done);
    log_summary();
  }

  void on_phase(PollPhase phase, BlockHeight height) {
    std::optional<SessionCompleted> done;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == SessionState::COMPLETED || state_ == SessionState::ERRORED)
        return;
      if (phase == PollPhase::BACKFILL) {
        state_ = SessionState::BACKFILLING;
        std::cout << "[Session] backfilling from " << height << std::endl;
        return;
      }
      state_ = SessionState::LIVE_TAILING;
      std::cout << "[Session] live-tail from " << height << ", " << store_.total() << " records so far"
                << std::endl;
      if (store_.total() >= static_cast<uint64_t>(config_.target_count))
        done = complete_locked("target reached during backfill");
    }
    if (done) {
      source_->cancel();
      emit(*done);
    }
  }

  bool on_block(const Block &block, PollPhase phase) {
    const bool backfill = phase == PollPhase::BACKFILL;
    const detect::BlockContext ctx{block.height, block.block_time.value_or(unix_now())};
    const std::string target = target_token();

    std::vector<TrackerEvent> events;
    std::optional<SessionCompleted> done;
    size_t relevant = 0;
    size_t detected = 0;

    for (const auto &tx : block.transactions) {
      if (!tx.success)
        continue;

      std::vector<AcquisitionRecord> found;
      try {
        auto deltas = detect::extract_deltas(tx);
        bool touches = std::any_of(deltas.begin(), deltas.end(),
                                   [&](const BalanceDelta &d) { return d.mint == target; });
        if (!touches)
          continue;
        ++relevant;
        found = detect::classify(tx, deltas, detect::decode(tx), target, ctx);
      } catch (const std::exception &e) {
        std::cerr << "[Session] tx " << tx.signature.substr(0, 8) << "... at " << block.height
                  << " skipped: " << e.what() << std::endl;
        continue;
      }

      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == SessionState::COMPLETED || state_ == SessionState::ERRORED)
        break;
      for (auto &record : found) {
        if (config_.dedupe_by_transaction && store_.contains_transaction(record.transaction_hash))
          continue;
        events.push_back(AcquisitionDetected{store_.append(std::move(record))});
        ++detected;
      }
      if (!backfill && store_.total() >= static_cast<uint64_t>(config_.target_count)) {
        done = complete_locked("target reached");
        break;
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.blocks;
      stats_.transactions += block.transactions.size();
      stats_.relevant += relevant;
      stats_.last_height = block.height;
    }

    events.push_back(BlockProcessed{block.height, block.transactions.size(), relevant, detected, backfill});
    for (const auto &e : events)
      emit(e);

    if (done) {
      source_->cancel();
      emit(*done);
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ != SessionState::COMPLETED;
  }

  SessionCompleted complete_locked(const std::string &reason) {
    state_ = SessionState::COMPLETED;
    completed_ = true;
    completion_reason_ = reason;
    return SessionCompleted{target_, store_.total(), reason};
  }

  void emit(const TrackerEvent &event) {
    if (!sink_)
      return;
    try {
      sink_(event);
    } catch (const std::exception &e) {
      std::cerr << "[Session] event sink failed: " << e.what() << std::endl;
    }
  }

  // 完成后的汇总
  void log_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> exchanges;
    std::set<std::string> acquirers;
    int64_t first_ts = 0;
    int64_t last_ts = 0;
    for (const auto &r : store_.snapshot()) {
      exchanges.insert(r.exchange_name);
      acquirers.insert(r.acquirer_address);
      if (first_ts == 0 || r.block_timestamp < first_ts)
        first_ts = r.block_timestamp;
      last_ts = std::max(last_ts, r.block_timestamp);
    }
    std::cout << "[Session] ==== " << target_ << " " << session_state_name(state_) << " ====" << std::endl;
    std::cout << "[Session] records=" << store_.total() << " (in memory " << store_.size()
              << ", archived " << store_.evicted() << ")"
              << " blocks=" << stats_.blocks << " txs=" << stats_.transactions << std::endl;
    std::cout << "[Session] exchanges=" << exchanges.size() << " acquirers=" << acquirers.size();
    if (!acquirers.empty())
      std::cout << " time range " << first_ts << " -> " << last_ts;
    std::cout << std::endl;
    if (!error_.empty())
      std::cout << "[Session] error: " << error_ << std::endl;
  }

  std::unique_ptr<BlockSource> source_;
  TrackingConfig config_;
  RecordStore store_;
  EventSink sink_;

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::IDLE;
  std::string target_;
  std::optional<BlockHeight> start_height_;
  std::string error_;
  bool completed_ = false;
  std::string completion_reason_;
  SessionStats stats_;

  std::thread worker_;
};
