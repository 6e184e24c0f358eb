#pragma once

// ============================================================================
// Tracker 事件 - 固定的几种带类型事件, 由 session / block source 发布
// ============================================================================

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

#include "types.hpp"

struct BlockProcessed {
  BlockHeight height = 0;
  size_t transactions = 0;
  size_t relevant = 0; // 涉及目标 token 的交易数
  size_t detected = 0;
  bool backfill = false;
};

struct AcquisitionDetected {
  AcquisitionRecord record;
};

struct ThrottleBackoff {
  std::string endpoint;
  int consecutive = 0;
  int64_t wait_ms = 0;
  bool rotated = false;
  std::string next_endpoint;
};

struct SessionCompleted {
  std::string target_token;
  uint64_t records = 0;
  std::string reason;
};

using TrackerEvent = std::variant<BlockProcessed, AcquisitionDetected, ThrottleBackoff, SessionCompleted>;
using EventSink = std::function<void(const TrackerEvent &)>;

// 默认 sink: 输出日志行
inline void log_event(const TrackerEvent &event) {
  std::visit(
      [](const auto &e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, BlockProcessed>) {
          if (e.relevant == 0)
            return;
          std::cout << "[Block] " << e.height << (e.backfill ? " (backfill)" : "")
                    << " txs=" << e.transactions << " relevant=" << e.relevant
                    << " detected=" << e.detected << std::endl;
        } else if constexpr (std::is_same_v<T, AcquisitionDetected>) {
          const auto &r = e.record;
          std::cout << "[Detect] #" << r.sequence_number << " " << r.transaction_hash.substr(0, 8) << "... "
                    << r.exchange_name << "/" << r.operation_type << " acquirer=" << r.acquirer_address
                    << " amount=" << r.amount_acquired << " price=" << r.unit_price
                    << " confidence=" << confidence_name(r.confidence_level) << std::endl;
        } else if constexpr (std::is_same_v<T, ThrottleBackoff>) {
          if (e.rotated) {
            std::cerr << "[RPC] " << e.consecutive << " 次连续限流, 切换 endpoint "
                      << e.endpoint << " -> " << e.next_endpoint << std::endl;
          } else {
            std::cerr << "[RPC] throttled by " << e.endpoint << " (" << e.consecutive
                      << " consecutive), backoff " << e.wait_ms << "ms" << std::endl;
          }
        } else if constexpr (std::is_same_v<T, SessionCompleted>) {
          std::cout << "[Session] " << e.target_token << " completed (" << e.reason
                    << "), " << e.records << " records" << std::endl;
        }
      },
      event);
}
