#pragma once

// ============================================================================
// BlockSource - 区块来源(高度查询 + 按高度取块) + 轮询循环
// 轮询: 可选 backfill [from, head) 分批扫描, 之后 live-tail 追新高度
// ============================================================================

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <optional>

#include "../core/config.hpp"
#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "../infra/cancel_signal.hpp"

enum class PollPhase {
  BACKFILL,
  LIVE_TAIL,
};

struct PollHandlers {
  std::function<void(PollPhase, BlockHeight)> on_phase;      // 进入阶段时回调(起始高度)
  std::function<bool(const Block &, PollPhase)> on_block;    // 返回 false 停止轮询
};

class BlockSource {
public:
  explicit BlockSource(const PollConfig &poll) : poll_(poll) {}
  virtual ~BlockSource() = default;

  BlockSource(const BlockSource &) = delete;
  BlockSource &operator=(const BlockSource &) = delete;

  virtual BlockHeight current_height() = 0;
  virtual Block block_at(BlockHeight height) = 0;

  // 新一轮 start 前调用: 清除取消标志 + 限流状态
  void prepare() {
    cancel_.reset();
    reset_rate_state();
  }

  // 任意等待中可被打断
  void cancel() { cancel_.cancel(); }
  bool cancelled() const { return cancel_.cancelled(); }

  // 取消或 handler 要求停止时正常返回; 上游不可用时抛 UpstreamUnavailableError
  void poll_new_heights(const PollHandlers &handlers, std::optional<BlockHeight> from_height) {
    try {
      run_poll(handlers, from_height);
    } catch (const CancelledError &) {
      std::cout << "[Poll] cancelled" << std::endl;
    }
  }

protected:
  virtual void reset_rate_state() {}

  CancelSignal cancel_;
  PollConfig poll_;

private:
  void run_poll(const PollHandlers &handlers, std::optional<BlockHeight> from_height) {
    const BlockHeight head = current_height();
    BlockHeight next = head;

    if (from_height && *from_height < head) {
      std::cout << "[Poll] backfill " << *from_height << " -> " << head
                << " (" << head - *from_height << " heights)" << std::endl;
      if (handlers.on_phase)
        handlers.on_phase(PollPhase::BACKFILL, *from_height);

      const BlockHeight batch = static_cast<BlockHeight>(poll_.historical_batch_size);
      for (BlockHeight batch_start = *from_height; batch_start < head; batch_start += batch) {
        BlockHeight batch_end = std::min(head, batch_start + batch);
        for (BlockHeight h = batch_start; h < batch_end; ++h) {
          if (!deliver(h, PollPhase::BACKFILL, handlers))
            return;
          if (h + 1 < batch_end && !pause(poll_.slot_processing_delay_ms))
            return;
        }
        if (batch_end < head && !pause(poll_.historical_batch_delay_ms))
          return;
      }
      std::cout << "[Poll] backfill done" << std::endl;
    } else if (from_height) {
      next = std::max(*from_height, head);
    }

    // live-tail 从 head 开始, backfill 边界不跳高度
    if (handlers.on_phase)
      handlers.on_phase(PollPhase::LIVE_TAIL, next);

    const BlockHeight per_cycle = static_cast<BlockHeight>(poll_.max_slots_per_cycle);
    while (!cancel_.cancelled()) {
      BlockHeight latest = current_height();
      if (latest >= next) {
        BlockHeight end = std::min(latest, next + per_cycle - 1);
        for (BlockHeight h = next; h <= end; ++h) {
          if (!deliver(h, PollPhase::LIVE_TAIL, handlers))
            return;
          next = h + 1;
          if (h < end && !pause(poll_.slot_processing_delay_ms))
            return;
        }
      }
      if (!pause(poll_.slot_poll_interval_ms))
        return;
    }
  }

  bool deliver(BlockHeight height, PollPhase phase, const PollHandlers &handlers) {
    Block block;
    try {
      block = block_at(height);
    } catch (const BlockUnavailableError &e) {
      std::cerr << "[Poll] skip " << e.what() << std::endl;
      return !cancel_.cancelled();
    }
    return handlers.on_block(block, phase);
  }

  bool pause(int ms) { return cancel_.wait_for(std::chrono::milliseconds(ms)); }
};
