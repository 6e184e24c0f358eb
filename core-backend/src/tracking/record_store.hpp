#pragma once

// ============================================================================
// RecordStore - 有界 ring buffer
// 超出容量的最旧记录交给 overflow sink(落盘), 序号按总 append 数连续分配
// 非线程安全, 由 TrackingSession 加锁
// ============================================================================

#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/types.hpp"

class RecordStore {
public:
  using OverflowSink = std::function<void(const AcquisitionRecord &)>;

  explicit RecordStore(size_t capacity, OverflowSink overflow = nullptr)
      : capacity_(capacity == 0 ? 1 : capacity), overflow_(std::move(overflow)) {}

  const AcquisitionRecord &append(AcquisitionRecord record) {
    record.sequence_number = total_ + 1;
    ++total_;
    hashes_.insert(record.transaction_hash);

    if (records_.size() >= capacity_) {
      if (overflow_) {
        overflow_(records_.front());
      } else if (evicted_ == 0) {
        std::cerr << "[Records] capacity " << capacity_ << " reached without overflow sink, dropping oldest"
                  << std::endl;
      }
      records_.pop_front();
      ++evicted_;
    }
    records_.push_back(std::move(record));
    return records_.back();
  }

  bool contains_transaction(const std::string &hash) const { return hashes_.count(hash) > 0; }

  std::vector<AcquisitionRecord> snapshot() const { return {records_.begin(), records_.end()}; }

  uint64_t total() const { return total_; }
  uint64_t evicted() const { return evicted_; }
  size_t size() const { return records_.size(); }
  size_t capacity() const { return capacity_; }

  void clear() {
    records_.clear();
    hashes_.clear();
    total_ = 0;
    evicted_ = 0;
  }

private:
  size_t capacity_;
  OverflowSink overflow_;
  std::deque<AcquisitionRecord> records_;
  std::unordered_set<std::string> hashes_;
  uint64_t total_ = 0;
  uint64_t evicted_ = 0;
};
