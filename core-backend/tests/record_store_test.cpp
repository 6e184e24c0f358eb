#include <gtest/gtest.h>

#include "tracking/record_store.hpp"

namespace {

AcquisitionRecord record(const std::string &hash) {
  AcquisitionRecord r;
  r.transaction_hash = hash;
  return r;
}

} // namespace

TEST(record_store, sequence_numbers_start_at_one_and_increase) {
  RecordStore store(10);
  EXPECT_EQ(store.append(record("a")).sequence_number, 1u);
  EXPECT_EQ(store.append(record("b")).sequence_number, 2u);
  EXPECT_EQ(store.append(record("c")).sequence_number, 3u);
  EXPECT_EQ(store.total(), 3u);
  EXPECT_EQ(store.size(), 3u);
}

TEST(record_store, overflow_hands_oldest_to_sink) {
  std::vector<AcquisitionRecord> archived;
  RecordStore store(2, [&archived](const AcquisitionRecord &r) { archived.push_back(r); });

  store.append(record("a"));
  store.append(record("b"));
  store.append(record("c"));
  store.append(record("d"));

  ASSERT_EQ(archived.size(), 2u);
  EXPECT_EQ(archived[0].transaction_hash, "a");
  EXPECT_EQ(archived[1].sequence_number, 2u);

  auto kept = store.snapshot();
  ASSERT_EQ(kept.size(), 2u);
  EXPECT_EQ(kept[0].sequence_number, 3u);
  EXPECT_EQ(kept[1].sequence_number, 4u);
  EXPECT_EQ(store.total(), 4u);
  EXPECT_EQ(store.evicted(), 2u);
}

TEST(record_store, overflow_without_sink_drops_oldest) {
  RecordStore store(1);
  store.append(record("a"));
  store.append(record("b"));
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(store.snapshot()[0].transaction_hash, "b");
  EXPECT_EQ(store.total(), 2u);
}

TEST(record_store, remembers_transactions_after_eviction) {
  RecordStore store(1);
  store.append(record("a"));
  store.append(record("b"));
  EXPECT_TRUE(store.contains_transaction("a"));
  EXPECT_FALSE(store.contains_transaction("z"));
}

TEST(record_store, clear_restarts_sequence) {
  RecordStore store(4);
  store.append(record("a"));
  store.clear();
  EXPECT_EQ(store.total(), 0u);
  EXPECT_TRUE(store.snapshot().empty());
  EXPECT_FALSE(store.contains_transaction("a"));
  EXPECT_EQ(store.append(record("b")).sequence_number, 1u);
}
