#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "core/database.hpp"
#include "core/record_json.hpp"
#include "test_support.hpp"
#include "tracking/session_registry.hpp"

using fixtures::FakeBlockSource;

namespace {

AcquisitionRecord record(uint64_t sequence, const std::string &acquirer, BlockHeight height = 100) {
  AcquisitionRecord r;
  r.transaction_hash = "sig-" + std::to_string(sequence);
  r.exchange_name = "Orca";
  r.target_token = fixtures::TARGET;
  r.counter_token = fixtures::WSOL;
  r.amount_acquired = "123456789012345678901234567890";
  r.amount_spent = "1000000000";
  r.target_decimals = 6;
  r.counter_decimals = 9;
  r.block_timestamp = 1700000123;
  r.operation_type = "swap";
  r.program_identifier = fixtures::ORCA;
  r.block_height = height;
  r.sequence_number = sequence;
  r.acquirer_address = acquirer;
  r.unit_price = "0.00000001";
  r.confidence_level = Confidence::HIGH;
  return r;
}

} // namespace

TEST(database, archived_records_load_unchanged) {
  Database db(":memory:");
  db.init_schema();

  auto a = record(1, fixtures::BUYER, 100);
  auto b = record(2, "unknown", 101);
  b.transaction_hash = "it's-quoted";
  b.confidence_level = Confidence::LOW;
  b.exchange_name = "Unknown";
  db.archive_records("trk-1", {a, b});

  auto loaded = db.load_records(fixtures::TARGET);
  ASSERT_EQ(loaded.size(), 2u);
  EXPECT_EQ(loaded[0], a);
  EXPECT_EQ(loaded[1], b);
  EXPECT_TRUE(db.load_records(fixtures::OTHER_MINT).empty());
}

TEST(database, archiving_same_sequence_twice_keeps_one_row) {
  Database db(":memory:");
  db.init_schema();

  db.archive_records("trk-1", {record(1, fixtures::BUYER)});
  db.archive_records("trk-1", {record(1, fixtures::BUYER), record(2, fixtures::BUYER)});
  EXPECT_EQ(db.load_records(fixtures::TARGET).size(), 2u);

  // 另一个会话的相同序号是不同的行
  db.archive_records("trk-2", {record(1, fixtures::BUYER)});
  EXPECT_EQ(db.load_records(fixtures::TARGET).size(), 3u);
}

TEST(database, load_records_respects_limit) {
  Database db(":memory:");
  db.init_schema();
  db.archive_records("trk-1", {record(1, fixtures::BUYER, 10), record(2, fixtures::BUYER, 11),
                               record(3, fixtures::BUYER, 12)});

  auto loaded = db.load_records(fixtures::TARGET, 2);
  ASSERT_EQ(loaded.size(), 2u);
  EXPECT_EQ(loaded[0].block_height, 10u);
  EXPECT_EQ(loaded[1].block_height, 11u);
}

TEST(database, repeat_acquirers_need_two_sessions) {
  Database db(":memory:");
  db.init_schema();

  const std::string once = "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin";
  db.archive_records("trk-1", {record(1, fixtures::BUYER), record(2, once), record(3, "unknown")});
  db.archive_records("trk-2", {record(1, fixtures::BUYER), record(2, "unknown")});
  // 同一会话内重复不算
  db.archive_records("trk-3", {record(1, once), record(2, once)});
  db.archive_records("trk-4", {record(1, fixtures::BUYER)});

  json rows = db.repeat_acquirers();
  std::vector<std::string> addresses;
  for (const auto &row : rows)
    addresses.push_back(row["acquirer_address"].get<std::string>());

  EXPECT_NE(std::find(addresses.begin(), addresses.end(), fixtures::BUYER), addresses.end());
  EXPECT_NE(std::find(addresses.begin(), addresses.end(), once), addresses.end());
  EXPECT_EQ(std::find(addresses.begin(), addresses.end(), "unknown"), addresses.end());
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0]["acquirer_address"], fixtures::BUYER);
  EXPECT_EQ(rows[0]["sessions"].get<int64_t>(), 3);

  json strict = db.repeat_acquirers(3);
  ASSERT_EQ(strict.size(), 1u);
  EXPECT_EQ(strict[0]["acquirer_address"], fixtures::BUYER);
}

TEST(database, registry_archives_overflow_and_stopped_sessions) {
  Database db(":memory:");
  db.init_schema();

  TrackingConfig cfg;
  cfg.target_count = 1;
  cfg.record_capacity = 2;
  SessionRegistry registry(
      cfg,
      []() -> std::unique_ptr<BlockSource> {
        auto source = std::make_unique<FakeBlockSource>();
        for (BlockHeight h = 0; h < 5; ++h)
          source->add_block(fixtures::buy_block(h));
        source->set_head(5);
        return source;
      },
      &db, nullptr);

  std::string id = registry.start_tracking(fixtures::TARGET, 0);
  ASSERT_TRUE(fixtures::wait_until([&] { return registry.get_progress(id).is_complete; }));

  // 溢出的 3 条已归档, 内存只保留最后 2 条
  EXPECT_EQ(registry.get_records(id).size(), 2u);
  EXPECT_EQ(db.load_records(fixtures::TARGET).size(), 3u);

  registry.stop_tracking(id);
  registry.stop_tracking(id);
  auto archived = db.load_records(fixtures::TARGET);
  ASSERT_EQ(archived.size(), 5u);
  for (size_t i = 0; i < archived.size(); ++i)
    EXPECT_EQ(archived[i].sequence_number, i + 1);
}

TEST(database, registry_import_archives_exported_records) {
  Database db(":memory:");
  db.init_schema();
  SessionRegistry registry(TrackingConfig{}, []() { return std::make_unique<FakeBlockSource>(); }, &db, nullptr);

  std::vector<AcquisitionRecord> records = {record(1, fixtures::BUYER, 7), record(2, fixtures::BUYER, 8)};
  EXPECT_EQ(registry.import_records(record_json::export_records(records)), 2u);
  EXPECT_EQ(db.load_records(fixtures::TARGET), records);

  // 每次导入是独立的会话
  EXPECT_EQ(registry.import_records(record_json::export_records(records)), 2u);
  EXPECT_EQ(db.load_records(fixtures::TARGET).size(), 4u);
  EXPECT_EQ(db.repeat_acquirers()[0]["acquirer_address"], fixtures::BUYER);

  EXPECT_THROW(registry.import_records("{\"not\": \"an array\"}"), TrackerError);
  EXPECT_EQ(db.load_records(fixtures::TARGET).size(), 4u);
}
