#include <gtest/gtest.h>

#include "detect/acquisition_classifier.hpp"
#include "detect/balance_delta.hpp"
#include "detect/instruction_decoder.hpp"
#include "test_support.hpp"

namespace {

const detect::BlockContext CTX{250000000, 1700000123};

std::vector<AcquisitionRecord> run(const RawTransaction &tx, const std::string &target = fixtures::TARGET) {
  return detect::classify(tx, detect::extract_deltas(tx), detect::decode(tx), target, CTX);
}

} // namespace

TEST(acquisition_classifier, orca_buy_produces_high_confidence_record) {
  auto tx = fixtures::buy_tx("5xSig", "1000000", "1000000000");
  auto records = run(tx);

  ASSERT_EQ(records.size(), 1u);
  const auto &r = records[0];
  EXPECT_EQ(r.transaction_hash, "5xSig");
  EXPECT_EQ(r.exchange_name, "Orca");
  EXPECT_EQ(r.program_identifier, fixtures::ORCA);
  EXPECT_EQ(r.operation_type, "swap");
  EXPECT_EQ(r.target_token, fixtures::TARGET);
  EXPECT_EQ(r.counter_token, fixtures::WSOL);
  EXPECT_EQ(r.amount_acquired, "1000000");
  EXPECT_EQ(r.amount_spent, "1000000000");
  EXPECT_EQ(r.target_decimals, 6);
  EXPECT_EQ(r.counter_decimals, 9);
  EXPECT_EQ(r.block_height, CTX.height);
  EXPECT_EQ(r.block_timestamp, CTX.timestamp);
  EXPECT_EQ(r.acquirer_address, fixtures::BUYER);
  EXPECT_EQ(r.confidence_level, Confidence::HIGH);
  // 1e9 / 1e6 * 10^(6-9)
  EXPECT_EQ(r.unit_price, "1.00000000");
}

TEST(acquisition_classifier, equal_decimals_price_is_raw_ratio) {
  auto tx = fixtures::buy_tx("sig", "1000000", "1000000000", fixtures::ORCA, 6, 6);
  auto records = run(tx);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].unit_price, "1000.00000000");
}

TEST(acquisition_classifier, price_rounds_half_up_to_eight_digits) {
  EXPECT_EQ(detect::format_unit_price(BigInt(2), BigInt(3), 0, 0), "0.66666667");
  EXPECT_EQ(detect::format_unit_price(BigInt(1), BigInt(3), 0, 0), "0.33333333");
  EXPECT_EQ(detect::format_unit_price(BigInt(1), BigInt(200000000), 0, 0), "0.00000001");
  EXPECT_EQ(detect::format_unit_price(BigInt(5), BigInt(1), 2, 0), "500.00000000");
  EXPECT_EQ(detect::format_unit_price(BigInt(7), BigInt(0), 6, 9), "0");
}

TEST(acquisition_classifier, sale_of_target_is_not_an_acquisition) {
  RawTransaction tx = fixtures::buy_tx("sell", "1000000", "1000000000");
  // 目标减少, 对手 token 增加
  tx.pre_token_balances = {fixtures::balance(1, fixtures::TARGET, "5000000", 6),
                           fixtures::balance(2, fixtures::WSOL, "0", 9)};
  tx.post_token_balances = {fixtures::balance(1, fixtures::TARGET, "4000000", 6),
                            fixtures::balance(2, fixtures::WSOL, "900000000", 9)};
  EXPECT_TRUE(run(tx).empty());
}

TEST(acquisition_classifier, transaction_without_target_delta_is_ignored) {
  auto tx = fixtures::buy_tx("other", "1000000", "1000000000");
  EXPECT_TRUE(run(tx, fixtures::OTHER_MINT).empty());
}

TEST(acquisition_classifier, target_increase_without_spend_is_ignored) {
  RawTransaction tx = fixtures::buy_tx("airdrop", "1000000", "1000000000");
  tx.pre_token_balances = {fixtures::balance(1, fixtures::TARGET, "0", 6)};
  tx.post_token_balances = {fixtures::balance(1, fixtures::TARGET, "1000000", 6)};
  EXPECT_TRUE(run(tx).empty());
}

TEST(acquisition_classifier, no_known_program_yields_potential_buy) {
  auto tx = fixtures::buy_tx("sig", "1000000", "1000000000", fixtures::SYSTEM_PROGRAM);
  auto records = run(tx);

  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].exchange_name, "Unknown");
  EXPECT_EQ(records[0].program_identifier, "unknown");
  EXPECT_EQ(records[0].operation_type, "potential_buy");
  EXPECT_EQ(records[0].confidence_level, Confidence::MEDIUM);
}

TEST(acquisition_classifier, unmatched_known_program_is_medium) {
  auto tx = fixtures::buy_tx("sig", "1000000", "1000000000");
  tx.instructions[0].data = fixtures::base58_encode({1, 2, 3, 4, 5, 6, 7, 8, 9});
  auto records = run(tx);

  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].exchange_name, "Orca");
  EXPECT_EQ(records[0].operation_type, UNMATCHED_OPERATION);
  EXPECT_EQ(records[0].confidence_level, Confidence::MEDIUM);
}

TEST(acquisition_classifier, one_record_per_decoded_instruction) {
  auto tx = fixtures::buy_tx("route", "1000000", "1000000000", fixtures::JUPITER);
  tx.account_keys.push_back(fixtures::ORCA);
  CompiledInstruction inner;
  inner.program_id_index = 4;
  inner.data = fixtures::base58_encode(fixtures::payload_for(fixtures::ORCA));
  tx.inner_instructions = {{0, {inner}}};

  auto records = run(tx);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].exchange_name, "Jupiter");
  EXPECT_EQ(records[1].exchange_name, "Orca");
  EXPECT_EQ(records[0].transaction_hash, records[1].transaction_hash);
  EXPECT_EQ(records[0].amount_acquired, records[1].amount_acquired);
}

TEST(acquisition_classifier, largest_legs_are_chosen) {
  RawTransaction tx = fixtures::buy_tx("multi", "1000000", "1000000000");
  tx.account_keys.push_back("AccountFour1111111111111111111111111111111");
  tx.pre_token_balances.push_back(fixtures::balance(4, fixtures::OTHER_MINT, "9000000", 6));
  tx.post_token_balances.push_back(fixtures::balance(4, fixtures::OTHER_MINT, "8999000", 6));
  tx.post_token_balances.push_back(fixtures::balance(5, fixtures::TARGET, "3000", 6));

  auto records = run(tx);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].amount_acquired, "1000000");
  EXPECT_EQ(records[0].counter_token, fixtures::WSOL);
  EXPECT_EQ(records[0].amount_spent, "1000000000");
}

TEST(acquisition_classifier, dust_legs_are_low_confidence) {
  auto tx = fixtures::buy_tx("dust", "1000", "1000000000");
  auto records = run(tx);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].confidence_level, Confidence::LOW);
}

TEST(acquisition_classifier, missing_account_keys_leave_acquirer_unknown) {
  auto tx = fixtures::buy_tx("nokeys", "1000000", "1000000000");
  auto deltas = detect::extract_deltas(tx);
  tx.account_keys.clear();
  auto records = detect::classify(tx, deltas, {}, fixtures::TARGET, CTX);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].acquirer_address, "unknown");
}

TEST(acquisition_classifier, balance_only_buy_without_decoded_instructions) {
  RawTransaction tx = fixtures::buy_tx("bal", "1000000", "1000000000");
  tx.pre_token_balances = {fixtures::balance(1, fixtures::TARGET, "0", 6),
                           fixtures::balance(2, fixtures::WSOL, "5000000000", 9)};
  tx.post_token_balances = {fixtures::balance(1, fixtures::TARGET, "1000000", 6),
                            fixtures::balance(2, fixtures::WSOL, "4000000000", 9)};

  auto records = detect::classify(tx, detect::extract_deltas(tx), {}, fixtures::TARGET, CTX);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].amount_acquired, "1000000");
  EXPECT_EQ(records[0].amount_spent, "1000000000");
  EXPECT_EQ(records[0].confidence_level, Confidence::MEDIUM);
  EXPECT_EQ(records[0].operation_type, "potential_buy");
  EXPECT_EQ(records[0].unit_price, "1.00000000");
}
