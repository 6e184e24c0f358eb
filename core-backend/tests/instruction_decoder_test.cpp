#include <gtest/gtest.h>

#include "detect/instruction_decoder.hpp"
#include "test_support.hpp"

namespace {

RawTransaction tx_with(const std::vector<std::string> &keys) {
  RawTransaction tx;
  tx.signature = "decode-test";
  tx.account_keys = keys;
  return tx;
}

CompiledInstruction ix(uint32_t program_index, const std::vector<uint8_t> &payload) {
  CompiledInstruction c;
  c.program_id_index = program_index;
  c.accounts = {0, 1};
  c.data = fixtures::base58_encode(payload);
  return c;
}

} // namespace

TEST(instruction_decoder, matches_known_program_signature) {
  auto tx = tx_with({fixtures::BUYER, fixtures::ORCA});
  tx.instructions = {ix(1, fixtures::payload_for(fixtures::ORCA))};

  auto decoded = detect::decode(tx);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].exchange, "Orca");
  EXPECT_EQ(decoded[0].program_id, fixtures::ORCA);
  EXPECT_EQ(decoded[0].operation_type, "swap");
  EXPECT_TRUE(decoded[0].matched());
  EXPECT_FALSE(decoded[0].is_inner);
  EXPECT_EQ(decoded[0].accounts, (std::vector<uint32_t>{0, 1}));
}

TEST(instruction_decoder, first_declared_operation_wins_on_shared_signature) {
  auto tx = tx_with({fixtures::BUYER, fixtures::JUPITER});
  tx.instructions = {ix(1, fixtures::payload_for(fixtures::JUPITER, 1))};

  auto decoded = detect::decode(tx);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].exchange, "Jupiter");
  EXPECT_EQ(decoded[0].operation_type, "shared_route");
}

TEST(instruction_decoder, known_program_with_foreign_payload_is_unmatched) {
  auto tx = tx_with({fixtures::BUYER, fixtures::ORCA});
  tx.instructions = {ix(1, {1, 2, 3, 4, 5, 6, 7, 8, 9})};

  auto decoded = detect::decode(tx);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].operation_type, UNMATCHED_OPERATION);
  EXPECT_FALSE(decoded[0].matched());
}

TEST(instruction_decoder, payload_shorter_than_signature_is_unmatched) {
  auto tx = tx_with({fixtures::BUYER, fixtures::ORCA});
  tx.instructions = {ix(1, {0xf8, 0xc6, 0x9e})};

  auto decoded = detect::decode(tx);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].operation_type, UNMATCHED_OPERATION);
}

TEST(instruction_decoder, unknown_programs_are_dropped) {
  auto tx = tx_with({fixtures::BUYER, fixtures::SYSTEM_PROGRAM});
  tx.instructions = {ix(1, fixtures::payload_for(fixtures::ORCA))};
  EXPECT_TRUE(detect::decode(tx).empty());
}

TEST(instruction_decoder, inner_instructions_carry_parent_index) {
  auto tx = tx_with({fixtures::BUYER, fixtures::JUPITER, fixtures::ORCA});
  tx.instructions = {ix(1, fixtures::payload_for(fixtures::JUPITER))};
  tx.inner_instructions = {{0, {ix(2, fixtures::payload_for(fixtures::ORCA))}}};

  auto decoded = detect::decode(tx);
  ASSERT_EQ(decoded.size(), 2u);
  EXPECT_EQ(decoded[0].exchange, "Jupiter");
  EXPECT_FALSE(decoded[0].parent_index.has_value());
  EXPECT_EQ(decoded[1].exchange, "Orca");
  EXPECT_TRUE(decoded[1].is_inner);
  EXPECT_EQ(decoded[1].parent_index, std::optional<uint32_t>(0));
}

TEST(instruction_decoder, bad_instruction_is_dropped_and_others_kept) {
  auto tx = tx_with({fixtures::BUYER, fixtures::ORCA});
  CompiledInstruction bad_data = ix(1, {});
  bad_data.data = "0OIl";
  CompiledInstruction bad_index = ix(9, fixtures::payload_for(fixtures::ORCA));
  tx.instructions = {bad_data, bad_index, ix(1, fixtures::payload_for(fixtures::ORCA))};

  auto decoded = detect::decode(tx);
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].source_index, 2u);
}

TEST(instruction_decoder, single_instruction_failures_are_reported) {
  auto tx = tx_with({fixtures::BUYER, fixtures::ORCA});
  EXPECT_THROW(detect::decode_instruction(ix(5, {}), tx, 0, false, std::nullopt), DecodeFailure);

  CompiledInstruction bad = ix(1, {});
  bad.data = "not base58!";
  EXPECT_THROW(detect::decode_instruction(bad, tx, 0, false, std::nullopt), DecodeFailure);
}

TEST(instruction_decoder, decoding_is_idempotent) {
  auto tx = tx_with({fixtures::BUYER, fixtures::JUPITER, fixtures::ORCA});
  tx.instructions = {ix(1, fixtures::payload_for(fixtures::JUPITER)), ix(2, {9, 9})};
  tx.inner_instructions = {{0, {ix(2, fixtures::payload_for(fixtures::ORCA))}}};

  EXPECT_EQ(detect::decode(tx), detect::decode(tx));
}
