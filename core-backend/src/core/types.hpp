#pragma once

// ============================================================================
// 链上数据类型(RPC 解析结果 + 检测产物)
// ============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

using BigInt = boost::multiprecision::cpp_int;
using BlockHeight = uint64_t;

// ============================================================================
// RawTransaction - getBlock 返回的单笔交易
// ============================================================================

// token 账户余额快照(交易执行前/后)
struct TokenBalance {
  uint32_t account_index = 0;
  std::string mint;
  std::string owner;
  std::string amount = "0"; // 原始整数金额(十进制字符串)
  int decimals = 0;
};

struct CompiledInstruction {
  uint32_t program_id_index = 0;
  std::vector<uint32_t> accounts;
  std::string data; // base58 编码的原始 payload
};

// inner instruction 按父指令 index 分组
struct InnerInstructionGroup {
  uint32_t index = 0;
  std::vector<CompiledInstruction> instructions;
};

struct RawTransaction {
  std::string signature;
  std::vector<std::string> account_keys; // 静态 key + loaded writable + loaded readonly
  std::vector<CompiledInstruction> instructions;
  std::vector<InnerInstructionGroup> inner_instructions;
  bool success = true;
  std::vector<TokenBalance> pre_token_balances;
  std::vector<TokenBalance> post_token_balances;
};

struct Block {
  BlockHeight height = 0;
  std::optional<int64_t> block_time; // 节点可能返回 null
  std::vector<RawTransaction> transactions;
};

// ============================================================================
// 检测中间产物(单次交易处理内有效)
// ============================================================================

struct BalanceDelta {
  std::string mint;
  uint32_t account_index = 0;
  BigInt delta;
  int decimals = 0;
};

inline constexpr const char *UNMATCHED_OPERATION = "unmatched";

struct DecodedInstruction {
  uint32_t source_index = 0;
  std::string program_id;
  std::string exchange;
  std::vector<uint32_t> accounts;
  std::vector<uint8_t> payload;
  std::string operation_type = UNMATCHED_OPERATION;
  bool is_inner = false;
  std::optional<uint32_t> parent_index;

  bool matched() const { return operation_type != UNMATCHED_OPERATION; }

  bool operator==(const DecodedInstruction &) const = default;
};

// ============================================================================
// AcquisitionRecord - 持久输出单元
// ============================================================================

enum class Confidence {
  HIGH,
  MEDIUM,
  LOW,
};

inline const char *confidence_name(Confidence c) {
  switch (c) {
  case Confidence::HIGH:
    return "high";
  case Confidence::MEDIUM:
    return "medium";
  case Confidence::LOW:
    return "low";
  }
  return "low";
}

inline std::optional<Confidence> parse_confidence(const std::string &s) {
  if (s == "high")
    return Confidence::HIGH;
  if (s == "medium")
    return Confidence::MEDIUM;
  if (s == "low")
    return Confidence::LOW;
  return std::nullopt;
}

struct AcquisitionRecord {
  std::string transaction_hash;
  std::string exchange_name;
  std::string target_token;
  std::string counter_token;
  std::string amount_acquired; // 原始整数(十进制字符串)
  std::string amount_spent;
  int target_decimals = 0;
  int counter_decimals = 0;
  int64_t block_timestamp = 0;
  std::string operation_type;
  std::string program_identifier;
  BlockHeight block_height = 0;
  uint64_t sequence_number = 0; // append 时分配
  std::string acquirer_address;
  std::string unit_price;
  Confidence confidence_level = Confidence::MEDIUM;

  bool operator==(const AcquisitionRecord &) const = default;
};
