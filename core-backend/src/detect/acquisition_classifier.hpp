#pragma once

// ============================================================================
// Acquisition 分类
// 目标 token 某账户余额增加 + 其他 token 余额减少 => 买入
// ============================================================================

#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "../core/types.hpp"

namespace detect {

inline constexpr int PRICE_PRECISION = 8;
inline constexpr int64_t DUST_THRESHOLD = 1000; // 原始单位, 不超过此值的一侧降为 low

struct BlockContext {
  BlockHeight height = 0;
  int64_t timestamp = 0;
};

inline BigInt pow10(int exponent) {
  return boost::multiprecision::pow(BigInt(10), static_cast<unsigned>(exponent));
}

// spent / acquired * 10^(target_decimals - counter_decimals), 四舍五入到 8 位小数
inline std::string format_unit_price(const BigInt &spent, const BigInt &acquired, int target_decimals,
                                     int counter_decimals) {
  if (acquired == 0)
    return "0";

  BigInt num = spent * pow10(PRICE_PRECISION);
  BigInt den = acquired;
  int exponent = target_decimals - counter_decimals;
  if (exponent >= 0)
    num *= pow10(exponent);
  else
    den *= pow10(-exponent);

  BigInt scaled = (num * 2 + den) / (den * 2);
  BigInt unit = pow10(PRICE_PRECISION);
  std::string frac = BigInt(scaled % unit).str();
  frac.insert(0, PRICE_PRECISION - frac.size(), '0');
  return BigInt(scaled / unit).str() + "." + frac;
}

// 返回空表示无关或无法判定; 序号由 session append 时分配
inline std::vector<AcquisitionRecord> classify(const RawTransaction &tx, const std::vector<BalanceDelta> &deltas,
                                               const std::vector<DecodedInstruction> &decoded,
                                               const std::string &target_token, const BlockContext &ctx) {
  const BalanceDelta *acquired = nullptr;
  bool touches_target = false;
  for (const auto &d : deltas) {
    if (d.mint != target_token)
      continue;
    touches_target = true;
    if (d.delta > 0 && (!acquired || d.delta > acquired->delta))
      acquired = &d;
  }
  if (!touches_target || !acquired)
    return {};

  const BalanceDelta *spent = nullptr;
  for (const auto &d : deltas) {
    if (d.mint == target_token || d.delta >= 0)
      continue;
    if (!spent || d.delta < spent->delta)
      spent = &d;
  }
  if (!spent)
    return {};

  BigInt amount_spent = -spent->delta;

  AcquisitionRecord base;
  base.transaction_hash = tx.signature;
  base.target_token = target_token;
  base.counter_token = spent->mint;
  base.amount_acquired = acquired->delta.str();
  base.amount_spent = amount_spent.str();
  base.target_decimals = acquired->decimals;
  base.counter_decimals = spent->decimals;
  base.block_timestamp = ctx.timestamp;
  base.block_height = ctx.height;
  // fee payer 即发起钱包, 与实际收币的中间账户无关
  base.acquirer_address = tx.account_keys.empty() ? "unknown" : tx.account_keys.front();
  base.unit_price = format_unit_price(amount_spent, acquired->delta, acquired->decimals, spent->decimals);

  const bool dust = acquired->delta <= DUST_THRESHOLD || amount_spent <= DUST_THRESHOLD;

  std::vector<AcquisitionRecord> records;
  if (decoded.empty()) {
    AcquisitionRecord r = base;
    r.exchange_name = "Unknown";
    r.program_identifier = "unknown";
    r.operation_type = "potential_buy";
    r.confidence_level = dust ? Confidence::LOW : Confidence::MEDIUM;
    records.push_back(std::move(r));
    return records;
  }

  // 每条 DEX 指令独立产出, 不去重
  for (const auto &ix : decoded) {
    AcquisitionRecord r = base;
    r.exchange_name = ix.exchange;
    r.program_identifier = ix.program_id;
    r.operation_type = ix.operation_type;
    if (dust)
      r.confidence_level = Confidence::LOW;
    else
      r.confidence_level = ix.matched() ? Confidence::HIGH : Confidence::MEDIUM;
    records.push_back(std::move(r));
  }
  return records;
}

} // namespace detect
