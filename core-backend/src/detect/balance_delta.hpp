#pragma once

// ============================================================================
// 余额变化提取: post - pre (按 accountIndex + mint 配对)
// ============================================================================

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../core/types.hpp"

namespace detect {

// 金额字符串非法时抛 std::runtime_error(由调用方按交易丢弃)
inline std::vector<BalanceDelta> extract_deltas(const RawTransaction &tx) {
  using Key = std::pair<uint32_t, std::string>;

  std::map<Key, BigInt> pre;
  for (const auto &b : tx.pre_token_balances)
    pre.emplace(Key{b.account_index, b.mint}, BigInt(b.amount));

  std::vector<BalanceDelta> deltas;
  std::set<Key> seen;
  for (const auto &b : tx.post_token_balances) {
    Key key{b.account_index, b.mint};
    if (!seen.insert(key).second)
      continue;

    // 新建的 token 账户没有 pre 记录, 视为 0
    BigInt delta = BigInt(b.amount);
    auto it = pre.find(key);
    if (it != pre.end())
      delta -= it->second;

    if (delta == 0)
      continue;
    deltas.push_back({b.mint, b.account_index, std::move(delta), b.decimals});
  }
  return deltas;
}

} // namespace detect
