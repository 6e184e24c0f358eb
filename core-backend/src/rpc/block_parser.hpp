#pragma once

// ============================================================================
// getBlock(encoding=json) 结果 -> Block
// ============================================================================

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/types.hpp"

using json = nlohmann::json;

namespace block_parser {

inline std::string account_key(const json &key) {
  // json 编码为字符串, jsonParsed 编码为 {pubkey, signer, writable}
  if (key.is_object())
    return key.at("pubkey").get<std::string>();
  return key.get<std::string>();
}

inline TokenBalance parse_token_balance(const json &j) {
  TokenBalance b;
  b.account_index = j.at("accountIndex").get<uint32_t>();
  b.mint = j.at("mint").get<std::string>();
  if (j.contains("owner") && j["owner"].is_string())
    b.owner = j["owner"].get<std::string>();
  const auto &ui = j.at("uiTokenAmount");
  b.amount = ui.value("amount", std::string("0"));
  b.decimals = ui.value("decimals", 0);
  return b;
}

inline CompiledInstruction parse_instruction(const json &j) {
  CompiledInstruction ix;
  ix.program_id_index = j.at("programIdIndex").get<uint32_t>();
  if (j.contains("accounts"))
    ix.accounts = j["accounts"].get<std::vector<uint32_t>>();
  if (j.contains("data") && j["data"].is_string())
    ix.data = j["data"].get<std::string>();
  return ix;
}

inline RawTransaction parse_transaction(const json &j) {
  RawTransaction tx;
  const auto &transaction = j.at("transaction");
  const auto &message = transaction.at("message");

  const auto &signatures = transaction.at("signatures");
  if (!signatures.empty())
    tx.signature = signatures[0].get<std::string>();

  for (const auto &key : message.at("accountKeys"))
    tx.account_keys.push_back(account_key(key));

  for (const auto &ix : message.at("instructions"))
    tx.instructions.push_back(parse_instruction(ix));

  if (!j.contains("meta") || j["meta"].is_null()) {
    // 无 meta 无法判断执行结果, 按失败处理
    tx.success = false;
    return tx;
  }
  const auto &meta = j["meta"];
  tx.success = !meta.contains("err") || meta["err"].is_null();

  // v0 交易: 地址表加载的账户追加在静态 key 之后
  if (meta.contains("loadedAddresses") && meta["loadedAddresses"].is_object()) {
    const auto &loaded = meta["loadedAddresses"];
    for (const char *kind : {"writable", "readonly"}) {
      if (loaded.contains(kind)) {
        for (const auto &key : loaded[kind])
          tx.account_keys.push_back(key.get<std::string>());
      }
    }
  }

  if (meta.contains("innerInstructions") && meta["innerInstructions"].is_array()) {
    for (const auto &group : meta["innerInstructions"]) {
      InnerInstructionGroup g;
      g.index = group.at("index").get<uint32_t>();
      for (const auto &ix : group.at("instructions"))
        g.instructions.push_back(parse_instruction(ix));
      tx.inner_instructions.push_back(std::move(g));
    }
  }

  if (meta.contains("preTokenBalances") && meta["preTokenBalances"].is_array()) {
    for (const auto &b : meta["preTokenBalances"])
      tx.pre_token_balances.push_back(parse_token_balance(b));
  }
  if (meta.contains("postTokenBalances") && meta["postTokenBalances"].is_array()) {
    for (const auto &b : meta["postTokenBalances"])
      tx.post_token_balances.push_back(parse_token_balance(b));
  }

  return tx;
}

// 单笔交易格式错误只丢弃该交易
inline Block parse_block(BlockHeight height, const json &result) {
  Block block;
  block.height = height;
  if (result.contains("blockTime") && result["blockTime"].is_number_integer())
    block.block_time = result["blockTime"].get<int64_t>();

  if (!result.contains("transactions") || !result["transactions"].is_array())
    return block;

  const auto &txs = result["transactions"];
  block.transactions.reserve(txs.size());
  for (size_t i = 0; i < txs.size(); ++i) {
    try {
      block.transactions.push_back(parse_transaction(txs[i]));
    } catch (const json::exception &e) {
      std::cerr << "[Parse] block " << height << " tx #" << i << " malformed: " << e.what() << std::endl;
    }
  }
  return block;
}

} // namespace block_parser
