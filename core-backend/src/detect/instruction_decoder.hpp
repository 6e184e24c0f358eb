#pragma once

// ============================================================================
// 指令解码: 顶层 + inner 指令 -> 已知 DEX program 的 DecodedInstruction
// 未知 program 直接丢弃; 已知 program 但签名不匹配 -> "unmatched"
// ============================================================================

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../core/base58.hpp"
#include "../core/dex_programs.hpp"
#include "../core/errors.hpp"
#include "../core/types.hpp"

namespace detect {

inline std::optional<DecodedInstruction> decode_instruction(const CompiledInstruction &ix, const RawTransaction &tx,
                                                            uint32_t source_index, bool is_inner,
                                                            std::optional<uint32_t> parent_index) {
  if (ix.program_id_index >= tx.account_keys.size())
    throw DecodeFailure("program index " + std::to_string(ix.program_id_index) + " outside account list of " +
                        std::to_string(tx.account_keys.size()));

  const std::string &program_id = tx.account_keys[ix.program_id_index];
  const dex::ProgramDef *program = dex::find_program(program_id);
  if (!program)
    return std::nullopt;

  DecodedInstruction d;
  d.source_index = source_index;
  d.program_id = program_id;
  d.exchange = program->exchange;
  d.accounts = ix.accounts;
  d.payload = base58::decode(ix.data);
  d.is_inner = is_inner;
  d.parent_index = parent_index;

  if (const char *op = dex::match_operation(*program, d.payload.data(), d.payload.size()))
    d.operation_type = op;
  return d;
}

// 纯函数: 同一输入得到同一输出; 单条指令失败只丢弃该条
inline std::vector<DecodedInstruction> decode(const RawTransaction &tx) {
  std::vector<DecodedInstruction> decoded;

  auto try_decode = [&](const CompiledInstruction &ix, uint32_t index, bool inner, std::optional<uint32_t> parent) {
    try {
      if (auto d = decode_instruction(ix, tx, index, inner, parent))
        decoded.push_back(std::move(*d));
    } catch (const DecodeFailure &e) {
      std::cerr << "[Decode] " << tx.signature.substr(0, 8) << "... instruction "
                << (inner ? "inner-" + std::to_string(parent.value_or(0)) + "-" : std::string()) << index
                << " dropped: " << e.what() << std::endl;
    }
  };

  for (uint32_t i = 0; i < tx.instructions.size(); ++i)
    try_decode(tx.instructions[i], i, false, std::nullopt);

  for (const auto &group : tx.inner_instructions) {
    for (uint32_t i = 0; i < group.instructions.size(); ++i)
      try_decode(group.instructions[i], i, true, group.index);
  }

  return decoded;
}

} // namespace detect
