#pragma once

// ============================================================================
// 已知 DEX program 表
// program id -> exchange 名称 -> { operation 名称 -> 8 字节前导签名 }
// 同一 program 内按声明顺序匹配, 先匹配者胜
// ============================================================================

#include <array>
#include <cstdint>
#include <cstring>
#include <string>

namespace dex {

inline constexpr size_t SIGNATURE_LEN = 8;
inline constexpr size_t MAX_OPERATIONS = 2;

using Signature = std::array<uint8_t, SIGNATURE_LEN>;

struct Operation {
  const char *name;
  Signature signature;
};

struct ProgramDef {
  const char *program_id;
  const char *exchange;
  size_t operation_count;
  std::array<Operation, MAX_OPERATIONS> operations;
};

// AMM 签名并未完整收录; 全 0 签名为占位
inline constexpr ProgramDef PROGRAMS[] = {
    {"JUP4Fb2cqiRUcaTHdrPC8h2gNsA2ETXiPDD33WcGuJB", "Jupiter", 2,
     {{{"shared_route", {0x8b, 0x8f, 0x1f, 0x8c, 0x1c, 0x1a, 0x6a, 0x4a}},
       {"route", {0x8b, 0x8f, 0x1f, 0x8c, 0x1c, 0x1a, 0x6a, 0x4a}}}}},
    {"9W959DqEETiGZocYWCQPaJ6sBmUzgfxXfqGeTEdp3aQP", "Orca", 1,
     {{{"swap", {0xf8, 0xc6, 0x9e, 0x91, 0xe1, 0x75, 0x87, 0xc8}}}}},
    {"675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8", "Raydium", 1,
     {{{"swap", {0x09, 0x0a, 0x90, 0x1d, 0x0c, 0x0a, 0x0b, 0x0c}}}}},
    {"2wT8Yq49kHgDzXuPxZSaeLaH1qbmGXtEyPy64bL7aD3c", "Lifinity", 1,
     {{{"swap", {0x2e, 0x6b, 0x41, 0x5a, 0x9f, 0x8b, 0x7c, 0x3d}}}}},
    {"9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin", "Serum", 1,
     {{{"new_order", {0x10, 0x2c, 0x0b, 0x6e, 0x3f, 0x54, 0x8a, 0x9c}}}}},
    {"srmqPvymJeFKQ4zGQed1GFppgkRHL9kaELCbyksJtPX", "OpenBook", 1,
     {{{"new_order", {0x10, 0x2c, 0x0b, 0x6e, 0x3f, 0x54, 0x8a, 0x9c}}}}},
    {"PhoeNiXZ8ByJGLkxNfZRnkUfjvmuYqLR89jjFHGqdXY", "Phoenix", 1, {{{"swap", {}}}}},
    {"SSwpMgqNDsyV7mAgN9ady4bDVu5ySjmmXejXvy2vLt1", "Step", 1, {{{"swap", {}}}}},
    {"cysPXAjehMpVKUapzbMCCnpFxUFFryEWEaLgnb9NrR8", "Cykura", 1, {{{"swap", {}}}}},
    {"7WduLbRfYhTJktjLw5FDEyrqoEv61aTTCuGAetgLjzN5", "GooseFX", 1, {{{"swap", {}}}}},
    {"6MLxLqiXaaSUpkgMnWDTuejNZEz3kE7k2woyHGVFw319", "Crema", 1, {{{"swap", {}}}}},
    {"AMM55ShdkoGRB5jVYPjWziwk8m5MpwyDgsMWHaMSQWH6", "Aldrin", 1, {{{"swap", {}}}}},
    {"pAMMBay6oceH9fJKBRHGP5D4bD4sWpmSwMn52FMfXEA", "Pumpswap", 1, {{{"swap", {}}}}},
    {"Eo7WjKq67rjJQSZxS6z3YkapzY3eMj6Xy8X5EQVn5UaB", "Meteora", 1, {{{"swap", {}}}}},
};

inline constexpr size_t PROGRAM_COUNT = sizeof(PROGRAMS) / sizeof(PROGRAMS[0]);

inline const ProgramDef *find_program(const std::string &program_id) {
  for (const auto &p : PROGRAMS) {
    if (program_id == p.program_id)
      return &p;
  }
  return nullptr;
}

// payload 前 8 字节精确匹配; 无匹配返回 nullptr
inline const char *match_operation(const ProgramDef &program, const uint8_t *payload, size_t len) {
  if (len < SIGNATURE_LEN)
    return nullptr;
  for (size_t i = 0; i < program.operation_count; ++i) {
    const auto &op = program.operations[i];
    if (std::memcmp(payload, op.signature.data(), SIGNATURE_LEN) == 0)
      return op.name;
  }
  return nullptr;
}

} // namespace dex
