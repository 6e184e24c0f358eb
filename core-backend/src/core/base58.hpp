#pragma once

// ============================================================================
// base58 解码 + 地址格式校验
// ============================================================================

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

namespace base58 {

inline constexpr const char *ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// 地址长度范围(32 字节公钥的 base58 表示)
inline constexpr size_t MIN_ADDRESS_LEN = 32;
inline constexpr size_t MAX_ADDRESS_LEN = 44;

inline const std::array<int8_t, 128> &index_table() {
  static const std::array<int8_t, 128> table = [] {
    std::array<int8_t, 128> t{};
    t.fill(-1);
    for (int i = 0; ALPHABET[i] != '\0'; ++i)
      t[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    return t;
  }();
  return table;
}

inline bool is_base58_char(char c) {
  auto uc = static_cast<unsigned char>(c);
  return uc < 128 && index_table()[uc] >= 0;
}

inline std::vector<uint8_t> decode(const std::string &text) {
  const auto &table = index_table();

  size_t leading_zeros = 0;
  while (leading_zeros < text.size() && text[leading_zeros] == '1')
    ++leading_zeros;

  // little-endian 累加: bytes = bytes * 58 + digit
  std::vector<uint8_t> bytes;
  bytes.reserve(text.size());
  for (size_t i = leading_zeros; i < text.size(); ++i) {
    auto uc = static_cast<unsigned char>(text[i]);
    if (uc >= 128 || table[uc] < 0)
      throw DecodeFailure("invalid base58 character at " + std::to_string(i));

    uint32_t carry = static_cast<uint32_t>(table[uc]);
    for (auto &b : bytes) {
      carry += static_cast<uint32_t>(b) * 58;
      b = static_cast<uint8_t>(carry & 0xff);
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<uint8_t>(carry & 0xff));
      carry >>= 8;
    }
  }

  std::vector<uint8_t> result(leading_zeros, 0);
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return result;
}

// 长度 32..44 且只含 base58 字符
inline bool is_valid_address(const std::string &address) {
  if (address.size() < MIN_ADDRESS_LEN || address.size() > MAX_ADDRESS_LEN)
    return false;
  for (char c : address) {
    if (!is_base58_char(c))
      return false;
  }
  return true;
}

} // namespace base58
