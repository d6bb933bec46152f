#include "common/types.h"
#include <atomic>
#include <iomanip>
#include <sstream>

namespace periwinkle {
namespace common {

/**
 * @file types.cpp
 * @brief Template instantiations and helpers for common types
 */

template class Result<bool>;
template class Result<uint64_t>;
template class Result<std::vector<uint8_t>>;

PublicKey new_unique_pubkey() {
  static std::atomic<uint64_t> counter{1};
  uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);

  // Big-endian counter in the leading bytes keeps keys distinct and ordered
  PublicKey key(PUBKEY_BYTES, 0);
  for (int i = 0; i < 8; ++i) {
    key[i] = static_cast<uint8_t>(value >> (56 - 8 * i));
  }
  key[PUBKEY_BYTES - 1] = 0x01;
  return key;
}

std::string hex_encode(const std::vector<uint8_t> &bytes) {
  std::ostringstream oss;
  for (uint8_t byte : bytes) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(byte);
  }
  return oss.str();
}

Result<std::vector<uint8_t>> hex_decode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return Result<std::vector<uint8_t>>("hex string has odd length");
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return Result<std::vector<uint8_t>>("invalid hex digit at offset " +
                                          std::to_string(i));
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return Result<std::vector<uint8_t>>(std::move(bytes));
}

} // namespace common
} // namespace periwinkle
