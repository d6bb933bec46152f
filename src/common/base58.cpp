#include "common/base58.h"
#include <stdexcept>

namespace periwinkle {
namespace common {

namespace {

const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_index(char c) {
  for (int i = 0; i < 58; ++i) {
    if (BASE58_ALPHABET[i] == c) {
      return i;
    }
  }
  return -1;
}

} // namespace

std::string base58_encode(const std::vector<uint8_t> &data) {
  if (data.empty())
    return "";

  // Little-endian base58 digits of the big-endian input number
  std::vector<uint8_t> digits;
  for (uint8_t byte : data) {
    uint32_t carry = byte;
    for (size_t i = 0; i < digits.size(); ++i) {
      carry += static_cast<uint32_t>(digits[i]) << 8;
      digits[i] = carry % 58;
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  std::string result;
  for (uint8_t byte : data) {
    if (byte != 0)
      break;
    result += BASE58_ALPHABET[0];
  }

  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += BASE58_ALPHABET[*it];
  }

  return result;
}

Result<std::vector<uint8_t>> base58_decode(const std::string &encoded) {
  // Little-endian base256 bytes of the number
  std::vector<uint8_t> bytes;
  for (char c : encoded) {
    int index = base58_index(c);
    if (index < 0) {
      return Result<std::vector<uint8_t>>(
          std::string("invalid base58 character '") + c + "'");
    }
    uint32_t carry = static_cast<uint32_t>(index);
    for (size_t i = 0; i < bytes.size(); ++i) {
      carry += static_cast<uint32_t>(bytes[i]) * 58;
      bytes[i] = carry & 0xff;
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(carry & 0xff);
      carry >>= 8;
    }
  }

  std::vector<uint8_t> result;
  for (char c : encoded) {
    if (c != BASE58_ALPHABET[0])
      break;
    result.push_back(0);
  }
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return Result<std::vector<uint8_t>>(std::move(result));
}

Result<PublicKey> pubkey_from_base58(const std::string &encoded) {
  auto decoded = base58_decode(encoded);
  if (decoded.is_err()) {
    return Result<PublicKey>(decoded.error());
  }
  if (decoded.value().size() != PUBKEY_BYTES) {
    return Result<PublicKey>("address '" + encoded + "' decodes to " +
                             std::to_string(decoded.value().size()) +
                             " bytes, expected 32");
  }
  return Result<PublicKey>(std::move(decoded).value());
}

PublicKey pubkey_literal(const char *encoded) {
  auto key = pubkey_from_base58(encoded);
  if (key.is_err()) {
    throw std::invalid_argument(key.error());
  }
  return std::move(key).value();
}

} // namespace common
} // namespace periwinkle
