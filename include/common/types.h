#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace periwinkle {
namespace common {

/**
 * @file types.h
 * @brief Byte-level aliases, address helpers and Result
 */

/// SHA-256 digest or blockhash (32 bytes)
using Hash = std::vector<uint8_t>;

/// Account or program address (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// Slot the harness pretends to execute in
using Slot = uint64_t;

/// Epoch as reported by the clock and epoch schedule sysvars
using Epoch = uint64_t;

/// Account balance unit
using Lamports = uint64_t;

/// Size in bytes of an address or hash
constexpr size_t PUBKEY_BYTES = 32;

/**
 * @brief Generate a fresh address for tests and examples
 *
 * Addresses are derived from a process-wide counter, so two calls never
 * return the same key.
 */
PublicKey new_unique_pubkey();

/// Lowercase hexadecimal rendering of a byte vector
std::string hex_encode(const std::vector<uint8_t> &bytes);

/**
 * @brief Value or error message
 *
 * Used for recoverable failures such as unreadable fixture files or
 * malformed program images. T must be default constructible and must not
 * be std::string, which would make the error constructor ambiguous.
 */
template <typename T> class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  explicit Result(const char *error) : success_(false), value_{}, error_(error) {}

  explicit Result(const std::string &error)
      : success_(false), value_{}, error_(error) {}

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  bool is_ok() const noexcept { return success_; }

  bool is_err() const noexcept { return !success_; }

  /// @warning Only meaningful when is_ok()
  const T &value() const & { return value_; }
  T &&value() && { return std::move(value_); }

  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

/// Parse lowercase or uppercase hexadecimal into bytes
Result<std::vector<uint8_t>> hex_decode(const std::string &hex);

} // namespace common
} // namespace periwinkle

/// Lets PublicKey and Hash key unordered containers
namespace std {
template <> struct hash<std::vector<uint8_t>> {
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
