#pragma once

#include "common/types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace periwinkle {
namespace common {

/**
 * @brief Incremental SHA-256 over an OpenSSL digest context
 *
 * Throws std::runtime_error if OpenSSL cannot initialize or update the
 * context.
 */
class Sha256Hasher {
public:
  Sha256Hasher();

  Sha256Hasher &update(const uint8_t *data, size_t len);
  Sha256Hasher &update(const std::vector<uint8_t> &data) {
    return update(data.data(), data.size());
  }

  /// Produces the 32-byte digest. The hasher cannot be reused afterwards.
  Hash finalize();

private:
  struct ContextDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

/**
 * Hashing and text encoding helpers backed by OpenSSL
 */
class CryptoUtils {
public:
  static Hash sha256(const std::vector<uint8_t> &data);

  /// Digest of the concatenation of `data_chunks`
  static Hash sha256_multi(const std::vector<std::vector<uint8_t>> &data_chunks);

  /// Standard base64 with padding, as printed in "Program data:" logs
  static std::string base64_encode(const std::vector<uint8_t> &data);
};

} // namespace common
} // namespace periwinkle
