#include "common/crypto_utils.h"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace periwinkle {
namespace common {

void Sha256Hasher::ContextDeleter::operator()(evp_md_ctx_st *ctx) const {
  EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA-256 context");
  }
}

Sha256Hasher &Sha256Hasher::update(const uint8_t *data, size_t len) {
  if (!ctx_) {
    throw std::logic_error("SHA-256 context already finalized");
  }
  if (len != 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
  return *this;
}

Hash Sha256Hasher::finalize() {
  if (!ctx_) {
    throw std::logic_error("SHA-256 context already finalized");
  }
  Hash hash(SHA256_DIGEST_LENGTH);
  unsigned int len = SHA256_DIGEST_LENGTH;
  int rc = EVP_DigestFinal_ex(ctx_.get(), hash.data(), &len);
  ctx_.reset();
  if (rc != 1 || len != SHA256_DIGEST_LENGTH) {
    throw std::runtime_error("SHA-256 finalize failed");
  }
  return hash;
}

Hash CryptoUtils::sha256(const std::vector<uint8_t> &data) {
  return Sha256Hasher().update(data).finalize();
}

Hash CryptoUtils::sha256_multi(
    const std::vector<std::vector<uint8_t>> &data_chunks) {
  Sha256Hasher hasher;
  for (const auto &chunk : data_chunks) {
    hasher.update(chunk);
  }
  return hasher.finalize();
}

std::string CryptoUtils::base64_encode(const std::vector<uint8_t> &data) {
  if (data.empty()) {
    return "";
  }
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded[0]),
                                data.data(), static_cast<int>(data.size()));
  encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return encoded;
}

} // namespace common
} // namespace periwinkle
