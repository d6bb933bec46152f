#include "common/byte_codec.h"
#include <algorithm>
#include <cstring>

namespace periwinkle {
namespace common {

void ByteWriter::put_u32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back((value >> (i * 8)) & 0xFF);
  }
}

void ByteWriter::put_u64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back((value >> (i * 8)) & 0xFF);
  }
}

void ByteWriter::put_f64(double value) {
  uint64_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  put_u64(bits);
}

void ByteWriter::put_raw(const std::vector<uint8_t> &bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::put_key(const PublicKey &key) {
  std::vector<uint8_t> fixed(PUBKEY_BYTES, 0);
  std::memcpy(fixed.data(), key.data(), std::min(key.size(), PUBKEY_BYTES));
  put_raw(fixed);
}

void ByteWriter::put_bytes(const std::vector<uint8_t> &bytes) {
  put_u64(bytes.size());
  put_raw(bytes);
}

void ByteWriter::put_string(const std::string &value) {
  put_bytes(std::vector<uint8_t>(value.begin(), value.end()));
}

bool ByteReader::take(size_t len, const uint8_t *&out) {
  if (!ok_ || len > data_.size() - offset_) {
    ok_ = false;
    return false;
  }
  out = data_.data() + offset_;
  offset_ += len;
  return true;
}

bool ByteReader::get_u8(uint8_t &out) {
  const uint8_t *p = nullptr;
  if (!take(1, p))
    return false;
  out = p[0];
  return true;
}

bool ByteReader::get_bool(bool &out) {
  uint8_t byte = 0;
  if (!get_u8(byte))
    return false;
  if (byte > 1) {
    ok_ = false;
    return false;
  }
  out = byte == 1;
  return true;
}

bool ByteReader::get_u32(uint32_t &out) {
  const uint8_t *p = nullptr;
  if (!take(4, p))
    return false;
  out = 0;
  for (int i = 0; i < 4; ++i) {
    out |= static_cast<uint32_t>(p[i]) << (i * 8);
  }
  return true;
}

bool ByteReader::get_u64(uint64_t &out) {
  const uint8_t *p = nullptr;
  if (!take(8, p))
    return false;
  out = 0;
  for (int i = 0; i < 8; ++i) {
    out |= static_cast<uint64_t>(p[i]) << (i * 8);
  }
  return true;
}

bool ByteReader::get_i32(int32_t &out) {
  uint32_t raw = 0;
  if (!get_u32(raw))
    return false;
  out = static_cast<int32_t>(raw);
  return true;
}

bool ByteReader::get_i64(int64_t &out) {
  uint64_t raw = 0;
  if (!get_u64(raw))
    return false;
  out = static_cast<int64_t>(raw);
  return true;
}

bool ByteReader::get_f64(double &out) {
  uint64_t bits = 0;
  if (!get_u64(bits))
    return false;
  std::memcpy(&out, &bits, sizeof(out));
  return true;
}

bool ByteReader::get_raw(size_t len, std::vector<uint8_t> &out) {
  const uint8_t *p = nullptr;
  if (!take(len, p))
    return false;
  out.assign(p, p + len);
  return true;
}

bool ByteReader::get_key(PublicKey &out) {
  return get_raw(PUBKEY_BYTES, out);
}

bool ByteReader::get_bytes(std::vector<uint8_t> &out) {
  uint64_t len = 0;
  if (!get_u64(len))
    return false;
  if (len > remaining()) {
    ok_ = false;
    return false;
  }
  return get_raw(static_cast<size_t>(len), out);
}

bool ByteReader::get_string(std::string &out) {
  std::vector<uint8_t> bytes;
  if (!get_bytes(bytes))
    return false;
  out.assign(bytes.begin(), bytes.end());
  return true;
}

} // namespace common
} // namespace periwinkle
