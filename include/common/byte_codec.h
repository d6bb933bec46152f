#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace periwinkle {
namespace common {

/**
 * Little-endian byte writer used by sysvar layouts and fixture blobs
 */
class ByteWriter {
public:
    void put_u8(uint8_t value) { buffer_.push_back(value); }
    void put_bool(bool value) { buffer_.push_back(value ? 1 : 0); }
    void put_u32(uint32_t value);
    void put_u64(uint64_t value);
    void put_i32(int32_t value) { put_u32(static_cast<uint32_t>(value)); }
    void put_i64(int64_t value) { put_u64(static_cast<uint64_t>(value)); }
    void put_f64(double value);
    void put_raw(const std::vector<uint8_t>& bytes);
    /// Fixed 32-byte field
    void put_key(const PublicKey& key);
    /// u64 length prefix followed by the bytes
    void put_bytes(const std::vector<uint8_t>& bytes);
    void put_string(const std::string& value);

    const std::vector<uint8_t>& buffer() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * Bounds-checked little-endian reader
 *
 * Every read returns false once the input is exhausted; the reader then
 * stays failed so a sequence of reads can be checked once at the end.
 */
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data) {}

    bool get_u8(uint8_t& out);
    bool get_bool(bool& out);
    bool get_u32(uint32_t& out);
    bool get_u64(uint64_t& out);
    bool get_i32(int32_t& out);
    bool get_i64(int64_t& out);
    bool get_f64(double& out);
    bool get_raw(size_t len, std::vector<uint8_t>& out);
    bool get_key(PublicKey& out);
    bool get_bytes(std::vector<uint8_t>& out);
    bool get_string(std::string& out);

    bool ok() const { return ok_; }
    size_t remaining() const { return data_.size() - offset_; }
    bool at_end() const { return offset_ == data_.size(); }

private:
    bool take(size_t len, const uint8_t*& out);

    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
    bool ok_ = true;
};

} // namespace common
} // namespace periwinkle
