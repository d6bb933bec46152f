/**
 * Unit tests for the common utilities
 *
 * Covers:
 * - Result value and error handling
 * - base58 and hex encodings
 * - Little-endian byte codec
 * - SHA-256 and base64 helpers
 */

#include "common/base58.h"
#include "common/byte_codec.h"
#include "common/crypto_utils.h"
#include "common/types.h"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>

using namespace periwinkle::common;

class CommonTest : public ::testing::Test {
protected:
    void SetUp() override {
        zero_key = PublicKey(PUBKEY_BYTES, 0);
    }

    PublicKey zero_key;
};

// ============================================================================
// Result
// ============================================================================

// Test 1: ok and error states
TEST_F(CommonTest, ResultStates) {
    Result<int> success_result(42);
    EXPECT_TRUE(success_result.is_ok());
    EXPECT_FALSE(success_result.is_err());
    EXPECT_EQ(42, success_result.value());

    Result<int> error_result("Something went wrong");
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_TRUE(error_result.is_err());
    EXPECT_EQ("Something went wrong", error_result.error());
    EXPECT_EQ(7, error_result.value_or(7));
}

// Test 2: value can be moved out
TEST_F(CommonTest, ResultMoveSemantics) {
    Result<std::vector<uint8_t>> result(std::vector<uint8_t>{1, 2, 3});
    ASSERT_TRUE(result.is_ok());

    std::vector<uint8_t> moved = std::move(result).value();
    EXPECT_EQ((std::vector<uint8_t>{1, 2, 3}), moved);
}

// ============================================================================
// Encodings
// ============================================================================

// Test 3: leading zero bytes map to '1'
TEST_F(CommonTest, Base58ZeroKey) {
    EXPECT_EQ("11111111111111111111111111111111", base58_encode(zero_key));

    auto decoded = pubkey_from_base58("11111111111111111111111111111111");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(zero_key, decoded.value());
}

// Test 4: known vector
TEST_F(CommonTest, Base58KnownVector) {
    std::string text = "Hello World!";
    EXPECT_EQ("2NEpo7TZRRrLZSi2U",
              base58_encode(std::vector<uint8_t>(text.begin(), text.end())));
}

// Test 5: malformed input is rejected
TEST_F(CommonTest, Base58RejectsInvalidInput) {
    EXPECT_TRUE(base58_decode("0OIl").is_err());
    // Valid characters but not 32 bytes
    EXPECT_TRUE(pubkey_from_base58("2NEpo7TZRRrLZSi2U").is_err());
    EXPECT_THROW(pubkey_literal("not-a-key"), std::invalid_argument);
}

// Test 6: hex round trip and errors
TEST_F(CommonTest, HexEncoding) {
    EXPECT_EQ("00ff10", hex_encode({0x00, 0xff, 0x10}));

    auto decoded = hex_decode("00FF10");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ((std::vector<uint8_t>{0x00, 0xff, 0x10}), decoded.value());

    EXPECT_TRUE(hex_decode("abc").is_err());
    EXPECT_TRUE(hex_decode("zz").is_err());
}

// Test 7: unique keys never repeat
TEST_F(CommonTest, UniquePubkeys) {
    std::set<PublicKey> keys;
    for (int i = 0; i < 1000; ++i) {
        PublicKey key = new_unique_pubkey();
        EXPECT_EQ(PUBKEY_BYTES, key.size());
        EXPECT_TRUE(keys.insert(key).second);
    }
}

// ============================================================================
// Byte codec
// ============================================================================

// Test 8: values are written little-endian
TEST_F(CommonTest, ByteWriterLittleEndian) {
    ByteWriter writer;
    writer.put_u32(0x01020304);
    writer.put_u64(1);
    writer.put_bytes({0xaa, 0xbb});

    const auto& buffer = writer.buffer();
    ASSERT_EQ(4u + 8u + 8u + 2u, buffer.size());
    EXPECT_EQ(0x04, buffer[0]);
    EXPECT_EQ(0x01, buffer[3]);
    EXPECT_EQ(0x01, buffer[4]);
    EXPECT_EQ(0x02, buffer[12]);
    EXPECT_EQ(0xaa, buffer[20]);
}

// Test 9: reader fails once exhausted and stays failed
TEST_F(CommonTest, ByteReaderStaysFailed) {
    ByteWriter writer;
    writer.put_u32(5);
    writer.put_string("abc");
    writer.put_f64(0.5);
    std::vector<uint8_t> data = writer.take();

    ByteReader reader(data);
    uint32_t value = 0;
    std::string text;
    double ratio = 0;
    EXPECT_TRUE(reader.get_u32(value));
    EXPECT_TRUE(reader.get_string(text));
    EXPECT_TRUE(reader.get_f64(ratio));
    EXPECT_EQ(5u, value);
    EXPECT_EQ("abc", text);
    EXPECT_DOUBLE_EQ(0.5, ratio);
    EXPECT_TRUE(reader.at_end());

    uint8_t extra = 0;
    EXPECT_FALSE(reader.get_u8(extra));
    EXPECT_FALSE(reader.ok());
}

// Test 10: a length prefix larger than the input does not read past the end
TEST_F(CommonTest, ByteReaderOversizedLength) {
    ByteWriter writer;
    writer.put_u64(1000);
    writer.put_u8(1);
    std::vector<uint8_t> data = writer.take();

    ByteReader reader(data);
    std::vector<uint8_t> bytes;
    EXPECT_FALSE(reader.get_bytes(bytes));
    EXPECT_FALSE(reader.ok());
}

// ============================================================================
// Hashing
// ============================================================================

// Test 11: SHA-256 of the empty input and of chunks
TEST_F(CommonTest, Sha256) {
    Hash empty = CryptoUtils::sha256({});
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
              hex_encode(empty));

    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    EXPECT_EQ(CryptoUtils::sha256(abc),
              CryptoUtils::sha256_multi({{'a'}, {'b', 'c'}}));
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
              hex_encode(CryptoUtils::sha256(abc)));

    Sha256Hasher hasher;
    hasher.update(abc.data(), 1).update({'b', 'c'});
    EXPECT_EQ(CryptoUtils::sha256(abc), hasher.finalize());
    EXPECT_THROW(hasher.finalize(), std::logic_error);
}

// Test 12: padded base64
TEST_F(CommonTest, Base64) {
    EXPECT_EQ("", CryptoUtils::base64_encode({}));
    EXPECT_EQ("AQID", CryptoUtils::base64_encode({1, 2, 3}));
    EXPECT_EQ("AQI=", CryptoUtils::base64_encode({1, 2}));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
