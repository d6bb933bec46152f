#pragma once

#include "common/byte_codec.h"
#include "common/types.h"
#include "svm/account.h"
#include "svm/compute_budget.h"
#include "svm/feature_set.h"
#include "svm/sysvars.h"
#include <nlohmann/json.hpp>
#include <string>

namespace periwinkle {
namespace fixture {

using namespace periwinkle::common;

/**
 * Shared pieces of the fixture binary and JSON codecs
 *
 * Binary blobs start with the magic "PWFX", a u32 format version and a
 * u8 layout tag; everything after is little-endian with u64 length
 * prefixes.
 */
namespace codec {

constexpr uint32_t FORMAT_VERSION = 1;

enum class Layout : uint8_t {
    NATIVE = 0,
    FIREDANCER = 1,
};

void write_header(ByteWriter& writer, Layout layout);
/// Fails on a wrong magic, version or layout
Result<bool> read_header(ByteReader& reader, Layout expected);

void put_account(ByteWriter& writer, const svm::KeyedAccount& account);
bool get_account(ByteReader& reader, svm::KeyedAccount& account);

void put_compute_budget(ByteWriter& writer, const svm::ComputeBudget& budget);
bool get_compute_budget(ByteReader& reader, svm::ComputeBudget& budget);

void put_feature_set(ByteWriter& writer, const svm::FeatureSet& features);
bool get_feature_set(ByteReader& reader, svm::FeatureSet& features);

void put_sysvars(ByteWriter& writer, const svm::Sysvars& sysvars);
bool get_sysvars(ByteReader& reader, svm::Sysvars& sysvars);

// JSON: addresses are base58 strings, byte strings are hex
nlohmann::json key_to_json(const PublicKey& key);
PublicKey key_from_json(const nlohmann::json& value);
nlohmann::json bytes_to_json(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> bytes_from_json(const nlohmann::json& value);

nlohmann::json account_to_json(const svm::KeyedAccount& account);
svm::KeyedAccount account_from_json(const nlohmann::json& value);

nlohmann::json compute_budget_to_json(const svm::ComputeBudget& budget);
svm::ComputeBudget compute_budget_from_json(const nlohmann::json& value);

nlohmann::json feature_set_to_json(const svm::FeatureSet& features);
svm::FeatureSet feature_set_from_json(const nlohmann::json& value);

nlohmann::json sysvars_to_json(const svm::Sysvars& sysvars);
svm::Sysvars sysvars_from_json(const nlohmann::json& value);

} // namespace codec
} // namespace fixture
} // namespace periwinkle
