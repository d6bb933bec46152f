#include "svm/feature_set.h"
#include "common/base58.h"
#include "common/crypto_utils.h"

namespace periwinkle {
namespace svm {

namespace features {

namespace {

// Gate ids are the SHA-256 of the gate name
PublicKey feature_id_for(const std::string &name) {
  return CryptoUtils::sha256(
      std::vector<uint8_t>(name.begin(), name.end()));
}

const char DEPLETE_CU_METER_ON_VM_FAILURE[] = "deplete_cu_meter_on_vm_failure";
const char ENABLE_LOG_RETURN_DATA[] = "enable_log_return_data";

} // namespace

const PublicKey &deplete_cu_meter_on_vm_failure() {
  static const PublicKey id = feature_id_for(DEPLETE_CU_METER_ON_VM_FAILURE);
  return id;
}

const PublicKey &enable_log_return_data() {
  static const PublicKey id = feature_id_for(ENABLE_LOG_RETURN_DATA);
  return id;
}

const std::vector<PublicKey> &all_known() {
  static const std::vector<PublicKey> known = {
      deplete_cu_meter_on_vm_failure(),
      enable_log_return_data(),
  };
  return known;
}

std::string name_of(const PublicKey &feature_id) {
  if (feature_id == deplete_cu_meter_on_vm_failure()) {
    return DEPLETE_CU_METER_ON_VM_FAILURE;
  }
  if (feature_id == enable_log_return_data()) {
    return ENABLE_LOG_RETURN_DATA;
  }
  return base58_encode(feature_id);
}

} // namespace features

FeatureSet FeatureSet::all_enabled() {
  FeatureSet set;
  for (const auto &id : features::all_known()) {
    set.activate(id, 0);
  }
  return set;
}

void FeatureSet::activate(const PublicKey &feature_id, Slot slot) {
  active_[feature_id] = slot;
}

void FeatureSet::deactivate(const PublicKey &feature_id) {
  active_.erase(feature_id);
}

bool FeatureSet::is_active(const PublicKey &feature_id) const {
  return active_.count(feature_id) > 0;
}

std::vector<PublicKey> FeatureSet::inactive() const {
  std::vector<PublicKey> result;
  for (const auto &id : features::all_known()) {
    if (!is_active(id)) {
      result.push_back(id);
    }
  }
  return result;
}

uint64_t FeatureSet::id_prefix(const PublicKey &feature_id) {
  uint64_t prefix = 0;
  for (size_t i = 0; i < 8 && i < feature_id.size(); ++i) {
    prefix |= static_cast<uint64_t>(feature_id[i]) << (8 * i);
  }
  return prefix;
}

std::vector<uint64_t> FeatureSet::to_id_prefixes() const {
  std::vector<uint64_t> prefixes;
  prefixes.reserve(active_.size());
  for (const auto &[id, slot] : active_) {
    (void)slot;
    prefixes.push_back(id_prefix(id));
  }
  return prefixes;
}

FeatureSet FeatureSet::from_id_prefixes(const std::vector<uint64_t> &prefixes) {
  FeatureSet set;
  for (uint64_t prefix : prefixes) {
    for (const auto &id : features::all_known()) {
      if (id_prefix(id) == prefix) {
        set.activate(id, 0);
      }
    }
  }
  return set;
}

} // namespace svm
} // namespace periwinkle
