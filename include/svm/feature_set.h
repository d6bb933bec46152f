#pragma once

#include "common/types.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Runtime feature gates consulted during execution
 */
namespace features {

/// A faulting VM consumes the whole remaining compute budget
const PublicKey& deplete_cu_meter_on_vm_failure();

/// Setting return data also logs "Program return: <program> <base64>"
const PublicKey& enable_log_return_data();

/// Every feature gate the runtime knows about
const std::vector<PublicKey>& all_known();

/// Name of a known feature gate, or its base58 address otherwise
std::string name_of(const PublicKey& feature_id);

} // namespace features

/**
 * Set of feature gates with their activation slots
 *
 * Features not listed as active are inactive. `all_enabled()` activates
 * every known feature at slot 0.
 */
class FeatureSet {
public:
    FeatureSet() = default;

    static FeatureSet all_enabled();

    void activate(const PublicKey& feature_id, Slot slot);
    void deactivate(const PublicKey& feature_id);
    bool is_active(const PublicKey& feature_id) const;

    const std::map<PublicKey, Slot>& active() const { return active_; }

    /// Known features that are not active
    std::vector<PublicKey> inactive() const;

    /**
     * Little-endian u64 of the first eight bytes of each active feature id,
     * the compact form used by the interchange fixture layout
     */
    std::vector<uint64_t> to_id_prefixes() const;

    /// Rebuild from prefixes; prefixes that match no known feature are dropped
    static FeatureSet from_id_prefixes(const std::vector<uint64_t>& prefixes);

    static uint64_t id_prefix(const PublicKey& feature_id);

    bool operator==(const FeatureSet& other) const { return active_ == other.active_; }
    bool operator!=(const FeatureSet& other) const { return !(*this == other); }

private:
    std::map<PublicKey, Slot> active_;
};

} // namespace svm
} // namespace periwinkle
