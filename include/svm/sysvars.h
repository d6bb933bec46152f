#pragma once

#include "common/types.h"
#include "svm/account.h"
#include <optional>
#include <utility>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Slot timing information
 */
struct Clock {
    Slot slot = 0;
    int64_t epoch_start_timestamp = 0;
    Epoch epoch = 0;
    Epoch leader_schedule_epoch = 0;
    int64_t unix_timestamp = 0;

    bool operator==(const Clock& other) const;
};

/**
 * Epoch rewards distribution state
 */
struct EpochRewards {
    uint64_t distribution_starting_block_height = 0;
    uint64_t num_partitions = 0;
    Hash parent_blockhash = Hash(PUBKEY_BYTES, 0);
    uint64_t total_points_lo = 0;            ///< Low half of the u128 point total
    uint64_t total_points_hi = 0;
    uint64_t total_rewards = 0;
    uint64_t distributed_rewards = 0;
    bool active = false;

    bool operator==(const EpochRewards& other) const;
};

/**
 * Slot to epoch mapping
 */
struct EpochSchedule {
    static constexpr uint64_t DEFAULT_SLOTS_PER_EPOCH = 432000;

    uint64_t slots_per_epoch = DEFAULT_SLOTS_PER_EPOCH;
    uint64_t leader_schedule_slot_offset = DEFAULT_SLOTS_PER_EPOCH;
    bool warmup = false;
    Epoch first_normal_epoch = 0;
    Slot first_normal_slot = 0;

    Epoch get_epoch(Slot slot) const;
    Epoch get_leader_schedule_epoch(Slot slot) const;
    Slot get_first_slot_in_epoch(Epoch epoch) const;

    bool operator==(const EpochSchedule& other) const;
};

/**
 * Rent parameters
 */
struct Rent {
    static constexpr Lamports DEFAULT_LAMPORTS_PER_BYTE_YEAR = 3480;
    static constexpr double DEFAULT_EXEMPTION_THRESHOLD = 2.0;
    static constexpr uint8_t DEFAULT_BURN_PERCENT = 50;
    /// Bytes charged per account on top of its data
    static constexpr uint64_t ACCOUNT_STORAGE_OVERHEAD = 128;

    Lamports lamports_per_byte_year = DEFAULT_LAMPORTS_PER_BYTE_YEAR;
    double exemption_threshold = DEFAULT_EXEMPTION_THRESHOLD;
    uint8_t burn_percent = DEFAULT_BURN_PERCENT;

    /// Minimum balance for an account of `data_len` bytes to be rent exempt
    Lamports minimum_balance(size_t data_len) const;
    bool is_exempt(Lamports balance, size_t data_len) const;

    bool operator==(const Rent& other) const;
};

struct StakeHistoryEntry {
    uint64_t effective = 0;
    uint64_t activating = 0;
    uint64_t deactivating = 0;

    bool operator==(const StakeHistoryEntry& other) const {
        return effective == other.effective && activating == other.activating &&
               deactivating == other.deactivating;
    }
};

/**
 * Sysvar values visible to executing programs
 *
 * Each sysvar has a well-known address and a canonical little-endian
 * layout; `keyed_account_for` produces the account a program would read.
 */
class Sysvars {
public:
    static constexpr size_t MAX_SLOT_HASHES = 512;
    static constexpr size_t MAX_STAKE_HISTORY = 512;

    Clock clock;
    EpochRewards epoch_rewards;
    EpochSchedule epoch_schedule;
    Slot last_restart_slot = 0;
    Rent rent;
    std::vector<std::pair<Slot, Hash>> slot_hashes;            ///< Newest first
    std::vector<std::pair<Epoch, StakeHistoryEntry>> stake_history;  ///< Newest first

    /**
     * Advance the clock to `slot`: updates slot, epoch and leader schedule
     * epoch, and records a slot hash for the slot being left
     */
    void warp_to_slot(Slot slot);

    static const PublicKey& clock_id();
    static const PublicKey& epoch_rewards_id();
    static const PublicKey& epoch_schedule_id();
    static const PublicKey& last_restart_slot_id();
    static const PublicKey& rent_id();
    static const PublicKey& slot_hashes_id();
    static const PublicKey& stake_history_id();

    static bool is_sysvar_id(const PublicKey& id);

    /// Serialized sysvar contents, or nothing for an unknown address
    std::optional<std::vector<uint8_t>> data_for(const PublicKey& id) const;

    /// Rent-exempt account owned by the sysvar program holding the sysvar
    std::optional<KeyedAccount> keyed_account_for(const PublicKey& id) const;

    std::vector<uint8_t> clock_bytes() const;
    std::vector<uint8_t> epoch_rewards_bytes() const;
    std::vector<uint8_t> epoch_schedule_bytes() const;
    std::vector<uint8_t> last_restart_slot_bytes() const;
    std::vector<uint8_t> rent_bytes() const;
    std::vector<uint8_t> slot_hashes_bytes() const;
    std::vector<uint8_t> stake_history_bytes() const;

    bool operator==(const Sysvars& other) const;
    bool operator!=(const Sysvars& other) const { return !(*this == other); }
};

} // namespace svm
} // namespace periwinkle
