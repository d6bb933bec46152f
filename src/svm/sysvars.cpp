#include "svm/sysvars.h"
#include "common/base58.h"
#include "common/byte_codec.h"
#include "common/crypto_utils.h"
#include "svm/program_ids.h"
#include <algorithm>

namespace periwinkle {
namespace svm {

namespace {

constexpr uint64_t MINIMUM_SLOTS_PER_EPOCH = 32;

uint64_t trailing_zeros(uint64_t value) {
  if (value == 0)
    return 64;
  uint64_t count = 0;
  while ((value & 1) == 0) {
    value >>= 1;
    ++count;
  }
  return count;
}

uint64_t next_power_of_two(uint64_t value) {
  uint64_t power = 1;
  while (power < value) {
    power <<= 1;
  }
  return power;
}

// Placeholder bank hash recorded for slots skipped by warp_to_slot
Hash slot_hash_for(Slot slot) {
  ByteWriter writer;
  writer.put_u64(slot);
  return CryptoUtils::sha256(writer.buffer());
}

} // namespace

bool Clock::operator==(const Clock &other) const {
  return slot == other.slot &&
         epoch_start_timestamp == other.epoch_start_timestamp &&
         epoch == other.epoch &&
         leader_schedule_epoch == other.leader_schedule_epoch &&
         unix_timestamp == other.unix_timestamp;
}

bool EpochRewards::operator==(const EpochRewards &other) const {
  return distribution_starting_block_height ==
             other.distribution_starting_block_height &&
         num_partitions == other.num_partitions &&
         parent_blockhash == other.parent_blockhash &&
         total_points_lo == other.total_points_lo &&
         total_points_hi == other.total_points_hi &&
         total_rewards == other.total_rewards &&
         distributed_rewards == other.distributed_rewards &&
         active == other.active;
}

Epoch EpochSchedule::get_epoch(Slot slot) const {
  if (slot < first_normal_slot) {
    uint64_t epoch = trailing_zeros(next_power_of_two(
                         slot + MINIMUM_SLOTS_PER_EPOCH + 1)) -
                     trailing_zeros(MINIMUM_SLOTS_PER_EPOCH) - 1;
    return epoch;
  }
  if (slots_per_epoch == 0) {
    return first_normal_epoch;
  }
  return (slot - first_normal_slot) / slots_per_epoch + first_normal_epoch;
}

Epoch EpochSchedule::get_leader_schedule_epoch(Slot slot) const {
  if (slot < first_normal_slot) {
    return get_epoch(slot) + 1;
  }
  if (slots_per_epoch == 0) {
    return first_normal_epoch;
  }
  uint64_t new_slots_since_first_normal_slot =
      slot - first_normal_slot + leader_schedule_slot_offset;
  return new_slots_since_first_normal_slot / slots_per_epoch +
         first_normal_epoch;
}

Slot EpochSchedule::get_first_slot_in_epoch(Epoch epoch) const {
  if (epoch <= first_normal_epoch) {
    return ((uint64_t{1} << epoch) - 1) * MINIMUM_SLOTS_PER_EPOCH;
  }
  return (epoch - first_normal_epoch) * slots_per_epoch + first_normal_slot;
}

bool EpochSchedule::operator==(const EpochSchedule &other) const {
  return slots_per_epoch == other.slots_per_epoch &&
         leader_schedule_slot_offset == other.leader_schedule_slot_offset &&
         warmup == other.warmup &&
         first_normal_epoch == other.first_normal_epoch &&
         first_normal_slot == other.first_normal_slot;
}

Lamports Rent::minimum_balance(size_t data_len) const {
  uint64_t bytes = ACCOUNT_STORAGE_OVERHEAD + data_len;
  return static_cast<Lamports>(
      static_cast<double>(bytes * lamports_per_byte_year) * exemption_threshold);
}

bool Rent::is_exempt(Lamports balance, size_t data_len) const {
  return balance >= minimum_balance(data_len);
}

bool Rent::operator==(const Rent &other) const {
  return lamports_per_byte_year == other.lamports_per_byte_year &&
         exemption_threshold == other.exemption_threshold &&
         burn_percent == other.burn_percent;
}

void Sysvars::warp_to_slot(Slot slot) {
  Slot previous = clock.slot;

  Clock next;
  next.slot = slot;
  next.epoch = epoch_schedule.get_epoch(slot);
  next.leader_schedule_epoch = epoch_schedule.get_leader_schedule_epoch(slot);
  clock = next;

  if (slot <= previous) {
    return;
  }

  // Only the newest MAX_SLOT_HASHES entries survive
  Slot first = slot - previous > MAX_SLOT_HASHES ? slot - MAX_SLOT_HASHES
                                                   : previous;
  if (first != previous) {
    slot_hashes.clear();
  }
  for (Slot s = first; s < slot; ++s) {
    slot_hashes.insert(slot_hashes.begin(), {s, slot_hash_for(s)});
  }
  if (slot_hashes.size() > MAX_SLOT_HASHES) {
    slot_hashes.resize(MAX_SLOT_HASHES);
  }
}

const PublicKey &Sysvars::clock_id() {
  static const PublicKey id =
      pubkey_literal("SysvarC1ock11111111111111111111111111111111");
  return id;
}

const PublicKey &Sysvars::epoch_rewards_id() {
  static const PublicKey id =
      pubkey_literal("SysvarEpochRewards1111111111111111111111111");
  return id;
}

const PublicKey &Sysvars::epoch_schedule_id() {
  static const PublicKey id =
      pubkey_literal("SysvarEpochSchedu1e111111111111111111111111");
  return id;
}

const PublicKey &Sysvars::last_restart_slot_id() {
  static const PublicKey id =
      pubkey_literal("SysvarLastRestartS1ot1111111111111111111111");
  return id;
}

const PublicKey &Sysvars::rent_id() {
  static const PublicKey id =
      pubkey_literal("SysvarRent111111111111111111111111111111111");
  return id;
}

const PublicKey &Sysvars::slot_hashes_id() {
  static const PublicKey id =
      pubkey_literal("SysvarS1otHashes111111111111111111111111111");
  return id;
}

const PublicKey &Sysvars::stake_history_id() {
  static const PublicKey id =
      pubkey_literal("SysvarStakeHistory1111111111111111111111111");
  return id;
}

bool Sysvars::is_sysvar_id(const PublicKey &id) {
  return id == clock_id() || id == epoch_rewards_id() ||
         id == epoch_schedule_id() || id == last_restart_slot_id() ||
         id == rent_id() || id == slot_hashes_id() || id == stake_history_id();
}

std::vector<uint8_t> Sysvars::clock_bytes() const {
  ByteWriter writer;
  writer.put_u64(clock.slot);
  writer.put_i64(clock.epoch_start_timestamp);
  writer.put_u64(clock.epoch);
  writer.put_u64(clock.leader_schedule_epoch);
  writer.put_i64(clock.unix_timestamp);
  return writer.take();
}

std::vector<uint8_t> Sysvars::epoch_rewards_bytes() const {
  ByteWriter writer;
  writer.put_u64(epoch_rewards.distribution_starting_block_height);
  writer.put_u64(epoch_rewards.num_partitions);
  writer.put_key(epoch_rewards.parent_blockhash);
  writer.put_u64(epoch_rewards.total_points_lo);
  writer.put_u64(epoch_rewards.total_points_hi);
  writer.put_u64(epoch_rewards.total_rewards);
  writer.put_u64(epoch_rewards.distributed_rewards);
  writer.put_bool(epoch_rewards.active);
  return writer.take();
}

std::vector<uint8_t> Sysvars::epoch_schedule_bytes() const {
  ByteWriter writer;
  writer.put_u64(epoch_schedule.slots_per_epoch);
  writer.put_u64(epoch_schedule.leader_schedule_slot_offset);
  writer.put_bool(epoch_schedule.warmup);
  writer.put_u64(epoch_schedule.first_normal_epoch);
  writer.put_u64(epoch_schedule.first_normal_slot);
  return writer.take();
}

std::vector<uint8_t> Sysvars::last_restart_slot_bytes() const {
  ByteWriter writer;
  writer.put_u64(last_restart_slot);
  return writer.take();
}

std::vector<uint8_t> Sysvars::rent_bytes() const {
  ByteWriter writer;
  writer.put_u64(rent.lamports_per_byte_year);
  writer.put_f64(rent.exemption_threshold);
  writer.put_u8(rent.burn_percent);
  return writer.take();
}

std::vector<uint8_t> Sysvars::slot_hashes_bytes() const {
  ByteWriter writer;
  writer.put_u64(slot_hashes.size());
  for (const auto &[slot, hash] : slot_hashes) {
    writer.put_u64(slot);
    writer.put_key(hash);
  }
  return writer.take();
}

std::vector<uint8_t> Sysvars::stake_history_bytes() const {
  ByteWriter writer;
  writer.put_u64(stake_history.size());
  for (const auto &[epoch, entry] : stake_history) {
    writer.put_u64(epoch);
    writer.put_u64(entry.effective);
    writer.put_u64(entry.activating);
    writer.put_u64(entry.deactivating);
  }
  return writer.take();
}

std::optional<std::vector<uint8_t>> Sysvars::data_for(const PublicKey &id) const {
  if (id == clock_id())
    return clock_bytes();
  if (id == epoch_rewards_id())
    return epoch_rewards_bytes();
  if (id == epoch_schedule_id())
    return epoch_schedule_bytes();
  if (id == last_restart_slot_id())
    return last_restart_slot_bytes();
  if (id == rent_id())
    return rent_bytes();
  if (id == slot_hashes_id())
    return slot_hashes_bytes();
  if (id == stake_history_id())
    return stake_history_bytes();
  return std::nullopt;
}

std::optional<KeyedAccount> Sysvars::keyed_account_for(const PublicKey &id) const {
  auto data = data_for(id);
  if (!data) {
    return std::nullopt;
  }
  Account account;
  account.lamports = std::max<Lamports>(rent.minimum_balance(data->size()), 1);
  account.data = std::move(*data);
  account.owner = program_ids::sysvar_owner();
  return KeyedAccount{id, std::move(account)};
}

bool Sysvars::operator==(const Sysvars &other) const {
  return clock == other.clock && epoch_rewards == other.epoch_rewards &&
         epoch_schedule == other.epoch_schedule &&
         last_restart_slot == other.last_restart_slot && rent == other.rent &&
         slot_hashes == other.slot_hashes &&
         stake_history == other.stake_history;
}

} // namespace svm
} // namespace periwinkle
