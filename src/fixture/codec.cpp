#include "fixture/codec.h"
#include "common/base58.h"
#include <cstring>
#include <stdexcept>
#include <type_traits>

namespace periwinkle {
namespace fixture {
namespace codec {

namespace {

const uint8_t MAGIC[4] = {'P', 'W', 'F', 'X'};

/// Calls `visit(name, field)` for every compute budget field
template <typename Budget, typename Visitor>
void visit_compute_budget(Budget &b, Visitor &&visit) {
  visit("compute_unit_limit", b.compute_unit_limit);
  visit("heap_size", b.heap_size);
  visit("heap_cost", b.heap_cost);
  visit("max_invoke_stack_height", b.max_invoke_stack_height);
  visit("max_instruction_trace_length", b.max_instruction_trace_length);
  visit("max_call_depth", b.max_call_depth);
  visit("stack_frame_size", b.stack_frame_size);
  visit("log_64_units", b.log_64_units);
  visit("log_pubkey_units", b.log_pubkey_units);
  visit("syscall_base_cost", b.syscall_base_cost);
  visit("invoke_units", b.invoke_units);
  visit("cpi_bytes_per_unit", b.cpi_bytes_per_unit);
  visit("max_cpi_instruction_size", b.max_cpi_instruction_size);
  visit("sha256_base_cost", b.sha256_base_cost);
  visit("sha256_byte_cost", b.sha256_byte_cost);
  visit("sha256_max_slices", b.sha256_max_slices);
  visit("mem_op_base_cost", b.mem_op_base_cost);
  visit("sysvar_base_cost", b.sysvar_base_cost);
  visit("create_program_address_units", b.create_program_address_units);
  visit("get_remaining_compute_units_cost", b.get_remaining_compute_units_cost);
}

template <typename T> bool get_unsigned(ByteReader &reader, T &field) {
  uint64_t value = 0;
  if (!reader.get_u64(value)) {
    return false;
  }
  field = static_cast<T>(value);
  return true;
}

} // namespace

void write_header(ByteWriter &writer, Layout layout) {
  writer.put_raw(std::vector<uint8_t>(MAGIC, MAGIC + 4));
  writer.put_u32(FORMAT_VERSION);
  writer.put_u8(static_cast<uint8_t>(layout));
}

Result<bool> read_header(ByteReader &reader, Layout expected) {
  std::vector<uint8_t> magic;
  uint32_t version = 0;
  uint8_t layout = 0;
  if (!reader.get_raw(4, magic) || std::memcmp(magic.data(), MAGIC, 4) != 0) {
    return Result<bool>("not a fixture blob (bad magic)");
  }
  if (!reader.get_u32(version) || version != FORMAT_VERSION) {
    return Result<bool>("unsupported fixture format version " +
                        std::to_string(version));
  }
  if (!reader.get_u8(layout) || layout != static_cast<uint8_t>(expected)) {
    return Result<bool>("fixture layout mismatch: found " +
                        std::to_string(layout) + ", expected " +
                        std::to_string(static_cast<uint8_t>(expected)));
  }
  return Result<bool>(true);
}

void put_account(ByteWriter &writer, const svm::KeyedAccount &account) {
  writer.put_key(account.pubkey);
  writer.put_u64(account.account.lamports);
  writer.put_bytes(account.account.data);
  writer.put_key(account.account.owner);
  writer.put_bool(account.account.executable);
  writer.put_u64(account.account.rent_epoch);
}

bool get_account(ByteReader &reader, svm::KeyedAccount &account) {
  return reader.get_key(account.pubkey) &&
         reader.get_u64(account.account.lamports) &&
         reader.get_bytes(account.account.data) &&
         reader.get_key(account.account.owner) &&
         reader.get_bool(account.account.executable) &&
         reader.get_u64(account.account.rent_epoch);
}

void put_compute_budget(ByteWriter &writer, const svm::ComputeBudget &budget) {
  visit_compute_budget(budget, [&](const char *, const auto &field) {
    writer.put_u64(static_cast<uint64_t>(field));
  });
}

bool get_compute_budget(ByteReader &reader, svm::ComputeBudget &budget) {
  bool ok = true;
  visit_compute_budget(budget, [&](const char *, auto &field) {
    ok = ok && get_unsigned(reader, field);
  });
  return ok;
}

void put_feature_set(ByteWriter &writer, const svm::FeatureSet &features) {
  writer.put_u64(features.active().size());
  for (const auto &[id, slot] : features.active()) {
    writer.put_key(id);
    writer.put_u64(slot);
  }
}

bool get_feature_set(ByteReader &reader, svm::FeatureSet &features) {
  uint64_t count = 0;
  if (!reader.get_u64(count)) {
    return false;
  }
  features = svm::FeatureSet();
  for (uint64_t i = 0; i < count; ++i) {
    PublicKey id;
    uint64_t slot = 0;
    if (!reader.get_key(id) || !reader.get_u64(slot)) {
      return false;
    }
    features.activate(id, slot);
  }
  return true;
}

void put_sysvars(ByteWriter &writer, const svm::Sysvars &sysvars) {
  writer.put_u64(sysvars.clock.slot);
  writer.put_i64(sysvars.clock.epoch_start_timestamp);
  writer.put_u64(sysvars.clock.epoch);
  writer.put_u64(sysvars.clock.leader_schedule_epoch);
  writer.put_i64(sysvars.clock.unix_timestamp);

  const svm::EpochRewards &rewards = sysvars.epoch_rewards;
  writer.put_u64(rewards.distribution_starting_block_height);
  writer.put_u64(rewards.num_partitions);
  writer.put_key(rewards.parent_blockhash);
  writer.put_u64(rewards.total_points_lo);
  writer.put_u64(rewards.total_points_hi);
  writer.put_u64(rewards.total_rewards);
  writer.put_u64(rewards.distributed_rewards);
  writer.put_bool(rewards.active);

  const svm::EpochSchedule &schedule = sysvars.epoch_schedule;
  writer.put_u64(schedule.slots_per_epoch);
  writer.put_u64(schedule.leader_schedule_slot_offset);
  writer.put_bool(schedule.warmup);
  writer.put_u64(schedule.first_normal_epoch);
  writer.put_u64(schedule.first_normal_slot);

  writer.put_u64(sysvars.last_restart_slot);

  writer.put_u64(sysvars.rent.lamports_per_byte_year);
  writer.put_f64(sysvars.rent.exemption_threshold);
  writer.put_u8(sysvars.rent.burn_percent);

  writer.put_u64(sysvars.slot_hashes.size());
  for (const auto &[slot, hash] : sysvars.slot_hashes) {
    writer.put_u64(slot);
    writer.put_key(hash);
  }

  writer.put_u64(sysvars.stake_history.size());
  for (const auto &[epoch, entry] : sysvars.stake_history) {
    writer.put_u64(epoch);
    writer.put_u64(entry.effective);
    writer.put_u64(entry.activating);
    writer.put_u64(entry.deactivating);
  }
}

bool get_sysvars(ByteReader &reader, svm::Sysvars &sysvars) {
  svm::Clock &clock = sysvars.clock;
  svm::EpochRewards &rewards = sysvars.epoch_rewards;
  svm::EpochSchedule &schedule = sysvars.epoch_schedule;

  bool ok = reader.get_u64(clock.slot) &&
            reader.get_i64(clock.epoch_start_timestamp) &&
            reader.get_u64(clock.epoch) &&
            reader.get_u64(clock.leader_schedule_epoch) &&
            reader.get_i64(clock.unix_timestamp) &&
            reader.get_u64(rewards.distribution_starting_block_height) &&
            reader.get_u64(rewards.num_partitions) &&
            reader.get_key(rewards.parent_blockhash) &&
            reader.get_u64(rewards.total_points_lo) &&
            reader.get_u64(rewards.total_points_hi) &&
            reader.get_u64(rewards.total_rewards) &&
            reader.get_u64(rewards.distributed_rewards) &&
            reader.get_bool(rewards.active) &&
            reader.get_u64(schedule.slots_per_epoch) &&
            reader.get_u64(schedule.leader_schedule_slot_offset) &&
            reader.get_bool(schedule.warmup) &&
            reader.get_u64(schedule.first_normal_epoch) &&
            reader.get_u64(schedule.first_normal_slot) &&
            reader.get_u64(sysvars.last_restart_slot) &&
            reader.get_u64(sysvars.rent.lamports_per_byte_year) &&
            reader.get_f64(sysvars.rent.exemption_threshold) &&
            reader.get_u8(sysvars.rent.burn_percent);
  if (!ok) {
    return false;
  }

  uint64_t count = 0;
  if (!reader.get_u64(count)) {
    return false;
  }
  sysvars.slot_hashes.clear();
  for (uint64_t i = 0; i < count; ++i) {
    Slot slot = 0;
    Hash hash;
    if (!reader.get_u64(slot) || !reader.get_key(hash)) {
      return false;
    }
    sysvars.slot_hashes.emplace_back(slot, std::move(hash));
  }

  if (!reader.get_u64(count)) {
    return false;
  }
  sysvars.stake_history.clear();
  for (uint64_t i = 0; i < count; ++i) {
    Epoch epoch = 0;
    svm::StakeHistoryEntry entry;
    if (!reader.get_u64(epoch) || !reader.get_u64(entry.effective) ||
        !reader.get_u64(entry.activating) || !reader.get_u64(entry.deactivating)) {
      return false;
    }
    sysvars.stake_history.emplace_back(epoch, entry);
  }
  return true;
}

nlohmann::json key_to_json(const PublicKey &key) { return base58_encode(key); }

PublicKey key_from_json(const nlohmann::json &value) {
  auto key = pubkey_from_base58(value.get<std::string>());
  if (key.is_err()) {
    throw std::invalid_argument(key.error());
  }
  return std::move(key).value();
}

nlohmann::json bytes_to_json(const std::vector<uint8_t> &bytes) {
  return hex_encode(bytes);
}

std::vector<uint8_t> bytes_from_json(const nlohmann::json &value) {
  auto bytes = hex_decode(value.get<std::string>());
  if (bytes.is_err()) {
    throw std::invalid_argument(bytes.error());
  }
  return std::move(bytes).value();
}

nlohmann::json account_to_json(const svm::KeyedAccount &account) {
  nlohmann::json j;
  j["address"] = key_to_json(account.pubkey);
  j["lamports"] = account.account.lamports;
  j["data"] = bytes_to_json(account.account.data);
  j["owner"] = key_to_json(account.account.owner);
  j["executable"] = account.account.executable;
  j["rent_epoch"] = account.account.rent_epoch;
  return j;
}

svm::KeyedAccount account_from_json(const nlohmann::json &value) {
  svm::KeyedAccount account;
  account.pubkey = key_from_json(value.at("address"));
  account.account.lamports = value.at("lamports").get<uint64_t>();
  account.account.data = bytes_from_json(value.at("data"));
  account.account.owner = key_from_json(value.at("owner"));
  account.account.executable = value.value("executable", false);
  account.account.rent_epoch = value.value("rent_epoch", uint64_t{0});
  return account;
}

nlohmann::json compute_budget_to_json(const svm::ComputeBudget &budget) {
  nlohmann::json j = nlohmann::json::object();
  visit_compute_budget(budget, [&](const char *name, const auto &field) {
    j[name] = static_cast<uint64_t>(field);
  });
  return j;
}

svm::ComputeBudget compute_budget_from_json(const nlohmann::json &value) {
  svm::ComputeBudget budget;
  visit_compute_budget(budget, [&](const char *name, auto &field) {
    using Field = std::decay_t<decltype(field)>;
    if (value.contains(name)) {
      field = static_cast<Field>(value.at(name).get<uint64_t>());
    }
  });
  return budget;
}

nlohmann::json feature_set_to_json(const svm::FeatureSet &features) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &[id, slot] : features.active()) {
    j.push_back({{"id", key_to_json(id)}, {"slot", slot}});
  }
  return j;
}

svm::FeatureSet feature_set_from_json(const nlohmann::json &value) {
  svm::FeatureSet features;
  for (const auto &entry : value) {
    features.activate(key_from_json(entry.at("id")),
                      entry.value("slot", uint64_t{0}));
  }
  return features;
}

nlohmann::json sysvars_to_json(const svm::Sysvars &sysvars) {
  nlohmann::json j;
  j["clock"] = {{"slot", sysvars.clock.slot},
                {"epoch_start_timestamp", sysvars.clock.epoch_start_timestamp},
                {"epoch", sysvars.clock.epoch},
                {"leader_schedule_epoch", sysvars.clock.leader_schedule_epoch},
                {"unix_timestamp", sysvars.clock.unix_timestamp}};

  const svm::EpochRewards &rewards = sysvars.epoch_rewards;
  j["epoch_rewards"] = {
      {"distribution_starting_block_height",
       rewards.distribution_starting_block_height},
      {"num_partitions", rewards.num_partitions},
      {"parent_blockhash", key_to_json(rewards.parent_blockhash)},
      {"total_points_lo", rewards.total_points_lo},
      {"total_points_hi", rewards.total_points_hi},
      {"total_rewards", rewards.total_rewards},
      {"distributed_rewards", rewards.distributed_rewards},
      {"active", rewards.active}};

  const svm::EpochSchedule &schedule = sysvars.epoch_schedule;
  j["epoch_schedule"] = {
      {"slots_per_epoch", schedule.slots_per_epoch},
      {"leader_schedule_slot_offset", schedule.leader_schedule_slot_offset},
      {"warmup", schedule.warmup},
      {"first_normal_epoch", schedule.first_normal_epoch},
      {"first_normal_slot", schedule.first_normal_slot}};

  j["last_restart_slot"] = sysvars.last_restart_slot;
  j["rent"] = {{"lamports_per_byte_year", sysvars.rent.lamports_per_byte_year},
               {"exemption_threshold", sysvars.rent.exemption_threshold},
               {"burn_percent", sysvars.rent.burn_percent}};

  j["slot_hashes"] = nlohmann::json::array();
  for (const auto &[slot, hash] : sysvars.slot_hashes) {
    j["slot_hashes"].push_back({{"slot", slot}, {"hash", key_to_json(hash)}});
  }
  j["stake_history"] = nlohmann::json::array();
  for (const auto &[epoch, entry] : sysvars.stake_history) {
    j["stake_history"].push_back({{"epoch", epoch},
                                  {"effective", entry.effective},
                                  {"activating", entry.activating},
                                  {"deactivating", entry.deactivating}});
  }
  return j;
}

svm::Sysvars sysvars_from_json(const nlohmann::json &value) {
  svm::Sysvars sysvars;

  const auto &clock = value.at("clock");
  sysvars.clock.slot = clock.at("slot").get<uint64_t>();
  sysvars.clock.epoch_start_timestamp = clock.at("epoch_start_timestamp").get<int64_t>();
  sysvars.clock.epoch = clock.at("epoch").get<uint64_t>();
  sysvars.clock.leader_schedule_epoch = clock.at("leader_schedule_epoch").get<uint64_t>();
  sysvars.clock.unix_timestamp = clock.at("unix_timestamp").get<int64_t>();

  const auto &rewards = value.at("epoch_rewards");
  svm::EpochRewards &epoch_rewards = sysvars.epoch_rewards;
  epoch_rewards.distribution_starting_block_height =
      rewards.at("distribution_starting_block_height").get<uint64_t>();
  epoch_rewards.num_partitions = rewards.at("num_partitions").get<uint64_t>();
  epoch_rewards.parent_blockhash = key_from_json(rewards.at("parent_blockhash"));
  epoch_rewards.total_points_lo = rewards.at("total_points_lo").get<uint64_t>();
  epoch_rewards.total_points_hi = rewards.at("total_points_hi").get<uint64_t>();
  epoch_rewards.total_rewards = rewards.at("total_rewards").get<uint64_t>();
  epoch_rewards.distributed_rewards = rewards.at("distributed_rewards").get<uint64_t>();
  epoch_rewards.active = rewards.at("active").get<bool>();

  const auto &schedule = value.at("epoch_schedule");
  sysvars.epoch_schedule.slots_per_epoch = schedule.at("slots_per_epoch").get<uint64_t>();
  sysvars.epoch_schedule.leader_schedule_slot_offset =
      schedule.at("leader_schedule_slot_offset").get<uint64_t>();
  sysvars.epoch_schedule.warmup = schedule.at("warmup").get<bool>();
  sysvars.epoch_schedule.first_normal_epoch =
      schedule.at("first_normal_epoch").get<uint64_t>();
  sysvars.epoch_schedule.first_normal_slot =
      schedule.at("first_normal_slot").get<uint64_t>();

  sysvars.last_restart_slot = value.at("last_restart_slot").get<uint64_t>();

  const auto &rent = value.at("rent");
  sysvars.rent.lamports_per_byte_year = rent.at("lamports_per_byte_year").get<uint64_t>();
  sysvars.rent.exemption_threshold = rent.at("exemption_threshold").get<double>();
  sysvars.rent.burn_percent = rent.at("burn_percent").get<uint8_t>();

  for (const auto &entry : value.at("slot_hashes")) {
    sysvars.slot_hashes.emplace_back(entry.at("slot").get<uint64_t>(),
                                     key_from_json(entry.at("hash")));
  }
  for (const auto &entry : value.at("stake_history")) {
    svm::StakeHistoryEntry history;
    history.effective = entry.at("effective").get<uint64_t>();
    history.activating = entry.at("activating").get<uint64_t>();
    history.deactivating = entry.at("deactivating").get<uint64_t>();
    sysvars.stake_history.emplace_back(entry.at("epoch").get<uint64_t>(), history);
  }
  return sysvars;
}

} // namespace codec
} // namespace fixture
} // namespace periwinkle
