#include "common/base58.h"
#include "common/crypto_utils.h"
#include "svm/bpf_vm.h"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace periwinkle {
namespace svm {

namespace {

constexpr uint64_t SUCCESS = 0;
constexpr uint64_t PDA_FAILURE = 1;

constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LEN = 32;
constexpr size_t MAX_LOG_DATA_FIELDS = 256;

constexpr size_t SOL_INSTRUCTION_SIZE = 40;
constexpr size_t SOL_ACCOUNT_META_SIZE = 16;
constexpr size_t SOL_ACCOUNT_INFO_SIZE = 56;
constexpr size_t SOL_SLICE_SIZE = 16;

constexpr uint64_t CPI_ACCOUNT_META_BYTES = 34;
constexpr uint64_t MAX_CPI_ACCOUNT_INFOS = 128;

uint64_t load_u64(const uint8_t *p) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(p[i]) << (8 * i);
  }
  return value;
}

void store_u64(uint8_t *p, uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    p[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

/// Copy a VM range into host memory; zero-length ranges need not be mapped
bool read_range(BpfVirtualMachine &vm, uint64_t addr, uint64_t len,
                std::vector<uint8_t> &out) {
  out.clear();
  if (len == 0) {
    return true;
  }
  const uint8_t *host = vm.translate(addr, len, false);
  if (!host) {
    return false;
  }
  out.assign(host, host + len);
  return true;
}

/// Read an array of {addr, len} slices and the bytes they reference
bool read_slices(BpfVirtualMachine &vm, uint64_t addr, uint64_t count,
                 std::vector<std::vector<uint8_t>> &out) {
  out.clear();
  if (count == 0) {
    return true;
  }
  const uint8_t *table = vm.translate(addr, count * SOL_SLICE_SIZE, false);
  if (!table) {
    return false;
  }
  for (uint64_t i = 0; i < count; ++i) {
    std::vector<uint8_t> bytes;
    if (!read_range(vm, load_u64(table + i * SOL_SLICE_SIZE),
                    load_u64(table + i * SOL_SLICE_SIZE + 8), bytes)) {
      return false;
    }
    out.push_back(std::move(bytes));
  }
  return true;
}

bool write_bytes(BpfVirtualMachine &vm, uint64_t addr,
                 const std::vector<uint8_t> &bytes) {
  if (bytes.empty()) {
    return true;
  }
  uint8_t *host = vm.translate(addr, bytes.size(), true);
  if (!host) {
    return false;
  }
  std::memcpy(host, bytes.data(), bytes.size());
  return true;
}

uint64_t mem_op_cost(const ComputeBudget &budget, uint64_t n) {
  return std::max(budget.mem_op_base_cost, n / budget.cpi_bytes_per_unit);
}

PublicKey derive_program_address(const std::vector<std::vector<uint8_t>> &seeds,
                                 const PublicKey &program_id) {
  static const std::string PDA_MARKER = "ProgramDerivedAddress";
  std::vector<std::vector<uint8_t>> chunks = seeds;
  chunks.push_back(program_id);
  chunks.emplace_back(PDA_MARKER.begin(), PDA_MARKER.end());
  return CryptoUtils::sha256_multi(chunks);
}

bool seeds_valid(const std::vector<std::vector<uint8_t>> &seeds) {
  if (seeds.size() > MAX_SEEDS) {
    return false;
  }
  return std::all_of(seeds.begin(), seeds.end(),
                     [](const std::vector<uint8_t> &seed) {
                       return seed.size() <= MAX_SEED_LEN;
                     });
}

// ============================================================================
// Program termination and logging
// ============================================================================

bool sol_abort(BpfVirtualMachine &vm, uint64_t, uint64_t, uint64_t, uint64_t,
               uint64_t, uint64_t &) {
  return vm.fail("SBF program called abort()");
}

bool sol_panic(BpfVirtualMachine &vm, uint64_t file, uint64_t len,
               uint64_t line, uint64_t column, uint64_t, uint64_t &) {
  if (!vm.consume(len)) {
    return false;
  }
  std::vector<uint8_t> name;
  if (!read_range(vm, file, len, name)) {
    return false;
  }
  return vm.fail("SBF program Panicked in " +
                 std::string(name.begin(), name.end()) + " at " +
                 std::to_string(line) + ":" + std::to_string(column));
}

bool sol_log(BpfVirtualMachine &vm, uint64_t addr, uint64_t len, uint64_t,
             uint64_t, uint64_t, uint64_t &result) {
  if (!vm.consume(std::max(vm.context().compute_budget().syscall_base_cost, len))) {
    return false;
  }
  std::vector<uint8_t> message;
  if (!read_range(vm, addr, len, message)) {
    return false;
  }
  vm.context().log("Program log: " + std::string(message.begin(), message.end()));
  result = SUCCESS;
  return true;
}

bool sol_log_64(BpfVirtualMachine &vm, uint64_t a1, uint64_t a2, uint64_t a3,
                uint64_t a4, uint64_t a5, uint64_t &result) {
  if (!vm.consume(vm.context().compute_budget().log_64_units)) {
    return false;
  }
  std::ostringstream line;
  line << std::hex << "Program log: 0x" << a1 << ", 0x" << a2 << ", 0x" << a3
       << ", 0x" << a4 << ", 0x" << a5;
  vm.context().log(line.str());
  result = SUCCESS;
  return true;
}

bool sol_log_pubkey(BpfVirtualMachine &vm, uint64_t addr, uint64_t, uint64_t,
                    uint64_t, uint64_t, uint64_t &result) {
  if (!vm.consume(vm.context().compute_budget().log_pubkey_units)) {
    return false;
  }
  std::vector<uint8_t> key;
  if (!read_range(vm, addr, PUBKEY_BYTES, key)) {
    return false;
  }
  vm.context().log("Program log: " + base58_encode(key));
  result = SUCCESS;
  return true;
}

bool sol_log_compute_units(BpfVirtualMachine &vm, uint64_t, uint64_t, uint64_t,
                           uint64_t, uint64_t, uint64_t &result) {
  if (!vm.consume(vm.context().compute_budget().syscall_base_cost)) {
    return false;
  }
  vm.context().log("Program consumption: " +
                   std::to_string(vm.context().compute_meter().remaining()) +
                   " units remaining");
  result = SUCCESS;
  return true;
}

bool sol_log_data(BpfVirtualMachine &vm, uint64_t addr, uint64_t count,
                  uint64_t, uint64_t, uint64_t, uint64_t &result) {
  const ComputeBudget &budget = vm.context().compute_budget();
  if (!vm.consume(budget.syscall_base_cost)) {
    return false;
  }
  if (count > MAX_LOG_DATA_FIELDS) {
    return vm.fail("too many fields passed to sol_log_data");
  }
  std::vector<std::vector<uint8_t>> fields;
  if (!read_slices(vm, addr, count, fields)) {
    return false;
  }
  uint64_t total = 0;
  std::string line = "Program data:";
  for (const auto &field : fields) {
    total += field.size();
    line += " " + CryptoUtils::base64_encode(field);
  }
  if (!vm.consume(budget.syscall_base_cost * count + total)) {
    return false;
  }
  vm.context().log(line);
  result = SUCCESS;
  return true;
}

// ============================================================================
// Return data
// ============================================================================

bool sol_set_return_data(BpfVirtualMachine &vm, uint64_t addr, uint64_t len,
                         uint64_t, uint64_t, uint64_t, uint64_t &result) {
  const ComputeBudget &budget = vm.context().compute_budget();
  if (!vm.consume(len / budget.cpi_bytes_per_unit + budget.syscall_base_cost)) {
    return false;
  }
  if (len > MAX_RETURN_DATA) {
    return vm.fail("Return data too large (" + std::to_string(len) + " > " +
                   std::to_string(MAX_RETURN_DATA) + ")");
  }
  std::vector<uint8_t> data;
  if (!read_range(vm, addr, len, data)) {
    return false;
  }
  vm.context().set_return_data(vm.context().program_id(), std::move(data));
  result = SUCCESS;
  return true;
}

bool sol_get_return_data(BpfVirtualMachine &vm, uint64_t addr, uint64_t len,
                         uint64_t program_id_addr, uint64_t, uint64_t,
                         uint64_t &result) {
  const ComputeBudget &budget = vm.context().compute_budget();
  if (!vm.consume(budget.syscall_base_cost)) {
    return false;
  }
  const ReturnData &return_data = vm.context().return_data();
  uint64_t length = std::min<uint64_t>(len, return_data.data.size());
  if (length != 0) {
    if (!vm.consume((length + PUBKEY_BYTES) / budget.cpi_bytes_per_unit)) {
      return false;
    }
    std::vector<uint8_t> prefix(return_data.data.begin(),
                                return_data.data.begin() + length);
    if (!write_bytes(vm, addr, prefix) ||
        !write_bytes(vm, program_id_addr, return_data.program_id)) {
      return false;
    }
  }
  result = return_data.data.size();
  return true;
}

// ============================================================================
// Memory operations
// ============================================================================

bool sol_memcpy(BpfVirtualMachine &vm, uint64_t dst, uint64_t src, uint64_t n,
                uint64_t, uint64_t, uint64_t &result) {
  if (!vm.consume(mem_op_cost(vm.context().compute_budget(), n))) {
    return false;
  }
  if ((dst <= src && src - dst < n) || (src <= dst && dst - src < n)) {
    return vm.fail("Overlapping copy in sol_memcpy_");
  }
  if (n != 0) {
    const uint8_t *from = vm.translate(src, n, false);
    uint8_t *to = from ? vm.translate(dst, n, true) : nullptr;
    if (!to) {
      return false;
    }
    std::memcpy(to, from, n);
  }
  result = SUCCESS;
  return true;
}

bool sol_memmove(BpfVirtualMachine &vm, uint64_t dst, uint64_t src, uint64_t n,
                 uint64_t, uint64_t, uint64_t &result) {
  if (!vm.consume(mem_op_cost(vm.context().compute_budget(), n))) {
    return false;
  }
  if (n != 0) {
    const uint8_t *from = vm.translate(src, n, false);
    uint8_t *to = from ? vm.translate(dst, n, true) : nullptr;
    if (!to) {
      return false;
    }
    std::memmove(to, from, n);
  }
  result = SUCCESS;
  return true;
}

bool sol_memcmp(BpfVirtualMachine &vm, uint64_t s1, uint64_t s2, uint64_t n,
                uint64_t result_addr, uint64_t, uint64_t &result) {
  if (!vm.consume(mem_op_cost(vm.context().compute_budget(), n))) {
    return false;
  }
  std::vector<uint8_t> a;
  std::vector<uint8_t> b;
  if (!read_range(vm, s1, n, a) || !read_range(vm, s2, n, b)) {
    return false;
  }
  int32_t cmp = 0;
  for (uint64_t i = 0; i < n; ++i) {
    if (a[i] != b[i]) {
      cmp = static_cast<int32_t>(a[i]) - static_cast<int32_t>(b[i]);
      break;
    }
  }
  uint8_t *out = vm.translate(result_addr, 4, true);
  if (!out) {
    return false;
  }
  uint32_t bits = static_cast<uint32_t>(cmp);
  for (size_t i = 0; i < 4; ++i) {
    out[i] = static_cast<uint8_t>(bits >> (8 * i));
  }
  result = SUCCESS;
  return true;
}

bool sol_memset(BpfVirtualMachine &vm, uint64_t dst, uint64_t c, uint64_t n,
                uint64_t, uint64_t, uint64_t &result) {
  if (!vm.consume(mem_op_cost(vm.context().compute_budget(), n))) {
    return false;
  }
  if (n != 0) {
    uint8_t *to = vm.translate(dst, n, true);
    if (!to) {
      return false;
    }
    std::memset(to, static_cast<uint8_t>(c), n);
  }
  result = SUCCESS;
  return true;
}

// ============================================================================
// Hashing and program derived addresses
// ============================================================================

bool sol_sha256(BpfVirtualMachine &vm, uint64_t vals_addr, uint64_t vals_len,
                uint64_t result_addr, uint64_t, uint64_t, uint64_t &result) {
  const ComputeBudget &budget = vm.context().compute_budget();
  if (vals_len > budget.sha256_max_slices) {
    return vm.fail("too many slices passed to sol_sha256");
  }
  if (!vm.consume(budget.sha256_base_cost)) {
    return false;
  }
  std::vector<std::vector<uint8_t>> slices;
  if (!read_slices(vm, vals_addr, vals_len, slices)) {
    return false;
  }
  for (const auto &slice : slices) {
    uint64_t cost = std::max(budget.mem_op_base_cost,
                             budget.sha256_byte_cost * (slice.size() / 2));
    if (!vm.consume(cost)) {
      return false;
    }
  }
  if (!write_bytes(vm, result_addr, CryptoUtils::sha256_multi(slices))) {
    return false;
  }
  result = SUCCESS;
  return true;
}

bool sol_create_program_address(BpfVirtualMachine &vm, uint64_t seeds_addr,
                                uint64_t seeds_len, uint64_t program_id_addr,
                                uint64_t address_addr, uint64_t,
                                uint64_t &result) {
  if (!vm.consume(vm.context().compute_budget().create_program_address_units)) {
    return false;
  }
  std::vector<std::vector<uint8_t>> seeds;
  std::vector<uint8_t> program_id;
  if (!read_slices(vm, seeds_addr, seeds_len, seeds) ||
      !read_range(vm, program_id_addr, PUBKEY_BYTES, program_id)) {
    return false;
  }
  if (!seeds_valid(seeds)) {
    result = PDA_FAILURE;
    return true;
  }
  if (!write_bytes(vm, address_addr, derive_program_address(seeds, program_id))) {
    return false;
  }
  result = SUCCESS;
  return true;
}

/// Without an on-curve check every bump is viable, so the first (255) wins
bool sol_try_find_program_address(BpfVirtualMachine &vm, uint64_t seeds_addr,
                                  uint64_t seeds_len, uint64_t program_id_addr,
                                  uint64_t address_addr, uint64_t bump_addr,
                                  uint64_t &result) {
  if (!vm.consume(vm.context().compute_budget().create_program_address_units)) {
    return false;
  }
  std::vector<std::vector<uint8_t>> seeds;
  std::vector<uint8_t> program_id;
  if (!read_slices(vm, seeds_addr, seeds_len, seeds) ||
      !read_range(vm, program_id_addr, PUBKEY_BYTES, program_id)) {
    return false;
  }
  if (seeds.size() >= MAX_SEEDS || !seeds_valid(seeds)) {
    result = PDA_FAILURE;
    return true;
  }
  const uint8_t bump = 255;
  seeds.push_back({bump});
  if (!write_bytes(vm, address_addr, derive_program_address(seeds, program_id)) ||
      !write_bytes(vm, bump_addr, {bump})) {
    return false;
  }
  result = SUCCESS;
  return true;
}

// ============================================================================
// Sysvars and compute units
// ============================================================================

bool write_sysvar(BpfVirtualMachine &vm, uint64_t addr,
                  const std::vector<uint8_t> &bytes, uint64_t &result) {
  if (!vm.consume(vm.context().compute_budget().sysvar_base_cost + bytes.size())) {
    return false;
  }
  if (!write_bytes(vm, addr, bytes)) {
    return false;
  }
  result = SUCCESS;
  return true;
}

bool sol_get_clock_sysvar(BpfVirtualMachine &vm, uint64_t addr, uint64_t,
                          uint64_t, uint64_t, uint64_t, uint64_t &result) {
  return write_sysvar(vm, addr, vm.context().sysvars().clock_bytes(), result);
}

bool sol_get_rent_sysvar(BpfVirtualMachine &vm, uint64_t addr, uint64_t,
                         uint64_t, uint64_t, uint64_t, uint64_t &result) {
  std::vector<uint8_t> bytes = vm.context().sysvars().rent_bytes();
  bytes.resize(24, 0);
  return write_sysvar(vm, addr, bytes, result);
}

bool sol_get_epoch_schedule_sysvar(BpfVirtualMachine &vm, uint64_t addr,
                                   uint64_t, uint64_t, uint64_t, uint64_t,
                                   uint64_t &result) {
  // The in-memory struct pads the warmup flag to 8 bytes
  std::vector<uint8_t> bytes = vm.context().sysvars().epoch_schedule_bytes();
  bytes.insert(bytes.begin() + 17, 7, 0);
  return write_sysvar(vm, addr, bytes, result);
}

bool sol_get_epoch_rewards_sysvar(BpfVirtualMachine &vm, uint64_t addr,
                                  uint64_t, uint64_t, uint64_t, uint64_t,
                                  uint64_t &result) {
  std::vector<uint8_t> bytes = vm.context().sysvars().epoch_rewards_bytes();
  bytes.resize(96, 0);
  return write_sysvar(vm, addr, bytes, result);
}

bool sol_get_last_restart_slot(BpfVirtualMachine &vm, uint64_t addr, uint64_t,
                               uint64_t, uint64_t, uint64_t, uint64_t &result) {
  return write_sysvar(vm, addr, vm.context().sysvars().last_restart_slot_bytes(),
                      result);
}

bool sol_remaining_compute_units(BpfVirtualMachine &vm, uint64_t, uint64_t,
                                 uint64_t, uint64_t, uint64_t,
                                 uint64_t &result) {
  if (!vm.consume(vm.context().compute_budget().get_remaining_compute_units_cost)) {
    return false;
  }
  result = vm.context().compute_meter().remaining();
  return true;
}

// ============================================================================
// Cross-program invocation
// ============================================================================

struct CallerAccountInfo {
  PublicKey key;
  uint64_t info_addr = 0;
};

bool sol_invoke_signed_c(BpfVirtualMachine &vm, uint64_t instruction_addr,
                         uint64_t account_infos_addr, uint64_t account_infos_len,
                         uint64_t signers_seeds_addr,
                         uint64_t signers_seeds_len, uint64_t &result) {
  InvokeContext &context = vm.context();
  const ComputeBudget &budget = context.compute_budget();

  const uint8_t *raw = vm.translate(instruction_addr, SOL_INSTRUCTION_SIZE, false);
  if (!raw) {
    return false;
  }
  uint64_t program_id_addr = load_u64(raw);
  uint64_t metas_addr = load_u64(raw + 8);
  uint64_t metas_len = load_u64(raw + 16);
  uint64_t data_addr = load_u64(raw + 24);
  uint64_t data_len = load_u64(raw + 32);

  // Bound each length before combining them so the sum cannot wrap
  if (metas_len > budget.max_cpi_instruction_size / CPI_ACCOUNT_META_BYTES ||
      data_len > budget.max_cpi_instruction_size ||
      metas_len * CPI_ACCOUNT_META_BYTES + data_len > budget.max_cpi_instruction_size) {
    return vm.fail("Invoked an instruction that is too large",
                   InstructionError(InstructionErrorKind::GENERIC_ERROR));
  }
  if (!vm.consume(data_len / budget.cpi_bytes_per_unit)) {
    return false;
  }

  Instruction instruction;
  if (!read_range(vm, program_id_addr, PUBKEY_BYTES, instruction.program_id) ||
      !read_range(vm, data_addr, data_len, instruction.data)) {
    return false;
  }
  if (metas_len != 0) {
    const uint8_t *metas =
        vm.translate(metas_addr, metas_len * SOL_ACCOUNT_META_SIZE, false);
    if (!metas) {
      return false;
    }
    for (uint64_t i = 0; i < metas_len; ++i) {
      const uint8_t *meta = metas + i * SOL_ACCOUNT_META_SIZE;
      AccountMeta account;
      if (!read_range(vm, load_u64(meta), PUBKEY_BYTES, account.pubkey)) {
        return false;
      }
      account.is_writable = meta[8] != 0;
      account.is_signer = meta[9] != 0;
      instruction.accounts.push_back(std::move(account));
    }
  }

  std::vector<CallerAccountInfo> infos;
  if (account_infos_len > MAX_CPI_ACCOUNT_INFOS) {
    return vm.fail("Invoked an instruction with too many account infos",
                   InstructionError(InstructionErrorKind::GENERIC_ERROR));
  }
  if (account_infos_len != 0) {
    const uint8_t *table = vm.translate(
        account_infos_addr, account_infos_len * SOL_ACCOUNT_INFO_SIZE, false);
    if (!table) {
      return false;
    }
    for (uint64_t i = 0; i < account_infos_len; ++i) {
      CallerAccountInfo info;
      info.info_addr = account_infos_addr + i * SOL_ACCOUNT_INFO_SIZE;
      if (!read_range(vm, load_u64(table + i * SOL_ACCOUNT_INFO_SIZE),
                      PUBKEY_BYTES, info.key)) {
        return false;
      }
      infos.push_back(std::move(info));
    }
  }
  for (const auto &meta : instruction.accounts) {
    bool shared = std::any_of(infos.begin(), infos.end(),
                              [&](const CallerAccountInfo &info) {
                                return info.key == meta.pubkey;
                              });
    if (!shared) {
      context.log("Instruction references an unknown account " +
                  base58_encode(meta.pubkey));
      return vm.fail("Invoked an instruction with an account the caller did not pass",
                     InstructionError(InstructionErrorKind::MISSING_ACCOUNT));
    }
  }

  std::vector<PublicKey> signers;
  if (signers_seeds_len > MAX_SEEDS) {
    return vm.fail("too many signers");
  }
  if (signers_seeds_len != 0) {
    const uint8_t *table =
        vm.translate(signers_seeds_addr, signers_seeds_len * SOL_SLICE_SIZE, false);
    if (!table) {
      return false;
    }
    for (uint64_t i = 0; i < signers_seeds_len; ++i) {
      std::vector<std::vector<uint8_t>> seeds;
      if (!read_slices(vm, load_u64(table + i * SOL_SLICE_SIZE),
                       load_u64(table + i * SOL_SLICE_SIZE + 8), seeds)) {
        return false;
      }
      if (!seeds_valid(seeds)) {
        return vm.fail("Could not create program address with signer seeds",
                       InstructionError(InstructionErrorKind::INVALID_SEEDS));
      }
      if (!vm.consume(budget.create_program_address_units)) {
        return false;
      }
      signers.push_back(derive_program_address(seeds, context.program_id()));
    }
  }

  // The callee must see the caller's writes made so far
  InvokeOutcome committed = deserialize_parameters(context, vm.parameters());
  if (!committed.is_success()) {
    return vm.fail("Failed to update caller accounts", committed);
  }

  InvokeOutcome outcome = context.process_nested_instruction(instruction, signers);
  if (!outcome.is_success()) {
    return vm.fail("Cross-program invocation failed", outcome);
  }

  InvokeOutcome refreshed = refresh_parameters(context, vm.parameters());
  if (!refreshed.is_success()) {
    return vm.fail("Failed to update caller account region", refreshed);
  }

  for (const auto &info : infos) {
    auto index = context.find_transaction_account(info.key);
    if (!index) {
      continue;
    }
    uint8_t *data_len_field = vm.translate(info.info_addr + 16, 8, true);
    if (!data_len_field) {
      return false;
    }
    store_u64(data_len_field,
              context.transaction_accounts()[*index].account.data.size());
  }

  result = SUCCESS;
  return true;
}

std::unordered_map<uint32_t, SyscallEntry> build_registry() {
  const std::vector<SyscallEntry> entries = {
      {"abort", sol_abort},
      {"sol_panic_", sol_panic},
      {"sol_log_", sol_log},
      {"sol_log_64_", sol_log_64},
      {"sol_log_pubkey", sol_log_pubkey},
      {"sol_log_compute_units_", sol_log_compute_units},
      {"sol_log_data", sol_log_data},
      {"sol_set_return_data", sol_set_return_data},
      {"sol_get_return_data", sol_get_return_data},
      {"sol_memcpy_", sol_memcpy},
      {"sol_memmove_", sol_memmove},
      {"sol_memcmp_", sol_memcmp},
      {"sol_memset_", sol_memset},
      {"sol_sha256", sol_sha256},
      {"sol_create_program_address", sol_create_program_address},
      {"sol_try_find_program_address", sol_try_find_program_address},
      {"sol_get_clock_sysvar", sol_get_clock_sysvar},
      {"sol_get_rent_sysvar", sol_get_rent_sysvar},
      {"sol_get_epoch_schedule_sysvar", sol_get_epoch_schedule_sysvar},
      {"sol_get_epoch_rewards_sysvar", sol_get_epoch_rewards_sysvar},
      {"sol_get_last_restart_slot", sol_get_last_restart_slot},
      {"sol_remaining_compute_units", sol_remaining_compute_units},
      {"sol_invoke_signed_c", sol_invoke_signed_c},
  };
  std::unordered_map<uint32_t, SyscallEntry> registry;
  for (const auto &entry : entries) {
    registry.emplace(syscall_hash(entry.name), entry);
  }
  return registry;
}

} // namespace

const std::unordered_map<uint32_t, SyscallEntry> &syscall_registry() {
  static const std::unordered_map<uint32_t, SyscallEntry> registry =
      build_registry();
  return registry;
}

} // namespace svm
} // namespace periwinkle
