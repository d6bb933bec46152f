#include "svm/bpf_vm.h"
#include <algorithm>

namespace periwinkle {
namespace svm {

namespace {

constexpr uint8_t NON_DUP_MARKER = 0xff;
constexpr size_t ALIGNMENT = 8;

void put_u8(std::vector<uint8_t> &buffer, uint8_t value) {
  buffer.push_back(value);
}

void put_u64(std::vector<uint8_t> &buffer, uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    buffer.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void put_bytes(std::vector<uint8_t> &buffer, const std::vector<uint8_t> &bytes) {
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void put_zeros(std::vector<uint8_t> &buffer, size_t count) {
  buffer.insert(buffer.end(), count, 0);
}

uint64_t get_u64(const std::vector<uint8_t> &buffer, size_t offset) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(buffer[offset + i]) << (8 * i);
  }
  return value;
}

void set_u64(std::vector<uint8_t> &buffer, size_t offset, uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    buffer[offset + i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

/// Padding after `data_len` bytes of data so the next field is aligned
size_t alignment_padding(size_t data_len) {
  size_t with_slack = data_len + MAX_PERMITTED_DATA_INCREASE;
  return (ALIGNMENT - with_slack % ALIGNMENT) % ALIGNMENT;
}

} // namespace

SerializedParameters serialize_parameters(const InvokeContext &context) {
  SerializedParameters parameters;
  std::vector<uint8_t> &buffer = parameters.buffer;
  const size_t count = context.instruction_account_count();

  put_u64(buffer, count);
  for (size_t i = 0; i < count; ++i) {
    const InstructionAccount &reference = context.instruction_account(i);
    SerializedAccount entry;
    entry.index_in_transaction = reference.index_in_transaction;

    size_t first = i;
    for (size_t j = 0; j < i; ++j) {
      if (context.instruction_account(j).index_in_transaction ==
          reference.index_in_transaction) {
        first = j;
        break;
      }
    }

    if (first != i) {
      entry.duplicate = true;
      put_u8(buffer, static_cast<uint8_t>(first));
      put_zeros(buffer, 7);
      parameters.accounts.push_back(entry);
      continue;
    }

    const KeyedAccount &state = context.instruction_account_state(i);
    put_u8(buffer, NON_DUP_MARKER);
    put_u8(buffer, reference.is_signer ? 1 : 0);
    put_u8(buffer, reference.is_writable ? 1 : 0);
    put_u8(buffer, state.account.executable ? 1 : 0);
    put_zeros(buffer, 4);
    put_bytes(buffer, state.pubkey);
    entry.owner_offset = buffer.size();
    put_bytes(buffer, state.account.owner);
    entry.lamports_offset = buffer.size();
    put_u64(buffer, state.account.lamports);
    entry.data_len_offset = buffer.size();
    put_u64(buffer, state.account.data.size());
    entry.data_offset = buffer.size();
    entry.original_data_len = state.account.data.size();
    put_bytes(buffer, state.account.data);
    put_zeros(buffer, MAX_PERMITTED_DATA_INCREASE +
                          alignment_padding(state.account.data.size()));
    put_u64(buffer, state.account.rent_epoch);
    parameters.accounts.push_back(entry);
  }

  put_u64(buffer, context.instruction_data().size());
  put_bytes(buffer, context.instruction_data());
  put_bytes(buffer, context.program_id());
  return parameters;
}

InvokeOutcome deserialize_parameters(InvokeContext &context,
                                     const SerializedParameters &parameters) {
  const std::vector<uint8_t> &buffer = parameters.buffer;

  for (size_t i = 0; i < parameters.accounts.size(); ++i) {
    const SerializedAccount &entry = parameters.accounts[i];
    if (entry.duplicate) {
      continue;
    }

    uint64_t data_len = get_u64(buffer, entry.data_len_offset);
    if (data_len > entry.original_data_len + MAX_PERMITTED_DATA_INCREASE) {
      return InvokeOutcome::failure(InstructionErrorKind::INVALID_REALLOC);
    }

    Account &account = context.instruction_account_state(i).account;
    account.lamports = get_u64(buffer, entry.lamports_offset);
    account.owner.assign(buffer.begin() + entry.owner_offset,
                         buffer.begin() + entry.owner_offset + PUBKEY_BYTES);
    account.data.assign(buffer.begin() + entry.data_offset,
                        buffer.begin() + entry.data_offset + data_len);
  }
  return InvokeOutcome::ok();
}

InvokeOutcome refresh_parameters(const InvokeContext &context,
                                 SerializedParameters &parameters) {
  std::vector<uint8_t> &buffer = parameters.buffer;

  for (size_t i = 0; i < parameters.accounts.size(); ++i) {
    const SerializedAccount &entry = parameters.accounts[i];
    if (entry.duplicate) {
      continue;
    }

    const Account &account = context.instruction_account_state(i).account;
    const size_t capacity = entry.original_data_len + MAX_PERMITTED_DATA_INCREASE;
    if (account.data.size() > capacity) {
      return InvokeOutcome::failure(InstructionErrorKind::INVALID_REALLOC);
    }

    set_u64(buffer, entry.lamports_offset, account.lamports);
    std::copy(account.owner.begin(), account.owner.end(),
              buffer.begin() + entry.owner_offset);
    set_u64(buffer, entry.data_len_offset, account.data.size());
    std::copy(account.data.begin(), account.data.end(),
              buffer.begin() + entry.data_offset);
    std::fill(buffer.begin() + entry.data_offset + account.data.size(),
              buffer.begin() + entry.data_offset + capacity, 0);
  }
  return InvokeOutcome::ok();
}

} // namespace svm
} // namespace periwinkle
