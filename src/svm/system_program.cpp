#include "svm/system_program.h"
#include "common/base58.h"
#include "common/byte_codec.h"
#include "svm/program_ids.h"

namespace periwinkle {
namespace svm {

namespace {

InvokeOutcome system_error(SystemError error) {
  return InvokeOutcome::failure(
      InstructionError::custom(static_cast<uint32_t>(error)));
}

} // namespace

class SystemProgram::Impl {
public:
  InvokeOutcome create_account(InvokeContext &context, Lamports lamports,
                               uint64_t space, const PublicKey &owner) const {
    if (context.instruction_account_count() < 2) {
      return InvokeOutcome::failure(InstructionErrorKind::NOT_ENOUGH_ACCOUNT_KEYS);
    }
    const KeyedAccount &to = context.instruction_account_state(1);
    if (to.account.lamports > 0) {
      context.log("Create Account: account " + base58_encode(to.pubkey) +
                  " already in use");
      return system_error(SystemError::ACCOUNT_ALREADY_IN_USE);
    }

    auto outcome = allocate(context, 1, space);
    if (!outcome.is_success()) {
      return outcome;
    }
    outcome = assign(context, 1, owner);
    if (!outcome.is_success()) {
      return outcome;
    }
    return transfer(context, 0, 1, lamports);
  }

  InvokeOutcome assign(InvokeContext &context, size_t index,
                       const PublicKey &owner) const {
    KeyedAccount &target = context.instruction_account_state(index);
    if (target.account.owner == owner) {
      return InvokeOutcome::ok();
    }
    if (!context.instruction_account(index).is_signer) {
      context.log("Assign: account " + base58_encode(target.pubkey) +
                  " must sign");
      return InvokeOutcome::failure(
          InstructionErrorKind::MISSING_REQUIRED_SIGNATURE);
    }
    target.account.owner = owner;
    return InvokeOutcome::ok();
  }

  InvokeOutcome allocate(InvokeContext &context, size_t index,
                         uint64_t space) const {
    KeyedAccount &target = context.instruction_account_state(index);
    if (!context.instruction_account(index).is_signer) {
      context.log("Allocate: 'to' account " + base58_encode(target.pubkey) +
                  " must sign");
      return InvokeOutcome::failure(
          InstructionErrorKind::MISSING_REQUIRED_SIGNATURE);
    }
    if (!target.account.data.empty() ||
        target.account.owner != program_ids::system_program()) {
      context.log("Allocate: account " + base58_encode(target.pubkey) +
                  " already in use");
      return system_error(SystemError::ACCOUNT_ALREADY_IN_USE);
    }
    if (space > MAX_PERMITTED_DATA_LENGTH) {
      context.log("Allocate: requested " + std::to_string(space) +
                  ", max allowed " + std::to_string(MAX_PERMITTED_DATA_LENGTH));
      return system_error(SystemError::INVALID_ACCOUNT_DATA_LENGTH);
    }
    target.account.data.assign(static_cast<size_t>(space), 0);
    return InvokeOutcome::ok();
  }

  InvokeOutcome transfer(InvokeContext &context, size_t from_index,
                         size_t to_index, Lamports lamports) const {
    KeyedAccount &from = context.instruction_account_state(from_index);
    if (!context.instruction_account(from_index).is_signer) {
      context.log("Transfer: `from` account " + base58_encode(from.pubkey) +
                  " must sign");
      return InvokeOutcome::failure(
          InstructionErrorKind::MISSING_REQUIRED_SIGNATURE);
    }
    if (!from.account.data.empty()) {
      context.log("Transfer: `from` must not carry data");
      return InvokeOutcome::failure(InstructionErrorKind::INVALID_ARGUMENT);
    }
    if (lamports > from.account.lamports) {
      context.log("Transfer: insufficient lamports " +
                  std::to_string(from.account.lamports) + ", need " +
                  std::to_string(lamports));
      return system_error(SystemError::RESULT_WITH_NEGATIVE_LAMPORTS);
    }

    from.account.lamports -= lamports;
    // `to` may alias `from`; re-resolve after the debit
    KeyedAccount &to = context.instruction_account_state(to_index);
    if (to.account.lamports > UINT64_MAX - lamports) {
      return InvokeOutcome::failure(InstructionErrorKind::ARITHMETIC_OVERFLOW);
    }
    to.account.lamports += lamports;
    return InvokeOutcome::ok();
  }
};

SystemProgram::SystemProgram() : impl_(std::make_unique<Impl>()) {}
SystemProgram::~SystemProgram() = default;

PublicKey SystemProgram::get_program_id() const {
  return program_ids::system_program();
}

InvokeOutcome SystemProgram::execute(InvokeContext &context) const {
  ByteReader reader(context.instruction_data());
  uint32_t instruction_type = 0;
  if (!reader.get_u32(instruction_type)) {
    return InvokeOutcome::failure(InstructionErrorKind::INVALID_INSTRUCTION_DATA);
  }

  switch (static_cast<system_instruction::Type>(instruction_type)) {
  case system_instruction::Type::CREATE_ACCOUNT: {
    uint64_t lamports = 0;
    uint64_t space = 0;
    PublicKey owner;
    if (!reader.get_u64(lamports) || !reader.get_u64(space) ||
        !reader.get_key(owner)) {
      return InvokeOutcome::failure(InstructionErrorKind::INVALID_INSTRUCTION_DATA);
    }
    return impl_->create_account(context, lamports, space, owner);
  }

  case system_instruction::Type::ASSIGN: {
    PublicKey owner;
    if (!reader.get_key(owner)) {
      return InvokeOutcome::failure(InstructionErrorKind::INVALID_INSTRUCTION_DATA);
    }
    if (context.instruction_account_count() < 1) {
      return InvokeOutcome::failure(InstructionErrorKind::NOT_ENOUGH_ACCOUNT_KEYS);
    }
    return impl_->assign(context, 0, owner);
  }

  case system_instruction::Type::TRANSFER: {
    uint64_t lamports = 0;
    if (!reader.get_u64(lamports)) {
      return InvokeOutcome::failure(InstructionErrorKind::INVALID_INSTRUCTION_DATA);
    }
    if (context.instruction_account_count() < 2) {
      return InvokeOutcome::failure(InstructionErrorKind::NOT_ENOUGH_ACCOUNT_KEYS);
    }
    return impl_->transfer(context, 0, 1, lamports);
  }

  case system_instruction::Type::ALLOCATE: {
    uint64_t space = 0;
    if (!reader.get_u64(space)) {
      return InvokeOutcome::failure(InstructionErrorKind::INVALID_INSTRUCTION_DATA);
    }
    if (context.instruction_account_count() < 1) {
      return InvokeOutcome::failure(InstructionErrorKind::NOT_ENOUGH_ACCOUNT_KEYS);
    }
    return impl_->allocate(context, 0, space);
  }

  default:
    return InvokeOutcome::failure(InstructionErrorKind::INVALID_INSTRUCTION_DATA);
  }
}

namespace system_instruction {

Instruction create_account(const PublicKey &from, const PublicKey &to,
                           Lamports lamports, uint64_t space,
                           const PublicKey &owner) {
  ByteWriter writer;
  writer.put_u32(static_cast<uint32_t>(Type::CREATE_ACCOUNT));
  writer.put_u64(lamports);
  writer.put_u64(space);
  writer.put_key(owner);
  return Instruction{program_ids::system_program(),
                     {AccountMeta::writable(from, true),
                      AccountMeta::writable(to, true)},
                     writer.take()};
}

Instruction assign(const PublicKey &account, const PublicKey &owner) {
  ByteWriter writer;
  writer.put_u32(static_cast<uint32_t>(Type::ASSIGN));
  writer.put_key(owner);
  return Instruction{program_ids::system_program(),
                     {AccountMeta::writable(account, true)},
                     writer.take()};
}

Instruction transfer(const PublicKey &from, const PublicKey &to,
                     Lamports lamports) {
  ByteWriter writer;
  writer.put_u32(static_cast<uint32_t>(Type::TRANSFER));
  writer.put_u64(lamports);
  return Instruction{program_ids::system_program(),
                     {AccountMeta::writable(from, true),
                      AccountMeta::writable(to, false)},
                     writer.take()};
}

Instruction allocate(const PublicKey &account, uint64_t space) {
  ByteWriter writer;
  writer.put_u32(static_cast<uint32_t>(Type::ALLOCATE));
  writer.put_u64(space);
  return Instruction{program_ids::system_program(),
                     {AccountMeta::writable(account, true)},
                     writer.take()};
}

} // namespace system_instruction

} // namespace svm
} // namespace periwinkle
