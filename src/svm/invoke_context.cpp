#include "svm/invoke_context.h"
#include "common/base58.h"
#include "common/crypto_utils.h"
#include "common/logging.h"
#include "svm/program_registry.h"
#include <algorithm>

namespace periwinkle {
namespace svm {

namespace {

bool is_zeroed(const std::vector<uint8_t> &data) {
  return std::all_of(data.begin(), data.end(),
                     [](uint8_t byte) { return byte == 0; });
}

} // namespace

void LogCollector::log(const std::string &message) {
  if (limit_reached_) {
    return;
  }
  bytes_written_ += message.size();
  if (bytes_written_ >= bytes_limit_) {
    limit_reached_ = true;
    messages_.push_back("Log truncated");
    return;
  }
  messages_.push_back(message);
}

InvokeContext::InvokeContext(std::vector<KeyedAccount> accounts,
                             const ComputeBudget &compute_budget,
                             const FeatureSet &feature_set,
                             const Sysvars &sysvars,
                             const ProgramRegistry &registry,
                             LogCollector &log_collector)
    : accounts_(std::move(accounts)),
      meter_(compute_budget.compute_unit_limit),
      compute_budget_(compute_budget), feature_set_(feature_set),
      sysvars_(sysvars), registry_(registry), log_collector_(log_collector) {}

InvokeOutcome InvokeContext::process_instruction(
    const PublicKey &program_id, std::vector<InstructionAccount> accounts,
    const std::vector<uint8_t> &data) {
  for (const auto &account : accounts) {
    if (account.index_in_transaction >= accounts_.size()) {
      return InvokeOutcome::failure(InstructionErrorKind::MISSING_ACCOUNT);
    }
  }

  Frame frame;
  frame.program_id = program_id;
  frame.accounts = std::move(accounts);
  frame.data = data;
  return execute_frame(std::move(frame));
}

InvokeOutcome
InvokeContext::process_nested_instruction(const Instruction &instruction,
                                          const std::vector<PublicKey> &signers) {
  if (frames_.empty()) {
    return InvokeOutcome::failure(InstructionErrorKind::GENERIC_ERROR);
  }

  if (!consume_checked(compute_budget_.invoke_units)) {
    return InvokeOutcome::failure(
        InstructionErrorKind::COMPUTATIONAL_BUDGET_EXCEEDED);
  }

  const Frame &caller = current_frame();
  std::vector<InstructionAccount> callee_accounts;
  callee_accounts.reserve(instruction.accounts.size());

  for (const auto &meta : instruction.accounts) {
    auto index = find_transaction_account(meta.pubkey);
    if (!index) {
      log("Instruction references an unknown account " +
          base58_encode(meta.pubkey));
      return InvokeOutcome::failure(InstructionErrorKind::MISSING_ACCOUNT);
    }

    // Caller privileges are the union over its references to the account
    bool caller_signer = false;
    bool caller_writable = false;
    for (const auto &account : caller.accounts) {
      if (account.index_in_transaction == *index) {
        caller_signer = caller_signer || account.is_signer;
        caller_writable = caller_writable || account.is_writable;
      }
    }
    bool signed_by_caller =
        std::find(signers.begin(), signers.end(), meta.pubkey) != signers.end();

    if (meta.is_writable && !caller_writable) {
      log(base58_encode(meta.pubkey) + "'s writable privilege escalated");
      return InvokeOutcome::failure(InstructionErrorKind::PRIVILEGE_ESCALATION);
    }
    if (meta.is_signer && !caller_signer && !signed_by_caller) {
      log(base58_encode(meta.pubkey) + "'s signer privilege escalated");
      return InvokeOutcome::failure(InstructionErrorKind::PRIVILEGE_ESCALATION);
    }

    callee_accounts.push_back(
        InstructionAccount{*index, meta.is_signer, meta.is_writable});
  }

  auto checkpoint = checkpoint_frame();
  if (!checkpoint.is_success()) {
    return checkpoint;
  }

  Frame frame;
  frame.program_id = instruction.program_id;
  frame.accounts = std::move(callee_accounts);
  frame.data = instruction.data;
  auto outcome = execute_frame(std::move(frame));
  if (!outcome.is_success()) {
    return outcome;
  }

  // The callee's changes were verified against its own frame; they become
  // the caller's baseline without being attributed to the caller
  rebase_frame();
  return InvokeOutcome::ok();
}

InvokeOutcome InvokeContext::execute_frame(Frame frame) {
  const std::string program = base58_encode(frame.program_id);

  if (frames_.size() >= compute_budget_.max_invoke_stack_height) {
    return InvokeOutcome::failure(InstructionErrorKind::CALL_DEPTH);
  }
  if (instruction_trace_length_ >= compute_budget_.max_instruction_trace_length) {
    return InvokeOutcome::failure(
        InstructionErrorKind::MAX_INSTRUCTION_TRACE_LENGTH_EXCEEDED);
  }
  // Reentrancy is only allowed as a direct self-invocation
  for (size_t i = 0; i < frames_.size(); ++i) {
    bool is_caller = i + 1 == frames_.size();
    if (frames_[i].program_id == frame.program_id && !is_caller) {
      return InvokeOutcome::failure(InstructionErrorKind::REENTRANCY_NOT_ALLOWED);
    }
  }

  const ProgramEntry *entry = registry_.find(frame.program_id);
  if (!entry) {
    log("Program " + program + " is not registered");
    LOG_DEBUG("Unknown program ", program);
    return InvokeOutcome::unknown_program();
  }
  const ProgramLoader *loader = registry_.loader_for(entry->loader_key);
  if (!loader) {
    log("Program " + program + " has no loader");
    return InvokeOutcome::unknown_program();
  }

  for (const auto &account : frame.accounts) {
    frame.pre_state.emplace(account.index_in_transaction,
                            accounts_[account.index_in_transaction].account);
  }

  ++instruction_trace_length_;
  frames_.push_back(std::move(frame));
  log("Program " + program + " invoke [" + std::to_string(frames_.size()) + "]");

  uint64_t remaining_before = meter_.remaining();
  InvokeOutcome outcome = loader->invoke(*entry, *this);
  if (outcome.is_success()) {
    outcome = verify_frame(current_frame());
  }

  if (!entry->builtin) {
    log("Program " + program + " consumed " +
        std::to_string(remaining_before - meter_.remaining()) + " of " +
        std::to_string(remaining_before) + " compute units");
  }
  if (outcome.is_success()) {
    log("Program " + program + " success");
  } else {
    log("Program " + program + " failed: " + outcome.error.to_string());
  }

  frames_.pop_back();
  return outcome;
}

InvokeOutcome InvokeContext::checkpoint_frame() {
  if (frames_.empty()) {
    return InvokeOutcome::ok();
  }
  Frame &frame = current_frame();
  auto outcome = verify_frame(frame);
  if (!outcome.is_success()) {
    return outcome;
  }
  rebase_frame();
  return InvokeOutcome::ok();
}

void InvokeContext::rebase_frame() {
  if (frames_.empty()) {
    return;
  }
  for (auto &[index, pre] : current_frame().pre_state) {
    pre = accounts_[index].account;
  }
}

InvokeOutcome InvokeContext::verify_frame(const Frame &frame) const {
  Lamports pre_total = 0;
  Lamports post_total = 0;

  for (const auto &[index, pre] : frame.pre_state) {
    bool is_writable = false;
    for (const auto &account : frame.accounts) {
      if (account.index_in_transaction == index) {
        is_writable = is_writable || account.is_writable;
      }
    }

    auto outcome = verify_account(frame, index, is_writable);
    if (!outcome.is_success()) {
      return outcome;
    }
    pre_total += pre.lamports;
    post_total += accounts_[index].account.lamports;
  }

  if (pre_total != post_total) {
    return InvokeOutcome::failure(InstructionErrorKind::UNBALANCED_INSTRUCTION);
  }
  return InvokeOutcome::ok();
}

InvokeOutcome InvokeContext::verify_account(const Frame &frame,
                                            size_t index_in_transaction,
                                            bool is_writable) const {
  const Account &pre = frame.pre_state.at(index_in_transaction);
  const Account &post = accounts_[index_in_transaction].account;

  if (!is_writable) {
    if (pre == post) {
      return InvokeOutcome::ok();
    }
    LOG_WARN("Program ", base58_encode(frame.program_id),
             " modified read-only account ",
             base58_encode(accounts_[index_in_transaction].pubkey));
    if (pre.lamports != post.lamports) {
      return InvokeOutcome::contract_violation(
          InstructionError(InstructionErrorKind::READONLY_LAMPORT_CHANGE));
    }
    if (pre.data != post.data) {
      return InvokeOutcome::contract_violation(
          InstructionError(InstructionErrorKind::READONLY_DATA_MODIFIED));
    }
    if (pre.owner != post.owner) {
      return InvokeOutcome::contract_violation(
          InstructionError(InstructionErrorKind::MODIFIED_PROGRAM_ID));
    }
    if (pre.executable != post.executable) {
      return InvokeOutcome::contract_violation(
          InstructionError(InstructionErrorKind::EXECUTABLE_MODIFIED));
    }
    return InvokeOutcome::contract_violation(
        InstructionError(InstructionErrorKind::RENT_EPOCH_MODIFIED));
  }

  bool owned_by_program = pre.owner == frame.program_id;

  // Only the owner may assign a zeroed, non-executable account
  if (pre.owner != post.owner &&
      (pre.executable || !owned_by_program || !is_zeroed(post.data))) {
    return InvokeOutcome::failure(InstructionErrorKind::MODIFIED_PROGRAM_ID);
  }

  if (post.lamports < pre.lamports && !owned_by_program) {
    return InvokeOutcome::failure(
        InstructionErrorKind::EXTERNAL_ACCOUNT_LAMPORT_SPEND);
  }
  if (pre.executable && pre.lamports != post.lamports) {
    return InvokeOutcome::failure(InstructionErrorKind::EXECUTABLE_LAMPORT_CHANGE);
  }

  if (pre.data != post.data) {
    if (pre.executable) {
      return InvokeOutcome::failure(InstructionErrorKind::EXECUTABLE_DATA_MODIFIED);
    }
    if (!owned_by_program) {
      return InvokeOutcome::failure(
          InstructionErrorKind::EXTERNAL_ACCOUNT_DATA_MODIFIED);
    }
  }

  if (pre.executable != post.executable) {
    // Marking executable is a one-way step taken by the owning loader
    if (pre.executable || !owned_by_program) {
      return InvokeOutcome::failure(InstructionErrorKind::EXECUTABLE_MODIFIED);
    }
    if (!sysvars_.rent.is_exempt(post.lamports, post.data.size())) {
      return InvokeOutcome::failure(
          InstructionErrorKind::EXECUTABLE_ACCOUNT_NOT_RENT_EXEMPT);
    }
  }

  if (pre.rent_epoch != post.rent_epoch) {
    return InvokeOutcome::failure(InstructionErrorKind::RENT_EPOCH_MODIFIED);
  }
  return InvokeOutcome::ok();
}

InvokeContext::Frame &InvokeContext::current_frame() { return frames_.back(); }

const InvokeContext::Frame &InvokeContext::current_frame() const {
  return frames_.back();
}

const PublicKey &InvokeContext::program_id() const {
  return current_frame().program_id;
}

const std::vector<uint8_t> &InvokeContext::instruction_data() const {
  return current_frame().data;
}

size_t InvokeContext::instruction_account_count() const {
  return current_frame().accounts.size();
}

const InstructionAccount &InvokeContext::instruction_account(size_t index) const {
  return current_frame().accounts.at(index);
}

KeyedAccount &InvokeContext::instruction_account_state(size_t index) {
  return accounts_.at(instruction_account(index).index_in_transaction);
}

const KeyedAccount &InvokeContext::instruction_account_state(size_t index) const {
  return accounts_.at(instruction_account(index).index_in_transaction);
}

std::optional<size_t>
InvokeContext::find_transaction_account(const PublicKey &pubkey) const {
  for (size_t i = 0; i < accounts_.size(); ++i) {
    if (accounts_[i].pubkey == pubkey) {
      return i;
    }
  }
  return std::nullopt;
}

bool InvokeContext::consume_checked(uint64_t units) {
  return meter_.consume(units).is_ok();
}

void InvokeContext::set_return_data(const PublicKey &program_id,
                                    std::vector<uint8_t> data) {
  if (feature_set_.is_active(features::enable_log_return_data()) &&
      !data.empty()) {
    log("Program return: " + base58_encode(program_id) + " " +
        CryptoUtils::base64_encode(data));
  }
  return_data_.program_id = program_id;
  return_data_.data = std::move(data);
}

} // namespace svm
} // namespace periwinkle
