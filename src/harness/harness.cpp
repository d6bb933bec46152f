#include "harness/harness.h"
#include "common/base58.h"
#include "common/logging.h"
#include "harness/fixture_adapter.h"
#include "svm/invoke_context.h"
#include <chrono>
#include <unordered_map>

namespace periwinkle {
namespace harness {

/// Deduplicated call inputs for one instruction
struct Harness::PreparedCall {
  std::vector<svm::KeyedAccount> accounts;
  std::vector<svm::InstructionAccount> instruction_accounts;
  /// Program stubs supplied by the harness, left out of the result
  std::vector<bool> synthesized;
};

Harness::Harness() : search_path_(svm::ProgramSearchPath::from_environment()) {
  registry_.add_default_builtins();
}

Harness::Harness(const PublicKey &program_id, const std::string &program_name)
    : Harness(program_id, program_name,
              svm::ProgramSearchPath::from_environment()) {}

Harness::Harness(const PublicKey &program_id, const std::string &program_name,
                 svm::ProgramSearchPath search_path)
    : search_path_(std::move(search_path)) {
  registry_.add_default_builtins();
  add_program(program_id, program_name);
}

void Harness::add_program(const PublicKey &program_id,
                          const std::string &program_name,
                          const PublicKey &loader_key) {
  auto image = svm::ProgramFile::load(program_name, search_path_);
  if (image.is_err()) {
    LOG_HARNESS_ERROR("Program image unavailable: " + image.error(),
                      "PROGRAM_NOT_FOUND");
    throw ConfigurationError(image.error());
  }
  auto added = registry_.add_program(program_id, loader_key,
                                     std::move(image).value(), program_name);
  if (added.is_err()) {
    LOG_HARNESS_ERROR("Program " + program_name + " rejected: " + added.error(),
                      "PROGRAM_REJECTED");
    throw ConfigurationError("Program " + program_name + ": " + added.error());
  }
  LOG_INFO("Registered program ", program_name, " at ", base58_encode(program_id));
}

void Harness::add_program_with_image(const PublicKey &program_id,
                                     std::vector<uint8_t> image,
                                     const PublicKey &loader_key) {
  auto added = registry_.add_program(program_id, loader_key, std::move(image));
  if (added.is_err()) {
    LOG_HARNESS_ERROR("Program image rejected: " + added.error(),
                      "PROGRAM_REJECTED");
    throw ConfigurationError("Program " + base58_encode(program_id) + ": " +
                             added.error());
  }
}

void Harness::add_builtin(std::shared_ptr<const svm::BuiltinProgram> builtin) {
  auto added = registry_.add_builtin(std::move(builtin));
  if (added.is_err()) {
    throw ConfigurationError(added.error());
  }
}

void Harness::add_observer(std::shared_ptr<ExecutionObserver> observer) {
  observers_.push_back(std::move(observer));
}

// ============================================================================
// Single instruction
// ============================================================================

Harness::PreparedCall
Harness::prepare_call(const svm::Instruction &instruction,
                      const svm::AccountStore &accounts) const {
  PreparedCall call;
  std::unordered_map<PublicKey, size_t> index_of;

  for (const auto &meta : instruction.accounts) {
    auto found = index_of.find(meta.pubkey);
    size_t index = 0;
    if (found != index_of.end()) {
      index = found->second;
    } else {
      const svm::Account *account = accounts.find(meta.pubkey);
      bool synthesized = false;
      svm::KeyedAccount keyed{meta.pubkey, svm::Account()};
      if (account) {
        keyed.account = *account;
      } else {
        auto stub = meta.pubkey == instruction.program_id
                        ? registry_.keyed_account_for(meta.pubkey,
                                                      config_.sysvars.rent)
                        : std::nullopt;
        if (!stub) {
          LOG_DEBUG("Instruction references missing account ",
                    base58_encode(meta.pubkey));
          throw InstructionValidationError(meta.pubkey);
        }
        keyed = std::move(*stub);
        synthesized = true;
      }
      index = call.accounts.size();
      index_of.emplace(meta.pubkey, index);
      call.accounts.push_back(std::move(keyed));
      call.synthesized.push_back(synthesized);
    }
    call.instruction_accounts.push_back(
        svm::InstructionAccount{index, meta.is_signer, meta.is_writable});
  }

  // Every reference to an account carries the union of its privileges
  std::vector<svm::InstructionAccount> merged(call.accounts.size());
  for (const auto &ref : call.instruction_accounts) {
    merged[ref.index_in_transaction].is_signer |= ref.is_signer;
    merged[ref.index_in_transaction].is_writable |= ref.is_writable;
  }
  for (auto &ref : call.instruction_accounts) {
    ref.is_signer = merged[ref.index_in_transaction].is_signer;
    ref.is_writable = merged[ref.index_in_transaction].is_writable;
  }
  return call;
}

InstructionResult
Harness::process_instruction(const svm::Instruction &instruction,
                             const svm::AccountStore &accounts) const {
  PreparedCall call = prepare_call(instruction, accounts);

  svm::LogCollector log_collector;
  svm::InvokeContext context(call.accounts, config_.compute_budget,
                             config_.feature_set, config_.sysvars, registry_,
                             log_collector);

  auto start_time = std::chrono::steady_clock::now();
  svm::InvokeOutcome outcome = context.process_instruction(
      instruction.program_id, call.instruction_accounts, instruction.data);
  auto end_time = std::chrono::steady_clock::now();

  InstructionResult result;
  result.compute_units_consumed = context.compute_meter().consumed();
  result.execution_time = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time)
          .count());
  result.program_result = ProgramResult::from_outcome(outcome);
  result.return_data = context.return_data().data;
  result.logs = log_collector.take_messages();

  // A failed call leaves every account as it was supplied
  const std::vector<svm::KeyedAccount> &final_accounts =
      outcome.is_success() ? context.transaction_accounts() : call.accounts;
  for (size_t i = 0; i < final_accounts.size(); ++i) {
    if (!call.synthesized[i]) {
      result.resulting_accounts.push_back(final_accounts[i]);
    }
  }

  if (config_.capture_program_logs) {
    for (const auto &line : result.logs) {
      LOG_DEBUG("[program] ", line);
    }
  }
  LOG_TRACE("Processed instruction for ", base58_encode(instruction.program_id),
            ": ", result.program_result.to_string(), ", ",
            result.compute_units_consumed, " CUs");

  notify_observers(instruction, accounts, result);
  return result;
}

InstructionResult Harness::process_and_validate_instruction(
    const svm::Instruction &instruction, const svm::AccountStore &accounts,
    const std::vector<Check> &checks) const {
  InstructionResult result = process_instruction(instruction, accounts);
  run_checks(result, checks);
  return result;
}

void Harness::notify_observers(const svm::Instruction &instruction,
                               const svm::AccountStore &accounts,
                               const InstructionResult &result) const {
  if (observers_.empty()) {
    return;
  }
  ExecutionRecord record{config_, registry_, instruction, accounts, result};
  for (const auto &observer : observers_) {
    observer->on_instruction(record);
  }
}

// ============================================================================
// Chains
// ============================================================================

namespace {

/// Result standing in for a step whose accounts could not be resolved
InstructionResult missing_account_step(size_t step,
                                       const InstructionValidationError &error) {
  InstructionResult aborted;
  aborted.program_result = ProgramResult::unknown_error(
      svm::InstructionError(svm::InstructionErrorKind::MISSING_ACCOUNT));
  aborted.chain_abort = ChainAbort{step, error.what()};
  LOG_WARN("Chain aborted at step ", step, ": missing account ",
           base58_encode(error.missing_account()));
  return aborted;
}

void merge_into(svm::AccountStore &store, const InstructionResult &step) {
  for (const auto &account : step.resulting_accounts) {
    store.upsert(account.pubkey, account.account);
  }
}

} // namespace

InstructionResult
Harness::process_instruction_chain(const std::vector<svm::Instruction> &instructions,
                                   const svm::AccountStore &accounts) const {
  svm::AccountStore store = accounts;
  InstructionResult composite;
  composite.resulting_accounts = store.entries();

  for (size_t i = 0; i < instructions.size(); ++i) {
    InstructionResult step;
    try {
      step = process_instruction(instructions[i], store);
    } catch (const InstructionValidationError &e) {
      composite.absorb(missing_account_step(i, e));
      break;
    }
    merge_into(store, step);
    composite.absorb(step);
    if (step.program_result.is_err()) {
      LOG_DEBUG("Chain stopped after failing step ", i, ": ",
                step.program_result.to_string());
      break;
    }
  }
  return composite;
}

InstructionResult Harness::process_and_validate_instruction_chain(
    const std::vector<ChainStep> &steps, const svm::AccountStore &accounts) const {
  svm::AccountStore store = accounts;
  InstructionResult composite;
  composite.resulting_accounts = store.entries();

  for (size_t i = 0; i < steps.size(); ++i) {
    InstructionResult step;
    try {
      step = process_instruction(steps[i].instruction, store);
    } catch (const InstructionValidationError &e) {
      composite.absorb(missing_account_step(i, e));
      break;
    }
    merge_into(store, step);
    composite.absorb(step);

    // Account checks see the running store, not only this step's accounts
    InstructionResult view = step;
    view.resulting_accounts = store.entries();
    std::vector<Mismatch> mismatches = evaluate_checks(view, steps[i].checks);
    if (!mismatches.empty()) {
      LOG_STRUCTURED(LogLevel::WARN, "harness",
                     "Chain step " + std::to_string(i) + " failed " +
                         std::to_string(mismatches.size()) + " checks",
                     "CHECK_FAILURE");
      throw CheckFailure(std::move(mismatches), i,
                         std::make_shared<const InstructionResult>(composite));
    }
    if (step.program_result.is_err()) {
      break;
    }
  }
  return composite;
}

// ============================================================================
// Fixtures
// ============================================================================

void Harness::apply_fixture_config(const EnvironmentConfig &config) {
  bool capture = config_.capture_program_logs;
  config_ = config;
  config_.capture_program_logs = capture;
}

InstructionResult Harness::process_fixture(const fixture::Fixture &fixture) {
  ParsedFixture parsed = load_native_fixture(fixture, config_);
  apply_fixture_config(parsed.config);
  return process_instruction(parsed.instruction, parsed.accounts);
}

InstructionResult
Harness::process_and_validate_fixture(const fixture::Fixture &fixture) {
  ParsedFixture parsed = load_native_fixture(fixture, config_);
  apply_fixture_config(parsed.config);
  InstructionResult result = process_instruction(parsed.instruction, parsed.accounts);

  std::vector<Mismatch> mismatches = parsed.expected.compare(result);
  if (!mismatches.empty()) {
    LOG_STRUCTURED(LogLevel::WARN, "fixture", "Fixture effects differ from result",
                   "FIXTURE_MISMATCH");
    throw CheckFailure(std::move(mismatches));
  }
  return result;
}

InstructionResult Harness::process_and_partially_validate_fixture(
    const fixture::Fixture &fixture, const std::vector<FixtureCheck> &checks) {
  ParsedFixture parsed = load_native_fixture(fixture, config_);
  apply_fixture_config(parsed.config);
  InstructionResult result = process_instruction(parsed.instruction, parsed.accounts);
  run_checks(result, checks_from_fixture(parsed.expected, checks));
  return result;
}

InstructionResult
Harness::process_fixture(const fixture::firedancer::Fixture &fixture) {
  ParsedFixture parsed = load_firedancer_fixture(fixture, config_);
  apply_fixture_config(parsed.config);
  return process_instruction(parsed.instruction, parsed.accounts);
}

InstructionResult
Harness::process_and_validate_fixture(const fixture::firedancer::Fixture &fixture) {
  ParsedFixture parsed = load_firedancer_fixture(fixture, config_);
  apply_fixture_config(parsed.config);
  InstructionResult result = process_instruction(parsed.instruction, parsed.accounts);

  InstructionResult normalized = normalize_for_firedancer(fixture, result);
  std::vector<Mismatch> mismatches = parsed.expected.compare(normalized);
  if (!mismatches.empty()) {
    LOG_STRUCTURED(LogLevel::WARN, "fixture", "Fixture effects differ from result",
                   "FIXTURE_MISMATCH");
    throw CheckFailure(std::move(mismatches));
  }
  return result;
}

InstructionResult Harness::process_and_partially_validate_fixture(
    const fixture::firedancer::Fixture &fixture,
    const std::vector<FixtureCheck> &checks) {
  ParsedFixture parsed = load_firedancer_fixture(fixture, config_);
  apply_fixture_config(parsed.config);
  InstructionResult result = process_instruction(parsed.instruction, parsed.accounts);
  run_checks(normalize_for_firedancer(fixture, result),
             checks_from_fixture(parsed.expected, checks));
  return result;
}

} // namespace harness
} // namespace periwinkle
