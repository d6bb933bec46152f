#include "harness/fixture_adapter.h"
#include "common/logging.h"
#include "svm/program_ids.h"
#include <algorithm>
#include <limits>
#include <unordered_map>

namespace periwinkle {
namespace harness {

namespace {

uint64_t custom_code_of(const ProgramResult &result) {
  if (result.is_err() &&
      result.error().kind == svm::InstructionErrorKind::CUSTOM) {
    return result.error().custom_code;
  }
  return 0;
}

/// Unique account keys in the order the instruction first references them
std::vector<PublicKey> referenced_keys(const svm::Instruction &instruction) {
  std::vector<PublicKey> keys;
  for (const auto &meta : instruction.accounts) {
    if (std::find(keys.begin(), keys.end(), meta.pubkey) == keys.end()) {
      keys.push_back(meta.pubkey);
    }
  }
  return keys;
}

} // namespace

// ============================================================================
// Native layout
// ============================================================================

fixture::Outcome to_fixture_outcome(const ProgramResult &result) {
  fixture::Outcome outcome;
  outcome.kind = static_cast<fixture::OutcomeKind>(result.kind());
  if (result.is_err()) {
    outcome.error_index = result.error().index();
    outcome.custom_code = result.error().custom_code;
  }
  outcome.program_result = result.to_code();
  return outcome;
}

ProgramResult from_fixture_outcome(const fixture::Outcome &outcome) {
  auto error =
      svm::InstructionError::from_index(outcome.error_index, outcome.custom_code);
  svm::InstructionError runtime_error =
      error ? *error : svm::InstructionError(svm::InstructionErrorKind::INVALID_ERROR);

  switch (outcome.kind) {
  case fixture::OutcomeKind::SUCCESS:
    return ProgramResult::success();
  case fixture::OutcomeKind::FAILURE:
    if (error && error->to_program_error_code() == outcome.program_result) {
      return ProgramResult::from_instruction_error(*error);
    }
    return ProgramResult::failure(outcome.program_result);
  case fixture::OutcomeKind::UNKNOWN_PROGRAM:
    return ProgramResult::unknown_program();
  case fixture::OutcomeKind::CONTRACT_VIOLATION:
    return ProgramResult::contract_violation(runtime_error);
  case fixture::OutcomeKind::UNKNOWN_ERROR:
  default:
    return ProgramResult::unknown_error(runtime_error);
  }
}

fixture::Fixture build_native_fixture(const EnvironmentConfig &config,
                                      const svm::Instruction &instruction,
                                      const svm::AccountStore &accounts,
                                      const InstructionResult &result) {
  fixture::Fixture fixture;
  fixture.input.compute_budget = config.compute_budget;
  fixture.input.feature_set = config.feature_set;
  fixture.input.sysvars = config.sysvars;
  fixture.input.program_id = instruction.program_id;
  fixture.input.instruction_accounts = instruction.accounts;
  fixture.input.instruction_data = instruction.data;
  fixture.input.accounts = accounts.entries();

  fixture.output.compute_units_consumed = result.compute_units_consumed;
  fixture.output.execution_time = result.execution_time;
  fixture.output.outcome = to_fixture_outcome(result.program_result);
  fixture.output.return_data = result.return_data;
  fixture.output.resulting_accounts = result.resulting_accounts;
  return fixture;
}

ParsedFixture load_native_fixture(const fixture::Fixture &fixture,
                                  const EnvironmentConfig &base) {
  ParsedFixture parsed;
  parsed.config = base;
  parsed.config.compute_budget = fixture.input.compute_budget;
  parsed.config.feature_set = fixture.input.feature_set;
  parsed.config.sysvars = fixture.input.sysvars;

  parsed.instruction.program_id = fixture.input.program_id;
  parsed.instruction.accounts = fixture.input.instruction_accounts;
  parsed.instruction.data = fixture.input.instruction_data;
  parsed.accounts = svm::AccountStore(fixture.input.accounts);

  parsed.expected.compute_units_consumed = fixture.output.compute_units_consumed;
  parsed.expected.execution_time = fixture.output.execution_time;
  parsed.expected.program_result = from_fixture_outcome(fixture.output.outcome);
  parsed.expected.return_data = fixture.output.return_data;
  parsed.expected.resulting_accounts = fixture.output.resulting_accounts;
  return parsed;
}

// ============================================================================
// Interchange layout
// ============================================================================

int32_t to_firedancer_result(const ProgramResult &result) {
  if (result.is_ok()) {
    return 0;
  }
  return static_cast<int32_t>(result.error().index()) + 1;
}

ProgramResult from_firedancer_result(int32_t result, uint64_t custom_err) {
  if (result == 0) {
    return ProgramResult::success();
  }
  auto error = result > 0 ? svm::InstructionError::from_index(
                                static_cast<uint32_t>(result - 1),
                                static_cast<uint32_t>(custom_err))
                          : std::nullopt;
  if (!error) {
    LOG_WARN("Unrecognized interchange result code ", result);
    return ProgramResult::unknown_error(
        svm::InstructionError(svm::InstructionErrorKind::INVALID_ERROR));
  }
  return ProgramResult::from_instruction_error(*error);
}

fixture::firedancer::Fixture
build_firedancer_fixture(const EnvironmentConfig &config,
                         const svm::ProgramRegistry &registry,
                         const svm::Instruction &instruction,
                         const svm::AccountStore &accounts,
                         const InstructionResult &result) {
  namespace fd = fixture::firedancer;

  fd::Fixture fixture;
  fd::Context &context = fixture.input;
  context.program_id = instruction.program_id;

  std::unordered_map<PublicKey, uint32_t> index_of;
  auto add_account = [&](const PublicKey &key, const svm::Account &account) {
    index_of.emplace(key, static_cast<uint32_t>(context.accounts.size()));
    context.accounts.push_back(fd::FdAccount{key, account, std::nullopt});
  };

  for (const auto &key : referenced_keys(instruction)) {
    const svm::Account *account = accounts.find(key);
    if (account) {
      add_account(key, *account);
    }
  }

  if (index_of.find(instruction.program_id) == index_of.end()) {
    const PublicKey &loader_key = registry.is_builtin(instruction.program_id)
                                      ? svm::program_ids::native_loader()
                                      : svm::program_ids::bpf_loader_upgradeable();
    const svm::Account *stored = accounts.find(instruction.program_id);
    svm::Account program_account;
    if (stored) {
      program_account = *stored;
    } else {
      program_account.executable = true;
      program_account.owner = loader_key;
    }
    add_account(instruction.program_id, program_account);
  }

  for (const auto &meta : instruction.accounts) {
    auto found = index_of.find(meta.pubkey);
    if (found != index_of.end()) {
      context.instr_accounts.push_back(
          fd::InstrAccount{found->second, meta.is_writable, meta.is_signer});
    }
  }
  context.data = instruction.data;
  context.cu_avail = config.compute_budget.compute_unit_limit;
  context.slot = config.sysvars.clock.slot;
  context.features = config.feature_set.to_id_prefixes();

  fd::Effects &effects = fixture.output;
  effects.result = to_firedancer_result(result.program_result);
  effects.custom_err = custom_code_of(result.program_result);
  for (const auto &account : context.accounts) {
    const svm::Account *resulting = result.get_account(account.address);
    if (resulting && *resulting != account.account) {
      effects.modified_accounts.push_back(
          fd::FdAccount{account.address, *resulting, account.seed_addr});
    }
  }
  effects.cu_avail = context.cu_avail > result.compute_units_consumed
                         ? context.cu_avail - result.compute_units_consumed
                         : 0;
  effects.return_data = result.return_data;
  return fixture;
}

ParsedFixture load_firedancer_fixture(const fixture::firedancer::Fixture &fixture,
                                      const EnvironmentConfig &base) {
  const auto &context = fixture.input;
  const auto &effects = fixture.output;

  ParsedFixture parsed;
  parsed.config = base;
  parsed.config.compute_budget = svm::ComputeBudget();
  parsed.config.compute_budget.compute_unit_limit = context.cu_avail;
  parsed.config.feature_set = svm::FeatureSet::from_id_prefixes(context.features);
  if (parsed.config.sysvars.clock.slot != context.slot) {
    parsed.config.sysvars.warp_to_slot(context.slot);
  }

  std::vector<svm::KeyedAccount> keyed;
  for (const auto &account : context.accounts) {
    keyed.push_back(svm::KeyedAccount{account.address, account.account});
  }
  parsed.accounts = svm::AccountStore(keyed);

  parsed.instruction.program_id = context.program_id;
  parsed.instruction.data = context.data;
  for (const auto &instr_account : context.instr_accounts) {
    parsed.instruction.accounts.push_back(
        svm::AccountMeta{context.accounts.at(instr_account.index).address,
                         instr_account.is_signer, instr_account.is_writable});
  }

  InstructionResult &expected = parsed.expected;
  expected.program_result = from_firedancer_result(effects.result, effects.custom_err);
  expected.compute_units_consumed =
      context.cu_avail > effects.cu_avail ? context.cu_avail - effects.cu_avail : 0;
  expected.return_data = effects.return_data;
  for (const auto &key : referenced_keys(parsed.instruction)) {
    auto modified = std::find_if(
        effects.modified_accounts.begin(), effects.modified_accounts.end(),
        [&](const fixture::firedancer::FdAccount &a) { return a.address == key; });
    if (modified != effects.modified_accounts.end()) {
      expected.resulting_accounts.push_back(svm::KeyedAccount{key, modified->account});
    } else if (const svm::Account *input = parsed.accounts.find(key)) {
      expected.resulting_accounts.push_back(svm::KeyedAccount{key, *input});
    }
  }
  return parsed;
}

InstructionResult normalize_for_firedancer(const fixture::firedancer::Fixture &fixture,
                                           const InstructionResult &result) {
  InstructionResult normalized = result;
  normalized.program_result =
      from_firedancer_result(to_firedancer_result(result.program_result),
                             custom_code_of(result.program_result));
  normalized.execution_time = 0;
  normalized.logs.clear();
  if (result.compute_units_consumed > fixture.input.cu_avail) {
    normalized.compute_units_consumed = fixture.input.cu_avail;
  }
  return normalized;
}

} // namespace harness
} // namespace periwinkle
