#include "harness/result.h"
#include "common/base58.h"
#include <limits>
#include <sstream>

namespace periwinkle {
namespace harness {

namespace {

constexpr size_t MAX_RENDERED_BYTES = 64;

std::string render_bytes(const std::vector<uint8_t> &bytes) {
  if (bytes.size() <= MAX_RENDERED_BYTES) {
    return "0x" + hex_encode(bytes) + " (" + std::to_string(bytes.size()) +
           " bytes)";
  }
  std::vector<uint8_t> head(bytes.begin(), bytes.begin() + MAX_RENDERED_BYTES);
  return "0x" + hex_encode(head) + "... (" + std::to_string(bytes.size()) +
         " bytes)";
}

void compare_account(const std::string &label, const svm::Account &expected,
                     const svm::Account &actual, std::vector<Mismatch> &out) {
  if (expected.lamports != actual.lamports) {
    out.push_back({label + " lamports", std::to_string(expected.lamports),
                   std::to_string(actual.lamports)});
  }
  if (expected.data != actual.data) {
    out.push_back({label + " data", render_bytes(expected.data),
                   render_bytes(actual.data)});
  }
  if (expected.owner != actual.owner) {
    out.push_back({label + " owner", base58_encode(expected.owner),
                   base58_encode(actual.owner)});
  }
  if (expected.executable != actual.executable) {
    out.push_back({label + " executable", expected.executable ? "true" : "false",
                   actual.executable ? "true" : "false"});
  }
  if (expected.rent_epoch != actual.rent_epoch) {
    out.push_back({label + " rent_epoch", std::to_string(expected.rent_epoch),
                   std::to_string(actual.rent_epoch)});
  }
}

} // namespace

ProgramResult ProgramResult::success() { return ProgramResult(); }

ProgramResult ProgramResult::failure(uint64_t program_error) {
  ProgramResult result;
  result.kind_ = Kind::FAILURE;
  result.program_error_ = program_error;
  auto error = svm::InstructionError::from_program_error_code(program_error);
  result.error_ = error ? *error
                        : svm::InstructionError(svm::InstructionErrorKind::INVALID_ERROR);
  return result;
}

ProgramResult ProgramResult::unknown_error(svm::InstructionError error) {
  ProgramResult result;
  result.kind_ = Kind::UNKNOWN_ERROR;
  result.error_ = error;
  return result;
}

ProgramResult ProgramResult::unknown_program() {
  ProgramResult result;
  result.kind_ = Kind::UNKNOWN_PROGRAM;
  result.error_ =
      svm::InstructionError(svm::InstructionErrorKind::UNSUPPORTED_PROGRAM_ID);
  return result;
}

ProgramResult ProgramResult::contract_violation(svm::InstructionError error) {
  ProgramResult result;
  result.kind_ = Kind::CONTRACT_VIOLATION;
  result.error_ = error;
  return result;
}

ProgramResult
ProgramResult::from_instruction_error(const svm::InstructionError &error) {
  auto code = error.to_program_error_code();
  if (!code) {
    return unknown_error(error);
  }
  ProgramResult result;
  result.kind_ = Kind::FAILURE;
  result.program_error_ = *code;
  result.error_ = error;
  return result;
}

ProgramResult ProgramResult::from_outcome(const svm::InvokeOutcome &outcome) {
  switch (outcome.fault) {
  case svm::FaultKind::NONE:
    return success();
  case svm::FaultKind::UNKNOWN_PROGRAM:
    return unknown_program();
  case svm::FaultKind::CONTRACT_VIOLATION:
    return contract_violation(outcome.error);
  case svm::FaultKind::INSTRUCTION_ERROR:
  default:
    return from_instruction_error(outcome.error);
  }
}

uint64_t ProgramResult::to_code() const {
  switch (kind_) {
  case Kind::SUCCESS:
    return 0;
  case Kind::FAILURE:
    return program_error_;
  default:
    return std::numeric_limits<uint64_t>::max();
  }
}

std::string ProgramResult::to_string() const {
  switch (kind_) {
  case Kind::SUCCESS:
    return "Success";
  case Kind::FAILURE:
    return "Failure(" + svm::program_error_code_to_string(program_error_) + ")";
  case Kind::UNKNOWN_ERROR:
    return "UnknownError(" + error_.to_string() + ")";
  case Kind::UNKNOWN_PROGRAM:
    return "UnknownProgram";
  case Kind::CONTRACT_VIOLATION:
    return "ContractViolation(" + error_.to_string() + ")";
  }
  return "Unknown";
}

bool ProgramResult::operator==(const ProgramResult &other) const {
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
  case Kind::FAILURE:
    return program_error_ == other.program_error_;
  case Kind::UNKNOWN_ERROR:
  case Kind::CONTRACT_VIOLATION:
    return error_ == other.error_;
  default:
    return true;
  }
}

const char *to_string(ProgramResult::Kind kind) {
  switch (kind) {
  case ProgramResult::Kind::SUCCESS:
    return "success";
  case ProgramResult::Kind::FAILURE:
    return "failure";
  case ProgramResult::Kind::UNKNOWN_ERROR:
    return "unknown_error";
  case ProgramResult::Kind::UNKNOWN_PROGRAM:
    return "unknown_program";
  case ProgramResult::Kind::CONTRACT_VIOLATION:
    return "contract_violation";
  }
  return "unknown";
}

CompareOptions CompareOptions::everything() {
  CompareOptions options;
  options.execution_time = true;
  options.logs = true;
  return options;
}

const svm::Account *InstructionResult::get_account(const PublicKey &pubkey) const {
  for (const auto &entry : resulting_accounts) {
    if (entry.pubkey == pubkey) {
      return &entry.account;
    }
  }
  return nullptr;
}

void InstructionResult::absorb(const InstructionResult &step) {
  compute_units_consumed += step.compute_units_consumed;
  execution_time += step.execution_time;
  program_result = step.program_result;
  return_data = step.return_data;
  logs.insert(logs.end(), step.logs.begin(), step.logs.end());
  chain_abort = step.chain_abort;

  for (const auto &entry : step.resulting_accounts) {
    bool replaced = false;
    for (auto &existing : resulting_accounts) {
      if (existing.pubkey == entry.pubkey) {
        existing.account = entry.account;
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      resulting_accounts.push_back(entry);
    }
  }
}

std::vector<Mismatch>
InstructionResult::compare(const InstructionResult &actual,
                           const CompareOptions &options) const {
  std::vector<Mismatch> mismatches;

  if (options.program_result && program_result != actual.program_result) {
    mismatches.push_back({"program_result", program_result.to_string(),
                          actual.program_result.to_string()});
  }
  if (options.compute_units &&
      compute_units_consumed != actual.compute_units_consumed) {
    mismatches.push_back({"compute_units_consumed",
                          std::to_string(compute_units_consumed),
                          std::to_string(actual.compute_units_consumed)});
  }
  if (options.execution_time && execution_time != actual.execution_time) {
    mismatches.push_back({"execution_time", std::to_string(execution_time),
                          std::to_string(actual.execution_time)});
  }
  if (options.return_data && return_data != actual.return_data) {
    mismatches.push_back({"return_data", render_bytes(return_data),
                          render_bytes(actual.return_data)});
  }
  if (options.logs && logs != actual.logs) {
    mismatches.push_back({"logs", std::to_string(logs.size()) + " lines",
                          std::to_string(actual.logs.size()) + " lines"});
  }

  if (options.resulting_accounts) {
    for (const auto &entry : resulting_accounts) {
      const std::string label = "account " + base58_encode(entry.pubkey);
      const svm::Account *other = actual.get_account(entry.pubkey);
      if (!other) {
        mismatches.push_back({label, describe_account(entry.account), "<absent>"});
        continue;
      }
      compare_account(label, entry.account, *other, mismatches);
    }
    for (const auto &entry : actual.resulting_accounts) {
      if (!get_account(entry.pubkey)) {
        mismatches.push_back({"account " + base58_encode(entry.pubkey),
                              "<absent>", describe_account(entry.account)});
      }
    }
  }
  return mismatches;
}

bool InstructionResult::operator==(const InstructionResult &other) const {
  return compute_units_consumed == other.compute_units_consumed &&
         execution_time == other.execution_time &&
         program_result == other.program_result &&
         return_data == other.return_data && logs == other.logs &&
         resulting_accounts == other.resulting_accounts &&
         chain_abort == other.chain_abort;
}

std::string describe_account(const svm::Account &account) {
  std::ostringstream out;
  out << "{lamports: " << account.lamports
      << ", data: " << render_bytes(account.data)
      << ", owner: " << base58_encode(account.owner)
      << ", executable: " << (account.executable ? "true" : "false")
      << ", rent_epoch: " << account.rent_epoch << "}";
  return out.str();
}

} // namespace harness
} // namespace periwinkle
