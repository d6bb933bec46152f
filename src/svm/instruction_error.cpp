#include "svm/instruction_error.h"

namespace periwinkle {
namespace svm {

namespace {

const char *const KIND_NAMES[INSTRUCTION_ERROR_KIND_COUNT] = {
    "GenericError",
    "InvalidArgument",
    "InvalidInstructionData",
    "InvalidAccountData",
    "AccountDataTooSmall",
    "InsufficientFunds",
    "IncorrectProgramId",
    "MissingRequiredSignature",
    "AccountAlreadyInitialized",
    "UninitializedAccount",
    "UnbalancedInstruction",
    "ModifiedProgramId",
    "ExternalAccountLamportSpend",
    "ExternalAccountDataModified",
    "ReadonlyLamportChange",
    "ReadonlyDataModified",
    "DuplicateAccountIndex",
    "ExecutableModified",
    "RentEpochModified",
    "NotEnoughAccountKeys",
    "AccountDataSizeChanged",
    "AccountNotExecutable",
    "AccountBorrowFailed",
    "AccountBorrowOutstanding",
    "DuplicateAccountOutOfSync",
    "Custom",
    "InvalidError",
    "ExecutableDataModified",
    "ExecutableLamportChange",
    "ExecutableAccountNotRentExempt",
    "UnsupportedProgramId",
    "CallDepth",
    "MissingAccount",
    "ReentrancyNotAllowed",
    "MaxSeedLengthExceeded",
    "InvalidSeeds",
    "InvalidRealloc",
    "ComputationalBudgetExceeded",
    "PrivilegeEscalation",
    "ProgramEnvironmentSetupFailure",
    "ProgramFailedToComplete",
    "ProgramFailedToCompile",
    "Immutable",
    "IncorrectAuthority",
    "BorshIoError",
    "AccountNotRentExempt",
    "InvalidAccountOwner",
    "ArithmeticOverflow",
    "UnsupportedSysvar",
    "IllegalOwner",
    "MaxAccountsDataAllocationsExceeded",
    "MaxAccountsExceeded",
    "MaxInstructionTraceLengthExceeded",
    "BuiltinProgramsMustConsumeComputeUnits",
};

// Builtin program error n is encoded as n << 32; index 0 is unused and
// index 1 stands for Custom(0).
const InstructionErrorKind BUILTIN_PROGRAM_ERRORS[] = {
    InstructionErrorKind::GENERIC_ERROR,
    InstructionErrorKind::CUSTOM,
    InstructionErrorKind::INVALID_ARGUMENT,
    InstructionErrorKind::INVALID_INSTRUCTION_DATA,
    InstructionErrorKind::INVALID_ACCOUNT_DATA,
    InstructionErrorKind::ACCOUNT_DATA_TOO_SMALL,
    InstructionErrorKind::INSUFFICIENT_FUNDS,
    InstructionErrorKind::INCORRECT_PROGRAM_ID,
    InstructionErrorKind::MISSING_REQUIRED_SIGNATURE,
    InstructionErrorKind::ACCOUNT_ALREADY_INITIALIZED,
    InstructionErrorKind::UNINITIALIZED_ACCOUNT,
    InstructionErrorKind::NOT_ENOUGH_ACCOUNT_KEYS,
    InstructionErrorKind::ACCOUNT_BORROW_FAILED,
    InstructionErrorKind::MAX_SEED_LENGTH_EXCEEDED,
    InstructionErrorKind::INVALID_SEEDS,
    InstructionErrorKind::BORSH_IO_ERROR,
    InstructionErrorKind::ACCOUNT_NOT_RENT_EXEMPT,
    InstructionErrorKind::UNSUPPORTED_SYSVAR,
    InstructionErrorKind::ILLEGAL_OWNER,
    InstructionErrorKind::MAX_ACCOUNTS_DATA_ALLOCATIONS_EXCEEDED,
    InstructionErrorKind::INVALID_REALLOC,
    InstructionErrorKind::MAX_INSTRUCTION_TRACE_LENGTH_EXCEEDED,
    InstructionErrorKind::BUILTIN_PROGRAMS_MUST_CONSUME_COMPUTE_UNITS,
    InstructionErrorKind::INVALID_ACCOUNT_OWNER,
    InstructionErrorKind::ARITHMETIC_OVERFLOW,
    InstructionErrorKind::IMMUTABLE,
    InstructionErrorKind::INCORRECT_AUTHORITY,
};

constexpr uint64_t BUILTIN_PROGRAM_ERROR_COUNT =
    sizeof(BUILTIN_PROGRAM_ERRORS) / sizeof(BUILTIN_PROGRAM_ERRORS[0]);

} // namespace

std::optional<InstructionError> InstructionError::from_index(uint32_t index,
                                                             uint32_t custom_code) {
  if (index >= INSTRUCTION_ERROR_KIND_COUNT) {
    return std::nullopt;
  }
  auto kind = static_cast<InstructionErrorKind>(index);
  return InstructionError(kind, kind == InstructionErrorKind::CUSTOM ? custom_code : 0);
}

std::string InstructionError::to_string() const {
  std::string name = KIND_NAMES[index()];
  if (kind == InstructionErrorKind::CUSTOM) {
    return name + "(" + std::to_string(custom_code) + ")";
  }
  return name;
}

std::optional<uint64_t> InstructionError::to_program_error_code() const {
  if (kind == InstructionErrorKind::CUSTOM) {
    if (custom_code == 0) {
      return uint64_t{1} << 32;
    }
    return static_cast<uint64_t>(custom_code);
  }
  for (uint64_t n = 2; n < BUILTIN_PROGRAM_ERROR_COUNT; ++n) {
    if (BUILTIN_PROGRAM_ERRORS[n] == kind) {
      return n << 32;
    }
  }
  return std::nullopt;
}

std::optional<InstructionError> InstructionError::from_program_error_code(uint64_t code) {
  if (code == 0) {
    return std::nullopt;
  }
  if ((code >> 32) == 0) {
    return InstructionError::custom(static_cast<uint32_t>(code));
  }
  uint64_t builtin = code >> 32;
  if ((code & 0xffffffffULL) != 0 || builtin >= BUILTIN_PROGRAM_ERROR_COUNT) {
    return InstructionError(InstructionErrorKind::INVALID_ERROR);
  }
  return InstructionError(BUILTIN_PROGRAM_ERRORS[builtin]);
}

std::string program_error_code_to_string(uint64_t code) {
  if (code == 0) {
    return "Success";
  }
  auto error = InstructionError::from_program_error_code(code);
  return error ? error->to_string() : "InvalidError";
}

} // namespace svm
} // namespace periwinkle
