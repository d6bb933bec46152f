#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace periwinkle {
namespace svm {

/**
 * Runtime instruction error taxonomy
 *
 * Enumerator values are the stable wire indices used by fixtures and the
 * interchange layout; do not reorder.
 */
enum class InstructionErrorKind : uint32_t {
    GENERIC_ERROR = 0,
    INVALID_ARGUMENT = 1,
    INVALID_INSTRUCTION_DATA = 2,
    INVALID_ACCOUNT_DATA = 3,
    ACCOUNT_DATA_TOO_SMALL = 4,
    INSUFFICIENT_FUNDS = 5,
    INCORRECT_PROGRAM_ID = 6,
    MISSING_REQUIRED_SIGNATURE = 7,
    ACCOUNT_ALREADY_INITIALIZED = 8,
    UNINITIALIZED_ACCOUNT = 9,
    UNBALANCED_INSTRUCTION = 10,
    MODIFIED_PROGRAM_ID = 11,
    EXTERNAL_ACCOUNT_LAMPORT_SPEND = 12,
    EXTERNAL_ACCOUNT_DATA_MODIFIED = 13,
    READONLY_LAMPORT_CHANGE = 14,
    READONLY_DATA_MODIFIED = 15,
    DUPLICATE_ACCOUNT_INDEX = 16,
    EXECUTABLE_MODIFIED = 17,
    RENT_EPOCH_MODIFIED = 18,
    NOT_ENOUGH_ACCOUNT_KEYS = 19,
    ACCOUNT_DATA_SIZE_CHANGED = 20,
    ACCOUNT_NOT_EXECUTABLE = 21,
    ACCOUNT_BORROW_FAILED = 22,
    ACCOUNT_BORROW_OUTSTANDING = 23,
    DUPLICATE_ACCOUNT_OUT_OF_SYNC = 24,
    CUSTOM = 25,
    INVALID_ERROR = 26,
    EXECUTABLE_DATA_MODIFIED = 27,
    EXECUTABLE_LAMPORT_CHANGE = 28,
    EXECUTABLE_ACCOUNT_NOT_RENT_EXEMPT = 29,
    UNSUPPORTED_PROGRAM_ID = 30,
    CALL_DEPTH = 31,
    MISSING_ACCOUNT = 32,
    REENTRANCY_NOT_ALLOWED = 33,
    MAX_SEED_LENGTH_EXCEEDED = 34,
    INVALID_SEEDS = 35,
    INVALID_REALLOC = 36,
    COMPUTATIONAL_BUDGET_EXCEEDED = 37,
    PRIVILEGE_ESCALATION = 38,
    PROGRAM_ENVIRONMENT_SETUP_FAILURE = 39,
    PROGRAM_FAILED_TO_COMPLETE = 40,
    PROGRAM_FAILED_TO_COMPILE = 41,
    IMMUTABLE = 42,
    INCORRECT_AUTHORITY = 43,
    BORSH_IO_ERROR = 44,
    ACCOUNT_NOT_RENT_EXEMPT = 45,
    INVALID_ACCOUNT_OWNER = 46,
    ARITHMETIC_OVERFLOW = 47,
    UNSUPPORTED_SYSVAR = 48,
    ILLEGAL_OWNER = 49,
    MAX_ACCOUNTS_DATA_ALLOCATIONS_EXCEEDED = 50,
    MAX_ACCOUNTS_EXCEEDED = 51,
    MAX_INSTRUCTION_TRACE_LENGTH_EXCEEDED = 52,
    BUILTIN_PROGRAMS_MUST_CONSUME_COMPUTE_UNITS = 53,
};

/// One past the highest defined kind index
constexpr uint32_t INSTRUCTION_ERROR_KIND_COUNT = 54;

/**
 * Structured runtime fault; `custom_code` is meaningful only for CUSTOM
 */
struct InstructionError {
    InstructionErrorKind kind = InstructionErrorKind::GENERIC_ERROR;
    uint32_t custom_code = 0;

    InstructionError() = default;
    explicit InstructionError(InstructionErrorKind kind, uint32_t custom_code = 0)
        : kind(kind), custom_code(custom_code) {}

    static InstructionError custom(uint32_t code) {
        return InstructionError(InstructionErrorKind::CUSTOM, code);
    }

    uint32_t index() const { return static_cast<uint32_t>(kind); }
    static std::optional<InstructionError> from_index(uint32_t index, uint32_t custom_code = 0);

    /// e.g. "Custom(1)" or "ReadonlyLamportChange"
    std::string to_string() const;

    /**
     * Program error code this fault maps to, if any
     *
     * Builtin program errors use the `n << 32` encoding; a non-zero custom
     * code is carried as is, and Custom(0) maps to `1 << 32`.
     */
    std::optional<uint64_t> to_program_error_code() const;

    /// Inverse of to_program_error_code(); code 0 has no error
    static std::optional<InstructionError> from_program_error_code(uint64_t code);

    bool operator==(const InstructionError& other) const {
        return kind == other.kind &&
               (kind != InstructionErrorKind::CUSTOM || custom_code == other.custom_code);
    }
    bool operator!=(const InstructionError& other) const { return !(*this == other); }
};

/// Human-readable name of a program error code
std::string program_error_code_to_string(uint64_t code);

} // namespace svm
} // namespace periwinkle
