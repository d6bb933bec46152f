#pragma once

#include "common/types.h"
#include "harness/errors.h"
#include "svm/account.h"
#include "svm/instruction_error.h"
#include "svm/invoke_context.h"
#include <optional>
#include <string>
#include <vector>

namespace periwinkle {
namespace harness {

using namespace periwinkle::common;

/**
 * @brief Outcome of one program invocation
 *
 * FAILURE carries the program error code the runtime error converts to;
 * UNKNOWN_ERROR carries a runtime error with no program error code.
 * UNKNOWN_PROGRAM and CONTRACT_VIOLATION are harness-detected faults kept
 * apart from ordinary program errors.
 */
class ProgramResult {
public:
    enum class Kind : uint8_t {
        SUCCESS = 0,
        FAILURE = 1,
        UNKNOWN_ERROR = 2,
        UNKNOWN_PROGRAM = 3,
        CONTRACT_VIOLATION = 4,
    };

    ProgramResult() = default;

    static ProgramResult success();
    /// `program_error` must be non-zero
    static ProgramResult failure(uint64_t program_error);
    static ProgramResult unknown_error(svm::InstructionError error);
    static ProgramResult unknown_program();
    static ProgramResult contract_violation(svm::InstructionError error);

    /// FAILURE when the error has a program error code, UNKNOWN_ERROR otherwise
    static ProgramResult from_instruction_error(const svm::InstructionError& error);
    static ProgramResult from_outcome(const svm::InvokeOutcome& outcome);

    Kind kind() const { return kind_; }
    bool is_ok() const { return kind_ == Kind::SUCCESS; }
    bool is_err() const { return kind_ != Kind::SUCCESS; }

    /// Runtime error behind a non-success result
    const svm::InstructionError& error() const { return error_; }
    uint64_t program_error() const { return program_error_; }

    /**
     * u64 code for the result: 0 on success, the program error code on
     * FAILURE, UINT64_MAX when the result has no program error code
     */
    uint64_t to_code() const;

    std::string to_string() const;

    bool operator==(const ProgramResult& other) const;
    bool operator!=(const ProgramResult& other) const { return !(*this == other); }

private:
    Kind kind_ = Kind::SUCCESS;
    uint64_t program_error_ = 0;
    svm::InstructionError error_;
};

const char* to_string(ProgramResult::Kind kind);

/**
 * Why a chain stopped before running all of its steps
 */
struct ChainAbort {
    size_t step = 0;
    std::string reason;

    bool operator==(const ChainAbort& other) const {
        return step == other.step && reason == other.reason;
    }
};

/**
 * Fields taken into account by InstructionResult::compare()
 */
struct CompareOptions {
    bool compute_units = true;
    bool execution_time = false;
    bool program_result = true;
    bool return_data = true;
    bool logs = false;
    bool resulting_accounts = true;

    static CompareOptions everything();
};

/**
 * @brief Canonical outcome of one instruction or one chain
 *
 * `resulting_accounts` holds the accounts referenced by the instruction,
 * in the order first referenced, with duplicates collapsed. For a chain it
 * holds the whole running account store.
 */
class InstructionResult {
public:
    uint64_t compute_units_consumed = 0;
    uint64_t execution_time = 0;  ///< Microseconds
    ProgramResult program_result;
    std::vector<uint8_t> return_data;
    std::vector<std::string> logs;
    std::vector<svm::KeyedAccount> resulting_accounts;
    std::optional<ChainAbort> chain_abort;

    const svm::Account* get_account(const PublicKey& pubkey) const;

    /**
     * Fold a later step into this result: units and time add up, the
     * outcome, return data and chain abort are the step's, logs append and
     * the step's accounts overwrite or extend ours.
     */
    void absorb(const InstructionResult& step);

    /// Every field difference between this result (expected) and `actual`
    std::vector<Mismatch> compare(const InstructionResult& actual,
                                  const CompareOptions& options = CompareOptions()) const;

    bool operator==(const InstructionResult& other) const;
    bool operator!=(const InstructionResult& other) const { return !(*this == other); }
};

/// Human-readable rendering used in mismatch reports
std::string describe_account(const svm::Account& account);

} // namespace harness
} // namespace periwinkle
