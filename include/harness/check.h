#pragma once

#include "common/types.h"
#include "harness/errors.h"
#include "harness/result.h"
#include <optional>
#include <vector>

namespace periwinkle {
namespace harness {

using namespace periwinkle::common;

/**
 * Expected state of one resulting account; unset fields are not checked
 */
struct AccountCheck {
    PublicKey pubkey;
    std::optional<std::vector<uint8_t>> data;
    std::optional<Lamports> lamports;
    std::optional<PublicKey> owner;
    std::optional<size_t> space;
    std::optional<bool> executable;
    std::optional<Epoch> rent_epoch;
    /// Expect a default (zero lamports, no data, system owned) account
    bool closed = false;
    /// Expect `bytes` at `offset` within the account data
    std::optional<std::pair<size_t, std::vector<uint8_t>>> data_slice;

    explicit AccountCheck(PublicKey key = PublicKey()) : pubkey(std::move(key)) {}
};

enum class CheckKind {
    PROGRAM_RESULT,
    COMPUTE_UNITS,
    RETURN_DATA,
    ACCOUNT,
};

/**
 * @brief Declarative expectation on an InstructionResult
 *
 * Plain data built through the factories below; evaluated by
 * evaluate_checks() or run_checks().
 */
struct Check {
    CheckKind kind = CheckKind::PROGRAM_RESULT;
    ProgramResult program_result;
    uint64_t compute_units = 0;
    std::vector<uint8_t> return_data;
    AccountCheck account;

    static Check success();
    /// Expect a program failure with this program error code
    static Check err(uint64_t program_error);
    /// Expect the result this runtime error maps to
    static Check instruction_err(const svm::InstructionError& error);
    static Check program_result_is(ProgramResult expected);
    static Check compute_units_are(uint64_t units);
    static Check return_data_is(std::vector<uint8_t> data);
    static Check account_is(AccountCheck expected);

    static Check account_lamports(const PublicKey& pubkey, Lamports lamports);
    static Check account_data(const PublicKey& pubkey, std::vector<uint8_t> data);
    static Check account_owner(const PublicKey& pubkey, const PublicKey& owner);
    static Check account_space(const PublicKey& pubkey, size_t space);
    static Check account_closed(const PublicKey& pubkey);
};

/// Evaluate every check; an empty result means all passed
std::vector<Mismatch> evaluate_checks(const InstructionResult& result,
                                      const std::vector<Check>& checks);

/// Evaluate every check and throw CheckFailure listing all mismatches
void run_checks(const InstructionResult& result, const std::vector<Check>& checks);

} // namespace harness
} // namespace periwinkle
