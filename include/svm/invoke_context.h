#pragma once

#include "common/types.h"
#include "svm/account.h"
#include "svm/compute_budget.h"
#include "svm/feature_set.h"
#include "svm/instruction_error.h"
#include "svm/sysvars.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

class ProgramRegistry;

/**
 * Return data set by the most recent program that set it
 */
struct ReturnData {
    PublicKey program_id = PublicKey(PUBKEY_BYTES, 0);
    std::vector<uint8_t> data;
};

/**
 * Per-call collector for program log lines
 *
 * Once `bytes_limit` bytes have been logged, a single "Log truncated" line
 * is appended and further messages are dropped.
 */
class LogCollector {
public:
    static constexpr size_t DEFAULT_BYTES_LIMIT = 10000;

    explicit LogCollector(size_t bytes_limit = DEFAULT_BYTES_LIMIT) : bytes_limit_(bytes_limit) {}

    void log(const std::string& message);
    const std::vector<std::string>& messages() const { return messages_; }
    std::vector<std::string> take_messages() { return std::move(messages_); }

private:
    size_t bytes_limit_;
    size_t bytes_written_ = 0;
    bool limit_reached_ = false;
    std::vector<std::string> messages_;
};

/**
 * Account reference of the executing frame, resolved to the call's
 * deduplicated account set
 */
struct InstructionAccount {
    size_t index_in_transaction = 0;
    bool is_signer = false;
    bool is_writable = false;
};

enum class FaultKind {
    NONE,
    INSTRUCTION_ERROR,   ///< Program, loader or runtime rule fault
    UNKNOWN_PROGRAM,     ///< Target program is not registered
    CONTRACT_VIOLATION,  ///< A read-only account was mutated
};

/**
 * Outcome of invoking one program
 */
struct InvokeOutcome {
    FaultKind fault = FaultKind::NONE;
    InstructionError error;

    bool is_success() const { return fault == FaultKind::NONE; }

    static InvokeOutcome ok() { return InvokeOutcome{}; }
    static InvokeOutcome failure(InstructionError error) {
        return InvokeOutcome{FaultKind::INSTRUCTION_ERROR, error};
    }
    static InvokeOutcome failure(InstructionErrorKind kind) {
        return failure(InstructionError(kind));
    }
    static InvokeOutcome unknown_program() {
        return InvokeOutcome{FaultKind::UNKNOWN_PROGRAM,
                             InstructionError(InstructionErrorKind::UNSUPPORTED_PROGRAM_ID)};
    }
    static InvokeOutcome contract_violation(InstructionError error) {
        return InvokeOutcome{FaultKind::CONTRACT_VIOLATION, error};
    }
};

/**
 * Ephemeral execution scope of one harness call
 *
 * Holds the call's accounts by value, the instruction frame stack, the
 * compute meter, logs and return data. Configuration is referenced, never
 * copied or modified. Loaders and builtin programs read and mutate the
 * accounts of the current frame through this object; the account mutation
 * rules are verified when each frame returns.
 */
class InvokeContext {
public:
    InvokeContext(std::vector<KeyedAccount> accounts,
                  const ComputeBudget& compute_budget,
                  const FeatureSet& feature_set,
                  const Sysvars& sysvars,
                  const ProgramRegistry& registry,
                  LogCollector& log_collector);

    InvokeContext(const InvokeContext&) = delete;
    InvokeContext& operator=(const InvokeContext&) = delete;

    /// Execute the top-level instruction
    InvokeOutcome process_instruction(const PublicKey& program_id,
                                      std::vector<InstructionAccount> accounts,
                                      const std::vector<uint8_t>& data);

    /**
     * Cross-program invocation from the executing program
     *
     * Signer and writable privileges may not exceed those of the caller;
     * `signers` adds addresses the caller signs for (program derived
     * addresses).
     */
    InvokeOutcome process_nested_instruction(const Instruction& instruction,
                                             const std::vector<PublicKey>& signers);

    // Current frame
    const PublicKey& program_id() const;
    const std::vector<uint8_t>& instruction_data() const;
    size_t instruction_account_count() const;
    const InstructionAccount& instruction_account(size_t index) const;
    /// Account behind the frame's `index`th reference
    KeyedAccount& instruction_account_state(size_t index);
    const KeyedAccount& instruction_account_state(size_t index) const;
    size_t stack_height() const { return frames_.size(); }

    std::vector<KeyedAccount>& transaction_accounts() { return accounts_; }
    const std::vector<KeyedAccount>& transaction_accounts() const { return accounts_; }
    std::optional<size_t> find_transaction_account(const PublicKey& pubkey) const;

    ComputeMeter& compute_meter() { return meter_; }
    const ComputeMeter& compute_meter() const { return meter_; }
    /// Charge units; on failure the fault to return is ComputationalBudgetExceeded
    bool consume_checked(uint64_t units);

    void log(const std::string& message) { log_collector_.log(message); }
    LogCollector& log_collector() { return log_collector_; }

    void set_return_data(const PublicKey& program_id, std::vector<uint8_t> data);
    const ReturnData& return_data() const { return return_data_; }

    const ComputeBudget& compute_budget() const { return compute_budget_; }
    const FeatureSet& feature_set() const { return feature_set_; }
    const Sysvars& sysvars() const { return sysvars_; }
    const ProgramRegistry& registry() const { return registry_; }

    /**
     * Verify the executing frame's changes so far and accept them as the
     * frame's new baseline; used before a nested invocation
     */
    InvokeOutcome checkpoint_frame();

private:
    struct Frame {
        PublicKey program_id;
        std::vector<InstructionAccount> accounts;
        std::vector<uint8_t> data;
        std::map<size_t, Account> pre_state;  ///< Keyed by transaction index
    };

    InvokeOutcome execute_frame(Frame frame);
    /// Accept the current account state as the executing frame's baseline
    void rebase_frame();
    InvokeOutcome verify_frame(const Frame& frame) const;
    InvokeOutcome verify_account(const Frame& frame, size_t index_in_transaction,
                                 bool is_writable) const;
    Frame& current_frame();
    const Frame& current_frame() const;

    std::vector<KeyedAccount> accounts_;
    std::vector<Frame> frames_;
    size_t instruction_trace_length_ = 0;
    ComputeMeter meter_;
    ReturnData return_data_;

    const ComputeBudget& compute_budget_;
    const FeatureSet& feature_set_;
    const Sysvars& sysvars_;
    const ProgramRegistry& registry_;
    LogCollector& log_collector_;
};

} // namespace svm
} // namespace periwinkle
