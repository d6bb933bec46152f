/**
 * Unit tests for the instruction harness
 *
 * Covers:
 * - Single instructions against the system program
 * - Chains and validating chains
 * - Missing accounts and unknown programs
 * - Read-only account violations
 * - Check aggregation
 * - Cross-program invocation from a builtin
 */

#include "common/base58.h"
#include "common/byte_codec.h"
#include "harness/harness.h"
#include "svm/program_ids.h"
#include "svm/system_program.h"
#include <atomic>
#include <gtest/gtest.h>

using namespace periwinkle;
using namespace periwinkle::common;
using namespace periwinkle::harness;

namespace {

/// Flips the first data byte of its first account
class ReadonlyMutator : public svm::BuiltinProgram {
public:
    explicit ReadonlyMutator(PublicKey program_id) : program_id_(std::move(program_id)) {}

    PublicKey get_program_id() const override { return program_id_; }
    std::string name() const override { return "readonly_mutator"; }
    uint64_t compute_units() const override { return 10; }

    svm::InvokeOutcome execute(svm::InvokeContext& context) const override {
        if (context.instruction_account_count() < 1) {
            return svm::InvokeOutcome::failure(svm::InstructionErrorKind::NOT_ENOUGH_ACCOUNT_KEYS);
        }
        auto& target = context.instruction_account_state(0);
        if (target.account.data.empty()) {
            return svm::InvokeOutcome::failure(svm::InstructionErrorKind::ACCOUNT_DATA_TOO_SMALL);
        }
        target.account.data[0] ^= 0xff;
        return svm::InvokeOutcome::ok();
    }

private:
    PublicKey program_id_;
};

/// Forwards a transfer of the u64 amount in its data to the system program
class TransferProxy : public svm::BuiltinProgram {
public:
    static constexpr uint64_t UNITS = 100;

    explicit TransferProxy(PublicKey program_id) : program_id_(std::move(program_id)) {}

    PublicKey get_program_id() const override { return program_id_; }
    std::string name() const override { return "transfer_proxy"; }
    uint64_t compute_units() const override { return UNITS; }

    svm::InvokeOutcome execute(svm::InvokeContext& context) const override {
        ByteReader reader(context.instruction_data());
        uint64_t lamports = 0;
        if (!reader.get_u64(lamports) || context.instruction_account_count() < 2) {
            return svm::InvokeOutcome::failure(svm::InstructionErrorKind::INVALID_INSTRUCTION_DATA);
        }
        PublicKey from = context.instruction_account_state(0).pubkey;
        PublicKey to = context.instruction_account_state(1).pubkey;
        return context.process_nested_instruction(
            svm::system_instruction::transfer(from, to, lamports), {});
    }

private:
    PublicKey program_id_;
};

/// Counts its invocations and does nothing else
class InvocationCounter : public svm::BuiltinProgram {
public:
    explicit InvocationCounter(PublicKey program_id) : program_id_(std::move(program_id)) {}

    PublicKey get_program_id() const override { return program_id_; }
    std::string name() const override { return "invocation_counter"; }
    uint64_t compute_units() const override { return 1; }

    svm::InvokeOutcome execute(svm::InvokeContext&) const override {
        ++invocations_;
        return svm::InvokeOutcome::ok();
    }

    size_t invocations() const { return invocations_.load(); }

private:
    PublicKey program_id_;
    mutable std::atomic<size_t> invocations_{0};
};

svm::Account system_account(Lamports lamports) {
    return svm::Account(lamports, 0, svm::program_ids::system_program());
}

} // namespace

class HarnessTest : public ::testing::Test {
protected:
    void SetUp() override {
        sender = new_unique_pubkey();
        recipient = new_unique_pubkey();
    }

    Harness harness;
    PublicKey sender;
    PublicKey recipient;
};

// ============================================================================
// Single instructions
// ============================================================================

// Test 1: plain transfer moves lamports and costs the builtin baseline
TEST_F(HarnessTest, SingleTransfer) {
    svm::AccountStore accounts{
        {sender, system_account(100000000)},
        {recipient, system_account(100000000)},
    };
    auto instruction = svm::system_instruction::transfer(sender, recipient, 42000);

    InstructionResult result = harness.process_and_validate_instruction(
        instruction, accounts,
        {
            Check::success(),
            Check::compute_units_are(svm::SystemProgram::DEFAULT_COMPUTE_UNITS),
            Check::account_lamports(sender, 99958000),
            Check::account_lamports(recipient, 100042000),
        });

    ASSERT_EQ(2u, result.resulting_accounts.size());
    EXPECT_EQ(sender, result.resulting_accounts[0].pubkey);
    EXPECT_EQ(recipient, result.resulting_accounts[1].pubkey);

    // The caller's store is left untouched
    EXPECT_EQ(100000000u, accounts.find(sender)->lamports);
}

// Test 2: same inputs, same result
TEST_F(HarnessTest, ProcessingIsIdempotent) {
    svm::AccountStore accounts{
        {sender, system_account(5000)},
        {recipient, system_account(0)},
    };
    auto instruction = svm::system_instruction::transfer(sender, recipient, 1000);

    InstructionResult first = harness.process_instruction(instruction, accounts);
    InstructionResult second = harness.process_instruction(instruction, accounts);
    EXPECT_TRUE(first.compare(second).empty());
    EXPECT_EQ(first.logs, second.logs);
}

// Test 3: overdraft fails and leaves accounts as supplied
TEST_F(HarnessTest, FailedTransferKeepsInputAccounts) {
    svm::AccountStore accounts{
        {sender, system_account(10)},
        {recipient, system_account(0)},
    };
    auto instruction = svm::system_instruction::transfer(sender, recipient, 11);

    InstructionResult result = harness.process_instruction(instruction, accounts);
    EXPECT_EQ(ProgramResult::Kind::FAILURE, result.program_result.kind());
    EXPECT_EQ(ProgramResult::from_instruction_error(svm::InstructionError::custom(
                  static_cast<uint32_t>(svm::SystemError::RESULT_WITH_NEGATIVE_LAMPORTS))),
              result.program_result);
    EXPECT_EQ(10u, result.get_account(sender)->lamports);
    EXPECT_EQ(0u, result.get_account(recipient)->lamports);
}

// Test 4: an absent account is a harness error, not a program fault
TEST_F(HarnessTest, MissingAccountThrows) {
    svm::AccountStore accounts{{sender, system_account(1000)}};
    auto instruction = svm::system_instruction::transfer(sender, recipient, 1);

    try {
        harness.process_instruction(instruction, accounts);
        FAIL() << "expected InstructionValidationError";
    } catch (const InstructionValidationError& e) {
        EXPECT_EQ(recipient, e.missing_account());
        EXPECT_NE(std::string::npos, std::string(e.what()).find(ERROR_PREFIX));
    }
}

// Test 4b: validation happens before any program runs
TEST_F(HarnessTest, MissingAccountSkipsProgram) {
    PublicKey program_id = new_unique_pubkey();
    auto counter = std::make_shared<InvocationCounter>(program_id);
    harness.add_builtin(counter);

    svm::AccountStore accounts{{sender, system_account(1000)}};
    svm::Instruction instruction{
        program_id,
        {svm::AccountMeta::writable(sender, true), svm::AccountMeta::readonly(recipient, false)},
        {}};

    EXPECT_THROW(harness.process_instruction(instruction, accounts), InstructionValidationError);
    EXPECT_EQ(0u, counter->invocations());

    accounts.upsert(recipient, system_account(0));
    EXPECT_TRUE(harness.process_instruction(instruction, accounts).program_result.is_ok());
    EXPECT_EQ(1u, counter->invocations());
}

// Test 5: unregistered program ids are reported as such
TEST_F(HarnessTest, UnknownProgram) {
    PublicKey program_id = new_unique_pubkey();
    svm::Instruction instruction{program_id, {}, {1, 2, 3}};

    InstructionResult result = harness.process_instruction(instruction, svm::AccountStore());
    EXPECT_EQ(ProgramResult::Kind::UNKNOWN_PROGRAM, result.program_result.kind());

    bool logged = false;
    for (const auto& line : result.logs) {
        if (line == "Program " + base58_encode(program_id) + " is not registered") {
            logged = true;
        }
    }
    EXPECT_TRUE(logged);
}

// Test 6: duplicate references collapse into one resulting account
TEST_F(HarnessTest, DuplicateReferencesCollapse) {
    svm::AccountStore accounts{{sender, system_account(1000)}};
    auto instruction = svm::system_instruction::transfer(sender, sender, 400);

    InstructionResult result = harness.process_instruction(instruction, accounts);
    EXPECT_TRUE(result.program_result.is_ok());
    ASSERT_EQ(1u, result.resulting_accounts.size());
    EXPECT_EQ(1000u, result.resulting_accounts[0].account.lamports);
}

// Test 7: writes to a read-only account are a contract violation
TEST_F(HarnessTest, ReadonlyMutationIsContractViolation) {
    PublicKey program_id = new_unique_pubkey();
    harness.add_builtin(std::make_shared<ReadonlyMutator>(program_id));

    PublicKey target = new_unique_pubkey();
    svm::AccountStore accounts{{target, svm::Account(1000, 8, program_id)}};
    svm::Instruction instruction{program_id, {svm::AccountMeta::readonly(target, false)}, {}};

    InstructionResult result = harness.process_instruction(instruction, accounts);
    EXPECT_EQ(ProgramResult::Kind::CONTRACT_VIOLATION, result.program_result.kind());
    EXPECT_EQ(svm::InstructionErrorKind::READONLY_DATA_MODIFIED,
              result.program_result.error().kind);
    EXPECT_EQ(std::vector<uint8_t>(8, 0), result.get_account(target)->data);

    // Writable, the same mutation is accepted
    instruction.accounts[0] = svm::AccountMeta::writable(target, false);
    result = harness.process_instruction(instruction, accounts);
    EXPECT_TRUE(result.program_result.is_ok());
    EXPECT_EQ(0xff, result.get_account(target)->data[0]);
}

// ============================================================================
// Checks
// ============================================================================

// Test 8: every failing check is reported at once
TEST_F(HarnessTest, CheckFailuresAggregate) {
    svm::AccountStore accounts{
        {sender, system_account(100000000)},
        {recipient, system_account(100000000)},
    };
    auto instruction = svm::system_instruction::transfer(sender, recipient, 42000);

    try {
        harness.process_and_validate_instruction(
            instruction, accounts,
            {
                Check::account_lamports(recipient, 1),
                Check::err(7),
                Check::compute_units_are(svm::SystemProgram::DEFAULT_COMPUTE_UNITS),
            });
        FAIL() << "expected CheckFailure";
    } catch (const CheckFailure& e) {
        ASSERT_EQ(2u, e.mismatches().size());
        EXPECT_EQ("account " + base58_encode(recipient) + " lamports", e.mismatches()[0].field);
        EXPECT_EQ("100042000", e.mismatches()[0].actual);
        EXPECT_EQ("program_result", e.mismatches()[1].field);
        EXPECT_FALSE(e.step().has_value());
    }
}

// Test 9: account check variants
TEST_F(HarnessTest, AccountChecks) {
    PublicKey owner = new_unique_pubkey();
    svm::AccountStore accounts{
        {sender, svm::Account(1000, 4, owner)},
        {recipient, svm::Account()},
    };
    InstructionResult result;
    result.resulting_accounts = accounts.entries();

    AccountCheck full(sender);
    full.lamports = 1000;
    full.owner = owner;
    full.space = 4;
    full.executable = false;
    full.data_slice = std::make_pair(size_t(2), std::vector<uint8_t>{0, 0});

    EXPECT_TRUE(evaluate_checks(result, {Check::account_is(full),
                                         Check::account_closed(recipient)})
                    .empty());

    AccountCheck slice_out_of_range(sender);
    slice_out_of_range.data_slice = std::make_pair(size_t(3), std::vector<uint8_t>{0, 0});
    EXPECT_EQ(1u, evaluate_checks(result, {Check::account_is(slice_out_of_range)}).size());

    EXPECT_EQ(1u, evaluate_checks(result, {Check::account_closed(sender)}).size());
    EXPECT_EQ(1u, evaluate_checks(result, {Check::account_space(new_unique_pubkey(), 0)}).size());
}

// ============================================================================
// Chains
// ============================================================================

class HarnessChainTest : public HarnessTest {
protected:
    void SetUp() override {
        HarnessTest::SetUp();
        alice = new_unique_pubkey();
        bob = new_unique_pubkey();
        carol = new_unique_pubkey();
        dave = new_unique_pubkey();
        accounts = svm::AccountStore{
            {alice, system_account(500000000)},
            {bob, system_account(500000000)},
            {carol, system_account(500000000)},
            {dave, system_account(500000000)},
        };
        instructions = {
            svm::system_instruction::transfer(alice, bob, 100000000),
            svm::system_instruction::transfer(bob, carol, 50000000),
            svm::system_instruction::transfer(bob, dave, 50000000),
        };
    }

    PublicKey alice, bob, carol, dave;
    svm::AccountStore accounts;
    std::vector<svm::Instruction> instructions;
};

// Test 10: each step sees the previous step's accounts
TEST_F(HarnessChainTest, ChainOfTransfers) {
    InstructionResult result = harness.process_instruction_chain(instructions, accounts);

    EXPECT_TRUE(result.program_result.is_ok());
    EXPECT_FALSE(result.chain_abort.has_value());
    EXPECT_EQ(3 * svm::SystemProgram::DEFAULT_COMPUTE_UNITS, result.compute_units_consumed);
    EXPECT_EQ(400000000u, result.get_account(alice)->lamports);
    EXPECT_EQ(500000000u, result.get_account(bob)->lamports);
    EXPECT_EQ(550000000u, result.get_account(carol)->lamports);
    EXPECT_EQ(550000000u, result.get_account(dave)->lamports);
}

// Test 11: a chain matches processing the steps one by one
TEST_F(HarnessChainTest, ChainMatchesSequentialCalls) {
    InstructionResult chained = harness.process_instruction_chain(instructions, accounts);

    svm::AccountStore store = accounts;
    for (const auto& instruction : instructions) {
        InstructionResult step = harness.process_instruction(instruction, store);
        ASSERT_TRUE(step.program_result.is_ok());
        for (const auto& account : step.resulting_accounts) {
            store.upsert(account.pubkey, account.account);
        }
    }
    EXPECT_EQ(store.entries(), chained.resulting_accounts);
}

// Test 12: the chain stops at the first failing step
TEST_F(HarnessChainTest, ChainStopsAtFailure) {
    instructions.insert(instructions.begin() + 1,
                        svm::system_instruction::transfer(carol, dave, 600000000));

    InstructionResult result = harness.process_instruction_chain(instructions, accounts);
    EXPECT_EQ(ProgramResult::Kind::FAILURE, result.program_result.kind());
    EXPECT_EQ(2 * svm::SystemProgram::DEFAULT_COMPUTE_UNITS, result.compute_units_consumed);
    EXPECT_EQ(600000000u, result.get_account(bob)->lamports);
    EXPECT_EQ(500000000u, result.get_account(dave)->lamports);
}

// Test 13: a missing account aborts the chain with the step recorded
TEST_F(HarnessChainTest, ChainAbortsOnMissingAccount) {
    PublicKey stranger = new_unique_pubkey();
    instructions.insert(instructions.begin() + 1,
                        svm::system_instruction::transfer(alice, stranger, 1));

    InstructionResult result = harness.process_instruction_chain(instructions, accounts);
    ASSERT_TRUE(result.chain_abort.has_value());
    EXPECT_EQ(1u, result.chain_abort->step);
    EXPECT_EQ(svm::InstructionErrorKind::MISSING_ACCOUNT, result.program_result.error().kind);
    EXPECT_EQ(400000000u, result.get_account(alice)->lamports);
    EXPECT_EQ(nullptr, result.get_account(stranger));
}

// Test 14: validating chain passes with per-step checks
TEST_F(HarnessChainTest, ValidatingChainPasses) {
    std::vector<ChainStep> steps = {
        {instructions[0], {Check::success(), Check::account_lamports(bob, 600000000)}},
        {instructions[1], {Check::success(), Check::account_lamports(alice, 400000000)}},
        {instructions[2], {Check::account_lamports(bob, 500000000)}},
    };

    InstructionResult result = harness.process_and_validate_instruction_chain(steps, accounts);
    EXPECT_EQ(550000000u, result.get_account(dave)->lamports);
}

// Test 15: validating chain reports the failing step and partial result
TEST_F(HarnessChainTest, ValidatingChainReportsStep) {
    std::vector<ChainStep> steps = {
        {instructions[0], {Check::success()}},
        {instructions[1], {Check::account_lamports(carol, 1)}},
        {instructions[2], {Check::success()}},
    };

    try {
        harness.process_and_validate_instruction_chain(steps, accounts);
        FAIL() << "expected CheckFailure";
    } catch (const CheckFailure& e) {
        ASSERT_TRUE(e.step().has_value());
        EXPECT_EQ(1u, *e.step());
        ASSERT_NE(nullptr, e.partial_result());
        EXPECT_EQ(550000000u, e.partial_result()->get_account(carol)->lamports);
        EXPECT_EQ(500000000u, e.partial_result()->get_account(dave)->lamports);
    }
}

// ============================================================================
// Cross-program invocation
// ============================================================================

// Test 16: a builtin calling the system program
TEST_F(HarnessTest, NestedTransfer) {
    PublicKey proxy_id = new_unique_pubkey();
    harness.add_builtin(std::make_shared<TransferProxy>(proxy_id));

    ByteWriter data;
    data.put_u64(2500);
    svm::Instruction instruction{
        proxy_id,
        {svm::AccountMeta::writable(sender, true), svm::AccountMeta::writable(recipient, false)},
        data.take()};
    svm::AccountStore accounts{
        {sender, system_account(10000)},
        {recipient, system_account(0)},
    };

    InstructionResult result = harness.process_instruction(instruction, accounts);
    ASSERT_TRUE(result.program_result.is_ok()) << result.program_result.to_string();
    EXPECT_EQ(7500u, result.get_account(sender)->lamports);
    EXPECT_EQ(2500u, result.get_account(recipient)->lamports);
    EXPECT_EQ(TransferProxy::UNITS + harness.config().compute_budget.invoke_units +
                  svm::SystemProgram::DEFAULT_COMPUTE_UNITS,
              result.compute_units_consumed);
}

// Test 17: the callee may not gain a signature the caller lacks
TEST_F(HarnessTest, NestedPrivilegeEscalation) {
    PublicKey proxy_id = new_unique_pubkey();
    harness.add_builtin(std::make_shared<TransferProxy>(proxy_id));

    ByteWriter data;
    data.put_u64(1);
    svm::Instruction instruction{
        proxy_id,
        {svm::AccountMeta::writable(sender, false), svm::AccountMeta::writable(recipient, false)},
        data.take()};
    svm::AccountStore accounts{
        {sender, system_account(10)},
        {recipient, system_account(0)},
    };

    InstructionResult result = harness.process_instruction(instruction, accounts);
    EXPECT_EQ(svm::InstructionErrorKind::PRIVILEGE_ESCALATION, result.program_result.error().kind);
    EXPECT_EQ(10u, result.get_account(sender)->lamports);
}

// ============================================================================
// Configuration
// ============================================================================

// Test 18: warping moves the clock and records slot hashes
TEST_F(HarnessTest, WarpToSlot) {
    harness.warp_to_slot(10);
    const auto& sysvars = harness.config().sysvars;
    EXPECT_EQ(10u, sysvars.clock.slot);
    ASSERT_EQ(10u, sysvars.slot_hashes.size());
    EXPECT_EQ(9u, sysvars.slot_hashes.front().first);

    Slot far = 3 * svm::EpochSchedule::DEFAULT_SLOTS_PER_EPOCH + 5;
    harness.warp_to_slot(far);
    EXPECT_EQ(3u, harness.config().sysvars.clock.epoch);
    EXPECT_EQ(far - 1, harness.config().sysvars.slot_hashes.front().first);
}

// Test 19: a too small budget stops the builtin
TEST_F(HarnessTest, ComputeBudgetExceeded) {
    svm::ComputeBudget budget;
    budget.compute_unit_limit = svm::SystemProgram::DEFAULT_COMPUTE_UNITS - 1;
    harness.set_compute_budget(budget);

    svm::AccountStore accounts{
        {sender, system_account(100)},
        {recipient, system_account(0)},
    };
    InstructionResult result = harness.process_instruction(
        svm::system_instruction::transfer(sender, recipient, 1), accounts);
    EXPECT_EQ(svm::InstructionErrorKind::COMPUTATIONAL_BUDGET_EXCEEDED,
              result.program_result.error().kind);
}

// Test 20: a missing program image is a configuration error
TEST_F(HarnessTest, MissingProgramImage) {
    svm::ProgramSearchPath empty_path({"/nonexistent/periwinkle"});
    EXPECT_THROW(Harness(new_unique_pubkey(), "no_such_program", empty_path),
                 ConfigurationError);
}

// Test 21: the meter drains on an overdraw and stays drained
TEST_F(HarnessTest, ComputeMeterDrainsOnOverdraw) {
    svm::ComputeMeter meter(100);
    EXPECT_TRUE(meter.consume(60).is_ok());
    EXPECT_EQ(40u, meter.remaining());

    auto overdraw = meter.consume(41);
    EXPECT_TRUE(overdraw.is_err());
    EXPECT_EQ(0u, meter.remaining());
    EXPECT_EQ(100u, meter.consumed());
    EXPECT_TRUE(meter.consume(0).is_ok());
    EXPECT_TRUE(meter.consume(1).is_err());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
