/**
 * Unit tests for the bytecode loader
 *
 * Programs are assembled by hand as raw instruction streams, which the
 * loader accepts with the entry point at the first instruction.
 */

#include "common/base58.h"
#include "common/crypto_utils.h"
#include "harness/harness.h"
#include "svm/bpf_runtime.h"
#include "svm/program_ids.h"
#include "svm/system_program.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>

using namespace periwinkle;
using namespace periwinkle::common;
using namespace periwinkle::harness;

namespace {

namespace op {
constexpr uint8_t MOV64_IMM = 0xb7;
constexpr uint8_t MOV64_REG = 0xbf;
constexpr uint8_t ADD64_IMM = 0x07;
constexpr uint8_t LDXDW = 0x79;
constexpr uint8_t STW = 0x62;
constexpr uint8_t STDW = 0x7a;
constexpr uint8_t STXDW = 0x7b;
constexpr uint8_t JA = 0x05;
constexpr uint8_t CALL = 0x85;
constexpr uint8_t EXIT = 0x95;
} // namespace op

class Assembler {
public:
    Assembler& emit(uint8_t opcode, uint8_t dst, uint8_t src, int16_t offset, int32_t imm) {
        code_.push_back(opcode);
        code_.push_back(static_cast<uint8_t>((dst & 0x0f) | (src << 4)));
        code_.push_back(static_cast<uint8_t>(offset & 0xff));
        code_.push_back(static_cast<uint8_t>((offset >> 8) & 0xff));
        for (int i = 0; i < 4; ++i) {
            code_.push_back(static_cast<uint8_t>((static_cast<uint32_t>(imm) >> (8 * i)) & 0xff));
        }
        return *this;
    }

    Assembler& mov_imm(uint8_t dst, int32_t imm) { return emit(op::MOV64_IMM, dst, 0, 0, imm); }
    Assembler& mov_reg(uint8_t dst, uint8_t src) { return emit(op::MOV64_REG, dst, src, 0, 0); }
    Assembler& add_imm(uint8_t dst, int32_t imm) { return emit(op::ADD64_IMM, dst, 0, 0, imm); }
    Assembler& ldxdw(uint8_t dst, uint8_t src, int16_t offset) {
        return emit(op::LDXDW, dst, src, offset, 0);
    }
    Assembler& stw(uint8_t dst, int16_t offset, int32_t imm) {
        return emit(op::STW, dst, 0, offset, imm);
    }
    Assembler& stdw(uint8_t dst, int16_t offset, int32_t imm) {
        return emit(op::STDW, dst, 0, offset, imm);
    }
    Assembler& stxdw(uint8_t dst, int16_t offset, uint8_t src) {
        return emit(op::STXDW, dst, src, offset, 0);
    }
    /// Stores `base + delta` at [dst + offset] via r2
    Assembler& store_address(uint8_t dst, int16_t offset, uint8_t base, int32_t delta) {
        return mov_reg(2, base).add_imm(2, delta).stxdw(dst, offset, 2);
    }
    Assembler& ja(int16_t offset) { return emit(op::JA, 0, 0, offset, 0); }
    Assembler& syscall(const std::string& name) {
        return emit(op::CALL, 0, 0, 0, static_cast<int32_t>(svm::syscall_hash(name)));
    }
    Assembler& exit() { return emit(op::EXIT, 0, 0, 0, 0); }

    std::vector<uint8_t> build() const { return code_; }

private:
    std::vector<uint8_t> code_;
};

/// Stores the low `len` bytes of `le_word` below the frame pointer and points r1/r2 at them
Assembler& load_stack_bytes(Assembler& a, uint32_t le_word, int32_t len) {
    return a.stw(10, -8, static_cast<int32_t>(le_word))
        .mov_reg(1, 10)
        .add_imm(1, -8)
        .mov_imm(2, len);
}

// Offsets of the first two account keys in the serialized input, for
// accounts without data
constexpr int32_t FIRST_KEY_OFFSET = 16;
constexpr int32_t SECOND_KEY_OFFSET =
    FIRST_KEY_OFFSET + 32 + 32 + 8 + 8 + static_cast<int32_t>(svm::MAX_PERMITTED_DATA_INCREASE) + 8 + 8;

/**
 * Program that invokes the system program to transfer `amount` from its
 * first account to its second, through sol_invoke_signed_c.
 *
 * Stack layout below r10: program id at -240, SolInstruction at -200,
 * two SolAccountMeta at -160, two SolAccountInfo at -128, data at -16.
 */
std::vector<uint8_t> cpi_transfer_program(uint32_t amount, bool escalate_recipient_signer) {
    Assembler a;
    a.mov_reg(6, 1);
    for (int16_t off = -240; off < -200; off += 8) {
        a.stdw(10, off, 0);
    }
    // SolInstruction
    a.store_address(10, -200, 10, -240)
        .store_address(10, -192, 10, -160)
        .stdw(10, -184, 2)
        .store_address(10, -176, 10, -16)
        .stdw(10, -168, 12);
    // Account metas: {key, is_writable, is_signer}
    a.store_address(10, -160, 6, FIRST_KEY_OFFSET)
        .stdw(10, -152, 0x0101)
        .store_address(10, -144, 6, SECOND_KEY_OFFSET)
        .stdw(10, -136, escalate_recipient_signer ? 0x0101 : 0x0001);
    // Account infos: only the key pointer is read
    for (int16_t off = -128; off < -16; off += 8) {
        a.stdw(10, off, 0);
    }
    a.store_address(10, -128, 6, FIRST_KEY_OFFSET)
        .store_address(10, -72, 6, SECOND_KEY_OFFSET);
    // Transfer data: u32 discriminant 2, u64 lamports
    a.stdw(10, -16, 0)
        .stdw(10, -8, 0)
        .stw(10, -16, 2)
        .stw(10, -12, static_cast<int32_t>(amount));
    a.mov_reg(1, 10)
        .add_imm(1, -200)
        .mov_reg(2, 10)
        .add_imm(2, -128)
        .mov_imm(3, 2)
        .mov_imm(4, 0)
        .mov_imm(5, 0)
        .syscall("sol_invoke_signed_c")
        .mov_imm(0, 0)
        .exit();
    return a.build();
}

} // namespace

class BpfLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        program_id = new_unique_pubkey();
    }

    void deploy(const std::vector<uint8_t>& code) {
        harness.add_program_with_image(program_id, code);
    }

    InstructionResult invoke(const svm::AccountStore& accounts = svm::AccountStore(),
                             std::vector<svm::AccountMeta> metas = {}) {
        svm::Instruction instruction{program_id, std::move(metas), {}};
        return harness.process_instruction(instruction, accounts);
    }

    bool has_log(const InstructionResult& result, const std::string& line) {
        for (const auto& log : result.logs) {
            if (log == line) {
                return true;
            }
        }
        return false;
    }

    Harness harness;
    PublicKey program_id;
};

// Test 1: one unit per executed instruction
TEST_F(BpfLoaderTest, ReturnsSuccess) {
    deploy(Assembler().mov_imm(0, 0).exit().build());

    InstructionResult result = invoke();
    EXPECT_TRUE(result.program_result.is_ok()) << result.program_result.to_string();
    EXPECT_EQ(2u, result.compute_units_consumed);

    std::string program = base58_encode(program_id);
    EXPECT_TRUE(has_log(result, "Program " + program + " invoke [1]"));
    EXPECT_TRUE(has_log(result, "Program " + program + " consumed 2 of " +
                                    std::to_string(harness.config().compute_budget.compute_unit_limit) +
                                    " compute units"));
    EXPECT_TRUE(has_log(result, "Program " + program + " success"));
}

// Test 2: non-zero r0 is the program error code
TEST_F(BpfLoaderTest, ReturnsErrorCode) {
    deploy(Assembler().mov_imm(0, 7).exit().build());

    InstructionResult result = invoke();
    EXPECT_EQ(ProgramResult::Kind::FAILURE, result.program_result.kind());
    EXPECT_EQ(7u, result.program_result.program_error());
    EXPECT_TRUE(evaluate_checks(result, {Check::err(7)}).empty());
}

// Test 3: an endless loop runs until the budget is gone
TEST_F(BpfLoaderTest, ExhaustsComputeBudget) {
    deploy(Assembler().ja(-1).build());

    svm::ComputeBudget budget;
    budget.compute_unit_limit = 1000;
    harness.set_compute_budget(budget);

    InstructionResult result = invoke();
    EXPECT_EQ(svm::InstructionErrorKind::COMPUTATIONAL_BUDGET_EXCEEDED,
              result.program_result.error().kind);
    EXPECT_EQ(1000u, result.compute_units_consumed);
}

// Test 4: a faulting program burns the whole budget only under the feature
TEST_F(BpfLoaderTest, VmFaultDepletesMeterWhenEnabled) {
    // Store through a null pointer
    deploy(Assembler().mov_imm(1, 0).stw(1, 0, 1).mov_imm(0, 0).exit().build());

    InstructionResult depleted = invoke();
    EXPECT_EQ(svm::InstructionErrorKind::PROGRAM_FAILED_TO_COMPLETE,
              depleted.program_result.error().kind);
    EXPECT_EQ(harness.config().compute_budget.compute_unit_limit,
              depleted.compute_units_consumed);

    svm::FeatureSet features = svm::FeatureSet::all_enabled();
    features.deactivate(svm::features::deplete_cu_meter_on_vm_failure());
    harness.set_feature_set(features);

    InstructionResult partial = invoke();
    EXPECT_TRUE(partial.program_result.is_err());
    EXPECT_EQ(2u, partial.compute_units_consumed);
}

// Test 5: sol_log_ reads the message from the stack
TEST_F(BpfLoaderTest, LogsFromStack) {
    Assembler a;
    load_stack_bytes(a, 0x00006968, 2).syscall("sol_log_").mov_imm(0, 0).exit();
    deploy(a.build());

    InstructionResult result = invoke();
    ASSERT_TRUE(result.program_result.is_ok()) << result.program_result.to_string();
    EXPECT_TRUE(has_log(result, "Program log: hi"));
    EXPECT_EQ(7u + harness.config().compute_budget.syscall_base_cost,
              result.compute_units_consumed);
}

// Test 6: return data is reported and logged
TEST_F(BpfLoaderTest, SetsReturnData) {
    Assembler a;
    load_stack_bytes(a, 0x04030201, 4).syscall("sol_set_return_data").mov_imm(0, 0).exit();
    deploy(a.build());

    InstructionResult result = invoke();
    ASSERT_TRUE(result.program_result.is_ok()) << result.program_result.to_string();
    EXPECT_EQ((std::vector<uint8_t>{1, 2, 3, 4}), result.return_data);
    EXPECT_TRUE(has_log(result, "Program return: " + base58_encode(program_id) + " " +
                                    CryptoUtils::base64_encode({1, 2, 3, 4})));
    EXPECT_TRUE(evaluate_checks(result, {Check::return_data_is({1, 2, 3, 4})}).empty());
}

// Test 7: the serialized input starts with the account count
TEST_F(BpfLoaderTest, ReadsSerializedInput) {
    deploy(Assembler().ldxdw(0, 1, 0).exit().build());

    PublicKey first = new_unique_pubkey();
    PublicKey second = new_unique_pubkey();
    svm::AccountStore accounts{
        {first, svm::Account(10, 0, program_id)},
        {second, svm::Account(20, 16, program_id)},
    };
    InstructionResult result = invoke(accounts, {svm::AccountMeta::writable(first, false),
                                                 svm::AccountMeta::readonly(second, false)});
    EXPECT_EQ(2u, result.program_result.program_error());
}

// Test 8: the program account itself is supplied by the harness
TEST_F(BpfLoaderTest, ProgramAccountStub) {
    deploy(Assembler().mov_imm(0, 0).exit().build());

    InstructionResult result = invoke(svm::AccountStore(),
                                      {svm::AccountMeta::readonly(program_id, false)});
    EXPECT_TRUE(result.program_result.is_ok());
    EXPECT_TRUE(result.resulting_accounts.empty());
}

// Test 9: malformed images are rejected at registration
TEST_F(BpfLoaderTest, RejectsMalformedImages) {
    EXPECT_THROW(deploy({0xb7, 0, 0, 0, 0, 0, 0}), ConfigurationError);
    EXPECT_THROW(deploy(Assembler().emit(0xff, 0, 0, 0, 0).exit().build()), ConfigurationError);
    EXPECT_THROW(deploy(Assembler().ja(5).exit().build()), ConfigurationError);
    EXPECT_THROW(harness.add_program_with_image(program_id, Assembler().exit().build(),
                                                new_unique_pubkey()),
                 ConfigurationError);
}

// Test 10: murmur3 keys are stable
TEST_F(BpfLoaderTest, SyscallHash) {
    EXPECT_EQ(0x207559bdu, svm::syscall_hash("sol_log_"));
    EXPECT_NE(svm::syscall_hash("sol_log_"), svm::syscall_hash("sol_log_64_"));
}

// Test 11: images are found by name along the search path
TEST_F(BpfLoaderTest, LoadsProgramFromSearchPath) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() /
                   ("periwinkle_programs_" + std::to_string(std::random_device{}()));
    fs::create_directories(dir / "deploy");
    std::vector<uint8_t> code = Assembler().mov_imm(0, 3).exit().build();
    {
        std::ofstream file(dir / "deploy" / "three.so", std::ios::binary);
        file.write(reinterpret_cast<const char*>(code.data()),
                   static_cast<std::streamsize>(code.size()));
    }

    svm::ProgramSearchPath search_path({(dir / "missing").string(), (dir / "deploy").string()});
    auto found = svm::ProgramFile::find("three", search_path);
    ASSERT_TRUE(found.is_ok()) << found.error();
    EXPECT_EQ(dir / "deploy" / "three.so", found.value());

    Harness loaded(program_id, "three", search_path);
    InstructionResult result = loaded.process_instruction(
        svm::Instruction{program_id, {}, {}}, svm::AccountStore());
    EXPECT_EQ(3u, result.program_result.program_error());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

// ============================================================================
// Cross-program invocation
// ============================================================================

// Test 12: a program moves lamports it does not own through the system program
TEST_F(BpfLoaderTest, InvokesSystemTransfer) {
    deploy(cpi_transfer_program(250, false));

    PublicKey from = new_unique_pubkey();
    PublicKey to = new_unique_pubkey();
    svm::AccountStore accounts{
        {from, svm::Account(1000, 0, svm::program_ids::system_program())},
        {to, svm::Account(0, 0, svm::program_ids::system_program())},
    };
    InstructionResult result = invoke(accounts, {svm::AccountMeta::writable(from, true),
                                                 svm::AccountMeta::writable(to, false)});
    ASSERT_TRUE(result.program_result.is_ok()) << result.program_result.to_string();
    EXPECT_EQ(750u, result.get_account(from)->lamports);
    EXPECT_EQ(250u, result.get_account(to)->lamports);
    EXPECT_GT(result.compute_units_consumed,
              harness.config().compute_budget.invoke_units +
                  svm::SystemProgram::DEFAULT_COMPUTE_UNITS);
    EXPECT_TRUE(has_log(result, "Program " + base58_encode(svm::program_ids::system_program()) +
                                    " invoke [2]"));
}

// Test 13: a callee cannot be granted a signature the caller lacks
TEST_F(BpfLoaderTest, RejectsSignerEscalation) {
    deploy(cpi_transfer_program(250, true));

    PublicKey from = new_unique_pubkey();
    PublicKey to = new_unique_pubkey();
    svm::AccountStore accounts{
        {from, svm::Account(1000, 0, svm::program_ids::system_program())},
        {to, svm::Account(0, 0, svm::program_ids::system_program())},
    };
    InstructionResult result = invoke(accounts, {svm::AccountMeta::writable(from, true),
                                                 svm::AccountMeta::writable(to, false)});
    EXPECT_EQ(svm::InstructionErrorKind::PRIVILEGE_ESCALATION,
              result.program_result.error().kind);
    EXPECT_EQ(1000u, result.get_account(from)->lamports);
    EXPECT_EQ(0u, result.get_account(to)->lamports);
}

// Test 14: oversized lengths are rejected before they can wrap
TEST_F(BpfLoaderTest, RejectsOversizedInvokeLengths) {
    Assembler a;
    for (int16_t off = -240; off < -160; off += 8) {
        a.stdw(10, off, 0);
    }
    a.store_address(10, -200, 10, -240)
        .store_address(10, -192, 10, -240)
        .stdw(10, -184, 1)
        .store_address(10, -176, 10, -240)
        .stdw(10, -168, -1)
        .mov_reg(1, 10)
        .add_imm(1, -200)
        .mov_imm(2, 0)
        .mov_imm(3, 0)
        .mov_imm(4, 0)
        .mov_imm(5, 0)
        .syscall("sol_invoke_signed_c")
        .mov_imm(0, 0)
        .exit();
    deploy(a.build());

    InstructionResult result = invoke();
    EXPECT_EQ(svm::InstructionErrorKind::GENERIC_ERROR, result.program_result.error().kind);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
