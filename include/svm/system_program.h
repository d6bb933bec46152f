#pragma once

#include "common/types.h"
#include "svm/account.h"
#include "svm/program_loader.h"
#include <memory>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * System program errors, reported as Custom(code)
 */
enum class SystemError : uint32_t {
    ACCOUNT_ALREADY_IN_USE = 0,
    RESULT_WITH_NEGATIVE_LAMPORTS = 1,
    INVALID_PROGRAM_ID = 2,
    INVALID_ACCOUNT_DATA_LENGTH = 3,
};

/**
 * System program: account creation, assignment, allocation and transfers
 *
 * Every invocation costs DEFAULT_COMPUTE_UNITS regardless of the
 * instruction.
 */
class SystemProgram : public BuiltinProgram {
public:
    static constexpr uint64_t DEFAULT_COMPUTE_UNITS = 150;
    /// Largest account a single allocation may create (10 MiB)
    static constexpr uint64_t MAX_PERMITTED_DATA_LENGTH = 10 * 1024 * 1024;

    SystemProgram();
    ~SystemProgram() override;

    PublicKey get_program_id() const override;
    std::string name() const override { return "system_program"; }
    uint64_t compute_units() const override { return DEFAULT_COMPUTE_UNITS; }
    InvokeOutcome execute(InvokeContext& context) const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Instruction builders for the system program
 */
namespace system_instruction {

enum class Type : uint32_t {
    CREATE_ACCOUNT = 0,
    ASSIGN = 1,
    TRANSFER = 2,
    ALLOCATE = 8,
};

Instruction create_account(const PublicKey& from, const PublicKey& to,
                           Lamports lamports, uint64_t space, const PublicKey& owner);
Instruction assign(const PublicKey& account, const PublicKey& owner);
Instruction transfer(const PublicKey& from, const PublicKey& to, Lamports lamports);
Instruction allocate(const PublicKey& account, uint64_t space);

} // namespace system_instruction

} // namespace svm
} // namespace periwinkle
