#pragma once

#include "common/types.h"
#include "svm/invoke_context.h"
#include <memory>
#include <string>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

class BuiltinProgram;

/**
 * Loader-specific prepared form of a program image (parsed, verified)
 */
class CompiledProgram {
public:
    virtual ~CompiledProgram() = default;
};

/**
 * Invocable program registered with the harness
 */
struct ProgramEntry {
    PublicKey program_id;
    PublicKey loader_key;
    std::string name;
    std::vector<uint8_t> image;                        ///< Empty for builtins
    std::shared_ptr<const BuiltinProgram> builtin;     ///< Set for builtins only
    std::shared_ptr<const CompiledProgram> compiled;   ///< Filled by the loader
};

/**
 * Program loader capability
 *
 * Given a registered program and the execution scope (accounts,
 * instruction data, compute meter, sysvars), runs the program and reports
 * success or a structured fault. The loader mutates accounts in place
 * through the scope and must halt with ComputationalBudgetExceeded when
 * the meter reaches zero.
 */
class ProgramLoader {
public:
    virtual ~ProgramLoader() = default;
    virtual std::string name() const = 0;

    /// Validate and prepare an image at registration time
    virtual Result<bool> prepare(ProgramEntry& program) const = 0;

    virtual InvokeOutcome invoke(const ProgramEntry& program,
                                 InvokeContext& context) const = 0;
};

/**
 * Built-in program interface
 */
class BuiltinProgram {
public:
    virtual ~BuiltinProgram() = default;
    virtual PublicKey get_program_id() const = 0;
    virtual std::string name() const = 0;

    /// Units charged by the loader before execute() runs
    virtual uint64_t compute_units() const = 0;

    virtual InvokeOutcome execute(InvokeContext& context) const = 0;
};

/**
 * Loader for in-process builtin programs
 */
class NativeLoader : public ProgramLoader {
public:
    std::string name() const override { return "native_loader"; }
    Result<bool> prepare(ProgramEntry& program) const override;
    InvokeOutcome invoke(const ProgramEntry& program,
                         InvokeContext& context) const override;
};

} // namespace svm
} // namespace periwinkle
