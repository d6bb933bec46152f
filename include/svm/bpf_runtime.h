#pragma once

#include "common/types.h"
#include "svm/program_loader.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Virtual address layout of the sBPF machine
 */
namespace bpf_memory {
    constexpr uint64_t PROGRAM_START = 0x100000000ULL;
    constexpr uint64_t STACK_START = 0x200000000ULL;
    constexpr uint64_t HEAP_START = 0x300000000ULL;
    constexpr uint64_t INPUT_START = 0x400000000ULL;
} // namespace bpf_memory

/// Bytes a program may grow each account by during one invocation
constexpr size_t MAX_PERMITTED_DATA_INCREASE = 10 * 1024;
/// Largest return data a program may set
constexpr size_t MAX_RETURN_DATA = 1024;

/**
 * Murmur3 32-bit hash (seed 0) used to key syscalls and internal
 * function calls
 */
uint32_t murmur3_32(const std::vector<uint8_t>& data);
uint32_t syscall_hash(const std::string& name);
/// Key of an internal function starting at instruction `pc`
uint32_t function_hash(uint64_t pc);

/**
 * Verified, relocated program ready to run
 */
class BpfExecutable : public CompiledProgram {
public:
    std::vector<uint8_t> text;          ///< Instruction stream
    std::vector<uint8_t> ro_image;      ///< Read-only region mapped at PROGRAM_START
    uint64_t text_vaddr = 0;            ///< Offset of `text` within ro_image
    uint64_t entry_pc = 0;
    std::unordered_map<uint32_t, uint64_t> functions;  ///< function_hash → pc

    size_t instruction_count() const { return text.size() / 8; }

    /**
     * Parse an ELF64 shared object, or accept a raw instruction stream
     * whose entry point is the first instruction
     */
    static Result<std::shared_ptr<BpfExecutable>> load(const std::vector<uint8_t>& image);

private:
    static Result<std::shared_ptr<BpfExecutable>> load_elf(const std::vector<uint8_t>& image);
    static Result<std::shared_ptr<BpfExecutable>> load_raw(const std::vector<uint8_t>& image);
    Result<bool> verify() const;
    void register_all_functions();
};

/**
 * Loader running sBPF bytecode on the interpreter
 *
 * One compute unit is charged per executed instruction. A non-zero r0 at
 * exit is the program's error code; VM faults are reported as
 * ProgramFailedToComplete unless they carry a more specific error.
 */
class BpfLoader : public ProgramLoader {
public:
    std::string name() const override { return "bpf_loader"; }
    Result<bool> prepare(ProgramEntry& program) const override;
    InvokeOutcome invoke(const ProgramEntry& program,
                         InvokeContext& context) const override;
};

} // namespace svm
} // namespace periwinkle
