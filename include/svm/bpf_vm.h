#pragma once

#include "common/types.h"
#include "svm/bpf_runtime.h"
#include "svm/invoke_context.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Host buffer mapped into the VM address space
 */
struct MemoryRegion {
    uint64_t vm_addr = 0;
    uint8_t* host = nullptr;
    uint64_t len = 0;
    bool writable = false;
};

/**
 * Where one instruction account lives in the serialized input region
 */
struct SerializedAccount {
    bool duplicate = false;
    size_t index_in_transaction = 0;
    size_t lamports_offset = 0;
    size_t owner_offset = 0;
    size_t data_len_offset = 0;
    size_t data_offset = 0;
    size_t original_data_len = 0;
};

/**
 * Input region handed to the program entrypoint (aligned layout)
 *
 *   u64 account count
 *   per account: 0xff, signer, writable, executable, 4 pad, key, owner,
 *                lamports, data len, data, realloc slack, align 8, rent epoch
 *                (or: index of the first occurrence, 7 pad)
 *   u64 instruction data len, instruction data, program id
 */
struct SerializedParameters {
    std::vector<uint8_t> buffer;
    std::vector<SerializedAccount> accounts;
};

SerializedParameters serialize_parameters(const InvokeContext& context);

/// Copy the region back into the call's accounts
InvokeOutcome deserialize_parameters(InvokeContext& context,
                                     const SerializedParameters& parameters);

/// Rewrite the region from the call's accounts (after a nested invocation)
InvokeOutcome refresh_parameters(const InvokeContext& context,
                                 SerializedParameters& parameters);

/**
 * Fault raised inside the VM
 *
 * `error` is set when the fault maps to a specific instruction error
 * (budget exhaustion, a failed nested invocation); otherwise the loader
 * reports ProgramFailedToComplete.
 */
struct VmFault {
    std::string message;
    std::optional<InstructionError> error;
    FaultKind kind = FaultKind::INSTRUCTION_ERROR;
};

class BpfVirtualMachine;

/// Syscall entry: five argument registers in, r0 out; false means faulted
using SyscallFunction = bool (*)(BpfVirtualMachine& vm, uint64_t arg1, uint64_t arg2,
                                 uint64_t arg3, uint64_t arg4, uint64_t arg5,
                                 uint64_t& result);

struct SyscallEntry {
    std::string name;
    SyscallFunction function;
};

/// Syscalls keyed by syscall_hash(name)
const std::unordered_map<uint32_t, SyscallEntry>& syscall_registry();

/**
 * sBPF interpreter for one program invocation
 */
class BpfVirtualMachine {
public:
    BpfVirtualMachine(const BpfExecutable& executable, InvokeContext& context,
                      SerializedParameters& parameters);

    BpfVirtualMachine(const BpfVirtualMachine&) = delete;
    BpfVirtualMachine& operator=(const BpfVirtualMachine&) = delete;

    /// Run from the entry point; on success `return_value` holds r0
    bool run(uint64_t& return_value);

    /**
     * Host pointer for [vm_addr, vm_addr + len); faults with an access
     * violation when the range is unmapped or not writable
     */
    uint8_t* translate(uint64_t vm_addr, uint64_t len, bool write);

    bool consume(uint64_t units);
    bool fail(const std::string& message);
    bool fail(const std::string& message, InstructionError error);
    /// Propagate a failed nested invocation unchanged
    bool fail(const std::string& message, const InvokeOutcome& outcome);

    const VmFault& fault() const { return fault_; }
    uint64_t instructions_executed() const { return instructions_executed_; }

    InvokeContext& context() { return context_; }
    SerializedParameters& parameters() { return parameters_; }

private:
    struct CallFrame {
        uint64_t return_pc;
        uint64_t saved[4];     ///< r6-r9
        uint64_t frame_pointer;
    };

    bool step();
    bool execute_alu64(uint8_t opcode, uint8_t dst, uint8_t src, int32_t imm);
    bool execute_alu32(uint8_t opcode, uint8_t dst, uint8_t src, int32_t imm);
    bool execute_jump(uint8_t opcode, uint8_t dst, uint8_t src, int16_t offset, int32_t imm);
    bool execute_load_reg(uint8_t opcode, uint8_t dst, uint8_t src, int16_t offset);
    bool execute_store(uint8_t opcode, uint8_t dst, int16_t offset, int32_t imm);
    bool execute_store_reg(uint8_t opcode, uint8_t dst, uint8_t src, int16_t offset);
    bool call_internal(uint64_t target_pc);
    bool call_syscall(const SyscallEntry& syscall);
    bool exit_frame();

    const BpfExecutable& executable_;
    InvokeContext& context_;
    SerializedParameters& parameters_;

    uint64_t registers_[11] = {0};
    uint64_t pc_ = 0;
    bool halted_ = false;
    std::vector<uint8_t> stack_;
    std::vector<uint8_t> heap_;
    std::vector<MemoryRegion> regions_;
    std::vector<CallFrame> call_frames_;
    uint64_t instructions_executed_ = 0;
    VmFault fault_;
};

} // namespace svm
} // namespace periwinkle
