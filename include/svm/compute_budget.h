#pragma once

#include "common/types.h"
#include "svm/instruction_error.h"
#include <cstdint>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Compute budget limits and per-operation costs for one instruction call
 */
struct ComputeBudget {
    static constexpr uint64_t DEFAULT_COMPUTE_UNIT_LIMIT = 1400000;
    static constexpr uint32_t DEFAULT_HEAP_SIZE = 32 * 1024;

    uint64_t compute_unit_limit = DEFAULT_COMPUTE_UNIT_LIMIT;
    uint32_t heap_size = DEFAULT_HEAP_SIZE;
    uint64_t heap_cost = 8;                  ///< Per 32 KiB of heap
    size_t max_invoke_stack_height = 5;
    size_t max_instruction_trace_length = 64;
    size_t max_call_depth = 64;
    size_t stack_frame_size = 4096;
    uint64_t log_64_units = 100;
    uint64_t log_pubkey_units = 100;
    uint64_t syscall_base_cost = 100;
    uint64_t invoke_units = 1000;
    uint64_t cpi_bytes_per_unit = 250;
    uint64_t max_cpi_instruction_size = 1280;
    uint64_t sha256_base_cost = 85;
    uint64_t sha256_byte_cost = 1;
    uint64_t sha256_max_slices = 20000;
    uint64_t mem_op_base_cost = 10;
    uint64_t sysvar_base_cost = 100;
    uint64_t create_program_address_units = 1500;
    uint64_t get_remaining_compute_units_cost = 100;

    bool operator==(const ComputeBudget& other) const;
    bool operator!=(const ComputeBudget& other) const { return !(*this == other); }
};

/**
 * Decrementing compute-unit counter for one call
 */
class ComputeMeter {
public:
    explicit ComputeMeter(uint64_t limit) : limit_(limit), remaining_(limit) {}

    /**
     * Charge `units`; when fewer remain the meter is drained and the
     * charge fails with ComputationalBudgetExceeded
     */
    Result<bool> consume(uint64_t units);

    /// Drain whatever is left
    void exhaust() { remaining_ = 0; }

    uint64_t remaining() const { return remaining_; }
    uint64_t limit() const { return limit_; }
    uint64_t consumed() const { return limit_ - remaining_; }

private:
    uint64_t limit_;
    uint64_t remaining_;
};

} // namespace svm
} // namespace periwinkle
