#include "svm/compute_budget.h"

namespace periwinkle {
namespace svm {

bool ComputeBudget::operator==(const ComputeBudget &other) const {
  return compute_unit_limit == other.compute_unit_limit &&
         heap_size == other.heap_size && heap_cost == other.heap_cost &&
         max_invoke_stack_height == other.max_invoke_stack_height &&
         max_instruction_trace_length == other.max_instruction_trace_length &&
         max_call_depth == other.max_call_depth &&
         stack_frame_size == other.stack_frame_size &&
         log_64_units == other.log_64_units &&
         log_pubkey_units == other.log_pubkey_units &&
         syscall_base_cost == other.syscall_base_cost &&
         invoke_units == other.invoke_units &&
         cpi_bytes_per_unit == other.cpi_bytes_per_unit &&
         max_cpi_instruction_size == other.max_cpi_instruction_size &&
         sha256_base_cost == other.sha256_base_cost &&
         sha256_byte_cost == other.sha256_byte_cost &&
         sha256_max_slices == other.sha256_max_slices &&
         mem_op_base_cost == other.mem_op_base_cost &&
         sysvar_base_cost == other.sysvar_base_cost &&
         create_program_address_units == other.create_program_address_units &&
         get_remaining_compute_units_cost ==
             other.get_remaining_compute_units_cost;
}

Result<bool> ComputeMeter::consume(uint64_t units) {
  if (units > remaining_) {
    remaining_ = 0;
    return Result<bool>("ComputationalBudgetExceeded");
  }
  remaining_ -= units;
  return Result<bool>(true);
}

} // namespace svm
} // namespace periwinkle
