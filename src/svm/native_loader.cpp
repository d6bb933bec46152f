#include "svm/program_loader.h"

namespace periwinkle {
namespace svm {

Result<bool> NativeLoader::prepare(ProgramEntry &program) const {
  if (!program.builtin) {
    return Result<bool>("native loader programs must be builtins");
  }
  return Result<bool>(true);
}

InvokeOutcome NativeLoader::invoke(const ProgramEntry &program,
                                   InvokeContext &context) const {
  if (!program.builtin) {
    return InvokeOutcome::failure(InstructionErrorKind::UNSUPPORTED_PROGRAM_ID);
  }
  if (!context.consume_checked(program.builtin->compute_units())) {
    return InvokeOutcome::failure(
        InstructionErrorKind::COMPUTATIONAL_BUDGET_EXCEEDED);
  }
  return program.builtin->execute(context);
}

} // namespace svm
} // namespace periwinkle
