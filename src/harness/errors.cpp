#include "harness/errors.h"
#include "common/base58.h"
#include <sstream>

namespace periwinkle {
namespace harness {

InstructionValidationError::InstructionValidationError(const PublicKey &missing)
    : HarnessError("An account required by the instruction was not provided: " +
                   base58_encode(missing)),
      missing_(missing) {}

std::string Mismatch::to_string() const {
  return field + ": expected " + expected + ", got " + actual;
}

CheckFailure::CheckFailure(std::vector<Mismatch> mismatches)
    : HarnessError(describe(mismatches, std::nullopt)),
      mismatches_(std::move(mismatches)) {}

CheckFailure::CheckFailure(std::vector<Mismatch> mismatches, size_t step,
                           std::shared_ptr<const InstructionResult> partial_result)
    : HarnessError(describe(mismatches, step)),
      mismatches_(std::move(mismatches)), step_(step),
      partial_result_(std::move(partial_result)) {}

std::string CheckFailure::describe(const std::vector<Mismatch> &mismatches,
                                   std::optional<size_t> step) {
  std::ostringstream out;
  out << mismatches.size() << (mismatches.size() == 1 ? " check" : " checks")
      << " failed";
  if (step) {
    out << " at chain step " << *step;
  }
  out << ":";
  for (const auto &mismatch : mismatches) {
    out << "\n      - " << mismatch.to_string();
  }
  return out.str();
}

} // namespace harness
} // namespace periwinkle
