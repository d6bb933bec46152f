#pragma once

#include "common/types.h"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace periwinkle {
namespace harness {

using namespace periwinkle::common;

class InstructionResult;

/// Prefix carried by every harness error message
constexpr const char* ERROR_PREFIX = "    [PERIWINKLE]: ";

/**
 * @brief Base class of errors raised by the harness itself
 *
 * Program faults are never thrown; they are reported in the
 * InstructionResult. These errors mean the test inputs or environment are
 * wrong, or a validating entry point found a mismatch.
 */
class HarnessError : public std::runtime_error {
public:
    explicit HarnessError(const std::string& message)
        : std::runtime_error(ERROR_PREFIX + message) {}
};

/// Unresolvable program image, rejected image, malformed configuration input
class ConfigurationError : public HarnessError {
public:
    explicit ConfigurationError(const std::string& message) : HarnessError(message) {}
};

/// An account referenced by the instruction was not supplied
class InstructionValidationError : public HarnessError {
public:
    explicit InstructionValidationError(const PublicKey& missing);

    const PublicKey& missing_account() const { return missing_; }

private:
    PublicKey missing_;
};

/**
 * One failed expectation: which field, what was expected, what was found
 */
struct Mismatch {
    std::string field;
    std::string expected;
    std::string actual;

    std::string to_string() const;
};

/**
 * @brief Aggregated validation failure
 *
 * Lists every mismatch found by one validation pass. When raised from a
 * validating chain, `step()` is the index of the failing step and
 * `partial_result()` the result accumulated up to and including it.
 */
class CheckFailure : public HarnessError {
public:
    explicit CheckFailure(std::vector<Mismatch> mismatches);
    CheckFailure(std::vector<Mismatch> mismatches, size_t step,
                 std::shared_ptr<const InstructionResult> partial_result);

    const std::vector<Mismatch>& mismatches() const { return mismatches_; }
    std::optional<size_t> step() const { return step_; }
    std::shared_ptr<const InstructionResult> partial_result() const { return partial_result_; }

private:
    static std::string describe(const std::vector<Mismatch>& mismatches,
                                std::optional<size_t> step);

    std::vector<Mismatch> mismatches_;
    std::optional<size_t> step_;
    std::shared_ptr<const InstructionResult> partial_result_;
};

} // namespace harness
} // namespace periwinkle
