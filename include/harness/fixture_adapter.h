#pragma once

#include "common/types.h"
#include "fixture/firedancer.h"
#include "fixture/fixture.h"
#include "harness/config.h"
#include "harness/result.h"
#include "svm/account.h"
#include "svm/program_registry.h"

namespace periwinkle {
namespace harness {

using namespace periwinkle::common;

/**
 * A fixture turned back into harness inputs and the result it recorded
 */
struct ParsedFixture {
    EnvironmentConfig config;
    svm::Instruction instruction;
    svm::AccountStore accounts;
    InstructionResult expected;
};

// ============================================================================
// Native layout
// ============================================================================

fixture::Outcome to_fixture_outcome(const ProgramResult& result);
ProgramResult from_fixture_outcome(const fixture::Outcome& outcome);

fixture::Fixture build_native_fixture(const EnvironmentConfig& config,
                                      const svm::Instruction& instruction,
                                      const svm::AccountStore& accounts,
                                      const InstructionResult& result);

/// `base` supplies the parts of the configuration a fixture does not carry
ParsedFixture load_native_fixture(const fixture::Fixture& fixture,
                                  const EnvironmentConfig& base);

// ============================================================================
// Interchange layout
// ============================================================================

/// 0 on success, otherwise the instruction error index plus one
int32_t to_firedancer_result(const ProgramResult& result);
ProgramResult from_firedancer_result(int32_t result, uint64_t custom_err);

/**
 * The program account is included with the native loader as owner for
 * builtins and the upgradeable loader otherwise.
 */
fixture::firedancer::Fixture build_firedancer_fixture(const EnvironmentConfig& config,
                                                      const svm::ProgramRegistry& registry,
                                                      const svm::Instruction& instruction,
                                                      const svm::AccountStore& accounts,
                                                      const InstructionResult& result);

/**
 * Compute unit limit comes from `cu_avail`, features from their id
 * prefixes and the clock is warped to the recorded slot; everything else
 * is taken from `base`
 */
ParsedFixture load_firedancer_fixture(const fixture::firedancer::Fixture& fixture,
                                      const EnvironmentConfig& base);

/**
 * Express `result` the way the interchange effects can: only the error
 * index and custom code survive, and execution time and logs are dropped
 */
InstructionResult normalize_for_firedancer(const fixture::firedancer::Fixture& fixture,
                                           const InstructionResult& result);

} // namespace harness
} // namespace periwinkle
