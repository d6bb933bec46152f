#pragma once

#include "common/types.h"
#include "fixture/firedancer.h"
#include "fixture/fixture.h"
#include "harness/check.h"
#include "harness/config.h"
#include "harness/errors.h"
#include "harness/fixture_check.h"
#include "harness/observer.h"
#include "harness/result.h"
#include "svm/account.h"
#include "svm/program_file.h"
#include "svm/program_ids.h"
#include "svm/program_registry.h"
#include <memory>
#include <string>
#include <vector>

namespace periwinkle {
namespace harness {

using namespace periwinkle::common;

/**
 * One step of a validating chain: the instruction and the checks its
 * result must pass
 */
struct ChainStep {
    svm::Instruction instruction;
    std::vector<Check> checks;
};

/**
 * @brief Executes single program instructions against caller-supplied
 * accounts and reports their effects
 *
 * A harness owns its configuration and program registry. Processing is
 * const: every call builds its own execution scope, never modifies the
 * caller's accounts, and may run concurrently with other calls on the same
 * harness.
 */
class Harness {
public:
    /// Default configuration with the builtin programs registered
    Harness();

    /**
     * Harness with the program `<program_name>.so` loaded under the
     * upgradeable loader
     * @throws ConfigurationError if the image is missing or rejected
     */
    Harness(const PublicKey& program_id, const std::string& program_name);
    Harness(const PublicKey& program_id, const std::string& program_name,
            svm::ProgramSearchPath search_path);

    // Configuration
    void set_compute_budget(const svm::ComputeBudget& budget) { config_.compute_budget = budget; }
    void set_feature_set(const svm::FeatureSet& features) { config_.feature_set = features; }
    void set_sysvars(const svm::Sysvars& sysvars) { config_.sysvars = sysvars; }
    void set_capture_program_logs(bool capture) { config_.capture_program_logs = capture; }
    void set_config(const EnvironmentConfig& config) { config_ = config; }
    const EnvironmentConfig& config() const { return config_; }

    /// Advance the clock and slot hashes to `slot`
    void warp_to_slot(Slot slot) { config_.sysvars.warp_to_slot(slot); }

    // Programs
    /// @throws ConfigurationError
    void add_program(const PublicKey& program_id, const std::string& program_name,
                     const PublicKey& loader_key = svm::program_ids::bpf_loader_upgradeable());
    /// @throws ConfigurationError
    void add_program_with_image(const PublicKey& program_id, std::vector<uint8_t> image,
                                const PublicKey& loader_key = svm::program_ids::bpf_loader_upgradeable());
    /// @throws ConfigurationError
    void add_builtin(std::shared_ptr<const svm::BuiltinProgram> builtin);
    const svm::ProgramRegistry& registry() const { return registry_; }
    const svm::ProgramSearchPath& search_path() const { return search_path_; }

    void add_observer(std::shared_ptr<ExecutionObserver> observer);

    // ========================================================================
    // Processing
    // ========================================================================

    /**
     * Execute one instruction
     *
     * Each referenced address must be in `accounts`, except the program id
     * of a registered program which is supplied as an executable stub.
     * @throws InstructionValidationError for a missing account
     */
    InstructionResult process_instruction(const svm::Instruction& instruction,
                                          const svm::AccountStore& accounts) const;

    /// @throws CheckFailure listing every failed check
    InstructionResult process_and_validate_instruction(const svm::Instruction& instruction,
                                                       const svm::AccountStore& accounts,
                                                       const std::vector<Check>& checks) const;

    /**
     * Execute instructions in order, each seeing the accounts the previous
     * ones produced; stops after the first failing step
     */
    InstructionResult process_instruction_chain(const std::vector<svm::Instruction>& instructions,
                                                const svm::AccountStore& accounts) const;

    /**
     * Chain where every step is validated as it completes
     * @throws CheckFailure at the first step whose checks fail
     */
    InstructionResult process_and_validate_instruction_chain(const std::vector<ChainStep>& steps,
                                                             const svm::AccountStore& accounts) const;

    // ========================================================================
    // Fixtures (replace the configuration with the fixture's)
    // ========================================================================

    InstructionResult process_fixture(const fixture::Fixture& fixture);
    /// @throws CheckFailure when the result differs from the recorded effects
    InstructionResult process_and_validate_fixture(const fixture::Fixture& fixture);
    InstructionResult process_and_partially_validate_fixture(
        const fixture::Fixture& fixture, const std::vector<FixtureCheck>& checks);

    InstructionResult process_fixture(const fixture::firedancer::Fixture& fixture);
    InstructionResult process_and_validate_fixture(const fixture::firedancer::Fixture& fixture);
    InstructionResult process_and_partially_validate_fixture(
        const fixture::firedancer::Fixture& fixture, const std::vector<FixtureCheck>& checks);

private:
    struct PreparedCall;

    PreparedCall prepare_call(const svm::Instruction& instruction,
                              const svm::AccountStore& accounts) const;
    void notify_observers(const svm::Instruction& instruction,
                          const svm::AccountStore& accounts,
                          const InstructionResult& result) const;
    void apply_fixture_config(const EnvironmentConfig& config);

    EnvironmentConfig config_;
    svm::ProgramRegistry registry_;
    svm::ProgramSearchPath search_path_;
    std::vector<std::shared_ptr<ExecutionObserver>> observers_;
};

} // namespace harness
} // namespace periwinkle
