#pragma once

#include "common/types.h"
#include "svm/account.h"
#include "svm/compute_budget.h"
#include "svm/feature_set.h"
#include "svm/sysvars.h"
#include <string>
#include <vector>

namespace periwinkle {
namespace fixture {

using namespace periwinkle::common;

/**
 * @brief Inputs of a recorded instruction call (native layout)
 */
struct Context {
    svm::ComputeBudget compute_budget;
    svm::FeatureSet feature_set = svm::FeatureSet::all_enabled();
    svm::Sysvars sysvars;
    PublicKey program_id = PublicKey(PUBKEY_BYTES, 0);
    std::vector<svm::AccountMeta> instruction_accounts;
    std::vector<uint8_t> instruction_data;
    std::vector<svm::KeyedAccount> accounts;

    bool operator==(const Context& other) const;
};

/// Mirrors the program result kinds of the harness
enum class OutcomeKind : uint8_t {
    SUCCESS = 0,
    FAILURE = 1,
    UNKNOWN_ERROR = 2,
    UNKNOWN_PROGRAM = 3,
    CONTRACT_VIOLATION = 4,
};

/**
 * @brief Lossless record of how a call ended
 *
 * `program_result` is 0 on success, the program error code on failure and
 * UINT64_MAX when the outcome has no program error code.
 */
struct Outcome {
    OutcomeKind kind = OutcomeKind::SUCCESS;
    uint32_t error_index = 0;
    uint32_t custom_code = 0;
    uint64_t program_result = 0;

    bool operator==(const Outcome& other) const {
        return kind == other.kind && error_index == other.error_index &&
               custom_code == other.custom_code &&
               program_result == other.program_result;
    }
};

/**
 * @brief Observable effects of a recorded instruction call
 */
struct Effects {
    uint64_t compute_units_consumed = 0;
    uint64_t execution_time = 0;
    Outcome outcome;
    std::vector<uint8_t> return_data;
    std::vector<svm::KeyedAccount> resulting_accounts;

    bool operator==(const Effects& other) const;
};

/**
 * @brief Native fixture: a context and the effects it produced
 */
struct Fixture {
    Context input;
    Effects output;

    std::vector<uint8_t> encode() const;
    static Result<Fixture> decode(const std::vector<uint8_t>& blob);

    std::string to_json() const;
    static Result<Fixture> from_json(const std::string& json_str);

    bool operator==(const Fixture& other) const {
        return input == other.input && output == other.output;
    }
};

} // namespace fixture
} // namespace periwinkle
