#pragma once

#include "svm/compute_budget.h"
#include "svm/feature_set.h"
#include "svm/sysvars.h"

namespace periwinkle {
namespace harness {

/**
 * Execution environment shared by every call of one harness
 *
 * Replaced only through the harness setters; calls read it and never
 * modify it.
 */
struct EnvironmentConfig {
    svm::ComputeBudget compute_budget;
    svm::FeatureSet feature_set = svm::FeatureSet::all_enabled();
    svm::Sysvars sysvars;
    /// Forward program log lines to the process logger at DEBUG level
    bool capture_program_logs = false;

    bool operator==(const EnvironmentConfig& other) const {
        return compute_budget == other.compute_budget &&
               feature_set == other.feature_set && sysvars == other.sysvars &&
               capture_program_logs == other.capture_program_logs;
    }
};

} // namespace harness
} // namespace periwinkle
