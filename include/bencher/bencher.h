#pragma once

#include "common/types.h"
#include "harness/harness.h"
#include "svm/account.h"
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace periwinkle {
namespace bencher {

using namespace periwinkle::common;

/**
 * Named instruction and the accounts it runs against
 */
struct Bench {
    std::string name;
    svm::Instruction instruction;
    svm::AccountStore accounts;
};

struct BenchResult {
    std::string name;
    uint64_t compute_units = 0;   ///< Mean over all iterations
    size_t iterations = 0;
    size_t failed_runs = 0;
};

/**
 * @brief Measures the compute units of a set of benches and maintains a
 * report of how they change between runs
 *
 * Every iteration runs against its own copy of the bench accounts, so
 * benches are spread across worker threads sharing the harness read-only.
 * Results are written to `<out_dir>/compute_units.md`, newest table first,
 * and `<out_dir>/compute_units.json`.
 */
class ComputeUnitBencher {
public:
    static constexpr size_t DEFAULT_ITERATIONS = 25;
    static constexpr const char* DEFAULT_OUT_DIR = "benches";

    explicit ComputeUnitBencher(const harness::Harness& harness);

    ComputeUnitBencher& bench(Bench bench);
    ComputeUnitBencher& set_iterations(size_t iterations);
    /// Treat any failed run as an error
    ComputeUnitBencher& set_must_pass(bool must_pass);
    ComputeUnitBencher& set_out_dir(const std::filesystem::path& out_dir);
    /// Worker threads; 0 picks the hardware concurrency
    ComputeUnitBencher& set_parallelism(size_t threads);

    /// Run every bench and update the report
    Result<std::vector<BenchResult>> execute();

private:
    Result<BenchResult> run_bench(const Bench& bench) const;

    const harness::Harness& harness_;
    std::vector<Bench> benches_;
    size_t iterations_ = DEFAULT_ITERATIONS;
    bool must_pass_ = false;
    std::filesystem::path out_dir_ = DEFAULT_OUT_DIR;
    size_t parallelism_ = 0;
};

// ============================================================================
// Report
// ============================================================================

using PreviousResults = std::vector<std::pair<std::string, uint64_t>>;

/// "1,234,567"; negative values keep their sign
std::string with_thousands_separators(int64_t value);

/// "--" when unchanged, "+N" or "-N" otherwise, "- new -" without a previous value
std::string format_delta(std::optional<uint64_t> previous, uint64_t current);

/// Name and units of the newest table in a compute_units.md document
PreviousResults parse_last_markdown_table(const std::string& contents);

/**
 * Markdown table for `results` against `previous`
 * @return The table, or nothing when no value changed
 */
std::optional<std::string> render_markdown_table(const std::vector<BenchResult>& results,
                                                 const std::optional<PreviousResults>& previous,
                                                 const std::string& timestamp);

/**
 * Update both report files in `out_dir`
 * @return Whether a new markdown table was written
 */
Result<bool> write_report(const std::filesystem::path& out_dir,
                          const std::vector<BenchResult>& results);

} // namespace bencher
} // namespace periwinkle
