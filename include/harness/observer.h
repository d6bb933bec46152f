#pragma once

#include "fixture/codec.h"
#include "harness/config.h"
#include "harness/result.h"
#include "svm/account.h"
#include "svm/program_registry.h"
#include <filesystem>
#include <mutex>
#include <vector>

namespace periwinkle {
namespace harness {

/**
 * Everything one processed call saw and produced
 */
struct ExecutionRecord {
    const EnvironmentConfig& config;
    const svm::ProgramRegistry& registry;
    const svm::Instruction& instruction;
    const svm::AccountStore& accounts;
    const InstructionResult& result;
};

/**
 * Hook notified after every processed instruction
 *
 * Observers may be called from several threads at once when calls run in
 * parallel.
 */
class ExecutionObserver {
public:
    virtual ~ExecutionObserver() = default;
    virtual void on_instruction(const ExecutionRecord& record) = 0;
};

/**
 * @brief Writes every processed call as a fixture file
 *
 * Files land in `directory` as `instr-<hash>.fix` (binary) or
 * `instr-<hash>.json`, in the native or the interchange layout.
 */
class FixtureEjector : public ExecutionObserver {
public:
    enum class Format { BLOB, JSON };

    explicit FixtureEjector(std::filesystem::path directory,
                            Format format = Format::BLOB,
                            fixture::codec::Layout layout = fixture::codec::Layout::NATIVE);

    void on_instruction(const ExecutionRecord& record) override;

    /// Paths written so far
    std::vector<std::filesystem::path> written() const;

private:
    std::filesystem::path directory_;
    Format format_;
    fixture::codec::Layout layout_;
    mutable std::mutex mutex_;
    std::vector<std::filesystem::path> written_;
};

} // namespace harness
} // namespace periwinkle
