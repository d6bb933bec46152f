#pragma once

#include "common/types.h"
#include <filesystem>
#include <string>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Ordered list of directories searched for program images
 */
class ProgramSearchPath {
public:
    ProgramSearchPath() = default;
    explicit ProgramSearchPath(std::vector<std::string> directories)
        : directories_(std::move(directories)) {}

    /**
     * tests/fixtures, $BPF_OUT_DIR, $SBF_OUT_DIR, then the current directory.
     * The environment is read when this is called.
     */
    static ProgramSearchPath from_environment();

    void push_back(const std::string& directory) { directories_.push_back(directory); }
    const std::vector<std::string>& directories() const { return directories_; }

private:
    std::vector<std::string> directories_;
};

/**
 * Program image lookup by name
 */
class ProgramFile {
public:
    /// First existing `<name>.so` along the search path
    static Result<std::filesystem::path> find(const std::string& name,
                                    const ProgramSearchPath& search_path);

    static Result<std::vector<uint8_t>> read_file(const std::string& path);

    /// find() then read_file()
    static Result<std::vector<uint8_t>> load(const std::string& name,
                                             const ProgramSearchPath& search_path);
};

} // namespace svm
} // namespace periwinkle
