#pragma once

#include "common/types.h"
#include <filesystem>
#include <string>
#include <vector>

namespace periwinkle {
namespace fixture {

using namespace periwinkle::common;

/// "instr-" followed by the base58 SHA-256 of the fixture's binary encoding
std::string fixture_file_stem(const std::vector<uint8_t>& blob);

/// Create `dir` if needed and write `data` to `dir/file_name`
Result<std::filesystem::path> write_file(const std::filesystem::path& dir,
                                         const std::string& file_name,
                                         const std::vector<uint8_t>& data);

Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

/**
 * Fixture files under `root` with the given extension (without the dot),
 * searched recursively and sorted; a file path is returned as is when its
 * extension matches
 */
std::vector<std::filesystem::path> find_files(const std::filesystem::path& root,
                                              const std::string& extension);

// Works with any fixture type offering encode/decode/to_json/from_json

template <typename F>
Result<std::filesystem::path> dump_to_blob_file(const F& fixture,
                                                const std::filesystem::path& dir) {
    std::vector<uint8_t> blob = fixture.encode();
    return write_file(dir, fixture_file_stem(blob) + ".fix", blob);
}

template <typename F>
Result<std::filesystem::path> dump_to_json_file(const F& fixture,
                                                const std::filesystem::path& dir) {
    std::string text = fixture.to_json();
    return write_file(dir, fixture_file_stem(fixture.encode()) + ".json",
                      std::vector<uint8_t>(text.begin(), text.end()));
}

template <typename F>
Result<F> load_from_blob_file(const std::filesystem::path& path) {
    if (path.extension() != ".fix") {
        return Result<F>("Invalid fixture file extension: " + path.string());
    }
    auto blob = read_file(path);
    if (blob.is_err()) {
        return Result<F>(blob.error());
    }
    return F::decode(blob.value());
}

template <typename F>
Result<F> load_from_json_file(const std::filesystem::path& path) {
    if (path.extension() != ".json") {
        return Result<F>("Invalid fixture file extension: " + path.string());
    }
    auto bytes = read_file(path);
    if (bytes.is_err()) {
        return Result<F>(bytes.error());
    }
    return F::from_json(std::string(bytes.value().begin(), bytes.value().end()));
}

} // namespace fixture
} // namespace periwinkle
