#include "svm/program_file.h"
#include "common/logging.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace periwinkle {
namespace svm {

namespace fs = std::filesystem;

ProgramSearchPath ProgramSearchPath::from_environment() {
  ProgramSearchPath path;
  path.push_back("tests/fixtures");
  if (const char *bpf_out = std::getenv("BPF_OUT_DIR")) {
    path.push_back(bpf_out);
  }
  if (const char *sbf_out = std::getenv("SBF_OUT_DIR")) {
    path.push_back(sbf_out);
  }
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  path.push_back(ec ? std::string(".") : cwd.string());
  return path;
}

Result<fs::path> ProgramFile::find(const std::string &name,
                                   const ProgramSearchPath &search_path) {
  const std::string file_name = name + ".so";
  for (const auto &directory : search_path.directories()) {
    fs::path candidate = fs::path(directory) / file_name;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      LOG_DEBUG("Found program ", name, " at ", candidate.string());
      return Result<fs::path>(candidate);
    }
  }

  std::string searched;
  for (const auto &directory : search_path.directories()) {
    searched += searched.empty() ? directory : ", " + directory;
  }
  return Result<fs::path>("program file " + file_name +
                          " not found (searched: " + searched + ")");
}

Result<std::vector<uint8_t>> ProgramFile::read_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<std::vector<uint8_t>>("failed to open " + path);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Result<std::vector<uint8_t>>("failed to read " + path);
  }
  return Result<std::vector<uint8_t>>(std::move(bytes));
}

Result<std::vector<uint8_t>>
ProgramFile::load(const std::string &name, const ProgramSearchPath &search_path) {
  auto path = ProgramFile::find(name, search_path);
  if (path.is_err()) {
    return Result<std::vector<uint8_t>>(path.error());
  }
  return read_file(path.value().string());
}

} // namespace svm
} // namespace periwinkle
