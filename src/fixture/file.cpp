#include "fixture/file.h"
#include "common/base58.h"
#include "common/crypto_utils.h"
#include "common/logging.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace periwinkle {
namespace fixture {

std::string fixture_file_stem(const std::vector<uint8_t> &blob) {
  return "instr-" + base58_encode(CryptoUtils::sha256(blob));
}

Result<fs::path> write_file(const fs::path &dir, const std::string &file_name,
                            const std::vector<uint8_t> &data) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return Result<fs::path>("Failed to create directory " + dir.string() +
                            ": " + ec.message());
  }

  fs::path path = dir / file_name;
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return Result<fs::path>("Failed to open " + path.string() + " for writing");
  }
  file.write(reinterpret_cast<const char *>(data.data()),
             static_cast<std::streamsize>(data.size()));
  if (!file) {
    return Result<fs::path>("Failed to write " + path.string());
  }
  LOG_DEBUG("Wrote fixture ", path.string(), " (", data.size(), " bytes)");
  return Result<fs::path>(path);
}

Result<std::vector<uint8_t>> read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::vector<uint8_t>>("Failed to open fixture file " +
                                        path.string());
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Result<std::vector<uint8_t>>("Failed to read fixture file " +
                                        path.string());
  }
  return Result<std::vector<uint8_t>>(std::move(data));
}

std::vector<fs::path> find_files(const fs::path &root,
                                 const std::string &extension) {
  const std::string suffix = "." + extension;
  std::vector<fs::path> found;
  std::error_code ec;

  if (fs::is_regular_file(root, ec)) {
    if (root.extension() == suffix) {
      found.push_back(root);
    }
    return found;
  }

  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    LOG_WARN("Cannot read fixture directory ", root.string(), ": ", ec.message());
    return found;
  }
  for (const auto &entry : it) {
    if (entry.is_regular_file() && entry.path().extension() == suffix) {
      found.push_back(entry.path());
    }
  }
  std::sort(found.begin(), found.end());
  return found;
}

} // namespace fixture
} // namespace periwinkle
