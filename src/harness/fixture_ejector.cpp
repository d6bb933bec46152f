#include "common/logging.h"
#include "fixture/file.h"
#include "harness/fixture_adapter.h"
#include "harness/observer.h"

namespace periwinkle {
namespace harness {

FixtureEjector::FixtureEjector(std::filesystem::path directory, Format format,
                               fixture::codec::Layout layout)
    : directory_(std::move(directory)), format_(format), layout_(layout) {}

namespace {

template <typename F>
Result<std::filesystem::path> dump(const F &fixture, FixtureEjector::Format format,
                                   const std::filesystem::path &directory) {
  if (format == FixtureEjector::Format::JSON) {
    return fixture::dump_to_json_file(fixture, directory);
  }
  return fixture::dump_to_blob_file(fixture, directory);
}

} // namespace

void FixtureEjector::on_instruction(const ExecutionRecord &record) {
  Result<std::filesystem::path> written("fixture not written");
  if (layout_ == fixture::codec::Layout::FIREDANCER) {
    written = dump(build_firedancer_fixture(record.config, record.registry,
                                            record.instruction, record.accounts,
                                            record.result),
                   format_, directory_);
  } else {
    written = dump(build_native_fixture(record.config, record.instruction,
                                        record.accounts, record.result),
                   format_, directory_);
  }

  if (written.is_err()) {
    LOG_FIXTURE_ERROR("Failed to eject fixture: " + written.error(),
                      "FIXTURE_WRITE_FAILED");
    return;
  }
  LOG_DEBUG("Ejected fixture ", written.value().string());
  std::lock_guard<std::mutex> lock(mutex_);
  written_.push_back(written.value());
}

std::vector<std::filesystem::path> FixtureEjector::written() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return written_;
}

} // namespace harness
} // namespace periwinkle
