#include "bencher/bencher.h"
#include "common/logging.h"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace periwinkle {
namespace bencher {

namespace {

constexpr const char *MARKDOWN_FILE = "compute_units.md";
constexpr const char *JSON_FILE = "compute_units.json";

std::string utc_timestamp() {
  std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

std::optional<std::string> read_text(const fs::path &path) {
  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }
  return std::string((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
}

Result<bool> write_text(const fs::path &path, const std::string &text) {
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    return Result<bool>("Failed to open " + path.string() + " for writing");
  }
  file << text;
  if (!file) {
    return Result<bool>("Failed to write " + path.string());
  }
  return Result<bool>(true);
}

/// Previous values from the JSON report, else the markdown report
std::optional<PreviousResults> load_previous(const fs::path &out_dir) {
  std::error_code ec;
  fs::path json_path = out_dir / JSON_FILE;
  if (fs::exists(json_path, ec)) {
    auto text = read_text(json_path);
    if (text) {
      try {
        json j = json::parse(*text);
        PreviousResults previous;
        for (const auto &entry : j.at("results")) {
          previous.emplace_back(entry.at("name").get<std::string>(),
                                entry.at("compute_units").get<uint64_t>());
        }
        return previous;
      } catch (const json::exception &e) {
        LOG_WARN("Ignoring unreadable ", json_path.string(), ": ", e.what());
      }
    }
  }

  fs::path md_path = out_dir / MARKDOWN_FILE;
  if (fs::exists(md_path, ec)) {
    auto text = read_text(md_path);
    if (text) {
      return parse_last_markdown_table(*text);
    }
  }
  return std::nullopt;
}

} // namespace

// ============================================================================
// ComputeUnitBencher
// ============================================================================

ComputeUnitBencher::ComputeUnitBencher(const harness::Harness &harness)
    : harness_(harness) {}

ComputeUnitBencher &ComputeUnitBencher::bench(Bench bench) {
  benches_.push_back(std::move(bench));
  return *this;
}

ComputeUnitBencher &ComputeUnitBencher::set_iterations(size_t iterations) {
  iterations_ = iterations;
  return *this;
}

ComputeUnitBencher &ComputeUnitBencher::set_must_pass(bool must_pass) {
  must_pass_ = must_pass;
  return *this;
}

ComputeUnitBencher &ComputeUnitBencher::set_out_dir(const fs::path &out_dir) {
  out_dir_ = out_dir;
  return *this;
}

ComputeUnitBencher &ComputeUnitBencher::set_parallelism(size_t threads) {
  parallelism_ = threads;
  return *this;
}

Result<BenchResult> ComputeUnitBencher::run_bench(const Bench &bench) const {
  BenchResult result;
  result.name = bench.name;
  result.iterations = iterations_;

  uint64_t total = 0;
  for (size_t i = 0; i < iterations_; ++i) {
    harness::InstructionResult run;
    try {
      run = harness_.process_instruction(bench.instruction, bench.accounts);
    } catch (const harness::HarnessError &e) {
      return Result<BenchResult>("Bench " + bench.name + ": " + e.what());
    }
    if (run.program_result.is_err()) {
      ++result.failed_runs;
      if (must_pass_) {
        return Result<BenchResult>("Bench " + bench.name +
                                   " failed but must pass: " +
                                   run.program_result.to_string());
      }
    }
    total += run.compute_units_consumed;
  }
  result.compute_units = iterations_ == 0 ? 0 : total / iterations_;
  return Result<BenchResult>(std::move(result));
}

Result<std::vector<BenchResult>> ComputeUnitBencher::execute() {
  using Outcome = Result<BenchResult>;

  size_t threads = parallelism_ != 0 ? parallelism_
                                     : std::max(1u, std::thread::hardware_concurrency());
  threads = std::min(threads, std::max<size_t>(benches_.size(), 1));

  std::vector<std::optional<Outcome>> outcomes(benches_.size());
  std::atomic<size_t> next{0};
  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < benches_.size(); i = next.fetch_add(1)) {
      outcomes[i] = run_bench(benches_[i]);
    }
  };

  LOG_INFO("Running ", benches_.size(), " benches x ", iterations_,
           " iterations on ", threads, " threads");
  std::vector<std::thread> pool;
  for (size_t t = 1; t < threads; ++t) {
    pool.emplace_back(worker);
  }
  worker();
  for (auto &thread : pool) {
    thread.join();
  }

  std::vector<BenchResult> results;
  for (auto &outcome : outcomes) {
    if (outcome->is_err()) {
      LOG_BENCHER_ERROR(outcome->error(), "BENCH_FAILED");
      return Result<std::vector<BenchResult>>(outcome->error());
    }
    results.push_back(std::move(*outcome).value());
  }
  benches_.clear();

  auto written = write_report(out_dir_, results);
  if (written.is_err()) {
    LOG_BENCHER_ERROR(written.error(), "REPORT_WRITE_FAILED");
    return Result<std::vector<BenchResult>>(written.error());
  }
  return Result<std::vector<BenchResult>>(std::move(results));
}

// ============================================================================
// Report
// ============================================================================

std::string with_thousands_separators(int64_t value) {
  uint64_t magnitude = value < 0 ? 0 - static_cast<uint64_t>(value)
                                 : static_cast<uint64_t>(value);
  std::string digits = std::to_string(magnitude);
  std::string out;
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (digits.size() - i) % 3 == 0) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return value < 0 ? "-" + out : out;
}

std::string format_delta(std::optional<uint64_t> previous, uint64_t current) {
  if (!previous) {
    return "- new -";
  }
  int64_t delta = static_cast<int64_t>(current) - static_cast<int64_t>(*previous);
  if (delta == 0) {
    return "--";
  }
  return delta > 0 ? "+" + with_thousands_separators(delta)
                   : with_thousands_separators(delta);
}

PreviousResults parse_last_markdown_table(const std::string &contents) {
  PreviousResults previous;
  std::istringstream lines(contents);
  std::string line;
  for (int skipped = 0; skipped < 4 && std::getline(lines, line); ++skipped) {
  }
  while (std::getline(lines, line)) {
    if (line.empty() || line.rfind("####", 0) == 0) {
      break;
    }
    std::vector<std::string> cells;
    std::istringstream row(line);
    std::string cell;
    while (std::getline(row, cell, '|')) {
      cells.push_back(trim(cell));
    }
    // Leading '|' yields an empty first cell
    if (cells.size() < 3) {
      continue;
    }
    try {
      previous.emplace_back(cells[1], std::stoull(cells[2]));
    } catch (const std::exception &e) {
      LOG_WARN("Skipping malformed report row '", line, "': ", e.what());
    }
  }
  return previous;
}

std::optional<std::string>
render_markdown_table(const std::vector<BenchResult> &results,
                      const std::optional<PreviousResults> &previous,
                      const std::string &timestamp) {
  std::ostringstream table;
  table << "#### Compute Units: " << timestamp << "\n\n"
        << "| Name | CUs | Delta |\n"
        << "|------|------|-------|\n";

  bool changed = false;
  for (const auto &result : results) {
    std::optional<uint64_t> last;
    if (previous) {
      for (const auto &[name, units] : *previous) {
        if (name == result.name) {
          last = units;
          break;
        }
      }
    }
    std::string delta = format_delta(last, result.compute_units);
    changed = changed || delta != "--";
    table << "| " << result.name << " | " << result.compute_units << " | "
          << delta << " |\n";
  }

  if (!changed) {
    return std::nullopt;
  }
  table << "\n";
  return table.str();
}

Result<bool> write_report(const fs::path &out_dir,
                          const std::vector<BenchResult> &results) {
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    return Result<bool>("Failed to create " + out_dir.string() + ": " +
                        ec.message());
  }

  std::string timestamp = utc_timestamp();
  std::optional<PreviousResults> previous = load_previous(out_dir);
  std::optional<std::string> table =
      render_markdown_table(results, previous, timestamp);

  if (table) {
    fs::path md_path = out_dir / MARKDOWN_FILE;
    std::string existing;
    if (fs::exists(md_path, ec)) {
      auto text = read_text(md_path);
      if (!text) {
        return Result<bool>("Failed to read " + md_path.string());
      }
      existing = std::move(*text);
    }
    auto written = write_text(md_path, *table + existing);
    if (written.is_err()) {
      return written;
    }
    LOG_INFO("Compute unit report updated: ", md_path.string());
  } else {
    LOG_INFO("Compute units unchanged; report not updated");
  }

  // Latest value per name, older names kept
  std::map<std::string, uint64_t> latest;
  if (previous) {
    for (const auto &[name, units] : *previous) {
      latest[name] = units;
    }
  }
  json j;
  j["generated_at"] = timestamp;
  j["results"] = json::array();
  for (const auto &result : results) {
    latest[result.name] = result.compute_units;
  }
  for (const auto &[name, units] : latest) {
    j["results"].push_back({{"name", name}, {"compute_units", units}});
  }
  auto written = write_text(out_dir / JSON_FILE, j.dump(2) + "\n");
  if (written.is_err()) {
    return written;
  }
  return Result<bool>(table.has_value());
}

} // namespace bencher
} // namespace periwinkle
