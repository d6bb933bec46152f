#include "common/base58.h"
#include "common/logging.h"
#include "fixture/file.h"
#include "fixture/firedancer.h"
#include "fixture/fixture.h"
#include "harness/fixture_adapter.h"
#include "harness/harness.h"
#include "svm/program_file.h"
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace periwinkle;
using namespace periwinkle::common;

namespace {

enum class Layout { NATIVE, FIREDANCER };

struct Options {
    bool json = false;
    Layout layout = Layout::NATIVE;
    bool inputs_only = false;
    bool program_logs = false;
    bool verbose = false;
    bool log_json = false;
    std::optional<LogLevel> log_level;
    harness::CompareOptions compare;
};

void print_usage() {
    std::cout << "Periwinkle instruction harness CLI\n";
    std::cout << "Usage: periwinkle-cli <command> [arguments] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  execute-fixture <elf> <fixture-or-dir> <program-id>\n";
    std::cout << "                    Run fixtures and validate their effects\n";
    std::cout << "  run-test <elf-ground> <elf-test> <fixture-or-dir> <program-id>\n";
    std::cout << "                    Run fixtures through two programs and compare\n\n";
    std::cout << "Options:\n";
    std::cout << "  --json                 Read .json fixtures instead of .fix blobs\n";
    std::cout << "  --layout <layout>      native (default) or firedancer\n";
    std::cout << "  --inputs-only          Execute without validating recorded effects\n";
    std::cout << "  --program-logs         Show program log output\n";
    std::cout << "  --verbose              Print results and every mismatch\n";
    std::cout << "  --config <path>        JSON file {\"checks\": [...]} selecting compared fields\n";
    std::cout << "  --log-level <level>    trace, debug, info, warn, error or critical\n";
    std::cout << "  --log-json             Write harness logs as JSON lines\n";
    std::cout << "  --help                 Show this help message\n";
}

/// Fields named in a {"checks": [...]} config file
Result<harness::CompareOptions> load_compare_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<harness::CompareOptions>("Cannot open config file " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    harness::CompareOptions options;
    options.compute_units = false;
    options.execution_time = false;
    options.program_result = false;
    options.return_data = false;
    options.logs = false;
    options.resulting_accounts = false;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        for (const auto& check : j.at("checks")) {
            std::string name = check.get<std::string>();
            if (name == "computeUnits" || name == "compute_units") {
                options.compute_units = true;
            } else if (name == "executionTime" || name == "execution_time") {
                options.execution_time = true;
            } else if (name == "programResult" || name == "program_result") {
                options.program_result = true;
            } else if (name == "returnData" || name == "return_data") {
                options.return_data = true;
            } else if (name == "logs") {
                options.logs = true;
            } else if (name == "resultingAccounts" || name == "resulting_accounts" ||
                       name == "allResultingAccounts") {
                options.resulting_accounts = true;
            } else {
                return Result<harness::CompareOptions>("Unknown check in config: " + name);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<harness::CompareOptions>("Invalid config file " + path + ": " + e.what());
    }
    return Result<harness::CompareOptions>(options);
}

void print_result(const char* label, const harness::InstructionResult& result) {
    std::cout << label << " RESULT:\n";
    std::cout << "  program_result: " << result.program_result.to_string() << "\n";
    std::cout << "  compute_units_consumed: " << result.compute_units_consumed << "\n";
    std::cout << "  execution_time: " << result.execution_time << "us\n";
    std::cout << "  return_data: 0x" << hex_encode(result.return_data) << "\n";
    for (const auto& account : result.resulting_accounts) {
        std::cout << "  " << base58_encode(account.pubkey) << ": "
                  << harness::describe_account(account.account) << "\n";
    }
}

/// Compare and report; true when nothing differs
bool compare(const char* label, const harness::InstructionResult& expected,
             const harness::InstructionResult& actual, const Options& options) {
    std::vector<harness::Mismatch> mismatches = expected.compare(actual, options.compare);
    if (options.verbose) {
        for (const auto& mismatch : mismatches) {
            std::cout << label << " MISMATCH: " << mismatch.to_string() << "\n";
        }
    }
    return mismatches.empty();
}

struct FixtureRun {
    harness::InstructionResult result;
    harness::InstructionResult effects;
};

template <typename F>
Result<F> load_fixture(const std::filesystem::path& path, bool json) {
    return json ? fixture::load_from_json_file<F>(path) : fixture::load_from_blob_file<F>(path);
}

Result<FixtureRun> run_fixture(harness::Harness& harness, const std::filesystem::path& path,
                               const Options& options) {
    try {
        if (options.layout == Layout::FIREDANCER) {
            auto loaded = load_fixture<fixture::firedancer::Fixture>(path, options.json);
            if (loaded.is_err()) {
                return Result<FixtureRun>(loaded.error());
            }
            const auto& fd = loaded.value();
            harness::InstructionResult result = harness.process_fixture(fd);
            harness::ParsedFixture parsed = harness::load_firedancer_fixture(fd, harness.config());
            return Result<FixtureRun>(FixtureRun{harness::normalize_for_firedancer(fd, result),
                                                 parsed.expected});
        }
        auto loaded = load_fixture<fixture::Fixture>(path, options.json);
        if (loaded.is_err()) {
            return Result<FixtureRun>(loaded.error());
        }
        harness::InstructionResult result = harness.process_fixture(loaded.value());
        harness::ParsedFixture parsed = harness::load_native_fixture(loaded.value(), harness.config());
        return Result<FixtureRun>(FixtureRun{result, parsed.expected});
    } catch (const harness::HarnessError& e) {
        return Result<FixtureRun>(std::string(e.what()));
    }
}

/// Runs one fixture through `ground` and, when given, `target`
bool run(harness::Harness& ground, harness::Harness* target,
         const std::filesystem::path& path, const Options& options) {
    bool pass = true;

    if (options.verbose) {
        std::cout << "[GROUND]: FIX: " << path.string() << "\n";
    }
    auto ground_run = run_fixture(ground, path, options);
    if (ground_run.is_err()) {
        std::cerr << "[GROUND]: " << ground_run.error() << "\n";
        std::cout << "FAIL: " << path.string() << std::endl;
        return false;
    }
    const FixtureRun& ground_out = ground_run.value();
    if (options.inputs_only && options.verbose) {
        print_result("[GROUND]:", ground_out.result);
    }
    if (!options.inputs_only) {
        pass &= compare("[GROUND]:", ground_out.effects, ground_out.result, options);
    }

    if (target) {
        if (options.verbose) {
            std::cout << "[TARGET]: FIX: " << path.string() << "\n";
        }
        auto target_run = run_fixture(*target, path, options);
        if (target_run.is_err()) {
            std::cerr << "[TARGET]: " << target_run.error() << "\n";
            std::cout << "FAIL: " << path.string() << std::endl;
            return false;
        }
        const FixtureRun& target_out = target_run.value();
        if (options.inputs_only || options.verbose) {
            print_result("[TARGET]:", target_out.result);
        }
        if (!options.inputs_only) {
            pass &= compare("[TARGET]:", target_out.effects, target_out.result, options);
        }
        pass &= compare("[GROUND vs TARGET]:", ground_out.result, target_out.result, options);
    }

    std::cout << (pass ? "PASS: " : "FAIL: ") << path.string() << std::endl;
    return pass;
}

/// Harness with the program at `elf_path` registered as `program_id`
Result<bool> load_program(harness::Harness& harness, const std::string& elf_path,
                          const PublicKey& program_id) {
    auto image = svm::ProgramFile::read_file(elf_path);
    if (image.is_err()) {
        return Result<bool>(image.error());
    }
    try {
        harness.add_program_with_image(program_id, std::move(image).value());
    } catch (const harness::ConfigurationError& e) {
        return Result<bool>(std::string(e.what()));
    }
    return Result<bool>(true);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help") {
        print_usage();
        return 0;
    }

    Options options;
    std::vector<std::string> positional;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            options.json = true;
        } else if (arg == "--layout" && i + 1 < argc) {
            std::string layout = argv[++i];
            if (layout == "native") {
                options.layout = Layout::NATIVE;
            } else if (layout == "firedancer") {
                options.layout = Layout::FIREDANCER;
            } else {
                std::cerr << "Unknown layout: " << layout << "\n";
                return 1;
            }
        } else if (arg == "--inputs-only") {
            options.inputs_only = true;
        } else if (arg == "--program-logs") {
            options.program_logs = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--config" && i + 1 < argc) {
            auto config = load_compare_config(argv[++i]);
            if (config.is_err()) {
                std::cerr << config.error() << "\n";
                return 1;
            }
            options.compare = config.value();
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.log_level = Logger::parse_level(argv[++i]);
            if (!options.log_level) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--log-json") {
            options.log_json = true;
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    Logger::instance().set_level(options.log_level.value_or(
        options.program_logs ? LogLevel::DEBUG : LogLevel::WARN));
    Logger::instance().set_json_format(options.log_json);

    size_t expected_args = command == "execute-fixture" ? 3 : command == "run-test" ? 4 : 0;
    if (expected_args == 0) {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }
    if (positional.size() != expected_args) {
        std::cerr << command << " takes " << expected_args << " arguments\n";
        print_usage();
        return 1;
    }

    auto program_id = pubkey_from_base58(positional.back());
    if (program_id.is_err()) {
        std::cerr << "Invalid program id: " << program_id.error() << "\n";
        return 1;
    }

    harness::Harness ground;
    ground.set_capture_program_logs(options.program_logs);
    auto loaded = load_program(ground, positional[0], program_id.value());
    if (loaded.is_err()) {
        std::cerr << "Failed to load program: " << loaded.error() << "\n";
        return 1;
    }

    std::optional<harness::Harness> target;
    if (command == "run-test") {
        target.emplace();
        target->set_capture_program_logs(options.program_logs);
        auto target_loaded = load_program(*target, positional[1], program_id.value());
        if (target_loaded.is_err()) {
            std::cerr << "Failed to load program: " << target_loaded.error() << "\n";
            return 1;
        }
    }

    const std::string& fixtures_root = positional[positional.size() - 2];
    auto fixtures = fixture::find_files(fixtures_root, options.json ? "json" : "fix");
    if (fixtures.empty()) {
        std::cerr << "No fixtures found under " << fixtures_root << "\n";
        return 1;
    }

    size_t failed = 0;
    for (const auto& path : fixtures) {
        if (!run(ground, target ? &*target : nullptr, path, options)) {
            ++failed;
        }
    }

    if (options.verbose || failed != 0) {
        std::cout << (fixtures.size() - failed) << " passed, " << failed << " failed\n";
    }
    return failed == 0 ? 0 : 1;
}
