/**
 * Unit tests for the compute unit bencher and its report
 */

#include "bencher/bencher.h"
#include "svm/program_ids.h"
#include "svm/system_program.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <random>

using namespace periwinkle;
using namespace periwinkle::common;
using namespace periwinkle::bencher;

namespace fs = std::filesystem;

class BencherTest : public ::testing::Test {
protected:
    void SetUp() override {
        out_dir = fs::temp_directory_path() /
                  ("periwinkle_bencher_test_" + std::to_string(std::random_device{}()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(out_dir, ec);
    }

    Bench transfer_bench(const std::string& name, Lamports balance, Lamports amount) {
        PublicKey from = new_unique_pubkey();
        PublicKey to = new_unique_pubkey();
        return Bench{name, svm::system_instruction::transfer(from, to, amount),
                     svm::AccountStore{
                         {from, svm::Account(balance, 0, svm::program_ids::system_program())},
                         {to, svm::Account(0, 0, svm::program_ids::system_program())},
                     }};
    }

    std::string read(const fs::path& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    harness::Harness harness;
    fs::path out_dir;
};

// Test 1: thousands separators keep the sign
TEST_F(BencherTest, ThousandsSeparators) {
    EXPECT_EQ("0", with_thousands_separators(0));
    EXPECT_EQ("999", with_thousands_separators(999));
    EXPECT_EQ("1,000", with_thousands_separators(1000));
    EXPECT_EQ("1,234,567", with_thousands_separators(1234567));
    EXPECT_EQ("-12,345", with_thousands_separators(-12345));
}

// Test 2: delta column
TEST_F(BencherTest, FormatDelta) {
    EXPECT_EQ("- new -", format_delta(std::nullopt, 100));
    EXPECT_EQ("--", format_delta(100, 100));
    EXPECT_EQ("+1,350", format_delta(150, 1500));
    EXPECT_EQ("-50", format_delta(150, 100));
}

// Test 3: only the newest table is read
TEST_F(BencherTest, ParseLastMarkdownTable) {
    std::string contents =
        "#### Compute Units: 2024-01-02 00:00:00 UTC\n"
        "\n"
        "| Name | CUs | Delta |\n"
        "|------|------|-------|\n"
        "| transfer | 150 | -- |\n"
        "| create | 300 | +10 |\n"
        "\n"
        "#### Compute Units: 2024-01-01 00:00:00 UTC\n"
        "\n"
        "| Name | CUs | Delta |\n"
        "|------|------|-------|\n"
        "| transfer | 999 | - new - |\n";

    PreviousResults previous = parse_last_markdown_table(contents);
    ASSERT_EQ(2u, previous.size());
    EXPECT_EQ("transfer", previous[0].first);
    EXPECT_EQ(150u, previous[0].second);
    EXPECT_EQ("create", previous[1].first);
    EXPECT_EQ(300u, previous[1].second);

    EXPECT_TRUE(parse_last_markdown_table("").empty());
}

// Test 4: unchanged results render nothing
TEST_F(BencherTest, RenderMarkdownTable) {
    std::vector<BenchResult> results = {{"transfer", 150, 1, 0}, {"create", 320, 1, 0}};

    auto table = render_markdown_table(results, std::nullopt, "2024-01-03 00:00:00 UTC");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ("#### Compute Units: 2024-01-03 00:00:00 UTC\n"
              "\n"
              "| Name | CUs | Delta |\n"
              "|------|------|-------|\n"
              "| transfer | 150 | - new - |\n"
              "| create | 320 | - new - |\n"
              "\n",
              *table);

    PreviousResults previous = {{"transfer", 150}, {"create", 300}};
    table = render_markdown_table(results, previous, "ts");
    ASSERT_TRUE(table.has_value());
    EXPECT_NE(std::string::npos, table->find("| transfer | 150 | -- |"));
    EXPECT_NE(std::string::npos, table->find("| create | 320 | +20 |"));

    previous = {{"transfer", 150}, {"create", 320}};
    EXPECT_FALSE(render_markdown_table(results, previous, "ts").has_value());
}

// Test 5: reports accumulate newest first and skip unchanged runs
TEST_F(BencherTest, WriteReport) {
    std::vector<BenchResult> first = {{"transfer", 150, 1, 0}};
    auto written = write_report(out_dir, first);
    ASSERT_TRUE(written.is_ok()) << written.error();
    EXPECT_TRUE(written.value());

    written = write_report(out_dir, first);
    ASSERT_TRUE(written.is_ok()) << written.error();
    EXPECT_FALSE(written.value());

    std::vector<BenchResult> second = {{"transfer", 175, 1, 0}};
    written = write_report(out_dir, second);
    ASSERT_TRUE(written.is_ok()) << written.error();
    EXPECT_TRUE(written.value());

    std::string markdown = read(out_dir / "compute_units.md");
    EXPECT_EQ(0u, markdown.find("#### Compute Units: "));
    EXPECT_NE(std::string::npos, markdown.find("| transfer | 175 | +25 |"));
    EXPECT_LT(markdown.find("+25"), markdown.find("- new -"));

    auto report = nlohmann::json::parse(read(out_dir / "compute_units.json"));
    ASSERT_EQ(1u, report.at("results").size());
    EXPECT_EQ("transfer", report["results"][0]["name"].get<std::string>());
    EXPECT_EQ(175u, report["results"][0]["compute_units"].get<uint64_t>());
    EXPECT_TRUE(report.contains("generated_at"));
}

// Test 6: markdown is the fallback when the JSON report is gone
TEST_F(BencherTest, MarkdownFallback) {
    ASSERT_TRUE(write_report(out_dir, {{"transfer", 150, 1, 0}}).is_ok());
    fs::remove(out_dir / "compute_units.json");

    auto written = write_report(out_dir, {{"transfer", 150, 1, 0}});
    ASSERT_TRUE(written.is_ok()) << written.error();
    EXPECT_FALSE(written.value());
}

// Test 7: benches run across threads and land in the report
TEST_F(BencherTest, ExecuteBenches) {
    ComputeUnitBencher bencher(harness);
    auto results = bencher.bench(transfer_bench("transfer_a", 1000, 10))
                       .bench(transfer_bench("transfer_b", 1000, 20))
                       .bench(transfer_bench("transfer_c", 1000, 30))
                       .set_iterations(5)
                       .set_parallelism(2)
                       .set_must_pass(true)
                       .set_out_dir(out_dir)
                       .execute();
    ASSERT_TRUE(results.is_ok()) << results.error();
    ASSERT_EQ(3u, results.value().size());
    for (const auto& result : results.value()) {
        EXPECT_EQ(svm::SystemProgram::DEFAULT_COMPUTE_UNITS, result.compute_units);
        EXPECT_EQ(5u, result.iterations);
        EXPECT_EQ(0u, result.failed_runs);
    }
    EXPECT_EQ("transfer_b", results.value()[1].name);
    EXPECT_TRUE(fs::exists(out_dir / "compute_units.md"));
}

// Test 8: failing benches are counted, or rejected when they must pass
TEST_F(BencherTest, FailingBench) {
    ComputeUnitBencher counting(harness);
    auto counted = counting.bench(transfer_bench("overdraft", 10, 20))
                       .set_iterations(3)
                       .set_out_dir(out_dir)
                       .execute();
    ASSERT_TRUE(counted.is_ok()) << counted.error();
    EXPECT_EQ(3u, counted.value()[0].failed_runs);

    ComputeUnitBencher strict(harness);
    auto rejected = strict.bench(transfer_bench("overdraft", 10, 20))
                        .set_must_pass(true)
                        .set_out_dir(out_dir)
                        .execute();
    ASSERT_TRUE(rejected.is_err());
    EXPECT_NE(std::string::npos, rejected.error().find("overdraft"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
