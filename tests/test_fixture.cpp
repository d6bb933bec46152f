/**
 * Unit tests for fixtures
 *
 * Covers:
 * - Binary and JSON codecs of both layouts, including malformed input
 * - Fixture files and discovery
 * - Ejecting processed calls and replaying them through the harness
 * - Full and partial validation against recorded effects
 */

#include "common/base58.h"
#include "fixture/file.h"
#include "fixture/firedancer.h"
#include "fixture/fixture.h"
#include "harness/fixture_adapter.h"
#include "harness/harness.h"
#include "svm/program_ids.h"
#include "svm/system_program.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>

using namespace periwinkle;
using namespace periwinkle::common;
using namespace periwinkle::harness;

namespace fs = std::filesystem;
namespace fd = periwinkle::fixture::firedancer;

class FixtureTest : public ::testing::Test {
protected:
    void SetUp() override {
        sender = new_unique_pubkey();
        recipient = new_unique_pubkey();
        accounts = svm::AccountStore{
            {sender, svm::Account(1000000, 0, svm::program_ids::system_program())},
            {recipient, svm::Account(0, 0, svm::program_ids::system_program())},
        };
        instruction = svm::system_instruction::transfer(sender, recipient, 250000);

        temp_dir = fs::temp_directory_path() /
                   ("periwinkle_fixture_test_" + std::to_string(std::random_device{}()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

    fixture::Fixture record_native() {
        InstructionResult result = harness.process_instruction(instruction, accounts);
        return build_native_fixture(harness.config(), instruction, accounts, result);
    }

    fd::Fixture record_firedancer() {
        InstructionResult result = harness.process_instruction(instruction, accounts);
        return build_firedancer_fixture(harness.config(), harness.registry(), instruction,
                                        accounts, result);
    }

    Harness harness;
    PublicKey sender;
    PublicKey recipient;
    svm::AccountStore accounts;
    svm::Instruction instruction;
    fs::path temp_dir;
};

// ============================================================================
// Native layout
// ============================================================================

// Test 1: binary and JSON encodings restore the same fixture
TEST_F(FixtureTest, NativeCodecs) {
    harness.warp_to_slot(42);
    fixture::Fixture original = record_native();
    EXPECT_EQ(svm::SystemProgram::DEFAULT_COMPUTE_UNITS, original.output.compute_units_consumed);

    auto decoded = fixture::Fixture::decode(original.encode());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error();
    EXPECT_EQ(original, decoded.value());

    auto parsed = fixture::Fixture::from_json(original.to_json());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    EXPECT_EQ(original, parsed.value());
    EXPECT_EQ(42u, parsed.value().input.sysvars.clock.slot);
}

// Test 2: malformed blobs are rejected with a reason
TEST_F(FixtureTest, NativeDecodeRejectsMalformedInput) {
    std::vector<uint8_t> blob = record_native().encode();

    EXPECT_TRUE(fixture::Fixture::decode({}).is_err());

    std::vector<uint8_t> bad_magic = blob;
    bad_magic[0] = 'X';
    EXPECT_TRUE(fixture::Fixture::decode(bad_magic).is_err());

    std::vector<uint8_t> truncated(blob.begin(), blob.end() - 3);
    auto truncated_result = fixture::Fixture::decode(truncated);
    ASSERT_TRUE(truncated_result.is_err());
    EXPECT_EQ("truncated or malformed fixture blob", truncated_result.error());

    std::vector<uint8_t> trailing = blob;
    trailing.push_back(0);
    auto trailing_result = fixture::Fixture::decode(trailing);
    ASSERT_TRUE(trailing_result.is_err());
    EXPECT_EQ("trailing bytes after fixture", trailing_result.error());

    // An interchange blob is not a native fixture
    EXPECT_TRUE(fixture::Fixture::decode(record_firedancer().encode()).is_err());
}

// Test 3: JSON errors are reported, not thrown
TEST_F(FixtureTest, NativeJsonErrors) {
    auto not_json = fixture::Fixture::from_json("{ not json");
    ASSERT_TRUE(not_json.is_err());
    EXPECT_EQ(0u, not_json.error().find("JSON parsing error"));

    EXPECT_TRUE(fixture::Fixture::from_json("{}").is_err());
}

// Test 4: a recorded call replays and validates
TEST_F(FixtureTest, NativeReplayValidates) {
    fixture::Fixture recorded = record_native();

    Harness replay;
    InstructionResult result = replay.process_and_validate_fixture(recorded);
    EXPECT_EQ(750000u, result.get_account(sender)->lamports);
}

// Test 5: tampered effects fail full validation but pass partial validation
TEST_F(FixtureTest, NativeTamperedEffects) {
    fixture::Fixture recorded = record_native();
    recorded.output.compute_units_consumed += 1;

    Harness replay;
    EXPECT_THROW(replay.process_and_validate_fixture(recorded), CheckFailure);

    EXPECT_NO_THROW(replay.process_and_partially_validate_fixture(
        recorded, {FixtureCheck::program_result(), FixtureCheck::all_resulting_accounts()}));
    EXPECT_THROW(replay.process_and_partially_validate_fixture(
                     recorded, {FixtureCheck::compute_units()}),
                 CheckFailure);
}

// Test 6: account selection in partial validation
TEST_F(FixtureTest, PartialAccountSelection) {
    fixture::Fixture recorded = record_native();
    recorded.output.resulting_accounts[1].account.lamports = 1;

    FixtureCheck::AccountFields lamports_only;
    lamports_only.data = false;
    lamports_only.owner = false;
    lamports_only.space = false;

    Harness replay;
    EXPECT_NO_THROW(replay.process_and_partially_validate_fixture(
        recorded, {FixtureCheck::only_resulting_accounts({sender}, lamports_only)}));
    EXPECT_NO_THROW(replay.process_and_partially_validate_fixture(
        recorded, {FixtureCheck::all_resulting_accounts_except({recipient})}));
    EXPECT_THROW(replay.process_and_partially_validate_fixture(
                     recorded, {FixtureCheck::all_resulting_accounts(lamports_only)}),
                 CheckFailure);

    // Ignoring lamports hides the change
    FixtureCheck::AccountFields no_lamports;
    no_lamports.lamports = false;
    EXPECT_NO_THROW(replay.process_and_partially_validate_fixture(
        recorded, {FixtureCheck::all_resulting_accounts(no_lamports)}));
}

// Test 7: outcomes keep their kind and error
TEST_F(FixtureTest, OutcomeConversion) {
    std::vector<ProgramResult> results = {
        ProgramResult::success(),
        ProgramResult::failure(7),
        ProgramResult::from_instruction_error(svm::InstructionError::custom(0)),
        ProgramResult::unknown_error(
            svm::InstructionError(svm::InstructionErrorKind::MISSING_ACCOUNT)),
        ProgramResult::unknown_program(),
        ProgramResult::contract_violation(
            svm::InstructionError(svm::InstructionErrorKind::READONLY_LAMPORT_CHANGE)),
    };
    for (const auto& result : results) {
        EXPECT_EQ(result, from_fixture_outcome(to_fixture_outcome(result)))
            << result.to_string();
    }
}

// ============================================================================
// Interchange layout
// ============================================================================

// Test 8: the program account is listed with its loader as owner
TEST_F(FixtureTest, FiredancerBuild) {
    fd::Fixture recorded = record_firedancer();

    EXPECT_EQ(fd::INSTR_ENTRYPOINT, recorded.metadata.fn_entrypoint);
    ASSERT_EQ(3u, recorded.input.accounts.size());
    const fd::FdAccount& program = recorded.input.accounts[2];
    EXPECT_EQ(svm::program_ids::system_program(), program.address);
    EXPECT_TRUE(program.account.executable);
    EXPECT_EQ(svm::program_ids::native_loader(), program.account.owner);

    ASSERT_EQ(2u, recorded.input.instr_accounts.size());
    EXPECT_TRUE(recorded.input.instr_accounts[0].is_signer);
    EXPECT_EQ(1u, recorded.input.instr_accounts[1].index);

    EXPECT_EQ(0, recorded.output.result);
    EXPECT_EQ(2u, recorded.output.modified_accounts.size());
    EXPECT_EQ(recorded.input.cu_avail - svm::SystemProgram::DEFAULT_COMPUTE_UNITS,
              recorded.output.cu_avail);
}

// Test 9: binary and JSON encodings of the interchange layout
TEST_F(FixtureTest, FiredancerCodecs) {
    fd::Fixture original = record_firedancer();
    original.input.accounts[0].seed_addr = fd::SeedAddress{recipient, "seed", sender};

    auto decoded = fd::Fixture::decode(original.encode());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error();
    EXPECT_EQ(original, decoded.value());

    auto parsed = fd::Fixture::from_json(original.to_json());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    EXPECT_EQ(original, parsed.value());
}

// Test 10: instruction account indices must point at a context account
TEST_F(FixtureTest, FiredancerRejectsBadIndex) {
    fd::Fixture broken = record_firedancer();
    broken.input.instr_accounts[0].index = 17;

    EXPECT_TRUE(fd::Fixture::decode(broken.encode()).is_err());
    EXPECT_TRUE(fd::Fixture::from_json(broken.to_json()).is_err());
}

// Test 11: interchange replay validates, including failures
TEST_F(FixtureTest, FiredancerReplayValidates) {
    Harness replay;
    EXPECT_NO_THROW(replay.process_and_validate_fixture(record_firedancer()));

    instruction = svm::system_instruction::transfer(sender, recipient, 2000000);
    fd::Fixture failing = record_firedancer();
    EXPECT_EQ(static_cast<int32_t>(svm::InstructionErrorKind::CUSTOM) + 1,
              failing.output.result);
    EXPECT_EQ(static_cast<uint64_t>(svm::SystemError::RESULT_WITH_NEGATIVE_LAMPORTS),
              failing.output.custom_err);
    EXPECT_TRUE(failing.output.modified_accounts.empty());
    EXPECT_NO_THROW(replay.process_and_validate_fixture(failing));

    failing.output.custom_err = 0;
    EXPECT_THROW(replay.process_and_validate_fixture(failing), CheckFailure);
}

// Test 12: result codes are the error index plus one
TEST_F(FixtureTest, FiredancerResultCodes) {
    EXPECT_EQ(0, to_firedancer_result(ProgramResult::success()));
    EXPECT_EQ(1, to_firedancer_result(ProgramResult::unknown_error(
                     svm::InstructionError(svm::InstructionErrorKind::GENERIC_ERROR))));
    EXPECT_EQ(ProgramResult::success(), from_firedancer_result(0, 0));
    EXPECT_EQ(ProgramResult::from_instruction_error(svm::InstructionError::custom(3)),
              from_firedancer_result(static_cast<int32_t>(svm::InstructionErrorKind::CUSTOM) + 1, 3));
    EXPECT_EQ(ProgramResult::Kind::UNKNOWN_ERROR, from_firedancer_result(-4, 0).kind());
}

// ============================================================================
// Files
// ============================================================================

// Test 13: file names are derived from the blob hash
TEST_F(FixtureTest, DumpAndLoadFiles) {
    fixture::Fixture recorded = record_native();

    auto blob_path = fixture::dump_to_blob_file(recorded, temp_dir);
    ASSERT_TRUE(blob_path.is_ok()) << blob_path.error();
    EXPECT_EQ(fixture::fixture_file_stem(recorded.encode()) + ".fix",
              blob_path.value().filename().string());
    EXPECT_EQ(0u, blob_path.value().filename().string().find("instr-"));

    auto json_path = fixture::dump_to_json_file(recorded, temp_dir / "json");
    ASSERT_TRUE(json_path.is_ok()) << json_path.error();
    EXPECT_EQ(blob_path.value().stem(), json_path.value().stem());

    auto from_blob = fixture::load_from_blob_file<fixture::Fixture>(blob_path.value());
    ASSERT_TRUE(from_blob.is_ok()) << from_blob.error();
    EXPECT_EQ(recorded, from_blob.value());

    auto from_json = fixture::load_from_json_file<fixture::Fixture>(json_path.value());
    ASSERT_TRUE(from_json.is_ok()) << from_json.error();
    EXPECT_EQ(recorded, from_json.value());

    EXPECT_TRUE(fixture::load_from_blob_file<fixture::Fixture>(json_path.value()).is_err());
    EXPECT_TRUE(fixture::load_from_json_file<fixture::Fixture>(temp_dir / "missing.json").is_err());
}

// Test 14: discovery is recursive, sorted and filtered by extension
TEST_F(FixtureTest, FindFiles) {
    fs::create_directories(temp_dir / "b");
    for (const auto& name : {"b/two.fix", "a.fix", "ignored.json"}) {
        std::ofstream(temp_dir / name) << "x";
    }

    auto found = fixture::find_files(temp_dir, "fix");
    ASSERT_EQ(2u, found.size());
    EXPECT_EQ(temp_dir / "a.fix", found[0]);
    EXPECT_EQ(temp_dir / "b" / "two.fix", found[1]);

    EXPECT_EQ(1u, fixture::find_files(temp_dir / "ignored.json", "json").size());
    EXPECT_TRUE(fixture::find_files(temp_dir / "ignored.json", "fix").empty());
    EXPECT_TRUE(fixture::find_files(temp_dir / "nowhere", "fix").empty());
}

// Test 15: the ejector writes one replayable file per processed call
TEST_F(FixtureTest, EjectorWritesReplayableFixtures) {
    auto ejector = std::make_shared<FixtureEjector>(temp_dir / "ejected");
    harness.add_observer(ejector);

    harness.process_instruction(instruction, accounts);
    harness.process_instruction(svm::system_instruction::transfer(sender, recipient, 1), accounts);

    auto written = ejector->written();
    ASSERT_EQ(2u, written.size());
    EXPECT_EQ(2u, fixture::find_files(temp_dir / "ejected", "fix").size());

    Harness replay;
    for (const auto& path : written) {
        auto loaded = fixture::load_from_blob_file<fixture::Fixture>(path);
        ASSERT_TRUE(loaded.is_ok()) << loaded.error();
        EXPECT_NO_THROW(replay.process_and_validate_fixture(loaded.value()));
    }
}

// Test 16: interchange JSON ejection
TEST_F(FixtureTest, EjectorInterchangeJson) {
    auto ejector = std::make_shared<FixtureEjector>(
        temp_dir, FixtureEjector::Format::JSON, fixture::codec::Layout::FIREDANCER);
    harness.add_observer(ejector);
    harness.process_instruction(instruction, accounts);

    auto written = ejector->written();
    ASSERT_EQ(1u, written.size());
    EXPECT_EQ(".json", written[0].extension());

    auto loaded = fixture::load_from_json_file<fd::Fixture>(written[0]);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    Harness replay;
    EXPECT_NO_THROW(replay.process_and_validate_fixture(loaded.value()));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
