#include "harness/check.h"
#include "common/base58.h"
#include "common/logging.h"

namespace periwinkle {
namespace harness {

namespace {

void evaluate_account(const InstructionResult &result, const AccountCheck &check,
                      std::vector<Mismatch> &out) {
  const std::string label = "account " + base58_encode(check.pubkey);
  const svm::Account *account = result.get_account(check.pubkey);
  if (!account) {
    out.push_back({label, "present in resulting accounts", "<absent>"});
    return;
  }

  if (check.closed && *account != svm::Account()) {
    out.push_back({label, "closed", describe_account(*account)});
  }
  if (check.lamports && *check.lamports != account->lamports) {
    out.push_back({label + " lamports", std::to_string(*check.lamports),
                   std::to_string(account->lamports)});
  }
  if (check.data && *check.data != account->data) {
    out.push_back({label + " data", "0x" + hex_encode(*check.data),
                   "0x" + hex_encode(account->data)});
  }
  if (check.owner && *check.owner != account->owner) {
    out.push_back({label + " owner", base58_encode(*check.owner),
                   base58_encode(account->owner)});
  }
  if (check.space && *check.space != account->data.size()) {
    out.push_back({label + " space", std::to_string(*check.space),
                   std::to_string(account->data.size())});
  }
  if (check.executable && *check.executable != account->executable) {
    out.push_back({label + " executable", *check.executable ? "true" : "false",
                   account->executable ? "true" : "false"});
  }
  if (check.rent_epoch && *check.rent_epoch != account->rent_epoch) {
    out.push_back({label + " rent_epoch", std::to_string(*check.rent_epoch),
                   std::to_string(account->rent_epoch)});
  }
  if (check.data_slice) {
    const size_t offset = check.data_slice->first;
    const std::vector<uint8_t> &expected = check.data_slice->second;
    std::string field = label + " data[" + std::to_string(offset) + ".." +
                        std::to_string(offset + expected.size()) + "]";
    if (offset > account->data.size() ||
        expected.size() > account->data.size() - offset) {
      out.push_back({field, "0x" + hex_encode(expected),
                     "out of range (" + std::to_string(account->data.size()) +
                         " bytes)"});
    } else {
      std::vector<uint8_t> actual(account->data.begin() + offset,
                                  account->data.begin() + offset + expected.size());
      if (actual != expected) {
        out.push_back({field, "0x" + hex_encode(expected), "0x" + hex_encode(actual)});
      }
    }
  }
}

} // namespace

Check Check::success() { return program_result_is(ProgramResult::success()); }

Check Check::err(uint64_t program_error) {
  return program_result_is(ProgramResult::failure(program_error));
}

Check Check::instruction_err(const svm::InstructionError &error) {
  return program_result_is(ProgramResult::from_instruction_error(error));
}

Check Check::program_result_is(ProgramResult expected) {
  Check check;
  check.kind = CheckKind::PROGRAM_RESULT;
  check.program_result = expected;
  return check;
}

Check Check::compute_units_are(uint64_t units) {
  Check check;
  check.kind = CheckKind::COMPUTE_UNITS;
  check.compute_units = units;
  return check;
}

Check Check::return_data_is(std::vector<uint8_t> data) {
  Check check;
  check.kind = CheckKind::RETURN_DATA;
  check.return_data = std::move(data);
  return check;
}

Check Check::account_is(AccountCheck expected) {
  Check check;
  check.kind = CheckKind::ACCOUNT;
  check.account = std::move(expected);
  return check;
}

Check Check::account_lamports(const PublicKey &pubkey, Lamports lamports) {
  AccountCheck expected(pubkey);
  expected.lamports = lamports;
  return account_is(std::move(expected));
}

Check Check::account_data(const PublicKey &pubkey, std::vector<uint8_t> data) {
  AccountCheck expected(pubkey);
  expected.data = std::move(data);
  return account_is(std::move(expected));
}

Check Check::account_owner(const PublicKey &pubkey, const PublicKey &owner) {
  AccountCheck expected(pubkey);
  expected.owner = owner;
  return account_is(std::move(expected));
}

Check Check::account_space(const PublicKey &pubkey, size_t space) {
  AccountCheck expected(pubkey);
  expected.space = space;
  return account_is(std::move(expected));
}

Check Check::account_closed(const PublicKey &pubkey) {
  AccountCheck expected(pubkey);
  expected.closed = true;
  return account_is(std::move(expected));
}

std::vector<Mismatch> evaluate_checks(const InstructionResult &result,
                                      const std::vector<Check> &checks) {
  std::vector<Mismatch> mismatches;
  for (const auto &check : checks) {
    switch (check.kind) {
    case CheckKind::PROGRAM_RESULT:
      if (check.program_result != result.program_result) {
        mismatches.push_back({"program_result", check.program_result.to_string(),
                              result.program_result.to_string()});
      }
      break;
    case CheckKind::COMPUTE_UNITS:
      if (check.compute_units != result.compute_units_consumed) {
        mismatches.push_back({"compute_units_consumed",
                              std::to_string(check.compute_units),
                              std::to_string(result.compute_units_consumed)});
      }
      break;
    case CheckKind::RETURN_DATA:
      if (check.return_data != result.return_data) {
        mismatches.push_back({"return_data", "0x" + hex_encode(check.return_data),
                              "0x" + hex_encode(result.return_data)});
      }
      break;
    case CheckKind::ACCOUNT:
      evaluate_account(result, check.account, mismatches);
      break;
    }
  }
  return mismatches;
}

void run_checks(const InstructionResult &result, const std::vector<Check> &checks) {
  auto mismatches = evaluate_checks(result, checks);
  if (!mismatches.empty()) {
    LOG_STRUCTURED(LogLevel::WARN, "harness",
                   std::to_string(mismatches.size()) + " check(s) failed",
                   "CHECK_FAILURE");
    throw CheckFailure(std::move(mismatches));
  }
}

} // namespace harness
} // namespace periwinkle
