#include "harness/fixture_check.h"
#include <algorithm>

namespace periwinkle {
namespace harness {

namespace {

void add_account_checks(std::vector<Check> &checks,
                        const svm::KeyedAccount &account,
                        const FixtureCheck::AccountFields &fields) {
  AccountCheck expected(account.pubkey);
  if (fields.data) {
    expected.data = account.account.data;
  }
  if (fields.lamports) {
    expected.lamports = account.account.lamports;
  }
  if (fields.owner) {
    expected.owner = account.account.owner;
  }
  if (fields.space) {
    expected.space = account.account.data.size();
  }
  checks.push_back(Check::account_is(std::move(expected)));
}

bool listed(const std::vector<PublicKey> &addresses, const PublicKey &key) {
  return std::find(addresses.begin(), addresses.end(), key) != addresses.end();
}

} // namespace

std::vector<Check> checks_from_fixture(const InstructionResult &expected,
                                       const std::vector<FixtureCheck> &fixture_checks) {
  std::vector<Check> checks;
  for (const auto &fixture_check : fixture_checks) {
    switch (fixture_check.kind) {
    case FixtureCheck::Kind::COMPUTE_UNITS:
      checks.push_back(Check::compute_units_are(expected.compute_units_consumed));
      break;
    case FixtureCheck::Kind::PROGRAM_RESULT:
      checks.push_back(Check::program_result_is(expected.program_result));
      break;
    case FixtureCheck::Kind::RETURN_DATA:
      checks.push_back(Check::return_data_is(expected.return_data));
      break;
    case FixtureCheck::Kind::ALL_RESULTING_ACCOUNTS:
      for (const auto &account : expected.resulting_accounts) {
        add_account_checks(checks, account, fixture_check.fields);
      }
      break;
    case FixtureCheck::Kind::ONLY_RESULTING_ACCOUNTS:
      for (const auto &account : expected.resulting_accounts) {
        if (listed(fixture_check.addresses, account.pubkey)) {
          add_account_checks(checks, account, fixture_check.fields);
        }
      }
      break;
    case FixtureCheck::Kind::ALL_RESULTING_ACCOUNTS_EXCEPT:
      for (const auto &account : expected.resulting_accounts) {
        if (!listed(fixture_check.addresses, account.pubkey)) {
          add_account_checks(checks, account, fixture_check.fields);
        }
      }
      break;
    }
  }
  return checks;
}

} // namespace harness
} // namespace periwinkle
