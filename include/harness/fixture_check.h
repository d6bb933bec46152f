#pragma once

#include "common/types.h"
#include "harness/check.h"
#include "harness/result.h"
#include <vector>

namespace periwinkle {
namespace harness {

using namespace periwinkle::common;

/// Account fields compared by the account variants of FixtureCheck
struct FixtureAccountFields {
    bool data = true;
    bool lamports = true;
    bool owner = true;
    bool space = true;
};

/**
 * @brief Part of a fixture's effects to validate against
 *
 * Unlike Check, a FixtureCheck carries no expected value: the value comes
 * from the fixture being replayed.
 */
struct FixtureCheck {
    enum class Kind {
        COMPUTE_UNITS,
        PROGRAM_RESULT,
        RETURN_DATA,
        ALL_RESULTING_ACCOUNTS,
        ONLY_RESULTING_ACCOUNTS,
        ALL_RESULTING_ACCOUNTS_EXCEPT,
    };

    using AccountFields = FixtureAccountFields;

    Kind kind = Kind::PROGRAM_RESULT;
    AccountFields fields;
    /// Addresses to include (ONLY_...) or skip (..._EXCEPT)
    std::vector<PublicKey> addresses;

    static FixtureCheck compute_units() { return FixtureCheck{Kind::COMPUTE_UNITS, {}, {}}; }
    static FixtureCheck program_result() { return FixtureCheck{Kind::PROGRAM_RESULT, {}, {}}; }
    static FixtureCheck return_data() { return FixtureCheck{Kind::RETURN_DATA, {}, {}}; }
    static FixtureCheck all_resulting_accounts(AccountFields fields = AccountFields()) {
        return FixtureCheck{Kind::ALL_RESULTING_ACCOUNTS, fields, {}};
    }
    static FixtureCheck only_resulting_accounts(std::vector<PublicKey> addresses,
                                                AccountFields fields = AccountFields()) {
        return FixtureCheck{Kind::ONLY_RESULTING_ACCOUNTS, fields, std::move(addresses)};
    }
    static FixtureCheck all_resulting_accounts_except(std::vector<PublicKey> ignore,
                                                      AccountFields fields = AccountFields()) {
        return FixtureCheck{Kind::ALL_RESULTING_ACCOUNTS_EXCEPT, fields, std::move(ignore)};
    }
};

/// Checks asserting the parts of `expected` selected by `fixture_checks`
std::vector<Check> checks_from_fixture(const InstructionResult& expected,
                                       const std::vector<FixtureCheck>& fixture_checks);

} // namespace harness
} // namespace periwinkle
