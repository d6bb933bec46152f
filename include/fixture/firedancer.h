#pragma once

#include "common/types.h"
#include "svm/account.h"
#include <optional>
#include <string>
#include <vector>

namespace periwinkle {
namespace fixture {
namespace firedancer {

using namespace periwinkle::common;

/// Entrypoint recorded in the metadata of every instruction fixture
constexpr const char* INSTR_ENTRYPOINT = "sol_compat_instr_execute_v1";

/**
 * Address derived with create-with-seed
 */
struct SeedAddress {
    PublicKey base;
    std::string seed;
    PublicKey owner;

    bool operator==(const SeedAddress& other) const {
        return base == other.base && seed == other.seed && owner == other.owner;
    }
};

struct FdAccount {
    PublicKey address;
    svm::Account account;
    std::optional<SeedAddress> seed_addr;

    bool operator==(const FdAccount& other) const {
        return address == other.address && account == other.account &&
               seed_addr == other.seed_addr;
    }
};

/// Instruction account given as an index into the context accounts
struct InstrAccount {
    uint32_t index = 0;
    bool is_writable = false;
    bool is_signer = false;

    bool operator==(const InstrAccount& other) const {
        return index == other.index && is_writable == other.is_writable &&
               is_signer == other.is_signer;
    }
};

struct Context {
    PublicKey program_id = PublicKey(PUBKEY_BYTES, 0);
    std::vector<FdAccount> accounts;
    std::vector<InstrAccount> instr_accounts;
    std::vector<uint8_t> data;
    uint64_t cu_avail = 0;
    Slot slot = 0;
    std::vector<uint64_t> features;  ///< Feature id prefixes

    bool operator==(const Context& other) const;
};

/**
 * Effects in the interchange layout
 *
 * `result` is 0 on success and the instruction error index plus one
 * otherwise; only accounts that changed are listed.
 */
struct Effects {
    int32_t result = 0;
    uint64_t custom_err = 0;
    std::vector<FdAccount> modified_accounts;
    uint64_t cu_avail = 0;
    std::vector<uint8_t> return_data;

    bool operator==(const Effects& other) const;
};

struct Metadata {
    std::string fn_entrypoint = INSTR_ENTRYPOINT;

    bool operator==(const Metadata& other) const {
        return fn_entrypoint == other.fn_entrypoint;
    }
};

struct Fixture {
    Metadata metadata;
    Context input;
    Effects output;

    std::vector<uint8_t> encode() const;
    static Result<Fixture> decode(const std::vector<uint8_t>& blob);

    std::string to_json() const;
    static Result<Fixture> from_json(const std::string& json_str);

    bool operator==(const Fixture& other) const {
        return metadata == other.metadata && input == other.input &&
               output == other.output;
    }
};

} // namespace firedancer
} // namespace fixture
} // namespace periwinkle
