#pragma once

#include "common/types.h"
#include <initializer_list>
#include <string>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Account state: balance, owner, data and executable flag
 */
struct Account {
    Lamports lamports = 0;
    std::vector<uint8_t> data;
    PublicKey owner = PublicKey(PUBKEY_BYTES, 0);
    bool executable = false;
    Epoch rent_epoch = 0;

    Account() = default;
    /// Zero-filled data of `space` bytes
    Account(Lamports lamports, size_t space, const PublicKey& owner);

    bool operator==(const Account& other) const;
    bool operator!=(const Account& other) const { return !(*this == other); }
};

/**
 * Account paired with its address
 */
struct KeyedAccount {
    PublicKey pubkey;
    Account account;

    bool operator==(const KeyedAccount& other) const {
        return pubkey == other.pubkey && account == other.account;
    }
};

/**
 * Ordered, key-unique set of accounts supplied to a call
 *
 * Insertion order is preserved so results list accounts in the order the
 * caller provided them.
 */
class AccountStore {
public:
    AccountStore() = default;
    AccountStore(std::initializer_list<KeyedAccount> accounts);
    explicit AccountStore(std::vector<KeyedAccount> accounts);

    const Account* find(const PublicKey& pubkey) const;
    Account* find(const PublicKey& pubkey);
    bool contains(const PublicKey& pubkey) const { return find(pubkey) != nullptr; }

    /// Replace the entry for `pubkey`, or append it if absent
    void upsert(const PublicKey& pubkey, const Account& account);

    const std::vector<KeyedAccount>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<KeyedAccount>::const_iterator begin() const { return entries_.begin(); }
    std::vector<KeyedAccount>::const_iterator end() const { return entries_.end(); }

    bool operator==(const AccountStore& other) const { return entries_ == other.entries_; }

private:
    std::vector<KeyedAccount> entries_;
};

/**
 * Account reference within an instruction
 */
struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const PublicKey& pubkey, bool is_signer);
    static AccountMeta readonly(const PublicKey& pubkey, bool is_signer);

    bool operator==(const AccountMeta& other) const {
        return pubkey == other.pubkey && is_signer == other.is_signer &&
               is_writable == other.is_writable;
    }
};

/**
 * Instruction invoking one program with an ordered account list
 */
struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;

    bool operator==(const Instruction& other) const {
        return program_id == other.program_id && accounts == other.accounts &&
               data == other.data;
    }
};

} // namespace svm
} // namespace periwinkle
