#include "svm/account.h"

namespace periwinkle {
namespace svm {

Account::Account(Lamports lamports, size_t space, const PublicKey &owner)
    : lamports(lamports), data(space, 0), owner(owner) {}

bool Account::operator==(const Account &other) const {
  return lamports == other.lamports && data == other.data &&
         owner == other.owner && executable == other.executable &&
         rent_epoch == other.rent_epoch;
}

AccountStore::AccountStore(std::initializer_list<KeyedAccount> accounts) {
  for (const auto &keyed : accounts) {
    upsert(keyed.pubkey, keyed.account);
  }
}

AccountStore::AccountStore(std::vector<KeyedAccount> accounts) {
  for (auto &keyed : accounts) {
    upsert(keyed.pubkey, keyed.account);
  }
}

const Account *AccountStore::find(const PublicKey &pubkey) const {
  for (const auto &keyed : entries_) {
    if (keyed.pubkey == pubkey) {
      return &keyed.account;
    }
  }
  return nullptr;
}

Account *AccountStore::find(const PublicKey &pubkey) {
  for (auto &keyed : entries_) {
    if (keyed.pubkey == pubkey) {
      return &keyed.account;
    }
  }
  return nullptr;
}

void AccountStore::upsert(const PublicKey &pubkey, const Account &account) {
  if (Account *existing = find(pubkey)) {
    *existing = account;
    return;
  }
  entries_.push_back(KeyedAccount{pubkey, account});
}

AccountMeta AccountMeta::writable(const PublicKey &pubkey, bool is_signer) {
  return AccountMeta{pubkey, is_signer, true};
}

AccountMeta AccountMeta::readonly(const PublicKey &pubkey, bool is_signer) {
  return AccountMeta{pubkey, is_signer, false};
}

} // namespace svm
} // namespace periwinkle
