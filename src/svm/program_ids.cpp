#include "svm/program_ids.h"
#include "common/base58.h"

namespace periwinkle {
namespace svm {
namespace program_ids {

const PublicKey &system_program() {
  static const PublicKey id = pubkey_literal("11111111111111111111111111111111");
  return id;
}

const PublicKey &native_loader() {
  static const PublicKey id =
      pubkey_literal("NativeLoader1111111111111111111111111111111");
  return id;
}

const PublicKey &bpf_loader_deprecated() {
  static const PublicKey id =
      pubkey_literal("BPFLoader1111111111111111111111111111111111");
  return id;
}

const PublicKey &bpf_loader() {
  static const PublicKey id =
      pubkey_literal("BPFLoader2111111111111111111111111111111111");
  return id;
}

const PublicKey &bpf_loader_upgradeable() {
  static const PublicKey id =
      pubkey_literal("BPFLoaderUpgradeab1e11111111111111111111111");
  return id;
}

const PublicKey &loader_v4() {
  static const PublicKey id =
      pubkey_literal("LoaderV411111111111111111111111111111111111");
  return id;
}

const PublicKey &sysvar_owner() {
  static const PublicKey id =
      pubkey_literal("Sysvar1111111111111111111111111111111111111");
  return id;
}

const PublicKey &incinerator() {
  static const PublicKey id =
      pubkey_literal("1nc1nerator11111111111111111111111111111111");
  return id;
}

bool is_bpf_loader(const PublicKey &key) {
  return key == bpf_loader_deprecated() || key == bpf_loader() ||
         key == bpf_loader_upgradeable() || key == loader_v4();
}

} // namespace program_ids
} // namespace svm
} // namespace periwinkle
