#pragma once

#include "common/types.h"

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Well-known program and account addresses
 */
namespace program_ids {

const PublicKey& system_program();
const PublicKey& native_loader();
const PublicKey& bpf_loader_deprecated();
const PublicKey& bpf_loader();
const PublicKey& bpf_loader_upgradeable();
const PublicKey& loader_v4();
const PublicKey& sysvar_owner();
const PublicKey& incinerator();

/// True for loaders whose programs run on the bytecode interpreter
bool is_bpf_loader(const PublicKey& key);

} // namespace program_ids

} // namespace svm
} // namespace periwinkle
