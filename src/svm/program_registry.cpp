#include "svm/program_registry.h"
#include "common/base58.h"
#include "common/logging.h"
#include "svm/bpf_runtime.h"
#include "svm/program_ids.h"
#include "svm/system_program.h"
#include <algorithm>

namespace periwinkle {
namespace svm {

ProgramRegistry::ProgramRegistry() {
  register_loader(program_ids::native_loader(), std::make_shared<NativeLoader>());

  auto bpf_loader = std::make_shared<BpfLoader>();
  register_loader(program_ids::bpf_loader_deprecated(), bpf_loader);
  register_loader(program_ids::bpf_loader(), bpf_loader);
  register_loader(program_ids::bpf_loader_upgradeable(), bpf_loader);
  register_loader(program_ids::loader_v4(), bpf_loader);
}

void ProgramRegistry::add_default_builtins() {
  auto added = add_builtin(std::make_shared<SystemProgram>());
  if (added.is_err()) {
    LOG_ERROR("Failed to register system program: ", added.error());
  }
}

void ProgramRegistry::register_loader(const PublicKey &loader_key,
                                      std::shared_ptr<const ProgramLoader> loader) {
  loaders_[loader_key] = std::move(loader);
}

Result<bool>
ProgramRegistry::add_builtin(std::shared_ptr<const BuiltinProgram> builtin) {
  if (!builtin) {
    return Result<bool>("builtin program is null");
  }

  ProgramEntry entry;
  entry.program_id = builtin->get_program_id();
  entry.loader_key = program_ids::native_loader();
  entry.name = builtin->name();
  entry.builtin = std::move(builtin);

  const ProgramLoader *loader = loader_for(entry.loader_key);
  if (!loader) {
    return Result<bool>("native loader is not registered");
  }
  auto prepared = loader->prepare(entry);
  if (prepared.is_err()) {
    return prepared;
  }

  PublicKey id = entry.program_id;
  if (programs_.find(id) == programs_.end()) {
    order_.push_back(id);
  }
  programs_[id] = std::move(entry);
  LOG_DEBUG("Registered builtin program ", base58_encode(id));
  return Result<bool>(true);
}

Result<bool> ProgramRegistry::add_program(const PublicKey &program_id,
                                          const PublicKey &loader_key,
                                          std::vector<uint8_t> image,
                                          const std::string &name) {
  const ProgramLoader *loader = loader_for(loader_key);
  if (!loader || loader_key == program_ids::native_loader()) {
    return Result<bool>("no bytecode loader registered for " +
                        base58_encode(loader_key));
  }

  ProgramEntry entry;
  entry.program_id = program_id;
  entry.loader_key = loader_key;
  entry.name = name.empty() ? base58_encode(program_id) : name;
  entry.image = std::move(image);

  auto prepared = loader->prepare(entry);
  if (prepared.is_err()) {
    return Result<bool>("program " + entry.name + " rejected by " +
                        loader->name() + ": " + prepared.error());
  }

  if (programs_.find(program_id) == programs_.end()) {
    order_.push_back(program_id);
  }
  programs_[program_id] = std::move(entry);
  LOG_DEBUG("Registered program ", base58_encode(program_id), " under ",
            loader->name());
  return Result<bool>(true);
}

const ProgramEntry *ProgramRegistry::find(const PublicKey &program_id) const {
  auto it = programs_.find(program_id);
  return it == programs_.end() ? nullptr : &it->second;
}

const ProgramLoader *ProgramRegistry::loader_for(const PublicKey &loader_key) const {
  auto it = loaders_.find(loader_key);
  return it == loaders_.end() ? nullptr : it->second.get();
}

bool ProgramRegistry::is_builtin(const PublicKey &program_id) const {
  const ProgramEntry *entry = find(program_id);
  return entry != nullptr && entry->builtin != nullptr;
}

std::vector<PublicKey> ProgramRegistry::program_ids() const { return order_; }

std::optional<KeyedAccount>
ProgramRegistry::keyed_account_for(const PublicKey &program_id,
                                   const Rent &rent) const {
  const ProgramEntry *entry = find(program_id);
  if (!entry) {
    return std::nullopt;
  }

  Account account;
  if (entry->builtin) {
    account.data.assign(entry->name.begin(), entry->name.end());
  } else {
    account.data = entry->image;
  }
  account.lamports = std::max<Lamports>(rent.minimum_balance(account.data.size()), 1);
  account.owner = entry->loader_key;
  account.executable = true;
  return KeyedAccount{program_id, std::move(account)};
}

} // namespace svm
} // namespace periwinkle
