#pragma once

#include "common/types.h"
#include "svm/account.h"
#include "svm/program_loader.h"
#include "svm/sysvars.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace periwinkle {
namespace svm {

using namespace periwinkle::common;

/**
 * Program id → invocable program, plus the loaders that run them
 *
 * Owned by one harness configuration and passed by reference into each
 * call; read-only while a call executes.
 */
class ProgramRegistry {
public:
    /// Registers the native loader and the bytecode loaders
    ProgramRegistry();

    /// Adds the system program
    void add_default_builtins();

    void register_loader(const PublicKey& loader_key,
                         std::shared_ptr<const ProgramLoader> loader);

    /// Register a builtin under the native loader (replaces an existing entry)
    Result<bool> add_builtin(std::shared_ptr<const BuiltinProgram> builtin);

    /**
     * Register a bytecode program under `loader_key`
     *
     * The loader prepares the image immediately; an unknown loader or a
     * rejected image is an error.
     */
    Result<bool> add_program(const PublicKey& program_id,
                             const PublicKey& loader_key,
                             std::vector<uint8_t> image,
                             const std::string& name = "");

    const ProgramEntry* find(const PublicKey& program_id) const;
    const ProgramLoader* loader_for(const PublicKey& loader_key) const;
    bool is_builtin(const PublicKey& program_id) const;
    std::vector<PublicKey> program_ids() const;

    /**
     * Executable account representing a registered program, for callers
     * that pass the program itself as an instruction account
     */
    std::optional<KeyedAccount> keyed_account_for(const PublicKey& program_id,
                                                  const Rent& rent) const;

private:
    std::unordered_map<PublicKey, ProgramEntry> programs_;
    std::vector<PublicKey> order_;
    std::unordered_map<PublicKey, std::shared_ptr<const ProgramLoader>> loaders_;
};

} // namespace svm
} // namespace periwinkle
