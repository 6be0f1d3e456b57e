#pragma once
// include/rustactions/binds/LegacyDynamicBinds.hpp
//
// Older releases kept dynamic binds in a JSON side file:
//
//   { "dynamic_binds": { "chat_say:gg": 4000, ... },
//     "dynamic_bind_order": [4000, ...],
//     "next_dynamic_bind": 4001 }
//
// keys.cfg is now the only record; the side file is imported once and removed.

#include "rustactions/binds/DynamicBindCache.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rustactions::binds {

class BindTrigger;

// Entries least recently used first: slots listed in "dynamic_bind_order"
// first, in that order, then any remaining entries. Invalid entries are
// skipped with a warning.
[[nodiscard]] bool ParseLegacyDynamicBinds(std::string_view text,
                                           std::vector<DynamicBindEntry>& out,
                                           std::string* err = nullptr);

enum class LegacyMigrationResult {
    NotNeeded,  // no side file, or dynamic binds already loaded from keys.cfg
    Migrated,   // imported, keys.cfg rewritten, side file removed
    Failed,     // side file kept for the next attempt
};

[[nodiscard]] LegacyMigrationResult MigrateLegacyDynamicBinds(const std::filesystem::path& legacyPath,
                                                              BindTrigger& trigger,
                                                              std::string* err = nullptr);

} // namespace rustactions::binds
