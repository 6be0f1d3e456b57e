#pragma once
// include/rustactions/binds/StaticCommands.hpp
//
// Fixed table of console commands that get one reserved bind each.
// Table order decides slot order: entry N is bound to staticCommand.begin + N.

#include <span>
#include <string_view>

namespace rustactions::binds {

struct StaticCommand {
    std::string_view name;    // stable API name, e.g. "hud_on"
    std::string_view command; // literal console command written into keys.cfg
};

[[nodiscard]] std::span<const StaticCommand> DefaultStaticCommands() noexcept;

} // namespace rustactions::binds
