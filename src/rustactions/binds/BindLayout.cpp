// src/rustactions/binds/BindLayout.cpp
#include "rustactions/binds/BindLayout.hpp"

#include <unordered_set>

namespace rustactions::binds {

const char* ToString(SlotKind kind) noexcept
{
    switch (kind)
    {
    case SlotKind::Crafting:      return "crafting";
    case SlotKind::StaticCommand: return "static";
    case SlotKind::Dynamic:       return "dynamic";
    case SlotKind::Count:         break;
    }
    return "unknown";
}

const SlotRange& BindLayout::Range(SlotKind kind) const noexcept
{
    switch (kind)
    {
    case SlotKind::Crafting:      return crafting;
    case SlotKind::StaticCommand: return staticCommand;
    default:                      return dynamic;
    }
}

bool BindLayout::Validate(std::string* err) const
{
    auto fail = [&](const std::string& why) {
        if (err) *err = why;
        return false;
    };

    if (arity == 0)
        return fail("chord arity must be at least 1");

    if (alphabet.empty())
        return fail("key alphabet is empty");

    std::unordered_set<std::string> seen;
    for (const auto& token : alphabet)
    {
        if (token.empty())
            return fail("key alphabet contains an empty token");
        if (!seen.insert(token).second)
            return fail("key alphabet contains duplicate token '" + token + "'");
    }

    if (crafting.size() == 0 || staticCommand.size() == 0 || dynamic.size() == 0)
        return fail("slot ranges must not be empty");

    if (!(crafting.end <= staticCommand.begin && staticCommand.end <= dynamic.begin))
        return fail("slot ranges must be ordered crafting < static < dynamic without overlap");

    if (err) err->clear();
    return true;
}

} // namespace rustactions::binds
