// src/rustactions/binds/SlotAllocator.cpp
#include "rustactions/binds/SlotAllocator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace rustactions::binds {

SlotAllocator::SlotAllocator(BindLayout layout)
    : m_layout(std::move(layout))
    , m_space(m_layout.alphabet, m_layout.arity)
    , m_used(m_space.Size(), false)
{
    std::string why;
    if (!m_layout.Validate(&why))
        spdlog::error("SlotAllocator: invalid bind layout: {}", why);

    for (SlotKind kind : {SlotKind::Crafting, SlotKind::StaticCommand, SlotKind::Dynamic})
    {
        const SlotRange configured = m_layout.Range(kind);
        const SlotRange effective  = EffectiveRange(kind);
        if (effective.size() < configured.size())
        {
            spdlog::warn("SlotAllocator: {} range [{}, {}) exceeds the {} available chords; capacity is {}",
                         ToString(kind), configured.begin, configured.end, m_space.Size(), effective.size());
        }
    }
}

SlotRange SlotAllocator::EffectiveRange(SlotKind kind) const noexcept
{
    const SlotRange& r = m_layout.Range(kind);
    const std::size_t limit = m_space.Size();

    SlotRange out = r;
    if (out.begin >= limit)
        return SlotRange{out.begin, out.begin};
    if (out.end > limit)
        out.end = static_cast<SlotIndex>(limit);
    return out;
}

void SlotAllocator::Reserve(SlotIndex slot)
{
    if (!m_space.Contains(slot))
        throw std::logic_error("SlotAllocator::Reserve: slot " + std::to_string(slot) + " is outside the chord space");
    if (m_used[slot])
        throw std::logic_error("SlotAllocator::Reserve: slot " + std::to_string(slot) + " is already reserved");

    m_used[slot] = true;
    ++m_usedCount;
}

bool SlotAllocator::Release(SlotIndex slot) noexcept
{
    if (!m_space.Contains(slot) || !m_used[slot])
        return false;

    m_used[slot] = false;
    --m_usedCount;
    return true;
}

bool SlotAllocator::IsUsed(SlotIndex slot) const noexcept
{
    return m_space.Contains(slot) && m_used[slot];
}

bool SlotAllocator::IsFree(SlotKind kind, SlotIndex slot) const noexcept
{
    return EffectiveRange(kind).contains(slot) && !m_used[slot];
}

std::size_t SlotAllocator::UsedCount(SlotKind kind) const noexcept
{
    const SlotRange r = EffectiveRange(kind);
    std::size_t n = 0;
    for (SlotIndex s = r.begin; s < r.end; ++s)
        n += m_used[s] ? 1u : 0u;
    return n;
}

void SlotAllocator::ReleaseRange(SlotKind kind) noexcept
{
    const SlotRange r = EffectiveRange(kind);
    for (SlotIndex s = r.begin; s < r.end; ++s)
        Release(s);
}

std::optional<SlotIndex> SlotAllocator::NextFree(SlotKind kind, SlotIndex from) const noexcept
{
    const SlotRange r = EffectiveRange(kind);
    for (SlotIndex s = std::max(from, r.begin); s < r.end; ++s)
    {
        if (!m_used[s])
            return s;
    }
    return std::nullopt;
}

std::size_t SlotAllocator::InitializeCrafting(const std::vector<catalog::CatalogItem>& items)
{
    ReleaseRange(SlotKind::Crafting);
    m_crafting.clear();
    m_craftingByItem.clear();
    m_requestedCrafting = items.size();

    SlotIndex cursor = EffectiveRange(SlotKind::Crafting).begin;

    for (std::size_t i = 0; i < items.size(); ++i)
    {
        const catalog::CatalogItem& item = items[i];

        if (m_craftingByItem.count(item.numericId) != 0)
        {
            spdlog::warn("SlotAllocator: duplicate catalog item {} ('{}') skipped", item.numericId, item.name);
            continue;
        }

        const auto craft  = NextFree(SlotKind::Crafting, cursor);
        const auto cancel = craft ? NextFree(SlotKind::Crafting, *craft + 1) : std::nullopt;
        if (!craft || !cancel)
        {
            spdlog::warn("SlotAllocator: crafting range exhausted; {} of {} items left without binds (first: {} '{}')",
                         items.size() - i, items.size(), item.numericId, item.name);
            break;
        }

        Reserve(*craft);
        Reserve(*cancel);
        cursor = *cancel + 1;

        m_craftingByItem.emplace(item.numericId, m_crafting.size());
        m_crafting.push_back(CraftingBindPair{item.numericId, item.name, *craft, *cancel});
    }

    spdlog::info("SlotAllocator: {} crafting bind pairs assigned", m_crafting.size());
    return m_crafting.size();
}

std::size_t SlotAllocator::InitializeStaticCommands(std::span<const StaticCommand> table)
{
    ReleaseRange(SlotKind::StaticCommand);
    m_static.clear();
    m_staticByName.clear();

    SlotIndex cursor = EffectiveRange(SlotKind::StaticCommand).begin;

    for (std::size_t i = 0; i < table.size(); ++i)
    {
        const StaticCommand& cmd = table[i];
        std::string name(cmd.name);

        if (m_staticByName.count(name) != 0)
        {
            spdlog::warn("SlotAllocator: duplicate static command '{}' skipped", name);
            continue;
        }

        const auto slot = NextFree(SlotKind::StaticCommand, cursor);
        if (!slot)
        {
            spdlog::warn("SlotAllocator: static command range exhausted; {} of {} commands left without binds (first: '{}')",
                         table.size() - i, table.size(), name);
            break;
        }

        Reserve(*slot);
        cursor = *slot + 1;

        m_staticByName.emplace(name, m_static.size());
        m_static.push_back(StaticCommandBind{std::move(name), std::string(cmd.command), *slot});
    }

    spdlog::info("SlotAllocator: {} static command binds assigned", m_static.size());
    return m_static.size();
}

std::optional<CraftingBindPair> SlotAllocator::FindCrafting(std::int64_t itemId) const
{
    const auto it = m_craftingByItem.find(itemId);
    if (it == m_craftingByItem.end())
        return std::nullopt;
    return m_crafting[it->second];
}

std::optional<StaticCommandBind> SlotAllocator::FindStaticCommand(std::string_view name) const
{
    const auto it = m_staticByName.find(std::string(name));
    if (it == m_staticByName.end())
        return std::nullopt;
    return m_static[it->second];
}

} // namespace rustactions::binds
