#pragma once
// include/rustactions/binds/SlotAllocator.hpp
//
// Owns the chord space, the three slot ranges and the set of occupied slots.
// Crafting and static-command slots are assigned in bulk at initialization;
// the dynamic layer reserves and releases single slots through Reserve/Release.

#include "rustactions/binds/BindLayout.hpp"
#include "rustactions/binds/KeyCombinationSpace.hpp"
#include "rustactions/binds/StaticCommands.hpp"
#include "rustactions/catalog/ItemCatalog.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rustactions::binds {

struct CraftingBindPair {
    std::int64_t itemId = 0;
    std::string  itemName;
    SlotIndex    craftSlot  = 0;
    SlotIndex    cancelSlot = 0;
};

struct StaticCommandBind {
    std::string name;
    std::string command;
    SlotIndex   slot = 0;
};

class SlotAllocator {
public:
    explicit SlotAllocator(BindLayout layout = {});

    SlotAllocator(const SlotAllocator&) = delete;
    SlotAllocator& operator=(const SlotAllocator&) = delete;

    [[nodiscard]] const BindLayout& Layout() const noexcept { return m_layout; }
    [[nodiscard]] const KeyCombinationSpace& Space() const noexcept { return m_space; }

    // Configured range clipped to the chord space; empty when the space is
    // smaller than the range start.
    [[nodiscard]] SlotRange EffectiveRange(SlotKind kind) const noexcept;
    [[nodiscard]] std::size_t Capacity(SlotKind kind) const noexcept { return EffectiveRange(kind).size(); }

    // Re-assigns the crafting range: two consecutive free slots (craft, cancel)
    // per item, in the given order. Items that do not fit are left unbound.
    // Returns the number of items that received binds.
    std::size_t InitializeCrafting(const std::vector<catalog::CatalogItem>& items);

    // Same pattern over the static-command range, one slot per table entry.
    std::size_t InitializeStaticCommands(std::span<const StaticCommand> table = DefaultStaticCommands());

    // Marks a slot occupied. Reserving an occupied slot, or one outside the
    // chord space, means the allocation discipline is broken: throws
    // std::logic_error.
    void Reserve(SlotIndex slot);

    // Returns false when the slot was not occupied.
    bool Release(SlotIndex slot) noexcept;

    [[nodiscard]] bool IsUsed(SlotIndex slot) const noexcept;

    // True when `slot` lies in the effective range of `kind` and is unoccupied.
    [[nodiscard]] bool IsFree(SlotKind kind, SlotIndex slot) const noexcept;

    [[nodiscard]] std::optional<CraftingBindPair> FindCrafting(std::int64_t itemId) const;
    [[nodiscard]] std::optional<StaticCommandBind> FindStaticCommand(std::string_view name) const;

    [[nodiscard]] const std::vector<CraftingBindPair>& CraftingBinds() const noexcept { return m_crafting; }
    [[nodiscard]] const std::vector<StaticCommandBind>& StaticCommandBinds() const noexcept { return m_static; }

    [[nodiscard]] std::size_t UsedCount(SlotKind kind) const noexcept;
    [[nodiscard]] std::size_t UsedCount() const noexcept { return m_usedCount; }

    // Number of catalog items that asked for binds at the last InitializeCrafting.
    [[nodiscard]] std::size_t RequestedCraftingItems() const noexcept { return m_requestedCrafting; }

private:
    void ReleaseRange(SlotKind kind) noexcept;
    [[nodiscard]] std::optional<SlotIndex> NextFree(SlotKind kind, SlotIndex from) const noexcept;

    BindLayout          m_layout;
    KeyCombinationSpace m_space;

    std::vector<bool> m_used;
    std::size_t       m_usedCount = 0;

    std::vector<CraftingBindPair>                 m_crafting;
    std::unordered_map<std::int64_t, std::size_t> m_craftingByItem;
    std::vector<StaticCommandBind>                m_static;
    std::unordered_map<std::string, std::size_t>  m_staticByName;
    std::size_t                                   m_requestedCrafting = 0;
};

} // namespace rustactions::binds
