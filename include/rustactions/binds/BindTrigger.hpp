#pragma once
// include/rustactions/binds/BindTrigger.hpp
//
// Turns logical actions (craft an item, run a fixed command, say something)
// into chord presses. All operations are serialized on one mutex: there is a
// single keyboard focus and concurrent chord sends would interleave.
//
// A dynamic action that creates or evicts a bind runs, in order:
//   1. KeysCfgStore::Write
//   2. IConfigReloader::ReloadConfig
//   3. IInputInjector::SendChord
// and stops at the first failing step, so no chord is sent that the game does
// not know yet. Until a write and a reload have both succeeded, the bind state
// counts as unflushed: every later action, hits included, repeats steps 1 and 2
// before pressing anything.
//
// After LoadState the first action compares keys.cfg with the assigned binds;
// a missing or stale file is rewritten and reloaded the same way.

#include "rustactions/binds/DynamicBindCache.hpp"
#include "rustactions/binds/KeysCfgStore.hpp"
#include "rustactions/binds/SlotAllocator.hpp"
#include "rustactions/catalog/ItemCatalog.hpp"
#include "rustactions/input/InputInjector.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rustactions::binds {

struct TriggerResult {
    bool        success = false;
    std::string message;

    // Batch progress (craft x N); 1/1 for single actions that succeeded.
    std::size_t completed = 0;
    std::size_t requested = 0;
};

struct BindStats {
    std::size_t totalSlots        = 0; // chords in the key combination space
    std::size_t usedSlots         = 0;
    std::size_t freeSlots         = 0;
    std::size_t craftingSlotsUsed = 0;
    std::size_t staticSlotsUsed   = 0;
    std::size_t dynamicSlotsUsed  = 0;
    std::size_t dynamicCapacity   = 0;
    std::size_t craftableItems    = 0;
};

// Tool Cupboard, Wood, Stone: crafting and cancelling these in quick
// succession makes the game restack the inventory.
inline constexpr std::array<std::int64_t, 3> kStackInventoryItems{-97956382, 1390353317, 15388698};

struct TriggerOptions {
    // Pause between the presses of a batch.
    std::chrono::milliseconds batchDelay{10};
};

class BindTrigger {
public:
    BindTrigger(SlotAllocator& allocator,
                DynamicBindCache& dynamic,
                const KeysCfgStore& store,
                input::IInputInjector& injector,
                input::IConfigReloader& reloader,
                TriggerOptions options = {});

    BindTrigger(const BindTrigger&) = delete;
    BindTrigger& operator=(const BindTrigger&) = delete;

    // Assigns crafting and static binds and hydrates the dynamic cache from
    // keys.cfg. Does not write the file. Returns false only when an existing
    // keys.cfg cannot be read; the binds are assigned regardless.
    [[nodiscard]] bool LoadState(const catalog::ICatalogSource& catalog, std::string* err = nullptr);

    [[nodiscard]] TriggerResult TriggerCraft(std::int64_t itemId, std::size_t quantity = 1);
    [[nodiscard]] TriggerResult TriggerCancelCraft(std::int64_t itemId, std::size_t quantity = 1);
    [[nodiscard]] TriggerResult TriggerStaticCommand(std::string_view name);

    // Presses the craft (or cancel) bind of every item once per iteration.
    // `completed` counts whole iterations.
    [[nodiscard]] TriggerResult TriggerStackInventory(std::size_t iterations,
                                                      bool cancel = false,
                                                      std::span<const std::int64_t> items = kStackInventoryItems);
    [[nodiscard]] TriggerResult TriggerDynamicCommand(DynamicCommandType type, std::string_view value);

    // Asks the game to re-read keys.cfg.
    [[nodiscard]] TriggerResult ReloadGameConfig();

    // Makes sure keys.cfg holds the current binds and the game has loaded them
    // (rewrite plus reload when it does not). Every Trigger* call does this
    // first; calling it up front moves the cost to startup.
    [[nodiscard]] bool SyncConfig(std::string* err = nullptr);

    [[nodiscard]] BindStats GetStats() const;

    // Protected full rewrite of keys.cfg from the current state.
    [[nodiscard]] bool RegenerateConfig(std::string* err = nullptr);

    // Drops every dynamic bind and rewrites keys.cfg.
    [[nodiscard]] bool ClearDynamicBinds(std::string* err = nullptr);

    // Replaces the dynamic cache with what keys.cfg currently holds.
    [[nodiscard]] bool ReloadDynamicBindsFromFile(std::string* err = nullptr);

    // Restores `entries` into an empty dynamic cache and rewrites keys.cfg.
    // Returns false when the cache is not empty (nothing is restored) or when
    // the write fails (restored entries stay in memory). `restored` receives
    // the number of entries taken.
    [[nodiscard]] bool ImportDynamicBinds(const std::vector<DynamicBindEntry>& entries,
                                          std::size_t* restored = nullptr,
                                          std::string* err = nullptr);

private:
    [[nodiscard]] TriggerResult TriggerCraftingSlot(std::int64_t itemId, std::size_t quantity, bool cancel);
    [[nodiscard]] bool SendSlot(SlotIndex slot, std::string* why);
    [[nodiscard]] bool HydrateDynamicLocked(std::string* err);
    [[nodiscard]] bool EnsureGameCurrentLocked(std::string* why);

    SlotAllocator&          m_allocator;
    DynamicBindCache&       m_dynamic;
    const KeysCfgStore&     m_store;
    input::IInputInjector&  m_injector;
    input::IConfigReloader& m_reloader;
    TriggerOptions          m_options;

    mutable std::mutex m_mutex;

    // keys.cfg was compared with the bind state since the last LoadState.
    bool m_fileChecked = false;
    // The bind state changed and the game has not confirmed a reload since.
    bool m_reloadPending = false;
};

} // namespace rustactions::binds
