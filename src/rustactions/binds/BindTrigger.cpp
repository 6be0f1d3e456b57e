// src/rustactions/binds/BindTrigger.cpp
#include "rustactions/binds/BindTrigger.hpp"

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <thread>
#include <utility>

namespace rustactions::binds {

namespace {

TriggerResult Fail(std::string message, std::size_t completed = 0, std::size_t requested = 1)
{
    TriggerResult r;
    r.success   = false;
    r.message   = std::move(message);
    r.completed = completed;
    r.requested = requested;
    return r;
}

TriggerResult Ok(std::string message, std::size_t count = 1)
{
    TriggerResult r;
    r.success   = true;
    r.message   = std::move(message);
    r.completed = count;
    r.requested = count;
    return r;
}

} // namespace

BindTrigger::BindTrigger(SlotAllocator& allocator,
                         DynamicBindCache& dynamic,
                         const KeysCfgStore& store,
                         input::IInputInjector& injector,
                         input::IConfigReloader& reloader,
                         TriggerOptions options)
    : m_allocator(allocator)
    , m_dynamic(dynamic)
    , m_store(store)
    , m_injector(injector)
    , m_reloader(reloader)
    , m_options(options)
{
}

bool BindTrigger::LoadState(const catalog::ICatalogSource& catalog, std::string* err)
{
    std::lock_guard lock(m_mutex);

    m_allocator.InitializeCrafting(catalog.GetCraftableItems());
    m_allocator.InitializeStaticCommands();

    return HydrateDynamicLocked(err);
}

bool BindTrigger::EnsureGameCurrentLocked(std::string* why)
{
    if (m_fileChecked && !m_reloadPending)
        return true;

    if (!m_reloadPending)
    {
        KeysCfgSnapshot snap;
        std::string readErr;
        if (m_store.Read(snap, &readErr) && KeysCfgStore::Matches(snap, m_allocator, m_dynamic))
        {
            m_fileChecked = true;
            return true;
        }
        if (!readErr.empty())
            spdlog::warn("BindTrigger: {}", readErr);
        else
            spdlog::info("BindTrigger: {} is missing or out of date; rewriting", m_store.Path().string());
    }

    m_reloadPending = true;

    std::string writeErr;
    if (!m_store.Write(m_allocator, m_dynamic, &writeErr))
    {
        if (why) *why = "keys.cfg could not be updated: " + writeErr;
        return false;
    }
    if (!m_reloader.ReloadConfig())
    {
        if (why) *why = "the game did not reload keys.cfg";
        return false;
    }

    m_fileChecked   = true;
    m_reloadPending = false;
    return true;
}

bool BindTrigger::SyncConfig(std::string* err)
{
    std::lock_guard lock(m_mutex);
    return EnsureGameCurrentLocked(err);
}

bool BindTrigger::HydrateDynamicLocked(std::string* err)
{
    m_fileChecked = false;

    KeysCfgSnapshot snap;
    std::string why;
    if (!m_store.Read(snap, &why))
    {
        spdlog::error("BindTrigger: cannot load dynamic binds: {}", why);
        if (err) *err = why;
        return false;
    }

    m_dynamic.Clear();

    if (!snap.exists)
    {
        spdlog::info("BindTrigger: {} does not exist yet; starting without dynamic binds", m_store.Path().string());
        return true;
    }

    m_dynamic.Restore(snap.dynamicEntries);
    return true;
}

bool BindTrigger::SendSlot(SlotIndex slot, std::string* why)
{
    const auto chord = m_allocator.Space().ChordAt(slot);
    if (!chord)
    {
        if (why) *why = fmt::format("bind no.{} has no key combination", slot);
        return false;
    }

    if (!m_injector.SendChord(*chord))
    {
        if (why) *why = fmt::format("key input for bind no.{} was not delivered (is the game focused?)", slot);
        spdlog::warn("BindTrigger: {}", why ? *why : std::string{});
        return false;
    }
    return true;
}

TriggerResult BindTrigger::TriggerCraftingSlot(std::int64_t itemId, std::size_t quantity, bool cancel)
{
    const char* verb = cancel ? "cancel" : "craft";

    if (quantity == 0)
        return Fail("quantity must be at least 1", 0, 0);

    std::lock_guard lock(m_mutex);

    const auto pair = m_allocator.FindCrafting(itemId);
    if (!pair)
        return Fail(fmt::format("item {} has no crafting bind", itemId), 0, quantity);

    const SlotIndex slot = cancel ? pair->cancelSlot : pair->craftSlot;

    if (std::string why; !EnsureGameCurrentLocked(&why))
        return Fail(fmt::format("{} {} not sent: {}", verb, pair->itemName, why), 0, quantity);

    for (std::size_t i = 0; i < quantity; ++i)
    {
        if (i != 0 && m_options.batchDelay.count() > 0)
            std::this_thread::sleep_for(m_options.batchDelay);

        std::string why;
        if (!SendSlot(slot, &why))
            return Fail(fmt::format("{} {} stopped after {}/{}: {}", verb, pair->itemName, i, quantity, why), i, quantity);
    }

    spdlog::info("BindTrigger: {} {} ({}) x{}", verb, pair->itemName, itemId, quantity);
    return Ok(fmt::format("{} {} x{}", verb, pair->itemName, quantity), quantity);
}

TriggerResult BindTrigger::TriggerCraft(std::int64_t itemId, std::size_t quantity)
{
    return TriggerCraftingSlot(itemId, quantity, false);
}

TriggerResult BindTrigger::TriggerCancelCraft(std::int64_t itemId, std::size_t quantity)
{
    return TriggerCraftingSlot(itemId, quantity, true);
}

TriggerResult BindTrigger::TriggerStackInventory(std::size_t iterations, bool cancel, std::span<const std::int64_t> items)
{
    if (iterations == 0)
        return Fail("iterations must be at least 1", 0, 0);

    std::lock_guard lock(m_mutex);

    std::vector<SlotIndex> slots;
    slots.reserve(items.size());
    for (const std::int64_t id : items)
    {
        const auto pair = m_allocator.FindCrafting(id);
        if (!pair)
            return Fail(fmt::format("stack item {} has no crafting bind", id), 0, iterations);
        slots.push_back(cancel ? pair->cancelSlot : pair->craftSlot);
    }

    if (std::string why; !EnsureGameCurrentLocked(&why))
        return Fail(fmt::format("stack not sent: {}", why), 0, iterations);

    for (std::size_t i = 0; i < iterations; ++i)
    {
        if (i != 0 && m_options.batchDelay.count() > 0)
            std::this_thread::sleep_for(m_options.batchDelay);

        for (const SlotIndex slot : slots)
        {
            std::string why;
            if (!SendSlot(slot, &why))
                return Fail(fmt::format("stack stopped after {}/{}: {}", i, iterations, why), i, iterations);
        }
    }

    spdlog::info("BindTrigger: {}stack inventory x{}", cancel ? "cancel " : "", iterations);
    return Ok(fmt::format("{}stack inventory x{}", cancel ? "cancel " : "", iterations), iterations);
}

TriggerResult BindTrigger::TriggerStaticCommand(std::string_view name)
{
    std::lock_guard lock(m_mutex);

    const auto bind = m_allocator.FindStaticCommand(name);
    if (!bind)
        return Fail(fmt::format("command '{}' is not available", name));

    std::string why;
    if (!EnsureGameCurrentLocked(&why))
        return Fail(fmt::format("command '{}' not sent: {}", name, why));
    if (!SendSlot(bind->slot, &why))
        return Fail(fmt::format("command '{}' failed: {}", name, why));

    spdlog::info("BindTrigger: command '{}'", name);
    return Ok(fmt::format("command '{}' sent", name));
}

TriggerResult BindTrigger::TriggerDynamicCommand(DynamicCommandType type, std::string_view value)
{
    std::lock_guard lock(m_mutex);

    const DynamicBindResult bind = m_dynamic.GetOrCreate(type, value);
    if (!bind.ok())
        return Fail(fmt::format("{} rejected: {}", ToString(type), bind.message));

    // A new or evicted bind exists only in memory until written and reloaded.
    // It stays cached when that fails and the next action retries the flush.
    if (bind.NeedsRewrite())
        m_reloadPending = true;

    std::string why;
    if (!EnsureGameCurrentLocked(&why))
        return Fail(fmt::format("{} not sent: {}", ToString(type), why));

    if (!SendSlot(bind.slot, &why))
        return Fail(fmt::format("{} failed: {}", ToString(type), why));

    return Ok(fmt::format("{} sent (bind no.{}, {})", ToString(type), bind.slot, ToString(bind.status)));
}

TriggerResult BindTrigger::ReloadGameConfig()
{
    std::lock_guard lock(m_mutex);

    if (!m_reloader.ReloadConfig())
        return Fail("the game did not reload keys.cfg");
    return Ok("keys.cfg reloaded");
}

BindStats BindTrigger::GetStats() const
{
    std::lock_guard lock(m_mutex);

    BindStats s;
    s.totalSlots        = m_allocator.Space().Size();
    s.usedSlots         = m_allocator.UsedCount();
    s.freeSlots         = s.totalSlots - s.usedSlots;
    s.craftingSlotsUsed = m_allocator.UsedCount(SlotKind::Crafting);
    s.staticSlotsUsed   = m_allocator.UsedCount(SlotKind::StaticCommand);
    s.dynamicSlotsUsed  = m_allocator.UsedCount(SlotKind::Dynamic);
    s.dynamicCapacity   = m_dynamic.Capacity();
    s.craftableItems    = m_allocator.RequestedCraftingItems();
    return s;
}

bool BindTrigger::RegenerateConfig(std::string* err)
{
    std::lock_guard lock(m_mutex);

    // The game may still hold an older file; reload before the next chord.
    m_reloadPending = true;
    return m_store.Write(m_allocator, m_dynamic, err);
}

bool BindTrigger::ClearDynamicBinds(std::string* err)
{
    std::lock_guard lock(m_mutex);

    const std::size_t dropped = m_dynamic.Size();
    m_dynamic.Clear();
    spdlog::info("BindTrigger: cleared {} dynamic binds", dropped);

    m_reloadPending = true;
    return m_store.Write(m_allocator, m_dynamic, err);
}

bool BindTrigger::ReloadDynamicBindsFromFile(std::string* err)
{
    std::lock_guard lock(m_mutex);
    return HydrateDynamicLocked(err);
}

bool BindTrigger::ImportDynamicBinds(const std::vector<DynamicBindEntry>& entries,
                                     std::size_t* restored,
                                     std::string* err)
{
    std::lock_guard lock(m_mutex);

    if (restored) *restored = 0;

    if (!m_dynamic.Empty())
    {
        if (err) *err = "dynamic binds already present";
        return false;
    }

    const std::size_t n = m_dynamic.Restore(entries);
    if (restored) *restored = n;

    m_reloadPending = true;
    return m_store.Write(m_allocator, m_dynamic, err);
}

} // namespace rustactions::binds
