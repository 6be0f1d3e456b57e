// src/rustactions/binds/DynamicBindCache.cpp
#include "rustactions/binds/DynamicBindCache.hpp"

#include "rustactions/binds/SlotAllocator.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <iterator>
#include <utility>

namespace rustactions::binds {

namespace {

struct TypeName {
    DynamicCommandType type;
    std::string_view   name;
};

constexpr std::array<TypeName, 5> kTypeNames = {{
    {DynamicCommandType::ChatSay,            "chat_say"},
    {DynamicCommandType::ChatTeamSay,        "chat_teamsay"},
    {DynamicCommandType::ClientConnect,      "client_connect"},
    {DynamicCommandType::RespawnSleepingBag, "respawn_sleepingbag"},
    {DynamicCommandType::InventoryGive,      "inventory_give"},
}};

// Suffix of the "# Dynamic:" comment that follows the value.
constexpr std::string_view kValueTerminator = "' - bind no.";

bool IsChat(DynamicCommandType type) noexcept
{
    return type == DynamicCommandType::ChatSay || type == DynamicCommandType::ChatTeamSay;
}

} // namespace

const char* ToString(DynamicCommandType type) noexcept
{
    for (const auto& t : kTypeNames)
    {
        if (t.type == type)
            return t.name.data();
    }
    return "unknown";
}

std::optional<DynamicCommandType> ParseDynamicCommandType(std::string_view text) noexcept
{
    for (const auto& t : kTypeNames)
    {
        if (t.name == text)
            return t.type;
    }
    return std::nullopt;
}

std::string RenderDynamicCommand(DynamicCommandType type, std::string_view value)
{
    std::string out;
    switch (type)
    {
    case DynamicCommandType::ChatSay:
        out = "chat.say \"";
        out += value;
        out += '"';
        break;
    case DynamicCommandType::ChatTeamSay:
        out = "chat.teamsay \"";
        out += value;
        out += '"';
        break;
    case DynamicCommandType::ClientConnect:
        out = "disconnect;client.connect ";
        out += value;
        break;
    case DynamicCommandType::RespawnSleepingBag:
        out = "respawn_sleepingbag ";
        out += value;
        break;
    case DynamicCommandType::InventoryGive:
        // The value already is the full "inventory.give ..." command.
        out = value;
        break;
    }
    return out;
}

bool ValidateDynamicValue(DynamicCommandType type, std::string_view value, std::string* err)
{
    auto fail = [&](const char* why) {
        if (err) *err = why;
        return false;
    };

    if (value.find_first_not_of(" \t") == std::string_view::npos)
        return fail("value is empty");
    if (value.find_first_of("\r\n") != std::string_view::npos)
        return fail("value must be a single line");
    if (value.find(kValueTerminator) != std::string_view::npos)
        return fail("value must not contain \"' - bind no.\"");
    if (IsChat(type) && value.find('"') != std::string_view::npos)
        return fail("chat messages must not contain double quotes");

    if (err) err->clear();
    return true;
}

const char* ToString(DynamicBindStatus status) noexcept
{
    switch (status)
    {
    case DynamicBindStatus::Hit:          return "hit";
    case DynamicBindStatus::Created:      return "created";
    case DynamicBindStatus::Evicted:      return "evicted";
    case DynamicBindStatus::InvalidValue: return "invalid value";
    case DynamicBindStatus::NoCapacity:   return "no capacity";
    }
    return "unknown";
}

DynamicBindCache::DynamicBindCache(SlotAllocator& allocator)
    : m_allocator(allocator)
    , m_range(allocator.EffectiveRange(SlotKind::Dynamic))
{
    if (m_range.size() == 0)
        spdlog::error("DynamicBindCache: the dynamic range holds no chords; dynamic commands are unavailable");
}

DynamicBindCache::~DynamicBindCache()
{
    Clear();
}

std::string DynamicBindCache::MakeKey(DynamicCommandType type, std::string_view value)
{
    std::string key;
    key.reserve(value.size() + 2);
    key.push_back(static_cast<char>('0' + static_cast<int>(type)));
    key.push_back(':');
    key += value;
    return key;
}

std::optional<SlotIndex> DynamicBindCache::NextUnusedSlot()
{
    const std::size_t cap = m_range.size();
    for (std::size_t i = 0; i < cap; ++i)
    {
        const std::size_t offset = (m_nextOffset + i) % cap;
        const SlotIndex slot = m_range.begin + static_cast<SlotIndex>(offset);
        if (m_allocator.IsFree(SlotKind::Dynamic, slot))
        {
            m_nextOffset = (offset + 1) % cap;
            return slot;
        }
    }
    return std::nullopt;
}

DynamicBindResult DynamicBindCache::GetOrCreate(DynamicCommandType type, std::string_view value)
{
    DynamicBindResult result;

    std::string why;
    if (!ValidateDynamicValue(type, value, &why))
    {
        result.status  = DynamicBindStatus::InvalidValue;
        result.message = why;
        return result;
    }

    const std::string key = MakeKey(type, value);
    if (auto it = m_index.find(key); it != m_index.end())
    {
        m_order.splice(m_order.end(), m_order, it->second);
        result.status = DynamicBindStatus::Hit;
        result.slot   = it->second->slot;
        return result;
    }

    if (m_range.size() == 0)
    {
        result.status  = DynamicBindStatus::NoCapacity;
        result.message = "no key combinations are available for dynamic binds";
        spdlog::error("DynamicBindCache: cannot bind {} '{}': {}", ToString(type), value, result.message);
        return result;
    }

    if (m_order.size() < m_range.size())
    {
        const auto slot = NextUnusedSlot();
        if (!slot)
        {
            // Only reachable if something else reserved slots in the dynamic range.
            result.status  = DynamicBindStatus::NoCapacity;
            result.message = "every dynamic slot is reserved";
            spdlog::error("DynamicBindCache: cannot bind {} '{}': {}", ToString(type), value, result.message);
            return result;
        }

        m_allocator.Reserve(*slot);
        m_order.push_back(DynamicBindEntry{type, std::string(value), *slot});
        m_index.emplace(key, std::prev(m_order.end()));

        result.status = DynamicBindStatus::Created;
        result.slot   = *slot;
        spdlog::info("DynamicBindCache: {} '{}' -> bind no.{} ({}/{})",
                     ToString(type), value, *slot, m_order.size(), m_range.size());
        return result;
    }

    // Full: the head of the recency list is the least recently used entry.
    auto victim = m_order.begin();
    m_index.erase(MakeKey(victim->type, victim->value));
    result.evicted = *victim;

    victim->type  = type;
    victim->value = std::string(value);
    m_order.splice(m_order.end(), m_order, victim);
    m_index.emplace(key, victim);

    result.status = DynamicBindStatus::Evicted;
    result.slot   = victim->slot;
    spdlog::info("DynamicBindCache: {} '{}' -> bind no.{} (evicted {} '{}')",
                 ToString(type), value, victim->slot, ToString(result.evicted->type), result.evicted->value);
    return result;
}

std::optional<SlotIndex> DynamicBindCache::Find(DynamicCommandType type, std::string_view value) const
{
    const auto it = m_index.find(MakeKey(type, value));
    if (it == m_index.end())
        return std::nullopt;
    return it->second->slot;
}

std::size_t DynamicBindCache::Restore(const std::vector<DynamicBindEntry>& entries)
{
    std::size_t restored = 0;

    for (const auto& e : entries)
    {
        std::string why;
        if (!ValidateDynamicValue(e.type, e.value, &why))
        {
            spdlog::warn("DynamicBindCache: skipping persisted {} bind no.{}: {}", ToString(e.type), e.slot, why);
            continue;
        }

        if (!m_allocator.IsFree(SlotKind::Dynamic, e.slot))
        {
            spdlog::warn("DynamicBindCache: skipping persisted {} '{}': bind no.{} is outside the dynamic range or taken",
                         ToString(e.type), e.value, e.slot);
            continue;
        }

        std::string key = MakeKey(e.type, e.value);
        if (m_index.count(key) != 0)
        {
            spdlog::warn("DynamicBindCache: skipping duplicate persisted {} '{}' (bind no.{})",
                         ToString(e.type), e.value, e.slot);
            continue;
        }

        m_allocator.Reserve(e.slot);
        m_order.push_back(e);
        m_index.emplace(std::move(key), std::prev(m_order.end()));
        ++restored;
    }

    if (m_range.size() != 0)
        m_nextOffset = m_order.size() % m_range.size();

    if (restored != 0 || !entries.empty())
        spdlog::info("DynamicBindCache: restored {} of {} persisted dynamic binds", restored, entries.size());
    return restored;
}

void DynamicBindCache::Clear() noexcept
{
    for (const auto& e : m_order)
        m_allocator.Release(e.slot);

    m_order.clear();
    m_index.clear();
    m_nextOffset = 0;
}

std::vector<DynamicBindEntry> DynamicBindCache::EntriesInOrder() const
{
    return {m_order.begin(), m_order.end()};
}

} // namespace rustactions::binds
