#pragma once
// include/rustactions/binds/DynamicBindCache.hpp
//
// Runtime binds for arbitrary strings (chat messages, server addresses, bag
// ids). Each distinct (type, value) pair owns one slot of the dynamic range;
// when the range is full the least recently used pair gives up its slot.

#include "rustactions/binds/BindLayout.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rustactions::binds {

class SlotAllocator;

enum class DynamicCommandType : std::uint8_t {
    ChatSay = 0,
    ChatTeamSay,
    ClientConnect,
    RespawnSleepingBag,
    InventoryGive,
};

// "chat_say", "chat_teamsay", "client_connect", "respawn_sleepingbag", "inventory_give".
[[nodiscard]] const char* ToString(DynamicCommandType type) noexcept;
[[nodiscard]] std::optional<DynamicCommandType> ParseDynamicCommandType(std::string_view text) noexcept;

// Console command bound for a value, e.g. chat.say "gg".
[[nodiscard]] std::string RenderDynamicCommand(DynamicCommandType type, std::string_view value);

// Rejects values that cannot be written into keys.cfg and parsed back
// unchanged: empty, multi-line, containing the "' - bind no." comment
// delimiter, or (for chat) containing a double quote.
[[nodiscard]] bool ValidateDynamicValue(DynamicCommandType type, std::string_view value, std::string* err = nullptr);

struct DynamicBindEntry {
    DynamicCommandType type = DynamicCommandType::ChatSay;
    std::string        value;
    SlotIndex          slot = 0;

    friend bool operator==(const DynamicBindEntry&, const DynamicBindEntry&) = default;
};

enum class DynamicBindStatus : std::uint8_t {
    Hit,          // existing bind, recency refreshed
    Created,      // new bind in a previously free slot
    Evicted,      // new bind in the slot of the least recently used entry
    InvalidValue,
    NoCapacity,   // the dynamic range holds no chords
};

[[nodiscard]] const char* ToString(DynamicBindStatus status) noexcept;

struct DynamicBindResult {
    DynamicBindStatus               status = DynamicBindStatus::NoCapacity;
    SlotIndex                       slot   = 0;
    std::optional<DynamicBindEntry> evicted;
    std::string                     message;

    [[nodiscard]] bool ok() const noexcept
    {
        return status == DynamicBindStatus::Hit || status == DynamicBindStatus::Created ||
               status == DynamicBindStatus::Evicted;
    }

    // keys.cfg must be rewritten and reloaded before the slot can be used.
    [[nodiscard]] bool NeedsRewrite() const noexcept
    {
        return status == DynamicBindStatus::Created || status == DynamicBindStatus::Evicted;
    }
};

class DynamicBindCache {
public:
    // `allocator` must outlive the cache; the destructor releases every slot.
    explicit DynamicBindCache(SlotAllocator& allocator);
    ~DynamicBindCache();

    DynamicBindCache(const DynamicBindCache&) = delete;
    DynamicBindCache& operator=(const DynamicBindCache&) = delete;

    [[nodiscard]] DynamicBindResult GetOrCreate(DynamicCommandType type, std::string_view value);

    // Lookup without touching recency.
    [[nodiscard]] std::optional<SlotIndex> Find(DynamicCommandType type, std::string_view value) const;

    // Re-populates the cache from persisted entries, least recently used first.
    // Entries with an out-of-range or already taken slot, a duplicate key or an
    // invalid value are skipped with a warning. Returns the number restored.
    std::size_t Restore(const std::vector<DynamicBindEntry>& entries);

    // Drops every entry and releases its slot.
    void Clear() noexcept;

    // Least recently used first; this is the order written to keys.cfg.
    [[nodiscard]] std::vector<DynamicBindEntry> EntriesInOrder() const;

    [[nodiscard]] std::size_t Size() const noexcept { return m_order.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_order.empty(); }
    [[nodiscard]] std::size_t Capacity() const noexcept { return m_range.size(); }
    [[nodiscard]] const SlotRange& Range() const noexcept { return m_range; }

private:
    using Order = std::list<DynamicBindEntry>;

    [[nodiscard]] static std::string MakeKey(DynamicCommandType type, std::string_view value);
    [[nodiscard]] std::optional<SlotIndex> NextUnusedSlot();

    SlotAllocator& m_allocator;
    SlotRange      m_range;

    Order                                               m_order;
    std::unordered_map<std::string, Order::iterator>    m_index;
    std::size_t                                         m_nextOffset = 0;
};

} // namespace rustactions::binds
