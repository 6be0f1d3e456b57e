#pragma once
// include/rustactions/binds/BindLayout.hpp
//
// Slot space layout: the key alphabet, chord arity and the three reserved
// slot ranges (crafting, static command, dynamic).
//
// The defaults match the keys.cfg files already deployed in the wild. Changing
// the alphabet or the arity re-numbers every chord, so a keys.cfg written with
// different settings must be regenerated from scratch.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rustactions::binds {

using SlotIndex = std::uint32_t;

enum class SlotKind : std::uint8_t {
    Crafting = 0,
    StaticCommand,
    Dynamic,

    Count
};

[[nodiscard]] const char* ToString(SlotKind kind) noexcept;

// Half-open interval [begin, end) of slot indices.
struct SlotRange {
    SlotIndex begin = 0;
    SlotIndex end   = 0;

    [[nodiscard]] constexpr std::size_t size() const noexcept
    {
        return end > begin ? static_cast<std::size_t>(end - begin) : 0u;
    }

    [[nodiscard]] constexpr bool contains(SlotIndex slot) const noexcept
    {
        return slot >= begin && slot < end;
    }

    [[nodiscard]] constexpr bool overlaps(const SlotRange& other) const noexcept
    {
        return begin < other.end && other.begin < end;
    }
};

// 23 keys the game accepts in bracketed multi-key binds and that players almost
// never bind themselves.
inline const std::vector<std::string>& DefaultKeyAlphabet()
{
    static const std::vector<std::string> kAlphabet = {
        "keypaddivide", "keypadmultiply", "keypadminus", "keypadplus", "keypadperiod",
        "keypad1", "keypad2", "keypad3", "keypad4", "keypad5",
        "keypad6", "keypad7", "keypad8", "keypad9", "keypad0",
        "f13", "f14", "f15",
        "slash", "period", "comma", "leftbracket", "rightbracket",
    };
    return kAlphabet;
}

inline constexpr std::size_t kDefaultChordArity = 5;

inline constexpr SlotRange kDefaultCraftingRange{0, 3000};
inline constexpr SlotRange kDefaultStaticCommandRange{3000, 4000};
inline constexpr SlotRange kDefaultDynamicRange{4000, 5000};

static_assert(!kDefaultCraftingRange.overlaps(kDefaultStaticCommandRange));
static_assert(!kDefaultStaticCommandRange.overlaps(kDefaultDynamicRange));
static_assert(!kDefaultCraftingRange.overlaps(kDefaultDynamicRange));

struct BindLayout {
    std::vector<std::string> alphabet = DefaultKeyAlphabet();
    std::size_t              arity    = kDefaultChordArity;

    SlotRange crafting      = kDefaultCraftingRange;
    SlotRange staticCommand = kDefaultStaticCommandRange;
    SlotRange dynamic       = kDefaultDynamicRange;

    [[nodiscard]] const SlotRange& Range(SlotKind kind) const noexcept;

    // Ranges must be non-empty, ordered crafting < static < dynamic and
    // disjoint; the alphabet must not contain duplicates or empty tokens.
    [[nodiscard]] bool Validate(std::string* err = nullptr) const;
};

} // namespace rustactions::binds
