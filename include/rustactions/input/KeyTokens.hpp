#pragma once

// include/rustactions/input/KeyTokens.hpp
// ---------------------------------------
// Maps keys.cfg key tokens ("keypaddivide", "f13", "leftbracket", "a", ...) to
// Win32 virtual-key codes.
//
// Header-only and free of <windows.h> so the mapping is unit tested on every
// platform. Uses "kVK_*" names to avoid collisions with Win32 macros.

#include "rustactions/util/StringUtil.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace rustactions::input {

// --- Win32 virtual-key codes (subset) -----------------------------------------------------------
inline constexpr std::uint16_t kVK_BACK    = 0x08;
inline constexpr std::uint16_t kVK_TAB     = 0x09;
inline constexpr std::uint16_t kVK_RETURN  = 0x0D;
inline constexpr std::uint16_t kVK_ESCAPE  = 0x1B;
inline constexpr std::uint16_t kVK_SPACE   = 0x20;
inline constexpr std::uint16_t kVK_PRIOR   = 0x21; // Page Up
inline constexpr std::uint16_t kVK_NEXT    = 0x22; // Page Down
inline constexpr std::uint16_t kVK_END     = 0x23;
inline constexpr std::uint16_t kVK_HOME    = 0x24;
inline constexpr std::uint16_t kVK_LEFT    = 0x25;
inline constexpr std::uint16_t kVK_UP      = 0x26;
inline constexpr std::uint16_t kVK_RIGHT   = 0x27;
inline constexpr std::uint16_t kVK_DOWN    = 0x28;
inline constexpr std::uint16_t kVK_INSERT  = 0x2D;
inline constexpr std::uint16_t kVK_DELETE  = 0x2E;

inline constexpr std::uint16_t kVK_NUMPAD0  = 0x60;
inline constexpr std::uint16_t kVK_MULTIPLY = 0x6A;
inline constexpr std::uint16_t kVK_ADD      = 0x6B;
inline constexpr std::uint16_t kVK_SUBTRACT = 0x6D;
inline constexpr std::uint16_t kVK_DECIMAL  = 0x6E;
inline constexpr std::uint16_t kVK_DIVIDE   = 0x6F;

inline constexpr std::uint16_t kVK_F1  = 0x70;
inline constexpr std::uint16_t kVK_F24 = 0x87;

inline constexpr std::uint16_t kVK_LSHIFT   = 0xA0;
inline constexpr std::uint16_t kVK_RSHIFT   = 0xA1;
inline constexpr std::uint16_t kVK_LCONTROL = 0xA2;
inline constexpr std::uint16_t kVK_RCONTROL = 0xA3;
inline constexpr std::uint16_t kVK_LMENU    = 0xA4;
inline constexpr std::uint16_t kVK_RMENU    = 0xA5;

// US layout OEM keys.
inline constexpr std::uint16_t kVK_OEM_1      = 0xBA; // ;
inline constexpr std::uint16_t kVK_OEM_PLUS   = 0xBB; // =
inline constexpr std::uint16_t kVK_OEM_COMMA  = 0xBC;
inline constexpr std::uint16_t kVK_OEM_MINUS  = 0xBD;
inline constexpr std::uint16_t kVK_OEM_PERIOD = 0xBE;
inline constexpr std::uint16_t kVK_OEM_2      = 0xBF; // /
inline constexpr std::uint16_t kVK_OEM_3      = 0xC0; // `
inline constexpr std::uint16_t kVK_OEM_4      = 0xDB; // [
inline constexpr std::uint16_t kVK_OEM_5      = 0xDC; // backslash
inline constexpr std::uint16_t kVK_OEM_6      = 0xDD; // ]
inline constexpr std::uint16_t kVK_OEM_7      = 0xDE; // '

[[nodiscard]] inline constexpr std::uint16_t VK_F(unsigned n) noexcept
{
    return (n >= 1 && n <= 24) ? static_cast<std::uint16_t>(kVK_F1 + (n - 1)) : 0u;
}
static_assert(VK_F(13) == 0x7C);
static_assert(VK_F(24) == kVK_F24);

struct KeyCode {
    std::uint16_t vk = 0;
    // KEYEVENTF_EXTENDEDKEY: keypad divide / enter, right modifiers, the
    // navigation cluster.
    bool extended = false;

    friend constexpr bool operator==(const KeyCode&, const KeyCode&) = default;
};

// Parses one keys.cfg token (case-insensitive). Returns nullopt for tokens the
// injector cannot produce (mouse buttons, wheel).
[[nodiscard]]
inline std::optional<KeyCode> ParseKeyToken(std::string_view token)
{
    const std::string t = util::ToLowerCopy(util::Trim(token));
    if (t.empty())
        return std::nullopt;

    // Letters and digits map to their ASCII upper-case code.
    if (t.size() == 1)
    {
        const char c = t[0];
        if (c >= 'a' && c <= 'z')
            return KeyCode{static_cast<std::uint16_t>('A' + (c - 'a')), false};
        if (c >= '0' && c <= '9')
            return KeyCode{static_cast<std::uint16_t>(c), false};
    }

    // f1..f24
    if (t.size() >= 2 && t[0] == 'f')
    {
        if (const auto n = util::ParseInteger<unsigned>(std::string_view(t).substr(1)))
        {
            if (const std::uint16_t vk = VK_F(*n))
                return KeyCode{vk, false};
        }
        return std::nullopt;
    }

    // keypad0..keypad9 and keypad operators
    constexpr std::string_view kKeypad = "keypad";
    if (t.rfind(kKeypad, 0) == 0)
    {
        const std::string_view rest = std::string_view(t).substr(kKeypad.size());
        if (rest.size() == 1 && rest[0] >= '0' && rest[0] <= '9')
            return KeyCode{static_cast<std::uint16_t>(kVK_NUMPAD0 + (rest[0] - '0')), false};
        if (rest == "divide")   return KeyCode{kVK_DIVIDE, true};
        if (rest == "multiply") return KeyCode{kVK_MULTIPLY, false};
        if (rest == "minus")    return KeyCode{kVK_SUBTRACT, false};
        if (rest == "plus")     return KeyCode{kVK_ADD, false};
        if (rest == "period")   return KeyCode{kVK_DECIMAL, false};
        if (rest == "enter")    return KeyCode{kVK_RETURN, true};
        return std::nullopt;
    }

    struct Named {
        std::string_view name;
        KeyCode          code;
    };
    static constexpr Named kNamed[] = {
        {"slash", {kVK_OEM_2, false}},
        {"period", {kVK_OEM_PERIOD, false}},
        {"comma", {kVK_OEM_COMMA, false}},
        {"leftbracket", {kVK_OEM_4, false}},
        {"rightbracket", {kVK_OEM_6, false}},
        {"semicolon", {kVK_OEM_1, false}},
        {"quote", {kVK_OEM_7, false}},
        {"backquote", {kVK_OEM_3, false}},
        {"backslash", {kVK_OEM_5, false}},
        {"minus", {kVK_OEM_MINUS, false}},
        {"equals", {kVK_OEM_PLUS, false}},
        {"return", {kVK_RETURN, false}},
        {"enter", {kVK_RETURN, false}},
        {"tab", {kVK_TAB, false}},
        {"space", {kVK_SPACE, false}},
        {"escape", {kVK_ESCAPE, false}},
        {"backspace", {kVK_BACK, false}},
        {"leftshift", {kVK_LSHIFT, false}},
        {"rightshift", {kVK_RSHIFT, false}},
        {"leftcontrol", {kVK_LCONTROL, false}},
        {"rightcontrol", {kVK_RCONTROL, true}},
        {"leftalt", {kVK_LMENU, false}},
        {"rightalt", {kVK_RMENU, true}},
        {"insert", {kVK_INSERT, true}},
        {"delete", {kVK_DELETE, true}},
        {"home", {kVK_HOME, true}},
        {"end", {kVK_END, true}},
        {"pageup", {kVK_PRIOR, true}},
        {"pagedown", {kVK_NEXT, true}},
        {"uparrow", {kVK_UP, true}},
        {"downarrow", {kVK_DOWN, true}},
        {"leftarrow", {kVK_LEFT, true}},
        {"rightarrow", {kVK_RIGHT, true}},
    };

    for (const auto& n : kNamed)
    {
        if (n.name == t)
            return n.code;
    }
    return std::nullopt;
}

} // namespace rustactions::input
