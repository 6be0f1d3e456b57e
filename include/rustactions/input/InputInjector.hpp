#pragma once
// include/rustactions/input/InputInjector.hpp
//
// Capabilities the bind trigger consumes: OS-level key injection and the
// game's "reload keys.cfg" action. Key names are keys.cfg tokens ("keypad7",
// "f13", "slash", ...); see input/KeyTokens.hpp.

#include <span>
#include <string_view>

namespace rustactions::input {

class IInputInjector {
public:
    virtual ~IInputInjector() = default;

    // Presses every key in order, holds, releases in reverse order.
    [[nodiscard]] virtual bool SendChord(std::span<const std::string_view> keys) = 0;

    // Types literal text (no key token parsing).
    [[nodiscard]] virtual bool TypeText(std::string_view text) = 0;

    [[nodiscard]] virtual bool PressKey(std::string_view key) = 0;
};

class IConfigReloader {
public:
    virtual ~IConfigReloader() = default;

    // Makes the game re-read keys.cfg. Blocks until the game had time to apply it.
    [[nodiscard]] virtual bool ReloadConfig() = 0;
};

} // namespace rustactions::input
