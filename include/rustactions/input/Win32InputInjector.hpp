#pragma once
// include/rustactions/input/Win32InputInjector.hpp
//
// SendInput backend (Windows only). Every call first checks that the game
// window has keyboard focus; injection into another window is skipped.

#include "rustactions/input/InputInjector.hpp"
#include "rustactions/util/StringUtil.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace rustactions::input {

struct Win32InjectorOptions {
    std::string windowTitle = "Rust";           // whole foreground title, case-insensitive
    std::string processName = "RustClient.exe"; // image name, case-insensitive
    bool        requireFocus = true;

    std::chrono::milliseconds chordHold{100};
    std::chrono::milliseconds keyHold{50};
};

// A window whose title merely contains "Rust" (an editor, a terminal) is not
// the game.
[[nodiscard]] inline bool IsGameWindow(std::string_view title, std::string_view processName,
                                       const Win32InjectorOptions& options)
{
    if (!options.windowTitle.empty() && util::EqualsIgnoreCase(util::Trim(title), options.windowTitle))
        return true;
    return !options.processName.empty() && util::EqualsIgnoreCase(processName, options.processName);
}

class Win32InputInjector final : public IInputInjector {
public:
    explicit Win32InputInjector(Win32InjectorOptions options = {});

    [[nodiscard]] bool SendChord(std::span<const std::string_view> keys) override;
    [[nodiscard]] bool TypeText(std::string_view text) override;
    [[nodiscard]] bool PressKey(std::string_view key) override;

    // True when the foreground window belongs to the game (always true when
    // requireFocus is off).
    [[nodiscard]] bool GameHasFocus() const;

private:
    Win32InjectorOptions m_options;
};

} // namespace rustactions::input
