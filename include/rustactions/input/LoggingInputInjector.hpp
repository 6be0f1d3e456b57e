#pragma once
// include/rustactions/input/LoggingInputInjector.hpp
//
// Dry-run injector: logs what would be sent and reports success. Used for
// --dry-run and on platforms without an injection backend.

#include "rustactions/input/InputInjector.hpp"

#include <cstddef>

namespace rustactions::input {

class LoggingInputInjector final : public IInputInjector {
public:
    [[nodiscard]] bool SendChord(std::span<const std::string_view> keys) override;
    [[nodiscard]] bool TypeText(std::string_view text) override;
    [[nodiscard]] bool PressKey(std::string_view key) override;

    [[nodiscard]] std::size_t EventCount() const noexcept { return m_events; }

private:
    std::size_t m_events = 0;
};

} // namespace rustactions::input
