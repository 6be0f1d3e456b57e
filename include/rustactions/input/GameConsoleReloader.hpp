#pragma once
// include/rustactions/input/GameConsoleReloader.hpp
//
// Reloads keys.cfg through the in-game console: open it, type the exec
// command, submit, and give the game time to apply the binds.

#include "rustactions/input/InputInjector.hpp"

#include <chrono>
#include <string>

namespace rustactions::input {

struct ConsoleReloadOptions {
    std::string toggleKey     = "f1";
    std::string reloadCommand = "exec keys.cfg";

    std::chrono::milliseconds consoleOpenDelay{200};
    std::chrono::milliseconds typeDelay{100};
    std::chrono::milliseconds afterReloadDelay{200};
};

class GameConsoleReloader final : public IConfigReloader {
public:
    explicit GameConsoleReloader(IInputInjector& injector, ConsoleReloadOptions options = {});

    [[nodiscard]] bool ReloadConfig() override;

    [[nodiscard]] const ConsoleReloadOptions& Options() const noexcept { return m_options; }

private:
    IInputInjector&      m_injector;
    ConsoleReloadOptions m_options;
};

} // namespace rustactions::input
