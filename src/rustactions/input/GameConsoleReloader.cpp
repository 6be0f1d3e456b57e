// src/rustactions/input/GameConsoleReloader.cpp
#include "rustactions/input/GameConsoleReloader.hpp"

#include <spdlog/spdlog.h>

#include <thread>
#include <utility>

namespace rustactions::input {

namespace {

void Pause(std::chrono::milliseconds d)
{
    if (d.count() > 0)
        std::this_thread::sleep_for(d);
}

} // namespace

GameConsoleReloader::GameConsoleReloader(IInputInjector& injector, ConsoleReloadOptions options)
    : m_injector(injector)
    , m_options(std::move(options))
{
}

bool GameConsoleReloader::ReloadConfig()
{
    if (!m_injector.PressKey(m_options.toggleKey))
    {
        spdlog::warn("GameConsoleReloader: cannot open the console ({})", m_options.toggleKey);
        return false;
    }
    Pause(m_options.consoleOpenDelay);

    if (!m_injector.TypeText(m_options.reloadCommand))
    {
        spdlog::warn("GameConsoleReloader: cannot type '{}'", m_options.reloadCommand);
        return false;
    }
    Pause(m_options.typeDelay);

    if (!m_injector.PressKey("enter"))
    {
        spdlog::warn("GameConsoleReloader: cannot submit '{}'", m_options.reloadCommand);
        return false;
    }
    Pause(m_options.afterReloadDelay);

    spdlog::info("GameConsoleReloader: sent '{}'", m_options.reloadCommand);
    return true;
}

} // namespace rustactions::input
