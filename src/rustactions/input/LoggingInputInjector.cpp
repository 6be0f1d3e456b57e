// src/rustactions/input/LoggingInputInjector.cpp
#include "rustactions/input/LoggingInputInjector.hpp"

#include <spdlog/spdlog.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rustactions::input {

bool LoggingInputInjector::SendChord(std::span<const std::string_view> keys)
{
    ++m_events;
    spdlog::info("[dry-run] chord {}", fmt::join(keys, "+"));
    return true;
}

bool LoggingInputInjector::TypeText(std::string_view text)
{
    ++m_events;
    spdlog::info("[dry-run] type \"{}\"", text);
    return true;
}

bool LoggingInputInjector::PressKey(std::string_view key)
{
    ++m_events;
    spdlog::info("[dry-run] key {}", key);
    return true;
}

} // namespace rustactions::input
