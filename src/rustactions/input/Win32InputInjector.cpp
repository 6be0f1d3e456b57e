// src/rustactions/input/Win32InputInjector.cpp
#include "rustactions/input/Win32InputInjector.hpp"

#include "rustactions/input/KeyTokens.hpp"
#include "rustactions/util/StringUtil.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iterator>
#include <thread>
#include <utility>
#include <vector>

namespace rustactions::input {

namespace {

INPUT MakeKey(const KeyCode& code, bool up) noexcept
{
    INPUT in{};
    in.type       = INPUT_KEYBOARD;
    in.ki.wVk     = code.vk;
    in.ki.wScan   = static_cast<WORD>(::MapVirtualKeyW(code.vk, MAPVK_VK_TO_VSC));
    in.ki.dwFlags = (up ? KEYEVENTF_KEYUP : 0u) | (code.extended ? KEYEVENTF_EXTENDEDKEY : 0u);
    return in;
}

bool Send(std::vector<INPUT>& inputs)
{
    if (inputs.empty())
        return true;

    const UINT sent = ::SendInput(static_cast<UINT>(inputs.size()), inputs.data(), sizeof(INPUT));
    if (sent != inputs.size())
    {
        spdlog::warn("Win32InputInjector: SendInput delivered {}/{} events (error {})",
                     sent, inputs.size(), ::GetLastError());
        return false;
    }
    return true;
}

std::wstring Widen(std::string_view s)
{
    if (s.empty())
        return {};
    const int n = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    if (n <= 0)
        return {};
    std::wstring out(static_cast<std::size_t>(n), L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
    return out;
}

std::string Narrow(std::wstring_view s)
{
    if (s.empty())
        return {};
    const int n = ::WideCharToMultiByte(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0, nullptr, nullptr);
    if (n <= 0)
        return {};
    std::string out(static_cast<std::size_t>(n), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n, nullptr, nullptr);
    return out;
}

std::string ForegroundTitle(HWND hwnd)
{
    wchar_t title[512] = {};
    const int n = ::GetWindowTextW(hwnd, title, static_cast<int>(std::size(title)));
    return n > 0 ? Narrow(std::wstring_view(title, static_cast<std::size_t>(n))) : std::string{};
}

std::string ForegroundProcessName(HWND hwnd)
{
    DWORD pid = 0;
    ::GetWindowThreadProcessId(hwnd, &pid);
    if (pid == 0)
        return {};

    HANDLE process = ::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!process)
        return {};

    wchar_t path[MAX_PATH] = {};
    DWORD size = MAX_PATH;
    const BOOL ok = ::QueryFullProcessImageNameW(process, 0, path, &size);
    ::CloseHandle(process);
    if (!ok)
        return {};

    return Narrow(std::filesystem::path(std::wstring_view(path, size)).filename().wstring());
}

} // namespace

Win32InputInjector::Win32InputInjector(Win32InjectorOptions options)
    : m_options(std::move(options))
{
}

bool Win32InputInjector::GameHasFocus() const
{
    if (!m_options.requireFocus)
        return true;

    HWND hwnd = ::GetForegroundWindow();
    if (!hwnd)
        return false;

    const std::string title = ForegroundTitle(hwnd);
    const std::string exe   = ForegroundProcessName(hwnd);
    if (IsGameWindow(title, exe, m_options))
        return true;

    spdlog::warn("Win32InputInjector: foreground window '{}' ({}) is not the game; input skipped", title, exe);
    return false;
}

bool Win32InputInjector::SendChord(std::span<const std::string_view> keys)
{
    std::vector<KeyCode> codes;
    codes.reserve(keys.size());
    for (const std::string_view key : keys)
    {
        const auto code = ParseKeyToken(key);
        if (!code)
        {
            spdlog::error("Win32InputInjector: no virtual key for '{}'", key);
            return false;
        }
        codes.push_back(*code);
    }

    if (!GameHasFocus())
        return false;

    std::vector<INPUT> down;
    down.reserve(codes.size());
    for (const auto& c : codes)
        down.push_back(MakeKey(c, false));

    std::vector<INPUT> up;
    up.reserve(codes.size());
    for (auto it = codes.rbegin(); it != codes.rend(); ++it)
        up.push_back(MakeKey(*it, true));

    const bool pressed = Send(down);
    std::this_thread::sleep_for(m_options.chordHold);
    // Release whatever went down even when the press was partial.
    const bool released = Send(up);
    return pressed && released;
}

bool Win32InputInjector::PressKey(std::string_view key)
{
    const auto code = ParseKeyToken(key);
    if (!code)
    {
        spdlog::error("Win32InputInjector: no virtual key for '{}'", key);
        return false;
    }

    if (!GameHasFocus())
        return false;

    std::vector<INPUT> down{MakeKey(*code, false)};
    std::vector<INPUT> up{MakeKey(*code, true)};

    const bool pressed = Send(down);
    std::this_thread::sleep_for(m_options.keyHold);
    const bool released = Send(up);
    return pressed && released;
}

bool Win32InputInjector::TypeText(std::string_view text)
{
    if (!GameHasFocus())
        return false;

    const std::wstring wide = Widen(text);

    std::vector<INPUT> inputs;
    inputs.reserve(wide.size() * 2);
    for (const wchar_t ch : wide)
    {
        INPUT in{};
        in.type       = INPUT_KEYBOARD;
        in.ki.wScan   = static_cast<WORD>(ch);
        in.ki.dwFlags = KEYEVENTF_UNICODE;
        inputs.push_back(in);

        in.ki.dwFlags = KEYEVENTF_UNICODE | KEYEVENTF_KEYUP;
        inputs.push_back(in);
    }
    return Send(inputs);
}

} // namespace rustactions::input
