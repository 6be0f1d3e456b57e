#pragma once
// src/app/AppSettings.h
//
// Persisted settings for the rustactions executable.
//
// Stored in:
//   <Documents>/Rust-Actions/settings.json   (or --settings <path>)
//
// Every key is optional; a missing file means defaults and a key with the
// wrong type keeps its default.

#include <filesystem>
#include <string>
#include <string_view>

namespace rustactions::app {

// Timing values are clamped to this range when loaded.
inline constexpr int kMaxDelayMs = 10'000;

struct AppSettings
{
    // paths
    std::filesystem::path keysCfg;
    std::filesystem::path itemDatabase;
    std::filesystem::path legacyDynamicBinds;
    std::filesystem::path logDir;

    // protection
    bool readOnlyAfterWrite = true;

    // game window matching for the focus check
    std::string windowTitle  = "Rust";
    std::string processName  = "RustClient.exe";
    bool        requireFocus = true;

    // timing (milliseconds)
    int chordHoldMs         = 100;
    int keyHoldMs           = 50;
    int consoleOpenDelayMs  = 200;
    int typeDelayMs         = 100;
    int afterReloadDelayMs  = 200;
    int batchDelayMs        = 10;

    // console
    std::string consoleToggleKey     = "f1";
    std::string consoleReloadCommand = "exec keys.cfg";

    // logging
    std::string logLevel = "info";
};

// <Documents>/Rust-Actions. Known Folder on Windows, $HOME/Documents elsewhere
// (current directory when neither is available). Not created here.
[[nodiscard]] std::filesystem::path DefaultDataDir();

// Defaults with every path resolved against `dataDir`.
[[nodiscard]] AppSettings DefaultAppSettings(const std::filesystem::path& dataDir);

// Default keys.cfg location: the Steam install on Windows, <dataDir>/keys.cfg elsewhere.
[[nodiscard]] std::filesystem::path DefaultKeysCfgPath(const std::filesystem::path& dataDir);

// Applies the values found in `path` on top of `inOut`.
// A missing file is not an error (returns true, `inOut` unchanged).
// A corrupt file returns false and leaves `inOut` unchanged.
[[nodiscard]] bool LoadAppSettings(const std::filesystem::path& path, AppSettings& inOut, std::string* err = nullptr);

// Same, from text (used by the loader and the tests).
[[nodiscard]] bool ParseAppSettings(std::string_view text, AppSettings& inOut, std::string* err = nullptr);

[[nodiscard]] std::string SerializeAppSettings(const AppSettings& settings);

// Atomic write; creates the parent directory.
[[nodiscard]] bool SaveAppSettings(const std::filesystem::path& path, const AppSettings& settings, std::string* err = nullptr);

} // namespace rustactions::app
