// src/app/AppSettings.cpp
#include "app/AppSettings.h"

#include "rustactions/io/AtomicFile.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <system_error>
#include <utility>

#if defined(_WIN32)
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <windows.h>
    #include <shlobj.h> // SHGetKnownFolderPath
#endif

namespace rustactions::app {

namespace fs = std::filesystem;

namespace {

constexpr const char* kDataDirName = "Rust-Actions";
constexpr int kSettingsSchemaVersion = 1;

[[nodiscard]] int ClampDelay(std::int64_t v) noexcept
{
    return static_cast<int>(std::clamp<std::int64_t>(v, 0, kMaxDelayMs));
}

void ReadPath(const nlohmann::json& obj, const char* key, fs::path& dst)
{
    if (auto it = obj.find(key); it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
        dst = fs::path(it->get<std::string>());
}

void ReadString(const nlohmann::json& obj, const char* key, std::string& dst)
{
    if (auto it = obj.find(key); it != obj.end() && it->is_string())
        dst = it->get<std::string>();
}

void ReadBool(const nlohmann::json& obj, const char* key, bool& dst)
{
    if (auto it = obj.find(key); it != obj.end() && it->is_boolean())
        dst = it->get<bool>();
}

void ReadDelay(const nlohmann::json& obj, const char* key, int& dst)
{
    if (auto it = obj.find(key); it != obj.end() && it->is_number_integer())
        dst = ClampDelay(it->get<std::int64_t>());
}

[[nodiscard]] const nlohmann::json* Section(const nlohmann::json& j, const char* name)
{
    if (auto it = j.find(name); it != j.end() && it->is_object())
        return &*it;
    return nullptr;
}

} // namespace

fs::path DefaultDataDir()
{
#if defined(_WIN32)
    PWSTR p = nullptr;
    if (SUCCEEDED(::SHGetKnownFolderPath(FOLDERID_Documents, 0, nullptr, &p)))
    {
        fs::path base(p);
        ::CoTaskMemFree(p);
        return base / kDataDirName;
    }
    ::CoTaskMemFree(p);
    if (const char* profile = std::getenv("USERPROFILE"); profile && *profile)
        return fs::path(profile) / "Documents" / kDataDirName;
#else
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / "Documents" / kDataDirName;
#endif
    std::error_code ec;
    return fs::current_path(ec) / kDataDirName;
}

fs::path DefaultKeysCfgPath(const fs::path& dataDir)
{
#if defined(_WIN32)
    (void)dataDir;
    return fs::path(R"(C:\Program Files (x86)\Steam\steamapps\common\Rust\cfg\keys.cfg)");
#else
    return dataDir / "keys.cfg";
#endif
}

AppSettings DefaultAppSettings(const fs::path& dataDir)
{
    AppSettings s;
    s.keysCfg            = DefaultKeysCfgPath(dataDir);
    s.itemDatabase       = dataDir / "itemDatabase.json";
    s.legacyDynamicBinds = dataDir / "dynamic_binds.json";
    s.logDir             = dataDir / "logs";
    return s;
}

bool ParseAppSettings(std::string_view text, AppSettings& inOut, std::string* err)
{
    const nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        if (err) *err = "not a JSON object";
        return false;
    }

    AppSettings tmp = inOut;

    if (const auto* paths = Section(j, "paths"))
    {
        ReadPath(*paths, "keysCfg", tmp.keysCfg);
        ReadPath(*paths, "itemDatabase", tmp.itemDatabase);
        ReadPath(*paths, "legacyDynamicBinds", tmp.legacyDynamicBinds);
        ReadPath(*paths, "logDir", tmp.logDir);
    }

    if (const auto* protection = Section(j, "protection"))
        ReadBool(*protection, "readOnlyAfterWrite", tmp.readOnlyAfterWrite);

    if (const auto* game = Section(j, "game"))
    {
        ReadString(*game, "windowTitle", tmp.windowTitle);
        ReadString(*game, "processName", tmp.processName);
        ReadBool(*game, "requireFocus", tmp.requireFocus);
    }

    if (const auto* timing = Section(j, "timing"))
    {
        ReadDelay(*timing, "chordHoldMs", tmp.chordHoldMs);
        ReadDelay(*timing, "keyHoldMs", tmp.keyHoldMs);
        ReadDelay(*timing, "consoleOpenDelayMs", tmp.consoleOpenDelayMs);
        ReadDelay(*timing, "typeDelayMs", tmp.typeDelayMs);
        ReadDelay(*timing, "afterReloadDelayMs", tmp.afterReloadDelayMs);
        ReadDelay(*timing, "batchDelayMs", tmp.batchDelayMs);
    }

    if (const auto* console = Section(j, "console"))
    {
        ReadString(*console, "toggleKey", tmp.consoleToggleKey);
        ReadString(*console, "reloadCommand", tmp.consoleReloadCommand);
    }

    if (const auto* logging = Section(j, "logging"))
        ReadString(*logging, "level", tmp.logLevel);

    inOut = std::move(tmp);
    if (err) err->clear();
    return true;
}

bool LoadAppSettings(const fs::path& path, AppSettings& inOut, std::string* err)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        spdlog::debug("AppSettings: {} not found; using defaults", path.string());
        return true;
    }

    std::string text;
    std::string why;
    if (!io::read_all(path, text, &why))
    {
        if (err) *err = "cannot read " + path.string() + ": " + why;
        return false;
    }

    if (!ParseAppSettings(text, inOut, &why))
    {
        if (err) *err = path.string() + ": " + why;
        return false;
    }
    return true;
}

std::string SerializeAppSettings(const AppSettings& s)
{
    nlohmann::ordered_json j;
    j["version"] = kSettingsSchemaVersion;
    j["paths"] = {
        {"keysCfg", s.keysCfg.string()},
        {"itemDatabase", s.itemDatabase.string()},
        {"legacyDynamicBinds", s.legacyDynamicBinds.string()},
        {"logDir", s.logDir.string()},
    };
    j["protection"] = {
        {"readOnlyAfterWrite", s.readOnlyAfterWrite},
    };
    j["game"] = {
        {"windowTitle", s.windowTitle},
        {"processName", s.processName},
        {"requireFocus", s.requireFocus},
    };
    j["timing"] = {
        {"chordHoldMs", s.chordHoldMs},
        {"keyHoldMs", s.keyHoldMs},
        {"consoleOpenDelayMs", s.consoleOpenDelayMs},
        {"typeDelayMs", s.typeDelayMs},
        {"afterReloadDelayMs", s.afterReloadDelayMs},
        {"batchDelayMs", s.batchDelayMs},
    };
    j["console"] = {
        {"toggleKey", s.consoleToggleKey},
        {"reloadCommand", s.consoleReloadCommand},
    };
    j["logging"] = {
        {"level", s.logLevel},
    };
    return j.dump(2) + "\n";
}

bool SaveAppSettings(const fs::path& path, const AppSettings& settings, std::string* err)
{
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);

    if (!io::write_atomic(path, SerializeAppSettings(settings), err, /*make_backup*/ true))
        return false;

    spdlog::info("AppSettings: wrote {}", path.string());
    return true;
}

} // namespace rustactions::app
