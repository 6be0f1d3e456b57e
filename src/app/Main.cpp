// src/app/Main.cpp
//
// rustactions command-line front end. Wires the bind allocator, the keys.cfg
// store and the input backend, then runs one command.

#include "app/AppSettings.h"
#include "app/CommandLineArgs.h"
#include "logging/Log.h"

#include "rustactions/binds/BindTrigger.hpp"
#include "rustactions/binds/DynamicBindCache.hpp"
#include "rustactions/binds/KeysCfgStore.hpp"
#include "rustactions/binds/LegacyDynamicBinds.hpp"
#include "rustactions/binds/SlotAllocator.hpp"
#include "rustactions/binds/StaticCommands.hpp"
#include "rustactions/catalog/ItemCatalog.hpp"
#include "rustactions/input/GameConsoleReloader.hpp"
#include "rustactions/input/LoggingInputInjector.hpp"
#include "rustactions/util/StringUtil.hpp"

#if defined(_WIN32)
#include "rustactions/input/Win32InputInjector.hpp"
#endif

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace rustactions;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage   = 2;

int Usage(const std::string& message)
{
    std::fprintf(stderr, "rustactions: %s\n(run 'rustactions --help' for usage)\n", message.c_str());
    return kExitUsage;
}

int Report(const binds::TriggerResult& r)
{
    if (r.success)
    {
        std::printf("%s\n", r.message.c_str());
        return kExitOk;
    }
    std::fprintf(stderr, "error: %s\n", r.message.c_str());
    return kExitFailure;
}

int Report(bool ok, const std::string& success, const std::string& err)
{
    if (ok)
    {
        std::printf("%s\n", success.c_str());
        return kExitOk;
    }
    std::fprintf(stderr, "error: %s\n", err.c_str());
    return kExitFailure;
}

std::string JoinArguments(const std::vector<std::string>& args)
{
    std::string out;
    for (const auto& a : args)
    {
        if (!out.empty())
            out.push_back(' ');
        out += a;
    }
    return out;
}

std::optional<std::int64_t> ResolveItem(const catalog::ItemCatalog& catalog, std::string_view text)
{
    if (const auto id = util::ParseInteger<std::int64_t>(util::Trim(text)))
        return id;
    if (const auto item = catalog.FindByName(text))
        return item->numericId;
    return std::nullopt;
}

struct Runtime {
    explicit Runtime(const app::AppSettings& settings, bool dryRun)
        : dynamic(allocator)
        , store(binds::KeysCfgStore::Options{settings.keysCfg, settings.readOnlyAfterWrite, false})
    {
#if defined(_WIN32)
        if (!dryRun)
        {
            input::Win32InjectorOptions o;
            o.windowTitle  = settings.windowTitle;
            o.processName  = settings.processName;
            o.requireFocus = settings.requireFocus;
            o.chordHold    = std::chrono::milliseconds(settings.chordHoldMs);
            o.keyHold      = std::chrono::milliseconds(settings.keyHoldMs);
            injector = std::make_unique<input::Win32InputInjector>(o);
        }
#else
        if (!dryRun)
            spdlog::info("No input backend on this platform; key presses are logged only");
#endif
        if (!injector)
            injector = std::make_unique<input::LoggingInputInjector>();

        input::ConsoleReloadOptions ro;
        ro.toggleKey        = settings.consoleToggleKey;
        ro.reloadCommand    = settings.consoleReloadCommand;
        ro.consoleOpenDelay = std::chrono::milliseconds(settings.consoleOpenDelayMs);
        ro.typeDelay        = std::chrono::milliseconds(settings.typeDelayMs);
        ro.afterReloadDelay = std::chrono::milliseconds(settings.afterReloadDelayMs);
        reloader = std::make_unique<input::GameConsoleReloader>(*injector, ro);

        binds::TriggerOptions to;
        to.batchDelay = std::chrono::milliseconds(settings.batchDelayMs);
        trigger = std::make_unique<binds::BindTrigger>(allocator, dynamic, store, *injector, *reloader, to);
    }

    catalog::ItemCatalog                    catalog;
    binds::SlotAllocator                    allocator;
    binds::DynamicBindCache                 dynamic;
    binds::KeysCfgStore                     store;
    std::unique_ptr<input::IInputInjector>  injector;
    std::unique_ptr<input::IConfigReloader> reloader;
    std::unique_ptr<binds::BindTrigger>     trigger;
};

int RunStatus(Runtime& rt)
{
    const binds::BindStats s = rt.trigger->GetStats();

    std::error_code ec;
    const bool exists = std::filesystem::exists(rt.store.Path(), ec);

    std::printf("keys.cfg:         %s%s\n", rt.store.Path().string().c_str(), exists ? "" : " (missing)");
    if (exists)
        std::printf("read-only:        %s\n", rt.store.IsProtected() ? "yes" : "no");
    std::printf("slots:            %zu used / %zu total (%zu free)\n", s.usedSlots, s.totalSlots, s.freeSlots);
    std::printf("crafting:         %zu slots for %zu craftable items\n", s.craftingSlotsUsed, s.craftableItems);
    std::printf("commands:         %zu slots\n", s.staticSlotsUsed);
    std::printf("dynamic:          %zu / %zu slots\n", s.dynamicSlotsUsed, s.dynamicCapacity);

    if (!exists)
        return kExitOk;

    binds::KeysCfgSnapshot snap;
    std::string err;
    if (!rt.store.Read(snap, &err))
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        return kExitFailure;
    }

    const bool upToDate = binds::KeysCfgStore::Matches(snap, rt.allocator, rt.dynamic);
    std::printf("managed section:  %s\n",
                !snap.hasMarkers ? "absent (run 'generate')"
                : upToDate       ? "up to date"
                                 : "stale (item database changed; run 'generate')");
    if (snap.malformedLines != 0 || snap.strayLines != 0)
        std::printf("warnings:         %zu malformed, %zu stray lines\n", snap.malformedLines, snap.strayLines);
    return kExitOk;
}

int RunCrafting(Runtime& rt, const app::CommandLineArgs& args, bool cancel)
{
    if (args.arguments.empty() || args.arguments.size() > 2)
        return Usage(fmt::format("usage: {} <item id|name> [quantity]", args.command));

    const auto itemId = ResolveItem(rt.catalog, args.arguments[0]);
    if (!itemId)
        return Usage(fmt::format("unknown item '{}'", args.arguments[0]));

    std::size_t quantity = 1;
    if (args.arguments.size() == 2)
    {
        const auto q = util::ParseInteger<std::size_t>(util::Trim(args.arguments[1]));
        if (!q || *q == 0)
            return Usage(fmt::format("invalid quantity '{}'", args.arguments[1]));
        quantity = *q;
    }

    return Report(cancel ? rt.trigger->TriggerCancelCraft(*itemId, quantity)
                         : rt.trigger->TriggerCraft(*itemId, quantity));
}

int RunStack(Runtime& rt, const app::CommandLineArgs& args, bool cancel)
{
    if (args.arguments.size() > 1)
        return Usage(fmt::format("usage: {} [iterations]", args.command));

    std::size_t iterations = 100;
    if (!args.arguments.empty())
    {
        const auto n = util::ParseInteger<std::size_t>(util::Trim(args.arguments[0]));
        if (!n || *n == 0)
            return Usage(fmt::format("invalid iteration count '{}'", args.arguments[0]));
        iterations = *n;
    }

    return Report(rt.trigger->TriggerStackInventory(iterations, cancel));
}

int RunDynamic(Runtime& rt, const app::CommandLineArgs& args, binds::DynamicCommandType type)
{
    const std::string value = JoinArguments(args.arguments);
    if (util::Trim(value).empty())
        return Usage(fmt::format("usage: {} <value>", args.command));
    return Report(rt.trigger->TriggerDynamicCommand(type, value));
}

int RunTypeText(Runtime& rt, const app::CommandLineArgs& args)
{
    const std::string text = JoinArguments(args.arguments);
    if (text.empty())
        return Usage("usage: type <text>");

    if (!rt.injector->TypeText(text) || !rt.injector->PressKey("enter"))
    {
        std::fprintf(stderr, "error: text was not delivered (is the game focused?)\n");
        return kExitFailure;
    }
    std::printf("typed %zu characters\n", text.size());
    return kExitOk;
}

int RunCommand(const app::CommandLineArgs& args, const app::AppSettings& settings)
{
    const std::string& cmd = args.command;

    if (cmd == "commands")
    {
        for (const auto& c : binds::DefaultStaticCommands())
            std::printf("%-22.*s %.*s\n", static_cast<int>(c.name.size()), c.name.data(),
                        static_cast<int>(c.command.size()), c.command.data());
        return kExitOk;
    }

    Runtime rt(settings, args.dryRun);
    std::string err;

    if (cmd == "protect" || cmd == "unprotect")
    {
        const bool readOnly = cmd == "protect";
        return Report(rt.store.SetProtected(readOnly, &err),
                      fmt::format("{} is now {}", rt.store.Path().string(), readOnly ? "read-only" : "writable"), err);
    }

    // Every other command needs the full bind state.
    std::string catalogErr;
    if (!rt.catalog.LoadFromFile(settings.itemDatabase, &catalogErr))
        spdlog::warn("Continuing without crafting binds: {}", catalogErr);

    if (!rt.trigger->LoadState(rt.catalog, &err))
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        return kExitFailure;
    }

    if (binds::MigrateLegacyDynamicBinds(settings.legacyDynamicBinds, *rt.trigger, &err) ==
        binds::LegacyMigrationResult::Failed)
    {
        spdlog::warn("Legacy dynamic binds not migrated: {}", err);
    }

    if (cmd == "generate")
        return Report(rt.trigger->RegenerateConfig(&err), fmt::format("wrote {}", rt.store.Path().string()), err);
    if (cmd == "status")
        return RunStatus(rt);
    if (cmd == "clear-dynamic")
        return Report(rt.trigger->ClearDynamicBinds(&err), "dynamic binds cleared", err);
    if (cmd == "craft")
        return RunCrafting(rt, args, false);
    if (cmd == "cancel")
        return RunCrafting(rt, args, true);
    if (cmd == "stack")
        return RunStack(rt, args, false);
    if (cmd == "unstack")
        return RunStack(rt, args, true);
    if (cmd == "command")
    {
        if (args.arguments.size() != 1)
            return Usage("usage: command <name>");
        return Report(rt.trigger->TriggerStaticCommand(args.arguments[0]));
    }
    if (cmd == "say")
        return RunDynamic(rt, args, binds::DynamicCommandType::ChatSay);
    if (cmd == "teamsay")
        return RunDynamic(rt, args, binds::DynamicCommandType::ChatTeamSay);
    if (cmd == "connect")
        return RunDynamic(rt, args, binds::DynamicCommandType::ClientConnect);
    if (cmd == "respawn")
        return RunDynamic(rt, args, binds::DynamicCommandType::RespawnSleepingBag);
    if (cmd == "give")
        return RunDynamic(rt, args, binds::DynamicCommandType::InventoryGive);
    if (cmd == "type")
        return RunTypeText(rt, args);
    if (cmd == "reload")
        return Report(rt.trigger->ReloadGameConfig());

    return Usage(fmt::format("unknown command '{}'", cmd));
}

} // namespace

int main(int argc, char** argv)
{
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::printf("%s", app::BuildCommandLineHelpText().c_str());
        return kExitOk;
    }
    if (!args.unknown.empty())
        return Usage(fmt::format("unrecognized or incomplete option '{}'", args.unknown.front()));
    if (args.command.empty())
        return Usage("no command given");

    const std::filesystem::path dataDir = app::DefaultDataDir();
    const std::filesystem::path settingsPath = args.settingsPath.value_or(dataDir / "settings.json");

    app::AppSettings settings = app::DefaultAppSettings(dataDir);
    std::string settingsErr;
    const bool settingsOk = app::LoadAppSettings(settingsPath, settings, &settingsErr);

    if (args.keysCfgPath) settings.keysCfg = *args.keysCfgPath;
    if (args.itemsPath)   settings.itemDatabase = *args.itemsPath;
    if (args.logLevel)    settings.logLevel = *args.logLevel;

    const auto level = logging::ParseLevel(settings.logLevel);
    if (!level)
        return Usage(fmt::format("invalid log level '{}'", settings.logLevel));

    logging::LogOptions logOptions;
    logOptions.directory = settings.logDir;
    logOptions.level     = *level;
    logging::Init(logOptions);

    if (!settingsOk)
        spdlog::warn("Ignoring settings file: {}", settingsErr);

    int rc = kExitOk;
    if (args.command == "config")
    {
        if (args.writeDefaults)
        {
            std::string err;
            rc = Report(app::SaveAppSettings(settingsPath, settings, &err),
                        fmt::format("wrote {}", settingsPath.string()), err);
        }
        else
        {
            std::printf("%s", app::SerializeAppSettings(settings).c_str());
        }
    }
    else
    {
        try
        {
            rc = RunCommand(args, settings);
        }
        catch (const std::exception& e)
        {
            spdlog::critical("Unhandled error: {}", e.what());
            std::fprintf(stderr, "error: %s\n", e.what());
            rc = kExitFailure;
        }
    }

    logging::Shutdown();
    return rc;
}
