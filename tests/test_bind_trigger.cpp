// tests/test_bind_trigger.cpp
//
// BindTrigger against a temp keys.cfg and recording input fakes.

#include <doctest/doctest.h>

#include "rustactions/binds/BindTrigger.hpp"
#include "rustactions/io/AtomicFile.hpp"

#include "test_support/RecordingInput.h"
#include "test_support/SmallLayout.h"
#include "test_support/TempDir.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace rustactions;
using binds::DynamicCommandType;
using testing::EventLog;

namespace {

constexpr std::array<binds::StaticCommand, 2> kCommands = {{
    {"kill", "kill"},
    {"autorun", "forward;sprint"},
}};

catalog::ItemCatalog WoodAndStone()
{
    catalog::CatalogItem wood;
    wood.numericId       = 1001;
    wood.name            = "Wood";
    wood.ingredientCount = 1;

    catalog::CatalogItem stone;
    stone.numericId       = 1002;
    stone.name            = "Stone";
    stone.ingredientCount = 2;

    catalog::CatalogItem raw;
    raw.numericId = 1003;
    raw.name      = "Raw Ore"; // no recipe

    return catalog::ItemCatalog({wood, stone, raw});
}

catalog::ItemCatalog StoneOnly()
{
    catalog::CatalogItem stone;
    stone.numericId       = 1002;
    stone.name            = "Stone";
    stone.ingredientCount = 2;
    return catalog::ItemCatalog({stone});
}

// One wired-up instance; the members mirror how the executable composes them.
struct Rig {
    explicit Rig(const std::filesystem::path& keysCfg, binds::SlotIndex dynamicCapacity = 3)
        : allocator(testing::SmallLayout(dynamicCapacity))
        , dynamic(allocator)
        , store({keysCfg})
        , injector(log)
        , reloader(log)
        , trigger(allocator, dynamic, store, injector, reloader, binds::TriggerOptions{std::chrono::milliseconds(0)})
    {
    }

    // LoadState with the small static table instead of the full default one.
    void LoadUnsynced(const catalog::ItemCatalog& catalog = WoodAndStone())
    {
        std::string err;
        REQUIRE_MESSAGE(trigger.LoadState(catalog, &err), err);
        allocator.InitializeStaticCommands(kCommands);
    }

    // Loaded, keys.cfg written and reloaded once; the log starts empty.
    void Load()
    {
        LoadUnsynced();
        std::string err;
        REQUIRE_MESSAGE(trigger.SyncConfig(&err), err);
        log.clear();
    }

    EventLog                  log;
    binds::SlotAllocator      allocator;
    binds::DynamicBindCache   dynamic;
    binds::KeysCfgStore       store;
    testing::RecordingInjector injector;
    testing::RecordingReloader reloader;
    binds::BindTrigger        trigger;
};

std::string ReadFile(const std::filesystem::path& p)
{
    std::string text;
    std::string err;
    REQUIRE_MESSAGE(io::read_all(p, text, &err), err);
    return text;
}

} // namespace

TEST_CASE("BindTrigger writes, reloads, then presses for a new dynamic bind")
{
    testing::ScopedTempDir dir("trigger");
    const auto path = dir / "keys.cfg";
    Rig rig(path);
    rig.Load();

    bool fileHadBindAtReload = false;
    rig.reloader.onReload = [&] {
        fileHadBindAtReload =
            ReadFile(path).find("# Dynamic: chat_say - 'hello' - bind no.9\nbind [c+d] chat.say \"hello\"\n") !=
            std::string::npos;
    };

    const auto r = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "hello");
    CHECK_MESSAGE(r.success, r.message);
    CHECK(fileHadBindAtReload);
    CHECK(rig.log == EventLog{"reload", "chord c+d"});

    SUBCASE("a repeated value presses without rewriting")
    {
        rig.log.clear();
        rig.reloader.onReload = nullptr;

        const auto again = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "hello");
        CHECK(again.success);
        CHECK(rig.log == EventLog{"chord c+d"});
    }
}

TEST_CASE("BindTrigger sends nothing when keys.cfg cannot be written")
{
    testing::ScopedTempDir dir("trigger");
    const auto path = dir / "keys.cfg";
    std::filesystem::create_directories(path); // a directory where the file should be

    Rig rig(path);
    rig.allocator.InitializeStaticCommands(kCommands);

    const auto r = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "hello");
    CHECK_FALSE(r.success);
    CHECK(r.message.find("keys.cfg could not be updated") != std::string::npos);
    CHECK(rig.log.empty());
}

TEST_CASE("BindTrigger sends nothing when the game does not reload")
{
    testing::ScopedTempDir dir("trigger");
    Rig rig(dir / "keys.cfg");
    rig.Load();
    rig.reloader.succeed = false;

    const auto r = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatTeamSay, "raid");
    CHECK_FALSE(r.success);
    CHECK(rig.log == EventLog{"failed reload"});
}

TEST_CASE("BindTrigger rejects invalid dynamic values before touching anything")
{
    testing::ScopedTempDir dir("trigger");
    const auto path = dir / "keys.cfg";
    Rig rig(path);
    rig.Load();

    const std::string before = ReadFile(path);

    const auto r = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "line\nbreak");
    CHECK_FALSE(r.success);
    CHECK(rig.log.empty());
    CHECK(ReadFile(path) == before);
}

TEST_CASE("BindTrigger retries an unflushed dynamic bind before pressing it")
{
    testing::ScopedTempDir dir("trigger");
    const auto path = dir / "keys.cfg";

    SUBCASE("after a failed write")
    {
        Rig rig(path);
        rig.Load();

        std::filesystem::remove(path);
        std::filesystem::create_directories(path);

        CHECK_FALSE(rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "hello").success);

        // The value is cached now, but the game has never seen its bind.
        const auto cachedOnly = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "hello");
        CHECK_FALSE(cachedOnly.success);
        CHECK(cachedOnly.message.find("keys.cfg could not be updated") != std::string::npos);
        CHECK(rig.log.empty());

        std::filesystem::remove(path);

        const auto r = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "hello");
        CHECK_MESSAGE(r.success, r.message);
        CHECK(rig.log == EventLog{"reload", "chord c+d"});
        CHECK(ReadFile(path).find("bind [c+d] chat.say \"hello\"") != std::string::npos);
    }

    SUBCASE("after a failed reload of an evicted slot")
    {
        Rig rig(path, 1);
        rig.Load();
        REQUIRE(rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "bye").success);
        rig.log.clear();

        rig.reloader.succeed = false;
        CHECK_FALSE(rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "yo").success);

        // c+d still means "bye" in the game until a reload succeeds.
        rig.reloader.succeed = true;
        const auto r = rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "yo");
        CHECK_MESSAGE(r.success, r.message);
        CHECK(rig.log == EventLog{"failed reload", "reload", "chord c+d"});
    }
}

TEST_CASE("BindTrigger brings keys.cfg up to date before the first press")
{
    testing::ScopedTempDir dir("trigger");
    const auto path = dir / "keys.cfg";

    SUBCASE("missing file is written and reloaded")
    {
        Rig rig(path);
        rig.LoadUnsynced();

        const auto r = rig.trigger.TriggerCraft(1001);
        CHECK_MESSAGE(r.success, r.message);
        CHECK(rig.log == EventLog{"reload", "chord a+b"});
        CHECK(std::filesystem::exists(path));

        rig.log.clear();
        CHECK(rig.trigger.TriggerCraft(1001).success);
        CHECK(rig.log == EventLog{"chord a+b"});
    }

    SUBCASE("file from another item database is rewritten")
    {
        {
            Rig old(path);
            old.LoadUnsynced(StoneOnly());
            std::string err;
            REQUIRE_MESSAGE(old.trigger.SyncConfig(&err), err);
        }

        Rig rig(path);
        rig.LoadUnsynced();
        CHECK(rig.trigger.TriggerStaticCommand("kill").success);
        CHECK(rig.log == EventLog{"reload", "chord b+d"});

        binds::KeysCfgSnapshot snap;
        std::string err;
        REQUIRE_MESSAGE(rig.store.Read(snap, &err), err);
        CHECK(binds::KeysCfgStore::Matches(snap, rig.allocator, rig.dynamic));
    }

    SUBCASE("a current file is left alone")
    {
        {
            Rig first(path);
            first.Load();
        }
        const std::string before = ReadFile(path);

        Rig rig(path);
        rig.LoadUnsynced();
        CHECK(rig.trigger.TriggerStaticCommand("autorun").success);
        CHECK(rig.log == EventLog{"chord b+e"});
        CHECK(ReadFile(path) == before);
    }

    SUBCASE("no press while the game has not reloaded")
    {
        Rig rig(path);
        rig.LoadUnsynced();
        rig.reloader.succeed = false;

        std::string err;
        CHECK_FALSE(rig.trigger.SyncConfig(&err));
        CHECK(err == "the game did not reload keys.cfg");

        const auto r = rig.trigger.TriggerCraft(1002);
        CHECK_FALSE(r.success);
        CHECK(r.completed == 0);
        CHECK(rig.log == EventLog{"failed reload", "failed reload"});

        rig.reloader.succeed = true;
        CHECK(rig.trigger.TriggerCraft(1002).success);
        CHECK(rig.log == EventLog{"failed reload", "failed reload", "reload", "chord a+d"});
    }
}

TEST_CASE("BindTrigger crafts in batches")
{
    testing::ScopedTempDir dir("trigger");
    Rig rig(dir / "keys.cfg");
    rig.Load();

    SUBCASE("every press is sent")
    {
        const auto r = rig.trigger.TriggerCraft(1002, 3);
        CHECK(r.success);
        CHECK(r.completed == 3);
        CHECK(r.requested == 3);
        // Stone is the second item: craft slot 2 (a+d), cancel slot 3 (a+e).
        CHECK(rig.log == EventLog{"chord a+d", "chord a+d", "chord a+d"});
    }

    SUBCASE("cancel uses the cancel slot")
    {
        const auto r = rig.trigger.TriggerCancelCraft(1001);
        CHECK(r.success);
        CHECK(rig.log == EventLog{"chord a+c"});
    }

    SUBCASE("a failed press stops the batch")
    {
        rig.injector.failAfter = 1;
        const auto r = rig.trigger.TriggerCraft(1001, 4);
        CHECK_FALSE(r.success);
        CHECK(r.completed == 1);
        CHECK(r.requested == 4);
        CHECK(rig.log == EventLog{"chord a+b", "failed chord a+b"});
    }

    SUBCASE("quantity zero is refused")
    {
        const auto r = rig.trigger.TriggerCraft(1001, 0);
        CHECK_FALSE(r.success);
        CHECK(rig.log.empty());
    }

    SUBCASE("items without a recipe have no bind")
    {
        const auto r = rig.trigger.TriggerCraft(1003, 1);
        CHECK_FALSE(r.success);
        CHECK(rig.log.empty());
    }
}

TEST_CASE("BindTrigger stacks the inventory in rounds")
{
    testing::ScopedTempDir dir("trigger");
    Rig rig(dir / "keys.cfg");
    rig.Load();

    constexpr std::array<std::int64_t, 2> items{1001, 1002};

    SUBCASE("each round presses every item once")
    {
        const auto r = rig.trigger.TriggerStackInventory(2, false, items);
        CHECK_MESSAGE(r.success, r.message);
        CHECK(r.completed == 2);
        CHECK(rig.log == EventLog{"chord a+b", "chord a+d", "chord a+b", "chord a+d"});
    }

    SUBCASE("unstack uses the cancel slots")
    {
        CHECK(rig.trigger.TriggerStackInventory(1, true, items).success);
        CHECK(rig.log == EventLog{"chord a+c", "chord a+e"});
    }

    SUBCASE("a failed press stops mid-round")
    {
        rig.injector.failAfter = 3;
        const auto r = rig.trigger.TriggerStackInventory(5, false, items);
        CHECK_FALSE(r.success);
        CHECK(r.completed == 1);
        CHECK(r.requested == 5);
        CHECK(rig.log == EventLog{"chord a+b", "chord a+d", "chord a+b", "failed chord a+d"});
    }

    SUBCASE("an item without a bind sends nothing")
    {
        const auto r = rig.trigger.TriggerStackInventory(3);
        CHECK_FALSE(r.success);
        CHECK(r.message.find("-97956382") != std::string::npos);
        CHECK(rig.log.empty());
    }

    SUBCASE("zero rounds is refused")
    {
        CHECK_FALSE(rig.trigger.TriggerStackInventory(0, false, items).success);
        CHECK(rig.log.empty());
    }
}

TEST_CASE("BindTrigger runs static commands")
{
    testing::ScopedTempDir dir("trigger");
    Rig rig(dir / "keys.cfg");
    rig.Load();

    CHECK(rig.trigger.TriggerStaticCommand("autorun").success);
    CHECK(rig.log == EventLog{"chord b+e"});

    CHECK_FALSE(rig.trigger.TriggerStaticCommand("fly").success);
    CHECK(rig.log.size() == 1);
}

TEST_CASE("BindTrigger restores dynamic binds from keys.cfg on load")
{
    testing::ScopedTempDir dir("trigger");
    const auto path = dir / "keys.cfg";

    {
        Rig first(path);
        first.Load();
        REQUIRE(first.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "one").success);
        REQUIRE(first.trigger.TriggerDynamicCommand(DynamicCommandType::ClientConnect, "1.2.3.4:28015").success);
        REQUIRE(first.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "one").success);
    }

    Rig second(path);
    second.Load();

    const binds::BindStats stats = second.trigger.GetStats();
    CHECK(stats.dynamicSlotsUsed == 2);

    // Known value: no rewrite, same chord as before.
    CHECK(second.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "one").success);
    CHECK(second.log == EventLog{"chord c+d"});

    // Order as of the last write; hits do not rewrite keys.cfg.
    const auto entries = second.dynamic.EntriesInOrder();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].value == "one");
    CHECK(entries[0].slot == 9);
    CHECK(entries[1].value == "1.2.3.4:28015");
    CHECK(entries[1].slot == 10);
}

TEST_CASE("BindTrigger reports slot usage")
{
    testing::ScopedTempDir dir("trigger");
    Rig rig(dir / "keys.cfg");
    rig.Load();
    REQUIRE(rig.trigger.TriggerDynamicCommand(DynamicCommandType::RespawnSleepingBag, "42").success);

    const binds::BindStats s = rig.trigger.GetStats();
    CHECK(s.totalSlots == 15);
    CHECK(s.craftingSlotsUsed == 4);
    CHECK(s.staticSlotsUsed == 2);
    CHECK(s.dynamicSlotsUsed == 1);
    CHECK(s.usedSlots == 7);
    CHECK(s.freeSlots == 8);
    CHECK(s.dynamicCapacity == 3);
    CHECK(s.craftableItems == 2);
}

TEST_CASE("BindTrigger maintenance operations")
{
    testing::ScopedTempDir dir("trigger");
    const auto path = dir / "keys.cfg";
    Rig rig(path);
    rig.Load();
    REQUIRE(rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "a").success);
    REQUIRE(rig.trigger.TriggerDynamicCommand(DynamicCommandType::ChatSay, "b").success);

    SUBCASE("ClearDynamicBinds empties the cache and the file section")
    {
        std::string err;
        REQUIRE_MESSAGE(rig.trigger.ClearDynamicBinds(&err), err);
        CHECK(rig.trigger.GetStats().dynamicSlotsUsed == 0);
        CHECK(ReadFile(path).find("# Dynamic:") == std::string::npos);
    }

    SUBCASE("ReloadDynamicBindsFromFile picks up external edits")
    {
        // Drop the in-memory state, then reload it from disk.
        rig.dynamic.Clear();
        std::string err;
        REQUIRE_MESSAGE(rig.trigger.ReloadDynamicBindsFromFile(&err), err);
        CHECK(rig.dynamic.Size() == 2);
    }

    SUBCASE("RegenerateConfig rewrites the same content")
    {
        const std::string before = ReadFile(path);
        std::string err;
        REQUIRE_MESSAGE(rig.trigger.RegenerateConfig(&err), err);
        CHECK(ReadFile(path) == before);
    }

    SUBCASE("ImportDynamicBinds requires an empty cache")
    {
        std::size_t restored = 99;
        std::string err;
        CHECK_FALSE(rig.trigger.ImportDynamicBinds({{DynamicCommandType::ChatSay, "c", 11}}, &restored, &err));
        CHECK(restored == 0);
        CHECK_FALSE(err.empty());
    }
}

TEST_CASE("BindTrigger::ReloadGameConfig forwards to the reloader")
{
    testing::ScopedTempDir dir("trigger");
    Rig rig(dir / "keys.cfg");

    CHECK(rig.trigger.ReloadGameConfig().success);
    rig.reloader.succeed = false;
    CHECK_FALSE(rig.trigger.ReloadGameConfig().success);
    CHECK(rig.log == EventLog{"reload", "failed reload"});
}
