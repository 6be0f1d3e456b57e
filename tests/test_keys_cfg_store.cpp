// tests/test_keys_cfg_store.cpp
//
// keys.cfg rendering, parsing and the protected rewrite cycle.

#include <doctest/doctest.h>

#include "rustactions/binds/DynamicBindCache.hpp"
#include "rustactions/binds/KeysCfgStore.hpp"
#include "rustactions/binds/SlotAllocator.hpp"
#include "rustactions/io/AtomicFile.hpp"
#include "rustactions/io/FileProtection.hpp"

#include "test_support/SmallLayout.h"
#include "test_support/TempDir.h"

#include <array>
#include <string>
#include <vector>

using namespace rustactions;
using binds::DynamicBindEntry;
using binds::DynamicCommandType;
using binds::KeysCfgSnapshot;
using binds::KeysCfgStore;

namespace {

catalog::CatalogItem Wood()
{
    catalog::CatalogItem item;
    item.numericId       = 1001;
    item.name            = "Wood";
    item.ingredientCount = 1;
    return item;
}

constexpr std::array<binds::StaticCommand, 1> kKillOnly = {{{"kill", "kill"}}};

std::string ReadFile(const std::filesystem::path& p)
{
    std::string text;
    std::string err;
    REQUIRE_MESSAGE(io::read_all(p, text, &err), err);
    return text;
}

void WriteFile(const std::filesystem::path& p, const std::string& text)
{
    std::string err;
    REQUIRE_MESSAGE(io::write_atomic(p, text, &err), err);
}

} // namespace

TEST_CASE("KeysCfgStore renders every section in the documented layout")
{
    binds::SlotAllocator alloc(testing::SmallLayout(1));
    alloc.InitializeCrafting({Wood()});
    alloc.InitializeStaticCommands(kKillOnly);

    binds::DynamicBindCache dynamic(alloc);
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "gg").slot == 9);

    const std::string text = KeysCfgStore::Render({"bind w +forward"}, alloc, dynamic);

    const std::string expected =
        "#USER-SECTION-START\n"
        "bind w +forward\n"
        "#USER-SECTION-END\n"
        "\n"
        "#RUST-ACTIONS-START\n"
        "# Rust Actions Programmatically Managed Binds\n"
        "# Generated by RustActions\n"
        "\n"
        "# === CRAFTING BINDS ===\n"
        "# Craft/Cancel Wood (ID: 1001) - reserved bind no.0/1\n"
        "bind [a+b] craft.add 1001 1\n"
        "bind [a+c] craft.cancel 1001 1\n"
        "\n"
        "# Empty reserved binds for future crafting items\n"
        "# Reserved bind no.2\n"
        "bind [a+d] \"\"\n"
        "# Reserved bind no.3\n"
        "bind [a+e] \"\"\n"
        "# Reserved bind no.4\n"
        "bind [a+f] \"\"\n"
        "# Reserved bind no.5\n"
        "bind [b+c] \"\"\n"
        "\n"
        "\n"
        "# === API BINDS ===\n"
        "# API: kill - reserved bind no.6\n"
        "bind [b+d] kill\n"
        "\n"
        "# Empty reserved binds for future API commands\n"
        "# Reserved bind no.7\n"
        "bind [b+e] \"\"\n"
        "# Reserved bind no.8\n"
        "bind [b+f] \"\"\n"
        "\n"
        "\n"
        "# === CHAT/CONNECTION BINDS ===\n"
        "# Dynamic: chat_say - 'gg' - bind no.9\n"
        "bind [c+d] chat.say \"gg\"\n"
        "\n"
        "\n"
        "#RUST-ACTIONS-END\n";

    CHECK(text == expected);
}

TEST_CASE("KeysCfgStore writes placeholders for an empty dynamic range")
{
    binds::SlotAllocator alloc(testing::SmallLayout(2));
    binds::DynamicBindCache dynamic(alloc);

    const std::string text = KeysCfgStore::Render({}, alloc, dynamic);

    CHECK(text.find("# Empty reserved binds for dynamic chat/connection commands\n"
                    "# Reserved bind no.9\n"
                    "bind [c+d] \"\"\n"
                    "# Reserved bind no.10\n"
                    "bind [c+e] \"\"\n") != std::string::npos);
    CHECK(text.find("future dynamic") == std::string::npos);
}

TEST_CASE("KeysCfgStore parses what it renders")
{
    binds::SlotAllocator alloc(testing::SmallLayout(3));
    alloc.InitializeCrafting({Wood()});
    alloc.InitializeStaticCommands(kKillOnly);

    binds::DynamicBindCache dynamic(alloc);
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "first").ok());
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ClientConnect, "1.2.3.4:28015").ok());
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatTeamSay, "it's - 'quoted' - ok").ok());
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "first").ok()); // now most recent

    const std::vector<std::string> user = {"bind w +forward", "", "  bind x  noclip  "};
    const KeysCfgSnapshot snap = KeysCfgStore::Parse(KeysCfgStore::Render(user, alloc, dynamic));

    CHECK(snap.exists);
    CHECK(snap.hasMarkers);
    CHECK(snap.hasUserSection);
    CHECK(snap.userLines == user);
    CHECK(snap.dynamicEntries == dynamic.EntriesInOrder());
    CHECK(snap.malformedLines == 0);
    CHECK(snap.strayLines == 0);

    REQUIRE(snap.craftingBinds.size() == 1);
    CHECK(snap.craftingBinds[0] == binds::PersistedCraftingBind{1001, 0, 1});
}

TEST_CASE("KeysCfgStore treats a file without markers as player binds")
{
    const KeysCfgSnapshot snap = KeysCfgStore::Parse("bind w +forward\nbind s +backward\n");

    CHECK(snap.exists);
    CHECK_FALSE(snap.hasMarkers);
    CHECK(snap.userLines == std::vector<std::string>{"bind w +forward", "bind s +backward"});
    CHECK(snap.dynamicEntries.empty());
}

TEST_CASE("KeysCfgStore accepts CRLF line endings")
{
    const std::string text =
        "#USER-SECTION-START\r\n"
        "bind w +forward\r\n"
        "#USER-SECTION-END\r\n"
        "#RUST-ACTIONS-START\r\n"
        "# === CHAT/CONNECTION BINDS ===\r\n"
        "# Dynamic: chat_say - 'hello world' - bind no.4001\r\n"
        "bind [x+y] chat.say \"hello world\"\r\n"
        "#RUST-ACTIONS-END\r\n";

    const KeysCfgSnapshot snap = KeysCfgStore::Parse(text);

    CHECK(snap.userLines == std::vector<std::string>{"bind w +forward"});
    REQUIRE(snap.dynamicEntries.size() == 1);
    CHECK(snap.dynamicEntries[0] == DynamicBindEntry{DynamicCommandType::ChatSay, "hello world", 4001});
}

TEST_CASE("KeysCfgStore skips malformed dynamic comments and counts stray lines")
{
    const std::string text =
        "bind stray before\n"
        "#USER-SECTION-START\n"
        "#USER-SECTION-END\n"
        "#RUST-ACTIONS-START\n"
        "# === CHAT/CONNECTION BINDS ===\n"
        "# Dynamic: chat_say - 'ok' - bind no.4000\n"
        "# Dynamic: chat_shout - 'unknown type' - bind no.4001\n"
        "# Dynamic: chat_say - 'no slot' - bind no.\n"
        "# Dynamic: chat_say - 'bad slot' - bind no.12x\n"
        "# Dynamic: chat_say missing quotes\n"
        "#RUST-ACTIONS-END\n"
        "bind stray after\n";

    const KeysCfgSnapshot snap = KeysCfgStore::Parse(text);

    REQUIRE(snap.dynamicEntries.size() == 1);
    CHECK(snap.dynamicEntries[0].value == "ok");
    CHECK(snap.malformedLines == 4);
    CHECK(snap.strayLines == 2);
    CHECK(snap.hasUserSection);
    CHECK(snap.userLines.empty());
}

TEST_CASE("KeysCfgStore ignores dynamic comments outside the chat block")
{
    const std::string text =
        "#RUST-ACTIONS-START\n"
        "# === API BINDS ===\n"
        "# Dynamic: chat_say - 'misplaced' - bind no.4000\n"
        "#RUST-ACTIONS-END\n";

    const KeysCfgSnapshot snap = KeysCfgStore::Parse(text);
    CHECK(snap.dynamicEntries.empty());
    CHECK(snap.hasMarkers);
    CHECK_FALSE(snap.hasUserSection);
}

TEST_CASE("KeysCfgStore::Write creates a protected file with the default player binds")
{
    testing::ScopedTempDir dir("keyscfg");
    const auto path = dir / "keys.cfg";

    binds::SlotAllocator alloc(testing::SmallLayout());
    binds::DynamicBindCache dynamic(alloc);
    const KeysCfgStore store({path});

    std::string err;
    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);

    CHECK(store.IsProtected());
    CHECK(io::IsReadOnly(path));

    KeysCfgSnapshot snap;
    REQUIRE(store.Read(snap, &err));
    CHECK(snap.userLines == binds::DefaultUserSection());

    // Reading restores the protection it found.
    CHECK(store.IsProtected());
}

TEST_CASE("KeysCfgStore::Write keeps the player's section byte for byte")
{
    testing::ScopedTempDir dir("keyscfg");
    const auto path = dir / "keys.cfg";

    const std::string userBlock =
        "bind w +forward\n"
        "   bind   q   \"chat.say  hi\"   \n"
        "\t// comment with tab\n"
        "\n"
        "bind [leftshift+e] noclip\n";
    WriteFile(path, "#USER-SECTION-START\n" + userBlock + "#USER-SECTION-END\n");

    binds::SlotAllocator alloc(testing::SmallLayout(1));
    alloc.InitializeCrafting({Wood()});
    binds::DynamicBindCache dynamic(alloc);
    const KeysCfgStore store({path, /*readOnlyAfterWrite*/ false});

    std::string err;
    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);

    const std::string written = ReadFile(path);
    CHECK(written.rfind("#USER-SECTION-START\n" + userBlock + "#USER-SECTION-END\n", 0) == 0);
    CHECK_FALSE(store.IsProtected());

    KeysCfgSnapshot snap;
    REQUIRE(store.Read(snap, &err));
    REQUIRE(snap.craftingBinds.size() == 1);
    CHECK(snap.craftingBinds[0] == binds::PersistedCraftingBind{1001, 0, 1});
}

TEST_CASE("KeysCfgStore::Write keeps CRLF files CRLF")
{
    testing::ScopedTempDir dir("keyscfg");
    const auto path = dir / "keys.cfg";

    const std::string userBlock =
        "bind w +forward\r\n"
        "  bind q  \"chat.say hi\"  \r\n"
        "\r\n";
    WriteFile(path, "#USER-SECTION-START\r\n" + userBlock + "#USER-SECTION-END\r\n");

    binds::SlotAllocator alloc(testing::SmallLayout(1));
    alloc.InitializeCrafting({Wood()});
    binds::DynamicBindCache dynamic(alloc);
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "gg").ok());
    const KeysCfgStore store({path, /*readOnlyAfterWrite*/ false});

    std::string err;
    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);

    const std::string written = ReadFile(path);
    CHECK(written.rfind("#USER-SECTION-START\r\n" + userBlock + "#USER-SECTION-END\r\n", 0) == 0);
    CHECK(written.find("bind [c+d] chat.say \"gg\"\r\n") != std::string::npos);
    for (std::size_t pos = written.find('\n'); pos != std::string::npos; pos = written.find('\n', pos + 1))
    {
        CAPTURE(pos);
        REQUIRE(pos > 0);
        CHECK(written[pos - 1] == '\r');
    }

    // A second write reads CRLF back and produces the same bytes.
    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);
    CHECK(ReadFile(path) == written);
}

TEST_CASE("KeysCfgStore::Matches compares the file with the current bind state")
{
    binds::SlotAllocator alloc(testing::SmallLayout(2));
    alloc.InitializeCrafting({Wood()});
    alloc.InitializeStaticCommands(kKillOnly);
    binds::DynamicBindCache dynamic(alloc);
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "a").ok());
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "b").ok());

    const KeysCfgSnapshot snap = KeysCfgStore::Parse(KeysCfgStore::Render({}, alloc, dynamic));
    REQUIRE(snap.staticBinds.size() == 1);
    CHECK(snap.staticBinds[0] == binds::PersistedStaticBind{"kill", 6});
    CHECK(KeysCfgStore::Matches(snap, alloc, dynamic));

    SUBCASE("recency order alone does not count")
    {
        REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "a").ok());
        CHECK(KeysCfgStore::Matches(snap, alloc, dynamic));
    }

    SUBCASE("a new dynamic value does")
    {
        REQUIRE(dynamic.GetOrCreate(DynamicCommandType::ChatSay, "c").ok());
        CHECK_FALSE(KeysCfgStore::Matches(snap, alloc, dynamic));
    }

    SUBCASE("another item database does")
    {
        catalog::CatalogItem stone;
        stone.numericId       = 1002;
        stone.name            = "Stone";
        stone.ingredientCount = 1;
        alloc.InitializeCrafting({stone, Wood()});
        CHECK_FALSE(KeysCfgStore::Matches(snap, alloc, dynamic));
    }

    SUBCASE("another command table does")
    {
        constexpr std::array<binds::StaticCommand, 2> two = {{{"kill", "kill"}, {"autorun", "forward;sprint"}}};
        alloc.InitializeStaticCommands(two);
        CHECK_FALSE(KeysCfgStore::Matches(snap, alloc, dynamic));
    }

    SUBCASE("a missing file or one without markers never matches")
    {
        CHECK_FALSE(KeysCfgStore::Matches(KeysCfgSnapshot{}, alloc, dynamic));
        CHECK_FALSE(KeysCfgStore::Matches(KeysCfgStore::Parse("bind w +forward\n"), alloc, dynamic));
    }
}

TEST_CASE("KeysCfgStore::Write moves a foreign file into the player section")
{
    testing::ScopedTempDir dir("keyscfg");
    const auto path = dir / "keys.cfg";
    WriteFile(path, "bind w +forward\nbind s +backward\n");

    binds::SlotAllocator alloc(testing::SmallLayout());
    binds::DynamicBindCache dynamic(alloc);
    const KeysCfgStore store({path});

    std::string err;
    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);

    const std::string written = ReadFile(path);
    CHECK(written.rfind("#USER-SECTION-START\nbind w +forward\nbind s +backward\n#USER-SECTION-END\n", 0) == 0);
}

TEST_CASE("KeysCfgStore::Write keeps an empty player section empty")
{
    testing::ScopedTempDir dir("keyscfg");
    const auto path = dir / "keys.cfg";
    WriteFile(path, "#USER-SECTION-START\n#USER-SECTION-END\n");

    binds::SlotAllocator alloc(testing::SmallLayout());
    binds::DynamicBindCache dynamic(alloc);
    const KeysCfgStore store({path});

    std::string err;
    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);
    CHECK(ReadFile(path).rfind("#USER-SECTION-START\n#USER-SECTION-END\n", 0) == 0);
}

TEST_CASE("KeysCfgStore rewrites are idempotent")
{
    testing::ScopedTempDir dir("keyscfg");
    const auto path = dir / "keys.cfg";

    binds::SlotAllocator alloc(testing::SmallLayout());
    alloc.InitializeCrafting({Wood()});
    alloc.InitializeStaticCommands(kKillOnly);
    binds::DynamicBindCache dynamic(alloc);
    REQUIRE(dynamic.GetOrCreate(DynamicCommandType::RespawnSleepingBag, "123456").ok());

    const KeysCfgStore store({path});

    std::string err;
    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);
    const std::string first = ReadFile(path);

    REQUIRE_MESSAGE(store.Write(alloc, dynamic, &err), err);
    CHECK(ReadFile(path) == first);
    CHECK(store.IsProtected());
}

TEST_CASE("KeysCfgStore::Read of a missing file is an empty snapshot")
{
    testing::ScopedTempDir dir("keyscfg");
    const KeysCfgStore store({dir / "missing.cfg"});

    KeysCfgSnapshot snap;
    std::string err;
    CHECK(store.Read(snap, &err));
    CHECK_FALSE(snap.exists);
    CHECK(snap.userLines.empty());
    CHECK_FALSE(store.IsProtected());
}

TEST_CASE("KeysCfgStore::SetProtected toggles the read-only state")
{
    testing::ScopedTempDir dir("keyscfg");
    const auto path = dir / "keys.cfg";
    WriteFile(path, "bind w +forward\n");

    const KeysCfgStore store({path});
    std::string err;

    REQUIRE(store.SetProtected(true, &err));
    CHECK(store.IsProtected());
    REQUIRE(store.SetProtected(false, &err));
    CHECK_FALSE(store.IsProtected());

    const KeysCfgStore missing({dir / "nope.cfg"});
    CHECK_FALSE(missing.SetProtected(true, &err));
    CHECK_FALSE(err.empty());
}
