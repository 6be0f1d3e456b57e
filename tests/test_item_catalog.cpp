// tests/test_item_catalog.cpp

#include <doctest/doctest.h>

#include "rustactions/catalog/ItemCatalog.hpp"

#include "test_support/TempDir.h"

#include <string>

using rustactions::catalog::ItemCatalog;

namespace {

constexpr const char* kDatabase = R"({
    "items": {
        "1545779598": { "numericId": 1545779598, "name": "Assault Rifle", "shortname": "rifle.ak",
                        "category": "Weapon", "ingredients": [{}, {}, {}], "userCraftable": false },
        "-151838493": { "numericId": "-151838493", "name": "Wood", "shortname": "wood", "category": "Resources" },
        "1390353317": { "name": "Wooden Door", "shortname": "door.hinged.wood", "amountToCreate": 1,
                        "ingredients": [{}], "userCraftable": true },
        "bogus":      { "name": "No Id" },
        "99":         "not an object",
        "-2072273936": { "shortname": "bandage", "ingredients": [{}], "amountToCreate": 2 }
    }
})";

} // namespace

TEST_CASE("ItemCatalog parses items in database order")
{
    ItemCatalog catalog;
    std::string err;
    REQUIRE_MESSAGE(catalog.LoadFromString(kDatabase, &err), err);

    const auto& items = catalog.Items();
    REQUIRE(items.size() == 4);
    CHECK(items[0].numericId == 1545779598);
    CHECK(items[0].category == "Weapon");
    CHECK(items[0].ingredientCount == 3);
    CHECK(items[1].numericId == -151838493); // string id
    CHECK(items[2].numericId == 1390353317); // id from the key
    CHECK(items[2].userCraftable);
    CHECK(items[3].name == "bandage");       // name falls back to shortname
    CHECK(items[3].amountToCreate == 2);
}

TEST_CASE("ItemCatalog craftable items are the ones with a recipe")
{
    ItemCatalog catalog;
    REQUIRE(catalog.LoadFromString(kDatabase));

    const auto craftable = catalog.GetCraftableItems();
    REQUIRE(craftable.size() == 3);
    CHECK(craftable[0].name == "Assault Rifle");
    CHECK(craftable[1].name == "Wooden Door");
    CHECK(craftable[2].name == "bandage");
}

TEST_CASE("ItemCatalog lookups")
{
    ItemCatalog catalog;
    REQUIRE(catalog.LoadFromString(kDatabase));

    REQUIRE(catalog.FindByNumericId(-151838493));
    CHECK(catalog.FindByNumericId(-151838493)->name == "Wood");
    CHECK_FALSE(catalog.FindByNumericId(7));

    REQUIRE(catalog.FindByName("  wooden DOOR "));
    CHECK(catalog.FindByName("wooden door")->numericId == 1390353317);
    REQUIRE(catalog.FindByName("RIFLE.AK"));
    CHECK(catalog.FindByName("rifle.ak")->name == "Assault Rifle");
    CHECK_FALSE(catalog.FindByName("door"));
    CHECK_FALSE(catalog.FindByName("   "));
}

TEST_CASE("ItemCatalog drops integers that do not fit")
{
    ItemCatalog catalog;
    REQUIRE(catalog.LoadFromString(R"({
        "items": {
            "huge":  { "numericId": 9223372036854775808, "name": "Huge", "ingredients": [{}] },
            "batch": { "numericId": 5, "name": "Batch", "amountToCreate": 4294967297, "ingredients": [{}] },
            "neg":   { "numericId": 6, "name": "Negative", "amountToCreate": -3000000000 }
        }
    })"));

    REQUIRE(catalog.Items().size() == 2);
    CHECK_FALSE(catalog.FindByName("Huge"));
    REQUIRE(catalog.FindByNumericId(5));
    CHECK(catalog.FindByNumericId(5)->amountToCreate == 1);
    REQUIRE(catalog.FindByNumericId(6));
    CHECK(catalog.FindByNumericId(6)->amountToCreate == 1);
}

TEST_CASE("ItemCatalog rejects malformed databases")
{
    ItemCatalog catalog;
    REQUIRE(catalog.LoadFromString(kDatabase));

    std::string err;
    CHECK_FALSE(catalog.LoadFromString("{ \"items\": ", &err));
    CHECK_FALSE(err.empty());
    CHECK(catalog.Items().empty());

    CHECK_FALSE(catalog.LoadFromString(R"({"items": []})", &err));
    CHECK_FALSE(catalog.LoadFromString(R"({"things": {}})", &err));
}

TEST_CASE("ItemCatalog reports a missing file")
{
    rustactions::testing::ScopedTempDir dir("catalog");
    ItemCatalog catalog;
    std::string err;
    CHECK_FALSE(catalog.LoadFromFile(dir / "itemDatabase.json", &err));
    CHECK_FALSE(err.empty());
    CHECK(catalog.GetCraftableItems().empty());
}
