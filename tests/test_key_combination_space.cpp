// tests/test_key_combination_space.cpp

#include <doctest/doctest.h>

#include "rustactions/binds/KeyCombinationSpace.hpp"

#include <set>
#include <string>
#include <vector>

using rustactions::binds::Chord;
using rustactions::binds::KeyCombinationSpace;
using rustactions::binds::SlotIndex;

TEST_CASE("KeyCombinationSpace enumerates pairs of five keys in lexicographic order")
{
    const KeyCombinationSpace space({"a", "b", "c", "d", "e"}, 2);

    REQUIRE(space.Size() == 10);

    const std::vector<std::string> expected = {
        "a+b", "a+c", "a+d", "a+e", "b+c", "b+d", "b+e", "c+d", "c+e", "d+e",
    };
    for (SlotIndex i = 0; i < expected.size(); ++i)
    {
        INFO("slot ", i);
        CHECK(space.Render(i) == expected[i]);
    }

    const auto first = space.ChordAt(0);
    REQUIRE(first);
    CHECK(*first == Chord{"a", "b"});

    const auto last = space.ChordAt(9);
    REQUIRE(last);
    CHECK(*last == Chord{"d", "e"});
}

TEST_CASE("KeyCombinationSpace default layout has 33649 five-key chords")
{
    const KeyCombinationSpace space(rustactions::binds::DefaultKeyAlphabet(), rustactions::binds::kDefaultChordArity);

    REQUIRE(space.Size() == 33649);
    CHECK(space.Arity() == 5);
    CHECK(space.Render(0) == "keypaddivide+keypadmultiply+keypadminus+keypadplus+keypadperiod");
    CHECK(space.Render(1) == "keypaddivide+keypadmultiply+keypadminus+keypadplus+keypad1");
    CHECK(space.Render(33648) == "slash+period+comma+leftbracket+rightbracket");
}

TEST_CASE("KeyCombinationSpace chords are distinct and keep alphabet order")
{
    const KeyCombinationSpace space({"k0", "k1", "k2", "k3", "k4", "k5", "k6"}, 3);
    REQUIRE(space.Size() == 35);

    std::set<std::string> seen;
    for (SlotIndex i = 0; i < space.Size(); ++i)
    {
        const auto chord = space.ChordAt(i);
        REQUIRE(chord);
        REQUIRE(chord->size() == 3);
        CHECK((*chord)[0] < (*chord)[1]);
        CHECK((*chord)[1] < (*chord)[2]);
        CHECK(seen.insert(space.Render(i)).second);
    }
}

TEST_CASE("KeyCombinationSpace out-of-range slots have no chord")
{
    const KeyCombinationSpace space({"a", "b", "c"}, 2);

    CHECK(space.Contains(2));
    CHECK_FALSE(space.Contains(3));
    CHECK_FALSE(space.ChordAt(3).has_value());
    CHECK(space.Render(3).empty());
}

TEST_CASE("KeyCombinationSpace with arity larger than the alphabet is empty")
{
    const KeyCombinationSpace tooWide({"a", "b"}, 3);
    CHECK(tooWide.Size() == 0);
    CHECK_FALSE(tooWide.ChordAt(0).has_value());

    const KeyCombinationSpace zero({"a", "b"}, 0);
    CHECK(zero.Size() == 0);
}

TEST_CASE("KeyCombinationSpace::CountCombinations")
{
    CHECK(KeyCombinationSpace::CountCombinations(23, 5) == 33649);
    CHECK(KeyCombinationSpace::CountCombinations(5, 2) == 10);
    CHECK(KeyCombinationSpace::CountCombinations(6, 0) == 1);
    CHECK(KeyCombinationSpace::CountCombinations(6, 6) == 1);
    CHECK(KeyCombinationSpace::CountCombinations(3, 4) == 0);
}
