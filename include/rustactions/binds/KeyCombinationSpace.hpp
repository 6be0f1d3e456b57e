#pragma once
// include/rustactions/binds/KeyCombinationSpace.hpp
//
// Enumerates every K-subset of the key alphabet in lexicographic order of
// alphabet positions. The position of a chord in that enumeration is its
// SlotIndex; the mapping is stable for a fixed alphabet and arity.

#include "rustactions/binds/BindLayout.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustactions::binds {

// A chord as the ordered list of key tokens it is made of.
using Chord = std::vector<std::string_view>;

class KeyCombinationSpace {
public:
    KeyCombinationSpace() = default;
    KeyCombinationSpace(std::vector<std::string> alphabet, std::size_t arity);

    // Number of chords; zero when arity exceeds the alphabet size.
    [[nodiscard]] std::size_t Size() const noexcept { return m_count; }
    [[nodiscard]] bool Contains(SlotIndex slot) const noexcept { return slot < m_count; }

    [[nodiscard]] std::size_t Arity() const noexcept { return m_arity; }
    [[nodiscard]] const std::vector<std::string>& Alphabet() const noexcept { return m_alphabet; }

    // Tokens of the chord at `slot`, or nullopt when out of range.
    [[nodiscard]] std::optional<Chord> ChordAt(SlotIndex slot) const;

    // "keypaddivide+keypadmultiply+..." as written between the brackets of a
    // keys.cfg bind line. Empty string when out of range.
    [[nodiscard]] std::string Render(SlotIndex slot) const;

    // Binomial coefficient, saturating at SIZE_MAX.
    [[nodiscard]] static std::size_t CountCombinations(std::size_t n, std::size_t k) noexcept;

private:
    std::vector<std::string>  m_alphabet;
    std::size_t               m_arity = 0;
    std::size_t               m_count = 0;

    // m_count * m_arity alphabet positions, one chord after another.
    std::vector<std::uint8_t> m_positions;
};

} // namespace rustactions::binds
