// src/rustactions/binds/KeyCombinationSpace.cpp
#include "rustactions/binds/KeyCombinationSpace.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <numeric>
#include <utility>

namespace rustactions::binds {

namespace {

// Hard ceiling on the number of materialized chords (the default layout needs 33649).
constexpr std::size_t kMaxChords = std::size_t{1} << 22;

} // namespace

std::size_t KeyCombinationSpace::CountCombinations(std::size_t n, std::size_t k) noexcept
{
    if (k > n)
        return 0;

    k = std::min(k, n - k);

    std::size_t result = 1;
    for (std::size_t i = 1; i <= k; ++i)
    {
        // result * (n - k + i) / i stays integral at every step.
        const std::size_t factor = n - k + i;
        if (result > (std::numeric_limits<std::size_t>::max)() / factor)
            return (std::numeric_limits<std::size_t>::max)();
        result = result * factor / i;
    }
    return result;
}

KeyCombinationSpace::KeyCombinationSpace(std::vector<std::string> alphabet, std::size_t arity)
    : m_alphabet(std::move(alphabet))
    , m_arity(arity)
{
    const std::size_t n = m_alphabet.size();

    if (m_arity == 0 || m_arity > n)
    {
        spdlog::error("KeyCombinationSpace: cannot build {}-key chords from {} keys; no binds can be allocated",
                      m_arity, n);
        return;
    }

    if (n > (std::numeric_limits<std::uint8_t>::max)())
    {
        spdlog::error("KeyCombinationSpace: alphabet of {} keys is too large", n);
        return;
    }

    const std::size_t count = CountCombinations(n, m_arity);
    if (count > kMaxChords)
    {
        spdlog::error("KeyCombinationSpace: {} chords exceed the supported maximum of {}", count, kMaxChords);
        return;
    }

    m_positions.reserve(count * m_arity);

    std::vector<std::size_t> idx(m_arity);
    std::iota(idx.begin(), idx.end(), std::size_t{0});

    while (true)
    {
        for (std::size_t p : idx)
            m_positions.push_back(static_cast<std::uint8_t>(p));

        // Advance to the next combination in lexicographic order.
        std::size_t i = m_arity;
        while (i > 0 && idx[i - 1] == n - m_arity + (i - 1))
            --i;
        if (i == 0)
            break;

        ++idx[i - 1];
        for (std::size_t j = i; j < m_arity; ++j)
            idx[j] = idx[j - 1] + 1;
    }

    m_count = m_positions.size() / m_arity;
    spdlog::debug("KeyCombinationSpace: {} chords of {} keys from a {}-key alphabet", m_count, m_arity, n);
}

std::optional<Chord> KeyCombinationSpace::ChordAt(SlotIndex slot) const
{
    if (!Contains(slot))
        return std::nullopt;

    Chord chord;
    chord.reserve(m_arity);

    const std::size_t base = static_cast<std::size_t>(slot) * m_arity;
    for (std::size_t i = 0; i < m_arity; ++i)
        chord.emplace_back(m_alphabet[m_positions[base + i]]);

    return chord;
}

std::string KeyCombinationSpace::Render(SlotIndex slot) const
{
    std::string out;
    if (!Contains(slot))
        return out;

    const std::size_t base = static_cast<std::size_t>(slot) * m_arity;
    for (std::size_t i = 0; i < m_arity; ++i)
    {
        if (i != 0)
            out.push_back('+');
        out += m_alphabet[m_positions[base + i]];
    }
    return out;
}

} // namespace rustactions::binds
