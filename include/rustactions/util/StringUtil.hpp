#pragma once

// include/rustactions/util/StringUtil.hpp
// ---------------------------------------
// Header-only string helpers shared by the keys.cfg parser, key token parsing,
// settings and the command line.

#include <cctype>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rustactions::util {

[[nodiscard]]
inline bool IsWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

[[nodiscard]]
inline std::string_view Trim(std::string_view s) noexcept
{
    while (!s.empty() && IsWhitespace(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsWhitespace(s.back())) s.remove_suffix(1);
    return s;
}

[[nodiscard]]
inline std::string ToLowerCopy(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]]
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

[[nodiscard]]
inline std::vector<std::string_view> Split(std::string_view s, char delim)
{
    std::vector<std::string_view> out;
    while (true)
    {
        const std::size_t pos = s.find(delim);
        if (pos == std::string_view::npos)
        {
            out.push_back(s);
            break;
        }
        out.push_back(s.substr(0, pos));
        s.remove_prefix(pos + 1);
    }
    return out;
}

// Splits on '\n' and drops one trailing '\r' per line. A final newline does not
// produce an empty last line; empty input yields no lines.
[[nodiscard]]
inline std::vector<std::string_view> SplitLines(std::string_view text)
{
    std::vector<std::string_view> out;
    while (!text.empty())
    {
        const std::size_t pos = text.find('\n');
        std::string_view line = text.substr(0, pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        out.push_back(line);

        if (pos == std::string_view::npos)
            break;
        text.remove_prefix(pos + 1);
    }
    return out;
}

// Whole-string integer parse; no sign for unsigned types, no surrounding space.
template <typename Int>
[[nodiscard]] std::optional<Int> ParseInteger(std::string_view s) noexcept
{
    Int value{};
    const char* first = s.data();
    const char* last  = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || s.empty())
        return std::nullopt;
    return value;
}

} // namespace rustactions::util
