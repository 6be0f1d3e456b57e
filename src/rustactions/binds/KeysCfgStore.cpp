// src/rustactions/binds/KeysCfgStore.cpp
#include "rustactions/binds/KeysCfgStore.hpp"

#include "rustactions/binds/SlotAllocator.hpp"
#include "rustactions/io/AtomicFile.hpp"
#include "rustactions/io/FileProtection.hpp"
#include "rustactions/util/StringUtil.hpp"

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <system_error>
#include <utility>

namespace rustactions::binds {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kUserStart   = "#USER-SECTION-START";
constexpr std::string_view kUserEnd     = "#USER-SECTION-END";
constexpr std::string_view kActionStart = "#RUST-ACTIONS-START";
constexpr std::string_view kActionEnd   = "#RUST-ACTIONS-END";

constexpr std::string_view kCraftingHeader = "# === CRAFTING BINDS ===";
constexpr std::string_view kApiHeader      = "# === API BINDS ===";
constexpr std::string_view kChatHeader     = "# === CHAT/CONNECTION BINDS ===";

constexpr std::string_view kDynamicPrefix  = "# Dynamic: ";
constexpr std::string_view kTypeTerminator = " - '";
constexpr std::string_view kValueTerminator = "' - bind no.";

constexpr std::string_view kCraftingPrefix = "# Craft/Cancel ";
constexpr std::string_view kCraftingIdTag  = " (ID: ";
constexpr std::string_view kCraftingSlots  = ") - reserved bind no.";

constexpr std::string_view kApiPrefix = "# API: ";
constexpr std::string_view kApiSlot   = " - reserved bind no.";

enum class Section { Other, User, Actions };
enum class Block { None, Crafting, Api, Chat };

bool StartsWith(std::string_view s, std::string_view prefix) noexcept
{
    return s.substr(0, prefix.size()) == prefix;
}

std::optional<DynamicBindEntry> ParseDynamicComment(std::string_view line)
{
    std::string_view rest = line.substr(kDynamicPrefix.size());

    const std::size_t typeEnd  = rest.find(kTypeTerminator);
    const std::size_t valueEnd = rest.rfind(kValueTerminator);
    if (typeEnd == std::string_view::npos || valueEnd == std::string_view::npos ||
        valueEnd < typeEnd + kTypeTerminator.size())
        return std::nullopt;

    const auto type = ParseDynamicCommandType(util::Trim(rest.substr(0, typeEnd)));
    const auto slot = util::ParseInteger<SlotIndex>(util::Trim(rest.substr(valueEnd + kValueTerminator.size())));
    if (!type || !slot)
        return std::nullopt;

    const std::size_t valueBegin = typeEnd + kTypeTerminator.size();
    return DynamicBindEntry{*type, std::string(rest.substr(valueBegin, valueEnd - valueBegin)), *slot};
}

std::optional<PersistedCraftingBind> ParseCraftingComment(std::string_view line)
{
    const std::size_t idTag = line.rfind(kCraftingIdTag);
    if (idTag == std::string_view::npos)
        return std::nullopt;

    std::string_view tail = line.substr(idTag + kCraftingIdTag.size());
    const std::size_t idEnd = tail.find(kCraftingSlots);
    if (idEnd == std::string_view::npos)
        return std::nullopt;

    const auto slots = util::Split(tail.substr(idEnd + kCraftingSlots.size()), '/');
    if (slots.size() != 2)
        return std::nullopt;

    const auto id     = util::ParseInteger<std::int64_t>(tail.substr(0, idEnd));
    const auto craft  = util::ParseInteger<SlotIndex>(slots[0]);
    const auto cancel = util::ParseInteger<SlotIndex>(slots[1]);
    if (!id || !craft || !cancel)
        return std::nullopt;

    return PersistedCraftingBind{*id, *craft, *cancel};
}

std::optional<PersistedStaticBind> ParseApiComment(std::string_view line)
{
    const std::string_view rest = line.substr(kApiPrefix.size());
    const std::size_t slotTag = rest.rfind(kApiSlot);
    if (slotTag == std::string_view::npos)
        return std::nullopt;

    const auto slot = util::ParseInteger<SlotIndex>(util::Trim(rest.substr(slotTag + kApiSlot.size())));
    if (!slot)
        return std::nullopt;
    return PersistedStaticBind{std::string(util::Trim(rest.substr(0, slotTag))), *slot};
}

// CRLF when the first line break is one.
bool UsesCrlf(std::string_view text) noexcept
{
    const std::size_t nl = text.find('\n');
    return nl != std::string_view::npos && nl > 0 && text[nl - 1] == '\r';
}

std::string SingleLine(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
    {
        if (c == '\r' || c == '\n')
            c = ' ';
    }
    return out;
}

class Writer {
public:
    Writer(const KeyCombinationSpace& space, std::string_view eol)
        : m_space(space)
        , m_eol(eol)
    {
        m_out.reserve(1u << 19);
    }

    void Line(std::string_view s)
    {
        m_out += s;
        m_out += m_eol;
    }

    void Bind(SlotIndex slot, std::string_view command)
    {
        m_out += "bind [";
        m_out += m_space.Render(slot);
        m_out += "] ";
        m_out += command;
        m_out += m_eol;
    }

    void Placeholders(const SlotAllocator& allocator, SlotKind kind, std::string_view header)
    {
        const SlotRange r = allocator.EffectiveRange(kind);

        bool any = false;
        for (SlotIndex s = r.begin; s < r.end; ++s)
        {
            if (allocator.IsUsed(s))
                continue;
            if (!any)
            {
                Line(header);
                any = true;
            }
            Line(fmt::format("# Reserved bind no.{}", s));
            Bind(s, "\"\"");
        }
        if (any)
            Line("");
    }

    [[nodiscard]] std::string Take() { return std::move(m_out); }

private:
    const KeyCombinationSpace& m_space;
    std::string_view           m_eol;
    std::string                m_out;
};

bool UseDefaultUserSection(const KeysCfgSnapshot& snap)
{
    if (!snap.exists)
        return true;
    if (snap.hasMarkers)
        return !snap.hasUserSection;

    for (const auto& line : snap.userLines)
    {
        if (!util::Trim(line).empty())
            return false;
    }
    return true;
}

} // namespace

KeysCfgStore::KeysCfgStore(Options options)
    : m_options(std::move(options))
{
}

KeysCfgSnapshot KeysCfgStore::Parse(std::string_view text)
{
    KeysCfgSnapshot snap;
    snap.exists = true;
    snap.crlf   = UsesCrlf(text);

    const std::vector<std::string_view> lines = util::SplitLines(text);

    Section section = Section::Other;
    Block   block   = Block::None;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string_view line = lines[i];
        const std::string_view t    = util::Trim(line);

        if (t == kUserStart)
        {
            snap.hasMarkers = snap.hasUserSection = true;
            section = Section::User;
            continue;
        }
        if (t == kUserEnd)
        {
            snap.hasMarkers = true;
            section = Section::Other;
            continue;
        }
        if (t == kActionStart)
        {
            snap.hasMarkers = true;
            section = Section::Actions;
            block   = Block::None;
            continue;
        }
        if (t == kActionEnd)
        {
            snap.hasMarkers = true;
            section = Section::Other;
            block   = Block::None;
            continue;
        }

        switch (section)
        {
        case Section::User:
            snap.userLines.emplace_back(line);
            break;

        case Section::Actions:
            if (StartsWith(t, "# ==="))
            {
                block = t == kCraftingHeader ? Block::Crafting
                      : t == kApiHeader      ? Block::Api
                      : t == kChatHeader     ? Block::Chat
                                             : Block::None;
            }
            else if (block == Block::Chat && StartsWith(t, kDynamicPrefix))
            {
                if (auto entry = ParseDynamicComment(t))
                {
                    snap.dynamicEntries.push_back(std::move(*entry));
                }
                else
                {
                    ++snap.malformedLines;
                    spdlog::warn("KeysCfgStore: line {}: malformed dynamic bind comment skipped: {}", i + 1, t);
                }
            }
            else if (block == Block::Crafting && StartsWith(t, kCraftingPrefix))
            {
                if (auto pair = ParseCraftingComment(t))
                    snap.craftingBinds.push_back(*pair);
                else
                    spdlog::debug("KeysCfgStore: line {}: unrecognized crafting comment: {}", i + 1, t);
            }
            else if (block == Block::Api && StartsWith(t, kApiPrefix))
            {
                if (auto bind = ParseApiComment(t))
                    snap.staticBinds.push_back(std::move(*bind));
                else
                    spdlog::debug("KeysCfgStore: line {}: unrecognized API comment: {}", i + 1, t);
            }
            break;

        case Section::Other:
            if (!t.empty())
                ++snap.strayLines;
            break;
        }
    }

    if (!snap.hasMarkers)
    {
        // Foreign or first-run file: everything belongs to the player.
        snap.userLines.assign(lines.begin(), lines.end());
        snap.strayLines = 0;
    }

    return snap;
}

std::string KeysCfgStore::Render(const std::vector<std::string>& userLines,
                                 const SlotAllocator& allocator,
                                 const DynamicBindCache& dynamic,
                                 std::string_view eol)
{
    Writer w(allocator.Space(), eol);

    w.Line(kUserStart);
    for (const auto& line : userLines)
        w.Line(line);
    w.Line(kUserEnd);
    w.Line("");

    w.Line(kActionStart);
    w.Line("# Rust Actions Programmatically Managed Binds");
    w.Line("# Generated by RustActions");
    w.Line("");

    w.Line(kCraftingHeader);
    for (const auto& pair : allocator.CraftingBinds())
    {
        w.Line(fmt::format("# Craft/Cancel {} (ID: {}) - reserved bind no.{}/{}",
                           SingleLine(pair.itemName), pair.itemId, pair.craftSlot, pair.cancelSlot));
        w.Bind(pair.craftSlot, fmt::format("craft.add {} 1", pair.itemId));
        w.Bind(pair.cancelSlot, fmt::format("craft.cancel {} 1", pair.itemId));
        w.Line("");
    }
    w.Placeholders(allocator, SlotKind::Crafting, "# Empty reserved binds for future crafting items");
    w.Line("");

    w.Line(kApiHeader);
    for (const auto& bind : allocator.StaticCommandBinds())
    {
        w.Line(fmt::format("# API: {} - reserved bind no.{}", bind.name, bind.slot));
        w.Bind(bind.slot, bind.command);
        w.Line("");
    }
    w.Placeholders(allocator, SlotKind::StaticCommand, "# Empty reserved binds for future API commands");
    w.Line("");

    w.Line(kChatHeader);
    const std::vector<DynamicBindEntry> entries = dynamic.EntriesInOrder();
    for (const auto& e : entries)
    {
        w.Line(fmt::format("{}{}{}{}{}{}", kDynamicPrefix, ToString(e.type), kTypeTerminator, e.value,
                           kValueTerminator, e.slot));
        w.Bind(e.slot, RenderDynamicCommand(e.type, e.value));
        w.Line("");
    }
    w.Placeholders(allocator, SlotKind::Dynamic,
                   entries.empty() ? "# Empty reserved binds for dynamic chat/connection commands"
                                   : "# Empty reserved binds for future dynamic chat/connection commands");
    w.Line("");

    w.Line(kActionEnd);
    return w.Take();
}

bool KeysCfgStore::Matches(const KeysCfgSnapshot& snap, const SlotAllocator& allocator, const DynamicBindCache& dynamic)
{
    if (!snap.exists || !snap.hasMarkers)
        return false;

    const auto& crafting = allocator.CraftingBinds();
    if (snap.craftingBinds.size() != crafting.size())
        return false;
    for (std::size_t i = 0; i < crafting.size(); ++i)
    {
        const PersistedCraftingBind expected{crafting[i].itemId, crafting[i].craftSlot, crafting[i].cancelSlot};
        if (snap.craftingBinds[i] != expected)
            return false;
    }

    const auto& statics = allocator.StaticCommandBinds();
    if (snap.staticBinds.size() != statics.size())
        return false;
    for (std::size_t i = 0; i < statics.size(); ++i)
    {
        if (snap.staticBinds[i].name != statics[i].name || snap.staticBinds[i].slot != statics[i].slot)
            return false;
    }

    std::vector<DynamicBindEntry> persisted = snap.dynamicEntries;
    std::vector<DynamicBindEntry> current   = dynamic.EntriesInOrder();
    const auto bySlot = [](const DynamicBindEntry& a, const DynamicBindEntry& b) { return a.slot < b.slot; };
    std::sort(persisted.begin(), persisted.end(), bySlot);
    std::sort(current.begin(), current.end(), bySlot);
    return persisted == current;
}

bool KeysCfgStore::ReadUnguarded(KeysCfgSnapshot& out, std::string* err) const
{
    std::error_code ec;
    if (!fs::exists(m_options.path, ec))
    {
        out = KeysCfgSnapshot{};
        if (ec)
        {
            if (err) *err = "cannot access " + m_options.path.string() + ": " + ec.message();
            return false;
        }
        return true;
    }

    std::string text;
    std::string why;
    if (!io::read_all(m_options.path, text, &why))
    {
        if (err) *err = "cannot read " + m_options.path.string() + ": " + why;
        return false;
    }

    out = Parse(text);

    if (!out.hasMarkers)
        spdlog::info("KeysCfgStore: {} has no section markers; keeping its {} lines as player binds",
                     m_options.path.string(), out.userLines.size());
    if (out.strayLines != 0)
        spdlog::warn("KeysCfgStore: {} lines outside the managed sections will be dropped on the next write",
                     out.strayLines);
    if (out.malformedLines != 0)
        spdlog::warn("KeysCfgStore: {} malformed dynamic bind comments ignored", out.malformedLines);

    return true;
}

bool KeysCfgStore::Read(KeysCfgSnapshot& out, std::string* err) const
{
    io::ScopedWritable guard(m_options.path);
    if (!guard.ok())
    {
        if (err) *err = "cannot make " + m_options.path.string() + " readable: " + guard.error().message();
        return false;
    }
    return ReadUnguarded(out, err);
}

bool KeysCfgStore::Write(const SlotAllocator& allocator, const DynamicBindCache& dynamic, std::string* err) const
{
    io::ScopedWritable guard(m_options.path);
    if (!guard.ok())
    {
        if (err) *err = "cannot make " + m_options.path.string() + " writable: " + guard.error().message();
        spdlog::error("KeysCfgStore: {}", err ? *err : guard.error().message());
        return false;
    }

    KeysCfgSnapshot current;
    std::string why;
    if (!ReadUnguarded(current, &why))
    {
        // Never rewrite without the player's section in hand.
        spdlog::error("KeysCfgStore: write aborted: {}", why);
        if (err) *err = why;
        return false;
    }

    const bool defaults = UseDefaultUserSection(current);
    const std::vector<std::string>& userLines = defaults ? DefaultUserSection() : current.userLines;

    const std::string text = Render(userLines, allocator, dynamic, current.crlf ? "\r\n" : "\n");

    if (!io::write_atomic(m_options.path, text, &why, m_options.makeBackup))
    {
        spdlog::error("KeysCfgStore: cannot write {}: {}", m_options.path.string(), why);
        if (err) *err = "cannot write " + m_options.path.string() + ": " + why;
        return false;
    }

    guard.RestoreAs(m_options.readOnlyAfterWrite || guard.WasReadOnly());

    spdlog::info("KeysCfgStore: wrote {} ({} player lines{}, {} crafting pairs, {} static, {} dynamic, {} bytes)",
                 m_options.path.string(), userLines.size(), defaults ? " (defaults)" : "",
                 allocator.CraftingBinds().size(), allocator.StaticCommandBinds().size(), dynamic.Size(), text.size());
    if (err) err->clear();
    return true;
}

bool KeysCfgStore::IsProtected() const
{
    return io::IsReadOnly(m_options.path);
}

bool KeysCfgStore::SetProtected(bool readOnly, std::string* err) const
{
    std::error_code ec;
    if (!io::SetReadOnly(m_options.path, readOnly, &ec))
    {
        if (err) *err = "cannot change protection of " + m_options.path.string() + ": " + ec.message();
        return false;
    }
    spdlog::info("KeysCfgStore: {} is now {}", m_options.path.string(), readOnly ? "read-only" : "writable");
    return true;
}

} // namespace rustactions::binds
