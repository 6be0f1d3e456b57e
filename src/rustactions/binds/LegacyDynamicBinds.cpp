// src/rustactions/binds/LegacyDynamicBinds.cpp
#include "rustactions/binds/LegacyDynamicBinds.hpp"

#include "rustactions/binds/BindTrigger.hpp"
#include "rustactions/io/AtomicFile.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <system_error>
#include <unordered_set>

namespace rustactions::binds {

namespace {

std::optional<SlotIndex> ReadSlot(const nlohmann::json& v)
{
    if (!v.is_number_unsigned())
        return std::nullopt;
    const auto n = v.get<std::uint64_t>();
    if (n > std::numeric_limits<SlotIndex>::max())
        return std::nullopt;
    return static_cast<SlotIndex>(n);
}

} // namespace

bool ParseLegacyDynamicBinds(std::string_view text, std::vector<DynamicBindEntry>& out, std::string* err)
{
    out.clear();

    const nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        if (err) *err = "not a JSON object";
        return false;
    }

    const auto binds = j.find("dynamic_binds");
    if (binds == j.end() || !binds->is_object())
    {
        if (err) *err = "missing \"dynamic_binds\" object";
        return false;
    }

    std::map<SlotIndex, DynamicBindEntry> bySlot;
    for (const auto& [key, slotValue] : binds->items())
    {
        const std::size_t colon = key.find(':');
        const auto type = colon == std::string::npos
            ? std::nullopt
            : ParseDynamicCommandType(std::string_view(key).substr(0, colon));

        const auto slotNumber = ReadSlot(slotValue);
        if (!type || !slotNumber)
        {
            spdlog::warn("LegacyDynamicBinds: skipping malformed entry '{}'", key);
            continue;
        }

        const SlotIndex slot = *slotNumber;
        if (!bySlot.emplace(slot, DynamicBindEntry{*type, key.substr(colon + 1), slot}).second)
            spdlog::warn("LegacyDynamicBinds: slot {} listed twice; keeping the first entry", slot);
    }

    std::unordered_set<SlotIndex> taken;
    if (auto order = j.find("dynamic_bind_order"); order != j.end() && order->is_array())
    {
        for (const auto& v : *order)
        {
            const auto slot = ReadSlot(v);
            if (!slot)
                continue;
            const auto it = bySlot.find(*slot);
            if (it != bySlot.end() && taken.insert(it->first).second)
                out.push_back(it->second);
        }
    }

    for (const auto& [slot, entry] : bySlot)
    {
        if (taken.count(slot) == 0)
            out.push_back(entry);
    }

    if (err) err->clear();
    return true;
}

LegacyMigrationResult MigrateLegacyDynamicBinds(const std::filesystem::path& legacyPath,
                                                BindTrigger& trigger,
                                                std::string* err)
{
    std::error_code ec;
    if (legacyPath.empty() || !std::filesystem::exists(legacyPath, ec))
        return LegacyMigrationResult::NotNeeded;

    if (trigger.GetStats().dynamicSlotsUsed != 0)
    {
        spdlog::info("LegacyDynamicBinds: {} ignored; keys.cfg already holds dynamic binds", legacyPath.string());
        return LegacyMigrationResult::NotNeeded;
    }

    std::string text;
    std::string why;
    if (!io::read_all(legacyPath, text, &why))
    {
        if (err) *err = "cannot read " + legacyPath.string() + ": " + why;
        return LegacyMigrationResult::Failed;
    }

    std::vector<DynamicBindEntry> entries;
    if (!ParseLegacyDynamicBinds(text, entries, &why))
    {
        if (err) *err = legacyPath.string() + ": " + why;
        return LegacyMigrationResult::Failed;
    }

    std::size_t restored = 0;
    if (!trigger.ImportDynamicBinds(entries, &restored, &why))
    {
        if (err) *err = "cannot migrate " + legacyPath.string() + ": " + why;
        return LegacyMigrationResult::Failed;
    }

    std::filesystem::remove(legacyPath, ec);
    if (ec)
        spdlog::warn("LegacyDynamicBinds: migrated, but cannot remove {}: {}", legacyPath.string(), ec.message());

    spdlog::info("LegacyDynamicBinds: migrated {} of {} dynamic binds from {}", restored, entries.size(),
                 legacyPath.string());
    return LegacyMigrationResult::Migrated;
}

} // namespace rustactions::binds
