// src/rustactions/catalog/ItemCatalog.cpp
#include "rustactions/catalog/ItemCatalog.hpp"

#include "rustactions/io/AtomicFile.hpp"
#include "rustactions/util/StringUtil.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace rustactions::catalog {

namespace {

// Object order of the database decides crafting slot order, so keep it.
using Json = nlohmann::ordered_json;

// Integers that do not fit T are treated as absent.
template <typename T>
std::optional<T> ReadInteger(const Json& v)
{
    if (v.is_number_unsigned())
    {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
            return std::nullopt;
        return static_cast<T>(u);
    }
    if (v.is_number_integer())
    {
        const auto i = v.get<std::int64_t>();
        if (i < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            i > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
            return std::nullopt;
        return static_cast<T>(i);
    }
    return std::nullopt;
}

std::optional<std::int64_t> ReadNumericId(const Json& item, const std::string& key)
{
    if (auto it = item.find("numericId"); it != item.end())
    {
        if (it->is_number_integer())
        {
            const auto id = ReadInteger<std::int64_t>(*it);
            if (!id)
                spdlog::warn("ItemCatalog: item '{}' has an out-of-range numericId", key);
            return id;
        }
        if (it->is_string())
            return util::ParseInteger<std::int64_t>(util::Trim(it->get_ref<const std::string&>()));
    }
    return util::ParseInteger<std::int64_t>(util::Trim(key));
}

std::string ReadString(const Json& item, const char* name)
{
    if (auto it = item.find(name); it != item.end() && it->is_string())
        return it->get<std::string>();
    return {};
}

} // namespace

ItemCatalog::ItemCatalog(std::vector<CatalogItem> items)
    : m_items(std::move(items))
{
}

bool ItemCatalog::LoadFromFile(const std::filesystem::path& path, std::string* err)
{
    m_items.clear();

    std::string text;
    std::string why;
    if (!io::read_all(path, text, &why))
    {
        if (err) *err = "cannot read item database " + path.string() + ": " + why;
        spdlog::warn("ItemCatalog: cannot read {}: {}; no crafting binds will be assigned", path.string(), why);
        return false;
    }

    if (!LoadFromString(text, &why))
    {
        if (err) *err = path.string() + ": " + why;
        spdlog::warn("ItemCatalog: {}: {}; no crafting binds will be assigned", path.string(), why);
        return false;
    }

    spdlog::info("ItemCatalog: loaded {} items from {}", m_items.size(), path.string());
    return true;
}

bool ItemCatalog::LoadFromString(std::string_view text, std::string* err)
{
    m_items.clear();

    const Json j = Json::parse(text.begin(), text.end(), nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        if (err) *err = "not a JSON object";
        return false;
    }

    const auto items = j.find("items");
    if (items == j.end() || !items->is_object())
    {
        if (err) *err = "missing \"items\" object";
        return false;
    }

    std::vector<CatalogItem> out;
    out.reserve(items->size());

    for (const auto& [key, item] : items->items())
    {
        if (!item.is_object())
            continue;

        const auto id = ReadNumericId(item, key);
        if (!id)
        {
            spdlog::debug("ItemCatalog: item '{}' has no numeric id; skipped", key);
            continue;
        }

        CatalogItem c;
        c.numericId = *id;
        c.name      = ReadString(item, "name");
        c.shortname = ReadString(item, "shortname");
        c.category  = ReadString(item, "category");

        if (auto it = item.find("amountToCreate"); it != item.end() && it->is_number_integer())
        {
            if (const auto amount = ReadInteger<int>(*it))
                c.amountToCreate = *amount;
            else
                spdlog::warn("ItemCatalog: item '{}' has an out-of-range amountToCreate; using {}", key,
                             c.amountToCreate);
        }
        if (auto it = item.find("userCraftable"); it != item.end() && it->is_boolean())
            c.userCraftable = it->get<bool>();
        if (auto it = item.find("ingredients"); it != item.end() && it->is_array())
            c.ingredientCount = it->size();

        if (c.name.empty())
            c.name = c.shortname.empty() ? key : c.shortname;

        out.push_back(std::move(c));
    }

    m_items = std::move(out);
    if (err) err->clear();
    return true;
}

std::vector<CatalogItem> ItemCatalog::GetCraftableItems() const
{
    std::vector<CatalogItem> out;
    for (const auto& item : m_items)
    {
        if (item.ingredientCount > 0)
            out.push_back(item);
    }
    return out;
}

std::optional<CatalogItem> ItemCatalog::FindByNumericId(std::int64_t numericId) const
{
    for (const auto& item : m_items)
    {
        if (item.numericId == numericId)
            return item;
    }
    return std::nullopt;
}

std::optional<CatalogItem> ItemCatalog::FindByName(std::string_view name) const
{
    const std::string_view wanted = util::Trim(name);
    if (wanted.empty())
        return std::nullopt;

    for (const auto& item : m_items)
    {
        if (util::EqualsIgnoreCase(item.name, wanted))
            return item;
    }
    for (const auto& item : m_items)
    {
        if (util::EqualsIgnoreCase(item.shortname, wanted))
            return item;
    }
    return std::nullopt;
}

} // namespace rustactions::catalog
