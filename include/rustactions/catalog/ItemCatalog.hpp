#pragma once
// include/rustactions/catalog/ItemCatalog.hpp
//
// Read-only item catalog. The bind allocator only needs the ordered list of
// craftable items; the command-line front end also resolves items by name.
//
// Database format (itemDatabase.json, produced by the asset extraction tools):
//   { "items": { "<id>": { "numericId": 1525520776, "name": "Building Plan",
//                          "shortname": "building.planner", "ingredients": [...],
//                          "amountToCreate": 1, "userCraftable": true, ... } } }

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustactions::catalog {

struct CatalogItem {
    std::int64_t numericId = 0;
    std::string  name;
    std::string  shortname;
    std::string  category;
    int          amountToCreate = 1;
    bool         userCraftable  = false;
    std::size_t  ingredientCount = 0;
};

// Source of craftable items, queried once when binds are allocated.
class ICatalogSource {
public:
    virtual ~ICatalogSource() = default;

    // Items that have a recipe, in catalog order.
    [[nodiscard]] virtual std::vector<CatalogItem> GetCraftableItems() const = 0;
};

class ItemCatalog final : public ICatalogSource {
public:
    ItemCatalog() = default;
    explicit ItemCatalog(std::vector<CatalogItem> items);

    // Loads the JSON database. Returns false (and leaves the catalog empty) when
    // the file is missing or malformed; `err` receives the reason.
    [[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, std::string* err = nullptr);

    // Same as LoadFromFile for an in-memory document.
    [[nodiscard]] bool LoadFromString(std::string_view text, std::string* err = nullptr);

    [[nodiscard]] std::vector<CatalogItem> GetCraftableItems() const override;

    [[nodiscard]] const std::vector<CatalogItem>& Items() const noexcept { return m_items; }

    [[nodiscard]] std::optional<CatalogItem> FindByNumericId(std::int64_t numericId) const;

    // Case-insensitive match on display name first, then shortname.
    [[nodiscard]] std::optional<CatalogItem> FindByName(std::string_view name) const;

private:
    std::vector<CatalogItem> m_items;
};

} // namespace rustactions::catalog
