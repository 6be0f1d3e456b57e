#pragma once
// include/rustactions/binds/KeysCfgStore.hpp
//
// Reads and writes the game's keys.cfg.
//
// File layout (trailing newline; CRLF when the existing file used CRLF, else LF):
//
//   #USER-SECTION-START
//   ...player binds, preserved byte for byte...
//   #USER-SECTION-END
//
//   #RUST-ACTIONS-START
//   # Rust Actions Programmatically Managed Binds
//   # Generated by RustActions
//
//   # === CRAFTING BINDS ===
//   # Craft/Cancel <name> (ID: <id>) - reserved bind no.<craft>/<cancel>
//   bind [k1+k2+k3+k4+k5] craft.add <id> 1
//   bind [...] craft.cancel <id> 1
//   ...
//   # === API BINDS ===
//   # API: <name> - reserved bind no.<slot>
//   ...
//   # === CHAT/CONNECTION BINDS ===
//   # Dynamic: <type> - '<value>' - bind no.<slot>
//   bind [...] <command>
//   ...
//   #RUST-ACTIONS-END
//
// Unassigned slots of every range are written as "# Reserved bind no.<slot>"
// followed by a bind to "" so the game never keeps a stale command on a chord.
// The "# Dynamic:" comments are the only persisted record of dynamic binds;
// they are written least recently used first so recency survives a restart.

#include "rustactions/binds/BindLayout.hpp"
#include "rustactions/binds/DynamicBindCache.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rustactions::binds {

class SlotAllocator;

// Crafting comment as found in an existing file; used to detect a stale file.
struct PersistedCraftingBind {
    std::int64_t itemId     = 0;
    SlotIndex    craftSlot  = 0;
    SlotIndex    cancelSlot = 0;

    friend bool operator==(const PersistedCraftingBind&, const PersistedCraftingBind&) = default;
};

// "# API:" comment as found in an existing file.
struct PersistedStaticBind {
    std::string name;
    SlotIndex   slot = 0;

    friend bool operator==(const PersistedStaticBind&, const PersistedStaticBind&) = default;
};

struct KeysCfgSnapshot {
    bool exists      = false;  // file was present
    bool hasMarkers  = false;  // at least one section marker was found
    bool hasUserSection = false;
    bool crlf        = false;  // line endings of the file, kept on rewrite

    // Without markers this is the whole file.
    std::vector<std::string> userLines;

    // File order, i.e. least recently used first.
    std::vector<DynamicBindEntry>      dynamicEntries;
    std::vector<PersistedCraftingBind> craftingBinds;
    std::vector<PersistedStaticBind>   staticBinds;

    std::size_t malformedLines = 0; // unparsable "# Dynamic:" comments
    std::size_t strayLines     = 0; // non-blank lines outside both sections (dropped on rewrite)
};

// Player binds written when keys.cfg has no user section yet: the game's stock
// bindings.
[[nodiscard]] const std::vector<std::string>& DefaultUserSection();

class KeysCfgStore {
public:
    struct Options {
        std::filesystem::path path;
        bool                  readOnlyAfterWrite = true;
        bool                  makeBackup         = false;
    };

    explicit KeysCfgStore(Options options);

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return m_options.path; }
    [[nodiscard]] const Options& GetOptions() const noexcept { return m_options; }

    // Pure parse of a file body. CRLF is accepted.
    [[nodiscard]] static KeysCfgSnapshot Parse(std::string_view text);

    // Pure render of the whole file from the given user lines and bind state.
    [[nodiscard]] static std::string Render(const std::vector<std::string>& userLines,
                                            const SlotAllocator& allocator,
                                            const DynamicBindCache& dynamic,
                                            std::string_view eol = "\n");

    // True when `snap` holds the managed section of exactly this bind state:
    // same crafting pairs and static commands on the same slots, and the same
    // dynamic entries (recency order aside).
    [[nodiscard]] static bool Matches(const KeysCfgSnapshot& snap,
                                      const SlotAllocator& allocator,
                                      const DynamicBindCache& dynamic);

    // Reads and parses the file, temporarily clearing a read-only attribute.
    // A missing file is not an error: `out.exists` is false.
    [[nodiscard]] bool Read(KeysCfgSnapshot& out, std::string* err = nullptr) const;

    // Full rewrite: keeps the current user section (or the default one), renders
    // every generated bind and atomically replaces the file. On success the file
    // is left read-only when `readOnlyAfterWrite` is set; on failure its previous
    // protection is restored and the file is untouched.
    [[nodiscard]] bool Write(const SlotAllocator& allocator,
                             const DynamicBindCache& dynamic,
                             std::string* err = nullptr) const;

    [[nodiscard]] bool IsProtected() const;
    [[nodiscard]] bool SetProtected(bool readOnly, std::string* err = nullptr) const;

private:
    [[nodiscard]] bool ReadUnguarded(KeysCfgSnapshot& out, std::string* err) const;

    Options m_options;
};

} // namespace rustactions::binds
