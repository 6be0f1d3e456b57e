// include/rustactions/io/AtomicFile.hpp
//
// Durable whole-file writes and reads.
//
// Guarantees:
//  - Data is written to a sibling temp file and flushed, then published over the
//    destination in one step (ReplaceFileW / MoveFileExW on Windows, rename(2)
//    elsewhere). A crash mid-write leaves either the old or the new file, never a
//    truncated one.
//  - The parent directory is created when missing.
//
// The implementation is selected by the build: AtomicFileWin.cpp on Windows,
// AtomicFilePosix.cpp everywhere else.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace rustactions::io {

namespace fs = std::filesystem;

/// Atomically replace `final_path` with `bytes`.
///
/// @param final_path   Destination path.
/// @param bytes        Entire file contents.
/// @param err          Optional: receives a human-readable error on failure.
/// @param make_backup  If true and the destination exists, keep "<final>.bak".
///
/// @return true on success; false on error (destination untouched).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                const std::string& bytes,
                                std::string* err,
                                bool make_backup);

/// Read the entire file at `path` into `out` (replaced on success).
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

[[nodiscard]] inline bool write_atomic(const fs::path& final_path,
                                       std::string_view bytes,
                                       std::string* err = nullptr,
                                       bool make_backup = false)
{
    return write_atomic(final_path, std::string(bytes), err, make_backup);
}

/// "<final>.bak", the backup written when `make_backup == true`.
[[nodiscard]] inline fs::path default_backup_path(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".bak";
    return p;
}

} // namespace rustactions::io
