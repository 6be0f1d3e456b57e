// include/rustactions/io/FileProtection.hpp
//
// Read-only toggling for files shared with the game process. keys.cfg is kept
// read-only between our writes so the game cannot overwrite generated binds when
// the player changes a key in the options menu.

#pragma once

#include <filesystem>
#include <system_error>

namespace rustactions::io {

namespace fs = std::filesystem;

// False for missing files.
[[nodiscard]] bool IsReadOnly(const fs::path& path, std::error_code* out_ec = nullptr);

// Sets or clears the read-only state (FILE_ATTRIBUTE_READONLY on Windows, the
// write permission bits elsewhere). Fails for missing files.
[[nodiscard]] bool SetReadOnly(const fs::path& path, bool readOnly, std::error_code* out_ec = nullptr);

// Makes a file writable for the lifetime of the guard and restores the previous
// read-only state on scope exit, including when unwinding. Missing files are
// left alone, but a file created while the guard is alive receives the restored
// state too (call RestoreAs(true) after a first write to protect it).
class ScopedWritable {
public:
    explicit ScopedWritable(fs::path path);
    ~ScopedWritable();

    ScopedWritable(const ScopedWritable&) = delete;
    ScopedWritable& operator=(const ScopedWritable&) = delete;

    // False when the file was read-only and could not be made writable.
    [[nodiscard]] bool ok() const noexcept { return !m_error; }
    [[nodiscard]] const std::error_code& error() const noexcept { return m_error; }

    [[nodiscard]] bool WasReadOnly() const noexcept { return m_wasReadOnly; }

    // Overrides the state applied on scope exit.
    void RestoreAs(bool readOnly) noexcept { m_restoreReadOnly = readOnly; }

private:
    fs::path        m_path;
    std::error_code m_error;
    bool            m_wasReadOnly     = false;
    bool            m_restoreReadOnly = false;
};

} // namespace rustactions::io
