// src/rustactions/io/FileProtection.cpp
#include "rustactions/io/FileProtection.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#if defined(_WIN32)
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

namespace rustactions::io {

namespace {

#if !defined(_WIN32)
constexpr fs::perms kAnyWrite = fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
#endif

void set_ec(std::error_code* out_ec, std::error_code ec) noexcept
{
    if (out_ec) *out_ec = ec;
}

} // namespace

bool IsReadOnly(const fs::path& path, std::error_code* out_ec)
{
    set_ec(out_ec, {});

#if defined(_WIN32)
    const DWORD attrs = ::GetFileAttributesW(path.c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES)
    {
        const DWORD e = ::GetLastError();
        if (e != ERROR_FILE_NOT_FOUND && e != ERROR_PATH_NOT_FOUND)
            set_ec(out_ec, std::error_code(static_cast<int>(e), std::system_category()));
        return false;
    }
    return (attrs & FILE_ATTRIBUTE_READONLY) != 0;
#else
    std::error_code ec;
    const fs::file_status st = fs::status(path, ec);
    if (ec)
    {
        if (ec != std::errc::no_such_file_or_directory)
            set_ec(out_ec, ec);
        return false;
    }
    if (!fs::exists(st))
        return false;
    return (st.permissions() & kAnyWrite) == fs::perms::none;
#endif
}

bool SetReadOnly(const fs::path& path, bool readOnly, std::error_code* out_ec)
{
    set_ec(out_ec, {});

#if defined(_WIN32)
    const DWORD attrs = ::GetFileAttributesW(path.c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES)
    {
        set_ec(out_ec, std::error_code(static_cast<int>(::GetLastError()), std::system_category()));
        return false;
    }

    const DWORD wanted = readOnly ? (attrs | FILE_ATTRIBUTE_READONLY) : (attrs & ~FILE_ATTRIBUTE_READONLY);
    if (wanted == attrs)
        return true;

    if (!::SetFileAttributesW(path.c_str(), wanted))
    {
        set_ec(out_ec, std::error_code(static_cast<int>(::GetLastError()), std::system_category()));
        return false;
    }
#else
    std::error_code ec;
    if (readOnly)
        fs::permissions(path, kAnyWrite, fs::perm_options::remove, ec);
    else
        fs::permissions(path, fs::perms::owner_write, fs::perm_options::add, ec);

    if (ec)
    {
        set_ec(out_ec, ec);
        return false;
    }
#endif

    spdlog::debug("FileProtection: {} is now {}", path.string(), readOnly ? "read-only" : "writable");
    return true;
}

ScopedWritable::ScopedWritable(fs::path path)
    : m_path(std::move(path))
{
    std::error_code ec;
    m_wasReadOnly     = IsReadOnly(m_path, &ec);
    m_restoreReadOnly = m_wasReadOnly;

    if (ec)
    {
        m_error = ec;
        spdlog::warn("FileProtection: cannot query {}: {}", m_path.string(), ec.message());
        return;
    }

    if (m_wasReadOnly && !SetReadOnly(m_path, false, &m_error))
        spdlog::error("FileProtection: cannot make {} writable: {}", m_path.string(), m_error.message());
}

ScopedWritable::~ScopedWritable()
{
    std::error_code ec;
    if (!fs::exists(m_path, ec))
        return;

    const bool current = IsReadOnly(m_path, &ec);
    if (ec || current == m_restoreReadOnly)
        return;

    if (!SetReadOnly(m_path, m_restoreReadOnly, &ec))
        spdlog::warn("FileProtection: cannot restore {} on {}: {}",
                     m_restoreReadOnly ? "read-only" : "writable", m_path.string(), ec.message());
}

} // namespace rustactions::io
