// src/rustactions/io/AtomicFileWin.cpp
//
// Windows implementation of io/AtomicFile.hpp.
//   - Bytes go to a hidden sibling temp file that is flushed, then swapped in
//     with ReplaceFileW (existing target, optional .bak) or MoveFileExW.
//   - Paths use the extended-length form (\\?\ or \\?\UNC\) so a Steam library
//     on a deep or network path still works.
//   - The game may hold keys.cfg open; reads share read, write and delete.

#include "rustactions/io/AtomicFile.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <windows.h>

#include <algorithm>
#include <atomic>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

namespace rustactions::io {

namespace {

std::string LastError(const char* what)
{
    const DWORD code = ::GetLastError();
    return std::string(what) + " failed: " + std::system_category().message(static_cast<int>(code));
}

class Handle {
public:
    explicit Handle(HANDLE h) noexcept : m_h(h) {}
    ~Handle() { Close(); }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    [[nodiscard]] bool Valid() const noexcept { return m_h != INVALID_HANDLE_VALUE && m_h != nullptr; }
    [[nodiscard]] HANDLE Get() const noexcept { return m_h; }

    void Close() noexcept
    {
        if (Valid())
            ::CloseHandle(m_h);
        m_h = INVALID_HANDLE_VALUE;
    }

private:
    HANDLE m_h;
};

// Deletes the temp file unless it was published.
class TempFileGuard {
public:
    explicit TempFileGuard(std::wstring path) : m_path(std::move(path)) {}
    ~TempFileGuard()
    {
        if (!m_published)
            ::DeleteFileW(m_path.c_str());
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::wstring& Path() const noexcept { return m_path; }
    void Published() noexcept { m_published = true; }

private:
    std::wstring m_path;
    bool         m_published = false;
};

std::wstring ExtendedPath(const fs::path& p)
{
    std::error_code ec;
    const fs::path abs = fs::absolute(p, ec);
    const std::wstring raw = ec ? p.native() : abs.native();

    if (raw.rfind(LR"(\\?\)", 0) == 0)
        return raw;
    if (raw.rfind(LR"(\\)", 0) == 0)
        return LR"(\\?\UNC)" + raw.substr(1);
    return LR"(\\?\)" + raw;
}

// .keys.cfg.<pid>.<n>.tmp beside the target.
fs::path TempSibling(const fs::path& finalPath)
{
    static std::atomic<unsigned> counter{0};

    std::wstring name = L".";
    name += finalPath.filename().native();
    name += L"." + std::to_wstring(::GetCurrentProcessId());
    name += L"." + std::to_wstring(counter.fetch_add(1, std::memory_order_relaxed));
    name += L".tmp";
    return finalPath.parent_path() / name;
}

bool WriteAll(HANDLE h, const std::string& bytes, std::string* err)
{
    std::size_t done = 0;
    while (done < bytes.size())
    {
        const DWORD chunk = static_cast<DWORD>(std::min<std::size_t>(bytes.size() - done, 1u << 20));
        DWORD wrote = 0;
        if (!::WriteFile(h, bytes.data() + done, chunk, &wrote, nullptr))
        {
            if (err) *err = LastError("WriteFile");
            return false;
        }
        if (wrote == 0)
        {
            if (err) *err = "WriteFile wrote nothing";
            return false;
        }
        done += wrote;
    }
    return true;
}

} // namespace

bool write_atomic(const fs::path& final_path,
                  const std::string& bytes,
                  std::string* err,
                  bool make_backup)
{
    if (err) err->clear();

    if (const fs::path parent = final_path.parent_path(); !parent.empty())
    {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            if (err) *err = "cannot create " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    const std::wstring target = ExtendedPath(final_path);
    TempFileGuard temp(ExtendedPath(TempSibling(final_path)));

    {
        Handle file(::CreateFileW(temp.Path().c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                                  FILE_ATTRIBUTE_HIDDEN | FILE_FLAG_WRITE_THROUGH, nullptr));
        if (!file.Valid())
        {
            if (err) *err = LastError("CreateFileW (temp)");
            return false;
        }
        if (!WriteAll(file.Get(), bytes, err))
            return false;
        if (!::FlushFileBuffers(file.Get()))
        {
            if (err) *err = LastError("FlushFileBuffers");
            return false;
        }
    }

    // Published files are not hidden.
    ::SetFileAttributesW(temp.Path().c_str(), FILE_ATTRIBUTE_NORMAL);

    if (::GetFileAttributesW(target.c_str()) != INVALID_FILE_ATTRIBUTES)
    {
        const std::wstring backup = target + L".bak";
        if (::ReplaceFileW(target.c_str(), temp.Path().c_str(), make_backup ? backup.c_str() : nullptr,
                           REPLACEFILE_IGNORE_MERGE_ERRORS | REPLACEFILE_IGNORE_ACL_ERRORS, nullptr, nullptr))
        {
            temp.Published();
            return true;
        }
        // Some file systems (FAT, a few network shares) refuse ReplaceFileW.
    }

    if (!::MoveFileExW(temp.Path().c_str(), target.c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH))
    {
        if (err) *err = LastError("MoveFileExW");
        return false;
    }
    temp.Published();
    return true;
}

bool read_all(const fs::path& path, std::string& out, std::string* err)
{
    if (err) err->clear();

    Handle file(::CreateFileW(ExtendedPath(path).c_str(), GENERIC_READ,
                              FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr, OPEN_EXISTING,
                              FILE_FLAG_SEQUENTIAL_SCAN, nullptr));
    if (!file.Valid())
    {
        if (err) *err = LastError("CreateFileW");
        return false;
    }

    LARGE_INTEGER size{};
    if (!::GetFileSizeEx(file.Get(), &size))
    {
        if (err) *err = LastError("GetFileSizeEx");
        return false;
    }
    if (size.QuadPart > static_cast<LONGLONG>((std::numeric_limits<DWORD>::max)()))
    {
        if (err) *err = "file is too large";
        return false;
    }

    std::string data(static_cast<std::size_t>(size.QuadPart), '\0');
    std::size_t total = 0;
    while (total < data.size())
    {
        DWORD got = 0;
        if (!::ReadFile(file.Get(), data.data() + total, static_cast<DWORD>(data.size() - total), &got, nullptr))
        {
            if (err) *err = LastError("ReadFile");
            return false;
        }
        if (got == 0)
            break; // truncated while reading
        total += got;
    }
    data.resize(total);
    out.swap(data);
    return true;
}

} // namespace rustactions::io
