// src/rustactions/io/AtomicFilePosix.cpp
//
// POSIX implementation of io/AtomicFile.hpp: write a unique sibling temp file,
// fsync it, rename(2) it over the destination, then fsync the directory.

#include "rustactions/io/AtomicFile.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rustactions::io {

namespace {

std::string errno_message(const char* what, int e)
{
    return std::string(what) + " failed: " + std::strerror(e);
}

bool ensure_parent_dir(const fs::path& final_path, std::string* err)
{
    const fs::path parent = final_path.parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    if (fs::exists(parent, ec))
        return true;

    fs::create_directories(parent, ec);
    if (ec)
    {
        if (err) *err = "create_directories failed: " + ec.message();
        return false;
    }
    return true;
}

// .<name>.tmp.<pid>_<rand>
fs::path make_temp_sibling(const fs::path& final_path)
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;

    std::string base = final_path.filename().string();
    if (base.empty()) base = "file";

    char buf[64];
    std::snprintf(buf, sizeof(buf), ".tmp.%ld_%llx", static_cast<long>(::getpid()), dist(gen));

    return final_path.parent_path() / ("." + base + buf);
}

bool write_all_to_fd(int fd, const std::string& bytes, std::string* err)
{
    const char* p = bytes.data();
    std::size_t left = bytes.size();
    while (left > 0)
    {
        const ssize_t wrote = ::write(fd, p, left);
        if (wrote < 0)
        {
            if (errno == EINTR)
                continue;
            if (err) *err = errno_message("write", errno);
            return false;
        }
        p += wrote;
        left -= static_cast<std::size_t>(wrote);
    }
    return true;
}

void fsync_directory(const fs::path& dir)
{
    const fs::path d = dir.empty() ? fs::path(".") : dir;
    const int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return;
    ::fsync(fd);
    ::close(fd);
}

} // namespace

bool write_atomic(const fs::path& final_path,
                  const std::string& bytes,
                  std::string* err,
                  bool make_backup)
{
    if (!ensure_parent_dir(final_path, err))
        return false;

    const fs::path tmp = make_temp_sibling(final_path);

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        if (err) *err = errno_message("open temp file", errno);
        return false;
    }

    std::error_code ec;

    bool ok = write_all_to_fd(fd, bytes, err);
    if (ok && ::fsync(fd) != 0)
    {
        if (err) *err = errno_message("fsync", errno);
        ok = false;
    }
    ::close(fd);

    if (!ok)
    {
        fs::remove(tmp, ec);
        return false;
    }

    if (make_backup && fs::exists(final_path, ec))
    {
        fs::copy_file(final_path, default_backup_path(final_path),
                      fs::copy_options::overwrite_existing, ec);
        // A missing backup does not block the save.
        ec.clear();
    }

    if (::rename(tmp.c_str(), final_path.c_str()) != 0)
    {
        if (err) *err = errno_message("rename", errno);
        fs::remove(tmp, ec);
        return false;
    }

    fsync_directory(final_path.parent_path());
    return true;
}

bool read_all(const fs::path& path, std::string& out, std::string* err)
{
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        if (err) *err = errno_message("open", errno);
        return false;
    }

    std::string data;
    struct stat st {};
    if (::fstat(fd, &st) == 0 && st.st_size > 0)
        data.reserve(static_cast<std::size_t>(st.st_size));

    char buf[64 * 1024];
    while (true)
    {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (err) *err = errno_message("read", errno);
            ::close(fd);
            return false;
        }
        if (n == 0)
            break;
        data.append(buf, static_cast<std::size_t>(n));
    }

    ::close(fd);
    out.swap(data);
    return true;
}

} // namespace rustactions::io
