/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <algorithm>
#include <cerrno>
#include <cstring>     // For strerror
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <secure_delete.h>

using namespace AppLauncher;

namespace {

//!
//! \brief Closes the held descriptor on scope exit.
//!
class ScopedFd
{
public:
    explicit ScopedFd(int fd) : m_fd(fd) {}

    ~ScopedFd()
    {
        if (m_fd >= 0) {
            close(m_fd);
        }
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return m_fd; }

    //!
    //! \brief Closes explicitly so that close errors can be reported.
    //! \return 0 on success, -1 with errno set otherwise.
    //!
    int Close()
    {
        int fd = m_fd;
        m_fd = -1;
        return close(fd);
    }

private:
    int m_fd;
};

std::string ErrnoString(int err)
{
    return std::string(strerror(err));
}

//!
//! \brief Adds the provided owner permission bits if they are missing. Failure is logged but not fatal, since the
//! subsequent operation reports the real error if the permission is actually needed.
//!
void RestoreOwnerPermissions(const fs::path& path, fs::perms required)
{
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);

    if (ec || fs::is_symlink(status)) {
        return;
    }

    if ((status.permissions() & required) == required) {
        return;
    }

    fs::permissions(path, required, fs::perm_options::add, ec);

    if (ec) {
        log("WARNING: %s: Unable to restore permissions on %s: %s",
            __func__,
            path,
            ec.message());
    } else {
        debug_log("INFO: %s: Restored owner permissions on %s",
                  __func__,
                  path);
    }
}

} // anonymous namespace

// Class SecureDeleter

SecureDeleter::SecureDeleter(size_t chunk_size)
    : m_chunk_size(std::max<size_t>(chunk_size, 1))
    , m_pass_observer()
{}

void SecureDeleter::SetPassObserver(PassObserver observer)
{
    m_pass_observer = std::move(observer);
}

DeletionReport SecureDeleter::Destroy(const fs::path& path, int passes) const
{
    DeletionReport report;
    report.m_target = path;

    if (path.empty()) {
        RecordFailure(report, path, "empty path");
        return report;
    }

    passes = std::max(passes, 1);

    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);

    if (status.type() == fs::file_type::not_found) {
        debug_log("INFO: %s: %s does not exist. Nothing to do.",
                  __func__,
                  path);
        return report;
    }

    report.m_existed = true;

    try {
        DestroyEntry(path, passes, report);
    } catch (const std::exception& e) {
        // Out-of-memory and similar conditions. The engine still must not throw past this point.
        RecordFailure(report, path, e.what());
    }

    if (report.Succeeded()) {
        log("INFO: %s: Destroyed %s (%i files, %i links, %i directories)",
            __func__,
            path,
            report.m_files_destroyed,
            report.m_links_removed,
            report.m_dirs_removed);
    } else {
        log("WARNING: %s: Destruction of %s was partial: %u entries failed (%i files, %i links, %i directories removed)",
            __func__,
            path,
            report.m_failures.size(),
            report.m_files_destroyed,
            report.m_links_removed,
            report.m_dirs_removed);
    }

    return report;
}

void SecureDeleter::DestroyEntry(const fs::path& path, int passes, DeletionReport& report) const
{
    std::error_code ec;

    // lstat semantics. A symlink must be recognized before any other kind check so it is never followed.
    fs::file_status status = fs::symlink_status(path, ec);

    if (status.type() == fs::file_type::not_found) {
        return;
    }

    if (ec) {
        RecordFailure(report, path, "unable to stat: " + ec.message());
        return;
    }

    switch (status.type()) {
    case fs::file_type::symlink:
        if (unlink(path.c_str()) != 0) {
            RecordFailure(report, path, "unable to remove symlink: " + ErrnoString(errno));
        } else {
            debug_log("INFO: %s: Removed symlink %s",
                      __func__,
                      path);
            ++report.m_links_removed;
        }
        break;
    case fs::file_type::directory:
        DestroyDirectory(path, passes, report);
        break;
    case fs::file_type::regular:
        try {
            DestroyFile(path, passes);
            ++report.m_files_destroyed;
        } catch (FileSystemException& e) {
            RecordFailure(report, path, e.what());
        }
        break;
    default:
        // Device nodes, fifos and sockets are never written to. The directory entry is removed.
        if (unlink(path.c_str()) != 0) {
            RecordFailure(report, path, "unable to remove special file: " + ErrnoString(errno));
        } else {
            debug_log("INFO: %s: Removed special file %s without overwrite",
                      __func__,
                      path);
            ++report.m_special_removed;
        }
        break;
    }
}

void SecureDeleter::DestroyDirectory(const fs::path& path, int passes, DeletionReport& report) const
{
    // Read and execute are needed to list the directory, write to unlink its entries.
    RestoreOwnerPermissions(path, fs::perms::owner_all);

    std::vector<fs::path> entries;
    std::error_code ec;

    fs::directory_iterator iter(path, ec);

    if (ec) {
        RecordFailure(report, path, "unable to list directory: " + ec.message());
        return;
    }

    for (; iter != fs::directory_iterator(); iter.increment(ec)) {
        entries.push_back(iter->path());
    }

    if (ec) {
        RecordFailure(report, path, "directory listing incomplete: " + ec.message());
    }

    for (const auto& entry : entries) {
        DestroyEntry(entry, passes, report);
    }

    RestoreOwnerPermissions(path, fs::perms::owner_write | fs::perms::owner_exec);

    if (rmdir(path.c_str()) != 0) {
        RecordFailure(report, path, "unable to remove directory: " + ErrnoString(errno));
        return;
    }

    debug_log("INFO: %s: Removed directory %s",
              __func__,
              path);

    ++report.m_dirs_removed;
}

void SecureDeleter::DestroyFile(const fs::path& path, int passes) const
{
    RestoreOwnerPermissions(path, fs::perms::owner_read | fs::perms::owner_write);

    // O_NOFOLLOW guards against the entry being swapped for a symlink after it was classified.
    ScopedFd fd(open(path.c_str(), O_WRONLY | O_NOFOLLOW | O_CLOEXEC));

    if (fd.get() < 0) {
        throw FileSystemException("Unable to open file for overwrite: " + ErrnoString(errno) + ".", path);
    }

    struct stat st;

    if (fstat(fd.get(), &st) != 0) {
        throw FileSystemException("Unable to stat open file: " + ErrnoString(errno) + ".", path);
    }

    if (!S_ISREG(st.st_mode)) {
        throw FileSystemException("Entry is no longer a regular file.", path);
    }

    for (int pass = 1; pass <= passes; ++pass) {
        OverwritePass(fd.get(), path, pass);
    }

    if (fd.Close() != 0) {
        throw FileSystemException("Error closing overwritten file: " + ErrnoString(errno) + ".", path);
    }

    if (unlink(path.c_str()) != 0) {
        throw FileSystemException("Unable to unlink overwritten file: " + ErrnoString(errno) + ".", path);
    }

    debug_log("INFO: %s: Overwrote (%i passes) and removed %s",
              __func__,
              passes,
              path);
}

void SecureDeleter::OverwritePass(int fd, const fs::path& path, int pass) const
{
    struct stat st;

    if (fstat(fd, &st) != 0) {
        throw FileSystemException("Unable to stat file before pass " + ::ToString(pass) + ": " + ErrnoString(errno) + ".",
                                  path);
    }

    // The length is fixed at the start of the pass. An external truncation during the pass does not change how much
    // is written.
    const uintmax_t length = static_cast<uintmax_t>(st.st_size);

    std::vector<unsigned char> buffer(static_cast<size_t>(std::min<uintmax_t>(m_chunk_size, std::max<uintmax_t>(length, 1))));

    uintmax_t offset = 0;

    while (offset < length) {
        size_t to_write = static_cast<size_t>(std::min<uintmax_t>(buffer.size(), length - offset));

        if (RAND_bytes(buffer.data(), static_cast<int>(to_write)) != 1) {
            throw FileSystemException("Random source failure: " + std::to_string(ERR_get_error()) + ".", path);
        }

        size_t written = 0;

        while (written < to_write) {
            ssize_t result = pwrite(fd, buffer.data() + written, to_write - written, static_cast<off_t>(offset + written));

            if (result < 0) {
                if (errno == EINTR) {
                    continue;
                }

                throw FileSystemException("Write failed during pass " + ::ToString(pass) + ": " + ErrnoString(errno) + ".",
                                          path);
            }

            if (result == 0) {
                throw FileSystemException("Device accepted no data during pass " + ::ToString(pass) + ".", path);
            }

            written += static_cast<size_t>(result);
        }

        offset += to_write;
    }

    if (fsync(fd) != 0) {
        throw FileSystemException("fsync failed after pass " + ::ToString(pass) + ": " + ErrnoString(errno) + ".", path);
    }

    if (m_pass_observer) {
        m_pass_observer(path, pass, length);
    }
}

void SecureDeleter::RecordFailure(DeletionReport& report, const fs::path& path, const std::string& reason)
{
    log("WARNING: %s: Failed to destroy %s: %s",
        __func__,
        path,
        reason);

    report.m_failures.push_back(DeletionFailure {path, reason});
}
