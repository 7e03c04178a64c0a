/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef SECURE_DELETE_H
#define SECURE_DELETE_H

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <context.h>

namespace AppLauncher {

//!
//! \brief One entry that could not be destroyed, with the underlying cause.
//!
struct DeletionFailure
{
    fs::path m_path;
    std::string m_reason;
};

//!
//! \brief The DeletionReport struct is the result of SecureDeleter::Destroy(). A report with failures still means the
//! whole subtree was attempted: deletion is best effort and continues past individual failures.
//!
struct DeletionReport
{
    fs::path m_target;

    //! False if nothing existed at the target path. This is not a failure.
    bool m_existed = false;

    int m_files_destroyed = 0;
    int m_links_removed = 0;
    int m_dirs_removed = 0;

    //! Special files (fifos, sockets, device nodes) are unlinked without being overwritten.
    int m_special_removed = 0;

    std::vector<DeletionFailure> m_failures;

    bool Succeeded() const { return m_failures.empty(); }
};

//!
//! \brief The SecureDeleter class irreversibly destroys a file, symbolic link or directory tree.
//!
//! Symbolic links are removed as links; their targets are never followed or modified. Regular files are made writable
//! if needed, overwritten with cryptographically random bytes the requested number of times (each pass forced to the
//! device with fsync before the next one begins), and unlinked. Directories are processed bottom-up: every entry is
//! destroyed before the directory itself is removed. Each failure is logged and recorded in the report and processing
//! continues with the siblings. Destroy() never throws.
//!
//! This is a best-effort overwrite. It gives no guarantee against recovery on wear-leveled (flash/SSD) storage, and a
//! crash part way through leaves a partially destroyed tree.
//!
class SecureDeleter
{
public:
    //!
    //! \brief Called after each completed overwrite pass with the path, the 1-based pass number and the number of bytes
    //! written in that pass.
    //!
    typedef std::function<void(const fs::path& path, int pass, uintmax_t bytes_written)> PassObserver;

    static constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

    explicit SecureDeleter(size_t chunk_size = DEFAULT_CHUNK_SIZE);

    void SetPassObserver(PassObserver observer);

    //!
    //! \brief Destroys whatever is at the path. A missing path is a no-op.
    //! \param path
    //! \param passes number of overwrite passes for each regular file. Values below 1 are raised to 1.
    //! \return DeletionReport
    //!
    DeletionReport Destroy(const fs::path& path, int passes = DEFAULT_OVERWRITE_PASSES) const;

private:
    void DestroyEntry(const fs::path& path, int passes, DeletionReport& report) const;

    void DestroyDirectory(const fs::path& path, int passes, DeletionReport& report) const;

    //!
    //! \brief Overwrites and unlinks a single regular file. Throws FileSystemException on failure.
    //!
    void DestroyFile(const fs::path& path, int passes) const;

    void OverwritePass(int fd, const fs::path& path, int pass) const;

    static void RecordFailure(DeletionReport& report, const fs::path& path, const std::string& reason);

    size_t m_chunk_size;

    PassObserver m_pass_observer;
};

} // namespace AppLauncher

#endif // SECURE_DELETE_H
