/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef PLATFORM_H
#define PLATFORM_H

#include <chrono>
#include <memory>
#include <optional>

#include <util.h>

namespace AppLauncher {

//!
//! \brief The FileLock class holds an exclusive advisory lock on a lock file for its lifetime. The lock is released and
//! the descriptor closed on destruction.
//!
class FileLock
{
public:
    explicit FileLock(int fd, const fs::path& lock_path);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&&) = delete;
    FileLock& operator=(FileLock&&) = delete;

    const fs::path& GetLockPath() const;

private:
    int m_fd;
    fs::path m_lock_path;
};

//!
//! \brief The Platform class abstracts the operating system capabilities the core needs: home directory resolution,
//! the per-user state base directory, environment lookup and advisory locking. Core logic only talks to this interface.
//!
class Platform
{
public:
    virtual ~Platform() = default;

    //!
    //! \brief Provides the home directory of the current user.
    //! \return home directory path, std::nullopt if it cannot be determined.
    //!
    virtual std::optional<fs::path> GetHomeDirectory() const = 0;

    //!
    //! \brief Provides the base directory under which the per-user state directory is created. This is the home
    //! directory on POSIX systems and the roaming application data directory on Windows-like systems.
    //! \return base directory path
    //!
    virtual fs::path GetStateBaseDirectory() const = 0;

    //!
    //! \brief Looks up an environment variable.
    //! \param name
    //! \return value, or std::nullopt if the variable is not set.
    //!
    virtual std::optional<std::string> GetEnv(const std::string& name) const = 0;

    //!
    //! \brief Acquires an exclusive advisory lock on the provided lock file, creating the file if needed. The attempt is
    //! retried until the timeout elapses.
    //! \param lock_path
    //! \param timeout
    //! \return unique_ptr to the held lock. Throws StoreException on timeout or if the lock file cannot be opened.
    //!
    virtual std::unique_ptr<FileLock> AcquireLock(const fs::path& lock_path, std::chrono::milliseconds timeout) const = 0;
};

//!
//! \brief POSIX implementation of Platform. Locking uses flock(2) with non-blocking attempts and a fixed polling
//! interval.
//!
class PosixPlatform : public Platform
{
public:
    std::optional<fs::path> GetHomeDirectory() const override;

    fs::path GetStateBaseDirectory() const override;

    std::optional<std::string> GetEnv(const std::string& name) const override;

    std::unique_ptr<FileLock> AcquireLock(const fs::path& lock_path, std::chrono::milliseconds timeout) const override;

    static constexpr std::chrono::milliseconds LOCK_POLLING_INTERVAL = std::chrono::milliseconds(20);
};

//!
//! \brief Wall-clock source. Returns Unix Epoch seconds (UTC).
//!
class Clock
{
public:
    virtual ~Clock() = default;

    virtual int64_t Now() const = 0;
};

class SystemClock : public Clock
{
public:
    int64_t Now() const override;
};

} // namespace AppLauncher

#endif // PLATFORM_H
