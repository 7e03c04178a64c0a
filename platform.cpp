/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <cerrno>
#include <cstring>   // For strerror
#include <fcntl.h>
#include <pwd.h>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

#include <platform.h>

using namespace AppLauncher;

// Class FileLock

FileLock::FileLock(int fd, const fs::path& lock_path)
    : m_fd(fd)
    , m_lock_path(lock_path)
{}

FileLock::~FileLock()
{
    if (m_fd >= 0) {
        if (flock(m_fd, LOCK_UN) != 0) {
            debug_log("WARNING: %s: Failed to unlock %s: %s",
                      __func__,
                      m_lock_path,
                      strerror(errno));
        }

        close(m_fd);
    }
}

const fs::path& FileLock::GetLockPath() const
{
    return m_lock_path;
}

// Class PosixPlatform

std::optional<fs::path> PosixPlatform::GetHomeDirectory() const
{
    std::optional<std::string> home = GetEnv("HOME");

    if (home && !home->empty()) {
        return fs::path(*home);
    }

    // Fall back to the password database when HOME is not set, e.g. under some cron/systemd setups.
    struct passwd pwd;
    struct passwd* result = nullptr;
    std::vector<char> buffer(16384);

    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result != nullptr
        && result->pw_dir != nullptr) {
        return fs::path(result->pw_dir);
    }

    return std::nullopt;
}

fs::path PosixPlatform::GetStateBaseDirectory() const
{
    std::optional<fs::path> home = GetHomeDirectory();

    if (home) {
        return *home;
    }

    error_log("%s: Unable to determine home directory. Using the current directory for state.",
              __func__);

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);

    return ec ? fs::path(".") : cwd;
}

std::optional<std::string> PosixPlatform::GetEnv(const std::string& name) const
{
    return GetEnvVariable(name);
}

std::unique_ptr<FileLock> PosixPlatform::AcquireLock(const fs::path& lock_path, std::chrono::milliseconds timeout) const
{
    auto start_time = std::chrono::steady_clock::now();

    int fd = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);

    if (fd == -1) {
        throw StoreException("Unable to open lock file " + lock_path.string() + ": " + strerror(errno));
    }

    while (true) {
        if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
            debug_log("INFO: %s: Acquired lock %s",
                      __func__,
                      lock_path);

            return std::make_unique<FileLock>(fd, lock_path);
        }

        int lock_errno = errno;

        if (lock_errno != EWOULDBLOCK && lock_errno != EINTR) {
            close(fd);
            throw StoreException("Unable to lock " + lock_path.string() + ": " + strerror(lock_errno));
        }

        if (std::chrono::steady_clock::now() - start_time >= timeout) {
            close(fd);
            throw StoreException("Timed out after " + ::ToString(timeout.count()) + " ms waiting for lock "
                                 + lock_path.string());
        }

        std::this_thread::sleep_for(LOCK_POLLING_INTERVAL);
    }
}

// Class SystemClock

int64_t SystemClock::Now() const
{
    return GetUnixEpochTime();
}
