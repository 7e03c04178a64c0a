/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef CONTEXT_H
#define CONTEXT_H

#include <chrono>
#include <memory>

#include <platform.h>

namespace AppLauncher {

//!
//! \brief Default number of overwrite passes for secure deletion.
//!
constexpr int DEFAULT_OVERWRITE_PASSES = 3;

//!
//! \brief Default bound on waiting for the state store lock.
//!
constexpr std::chrono::milliseconds DEFAULT_LOCK_TIMEOUT = std::chrono::milliseconds(5000);

//!
//! \brief The RunContext struct is handed explicitly to each component instead of global singletons, so tests can
//! supply a temporary store, a fixed clock and their own platform.
//!
struct RunContext
{
    //! Path of the persistent store file (state.db).
    fs::path m_store_path;

    //! Path of the advisory lock file that serializes concurrent invocations against the store.
    fs::path m_lock_path;

    std::chrono::milliseconds m_lock_timeout = DEFAULT_LOCK_TIMEOUT;

    int m_overwrite_passes = DEFAULT_OVERWRITE_PASSES;

    std::shared_ptr<const Clock> m_clock;

    std::shared_ptr<const Platform> m_platform;

    //!
    //! \brief Builds a context for the store in the provided state directory. The lock file sits beside the store
    //! file with a .lock suffix.
    //!
    static RunContext ForStateDirectory(const fs::path& state_dir,
                                        const std::string& store_filename,
                                        std::shared_ptr<const Clock> clock,
                                        std::shared_ptr<const Platform> platform)
    {
        RunContext context;

        context.m_store_path = state_dir / store_filename;
        context.m_lock_path = state_dir / (store_filename + ".lock");
        context.m_clock = std::move(clock);
        context.m_platform = std::move(platform);

        return context;
    }
};

} // namespace AppLauncher

#endif // CONTEXT_H
