/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef LAUNCHER_H
#define LAUNCHER_H

#include <optional>
#include <string>
#include <vector>

#include <platform.h>

namespace AppLauncher {

//!
//! \brief Splits a command line into arguments using POSIX shell quoting rules: whitespace separates arguments, single
//! quotes are literal, double quotes allow backslash escapes of ", \, $ and `, and a backslash outside quotes escapes
//! the next character. No variable expansion or globbing is done.
//! \param command_line
//! \return argument vector. Throws ConfigException on an unterminated quote or a trailing backslash.
//!
std::vector<std::string> SplitCommandLine(const std::string& command_line);

//!
//! \brief Resolves an executable the way a shell would. A name containing '/' is used as given; otherwise each PATH
//! entry is searched in order.
//! \param name
//! \param platform
//! \return path to an existing executable regular file, or std::nullopt.
//!
std::optional<fs::path> FindExecutable(const std::string& name, const Platform& platform);

//!
//! \brief Starts processes detached from the caller.
//!
class ProcessLauncher
{
public:
    virtual ~ProcessLauncher() = default;

    //!
    //! \brief Starts argv[0] (a resolved executable path) with the provided arguments, detached from this process.
    //! \param argv
    //! \return true if the program was started.
    //!
    virtual bool StartDetached(const std::vector<std::string>& argv) const = 0;
};

//!
//! \brief POSIX implementation using a double fork with setsid(), so the started program runs in its own session and
//! is reparented to init right away. A close-on-exec pipe carries an exec failure back to the caller.
//!
class PosixProcessLauncher : public ProcessLauncher
{
public:
    bool StartDetached(const std::vector<std::string>& argv) const override;
};

} // namespace AppLauncher

#endif // LAUNCHER_H
