/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef PATH_NORMALIZER_H
#define PATH_NORMALIZER_H

#include <string>
#include <vector>

#include <platform.h>

namespace AppLauncher {

//!
//! \brief Expands $VAR, ${VAR} and %VAR% references using the platform environment. References to variables that are
//! not set are left verbatim.
//! \param expression
//! \param platform
//! \return expanded string
//!
std::string ExpandEnvironmentVariables(const std::string& expression, const Platform& platform);

//!
//! \brief Expands a leading "~" or "~/" to the home directory. Other uses of '~' are left verbatim, as is the whole
//! expression if the home directory is unknown.
//! \param expression
//! \param platform
//! \return expanded string
//!
std::string ExpandHomeDirectory(const std::string& expression, const Platform& platform);

//!
//! \brief Resolves a configured path expression into a canonical absolute path. The target does not need to exist.
//!
//! Environment variables are expanded first, then the home directory shorthand, and relative results are made absolute
//! against the current working directory. Symlinks are resolved in the parent chain only, so a target that is itself
//! a symlink is returned as the link and not as the link's target. Failures during canonicalization are not errors:
//! the expanded, lexically normalized absolute form is returned instead.
//!
//! \param expression path expression from the configuration
//! \param platform
//! \return normalized path. Empty if the expression is empty.
//!
fs::path NormalizePath(const std::string& expression, const Platform& platform);

//!
//! \brief NormalizePath applied to each element, preserving order.
//!
std::vector<fs::path> NormalizePaths(const std::vector<std::string>& expressions, const Platform& platform);

} // namespace AppLauncher

#endif // PATH_NORMALIZER_H
