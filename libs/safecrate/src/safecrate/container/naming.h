/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/utils/error/error.h"

#include <filesystem>
#include <string>

namespace safecrate::container {

// Resolves symlinks, "." and ".." to an absolute path. The directory must exist.
utils::error::Result<std::filesystem::path>
canonicalDirectory(const std::filesystem::path &dir) noexcept;

// <basename>_isolated, computed from an already canonical path without touching the filesystem.
// Fails for paths without a final component such as "/".
utils::error::Result<std::string>
nameFromCanonicalPath(const std::filesystem::path &canonicalDir) noexcept;

// canonicalDirectory() followed by nameFromCanonicalPath().
utils::error::Result<std::string> containerName(const std::filesystem::path &dir) noexcept;

} // namespace safecrate::container
