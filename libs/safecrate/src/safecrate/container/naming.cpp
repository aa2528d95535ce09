/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/container/naming.h"

#include "configure.h"

#include <fmt/format.h>

#include <system_error>

namespace safecrate::container {

using utils::error::ErrorCode;

utils::error::Result<std::filesystem::path>
canonicalDirectory(const std::filesystem::path &dir) noexcept
{
    SAFECRATE_TRACE(fmt::format("canonicalize {}", dir.string()));

    std::error_code ec;
    auto canonical = std::filesystem::canonical(dir, ec);
    if (ec) {
        return SAFECRATE_ERR(fmt::format("Invalid directory {}: {}", dir.string(), ec.message()),
                             ErrorCode::InvalidDirectory);
    }

    if (!std::filesystem::is_directory(canonical, ec)) {
        return SAFECRATE_ERR(fmt::format("Invalid directory {}: not a directory", dir.string()),
                             ErrorCode::InvalidDirectory);
    }

    return canonical;
}

utils::error::Result<std::string>
nameFromCanonicalPath(const std::filesystem::path &canonicalDir) noexcept
{
    SAFECRATE_TRACE(fmt::format("derive container name for {}", canonicalDir.string()));

    auto projectName = canonicalDir.filename().string();
    if (projectName.empty() || projectName == "." || projectName == "..") {
        return SAFECRATE_ERR(fmt::format("Invalid directory name: {}", canonicalDir.string()),
                             ErrorCode::InvalidDirectory);
    }

    return projectName + "_" + SAFECRATE_CONTAINER_SUFFIX;
}

utils::error::Result<std::string> containerName(const std::filesystem::path &dir) noexcept
{
    SAFECRATE_TRACE(fmt::format("get container name of {}", dir.string()));

    auto canonical = canonicalDirectory(dir);
    if (!canonical) {
        return SAFECRATE_ERR(canonical);
    }

    auto name = nameFromCanonicalPath(*canonical);
    if (!name) {
        return SAFECRATE_ERR(name);
    }

    return name;
}

} // namespace safecrate::container
