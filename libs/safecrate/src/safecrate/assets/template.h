/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#pragma once

#include "safecrate/utils/error/error.h"

#include <filesystem>
#include <string_view>

namespace safecrate::assets {

// The image template bundled into the binary.
std::string_view defaultDockerfile() noexcept;

// Writes the bundled template to path, replacing any existing file.
utils::error::Result<void> writeDefaultDockerfile(const std::filesystem::path &path) noexcept;

} // namespace safecrate::assets
