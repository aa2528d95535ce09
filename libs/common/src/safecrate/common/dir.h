// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <filesystem>

namespace safecrate::common::dir {

// user config directory for safecrate in the following order:
// 1. $XDG_CONFIG_HOME/safecrate
// 2. $HOME/.config/safecrate, if $XDG_CONFIG_HOME is either not set or empty
// 3. empty path, if $HOME is either not set or empty
std::filesystem::path getUserConfigDir() noexcept;

// where the bundled image template is materialized when init runs without --dockerfile
std::filesystem::path getDefaultTemplatePath() noexcept;

} // namespace safecrate::common::dir
