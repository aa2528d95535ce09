// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "safecrate/common/xdg.h"

#include <cstdlib>

namespace safecrate::common::xdg {

std::filesystem::path getXDGConfigHomeDir() noexcept
{
    auto *configHomeEnv = std::getenv("XDG_CONFIG_HOME");
    if (configHomeEnv != nullptr && configHomeEnv[0] != '\0') {
        return configHomeEnv;
    }

    // fallback to default
    // $HOME/.config
    auto *homeEnv = std::getenv("HOME");
    if (homeEnv != nullptr && homeEnv[0] != '\0') {
        return std::filesystem::path{ homeEnv } / ".config";
    }

    return "";
}

} // namespace safecrate::common::xdg
