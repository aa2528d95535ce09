// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "dir.h"

#include "configure.h"
#include "safecrate/common/xdg.h"

#include <system_error>

namespace safecrate::common::dir {

std::filesystem::path getUserConfigDir() noexcept
{
    auto configDir = xdg::getXDGConfigHomeDir();
    if (configDir.empty()) {
        return {};
    }

    return configDir / "safecrate";
}

std::filesystem::path getDefaultTemplatePath() noexcept
{
    std::error_code ec;
    auto tmpDir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmpDir = "/tmp";
    }

    return tmpDir / SAFECRATE_TEMPLATE_FILENAME;
}

} // namespace safecrate::common::dir
