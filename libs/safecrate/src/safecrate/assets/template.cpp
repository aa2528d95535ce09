/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/assets/template.h"

#include "safecrate/assets/dockerfile_template.h"
#include "safecrate/utils/log/log.h"

#include <fmt/format.h>

#include <fstream>

namespace safecrate::assets {

using utils::error::ErrorCode;

std::string_view defaultDockerfile() noexcept
{
    return generated::DockerfileTemplate;
}

utils::error::Result<void> writeDefaultDockerfile(const std::filesystem::path &path) noexcept
{
    SAFECRATE_TRACE("write default image template to " + path.string());

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return SAFECRATE_ERR(fmt::format("Failed to write temporary Dockerfile {}", path.string()),
                             ErrorCode::TemplateWriteFailed);
    }

    auto content = defaultDockerfile();
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
        return SAFECRATE_ERR(fmt::format("Failed to write temporary Dockerfile {}", path.string()),
                             ErrorCode::TemplateWriteFailed);
    }

    LogD("default image template written to {}", path.string());
    return SAFECRATE_OK;
}

} // namespace safecrate::assets
